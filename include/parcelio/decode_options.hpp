#pragma once

namespace parcelio {

/**
 * @brief Knobs for bundle decoding
 *
 * The defaults accept everything the producing side is known to write.
 */
struct DecodeOptions {
    /// Require the bundle magic to be 'BNDL' or 'BNDN' instead of skipping it
    bool validate_magic{false};

    /// Require the bundle entries to end exactly at the declared bundle length
    bool strict_length{false};
};

} // namespace parcelio
