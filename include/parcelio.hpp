#pragma once

// Umbrella header for the parcelio decoder

#include "parcelio/bundle.hpp"
#include "parcelio/creator_registry.hpp"
#include "parcelio/decode_options.hpp"
#include "parcelio/detail/decode_error.hpp"
#include "parcelio/detail/decode_result.hpp"
#include "parcelio/detail/string_decode.hpp"
#include "parcelio/detail/value_decode.hpp"
#include "parcelio/expected.hpp"
#include "parcelio/parcel_reader.hpp"
#include "parcelio/records.hpp"
#include "parcelio/types.hpp"
#include "parcelio/value.hpp"
