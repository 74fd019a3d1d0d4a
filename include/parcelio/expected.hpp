#pragma once

// tl::expected, brought into the parcelio namespace.
//
// Every decoder returns DecodeResult<T> (detail/decode_result.hpp), an
// expected<T, DecodeError>. Decoders forward a failure from a nested step
// with `return unexpected(r.error());` and build new ones through the
// make_*_error helpers. Creators convert a typed record into a Record with
// map(), as register_builtin_creators does.

#include <tl/expected.hpp>

namespace parcelio {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace parcelio
