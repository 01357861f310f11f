#pragma once

// TEMPUS Expected Type
//
// Exposes tl::expected in the tempus namespace for consistent error handling.
// Every fallible operation (calendar construction, narrowing accessors,
// parsers and file loaders) returns tempus::expected<T, E> where E is one of
// the error structs from tempus/errors.hpp.
//
// Usage:
//   auto epoch = tempus::Epoch::maybe_from_gregorian_utc(2024, 2, 30, 0, 0, 0, 0);
//   if (!epoch) {
//       std::cerr << epoch.error().message() << '\n';
//   }
//
// Monadic operations:
//   result.and_then(f)  - chain on success
//   result.map(f)       - transform value
//   result.or_else(f)   - chain on error
//   result.map_error(f) - transform error

#include <tl/expected.hpp>

namespace tempus {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace tempus
