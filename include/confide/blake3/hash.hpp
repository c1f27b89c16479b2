#pragma once
#include <confide/schema/primitives.hpp>
#include <cstddef>

namespace confide::blake3 {

/// BLAKE3 extendable output of the requested length.
confide::schema::bytes_t hash_xof(const confide::schema::bytes_view_t& bytes,
                                  std::size_t length);

}  // namespace confide::blake3
