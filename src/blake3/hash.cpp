#include <blake3.h>
#include <confide/blake3/hash.hpp>

namespace confide::blake3 {

confide::schema::bytes_t hash_xof(const confide::schema::bytes_view_t& bytes,
                                  const std::size_t length) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = confide::schema::bytes_t(length);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace confide::blake3
