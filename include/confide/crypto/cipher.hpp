#pragma once

#include <confide/schema/primitives.hpp>
#include <confide/schema/sealed_envelope.hpp>
#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace confide::crypto {

inline constexpr std::size_t kKeySize = 32;
inline constexpr std::size_t kIvSize = 12;
inline constexpr std::size_t kTagSize = 16;

using symmetric_key_t = std::array<uint8_t, kKeySize>;

/// Authentication of sealed data failed: wrong key, wrong associated data or
/// tampered bytes. Always an integrity fault, never an authorization outcome.
class decryption_error final : public std::runtime_error {
 public:
  explicit decryption_error(const std::string& what)
      : std::runtime_error{what} {}
};

/// Fill `size` bytes from the OpenSSL CSPRNG.
confide::schema::bytes_t random_bytes(std::size_t size);

/// Fresh random record/session identifier.
confide::schema::hash32_t random_id();

symmetric_key_t random_key();

/// Parse a 64 character hex master key.
std::optional<symmetric_key_t> try_make_key(std::string_view hex);

/// AES-256-GCM. Output layout is iv || ciphertext || tag.
confide::schema::bytes_t seal(const symmetric_key_t& key,
                              const confide::schema::bytes_view_t& plaintext,
                              const confide::schema::bytes_view_t& aad);

/// Inverse of seal. Throws decryption_error when authentication fails.
confide::schema::bytes_t open(const symmetric_key_t& key,
                              const confide::schema::bytes_view_t& sealed,
                              const confide::schema::bytes_view_t& aad);

/// Envelope encryption under a master key held only in memory.
///
/// Each payload gets its own random data key; the data key is sealed under
/// the master key and stored next to the payload. Associated data binds the
/// envelope to the record that owns it.
class envelope_cipher final {
 public:
  explicit envelope_cipher(const symmetric_key_t& master_key);

  confide::schema::sealed_envelope_t seal(
      const confide::schema::bytes_view_t& plaintext,
      const confide::schema::bytes_view_t& aad) const;

  confide::schema::bytes_t open(const confide::schema::sealed_envelope_t& envelope,
                                const confide::schema::bytes_view_t& aad) const;

 private:
  symmetric_key_t master_key_;
};

}  // namespace confide::crypto
