#pragma once

#include <confide/schema/primitives.hpp>

namespace confide::schema {

/// Envelope-encrypted payload: the data key is sealed under the master key,
/// the payload under the data key. Both carry AES-GCM iv and tag inline.
template <uint16_t Version>
struct sealed_envelope;

template <>
struct sealed_envelope<1> final {
  uint16_t version{1};
  bytes_t wrapped_key;
  bytes_t ciphertext;
};

using sealed_envelope_t = sealed_envelope<1>;

}  // namespace confide::schema
