#pragma once

#include <confide/schema/primitives.hpp>
#include <confide/schema/sealed_envelope.hpp>
#include <optional>

namespace confide::schema {

/// Immutable enrolled voice embedding. The embedding itself is only stored
/// sealed; `enrollment_confidence_ppm` is the mean similarity of the enrolment
/// samples to their average, in parts per million.
template <uint16_t Version>
struct voiceprint;

template <>
struct voiceprint<1> final {
  uint16_t version{1};
  record_id_t voiceprint_id{};
  principal_id_t owner;
  sealed_envelope_t embedding;
  std::string model_version;
  timestamp_milliseconds_t enrolled_at{};
  std::optional<std::string> device_hint;
  uint32_t enrollment_confidence_ppm{};
};

using voiceprint_t = voiceprint<1>;

}  // namespace confide::schema
