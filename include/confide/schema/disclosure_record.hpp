#pragma once

#include <confide/schema/primitives.hpp>
#include <confide/schema/sealed_envelope.hpp>
#include <optional>

namespace confide::schema {

/// Private record readable by its owner and at most one designated reader.
/// A romantic record names a target who gains read access once the target
/// holds a reciprocal romantic record naming the owner.
template <uint16_t Version>
struct disclosure_record;

template <>
struct disclosure_record<1> final {
  uint16_t version{1};
  record_id_t record_id{};
  principal_id_t owner;
  std::string title;
  sealed_envelope_t content;
  std::optional<principal_id_t> designated_reader;
  bool romantic{};
  std::optional<principal_id_t> target_id;
  std::optional<std::string> target_name;
  bool matched{};
  std::optional<timestamp_milliseconds_t> matched_at;
  timestamp_milliseconds_t created_at{};
};

using disclosure_record_t = disclosure_record<1>;

}  // namespace confide::schema
