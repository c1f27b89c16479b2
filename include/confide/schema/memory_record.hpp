#pragma once

#include <confide/schema/primitives.hpp>
#include <optional>

namespace confide::schema {

/// A principal's own memory as handed over by the external memory store.
struct memory_record_t final {
  std::string memory_id;
  principal_id_t owner;
  std::string category;
  std::string content;
  timestamp_milliseconds_t created_at{};
  std::optional<std::string> counterpart_name;
  std::optional<std::string> relationship_label;
};

}  // namespace confide::schema
