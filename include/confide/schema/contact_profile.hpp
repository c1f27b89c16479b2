#pragma once

#include <confide/schema/knowledge_access_level.hpp>
#include <confide/schema/primitives.hpp>
#include <confide/schema/relationship_type.hpp>

namespace confide::schema {

/// How much an owner trusts one of their contacts. Produced by contact
/// management; the vault only reads it.
template <uint16_t Version>
struct contact_profile;

template <>
struct contact_profile<1> final {
  uint16_t version{1};
  principal_id_t owner;
  principal_id_t contact_id;
  std::string display_name;
  relationship_type_t relationship{relationship_type_t::unknown};
  knowledge_access_level_t knowledge_access{knowledge_access_level_t::general};
};

using contact_profile_t = contact_profile<1>;

}  // namespace confide::schema
