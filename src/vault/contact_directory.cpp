#include <confide/schema/key/keys.hpp>
#include <confide/vault/contact_directory.hpp>

#include <spdlog/spdlog.h>

namespace confide::vault {

contact_directory::contact_directory(
    confide::schema::encoding::scale_encoder_t& encoder,
    const confide::storage::rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void contact_directory::upsert(
    const confide::schema::contact_profile_t& profile) {
  storage_.put(encoder_,
               confide::schema::key::make_contact_key(encoder_, profile.owner,
                                                      profile.contact_id),
               profile);
  spdlog::debug("Contact '{}' of '{}' set to {} ({})", profile.contact_id,
                profile.owner, to_string(profile.knowledge_access),
                to_string(profile.relationship));
}

std::optional<confide::schema::contact_profile_t> contact_directory::find(
    const confide::schema::principal_id_t& owner,
    const confide::schema::principal_id_t& contact) const {
  return storage_.get<confide::schema::contact_profile_t>(
      encoder_, confide::schema::key::make_contact_key(encoder_, owner, contact));
}

std::vector<confide::schema::contact_profile_t> contact_directory::list(
    const confide::schema::principal_id_t& owner) const {
  auto profiles = std::vector<confide::schema::contact_profile_t>{};
  for (const auto& [key, value] : storage_.list_by_prefix(
           confide::schema::key::make_contact_prefix_key(encoder_, owner))) {
    profiles.push_back(
        encoder_.decode<confide::schema::contact_profile_t>(value));
  }
  return profiles;
}

confide::schema::access_error_code contact_directory::remove(
    const confide::schema::principal_id_t& owner,
    const confide::schema::principal_id_t& contact) {
  auto key = confide::schema::key::make_contact_key(encoder_, owner, contact);
  if (!storage_.get<confide::schema::contact_profile_t>(encoder_, key)) {
    return confide::schema::access_error_code::record_not_found;
  }
  storage_.erase(key);
  return confide::schema::access_error_code::ok;
}

contact_lookup_t contact_directory::lookup() const {
  return [this](const confide::schema::principal_id_t& owner,
                const confide::schema::principal_id_t& contact) {
    return find(owner, contact);
  };
}

}  // namespace confide::vault
