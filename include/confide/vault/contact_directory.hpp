#pragma once

#include <confide/schema/access_error_code.hpp>
#include <confide/schema/contact_profile.hpp>
#include <confide/schema/encoding/scale/encoder.hpp>
#include <confide/storage/rocksdb/storage.hpp>
#include <functional>
#include <optional>
#include <vector>

namespace confide::vault {

/// Resolves the profile `owner` keeps for `contact`, if any.
using contact_lookup_t =
    std::function<std::optional<confide::schema::contact_profile_t>(
        const confide::schema::principal_id_t& owner,
        const confide::schema::principal_id_t& contact)>;

/// Persisted copy of the contact-management feed.
class contact_directory final {
 public:
  contact_directory(confide::schema::encoding::scale_encoder_t& encoder,
                    const confide::storage::rocksdb_storage_t& storage);

  void upsert(const confide::schema::contact_profile_t& profile);

  std::optional<confide::schema::contact_profile_t> find(
      const confide::schema::principal_id_t& owner,
      const confide::schema::principal_id_t& contact) const;

  std::vector<confide::schema::contact_profile_t> list(
      const confide::schema::principal_id_t& owner) const;

  confide::schema::access_error_code remove(
      const confide::schema::principal_id_t& owner,
      const confide::schema::principal_id_t& contact);

  /// Lookup bound to this directory. The directory must outlive it.
  contact_lookup_t lookup() const;

 private:
  confide::schema::encoding::scale_encoder_t& encoder_;
  const confide::storage::rocksdb_storage_t& storage_;
};

}  // namespace confide::vault
