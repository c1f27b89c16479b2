#pragma once

#include <confide/auth/challenge_issuer.hpp>
#include <confide/auth/confidence_authenticator.hpp>
#include <confide/auth/session_store.hpp>
#include <confide/config/options.hpp>
#include <confide/crypto/cipher.hpp>
#include <confide/disclosure/disclosure_registry.hpp>
#include <confide/schema/memory_record.hpp>
#include <confide/storage/rocksdb/storage.hpp>
#include <confide/testing/common.hpp>
#include <confide/vault/contact_directory.hpp>
#include <confide/vault/secret_vault.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace confide::testing {

using scale_encoder_t = confide::schema::encoding::scale_encoder_t;

/// Every service wired against one temporary database and a manual clock.
class service_fixture final {
 public:
  explicit service_fixture(const std::string_view db_prefix,
                           confide::config::options options = {},
                           confide::disclosure::intent_classifier_t classifier =
                               always_romantic())
      : db_path_{db_prefix},
        options_{std::move(options)},
        storage_{confide::storage::make_storage<
            confide::storage::rocksdb_storage_tag>(db_path_.path())},
        cipher_{make_key(7)},
        sessions_{clock_.provider()},
        contacts_{encoder_, storage_},
        challenges_{encoder_,
                    storage_,
                    sessions_,
                    memory_source(),
                    confide::auth::make_expected_answer_verifier(),
                    options_.challenge,
                    clock_.provider()},
        authenticator_{encoder_,
                       storage_,
                       cipher_,
                       sessions_,
                       challenges_,
                       [this](const confide::schema::bytes_view_t& sample) {
                         return extractor_(sample);
                       },
                       options_.authenticator,
                       clock_.provider()},
        vault_{encoder_,   storage_,       cipher_,
               sessions_,  contacts_.lookup(), options_.vault,
               clock_.provider()},
        disclosures_{encoder_, storage_, cipher_, sessions_,
                     std::move(classifier), clock_.provider()} {}

  service_fixture(const service_fixture&) = delete;
  service_fixture& operator=(const service_fixture&) = delete;
  service_fixture(service_fixture&&) = delete;
  service_fixture& operator=(service_fixture&&) = delete;


  static confide::disclosure::intent_classifier_t always_romantic() {
    return [](std::string_view, std::string_view,
              const std::optional<std::string>&) { return true; };
  }

  /// Enroll `principal` with the reference embedding (1, 0) under the
  /// sample name "<principal>-enroll".
  void enroll(const confide::schema::principal_id_t& principal) {
    auto sample = principal + "-enroll";
    extractor_.add(sample, {1.0f, 0.0f});
    auto result = authenticator_.enroll(
        principal, {confide::schema::make_bytes(sample)});
    if (!result.ok()) {
      throw std::runtime_error{"enrollment failed: " + result.log};
    }
  }

  /// Register a sample for `principal` scoring `score` against enrollment.
  std::string sample_at(const confide::schema::principal_id_t& principal,
                        const double score) {
    auto sample = principal + "-sample-" + std::to_string(score);
    extractor_.add(sample, embedding_at(score));
    return sample;
  }

  confide::auth::verify_result_t verify(
      const confide::schema::principal_id_t& principal,
      const std::string& sample,
      const std::string& channel = "test-channel",
      const std::optional<std::string>& category = std::nullopt) {
    return authenticator_.verify(principal,
                                 confide::schema::make_bytes_view(sample),
                                 channel, category);
  }

  void add_memory(confide::schema::memory_record_t record) {
    memories_.push_back(std::move(record));
  }

  const std::string& db_path() const { return db_path_.path(); }
  manual_clock& clock() { return clock_; }
  table_extractor& extractor() { return extractor_; }
  scale_encoder_t& encoder() { return encoder_; }
  const confide::storage::rocksdb_storage_t& storage() const { return storage_; }
  const confide::crypto::envelope_cipher& cipher() const { return cipher_; }
  confide::auth::session_store& sessions() { return sessions_; }
  confide::vault::contact_directory& contacts() { return contacts_; }
  confide::auth::challenge_issuer& challenges() { return challenges_; }
  confide::auth::confidence_authenticator& authenticator() {
    return authenticator_;
  }
  confide::vault::secret_vault& vault() { return vault_; }
  confide::disclosure::disclosure_registry& disclosures() {
    return disclosures_;
  }

 private:
  // Returns every stored memory in the category, newest first, regardless
  // of owner.
  confide::auth::memory_source_t memory_source() {
    return [this](const confide::schema::principal_id_t&,
                  const std::optional<std::string>& category,
                  const std::size_t limit) {
      auto out = std::vector<confide::schema::memory_record_t>{};
      for (const auto& record : memories_) {
        if (!category.has_value() || record.category == *category) {
          out.push_back(record);
        }
      }
      std::ranges::sort(out, [](const auto& a, const auto& b) {
        return a.created_at > b.created_at;
      });
      if (out.size() > limit) {
        out.resize(limit);
      }
      return out;
    };
  }

  scoped_db_path db_path_;
  confide::config::options options_;
  manual_clock clock_;
  table_extractor extractor_;
  std::vector<confide::schema::memory_record_t> memories_;
  scale_encoder_t encoder_;
  confide::storage::rocksdb_storage_t storage_;
  confide::crypto::envelope_cipher cipher_;
  confide::auth::session_store sessions_;
  confide::vault::contact_directory contacts_;
  confide::auth::challenge_issuer challenges_;
  confide::auth::confidence_authenticator authenticator_;
  confide::vault::secret_vault vault_;
  confide::disclosure::disclosure_registry disclosures_;
};

}  // namespace confide::testing
