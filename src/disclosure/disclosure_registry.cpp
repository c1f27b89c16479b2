#include <confide/disclosure/disclosure_registry.hpp>
#include <confide/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <utility>

namespace confide::disclosure {

namespace {

constexpr auto kCodespace = "confide.disclosure";

using confide::schema::access_error_code;

constexpr auto kRomanticKeywords = std::array<std::string_view, 9>{
    "love",     "crush",  "romantic", "feelings for", "attracted",
    "date him", "date her", "kiss",   "in love"};

std::string lowercase(const std::string_view text) {
  auto out = std::string{text};
  std::ranges::transform(out, std::begin(out), [](const char ch) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  });
  return out;
}

}  // namespace

intent_classifier_t make_keyword_classifier() {
  return [](const std::string_view title, const std::string_view content,
            const std::optional<std::string>& target_name) {
    if (!target_name.has_value() || target_name->empty()) {
      return false;
    }
    auto text = lowercase(title);
    text.push_back(' ');
    text.append(lowercase(content));
    return std::ranges::any_of(kRomanticKeywords, [&](const auto keyword) {
      return text.find(keyword) != std::string::npos;
    });
  };
}

std::vector<confide::schema::principal_id_t> readers_of(
    const confide::schema::disclosure_record_t& record) {
  auto readers = std::vector<confide::schema::principal_id_t>{record.owner};
  if (record.designated_reader.has_value()) {
    readers.push_back(*record.designated_reader);
  }
  if (record.matched && record.target_id.has_value() &&
      std::ranges::find(readers, *record.target_id) == std::end(readers)) {
    readers.push_back(*record.target_id);
  }
  return readers;
}

disclosure_registry::disclosure_registry(
    confide::schema::encoding::scale_encoder_t& encoder,
    const confide::storage::rocksdb_storage_t& storage,
    const confide::crypto::envelope_cipher& cipher,
    confide::auth::session_store& sessions,
    intent_classifier_t classifier,
    confide::common::now_provider_t now)
    : encoder_{encoder},
      storage_{storage},
      cipher_{cipher},
      sessions_{sessions},
      classifier_{std::move(classifier)},
      now_{std::move(now)},
      matcher_{encoder, storage, record_locks_, now_} {}

void disclosure_registry::set_match_listener(match_listener_t listener) {
  matcher_.set_match_listener(std::move(listener));
}

std::optional<confide::schema::disclosure_record_t> disclosure_registry::load(
    const confide::schema::record_id_t& record_id) const {
  return storage_.get<confide::schema::disclosure_record_t>(
      encoder_, confide::schema::key::make_disclosure_key(encoder_, record_id));
}

confide::schema::access_result<confide::schema::disclosure_record_t>
disclosure_registry::load_owned(
    const confide::schema::record_id_t& record_id,
    const confide::schema::principal_id_t& owner) const {
  auto record = load(record_id);
  if (!record.has_value() || record->owner != owner) {
    return confide::schema::make_access_denied<
        confide::schema::disclosure_record_t>(kCodespace);
  }
  return confide::schema::make_ok(std::move(*record), kCodespace);
}

confide::schema::access_result<confide::schema::disclosure_record_t>
disclosure_registry::create(
    const confide::schema::principal_id_t& owner,
    const std::string& title,
    const std::string& content,
    const std::optional<confide::schema::principal_id_t>& target_id,
    const std::optional<std::string>& target_name) {
  using record_t = confide::schema::disclosure_record_t;
  if (owner.empty()) {
    return confide::schema::make_error<record_t>(
        access_error_code::invalid_argument, "owner is empty", kCodespace);
  }
  if (target_id.has_value() && (target_id->empty() || *target_id == owner)) {
    return confide::schema::make_error<record_t>(
        access_error_code::invalid_argument, "invalid target", kCodespace);
  }

  auto record = record_t{};
  record.record_id = confide::crypto::random_id();
  record.owner = owner;
  record.title = title;
  record.content =
      cipher_.seal(confide::schema::make_bytes_view(content),
                   confide::schema::make_bytes_view(record.record_id));
  record.romantic = classifier_ && classifier_(title, content, target_name);
  record.target_id = target_id;
  record.target_name = target_name;
  record.created_at = now_();

  storage_.commit(
      {confide::storage::make_put(
           encoder_,
           confide::schema::key::make_disclosure_key(encoder_, record.record_id),
           record),
       confide::storage::make_put(
           encoder_,
           confide::schema::key::make_disclosure_owner_key(encoder_, owner,
                                                           record.record_id),
           record.record_id)});
  spdlog::info("Stored disclosure {} for '{}' (romantic: {})",
               confide::schema::to_hex(record.record_id), owner,
               record.romantic);

  if (record.romantic && record.target_id.has_value()) {
    matcher_.on_created(record);
    auto refreshed = load(record.record_id);
    if (refreshed.has_value()) {
      record = std::move(*refreshed);
    }
  }
  return confide::schema::make_ok(std::move(record), kCodespace);
}

confide::schema::access_result<confide::schema::disclosure_record_t>
disclosure_registry::set_designated_reader(
    const confide::schema::record_id_t& record_id,
    const confide::schema::principal_id_t& owner,
    const confide::schema::principal_id_t& reader) {
  auto lock = record_locks_.lock(confide::schema::make_bytes_view(record_id));
  auto result = load_owned(record_id, owner);
  if (!result.ok()) {
    return result;
  }
  if (reader.empty() || reader == owner) {
    return confide::schema::make_error<confide::schema::disclosure_record_t>(
        access_error_code::invalid_argument, "invalid reader", kCodespace);
  }
  auto& record = *result.value;
  if (record.designated_reader == reader) {
    return result;
  }
  record.designated_reader = reader;
  storage_.put(encoder_,
               confide::schema::key::make_disclosure_key(encoder_, record_id),
               record);
  spdlog::info("Designated '{}' as reader of disclosure {}", reader,
               confide::schema::to_hex(record_id));
  return result;
}

confide::schema::access_result<confide::schema::disclosure_record_t>
disclosure_registry::clear_designated_reader(
    const confide::schema::record_id_t& record_id,
    const confide::schema::principal_id_t& owner) {
  auto lock = record_locks_.lock(confide::schema::make_bytes_view(record_id));
  auto result = load_owned(record_id, owner);
  if (!result.ok() || !result.value->designated_reader.has_value()) {
    return result;
  }
  result.value->designated_reader.reset();
  storage_.put(encoder_,
               confide::schema::key::make_disclosure_key(encoder_, record_id),
               *result.value);
  return result;
}

confide::schema::access_result<confide::schema::disclosure_record_t>
disclosure_registry::clear_target(
    const confide::schema::record_id_t& record_id,
    const confide::schema::principal_id_t& owner) {
  auto lock = record_locks_.lock(confide::schema::make_bytes_view(record_id));
  auto result = load_owned(record_id, owner);
  if (!result.ok()) {
    return result;
  }
  auto& record = *result.value;
  if (record.matched) {
    return confide::schema::make_error<confide::schema::disclosure_record_t>(
        access_error_code::invalid_argument, "record already matched",
        kCodespace);
  }
  if (!record.target_id.has_value() && !record.target_name.has_value()) {
    return result;
  }
  record.target_id.reset();
  record.target_name.reset();
  storage_.put(encoder_,
               confide::schema::key::make_disclosure_key(encoder_, record_id),
               record);
  spdlog::info("Cleared target of disclosure {}",
               confide::schema::to_hex(record_id));
  return result;
}

confide::schema::access_result<std::string> disclosure_registry::read(
    const confide::schema::record_id_t& record_id,
    const confide::schema::principal_id_t& requester) const {
  auto record = load(record_id);
  if (!record.has_value() || requester.empty()) {
    return confide::schema::make_access_denied<std::string>(kCodespace);
  }
  auto readers = readers_of(*record);
  if (std::ranges::find(readers, requester) == std::end(readers)) {
    spdlog::info("Denied '{}' read of disclosure {}", requester,
                 confide::schema::to_hex(record_id));
    return confide::schema::make_access_denied<std::string>(kCodespace);
  }

  try {
    auto plaintext = cipher_.open(
        record->content, confide::schema::make_bytes_view(record->record_id));
    return confide::schema::make_ok(confide::schema::make_string(plaintext),
                                    kCodespace);
  } catch (const confide::crypto::decryption_error& ex) {
    spdlog::critical("Disclosure {} failed integrity check: {}",
                     confide::schema::to_hex(record_id), ex.what());
    throw;
  }
}

confide::schema::access_result<std::string>
disclosure_registry::read_with_session(
    const confide::schema::record_id_t& record_id,
    const confide::schema::session_id_t& session_id) const {
  auto session = sessions_.find(session_id);
  if (!session.ok()) {
    return confide::schema::make_error<std::string>(session.code, session.log,
                                                    kCodespace);
  }
  return read(record_id, session.value->principal_id);
}

std::vector<confide::schema::principal_id_t> disclosure_registry::readers(
    const confide::schema::record_id_t& record_id) const {
  auto record = load(record_id);
  if (!record.has_value()) {
    return {};
  }
  return readers_of(*record);
}

std::vector<confide::schema::disclosure_record_t>
disclosure_registry::list_owned(
    const confide::schema::principal_id_t& owner) const {
  auto records = std::vector<confide::schema::disclosure_record_t>{};
  for (const auto& [key, value] : storage_.list_by_prefix(
           confide::schema::key::make_disclosure_owner_prefix_key(encoder_,
                                                                  owner))) {
    auto record = load(encoder_.decode<confide::schema::record_id_t>(value));
    if (record.has_value()) {
      records.push_back(std::move(*record));
    }
  }
  std::ranges::sort(records, [](const auto& a, const auto& b) {
    return a.created_at < b.created_at;
  });
  return records;
}

std::vector<confide::schema::match_event_t> disclosure_registry::matches(
    const confide::schema::principal_id_t& principal) const {
  return matcher_.matches(principal);
}

}  // namespace confide::disclosure
