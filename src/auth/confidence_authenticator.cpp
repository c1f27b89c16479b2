#include <confide/auth/confidence_authenticator.hpp>
#include <confide/auth/embedding.hpp>
#include <confide/schema/key/keys.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace confide::auth {

namespace {

constexpr auto kCodespace = "confide.auth";

using confide::schema::access_error_code;

}  // namespace

confidence_authenticator::confidence_authenticator(
    confide::schema::encoding::scale_encoder_t& encoder,
    const confide::storage::rocksdb_storage_t& storage,
    const confide::crypto::envelope_cipher& cipher,
    session_store& sessions,
    challenge_issuer& challenges,
    embedding_extractor_t extractor,
    confide::config::authenticator_options options,
    confide::common::now_provider_t now)
    : encoder_{encoder},
      storage_{storage},
      cipher_{cipher},
      sessions_{sessions},
      challenges_{challenges},
      extractor_{std::move(extractor)},
      options_{std::move(options)},
      now_{std::move(now)} {
  if (options_.medium_confidence_threshold >
      options_.high_confidence_threshold) {
    spdlog::warn(
        "Medium confidence threshold {} exceeds high threshold {}; no "
        "challenge band",
        options_.medium_confidence_threshold,
        options_.high_confidence_threshold);
  }
}

confide::schema::principal_record_t confidence_authenticator::register_principal(
    const confide::schema::principal_id_t& principal,
    const std::string& display_name) {
  auto key = confide::schema::key::make_principal_key(encoder_, principal);
  auto lock = principal_locks_.lock(principal);

  auto record =
      storage_.get<confide::schema::principal_record_t>(encoder_, key)
          .value_or(confide::schema::principal_record_t{
              .principal_id = principal, .created_at = now_()});
  record.display_name = display_name;
  storage_.put(encoder_, key, record);
  return record;
}

std::optional<confide::schema::principal_record_t>
confidence_authenticator::find_principal(
    const confide::schema::principal_id_t& principal) const {
  return storage_.get<confide::schema::principal_record_t>(
      encoder_, confide::schema::key::make_principal_key(encoder_, principal));
}

confide::schema::access_result<confide::schema::voiceprint_t>
confidence_authenticator::enroll(
    const confide::schema::principal_id_t& principal,
    const std::vector<confide::schema::bytes_t>& samples,
    const std::optional<std::string>& device_hint) {
  if (principal.empty()) {
    return confide::schema::make_error<confide::schema::voiceprint_t>(
        access_error_code::invalid_argument, "principal id is empty",
        kCodespace);
  }
  if (samples.empty()) {
    return confide::schema::make_error<confide::schema::voiceprint_t>(
        access_error_code::invalid_argument,
        "enrollment requires at least one sample", kCodespace);
  }

  auto embeddings = std::vector<confide::schema::embedding_t>{};
  embeddings.reserve(samples.size());
  for (const auto& sample : samples) {
    if (sample.empty()) {
      return confide::schema::make_error<confide::schema::voiceprint_t>(
          access_error_code::invalid_argument, "enrollment sample is empty",
          kCodespace);
    }
    embeddings.push_back(extractor_(sample));
  }
  auto dimensions = embeddings.front().size();
  if (dimensions == 0 ||
      !std::ranges::all_of(embeddings, [&](const auto& embedding) {
        return embedding.size() == dimensions;
      })) {
    return confide::schema::make_error<confide::schema::voiceprint_t>(
        access_error_code::invalid_argument,
        "samples produced inconsistent embeddings", kCodespace);
  }

  auto average = average_embeddings(embeddings);
  auto similarity = 0.0;
  for (const auto& embedding : embeddings) {
    similarity += cosine_similarity(embedding, average);
  }
  similarity /= static_cast<double>(embeddings.size());

  auto principal_key =
      confide::schema::key::make_principal_key(encoder_, principal);
  auto lock = principal_locks_.lock(principal);
  auto now = now_();

  auto record =
      storage_.get<confide::schema::principal_record_t>(encoder_, principal_key)
          .value_or(confide::schema::principal_record_t{
              .principal_id = principal,
              .display_name = principal,
              .created_at = now});
  if (record.status == confide::schema::principal_status_t::suspended) {
    spdlog::warn("Refusing enrollment for suspended principal '{}'", principal);
    return confide::schema::make_error<confide::schema::voiceprint_t>(
        access_error_code::authentication_denied, "principal is suspended",
        kCodespace);
  }
  record.status = confide::schema::principal_status_t::enrolled;

  auto voiceprint = confide::schema::voiceprint_t{};
  voiceprint.voiceprint_id = confide::crypto::random_id();
  voiceprint.owner = principal;
  voiceprint.embedding =
      cipher_.seal(serialize_embedding(average),
                   confide::schema::make_bytes_view(voiceprint.voiceprint_id));
  voiceprint.model_version = options_.model_version;
  voiceprint.enrolled_at = now;
  voiceprint.device_hint = device_hint;
  voiceprint.enrollment_confidence_ppm = to_ppm(similarity);

  storage_.commit(
      {confide::storage::make_put(
           encoder_,
           confide::schema::key::make_voiceprint_key(encoder_, principal,
                                                     voiceprint.voiceprint_id),
           voiceprint),
       confide::storage::make_put(encoder_, principal_key, record)});

  spdlog::info("Enrolled voiceprint for '{}' from {} sample(s)", principal,
               samples.size());
  return confide::schema::make_ok(std::move(voiceprint), kCodespace);
}

bool confidence_authenticator::admit_attempt(
    const confide::schema::principal_id_t& principal,
    const confide::schema::timestamp_milliseconds_t now) {
  auto lock = std::scoped_lock{rate_mutex_};
  if (now >= last_rate_sweep_ + options_.attempt_window) {
    std::erase_if(recent_attempts_, [&](const auto& entry) {
      return entry.second.empty() ||
             entry.second.back() + options_.attempt_window <= now;
    });
    last_rate_sweep_ = now;
  }
  auto& window = recent_attempts_[principal];
  while (!window.empty() && window.front() + options_.attempt_window <= now) {
    window.pop_front();
  }
  if (window.size() >= options_.max_attempts_per_window) {
    return false;
  }
  window.push_back(now);
  return true;
}

uint32_t confidence_authenticator::best_score_ppm(
    const std::vector<confide::schema::voiceprint_t>& voiceprints,
    const confide::schema::embedding_t& sample) const {
  auto best = 0.0;
  for (const auto& voiceprint : voiceprints) {
    auto plaintext = confide::schema::bytes_t{};
    try {
      plaintext = cipher_.open(
          voiceprint.embedding,
          confide::schema::make_bytes_view(voiceprint.voiceprint_id));
    } catch (const confide::crypto::decryption_error& ex) {
      spdlog::critical("Voiceprint {} of '{}' failed integrity check: {}",
                       confide::schema::to_hex(voiceprint.voiceprint_id),
                       voiceprint.owner, ex.what());
      throw;
    }
    auto stored = deserialize_embedding(plaintext);
    if (!stored.has_value()) {
      throw confide::crypto::decryption_error{"voiceprint embedding is malformed"};
    }
    best = std::max(best, cosine_similarity(*stored, sample));
  }
  return to_ppm(best);
}

void confidence_authenticator::record_attempt(
    const confide::schema::principal_id_t& principal,
    const confide::schema::channel_id_t& channel,
    const confide::schema::timestamp_milliseconds_t now,
    const uint32_t score_ppm,
    const confide::schema::auth_outcome_t outcome,
    const std::string& reason) {
  auto attempt = confide::schema::auth_attempt_t{.principal_id = principal,
                                                 .channel_id = channel,
                                                 .attempted_at = now,
                                                 .score_ppm = score_ppm,
                                                 .outcome = outcome,
                                                 .reason = reason};
  storage_.put(encoder_,
               confide::schema::key::make_auth_attempt_key(
                   encoder_, principal, now, attempt_sequence_.fetch_add(1)),
               attempt);
}

verify_result_t confidence_authenticator::verify(
    const confide::schema::principal_id_t& principal,
    const confide::schema::bytes_view_t& sample,
    const confide::schema::channel_id_t& channel,
    const std::optional<std::string>& category) {
  auto now = now_();

  auto deny = [&](const access_error_code code, std::string reason,
                  const uint32_t score_ppm) -> verify_result_t {
    record_attempt(principal, channel, now, score_ppm,
                   confide::schema::auth_outcome_t::denied, reason);
    spdlog::info("Denied '{}' on '{}': {}", principal, channel, reason);
    return denied_t{.score = from_ppm(score_ppm),
                    .code = code,
                    .reason = std::move(reason)};
  };

  if (!admit_attempt(principal, now)) {
    return deny(access_error_code::rate_limited, "too many attempts", 0);
  }

  auto record = find_principal(principal);
  if (!record.has_value()) {
    return deny(access_error_code::not_enrolled, "principal is not enrolled",
                0);
  }
  if (record->status != confide::schema::principal_status_t::enrolled) {
    return deny(access_error_code::not_enrolled,
                fmt::format("principal is {}", to_string(record->status)), 0);
  }

  auto voiceprints = list_voiceprints(principal);
  if (voiceprints.empty()) {
    return deny(access_error_code::not_enrolled,
                "principal has no voiceprints", 0);
  }
  if (sample.empty()) {
    return deny(access_error_code::authentication_denied, "sample is empty",
                0);
  }

  auto score_ppm = best_score_ppm(voiceprints, extractor_(sample));
  auto score = from_ppm(score_ppm);

  if (score_ppm >= to_ppm(options_.high_confidence_threshold)) {
    auto session =
        sessions_.issue(principal, channel, score,
                        {confide::schema::session_factor_t::voice},
                        options_.session_ttl, category);
    record_attempt(principal, channel, now, score_ppm,
                   confide::schema::auth_outcome_t::authenticated,
                   "voice match");
    spdlog::info("Authenticated '{}' on '{}' with score {:.3f}", principal,
                 channel, score);
    return authenticated_t{.session = std::move(session)};
  }

  if (score_ppm >= to_ppm(options_.medium_confidence_threshold)) {
    auto issued = challenges_.issue(principal, category);
    challenges_.attach_voice_evidence(principal, channel, score);
    record_attempt(principal, channel, now, score_ppm,
                   confide::schema::auth_outcome_t::challenge_required,
                   "medium confidence");
    spdlog::info("Challenge required for '{}' on '{}' with score {:.3f}",
                 principal, channel, score);
    return challenge_required_t{.score = score, .challenges = std::move(issued)};
  }

  return deny(access_error_code::authentication_denied,
              "voice confidence below threshold", score_ppm);
}

std::future<verify_result_t> confidence_authenticator::verify_async(
    confide::schema::principal_id_t principal,
    confide::schema::bytes_t sample,
    confide::schema::channel_id_t channel,
    std::optional<std::string> category) {
  return std::async(std::launch::async,
                    [this, principal = std::move(principal),
                     sample = std::move(sample), channel = std::move(channel),
                     category = std::move(category)] {
                      return verify(principal, sample, channel, category);
                    });
}

std::vector<confide::schema::voiceprint_t>
confidence_authenticator::list_voiceprints(
    const confide::schema::principal_id_t& principal) const {
  auto voiceprints = std::vector<confide::schema::voiceprint_t>{};
  auto entries = storage_.list_by_prefix(
      confide::schema::key::make_voiceprint_prefix_key(encoder_, principal));
  voiceprints.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    voiceprints.push_back(
        encoder_.decode<confide::schema::voiceprint_t>(value));
  }
  std::ranges::sort(voiceprints, [](const auto& a, const auto& b) {
    return a.enrolled_at < b.enrolled_at;
  });
  return voiceprints;
}

std::size_t confidence_authenticator::delete_account(
    const confide::schema::principal_id_t& principal) {
  auto lock = principal_locks_.lock(principal);

  auto entries = storage_.list_by_prefix(
      confide::schema::key::make_voiceprint_prefix_key(encoder_, principal));
  auto operations = std::vector<confide::storage::write_op_t>{};
  operations.reserve(entries.size() + 1);
  for (auto& [key, value] : entries) {
    operations.push_back(confide::storage::make_erase(std::move(key)));
  }
  operations.push_back(confide::storage::make_erase(
      confide::schema::key::make_principal_key(encoder_, principal)));
  storage_.commit(operations);

  auto revoked = sessions_.revoke_principal(principal);
  challenges_.forget(principal);
  {
    auto rate_lock = std::scoped_lock{rate_mutex_};
    recent_attempts_.erase(principal);
  }

  spdlog::info("Deleted account '{}': {} voiceprint(s), {} session(s)",
               principal, entries.size(), revoked);
  return entries.size();
}

std::vector<confide::schema::auth_attempt_t> confidence_authenticator::attempts(
    const confide::schema::principal_id_t& principal,
    const std::size_t limit) const {
  auto entries = storage_.list_by_prefix(
      confide::schema::key::make_auth_attempt_prefix_key(encoder_, principal));
  auto out = std::vector<confide::schema::auth_attempt_t>{};
  for (auto it = std::rbegin(entries);
       it != std::rend(entries) && out.size() < limit; ++it) {
    out.push_back(encoder_.decode<confide::schema::auth_attempt_t>(it->second));
  }
  return out;
}

std::size_t confidence_authenticator::rate_tracked_principals() const {
  auto lock = std::scoped_lock{rate_mutex_};
  return recent_attempts_.size();
}

bool confidence_authenticator::logout(
    const confide::schema::session_id_t& session_id) {
  return sessions_.revoke(session_id);
}

}  // namespace confide::auth
