#include <confide/auth/challenge_issuer.hpp>
#include <confide/crypto/cipher.hpp>
#include <confide/schema/key/keys.hpp>
#include <confide/schema/principal_record.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <utility>
#include <vector>

namespace confide::auth {

namespace {

constexpr auto kCodespace = "confide.challenge";

constexpr std::size_t kMinContentWords = 3;
constexpr std::size_t kMaxContentWords = 8;

constexpr auto kFamilyCategories =
    std::array<std::string_view, 6>{"family",  "mother",  "father",
                                    "parents", "siblings", "children"};

// Cut at most `length` bytes without splitting a UTF-8 sequence.
std::size_t utf8_boundary(const std::string& text, std::size_t length) {
  if (length >= text.size()) {
    return text.size();
  }
  while (length > 0 &&
         (static_cast<unsigned char>(text[length]) & 0xC0u) == 0x80u) {
    --length;
  }
  return length;
}

confide::schema::access_result<confide::schema::auth_session_t> deny(
    std::string log) {
  return confide::schema::make_error<confide::schema::auth_session_t>(
      confide::schema::access_error_code::authentication_denied,
      std::move(log), kCodespace);
}

std::vector<std::string> split_words(const std::string& normalized) {
  auto words = std::vector<std::string>{};
  auto begin = std::size_t{0};
  while (begin < normalized.size()) {
    auto end = normalized.find(' ', begin);
    if (end == std::string::npos) {
      end = normalized.size();
    }
    words.push_back(normalized.substr(begin, end - begin));
    begin = end + 1;
  }
  return words;
}

// Half the hidden remainder, clamped to [kMinContentWords, kMaxContentWords]
// and never more than the remainder itself.
std::size_t required_content_words(const std::size_t total) {
  auto half = (total + 1) / 2;
  return std::min(total,
                  std::clamp(half, kMinContentWords, kMaxContentWords));
}

// The response must be a contiguous run of whole words from the remainder.
// The hint may cut a word, so the first remainder word also matches the tail
// of a fully spelled first response word.
bool recalls_content(const std::string& expected, const std::string& response) {
  auto want = split_words(expected);
  auto got = split_words(response);
  if (got.empty() || got.size() < required_content_words(want.size())) {
    return false;
  }
  for (std::size_t start = 0; start + got.size() <= want.size(); ++start) {
    auto first_matches =
        got.front() == want[start] ||
        (start == 0 && got.front().ends_with(want.front()));
    if (first_matches && std::equal(std::next(std::begin(got)), std::end(got),
                                    std::begin(want) +
                                        static_cast<std::ptrdiff_t>(start + 1))) {
      return true;
    }
  }
  return false;
}

}  // namespace

bool is_family_category(const std::string_view category) {
  auto normalized = normalize_answer(category);
  return std::ranges::find(kFamilyCategories, normalized) !=
         std::end(kFamilyCategories);
}

std::string normalize_answer(const std::string_view answer) {
  auto out = std::string{};
  out.reserve(answer.size());
  auto pending_space = false;
  for (const auto ch : answer) {
    auto byte = static_cast<unsigned char>(ch);
    if (byte >= 0x80u || std::isalnum(byte) != 0) {
      if (pending_space && !out.empty()) {
        out.push_back(' ');
      }
      pending_space = false;
      out.push_back(static_cast<char>(std::tolower(byte)));
      continue;
    }
    pending_space = true;
  }
  return out;
}

bool match_expected_answer(const confide::schema::challenge_t& challenge,
                           const std::string_view expected,
                           const std::string_view response) {
  auto normalized_response = normalize_answer(response);
  auto normalized_expected = normalize_answer(expected);
  if (normalized_response.empty() || normalized_expected.empty()) {
    return false;
  }
  if (challenge.kind == confide::schema::challenge_kind_t::content) {
    return recalls_content(normalized_expected, normalized_response);
  }
  return normalized_response == normalized_expected;
}

answer_verifier_t make_expected_answer_verifier() {
  return [](const confide::schema::challenge_t& challenge,
            const std::string_view expected, const std::string_view response) {
    return match_expected_answer(challenge, expected, response);
  };
}

challenge_issuer::challenge_issuer(
    confide::schema::encoding::scale_encoder_t& encoder,
    const confide::storage::rocksdb_storage_t& storage,
    session_store& sessions,
    memory_source_t memory_source,
    answer_verifier_t verifier,
    confide::config::challenge_options options,
    confide::common::now_provider_t now)
    : encoder_{encoder},
      storage_{storage},
      sessions_{sessions},
      memory_source_{std::move(memory_source)},
      verifier_{std::move(verifier)},
      options_{std::move(options)},
      now_{std::move(now)} {}

std::vector<confide::schema::memory_record_t> challenge_issuer::recent_records(
    const confide::schema::principal_id_t& principal,
    const std::optional<std::string>& category) const {
  if (!memory_source_) {
    return {};
  }
  auto records = memory_source_(principal, category, options_.record_window);
  if (records.empty() && category.has_value()) {
    records = memory_source_(principal, std::nullopt, options_.record_window);
  }
  std::erase_if(records, [&](const auto& record) {
    return record.owner != principal;
  });
  std::ranges::stable_sort(records, [](const auto& a, const auto& b) {
    return a.created_at > b.created_at;
  });
  return records;
}

std::string challenge_issuer::identity_answer(
    const confide::schema::principal_id_t& principal) const {
  auto record = storage_.get<confide::schema::principal_record_t>(
      encoder_, confide::schema::key::make_principal_key(encoder_, principal));
  if (record.has_value() && !record->display_name.empty()) {
    return record->display_name;
  }
  return principal;
}

std::vector<challenge_issuer::pending_challenge>
challenge_issuer::build_challenges(
    const confide::schema::principal_id_t& principal,
    const std::optional<std::string>& category) const {
  auto records = recent_records(principal, category);

  auto temporal = std::optional<pending_challenge>{};
  auto content = std::optional<pending_challenge>{};
  auto relationship = std::optional<pending_challenge>{};

  if (!records.empty()) {
    const auto& newest = records.front();
    temporal = pending_challenge{
        .challenge = {.challenge_id = confide::crypto::random_id(),
                      .kind = confide::schema::challenge_kind_t::temporal,
                      .prompt = fmt::format(
                          "On what date did you save your most recent {}"
                          "memory? Answer as YYYY-MM-DD.",
                          newest.category.empty() ? ""
                                                  : newest.category + " ")},
        .expected = confide::schema::to_utc_date(newest.created_at)};
  }

  if (records.size() >= 2) {
    const auto& second = records[1];
    auto cut = utf8_boundary(second.content, options_.content_hint_length);
    if (cut > 0 && cut < second.content.size()) {
      content = pending_challenge{
          .challenge = {.challenge_id = confide::crypto::random_id(),
                        .kind = confide::schema::challenge_kind_t::content,
                        .prompt = fmt::format(
                            "How does this memory of yours continue? \"{}...\"",
                            second.content.substr(0, cut))},
          .expected = second.content.substr(cut)};
    }
  }

  auto with_counterpart = std::ranges::find_if(records, [](const auto& r) {
    return r.counterpart_name.has_value() && r.relationship_label.has_value() &&
           !r.counterpart_name->empty() && !r.relationship_label->empty();
  });
  if (with_counterpart != std::end(records)) {
    relationship = pending_challenge{
        .challenge = {.challenge_id = confide::crypto::random_id(),
                      .kind = confide::schema::challenge_kind_t::relationship,
                      .prompt = fmt::format("Who is {} to you?",
                                            *with_counterpart->counterpart_name)},
        .expected = *with_counterpart->relationship_label};
  }

  auto ordered = std::vector<std::optional<pending_challenge>>{};
  if (category.has_value() && is_family_category(*category)) {
    ordered = {relationship, temporal, content};
  } else {
    ordered = {temporal, content, relationship};
  }

  auto selected = std::vector<pending_challenge>{};
  for (auto& candidate : ordered) {
    if (candidate.has_value() && selected.size() < options_.max_challenges) {
      selected.push_back(std::move(*candidate));
    }
  }

  if (selected.empty()) {
    selected.push_back(pending_challenge{
        .challenge = {.challenge_id = confide::crypto::random_id(),
                      .kind = confide::schema::challenge_kind_t::identity,
                      .prompt = "What name did you register with?"},
        .expected = identity_answer(principal)});
  }
  return selected;
}

std::vector<confide::schema::challenge_t> challenge_issuer::issue(
    const confide::schema::principal_id_t& principal,
    const std::optional<std::string>& category) {
  auto built = build_challenges(principal, category);

  auto issued = std::vector<confide::schema::challenge_t>{};
  issued.reserve(built.size());
  for (const auto& entry : built) {
    issued.push_back(entry.challenge);
  }

  auto lock = std::scoped_lock{mutex_};
  pending_[principal] = pending_set{.challenges = std::move(built),
                                    .category = category,
                                    .expires_at = now_() + options_.challenge_ttl,
                                    .failed_attempts = 0};
  evidence_.erase(principal);
  spdlog::info("Issued {} challenge(s) to '{}'", issued.size(), principal);
  return issued;
}

void challenge_issuer::attach_voice_evidence(
    const confide::schema::principal_id_t& principal,
    const confide::schema::channel_id_t& channel,
    const double score) {
  auto lock = std::scoped_lock{mutex_};
  evidence_[principal] =
      voice_evidence{.channel = channel, .score = score, .recorded_at = now_()};
}

confide::schema::access_result<confide::schema::auth_session_t>
challenge_issuer::verify(
    const confide::schema::principal_id_t& principal,
    const confide::schema::channel_id_t& channel,
    const std::vector<confide::schema::challenge_response_t>& responses) {
  auto lock = std::scoped_lock{mutex_};
  auto now = now_();

  auto pending = pending_.find(principal);
  if (pending == std::end(pending_)) {
    return deny("no pending challenge");
  }
  if (now >= pending->second.expires_at) {
    pending_.erase(pending);
    evidence_.erase(principal);
    return deny("challenge expired");
  }

  auto evidence = evidence_.find(principal);
  if (evidence == std::end(evidence_) || evidence->second.channel != channel) {
    spdlog::warn("Challenge response from '{}' on '{}' without voice evidence",
                 principal, channel);
    return deny("voice evidence missing for channel");
  }

  auto& set = pending->second;
  auto all_answered =
      !responses.empty() &&
      std::ranges::all_of(responses, [&](const auto& response) {
        return std::ranges::any_of(set.challenges, [&](const auto& entry) {
          return entry.challenge.challenge_id == response.challenge_id;
        });
      }) &&
      std::ranges::all_of(set.challenges, [&](const auto& entry) {
        auto response = std::ranges::find_if(responses, [&](const auto& r) {
          return r.challenge_id == entry.challenge.challenge_id;
        });
        return response != std::end(responses) && verifier_ &&
               verifier_(entry.challenge, entry.expected, response->answer);
      });

  if (!all_answered) {
    ++set.failed_attempts;
    spdlog::warn("Rejected challenge response from '{}' ({}/{})", principal,
                 set.failed_attempts, options_.max_failed_attempts);
    if (set.failed_attempts >= options_.max_failed_attempts) {
      pending_.erase(pending);
      evidence_.erase(evidence);
      return deny("too many failed challenge attempts");
    }
    return deny("challenge response rejected");
  }

  auto category = set.category;
  auto voice_score = evidence->second.score;
  pending_.erase(pending);
  evidence_.erase(evidence);

  auto session = sessions_.issue(
      principal, channel, options_.challenge_confidence,
      {confide::schema::session_factor_t::voice,
       confide::schema::session_factor_t::challenge},
      options_.session_ttl, std::move(category));
  spdlog::info("Challenge passed for '{}' on '{}' (voice score {:.3f})",
               principal, channel, voice_score);
  return confide::schema::make_ok(std::move(session), kCodespace);
}

bool challenge_issuer::has_pending(
    const confide::schema::principal_id_t& principal) {
  auto lock = std::scoped_lock{mutex_};
  return pending_.contains(principal);
}

void challenge_issuer::forget(
    const confide::schema::principal_id_t& principal) {
  auto lock = std::scoped_lock{mutex_};
  pending_.erase(principal);
  evidence_.erase(principal);
}

}  // namespace confide::auth
