#include <confide/disclosure/mutual_disclosure_matcher.hpp>
#include <confide/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace confide::disclosure {

bool reciprocates(const confide::schema::disclosure_record_t& record,
                  const confide::schema::disclosure_record_t& candidate) {
  return record.romantic && candidate.romantic && record.target_id.has_value() &&
         candidate.target_id.has_value() &&
         candidate.owner == *record.target_id &&
         *candidate.target_id == record.owner &&
         candidate.record_id != record.record_id;
}

mutual_disclosure_matcher::mutual_disclosure_matcher(
    confide::schema::encoding::scale_encoder_t& encoder,
    const confide::storage::rocksdb_storage_t& storage,
    confide::common::lock_table& record_locks,
    confide::common::now_provider_t now)
    : encoder_{encoder},
      storage_{storage},
      record_locks_{record_locks},
      now_{std::move(now)} {}

void mutual_disclosure_matcher::set_match_listener(match_listener_t listener) {
  listener_ = std::move(listener);
}

std::optional<confide::schema::disclosure_record_t>
mutual_disclosure_matcher::load(
    const confide::schema::record_id_t& record_id) const {
  return storage_.get<confide::schema::disclosure_record_t>(
      encoder_, confide::schema::key::make_disclosure_key(encoder_, record_id));
}

std::optional<confide::schema::disclosure_record_t>
mutual_disclosure_matcher::find_reciprocal(
    const confide::schema::disclosure_record_t& record) const {
  auto best = std::optional<confide::schema::disclosure_record_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(confide::schema::key::make_disclosure_owner_prefix_key(
           encoder_, *record.target_id))) {
    auto candidate =
        load(encoder_.decode<confide::schema::record_id_t>(value));
    if (!candidate.has_value() || !reciprocates(record, *candidate)) {
      continue;
    }
    if (!best.has_value() || candidate->created_at < best->created_at) {
      best = std::move(candidate);
    }
  }
  return best;
}

std::optional<confide::schema::match_event_t>
mutual_disclosure_matcher::on_created(
    const confide::schema::disclosure_record_t& record) {
  if (!record.romantic || !record.target_id.has_value() ||
      record.target_id->empty() || *record.target_id == record.owner) {
    return std::nullopt;
  }

  auto [first, second] =
      confide::schema::key::canonical_pair(record.owner, *record.target_id);
  auto pair_key = first;
  pair_key.push_back('\0');
  pair_key.append(second);
  auto pair_lock = pair_locks_.lock(std::string_view{pair_key});

  auto candidate = find_reciprocal(record);
  if (!candidate.has_value()) {
    spdlog::debug("No reciprocal disclosure yet for '{}' -> '{}'", record.owner,
                  *record.target_id);
    return std::nullopt;
  }

  auto event = std::optional<confide::schema::match_event_t>{};
  {
    auto record_locks =
        record_locks_.lock_pair(confide::schema::make_bytes_view(record.record_id),
                                confide::schema::make_bytes_view(candidate->record_id));

    // Re-read under the record locks; a concurrent clear_target may have
    // withdrawn either side.
    auto current = load(record.record_id);
    auto other = load(candidate->record_id);
    if (!current.has_value() || !other.has_value() ||
        !reciprocates(*current, *other)) {
      return std::nullopt;
    }

    auto match_key =
        confide::schema::key::make_match_key(encoder_, first, second);
    auto existing =
        storage_.get<confide::schema::match_event_t>(encoder_, match_key);
    auto matched_at = existing.has_value() ? existing->matched_at : now_();

    auto operations = std::vector<confide::storage::write_op_t>{};
    for (auto* side : {&*current, &*other}) {
      if (side->matched) {
        continue;
      }
      side->matched = true;
      side->matched_at = matched_at;
      operations.push_back(confide::storage::make_put(
          encoder_,
          confide::schema::key::make_disclosure_key(encoder_, side->record_id),
          *side));
    }
    if (!existing.has_value()) {
      auto first_is_current = current->owner == first;
      event = confide::schema::match_event_t{
          .first_principal = first,
          .second_principal = second,
          .first_record =
              first_is_current ? current->record_id : other->record_id,
          .second_record =
              first_is_current ? other->record_id : current->record_id,
          .matched_at = matched_at};
      operations.push_back(
          confide::storage::make_put(encoder_, match_key, *event));
    }
    if (!operations.empty()) {
      storage_.commit(operations);
    }
  }

  if (!event.has_value()) {
    spdlog::debug("Pair '{}' / '{}' already matched", first, second);
    return std::nullopt;
  }

  spdlog::info("Mutual disclosure matched '{}' and '{}'", first, second);
  pair_lock.unlock();
  if (listener_) {
    listener_(*event);
  }
  return event;
}

std::vector<confide::schema::match_event_t> mutual_disclosure_matcher::matches(
    const confide::schema::principal_id_t& principal) const {
  auto events = std::vector<confide::schema::match_event_t>{};
  for (const auto& [key, value] : storage_.list_by_prefix(
           confide::schema::key::make_prefix_key(
               encoder_, confide::schema::key::kMatchKeyPrefix))) {
    auto event = encoder_.decode<confide::schema::match_event_t>(value);
    if (event.first_principal == principal ||
        event.second_principal == principal) {
      events.push_back(std::move(event));
    }
  }
  std::ranges::sort(events, [](const auto& a, const auto& b) {
    return a.matched_at < b.matched_at;
  });
  return events;
}

std::optional<confide::schema::match_event_t>
mutual_disclosure_matcher::find_match(
    const confide::schema::principal_id_t& a,
    const confide::schema::principal_id_t& b) const {
  return storage_.get<confide::schema::match_event_t>(
      encoder_, confide::schema::key::make_match_key(encoder_, a, b));
}

match_state_t mutual_disclosure_matcher::match_state(
    const confide::schema::record_id_t& first,
    const confide::schema::record_id_t& second) const {
  auto values = storage_.snapshot_get(
      {confide::schema::key::make_disclosure_key(encoder_, first),
       confide::schema::key::make_disclosure_key(encoder_, second)});
  auto decode = [this](const std::optional<confide::schema::bytes_t>& raw) {
    auto out = std::optional<confide::schema::disclosure_record_t>{};
    if (raw.has_value()) {
      out = encoder_.decode<confide::schema::disclosure_record_t>(*raw);
    }
    return out;
  };
  return match_state_t{.first = decode(values[0]), .second = decode(values[1])};
}

}  // namespace confide::disclosure
