#pragma once

#include <confide/schema/challenge.hpp>
#include <confide/schema/memory_record.hpp>
#include <confide/schema/primitives.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace confide::auth {

/// Turns one audio sample into a fixed-length speaker embedding.
using embedding_extractor_t = std::function<confide::schema::embedding_t(
    const confide::schema::bytes_view_t& sample)>;

/// Decides whether `response` answers `challenge`, given the answer captured
/// when the challenge was issued.
using answer_verifier_t =
    std::function<bool(const confide::schema::challenge_t& challenge,
                       std::string_view expected,
                       std::string_view response)>;

/// Most recent records owned by a principal, newest first, optionally
/// restricted to one category.
using memory_source_t = std::function<std::vector<confide::schema::memory_record_t>(
    const confide::schema::principal_id_t& principal,
    const std::optional<std::string>& category,
    std::size_t limit)>;

}  // namespace confide::auth
