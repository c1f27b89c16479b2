#pragma once

#include <confide/auth/capabilities.hpp>
#include <confide/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace confide::auth {

inline constexpr std::size_t kPlaceholderEmbeddingDimensions = 512;

/// Stand-in speaker model: BLAKE3 extended output of the raw sample, one
/// byte per dimension scaled into [0, 1]. Identical samples produce identical
/// embeddings; it carries no biometric meaning.
confide::schema::embedding_t placeholder_embedding(
    const confide::schema::bytes_view_t& sample);

embedding_extractor_t make_placeholder_extractor();

/// Cosine similarity in [-1, 1]; 0 when either vector is empty, all zero or
/// the dimensions differ.
double cosine_similarity(const confide::schema::embedding_t& a,
                         const confide::schema::embedding_t& b);

/// Element-wise mean. All inputs must share one dimension.
confide::schema::embedding_t average_embeddings(
    const std::vector<confide::schema::embedding_t>& embeddings);

/// Scores are compared and persisted at parts-per-million resolution.
uint32_t to_ppm(double score);
double from_ppm(uint32_t ppm);

confide::schema::bytes_t serialize_embedding(
    const confide::schema::embedding_t& embedding);
std::optional<confide::schema::embedding_t> deserialize_embedding(
    const confide::schema::bytes_view_t& bytes);

}  // namespace confide::auth
