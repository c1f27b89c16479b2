#include <confide/auth/embedding.hpp>
#include <confide/blake3/hash.hpp>

#include <boost/endian/buffers.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iterator>

namespace confide::auth {

confide::schema::embedding_t placeholder_embedding(
    const confide::schema::bytes_view_t& sample) {
  auto digest =
      confide::blake3::hash_xof(sample, kPlaceholderEmbeddingDimensions);
  auto embedding = confide::schema::embedding_t{};
  embedding.reserve(digest.size());
  std::ranges::transform(digest, std::back_inserter(embedding),
                         [](const uint8_t value) {
                           return static_cast<float>(value) / 255.0f;
                         });
  return embedding;
}

embedding_extractor_t make_placeholder_extractor() {
  return [](const confide::schema::bytes_view_t& sample) {
    return placeholder_embedding(sample);
  };
}

double cosine_similarity(const confide::schema::embedding_t& a,
                         const confide::schema::embedding_t& b) {
  if (a.empty() || a.size() != b.size()) {
    return 0.0;
  }
  auto dot = 0.0;
  auto norm_a = 0.0;
  auto norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

confide::schema::embedding_t average_embeddings(
    const std::vector<confide::schema::embedding_t>& embeddings) {
  if (embeddings.empty()) {
    return {};
  }
  auto sum = std::vector<double>(embeddings.front().size(), 0.0);
  for (const auto& embedding : embeddings) {
    for (std::size_t i = 0; i < sum.size() && i < embedding.size(); ++i) {
      sum[i] += static_cast<double>(embedding[i]);
    }
  }
  auto average = confide::schema::embedding_t{};
  average.reserve(sum.size());
  for (const auto value : sum) {
    average.push_back(
        static_cast<float>(value / static_cast<double>(embeddings.size())));
  }
  return average;
}

uint32_t to_ppm(const double score) {
  auto clamped = std::clamp(score, 0.0, 1.0);
  return static_cast<uint32_t>(std::llround(clamped * 1'000'000.0));
}

double from_ppm(const uint32_t ppm) {
  return static_cast<double>(ppm) / 1'000'000.0;
}

confide::schema::bytes_t serialize_embedding(
    const confide::schema::embedding_t& embedding) {
  auto out = confide::schema::bytes_t{};
  out.reserve(embedding.size() * sizeof(float));
  for (const auto value : embedding) {
    auto buffer = boost::endian::little_float32_buf_t{value};
    out.insert(std::end(out), buffer.data(), buffer.data() + sizeof(float));
  }
  return out;
}

std::optional<confide::schema::embedding_t> deserialize_embedding(
    const confide::schema::bytes_view_t& bytes) {
  if ((bytes.size() % sizeof(float)) != 0) {
    return std::nullopt;
  }
  auto embedding = confide::schema::embedding_t{};
  embedding.reserve(bytes.size() / sizeof(float));
  for (std::size_t offset = 0; offset < bytes.size(); offset += sizeof(float)) {
    auto buffer = boost::endian::little_float32_buf_t{};
    std::memcpy(buffer.data(), bytes.data() + offset, sizeof(float));
    embedding.push_back(buffer.value());
  }
  return embedding;
}

}  // namespace confide::auth
