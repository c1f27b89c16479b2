#pragma once

#include <confide/common/clock.hpp>
#include <confide/crypto/cipher.hpp>
#include <confide/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <system_error>

namespace confide::testing {

// 2026-03-01T10:00:00Z
inline constexpr confide::schema::timestamp_milliseconds_t kStartTime =
    1'772'359'200'000;

inline confide::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = confide::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline confide::crypto::symmetric_key_t make_key(const uint8_t seed) {
  auto key = confide::crypto::symmetric_key_t{};
  for (std::size_t i = 0; i < key.size(); ++i) {
    key[i] = static_cast<uint8_t>(seed ^ static_cast<uint8_t>(i * 7));
  }
  return key;
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Temporary directory removed when the holder goes out of scope. Declare it
/// before the storage that lives in it.
class scoped_db_path final {
 public:
  explicit scoped_db_path(const std::string_view prefix)
      : path_{make_db_path(prefix)} {}
  scoped_db_path(const scoped_db_path&) = delete;
  scoped_db_path& operator=(const scoped_db_path&) = delete;
  ~scoped_db_path() { remove_path(path_); }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

/// Clock under test control.
class manual_clock final {
 public:
  explicit manual_clock(
      const confide::schema::timestamp_milliseconds_t start = kStartTime)
      : now_{start} {}

  confide::schema::timestamp_milliseconds_t now() const { return now_.load(); }

  void advance(const confide::schema::duration_milliseconds_t delta) {
    now_.fetch_add(delta);
  }

  void set(const confide::schema::timestamp_milliseconds_t value) {
    now_.store(value);
  }

  confide::common::now_provider_t provider() {
    return [this] { return now_.load(); };
  }

 private:
  std::atomic<confide::schema::timestamp_milliseconds_t> now_;
};

/// Two-dimensional embedding whose cosine similarity with (1, 0) is `score`.
inline confide::schema::embedding_t embedding_at(const double score) {
  return {static_cast<float>(score),
          static_cast<float>(std::sqrt(1.0 - score * score))};
}

/// Extractor that maps known sample strings to fixed embeddings.
class table_extractor final {
 public:
  void add(const std::string& sample, confide::schema::embedding_t embedding) {
    table_[sample] = std::move(embedding);
  }

  confide::schema::embedding_t operator()(
      const confide::schema::bytes_view_t& sample) const {
    auto it = table_.find(confide::schema::make_string(sample));
    if (it == std::end(table_)) {
      return {0.0f, 1.0f};
    }
    return it->second;
  }

 private:
  std::map<std::string, confide::schema::embedding_t> table_;
};

}  // namespace confide::testing
