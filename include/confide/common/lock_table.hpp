#pragma once

#include <confide/schema/primitives.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>

namespace confide::common {

/// Fixed set of mutexes addressed by key hash.
///
/// Gives single-writer-per-key semantics without keeping one mutex per record
/// alive. Distinct keys may share a stripe; that only costs concurrency.
class lock_table final {
 public:
  using lock_t = std::unique_lock<std::mutex>;

  explicit lock_table(std::size_t stripes = 64);

  lock_table(const lock_table&) = delete;
  lock_table& operator=(const lock_table&) = delete;

  /// Lock the stripe owning key.
  lock_t lock(const confide::schema::bytes_view_t& key);
  lock_t lock(std::string_view key);

  /// Lock the stripes of two keys without lock-order inversion. When both
  /// keys land on one stripe the second lock is left unowned.
  std::pair<lock_t, lock_t> lock_pair(const confide::schema::bytes_view_t& a,
                                      const confide::schema::bytes_view_t& b);

  std::size_t stripe_of(const confide::schema::bytes_view_t& key) const;
  std::size_t stripes() const { return stripe_count_; }

 private:
  std::size_t stripe_count_;
  std::unique_ptr<std::mutex[]> mutexes_;
};

}  // namespace confide::common
