#include <confide/common/critical.hpp>
#include <confide/common/lock_table.hpp>

#include <functional>

namespace confide::common {

lock_table::lock_table(std::size_t stripes)
    : stripe_count_{stripes}, mutexes_{std::make_unique<std::mutex[]>(stripes)} {
  if (stripes == 0) {
    critical("lock_table requires at least one stripe");
  }
}

std::size_t lock_table::stripe_of(
    const confide::schema::bytes_view_t& key) const {
  auto hashed = std::hash<std::string_view>{}(
      confide::schema::make_string_view(key));
  return hashed % stripe_count_;
}

lock_table::lock_t lock_table::lock(const confide::schema::bytes_view_t& key) {
  return lock_t{mutexes_[stripe_of(key)]};
}

lock_table::lock_t lock_table::lock(std::string_view key) {
  return lock(confide::schema::make_bytes_view(key));
}

std::pair<lock_table::lock_t, lock_table::lock_t> lock_table::lock_pair(
    const confide::schema::bytes_view_t& a,
    const confide::schema::bytes_view_t& b) {
  auto first = stripe_of(a);
  auto second = stripe_of(b);
  if (first == second) {
    return {lock_t{mutexes_[first]}, lock_t{}};
  }
  std::lock(mutexes_[first], mutexes_[second]);
  return {lock_t{mutexes_[first], std::adopt_lock},
          lock_t{mutexes_[second], std::adopt_lock}};
}

}  // namespace confide::common
