#pragma once
#include <confide/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace confide::storage {

using key_value_entry_t =
    std::pair<confide::schema::bytes_t, confide::schema::bytes_t>;

struct put_entry final {
  confide::schema::bytes_t key;
  confide::schema::bytes_t value;
};

struct erase_entry final {
  confide::schema::bytes_t key;
};

/// One mutation of an atomic write batch.
using write_op_t = std::variant<put_entry, erase_entry>;

/// Encode value and wrap it as a batch put.
template <typename Encoder, typename T>
write_op_t make_put(Encoder& encoder,
                    confide::schema::bytes_t key,
                    const T& value) {
  return put_entry{.key = std::move(key), .value = encoder.encode(value)};
}

inline write_op_t make_erase(confide::schema::bytes_t key) {
  return erase_entry{.key = std::move(key)};
}

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const confide::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const confide::schema::bytes_view_t& key,
           const T& value) const;

  /// Remove key if present.
  void erase(const confide::schema::bytes_view_t& key) const;

  /// Apply every mutation or none of them.
  void commit(const std::vector<write_op_t>& operations) const;

  /// Read several keys from one consistent point-in-time view.
  std::vector<std::optional<confide::schema::bytes_t>> snapshot_get(
      const std::vector<confide::schema::bytes_t>& keys) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const confide::schema::bytes_view_t& prefix) const;

  /// Atomically delete every entry under prefix; returns the number removed.
  std::size_t erase_by_prefix(const confide::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace confide::storage
