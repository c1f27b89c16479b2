#pragma once
#include <confide/schema/primitives.hpp>
#include <optional>
#include <span>

namespace confide::schema::encoding {

// Build-time selected codec. Specialised per library tag; components are
// written against the encoder<Tag> interface and never name the codec
// directly.
template <typename Library>
struct encoder {
  template <typename T>
  confide::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, confide::schema::bytes_t& out);

  template <typename T>
  T decode(const confide::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const confide::schema::bytes_view_t& bytes);
};

}  // namespace confide::schema::encoding
