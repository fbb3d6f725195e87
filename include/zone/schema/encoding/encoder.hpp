#pragma once
#include <zone/schema/primitives.hpp>
#include <optional>
#include <span>

namespace zone::schema::encoding {

// The encoding library is a build time choice made through the tag type.
// Swapping it at runtime is not a goal.
template <typename Library>
struct encoder {
  template <typename T>
  zone::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, zone::schema::bytes_t& out);

  template <typename T>
  T decode(const zone::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const zone::schema::bytes_view_t& bytes);
};

}  // namespace zone::schema::encoding
