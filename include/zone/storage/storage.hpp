#pragma once
#include <zone/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace zone::storage {

using key_value_entry_t =
    std::pair<zone::schema::bytes_t, zone::schema::bytes_t>;

enum class open_mode : uint8_t { read_write = 0, read_only = 1 };

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder, const zone::schema::bytes_view_t& key);

  /// Encode and persist value at key. False when the backend rejects the
  /// write.
  template <typename T, typename Encoder>
  bool put(Encoder& encoder,
           const zone::schema::bytes_view_t& key,
           const T& value);

  /// Raw entries whose keys start with `prefix`, in key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const zone::schema::bytes_view_t& prefix) const;

  /// Write all entries atomically. False when nothing was written.
  bool commit(const std::vector<key_value_entry_t>& entries) const;
};

template <typename Library>
storage<Library> make_storage(const std::string_view& path,
                              open_mode mode = open_mode::read_write);

}  // namespace zone::storage
