#include <zone/schema/key/builder.hpp>
#include <algorithm>
#include <iterator>
#include <ranges>

using namespace zone::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const hash32_t& hash) {
  std::ranges::copy_n(hash.data(), hash.size(), std::back_inserter(data));
  return *this;
}
