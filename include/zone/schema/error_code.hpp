#pragma once

#include <zone/schema/enum_string.hpp>
#include <cstdint>
#include <string_view>

// Schema type: error code.
// Outcome taxonomy shared by every fallible ledger, identity and citation
// operation.
namespace zone::schema {

enum class error_code : uint8_t {
  ok = 0,
  invalid_input = 1,
  duplicate_attestation = 2,
  identity = 3,
  verification_failure = 4,
  unreachable_collaborator = 5,
  not_found = 6
};

inline constexpr auto kErrorCodeNames =
    std::array<std::pair<std::string_view, error_code>, 7>{
        {{"ok", error_code::ok},
         {"invalid_input", error_code::invalid_input},
         {"duplicate_attestation", error_code::duplicate_attestation},
         {"identity", error_code::identity},
         {"verification_failure", error_code::verification_failure},
         {"unreachable_collaborator", error_code::unreachable_collaborator},
         {"not_found", error_code::not_found}}};

constexpr std::string_view to_string(const error_code code) {
  return to_string(code, kErrorCodeNames).value_or("unknown");
}

}  // namespace zone::schema
