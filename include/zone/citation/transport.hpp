#pragma once

#include <zone/schema/primitives.hpp>
#include <zone/schema/served_record.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace zone::citation {

enum class fetch_status : uint8_t {
  ok = 0,
  not_found = 1,
  unreachable = 2,
  malformed = 3
};

struct fetch_result final {
  fetch_status status{fetch_status::unreachable};
  std::string log;
  std::optional<zone::schema::served_record_t> record;
};

/// Fetches (attestation, proof, anchor) tuples from other zones. Missing and
/// unreachable records are reported as statuses, never as verification
/// failures. Implementations should give up after `timeout`; the verifier
/// stops waiting at that point either way and reports the fetch unreachable.
class transport {
 public:
  virtual ~transport() = default;

  virtual fetch_result fetch(const std::string& endpoint,
                             const zone::schema::attestation_id_t& id,
                             std::chrono::milliseconds timeout) = 0;
};

}  // namespace zone::citation
