#include <zone/common/critical.hpp>
#include <zone/ledger/anchor_registry.hpp>
#include <zone/schema/key/ledger_keys.hpp>

#include <spdlog/spdlog.h>

#include <mutex>

using namespace zone::schema;

namespace zone::ledger {

anchor_registry::anchor_registry(encoder_t& encoder,
                                 storage_t& storage,
                                 const ledger& ledger)
    : encoder_{encoder}, storage_{storage}, ledger_{ledger} {
  load();
}

void anchor_registry::load() {
  auto prefix = make_bytes(key::kAnchorKeyPrefix);
  auto loaded = std::vector<anchor_t>{};
  for (const auto& [raw_key, raw_value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto anchor = encoder_.try_decode<anchor_t>(make_bytes_view(raw_value));
    if (!anchor) {
      zone::common::critical("failed to decode stored anchor");
    }
    if (!ledger_.version_of(anchor->merkle_root)) {
      zone::common::critical("stored anchor refers to unknown root {}",
                             to_hex(anchor->merkle_root));
    }
    loaded.push_back(std::move(*anchor));
  }
  auto lock = std::unique_lock{mutex_};
  anchors_ = std::move(loaded);
  spdlog::info("Loaded {} anchors", anchors_.size());
}

result<anchor_t> anchor_registry::record(anchor_t anchor) {
  if (!ledger_.version_of(anchor.merkle_root)) {
    return make_error<anchor_t>(
        error_code::invalid_input,
        fmt::format("root {} was not produced by this ledger",
                    to_hex(anchor.merkle_root)));
  }

  auto lock = std::unique_lock{mutex_};
  auto anchor_key = key::make_anchor_key(anchors_.size());
  if (!storage_.put(encoder_, make_bytes_view(anchor_key), anchor)) {
    return make_error<anchor_t>(error_code::unreachable_collaborator,
                                "storage rejected the anchor");
  }
  anchors_.push_back(anchor);
  spdlog::info("Anchored root {} via {} at {}", to_hex(anchor.merkle_root),
               to_string(anchor.type), anchor.external_timestamp);
  return make_result(std::move(anchor));
}

std::optional<anchor_t> anchor_registry::anchor_for(
    const hash32_t& root) const {
  auto lock = std::shared_lock{mutex_};
  auto found = std::optional<anchor_t>{};
  for (const auto& anchor : anchors_) {
    if (anchor.merkle_root != root) {
      continue;
    }
    if (!found || anchor.external_timestamp < found->external_timestamp) {
      found = anchor;
    }
  }
  return found;
}

std::optional<anchor_t> anchor_registry::latest() const {
  auto lock = std::shared_lock{mutex_};
  if (anchors_.empty()) {
    return std::nullopt;
  }
  return anchors_.back();
}

std::optional<anchor_t> anchor_registry::earliest_covering(
    const uint64_t version) const {
  auto lock = std::shared_lock{mutex_};
  auto found = std::optional<anchor_t>{};
  for (const auto& anchor : anchors_) {
    auto anchored_version = ledger_.version_of(anchor.merkle_root);
    if (!anchored_version || *anchored_version < version) {
      continue;
    }
    if (!found || anchor.external_timestamp < found->external_timestamp) {
      found = anchor;
    }
  }
  return found;
}

std::vector<anchor_t> anchor_registry::anchors() const {
  auto lock = std::shared_lock{mutex_};
  return anchors_;
}

}  // namespace zone::ledger
