#pragma once

#include <zone/citation/transport.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace zone::testing {

/// In-memory transport: each endpoint answers with a canned fetch result.
/// Unknown endpoints are unreachable.
class fake_transport final : public zone::citation::transport {
 public:
  void serve(const std::string& endpoint, zone::citation::fetch_result result) {
    auto lock = std::scoped_lock{mutex_};
    responses_[endpoint] = std::move(result);
  }

  void serve_record(const std::string& endpoint,
                    zone::schema::served_record_t record) {
    auto result = zone::citation::fetch_result{};
    result.status = zone::citation::fetch_status::ok;
    result.record = std::move(record);
    serve(endpoint, std::move(result));
  }

  void throw_on(const std::string& endpoint) {
    auto lock = std::scoped_lock{mutex_};
    throwing_[endpoint] = true;
  }

  void set_delay(const std::chrono::milliseconds delay) { delay_ = delay; }

  /// `endpoint` answers only after `duration`, whatever timeout it was given.
  void stall(const std::string& endpoint,
             const std::chrono::milliseconds duration) {
    auto lock = std::scoped_lock{mutex_};
    stalls_[endpoint] = duration;
  }

  zone::citation::fetch_result fetch(
      const std::string& endpoint,
      const zone::schema::attestation_id_t&,
      std::chrono::milliseconds timeout) override {
    ++calls_;
    last_timeout_ = timeout;
    auto stall = delay_;
    {
      auto lock = std::scoped_lock{mutex_};
      if (auto found = stalls_.find(endpoint); found != stalls_.end()) {
        stall = found->second;
      }
    }
    if (stall.count() > 0) {
      std::this_thread::sleep_for(stall);
    }
    auto lock = std::scoped_lock{mutex_};
    if (throwing_.contains(endpoint)) {
      throw std::runtime_error{"connection reset"};
    }
    auto found = responses_.find(endpoint);
    if (found == responses_.end()) {
      auto result = zone::citation::fetch_result{};
      result.status = zone::citation::fetch_status::unreachable;
      result.log = "no route to " + endpoint;
      return result;
    }
    return found->second;
  }

  int calls() const { return calls_; }
  std::chrono::milliseconds last_timeout() const { return last_timeout_; }

 private:
  std::mutex mutex_;
  std::map<std::string, zone::citation::fetch_result> responses_;
  std::map<std::string, bool> throwing_;
  std::map<std::string, std::chrono::milliseconds> stalls_;
  std::chrono::milliseconds delay_{0};
  std::atomic<int> calls_{0};
  std::atomic<std::chrono::milliseconds> last_timeout_{
      std::chrono::milliseconds{0}};
};

}  // namespace zone::testing
