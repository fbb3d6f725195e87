#pragma once

#include <zone/crypto/identity.hpp>

#include <spdlog/common.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace zone::config {

inline constexpr auto kPrivateKeyEnv = "ZONE_PRIVATE_KEY";

/// Runtime settings of a zone node.
struct options final {
  std::string listen{"0.0.0.0:7443"};
  std::string db_path{"./data/zone.db"};
  std::string key_file{"./data/zone_key.pem"};
  /// Hex private key from ZONE_PRIVATE_KEY; wins over `key_file`.
  std::optional<std::string> private_key_hex;
  zone::crypto::key_algorithm key_type{zone::crypto::key_algorithm::ed25519};
  std::string name{"Unnamed Zone"};
  std::string description;
  std::vector<std::string> canons;
  std::chrono::milliseconds citation_timeout{5000};
  spdlog::level::level_enum log_level{spdlog::level::info};
  std::string log_file{"zone.log"};
};

/// Parse the command line (and the ZONE_PRIVATE_KEY environment variable).
/// Returns std::nullopt after printing help or a usage error; `exit_code`
/// tells the caller what to return from main.
std::optional<options> parse_options(int argc,
                                     const char* const* argv,
                                     int& exit_code);

/// Resolve the node identity: ZONE_PRIVATE_KEY, then the key file, otherwise
/// a freshly generated key that is saved to the key file.
zone::schema::result<zone::crypto::identity> load_identity(
    const options& options);

/// Create the directory that will hold the database at `db_path`. Failures
/// are logged and reported as false; opening the store decides whether they
/// are fatal.
bool prepare_db_directory(const std::string& db_path);

}  // namespace zone::config
