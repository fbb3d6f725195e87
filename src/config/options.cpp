#include <zone/config/options.hpp>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace po = boost::program_options;

namespace zone::config {

std::optional<options> parse_options(const int argc,
                                     const char* const* argv,
                                     int& exit_code) {
  auto parsed = options{};
  auto key_type = std::string{};
  auto log_level = std::string{};
  auto citation_timeout_ms = uint64_t{};

  auto description = po::options_description{"Zone node"};
  description.add_options()("help,h", "Show the help message")(
      "listen,l", po::value<std::string>(&parsed.listen)->default_value(parsed.listen),
      "IP:Port for the gRPC service")(
      "db-path", po::value<std::string>(&parsed.db_path)->default_value(parsed.db_path),
      "RocksDB directory")(
      "key-file", po::value<std::string>(&parsed.key_file)->default_value(parsed.key_file),
      "PEM private key, created when missing")(
      "key-type", po::value<std::string>(&key_type)->default_value("ed25519"),
      "ed25519|secp256k1, used for new or hex keys")(
      "name", po::value<std::string>(&parsed.name)->default_value(parsed.name),
      "zone name")(
      "description", po::value<std::string>(&parsed.description)->default_value(""),
      "zone description")(
      "canon", po::value<std::vector<std::string>>(&parsed.canons)->composing(),
      "supported canon as name:version, repeatable; none accepts all")(
      "citation-timeout-ms",
      po::value<uint64_t>(&citation_timeout_ms)->default_value(5000),
      "per-citation fetch timeout")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&parsed.log_file)->default_value(parsed.log_file),
      "log file path, empty disables file logging");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n' << description << std::endl;
    exit_code = 1;
    return std::nullopt;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    exit_code = 0;
    return std::nullopt;
  }

  auto algorithm = zone::crypto::try_make_key_algorithm(key_type);
  if (!algorithm) {
    std::cerr << "unknown --key-type " << key_type << std::endl;
    exit_code = 1;
    return std::nullopt;
  }
  parsed.key_type = *algorithm;

  auto level = spdlog::level::from_str(log_level);
  if (level == spdlog::level::off && log_level != "off") {
    std::cerr << "unknown --log-level " << log_level << std::endl;
    exit_code = 1;
    return std::nullopt;
  }
  parsed.log_level = level;
  parsed.citation_timeout = std::chrono::milliseconds{citation_timeout_ms};

  if (const auto* env = std::getenv(kPrivateKeyEnv); env != nullptr && *env) {
    parsed.private_key_hex = std::string{env};
  }

  exit_code = 0;
  return parsed;
}

zone::schema::result<zone::crypto::identity> load_identity(
    const options& options) {
  if (options.private_key_hex) {
    spdlog::info("Using {} key from {}",
                 zone::crypto::to_string(options.key_type), kPrivateKeyEnv);
    return zone::crypto::identity::from_private_hex(options.key_type,
                                                    *options.private_key_hex);
  }

  auto ec = std::error_code{};
  if (std::filesystem::exists(options.key_file, ec)) {
    spdlog::info("Loading key from {}", options.key_file);
    return zone::crypto::identity::load_pem(options.key_file);
  }

  spdlog::warn("No key found, generating a new {} key at {}",
               zone::crypto::to_string(options.key_type), options.key_file);
  auto generated = zone::crypto::identity::generate(options.key_type);
  if (!generated.ok()) {
    return generated;
  }
  auto public_path = options.key_file + ".pub";
  if (!generated.value->save_pem(options.key_file, public_path)) {
    return zone::schema::make_error<zone::crypto::identity>(
        zone::schema::error_code::identity,
        fmt::format("failed to save generated key to {}", options.key_file));
  }
  return generated;
}

bool prepare_db_directory(const std::string& db_path) {
  auto parent = std::filesystem::path{db_path}.parent_path();
  if (parent.empty()) {
    return true;
  }
  auto ec = std::error_code{};
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    spdlog::warn("Cannot create database directory {}: {}", parent.string(),
                 ec.message());
    return false;
  }
  return true;
}

}  // namespace zone::config
