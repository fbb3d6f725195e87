#include <boost/program_options.hpp>
#include <zone/attestation/builder.hpp>
#include <zone/common/critical.hpp>
#include <zone/crypto/hash.hpp>
#include <zone/crypto/identity.hpp>
#include <zone/merkle/tree.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
using namespace zone::schema;

void print_help(const po::options_description& options) {
  std::cout << "Usage: zone_tool <command> [options]\n\n"
            << "Commands:\n"
            << "  hash            H(--text)\n"
            << "  canon-id        H(--name \":\" --version)\n"
            << "  attestation-id  --zone-id --canon-id --claim-hash "
               "--timestamp\n"
            << "  citations-hash  --citation ...\n"
            << "  merkle-root     --leaf ...\n"
            << "  merkle-proof    --leaf ... --target\n"
            << "  verify-proof    --leaf-hash --leaf-index --sibling ... "
               "--root\n"
            << "  keygen          --key-type --out\n\n"
            << options << '\n';
}

const std::string& require(const po::variables_map& vm,
                           const std::string_view command,
                           const char* name) {
  if (!vm.contains(name)) {
    zone::common::critical("{} requires --{}", command, name);
  }
  return vm[name].as<std::string>();
}

hash32_t get_hash32(const po::variables_map& vm,
                    const std::string_view command,
                    const char* name) {
  auto hash = try_make_hash32(std::string_view{require(vm, command, name)});
  if (!hash) {
    zone::common::critical("--{} must be 64 hex characters", name);
  }
  return *hash;
}

std::vector<std::string> get_list(const po::variables_map& vm,
                                  const char* name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<std::string>>();
}

std::vector<hash32_t> get_hash_list(const po::variables_map& vm,
                                    const char* name) {
  auto hashes = std::vector<hash32_t>{};
  for (const auto& value : get_list(vm, name)) {
    auto hash = try_make_hash32(std::string_view{value});
    if (!hash) {
      zone::common::critical("--{} '{}' must be 64 hex characters", name,
                             value);
    }
    hashes.push_back(*hash);
  }
  return hashes;
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"zone_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "hash|canon-id|attestation-id|citations-hash|merkle-root|merkle-proof|"
      "verify-proof|keygen")("text", po::value<std::string>(),
                             "text to hash")(
      "name", po::value<std::string>(), "canon name")(
      "version", po::value<std::string>(), "canon version")(
      "zone-id", po::value<std::string>(), "zone id hex")(
      "canon-id", po::value<std::string>(), "canon id hex")(
      "claim-hash", po::value<std::string>(), "claim hash hex")(
      "timestamp", po::value<uint64_t>(), "unix seconds")(
      "citation", po::value<std::vector<std::string>>()->multitoken(),
      "cited attestation id hex values")(
      "leaf", po::value<std::vector<std::string>>()->multitoken(),
      "leaf hash hex values")("target", po::value<std::string>(),
                              "leaf to prove")(
      "leaf-hash", po::value<std::string>(), "proven leaf hex")(
      "leaf-index", po::value<uint64_t>(), "proven leaf index")(
      "sibling", po::value<std::vector<std::string>>()->multitoken(),
      "proof siblings, hex or *")("root", po::value<std::string>(),
                                  "expected root hex")(
      "key-type", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("out", po::value<std::string>(),
                           "private key PEM path");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "hash") {
    std::cout << to_hex(zone::crypto::compute_hash(require(vm, command, "text")))
              << '\n';
    return 0;
  }

  if (command == "canon-id") {
    std::cout << to_hex(zone::crypto::compute_canon_id(
                     require(vm, command, "name"),
                     require(vm, command, "version")))
              << '\n';
    return 0;
  }

  if (command == "attestation-id") {
    if (!vm.contains("timestamp")) {
      zone::common::critical("attestation-id requires --timestamp");
    }
    std::cout << to_hex(zone::attestation::compute_attestation_id(
                     get_hash32(vm, command, "zone-id"),
                     get_hash32(vm, command, "canon-id"),
                     get_hash32(vm, command, "claim-hash"),
                     vm["timestamp"].as<uint64_t>()))
              << '\n';
    return 0;
  }

  if (command == "citations-hash") {
    std::cout << to_hex(zone::attestation::compute_citations_hash(
                     get_hash_list(vm, "citation")))
              << '\n';
    return 0;
  }

  if (command == "merkle-root") {
    std::cout << to_hex(zone::merkle::build_root(get_hash_list(vm, "leaf")))
              << '\n';
    return 0;
  }

  if (command == "merkle-proof") {
    auto proof = zone::merkle::build_proof(get_hash_list(vm, "leaf"),
                                           get_hash32(vm, command, "target"));
    if (!proof.ok()) {
      std::cerr << proof.log << '\n';
      return 1;
    }
    std::cout << "leaf_hash " << to_hex(proof.value->leaf_hash) << '\n'
              << "leaf_index " << proof.value->leaf_index << '\n'
              << "root " << to_hex(proof.value->root) << '\n';
    for (const auto& step : proof.value->siblings) {
      std::cout << "sibling " << zone::merkle::to_string(step) << '\n';
    }
    return 0;
  }

  if (command == "verify-proof") {
    if (!vm.contains("leaf-index")) {
      zone::common::critical("verify-proof requires --leaf-index");
    }
    auto siblings = zone::merkle::parse_steps(get_list(vm, "sibling"));
    if (!siblings.ok()) {
      std::cerr << siblings.log << '\n';
      return 2;
    }
    auto valid = zone::merkle::verify_proof(
        get_hash32(vm, command, "leaf-hash"), vm["leaf-index"].as<uint64_t>(),
        *siblings.value, get_hash32(vm, command, "root"));
    std::cout << (valid ? "valid" : "invalid") << '\n';
    return valid ? 0 : 1;
  }

  if (command == "keygen") {
    const auto& key_type = vm["key-type"].as<std::string>();
    auto algorithm = zone::crypto::try_make_key_algorithm(key_type);
    if (!algorithm) {
      zone::common::critical("--key-type must be ed25519|secp256k1");
    }
    const auto& out = require(vm, command, "out");
    auto identity = zone::crypto::identity::generate(*algorithm);
    if (!identity.ok()) {
      std::cerr << identity.log << '\n';
      return 1;
    }
    if (!identity.value->save_pem(out, out + ".pub")) {
      std::cerr << "failed to write " << out << '\n';
      return 1;
    }
    std::cout << "zone_id " << to_hex(identity.value->zone_id()) << '\n'
              << "public_key " << identity.value->public_key_hex() << '\n';
    return 0;
  }

  zone::common::critical(
      "command must be hash|canon-id|attestation-id|citations-hash|"
      "merkle-root|merkle-proof|verify-proof|keygen");
}
