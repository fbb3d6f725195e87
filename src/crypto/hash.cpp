#include <zone/common/critical.hpp>
#include <zone/crypto/hash.hpp>

#include <openssl/evp.h>

#include <initializer_list>
#include <memory>
#include <string>

namespace zone::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

zone::schema::hash32_t digest(
    std::initializer_list<zone::schema::bytes_view_t> parts) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    zone::common::critical("failed to initialize SHA-256 digest");
  }
  for (const auto& part : parts) {
    if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
      zone::common::critical("failed to update SHA-256 digest");
    }
  }
  auto out = zone::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &length) != 1 ||
      length != out.size()) {
    zone::common::critical("failed to finalize SHA-256 digest");
  }
  return out;
}

}  // namespace

zone::schema::hash32_t sha256(const zone::schema::bytes_view_t& bytes) {
  return digest({bytes});
}

zone::schema::hash32_t sha256(const std::string_view& text) {
  return digest({zone::schema::make_bytes_view(text)});
}

zone::schema::hash32_t sha256_pair(const zone::schema::hash32_t& left,
                                   const zone::schema::hash32_t& right) {
  return digest({zone::schema::make_bytes_view(left),
                 zone::schema::make_bytes_view(right)});
}

const zone::schema::hash32_t& glsr() {
  static const auto genesis = sha256(std::string_view{});
  return genesis;
}

zone::schema::hash32_t compute_hash(const std::string_view& text) {
  return sha256(text);
}

zone::schema::canon_id_t compute_canon_id(const std::string_view& name,
                                          const std::string_view& version) {
  auto label = std::string{name};
  label.push_back(':');
  label.append(version);
  return sha256(std::string_view{label});
}

}  // namespace zone::crypto
