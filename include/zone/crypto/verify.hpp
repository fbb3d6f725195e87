#pragma once

#include <zone/schema/primitives.hpp>

namespace zone::crypto {

/// True when the OpenSSL build provides both Ed25519 and secp256k1.
bool available();

/// Fail-closed signature check: malformed keys, algorithm mismatches and
/// missing providers all yield false.
bool verify_signature(const zone::schema::bytes_view_t& message,
                      const zone::schema::signer_id_t& signer,
                      const zone::schema::signature_t& signature);

}  // namespace zone::crypto
