#pragma once
#include "node_key.hpp"
#include <string>

// Detached passphrase signatures: an armored PGP SIGNATURE holding one v4
// binary-document signature packet (EdDSA, SHA-256) by the signer's primary
// key, with an issuer fingerprint subpacket.
// The signed bytes are the exact armored text of the payload.

namespace signature {

enum class Verdict {
    Valid,
    Malformed,      // signature block does not parse
    BadSignature,   // OpenPGP check against the verifier key failed
    WrongKeyId,     // signer key id differs from the expected one
    WrongIdentity   // verifier key's email differs from the expected one
};

const char* verdict_str(Verdict v);

std::string sign(const std::string& payload, const node_key::UnlockedKey& signer);

// All checks run on every call. Empty expected_key_id / expected_identity
// skip that check. Never throws for untrusted input.
Verdict check(const std::string& payload,
              const std::string& armored_sig,
              const node_key::PublicKey& verifier,
              const std::string& expected_key_id = "",
              const std::string& expected_identity = "");

// check(...) == Verdict::Valid
bool verify(const std::string& payload,
            const std::string& armored_sig,
            const node_key::PublicKey& verifier,
            const std::string& expected_key_id = "",
            const std::string& expected_identity = "");

// Issuer key id recorded in the signature, uppercase hex. Throws
// MalformedInputError.
std::string signer_key_id(const std::string& armored_sig);

} // namespace signature
