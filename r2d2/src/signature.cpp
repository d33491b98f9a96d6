#include "signature.hpp"
#include "errors.hpp"
#include "pgp.hpp"
#include <openssl/crypto.h>

namespace signature {

// Length-checked constant-time compare.
static bool equal_ct(const std::string& a, const std::string& b) {
    if (a.size() != b.size())
        return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// Only the verifier's key is in the keyring, so a signature by any other key
// fails here as well.
static bool verify_packets(const std::string& payload,
                           const std::vector<uint8_t>& sig_packets,
                           const node_key::PublicKey& verifier)
{
    try {
        pgp::Ffi ffi;
        ffi.import_keys(verifier.armored, false);

        pgp::Input data(payload);
        pgp::Input sig(sig_packets);
        rnp_op_verify_t raw = nullptr;
        if (rnp_op_verify_detached_create(&raw, ffi.get(), data.get(), sig.get()) != RNP_SUCCESS)
            return false;
        pgp::VerifyOp op(raw);
        if (rnp_op_verify_execute(op.get()) != RNP_SUCCESS)
            return false;

        size_t count = 0;
        if (rnp_op_verify_get_signature_count(op.get(), &count) != RNP_SUCCESS || count != 1)
            return false;
        rnp_op_verify_signature_t s = nullptr;
        if (rnp_op_verify_get_signature_at(op.get(), 0, &s) != RNP_SUCCESS)
            return false;
        return rnp_op_verify_signature_get_status(s) == RNP_SUCCESS;
    } catch (const CryptoError&) {
        return false;
    }
}

const char* verdict_str(Verdict v) {
    switch (v) {
        case Verdict::Valid:         return "valid";
        case Verdict::Malformed:     return "malformed";
        case Verdict::BadSignature:  return "bad-signature";
        case Verdict::WrongKeyId:    return "wrong-key-id";
        case Verdict::WrongIdentity: return "wrong-identity";
    }
    return "unknown";
}

std::string sign(const std::string& payload, const node_key::UnlockedKey& signer) {
    pgp::Ffi ffi;
    ffi.import_keys(signer.secret.str(), true);
    pgp::Key key = ffi.primary();

    pgp::Input  in(payload);
    pgp::Output out;

    rnp_op_sign_t raw = nullptr;
    pgp::check(rnp_op_sign_detached_create(&raw, ffi.get(), in.get(), out.get()), "sign");
    pgp::SignOp op(raw);

    rnp_op_sign_signature_t sig = nullptr;
    pgp::check(rnp_op_sign_add_signature(op.get(), key.get(), &sig), "sign key");
    pgp::check(rnp_op_sign_set_hash(op.get(), "SHA256"), "sign hash");
    pgp::check(rnp_op_sign_set_armor(op.get(), true), "sign armor");
    pgp::check(rnp_op_sign_execute(op.get()), "sign");
    return out.str();
}

Verdict check(const std::string& payload,
              const std::string& armored_sig,
              const node_key::PublicKey& verifier,
              const std::string& expected_key_id,
              const std::string& expected_identity)
{
    std::vector<uint8_t> packets;
    std::string          issuer;
    try {
        packets = pgp::dearmor(armored_sig);
        issuer  = pgp::signature_issuer(packets);
    } catch (const MalformedInputError&) {
        return Verdict::Malformed;
    }

    bool sig_ok = verify_packets(payload, packets, verifier);

    bool id_ok = true;
    if (!expected_key_id.empty())
        id_ok = equal_ct(issuer, expected_key_id);

    bool identity_ok = true;
    if (!expected_identity.empty())
        identity_ok = equal_ct(verifier.email(), expected_identity);

    if (!sig_ok)      return Verdict::BadSignature;
    if (!id_ok)       return Verdict::WrongKeyId;
    if (!identity_ok) return Verdict::WrongIdentity;
    return Verdict::Valid;
}

bool verify(const std::string& payload,
            const std::string& armored_sig,
            const node_key::PublicKey& verifier,
            const std::string& expected_key_id,
            const std::string& expected_identity)
{
    return check(payload, armored_sig, verifier,
                 expected_key_id, expected_identity) == Verdict::Valid;
}

std::string signer_key_id(const std::string& armored_sig) {
    return pgp::signature_issuer(pgp::dearmor(armored_sig));
}

} // namespace signature
