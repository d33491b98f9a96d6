#include "message.hpp"
#include "errors.hpp"
#include "kdf.hpp"
#include "pgp.hpp"
#include <stdexcept>

namespace message {

// Session key cipher, no compression, armored output, then run.
static void finish_encrypt(rnp_op_encrypt_t op) {
    pgp::check(rnp_op_encrypt_set_cipher(op, "AES256"), "encrypt cipher");
    pgp::check(rnp_op_encrypt_set_compression(op, "Uncompressed", 0), "encrypt compression");
    pgp::check(rnp_op_encrypt_set_armor(op, true), "encrypt armor");
    pgp::check(rnp_op_encrypt_execute(op), "encrypt");
}

// The session key packets already parsed, so anything short of a format
// error is a key, password or integrity failure.
static SecretBytes decrypt(const pgp::Ffi& ffi, const std::vector<uint8_t>& packets) {
    pgp::Input  in(packets);
    pgp::Output out;
    rnp_result_t rc = rnp_decrypt(ffi.get(), in.get(), out.get());
    if (rc == RNP_ERROR_BAD_FORMAT || rc == RNP_ERROR_NOT_SUPPORTED)
        pgp::fail(rc, "decrypt");
    if (rc != RNP_SUCCESS)
        throw DecryptionError(std::string("decrypt: ") + rnp_result_to_string(rc));
    return SecretBytes(out.bytes());
}

// ── Password mode ────────────────────────────────────────────────────────────

std::string seal_password(const std::vector<uint8_t>& plaintext,
                          const std::string& password,
                          uint32_t iterations)
{
    if (password.empty())
        throw std::invalid_argument("message: empty password");

    pgp::Ffi    ffi;
    pgp::Input  in(plaintext);
    pgp::Output out;

    rnp_op_encrypt_t raw = nullptr;
    pgp::check(rnp_op_encrypt_create(&raw, ffi.get(), in.get(), out.get()), "encrypt");
    pgp::EncryptOp op(raw);
    pgp::check(rnp_op_encrypt_add_password(op.get(), password.c_str(), "SHA256",
                                           iterations, "AES256"), "encrypt password");
    finish_encrypt(op.get());
    return out.str();
}

SecretBytes open_password(const std::string& armored, const std::string& password) {
    std::vector<uint8_t> packets = pgp::dearmor(armored);
    pgp::MessageInfo info = pgp::inspect_message(packets);
    if (info.passwords == 0)
        throw DecryptionError("message: not sealed with a password");
    if (info.max_s2k_iterations > S2K_MAX_ITERATIONS)
        throw MalformedInputError("message: S2K iteration count " +
                                  std::to_string(info.max_s2k_iterations) +
                                  " above limit");

    pgp::Ffi ffi;
    ffi.offer_password(password);
    return decrypt(ffi, packets);
}

// ── Public-key mode ──────────────────────────────────────────────────────────

std::string seal_public(const std::vector<uint8_t>& plaintext,
                        const node_key::PublicKey& recipient)
{
    pgp::Ffi ffi;
    ffi.import_keys(recipient.armored, false);
    pgp::Key key = ffi.primary();

    pgp::Input  in(plaintext);
    pgp::Output out;

    rnp_op_encrypt_t raw = nullptr;
    pgp::check(rnp_op_encrypt_create(&raw, ffi.get(), in.get(), out.get()), "encrypt");
    pgp::EncryptOp op(raw);
    pgp::check(rnp_op_encrypt_add_recipient(op.get(), key.get()), "encrypt recipient");
    finish_encrypt(op.get());
    return out.str();
}

SecretBytes open_public(const std::string& armored, const node_key::UnlockedKey& k) {
    std::vector<uint8_t> packets = pgp::dearmor(armored);
    pgp::MessageInfo info = pgp::inspect_message(packets);
    if (info.recipients == 0)
        throw DecryptionError("message: not sealed to a public key");

    pgp::Ffi ffi;
    ffi.import_keys(k.secret.str(), true);
    return decrypt(ffi, packets);
}

} // namespace message
