#pragma once
#include "errors.hpp"
#include <rnp/rnp.h>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>
#include <cstdint>

// Thin RAII layer over librnp plus a reader for the few OpenPGP packet
// fields librnp does not expose before decrypting (RFC 4880 / RFC 9580).
//
// Every operation builds its own Ffi; no librnp state is shared between
// threads.

namespace pgp {

static constexpr size_t KEY_ID_LEN = 8;

// Throws the CryptoError matching `rc`, std::runtime_error for the rest.
[[noreturn]] void fail(rnp_result_t rc, const std::string& what);

inline void check(rnp_result_t rc, const char* what) {
    if (rc != RNP_SUCCESS)
        fail(rc, what);
}

// Takes ownership of a librnp-allocated string.
std::string take(char* buf);

// ── Handles ──────────────────────────────────────────────────────────────────

template <typename H, rnp_result_t (*Destroy)(H)>
struct Deleter {
    void operator()(typename std::remove_pointer<H>::type* p) const { Destroy(p); }
};

template <typename H, rnp_result_t (*Destroy)(H)>
using Handle = std::unique_ptr<typename std::remove_pointer<H>::type, Deleter<H, Destroy>>;

using EncryptOp = Handle<rnp_op_encrypt_t, rnp_op_encrypt_destroy>;
using SignOp    = Handle<rnp_op_sign_t,    rnp_op_sign_destroy>;
using VerifyOp  = Handle<rnp_op_verify_t,  rnp_op_verify_destroy>;

class Input {
public:
    // `data` must outlive the input; nothing is copied.
    Input(const uint8_t* data, size_t len);
    explicit Input(const std::string& data);
    explicit Input(const std::vector<uint8_t>& data);
    ~Input();

    Input(const Input&) = delete;
    Input& operator=(const Input&) = delete;

    rnp_input_t get() const { return in_; }

private:
    rnp_input_t in_ = nullptr;
};

class Output {
public:
    Output();
    ~Output();

    Output(const Output&) = delete;
    Output& operator=(const Output&) = delete;

    rnp_output_t get() const { return out_; }

    std::vector<uint8_t> bytes() const;
    std::string          str() const;

private:
    rnp_output_t out_ = nullptr;
};

class Key {
public:
    Key() = default;
    explicit Key(rnp_key_handle_t h) : h_(h) {}
    ~Key();

    Key(Key&& o) noexcept : h_(o.h_) { o.h_ = nullptr; }
    Key& operator=(Key&& o) noexcept;
    Key(const Key&) = delete;
    Key& operator=(const Key&) = delete;

    rnp_key_handle_t get() const { return h_; }

    std::string key_id() const;       // 16 uppercase hex digits
    std::string primary_uid() const;
    bool        is_valid() const;
    bool        has_secret() const;
    bool        is_protected() const;
    size_t      protection_iterations() const;

    std::vector<Key> subkeys() const;

    // RNP_KEY_EXPORT_* flags; ARMORED and SUBKEYS are always added.
    std::string export_armored(uint32_t flags) const;

private:
    rnp_key_handle_t h_ = nullptr;
};

class Ffi {
public:
    Ffi();
    ~Ffi();

    Ffi(const Ffi&) = delete;
    Ffi& operator=(const Ffi&) = delete;

    rnp_ffi_t get() const { return ffi_; }

    // Imports an armored or binary key block. Public parts only unless
    // `secret` is set.
    void import_keys(const std::string& block, bool secret);

    // The single primary key of the keyring. MalformedInputError when there
    // is none or more than one.
    Key primary() const;

    // Answers librnp's first password request with `password` and refuses
    // every later one, so a wrong password fails instead of looping.
    void offer_password(const std::string& password);

private:
    static bool password_cb(rnp_ffi_t ffi, void* ctx, rnp_key_handle_t key,
                            const char* pgp_context, char buf[], size_t buf_len);

    rnp_ffi_t   ffi_ = nullptr;
    std::string password_;
    bool        password_used_ = true;
};

// ── Armor ────────────────────────────────────────────────────────────────────

// ASCII armor to packet bytes. Binary input passes through unchanged.
std::vector<uint8_t> dearmor(const std::string& data);

// `type` is "message", "signature", "public key" or "secret key".
std::string enarmor(const std::vector<uint8_t>& packets, const char* type);

// librnp armor type for an armored block's header line, empty if unknown.
std::string armor_type(const std::string& armored);

// ── Packet inspection ────────────────────────────────────────────────────────

// Session-key packets at the head of an encrypted message.
struct MessageInfo {
    size_t   passwords  = 0;   // SKESK
    size_t   recipients = 0;   // PKESK
    uint32_t max_s2k_iterations = 0;
};

// Throws MalformedInputError when the packets do not parse or the message is
// not integrity protected (no SEIPD or AEAD packet after the session keys).
MessageInfo inspect_message(const std::vector<uint8_t>& packets);

// Issuer key id of a detached signature packet, 16 uppercase hex digits.
std::string signature_issuer(const std::vector<uint8_t>& packets);

// Octet count of an iterated-and-salted S2K coded count byte.
uint32_t s2k_decode_count(uint8_t c);

std::string hex_upper(const uint8_t* data, size_t len);

} // namespace pgp
