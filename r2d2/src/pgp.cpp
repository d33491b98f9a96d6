#include "pgp.hpp"
#include "wire.hpp"
#include <openssl/crypto.h>
#include <cstring>
#include <set>
#include <stdexcept>

namespace pgp {

// Packet tags, RFC 9580 §5.
static const uint8_t kTagPKESK     = 1;
static const uint8_t kTagSignature = 2;
static const uint8_t kTagSKESK     = 3;
static const uint8_t kTagSED       = 9;
static const uint8_t kTagMarker    = 10;
static const uint8_t kTagSEIPD     = 18;
static const uint8_t kTagAEAD      = 20;

// Subpacket types.
static const uint8_t kSubIssuer      = 16;
static const uint8_t kSubIssuerFpr   = 33;
static const uint8_t kS2KIterated    = 3;

// ── Errors ───────────────────────────────────────────────────────────────────

void fail(rnp_result_t rc, const std::string& what) {
    std::string msg = what + ": " + rnp_result_to_string(rc);
    switch (rc) {
        case RNP_ERROR_BAD_PASSWORD:
        case RNP_ERROR_DECRYPT_FAILED:
        case RNP_ERROR_NO_SUITABLE_KEY:
        case RNP_ERROR_KEY_NOT_FOUND:
        case RNP_ERROR_BAD_STATE:            // MDC mismatch after decryption
            throw DecryptionError(msg);
        case RNP_ERROR_BAD_FORMAT:
        case RNP_ERROR_NOT_SUPPORTED:
        case RNP_ERROR_NOT_ENOUGH_DATA:
        case RNP_ERROR_SHORT_BUFFER:
        case RNP_ERROR_READ:
        case RNP_ERROR_EOF:
            throw MalformedInputError(msg);
        default:
            throw std::runtime_error(msg);
    }
}

std::string take(char* buf) {
    if (!buf)
        return std::string();
    std::string s(buf);
    rnp_buffer_destroy(buf);
    return s;
}

std::string hex_upper(const uint8_t* data, size_t len) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += kHex[data[i] >> 4];
        out += kHex[data[i] & 0x0F];
    }
    return out;
}

// ── Input / Output ───────────────────────────────────────────────────────────

Input::Input(const uint8_t* data, size_t len) {
    static const uint8_t kEmpty = 0;
    check(rnp_input_from_memory(&in_, len ? data : &kEmpty, len, false), "input");
}

Input::Input(const std::string& data)
    : Input((const uint8_t*)data.data(), data.size()) {}

Input::Input(const std::vector<uint8_t>& data)
    : Input(data.data(), data.size()) {}

Input::~Input() {
    if (in_) rnp_input_destroy(in_);
}

Output::Output() {
    check(rnp_output_to_memory(&out_, 0), "output");
}

Output::~Output() {
    if (out_) rnp_output_destroy(out_);
}

std::vector<uint8_t> Output::bytes() const {
    uint8_t* buf = nullptr;
    size_t   len = 0;
    check(rnp_output_memory_get_buf(out_, &buf, &len, false), "output buffer");
    return std::vector<uint8_t>(buf, buf + len);
}

std::string Output::str() const {
    std::vector<uint8_t> b = bytes();
    return std::string(b.begin(), b.end());
}

// ── Key ──────────────────────────────────────────────────────────────────────

Key::~Key() {
    if (h_) rnp_key_handle_destroy(h_);
}

Key& Key::operator=(Key&& o) noexcept {
    if (this != &o) {
        if (h_) rnp_key_handle_destroy(h_);
        h_ = o.h_;
        o.h_ = nullptr;
    }
    return *this;
}

std::string Key::key_id() const {
    char* id = nullptr;
    check(rnp_key_get_keyid(h_, &id), "key id");
    return take(id);
}

std::string Key::primary_uid() const {
    char* uid = nullptr;
    rnp_result_t rc = rnp_key_get_primary_uid(h_, &uid);
    if (rc != RNP_SUCCESS)
        throw MalformedInputError("key block: no user id");
    return take(uid);
}

bool Key::is_valid() const {
    bool valid = false;
    check(rnp_key_is_valid(h_, &valid), "key validity");
    return valid;
}

bool Key::has_secret() const {
    bool have = false;
    check(rnp_key_have_secret(h_, &have), "key secret");
    return have;
}

bool Key::is_protected() const {
    bool prot = false;
    check(rnp_key_is_protected(h_, &prot), "key protection");
    return prot;
}

size_t Key::protection_iterations() const {
    size_t n = 0;
    check(rnp_key_get_protection_iterations(h_, &n), "key protection iterations");
    return n;
}

std::vector<Key> Key::subkeys() const {
    size_t count = 0;
    check(rnp_key_get_subkey_count(h_, &count), "subkey count");

    std::vector<Key> out;
    for (size_t i = 0; i < count; ++i) {
        rnp_key_handle_t sub = nullptr;
        check(rnp_key_get_subkey_at(h_, i, &sub), "subkey");
        out.emplace_back(sub);
    }
    return out;
}

std::string Key::export_armored(uint32_t flags) const {
    Output out;
    check(rnp_key_export(h_, out.get(),
                         flags | RNP_KEY_EXPORT_ARMORED | RNP_KEY_EXPORT_SUBKEYS),
          "key export");
    return out.str();
}

// ── Ffi ──────────────────────────────────────────────────────────────────────

Ffi::Ffi() {
    check(rnp_ffi_create(&ffi_, "GPG", "GPG"), "rnp_ffi_create");
    rnp_result_t rc = rnp_ffi_set_pass_provider(ffi_, &Ffi::password_cb, this);
    if (rc != RNP_SUCCESS) {
        rnp_ffi_destroy(ffi_);
        fail(rc, "password provider");
    }
}

Ffi::~Ffi() {
    if (!password_.empty())
        OPENSSL_cleanse(&password_[0], password_.size());
    if (ffi_) rnp_ffi_destroy(ffi_);
}

void Ffi::import_keys(const std::string& block, bool secret) {
    Input in(block);
    uint32_t flags = RNP_LOAD_SAVE_PUBLIC_KEYS;
    if (secret)
        flags |= RNP_LOAD_SAVE_SECRET_KEYS;
    check(rnp_import_keys(ffi_, in.get(), flags, nullptr), "key import");
}

Key Ffi::primary() const {
    rnp_identifier_iterator_t it = nullptr;
    check(rnp_identifier_iterator_create(ffi_, &it, "fingerprint"), "key iterator");

    std::set<std::string> seen;
    Key found;
    const char* fpr = nullptr;
    rnp_result_t rc;
    while ((rc = rnp_identifier_iterator_next(it, &fpr)) == RNP_SUCCESS && fpr) {
        rnp_key_handle_t h = nullptr;
        rc = rnp_locate_key(ffi_, "fingerprint", fpr, &h);
        if (rc != RNP_SUCCESS)
            break;
        Key k(h);
        bool is_primary = false;
        rc = rnp_key_is_primary(h, &is_primary);
        if (rc != RNP_SUCCESS)
            break;
        if (is_primary && seen.insert(fpr).second)
            found = std::move(k);
    }
    rnp_identifier_iterator_destroy(it);
    if (rc != RNP_SUCCESS)
        fail(rc, "key iterator");

    if (seen.size() != 1)
        throw MalformedInputError("key block: expected one primary key, found " +
                                  std::to_string(seen.size()));
    return found;
}

void Ffi::offer_password(const std::string& password) {
    if (!password_.empty())
        OPENSSL_cleanse(&password_[0], password_.size());
    password_      = password;
    password_used_ = false;
}

bool Ffi::password_cb(rnp_ffi_t, void* ctx, rnp_key_handle_t, const char*,
                      char buf[], size_t buf_len)
{
    Ffi* self = (Ffi*)ctx;
    if (self->password_used_ || self->password_.size() + 1 > buf_len)
        return false;
    std::memcpy(buf, self->password_.c_str(), self->password_.size() + 1);
    self->password_used_ = true;
    return true;
}

// ── Armor ────────────────────────────────────────────────────────────────────

static bool is_armored(const std::string& data) {
    size_t i = data.find_first_not_of(" \t\r\n");
    return i != std::string::npos && data.compare(i, 10, "-----BEGIN") == 0;
}

std::vector<uint8_t> dearmor(const std::string& data) {
    if (!is_armored(data))
        return std::vector<uint8_t>(data.begin(), data.end());
    Input  in(data);
    Output out;
    rnp_result_t rc = rnp_dearmor(in.get(), out.get());
    if (rc != RNP_SUCCESS)
        throw MalformedInputError(std::string("armor: ") + rnp_result_to_string(rc));
    return out.bytes();
}

std::string enarmor(const std::vector<uint8_t>& packets, const char* type) {
    Input  in(packets);
    Output out;
    check(rnp_enarmor(in.get(), out.get(), type), "enarmor");
    return out.str();
}

std::string armor_type(const std::string& armored) {
    static const char kBegin[] = "-----BEGIN PGP ";
    size_t b = armored.find(kBegin);
    if (b == std::string::npos)
        return std::string();
    b += sizeof(kBegin) - 1;
    size_t e = armored.find("-----", b);
    if (e == std::string::npos)
        return std::string();

    std::string label = armored.substr(b, e - b);
    if (label == "MESSAGE")           return "message";
    if (label == "SIGNATURE")         return "signature";
    if (label == "PUBLIC KEY BLOCK")  return "public key";
    if (label == "PRIVATE KEY BLOCK") return "secret key";
    return std::string();
}

// ── Packets ──────────────────────────────────────────────────────────────────

// Reads a packet header. Returns false for partial or indeterminate body
// lengths, which only data packets use.
static bool packet_header(WireReader& r, uint8_t& tag, size_t& len) {
    uint8_t h = r.u8();
    if (!(h & 0x80))
        throw MalformedInputError("openpgp: invalid packet header");

    if (h & 0x40) {
        tag = h & 0x3F;
        uint8_t o1 = r.u8();
        if (o1 < 192)
            len = o1;
        else if (o1 < 224)
            len = ((size_t)(o1 - 192) << 8) + r.u8() + 192;
        else if (o1 == 255)
            len = r.u32be();
        else
            return false;
        return true;
    }

    tag = (h >> 2) & 0x0F;
    switch (h & 0x03) {
        case 0:  len = r.u8();    return true;
        case 1:  len = r.u16be(); return true;
        case 2:  len = r.u32be(); return true;
        default: return false;
    }
}

uint32_t s2k_decode_count(uint8_t c) {
    return (uint32_t)(16 + (c & 15)) << ((c >> 4) + 6);
}

static uint32_t skesk_iterations(const std::vector<uint8_t>& body) {
    WireReader r(body, "openpgp SKESK");
    uint8_t version = r.u8();
    switch (version) {
        case 4: r.u8(); break;                                  // cipher
        case 5: r.u8(); r.u8(); break;                          // cipher, aead
        case 6: r.u8(); r.u8(); r.u8(); r.u8(); break;          // len, cipher, aead, s2k len
        default:
            throw MalformedInputError("openpgp SKESK: unsupported version " +
                                      std::to_string(version));
    }
    if (r.u8() != kS2KIterated)
        return 0;
    r.u8();          // hash
    r.bytes(8);      // salt
    return s2k_decode_count(r.u8());
}

MessageInfo inspect_message(const std::vector<uint8_t>& packets) {
    WireReader r(packets, "openpgp message");
    MessageInfo info;

    for (;;) {
        if (r.remaining() == 0)
            throw MalformedInputError("openpgp message: no encrypted data packet");

        uint8_t tag = 0;
        size_t  len = 0;
        bool definite = packet_header(r, tag, len);

        if (tag == kTagSEIPD || tag == kTagAEAD)
            break;
        if (tag == kTagSED)
            throw MalformedInputError("openpgp message: not integrity protected");
        if (tag != kTagPKESK && tag != kTagSKESK && tag != kTagMarker)
            throw MalformedInputError("openpgp message: unexpected packet tag " +
                                      std::to_string(tag));
        if (!definite)
            throw MalformedInputError("openpgp message: session key packet without length");

        std::vector<uint8_t> body = r.bytes(len);
        if (tag == kTagPKESK) {
            ++info.recipients;
        } else if (tag == kTagSKESK) {
            ++info.passwords;
            uint32_t n = skesk_iterations(body);
            if (n > info.max_s2k_iterations)
                info.max_s2k_iterations = n;
        }
    }

    if (info.passwords == 0 && info.recipients == 0)
        throw MalformedInputError("openpgp message: no session key packets");
    return info;
}

std::string signature_issuer(const std::vector<uint8_t>& packets) {
    WireReader r(packets, "openpgp signature");
    uint8_t tag = 0;
    size_t  len = 0;
    if (!packet_header(r, tag, len) || tag != kTagSignature)
        throw MalformedInputError("openpgp signature: not a signature packet");
    std::vector<uint8_t> body = r.bytes(len);

    WireReader s(body, "openpgp signature");
    uint8_t version = s.u8();
    if (version == 3) {
        s.u8();              // hashed length, always 5
        s.u8();              // type
        s.bytes(4);          // creation time
        std::vector<uint8_t> id = s.bytes(KEY_ID_LEN);
        return hex_upper(id.data(), id.size());
    }
    if (version != 4 && version != 6)
        throw MalformedInputError("openpgp signature: unsupported version " +
                                  std::to_string(version));
    s.u8(); s.u8(); s.u8();  // type, public key algorithm, hash algorithm

    std::string issuer, from_fpr;
    for (int area = 0; area < 2; ++area) {
        size_t n = version == 4 ? s.u16be() : s.u32be();
        std::vector<uint8_t> sub = s.bytes(n);
        WireReader a(sub, "openpgp signature subpackets");
        while (a.remaining() > 0) {
            uint8_t o1 = a.u8();
            size_t  sl;
            if (o1 < 192)
                sl = o1;
            else if (o1 < 255)
                sl = ((size_t)(o1 - 192) << 8) + a.u8() + 192;
            else
                sl = a.u32be();
            if (sl == 0)
                throw MalformedInputError("openpgp signature: empty subpacket");

            std::vector<uint8_t> sp = a.bytes(sl);
            uint8_t type = sp[0] & 0x7F;
            if (type == kSubIssuer && sp.size() == 1 + KEY_ID_LEN) {
                issuer = hex_upper(sp.data() + 1, KEY_ID_LEN);
            } else if (type == kSubIssuerFpr && sp.size() >= 2) {
                size_t fpr_len = sp.size() - 2;
                if (sp[1] == 4 && fpr_len == 20)
                    from_fpr = hex_upper(sp.data() + 2 + 12, KEY_ID_LEN);
                else if (sp[1] == 6 && fpr_len == 32)
                    from_fpr = hex_upper(sp.data() + 2, KEY_ID_LEN);
            }
        }
    }

    if (!from_fpr.empty())
        return from_fpr;
    if (!issuer.empty())
        return issuer;
    throw MalformedInputError("openpgp signature: no issuer");
}

} // namespace pgp
