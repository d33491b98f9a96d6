#include "node_key.hpp"
#include "errors.hpp"
#include "kdf.hpp"
#include "pgp.hpp"
#include <stdexcept>
#include <vector>

namespace node_key {

std::string PublicKey::email() const {
    return email_of(uid);
}

std::string email_of(const std::string& uid) {
    size_t open = uid.rfind('<');
    if (open == std::string::npos)
        return uid;
    size_t close = uid.find('>', open + 1);
    if (close == std::string::npos)
        return uid;
    return uid.substr(open + 1, close - open - 1);
}

// ── helpers ──────────────────────────────────────────────────────────────────

static PublicKey public_of(const pgp::Key& primary) {
    if (!primary.is_valid())
        throw MalformedInputError("key block: self-signature does not verify");

    PublicKey pub;
    pub.uid     = primary.primary_uid();
    pub.key_id  = primary.key_id();
    pub.armored = primary.export_armored(RNP_KEY_EXPORT_PUBLIC);
    return pub;
}

static UnlockedKey unlocked_of(const pgp::Key& primary) {
    UnlockedKey key;
    key.pub    = public_of(primary);
    key.secret = SecretString(primary.export_armored(RNP_KEY_EXPORT_SECRET));
    return key;
}

// A stored node key is locked with an S2K count of at most S2K_MAX_ITERATIONS.
static void require_locked(const pgp::Key& k) {
    if (!k.has_secret())
        throw MalformedInputError("key block: no private part");
    if (!k.is_protected())
        throw MalformedInputError("key block: private part is not protected");
    if (k.protection_iterations() > S2K_MAX_ITERATIONS)
        throw MalformedInputError("key block: S2K iteration count " +
                                  std::to_string(k.protection_iterations()) +
                                  " above limit");
}

// ── Public API ────────────────────────────────────────────────────────────────

UnlockedKey generate(const Identity& id) {
    pgp::Ffi ffi;
    std::string uid = id.uid();
    rnp_key_handle_t h = nullptr;
    pgp::check(rnp_generate_key_25519(ffi.get(), uid.c_str(), nullptr, &h),
               "key generation");
    pgp::Key primary(h);
    return unlocked_of(primary);
}

std::string lock(const UnlockedKey& key, const std::string& passphrase,
                 uint32_t iterations)
{
    if (key.secret.empty())
        throw std::invalid_argument("node key: private half missing");
    if (passphrase.empty())
        throw std::invalid_argument("node key: empty passphrase");

    pgp::Ffi ffi;
    ffi.import_keys(key.secret.str(), true);
    pgp::Key primary = ffi.primary();

    pgp::check(rnp_key_protect(primary.get(), passphrase.c_str(), "AES256", nullptr,
                               "SHA256", iterations), "key protection");
    for (const pgp::Key& sub : primary.subkeys())
        pgp::check(rnp_key_protect(sub.get(), passphrase.c_str(), "AES256", nullptr,
                                   "SHA256", iterations), "subkey protection");

    return primary.export_armored(RNP_KEY_EXPORT_SECRET);
}

UnlockedKey unlock(const std::string& armored_private, const std::string& passphrase) {
    pgp::Ffi ffi;
    ffi.import_keys(armored_private, true);
    pgp::Key primary = ffi.primary();
    std::vector<pgp::Key> subs = primary.subkeys();

    require_locked(primary);
    for (const pgp::Key& sub : subs)
        require_locked(sub);

    pgp::check(rnp_key_unprotect(primary.get(), passphrase.c_str()), "key unlock");
    for (const pgp::Key& sub : subs)
        pgp::check(rnp_key_unprotect(sub.get(), passphrase.c_str()), "subkey unlock");

    return unlocked_of(primary);
}

PublicKey read_public(const std::string& armored) {
    std::string type = pgp::armor_type(armored);
    if (type != "public key" && type != "secret key")
        throw MalformedInputError("key block: not a key block");

    pgp::Ffi ffi;
    ffi.import_keys(armored, true);
    return public_of(ffi.primary());
}

} // namespace node_key
