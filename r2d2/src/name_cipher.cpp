#include "name_cipher.hpp"
#include "errors.hpp"
#include "kdf.hpp"
#include "log.hpp"
#include "message.hpp"

namespace name_cipher {

static bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string canonical_name(const std::string& name) {
    size_t b = 0, e = name.size();
    while (b < e && is_ascii_space(name[b]))     ++b;
    while (e > b && is_ascii_space(name[e - 1])) --e;

    std::string out = name.substr(b, e - b);
    for (char& c : out)
        if (c >= 'A' && c <= 'Z')
            c = (char)(c - 'A' + 'a');
    return out;
}

std::string name_hash(const std::string& name) {
    return sha256_hex(canonical_name(name));
}

EncryptedName encrypt_name(const std::string& plaintext, const node_key::PublicKey& key) {
    EncryptedName en;
    en.ciphertext = message::seal_public(
        std::vector<uint8_t>(plaintext.begin(), plaintext.end()), key);
    en.name_hash = name_hash(plaintext);
    return en;
}

std::string decrypt_name(const std::string& ciphertext, const node_key::UnlockedKey& key) {
    SecretBytes plain = message::open_public(ciphertext, key);
    return std::string(plain.bytes().begin(), plain.bytes().end());
}

std::string decrypt_name_or(const std::string& ciphertext,
                            const node_key::UnlockedKey& key,
                            const std::string& placeholder)
{
    if (ciphertext.empty())
        return placeholder;
    try {
        return decrypt_name(ciphertext, key);
    } catch (const CryptoError& e) {
        logging::warn("name for key " + key.pub.key_id + " unreadable (" +
                      error_kind_str(e.kind()) + "): " + e.what());
        return placeholder;
    }
}

} // namespace name_cipher
