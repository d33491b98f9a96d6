#include "key_packet.hpp"
#include "base64.hpp"
#include "errors.hpp"
#include "message.hpp"
#include <msgpack.hpp>
#include <openssl/rand.h>
#include <chrono>
#include <ctime>
#include <stdexcept>

namespace key_packet {

// ── helpers ───────────────────────────────────────────────────────────────────

static std::string iso8601_now() {
    std::time_t t = std::time(nullptr);
    struct tm gmt;
    gmtime_r(&t, &gmt);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &gmt);
    return std::string(buf);
}

static std::string to_base36(uint64_t v) {
    static const char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (v == 0) return "0";
    std::string out;
    while (v > 0) {
        out.insert(out.begin(), kDigits[v % 36]);
        v /= 36;
    }
    return out;
}

static std::string require_str(const msgpack::object& obj, const char* ctx) {
    if (obj.type != msgpack::type::STR)
        throw MalformedInputError(std::string("key packet: ") + ctx + ": expected string");
    return {obj.via.str.ptr, obj.via.str.size};
}

// ── ids and keys ──────────────────────────────────────────────────────────────

SessionKey new_session_key() {
    SecretBytes raw(32);
    if (RAND_bytes(raw.data(), 32) != 1)
        throw std::runtime_error("RAND_bytes failed");
    return SessionKey(base64_encode(raw.data(), raw.size()));
}

std::string new_packet_id() {
    static const char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    uint64_t ms = (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    uint8_t rnd[8];
    if (RAND_bytes(rnd, sizeof(rnd)) != 1)
        throw std::runtime_error("RAND_bytes failed");

    std::string id = to_base36(ms);
    id += '-';
    for (uint8_t b : rnd)
        id += kDigits[b % 36];
    return id;
}

KeyPacket make(NodeKind kind, const std::string& parent_key_packet_id) {
    KeyPacket p;
    p.session_key          = new_session_key();
    p.parent_key_packet_id = parent_key_packet_id;
    p.created              = iso8601_now();
    p.version              = KEY_PACKET_VERSION;
    p.key_type             = kind;
    p.id                   = new_packet_id();
    return p;
}

// ── encode / decode ───────────────────────────────────────────────────────────

std::vector<uint8_t> encode(const KeyPacket& p) {
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(buf);

    pk.pack_map(6);

    pk.pack(std::string("sessionKey"));
    pk.pack(p.session_key.str());

    pk.pack(std::string("parentKeyPacketId"));
    pk.pack(p.parent_key_packet_id);

    pk.pack(std::string("created"));
    pk.pack(p.created);

    pk.pack(std::string("version"));
    pk.pack_uint32(p.version);

    pk.pack(std::string("keyType"));
    pk.pack(node_kind_str(p.key_type));

    pk.pack(std::string("id"));
    pk.pack(p.id);

    std::vector<uint8_t> out(reinterpret_cast<const uint8_t*>(buf.data()),
                             reinterpret_cast<const uint8_t*>(buf.data()) + buf.size());
    OPENSSL_cleanse(buf.data(), buf.size());
    return out;
}

KeyPacket decode(const std::vector<uint8_t>& data) {
    msgpack::object_handle oh;
    try {
        msgpack::unpack(oh, reinterpret_cast<const char*>(data.data()), data.size());
    } catch (const msgpack::unpack_error& e) {
        throw MalformedInputError(std::string("key packet: ") + e.what());
    }
    const msgpack::object& obj = oh.get();

    if (obj.type != msgpack::type::MAP)
        throw MalformedInputError("key packet: top-level object must be a map");

    KeyPacket p;
    bool got_sk = false, got_parent = false, got_cr = false,
         got_v = false, got_type = false, got_id = false;

    const auto& map = obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i) {
        const auto& kv = map.ptr[i];
        std::string key = require_str(kv.key, "map key");
        const msgpack::object& val = kv.val;

        if (key == "sessionKey") {
            p.session_key = SessionKey(require_str(val, "'sessionKey'"));
            got_sk = true;
        } else if (key == "parentKeyPacketId") {
            p.parent_key_packet_id = require_str(val, "'parentKeyPacketId'");
            got_parent = true;
        } else if (key == "created") {
            p.created = require_str(val, "'created'");
            got_cr = true;
        } else if (key == "version") {
            if (val.type != msgpack::type::POSITIVE_INTEGER)
                throw MalformedInputError("key packet: 'version' must be unsigned int");
            p.version = static_cast<uint32_t>(val.via.u64);
            got_v = true;
        } else if (key == "keyType") {
            p.key_type = node_kind_from_str(require_str(val, "'keyType'"));
            got_type = true;
        } else if (key == "id") {
            p.id = require_str(val, "'id'");
            got_id = true;
        }
    }

    if (!got_sk || !got_parent || !got_cr || !got_v || !got_type || !got_id)
        throw MalformedInputError("key packet: missing required fields");
    if (p.version != KEY_PACKET_VERSION)
        throw MalformedInputError("key packet: unsupported version " +
                                  std::to_string(p.version));
    if (p.session_key.empty() || p.id.empty())
        throw MalformedInputError("key packet: empty session key or id");

    return p;
}

// ── seal / unseal ─────────────────────────────────────────────────────────────

std::string seal(const KeyPacket& p, const std::string& parent_secret,
                 uint32_t iterations)
{
    SecretBytes plain(encode(p));
    return message::seal_password(plain.bytes(), parent_secret, iterations);
}

KeyPacket unseal(const std::string& armored, const std::string& parent_secret) {
    SecretBytes plain = message::open_password(armored, parent_secret);
    return decode(plain.bytes());
}

std::string seal_to(const KeyPacket& p, const node_key::PublicKey& recipient) {
    SecretBytes plain(encode(p));
    return message::seal_public(plain.bytes(), recipient);
}

KeyPacket unseal_with(const std::string& armored, const node_key::UnlockedKey& key) {
    SecretBytes plain = message::open_public(armored, key);
    return decode(plain.bytes());
}

} // namespace key_packet
