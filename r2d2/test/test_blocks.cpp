#include "test_tree.hpp"
#include "../src/base64.hpp"
#include "../src/errors.hpp"
#include "../src/kdf.hpp"
#include "../src/message.hpp"
#include "../src/node_key.hpp"
#include "../src/pgp.hpp"
#include "../src/signature.hpp"
#include "../src/wire.hpp"
#include <iostream>
#include <stdexcept>

// ── base64 ───────────────────────────────────────────────────────────────────

static bool test_base64() {
    bool ok = true;

    std::vector<uint8_t> data;
    for (int i = 0; i < 100; ++i) data.push_back((uint8_t)(i * 7));
    for (size_t n = 0; n <= data.size(); n += 33) {
        std::vector<uint8_t> slice(data.begin(), data.begin() + (std::ptrdiff_t)n);
        ok &= check(base64_decode(base64_encode(slice)) == slice, "base64 roundtrip");
    }

    ok &= check(base64_encode(std::vector<uint8_t>{'f', 'o', 'o', 'b'}) == "Zm9vYg==",
                "base64 known vector");
    ok &= check(base64_decode("Zm9v\nYg==") == std::vector<uint8_t>({'f', 'o', 'o', 'b'}),
                "base64 skips newlines");

    ok &= check(throws<MalformedInputError>([] { base64_decode("Zm9v!g=="); }),
                "base64 rejects foreign characters");
    ok &= check(throws<MalformedInputError>([] { base64_decode("Zm=9v"); }),
                "base64 rejects data after padding");
    ok &= check(throws<MalformedInputError>([] { base64_decode("Zm9vY"); }),
                "base64 rejects partial quantum");
    return ok;
}

// ── armor ────────────────────────────────────────────────────────────────────

static bool test_armor() {
    bool ok = true;

    std::vector<uint8_t> pt = {'h', 'i'};
    std::string msg = message::seal_password(pt, "pw", kTestIterations);
    ok &= check(msg.find("-----BEGIN PGP MESSAGE-----") != std::string::npos,
                "message BEGIN line");
    ok &= check(msg.find("-----END PGP MESSAGE-----") != std::string::npos,
                "message END line");
    ok &= check(pgp::armor_type(msg) == "message", "message armor type");

    std::vector<uint8_t> packets = pgp::dearmor(msg);
    ok &= check(!packets.empty() && (packets[0] & 0x80), "dearmor yields packets");
    ok &= check(pgp::dearmor(pgp::enarmor(packets, "message")) == packets,
                "enarmor keeps packets");
    ok &= check(pgp::dearmor(std::string(packets.begin(), packets.end())) == packets,
                "binary input passes through");

    ok &= check(pgp::armor_type("not armored").empty(), "armor_type on plain text");
    ok &= check(pgp::armor_type("-----BEGIN PGP SOMETHING-----\n").empty(),
                "armor_type on unknown label");

    std::string cut = msg.substr(0, msg.size() / 2);
    ok &= check(throws<MalformedInputError>([&] { pgp::dearmor(cut); }),
                "truncated armor is malformed");

    ok &= check(pgp::s2k_decode_count(0x00) == 1024, "smallest S2K count");
    ok &= check(pgp::s2k_decode_count(0x60) == 65536, "S2K count 0x60");
    ok &= check(pgp::s2k_decode_count(0xFF) == 65011712, "largest S2K count");
    return ok;
}

// ── wire ─────────────────────────────────────────────────────────────────────

static bool test_wire() {
    bool ok = true;

    std::vector<uint8_t> buf;
    push_u16be(buf, 0x0102);
    push_u32be(buf, 0x03040506);
    ok &= check(buf == std::vector<uint8_t>({1, 2, 3, 4, 5, 6}), "big-endian encoding");

    WireReader r(buf, "test");
    ok &= check(r.u16be() == 0x0102, "u16be");
    ok &= check(r.u32be() == 0x03040506, "u32be");
    ok &= check(r.remaining() == 0, "fully consumed");
    ok &= check(throws<MalformedInputError>([&] { r.u8(); }), "read past end is malformed");
    return ok;
}

// ── messages ─────────────────────────────────────────────────────────────────

// Largest count an S2K specifier can encode, above S2K_MAX_ITERATIONS.
static const uint32_t kOverCap = 65011712;

static bool test_messages() {
    bool ok = true;
    std::vector<uint8_t> pt = {'h', 'e', 'l', 'l', 'o'};

    std::string pw = message::seal_password(pt, "pw", kTestIterations);
    pgp::MessageInfo info = pgp::inspect_message(pgp::dearmor(pw));
    ok &= check(info.passwords == 1 && info.recipients == 0, "one SKESK packet");
    ok &= check(info.max_s2k_iterations >= kTestIterations &&
                info.max_s2k_iterations <= S2K_MAX_ITERATIONS, "S2K count recorded");
    ok &= check(message::open_password(pw, "pw").bytes() == pt, "password roundtrip");
    ok &= check(throws<DecryptionError>([&] { message::open_password(pw, "other"); }),
                "wrong password is a decryption error");
    ok &= check(rejects([&] { message::open_password(tamper(pw), "pw"); }),
                "tampered ciphertext is rejected");
    ok &= check(throws<std::invalid_argument>([&] { message::seal_password(pt, "", kTestIterations); }),
                "empty password refused");

    node_key::UnlockedKey alice = node_key::generate(Identity{"Alice", "alice@example.com"});
    node_key::UnlockedKey bob   = node_key::generate(Identity{"Bob", "bob@example.com"});

    std::string pk = message::seal_public(pt, alice.pub);
    info = pgp::inspect_message(pgp::dearmor(pk));
    ok &= check(info.passwords == 0 && info.recipients == 1, "one PKESK packet");
    ok &= check(message::open_public(pk, alice).bytes() == pt, "public roundtrip");
    ok &= check(throws<DecryptionError>([&] { message::open_public(pk, bob); }),
                "other recipient is a decryption error");
    ok &= check(throws<DecryptionError>([&] { message::open_password(pk, "pw"); }),
                "public message opened by password is a decryption error");
    ok &= check(throws<DecryptionError>([&] { message::open_public(pw, alice); }),
                "password message opened by key is a decryption error");

    std::string sig = signature::sign("x", alice);
    ok &= check(throws<MalformedInputError>([&] { message::open_password(sig, "pw"); }),
                "signature block is not a message");
    ok &= check(throws<MalformedInputError>([&] { message::open_password("junk", "pw"); }),
                "junk is malformed");
    return ok;
}

static bool test_message_iteration_cap() {
    bool ok = true;
    std::vector<uint8_t> pt = {'c', 'a', 'p'};

    std::string at_cap = message::seal_password(pt, "pw", S2K_MAX_ITERATIONS);
    ok &= check(message::open_password(at_cap, "pw").bytes() == pt,
                "count at the limit is accepted");

    std::string over = message::seal_password(pt, "pw", kOverCap);
    ok &= check(pgp::inspect_message(pgp::dearmor(over)).max_s2k_iterations > S2K_MAX_ITERATIONS,
                "count above the limit is written");
    ok &= check(throws<MalformedInputError>([&] { message::open_password(over, "pw"); }),
                "count above the limit is malformed");
    return ok;
}

// ── key blocks ───────────────────────────────────────────────────────────────

static bool test_key_blocks() {
    bool ok = true;

    node_key::UnlockedKey k = node_key::generate(Identity{"Alice", "alice@example.com"});
    ok &= check(k.pub.uid == "Alice <alice@example.com>", "uid format");
    ok &= check(k.pub.email() == "alice@example.com", "email from uid");
    ok &= check(k.pub.key_id.size() == 2 * pgp::KEY_ID_LEN, "key id hex length");
    ok &= check(pgp::armor_type(k.pub.armored) == "public key", "public block type");
    ok &= check(!k.secret.empty(), "private half present");

    std::string locked = node_key::lock(k, "session", kTestIterations);
    ok &= check(pgp::armor_type(locked) == "secret key", "locked block type");

    node_key::UnlockedKey back = node_key::unlock(locked, "session");
    ok &= check(back.pub.key_id == k.pub.key_id, "unlock keeps key id");
    ok &= check(back.pub.uid == k.pub.uid, "unlock keeps uid");

    // The unlocked key still decrypts what was sealed to the original.
    std::string pk = message::seal_public({7, 7, 7}, k.pub);
    ok &= check(message::open_public(pk, back).bytes() == std::vector<uint8_t>({7, 7, 7}),
                "unlocked key decrypts");

    ok &= check(throws<DecryptionError>([&] { node_key::unlock(locked, "wrong"); }),
                "wrong passphrase is a decryption error");

    ok &= check(node_key::read_public(k.pub.armored).key_id == k.pub.key_id,
                "public block carries the key id");
    ok &= check(node_key::read_public(locked).email() == "alice@example.com",
                "public half readable from private block");
    ok &= check(throws<MalformedInputError>([&] { node_key::unlock(k.pub.armored, "session"); }),
                "public block cannot be unlocked");
    ok &= check(throws<MalformedInputError>([&] { node_key::unlock(k.secret.str(), "session"); }),
                "unprotected block is not a stored key");

    std::string sig = signature::sign("x", k);
    ok &= check(throws<MalformedInputError>([&] { node_key::read_public(sig); }),
                "signature block is not a key");

    ok &= check(node_key::email_of("no brackets") == "no brackets", "email_of fallback");
    return ok;
}

static bool test_key_iteration_cap() {
    bool ok = true;

    node_key::UnlockedKey k = node_key::generate(Identity{"Alice", "alice@example.com"});
    std::string over = node_key::lock(k, "session", kOverCap);
    ok &= check(throws<MalformedInputError>([&] { node_key::unlock(over, "session"); }),
                "key S2K count above the limit is malformed");
    return ok;
}

// ── signatures ───────────────────────────────────────────────────────────────

static bool test_signatures() {
    bool ok = true;

    node_key::UnlockedKey alice = node_key::generate(Identity{"Alice", "alice@x"});
    node_key::UnlockedKey bob   = node_key::generate(Identity{"Bob", "bob@y"});

    std::string payload = message::seal_password({1, 2, 3}, "pw", kTestIterations);
    std::string sig = signature::sign(payload, alice);

    ok &= check(pgp::armor_type(sig) == "signature", "signature armor type");
    ok &= check(signature::signer_key_id(sig) == alice.pub.key_id, "signer key id");
    ok &= check(signature::verify(payload, sig, alice.pub, alice.pub.key_id, "alice@x"),
                "valid signature");

    // Valid signature, but the caller expected bob's identity.
    ok &= check(signature::check(payload, sig, alice.pub, "", "bob@y") ==
                signature::Verdict::WrongIdentity, "identity binding");
    ok &= check(!signature::verify(payload, sig, alice.pub, "", "bob@y"),
                "identity binding rejects");

    ok &= check(signature::check(payload, sig, alice.pub, bob.pub.key_id) ==
                signature::Verdict::WrongKeyId, "key id binding");
    ok &= check(signature::check(payload, sig, bob.pub) ==
                signature::Verdict::BadSignature, "wrong verifier");
    ok &= check(signature::check(payload + " ", sig, alice.pub) ==
                signature::Verdict::BadSignature, "payload change breaks signature");
    ok &= check(signature::check(payload, "garbage", alice.pub) ==
                signature::Verdict::Malformed, "unparseable signature");
    ok &= check(signature::check(payload, tamper(sig), alice.pub) ==
                signature::Verdict::BadSignature, "tampered signature bytes");
    return ok;
}

int main() {
    bool ok = true;
    ok &= test_base64();
    ok &= test_armor();
    ok &= test_wire();
    ok &= test_messages();
    ok &= test_message_iteration_cap();
    ok &= test_key_blocks();
    ok &= test_key_iteration_cap();
    ok &= test_signatures();

    if (ok) std::cout << "PASS: test_blocks\n";
    return ok ? 0 : 1;
}
