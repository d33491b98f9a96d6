#include "test_tree.hpp"
#include "../src/errors.hpp"
#include "../src/integrity.hpp"
#include "../src/key_packet.hpp"
#include "../src/name_cipher.hpp"
#include "../src/node_keygen.hpp"
#include "../src/node_resolver.hpp"
#include "../src/signature.hpp"
#include <iostream>
#include <set>

// ── key packets ──────────────────────────────────────────────────────────────

static bool test_key_packets() {
    bool ok = true;

    KeyPacket p = key_packet::make(NodeKind::Folder, "parent-id");
    ok &= check(!p.session_key.empty(), "fresh session key");
    ok &= check(p.version == key_packet::KEY_PACKET_VERSION, "packet version");
    ok &= check(p.created.size() == 20 && p.created.back() == 'Z', "ISO 8601 UTC timestamp");
    ok &= check(p.id.find('-') != std::string::npos, "packet id shape");

    std::string sealed = key_packet::seal(p, "parent secret", kTestIterations);
    ok &= check(p.session_key.str().size() == 44, "seal leaves the packet intact");

    KeyPacket back = key_packet::unseal(sealed, "parent secret");
    ok &= check(back.session_key == p.session_key, "session key roundtrip");
    ok &= check(back.parent_key_packet_id == "parent-id", "parent id roundtrip");
    ok &= check(back.key_type == NodeKind::Folder, "key type roundtrip");
    ok &= check(back.id == p.id, "id roundtrip");

    ok &= check(throws<DecryptionError>([&] { key_packet::unseal(sealed, "other secret"); }),
                "wrong parent secret is a decryption error");

    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i)
        ids.insert(key_packet::new_packet_id());
    ok &= check(ids.size() == 200, "packet ids are unique");

    // Missing fields and wrong types.
    ok &= check(throws<MalformedInputError>([] { key_packet::decode({0x90}); }),
                "array is not a packet");
    ok &= check(throws<MalformedInputError>([] { key_packet::decode({0x80}); }),
                "empty map is not a packet");
    ok &= check(throws<MalformedInputError>([] { key_packet::decode({0xc1}); }),
                "garbage bytes are malformed");

    node_key::UnlockedKey bob = node_key::generate(Identity{"Bob", "bob@example.com"});
    std::string to_bob = key_packet::seal_to(p, bob.pub);
    ok &= check(key_packet::unseal_with(to_bob, bob).session_key == p.session_key,
                "public-key sealed packet");
    return ok;
}

// ── names ────────────────────────────────────────────────────────────────────

static bool test_names() {
    bool ok = true;
    node_key::UnlockedKey k = node_key::generate(Identity{"Alice", "alice@example.com"});
    node_key::UnlockedKey other = node_key::generate(Identity{"Bob", "bob@example.com"});

    const char* corpus[] = {"a", "Report.PDF", "  spaced name  ", "tab\tinside",
                            "caf\xc3\xa9", "\xe6\x97\xa5\xe6\x9c\xac", "x.tar.gz",
                            "A very long file name that goes on for a while.txt"};
    for (const char* n : corpus) {
        name_cipher::EncryptedName en = name_cipher::encrypt_name(n, k.pub);
        ok &= check(name_cipher::decrypt_name(en.ciphertext, k) == n, "name roundtrip");
        ok &= check(en.name_hash == name_cipher::name_hash(n), "hash stable across calls");
        ok &= check(en.name_hash.size() == 64, "hash is hex sha-256");
    }

    ok &= check(name_cipher::name_hash("Report.PDF") == name_cipher::name_hash("  report.pdf\n"),
                "hash ignores case and outer whitespace");
    ok &= check(name_cipher::name_hash("report.pdf") != name_cipher::name_hash("report pdf"),
                "distinct names hash apart");
    ok &= check(name_cipher::canonical_name(" \tMiXeD Case \r\n") == "mixed case",
                "canonical form");
    ok &= check(name_cipher::name_hash("abc") ==
                "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                "hash of canonical 'abc'");

    name_cipher::EncryptedName en = name_cipher::encrypt_name("secret.txt", k.pub);
    ok &= check(throws<DecryptionError>([&] { name_cipher::decrypt_name(en.ciphertext, other); }),
                "name under another key");
    ok &= check(name_cipher::decrypt_name_or(en.ciphertext, other, "Unnamed File") ==
                "Unnamed File", "placeholder for unreadable name");
    ok &= check(name_cipher::decrypt_name_or("", k, "Unnamed Folder") == "Unnamed Folder",
                "placeholder for missing name");
    ok &= check(name_cipher::decrypt_name_or("junk", k, "Unnamed File") == "Unnamed File",
                "placeholder for malformed name");
    return ok;
}

// ── resolution ───────────────────────────────────────────────────────────────

static bool test_resolve_chain(const TestTree& t) {
    bool ok = true;

    UnlockedNode u = node_resolver::resolve(ParentContext::from_root(t.root_secret), t.user_desc());
    ok &= check(u.state == NodeState::Unlocked, "user node unlocked");
    ok &= check(u.has_signature && u.verdict == signature::Verdict::Valid, "user self-signature");
    ok &= check(u.name == "My Files", "user node shows root placeholder");
    ok &= check(u.key_packet_id == t.user.key_packet_id, "user packet id");

    UnlockedNode s = node_resolver::resolve(ParentContext::from_node(u), t.share_desc());
    ok &= check(s.trusted() && s.name == "Team", "share unlocked with name");

    UnlockedNode f = node_resolver::resolve(ParentContext::from_node(s), t.folder_desc());
    ok &= check(f.trusted() && f.name == "Projects", "folder unlocked with name");
    ok &= check(f.session_key == t.folder.session_key, "folder session key recovered");

    UnlockedNode g = node_resolver::resolve(ParentContext::from_node(f), t.file_desc());
    ok &= check(g.trusted() && g.name == "plan.txt", "file unlocked with name");
    ok &= check(g.kind == NodeKind::File, "file kind");

    // Wrong parent: the share's context for the file.
    ok &= check(throws<DecryptionError>([&] {
                    node_resolver::resolve(ParentContext::from_node(s), t.file_desc());
                }), "wrong parent key is a decryption error");

    UnlockedNode failed = node_resolver::resolve_or_fail(ParentContext::from_node(s), t.file_desc());
    ok &= check(failed.state == NodeState::Failed, "resolve_or_fail marks failure");
    ok &= check(failed.error == ErrorKind::Decryption, "failure kind recorded");
    ok &= check(failed.session_key.empty() && failed.key.secret.empty(),
                "failed node holds no secrets");

    ok &= check(throws<std::invalid_argument>([&] { ParentContext::from_node(failed); }),
                "failed node cannot be a parent");
    return ok;
}

static bool test_anti_substitution(const TestTree& t) {
    bool ok = true;

    // A second folder B in the same share. The folder's packet really is
    // sealed with the share's secret, but B's id is not the one it names.
    GeneratedKeys b = node_keygen::generate_node_keys(
        child_request(t.share, t.alice, NodeKind::Folder, "Other", t.user.node_key));

    ParentContext via_b;
    via_b.secret        = t.share.session_key;
    via_b.key_packet_id = b.key_packet_id;

    ok &= check(throws<PacketChainMismatchError>([&] {
                    node_resolver::resolve(via_b, t.folder_desc());
                }), "substituted parent packet is rejected");

    UnlockedNode n = node_resolver::resolve_or_fail(via_b, t.folder_desc());
    ok &= check(n.state == NodeState::Failed && n.error == ErrorKind::PacketChainMismatch,
                "substitution recorded as packet chain mismatch");

    // Declared kind must match the packet's key type.
    NodeDescriptor as_file = t.folder_desc();
    as_file.kind = NodeKind::File;
    UnlockedNode s = node_resolver::resolve(
        ParentContext::from_node(node_resolver::resolve(
            ParentContext::from_root(t.root_secret), t.user_desc())),
        t.share_desc());
    ok &= check(throws<MalformedInputError>([&] {
                    node_resolver::resolve(ParentContext::from_node(s), as_file);
                }), "kind mismatch is malformed");
    return ok;
}

static bool test_untrusted(const TestTree& t) {
    bool ok = true;

    UnlockedNode u = node_resolver::resolve(ParentContext::from_root(t.root_secret), t.user_desc());
    UnlockedNode s = node_resolver::resolve(ParentContext::from_node(u), t.share_desc());

    // Folder passphrase re-signed by a stranger.
    node_key::UnlockedKey mallory = node_key::generate(Identity{"Mallory", "m@example.com"});
    NodeDescriptor forged = t.folder_desc();
    forged.node_passphrase_signature = signature::sign(forged.node_passphrase, mallory);

    UnlockedNode f = node_resolver::resolve(ParentContext::from_node(s), forged);
    ok &= check(f.state == NodeState::UnlockedUntrusted, "bad signature marks untrusted");
    ok &= check(f.usable() && !f.trusted(), "untrusted node is usable");
    ok &= check(f.verdict != signature::Verdict::Valid, "verdict recorded");
    ok &= check(f.name == "Projects", "untrusted node still decrypts its name");

    ResolveOptions strict;
    strict.require_trusted = true;
    ok &= check(throws<CryptoError>([&] {
                    node_resolver::resolve(ParentContext::from_node(s), forged, strict);
                }), "strict mode rejects bad signature");

    // Owner claims somebody else: signature is fine, identity is not.
    NodeDescriptor wrong_owner = t.folder_desc();
    wrong_owner.owner_email = "bob@example.com";
    UnlockedNode w = node_resolver::resolve(ParentContext::from_node(s), wrong_owner);
    ok &= check(w.verdict == signature::Verdict::WrongIdentity, "owner mismatch verdict");
    ok &= check(throws<IdentityMismatchError>([&] {
                    node_resolver::resolve(ParentContext::from_node(s), wrong_owner, strict);
                }), "strict mode reports identity mismatch");

    NodeDescriptor unsigned_node = t.folder_desc();
    unsigned_node.node_passphrase_signature.clear();
    UnlockedNode n = node_resolver::resolve(ParentContext::from_node(s), unsigned_node);
    ok &= check(n.state == NodeState::Unlocked && !n.has_signature, "absent signature");

    ResolveOptions custom;
    custom.placeholders.folder = "(hidden)";
    NodeDescriptor nameless = t.folder_desc();
    nameless.name = tamper(nameless.name);
    ok &= check(node_resolver::resolve(ParentContext::from_node(s), nameless, custom).name ==
                "(hidden)", "configured placeholder for unreadable name");
    return ok;
}

// ── generation ───────────────────────────────────────────────────────────────

static bool test_generation(const TestTree& t) {
    bool ok = true;

    ok &= check(!t.file.content_key.empty() && !t.file.content_key_packet.empty() &&
                !t.file.content_key_signature.empty(), "file gets a content key");
    ok &= check(t.folder.content_key.empty() && t.folder.content_key_packet.empty(),
                "folder has no content key");
    ok &= check(t.file.name_hash == name_cipher::name_hash("plan.txt"), "name hash returned");
    ok &= check(t.user.folder_name.empty(), "user node has no name");

    GenerateRequest as_user = child_request(t.folder, t.alice, NodeKind::User, "x",
                                            t.share.node_key);
    ok &= check(throws<std::invalid_argument>([&] { node_keygen::generate_node_keys(as_user); }),
                "user kind refused");

    GenerateRequest no_parent_id = child_request(t.folder, t.alice, NodeKind::File, "x",
                                                 t.share.node_key);
    no_parent_id.parent_key_packet_id.clear();
    ok &= check(throws<std::invalid_argument>([&] { node_keygen::generate_node_keys(no_parent_id); }),
                "parent packet id required");

    // The folder's packet was signed by the share, not the user.
    GenerateRequest wrong_signer = child_request(t.folder, t.alice, NodeKind::File, "x",
                                                 t.user.node_key);
    ok &= check(throws<SignatureInvalidError>([&] {
                    node_keygen::generate_node_keys(wrong_signer);
                }), "parent signature checked against its signer");

    GenerateRequest wrong_session = child_request(t.folder, t.alice, NodeKind::File, "x",
                                                  t.share.node_key);
    wrong_session.parent_session_key = t.share.session_key;
    ok &= check(throws<DecryptionError>([&] { node_keygen::generate_node_keys(wrong_session); }),
                "parent key must open");

    GenerateRequest with_attrs = child_request(t.folder, t.alice, NodeKind::File, "attrs.bin",
                                               t.share.node_key);
    with_attrs.xattrs["size"]  = {0x00, 0x10};
    with_attrs.xattrs["mtime"] = {1, 2, 3, 4};
    GeneratedKeys g = node_keygen::generate_node_keys(with_attrs);
    ok &= check(!g.xattrs.empty(), "xattrs sealed");
    ExtendedAttributes back = node_keygen::open_xattrs(g.xattrs, g.session_key);
    ok &= check(back == with_attrs.xattrs, "xattrs roundtrip");
    ok &= check(throws<DecryptionError>([&] { node_keygen::open_xattrs(g.xattrs, t.folder.session_key); }),
                "xattrs need the node's own session key");

    NodeDescriptor d = node_keygen::to_descriptor(g, NodeKind::File, t.alice.email);
    ok &= check(d.id == g.key_packet_id && d.xattrs == g.xattrs, "descriptor from keys");
    return ok;
}

// ── integrity ────────────────────────────────────────────────────────────────

static bool test_integrity(const TestTree& t) {
    bool ok = true;

    node_key::PublicKey user_pub   = node_key::read_public(t.user.node_key);
    node_key::PublicKey share_pub  = node_key::read_public(t.share.node_key);
    node_key::PublicKey folder_pub = node_key::read_public(t.folder.node_key);

    ok &= check(integrity::verify_root_item_integrity(t.user_desc()), "root badge");
    ok &= check(integrity::verify_item_integrity(t.share_desc(), user_pub), "share badge");
    ok &= check(integrity::verify_item_integrity(t.folder_desc(), share_pub), "folder badge");
    ok &= check(integrity::verify_item_integrity(t.file_desc(), folder_pub), "file badge");

    ok &= check(!integrity::verify_item_integrity(t.file_desc(), share_pub),
                "badge against the wrong parent");

    NodeDescriptor ck = t.file_desc();
    ck.content_key_signature = tamper(ck.content_key_signature);
    ok &= check(!integrity::verify_item_integrity(ck, folder_pub), "tampered content key signature");

    NodeDescriptor none = t.folder_desc();
    none.node_passphrase_signature.clear();
    ok &= check(!integrity::verify_item_integrity(none, share_pub), "no signature, no badge");

    NodeDescriptor root = t.user_desc();
    root.node_passphrase = t.share.node_passphrase;
    ok &= check(!integrity::verify_root_item_integrity(root), "root badge over other payload");

    NodeDescriptor bad_key = t.user_desc();
    bad_key.node_key = "junk";
    ok &= check(!integrity::verify_root_item_integrity(bad_key), "root badge with unreadable key");
    return ok;
}

// ── moves ────────────────────────────────────────────────────────────────────

static bool test_move(const TestTree& t) {
    bool ok = true;

    // Move the file from the folder straight into the share.
    MoveRequest mr;
    mr.kind                 = NodeKind::File;
    mr.name                 = "plan.txt";
    mr.item_session_key     = t.file.session_key;
    mr.item_key_packet_id   = t.file.key_packet_id;
    mr.target_private_key   = t.share.node_key;
    mr.target_session_key   = t.share.session_key;
    mr.target_key_packet_id = t.share.key_packet_id;
    mr.iterations           = kTestIterations;

    MoveResult m = node_keygen::prepare_move(mr);
    ok &= check(m.key_packet_id == t.file.key_packet_id, "moved item keeps its packet id");
    ok &= check(m.name_hash == name_cipher::name_hash("plan.txt"), "moved name hash");

    NodeDescriptor moved = t.file_desc();
    moved.node_passphrase           = m.node_passphrase;
    moved.node_passphrase_signature = m.node_passphrase_signature;

    UnlockedNode u = node_resolver::resolve(ParentContext::from_root(t.root_secret), t.user_desc());
    UnlockedNode s = node_resolver::resolve(ParentContext::from_node(u), t.share_desc());
    UnlockedNode g = node_resolver::resolve(ParentContext::from_node(s), moved);
    ok &= check(g.trusted(), "moved item resolves under the new parent");
    ok &= check(g.session_key == t.file.session_key, "moved item keeps its session key");
    ok &= check(g.name == "plan.txt", "moved item keeps its name");

    UnlockedNode f = node_resolver::resolve(ParentContext::from_node(s), t.folder_desc());
    ok &= check(throws<DecryptionError>([&] {
                    node_resolver::resolve(ParentContext::from_node(f), moved);
                }), "old parent can no longer open the moved item");

    MoveRequest missing = mr;
    missing.target_key_packet_id.clear();
    ok &= check(throws<std::invalid_argument>([&] { node_keygen::prepare_move(missing); }),
                "move needs target packet id");
    return ok;
}

int main() {
    bool ok = true;
    ok &= test_key_packets();
    ok &= test_names();

    TestTree t = build_tree();
    ok &= test_resolve_chain(t);
    ok &= test_anti_substitution(t);
    ok &= test_untrusted(t);
    ok &= test_generation(t);
    ok &= test_integrity(t);
    ok &= test_move(t);

    if (ok) std::cout << "PASS: test_key_chain\n";
    return ok ? 0 : 1;
}
