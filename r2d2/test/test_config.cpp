#include "test_tree.hpp"
#include "../src/config.hpp"
#include "../src/descriptor_yaml.hpp"
#include "../src/log.hpp"
#include "../src/signature.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

// ── settings ─────────────────────────────────────────────────────────────────

static bool test_config() {
    bool ok = true;

    Config def = config::parse("");
    ok &= check(def.workers == 0, "default workers");
    ok &= check(def.s2k_iterations == S2K_DEFAULT_ITERATIONS, "default iterations");
    ok &= check(def.block_size == 4 * 1024 * 1024, "default block size");
    ok &= check(def.log_level == logging::Level::Warn, "default log level");
    ok &= check(def.placeholders.root == "My Files" && def.placeholders.file == "Unnamed File",
                "default placeholders");

    Config c = config::parse(
        "workers: 4\n"
        "s2k-iterations: 200000\n"
        "block-size: 65536\n"
        "log-level: debug\n"
        "placeholders:\n"
        "  folder: Locked folder\n");
    ok &= check(c.workers == 4, "workers");
    ok &= check(c.s2k_iterations == 200000, "iterations");
    ok &= check(c.block_size == 65536, "block size");
    ok &= check(c.log_level == logging::Level::Debug, "log level");
    ok &= check(c.placeholders.folder == "Locked folder", "folder placeholder");
    ok &= check(c.placeholders.share == "Shared", "unset placeholder keeps default");

    ok &= check(throws<std::runtime_error>([] { config::parse("s2k-iterations: 10\n"); }),
                "too few iterations");
    ok &= check(throws<std::runtime_error>([] { config::parse("s2k-iterations: 65011712\n"); }),
                "iterations above the read limit");
    ok &= check(throws<std::runtime_error>([] { config::parse("workers: many\n"); }),
                "non-numeric workers");
    ok &= check(throws<std::runtime_error>([] { config::parse("workers: 1000\n"); }),
                "too many workers");
    ok &= check(throws<std::runtime_error>([] { config::parse("block-size: 12\n"); }),
                "block size too small");
    ok &= check(throws<std::runtime_error>([] { config::parse("log-level: loud\n"); }),
                "unknown log level");
    ok &= check(throws<std::runtime_error>([] { config::parse("- a\n- b\n"); }),
                "top level must be a map");
    ok &= check(throws<std::runtime_error>([] { config::parse("placeholders: x\n"); }),
                "placeholders must be a map");
    ok &= check(throws<std::runtime_error>([] { config::parse("workers: [1\n"); }),
                "broken YAML");
    ok &= check(throws<std::runtime_error>([] { config::load_file("/nonexistent/r2d2.yaml"); }),
                "missing config file");

    config::apply(c);
    ok &= check(logging::level() == logging::Level::Debug, "apply sets log level");
    config::apply(def);
    ok &= check(logging::level() == logging::Level::Warn, "apply restores log level");
    return ok;
}

// ── descriptors ──────────────────────────────────────────────────────────────

static bool test_descriptor_yaml(const TestTree& t) {
    bool ok = true;

    NodeDescriptor d = t.file_desc();
    std::string text = emit_descriptor_yaml(d);
    ok &= check(text.find("type: node") != std::string::npos, "type tag");
    ok &= check(text.find("kind: file") != std::string::npos, "kind");

    NodeDescriptor back = parse_descriptor_yaml(text);
    ok &= check(back.id == d.id && back.kind == NodeKind::File, "id and kind");
    ok &= check(back.owner_email == d.owner_email, "owner");
    ok &= check(back.node_key == d.node_key, "node key byte-exact");
    ok &= check(back.node_passphrase == d.node_passphrase, "passphrase byte-exact");
    ok &= check(back.node_passphrase_signature == d.node_passphrase_signature,
                "signature byte-exact");
    ok &= check(back.name == d.name, "name byte-exact");
    ok &= check(back.content_key_packet == d.content_key_packet &&
                back.content_key_signature == d.content_key_signature, "content key fields");
    ok &= check(back.xattrs.empty(), "absent xattrs stay absent");

    // Signatures still verify over the reloaded text.
    node_key::PublicKey folder_pub = node_key::read_public(t.folder.node_key);
    ok &= check(signature::verify(back.node_passphrase, back.node_passphrase_signature,
                                  folder_pub), "signature survives YAML");

    NodeDescriptor u = parse_descriptor_yaml(emit_descriptor_yaml(t.user_desc()));
    ok &= check(u.kind == NodeKind::User && u.name.empty() && u.content_key_packet.empty(),
                "optional fields omitted for a user node");

    std::string path = "r2d2_test_descriptor.yaml";
    {
        std::ofstream f(path);
        f << text;
    }
    ok &= check(load_descriptor_yaml(path).node_key == d.node_key, "load from file");
    std::remove(path.c_str());

    ok &= check(throws<std::runtime_error>([] { parse_descriptor_yaml("type: other\nid: x\n"); }),
                "wrong type tag");
    ok &= check(throws<std::runtime_error>([] { parse_descriptor_yaml("type: node\nkind: file\n"); }),
                "missing id");
    ok &= check(throws<MalformedInputError>([] {
                    parse_descriptor_yaml("type: node\nid: x\nkind: disk\nnode-key: a\nnode-passphrase: b\n");
                }), "unknown kind");
    return ok;
}

int main() {
    bool ok = true;
    ok &= test_config();

    TestTree t = build_tree();
    ok &= test_descriptor_yaml(t);

    if (ok) std::cout << "PASS: test_config\n";
    return ok ? 0 : 1;
}
