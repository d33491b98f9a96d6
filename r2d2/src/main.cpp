#include "base64.hpp"
#include "chain_walker.hpp"
#include "config.hpp"
#include "content.hpp"
#include "descriptor_yaml.hpp"
#include "errors.hpp"
#include "executor.hpp"
#include "log.hpp"
#include "node_keygen.hpp"
#include "node_registry.hpp"
#include "wire.hpp"

#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <cstring>
#include <cstdlib>
#include <stdexcept>
#include <utility>
#include <openssl/rand.h>

// ── Usage ─────────────────────────────────────────────────────────────────────

static void print_usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " secret  [--out <file>]\n"
        "  " << prog << " keygen  --secret <file> --name <name> --email <email> [--out <file>]\n"
        "  " << prog << " mknode  --secret <file> --kind share|folder|file --name <name>\n"
        "                [--xattr key=value]... [--out <file>] <node.yaml>...\n"
        "  " << prog << " walk    --secret <file> <node.yaml>...\n"
        "  " << prog << " encrypt --secret <file> --in <file> [--out <file>] <node.yaml>...\n"
        "  " << prog << " decrypt --secret <file> --in <file> [--out <file>] <node.yaml>...\n"
        "\n"
        "  --config <file>  YAML settings (workers, s2k-iterations, block-size, log-level)\n"
        "  --secret <file>  root secret, as written by 'secret'\n"
        "\n"
        "  <node.yaml>... is the path from the user node down, one descriptor per level.\n"
        "  secret:  writes a fresh random root secret\n"
        "  keygen:  writes the descriptor of a new user node\n"
        "  mknode:  unlocks the path and writes a new child descriptor under its last node\n"
        "  walk:    unlocks the path and prints each node's state and name\n"
        "  encrypt: encrypts <in> with the content key of the file at the end of the path\n"
        "  decrypt: reverses encrypt\n"
        "\n"
        "Exit codes: 0=ok, 1=usage, 2=crypto, 3=I/O\n";
}

// ── File I/O ──────────────────────────────────────────────────────────────────

struct IoError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw IoError("Cannot open file: " + path);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)),
                                 std::istreambuf_iterator<char>());
}

static std::string read_file_text(const std::string& path) {
    std::ifstream f(path);
    if (!f)
        throw IoError("Cannot open file: " + path);
    return std::string((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
}

static void write_output(const std::string& path, const uint8_t* data, size_t len) {
    if (path.empty()) {
        std::cout.write(reinterpret_cast<const char*>(data), (std::streamsize)len);
        std::cout.flush();
        if (!std::cout)
            throw IoError("write to stdout failed");
        return;
    }
    std::ofstream f(path, std::ios::binary);
    if (!f)
        throw IoError("Cannot create file: " + path);
    f.write(reinterpret_cast<const char*>(data), (std::streamsize)len);
    if (!f)
        throw IoError("Write error: " + path);
}

static void write_output(const std::string& path, const std::string& text) {
    write_output(path, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

static SecretString read_secret(const std::string& path) {
    std::string s = read_file_text(path);
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
        s.pop_back();
    if (s.empty())
        throw IoError("Secret file is empty: " + path);
    return SecretString(std::move(s));
}

// ── Helpers ───────────────────────────────────────────────────────────────────

static std::vector<NodeDescriptor> load_path(const std::vector<std::string>& files) {
    std::vector<NodeDescriptor> path;
    for (const auto& f : files) {
        try {
            path.push_back(load_descriptor_yaml(f));
        } catch (const CryptoError&) {
            throw;
        } catch (const std::runtime_error& e) {
            throw IoError(e.what());
        }
    }
    return path;
}

// "Name <email>" -> {Name, email}
static Identity identity_of(const std::string& uid) {
    Identity id;
    id.email = node_key::email_of(uid);
    size_t lt = uid.rfind(" <");
    id.name = (lt == std::string::npos) ? id.email : uid.substr(0, lt);
    return id;
}

static ResolveOptions resolve_options(const Config& cfg) {
    ResolveOptions opts;
    opts.placeholders = cfg.placeholders;
    return opts;
}

// Unlocks the whole path or throws the error of the node that failed.
static void walk_or_throw(ChainWalker& walker, const SecretString& secret,
                          const std::vector<NodeDescriptor>& path)
{
    WalkResult wr = walker.walk(secret, path);
    if (!wr.complete)
        throw CryptoError(wr.error, "cannot unlock " + wr.ids.back() + ": " + wr.error_message);
}

// ── secret command ────────────────────────────────────────────────────────────

static int cmd_secret(const std::string& out_path) {
    SecretBytes raw(32);
    if (RAND_bytes(raw.data(), 32) != 1)
        throw std::runtime_error("RAND_bytes failed");
    SecretString s(base64_encode(raw.data(), raw.size()) + "\n");
    write_output(out_path, s.str());
    return 0;
}

// ── keygen command ────────────────────────────────────────────────────────────

static int cmd_keygen(const Config& cfg, const std::string& secret_path,
                      const Identity& owner, const std::string& out_path)
{
    SecretString secret = read_secret(secret_path);
    GeneratedKeys g = node_keygen::generate_user_keys(owner, secret, cfg.s2k_iterations);
    write_output(out_path, emit_descriptor_yaml(node_keygen::to_descriptor(g, NodeKind::User, owner.email)));
    std::cerr << "Created user node " << g.key_packet_id << " for " << owner.uid() << "\n";
    return 0;
}

// ── mknode command ────────────────────────────────────────────────────────────

static int cmd_mknode(const Config& cfg, const std::string& secret_path,
                      NodeKind kind, const std::string& name,
                      const ExtendedAttributes& xattrs,
                      const std::vector<std::string>& path_files,
                      const std::string& out_path)
{
    SecretString secret = read_secret(secret_path);
    std::vector<NodeDescriptor> path = load_path(path_files);

    Executor     exec(cfg.workers);
    NodeRegistry registry;
    ChainWalker  walker(exec, registry, resolve_options(cfg));
    walk_or_throw(walker, secret, path);

    const NodeDescriptor& parent_desc = path.back();
    const UnlockedNode*   parent      = registry.find(parent_desc.id);

    GenerateRequest req;
    req.name                        = name;
    req.owner                       = identity_of(parent->key.pub.uid);
    req.kind                        = kind;
    req.parent_private_key          = parent_desc.node_key;
    req.parent_passphrase           = parent_desc.node_passphrase;
    req.parent_passphrase_signature = parent_desc.node_passphrase_signature;
    req.parent_session_key          = parent->session_key;
    req.parent_key_packet_id        = parent->key_packet_id;
    req.xattrs                      = xattrs;
    req.iterations                  = cfg.s2k_iterations;
    if (path.size() >= 2)
        req.parent_signer_key = path[path.size() - 2].node_key;

    TaskResult r = exec.submit(TaskType::GenerateNodeKeys, req).get();
    if (!r.ok)
        throw CryptoError(r.error.kind, r.error.message);
    const GeneratedKeys& g = std::get<GeneratedKeys>(r.value);

    write_output(out_path, emit_descriptor_yaml(node_keygen::to_descriptor(g, kind, parent_desc.owner_email)));
    std::cerr << "Created " << node_kind_str(kind) << " " << g.key_packet_id
              << " under " << parent_desc.id << "\n";
    return 0;
}

// ── walk command ──────────────────────────────────────────────────────────────

static int cmd_walk(const Config& cfg, const std::string& secret_path,
                    const std::vector<std::string>& path_files)
{
    SecretString secret = read_secret(secret_path);
    std::vector<NodeDescriptor> path = load_path(path_files);

    Executor     exec(cfg.workers);
    NodeRegistry registry;
    ChainWalker  walker(exec, registry, resolve_options(cfg));
    WalkResult   wr = walker.walk(secret, path);

    for (size_t i = 0; i < wr.ids.size(); ++i) {
        const UnlockedNode* n = registry.find(wr.ids[i]);
        std::cout << std::string(2 * i, ' ') << node_kind_str(n->kind) << " " << n->id
                  << " [" << node_state_str(n->state) << "]";
        if (n->usable())
            std::cout << " \"" << n->name << "\" key " << n->key.pub.key_id;
        else
            std::cout << " " << error_kind_str(n->error) << ": " << n->error_message;
        std::cout << "\n";
    }
    return wr.complete ? 0 : 2;
}

// ── encrypt / decrypt commands ────────────────────────────────────────────────
// Encrypted file: for each block, length(4, big-endian) || ciphertext || tag.

static SecretBytes file_content_key(const Config& cfg, Executor& exec,
                                    const std::string& secret_path,
                                    const std::vector<std::string>& path_files)
{
    SecretString secret = read_secret(secret_path);
    std::vector<NodeDescriptor> path = load_path(path_files);
    if (path.back().kind != NodeKind::File)
        throw std::invalid_argument("last node of the path must be a file");

    NodeRegistry registry;
    ChainWalker  walker(exec, registry, resolve_options(cfg));
    walk_or_throw(walker, secret, path);
    return walker.unlock_content_key(path.back());
}

static int cmd_encrypt(const Config& cfg, const std::string& secret_path,
                       const std::string& in_path, const std::string& out_path,
                       const std::vector<std::string>& path_files)
{
    Executor    exec(cfg.workers);
    SecretBytes key = file_content_key(cfg, exec, secret_path, path_files);

    std::vector<uint8_t> plaintext = read_file(in_path);
    std::vector<std::vector<uint8_t>> blocks =
        content::encrypt_payload(key, plaintext, cfg.block_size);

    std::vector<uint8_t> out;
    for (const auto& b : blocks) {
        push_u32be(out, (uint32_t)b.size());
        push_bytes(out, b);
    }
    write_output(out_path, out.data(), out.size());
    return 0;
}

static int cmd_decrypt(const Config& cfg, const std::string& secret_path,
                       const std::string& in_path, const std::string& out_path,
                       const std::vector<std::string>& path_files)
{
    Executor    exec(cfg.workers);
    SecretBytes key = file_content_key(cfg, exec, secret_path, path_files);

    std::vector<uint8_t> data = read_file(in_path);
    WireReader r(data, "encrypted file");

    std::vector<std::vector<uint8_t>> blocks;
    while (r.remaining() > 0) {
        uint32_t len = r.u32be();
        blocks.push_back(r.bytes(len));
    }
    if (blocks.empty())
        throw MalformedInputError("encrypted file: no blocks");

    // Blocks are independent; decrypt them in parallel and reassemble in order.
    // Only the final block opens with the last flag, so a cut file fails.
    std::vector<std::future<TaskResult>> pending;
    for (size_t i = 0; i < blocks.size(); ++i)
        pending.push_back(exec.submit(TaskType::DecryptBlock,
                                      BlockRequest{key, content::FIRST_BLOCK_INDEX + i,
                                                   std::move(blocks[i]),
                                                   i + 1 == blocks.size()}));

    std::vector<uint8_t> plaintext;
    for (auto& f : pending) {
        TaskResult res = f.get();
        if (!res.ok)
            throw CryptoError(res.error.kind, "decrypt: " + res.error.message);
        const auto& pt = std::get<std::vector<uint8_t>>(res.value);
        plaintext.insert(plaintext.end(), pt.begin(), pt.end());
    }
    write_output(out_path, plaintext.data(), plaintext.size());
    return 0;
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    if (cmd != "secret" && cmd != "keygen" && cmd != "mknode" && cmd != "walk" &&
        cmd != "encrypt" && cmd != "decrypt") {
        std::cerr << "Error: unknown command '" << cmd << "'\n";
        print_usage(argv[0]);
        return 1;
    }

    std::string config_path, secret_path, out_path, in_path, name, email, kind_str;
    ExtendedAttributes xattrs;
    std::vector<std::string> path_files;

    for (int i = 2; i < argc; ++i) {
        const char* opt = argv[i];
        std::string* target = nullptr;
        if      (std::strcmp(opt, "--config") == 0) target = &config_path;
        else if (std::strcmp(opt, "--secret") == 0) target = &secret_path;
        else if (std::strcmp(opt, "--out") == 0)    target = &out_path;
        else if (std::strcmp(opt, "--in") == 0)     target = &in_path;
        else if (std::strcmp(opt, "--name") == 0)   target = &name;
        else if (std::strcmp(opt, "--email") == 0)  target = &email;
        else if (std::strcmp(opt, "--kind") == 0)   target = &kind_str;

        if (target) {
            if (++i >= argc) {
                std::cerr << "Error: " << opt << " requires a value\n";
                return 1;
            }
            *target = argv[i];
        } else if (std::strcmp(opt, "--xattr") == 0) {
            if (++i >= argc) {
                std::cerr << "Error: --xattr requires key=value\n";
                return 1;
            }
            std::string kv = argv[i];
            size_t eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Error: --xattr must be key=value (got '" << kv << "')\n";
                return 1;
            }
            std::string v = kv.substr(eq + 1);
            xattrs[kv.substr(0, eq)] = std::vector<uint8_t>(v.begin(), v.end());
        } else if (opt[0] == '-') {
            std::cerr << "Error: unknown option '" << opt << "'\n";
            return 1;
        } else {
            path_files.push_back(opt);
        }
    }

    Config cfg;
    try {
        if (!config_path.empty())
            cfg = config::load_file(config_path);
        config::apply(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    if (cmd != "secret" && secret_path.empty()) {
        std::cerr << "Error: --secret is required\n";
        return 1;
    }
    bool needs_path = (cmd == "mknode" || cmd == "walk" || cmd == "encrypt" || cmd == "decrypt");
    if (needs_path && path_files.empty()) {
        std::cerr << "Error: at least one <node.yaml> is required\n";
        return 1;
    }
    if ((cmd == "encrypt" || cmd == "decrypt") && in_path.empty()) {
        std::cerr << "Error: --in is required\n";
        return 1;
    }
    if (cmd == "keygen" && (name.empty() || email.empty())) {
        std::cerr << "Error: keygen requires --name and --email\n";
        return 1;
    }

    NodeKind kind = NodeKind::Folder;
    if (cmd == "mknode") {
        if (name.empty()) {
            std::cerr << "Error: mknode requires --name\n";
            return 1;
        }
        if (kind_str != "share" && kind_str != "folder" && kind_str != "file") {
            std::cerr << "Error: --kind must be share, folder or file\n";
            return 1;
        }
        kind = node_kind_from_str(kind_str);
    }

    try {
        if (cmd == "secret")  return cmd_secret(out_path);
        if (cmd == "keygen")  return cmd_keygen(cfg, secret_path, Identity{name, email}, out_path);
        if (cmd == "mknode")  return cmd_mknode(cfg, secret_path, kind, name, xattrs,
                                                path_files, out_path);
        if (cmd == "walk")    return cmd_walk(cfg, secret_path, path_files);
        if (cmd == "encrypt") return cmd_encrypt(cfg, secret_path, in_path, out_path, path_files);
        return cmd_decrypt(cfg, secret_path, in_path, out_path, path_files);
    } catch (const IoError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    } catch (const CryptoError& e) {
        std::cerr << "Error: " << error_kind_str(e.kind()) << ": " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
