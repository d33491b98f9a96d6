#include "descriptor_yaml.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

// ── emission ──────────────────────────────────────────────────────────────────

// Armored text ends in '\n', so yaml-cpp emits '|' (clip) and the value
// reloads with exactly that one trailing newline.
static void emit_block(YAML::Emitter& out, const char* key, const std::string& val) {
    if (val.empty())
        return;
    out << YAML::Key << key << YAML::Value;
    if (val.find('\n') != std::string::npos)
        out << YAML::Literal;
    out << val;
}

std::string emit_descriptor_yaml(const NodeDescriptor& d) {
    YAML::Emitter out;

    out << YAML::BeginDoc;
    out << YAML::BeginMap;

    out << YAML::Key << "type"  << YAML::Value << "node";
    out << YAML::Key << "id"    << YAML::Value << d.id;
    out << YAML::Key << "kind"  << YAML::Value << node_kind_str(d.kind);
    out << YAML::Key << "owner" << YAML::Value << d.owner_email;

    emit_block(out, "node-key",                  d.node_key);
    emit_block(out, "node-passphrase",           d.node_passphrase);
    emit_block(out, "node-passphrase-signature", d.node_passphrase_signature);
    emit_block(out, "name",                      d.name);
    emit_block(out, "content-key-packet",        d.content_key_packet);
    emit_block(out, "content-key-signature",     d.content_key_signature);
    emit_block(out, "xattrs",                    d.xattrs);

    out << YAML::EndMap;
    out << YAML::EndDoc;

    if (!out.good())
        throw std::runtime_error("YAML node: emit failed: " + out.GetLastError());
    return std::string(out.c_str()) + "\n";
}

// ── parsing ───────────────────────────────────────────────────────────────────

static NodeDescriptor from_node(const YAML::Node& doc) {
    if (!doc.IsMap())
        throw std::runtime_error("YAML node: top level must be a map");

    std::string doc_type = doc["type"].as<std::string>("");
    if (doc_type != "node")
        throw std::runtime_error("YAML node: 'type' field must be 'node' (got '" + doc_type + "')");

    NodeDescriptor d;
    d.id          = doc["id"].as<std::string>();
    d.kind        = node_kind_from_str(doc["kind"].as<std::string>());
    d.owner_email = doc["owner"].as<std::string>("");

    d.node_key        = doc["node-key"].as<std::string>();
    d.node_passphrase = doc["node-passphrase"].as<std::string>();

    d.node_passphrase_signature = doc["node-passphrase-signature"].as<std::string>("");
    d.name                      = doc["name"].as<std::string>("");
    d.content_key_packet        = doc["content-key-packet"].as<std::string>("");
    d.content_key_signature     = doc["content-key-signature"].as<std::string>("");
    d.xattrs                    = doc["xattrs"].as<std::string>("");
    return d;
}

NodeDescriptor parse_descriptor_yaml(const std::string& text) {
    try {
        return from_node(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("YAML node: ") + e.what());
    }
}

NodeDescriptor load_descriptor_yaml(const std::string& path) {
    try {
        return from_node(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML node: " + path + ": " + e.what());
    }
}
