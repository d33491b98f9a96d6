#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace config {

static const size_t   kMinBlockSize  = 1024;
static const size_t   kMaxBlockSize  = 64 * 1024 * 1024;

template <typename T>
static T read_scalar(const YAML::Node& node, const char* key, T fallback) {
    YAML::Node v = node[key];
    if (!v)
        return fallback;
    try {
        return v.as<T>();
    } catch (const YAML::Exception&) {
        throw std::runtime_error(std::string("config: bad value for '") + key + "'");
    }
}

static Config from_node(const YAML::Node& doc) {
    Config cfg;
    if (!doc || doc.IsNull())
        return cfg;
    if (!doc.IsMap())
        throw std::runtime_error("config: top level must be a map");

    cfg.workers = read_scalar<unsigned>(doc, "workers", cfg.workers);
    if (cfg.workers > 256)
        throw std::runtime_error("config: 'workers' must be at most 256");

    cfg.s2k_iterations = read_scalar<uint32_t>(doc, "s2k-iterations", cfg.s2k_iterations);
    if (cfg.s2k_iterations < S2K_MIN_ITERATIONS || cfg.s2k_iterations > S2K_MAX_ITERATIONS)
        throw std::runtime_error("config: 's2k-iterations' must be between " +
                                 std::to_string(S2K_MIN_ITERATIONS) + " and " +
                                 std::to_string(S2K_MAX_ITERATIONS));

    cfg.block_size = read_scalar<size_t>(doc, "block-size", cfg.block_size);
    if (cfg.block_size < kMinBlockSize || cfg.block_size > kMaxBlockSize)
        throw std::runtime_error("config: 'block-size' must be between " +
                                 std::to_string(kMinBlockSize) + " and " +
                                 std::to_string(kMaxBlockSize));

    std::string level = read_scalar<std::string>(doc, "log-level", "");
    if (!level.empty())
        cfg.log_level = logging::level_from_str(level);

    YAML::Node ph = doc["placeholders"];
    if (ph) {
        if (!ph.IsMap())
            throw std::runtime_error("config: 'placeholders' must be a map");
        cfg.placeholders.root   = read_scalar<std::string>(ph, "root",   cfg.placeholders.root);
        cfg.placeholders.share  = read_scalar<std::string>(ph, "share",  cfg.placeholders.share);
        cfg.placeholders.folder = read_scalar<std::string>(ph, "folder", cfg.placeholders.folder);
        cfg.placeholders.file   = read_scalar<std::string>(ph, "file",   cfg.placeholders.file);
    }
    return cfg;
}

Config parse(const std::string& yaml_text) {
    YAML::Node doc;
    try {
        doc = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("config: ") + e.what());
    }
    return from_node(doc);
}

Config load_file(const std::string& path) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("config: cannot open " + path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("config: " + path + ": " + e.what());
    }
    return from_node(doc);
}

void apply(const Config& cfg) {
    logging::set_level(cfg.log_level);
}

} // namespace config
