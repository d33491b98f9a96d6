#pragma once
#include "kdf.hpp"
#include "log.hpp"
#include "node_resolver.hpp"
#include <cstdint>
#include <string>

// Runtime settings, read from a YAML file:
//
//   workers: 4                 # 0 = one per hardware thread
//   s2k-iterations: 16777216   # OpenPGP S2K octet count for new packets and keys
//   block-size: 4194304        # file body block size in bytes
//   log-level: warn            # error | warn | info | debug
//   placeholders:
//     root: My Files
//     share: Shared
//     folder: Unnamed Folder
//     file: Unnamed File
//
// Missing keys keep their defaults.
struct Config {
    unsigned       workers        = 0;
    uint32_t       s2k_iterations = S2K_DEFAULT_ITERATIONS;
    size_t         block_size     = 4 * 1024 * 1024;
    logging::Level log_level      = logging::Level::Warn;
    Placeholders   placeholders;
};

namespace config {

// Throws std::runtime_error on a value of the wrong type or out of range.
Config parse(const std::string& yaml_text);
Config load_file(const std::string& path);

// Applies process-wide settings (log level).
void apply(const Config& cfg);

} // namespace config
