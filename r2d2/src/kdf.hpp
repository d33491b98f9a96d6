#pragma once
#include "secret.hpp"
#include <vector>
#include <string>
#include <cstdint>

// OpenPGP iterated-and-salted S2K octet counts. Counts are rounded up to the
// next encodable value when a packet is written.
static const uint32_t S2K_DEFAULT_ITERATIONS = 16777216;
static const uint32_t S2K_MIN_ITERATIONS     = 1024;
// Largest count accepted from a packet or a config file.
static const uint32_t S2K_MAX_ITERATIONS     = 2 * S2K_DEFAULT_ITERATIONS;

// Key for the file body and thumbnail blocks.
// key     = content key
// message = "payload"
// custom  = "r2d2-content-v1"
SecretBytes derive_payload_key(const SecretBytes& content_key);

// Lowercase hex SHA-256.
std::string sha256_hex(const std::string& data);
