#pragma once
#include <string>
#include <vector>
#include <cstdint>

std::string base64_encode(const uint8_t* data, size_t len);
std::string base64_encode(const std::vector<uint8_t>& data);

// Skips CR/LF/space. Throws MalformedInputError on any other non-alphabet
// character or on a body that is not a whole number of quanta.
std::vector<uint8_t> base64_decode(const std::string& encoded);
