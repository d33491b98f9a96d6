#include "base64.hpp"
#include "errors.hpp"

static const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int decode_char(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string base64_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t b = (uint32_t)data[i] << 16;
        if (i + 1 < len) b |= (uint32_t)data[i + 1] << 8;
        if (i + 2 < len) b |= (uint32_t)data[i + 2];

        out += kAlphabet[(b >> 18) & 0x3F];
        out += kAlphabet[(b >> 12) & 0x3F];
        out += (i + 1 < len) ? kAlphabet[(b >> 6) & 0x3F] : '=';
        out += (i + 2 < len) ? kAlphabet[b & 0x3F] : '=';
    }
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    std::vector<uint8_t> out;
    out.reserve((encoded.size() / 4) * 3);

    uint32_t acc = 0;
    int bits = 0;
    size_t symbols = 0;
    size_t padding = 0;

    for (unsigned char c : encoded) {
        if (c == '\n' || c == '\r' || c == ' ') continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0)
            throw MalformedInputError("base64: data after padding");
        int val = decode_char(c);
        if (val < 0)
            throw MalformedInputError("base64: invalid character");
        acc = (acc << 6) | (uint32_t)val;
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back((uint8_t)((acc >> bits) & 0xFF));
        }
    }

    if (padding > 2 || (symbols + padding) % 4 != 0 || symbols % 4 == 1)
        throw MalformedInputError("base64: truncated input");
    return out;
}
