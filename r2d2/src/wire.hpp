#pragma once
#include "errors.hpp"
#include <vector>
#include <string>
#include <cstdint>
#include <cstring>

// Big-endian framing helpers shared by the key, message and signature blocks.

inline void push_u16be(std::vector<uint8_t>& buf, uint16_t v) {
    buf.push_back((v >> 8) & 0xFF);
    buf.push_back((v >> 0) & 0xFF);
}

inline void push_u32be(std::vector<uint8_t>& buf, uint32_t v) {
    buf.push_back((v >> 24) & 0xFF);
    buf.push_back((v >> 16) & 0xFF);
    buf.push_back((v >>  8) & 0xFF);
    buf.push_back((v >>  0) & 0xFF);
}

inline void push_bytes(std::vector<uint8_t>& buf, const uint8_t* p, size_t n) {
    buf.insert(buf.end(), p, p + n);
}

inline void push_bytes(std::vector<uint8_t>& buf, const std::vector<uint8_t>& v) {
    buf.insert(buf.end(), v.begin(), v.end());
}

// Bounds-checked cursor over an untrusted buffer. Every short read is a
// MalformedInputError tagged with `what`.
class WireReader {
public:
    WireReader(const std::vector<uint8_t>& buf, const char* what)
        : p_(buf.data()), end_(buf.data() + buf.size()), what_(what) {}

    size_t remaining() const { return (size_t)(end_ - p_); }
    const uint8_t* pos() const { return p_; }

    uint8_t u8() {
        need(1);
        return *p_++;
    }

    uint16_t u16be() {
        need(2);
        uint16_t v = (uint16_t)(((uint16_t)p_[0] << 8) | p_[1]);
        p_ += 2;
        return v;
    }

    uint32_t u32be() {
        need(4);
        uint32_t v = ((uint32_t)p_[0] << 24) | ((uint32_t)p_[1] << 16) |
                     ((uint32_t)p_[2] <<  8) | ((uint32_t)p_[3]);
        p_ += 4;
        return v;
    }

    std::vector<uint8_t> bytes(size_t n) {
        need(n);
        std::vector<uint8_t> out(p_, p_ + n);
        p_ += n;
        return out;
    }

    void copy(uint8_t* dst, size_t n) {
        need(n);
        std::memcpy(dst, p_, n);
        p_ += n;
    }

    std::vector<uint8_t> rest() {
        std::vector<uint8_t> out(p_, end_);
        p_ = end_;
        return out;
    }

    void expect_magic(const char* magic, size_t n) {
        need(n);
        if (std::memcmp(p_, magic, n) != 0)
            throw MalformedInputError(std::string(what_) + ": invalid magic");
        p_ += n;
    }

private:
    void need(size_t n) const {
        if ((size_t)(end_ - p_) < n)
            throw MalformedInputError(std::string(what_) + ": truncated");
    }

    const uint8_t* p_;
    const uint8_t* end_;
    const char*    what_;
};
