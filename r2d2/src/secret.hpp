#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <openssl/crypto.h>

// Byte buffer that is wiped with OPENSSL_cleanse when it dies or is
// overwritten. Holds decrypted private halves, session keys and content keys.
class SecretBytes {
public:
    SecretBytes() = default;
    explicit SecretBytes(size_t n) : data_(n, 0) {}
    SecretBytes(const uint8_t* p, size_t n) : data_(p, p + n) {}
    explicit SecretBytes(std::vector<uint8_t>&& v) : data_(std::move(v)) {}

    SecretBytes(const SecretBytes& o) : data_(o.data_) {}
    SecretBytes(SecretBytes&& o) noexcept : data_(std::move(o.data_)) { o.data_.clear(); }

    SecretBytes& operator=(const SecretBytes& o) {
        if (this != &o) {
            wipe();
            data_ = o.data_;
        }
        return *this;
    }

    SecretBytes& operator=(SecretBytes&& o) noexcept {
        if (this != &o) {
            wipe();
            data_ = std::move(o.data_);
            o.data_.clear();
        }
        return *this;
    }

    ~SecretBytes() { wipe(); }

    uint8_t*       data()       { return data_.data(); }
    const uint8_t* data() const { return data_.data(); }
    size_t size() const  { return data_.size(); }
    bool   empty() const { return data_.empty(); }

    const std::vector<uint8_t>& bytes() const { return data_; }

    void wipe() {
        if (!data_.empty())
            OPENSSL_cleanse(data_.data(), data_.size());
        data_.clear();
    }

    bool operator==(const SecretBytes& o) const {
        return data_.size() == o.data_.size() &&
               CRYPTO_memcmp(data_.data(), o.data_.data(), data_.size()) == 0;
    }
    bool operator!=(const SecretBytes& o) const { return !(*this == o); }

private:
    std::vector<uint8_t> data_;
};

// Text secret (root secret, base64 session key). Same wiping rules.
class SecretString {
public:
    SecretString() = default;
    explicit SecretString(std::string s) : s_(std::move(s)) {}

    SecretString(const SecretString& o) : s_(o.s_) {}
    SecretString(SecretString&& o) noexcept : s_(std::move(o.s_)) { o.s_.clear(); }

    SecretString& operator=(const SecretString& o) {
        if (this != &o) {
            wipe();
            s_ = o.s_;
        }
        return *this;
    }

    SecretString& operator=(SecretString&& o) noexcept {
        if (this != &o) {
            wipe();
            s_ = std::move(o.s_);
            o.s_.clear();
        }
        return *this;
    }

    ~SecretString() { wipe(); }

    const std::string& str() const { return s_; }
    bool empty() const { return s_.empty(); }

    void wipe() {
        if (!s_.empty())
            OPENSSL_cleanse(&s_[0], s_.size());
        s_.clear();
    }

    bool operator==(const SecretString& o) const {
        return s_.size() == o.s_.size() &&
               CRYPTO_memcmp(s_.data(), o.s_.data(), s_.size()) == 0;
    }
    bool operator!=(const SecretString& o) const { return !(*this == o); }

private:
    std::string s_;
};

// A node's session key: the password that seals its children.
using SessionKey = SecretString;
