#pragma once
#include <stdexcept>
#include <string>

// Failure classes surfaced by the key-chain code. Anything else thrown by the
// crypto glue (allocation, RNG) stays a plain std::runtime_error.
enum class ErrorKind {
    Decryption,           // ciphertext unreadable or wrong key
    SignatureInvalid,     // signature present but cryptographically wrong
    IdentityMismatch,     // signature valid, signer or identity unexpected
    PacketChainMismatch,  // parentKeyPacketId does not name the packet used
    Malformed,            // structurally invalid packet or ciphertext
    Internal              // anything outside the taxonomy
};

const char* error_kind_str(ErrorKind k);

class CryptoError : public std::runtime_error {
public:
    CryptoError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& what)
        : CryptoError(ErrorKind::Decryption, what) {}
};

class SignatureInvalidError : public CryptoError {
public:
    explicit SignatureInvalidError(const std::string& what)
        : CryptoError(ErrorKind::SignatureInvalid, what) {}
};

class IdentityMismatchError : public CryptoError {
public:
    explicit IdentityMismatchError(const std::string& what)
        : CryptoError(ErrorKind::IdentityMismatch, what) {}
};

class PacketChainMismatchError : public CryptoError {
public:
    explicit PacketChainMismatchError(const std::string& what)
        : CryptoError(ErrorKind::PacketChainMismatch, what) {}
};

class MalformedInputError : public CryptoError {
public:
    explicit MalformedInputError(const std::string& what)
        : CryptoError(ErrorKind::Malformed, what) {}
};
