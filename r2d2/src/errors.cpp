#include "errors.hpp"

const char* error_kind_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::Decryption:          return "decryption";
        case ErrorKind::SignatureInvalid:    return "signature-invalid";
        case ErrorKind::IdentityMismatch:    return "identity-mismatch";
        case ErrorKind::PacketChainMismatch: return "packet-chain-mismatch";
        case ErrorKind::Malformed:           return "malformed";
        case ErrorKind::Internal:            return "internal";
    }
    return "internal";
}
