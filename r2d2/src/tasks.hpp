#pragma once
#include "errors.hpp"
#include "key_packet.hpp"
#include "name_cipher.hpp"
#include "node.hpp"
#include "node_key.hpp"
#include "node_keygen.hpp"
#include "node_resolver.hpp"
#include "secret.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class TaskType {
    UnlockNode,               // ResolveRequest        -> UnlockedNode
    UnsealKeyPacket,          // UnsealPacketRequest   -> KeyPacket
    SealKeyPacket,            // SealPacketRequest     -> std::string
    UnsealContentKey,         // ContentKeyRequest     -> SecretBytes
    DecryptBlock,             // BlockRequest          -> std::vector<uint8_t>
    EncryptBlock,             // BlockRequest          -> std::vector<uint8_t>
    DecryptThumbnail,         // BlockRequest          -> std::vector<uint8_t>
    EncryptName,              // EncryptNameRequest    -> EncryptedName
    DecryptName,              // DecryptNameRequest    -> std::string
    GenerateNodeKeys,         // GenerateRequest       -> GeneratedKeys
    PrepareMove,              // MoveRequest           -> MoveResult
    VerifyItemIntegrity,      // IntegrityRequest      -> bool
    VerifyRootItemIntegrity   // RootIntegrityRequest  -> bool
};

const char* task_type_str(TaskType t);

// ── Payloads ─────────────────────────────────────────────────────────────────

struct ResolveRequest {
    ParentContext  parent;
    NodeDescriptor node;
    ResolveOptions options;
};

struct UnsealPacketRequest {
    std::string packet;
    SessionKey  secret;
};

struct SealPacketRequest {
    KeyPacket  packet;
    SessionKey secret;
    uint32_t   iterations = S2K_DEFAULT_ITERATIONS;
};

struct ContentKeyRequest {
    std::string           packet;
    node_key::UnlockedKey file_key;
};

// DecryptThumbnail ignores `index` and `last`. `last` marks the final block
// of a body.
struct BlockRequest {
    SecretBytes          key;
    uint64_t             index = 0;
    std::vector<uint8_t> data;
    bool                 last  = false;
};

struct EncryptNameRequest {
    std::string         name;
    node_key::PublicKey key;
};

// Empty placeholder: failure is an error result. Otherwise the placeholder
// is returned in its place.
struct DecryptNameRequest {
    std::string           ciphertext;
    node_key::UnlockedKey key;
    std::string           placeholder;
};

struct IntegrityRequest {
    NodeDescriptor      item;
    node_key::PublicKey parent;
};

struct RootIntegrityRequest {
    NodeDescriptor root;
};

using TaskPayload = std::variant<
    ResolveRequest,
    UnsealPacketRequest,
    SealPacketRequest,
    ContentKeyRequest,
    BlockRequest,
    EncryptNameRequest,
    DecryptNameRequest,
    GenerateRequest,
    MoveRequest,
    IntegrityRequest,
    RootIntegrityRequest>;

// ── Results ──────────────────────────────────────────────────────────────────

using TaskValue = std::variant<
    std::monostate,
    UnlockedNode,
    KeyPacket,
    std::string,
    SecretBytes,
    std::vector<uint8_t>,
    name_cipher::EncryptedName,
    GeneratedKeys,
    MoveResult,
    bool>;

struct TaskError {
    ErrorKind   kind = ErrorKind::Internal;
    std::string message;
};

struct TaskResult {
    uint64_t  request_id = 0;
    TaskType  type = TaskType::UnlockNode;
    bool      ok = false;
    TaskValue value;
    TaskError error;      // when !ok
};

// Runs one task on the calling thread. Throws whatever the operation throws;
// a payload that does not fit the task type is a MalformedInputError.
TaskValue run_task(TaskType type, const TaskPayload& payload);
