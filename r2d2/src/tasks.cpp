#include "tasks.hpp"
#include "content.hpp"
#include "integrity.hpp"

const char* task_type_str(TaskType t) {
    switch (t) {
        case TaskType::UnlockNode:              return "unlock-node";
        case TaskType::UnsealKeyPacket:         return "unseal-key-packet";
        case TaskType::SealKeyPacket:           return "seal-key-packet";
        case TaskType::UnsealContentKey:        return "unseal-content-key";
        case TaskType::DecryptBlock:            return "decrypt-block";
        case TaskType::EncryptBlock:            return "encrypt-block";
        case TaskType::DecryptThumbnail:        return "decrypt-thumbnail";
        case TaskType::EncryptName:             return "encrypt-name";
        case TaskType::DecryptName:             return "decrypt-name";
        case TaskType::GenerateNodeKeys:        return "generate-node-keys";
        case TaskType::PrepareMove:             return "prepare-move";
        case TaskType::VerifyItemIntegrity:     return "verify-item-integrity";
        case TaskType::VerifyRootItemIntegrity: return "verify-root-item-integrity";
    }
    return "unknown";
}

template <typename T>
static const T& payload_as(TaskType type, const TaskPayload& payload) {
    const T* p = std::get_if<T>(&payload);
    if (!p)
        throw MalformedInputError(std::string("payload does not match task ") +
                                  task_type_str(type));
    return *p;
}

TaskValue run_task(TaskType type, const TaskPayload& payload) {
    switch (type) {
        case TaskType::UnlockNode: {
            const auto& r = payload_as<ResolveRequest>(type, payload);
            return node_resolver::resolve(r.parent, r.node, r.options);
        }
        case TaskType::UnsealKeyPacket: {
            const auto& r = payload_as<UnsealPacketRequest>(type, payload);
            return key_packet::unseal(r.packet, r.secret.str());
        }
        case TaskType::SealKeyPacket: {
            const auto& r = payload_as<SealPacketRequest>(type, payload);
            return key_packet::seal(r.packet, r.secret.str(), r.iterations);
        }
        case TaskType::UnsealContentKey: {
            const auto& r = payload_as<ContentKeyRequest>(type, payload);
            return content::unseal_content_key(r.packet, r.file_key);
        }
        case TaskType::DecryptBlock: {
            const auto& r = payload_as<BlockRequest>(type, payload);
            return content::decrypt_block(r.key, r.index, r.data, r.last);
        }
        case TaskType::EncryptBlock: {
            const auto& r = payload_as<BlockRequest>(type, payload);
            return content::encrypt_block(r.key, r.index, r.data, r.last);
        }
        case TaskType::DecryptThumbnail: {
            const auto& r = payload_as<BlockRequest>(type, payload);
            return content::decrypt_thumbnail(r.key, r.data);
        }
        case TaskType::EncryptName: {
            const auto& r = payload_as<EncryptNameRequest>(type, payload);
            return name_cipher::encrypt_name(r.name, r.key);
        }
        case TaskType::DecryptName: {
            const auto& r = payload_as<DecryptNameRequest>(type, payload);
            if (r.placeholder.empty())
                return name_cipher::decrypt_name(r.ciphertext, r.key);
            return name_cipher::decrypt_name_or(r.ciphertext, r.key, r.placeholder);
        }
        case TaskType::GenerateNodeKeys: {
            const auto& r = payload_as<GenerateRequest>(type, payload);
            return node_keygen::generate_node_keys(r);
        }
        case TaskType::PrepareMove: {
            const auto& r = payload_as<MoveRequest>(type, payload);
            return node_keygen::prepare_move(r);
        }
        case TaskType::VerifyItemIntegrity: {
            const auto& r = payload_as<IntegrityRequest>(type, payload);
            return integrity::verify_item_integrity(r.item, r.parent);
        }
        case TaskType::VerifyRootItemIntegrity: {
            const auto& r = payload_as<RootIntegrityRequest>(type, payload);
            return integrity::verify_root_item_integrity(r.root);
        }
    }
    throw std::invalid_argument("unknown task type");
}
