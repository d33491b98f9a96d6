#include "integrity.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "node_resolver.hpp"
#include "signature.hpp"

namespace integrity {

bool verify_item_integrity(const NodeDescriptor& item, const node_key::PublicKey& parent) {
    bool has_pp = !item.node_passphrase_signature.empty();
    bool has_ck = !item.content_key_signature.empty();
    if (!has_pp && !has_ck)
        return false;

    bool ok = true;
    if (has_pp) {
        signature::Verdict v = node_resolver::check_passphrase(item, parent);
        if (v != signature::Verdict::Valid) {
            logging::info("item " + item.id + ": passphrase signature " +
                          signature::verdict_str(v));
            ok = false;
        }
    }
    if (has_ck) {
        signature::Verdict v = signature::check(item.content_key_packet,
                                                item.content_key_signature,
                                                parent, parent.key_id,
                                                item.owner_email);
        if (v != signature::Verdict::Valid) {
            logging::info("item " + item.id + ": content key signature " +
                          signature::verdict_str(v));
            ok = false;
        }
    }
    return ok;
}

bool verify_root_item_integrity(const NodeDescriptor& root) {
    if (root.node_passphrase_signature.empty())
        return false;

    node_key::PublicKey own;
    try {
        own = node_key::read_public(root.node_key);
    } catch (const MalformedInputError& e) {
        logging::info("root item " + root.id + ": " + e.what());
        return false;
    }
    return node_resolver::check_passphrase(root, own) == signature::Verdict::Valid;
}

} // namespace integrity
