#pragma once
#include "node.hpp"
#include "node_key.hpp"

// Trust badges. False when the item carries no signature at all; otherwise
// true only if every signature present verifies against the expected signer.

namespace integrity {

// Passphrase signature and, for files, content key signature, both made by
// the parent key.
bool verify_item_integrity(const NodeDescriptor& item, const node_key::PublicKey& parent);

// User node: passphrase signature made by the node's own key.
bool verify_root_item_integrity(const NodeDescriptor& root);

} // namespace integrity
