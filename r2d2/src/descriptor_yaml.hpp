#pragma once
#include "node.hpp"
#include <string>

// Node descriptors on disk, as the node cache hands them over:
//
//   type: node
//   id: lmn3k2x0-4fz81qpa
//   kind: folder
//   owner: alice@example.com
//   node-key: |
//     -----BEGIN R2D2 PRIVATE KEY BLOCK-----
//     ...
//   node-passphrase: |
//   node-passphrase-signature: |     (optional)
//   name: |                          (optional)
//   content-key-packet: |            (files)
//   content-key-signature: |         (files)
//   xattrs: |                        (optional)
//
// Armored values round-trip byte for byte; signatures cover that text.

std::string    emit_descriptor_yaml(const NodeDescriptor& d);
NodeDescriptor parse_descriptor_yaml(const std::string& text);
NodeDescriptor load_descriptor_yaml(const std::string& path);
