#include "node.hpp"
#include "errors.hpp"
#include <stdexcept>

std::string node_kind_str(NodeKind k) {
    switch (k) {
        case NodeKind::User:   return "user";
        case NodeKind::Share:  return "share";
        case NodeKind::Folder: return "folder";
        case NodeKind::File:   return "file";
    }
    throw std::invalid_argument("Unknown node kind");
}

NodeKind node_kind_from_str(const std::string& s) {
    if (s == "user")   return NodeKind::User;
    if (s == "share")  return NodeKind::Share;
    if (s == "folder") return NodeKind::Folder;
    if (s == "file")   return NodeKind::File;
    throw MalformedInputError("unknown node kind '" + s + "'");
}

std::string Identity::uid() const {
    return name + " <" + email + ">";
}
