#include "dagsel/node.h"

static const char *kind_names[] = {
    "invalid", "null", "bool", "int", "float", "string", "bytes", "map", "list", "link"
};

const char *node_kind_name(NodeKind kind) {
    ValkeyModule_Assert(kind >= NODE_KIND_INVALID && kind <= NODE_KIND_LINK);
    return kind_names[kind];
}

bool node_kind_from_name(const std::string_view &name, NodeKind &kind) {
    for (int k = NODE_KIND_NULL; k <= NODE_KIND_LINK; k++) {
        if (name == kind_names[k]) {
            kind = static_cast<NodeKind>(k);
            return true;
        }
    }
    return false;
}
