/**
 * Node Accessor interface.
 *
 * The evaluator never owns, constructs or mutates data tree nodes. It reaches the data tree only through the
 * NodeAccessor capability below, which a storage layer implements (see block.h for the DAG-JSON implementation
 * backed by Valkey keys). A Node is an opaque handle issued by the accessor; two handles are the same node iff
 * they compare equal, and handles stay valid for the lifetime of the accessor that issued them.
 *
 * Coding Conventions & Best Practices:
 * 1. Lookups that may legitimately find nothing (missing map key, index out of range) return bool.
 * 2. Fetches that may fail (dereferencing a link) return DagselCode.
 * 3. Output parameters are placed at the end.
 */
#ifndef VALKEYDAGSELMODULE_DAGSEL_NODE_H_
#define VALKEYDAGSELMODULE_DAGSEL_NODE_H_

#include <stddef.h>
#include <stdint.h>
#include <string_view>
#include "dagsel/util.h"
#include "dagsel/memory.h"

typedef enum {
    NODE_KIND_INVALID = 0,
    NODE_KIND_NULL,
    NODE_KIND_BOOL,
    NODE_KIND_INT,
    NODE_KIND_FLOAT,
    NODE_KIND_STRING,
    NODE_KIND_BYTES,
    NODE_KIND_MAP,
    NODE_KIND_LIST,
    NODE_KIND_LINK
} NodeKind;

/* Name of the kind as used in the DAG-JSON selector form, e.g. "map". */
const char *node_kind_name(NodeKind kind);

/* Reverse of node_kind_name(). Returns false if the name is not a kind. */
bool node_kind_from_name(const std::string_view &name, NodeKind &kind);

/* Is the kind a scalar, i.e., not a map, list or link. */
inline bool node_kind_is_scalar(NodeKind kind) {
    return kind >= NODE_KIND_NULL && kind <= NODE_KIND_BYTES;
}

struct Node {
    Node() : handle(nullptr) {}
    explicit Node(const void *h) : handle(h) {}
    bool isValid() const { return handle != nullptr; }
    bool operator==(const Node &rhs) const { return handle == rhs.handle; }
    bool operator!=(const Node &rhs) const { return handle != rhs.handle; }
    const void *handle;
};

struct NodeHash {
    std::size_t operator()(const Node &n) const noexcept {
        return std::hash<const void *>{}(n.handle);
    }
};

/**
 * One child of a map or list, as enumerated by NodeAccessor::children().
 * For map entries isIndex is false and key is the member name. For list elements isIndex is true
 * and index is the position. The key view is owned by the accessor.
 */
struct NodeEntry {
    NodeEntry() : isIndex(false), key(), index(0), node() {}
    bool isIndex;
    std::string_view key;
    size_t index;
    Node node;
};

/**
 * A scalar value read from a node, or carried by a condition. Only the field matching kind is meaningful.
 * For strings and bytes, strVal is a view owned by whoever produced the Scalar.
 */
struct Scalar {
    Scalar() : kind(NODE_KIND_NULL), boolVal(false), intVal(0), floatVal(0), strVal() {}
    NodeKind kind;
    bool boolVal;
    int64_t intVal;
    double floatVal;
    std::string_view strVal;

    bool isNumber() const { return kind == NODE_KIND_INT || kind == NODE_KIND_FLOAT; }
};

class NodeAccessor {
 public:
    virtual ~NodeAccessor() {}

    virtual NodeKind kind(const Node &node) const = 0;

    /* Child of a map by key. Returns false if the node is not a map or has no such key. */
    virtual bool child(const Node &node, const std::string_view &key, Node &out) const = 0;

    /* Element of a list by index. Returns false if the node is not a list or the index is out of range. */
    virtual bool element(const Node &node, size_t index, Node &out) const = 0;

    /* Number of entries of a map or list, 0 for any other kind. */
    virtual size_t length(const Node &node) const = 0;

    /* All children of a map (in insertion order) or list (in index order). Empty for any other kind. */
    virtual void children(const Node &node, dsel::vector<NodeEntry> &entries) const = 0;

    /* Resolve a link to the root node of its target. May be slow, and may fail. */
    virtual DagselCode dereference(const Node &link, Node &out) = 0;

    /* Read a scalar value. Returns false if the node is not a scalar. */
    virtual bool scalar(const Node &node, Scalar &out) const = 0;
};

#endif  // VALKEYDAGSELMODULE_DAGSEL_NODE_H_
