/**
 * Block layer: DAG-JSON data trees stored as blocks, and the NodeAccessor implementation over them.
 * The block layer provides the following functions:
 * 1. Parsing and validating an input DAG-JSON string buffer into a block
 * 2. Serializing a value of a block into a JSON string
 * 3. Classifying values into data model kinds (links and bytes are maps of a special shape in DAG-JSON)
 * 4. DagJsonAccessor: the NodeAccessor that loads blocks on demand from a BlockSource and follows links
 *
 * DAG-JSON conventions:
 *   {"/": "<key>"}                 a link to the block stored under <key>
 *   {"/": {"bytes": "<base64>"}}   a bytes value. The base64 text is kept as is, it is not decoded.
 *
 * Design Considerations:
 * 1. Memory management: All memory used by blocks must be handled by the block allocator.
 *    - For memories allocated by our own code:
 *      All allocations and de-allocations must be done through block_alloc, block_free and block_realloc.
 *    - For objects allocated by RapidJSON library:
 *      Our solution is to use a custom memory allocator class as template, so as to instruct RapidJSON to use
 *      the block allocator. The custom allocator works under the hood and is not exposed through this interface.
 * 2. Generally speaking, interface methods should not have Valkey module types such as ValkeyModuleCtx or
 *    ValkeyModuleString, because that would make unit tests hard to write. The Valkey backed BlockSource
 *    lives in module.cc.
 *
 * Coding Conventions & Best Practices:
 * 1. Error handling: If a method may fail, the return type should be enum DagselCode.
 * 2. Output parameters: Output parameters should be placed at the end.
 * 3. Every public interface function declared in this file should be prefixed with "block_".
 */
#ifndef VALKEYDAGSELMODULE_DAGSEL_BLOCK_H_
#define VALKEYDAGSELMODULE_DAGSEL_BLOCK_H_

#include <stdlib.h>
#include <string>
#include <string_view>
#include "dagsel/util.h"
#include "dagsel/alloc.h"
#include "dagsel/node.h"
#include "dagsel/rapidjson_includes.h"

/**
 * This is a custom allocator for RapidJSON. It delegates memory management to the block allocator, so that
 * memory allocated by the underlying RapidJSON library is tracked and reported. The class is passed into
 * rapidjson::GenericDocument and rapidjson::GenericValue as template, which is the way to tell RapidJSON to
 * use a custom allocator.
 */
class RapidJsonAllocator {
 public:
    RapidJsonAllocator();

    void *Malloc(size_t size) {
        if (size == 0) return nullptr;
        return block_alloc(size);
    }

    void *Realloc(void *originalPtr, size_t /*originalSize*/, size_t newSize) {
        return block_realloc(originalPtr, newSize);
    }

    static void Free(void *ptr) RAPIDJSON_NOEXCEPT {
        block_free(ptr);
    }

    bool operator==(const RapidJsonAllocator&) const RAPIDJSON_NOEXCEPT {
        return true;
    }

    bool operator!=(const RapidJsonAllocator&) const RAPIDJSON_NOEXCEPT {
        return false;
    }

    static const bool kNeedFree = true;
};

/**
 * Wrap the RapidJSON objects (RJxxxxx) with our own objects (Jxxxxx), to hide the details of allocators.
 *
 *  RJValue (JValue):   A JSON value, implemented as a node of a tree. Every data tree Node handed out by
 *                      DagJsonAccessor points to a JValue.
 *
 *  RJParser (JParser): Contains a JValue into which a DAG-JSON string is deserialized. Typically, a JParser
 *                      object is created on the run-time stack, filled by Parse, and the resulting JValue is
 *                      moved into a JBlock.
 *
 *  JBlock:             One parsed block. Owned by the DagJsonAccessor that loaded it.
 */
typedef rapidjson::GenericValue<rapidjson::UTF8<>, RapidJsonAllocator> RJValue;
typedef RJValue JValue;

extern RapidJsonAllocator allocator;

struct JBlock : JValue {
    JBlock() : JValue(), size(0) {}
    JValue& GetJValue() { return *this; }
    const JValue& GetJValue() const { return *this; }
    void SetJValue(JValue& rhs) { *static_cast<JValue *>(this) = rhs; }
    size_t size;    // Size of the serialized block
    void *operator new(size_t size) { return block_alloc(size); }
    void operator delete(void *ptr) { return block_free(ptr); }

 private:
    void *operator new[](size_t);       // Not defined anywhere, causes link error if used
    void operator delete[](void *);     // Not defined anywhere, causes link error if used
};

typedef rapidjson::GenericDocument<rapidjson::UTF8<>, RapidJsonAllocator> RJParser;

struct JParser : RJParser {
    JParser() : RJParser(&allocator), depthLimited(false), depthResult() {}
    // Access the contained JValue
    JValue& GetJValue() { return *this; }
    //
    // Parse iteratively, so that deeply nested input cannot overflow the C stack.
    //
    JParser& Parse(const char *json, size_t len) {
        depthLimited = false;
        RJParser::Parse<rapidjson::kParseIterativeFlag>(json, len);
        return *this;
    }
    JParser& Parse(const std::string_view &sv) { return Parse(sv.data(), sv.length()); }
    //
    // Parse iteratively and stop as soon as arrays and objects nest deeper than max_depth. Freeing and
    // serializing a value recurse once per nesting level, so a value that is kept must be bounded here.
    //
    JParser& Parse(const char *json, size_t len, size_t max_depth);
    //
    // The depth limited parse drives the reader itself, so its result is kept here instead of in the document.
    //
    bool HasParseError() const { return depthLimited ? depthResult.IsError() : RJParser::HasParseError(); }
    rapidjson::ParseErrorCode GetParseError() const {
        return depthLimited ? depthResult.Code() : RJParser::GetParseError();
    }
    size_t GetErrorOffset() const { return depthLimited ? depthResult.Offset() : RJParser::GetErrorOffset(); }
    const char *GetParseErrorMessage() const { return rapidjson::GetParseError_En(GetParseError()); }
    //
    // Translate rapidJSON parse error code into DagselCode.
    //
    DagselCode GetParseErrorCode() const {
        switch (GetParseError()) {
            case rapidjson::kParseErrorTermination:
                return DAGSEL_BLOCK_DEPTH_LIMIT_EXCEEDED;
            case rapidjson::kParseErrorNone:
                ValkeyModule_Assert(false);
                /* Fall Through, but not really */
            default:
                return DAGSEL_JSON_PARSE_ERROR;
        }
    }

 private:
    bool depthLimited;
    rapidjson::ParseResult depthResult;
};

/* Parse an input DAG-JSON string, validate syntax, and return a block.
 * The input string does not need to be NULL terminated.
 *
 * @param block - OUTPUT param, pointer to block pointer. The caller is responsible for calling
 *        block_destroy(JBlock*) to free the memory after it's consumed.
 * Arrays and objects may nest at most dagsel_get_max_block_depth() levels deep.
 *
 * @return DAGSEL_SUCCESS for success, DAGSEL_JSON_PARSE_ERROR if the input is not valid JSON,
 *         DAGSEL_BLOCK_DEPTH_LIMIT_EXCEEDED if the input nests too deep.
 */
DagselCode block_parse(const char *json_buf, const size_t buf_len, JBlock **block);

/* Free a block */
void block_destroy(JBlock *block);

/* Classify a value into the data model. */
NodeKind block_value_kind(const JValue &val);

/* If the value is a link, return its target key. */
bool block_link_target(const JValue &val, std::string_view &key);

/* Serialize a value into the given string buffer, in compact format. */
void block_serialize_value(const JValue &val, rapidjson::StringBuffer &oss);

/**
 * Where blocks come from. The module implements this over Valkey string keys. Tests implement it over
 * an in-memory map.
 */
class BlockSource {
 public:
    virtual ~BlockSource() {}

    /* Read the serialized block stored under key. The returned view must stay valid until the next
     * call to read().
     * @return DAGSEL_SUCCESS, DAGSEL_BLOCK_KEY_NOT_FOUND, DAGSEL_NOT_A_BLOCK_KEY or DAGSEL_LINK_ACCESS_DENIED
     */
    virtual DagselCode read(const std::string_view &key, std::string_view &json) = 0;
};

/**
 * NodeAccessor over DAG-JSON blocks. Blocks are loaded on first use and cached for the lifetime of the
 * accessor, so following the same link twice yields the same Node.
 */
class DagJsonAccessor : public NodeAccessor {
 public:
    explicit DagJsonAccessor(BlockSource &src)
            : source(src)
            , blocks()
            , numBlocksLoaded(0)
    {}
    ~DagJsonAccessor();

    /* Load the block stored under key and return its root node. */
    DagselCode load(const std::string_view &key, Node &root);

    NodeKind kind(const Node &node) const;
    bool child(const Node &node, const std::string_view &key, Node &out) const;
    bool element(const Node &node, size_t index, Node &out) const;
    size_t length(const Node &node) const;
    void children(const Node &node, dsel::vector<NodeEntry> &entries) const;
    DagselCode dereference(const Node &link, Node &out);
    bool scalar(const Node &node, Scalar &out) const;

    /* Serialize the value behind a node. */
    void serialize(const Node &node, rapidjson::StringBuffer &oss) const;

    size_t getNumBlocksLoaded() const { return numBlocksLoaded; }

    static const JValue *toValue(const Node &node) { return static_cast<const JValue *>(node.handle); }
    static Node toNode(const JValue &val) { return Node(&val); }

 private:
    DagJsonAccessor(const DagJsonAccessor &);  // disable copy constructor
    DagJsonAccessor& operator=(const DagJsonAccessor &);  // disable assignment operator

    DagselCode loadBlock(const std::string_view &key, JBlock **block);

    BlockSource &source;
    dsel::unordered_map<dsel::string, JBlock *> blocks;
    size_t numBlocksLoaded;
};

#endif  // VALKEYDAGSELMODULE_DAGSEL_BLOCK_H_
