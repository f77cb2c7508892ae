#include "dagsel/block.h"
#include <cstring>
#include "dagsel/dagsel.h"

extern "C" {
#define VALKEYMODULE_EXPERIMENTAL_API
#include <valkeymodule.h>
}

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

/*
 * There is only one instance of the allocator. Every document and value is handed &allocator.
 */
RapidJsonAllocator allocator;

RapidJsonAllocator::RapidJsonAllocator() {
    ValkeyModule_Assert(this == &allocator);
}

/*
 * SAX handler that forwards every event to the document being built, and terminates the parse when arrays
 * and objects nest deeper than the limit.
 */
class DepthLimitHandler {
 public:
    DepthLimitHandler(RJParser &d, size_t limit) : doc(d), depth(0), maxDepth(limit) {}

    bool Null() { return doc.Null(); }
    bool Bool(bool b) { return doc.Bool(b); }
    bool Int(int i) { return doc.Int(i); }
    bool Uint(unsigned i) { return doc.Uint(i); }
    bool Int64(int64_t i) { return doc.Int64(i); }
    bool Uint64(uint64_t i) { return doc.Uint64(i); }
    bool Double(double d) { return doc.Double(d); }
    bool RawNumber(const char *str, rapidjson::SizeType len, bool copy) { return doc.RawNumber(str, len, copy); }
    bool String(const char *str, rapidjson::SizeType len, bool copy) { return doc.String(str, len, copy); }
    bool Key(const char *str, rapidjson::SizeType len, bool copy) { return doc.Key(str, len, copy); }

    bool StartObject() { return enter() && doc.StartObject(); }
    bool EndObject(rapidjson::SizeType count) { depth--; return doc.EndObject(count); }
    bool StartArray() { return enter() && doc.StartArray(); }
    bool EndArray(rapidjson::SizeType count) { depth--; return doc.EndArray(count); }

 private:
    bool enter() { return ++depth <= maxDepth; }

    RJParser &doc;
    size_t depth;
    size_t maxDepth;
};

/*
 * Generator handed to RJParser::Populate. Populate keeps the value on success and frees the partial tree
 * on failure.
 */
struct DepthLimitedReader {
    const char *json;
    size_t len;
    size_t maxDepth;
    rapidjson::ParseResult result;

    bool operator()(RJParser &doc) {
        DepthLimitHandler handler(doc, maxDepth);
        rapidjson::MemoryStream ms(json, len);
        rapidjson::EncodedInputStream<rapidjson::UTF8<>, rapidjson::MemoryStream> is(ms);
        rapidjson::GenericReader<rapidjson::UTF8<>, rapidjson::UTF8<>, RapidJsonAllocator> reader(&allocator);
        result = reader.Parse<rapidjson::kParseIterativeFlag>(is, handler);
        return !result.IsError();
    }
};

JParser& JParser::Parse(const char *json, size_t len, size_t max_depth) {
    DepthLimitedReader gen = {json, len, max_depth, rapidjson::ParseResult()};
    Populate(gen);
    depthLimited = true;
    depthResult = gen.result;
    return *this;
}

DagselCode block_parse(const char *json_buf, const size_t buf_len, JBlock **block) {
    *block = nullptr;
    JParser parser;
    if (parser.Parse(json_buf, buf_len, dagsel_get_max_block_depth()).HasParseError()) {
        ValkeyModule_Log(nullptr, "debug", "block parse error at offset %zu: %s",
                         parser.GetErrorOffset(), parser.GetParseErrorMessage());
        return parser.GetParseErrorCode();
    }
    JBlock *b = new JBlock();
    b->SetJValue(parser.GetJValue());
    b->size = buf_len;
    *block = b;
    return DAGSEL_SUCCESS;
}

void block_destroy(JBlock *block) {
    delete block;
}

/*
 * A single member object keyed "/" is either a link or bytes. Anything else under "/" is a plain map.
 */
STATIC const JValue *slash_member(const JValue &val) {
    if (!val.IsObject() || val.MemberCount() != 1) return nullptr;
    JValue::ConstMemberIterator it = val.MemberBegin();
    if (it->name.GetStringLength() != 1 || it->name.GetString()[0] != '/') return nullptr;
    return &it->value;
}

STATIC const JValue *bytes_member(const JValue &val) {
    const JValue *slash = slash_member(val);
    if (slash == nullptr || !slash->IsObject() || slash->MemberCount() != 1) return nullptr;
    JValue::ConstMemberIterator it = slash->MemberBegin();
    if (it->name.GetStringLength() != 5 || std::memcmp(it->name.GetString(), "bytes", 5) != 0) return nullptr;
    if (!it->value.IsString()) return nullptr;
    return &it->value;
}

NodeKind block_value_kind(const JValue &val) {
    switch (val.GetType()) {
        case rapidjson::kNullType:
            return NODE_KIND_NULL;
        case rapidjson::kFalseType:
        case rapidjson::kTrueType:
            return NODE_KIND_BOOL;
        case rapidjson::kNumberType:
            return val.IsInt64() ? NODE_KIND_INT : NODE_KIND_FLOAT;
        case rapidjson::kStringType:
            return NODE_KIND_STRING;
        case rapidjson::kArrayType:
            return NODE_KIND_LIST;
        case rapidjson::kObjectType: {
            const JValue *slash = slash_member(val);
            if (slash != nullptr && slash->IsString()) return NODE_KIND_LINK;
            if (bytes_member(val) != nullptr) return NODE_KIND_BYTES;
            return NODE_KIND_MAP;
        }
        default:
            return NODE_KIND_INVALID;
    }
}

bool block_link_target(const JValue &val, std::string_view &key) {
    const JValue *slash = slash_member(val);
    if (slash == nullptr || !slash->IsString()) return false;
    key = std::string_view(slash->GetString(), slash->GetStringLength());
    return true;
}

void block_serialize_value(const JValue &val, rapidjson::StringBuffer &oss) {
    rapidjson::Writer<rapidjson::StringBuffer> writer(oss);
    val.Accept(writer);
}

DagJsonAccessor::~DagJsonAccessor() {
    for (auto &b : blocks) {
        block_destroy(b.second);
    }
    blocks.clear();
}

DagselCode DagJsonAccessor::loadBlock(const std::string_view &key, JBlock **block) {
    dsel::string k(key.data(), key.length());
    auto it = blocks.find(k);
    if (it != blocks.end()) {
        *block = it->second;
        return DAGSEL_SUCCESS;
    }
    std::string_view json;
    DagselCode rc = source.read(key, json);
    if (rc != DAGSEL_SUCCESS) return rc;
    JBlock *b = nullptr;
    rc = block_parse(json.data(), json.length(), &b);
    if (rc == DAGSEL_BLOCK_DEPTH_LIMIT_EXCEEDED) {
        ValkeyModule_Log(nullptr, "debug", "block %.*s nests too deep",
                         static_cast<int>(key.length()), key.data());
        return rc;
    }
    if (rc != DAGSEL_SUCCESS) {
        ValkeyModule_Log(nullptr, "debug", "block %.*s is not valid DAG-JSON",
                         static_cast<int>(key.length()), key.data());
        return DAGSEL_BLOCK_PARSE_ERROR;
    }
    blocks.emplace(k, b);
    numBlocksLoaded++;
    *block = b;
    return DAGSEL_SUCCESS;
}

DagselCode DagJsonAccessor::load(const std::string_view &key, Node &root) {
    JBlock *b = nullptr;
    DagselCode rc = loadBlock(key, &b);
    if (rc != DAGSEL_SUCCESS) return rc;
    root = toNode(b->GetJValue());
    return DAGSEL_SUCCESS;
}

NodeKind DagJsonAccessor::kind(const Node &node) const {
    if (!node.isValid()) return NODE_KIND_INVALID;
    return block_value_kind(*toValue(node));
}

bool DagJsonAccessor::child(const Node &node, const std::string_view &key, Node &out) const {
    if (kind(node) != NODE_KIND_MAP) return false;
    const JValue *v = toValue(node);
    for (JValue::ConstMemberIterator m = v->MemberBegin(); m != v->MemberEnd(); ++m) {
        if (std::string_view(m->name.GetString(), m->name.GetStringLength()) == key) {
            out = toNode(m->value);
            return true;
        }
    }
    return false;
}

bool DagJsonAccessor::element(const Node &node, size_t index, Node &out) const {
    if (kind(node) != NODE_KIND_LIST) return false;
    const JValue *v = toValue(node);
    if (index >= v->Size()) return false;
    out = toNode((*v)[static_cast<rapidjson::SizeType>(index)]);
    return true;
}

size_t DagJsonAccessor::length(const Node &node) const {
    switch (kind(node)) {
        case NODE_KIND_MAP:
            return toValue(node)->MemberCount();
        case NODE_KIND_LIST:
            return toValue(node)->Size();
        default:
            return 0;
    }
}

void DagJsonAccessor::children(const Node &node, dsel::vector<NodeEntry> &entries) const {
    entries.clear();
    const JValue *v = toValue(node);
    switch (kind(node)) {
        case NODE_KIND_MAP:
            entries.reserve(v->MemberCount());
            for (JValue::ConstMemberIterator m = v->MemberBegin(); m != v->MemberEnd(); ++m) {
                NodeEntry e;
                e.key = std::string_view(m->name.GetString(), m->name.GetStringLength());
                e.node = toNode(m->value);
                entries.push_back(e);
            }
            break;
        case NODE_KIND_LIST:
            entries.reserve(v->Size());
            for (rapidjson::SizeType i = 0; i < v->Size(); i++) {
                NodeEntry e;
                e.isIndex = true;
                e.index = i;
                e.node = toNode((*v)[i]);
                entries.push_back(e);
            }
            break;
        default:
            break;
    }
}

DagselCode DagJsonAccessor::dereference(const Node &link, Node &out) {
    std::string_view key;
    if (!link.isValid() || !block_link_target(*toValue(link), key)) return DAGSEL_NOT_A_LINK;
    DagselCode rc = load(key, out);
    if (rc == DAGSEL_BLOCK_KEY_NOT_FOUND) return DAGSEL_LINK_TARGET_NOT_FOUND;
    return rc;
}

bool DagJsonAccessor::scalar(const Node &node, Scalar &out) const {
    NodeKind k = kind(node);
    if (!node_kind_is_scalar(k)) return false;
    const JValue *v = toValue(node);
    out = Scalar();
    out.kind = k;
    switch (k) {
        case NODE_KIND_BOOL:
            out.boolVal = v->GetBool();
            break;
        case NODE_KIND_INT:
            out.intVal = v->GetInt64();
            break;
        case NODE_KIND_FLOAT:
            out.floatVal = v->GetDouble();
            break;
        case NODE_KIND_STRING:
            out.strVal = std::string_view(v->GetString(), v->GetStringLength());
            break;
        case NODE_KIND_BYTES: {
            const JValue *b = bytes_member(*v);
            out.strVal = std::string_view(b->GetString(), b->GetStringLength());
            break;
        }
        default:
            break;
    }
    return true;
}

void DagJsonAccessor::serialize(const Node &node, rapidjson::StringBuffer &oss) const {
    block_serialize_value(*toValue(node), oss);
}
