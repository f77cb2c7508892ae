#include "dagsel/selector.h"
#include <cstring>
#include <initializer_list>
#include <utility>
#include "dagsel/dagsel.h"
#include "dagsel/block.h"

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

const uint64_t Selector::UNBOUNDED_DEPTH;

thread_local int64_t current_depth = 0;  // decoder's recursion depth

class RecursionDepthTracker {
 public:
    RecursionDepthTracker() {
        current_depth++;
    }
    ~RecursionDepthTracker() {
        current_depth--;
    }
    bool isTooDeep() { return current_depth > static_cast<int64_t>(dagsel_get_max_parser_recursion_depth()); }
};

#define CHECK_RECURSION_DEPTH() \
    RecursionDepthTracker _rdtracker; \
    if (_rdtracker.isTooDeep()) return DAGSEL_PARSER_RECURSION_DEPTH_LIMIT_EXCEEDED;

#define CHECK_SELECTOR_SIZE(len) \
    if (len > dagsel_get_max_selector_size()) return DAGSEL_SELECTOR_SIZE_LIMIT_EXCEEDED;

SelectorPtr Selector::matcher(ConditionPtr onlyIf) {
    SelectorPtr s(new Selector(MATCHER));
    s->condition = std::move(onlyIf);
    return s;
}

SelectorPtr Selector::matcher(const std::string_view &label, ConditionPtr onlyIf) {
    SelectorPtr s = matcher(std::move(onlyIf));
    s->hasLabel = true;
    s->label = dsel::string(label.data(), label.length());
    return s;
}

SelectorPtr Selector::exploreAll(SelectorPtr next) {
    SelectorPtr s(new Selector(EXPLORE_ALL));
    s->next = std::move(next);
    return s;
}

SelectorPtr Selector::exploreFields(FieldList &&fields) {
    SelectorPtr s(new Selector(EXPLORE_FIELDS));
    s->fields = std::move(fields);
    return s;
}

SelectorPtr Selector::exploreIndex(size_t index, SelectorPtr next) {
    SelectorPtr s(new Selector(EXPLORE_INDEX));
    s->index = index;
    s->next = std::move(next);
    return s;
}

SelectorPtr Selector::exploreRange(size_t start, size_t end, SelectorPtr next) {
    SelectorPtr s(new Selector(EXPLORE_RANGE));
    s->start = start;
    s->end = end;
    s->next = std::move(next);
    return s;
}

SelectorPtr Selector::exploreRecursive(SelectorPtr sequence, uint64_t maxDepth, ConditionPtr stopAt) {
    SelectorPtr s(new Selector(EXPLORE_RECURSIVE));
    s->sequence = std::move(sequence);
    s->maxDepth = maxDepth;
    s->stopAt = std::move(stopAt);
    return s;
}

SelectorPtr Selector::exploreRecursiveEdge() {
    return SelectorPtr(new Selector(EXPLORE_RECURSIVE_EDGE));
}

SelectorPtr Selector::exploreUnion(dsel::vector<SelectorPtr> &&members) {
    SelectorPtr s(new Selector(EXPLORE_UNION));
    s->members = std::move(members);
    return s;
}

SelectorPtr Selector::exploreConditional(ConditionPtr condition, SelectorPtr next) {
    SelectorPtr s(new Selector(EXPLORE_CONDITIONAL));
    s->condition = std::move(condition);
    s->next = std::move(next);
    return s;
}

const char *Selector::typeCode(Type t) {
    switch (t) {
        case MATCHER: return ".";
        case EXPLORE_ALL: return "a";
        case EXPLORE_FIELDS: return "f";
        case EXPLORE_INDEX: return "i";
        case EXPLORE_RANGE: return "r";
        case EXPLORE_RECURSIVE: return "R";
        case EXPLORE_RECURSIVE_EDGE: return "@";
        case EXPLORE_UNION: return "|";
        case EXPLORE_CONDITIONAL: return "&";
        default:
            ValkeyModule_Assert(false);
            return "";
    }
}

/*
 * Decoder
 */

STATIC std::string_view name_of(const JValue &name) {
    return std::string_view(name.GetString(), name.GetStringLength());
}

/* A variant or condition is an object with exactly one member. */
STATIC bool single_member(const JValue &v, std::string_view &key, const JValue *&val) {
    if (!v.IsObject() || v.MemberCount() != 1) return false;
    JValue::ConstMemberIterator it = v.MemberBegin();
    key = name_of(it->name);
    val = &it->value;
    return true;
}

STATIC const JValue *find_member(const JValue &obj, const std::string_view &key) {
    for (JValue::ConstMemberIterator m = obj.MemberBegin(); m != obj.MemberEnd(); ++m) {
        if (name_of(m->name) == key) return &m->value;
    }
    return nullptr;
}

/* Check that obj is an object with no members other than the allowed ones. */
STATIC bool has_only_members(const JValue &obj, std::initializer_list<std::string_view> allowed) {
    if (!obj.IsObject()) return false;
    for (JValue::ConstMemberIterator m = obj.MemberBegin(); m != obj.MemberEnd(); ++m) {
        bool found = false;
        for (auto &a : allowed) {
            if (name_of(m->name) == a) {
                found = true;
                break;
            }
        }
        if (!found) return false;
    }
    return true;
}

STATIC bool get_size(const JValue *v, size_t &out) {
    if (v == nullptr || !v->IsUint64()) return false;
    out = static_cast<size_t>(v->GetUint64());
    return true;
}

STATIC DagselCode decode_condition(const JValue &v, ConditionPtr &out);
STATIC DagselCode decode_selector(const JValue &v, SelectorPtr &out);

STATIC DagselCode decode_scalar(const JValue &v, Scalar &out) {
    switch (block_value_kind(v)) {
        case NODE_KIND_NULL:
            out = Condition::nullValue();
            break;
        case NODE_KIND_BOOL:
            out = Condition::boolValue(v.GetBool());
            break;
        case NODE_KIND_INT:
            out = Condition::intValue(v.GetInt64());
            break;
        case NODE_KIND_FLOAT:
            out = Condition::floatValue(v.GetDouble());
            break;
        case NODE_KIND_STRING:
            out = Condition::stringValue(name_of(v));
            break;
        case NODE_KIND_BYTES: {
            const JValue &b = v.MemberBegin()->value.MemberBegin()->value;
            out = Condition::bytesValue(name_of(b));
            break;
        }
        default:
            return DAGSEL_INVALID_CONDITION;
    }
    return DAGSEL_SUCCESS;
}

STATIC DagselCode decode_operands(const JValue &v, dsel::vector<ConditionPtr> &ops) {
    if (!v.IsArray()) return DAGSEL_INVALID_CONDITION;
    for (rapidjson::SizeType i = 0; i < v.Size(); i++) {
        ConditionPtr op;
        DagselCode rc = decode_condition(v[i], op);
        if (rc != DAGSEL_SUCCESS) return rc;
        ops.push_back(std::move(op));
    }
    return DAGSEL_SUCCESS;
}

STATIC DagselCode decode_condition(const JValue &v, ConditionPtr &out) {
    CHECK_RECURSION_DEPTH();
    std::string_view key;
    const JValue *body;
    if (!single_member(v, key, body)) return DAGSEL_INVALID_CONDITION;

    if (key == "hasField") {
        if (!body->IsString()) return DAGSEL_INVALID_CONDITION;
        out = Condition::hasField(name_of(*body));
    } else if (key == "=") {
        Scalar s;
        DagselCode rc = decode_scalar(*body, s);
        if (rc != DAGSEL_SUCCESS) return rc;
        out = Condition::hasValue(s);
    } else if (key == "%") {
        if (!body->IsString()) return DAGSEL_INVALID_CONDITION;
        NodeKind k;
        if (!node_kind_from_name(name_of(*body), k)) return DAGSEL_INVALID_KIND;
        out = Condition::hasKind(k);
    } else if (key == "/") {
        if (!body->IsObject() || body->MemberCount() != 0) return DAGSEL_INVALID_CONDITION;
        out = Condition::isLink();
    } else if (key == "greaterThan" || key == "lessThan") {
        Scalar s;
        DagselCode rc = decode_scalar(*body, s);
        if (rc != DAGSEL_SUCCESS) return rc;
        if (!s.isNumber() && s.kind != NODE_KIND_STRING) return DAGSEL_INVALID_CONDITION;
        out = (key == "greaterThan") ? Condition::greaterThan(s) : Condition::lessThan(s);
    } else if (key == "and" || key == "or") {
        dsel::vector<ConditionPtr> ops;
        DagselCode rc = decode_operands(*body, ops);
        if (rc != DAGSEL_SUCCESS) return rc;
        out = (key == "and") ? Condition::allOf(std::move(ops)) : Condition::anyOf(std::move(ops));
    } else {
        return DAGSEL_INVALID_CONDITION;
    }
    return DAGSEL_SUCCESS;
}

/* Decode the required ">" (or other) member holding a nested selector. */
STATIC DagselCode decode_next(const JValue &body, const std::string_view &member, SelectorPtr &out) {
    const JValue *v = find_member(body, member);
    if (v == nullptr) return DAGSEL_INVALID_SELECTOR;
    return decode_selector(*v, out);
}

STATIC DagselCode decode_matcher(const JValue &body, SelectorPtr &out) {
    if (!has_only_members(body, {"onlyIf", "label"})) return DAGSEL_INVALID_SELECTOR;
    ConditionPtr onlyIf;
    const JValue *cond = find_member(body, "onlyIf");
    if (cond != nullptr) {
        DagselCode rc = decode_condition(*cond, onlyIf);
        if (rc != DAGSEL_SUCCESS) return rc;
    }
    const JValue *label = find_member(body, "label");
    if (label != nullptr) {
        if (!label->IsString()) return DAGSEL_INVALID_SELECTOR;
        out = Selector::matcher(name_of(*label), std::move(onlyIf));
    } else {
        out = Selector::matcher(std::move(onlyIf));
    }
    return DAGSEL_SUCCESS;
}

STATIC DagselCode decode_fields(const JValue &body, SelectorPtr &out) {
    if (!has_only_members(body, {"f>"})) return DAGSEL_INVALID_SELECTOR;
    const JValue *fields = find_member(body, "f>");
    if (fields == nullptr || !fields->IsObject()) return DAGSEL_INVALID_SELECTOR;
    Selector::FieldList list;
    dsel::unordered_set<dsel::string> seen;
    for (JValue::ConstMemberIterator m = fields->MemberBegin(); m != fields->MemberEnd(); ++m) {
        dsel::string name(m->name.GetString(), m->name.GetStringLength());
        if (!seen.insert(name).second) return DAGSEL_INVALID_SELECTOR;
        SelectorPtr sub;
        DagselCode rc = decode_selector(m->value, sub);
        if (rc != DAGSEL_SUCCESS) return rc;
        list.emplace_back(std::move(name), std::move(sub));
    }
    out = Selector::exploreFields(std::move(list));
    return DAGSEL_SUCCESS;
}

STATIC DagselCode decode_recursive(const JValue &body, SelectorPtr &out) {
    if (!has_only_members(body, {"l", ":>", "!"})) return DAGSEL_INVALID_SELECTOR;
    const JValue *limit = find_member(body, "l");
    std::string_view limitKind;
    const JValue *limitBody;
    if (limit == nullptr || !single_member(*limit, limitKind, limitBody)) return DAGSEL_INVALID_SELECTOR;
    uint64_t maxDepth;
    if (limitKind == "depth") {
        if (!limitBody->IsUint64()) return DAGSEL_INVALID_SELECTOR;
        maxDepth = limitBody->GetUint64();
    } else if (limitKind == "none") {
        if (!limitBody->IsObject() || limitBody->MemberCount() != 0) return DAGSEL_INVALID_SELECTOR;
        maxDepth = Selector::UNBOUNDED_DEPTH;
    } else {
        return DAGSEL_INVALID_SELECTOR;
    }

    SelectorPtr sequence;
    DagselCode rc = decode_next(body, ":>", sequence);
    if (rc != DAGSEL_SUCCESS) return rc;

    ConditionPtr stopAt;
    const JValue *stop = find_member(body, "!");
    if (stop != nullptr) {
        rc = decode_condition(*stop, stopAt);
        if (rc != DAGSEL_SUCCESS) return rc;
    }
    out = Selector::exploreRecursive(std::move(sequence), maxDepth, std::move(stopAt));
    return DAGSEL_SUCCESS;
}

STATIC DagselCode decode_selector(const JValue &v, SelectorPtr &out) {
    CHECK_RECURSION_DEPTH();
    std::string_view key;
    const JValue *body;
    if (!single_member(v, key, body)) return DAGSEL_INVALID_SELECTOR;
    if (key.length() != 1) return DAGSEL_INVALID_SELECTOR;

    DagselCode rc;
    switch (key[0]) {
        case '.':
            return decode_matcher(*body, out);
        case 'a': {
            if (!has_only_members(*body, {">"})) return DAGSEL_INVALID_SELECTOR;
            SelectorPtr next;
            if ((rc = decode_next(*body, ">", next)) != DAGSEL_SUCCESS) return rc;
            out = Selector::exploreAll(std::move(next));
            return DAGSEL_SUCCESS;
        }
        case 'f':
            return decode_fields(*body, out);
        case 'i': {
            if (!has_only_members(*body, {"i", ">"})) return DAGSEL_INVALID_SELECTOR;
            size_t index;
            if (!get_size(find_member(*body, "i"), index)) return DAGSEL_INVALID_SELECTOR;
            SelectorPtr next;
            if ((rc = decode_next(*body, ">", next)) != DAGSEL_SUCCESS) return rc;
            out = Selector::exploreIndex(index, std::move(next));
            return DAGSEL_SUCCESS;
        }
        case 'r': {
            if (!has_only_members(*body, {"^", "$", ">"})) return DAGSEL_INVALID_SELECTOR;
            size_t start, end;
            if (!get_size(find_member(*body, "^"), start) || !get_size(find_member(*body, "$"), end))
                return DAGSEL_INVALID_SELECTOR;
            if (start > end) return DAGSEL_INVALID_SELECTOR;
            SelectorPtr next;
            if ((rc = decode_next(*body, ">", next)) != DAGSEL_SUCCESS) return rc;
            out = Selector::exploreRange(start, end, std::move(next));
            return DAGSEL_SUCCESS;
        }
        case 'R':
            return decode_recursive(*body, out);
        case '@':
            if (!body->IsObject() || body->MemberCount() != 0) return DAGSEL_INVALID_SELECTOR;
            out = Selector::exploreRecursiveEdge();
            return DAGSEL_SUCCESS;
        case '|': {
            if (!body->IsArray()) return DAGSEL_INVALID_SELECTOR;
            dsel::vector<SelectorPtr> members;
            for (rapidjson::SizeType i = 0; i < body->Size(); i++) {
                SelectorPtr m;
                if ((rc = decode_selector((*body)[i], m)) != DAGSEL_SUCCESS) return rc;
                members.push_back(std::move(m));
            }
            out = Selector::exploreUnion(std::move(members));
            return DAGSEL_SUCCESS;
        }
        case '&': {
            if (!has_only_members(*body, {"&", ">"})) return DAGSEL_INVALID_SELECTOR;
            const JValue *cond = find_member(*body, "&");
            if (cond == nullptr) return DAGSEL_INVALID_SELECTOR;
            ConditionPtr condition;
            if ((rc = decode_condition(*cond, condition)) != DAGSEL_SUCCESS) return rc;
            SelectorPtr next;
            if ((rc = decode_next(*body, ">", next)) != DAGSEL_SUCCESS) return rc;
            out = Selector::exploreConditional(std::move(condition), std::move(next));
            return DAGSEL_SUCCESS;
        }
        default:
            return DAGSEL_INVALID_SELECTOR;
    }
}

DagselCode dagsel_parse_selector(const char *buf, const size_t len, SelectorPtr &selector) {
    CHECK_SELECTOR_SIZE(len);
    JParser parser;
    if (parser.Parse(buf, len).HasParseError()) {
        ValkeyModule_Log(nullptr, "debug", "selector parse error at offset %zu: %s",
                         parser.GetErrorOffset(), parser.GetParseErrorMessage());
        return DAGSEL_SELECTOR_PARSE_ERROR;
    }
    SelectorPtr s;
    DagselCode rc = decode_selector(parser.GetJValue(), s);
    if (rc != DAGSEL_SUCCESS) {
        ValkeyModule_Log(nullptr, "debug", "invalid selector: %s", dagselutil_code_to_message(rc));
        return rc;
    }
    selector = std::move(s);
    return DAGSEL_SUCCESS;
}

DagselCode dagsel_parse_condition(const char *buf, const size_t len, ConditionPtr &condition) {
    CHECK_SELECTOR_SIZE(len);
    JParser parser;
    if (parser.Parse(buf, len).HasParseError()) return DAGSEL_SELECTOR_PARSE_ERROR;
    ConditionPtr c;
    DagselCode rc = decode_condition(parser.GetJValue(), c);
    if (rc != DAGSEL_SUCCESS) return rc;
    condition = std::move(c);
    return DAGSEL_SUCCESS;
}
