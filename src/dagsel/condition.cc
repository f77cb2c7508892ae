#include "dagsel/condition.h"
#include <cmath>
#include <utility>

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

ConditionPtr Condition::hasField(const std::string_view &name) {
    ConditionPtr c(new Condition(HAS_FIELD));
    c->field = dsel::string(name.data(), name.length());
    return c;
}

ConditionPtr Condition::hasKind(NodeKind k) {
    ConditionPtr c(new Condition(HAS_KIND));
    c->kind = k;
    return c;
}

ConditionPtr Condition::isLink() {
    return ConditionPtr(new Condition(IS_LINK));
}

ConditionPtr Condition::withValue(Type t, const Scalar &v) {
    ConditionPtr c(new Condition(t));
    c->value = v;
    if (v.kind == NODE_KIND_STRING || v.kind == NODE_KIND_BYTES) {
        c->valueStr = dsel::string(v.strVal.data(), v.strVal.length());
        c->value.strVal = std::string_view(c->valueStr.c_str(), c->valueStr.length());
    }
    return c;
}

ConditionPtr Condition::hasValue(const Scalar &v) {
    return withValue(HAS_VALUE, v);
}

ConditionPtr Condition::greaterThan(const Scalar &v) {
    return withValue(GREATER_THAN, v);
}

ConditionPtr Condition::lessThan(const Scalar &v) {
    return withValue(LESS_THAN, v);
}

ConditionPtr Condition::allOf(dsel::vector<ConditionPtr> &&ops) {
    ConditionPtr c(new Condition(AND));
    c->operands = std::move(ops);
    return c;
}

ConditionPtr Condition::anyOf(dsel::vector<ConditionPtr> &&ops) {
    ConditionPtr c(new Condition(OR));
    c->operands = std::move(ops);
    return c;
}

Scalar Condition::nullValue() {
    return Scalar();
}

Scalar Condition::boolValue(bool b) {
    Scalar s;
    s.kind = NODE_KIND_BOOL;
    s.boolVal = b;
    return s;
}

Scalar Condition::intValue(int64_t i) {
    Scalar s;
    s.kind = NODE_KIND_INT;
    s.intVal = i;
    return s;
}

Scalar Condition::floatValue(double d) {
    Scalar s;
    s.kind = NODE_KIND_FLOAT;
    s.floatVal = d;
    return s;
}

Scalar Condition::stringValue(const std::string_view &str) {
    Scalar s;
    s.kind = NODE_KIND_STRING;
    s.strVal = str;
    return s;
}

Scalar Condition::bytesValue(const std::string_view &str) {
    Scalar s;
    s.kind = NODE_KIND_BYTES;
    s.strVal = str;
    return s;
}

size_t Condition::size() const {
    size_t n = 1;
    for (auto &op : operands) n += op->size();
    return n;
}

STATIC int compare_bytes(const std::string_view &a, const std::string_view &b) {
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

bool condition_compare_scalars(const Scalar &a, const Scalar &b, int &cmp) {
    if (a.isNumber() && b.isNumber()) {
        if ((a.kind == NODE_KIND_FLOAT && std::isnan(a.floatVal)) ||
            (b.kind == NODE_KIND_FLOAT && std::isnan(b.floatVal)))
            return false;
        if (a.kind == NODE_KIND_INT && b.kind == NODE_KIND_INT) {
            cmp = a.intVal < b.intVal ? -1 : (a.intVal > b.intVal ? 1 : 0);
        } else if (a.kind == NODE_KIND_INT) {
            cmp = dagselutil_compare_int64_double(a.intVal, b.floatVal);
        } else if (b.kind == NODE_KIND_INT) {
            cmp = -dagselutil_compare_int64_double(b.intVal, a.floatVal);
        } else {
            cmp = dagselutil_compare_double(a.floatVal, b.floatVal);
        }
        return true;
    }
    if ((a.kind == NODE_KIND_STRING && b.kind == NODE_KIND_STRING) ||
        (a.kind == NODE_KIND_BYTES && b.kind == NODE_KIND_BYTES)) {
        cmp = compare_bytes(a.strVal, b.strVal);
        return true;
    }
    return false;
}

STATIC bool scalar_equals(const Scalar &a, const Scalar &b) {
    if (a.kind == NODE_KIND_NULL || b.kind == NODE_KIND_NULL) return a.kind == b.kind;
    if (a.kind == NODE_KIND_BOOL || b.kind == NODE_KIND_BOOL)
        return a.kind == b.kind && a.boolVal == b.boolVal;
    int cmp;
    return condition_compare_scalars(a, b, cmp) && cmp == 0;
}

DagselCode ConditionEngine::evaluate(const Condition &cond, const Node &node, bool &result) {
    numEvaluations++;
    if (scope == BUDGET_PER_CONDITION) remaining = budget;
    return eval(cond, node, result);
}

DagselCode ConditionEngine::eval(const Condition &cond, const Node &node, bool &result) {
    if (remaining == 0) return DAGSEL_CONDITION_BUDGET_EXCEEDED;
    remaining--;
    unitsUsed++;

    result = false;
    switch (cond.type) {
        case Condition::HAS_FIELD: {
            Node child;
            result = accessor.child(node, std::string_view(cond.field.c_str(), cond.field.length()), child);
            break;
        }
        case Condition::HAS_KIND:
            result = (accessor.kind(node) == cond.kind);
            break;
        case Condition::IS_LINK:
            result = (accessor.kind(node) == NODE_KIND_LINK);
            break;
        case Condition::HAS_VALUE: {
            Scalar s;
            result = accessor.scalar(node, s) && scalar_equals(s, cond.value);
            break;
        }
        case Condition::GREATER_THAN:
        case Condition::LESS_THAN: {
            Scalar s;
            int cmp;
            if (accessor.scalar(node, s) && (s.isNumber() || s.kind == NODE_KIND_STRING) &&
                condition_compare_scalars(s, cond.value, cmp)) {
                result = (cond.type == Condition::GREATER_THAN) ? cmp > 0 : cmp < 0;
            }
            break;
        }
        case Condition::AND: {
            result = true;
            for (auto &op : cond.operands) {
                bool r;
                DagselCode rc = eval(*op, node, r);
                if (rc != DAGSEL_SUCCESS) return rc;
                if (!r) {
                    result = false;
                    break;
                }
            }
            break;
        }
        case Condition::OR: {
            result = false;
            for (auto &op : cond.operands) {
                bool r;
                DagselCode rc = eval(*op, node, r);
                if (rc != DAGSEL_SUCCESS) return rc;
                if (r) {
                    result = true;
                    break;
                }
            }
            break;
        }
        default:
            ValkeyModule_Assert(false);
    }
    return DAGSEL_SUCCESS;
}
