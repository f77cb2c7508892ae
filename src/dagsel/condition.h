/**
 * Condition Engine.
 *
 * A Condition is a small predicate over a single node, used by ExploreConditional, by Matcher.onlyIf and by
 * ExploreRecursive.stopAt. The variant set is closed:
 *
 *   HAS_FIELD(name)       node is a map and has key name
 *   HAS_VALUE(v)          node is a scalar equal to v. Numbers compare numerically across int and float,
 *                         bytes compare only with bytes.
 *   HAS_KIND(k)           node kind is k
 *   IS_LINK               node is a link. The link is not dereferenced.
 *   GREATER_THAN(v)       node > v, numeric when both are numbers, byte-wise when both are strings
 *   LESS_THAN(v)          node < v, same rules as GREATER_THAN
 *   AND(c1, c2, ...)      left to right, short circuit, empty AND is true
 *   OR(c1, c2, ...)       left to right, short circuit, empty OR is false
 *
 * Evaluation is metered: every predicate node that is actually reached, including each AND/OR operand, costs
 * one unit. When the budget runs out the evaluation fails with DAGSEL_CONDITION_BUDGET_EXCEEDED before any
 * boolean is produced. The budget is either refilled for each top level evaluation (BUDGET_PER_CONDITION) or
 * shared by every evaluation of one traversal (BUDGET_PER_TRAVERSAL).
 */
#ifndef VALKEYDAGSELMODULE_DAGSEL_CONDITION_H_
#define VALKEYDAGSELMODULE_DAGSEL_CONDITION_H_

#include <stddef.h>
#include <stdint.h>
#include <memory>
#include <string_view>
#include "dagsel/util.h"
#include "dagsel/memory.h"
#include "dagsel/node.h"

struct Condition;
typedef std::unique_ptr<Condition> ConditionPtr;

struct Condition {
    typedef enum {
        HAS_FIELD = 0,
        HAS_VALUE,
        HAS_KIND,
        IS_LINK,
        GREATER_THAN,
        LESS_THAN,
        AND,
        OR
    } Type;

    explicit Condition(Type t)
            : type(t)
            , field()
            , value()
            , valueStr()
            , kind(NODE_KIND_INVALID)
            , operands()
    {}

    Type type;
    dsel::string field;                 // HAS_FIELD
    Scalar value;                       // HAS_VALUE, GREATER_THAN, LESS_THAN
    dsel::string valueStr;              // owns value.strVal
    NodeKind kind;                      // HAS_KIND
    dsel::vector<ConditionPtr> operands;  // AND, OR

    static ConditionPtr hasField(const std::string_view &name);
    static ConditionPtr hasKind(NodeKind k);
    static ConditionPtr isLink();
    static ConditionPtr hasValue(const Scalar &v);
    static ConditionPtr greaterThan(const Scalar &v);
    static ConditionPtr lessThan(const Scalar &v);
    static ConditionPtr allOf(dsel::vector<ConditionPtr> &&ops);
    static ConditionPtr anyOf(dsel::vector<ConditionPtr> &&ops);

    // Scalar helpers for the builders above
    static Scalar nullValue();
    static Scalar boolValue(bool b);
    static Scalar intValue(int64_t i);
    static Scalar floatValue(double d);
    static Scalar stringValue(const std::string_view &s);
    static Scalar bytesValue(const std::string_view &s);

    /* Number of predicate nodes in the tree. */
    size_t size() const;

    void *operator new(size_t size) { return memory_alloc(size); }
    void operator delete(void *ptr) { memory_free(ptr); }

 private:
    Condition(const Condition &);  // disable copy constructor
    Condition& operator=(const Condition &);  // disable assignment operator

    static ConditionPtr withValue(Type t, const Scalar &v);
};

class ConditionEngine {
 public:
    typedef enum {
        BUDGET_PER_CONDITION = 0,
        BUDGET_PER_TRAVERSAL
    } BudgetScope;

    ConditionEngine(const NodeAccessor &acc, size_t budgetUnits, BudgetScope budgetScope = BUDGET_PER_CONDITION)
            : accessor(acc)
            , budget(budgetUnits)
            , scope(budgetScope)
            , remaining(budgetUnits)
            , numEvaluations(0)
            , unitsUsed(0)
    {}

    /**
     * Evaluate a condition against a node.
     * @param result OUTPUT param, only meaningful if DAGSEL_SUCCESS is returned.
     * @return DAGSEL_SUCCESS or DAGSEL_CONDITION_BUDGET_EXCEEDED
     */
    DagselCode evaluate(const Condition &cond, const Node &node, bool &result);

    /* Refill the budget and clear counters, e.g., at the start of a traversal. */
    void reset() {
        remaining = budget;
        numEvaluations = 0;
        unitsUsed = 0;
    }

    size_t getNumEvaluations() const { return numEvaluations; }
    size_t getUnitsUsed() const { return unitsUsed; }
    size_t getRemaining() const { return remaining; }

 private:
    DagselCode eval(const Condition &cond, const Node &node, bool &result);

    const NodeAccessor &accessor;
    size_t budget;
    BudgetScope scope;
    size_t remaining;
    size_t numEvaluations;
    size_t unitsUsed;
};

/**
 * Compare two scalars.
 * @param cmp OUTPUT param, -1, 0 or 1
 * @return false if the scalars are not comparable, i.e., they are not both numbers, both strings or both bytes,
 *         or a NaN is involved.
 */
bool condition_compare_scalars(const Scalar &a, const Scalar &b, int &cmp);

#endif  // VALKEYDAGSELMODULE_DAGSEL_CONDITION_H_
