/**
 * Selector model.
 *
 * A Selector is an immutable tree that tells the evaluator where to go in a data tree and what to match there.
 * There are nine variants:
 *
 *   MATCHER                   match the current node, optionally guarded by onlyIf and tagged with a label
 *   EXPLORE_ALL               apply next to every child of a map or list
 *   EXPLORE_FIELDS            apply a per-field selector to named map entries, in declaration order
 *   EXPLORE_INDEX             apply next to one list element
 *   EXPLORE_RANGE             apply next to list elements in [start, end)
 *   EXPLORE_RECURSIVE         apply sequence repeatedly, at most maxDepth times, unless stopAt holds
 *   EXPLORE_RECURSIVE_EDGE    the point inside a recursive sequence where recursion re-enters
 *   EXPLORE_UNION             apply every member to the same node, in member order
 *   EXPLORE_CONDITIONAL       apply next to the same node if condition holds
 *
 * Selectors are built in code with the static builders below, or decoded from their DAG-JSON representation
 * with dagsel_parse_selector(). The DAG-JSON form is a single member object keyed by the variant code, e.g.
 *
 *   {"R": {"l": {"depth": 5}, ":>": {"a": {">": {"@": {}}}}}}
 *
 * Variant codes and body members:
 *   "."  {"onlyIf": <condition>?, "label": <string>?}
 *   "a"  {">": <selector>}
 *   "f"  {"f>": {<name>: <selector>, ...}}
 *   "i"  {"i": <uint>, ">": <selector>}
 *   "r"  {"^": <uint>, "$": <uint>, ">": <selector>}
 *   "R"  {"l": {"depth": <uint>} | {"none": {}}, ":>": <selector>, "!": <condition>?}
 *   "@"  {}
 *   "|"  [<selector>, ...]
 *   "&"  {"&": <condition>, ">": <selector>}
 *
 * Conditions are single member objects too:
 *   {"hasField": <string>}  {"=": <scalar>}  {"%": <kind name>}  {"/": {}}
 *   {"greaterThan": <number|string>}  {"lessThan": <number|string>}  {"and": [...]}  {"or": [...]}
 * A bytes scalar is written {"/": {"bytes": "<base64>"}}.
 */
#ifndef VALKEYDAGSELMODULE_DAGSEL_SELECTOR_H_
#define VALKEYDAGSELMODULE_DAGSEL_SELECTOR_H_

#include <stddef.h>
#include <stdint.h>
#include <memory>
#include <string_view>
#include <utility>
#include "dagsel/util.h"
#include "dagsel/memory.h"
#include "dagsel/condition.h"

struct Selector;
typedef std::unique_ptr<Selector> SelectorPtr;

struct Selector {
    typedef enum {
        MATCHER = 0,
        EXPLORE_ALL,
        EXPLORE_FIELDS,
        EXPLORE_INDEX,
        EXPLORE_RANGE,
        EXPLORE_RECURSIVE,
        EXPLORE_RECURSIVE_EDGE,
        EXPLORE_UNION,
        EXPLORE_CONDITIONAL
    } Type;

    typedef std::pair<dsel::string, SelectorPtr> Field;
    typedef dsel::vector<Field> FieldList;

    static const uint64_t UNBOUNDED_DEPTH = UINT64_MAX;

    explicit Selector(Type t)
            : type(t)
            , condition()
            , hasLabel(false)
            , label()
            , next()
            , fields()
            , index(0)
            , start(0)
            , end(0)
            , sequence()
            , maxDepth(0)
            , stopAt()
            , members()
    {}

    Type type;
    ConditionPtr condition;     // MATCHER (onlyIf), EXPLORE_CONDITIONAL
    bool hasLabel;              // MATCHER
    dsel::string label;         // MATCHER
    SelectorPtr next;           // EXPLORE_ALL, EXPLORE_INDEX, EXPLORE_RANGE, EXPLORE_CONDITIONAL
    FieldList fields;           // EXPLORE_FIELDS
    size_t index;               // EXPLORE_INDEX
    size_t start;               // EXPLORE_RANGE, inclusive
    size_t end;                 // EXPLORE_RANGE, exclusive
    SelectorPtr sequence;       // EXPLORE_RECURSIVE
    uint64_t maxDepth;          // EXPLORE_RECURSIVE
    ConditionPtr stopAt;        // EXPLORE_RECURSIVE, optional
    dsel::vector<SelectorPtr> members;  // EXPLORE_UNION

    static SelectorPtr matcher(ConditionPtr onlyIf = ConditionPtr());
    static SelectorPtr matcher(const std::string_view &label, ConditionPtr onlyIf = ConditionPtr());
    static SelectorPtr exploreAll(SelectorPtr next);
    static SelectorPtr exploreFields(FieldList &&fields);
    static SelectorPtr exploreIndex(size_t index, SelectorPtr next);
    static SelectorPtr exploreRange(size_t start, size_t end, SelectorPtr next);
    static SelectorPtr exploreRecursive(SelectorPtr sequence, uint64_t maxDepth, ConditionPtr stopAt = ConditionPtr());
    static SelectorPtr exploreRecursiveEdge();
    static SelectorPtr exploreUnion(dsel::vector<SelectorPtr> &&members);
    static SelectorPtr exploreConditional(ConditionPtr condition, SelectorPtr next);

    /* Short code of a variant as used in the DAG-JSON form and in selector paths of errors, e.g. "R". */
    static const char *typeCode(Type t);

    void *operator new(size_t size) { return memory_alloc(size); }
    void operator delete(void *ptr) { memory_free(ptr); }

 private:
    Selector(const Selector &);  // disable copy constructor
    Selector& operator=(const Selector &);  // disable assignment operator
};

/**
 * Decode a selector from its DAG-JSON representation.
 * The input string does not need to be NULL terminated.
 *
 * @param selector OUTPUT param, the decoded selector tree
 * @return DAGSEL_SUCCESS, DAGSEL_SELECTOR_SIZE_LIMIT_EXCEEDED, DAGSEL_SELECTOR_PARSE_ERROR,
 *         DAGSEL_INVALID_SELECTOR, DAGSEL_INVALID_CONDITION, DAGSEL_INVALID_KIND or
 *         DAGSEL_PARSER_RECURSION_DEPTH_LIMIT_EXCEEDED
 */
DagselCode dagsel_parse_selector(const char *buf, const size_t len, SelectorPtr &selector);

/* Decode a condition from its DAG-JSON representation. */
DagselCode dagsel_parse_condition(const char *buf, const size_t len, ConditionPtr &condition);

#endif  // VALKEYDAGSELMODULE_DAGSEL_SELECTOR_H_
