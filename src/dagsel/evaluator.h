/**
 * Selector Evaluator.
 *
 * Walks a data tree depth first, guided by a Selector, and reports every node it reaches (the covered set) and
 * every node a Matcher accepts (the result set) to a ResultCollector, in deterministic traversal order:
 * map entries in insertion order, list elements in ascending index order, union members in member order.
 *
 * Links are followed lazily: a link node is only dereferenced when a selector needs its structure, i.e.,
 * ExploreAll, ExploreFields, ExploreIndex and ExploreRange. The link node is covered first, then its target is
 * covered under the same path. Matcher, ExploreConditional, ExploreUnion, ExploreRecursive and
 * ExploreRecursiveEdge act on the link node itself.
 *
 * Paths are in JSON pointer format: "" is the root, each map key or list index appends a "/<segment>".
 * Crossing a link does not append a segment.
 *
 * Every traversal is bounded:
 *   - maxNodes: total number of node visits
 *   - maxDepth: evaluator call depth, never more than DAGSEL_MAX_TRAVERSAL_DEPTH_CAP
 *   - condition budget, see condition.h
 *   - an optional wall clock timeout and an optional cancellation flag, checked between node visits
 *
 * The first error aborts the traversal. Matches and covered nodes delivered before the error stay delivered.
 * The error is recorded in an EvalError, together with where in the selector and where in the data tree it
 * happened. Accessor errors (unreadable link targets) are subject to the link policy: LINK_POLICY_ABORT fails
 * the traversal, LINK_POLICY_SKIP treats the branch as empty.
 *
 * An Evaluator holds no global state. Independent evaluators can run on different threads, as long as each
 * has its own NodeAccessor.
 */
#ifndef VALKEYDAGSELMODULE_DAGSEL_EVALUATOR_H_
#define VALKEYDAGSELMODULE_DAGSEL_EVALUATOR_H_

#include <stddef.h>
#include <stdint.h>
#include <atomic>
#include <string_view>
#include "dagsel/util.h"
#include "dagsel/memory.h"
#include "dagsel/node.h"
#include "dagsel/condition.h"
#include "dagsel/selector.h"
#include "dagsel/recursion.h"
#include "dagsel/collector.h"
#include "dagsel/stats.h"

typedef enum {
    LINK_POLICY_ABORT = 0,
    LINK_POLICY_SKIP
} LinkPolicy;

/**
 * Options of a traversal. The default constructor snapshots the module configs.
 */
struct TraversalOptions {
    TraversalOptions();
    size_t maxNodes;
    size_t maxDepth;
    size_t conditionBudget;
    ConditionEngine::BudgetScope conditionBudgetScope;
    size_t timeoutMs;                   // 0 means no timeout
    const std::atomic_bool *cancelFlag;   // optional, traversal stops once it is set
    LinkPolicy linkPolicy;
    bool dedupCovered;                  // report each node once, see collector.h
    bool instrument;                    // log every visit
};

/**
 * Where and why a traversal failed.
 *   selectorPath: variant codes and member keys from the root selector, e.g. "R/:>/a/>/@"
 *   nodePath:     JSON pointer of the node being evaluated
 */
struct EvalError {
    EvalError() : code(DAGSEL_SUCCESS), selectorPath(), nodePath(), node() {}
    DagselCode code;
    dsel::string selectorPath;
    dsel::string nodePath;
    Node node;
};

class Evaluator {
 public:
    explicit Evaluator(NodeAccessor &acc, const TraversalOptions &opts = TraversalOptions());

    /**
     * Entry point. Evaluate the selector against the root node.
     * Results are buffered in getResults(), or streamed to the listener if one is given.
     * @return DAGSEL_SUCCESS or the first error, see getError() for details.
     */
    DagselCode traverse(const Selector &selector, const Node &root, TraversalListener *listener = nullptr);

    const ResultCollector& getResults() const { return collector; }
    const EvalError& getError() const { return error; }
    const TraversalSummary& getSummary() const { return summary; }
    const TraversalOptions& getOptions() const { return options; }

 private:
    Evaluator(const Evaluator &);  // disable copy constructor
    Evaluator& operator=(const Evaluator &);  // disable assignment operator

    DagselCode eval(const Selector &sel, const Node &node, const RecursionFrame *frames);
    DagselCode evalSub(const Selector &sel, const std::string_view &member, const Node &node,
                       const RecursionFrame *frames);
    DagselCode evalRecursive(const Selector &recursive, const Node &node, uint64_t remainingDepth,
                             const RecursionFrame *parent);
    DagselCode evalChildren(const Selector &sel, const Node &node, const RecursionFrame *frames);
    DagselCode evalFields(const Selector &sel, const Node &node, const RecursionFrame *frames);
    DagselCode evalIndexes(const Selector &sel, const Node &node, size_t start, size_t end,
                           const RecursionFrame *frames);
    DagselCode evalCondition(const Condition &cond, const Node &node, bool &result);

    DagselCode visit(const Node &node);
    DagselCode resolve(const Node &node, Node &target, bool &skipped);
    DagselCode fail(DagselCode rc, const Node &node);
    void appendNodePath(const std::string_view &key);
    void appendNodePath(size_t index);
    void appendSelectorPath(const std::string_view &segment);

    NodeAccessor &accessor;
    TraversalOptions options;
    ConditionEngine conditions;
    RecursionController recursion;
    ResultCollector collector;
    dsel::string nodePath;
    dsel::string selectorPath;
    size_t numVisits;
    size_t numLinksLoaded;
    size_t numLinksSkipped;
    size_t currDepth;
    long long deadline;
    EvalError error;
    TraversalSummary summary;
};

#endif  // VALKEYDAGSELMODULE_DAGSEL_EVALUATOR_H_
