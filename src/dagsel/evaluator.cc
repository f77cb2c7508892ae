#include "dagsel/evaluator.h"
#include <string>
#include <iostream>
#include "dagsel/dagsel.h"

#ifdef INSTRUMENT_TRAVERSAL
#define TRACE(level, msg) \
std::cout << level << " " << msg << std::endl;
#else
#define TRACE(level, msg)
#endif

class CallDepthTracker {
 public:
    explicit CallDepthTracker(size_t &d) : depth(d) {
        depth++;
    }
    ~CallDepthTracker() {
        depth--;
    }
 private:
    size_t &depth;
};

TraversalOptions::TraversalOptions()
        : maxNodes(dagsel_get_max_traversal_nodes())
        , maxDepth(dagsel_get_max_traversal_depth())
        , conditionBudget(dagsel_get_condition_budget())
        , conditionBudgetScope(ConditionEngine::BUDGET_PER_CONDITION)
        , timeoutMs(dagsel_get_max_traversal_time_ms())
        , cancelFlag(nullptr)
        , linkPolicy(dagsel_is_skip_unreachable_links() ? LINK_POLICY_SKIP : LINK_POLICY_ABORT)
        , dedupCovered(true)
        , instrument(dagsel_is_instrument_enabled_traversal())
{}

Evaluator::Evaluator(NodeAccessor &acc, const TraversalOptions &opts)
        : accessor(acc)
        , options(opts)
        , conditions(acc, opts.conditionBudget, opts.conditionBudgetScope)
        , recursion()
        , collector()
        , nodePath()
        , selectorPath()
        , numVisits(0)
        , numLinksLoaded(0)
        , numLinksSkipped(0)
        , currDepth(0)
        , deadline(0)
        , error()
        , summary()
{}

DagselCode Evaluator::traverse(const Selector &selector, const Node &root, TraversalListener *listener) {
    collector.reset(listener, options.dedupCovered);
    conditions.reset();
    recursion.reset();
    nodePath = "";
    selectorPath = "";
    numVisits = 0;
    numLinksLoaded = 0;
    numLinksSkipped = 0;
    currDepth = 0;
    error = EvalError();
    deadline = (options.timeoutMs > 0) ? ValkeyModule_Milliseconds() + static_cast<long long>(options.timeoutMs) : 0;

    DagselCode rc = eval(selector, root, nullptr);

    summary.num_covered = collector.getNumCovered();
    summary.num_matches = collector.getNumMatches();
    summary.num_visits = numVisits;
    summary.num_links_loaded = numLinksLoaded;
    summary.num_links_skipped = numLinksSkipped;
    summary.num_condition_evals = conditions.getNumEvaluations();
    summary.max_frame_depth = recursion.getMaxFrameDepth();
    summary.rc = rc;
    dagselstats_update_stats_on_traversal(summary);

    if (rc != DAGSEL_SUCCESS) {
        ValkeyModule_Log(nullptr, "debug", "traversal failed: %s, selector path: %s, node path: %s",
                         dagselutil_code_to_message(rc), error.selectorPath.c_str(), error.nodePath.c_str());
    }
    return rc;
}

DagselCode Evaluator::fail(DagselCode rc, const Node &node) {
    if (error.code == DAGSEL_SUCCESS) {
        error.code = rc;
        error.selectorPath = selectorPath;
        error.nodePath = nodePath;
        error.node = node;
    }
    return rc;
}

void Evaluator::appendNodePath(const std::string_view &key) {
    nodePath.append("/").append(key);
}

void Evaluator::appendNodePath(size_t index) {
    nodePath.append("/").append(std::to_string(index));
}

void Evaluator::appendSelectorPath(const std::string_view &segment) {
    if (!selectorPath.empty()) selectorPath.append("/");
    selectorPath.append(segment);
}

/*
 * Called once for every node the evaluator reaches. Enforces the traversal limits and covers the node.
 */
DagselCode Evaluator::visit(const Node &node) {
    if (options.cancelFlag != nullptr && options.cancelFlag->load()) return fail(DAGSEL_TRAVERSAL_CANCELLED, node);
    if (deadline > 0 && ValkeyModule_Milliseconds() > deadline) return fail(DAGSEL_TRAVERSAL_TIMEOUT, node);
    if (numVisits >= options.maxNodes) return fail(DAGSEL_TRAVERSAL_BUDGET_EXCEEDED, node);
    numVisits++;
    if (options.instrument) {
        ValkeyModule_Log(nullptr, "warning", "Dagsel visit %zu: selector path: %s, node path: %s",
                         numVisits, selectorPath.c_str(), nodePath.c_str());
    }
    collector.cover(node, nodePath);
    return DAGSEL_SUCCESS;
}

/*
 * Follow links until a non-link node is reached. Every target is covered under the current path.
 * If a target cannot be loaded and the link policy is SKIP, skipped is set and the branch is empty.
 */
DagselCode Evaluator::resolve(const Node &node, Node &target, bool &skipped) {
    skipped = false;
    target = node;
    while (accessor.kind(target) == NODE_KIND_LINK) {
        Node next;
        DagselCode rc = accessor.dereference(target, next);
        if (rc != DAGSEL_SUCCESS) {
            if (dagselutil_is_accessor_error(rc) && options.linkPolicy == LINK_POLICY_SKIP) {
                numLinksSkipped++;
                ValkeyModule_Log(nullptr, "debug", "skipping unreachable link at node path %s: %s",
                                 nodePath.c_str(), dagselutil_code_to_message(rc));
                skipped = true;
                return DAGSEL_SUCCESS;
            }
            return fail(rc, target);
        }
        numLinksLoaded++;
        TRACE("DEBUG", "resolve followed link at " << nodePath)
        rc = visit(next);
        if (rc != DAGSEL_SUCCESS) return rc;
        target = next;
    }
    return DAGSEL_SUCCESS;
}

DagselCode Evaluator::evalCondition(const Condition &cond, const Node &node, bool &result) {
    DagselCode rc = conditions.evaluate(cond, node, result);
    if (rc != DAGSEL_SUCCESS) return fail(rc, node);
    return DAGSEL_SUCCESS;
}

DagselCode Evaluator::evalSub(const Selector &sel, const std::string_view &member, const Node &node,
                              const RecursionFrame *frames) {
    size_t path_len = selectorPath.length();
    appendSelectorPath(member);
    DagselCode rc = eval(sel, node, frames);
    selectorPath.resize(path_len);
    return rc;
}

DagselCode Evaluator::eval(const Selector &sel, const Node &node, const RecursionFrame *frames) {
    CallDepthTracker tracker(currDepth);
    size_t path_len = selectorPath.length();
    appendSelectorPath(Selector::typeCode(sel.type));
    TRACE("DEBUG", "eval selector path: " << selectorPath << ", nodePath: " << nodePath
        << ", call depth: " << currDepth)

    DagselCode rc;
    if (currDepth > options.maxDepth || currDepth > DAGSEL_MAX_TRAVERSAL_DEPTH_CAP) {
        rc = fail(DAGSEL_TRAVERSAL_DEPTH_LIMIT_EXCEEDED, node);
    } else {
        rc = visit(node);
    }
    if (rc != DAGSEL_SUCCESS) {
        selectorPath.resize(path_len);
        return rc;
    }

    switch (sel.type) {
        case Selector::MATCHER: {
            bool ok = true;
            if (sel.condition) rc = evalCondition(*sel.condition, node, ok);
            if (rc == DAGSEL_SUCCESS && ok) {
                if (sel.hasLabel) {
                    std::string_view label(sel.label.c_str(), sel.label.length());
                    collector.match(node, nodePath, &label);
                } else {
                    collector.match(node, nodePath, nullptr);
                }
            }
            break;
        }
        case Selector::EXPLORE_ALL:
            rc = evalChildren(sel, node, frames);
            break;
        case Selector::EXPLORE_FIELDS:
            rc = evalFields(sel, node, frames);
            break;
        case Selector::EXPLORE_INDEX:
            // empty range if index + 1 overflows
            rc = evalIndexes(sel, node, sel.index, sel.index + 1, frames);
            break;
        case Selector::EXPLORE_RANGE:
            rc = evalIndexes(sel, node, sel.start, sel.end, frames);
            break;
        case Selector::EXPLORE_RECURSIVE:
            rc = evalRecursive(sel, node, sel.maxDepth, frames);
            break;
        case Selector::EXPLORE_RECURSIVE_EDGE: {
            const RecursionFrame *frame = recursion.resolveEdge(frames);
            if (frame == nullptr) {
                rc = fail(DAGSEL_RECURSIVE_EDGE_WITHOUT_FRAME, node);
                break;
            }
            rc = evalRecursive(*frame->recursive, node, frame->remainingDepth - 1, frame->parent);
            break;
        }
        case Selector::EXPLORE_UNION:
            for (size_t i = 0; i < sel.members.size(); i++) {
                if (!sel.members[i]) continue;
                rc = evalSub(*sel.members[i], std::to_string(i), node, frames);
                if (rc != DAGSEL_SUCCESS) break;
            }
            break;
        case Selector::EXPLORE_CONDITIONAL: {
            if (!sel.condition || !sel.next) {
                rc = fail(DAGSEL_INVALID_SELECTOR, node);
                break;
            }
            bool ok;
            rc = evalCondition(*sel.condition, node, ok);
            if (rc == DAGSEL_SUCCESS && ok) rc = evalSub(*sel.next, ">", node, frames);
            break;
        }
        default:
            rc = fail(DAGSEL_INVALID_SELECTOR, node);
            break;
    }
    selectorPath.resize(path_len);
    return rc;
}

DagselCode Evaluator::evalRecursive(const Selector &recursive, const Node &node, uint64_t remainingDepth,
                                    const RecursionFrame *parent) {
    bool stop;
    DagselCode rc = recursion.shouldStop(recursive, remainingDepth, node, conditions, stop);
    if (rc != DAGSEL_SUCCESS) return fail(rc, node);
    if (stop) {
        TRACE("DEBUG", "evalRecursive stops at " << nodePath << ", remaining depth: " << remainingDepth)
        return DAGSEL_SUCCESS;
    }
    rc = recursion.validate(recursive);
    if (rc != DAGSEL_SUCCESS) return fail(rc, node);

    RecursionFrame frame(&recursive, remainingDepth, parent);
    recursion.onPush(frame);
    return evalSub(*recursive.sequence, ":>", node, &frame);
}

DagselCode Evaluator::evalChildren(const Selector &sel, const Node &node, const RecursionFrame *frames) {
    if (!sel.next) return fail(DAGSEL_INVALID_SELECTOR, node);
    Node target;
    bool skipped;
    DagselCode rc = resolve(node, target, skipped);
    if (rc != DAGSEL_SUCCESS || skipped) return rc;

    dsel::vector<NodeEntry> entries;
    accessor.children(target, entries);
    for (auto &e : entries) {
        size_t path_len = nodePath.length();
        if (e.isIndex)
            appendNodePath(e.index);
        else
            appendNodePath(e.key);
        rc = evalSub(*sel.next, ">", e.node, frames);
        nodePath.resize(path_len);
        if (rc != DAGSEL_SUCCESS) return rc;
    }
    return DAGSEL_SUCCESS;
}

DagselCode Evaluator::evalFields(const Selector &sel, const Node &node, const RecursionFrame *frames) {
    Node target;
    bool skipped;
    DagselCode rc = resolve(node, target, skipped);
    if (rc != DAGSEL_SUCCESS || skipped) return rc;
    if (accessor.kind(target) != NODE_KIND_MAP) return DAGSEL_SUCCESS;

    for (auto &f : sel.fields) {
        std::string_view key(f.first.c_str(), f.first.length());
        Node child;
        if (!f.second || !accessor.child(target, key, child)) continue;
        size_t node_path_len = nodePath.length();
        size_t sel_path_len = selectorPath.length();
        appendNodePath(key);
        appendSelectorPath("f>");
        rc = evalSub(*f.second, key, child, frames);
        selectorPath.resize(sel_path_len);
        nodePath.resize(node_path_len);
        if (rc != DAGSEL_SUCCESS) return rc;
    }
    return DAGSEL_SUCCESS;
}

DagselCode Evaluator::evalIndexes(const Selector &sel, const Node &node, size_t start, size_t end,
                                  const RecursionFrame *frames) {
    if (!sel.next) return fail(DAGSEL_INVALID_SELECTOR, node);
    Node target;
    bool skipped;
    DagselCode rc = resolve(node, target, skipped);
    if (rc != DAGSEL_SUCCESS || skipped) return rc;
    if (accessor.kind(target) != NODE_KIND_LIST) return DAGSEL_SUCCESS;

    size_t len = accessor.length(target);
    if (end > len) end = len;
    for (size_t i = start; i < end; i++) {
        Node child;
        if (!accessor.element(target, i, child)) continue;
        size_t path_len = nodePath.length();
        appendNodePath(i);
        rc = evalSub(*sel.next, ">", child, frames);
        nodePath.resize(path_len);
        if (rc != DAGSEL_SUCCESS) return rc;
    }
    return DAGSEL_SUCCESS;
}
