#include "dagsel/recursion.h"

DagselCode RecursionController::shouldStop(const Selector &recursive, uint64_t remainingDepth, const Node &node,
                                           ConditionEngine &conditions, bool &stop) const {
    stop = true;
    if (remainingDepth == 0) return DAGSEL_SUCCESS;
    if (recursive.stopAt) {
        bool holds;
        DagselCode rc = conditions.evaluate(*recursive.stopAt, node, holds);
        if (rc != DAGSEL_SUCCESS) return rc;
        if (holds) return DAGSEL_SUCCESS;
    }
    stop = false;
    return DAGSEL_SUCCESS;
}

DagselCode RecursionController::validate(const Selector &recursive) {
    auto it = validated.find(&recursive);
    if (it != validated.end()) return it->second;
    DagselCode rc = DAGSEL_SUCCESS;
    if (!recursive.sequence || !sequenceHasEdge(*recursive.sequence)) {
        ValkeyModule_Log(nullptr, "debug", "ExploreRecursive sequence has no reachable ExploreRecursiveEdge");
        rc = DAGSEL_RECURSIVE_SEQUENCE_WITHOUT_EDGE;
    }
    validated.emplace(&recursive, rc);
    return rc;
}

bool RecursionController::sequenceHasEdge(const Selector &s) {
    switch (s.type) {
        case Selector::EXPLORE_RECURSIVE_EDGE:
            return true;
        case Selector::EXPLORE_RECURSIVE:
            // edges inside a nested sequence bind to the nested ExploreRecursive
            return false;
        case Selector::EXPLORE_ALL:
        case Selector::EXPLORE_INDEX:
        case Selector::EXPLORE_RANGE:
        case Selector::EXPLORE_CONDITIONAL:
            return s.next && sequenceHasEdge(*s.next);
        case Selector::EXPLORE_FIELDS:
            for (auto &f : s.fields) {
                if (f.second && sequenceHasEdge(*f.second)) return true;
            }
            return false;
        case Selector::EXPLORE_UNION:
            for (auto &m : s.members) {
                if (m && sequenceHasEdge(*m)) return true;
            }
            return false;
        default:
            return false;
    }
}
