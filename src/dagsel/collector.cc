#include "dagsel/collector.h"

void ResultCollector::reset(TraversalListener *l, bool dedup) {
    listener = l;
    dedupCovered = dedup;
    coveredSet.clear();
    covered.clear();
    matches.clear();
    numCovered = 0;
    numMatches = 0;
}

bool ResultCollector::cover(const Node &node, const std::string_view &path) {
    if (dedupCovered && !coveredSet.insert(node).second) return false;
    numCovered++;
    if (listener != nullptr) {
        listener->onCovered(node, path);
    } else {
        CoveredEntry e;
        e.node = node;
        e.path = dsel::string(path.data(), path.length());
        covered.push_back(std::move(e));
    }
    return true;
}

void ResultCollector::match(const Node &node, const std::string_view &path, const std::string_view *label) {
    numMatches++;
    if (listener != nullptr) {
        listener->onMatch(node, path, label);
        return;
    }
    MatchEntry e;
    e.node = node;
    e.path = dsel::string(path.data(), path.length());
    if (label != nullptr) {
        e.hasLabel = true;
        e.label = dsel::string(label->data(), label->length());
    }
    matches.push_back(std::move(e));
}
