/**
 * Result Collector.
 *
 * Receives covered nodes and matches from the evaluator, in traversal order. Covered nodes are deduplicated by
 * node identity, matches are not: a node reached twice by different selector branches matches twice.
 *
 * Delivery is either buffered (no listener, read the sequences after the traversal) or streamed (every event
 * is handed to a TraversalListener as soon as it occurs, nothing is buffered).
 *
 * Deduplication keeps one set entry per distinct covered node for the whole traversal, even when streaming.
 * A streaming consumer that can handle repeated covered events may turn deduplication off. The collector then
 * holds no per-node state, and every visit is reported as a covered event.
 */
#ifndef VALKEYDAGSELMODULE_DAGSEL_COLLECTOR_H_
#define VALKEYDAGSELMODULE_DAGSEL_COLLECTOR_H_

#include <stddef.h>
#include <string_view>
#include "dagsel/memory.h"
#include "dagsel/node.h"

class TraversalListener {
 public:
    virtual ~TraversalListener() {}

    /* A node is covered for the first time. The path is in JSON pointer format. */
    virtual void onCovered(const Node &node, const std::string_view &path) = 0;

    /* A Matcher matched a node. label is nullptr for an unlabelled Matcher. */
    virtual void onMatch(const Node &node, const std::string_view &path, const std::string_view *label) = 0;
};

struct CoveredEntry {
    Node node;
    dsel::string path;
};

struct MatchEntry {
    MatchEntry() : node(), path(), hasLabel(false), label() {}
    Node node;
    dsel::string path;
    bool hasLabel;
    dsel::string label;
};

class ResultCollector {
 public:
    explicit ResultCollector(TraversalListener *l = nullptr, bool dedup = true)
            : listener(l)
            , dedupCovered(dedup)
            , coveredSet()
            , covered()
            , matches()
            , numCovered(0)
            , numMatches(0)
    {}

    /* Start over, optionally switching to streaming delivery or turning deduplication off. */
    void reset(TraversalListener *l = nullptr, bool dedup = true);

    /* Record a covered node. Returns false if deduplication is on and the node was already covered. */
    bool cover(const Node &node, const std::string_view &path);

    void match(const Node &node, const std::string_view &path, const std::string_view *label);

    // Only tracked while deduplicating
    bool isCovered(const Node &node) const { return coveredSet.count(node) > 0; }
    bool isStreaming() const { return listener != nullptr; }
    bool isDeduplicating() const { return dedupCovered; }

    size_t getNumCovered() const { return numCovered; }
    size_t getNumMatches() const { return numMatches; }

    // Buffered sequences, empty when streaming
    const dsel::vector<CoveredEntry>& getCovered() const { return covered; }
    const dsel::vector<MatchEntry>& getMatches() const { return matches; }

 private:
    ResultCollector(const ResultCollector &);  // disable copy constructor
    ResultCollector& operator=(const ResultCollector &);  // disable assignment operator

    TraversalListener *listener;
    bool dedupCovered;
    dsel::unordered_set<Node, NodeHash> coveredSet;
    dsel::vector<CoveredEntry> covered;
    dsel::vector<MatchEntry> matches;
    size_t numCovered;
    size_t numMatches;
};

#endif  // VALKEYDAGSELMODULE_DAGSEL_COLLECTOR_H_
