/**
 * Recursion Controller.
 *
 * ExploreRecursive and ExploreRecursiveEdge are implemented with a stack of frames. A frame is pushed each time
 * an ExploreRecursive starts an iteration over its sequence. Frames live on the evaluator's call stack and are
 * linked through parent pointers, so the frame list is just a pointer passed down every recursive call.
 *
 * An ExploreRecursiveEdge always binds to the nearest frame F, and re-enters F's ExploreRecursive with one less
 * remaining depth, on the stack below F. Derived "depth minus one" selectors are never materialized.
 */
#ifndef VALKEYDAGSELMODULE_DAGSEL_RECURSION_H_
#define VALKEYDAGSELMODULE_DAGSEL_RECURSION_H_

#include <stddef.h>
#include <stdint.h>
#include "dagsel/util.h"
#include "dagsel/memory.h"
#include "dagsel/node.h"
#include "dagsel/condition.h"
#include "dagsel/selector.h"

struct RecursionFrame {
    RecursionFrame(const Selector *r, uint64_t depth, const RecursionFrame *p)
            : recursive(r)
            , remainingDepth(depth)
            , parent(p)
            , stackDepth(p == nullptr ? 1 : p->stackDepth + 1)
    {}
    const Selector *recursive;      // the ExploreRecursive that pushed this frame
    uint64_t remainingDepth;
    const RecursionFrame *parent;   // enclosing frame, nullptr at the bottom of the stack
    size_t stackDepth;              // number of frames on the stack, including this one
};

class RecursionController {
 public:
    RecursionController()
            : validated()
            , maxFrameDepth(0)
    {}

    /**
     * Decide whether an ExploreRecursive stops before its next iteration. It stops when no depth is left,
     * or when its stopAt condition holds for the node. Checked before every iteration, the first one included.
     * @param stop OUTPUT param
     * @return DAGSEL_SUCCESS, or the condition engine's error
     */
    DagselCode shouldStop(const Selector &recursive, uint64_t remainingDepth, const Node &node,
                          ConditionEngine &conditions, bool &stop) const;

    /**
     * Check that the sequence of an ExploreRecursive contains an ExploreRecursiveEdge that is not inside a
     * nested ExploreRecursive's sequence. The outcome is cached per selector instance.
     * @return DAGSEL_SUCCESS or DAGSEL_RECURSIVE_SEQUENCE_WITHOUT_EDGE
     */
    DagselCode validate(const Selector &recursive);

    /* The frame an ExploreRecursiveEdge binds to, nullptr if there is no enclosing ExploreRecursive. */
    const RecursionFrame *resolveEdge(const RecursionFrame *frames) const { return frames; }

    void onPush(const RecursionFrame &frame) {
        if (frame.stackDepth > maxFrameDepth) maxFrameDepth = frame.stackDepth;
    }

    size_t getMaxFrameDepth() const { return maxFrameDepth; }

    void reset() {
        validated.clear();
        maxFrameDepth = 0;
    }

    static bool sequenceHasEdge(const Selector &sequence);

 private:
    dsel::unordered_map<const Selector *, DagselCode> validated;
    size_t maxFrameDepth;
};

#endif  // VALKEYDAGSELMODULE_DAGSEL_RECURSION_H_
