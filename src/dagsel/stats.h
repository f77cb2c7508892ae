/**
 * The STATS module tracks memory used by loaded blocks and counts what traversals do, so that INFO can report
 * how the module is being used.
 *
 * Memory: the block allocator (block_alloc/block_free/block_realloc) calls dagselstats_increment_used_mem()
 * and dagselstats_decrement_used_mem() upon every malloc/free/realloc.
 *
 * Traversals: at the end of every traversal the evaluator calls dagselstats_update_stats_on_traversal(), which
 * updates the global counters and the histogram of covered nodes per traversal.
 */
#ifndef VALKEYDAGSELMODULE_DAGSEL_STATS_H_
#define VALKEYDAGSELMODULE_DAGSEL_STATS_H_

#include <stddef.h>
#include <stdint.h>
#include "dagsel/util.h"

/* Initialize statistics counters. */
DagselCode dagselstats_init();

/* Get the total memory allocated to loaded blocks. */
unsigned long long dagselstats_get_used_mem();

/* The following two methods are invoked by the block memory allocator upon every malloc/free/realloc. */
void dagselstats_increment_used_mem(size_t delta);
void dagselstats_decrement_used_mem(size_t delta);

/* Per traversal summary handed over by the evaluator. */
typedef struct {
    size_t num_covered;
    size_t num_matches;
    size_t num_visits;
    size_t num_links_loaded;
    size_t num_links_skipped;
    size_t num_condition_evals;
    size_t max_frame_depth;
    DagselCode rc;
} TraversalSummary;

void dagselstats_update_stats_on_traversal(const TraversalSummary &summary);

// get counters
unsigned long long dagselstats_get_num_traversals();
unsigned long long dagselstats_get_num_failed_traversals();
unsigned long long dagselstats_get_num_structural_errors();
unsigned long long dagselstats_get_num_limit_errors();
unsigned long long dagselstats_get_num_accessor_errors();
unsigned long long dagselstats_get_total_covered();
unsigned long long dagselstats_get_total_matches();
unsigned long long dagselstats_get_total_links_loaded();
unsigned long long dagselstats_get_total_links_skipped();
unsigned long long dagselstats_get_total_condition_evals();
unsigned long long dagselstats_get_max_covered_ever_seen();
unsigned long long dagselstats_get_max_frame_depth_ever_seen();

unsigned long long dagselstats_get_num_blocks_written();
void dagselstats_increment_blocks_written();

// helper methods for printing histograms into C string
void dagselstats_sprint_hist_buckets(char *buf, const size_t buf_size);
void dagselstats_sprint_covered_hist(char *buf, const size_t buf_size);

/* Given a number of covered nodes, find the histogram bucket index using binary search.
 */
uint32_t dagselstats_find_bucket(size_t num_covered);

#endif  // VALKEYDAGSELMODULE_DAGSEL_STATS_H_
