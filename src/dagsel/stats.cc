#include "dagsel/stats.h"
#include <cstring>
#include <atomic>
#include <string>
#include <sstream>

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

/* Traversal statistics struct.
 * Use atomic integers because traversals may run on threads other than the main thread, and the
 * overhead of atomic operations is negligible compared to a traversal.
 */
typedef struct {
    std::atomic_ullong used_mem;  // global used memory counter
    std::atomic_ullong num_traversals;
    std::atomic_ullong num_failed_traversals;
    std::atomic_ullong num_structural_errors;
    std::atomic_ullong num_limit_errors;
    std::atomic_ullong num_accessor_errors;
    std::atomic_ullong total_covered;
    std::atomic_ullong total_matches;
    std::atomic_ullong total_links_loaded;
    std::atomic_ullong total_links_skipped;
    std::atomic_ullong total_condition_evals;
    std::atomic_ullong max_covered_ever_seen;
    std::atomic_ullong max_frame_depth_ever_seen;
    std::atomic_ullong num_blocks_written;

    void reset() {
        used_mem = 0;
        num_traversals = 0;
        num_failed_traversals = 0;
        num_structural_errors = 0;
        num_limit_errors = 0;
        num_accessor_errors = 0;
        total_covered = 0;
        total_matches = 0;
        total_links_loaded = 0;
        total_links_skipped = 0;
        total_condition_evals = 0;
        max_covered_ever_seen = 0;
        max_frame_depth_ever_seen = 0;
        num_blocks_written = 0;
    }
} DagselStats;
static DagselStats dagselstats;

// histograms
#define NUM_BUCKETS (11)
static size_t buckets[] = {
        0, 16, 64, 256, 1024, 4*1024, 16*1024, 64*1024,
        256*1024, 1024*1024, 4*1024*1024, SIZE_MAX
};

// dynamic histogram of the number of covered nodes per traversal (DAG.SELECT)
static std::atomic_ullong covered_hist[NUM_BUCKETS];

DagselCode dagselstats_init() {
    dagselstats.reset();
    for (size_t i = 0; i < NUM_BUCKETS; i++) covered_hist[i] = 0;
    return DAGSEL_SUCCESS;
}

void dagselstats_increment_used_mem(size_t delta) {
    dagselstats.used_mem += delta;
}

void dagselstats_decrement_used_mem(size_t delta) {
    ValkeyModule_Assert(delta <= dagselstats.used_mem);
    dagselstats.used_mem -= delta;
}

unsigned long long dagselstats_get_used_mem() {
    return dagselstats.used_mem;
}

STATIC void update_max(std::atomic_ullong &target, const unsigned long long val) {
    unsigned long long curr = target.load();
    while (val > curr && !target.compare_exchange_weak(curr, val)) {}
}

void dagselstats_update_stats_on_traversal(const TraversalSummary &summary) {
    dagselstats.num_traversals++;
    if (summary.rc != DAGSEL_SUCCESS) {
        dagselstats.num_failed_traversals++;
        if (dagselutil_is_structural_error(summary.rc))
            dagselstats.num_structural_errors++;
        else if (dagselutil_is_resource_limit_error(summary.rc))
            dagselstats.num_limit_errors++;
        else if (dagselutil_is_accessor_error(summary.rc))
            dagselstats.num_accessor_errors++;
    }
    dagselstats.total_covered += summary.num_covered;
    dagselstats.total_matches += summary.num_matches;
    dagselstats.total_links_loaded += summary.num_links_loaded;
    dagselstats.total_links_skipped += summary.num_links_skipped;
    dagselstats.total_condition_evals += summary.num_condition_evals;
    update_max(dagselstats.max_covered_ever_seen, summary.num_covered);
    update_max(dagselstats.max_frame_depth_ever_seen, summary.max_frame_depth);
    covered_hist[dagselstats_find_bucket(summary.num_covered)]++;
}

unsigned long long dagselstats_get_num_traversals() {
    return dagselstats.num_traversals;
}

unsigned long long dagselstats_get_num_failed_traversals() {
    return dagselstats.num_failed_traversals;
}

unsigned long long dagselstats_get_num_structural_errors() {
    return dagselstats.num_structural_errors;
}

unsigned long long dagselstats_get_num_limit_errors() {
    return dagselstats.num_limit_errors;
}

unsigned long long dagselstats_get_num_accessor_errors() {
    return dagselstats.num_accessor_errors;
}

unsigned long long dagselstats_get_total_covered() {
    return dagselstats.total_covered;
}

unsigned long long dagselstats_get_total_matches() {
    return dagselstats.total_matches;
}

unsigned long long dagselstats_get_total_links_loaded() {
    return dagselstats.total_links_loaded;
}

unsigned long long dagselstats_get_total_links_skipped() {
    return dagselstats.total_links_skipped;
}

unsigned long long dagselstats_get_total_condition_evals() {
    return dagselstats.total_condition_evals;
}

unsigned long long dagselstats_get_max_covered_ever_seen() {
    return dagselstats.max_covered_ever_seen;
}

unsigned long long dagselstats_get_max_frame_depth_ever_seen() {
    return dagselstats.max_frame_depth_ever_seen;
}

unsigned long long dagselstats_get_num_blocks_written() {
    return dagselstats.num_blocks_written;
}

void dagselstats_increment_blocks_written() {
    dagselstats.num_blocks_written++;
}

/* Given a number of covered nodes, find histogram bucket index using binary search.
 */
uint32_t dagselstats_find_bucket(size_t num_covered) {
    int lo = 0;
    int hi = NUM_BUCKETS;  // length of buckets[] is NUM_BUCKETS + 1
    while (hi - lo > 1) {
        uint32_t mid = (lo + hi) / 2;
        if (num_covered < buckets[mid])
            hi = mid;
        else if (num_covered > buckets[mid])
            lo = mid;
        else
            return mid;
    }
    return lo;
}

void dagselstats_sprint_hist_buckets(char *buf, const size_t buf_size) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i=0; i < NUM_BUCKETS; i++) {
        if (i > 0) oss << ",";
        oss << buckets[i];
    }
    oss << ",INF]";
    std::string str = oss.str();
    ValkeyModule_Assert(str.length() < buf_size);
    memcpy(buf, str.c_str(), str.length());
    buf[str.length()] = '\0';
}

void dagselstats_sprint_covered_hist(char *buf, const size_t buf_size) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i=0; i < NUM_BUCKETS; i++) {
        if (i > 0) oss << ",";
        oss << covered_hist[i].load();
    }
    oss << "]";
    std::string str = oss.str();
    ValkeyModule_Assert(str.length() < buf_size);
    memcpy(buf, str.c_str(), str.length());
    buf[str.length()] = '\0';
}
