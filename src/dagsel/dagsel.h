#ifndef VALKEYDAGSELMODULE_DAGSEL_H_
#define VALKEYDAGSELMODULE_DAGSEL_H_

#include <stddef.h>

// Freeing, serializing and evaluating nested data recurse on the C stack, so these limits are capped.
#define DAGSEL_MAX_BLOCK_DEPTH_CAP 10000
#define DAGSEL_MAX_TRAVERSAL_DEPTH_CAP 4096

size_t dagsel_get_max_traversal_nodes();
size_t dagsel_get_max_traversal_depth();
size_t dagsel_get_condition_budget();
size_t dagsel_get_max_traversal_time_ms();
size_t dagsel_get_max_selector_size();
size_t dagsel_get_max_parser_recursion_depth();
size_t dagsel_get_max_block_size();
size_t dagsel_get_max_block_depth();

bool dagsel_is_skip_unreachable_links();
bool dagsel_is_instrument_enabled_traversal();

#endif  // VALKEYDAGSELMODULE_DAGSEL_H_
