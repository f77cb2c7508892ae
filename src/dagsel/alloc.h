/**
 * The block allocator. It wraps around the memory shim (memory_alloc, memory_free, memory_realloc), which in
 * turn wraps Valkey's built-in allocation functions. Every allocation made on behalf of a parsed DAG-JSON
 * block, including the ones RapidJSON makes internally, goes through this interface so that the memory held
 * by loaded blocks is tracked by the STATS module and reported in INFO.
 */
#ifndef VALKEYDAGSELMODULE_DAGSEL_ALLOC_H_
#define VALKEYDAGSELMODULE_DAGSEL_ALLOC_H_

#include <stddef.h>

#include "dagsel/memory.h"

void *block_alloc(size_t size);
void block_free(void *ptr);
void *block_realloc(void *orig_ptr, size_t new_size);

#endif  // VALKEYDAGSELMODULE_DAGSEL_ALLOC_H_
