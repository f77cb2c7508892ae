#include "dagsel/memory.h"
#include "dagsel/alloc.h"
#include "dagsel/stats.h"

void *block_alloc(size_t size) {
    void *ptr = memory_alloc(size);
    // actually allocated size may not be same as the requested size
    size_t real_size = memory_allocsize(ptr);
    dagselstats_increment_used_mem(real_size);
    return ptr;
}

void block_free(void *ptr) {
    if (ptr == nullptr) return;
    size_t size = memory_allocsize(ptr);
    memory_free(ptr);
    dagselstats_decrement_used_mem(size);
}

void *block_realloc(void *orig_ptr, size_t new_size) {
    // We need to handle the following two edge cases first. Otherwise, the following
    // calculation of the incremented/decremented amount will fail.
    if (new_size == 0 && orig_ptr != nullptr) {
        block_free(orig_ptr);
        return nullptr;
    }
    if (orig_ptr == nullptr) return block_alloc(new_size);

    size_t orig_size = memory_allocsize(orig_ptr);
    void *new_ptr = memory_realloc(orig_ptr, new_size);
    // actually allocated size may not be same as the requested size
    size_t real_new_size = memory_allocsize(new_ptr);
    if (real_new_size > orig_size)
        dagselstats_increment_used_mem(real_new_size - orig_size);
    else if (real_new_size < orig_size)
        dagselstats_decrement_used_mem(orig_size - real_new_size);

    return new_ptr;
}
