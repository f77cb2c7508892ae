/**
 * Memory shim for the module.
 *
 * All memory the module allocates, whether for parsed blocks, selector trees or transient traversal state,
 * goes through the function pointers below, which in turn call Valkey's allocator. That way the memory is
 * reported to the Valkey engine (MEMORY STATS) and the module can keep its own running total.
 */
#ifndef VALKEYDAGSELMODULE_DAGSEL_MEMORY_H_
#define VALKEYDAGSELMODULE_DAGSEL_MEMORY_H_

#include <stddef.h>

#include <vector>
#include <unordered_set>
#include <unordered_map>
#include <string>
#include <string_view>

//
// All functions in the module (outside of memory.cc) should use these to allocate memory
// instead of the ValkeyModule_xxxx functions.
//
extern void *(*memory_alloc)(size_t size);
extern void (*memory_free)(void *ptr);
extern void *(*memory_realloc)(void *orig_ptr, size_t new_size);
extern size_t (*memory_allocsize)(void *ptr);

//
// Install the allocator functions. Must be called once, after the ValkeyModule_xxxx allocation
// functions are available and before any allocation is made.
//
void memory_init();

//
// Total memory usage.
//
//  (1) Includes block_alloc memory usage. block_alloc tracks DAG-JSON data of loaded blocks
//  (2) Includes selector trees and traversal state
//  (3) Includes STL library allocations
//
extern size_t memory_usage();

//
// Classes for STL Containers that utilize memory usage logic.
//
namespace dsel
{
//
// Our custom allocator
//
template <typename T> class stl_allocator : public std::allocator<T> {
 public:
    typedef T value_type;
    stl_allocator() = default;
    stl_allocator(std::allocator<T>&) {}
    stl_allocator(std::allocator<T>&&) {}
    template <class U> constexpr stl_allocator(const stl_allocator<U>&) noexcept {}
    template <class U> struct rebind { typedef stl_allocator<U> other; };

    T *allocate(std::size_t n) { return static_cast<T *>(memory_alloc(n*sizeof(T))); }
    void deallocate(T *p, std::size_t n) { (void)n; memory_free(p); }
};

template <class T, class U>
bool operator==(const stl_allocator<T>&, const stl_allocator<U>&) { return true; }
template <class T, class U>
bool operator!=(const stl_allocator<T>&, const stl_allocator<U>&) { return false; }

template<class Elm> using vector = std::vector<Elm, stl_allocator<Elm>>;


template<class Key, class Hash = std::hash<Key>, class KeyEqual = std::equal_to<Key>>
        using unordered_set = std::unordered_set<Key, Hash, KeyEqual, stl_allocator<Key>>;

template<class Key, class T, class Hash = std::hash<Key>, class KeyEqual = std::equal_to<Key>>
        using unordered_map = std::unordered_map<Key, T, Hash, KeyEqual, stl_allocator<std::pair<const Key, T>>>;

typedef std::basic_string<char, std::char_traits<char>, stl_allocator<char>> string;

}  // namespace dsel

// custom specialization of std::hash can be injected in namespace std
template<>
struct std::hash<dsel::string>
{
    std::size_t operator()(const dsel::string& s) const noexcept {
        return std::hash<std::string_view>{}(std::string_view(s.c_str(), s.length()));
    }
};

#endif  // VALKEYDAGSELMODULE_DAGSEL_MEMORY_H_
