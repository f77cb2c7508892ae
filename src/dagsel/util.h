/**
 * This is the utility module, containing shared utility and helper code.
 *
 * Coding Conventions & Best Practices:
 * 1. Every public interface method declared in this file should be prefixed with "dagselutil_".
 * 2. Generally speaking, interface methods should not have Valkey module types such as ValkeyModuleCtx
 *    or ValkeyModuleString, because that would make unit tests hard to write, unless gmock classes
 *    have been developed.
 */
#ifndef VALKEYDAGSELMODULE_DAGSEL_UTIL_H_
#define VALKEYDAGSELMODULE_DAGSEL_UTIL_H_

#include <stdint.h>
#include <cmath>

extern "C" {
#define VALKEYMODULE_EXPERIMENTAL_API
#include <valkeymodule.h>
}

typedef enum {
    DAGSEL_SUCCESS = 0,
    DAGSEL_WRONG_NUM_ARGS,
    DAGSEL_COMMAND_SYNTAX_ERROR,
    DAGSEL_JSON_PARSE_ERROR,
    DAGSEL_SELECTOR_PARSE_ERROR,
    DAGSEL_INVALID_SELECTOR,
    DAGSEL_INVALID_CONDITION,
    DAGSEL_INVALID_KIND,
    DAGSEL_SELECTOR_SIZE_LIMIT_EXCEEDED,
    DAGSEL_PARSER_RECURSION_DEPTH_LIMIT_EXCEEDED,
    DAGSEL_BLOCK_SIZE_LIMIT_EXCEEDED,
    DAGSEL_BLOCK_DEPTH_LIMIT_EXCEEDED,
    DAGSEL_BLOCK_KEY_NOT_FOUND,
    DAGSEL_NOT_A_BLOCK_KEY,
    DAGSEL_BLOCK_PARSE_ERROR,
    DAGSEL_LINK_TARGET_NOT_FOUND,
    DAGSEL_NOT_A_LINK,
    DAGSEL_LINK_ACCESS_DENIED,
    DAGSEL_RECURSIVE_EDGE_WITHOUT_FRAME,
    DAGSEL_RECURSIVE_SEQUENCE_WITHOUT_EDGE,
    DAGSEL_CONDITION_BUDGET_EXCEEDED,
    DAGSEL_TRAVERSAL_BUDGET_EXCEEDED,
    DAGSEL_TRAVERSAL_DEPTH_LIMIT_EXCEEDED,
    DAGSEL_TRAVERSAL_TIMEOUT,
    DAGSEL_TRAVERSAL_CANCELLED,
    DAGSEL_LAST
} DagselCode;

/* Get message for a given code. */
const char *dagselutil_code_to_message(DagselCode code);

/* A structural error means the selector itself is malformed. It aborts the traversal immediately. */
bool dagselutil_is_structural_error(DagselCode code);

/* A resource limit error means a budget, deadline or cancellation stopped the traversal. */
bool dagselutil_is_resource_limit_error(DagselCode code);

/* An accessor error means a node could not be fetched, e.g., a link target is missing, unreadable, nests too
 * deep, or the current user may not read it.
 * Depending on the link policy, the failing branch either aborts the traversal or is skipped.
 */
bool dagselutil_is_accessor_error(DagselCode code);

/* Compare two doubles. Returns -1, 0 or 1. Unordered values (NaN) compare as 0. */
int dagselutil_compare_double(const double a, const double b);

/* Compare an int64 against a double without losing precision for large integers.
 * Returns -1, 0 or 1. A NaN on the right hand side compares as smaller than any integer.
 */
int dagselutil_compare_int64_double(const int64_t a, const double b);

/* Check if a double value is int64.
 * If the given double does not equal an integer (int64), return false.
 * If the given double is out of range of int64, return false.
 */
bool dagselutil_is_int64(const double a);

#endif  // VALKEYDAGSELMODULE_DAGSEL_UTIL_H_
