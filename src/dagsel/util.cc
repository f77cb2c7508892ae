#include "dagsel/util.h"
#include <cstring>

const char *dagselutil_code_to_message(DagselCode code) {
    switch (code) {
        case DAGSEL_SUCCESS:
        case DAGSEL_WRONG_NUM_ARGS:
            // only used as code, no message needed
            break;
        case DAGSEL_COMMAND_SYNTAX_ERROR: return "SYNTAXERR Command syntax error";
        case DAGSEL_JSON_PARSE_ERROR: return "SYNTAXERR Failed to parse JSON string due to syntax error";
        case DAGSEL_SELECTOR_PARSE_ERROR: return "SYNTAXERR Failed to parse selector due to syntax error";
        case DAGSEL_INVALID_SELECTOR: return "SYNTAXERR Invalid selector";
        case DAGSEL_INVALID_CONDITION: return "SYNTAXERR Invalid condition";
        case DAGSEL_INVALID_KIND: return "SYNTAXERR Invalid node kind";
        case DAGSEL_SELECTOR_SIZE_LIMIT_EXCEEDED: return "LIMIT Selector size limit is exceeded";
        case DAGSEL_PARSER_RECURSION_DEPTH_LIMIT_EXCEEDED: return "LIMIT Parser recursion depth is exceeded";
        case DAGSEL_BLOCK_SIZE_LIMIT_EXCEEDED: return "LIMIT Block size limit is exceeded";
        case DAGSEL_BLOCK_DEPTH_LIMIT_EXCEEDED: return "LIMIT Block nesting depth limit is exceeded";
        case DAGSEL_BLOCK_KEY_NOT_FOUND: return "NONEXISTENT Block key does not exist";
        case DAGSEL_NOT_A_BLOCK_KEY: return "WRONGTYPE Not a block key";
        case DAGSEL_BLOCK_PARSE_ERROR: return "ERROR Stored block is not valid DAG-JSON";
        case DAGSEL_LINK_TARGET_NOT_FOUND: return "NONEXISTENT Link target does not exist";
        case DAGSEL_NOT_A_LINK: return "WRONGTYPE Node is not a link";
        case DAGSEL_LINK_ACCESS_DENIED: return "NOPERM User has no permission to read the link target";
        case DAGSEL_RECURSIVE_EDGE_WITHOUT_FRAME:
            return "STRUCTURE ExploreRecursiveEdge has no enclosing ExploreRecursive";
        case DAGSEL_RECURSIVE_SEQUENCE_WITHOUT_EDGE:
            return "STRUCTURE ExploreRecursive sequence has no reachable ExploreRecursiveEdge";
        case DAGSEL_CONDITION_BUDGET_EXCEEDED: return "LIMIT Condition evaluation budget is exhausted";
        case DAGSEL_TRAVERSAL_BUDGET_EXCEEDED: return "LIMIT Traversal node budget is exhausted";
        case DAGSEL_TRAVERSAL_DEPTH_LIMIT_EXCEEDED: return "LIMIT Traversal depth limit is exceeded";
        case DAGSEL_TRAVERSAL_TIMEOUT: return "LIMIT Traversal time limit is exceeded";
        case DAGSEL_TRAVERSAL_CANCELLED: return "CANCELLED Traversal was cancelled";
        default: ValkeyModule_Assert(false);
    }
    return "";
}

bool dagselutil_is_structural_error(DagselCode code) {
    return (code == DAGSEL_RECURSIVE_EDGE_WITHOUT_FRAME ||
            code == DAGSEL_RECURSIVE_SEQUENCE_WITHOUT_EDGE);
}

bool dagselutil_is_resource_limit_error(DagselCode code) {
    return (code == DAGSEL_CONDITION_BUDGET_EXCEEDED ||
            code == DAGSEL_TRAVERSAL_BUDGET_EXCEEDED ||
            code == DAGSEL_TRAVERSAL_DEPTH_LIMIT_EXCEEDED ||
            code == DAGSEL_TRAVERSAL_TIMEOUT ||
            code == DAGSEL_TRAVERSAL_CANCELLED);
}

bool dagselutil_is_accessor_error(DagselCode code) {
    return (code == DAGSEL_LINK_TARGET_NOT_FOUND ||
            code == DAGSEL_NOT_A_BLOCK_KEY ||
            code == DAGSEL_BLOCK_PARSE_ERROR ||
            code == DAGSEL_BLOCK_DEPTH_LIMIT_EXCEEDED ||
            code == DAGSEL_NOT_A_LINK ||
            code == DAGSEL_LINK_ACCESS_DENIED);
}

int dagselutil_compare_double(const double a, const double b) {
    if (a < b) return -1;
    if (a > b) return 1;
    return 0;
}

int dagselutil_compare_int64_double(const int64_t a, const double b) {
    if (std::isnan(b)) return 1;
    // 2^63 is exactly representable, INT64_MAX is not
    if (b >=9223372036854775808.0) return -1;
    if (b < -9223372036854775808.0) return 1;
    int64_t b_l = static_cast<int64_t>(b);  // truncates toward zero
    if (a < b_l) return -1;
    if (a > b_l) return 1;
    double frac = b - static_cast<double>(b_l);
    if (frac > 0) return -1;
    if (frac < 0) return 1;
    return 0;
}

bool dagselutil_is_int64(const double a) {
    if (!(a >= -9223372036854775808.0 && a < 9223372036854775808.0)) return false;
    int64_t a_l = static_cast<int64_t>(a);
    double b = static_cast<double>(a_l);
    return (a <= b && a >= b);
}
