/**
 * This file implements the Valkey Module interfaces.
 *
 * When the module is loaded, it does the following:
 * 1. register the dagsel module.
 * 2. install the memory allocator and initialize metrics.
 * 3. register commands that are all prefixed with "DAG.".
 * 4. register module configs.
 *
 * Blocks are stored as plain Valkey strings holding DAG-JSON. A link {"/": "<key>"} inside a block refers to
 * the block stored under <key>. DAG.SELECT loads the root block, then loads linked blocks on demand while
 * the selector walks the data.
 *
 * Design Considerations:
 * 1. All selector work is delegated to the evaluator. Block loading is delegated to the block layer through
 *    the ValkeyBlockSource below, which is the only place that reads Valkey keys on behalf of a traversal.
 * 2. The first line of every command handler should be: "ValkeyModule_AutoMemory(ctx);". This is for enabling
 *    auto memory management for the command.
 * 3. Every write command must support replication. Call "ValkeyModule_ReplicateVerbatim(ctx)" to tell Valkey to
 *    replicate the command.
 * 4. Any write command that increases total memory utilization, should be created using "write deny-oom" flags.
 *
 * Coding Conventions & Best Practices:
 * 1. Every command handler is named as Command_DagXXX, where XXX is command name.
 * 2. Command arguments processing code are separated out into helper structs named as XXXCmdArgs, and helper
 *    methods named as parseXXXCmdArgs, where XXX is command name.
 */

#include "dagsel/dagsel.h"
#include "dagsel/util.h"
#include "dagsel/memory.h"
#include "dagsel/stats.h"
#include "dagsel/block.h"
#include "dagsel/selector.h"
#include "dagsel/evaluator.h"
#include "dagsel/rapidjson_includes.h"
#include <strings.h>
#include <climits>
#include <cstring>
#include <string>
#include <string_view>
#include <memory>
#include <tuple>

#define MODULE_VERSION 10000
#define MODULE_NAME "dagsel"

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

#define DEFAULT_MAX_TRAVERSAL_NODES 1000000
static size_t config_max_traversal_nodes = DEFAULT_MAX_TRAVERSAL_NODES;

#define DEFAULT_MAX_TRAVERSAL_DEPTH 1000
static size_t config_max_traversal_depth = DEFAULT_MAX_TRAVERSAL_DEPTH;

#define DEFAULT_CONDITION_BUDGET 256
static size_t config_condition_budget = DEFAULT_CONDITION_BUDGET;

#define DEFAULT_MAX_TRAVERSAL_TIME_MS 0  // no timeout
static size_t config_max_traversal_time_ms = DEFAULT_MAX_TRAVERSAL_TIME_MS;

#define DEFAULT_MAX_SELECTOR_SIZE (64 * 1024)  // 64KB
static size_t config_max_selector_size = DEFAULT_MAX_SELECTOR_SIZE;

#define DEFAULT_MAX_PARSER_RECURSION_DEPTH 200
static size_t config_max_parser_recursion_depth = DEFAULT_MAX_PARSER_RECURSION_DEPTH;

#define DEFAULT_MAX_BLOCK_SIZE (64 * 1024 * 1024)  // 64MB
static size_t config_max_block_size = DEFAULT_MAX_BLOCK_SIZE;

#define DEFAULT_MAX_BLOCK_DEPTH 128
static size_t config_max_block_depth = DEFAULT_MAX_BLOCK_DEPTH;

static int config_skip_unreachable_links = 0;
static int instrument_enabled_traversal = 0;

size_t dagsel_get_max_traversal_nodes() {
    return config_max_traversal_nodes;
}

size_t dagsel_get_max_traversal_depth() {
    return config_max_traversal_depth;
}

size_t dagsel_get_condition_budget() {
    return config_condition_budget;
}

size_t dagsel_get_max_traversal_time_ms() {
    return config_max_traversal_time_ms;
}

size_t dagsel_get_max_selector_size() {
    return config_max_selector_size;
}

size_t dagsel_get_max_parser_recursion_depth() {
    return config_max_parser_recursion_depth;
}

size_t dagsel_get_max_block_size() {
    return config_max_block_size;
}

size_t dagsel_get_max_block_depth() {
    return config_max_block_depth;
}

bool dagsel_is_skip_unreachable_links() {
    return config_skip_unreachable_links == 1;
}

bool dagsel_is_instrument_enabled_traversal() {
    return instrument_enabled_traversal == 1;
}

#define CHECK_BLOCK_SIZE_LIMIT(ctx, block_size) \
if (!(ValkeyModule_GetContextFlags(ctx) & VALKEYMODULE_CTX_FLAGS_REPLICATED) && \
    dagsel_get_max_block_size() > 0 && (block_size > dagsel_get_max_block_size())) { \
    return ValkeyModule_ReplyWithError(ctx, dagselutil_code_to_message(DAGSEL_BLOCK_SIZE_LIMIT_EXCEEDED)); \
}

#define REGISTER_BOOL_CONFIG(ctx, name, default_val, privdata, getfn, setfn) { \
    if (ValkeyModule_RegisterBoolConfig(ctx, name, default_val, VALKEYMODULE_CONFIG_DEFAULT, \
        getfn, setfn, nullptr, privdata) == VALKEYMODULE_ERR) { \
        ValkeyModule_Log(ctx, "warning", "Failed to register module config \"%s\".", name); \
        return VALKEYMODULE_ERR; \
    } \
}

#define REGISTER_NUMERIC_CONFIG(ctx, name, default_val, flag, min, max, privdata, getfn, setfn) { \
    if (ValkeyModule_RegisterNumericConfig(ctx, name, default_val, flag, min, max, \
        getfn, setfn, nullptr, privdata) == VALKEYMODULE_ERR ) { \
        ValkeyModule_Log(ctx, "warning", "Failed to register module config \"%s\".", name); \
        return VALKEYMODULE_ERR; \
    } \
}

/* ============================== Helper Methods ============================== */

/**
 * BlockSource over Valkey string keys. Keys are opened read-only and closed by auto memory when the command
 * returns, so the string views handed out stay valid for the whole command.
 *
 * Only the root key is declared in the command's key specs. Every key read here is therefore checked against
 * the ACL key patterns of the calling user, so a link cannot expose a key the user may not read. Without a
 * calling user (e.g., the command is executed by the server itself) no check is made.
 */
class ValkeyBlockSource : public BlockSource {
 public:
    explicit ValkeyBlockSource(ValkeyModuleCtx *c) : ctx(c), user(nullptr) {
        ValkeyModuleString *name = ValkeyModule_GetCurrentUserName(ctx);
        if (name != nullptr) user = ValkeyModule_GetModuleUserFromUserName(name);
    }

    ~ValkeyBlockSource() {
        if (user != nullptr) ValkeyModule_FreeModuleUser(user);
    }

    DagselCode read(const std::string_view &key_sv, std::string_view &json) {
        ValkeyModuleString *key_str = ValkeyModule_CreateString(ctx, key_sv.data(), key_sv.length());
        if (user != nullptr &&
            ValkeyModule_ACLCheckKeyPermissions(user, key_str, VALKEYMODULE_CMD_KEY_ACCESS) != VALKEYMODULE_OK) {
            ValkeyModule_Log(ctx, "verbose", "ACL denies reading block key %.*s",
                             static_cast<int>(key_sv.length()), key_sv.data());
            return DAGSEL_LINK_ACCESS_DENIED;
        }
        ValkeyModuleKey *key = static_cast<ValkeyModuleKey*>(ValkeyModule_OpenKey(ctx, key_str, VALKEYMODULE_READ));
        int type = ValkeyModule_KeyType(key);
        if (type == VALKEYMODULE_KEYTYPE_EMPTY) return DAGSEL_BLOCK_KEY_NOT_FOUND;
        if (type != VALKEYMODULE_KEYTYPE_STRING) return DAGSEL_NOT_A_BLOCK_KEY;
        size_t len;
        const char *buf = ValkeyModule_StringDMA(key, &len, VALKEYMODULE_READ);
        if (buf == nullptr) return DAGSEL_NOT_A_BLOCK_KEY;
        json = std::string_view(buf, len);
        return DAGSEL_SUCCESS;
    }

 private:
    ValkeyBlockSource(const ValkeyBlockSource &);  // disable copy constructor
    ValkeyBlockSource& operator=(const ValkeyBlockSource &);  // disable assignment operator

    ValkeyModuleCtx *ctx;
    ValkeyModuleUser *user;
};

STATIC std::string_view string_view_of(ValkeyModuleString *str) {
    size_t len;
    const char *ptr = ValkeyModule_StringPtrLen(str, &len);
    return std::string_view(ptr, len);
}

STATIC bool is_arg(ValkeyModuleString *arg, const char *name) {
    size_t len;
    const char *ptr = ValkeyModule_StringPtrLen(arg, &len);
    return len == strlen(name) && strncasecmp(ptr, name, len) == 0;
}

/* ============================ Command Arguments ============================ */

typedef struct {
    ValkeyModuleString *key;
    const char *json;
    size_t json_len;
} PutCmdArgs;

STATIC DagselCode parsePutCmdArgs(ValkeyModuleString **argv, const int argc, PutCmdArgs *args) {
    memset(args, 0, sizeof(PutCmdArgs));
    if (argc != 3) return DAGSEL_WRONG_NUM_ARGS;
    args->key = argv[1];
    args->json = ValkeyModule_StringPtrLen(argv[2], &args->json_len);
    return DAGSEL_SUCCESS;
}

typedef struct {
    ValkeyModuleString *key;
    const char *selector;
    size_t selector_len;
    bool with_covered;
    long long max_nodes;   // 0 means use the config
    bool has_link_policy;
    LinkPolicy link_policy;
} SelectCmdArgs;

/*
 * DAG.SELECT <key> <selector> [COVERED] [MAXNODES n] [ONERROR ABORT|SKIP]
 */
STATIC DagselCode parseSelectCmdArgs(ValkeyModuleString **argv, const int argc, SelectCmdArgs *args) {
    memset(args, 0, sizeof(SelectCmdArgs));
    if (argc < 3) return DAGSEL_WRONG_NUM_ARGS;
    args->key = argv[1];
    args->selector = ValkeyModule_StringPtrLen(argv[2], &args->selector_len);

    for (int i = 3; i < argc; i++) {
        if (is_arg(argv[i], "COVERED")) {
            args->with_covered = true;
        } else if (is_arg(argv[i], "MAXNODES")) {
            if (++i >= argc) return DAGSEL_COMMAND_SYNTAX_ERROR;
            if (ValkeyModule_StringToLongLong(argv[i], &args->max_nodes) == VALKEYMODULE_ERR || args->max_nodes <= 0)
                return DAGSEL_COMMAND_SYNTAX_ERROR;
        } else if (is_arg(argv[i], "ONERROR")) {
            if (++i >= argc) return DAGSEL_COMMAND_SYNTAX_ERROR;
            args->has_link_policy = true;
            if (is_arg(argv[i], "ABORT"))
                args->link_policy = LINK_POLICY_ABORT;
            else if (is_arg(argv[i], "SKIP"))
                args->link_policy = LINK_POLICY_SKIP;
            else
                return DAGSEL_COMMAND_SYNTAX_ERROR;
        } else {
            return DAGSEL_COMMAND_SYNTAX_ERROR;
        }
    }
    return DAGSEL_SUCCESS;
}

/* ============================= Command Handlers =========================== */

int Command_DagPut(ValkeyModuleCtx *ctx, ValkeyModuleString **argv, int argc) {
    ValkeyModule_AutoMemory(ctx);

    PutCmdArgs args;
    DagselCode rc = parsePutCmdArgs(argv, argc, &args);
    if (rc != DAGSEL_SUCCESS) {
        if (rc == DAGSEL_WRONG_NUM_ARGS)
            return ValkeyModule_WrongArity(ctx);
        else
            return ValkeyModule_ReplyWithError(ctx, dagselutil_code_to_message(rc));
    }
    CHECK_BLOCK_SIZE_LIMIT(ctx, args.json_len)

    // validate the block
    JBlock *block;
    rc = block_parse(args.json, args.json_len, &block);
    if (rc != DAGSEL_SUCCESS) return ValkeyModule_ReplyWithError(ctx, dagselutil_code_to_message(rc));
    block_destroy(block);

    ValkeyModuleKey *key = static_cast<ValkeyModuleKey*>(ValkeyModule_OpenKey(ctx, args.key,
                                                                           VALKEYMODULE_READ | VALKEYMODULE_WRITE));
    int type = ValkeyModule_KeyType(key);
    if (type != VALKEYMODULE_KEYTYPE_EMPTY && type != VALKEYMODULE_KEYTYPE_STRING)
        return ValkeyModule_ReplyWithError(ctx, dagselutil_code_to_message(DAGSEL_NOT_A_BLOCK_KEY));

    if (ValkeyModule_StringSet(key, argv[2]) == VALKEYMODULE_ERR) {
        ValkeyModule_Log(ctx, "warning", "Failed to store block");
        return ValkeyModule_ReplyWithError(ctx, "ERR failed to store block");
    }
    dagselstats_increment_blocks_written();

    // replicate the command
    ValkeyModule_ReplicateVerbatim(ctx);
    ValkeyModule_NotifyKeyspaceEvent(ctx, VALKEYMODULE_NOTIFY_GENERIC, "dag.put", args.key);
    return ValkeyModule_ReplyWithSimpleString(ctx, "OK");
}

STATIC void reply_matches(ValkeyModuleCtx *ctx, const DagJsonAccessor &accessor,
                          const dsel::vector<MatchEntry> &matches) {
    ValkeyModule_ReplyWithArray(ctx, matches.size());
    for (auto &m : matches) {
        ValkeyModule_ReplyWithArray(ctx, 3);
        ValkeyModule_ReplyWithStringBuffer(ctx, m.path.c_str(), m.path.length());
        if (m.hasLabel)
            ValkeyModule_ReplyWithStringBuffer(ctx, m.label.c_str(), m.label.length());
        else
            ValkeyModule_ReplyWithNull(ctx);
        rapidjson::StringBuffer oss;
        accessor.serialize(m.node, oss);
        ValkeyModule_ReplyWithStringBuffer(ctx, oss.GetString(), oss.GetSize());
    }
}

STATIC void reply_covered(ValkeyModuleCtx *ctx, const dsel::vector<CoveredEntry> &covered) {
    ValkeyModule_ReplyWithArray(ctx, covered.size());
    for (auto &c : covered) {
        ValkeyModule_ReplyWithStringBuffer(ctx, c.path.c_str(), c.path.length());
    }
}

int Command_DagSelect(ValkeyModuleCtx *ctx, ValkeyModuleString **argv, int argc) {
    ValkeyModule_AutoMemory(ctx);

    SelectCmdArgs args;
    DagselCode rc = parseSelectCmdArgs(argv, argc, &args);
    if (rc != DAGSEL_SUCCESS) {
        if (rc == DAGSEL_WRONG_NUM_ARGS)
            return ValkeyModule_WrongArity(ctx);
        else
            return ValkeyModule_ReplyWithError(ctx, dagselutil_code_to_message(rc));
    }

    SelectorPtr selector;
    rc = dagsel_parse_selector(args.selector, args.selector_len, selector);
    if (rc != DAGSEL_SUCCESS) return ValkeyModule_ReplyWithError(ctx, dagselutil_code_to_message(rc));

    ValkeyBlockSource source(ctx);
    DagJsonAccessor accessor(source);
    Node root;
    rc = accessor.load(string_view_of(args.key), root);
    if (rc != DAGSEL_SUCCESS) return ValkeyModule_ReplyWithError(ctx, dagselutil_code_to_message(rc));

    TraversalOptions options;
    if (args.max_nodes > 0) options.maxNodes = static_cast<size_t>(args.max_nodes);
    if (args.has_link_policy) options.linkPolicy = args.link_policy;

    Evaluator evaluator(accessor, options);
    rc = evaluator.traverse(*selector, root);
    if (rc != DAGSEL_SUCCESS) {
        const EvalError &err = evaluator.getError();
        dsel::string msg = dagselutil_code_to_message(rc);
        msg.append(" (selector path: ").append(err.selectorPath)
           .append(", node path: ").append(err.nodePath).append(")");
        return ValkeyModule_ReplyWithError(ctx, msg.c_str());
    }

    const ResultCollector &results = evaluator.getResults();
    if (args.with_covered) {
        ValkeyModule_ReplyWithArray(ctx, 2);
        reply_matches(ctx, accessor, results.getMatches());
        reply_covered(ctx, results.getCovered());
    } else {
        reply_matches(ctx, accessor, results.getMatches());
    }
    return VALKEYMODULE_OK;
}

/* =============================== Module Info =============================== */

// NOTE: Valkey will prefix every section and field name with the module name.
void Module_Info(ValkeyModuleInfoCtx *ctx, int for_crash_report) {
    VALKEYMODULE_NOT_USED(for_crash_report);

#define beginSection(name) \
    if (ValkeyModule_InfoAddSection(ctx, const_cast<char *>(name)) != VALKEYMODULE_ERR) {
#define endSection() }

#define addULongLong(name, value) { \
    if (ValkeyModule_InfoAddFieldULongLong(ctx, const_cast<char *>(name), value) == VALKEYMODULE_ERR) { \
        ValkeyModule_Log(nullptr, "warning", "Can't add info variable %s", name); \
    } \
}

    beginSection("core_metrics")
        addULongLong("block_memory_bytes", dagselstats_get_used_mem());
        addULongLong("total_malloc_bytes_used", memory_usage());
        addULongLong("num_blocks_written", dagselstats_get_num_blocks_written());
    endSection();

    beginSection("traversal_metrics")
        addULongLong("num_traversals", dagselstats_get_num_traversals());
        addULongLong("num_failed_traversals", dagselstats_get_num_failed_traversals());
        addULongLong("num_structural_errors", dagselstats_get_num_structural_errors());
        addULongLong("num_limit_errors", dagselstats_get_num_limit_errors());
        addULongLong("num_accessor_errors", dagselstats_get_num_accessor_errors());
        addULongLong("total_covered", dagselstats_get_total_covered());
        addULongLong("total_matches", dagselstats_get_total_matches());
        addULongLong("total_links_loaded", dagselstats_get_total_links_loaded());
        addULongLong("total_links_skipped", dagselstats_get_total_links_skipped());
        addULongLong("total_condition_evals", dagselstats_get_total_condition_evals());
        addULongLong("max_covered_ever_seen", dagselstats_get_max_covered_ever_seen());
        addULongLong("max_frame_depth_ever_seen", dagselstats_get_max_frame_depth_ever_seen());
    endSection();

    beginSection("histograms")
        char name[128];
        char buf[1024];
        snprintf(name, sizeof(name), "covered_histogram");
        dagselstats_sprint_covered_hist(buf, sizeof(buf));
        ValkeyModule_InfoAddFieldCString(ctx, name, buf);

        snprintf(name, sizeof(name), "histogram_buckets");
        dagselstats_sprint_hist_buckets(buf, sizeof(buf));
        ValkeyModule_InfoAddFieldCString(ctx, name, buf);
    endSection();
}

/* ================================ Configs ================================== */

int Config_GetBoolConfig(const char *name, void *privdata) {
    VALKEYMODULE_NOT_USED(name);
    return *static_cast<int*>(privdata);
}

int Config_SetBoolConfig(const char *name, int val, void *privdata, ValkeyModuleString **err) {
    VALKEYMODULE_NOT_USED(name);
    VALKEYMODULE_NOT_USED(err);
    *static_cast<int*>(privdata) = val;
    return VALKEYMODULE_OK;
}

long long Config_GetSizeConfig(const char *name, void *privdata) {
    VALKEYMODULE_NOT_USED(name);
    return *static_cast<size_t*>(privdata);
}

int Config_SetSizeConfig(const char *name, long long val, void *privdata, ValkeyModuleString **err) {
    VALKEYMODULE_NOT_USED(name);
    VALKEYMODULE_NOT_USED(err);
    *static_cast<size_t*>(privdata) = val;
    return VALKEYMODULE_OK;
}

int registerModuleConfigs(ValkeyModuleCtx *ctx) {
    REGISTER_BOOL_CONFIG(ctx, "skip-unreachable-links", 0, &config_skip_unreachable_links,
                         Config_GetBoolConfig, Config_SetBoolConfig)
    REGISTER_BOOL_CONFIG(ctx, "enable-instrument-traversal", 0, &instrument_enabled_traversal,
                         Config_GetBoolConfig, Config_SetBoolConfig)

    REGISTER_NUMERIC_CONFIG(ctx, "max-traversal-nodes", DEFAULT_MAX_TRAVERSAL_NODES, VALKEYMODULE_CONFIG_DEFAULT,
                            1, LLONG_MAX, &config_max_traversal_nodes, Config_GetSizeConfig, Config_SetSizeConfig)
    REGISTER_NUMERIC_CONFIG(ctx, "max-traversal-depth", DEFAULT_MAX_TRAVERSAL_DEPTH, VALKEYMODULE_CONFIG_DEFAULT,
                            1, DAGSEL_MAX_TRAVERSAL_DEPTH_CAP, &config_max_traversal_depth,
                            Config_GetSizeConfig, Config_SetSizeConfig)
    REGISTER_NUMERIC_CONFIG(ctx, "condition-budget", DEFAULT_CONDITION_BUDGET, VALKEYMODULE_CONFIG_DEFAULT,
                            1, INT_MAX, &config_condition_budget, Config_GetSizeConfig, Config_SetSizeConfig)
    REGISTER_NUMERIC_CONFIG(ctx, "max-traversal-time-ms", DEFAULT_MAX_TRAVERSAL_TIME_MS,
                            VALKEYMODULE_CONFIG_DEFAULT, 0, INT_MAX, &config_max_traversal_time_ms,
                            Config_GetSizeConfig, Config_SetSizeConfig)
    REGISTER_NUMERIC_CONFIG(ctx, "max-selector-size", DEFAULT_MAX_SELECTOR_SIZE, VALKEYMODULE_CONFIG_MEMORY,
                            0, INT_MAX, &config_max_selector_size, Config_GetSizeConfig, Config_SetSizeConfig)
    REGISTER_NUMERIC_CONFIG(ctx, "max-parser-recursion-depth", DEFAULT_MAX_PARSER_RECURSION_DEPTH,
                            VALKEYMODULE_CONFIG_DEFAULT, 0, INT_MAX, &config_max_parser_recursion_depth,
                            Config_GetSizeConfig, Config_SetSizeConfig)
    REGISTER_NUMERIC_CONFIG(ctx, "max-block-size", DEFAULT_MAX_BLOCK_SIZE, VALKEYMODULE_CONFIG_MEMORY,
                            0, LLONG_MAX, &config_max_block_size, Config_GetSizeConfig, Config_SetSizeConfig)
    REGISTER_NUMERIC_CONFIG(ctx, "max-block-depth", DEFAULT_MAX_BLOCK_DEPTH, VALKEYMODULE_CONFIG_DEFAULT,
                            1, DAGSEL_MAX_BLOCK_DEPTH_CAP, &config_max_block_depth,
                            Config_GetSizeConfig, Config_SetSizeConfig)
    return VALKEYMODULE_OK;
}

bool set_command_info(ValkeyModuleCtx *ctx, const char *name, int32_t arity, uint64_t keyspec_flags,
                        int bs_index, std::tuple<int, int, int> key_range) {
    // Get command
    ValkeyModuleCommand *command = ValkeyModule_GetCommand(ctx, name);
    if (command == nullptr) {
        ValkeyModule_Log(ctx, "warning", "Failed to get command '%s'", name);
        return false;
    }
    ValkeyModuleCommandInfo info;
    memset(&info, 0, sizeof(info));
    info.version = VALKEYMODULE_COMMAND_INFO_VERSION;
    info.arity = arity;

    // We only need one key_spec entry, but key_specs are sent as a null-entry terminated array,
    // so we leave a second value filled with 0s
    ValkeyModuleCommandKeySpec cmdKeySpec[2];
    memset(cmdKeySpec, 0, sizeof(cmdKeySpec));

    cmdKeySpec[0].flags = keyspec_flags;
    cmdKeySpec[0].begin_search_type = VALKEYMODULE_KSPEC_BS_INDEX;
    cmdKeySpec[0].bs.index = {bs_index};
    cmdKeySpec[0].find_keys_type = VALKEYMODULE_KSPEC_FK_RANGE;
    cmdKeySpec[0].fk.range = {std::get<0>(key_range), std::get<1>(key_range), std::get<2>(key_range)};

    info.key_specs = &cmdKeySpec[0];

    if (ValkeyModule_SetCommandInfo(command, &info) == VALKEYMODULE_ERR) {
        ValkeyModule_Log(ctx, "warning", "Failed to set command info for %s", name);
        return false;
    }
    return true;
}

STATIC bool create_command(ValkeyModuleCtx *ctx, const char *name, ValkeyModuleCmdFunc fn, const char *flags,
                           const char *categories) {
    if (ValkeyModule_CreateCommand(ctx, name, fn, flags, 1, 1, 1) == VALKEYMODULE_ERR) {
        ValkeyModule_Log(ctx, "warning", "Failed to create command %s.", name);
        return false;
    }
    if (ValkeyModule_SetCommandACLCategories(ValkeyModule_GetCommand(ctx, name), categories) == VALKEYMODULE_ERR) {
        ValkeyModule_Log(ctx, "warning", "Failed to set command category for %s.", name);
        return false;
    }
    return true;
}

/* ================================ Module OnLoad ============================= */

extern "C" int ValkeyModule_OnLoad(ValkeyModuleCtx *ctx) {
    // Register the module
    if (ValkeyModule_Init(ctx, MODULE_NAME, MODULE_VERSION, VALKEYMODULE_APIVER_1) == VALKEYMODULE_ERR) {
        ValkeyModule_Log(ctx, "warning", "Failed to initialize module %s version %d", MODULE_NAME, MODULE_VERSION);
        return VALKEYMODULE_ERR;
    }

    // Must precede any allocation made by the module
    memory_init();

    // Initialize metrics
    DagselCode rc = dagselstats_init();
    if (rc != DAGSEL_SUCCESS) {
        ValkeyModule_Log(ctx, "warning", "%s", dagselutil_code_to_message(rc));
        return VALKEYMODULE_ERR;
    }

    // Register info callback
    if (ValkeyModule_RegisterInfoFunc(ctx, Module_Info) == VALKEYMODULE_ERR) {
        ValkeyModule_Log(ctx, "warning", "Failed to register module info callback.");
        return VALKEYMODULE_ERR;
    }

    char dagsel_category[] = "dagsel";
    if (ValkeyModule_AddACLCategory(ctx, dagsel_category) == VALKEYMODULE_ERR)
        return VALKEYMODULE_ERR;

    const char *cmdflg_readonly        = "readonly";
    const char *cmdflg_slow_write_deny = "write deny-oom";
    const char *cat_readonly           = "dagsel read slow";
    const char *cat_slow_write_deny    = "dagsel write slow";

    // Register commands
    if (!create_command(ctx, "DAG.PUT", Command_DagPut, cmdflg_slow_write_deny, cat_slow_write_deny))
        return VALKEYMODULE_ERR;
    if (!create_command(ctx, "DAG.SELECT", Command_DagSelect, cmdflg_readonly, cat_readonly))
        return VALKEYMODULE_ERR;

    const uint64_t ks_overwrite = VALKEYMODULE_CMD_KEY_OW | VALKEYMODULE_CMD_KEY_UPDATE;
    const uint64_t ks_read_only_access = VALKEYMODULE_CMD_KEY_RO | VALKEYMODULE_CMD_KEY_ACCESS;
    if (!set_command_info(ctx, "DAG.PUT", 3, ks_overwrite, 1, std::make_tuple(0, 1, 0))) {
        return VALKEYMODULE_ERR;
    }
    if (!set_command_info(ctx, "DAG.SELECT", -3, ks_read_only_access, 1, std::make_tuple(0, 1, 0))) {
        return VALKEYMODULE_ERR;
    }

    if (registerModuleConfigs(ctx) == VALKEYMODULE_ERR) return VALKEYMODULE_ERR;

    return VALKEYMODULE_OK;
}
