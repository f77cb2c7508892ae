#include <cstring>
#include <string>
#include <utility>
#include <gtest/gtest.h>
#include "dagsel/selector.h"
#include "dagsel/recursion.h"
#include "dagsel/dagsel.h"
#include "dagsel/stats.h"
#include "module_sim.h"

class SelectorTest : public ::testing::Test {
 protected:
    void SetUp() override {
        DagselCode rc = dagselstats_init();
        ASSERT_EQ(rc, DAGSEL_SUCCESS);
        setupValkeyModulePointers();
    }

    DagselCode parse(const std::string &json, SelectorPtr &sel) {
        return dagsel_parse_selector(json.c_str(), json.length(), sel);
    }

    DagselCode parseCondition(const std::string &json, ConditionPtr &cond) {
        return dagsel_parse_condition(json.c_str(), json.length(), cond);
    }
};

TEST_F(SelectorTest, testTypeCodes) {
    EXPECT_STREQ(Selector::typeCode(Selector::MATCHER), ".");
    EXPECT_STREQ(Selector::typeCode(Selector::EXPLORE_ALL), "a");
    EXPECT_STREQ(Selector::typeCode(Selector::EXPLORE_FIELDS), "f");
    EXPECT_STREQ(Selector::typeCode(Selector::EXPLORE_INDEX), "i");
    EXPECT_STREQ(Selector::typeCode(Selector::EXPLORE_RANGE), "r");
    EXPECT_STREQ(Selector::typeCode(Selector::EXPLORE_RECURSIVE), "R");
    EXPECT_STREQ(Selector::typeCode(Selector::EXPLORE_RECURSIVE_EDGE), "@");
    EXPECT_STREQ(Selector::typeCode(Selector::EXPLORE_UNION), "|");
    EXPECT_STREQ(Selector::typeCode(Selector::EXPLORE_CONDITIONAL), "&");
}

TEST_F(SelectorTest, testBuilders) {
    Selector::FieldList fields;
    fields.emplace_back(dsel::string("a"), Selector::matcher("found"));
    fields.emplace_back(dsel::string("b"), Selector::exploreIndex(2, Selector::matcher()));
    SelectorPtr sel = Selector::exploreRecursive(Selector::exploreAll(Selector::exploreRecursiveEdge()),
                                                 Selector::UNBOUNDED_DEPTH, Condition::isLink());
    EXPECT_EQ(sel->type, Selector::EXPLORE_RECURSIVE);
    EXPECT_EQ(sel->maxDepth, UINT64_MAX);
    ASSERT_TRUE(sel->stopAt != nullptr);
    EXPECT_EQ(sel->stopAt->type, Condition::IS_LINK);
    EXPECT_EQ(sel->sequence->type, Selector::EXPLORE_ALL);
    EXPECT_EQ(sel->sequence->next->type, Selector::EXPLORE_RECURSIVE_EDGE);

    SelectorPtr f = Selector::exploreFields(std::move(fields));
    ASSERT_EQ(f->fields.size(), 2);
    EXPECT_STREQ(f->fields[0].first.c_str(), "a");
    EXPECT_TRUE(f->fields[0].second->hasLabel);
    EXPECT_STREQ(f->fields[0].second->label.c_str(), "found");
    EXPECT_EQ(f->fields[1].second->index, 2);

    SelectorPtr r = Selector::exploreRange(1, 3, Selector::matcher());
    EXPECT_EQ(r->start, 1);
    EXPECT_EQ(r->end, 3);
    EXPECT_FALSE(r->next->hasLabel);
}

TEST_F(SelectorTest, testParseMatcher) {
    SelectorPtr sel;
    ASSERT_EQ(parse("{\".\":{}}", sel), DAGSEL_SUCCESS);
    EXPECT_EQ(sel->type, Selector::MATCHER);
    EXPECT_FALSE(sel->hasLabel);
    EXPECT_TRUE(sel->condition == nullptr);

    ASSERT_EQ(parse("{\".\":{\"label\":\"x\",\"onlyIf\":{\"hasField\":\"name\"}}}", sel), DAGSEL_SUCCESS);
    EXPECT_TRUE(sel->hasLabel);
    EXPECT_STREQ(sel->label.c_str(), "x");
    ASSERT_TRUE(sel->condition != nullptr);
    EXPECT_EQ(sel->condition->type, Condition::HAS_FIELD);
    EXPECT_STREQ(sel->condition->field.c_str(), "name");
}

TEST_F(SelectorTest, testParseExplore) {
    SelectorPtr sel;
    ASSERT_EQ(parse("{\"a\":{\">\":{\".\":{}}}}", sel), DAGSEL_SUCCESS);
    EXPECT_EQ(sel->type, Selector::EXPLORE_ALL);
    EXPECT_EQ(sel->next->type, Selector::MATCHER);

    ASSERT_EQ(parse("{\"f\":{\"f>\":{\"z\":{\".\":{}},\"a\":{\"a\":{\">\":{\".\":{}}}}}}}", sel), DAGSEL_SUCCESS);
    EXPECT_EQ(sel->type, Selector::EXPLORE_FIELDS);
    ASSERT_EQ(sel->fields.size(), 2);
    // fields keep their declared order
    EXPECT_STREQ(sel->fields[0].first.c_str(), "z");
    EXPECT_STREQ(sel->fields[1].first.c_str(), "a");
    EXPECT_EQ(sel->fields[1].second->type, Selector::EXPLORE_ALL);

    ASSERT_EQ(parse("{\"i\":{\"i\":3,\">\":{\".\":{}}}}", sel), DAGSEL_SUCCESS);
    EXPECT_EQ(sel->type, Selector::EXPLORE_INDEX);
    EXPECT_EQ(sel->index, 3);

    ASSERT_EQ(parse("{\"r\":{\"^\":1,\"$\":4,\">\":{\".\":{}}}}", sel), DAGSEL_SUCCESS);
    EXPECT_EQ(sel->type, Selector::EXPLORE_RANGE);
    EXPECT_EQ(sel->start, 1);
    EXPECT_EQ(sel->end, 4);

    ASSERT_EQ(parse("{\"r\":{\"^\":2,\"$\":2,\">\":{\".\":{}}}}", sel), DAGSEL_SUCCESS);

    ASSERT_EQ(parse("{\"|\":[{\".\":{}},{\"a\":{\">\":{\".\":{}}}}]}", sel), DAGSEL_SUCCESS);
    EXPECT_EQ(sel->type, Selector::EXPLORE_UNION);
    ASSERT_EQ(sel->members.size(), 2);
    EXPECT_EQ(sel->members[1]->type, Selector::EXPLORE_ALL);

    ASSERT_EQ(parse("{\"|\":[]}", sel), DAGSEL_SUCCESS);
    EXPECT_TRUE(sel->members.empty());

    ASSERT_EQ(parse("{\"&\":{\"&\":{\"%\":\"map\"},\">\":{\".\":{}}}}", sel), DAGSEL_SUCCESS);
    EXPECT_EQ(sel->type, Selector::EXPLORE_CONDITIONAL);
    EXPECT_EQ(sel->condition->type, Condition::HAS_KIND);
    EXPECT_EQ(sel->condition->kind, NODE_KIND_MAP);
}

TEST_F(SelectorTest, testParseRecursive) {
    SelectorPtr sel;
    ASSERT_EQ(parse("{\"R\":{\"l\":{\"depth\":5},\":>\":{\"a\":{\">\":{\"@\":{}}}}}}", sel), DAGSEL_SUCCESS);
    EXPECT_EQ(sel->type, Selector::EXPLORE_RECURSIVE);
    EXPECT_EQ(sel->maxDepth, 5);
    EXPECT_TRUE(sel->stopAt == nullptr);
    EXPECT_EQ(sel->sequence->next->type, Selector::EXPLORE_RECURSIVE_EDGE);

    ASSERT_EQ(parse("{\"R\":{\"l\":{\"none\":{}},\":>\":{\"@\":{}},\"!\":{\"/\":{}}}}", sel), DAGSEL_SUCCESS);
    EXPECT_EQ(sel->maxDepth, Selector::UNBOUNDED_DEPTH);
    ASSERT_TRUE(sel->stopAt != nullptr);
    EXPECT_EQ(sel->stopAt->type, Condition::IS_LINK);

    // an edge without an enclosing recursion decodes fine, it fails at traversal time
    ASSERT_EQ(parse("{\"@\":{}}", sel), DAGSEL_SUCCESS);
    EXPECT_EQ(sel->type, Selector::EXPLORE_RECURSIVE_EDGE);
}

TEST_F(SelectorTest, testParseConditions) {
    ConditionPtr cond;
    ASSERT_EQ(parseCondition("{\"=\":5}", cond), DAGSEL_SUCCESS);
    EXPECT_EQ(cond->type, Condition::HAS_VALUE);
    EXPECT_EQ(cond->value.kind, NODE_KIND_INT);
    EXPECT_EQ(cond->value.intVal, 5);

    ASSERT_EQ(parseCondition("{\"=\":5.5}", cond), DAGSEL_SUCCESS);
    EXPECT_EQ(cond->value.kind, NODE_KIND_FLOAT);

    ASSERT_EQ(parseCondition("{\"=\":\"abc\"}", cond), DAGSEL_SUCCESS);
    EXPECT_EQ(cond->value.kind, NODE_KIND_STRING);
    EXPECT_EQ(cond->value.strVal, "abc");

    ASSERT_EQ(parseCondition("{\"=\":{\"/\":{\"bytes\":\"AAE\"}}}", cond), DAGSEL_SUCCESS);
    EXPECT_EQ(cond->value.kind, NODE_KIND_BYTES);
    EXPECT_EQ(cond->value.strVal, "AAE");

    ASSERT_EQ(parseCondition("{\"=\":null}", cond), DAGSEL_SUCCESS);
    EXPECT_EQ(cond->value.kind, NODE_KIND_NULL);

    ASSERT_EQ(parseCondition("{\"greaterThan\":10}", cond), DAGSEL_SUCCESS);
    EXPECT_EQ(cond->type, Condition::GREATER_THAN);
    ASSERT_EQ(parseCondition("{\"lessThan\":\"m\"}", cond), DAGSEL_SUCCESS);
    EXPECT_EQ(cond->type, Condition::LESS_THAN);

    ASSERT_EQ(parseCondition("{\"and\":[{\"hasField\":\"a\"},{\"or\":[{\"/\":{}},{\"%\":\"list\"}]}]}", cond),
              DAGSEL_SUCCESS);
    EXPECT_EQ(cond->type, Condition::AND);
    EXPECT_EQ(cond->size(), 5);
    EXPECT_EQ(cond->operands[1]->type, Condition::OR);
    EXPECT_EQ(cond->operands[1]->operands[1]->kind, NODE_KIND_LIST);

    ASSERT_EQ(parseCondition("{\"or\":[]}", cond), DAGSEL_SUCCESS);
    EXPECT_TRUE(cond->operands.empty());
}

TEST_F(SelectorTest, testParseConditionErrors) {
    ConditionPtr cond;
    EXPECT_EQ(parseCondition("{\"%\":\"object\"}", cond), DAGSEL_INVALID_KIND);
    EXPECT_EQ(parseCondition("{\"hasField\":1}", cond), DAGSEL_INVALID_CONDITION);
    EXPECT_EQ(parseCondition("{\"greaterThan\":true}", cond), DAGSEL_INVALID_CONDITION);
    EXPECT_EQ(parseCondition("{\"lessThan\":[1]}", cond), DAGSEL_INVALID_CONDITION);
    EXPECT_EQ(parseCondition("{\"=\":{\"a\":1}}", cond), DAGSEL_INVALID_CONDITION);
    EXPECT_EQ(parseCondition("{\"/\":1}", cond), DAGSEL_INVALID_CONDITION);
    EXPECT_EQ(parseCondition("{\"and\":{}}", cond), DAGSEL_INVALID_CONDITION);
    EXPECT_EQ(parseCondition("{\"and\":[1]}", cond), DAGSEL_INVALID_CONDITION);
    EXPECT_EQ(parseCondition("{\"xor\":[]}", cond), DAGSEL_INVALID_CONDITION);
    EXPECT_EQ(parseCondition("{\"hasField\":\"a\",\"=\":1}", cond), DAGSEL_INVALID_CONDITION);
    EXPECT_EQ(parseCondition("[]", cond), DAGSEL_INVALID_CONDITION);
    EXPECT_EQ(parseCondition("{", cond), DAGSEL_SELECTOR_PARSE_ERROR);
}

TEST_F(SelectorTest, testParseErrors) {
    const char *invalid[] = {
        "{}",
        "[]",
        "1",
        "{\"x\":{}}",
        "{\"ab\":{}}",
        "{\".\":{},\"a\":{}}",
        "{\".\":{\"label\":1}}",
        "{\".\":{\"other\":1}}",
        "{\"a\":{}}",
        "{\"a\":{\">\":{}}}",
        "{\"a\":{\">\":{\".\":{}},\"x\":1}}",
        "{\"f\":{\"f>\":[]}}",
        "{\"f\":{}}",
        "{\"i\":{\"i\":-1,\">\":{\".\":{}}}}",
        "{\"i\":{\"i\":1.5,\">\":{\".\":{}}}}",
        "{\"i\":{\">\":{\".\":{}}}}",
        "{\"r\":{\"^\":3,\"$\":1,\">\":{\".\":{}}}}",
        "{\"r\":{\"^\":0,\">\":{\".\":{}}}}",
        "{\"R\":{\":>\":{\"@\":{}}}}",
        "{\"R\":{\"l\":{\"depth\":-1},\":>\":{\"@\":{}}}}",
        "{\"R\":{\"l\":{\"none\":1},\":>\":{\"@\":{}}}}",
        "{\"R\":{\"l\":{\"forever\":{}},\":>\":{\"@\":{}}}}",
        "{\"R\":{\"l\":{\"depth\":1}}}",
        "{\"@\":{\"x\":1}}",
        "{\"|\":{}}",
        "{\"|\":[1]}",
        "{\"&\":{\">\":{\".\":{}}}}",
    };
    for (auto json : invalid) {
        SelectorPtr sel;
        EXPECT_EQ(parse(json, sel), DAGSEL_INVALID_SELECTOR) << json;
        EXPECT_TRUE(sel == nullptr) << json;
    }

    SelectorPtr sel;
    EXPECT_EQ(parse("{\"a\":", sel), DAGSEL_SELECTOR_PARSE_ERROR);
    EXPECT_EQ(parse("", sel), DAGSEL_SELECTOR_PARSE_ERROR);
    EXPECT_EQ(parse("{\".\":{\"onlyIf\":{\"%\":\"thing\"}}}", sel), DAGSEL_INVALID_KIND);
    EXPECT_EQ(parse("{\"&\":{\"&\":{\"bad\":1},\">\":{\".\":{}}}}", sel), DAGSEL_INVALID_CONDITION);
    EXPECT_EQ(parse("{\"R\":{\"l\":{\"depth\":1},\":>\":{\"@\":{}},\"!\":{}}}", sel), DAGSEL_INVALID_CONDITION);
}

TEST_F(SelectorTest, testDuplicateFieldNames) {
    SelectorPtr sel;
    EXPECT_EQ(parse("{\"f\":{\"f>\":{\"a\":{\".\":{}},\"a\":{\".\":{}}}}}", sel), DAGSEL_INVALID_SELECTOR);
}

TEST_F(SelectorTest, testSelectorSizeLimit) {
    std::string json = "{\".\":{}}";
    json.append(dagsel_get_max_selector_size(), ' ');
    SelectorPtr sel;
    EXPECT_EQ(parse(json, sel), DAGSEL_SELECTOR_SIZE_LIMIT_EXCEEDED);
    ConditionPtr cond;
    EXPECT_EQ(parseCondition(json, cond), DAGSEL_SELECTOR_SIZE_LIMIT_EXCEEDED);
}

TEST_F(SelectorTest, testParserRecursionDepthLimit) {
    size_t limit = dagsel_get_max_parser_recursion_depth();
    auto nested = [](size_t levels) {
        std::string json;
        for (size_t i = 0; i < levels; i++) json.append("{\"a\":{\">\":");
        json.append("{\".\":{}}");
        for (size_t i = 0; i < levels; i++) json.append("}}");
        return json;
    };
    SelectorPtr sel;
    // levels explore nodes plus the matcher
    EXPECT_EQ(parse(nested(limit - 1), sel), DAGSEL_SUCCESS);
    EXPECT_EQ(parse(nested(limit), sel), DAGSEL_PARSER_RECURSION_DEPTH_LIMIT_EXCEEDED);

    std::string cond;
    for (size_t i = 0; i <= limit; i++) cond.append("{\"and\":[");
    cond.append("{\"/\":{}}");
    for (size_t i = 0; i <= limit; i++) cond.append("]}");
    ConditionPtr c;
    EXPECT_EQ(parseCondition(cond, c), DAGSEL_PARSER_RECURSION_DEPTH_LIMIT_EXCEEDED);
}

TEST_F(SelectorTest, testSequenceHasEdge) {
    SelectorPtr sel;
    ASSERT_EQ(parse("{\"a\":{\">\":{\"@\":{}}}}", sel), DAGSEL_SUCCESS);
    EXPECT_TRUE(RecursionController::sequenceHasEdge(*sel));
    ASSERT_EQ(parse("{\"f\":{\"f>\":{\"x\":{\".\":{}},\"y\":{\"|\":[{\".\":{}},{\"@\":{}}]}}}}", sel),
              DAGSEL_SUCCESS);
    EXPECT_TRUE(RecursionController::sequenceHasEdge(*sel));
    ASSERT_EQ(parse("{\"&\":{\"&\":{\"/\":{}},\">\":{\"i\":{\"i\":0,\">\":{\"@\":{}}}}}}", sel), DAGSEL_SUCCESS);
    EXPECT_TRUE(RecursionController::sequenceHasEdge(*sel));
    ASSERT_EQ(parse("{\"a\":{\">\":{\".\":{}}}}", sel), DAGSEL_SUCCESS);
    EXPECT_FALSE(RecursionController::sequenceHasEdge(*sel));
    // an edge inside a nested recursion belongs to the nested one
    ASSERT_EQ(parse("{\"a\":{\">\":{\"R\":{\"l\":{\"depth\":1},\":>\":{\"@\":{}}}}}}", sel), DAGSEL_SUCCESS);
    EXPECT_FALSE(RecursionController::sequenceHasEdge(*sel));
}
