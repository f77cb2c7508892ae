#include <cmath>
#include <string>
#include <utility>
#include <gtest/gtest.h>
#include "dagsel/condition.h"
#include "dagsel/block.h"
#include "dagsel/stats.h"
#include "module_sim.h"
#include "block_sim.h"

class ConditionTest : public ::testing::Test {
 protected:
    void SetUp() override {
        DagselCode rc = dagselstats_init();
        ASSERT_EQ(rc, DAGSEL_SUCCESS);
        setupValkeyModulePointers();
        src.put("root", "{\"name\":\"bob\",\"age\":42,\"score\":42.0,\"ratio\":0.25,\"ok\":true,\"none\":null,"
                        "\"blob\":{\"/\":{\"bytes\":\"Ym9i\"}},\"next\":{\"/\":\"other\"},\"list\":[1]}");
        accessor.reset(new DagJsonAccessor(src));
        ASSERT_EQ(accessor->load("root", root), DAGSEL_SUCCESS);
    }

    void TearDown() override {
        accessor.reset();
    }

    Node field(const char *name) {
        Node n;
        EXPECT_TRUE(accessor->child(root, name, n)) << name;
        return n;
    }

    bool eval(const Condition &cond, const Node &node) {
        ConditionEngine engine(*accessor, 1000);
        bool result = false;
        EXPECT_EQ(engine.evaluate(cond, node, result), DAGSEL_SUCCESS);
        return result;
    }

    MapBlockSource src;
    std::unique_ptr<DagJsonAccessor> accessor;
    Node root;
};

TEST_F(ConditionTest, testHasField) {
    EXPECT_TRUE(eval(*Condition::hasField("name"), root));
    EXPECT_FALSE(eval(*Condition::hasField("missing"), root));
    // only maps have fields
    EXPECT_FALSE(eval(*Condition::hasField("0"), field("list")));
    EXPECT_FALSE(eval(*Condition::hasField("/"), field("next")));
}

TEST_F(ConditionTest, testHasKind) {
    EXPECT_TRUE(eval(*Condition::hasKind(NODE_KIND_MAP), root));
    EXPECT_TRUE(eval(*Condition::hasKind(NODE_KIND_STRING), field("name")));
    EXPECT_TRUE(eval(*Condition::hasKind(NODE_KIND_INT), field("age")));
    EXPECT_TRUE(eval(*Condition::hasKind(NODE_KIND_FLOAT), field("ratio")));
    EXPECT_TRUE(eval(*Condition::hasKind(NODE_KIND_BYTES), field("blob")));
    EXPECT_TRUE(eval(*Condition::hasKind(NODE_KIND_LINK), field("next")));
    EXPECT_FALSE(eval(*Condition::hasKind(NODE_KIND_MAP), field("next")));
    EXPECT_TRUE(eval(*Condition::isLink(), field("next")));
    EXPECT_FALSE(eval(*Condition::isLink(), root));
}

TEST_F(ConditionTest, testHasValue) {
    EXPECT_TRUE(eval(*Condition::hasValue(Condition::stringValue("bob")), field("name")));
    EXPECT_FALSE(eval(*Condition::hasValue(Condition::stringValue("bo")), field("name")));
    EXPECT_TRUE(eval(*Condition::hasValue(Condition::boolValue(true)), field("ok")));
    EXPECT_FALSE(eval(*Condition::hasValue(Condition::intValue(1)), field("ok")));
    EXPECT_TRUE(eval(*Condition::hasValue(Condition::nullValue()), field("none")));
    EXPECT_FALSE(eval(*Condition::hasValue(Condition::nullValue()), field("ok")));

    // integers and floats compare numerically
    EXPECT_TRUE(eval(*Condition::hasValue(Condition::intValue(42)), field("score")));
    EXPECT_TRUE(eval(*Condition::hasValue(Condition::floatValue(42.0)), field("age")));
    EXPECT_FALSE(eval(*Condition::hasValue(Condition::floatValue(42.5)), field("age")));

    // bytes never equal a string with the same text
    EXPECT_TRUE(eval(*Condition::hasValue(Condition::bytesValue("Ym9i")), field("blob")));
    EXPECT_FALSE(eval(*Condition::hasValue(Condition::stringValue("Ym9i")), field("blob")));

    // non-scalars never have a value
    EXPECT_FALSE(eval(*Condition::hasValue(Condition::stringValue("other")), field("next")));
    EXPECT_FALSE(eval(*Condition::hasValue(Condition::nullValue()), root));
}

TEST_F(ConditionTest, testHasValueOwnsString) {
    ConditionPtr cond;
    {
        std::string tmp("bob");
        cond = Condition::hasValue(Condition::stringValue(tmp));
        tmp.assign("xyz");
    }
    EXPECT_TRUE(eval(*cond, field("name")));
}

TEST_F(ConditionTest, testOrdering) {
    EXPECT_TRUE(eval(*Condition::greaterThan(Condition::intValue(41)), field("age")));
    EXPECT_FALSE(eval(*Condition::greaterThan(Condition::intValue(42)), field("age")));
    EXPECT_TRUE(eval(*Condition::lessThan(Condition::floatValue(42.5)), field("age")));
    EXPECT_TRUE(eval(*Condition::lessThan(Condition::intValue(1)), field("ratio")));
    EXPECT_TRUE(eval(*Condition::greaterThan(Condition::stringValue("bim")), field("name")));
    EXPECT_TRUE(eval(*Condition::lessThan(Condition::stringValue("bobby")), field("name")));

    // mismatched or unordered kinds are false both ways
    EXPECT_FALSE(eval(*Condition::greaterThan(Condition::stringValue("a")), field("age")));
    EXPECT_FALSE(eval(*Condition::lessThan(Condition::stringValue("a")), field("age")));
    EXPECT_FALSE(eval(*Condition::greaterThan(Condition::boolValue(false)), field("ok")));
    EXPECT_FALSE(eval(*Condition::greaterThan(Condition::bytesValue("A")), field("blob")));
    EXPECT_FALSE(eval(*Condition::lessThan(Condition::intValue(100)), root));
    EXPECT_FALSE(eval(*Condition::greaterThan(Condition::floatValue(std::nan(""))), field("age")));
    EXPECT_FALSE(eval(*Condition::lessThan(Condition::floatValue(std::nan(""))), field("age")));
}

TEST_F(ConditionTest, testCompareScalars) {
    int cmp = 99;
    EXPECT_TRUE(condition_compare_scalars(Condition::intValue(3), Condition::floatValue(2.5), cmp));
    EXPECT_EQ(cmp, 1);
    EXPECT_TRUE(condition_compare_scalars(Condition::floatValue(2.5), Condition::intValue(3), cmp));
    EXPECT_EQ(cmp, -1);
    EXPECT_TRUE(condition_compare_scalars(Condition::bytesValue("ab"), Condition::bytesValue("ab"), cmp));
    EXPECT_EQ(cmp, 0);
    EXPECT_FALSE(condition_compare_scalars(Condition::bytesValue("ab"), Condition::stringValue("ab"), cmp));
    EXPECT_FALSE(condition_compare_scalars(Condition::nullValue(), Condition::nullValue(), cmp));
    EXPECT_FALSE(condition_compare_scalars(Condition::floatValue(std::nan("")), Condition::intValue(1), cmp));
}

TEST_F(ConditionTest, testAndOr) {
    dsel::vector<ConditionPtr> empty1, empty2;
    EXPECT_TRUE(eval(*Condition::allOf(std::move(empty1)), root));
    EXPECT_FALSE(eval(*Condition::anyOf(std::move(empty2)), root));

    dsel::vector<ConditionPtr> ops;
    ops.push_back(Condition::hasField("name"));
    ops.push_back(Condition::hasField("age"));
    ConditionPtr both = Condition::allOf(std::move(ops));
    EXPECT_EQ(both->size(), 3);
    EXPECT_TRUE(eval(*both, root));

    ops.clear();
    ops.push_back(Condition::hasField("missing"));
    ops.push_back(Condition::hasKind(NODE_KIND_MAP));
    EXPECT_TRUE(eval(*Condition::anyOf(std::move(ops)), root));

    ops.clear();
    ops.push_back(Condition::hasField("missing"));
    ops.push_back(Condition::hasKind(NODE_KIND_LIST));
    EXPECT_FALSE(eval(*Condition::anyOf(std::move(ops)), root));
}

TEST_F(ConditionTest, testShortCircuit) {
    dsel::vector<ConditionPtr> ops;
    ops.push_back(Condition::hasField("missing"));
    ops.push_back(Condition::hasField("name"));
    ops.push_back(Condition::hasField("age"));
    ConditionPtr cond = Condition::allOf(std::move(ops));

    ConditionEngine engine(*accessor, 100);
    bool result = true;
    EXPECT_EQ(engine.evaluate(*cond, root, result), DAGSEL_SUCCESS);
    EXPECT_FALSE(result);
    // the AND node and its first operand
    EXPECT_EQ(engine.getUnitsUsed(), 2);
    EXPECT_EQ(engine.getNumEvaluations(), 1);
}

TEST_F(ConditionTest, testBudgetExhaustedByDepth) {
    // a chain of 10 nested ANDs ending in a leaf costs 11 units
    ConditionPtr cond = Condition::hasField("name");
    for (int i = 0; i < 10; i++) {
        dsel::vector<ConditionPtr> ops;
        ops.push_back(std::move(cond));
        cond = Condition::allOf(std::move(ops));
    }
    EXPECT_EQ(cond->size(), 11);

    bool result;
    ConditionEngine small(*accessor, 5);
    EXPECT_EQ(small.evaluate(*cond, root, result), DAGSEL_CONDITION_BUDGET_EXCEEDED);
    EXPECT_EQ(small.getUnitsUsed(), 5);

    ConditionEngine exact(*accessor, 11);
    EXPECT_EQ(exact.evaluate(*cond, root, result), DAGSEL_SUCCESS);
    EXPECT_TRUE(result);
    EXPECT_EQ(exact.getRemaining(), 0);
}

TEST_F(ConditionTest, testBudgetScope) {
    ConditionPtr cond = Condition::hasField("name");
    bool result;

    // per condition: every evaluation gets a fresh budget
    ConditionEngine perCondition(*accessor, 1, ConditionEngine::BUDGET_PER_CONDITION);
    for (int i = 0; i < 5; i++) {
        EXPECT_EQ(perCondition.evaluate(*cond, root, result), DAGSEL_SUCCESS);
        EXPECT_TRUE(result);
    }
    EXPECT_EQ(perCondition.getNumEvaluations(), 5);

    // per traversal: evaluations share one budget until reset
    ConditionEngine perTraversal(*accessor, 3, ConditionEngine::BUDGET_PER_TRAVERSAL);
    for (int i = 0; i < 3; i++) {
        EXPECT_EQ(perTraversal.evaluate(*cond, root, result), DAGSEL_SUCCESS);
    }
    EXPECT_EQ(perTraversal.evaluate(*cond, root, result), DAGSEL_CONDITION_BUDGET_EXCEEDED);
    perTraversal.reset();
    EXPECT_EQ(perTraversal.getUnitsUsed(), 0);
    EXPECT_EQ(perTraversal.evaluate(*cond, root, result), DAGSEL_SUCCESS);
}

TEST_F(ConditionTest, testZeroBudget) {
    ConditionEngine engine(*accessor, 0);
    bool result;
    EXPECT_EQ(engine.evaluate(*Condition::isLink(), root, result), DAGSEL_CONDITION_BUDGET_EXCEEDED);
}
