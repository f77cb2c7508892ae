#include <string>
#include <string_view>
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "dagsel/collector.h"
#include "dagsel/stats.h"
#include "module_sim.h"

using ::testing::_;
using ::testing::Eq;
using ::testing::IsNull;
using ::testing::Pointee;

class MockListener : public TraversalListener {
 public:
    MOCK_METHOD(void, onCovered, (const Node &node, const std::string_view &path), (override));
    MOCK_METHOD(void, onMatch, (const Node &node, const std::string_view &path, const std::string_view *label),
                (override));
};

class CollectorTest : public ::testing::Test {
 protected:
    void SetUp() override {
        DagselCode rc = dagselstats_init();
        ASSERT_EQ(rc, DAGSEL_SUCCESS);
        setupValkeyModulePointers();
    }

    int cells[4];
    Node node(int i) { return Node(&cells[i]); }
};

TEST_F(CollectorTest, testBufferedCoverIsDeduplicated) {
    ResultCollector collector;
    EXPECT_FALSE(collector.isStreaming());
    EXPECT_TRUE(collector.cover(node(0), ""));
    EXPECT_TRUE(collector.cover(node(1), "/a"));
    EXPECT_FALSE(collector.cover(node(0), "/b/c"));
    EXPECT_TRUE(collector.cover(node(2), "/b"));

    EXPECT_EQ(collector.getNumCovered(), 3);
    ASSERT_EQ(collector.getCovered().size(), 3);
    // first path wins
    EXPECT_EQ(collector.getCovered()[0].node, node(0));
    EXPECT_STREQ(collector.getCovered()[0].path.c_str(), "");
    EXPECT_STREQ(collector.getCovered()[1].path.c_str(), "/a");
    EXPECT_STREQ(collector.getCovered()[2].path.c_str(), "/b");
    EXPECT_TRUE(collector.isCovered(node(1)));
    EXPECT_FALSE(collector.isCovered(node(3)));
}

TEST_F(CollectorTest, testBufferedMatchesAreNotDeduplicated) {
    ResultCollector collector;
    std::string_view label("hit");
    collector.cover(node(0), "/x");
    collector.match(node(0), "/x", nullptr);
    collector.match(node(0), "/x", &label);

    EXPECT_EQ(collector.getNumMatches(), 2);
    ASSERT_EQ(collector.getMatches().size(), 2);
    EXPECT_FALSE(collector.getMatches()[0].hasLabel);
    EXPECT_TRUE(collector.getMatches()[1].hasLabel);
    EXPECT_STREQ(collector.getMatches()[1].label.c_str(), "hit");
    EXPECT_STREQ(collector.getMatches()[1].path.c_str(), "/x");
}

TEST_F(CollectorTest, testStreaming) {
    MockListener listener;
    ResultCollector collector(&listener);
    EXPECT_TRUE(collector.isStreaming());

    std::string_view label("L");
    {
        ::testing::InSequence seq;
        EXPECT_CALL(listener, onCovered(node(0), Eq(std::string_view(""))));
        EXPECT_CALL(listener, onCovered(node(1), Eq(std::string_view("/0"))));
        EXPECT_CALL(listener, onMatch(node(1), Eq(std::string_view("/0")), IsNull()));
        EXPECT_CALL(listener, onMatch(node(1), Eq(std::string_view("/0")), Pointee(Eq(std::string_view("L")))));
    }
    collector.cover(node(0), "");
    collector.cover(node(1), "/0");
    collector.cover(node(1), "/1");
    collector.match(node(1), "/0", nullptr);
    collector.match(node(1), "/0", &label);

    // nothing is buffered while streaming
    EXPECT_TRUE(collector.getCovered().empty());
    EXPECT_TRUE(collector.getMatches().empty());
    EXPECT_EQ(collector.getNumCovered(), 2);
    EXPECT_EQ(collector.getNumMatches(), 2);
}

TEST_F(CollectorTest, testStreamingWithoutDedup) {
    MockListener listener;
    ResultCollector collector(&listener, false);
    EXPECT_FALSE(collector.isDeduplicating());
    {
        ::testing::InSequence seq;
        EXPECT_CALL(listener, onCovered(node(0), Eq(std::string_view(""))));
        EXPECT_CALL(listener, onCovered(node(1), Eq(std::string_view("/0"))));
        EXPECT_CALL(listener, onCovered(node(1), Eq(std::string_view("/1"))));
    }
    EXPECT_TRUE(collector.cover(node(0), ""));
    EXPECT_TRUE(collector.cover(node(1), "/0"));
    EXPECT_TRUE(collector.cover(node(1), "/1"));
    EXPECT_EQ(collector.getNumCovered(), 3);
    EXPECT_FALSE(collector.isCovered(node(1)));

    // reset goes back to deduplicating
    collector.reset();
    EXPECT_TRUE(collector.isDeduplicating());
    EXPECT_TRUE(collector.cover(node(1), "/0"));
    EXPECT_FALSE(collector.cover(node(1), "/1"));
    EXPECT_EQ(collector.getNumCovered(), 1);
}

TEST_F(CollectorTest, testReset) {
    MockListener listener;
    ResultCollector collector(&listener);
    EXPECT_CALL(listener, onCovered(_, _)).Times(1);
    collector.cover(node(0), "");

    collector.reset();
    EXPECT_FALSE(collector.isStreaming());
    EXPECT_EQ(collector.getNumCovered(), 0);
    EXPECT_EQ(collector.getNumMatches(), 0);
    EXPECT_TRUE(collector.cover(node(0), ""));
    EXPECT_EQ(collector.getCovered().size(), 1);
}
