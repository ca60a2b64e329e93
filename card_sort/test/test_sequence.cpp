#include <gtest/gtest.h>

#include "engine_error.hpp"
#include "sequence.hpp"
#include "step_hook.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace CardSort;

class SequenceTest : public ::testing::Test {
protected:
    TraceRecorder hook;
};

TEST_F(SequenceTest, BuildsItemsWithConsecutiveIds) {
    Sequence seq({7, 3, 9}, hook, 100);

    ASSERT_EQ(seq.size(), 3u);
    EXPECT_EQ(seq.values(), (std::vector<int>{7, 3, 9}));
    EXPECT_EQ(seq.ids(), (std::vector<ItemId>{100, 101, 102}));
    EXPECT_EQ(seq.steps(), 0u);
    EXPECT_TRUE(hook.events().empty());
}

TEST_F(SequenceTest, EmptyDatasetIsInvalidInput) {
    try {
        Sequence seq({}, hook);
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidInput);
    }
}

TEST_F(SequenceTest, CompareReportsThenReturnsThreeWayResult) {
    Sequence seq({4, 2, 4}, hook);

    EXPECT_EQ(seq.compare(0, 1), 1);
    EXPECT_EQ(seq.compare(1, 2), -1);
    EXPECT_EQ(seq.compare(0, 2), 0);

    ASSERT_EQ(hook.events().size(), 3u);
    EXPECT_EQ(hook.events()[0], (StepEvent{StepKind::Compare, 0, 1}));
    EXPECT_EQ(hook.events()[2], (StepEvent{StepKind::Compare, 0, 2}));
    EXPECT_EQ(seq.comparisons(), 3u);
    EXPECT_EQ(seq.values(), (std::vector<int>{4, 2, 4}));
}

TEST_F(SequenceTest, AdjacentSwapExchangesItems) {
    Sequence seq({1, 2, 3}, hook);
    seq.swap(2, 1);

    EXPECT_EQ(seq.values(), (std::vector<int>{1, 3, 2}));
    EXPECT_EQ(seq.ids(), (std::vector<ItemId>{0, 2, 1}));
    ASSERT_EQ(hook.events().size(), 1u);
    EXPECT_EQ(hook.events()[0], (StepEvent{StepKind::Swap, 2, 1}));
    EXPECT_EQ(seq.swaps(), 1u);
}

TEST_F(SequenceTest, NonAdjacentSwapIsRejectedWithoutMutation) {
    Sequence seq({1, 2, 3, 4}, hook);

    for (auto pair : std::vector<std::pair<int, int>>{{0, 2}, {3, 0}, {1, 1}}) {
        try {
            seq.swap(pair.first, pair.second);
            FAIL() << "swap(" << pair.first << ", " << pair.second << ") should be rejected";
        } catch (const EngineError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidOperation);
        }
    }
    EXPECT_EQ(seq.values(), (std::vector<int>{1, 2, 3, 4}));
    EXPECT_TRUE(hook.events().empty());
    EXPECT_EQ(seq.steps(), 0u);
}

TEST_F(SequenceTest, OutOfRangeIndexIsInvalidOperation) {
    Sequence seq({1, 2}, hook);

    EXPECT_THROW(seq.swap(1, 2), EngineError);
    EXPECT_THROW(seq.swap(-1, 0), EngineError);
    EXPECT_THROW(seq.compare(0, 5), EngineError);
    EXPECT_THROW(seq.at(2), EngineError);
    EXPECT_TRUE(hook.events().empty());
}

TEST_F(SequenceTest, HookExceptionBecomesHookFailure) {
    Sequence seq({2, 1}, hook);
    hook.failOnStep(2);

    EXPECT_EQ(seq.compare(0, 1), 1);
    try {
        seq.swap(0, 1);
        FAIL() << "expected HookFailure";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::HookFailure);
    }
    // The exchange happened before the hook was awaited.
    EXPECT_EQ(seq.values(), (std::vector<int>{1, 2}));
}

namespace {

class ValueThrowingHook : public TraceRecorder {
public:
    void onCompare(int, int) override { throw 42; }
};

class KindThrowingHook : public TraceRecorder {
public:
    void onSwap(int, int) override {
        throw EngineError(ErrorKind::AlreadyRunning, "run requested while a sort is running");
    }
};

} // namespace

TEST(SequenceHookErrorTest, NonStandardThrowBecomesHookFailure) {
    ValueThrowingHook hook;
    Sequence seq({2, 1}, hook);
    try {
        seq.compare(0, 1);
        FAIL() << "expected HookFailure";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::HookFailure);
    }
}

TEST(SequenceHookErrorTest, EngineErrorFromHookIsReportedAsHookFailure) {
    KindThrowingHook hook;
    Sequence seq({2, 1}, hook);
    try {
        seq.swap(0, 1);
        FAIL() << "expected HookFailure";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::HookFailure);
        EXPECT_NE(std::string(e.what()).find("AlreadyRunning"), std::string::npos);
    }
}

TEST_F(SequenceTest, IndexOfFindsIdFromBoundary) {
    Sequence seq({5, 5, 5, 5}, hook);

    EXPECT_EQ(seq.indexOf(2), 2);
    EXPECT_EQ(seq.indexOf(3, 1), 3);
    try {
        seq.indexOf(0, 1);
        FAIL() << "id 0 sits before the boundary";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidOperation);
    }
}

TEST_F(SequenceTest, IsSortedAcceptsEqualNeighbours) {
    EXPECT_TRUE(Sequence({1, 1, 2, 3}, hook).isSorted());
    EXPECT_TRUE(Sequence({42}, hook).isSorted());
    EXPECT_FALSE(Sequence({1, 3, 2}, hook).isSorted());
}

TEST_F(SequenceTest, ResetCountersKeepsOrder) {
    Sequence seq({3, 1}, hook);
    seq.compare(0, 1);
    seq.swap(0, 1);
    EXPECT_EQ(seq.steps(), 2u);

    seq.resetCounters();
    EXPECT_EQ(seq.steps(), 0u);
    EXPECT_EQ(seq.values(), (std::vector<int>{1, 3}));
}
