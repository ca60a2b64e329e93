#include <gtest/gtest.h>

#include "engine_error.hpp"
#include "run_config.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace CardSort;

namespace {

ErrorKind parseError(const std::vector<std::string>& args) {
    try {
        parseRunConfig(args);
    } catch (const EngineError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected parseRunConfig to reject the arguments";
    return ErrorKind::HookFailure;
}

} // namespace

// === SPEED ===

TEST(RunConfigTest, SpeedDelays) {
    EXPECT_EQ(stepDelay(Speed::Slow).count(), 700);
    EXPECT_EQ(stepDelay(Speed::Medium).count(), 380);
    EXPECT_EQ(stepDelay(Speed::Fast).count(), 160);

    EXPECT_EQ(compareDelay(Speed::Slow).count(), 280);
    EXPECT_EQ(compareDelay(Speed::Medium).count(), 152);
    EXPECT_EQ(compareDelay(Speed::Fast).count(), 64);
}

TEST(RunConfigTest, ParseSpeedAcceptsNamesAndSliderValues) {
    EXPECT_EQ(parseSpeed("slow"), Speed::Slow);
    EXPECT_EQ(parseSpeed("Medium"), Speed::Medium);
    EXPECT_EQ(parseSpeed("FAST"), Speed::Fast);
    EXPECT_EQ(parseSpeed("1"), Speed::Slow);
    EXPECT_EQ(parseSpeed("2"), Speed::Medium);
    EXPECT_EQ(parseSpeed("3"), Speed::Fast);
    EXPECT_STREQ(speedLabel(Speed::Fast), "Fast");

    EXPECT_THROW(parseSpeed("ludicrous"), EngineError);
    EXPECT_THROW(parseSpeed("4"), EngineError);
}

// === ARGUMENTS ===

TEST(RunConfigTest, DefaultsAfterAlgorithm) {
    RunConfig config = parseRunConfig({"quick"});
    EXPECT_EQ(config.algorithm, Algorithm::Quick);
    EXPECT_EQ(config.size, kDefaultSize);
    EXPECT_EQ(config.speed, Speed::Medium);
    EXPECT_EQ(config.seed, 0u);
    EXPECT_FALSE(config.verbose);
}

TEST(RunConfigTest, AllPositionalsAndVerbose) {
    RunConfig config = parseRunConfig({"--verbose", "merge", "16", "fast", "42"});
    EXPECT_EQ(config.algorithm, Algorithm::Merge);
    EXPECT_EQ(config.size, 16);
    EXPECT_EQ(config.speed, Speed::Fast);
    EXPECT_EQ(config.seed, 42u);
    EXPECT_TRUE(config.verbose);
}

TEST(RunConfigTest, RejectsBadArguments) {
    EXPECT_EQ(parseError({}), ErrorKind::InvalidInput);
    EXPECT_EQ(parseError({"heap"}), ErrorKind::InvalidInput);
    EXPECT_EQ(parseError({"bubble", "0"}), ErrorKind::InvalidInput);
    EXPECT_EQ(parseError({"bubble", std::to_string(kMaxSize + 1)}), ErrorKind::InvalidInput);
    EXPECT_EQ(parseError({"bubble", "12abc"}), ErrorKind::InvalidInput);
    EXPECT_EQ(parseError({"bubble", "twelve"}), ErrorKind::InvalidInput);
    EXPECT_EQ(parseError({"bubble", "12", "warp"}), ErrorKind::InvalidInput);
    EXPECT_EQ(parseError({"bubble", "12", "slow", "-3"}), ErrorKind::InvalidInput);
    EXPECT_EQ(parseError({"bubble", "12", "slow", "3", "extra"}), ErrorKind::InvalidInput);
}

// === DATASET GENERATION ===

TEST(RunConfigTest, GeneratedValuesAreDistinctAndInRange) {
    for (int n : {kMinSize, 7, kMaxSize}) {
        std::vector<int> values = generateValues(n, 1234);
        ASSERT_EQ(static_cast<int>(values.size()), n);
        std::set<int> unique(values.begin(), values.end());
        EXPECT_EQ(static_cast<int>(unique.size()), n);
        EXPECT_GE(*std::min_element(values.begin(), values.end()), kMinValue);
        EXPECT_LE(*std::max_element(values.begin(), values.end()), kMaxValue);
    }
}

TEST(RunConfigTest, SameSeedSameValues) {
    EXPECT_EQ(generateValues(20, 99), generateValues(20, 99));
    EXPECT_NE(generateValues(20, 99), generateValues(20, 100));
}

TEST(RunConfigTest, GenerateRejectsOutOfRangeSize) {
    EXPECT_THROW(generateValues(0, 1), EngineError);
    EXPECT_THROW(generateValues(kMaxSize + 1, 1), EngineError);
}
