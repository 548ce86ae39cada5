#include "engine/ShuffleEngine.hh"
#include "scoring/AlgorithmStatistics.hh"
#include "shuffling/InvalidInputException.hh"
#include "TestUtility.hh"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using Shuffling::Deck;
using Shuffling::Scoring::AlgorithmStatistics;

class AlgorithmStatisticsTest : public testing::Test {
protected:
    AlgorithmStatistics withValues(
        const std::string& name, const double randomness,
        const double steps, std::vector<double> times)
    {
        auto ret = Shuffling::Scoring::initStats(name);
        ret.shuffleCount = static_cast<int>(times.size());
        ret.randomnessScore = randomness;
        ret.averageStepCount = steps;
        ret.executionTimes = std::move(times);
        return ret;
    }

    const Deck original = Shuffling::createOrderedDeck(4);
    const Deck reversed = Shuffling::permuteDeck(original, {3, 2, 1, 0});
};

TEST_F(AlgorithmStatisticsTest, testInitStats)
{
    const auto stats = Shuffling::Scoring::initStats("Riffle Shuffle");
    EXPECT_EQ("Riffle Shuffle", stats.algorithmName);
    EXPECT_EQ(0, stats.shuffleCount);
    EXPECT_EQ(0.0, stats.averageStepCount);
    EXPECT_EQ(0.0, stats.randomnessScore);
    EXPECT_TRUE(stats.executionTimes.empty());
}

TEST_F(AlgorithmStatisticsTest, testInitAllStats)
{
    const auto algorithms = Shuffling::Engine::listAlgorithms();
    const auto stats = Shuffling::Scoring::initAllStats(algorithms);
    ASSERT_EQ(algorithms.size(), stats.size());
    for (const auto& algorithm : algorithms) {
        const auto iter = stats.find(algorithm.name);
        ASSERT_NE(stats.end(), iter);
        EXPECT_EQ(Shuffling::Scoring::initStats(algorithm.name), iter->second);
    }
}

TEST_F(AlgorithmStatisticsTest, testUpdateStats)
{
    auto stats = Shuffling::Scoring::initStats("Fisher-Yates");
    stats = Shuffling::Scoring::updateStats(stats, original, reversed, 2.5, 3);
    EXPECT_EQ(1, stats.shuffleCount);
    EXPECT_DOUBLE_EQ(3.0, stats.averageStepCount);
    EXPECT_DOUBLE_EQ(100.0, stats.randomnessScore);
    EXPECT_EQ(std::vector {2.5}, stats.executionTimes);

    stats = Shuffling::Scoring::updateStats(stats, original, original, 0.5, 4);
    EXPECT_EQ(2, stats.shuffleCount);
    EXPECT_DOUBLE_EQ(3.5, stats.averageStepCount);
    EXPECT_DOUBLE_EQ(50.0, stats.randomnessScore);
    EXPECT_EQ((std::vector {2.5, 0.5}), stats.executionTimes);
}

TEST_F(AlgorithmStatisticsTest, testRunningAverageMatchesMean)
{
    const auto stepCounts = std::vector {3, 7, 4, 10, 1, 6, 6};
    auto stats = Shuffling::Scoring::initStats("Hindu Shuffle");
    auto sum = 0;
    for (const auto steps : stepCounts) {
        stats = Shuffling::Scoring::updateStats(
            stats, original, reversed, 1.0, steps);
        sum += steps;
    }
    const auto mean = static_cast<double>(sum) / stepCounts.size();
    EXPECT_DOUBLE_EQ(mean, stats.averageStepCount);
    EXPECT_EQ(std::round(mean), std::round(stats.averageStepCount));
    EXPECT_EQ(static_cast<int>(stepCounts.size()), stats.shuffleCount);
}

TEST_F(AlgorithmStatisticsTest, testUpdateStatsDoesNotModifyOriginal)
{
    const auto stats = Shuffling::Scoring::initStats("Fisher-Yates");
    Shuffling::Scoring::updateStats(stats, original, reversed, 1.0, 3);
    EXPECT_EQ(Shuffling::Scoring::initStats("Fisher-Yates"), stats);
}

TEST_F(AlgorithmStatisticsTest, testNegativeExecutionTime)
{
    const auto stats = Shuffling::Scoring::initStats("Fisher-Yates");
    EXPECT_THROW(
        Shuffling::Scoring::updateStats(stats, original, reversed, -1.0, 3),
        Shuffling::InvalidInputException);
}

TEST_F(AlgorithmStatisticsTest, testNegativeStepCount)
{
    const auto stats = Shuffling::Scoring::initStats("Fisher-Yates");
    EXPECT_THROW(
        Shuffling::Scoring::updateStats(stats, original, reversed, 1.0, -3),
        Shuffling::InvalidInputException);
}

TEST_F(AlgorithmStatisticsTest, testClearAllStats)
{
    auto stats = Shuffling::Scoring::initAllStats(
        Shuffling::Engine::listAlgorithms());
    for (auto& [name, entry] : stats) {
        entry = Shuffling::Scoring::updateStats(
            entry, original, reversed, 1.0, 5);
    }
    Shuffling::Scoring::clearAllStats(stats);
    for (const auto& [name, entry] : stats) {
        EXPECT_EQ(Shuffling::Scoring::initStats(name), entry);
    }
}

TEST_F(AlgorithmStatisticsTest, testAverageExecutionTime)
{
    EXPECT_EQ(
        0.0,
        Shuffling::Scoring::averageExecutionTime(
            Shuffling::Scoring::initStats("Fisher-Yates")));
    EXPECT_DOUBLE_EQ(
        2.0,
        Shuffling::Scoring::averageExecutionTime(
            withValues("Fisher-Yates", 0, 0, {1.0, 2.0, 3.0})));
}

TEST_F(AlgorithmStatisticsTest, testCompareStats)
{
    const auto first = withValues("A", 90, 51, {5.0});
    const auto second = withValues("B", 70, 30, {2.0});
    const auto comparison = Shuffling::Scoring::compareStats(first, second);
    EXPECT_EQ("A", comparison.firstName);
    EXPECT_EQ("B", comparison.secondName);
    EXPECT_EQ("A", comparison.randomness.winner);
    EXPECT_DOUBLE_EQ(90.0, comparison.randomness.firstValue);
    EXPECT_DOUBLE_EQ(70.0, comparison.randomness.secondValue);
    EXPECT_EQ("B", comparison.speed.winner);
    EXPECT_DOUBLE_EQ(5.0, comparison.speed.firstValue);
    EXPECT_DOUBLE_EQ(2.0, comparison.speed.secondValue);
    EXPECT_EQ("B", comparison.steps.winner);
}

TEST_F(AlgorithmStatisticsTest, testCompareStatsTiesGoToFirst)
{
    const auto first = withValues("A", 60, 10, {1.0});
    const auto second = withValues("B", 60, 10, {1.0});
    const auto comparison = Shuffling::Scoring::compareStats(first, second);
    EXPECT_EQ("A", comparison.randomness.winner);
    EXPECT_EQ("A", comparison.speed.winner);
    EXPECT_EQ("A", comparison.steps.winner);
    const auto reverse = Shuffling::Scoring::compareStats(second, first);
    EXPECT_EQ("B", reverse.randomness.winner);
    EXPECT_EQ("B", reverse.speed.winner);
    EXPECT_EQ("B", reverse.steps.winner);
}
