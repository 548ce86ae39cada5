#include "scoring/AlgorithmStatistics.hh"

#include "scoring/RandomnessEstimator.hh"
#include "shuffling/InvalidInputException.hh"

#include <numeric>
#include <ostream>
#include <utility>

namespace Shuffling {
namespace Scoring {

namespace {

double foldIntoAverage(
    const double average, const int count, const double sample)
{
    return (average * count + sample) / (count + 1);
}

template<typename Better>
MetricComparison compareMetric(
    const AlgorithmStatistics& first, const double firstValue,
    const AlgorithmStatistics& second, const double secondValue,
    Better better)
{
    auto ret = MetricComparison {};
    ret.firstValue = firstValue;
    ret.secondValue = secondValue;
    ret.winner = better(firstValue, secondValue) ?
        first.algorithmName : second.algorithmName;
    return ret;
}

}

AlgorithmStatistics initStats(std::string algorithmName)
{
    auto ret = AlgorithmStatistics {};
    ret.algorithmName = std::move(algorithmName);
    return ret;
}

AlgorithmStatisticsMap initAllStats(
    const Engine::AlgorithmDescriptorVector& algorithms)
{
    auto ret = AlgorithmStatisticsMap {};
    for (const auto& algorithm : algorithms) {
        ret.try_emplace(algorithm.name, initStats(algorithm.name));
    }
    return ret;
}

AlgorithmStatistics updateStats(
    const AlgorithmStatistics& stats, const Deck& original,
    const Deck& shuffled, const double executionTimeMs, const int stepCount)
{
    if (executionTimeMs < 0 || stepCount < 0) {
        throw InvalidInputException {"Negative execution time or step count"};
    }
    auto ret = stats;
    const auto randomness = estimateRandomness(original, shuffled);
    ret.averageStepCount = foldIntoAverage(
        stats.averageStepCount, stats.shuffleCount, stepCount);
    ret.randomnessScore = foldIntoAverage(
        stats.randomnessScore, stats.shuffleCount, randomness);
    ++ret.shuffleCount;
    ret.executionTimes.push_back(executionTimeMs);
    return ret;
}

void clearAllStats(AlgorithmStatisticsMap& stats)
{
    for (auto& [name, entry] : stats) {
        entry = initStats(name);
    }
}

double averageExecutionTime(const AlgorithmStatistics& stats)
{
    const auto& times = stats.executionTimes;
    if (times.empty()) {
        return 0;
    }
    return std::accumulate(times.begin(), times.end(), 0.0) / times.size();
}

StatisticsComparison compareStats(
    const AlgorithmStatistics& first, const AlgorithmStatistics& second)
{
    auto ret = StatisticsComparison {};
    ret.firstName = first.algorithmName;
    ret.secondName = second.algorithmName;
    ret.randomness = compareMetric(
        first, first.randomnessScore, second, second.randomnessScore,
        std::greater_equal<> {});
    ret.speed = compareMetric(
        first, averageExecutionTime(first),
        second, averageExecutionTime(second), std::less_equal<> {});
    ret.steps = compareMetric(
        first, first.averageStepCount, second, second.averageStepCount,
        std::less_equal<> {});
    return ret;
}

bool operator==(const AlgorithmStatistics& lhs, const AlgorithmStatistics& rhs)
{
    return lhs.algorithmName == rhs.algorithmName &&
        lhs.shuffleCount == rhs.shuffleCount &&
        lhs.averageStepCount == rhs.averageStepCount &&
        lhs.randomnessScore == rhs.randomnessScore &&
        lhs.executionTimes == rhs.executionTimes;
}

bool operator==(const MetricComparison& lhs, const MetricComparison& rhs)
{
    return lhs.firstValue == rhs.firstValue &&
        lhs.secondValue == rhs.secondValue && lhs.winner == rhs.winner;
}

bool operator==(
    const StatisticsComparison& lhs, const StatisticsComparison& rhs)
{
    return lhs.firstName == rhs.firstName &&
        lhs.secondName == rhs.secondName &&
        lhs.randomness == rhs.randomness && lhs.speed == rhs.speed &&
        lhs.steps == rhs.steps;
}

std::ostream& operator<<(std::ostream& os, const AlgorithmStatistics& stats)
{
    return os << stats.algorithmName << ": " << stats.shuffleCount <<
        " shuffles, " << stats.averageStepCount << " steps, randomness " <<
        stats.randomnessScore << ", " << averageExecutionTime(stats) << " ms";
}

}
}
