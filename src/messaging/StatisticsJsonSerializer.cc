#include "messaging/StatisticsJsonSerializer.hh"

#include "scoring/AlgorithmStatistics.hh"
#include "scoring/RandomnessEstimator.hh"
#include "messaging/JsonSerializerUtility.hh"

#include <algorithm>
#include <vector>

using nlohmann::json;

namespace Shuffling {
namespace Scoring {

const std::string STATS_ALGORITHM_NAME_KEY {"algorithmName"};
const std::string STATS_SHUFFLE_COUNT_KEY {"shuffleCount"};
const std::string STATS_AVERAGE_STEP_COUNT_KEY {"averageStepCount"};
const std::string STATS_RANDOMNESS_SCORE_KEY {"randomnessScore"};
const std::string STATS_EXECUTION_TIMES_KEY {"executionTimes"};
const std::string METRIC_FIRST_VALUE_KEY {"firstValue"};
const std::string METRIC_SECOND_VALUE_KEY {"secondValue"};
const std::string METRIC_WINNER_KEY {"winner"};
const std::string COMPARISON_FIRST_KEY {"first"};
const std::string COMPARISON_SECOND_KEY {"second"};
const std::string COMPARISON_RANDOMNESS_KEY {"randomness"};
const std::string COMPARISON_SPEED_KEY {"speed"};
const std::string COMPARISON_STEPS_KEY {"steps"};
const std::string ESTIMATE_DISPLACEMENT_KEY {"displacementScore"};
const std::string ESTIMATE_ENTROPY_KEY {"entropyScore"};
const std::string ESTIMATE_SUIT_RUNS_KEY {"suitRuns"};

namespace {

bool isScore(const double score)
{
    return score >= 0 && score <= 100;
}

}

void to_json(json& j, const AlgorithmStatistics& stats)
{
    j.emplace(STATS_ALGORITHM_NAME_KEY, stats.algorithmName);
    j.emplace(STATS_SHUFFLE_COUNT_KEY, stats.shuffleCount);
    j.emplace(STATS_AVERAGE_STEP_COUNT_KEY, stats.averageStepCount);
    j.emplace(STATS_RANDOMNESS_SCORE_KEY, stats.randomnessScore);
    j.emplace(STATS_EXECUTION_TIMES_KEY, stats.executionTimes);
}

void from_json(const json& j, AlgorithmStatistics& stats)
{
    stats.algorithmName = j.at(STATS_ALGORITHM_NAME_KEY).get<std::string>();
    stats.shuffleCount = Messaging::validate(
        j.at(STATS_SHUFFLE_COUNT_KEY).get<int>(), Messaging::isNonNegative);
    stats.averageStepCount = Messaging::validate(
        j.at(STATS_AVERAGE_STEP_COUNT_KEY).get<double>(),
        Messaging::isNonNegative);
    stats.randomnessScore = Messaging::validate(
        j.at(STATS_RANDOMNESS_SCORE_KEY).get<double>(), isScore);
    stats.executionTimes = Messaging::validate(
        j.at(STATS_EXECUTION_TIMES_KEY).get<std::vector<double>>(),
        [](const auto& times)
        {
            return std::all_of(
                times.begin(), times.end(), Messaging::isNonNegative);
        });
}

void to_json(json& j, const MetricComparison& comparison)
{
    j.emplace(METRIC_FIRST_VALUE_KEY, comparison.firstValue);
    j.emplace(METRIC_SECOND_VALUE_KEY, comparison.secondValue);
    j.emplace(METRIC_WINNER_KEY, comparison.winner);
}

void from_json(const json& j, MetricComparison& comparison)
{
    comparison.firstValue = j.at(METRIC_FIRST_VALUE_KEY).get<double>();
    comparison.secondValue = j.at(METRIC_SECOND_VALUE_KEY).get<double>();
    comparison.winner = j.at(METRIC_WINNER_KEY).get<std::string>();
}

void to_json(json& j, const StatisticsComparison& comparison)
{
    j.emplace(COMPARISON_FIRST_KEY, comparison.firstName);
    j.emplace(COMPARISON_SECOND_KEY, comparison.secondName);
    j.emplace(COMPARISON_RANDOMNESS_KEY, comparison.randomness);
    j.emplace(COMPARISON_SPEED_KEY, comparison.speed);
    j.emplace(COMPARISON_STEPS_KEY, comparison.steps);
}

void from_json(const json& j, StatisticsComparison& comparison)
{
    comparison.firstName = j.at(COMPARISON_FIRST_KEY).get<std::string>();
    comparison.secondName = j.at(COMPARISON_SECOND_KEY).get<std::string>();
    comparison.randomness = j.at(COMPARISON_RANDOMNESS_KEY);
    comparison.speed = j.at(COMPARISON_SPEED_KEY);
    comparison.steps = j.at(COMPARISON_STEPS_KEY);
    const auto valid_winner = [&comparison](const auto& metric)
    {
        return metric.winner == comparison.firstName ||
            metric.winner == comparison.secondName;
    };
    if (!valid_winner(comparison.randomness) ||
        !valid_winner(comparison.speed) ||
        !valid_winner(comparison.steps)) {
        throw Messaging::SerializationFailureException {};
    }
}

void to_json(json& j, const RandomnessEstimate& estimate)
{
    j.emplace(ESTIMATE_DISPLACEMENT_KEY, estimate.displacementScore);
    j.emplace(ESTIMATE_ENTROPY_KEY, estimate.entropyScore);
    j.emplace(ESTIMATE_SUIT_RUNS_KEY, estimate.suitRuns);
}

void from_json(const json& j, RandomnessEstimate& estimate)
{
    estimate.displacementScore = Messaging::validate(
        j.at(ESTIMATE_DISPLACEMENT_KEY).get<int>(), isScore);
    estimate.entropyScore = Messaging::validate(
        j.at(ESTIMATE_ENTROPY_KEY).get<double>(), isScore);
    estimate.suitRuns = Messaging::validate(
        j.at(ESTIMATE_SUIT_RUNS_KEY).get<int>(), Messaging::isNonNegative);
}

}
}
