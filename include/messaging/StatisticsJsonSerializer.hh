/** \file
 *
 * \brief Definition of JSON serializers for the scoring types
 *
 * \page jsonalgorithmstatistics Algorithm statistics JSON representation
 *
 * A Shuffling::Scoring::AlgorithmStatistics is represented by a JSON object
 * consisting of the following:
 *
 * \code{.json}
 * {
 *     "algorithmName": <name>,
 *     "shuffleCount": <count>,
 *     "averageStepCount": <steps>,
 *     "randomnessScore": <randomness>,
 *     "executionTimes": [ <time>, ... ]
 * }
 * \endcode
 *
 * - &lt;name&gt; is a string
 * - &lt;count&gt; is a non-negative integer
 * - &lt;steps&gt; and &lt;randomness&gt; are non-negative numbers
 * - each &lt;time&gt; is a non-negative number of milliseconds
 *
 * \page jsonstatisticscomparison Statistics comparison JSON representation
 *
 * A Shuffling::Scoring::StatisticsComparison is represented by a JSON object
 * consisting of the following:
 *
 * \code{.json}
 * {
 *     "first": <name>,
 *     "second": <name>,
 *     "randomness": <metric>,
 *     "speed": <metric>,
 *     "steps": <metric>
 * }
 * \endcode
 *
 * where each &lt;metric&gt; is a Shuffling::Scoring::MetricComparison:
 *
 * \code{.json}
 * {
 *     "firstValue": <value>,
 *     "secondValue": <value>,
 *     "winner": <name>
 * }
 * \endcode
 *
 * \page jsonrandomnessestimate Randomness estimate JSON representation
 *
 * A Shuffling::Scoring::RandomnessEstimate is represented by a JSON object
 * consisting of the following:
 *
 * \code{.json}
 * {
 *     "displacementScore": <displacement>,
 *     "entropyScore": <entropy>,
 *     "suitRuns": <runs>
 * }
 * \endcode
 */

#ifndef MESSAGING_STATISTICSJSONSERIALIZER_HH_
#define MESSAGING_STATISTICSJSONSERIALIZER_HH_

#include <nlohmann/json.hpp>

#include <string>

namespace Shuffling {
namespace Scoring {

struct AlgorithmStatistics;
struct MetricComparison;
struct StatisticsComparison;
struct RandomnessEstimate;

/** \brief Key for AlgorithmStatistics::algorithmName
 *
 * \sa \ref jsonalgorithmstatistics
 */
extern const std::string STATS_ALGORITHM_NAME_KEY;

/** \brief Key for AlgorithmStatistics::shuffleCount
 *
 * \sa \ref jsonalgorithmstatistics
 */
extern const std::string STATS_SHUFFLE_COUNT_KEY;

/** \brief Key for AlgorithmStatistics::averageStepCount
 *
 * \sa \ref jsonalgorithmstatistics
 */
extern const std::string STATS_AVERAGE_STEP_COUNT_KEY;

/** \brief Key for AlgorithmStatistics::randomnessScore
 *
 * \sa \ref jsonalgorithmstatistics
 */
extern const std::string STATS_RANDOMNESS_SCORE_KEY;

/** \brief Key for AlgorithmStatistics::executionTimes
 *
 * \sa \ref jsonalgorithmstatistics
 */
extern const std::string STATS_EXECUTION_TIMES_KEY;

/** \brief Key for MetricComparison::firstValue
 *
 * \sa \ref jsonstatisticscomparison
 */
extern const std::string METRIC_FIRST_VALUE_KEY;

/** \brief Key for MetricComparison::secondValue
 *
 * \sa \ref jsonstatisticscomparison
 */
extern const std::string METRIC_SECOND_VALUE_KEY;

/** \brief Key for MetricComparison::winner
 *
 * \sa \ref jsonstatisticscomparison
 */
extern const std::string METRIC_WINNER_KEY;

/** \brief Key for StatisticsComparison::firstName
 *
 * \sa \ref jsonstatisticscomparison
 */
extern const std::string COMPARISON_FIRST_KEY;

/** \brief Key for StatisticsComparison::secondName
 *
 * \sa \ref jsonstatisticscomparison
 */
extern const std::string COMPARISON_SECOND_KEY;

/** \brief Key for StatisticsComparison::randomness
 *
 * \sa \ref jsonstatisticscomparison
 */
extern const std::string COMPARISON_RANDOMNESS_KEY;

/** \brief Key for StatisticsComparison::speed
 *
 * \sa \ref jsonstatisticscomparison
 */
extern const std::string COMPARISON_SPEED_KEY;

/** \brief Key for StatisticsComparison::steps
 *
 * \sa \ref jsonstatisticscomparison
 */
extern const std::string COMPARISON_STEPS_KEY;

/** \brief Key for RandomnessEstimate::displacementScore
 *
 * \sa \ref jsonrandomnessestimate
 */
extern const std::string ESTIMATE_DISPLACEMENT_KEY;

/** \brief Key for RandomnessEstimate::entropyScore
 *
 * \sa \ref jsonrandomnessestimate
 */
extern const std::string ESTIMATE_ENTROPY_KEY;

/** \brief Key for RandomnessEstimate::suitRuns
 *
 * \sa \ref jsonrandomnessestimate
 */
extern const std::string ESTIMATE_SUIT_RUNS_KEY;

/** \brief Convert AlgorithmStatistics to JSON
 */
void to_json(nlohmann::json&, const AlgorithmStatistics&);

/** \brief Convert JSON to AlgorithmStatistics
 */
void from_json(const nlohmann::json&, AlgorithmStatistics&);

/** \brief Convert MetricComparison to JSON
 */
void to_json(nlohmann::json&, const MetricComparison&);

/** \brief Convert JSON to MetricComparison
 */
void from_json(const nlohmann::json&, MetricComparison&);

/** \brief Convert StatisticsComparison to JSON
 */
void to_json(nlohmann::json&, const StatisticsComparison&);

/** \brief Convert JSON to StatisticsComparison
 */
void from_json(const nlohmann::json&, StatisticsComparison&);

/** \brief Convert RandomnessEstimate to JSON
 */
void to_json(nlohmann::json&, const RandomnessEstimate&);

/** \brief Convert JSON to RandomnessEstimate
 */
void from_json(const nlohmann::json&, RandomnessEstimate&);

}
}

#endif // MESSAGING_STATISTICSJSONSERIALIZER_HH_
