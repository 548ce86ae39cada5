/** \file
 *
 * \brief Definition of Shuffling::Scoring::AlgorithmStatistics struct and the
 * statistics aggregator
 */

#ifndef SCORING_ALGORITHMSTATISTICS_HH_
#define SCORING_ALGORITHMSTATISTICS_HH_

#include "engine/AlgorithmDescriptor.hh"
#include "shuffling/Deck.hh"

#include <boost/operators.hpp>

#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace Shuffling {
namespace Scoring {

/** \brief Running statistics of a shuffle algorithm
 *
 * The averages are kept unrounded. They are unweighted means over every
 * shuffle recorded so far.
 *
 * AlgorithmStatistics objects are equality comparable. They compare equal
 * when all their fields are equal.
 */
struct AlgorithmStatistics :
        private boost::equality_comparable<AlgorithmStatistics> {
    std::string algorithmName;          ///< \brief Name of the algorithm
    int shuffleCount {};                ///< \brief Number of shuffles
    double averageStepCount {};         ///< \brief Mean number of steps
    double randomnessScore {};          ///< \brief Mean randomness, 0–100
    std::vector<double> executionTimes; ///< \brief Execution times (ms)
};

/** \brief Statistics of every algorithm, keyed by algorithm name
 *
 * The map is owned by the caller and passed to the functions that update it.
 */
using AlgorithmStatisticsMap =
    std::map<std::string, AlgorithmStatistics, std::less<>>;

/** \brief Create zeroed statistics
 *
 * \param algorithmName the name of the algorithm
 */
AlgorithmStatistics initStats(std::string algorithmName);

/** \brief Create zeroed statistics for each algorithm
 *
 * \param algorithms the algorithms
 *
 * \return map from the name of each algorithm to zeroed statistics
 */
AlgorithmStatisticsMap initAllStats(
    const Engine::AlgorithmDescriptorVector& algorithms);

/** \brief Add a shuffle to statistics
 *
 * Increments the shuffle count, folds \p stepCount and the randomness
 * estimate of the shuffle into the running averages and appends \p
 * executionTimeMs to the execution time history.
 *
 * \param stats the statistics before the shuffle
 * \param original the deck before the shuffle
 * \param shuffled the deck after the shuffle
 * \param executionTimeMs the time the shuffle took in milliseconds
 * \param stepCount the number of steps in the shuffle
 *
 * \return the updated statistics
 *
 * \throw InvalidInputException if \p executionTimeMs or \p stepCount is
 * negative
 */
AlgorithmStatistics updateStats(
    const AlgorithmStatistics& stats, const Deck& original,
    const Deck& shuffled, double executionTimeMs, int stepCount);

/** \brief Reset the statistics of every algorithm
 *
 * The statistics of all algorithms are reset together. There is no per
 * algorithm reset.
 *
 * \param stats the statistics
 */
void clearAllStats(AlgorithmStatisticsMap& stats);

/** \brief Compute the mean execution time
 *
 * \return the mean of the execution times, or zero if there are none
 */
double averageExecutionTime(const AlgorithmStatistics& stats);

/** \brief Comparison of one metric between two algorithms
 */
struct MetricComparison : private boost::equality_comparable<MetricComparison> {
    double firstValue {};   ///< \brief Value of the first algorithm
    double secondValue {};  ///< \brief Value of the second algorithm
    std::string winner;     ///< \brief Name of the winning algorithm
};

/** \brief Comparison between two algorithms
 */
struct StatisticsComparison :
        private boost::equality_comparable<StatisticsComparison> {
    std::string firstName;        ///< \brief Name of the first algorithm
    std::string secondName;       ///< \brief Name of the second algorithm
    MetricComparison randomness;  ///< \brief Higher randomness wins
    MetricComparison speed;       ///< \brief Lower execution time wins
    MetricComparison steps;       ///< \brief Lower step count wins
};

/** \brief Compare the statistics of two algorithms
 *
 * For each metric, the winner is the algorithm with the better value. On
 * equal values the first algorithm wins.
 *
 * \param first the statistics of the first algorithm
 * \param second the statistics of the second algorithm
 */
StatisticsComparison compareStats(
    const AlgorithmStatistics& first, const AlgorithmStatistics& second);

/** \brief Equality operator for algorithm statistics
 */
bool operator==(const AlgorithmStatistics&, const AlgorithmStatistics&);

/** \brief Equality operator for metric comparisons
 */
bool operator==(const MetricComparison&, const MetricComparison&);

/** \brief Equality operator for statistics comparisons
 */
bool operator==(const StatisticsComparison&, const StatisticsComparison&);

/** \brief Output AlgorithmStatistics to stream
 *
 * \param os the output stream
 * \param stats the statistics to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const AlgorithmStatistics& stats);

}
}

#endif // SCORING_ALGORITHMSTATISTICS_HH_
