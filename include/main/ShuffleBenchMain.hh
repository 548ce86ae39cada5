/** \file
 *
 * \brief Definition of Shuffling::Main::ShuffleBenchMain class
 */

#ifndef MAIN_SHUFFLEBENCHMAIN_HH_
#define MAIN_SHUFFLEBENCHMAIN_HH_

#include "engine/AlgorithmDescriptor.hh"
#include "scoring/AlgorithmStatistics.hh"
#include "shuffling/Deck.hh"
#include "shuffling/Random.hh"

#include <boost/core/noncopyable.hpp>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Shuffling {

/** \brief The glue code of the benchmark driver
 *
 * The main class ShuffleBenchMain runs the shuffle algorithms against each
 * other and collects their statistics.
 */
namespace Main {

class Config;

/** \brief Options of a benchmark run
 *
 * The options are initially read from Config, and may then be overridden from
 * the command line.
 */
struct BenchOptions {
    std::vector<std::string> algorithms;  ///< \brief Empty means all
    int rounds;                           ///< \brief Shuffles per algorithm
    std::optional<Rng::result_type> seed; ///< \brief Seed, if deterministic
    int deckSize;                         ///< \brief Number of cards
    bool verifyReplay;                    ///< \brief Verify recorded steps
};

/** \brief Create benchmark options from configuration
 *
 * \param config the configuration
 */
BenchOptions optionsFromConfig(const Config& config);

/** \brief Benchmark the shuffle algorithms
 *
 * Each shuffle is done twice from the same random draws: once in bulk mode,
 * which is timed, and once in step mode. Unless disabled, the recorded steps
 * are replayed against the original deck and the result is required to equal
 * the bulk result.
 */
class ShuffleBenchMain : private boost::noncopyable {
public:

    /** \brief Create benchmark
     *
     * \param options the options of the run
     * \param random the random source the shuffles draw from
     *
     * \throw InvalidInputException if an algorithm is unknown, or the deck
     * size or the number of rounds is invalid
     */
    ShuffleBenchMain(const BenchOptions& options, RandomSource& random);

    /** \brief Run all rounds for all algorithms
     */
    void run();

    /** \brief Run one shuffle
     *
     * \param name the name of the algorithm
     *
     * \return the shuffled deck
     *
     * \throw InvalidInputException if \p name is not benchmarked
     * \throw InvariantViolationException if the replayed steps do not
     * reproduce the bulk result
     */
    Deck runShuffle(std::string_view name);

    /** \brief Get the descriptors of the benchmarked algorithms
     */
    const Engine::AlgorithmDescriptorVector& getAlgorithms() const;

    /** \brief Get the original deck
     */
    const Deck& getDeck() const;

    /** \brief Get the statistics collected so far
     */
    const Scoring::AlgorithmStatisticsMap& getStatistics() const;

    /** \brief Compare each pair of benchmarked algorithms
     *
     * \return the comparisons of each pair, the first algorithm of the pair
     * being the one listed first
     */
    std::vector<Scoring::StatisticsComparison> getComparisons() const;

    /** \brief Create the report of the benchmark
     *
     * \return JSON object containing the deck size, the statistics of each
     * algorithm and the pairwise comparisons
     */
    nlohmann::json getReport() const;

    /** \brief Record the steps of one shuffle of each algorithm
     *
     * The statistics are not affected.
     *
     * \return JSON array containing, for each algorithm, its descriptor, the
     * recorded steps and the deck after the last step
     */
    nlohmann::json getStepsReport();

private:

    const Engine::AlgorithmDescriptorVector algorithms;
    const int rounds;
    const bool verifyReplay;
    const Deck deck;
    RandomSource& random;
    Scoring::AlgorithmStatisticsMap statistics;
};

}
}

#endif // MAIN_SHUFFLEBENCHMAIN_HH_
