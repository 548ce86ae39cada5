/** \file
 *
 * \brief Definition of Shuffling::Main::Config class
 */

#ifndef MAIN_CONFIG_HH_
#define MAIN_CONFIG_HH_

#include "shuffling/Random.hh"
#include "Logging.hh"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Shuffling {
namespace Main {

/** \brief Configuration file processing utility
 *
 * The configuration of the benchmark driver is a Lua script. After the script
 * has run, the following global variables are read:
 *
 * - \c algorithms: array of algorithm names to benchmark. If missing, all
 *   registered algorithms are benchmarked.
 * - \c rounds: number of shuffles per algorithm, default 1
 * - \c seed: seed of the random number generator. If missing, the generator is
 *   seeded from a nondeterministic source.
 * - \c deck_size: number of cards in the deck, default 52
 * - \c verify_replay: whether the recorded steps are replayed and compared to
 *   the bulk result, default true
 * - \c log_level: one of "none", "fatal", "error", "warning", "info",
 *   "debug"
 *
 * Values of wrong type or out of range are ignored with a warning.
 */
class Config {
public:

    /** \brief Vector of algorithm names
     */
    using AlgorithmNameVector = std::vector<std::string>;

    /** \brief Default number of rounds
     */
    static constexpr auto DEFAULT_ROUNDS = 1;

    /** \brief Create configuration with default values
     */
    Config();

    /** \brief Create configuration from stream
     *
     * The constructor reads configuration script from stream \p in and
     * processes it. The processing involves reading the stream until EOF,
     * parsing the contents as Lua script and running the script.
     *
     * \throw std::runtime_error if reading the stream or processing the script
     * fails
     */
    Config(std::istream& in);

    /** \brief Move constructor
     */
    Config(Config&&);

    ~Config();

    /** \brief Move assignment
     */
    Config& operator=(Config&&);

    /** \brief Get the names of the algorithms to benchmark
     *
     * \return the names in the order given, or empty vector if all algorithms
     * are benchmarked
     */
    const AlgorithmNameVector& getAlgorithms() const;

    /** \brief Get the number of rounds per algorithm
     */
    int getRounds() const;

    /** \brief Get the seed of the random number generator
     *
     * \return the seed, or none if the generator is seeded nondeterministically
     */
    std::optional<Rng::result_type> getSeed() const;

    /** \brief Get the deck size
     */
    int getDeckSize() const;

    /** \brief Determine if the recorded steps are verified
     */
    bool getVerifyReplay() const;

    /** \brief Get the logging level
     *
     * \return the logging level, or none if not configured
     */
    std::optional<LogLevel> getLogLevel() const;

private:

    class Impl;
    std::unique_ptr<const Impl> impl;
};

/** \brief Create configuration from file
 *
 * Depending on the value the \p path, the function generates the config object
 * in different ways:
 * - If \p path is empty, default configuration is returned
 * - If \p path is hyphen (“-”), configuration is read from stdin
 * - Otherwise \p path is interpreted as path to the configuration file
 *
 * \param path the path of the configuration file
 *
 * \return config object based on the file
 */
Config configFromPath(std::string_view path);

}
}

#endif // MAIN_CONFIG_HH_
