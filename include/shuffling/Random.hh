/** \file
 *
 * \brief Definition of the random sources used by the shuffle algorithms
 */

#ifndef RANDOM_HH_
#define RANDOM_HH_

#include <boost/core/noncopyable.hpp>

#include <cstddef>
#include <random>
#include <vector>

namespace Shuffling {

/** \brief The preferred random number generator for the shuffling engine
 */
using Rng = std::mt19937;

/** \brief Source of uniformly distributed random draws
 *
 * The shuffle algorithms never use ambient randomness. Instead they draw from
 * a RandomSource supplied by the caller. Tests substitute sources that replay
 * a fixed trace of draws, which makes it possible to check an algorithm
 * against a known result.
 */
class RandomSource : private boost::noncopyable {
public:

    virtual ~RandomSource();

    /** \brief Draw a uniformly distributed integer
     *
     * \param low the lower bound (inclusive)
     * \param high the upper bound (inclusive)
     *
     * \return an integer between \p low and \p high
     *
     * \throw std::invalid_argument if low > high
     */
    int drawInteger(int low, int high);

    /** \brief Draw a fair boolean
     *
     * This is equivalent to <tt>drawInteger(0, 1) == 1</tt>, and consumes
     * exactly one draw.
     *
     * \return true or false with equal probability
     */
    bool drawBoolean();

private:

    /** \brief Handle for drawing an integer
     *
     * It may be assumed that low <= high.
     *
     * \sa drawInteger()
     */
    virtual int handleDrawInteger(int low, int high) = 0;
};

/** \brief Random source backed by the Mersenne Twister engine
 */
class RngRandomSource : public RandomSource {
public:

    /** \brief Create random source seeded from the OS random number source
     */
    RngRandomSource();

    /** \brief Create random source with fixed seed
     *
     * Two sources created with the same seed produce the same draws.
     *
     * \param seed the seed
     */
    explicit RngRandomSource(Rng::result_type seed);

private:

    int handleDrawInteger(int low, int high) override;

    Rng rng;
};

/** \brief Random source that records the draws of another source
 *
 * The trace can later be replayed with ReplayRandomSource.
 */
class RecordingRandomSource : public RandomSource {
public:

    /** \brief Create recording random source
     *
     * \param source the underlying source. It is the responsibility of the
     * caller to ensure that the lifetime of \p source exceeds the lifetime of
     * the recording source.
     */
    explicit RecordingRandomSource(RandomSource& source);

    /** \brief Get the draws made so far, in order
     */
    const std::vector<int>& getTrace() const;

private:

    int handleDrawInteger(int low, int high) override;

    RandomSource& source;
    std::vector<int> trace;
};

/** \brief Random source that replays a fixed trace of draws
 */
class ReplayRandomSource : public RandomSource {
public:

    /** \brief Create replay random source
     *
     * \param trace the draws returned, in order
     */
    explicit ReplayRandomSource(std::vector<int> trace);

    /** \brief Determine if every draw in the trace has been consumed
     */
    bool isExhausted() const;

private:

    int handleDrawInteger(int low, int high) override;

    std::vector<int> trace;
    std::size_t next;
};

}

#endif // RANDOM_HH_
