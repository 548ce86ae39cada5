/** \file
 *
 * \brief Definition of Shuffling::Engine::ShuffleAlgorithm interface
 */

#ifndef ENGINE_SHUFFLEALGORITHM_HH_
#define ENGINE_SHUFFLEALGORITHM_HH_

#include "engine/AlgorithmDescriptor.hh"
#include "engine/TransformationRecord.hh"
#include "shuffling/Deck.hh"

#include <boost/core/noncopyable.hpp>

namespace Shuffling {

class RandomSource;

namespace Engine {

class MoveEmitter;

/** \brief A shuffle algorithm
 *
 * ShuffleAlgorithm is the interface of the shuffle algorithms. An algorithm is
 * described by a single run() that emits the steps of the shuffle to a
 * MoveEmitter. shuffle() and recordSteps() are the bulk and step mode views of
 * that same run. Given the same sequence of random draws, replaying the
 * records returned by recordSteps() with applyStep() yields exactly the deck
 * returned by shuffle().
 *
 * Algorithms are stateless and never modify their input.
 */
class ShuffleAlgorithm : private boost::noncopyable {
public:

    virtual ~ShuffleAlgorithm();

    /** \brief Get the descriptor of the algorithm
     */
    const AlgorithmDescriptor& getDescriptor() const;

    /** \brief Shuffle a deck
     *
     * \param deck the deck
     * \param random the random source
     *
     * \return a permutation of \p deck, with positions renumbered and
     * highlights cleared
     *
     * \throw InvalidInputException if \p deck is empty
     * \throw InvariantViolationException if \p deck contains duplicate ids
     */
    Deck shuffle(const Deck& deck, RandomSource& random) const;

    /** \brief Record the steps of a shuffle
     *
     * \param deck the deck
     * \param random the random source
     *
     * \return the transformation records of the shuffle, in order
     *
     * \throw InvalidInputException if \p deck is empty
     * \throw InvariantViolationException if \p deck contains duplicate ids
     */
    TransformationRecordVector recordSteps(
        const Deck& deck, RandomSource& random) const;

    /** \brief Run the algorithm
     *
     * \param size the number of cards, at least one
     * \param random the random source
     * \param emitter the emitter the steps are emitted to
     */
    void run(int size, RandomSource& random, MoveEmitter& emitter) const;

private:

    /** \brief Handle for returning the descriptor
     *
     * \sa getDescriptor()
     */
    virtual const AlgorithmDescriptor& handleGetDescriptor() const = 0;

    /** \brief Handle for running the algorithm
     *
     * It may be assumed that size >= 1.
     *
     * \sa run()
     */
    virtual void handleRun(
        int size, RandomSource& random, MoveEmitter& emitter) const = 0;
};

}
}

#endif // ENGINE_SHUFFLEALGORITHM_HH_
