/** \file
 *
 * \brief Definition of the registry of shuffle algorithms
 *
 * These functions are the entry points the presentation layer uses to run
 * the shuffle algorithms by name.
 */

#ifndef ENGINE_SHUFFLEENGINE_HH_
#define ENGINE_SHUFFLEENGINE_HH_

#include "engine/AlgorithmDescriptor.hh"
#include "engine/TransformationRecord.hh"
#include "shuffling/Deck.hh"

#include <string_view>

namespace Shuffling {

class RandomSource;

namespace Engine {

class ShuffleAlgorithm;

/** \brief List the available shuffle algorithms
 *
 * \return descriptors of the exchange (Fisher–Yates), riffle, overhand and
 * Hindu shuffles, in that order
 */
AlgorithmDescriptorVector listAlgorithms();

/** \brief Look up a shuffle algorithm by name
 *
 * \param name the name of the algorithm
 *
 * \return reference to the algorithm
 *
 * \throw InvalidInputException if there is no algorithm named \p name
 */
const ShuffleAlgorithm& getAlgorithm(std::string_view name);

/** \brief Shuffle a deck with the named algorithm
 *
 * \param name the name of the algorithm
 * \param deck the deck
 * \param random the random source
 *
 * \return the shuffled deck
 *
 * \throw InvalidInputException if the algorithm is unknown or \p deck is
 * empty
 * \throw InvariantViolationException if \p deck contains duplicate ids
 *
 * \sa ShuffleAlgorithm::shuffle()
 */
Deck shuffle(std::string_view name, const Deck& deck, RandomSource& random);

/** \brief Record the steps of shuffling a deck with the named algorithm
 *
 * \param name the name of the algorithm
 * \param deck the deck
 * \param random the random source
 *
 * \return the transformation records
 *
 * \throw InvalidInputException if the algorithm is unknown or \p deck is
 * empty
 * \throw InvariantViolationException if \p deck contains duplicate ids
 *
 * \sa ShuffleAlgorithm::recordSteps()
 */
TransformationRecordVector recordSteps(
    std::string_view name, const Deck& deck, RandomSource& random);

}
}

#endif // ENGINE_SHUFFLEENGINE_HH_
