/** \file
 *
 * \brief Definition of Shuffling::Engine::OverhandShuffle class
 */

#ifndef ENGINE_OVERHANDSHUFFLE_HH_
#define ENGINE_OVERHANDSHUFFLE_HH_

#include "engine/ShuffleAlgorithm.hh"

namespace Shuffling {
namespace Engine {

/** \brief Overhand shuffle
 *
 * Repeatedly takes a group of 1 to 7 cards from the top of the working deck
 * and places it on the front of the accumulated result, until the working
 * deck is empty. The group size is drawn uniformly from <tt>[1, min(7,
 * remaining)]</tt>. A single pass mixes the deck poorly.
 *
 * Each group is emitted as one StepKind::MOVE record. The working deck is the
 * remaining cards followed by the accumulated result.
 */
class OverhandShuffle : public ShuffleAlgorithm {
private:

    const AlgorithmDescriptor& handleGetDescriptor() const override;

    void handleRun(
        int size, RandomSource& random, MoveEmitter& emitter) const override;
};

}
}

#endif // ENGINE_OVERHANDSHUFFLE_HH_
