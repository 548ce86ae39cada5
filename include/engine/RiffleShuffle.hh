/** \file
 *
 * \brief Definition of Shuffling::Engine::RiffleShuffle class
 */

#ifndef ENGINE_RIFFLESHUFFLE_HH_
#define ENGINE_RIFFLESHUFFLE_HH_

#include "engine/ShuffleAlgorithm.hh"

namespace Shuffling {
namespace Engine {

/** \brief Riffle shuffle
 *
 * The deck is split near the middle, with the split point perturbed by a
 * random draw from <tt>[-1, 1]</tt> and clamped to <tt>[1, N - 1]</tt>. The
 * halves are then interleaved. While both halves have cards, a fair boolean
 * decides which half the next card comes from. Once one half is exhausted
 * the rest of the other half follows without further draws.
 *
 * The steps are one StepKind::SPLIT annotation followed by one
 * StepKind::MOVE record per card. The working deck consists of the output so
 * far, followed by what is left of the left half and the right half.
 */
class RiffleShuffle : public ShuffleAlgorithm {
private:

    const AlgorithmDescriptor& handleGetDescriptor() const override;

    void handleRun(
        int size, RandomSource& random, MoveEmitter& emitter) const override;
};

}
}

#endif // ENGINE_RIFFLESHUFFLE_HH_
