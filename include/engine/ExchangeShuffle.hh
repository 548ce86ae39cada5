/** \file
 *
 * \brief Definition of Shuffling::Engine::ExchangeShuffle class
 */

#ifndef ENGINE_EXCHANGESHUFFLE_HH_
#define ENGINE_EXCHANGESHUFFLE_HH_

#include "engine/ShuffleAlgorithm.hh"

namespace Shuffling {
namespace Engine {

/** \brief Exchange (Fisher–Yates) shuffle
 *
 * For each index \c i from the last down to 1, draws \c j uniformly from
 * <tt>[0, i]</tt> and swaps the cards at \c i and \c j. The result is
 * uniformly distributed over all orderings of the deck. Each swap is emitted
 * as one StepKind::SWAP record.
 */
class ExchangeShuffle : public ShuffleAlgorithm {
private:

    const AlgorithmDescriptor& handleGetDescriptor() const override;

    void handleRun(
        int size, RandomSource& random, MoveEmitter& emitter) const override;
};

}
}

#endif // ENGINE_EXCHANGESHUFFLE_HH_
