/** \file
 *
 * \brief Definition of Shuffling::Engine::HinduShuffle class
 */

#ifndef ENGINE_HINDUSHUFFLE_HH_
#define ENGINE_HINDUSHUFFLE_HH_

#include "engine/ShuffleAlgorithm.hh"

namespace Shuffling {
namespace Engine {

/** \brief Hindu shuffle
 *
 * Repeatedly pulls a packet of 1 to 6 cards from the bottom of the working
 * deck and drops it on the back of the accumulated result, preserving the
 * order inside the packet, until the working deck is empty. The packet size
 * is drawn uniformly from <tt>[1, min(6, remaining)]</tt>.
 *
 * Each packet is emitted as one StepKind::MOVE record. The working deck is
 * the remaining cards followed by the accumulated result.
 */
class HinduShuffle : public ShuffleAlgorithm {
private:

    const AlgorithmDescriptor& handleGetDescriptor() const override;

    void handleRun(
        int size, RandomSource& random, MoveEmitter& emitter) const override;
};

}
}

#endif // ENGINE_HINDUSHUFFLE_HH_
