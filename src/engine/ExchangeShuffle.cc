#include "engine/ExchangeShuffle.hh"

#include "engine/MoveEmitter.hh"
#include "shuffling/Random.hh"

#include <boost/format.hpp>

namespace Shuffling {
namespace Engine {

namespace {

const auto DESCRIPTOR = AlgorithmDescriptor {
    "Fisher-Yates",
    "Modern unbiased shuffle algorithm that produces a uniformly random "
    "permutation. Each card has an equal probability of ending up in any "
    "position. This is the gold standard for computer-based shuffling.",
    "O(n)",
};

}

const AlgorithmDescriptor& ExchangeShuffle::handleGetDescriptor() const
{
    return DESCRIPTOR;
}

void ExchangeShuffle::handleRun(
    const int size, RandomSource& random, MoveEmitter& emitter) const
{
    for (auto i = size - 1; i > 0; --i) {
        const auto j = random.drawInteger(0, i);
        auto description = boost::format(
            "Step %1%: Swap card at position %2% with card at position %3%") %
            (emitter.getNumberOfSteps() + 1) % i % j;
        emitter.emit(makeSwapRecord(description.str(), i, j));
    }
}

}
}
