#include "engine/RiffleShuffle.hh"

#include "engine/MoveEmitter.hh"
#include "shuffling/Random.hh"

#include <boost/format.hpp>

#include <algorithm>

namespace Shuffling {
namespace Engine {

namespace {

const auto DESCRIPTOR = AlgorithmDescriptor {
    "Riffle Shuffle",
    "Simulates the physical riffle shuffle used in card games. The deck is "
    "split roughly in half and the cards are interleaved with slight "
    "randomization. Commonly used in casinos and card games.",
    "O(n)",
};

}

const AlgorithmDescriptor& RiffleShuffle::handleGetDescriptor() const
{
    return DESCRIPTOR;
}

void RiffleShuffle::handleRun(
    const int size, RandomSource& random, MoveEmitter& emitter) const
{
    const auto variation = random.drawInteger(-1, 1);
    const auto split = std::max(1, std::min(size - 1, size / 2 + variation));
    const auto n_left = split;
    const auto n_right = size - split;
    emitter.emit(
        makeSplitRecord(
            boost::str(
                boost::format(
                    "Step 1: Split deck at position %1% "
                    "(%2% cards left, %3% cards right)") %
                split % n_left % n_right),
            size));

    // Working deck: output so far, then the rest of the left half, then the
    // rest of the right half
    auto left = 0;
    auto right = 0;
    while (left < n_left || right < n_right) {
        const auto step = emitter.getNumberOfSteps() + 1;
        const auto output = left + right;
        const auto from_left =
            left < n_left && (right >= n_right || random.drawBoolean());
        if (from_left) {
            auto description = boost::format(
                "Step %1%: Take card from left half "
                "(position %2% in left half)") % step % left;
            emitter.emit(
                makeMoveRecord(
                    description.str(), {output}, {output}, {output}));
            ++left;
        } else {
            const auto source = split + right;
            auto description = boost::format(
                "Step %1%: Take card from right half "
                "(position %2% in right half)") % step % right;
            emitter.emit(
                makeMoveRecord(
                    description.str(), {output}, {source}, {output}));
            ++right;
        }
    }
}

}
}
