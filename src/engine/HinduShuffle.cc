#include "engine/HinduShuffle.hh"

#include "engine/MoveEmitter.hh"
#include "shuffling/Random.hh"

#include <boost/format.hpp>

#include <algorithm>

namespace Shuffling {
namespace Engine {

namespace {

constexpr auto MAX_PACKET_SIZE = 6;

const auto DESCRIPTOR = AlgorithmDescriptor {
    "Hindu Shuffle",
    "Traditional shuffle method from South Asia where small packets of cards "
    "are pulled from the bottom of the deck and dropped on top. Similar to "
    "overhand shuffle but with opposite direction of movement.",
    "O(n²) for full randomization",
};

}

const AlgorithmDescriptor& HinduShuffle::handleGetDescriptor() const
{
    return DESCRIPTOR;
}

void HinduShuffle::handleRun(
    const int size, RandomSource& random, MoveEmitter& emitter) const
{
    // Working deck: the remaining cards, then the accumulated result
    for (auto remaining = size; remaining > 0; ) {
        const auto packet = random.drawInteger(
            1, std::min(MAX_PACKET_SIZE, remaining));
        auto description = boost::format(
            "Step %1%: Pull %2% card%3% from bottom and drop on top") %
            (emitter.getNumberOfSteps() + 1) % packet % (packet > 1 ? "s" : "");
        auto destinations = makeIndexRange(size - packet, size);
        emitter.emit(
            makeMoveRecord(
                description.str(), destinations,
                makeIndexRange(remaining - packet, remaining), destinations));
        remaining -= packet;
    }
}

}
}
