#include "engine/OverhandShuffle.hh"

#include "engine/MoveEmitter.hh"
#include "shuffling/Random.hh"

#include <boost/format.hpp>

#include <algorithm>

namespace Shuffling {
namespace Engine {

namespace {

constexpr auto MAX_GROUP_SIZE = 7;

const auto DESCRIPTOR = AlgorithmDescriptor {
    "Overhand Shuffle",
    "Common casual shuffling method where small groups of cards are taken "
    "from the top of the deck and placed on the bottom. While intuitive, it "
    "requires many iterations to achieve good randomization and has poor "
    "mixing properties.",
    "O(n²) for full randomization",
};

}

const AlgorithmDescriptor& OverhandShuffle::handleGetDescriptor() const
{
    return DESCRIPTOR;
}

void OverhandShuffle::handleRun(
    const int size, RandomSource& random, MoveEmitter& emitter) const
{
    // Working deck: the remaining cards, then the accumulated result
    for (auto remaining = size; remaining > 0; ) {
        const auto group = random.drawInteger(
            1, std::min(MAX_GROUP_SIZE, remaining));
        auto description = boost::format(
            "Step %1%: Take %2% card%3% from top and place on bottom") %
            (emitter.getNumberOfSteps() + 1) % group % (group > 1 ? "s" : "");
        auto destinations = makeIndexRange(remaining - group, remaining);
        emitter.emit(
            makeMoveRecord(
                description.str(), destinations, makeIndexRange(0, group),
                destinations));
        remaining -= group;
    }
}

}
}
