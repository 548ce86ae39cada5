#include "engine/ShuffleAlgorithm.hh"

#include "engine/MoveEmitter.hh"
#include "shuffling/InvalidInputException.hh"
#include "Logging.hh"

namespace Shuffling {
namespace Engine {

ShuffleAlgorithm::~ShuffleAlgorithm() = default;

const AlgorithmDescriptor& ShuffleAlgorithm::getDescriptor() const
{
    return handleGetDescriptor();
}

Deck ShuffleAlgorithm::shuffle(const Deck& deck, RandomSource& random) const
{
    validateDeck(deck);
    log(LogLevel::DEBUG, "Shuffling %d cards with %s",
        deck.size(), getDescriptor().name);
    auto emitter = BulkMoveEmitter {deck};
    run(static_cast<int>(deck.size()), random, emitter);
    return emitter.getDeck();
}

TransformationRecordVector ShuffleAlgorithm::recordSteps(
    const Deck& deck, RandomSource& random) const
{
    validateDeck(deck);
    log(LogLevel::DEBUG, "Recording steps for %d cards with %s",
        deck.size(), getDescriptor().name);
    auto emitter = RecordingMoveEmitter {deck.size()};
    run(static_cast<int>(deck.size()), random, emitter);
    log(LogLevel::DEBUG, "Recorded %d steps", emitter.getNumberOfSteps());
    return emitter.getRecords();
}

void ShuffleAlgorithm::run(
    const int size, RandomSource& random, MoveEmitter& emitter) const
{
    if (size < 1) {
        throw InvalidInputException {"Cannot shuffle empty deck"};
    }
    handleRun(size, random, emitter);
}

}
}
