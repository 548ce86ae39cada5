#include "engine/MoveEmitter.hh"

#include "engine/StepApplicator.hh"

#include <utility>

namespace Shuffling {
namespace Engine {

MoveEmitter::~MoveEmitter() = default;

void MoveEmitter::emit(TransformationRecord record)
{
    handleEmit(std::move(record));
    ++nSteps;
}

std::size_t MoveEmitter::getNumberOfSteps() const
{
    return nSteps;
}

BulkMoveEmitter::BulkMoveEmitter(Deck deck) :
    deck(std::move(deck))
{
}

Deck BulkMoveEmitter::getDeck() const
{
    return resetPositions(deck);
}

void BulkMoveEmitter::handleEmit(TransformationRecord record)
{
    checkRecord(record, deck.size());
    deck = reorder(std::move(deck), record);
}

RecordingMoveEmitter::RecordingMoveEmitter(const std::size_t size) :
    size {size},
    records {}
{
}

const TransformationRecordVector& RecordingMoveEmitter::getRecords() const
{
    return records;
}

void RecordingMoveEmitter::handleEmit(TransformationRecord record)
{
    checkRecord(record, size);
    records.emplace_back(std::move(record));
}

}
}
