#include "engine/StepApplicator.hh"

#include "shuffling/InvalidInputException.hh"
#include "shuffling/InvariantViolationException.hh"
#include "Utility.hh"
#include "Logging.hh"

#include <boost/format.hpp>

#include <algorithm>
#include <utility>
#include <vector>

namespace Shuffling {
namespace Engine {

namespace {

void checkIndices(
    const TransformationRecord::IndexVector& indices, const std::size_t size,
    const bool allowRepeats)
{
    const auto n = static_cast<int>(size);
    auto seen = std::vector<bool>(size);
    for (const auto i : indices) {
        if (i < 0 || i >= n) {
            throw InvariantViolationException {
                boost::str(
                    boost::format("Record refers to index %1% outside deck of %2% cards") %
                    i % size)};
        }
        if (seen[i] && !allowRepeats) {
            throw InvariantViolationException {
                boost::str(boost::format("Record repeats index %1%") % i)};
        }
        seen[i] = true;
    }
}

}

void checkRecord(const TransformationRecord& record, const std::size_t size)
{
    // A card swapped with itself is a legitimate Fisher-Yates step
    const auto is_swap = record.kind == StepKinds::SWAP;
    checkIndices(record.affectedIndices, size, is_swap);
    checkIndices(record.sourcePositions, size, is_swap);
    checkIndices(record.destinationPositions, size, is_swap);
    if (record.sourcePositions.size() != record.destinationPositions.size()) {
        throw InvariantViolationException {
            "Record has source and destination of different length"};
    }
    if (is_swap) {
        const auto& indices = record.affectedIndices;
        const auto valid = indices.size() == 2 &&
            record.sourcePositions == indices &&
            record.destinationPositions ==
            TransformationRecord::IndexVector(indices.rbegin(), indices.rend());
        if (!valid) {
            throw InvariantViolationException {"Malformed swap record"};
        }
    }
}

Deck reorder(Deck deck, const TransformationRecord& record)
{
    if (record.kind == StepKinds::SWAP) {
        std::swap(
            deck[record.affectedIndices[0]], deck[record.affectedIndices[1]]);
        return deck;
    }

    const auto& sources = record.sourcePositions;
    const auto& destinations = record.destinationPositions;
    auto lifted = std::vector<bool>(deck.size());
    auto owner = std::vector<int>(deck.size(), -1);
    for (const auto k : to(sources.size())) {
        lifted[sources[k]] = true;
        owner[destinations[k]] = static_cast<int>(k);
    }

    auto rest = Deck {};
    rest.reserve(deck.size() - sources.size());
    for (const auto n : to(deck.size())) {
        if (!lifted[n]) {
            rest.emplace_back(std::move(deck[n]));
        }
    }

    auto result = Deck {};
    result.reserve(deck.size());
    auto rest_iter = rest.begin();
    for (const auto k : owner) {
        if (k >= 0) {
            result.emplace_back(std::move(deck[sources[k]]));
        } else {
            result.emplace_back(std::move(*rest_iter++));
        }
    }
    return result;
}

Deck applyStep(const Deck& deck, const TransformationRecord& record)
{
    if (deck.empty()) {
        throw InvalidInputException {"Cannot apply step to empty deck"};
    }
    checkRecord(record, deck.size());
    log(LogLevel::DEBUG, "Applying step: %s", record);

    auto result = reorder(deck, record);
    auto highlighted = std::vector<bool>(result.size());
    for (const auto n : record.affectedIndices) {
        highlighted[n] = true;
    }
    for (const auto n : to(result.size())) {
        result[n].position = static_cast<int>(n);
        result[n].highlighted = highlighted[n];
    }
    return result;
}

Deck replaySteps(
    const Deck& original, const TransformationRecordVector& records,
    const std::size_t count)
{
    if (count > records.size()) {
        throw InvalidInputException {
            boost::str(
                boost::format("Cannot replay %1% steps out of %2%") %
                count % records.size())};
    }
    auto deck = clearHighlights(original);
    for (auto iter = records.begin(); iter != records.begin() + count; ++iter) {
        deck = applyStep(deck, *iter);
    }
    return deck;
}

}
}
