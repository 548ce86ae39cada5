#include "engine/TransformationRecord.hh"

#include "Utility.hh"

#include <ostream>
#include <utility>

namespace Shuffling {
namespace Engine {

namespace {

std::ostream& outputIndices(
    std::ostream& os, const TransformationRecord::IndexVector& indices)
{
    os << "[";
    auto separator = "";
    for (const auto n : indices) {
        os << separator << n;
        separator = ", ";
    }
    return os << "]";
}

}

TransformationRecord::TransformationRecord(
    std::string description, IndexVector affectedIndices, const StepKind kind,
    IndexVector sourcePositions, IndexVector destinationPositions) :
    description {std::move(description)},
    affectedIndices(std::move(affectedIndices)),
    kind {kind},
    sourcePositions(std::move(sourcePositions)),
    destinationPositions(std::move(destinationPositions))
{
}

TransformationRecord::IndexVector makeIndexRange(const int first, const int last)
{
    const auto range = from_to(first, last);
    return TransformationRecord::IndexVector(range.begin(), range.end());
}

TransformationRecord makeSwapRecord(
    std::string description, const int i, const int j)
{
    return {
        std::move(description), TransformationRecord::IndexVector {i, j},
        StepKinds::SWAP, TransformationRecord::IndexVector {i, j},
        TransformationRecord::IndexVector {j, i}};
}

TransformationRecord makeMoveRecord(
    std::string description,
    TransformationRecord::IndexVector affectedIndices,
    TransformationRecord::IndexVector sourcePositions,
    TransformationRecord::IndexVector destinationPositions)
{
    return {
        std::move(description), std::move(affectedIndices), StepKinds::MOVE,
        std::move(sourcePositions), std::move(destinationPositions)};
}

TransformationRecord makeSplitRecord(std::string description, const int size)
{
    auto indices = makeIndexRange(0, size);
    return {
        std::move(description), indices, StepKinds::SPLIT, indices, indices};
}

bool operator==(
    const TransformationRecord& lhs, const TransformationRecord& rhs)
{
    return lhs.description == rhs.description &&
        lhs.affectedIndices == rhs.affectedIndices &&
        lhs.kind == rhs.kind &&
        lhs.sourcePositions == rhs.sourcePositions &&
        lhs.destinationPositions == rhs.destinationPositions;
}

std::ostream& operator<<(std::ostream& os, const StepKind kind)
{
    return os << kind.value();
}

std::ostream& operator<<(std::ostream& os, const TransformationRecord& record)
{
    os << record.kind << " ";
    outputIndices(os, record.sourcePositions) << " -> ";
    outputIndices(os, record.destinationPositions);
    return os << ": " << record.description;
}

}
}
