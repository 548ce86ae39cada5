#include "messaging/TransformationRecordJsonSerializer.hh"

#include "engine/AlgorithmDescriptor.hh"
#include "engine/TransformationRecord.hh"
#include "messaging/JsonSerializerUtility.hh"

#include <algorithm>

using nlohmann::json;

namespace Shuffling {
namespace Engine {

const std::string RECORD_DESCRIPTION_KEY {"description"};
const std::string RECORD_AFFECTED_INDICES_KEY {"affectedIndices"};
const std::string RECORD_KIND_KEY {"kind"};
const std::string RECORD_SOURCE_POSITIONS_KEY {"sourcePositions"};
const std::string RECORD_DESTINATION_POSITIONS_KEY {"destinationPositions"};
const std::string DESCRIPTOR_NAME_KEY {"name"};
const std::string DESCRIPTOR_DESCRIPTION_KEY {"description"};
const std::string DESCRIPTOR_COMPLEXITY_KEY {"complexity"};

namespace {

TransformationRecord::IndexVector indicesFromJson(const json& j)
{
    return Messaging::validate(
        j.get<TransformationRecord::IndexVector>(),
        [](const auto& indices)
        {
            return std::all_of(
                indices.begin(), indices.end(), Messaging::isNonNegative);
        });
}

}

void to_json(json& j, const TransformationRecord& record)
{
    j.emplace(RECORD_DESCRIPTION_KEY, record.description);
    j.emplace(RECORD_AFFECTED_INDICES_KEY, record.affectedIndices);
    j.emplace(RECORD_KIND_KEY, record.kind);
    j.emplace(RECORD_SOURCE_POSITIONS_KEY, record.sourcePositions);
    j.emplace(RECORD_DESTINATION_POSITIONS_KEY, record.destinationPositions);
}

void from_json(const json& j, TransformationRecord& record)
{
    record.description = j.at(RECORD_DESCRIPTION_KEY).get<std::string>();
    record.affectedIndices = indicesFromJson(j.at(RECORD_AFFECTED_INDICES_KEY));
    record.kind = j.at(RECORD_KIND_KEY);
    record.sourcePositions = indicesFromJson(j.at(RECORD_SOURCE_POSITIONS_KEY));
    record.destinationPositions = indicesFromJson(
        j.at(RECORD_DESTINATION_POSITIONS_KEY));
    if (record.sourcePositions.size() != record.destinationPositions.size()) {
        throw Messaging::SerializationFailureException {};
    }
}

void to_json(json& j, const AlgorithmDescriptor& descriptor)
{
    j.emplace(DESCRIPTOR_NAME_KEY, descriptor.name);
    j.emplace(DESCRIPTOR_DESCRIPTION_KEY, descriptor.description);
    j.emplace(DESCRIPTOR_COMPLEXITY_KEY, descriptor.complexity);
}

void from_json(const json& j, AlgorithmDescriptor& descriptor)
{
    descriptor.name = j.at(DESCRIPTOR_NAME_KEY).get<std::string>();
    descriptor.description = j.at(DESCRIPTOR_DESCRIPTION_KEY).get<std::string>();
    descriptor.complexity = j.at(DESCRIPTOR_COMPLEXITY_KEY).get<std::string>();
}

}
}
