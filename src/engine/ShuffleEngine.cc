#include "engine/ShuffleEngine.hh"

#include "engine/ExchangeShuffle.hh"
#include "engine/HinduShuffle.hh"
#include "engine/OverhandShuffle.hh"
#include "engine/RiffleShuffle.hh"
#include "shuffling/InvalidInputException.hh"

#include <boost/format.hpp>

#include <algorithm>
#include <array>

namespace Shuffling {
namespace Engine {

namespace {

const auto& getAlgorithms()
{
    static const auto exchange = ExchangeShuffle {};
    static const auto riffle = RiffleShuffle {};
    static const auto overhand = OverhandShuffle {};
    static const auto hindu = HinduShuffle {};
    static const auto algorithms = std::array<const ShuffleAlgorithm*, 4> {
        &exchange, &riffle, &overhand, &hindu };
    return algorithms;
}

}

AlgorithmDescriptorVector listAlgorithms()
{
    auto ret = AlgorithmDescriptorVector {};
    for (const auto* algorithm : getAlgorithms()) {
        ret.emplace_back(algorithm->getDescriptor());
    }
    return ret;
}

const ShuffleAlgorithm& getAlgorithm(const std::string_view name)
{
    const auto& algorithms = getAlgorithms();
    const auto iter = std::find_if(
        algorithms.begin(), algorithms.end(),
        [name](const auto* algorithm)
        {
            return algorithm->getDescriptor().name == name;
        });
    if (iter == algorithms.end()) {
        throw InvalidInputException {
            boost::str(boost::format("Unknown algorithm: %1%") % name)};
    }
    return **iter;
}

Deck shuffle(
    const std::string_view name, const Deck& deck, RandomSource& random)
{
    return getAlgorithm(name).shuffle(deck, random);
}

TransformationRecordVector recordSteps(
    const std::string_view name, const Deck& deck, RandomSource& random)
{
    return getAlgorithm(name).recordSteps(deck, random);
}

}
}
