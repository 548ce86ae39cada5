#include "engine/AlgorithmDescriptor.hh"

#include <ostream>
#include <utility>

namespace Shuffling {
namespace Engine {

AlgorithmDescriptor::AlgorithmDescriptor(
    std::string name, std::string description, std::string complexity) :
    name {std::move(name)},
    description {std::move(description)},
    complexity {std::move(complexity)}
{
}

bool operator==(const AlgorithmDescriptor& lhs, const AlgorithmDescriptor& rhs)
{
    return lhs.name == rhs.name && lhs.description == rhs.description &&
        lhs.complexity == rhs.complexity;
}

std::ostream& operator<<(
    std::ostream& os, const AlgorithmDescriptor& descriptor)
{
    return os << descriptor.name << " (" << descriptor.complexity << ")";
}

}
}
