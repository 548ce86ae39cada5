/** \file
 *
 * \brief Definition of Shuffling::Engine::AlgorithmDescriptor struct
 */

#ifndef ENGINE_ALGORITHMDESCRIPTOR_HH_
#define ENGINE_ALGORITHMDESCRIPTOR_HH_

#include <boost/operators.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace Shuffling {
namespace Engine {

/** \brief Static description of a shuffle algorithm
 *
 * AlgorithmDescriptor objects are equality comparable. They compare equal
 * when all their fields are equal.
 */
struct AlgorithmDescriptor :
        private boost::equality_comparable<AlgorithmDescriptor> {
    std::string name;         ///< \brief Unique name of the algorithm
    std::string description;  ///< \brief Human readable description
    std::string complexity;   ///< \brief Asymptotic complexity label

    AlgorithmDescriptor() = default;

    /** \brief Create new algorithm descriptor
     *
     * \param name the unique name of the algorithm
     * \param description the human readable description
     * \param complexity the asymptotic complexity label
     */
    AlgorithmDescriptor(
        std::string name, std::string description, std::string complexity);
};

/** \brief Vector of algorithm descriptors
 */
using AlgorithmDescriptorVector = std::vector<AlgorithmDescriptor>;

/** \brief Equality operator for algorithm descriptors
 *
 * \sa AlgorithmDescriptor
 */
bool operator==(const AlgorithmDescriptor&, const AlgorithmDescriptor&);

/** \brief Output an AlgorithmDescriptor to stream
 *
 * \param os the output stream
 * \param descriptor the descriptor to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(
    std::ostream& os, const AlgorithmDescriptor& descriptor);

}
}

#endif // ENGINE_ALGORITHMDESCRIPTOR_HH_
