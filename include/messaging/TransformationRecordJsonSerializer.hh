/** \file
 *
 * \brief Definition of JSON serializer for
 * Shuffling::Engine::TransformationRecord
 *
 * \page jsontransformationrecord Transformation record JSON representation
 *
 * A Shuffling::Engine::TransformationRecord is represented by a JSON object
 * consisting of the following:
 *
 * \code{.json}
 * {
 *     "description": <description>,
 *     "affectedIndices": [ <index>, ... ],
 *     "kind": <kind>,
 *     "sourcePositions": [ <index>, ... ],
 *     "destinationPositions": [ <index>, ... ]
 * }
 * \endcode
 *
 * - &lt;description&gt; is a string
 * - &lt;kind&gt; is one of the following: "swap", "move", "split", "merge"
 * - each &lt;index&gt; is a non-negative integer
 *
 * The number of source and destination positions must be equal. Whether the
 * indices fit a particular deck is checked when the record is applied.
 *
 * \page jsonalgorithmdescriptor Algorithm descriptor JSON representation
 *
 * A Shuffling::Engine::AlgorithmDescriptor is represented by a JSON object
 * consisting of the following:
 *
 * \code{.json}
 * {
 *     "name": <name>,
 *     "description": <description>,
 *     "complexity": <complexity>
 * }
 * \endcode
 *
 * All values are strings.
 */

#ifndef MESSAGING_TRANSFORMATIONRECORDJSONSERIALIZER_HH_
#define MESSAGING_TRANSFORMATIONRECORDJSONSERIALIZER_HH_

#include <nlohmann/json.hpp>

#include <string>

namespace Shuffling {
namespace Engine {

struct AlgorithmDescriptor;
struct TransformationRecord;

/** \brief Key for TransformationRecord::description
 *
 * \sa \ref jsontransformationrecord
 */
extern const std::string RECORD_DESCRIPTION_KEY;

/** \brief Key for TransformationRecord::affectedIndices
 *
 * \sa \ref jsontransformationrecord
 */
extern const std::string RECORD_AFFECTED_INDICES_KEY;

/** \brief Key for TransformationRecord::kind
 *
 * \sa \ref jsontransformationrecord
 */
extern const std::string RECORD_KIND_KEY;

/** \brief Key for TransformationRecord::sourcePositions
 *
 * \sa \ref jsontransformationrecord
 */
extern const std::string RECORD_SOURCE_POSITIONS_KEY;

/** \brief Key for TransformationRecord::destinationPositions
 *
 * \sa \ref jsontransformationrecord
 */
extern const std::string RECORD_DESTINATION_POSITIONS_KEY;

/** \brief Key for AlgorithmDescriptor::name
 *
 * \sa \ref jsonalgorithmdescriptor
 */
extern const std::string DESCRIPTOR_NAME_KEY;

/** \brief Key for AlgorithmDescriptor::description
 *
 * \sa \ref jsonalgorithmdescriptor
 */
extern const std::string DESCRIPTOR_DESCRIPTION_KEY;

/** \brief Key for AlgorithmDescriptor::complexity
 *
 * \sa \ref jsonalgorithmdescriptor
 */
extern const std::string DESCRIPTOR_COMPLEXITY_KEY;

/** \brief Convert TransformationRecord to JSON
 */
void to_json(nlohmann::json&, const TransformationRecord&);

/** \brief Convert JSON to TransformationRecord
 */
void from_json(const nlohmann::json&, TransformationRecord&);

/** \brief Convert AlgorithmDescriptor to JSON
 */
void to_json(nlohmann::json&, const AlgorithmDescriptor&);

/** \brief Convert JSON to AlgorithmDescriptor
 */
void from_json(const nlohmann::json&, AlgorithmDescriptor&);

}
}

#endif // MESSAGING_TRANSFORMATIONRECORDJSONSERIALIZER_HH_
