/** \file
 *
 * \brief Definition of Shuffling::Messaging::SerializationFailureException
 * class
 */

#ifndef MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
#define MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_

#include <exception>

namespace Shuffling {
namespace Messaging {

/** \brief Exception to indicate error in serialization or deserialization
 *
 * This non-fatal exception is used by JsonSerializer and the JSON converters
 * to signal that a document does not describe a valid object.
 */
class SerializationFailureException : public std::exception {};

}
}

#endif // MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
