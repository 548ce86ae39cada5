/** \file
 *
 * \brief Definition of JSON serialization policy
 *
 * The file defines serialization policy based on the JSON library by nlohmann
 * (https://github.com/nlohmann/json). It is used to hand decks, step lists and
 * statistics over to a presentation layer, and by the benchmark driver to
 * output its report.
 */

#ifndef MESSAGING_JSONSERIALIZER_HH_
#define MESSAGING_JSONSERIALIZER_HH_

#include "messaging/SerializationFailureException.hh"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace Shuffling {
namespace Messaging {

/** \brief Serialization policy that uses JSON
 *
 * This serializer uses the nlohmann::json library to serialize objects into
 * JSON and dumps them as string. For deserialization it parses the incoming
 * string as JSON and converts to the desired type.
 */
struct JsonSerializer {

    /** \brief Serialize object to string
     *
     * \param t the object to serialize
     *
     * \return string dump of the JSON object resulting from converting \p t
     */
    template<typename T> static std::string serialize(T&& t)
    {
        return nlohmann::json(std::forward<T>(t)).dump();
    }

    /** \brief Deserialize string to object
     *
     * \param s the string to deserialize
     *
     * \return object retrieved by parsing \p s into JSON and then deserializing
     * it to an object of type \c T
     *
     * \throw SerializationFailureException in case any exception is caught from
     * the JSON library
     */
    template<typename T>
    static T deserialize(std::string_view s)
    {
        try {
            return nlohmann::json::parse(s).template get<T>();
        } catch (const nlohmann::json::exception&) {
            throw SerializationFailureException {};
        }
    }
};

}
}

#endif // MESSAGING_JSONSERIALIZER_HH_
