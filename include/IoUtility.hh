/** \file
 *
 * \brief Definition of input and output stream related utilities
 *
 * Although the utilities in this file do not depend on any other classes or
 * functions inside the Shuffling namespace, the functions are still inside
 * the namespace to avoid name conflicts.
 */

#ifndef IOUTILITY_HH_
#define IOUTILITY_HH_

#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace Shuffling {

/** \brief Output optional value
 *
 * If \p t is not empty, outputs the wrapped value using \c operator<< for \c
 * T. Otherwise outputs the placeholder value “(none)”.
 *
 * \param os the output stream
 * \param t the value to be written to \p os
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const std::optional<T>& t)
{
    if (t) {
        return os << *t;
    }
    return os << "(none)";
}

/** \brief Process file stream or stdin based on \p path
 *
 * If \p path is a hyphen (“-”), calls \p callback with \c std::cin as
 * argument. Otherwise opens the file at \p path and passes the corresponding
 * \c std::ifstream to the callback. The file is closed after the callback
 * returns.
 *
 * \param path a filesystem path or hyphen
 * \param callback a callable that accepts reference to \c std::istream as
 * argument
 *
 * \return the result of invoking \p callback with the reference to the stream
 */
template<typename Callable>
decltype(auto) processStreamFromPath(std::string_view path, Callable&& callback)
{
    if (path == "-") {
        return std::invoke(std::forward<Callable>(callback), std::cin);
    }
    auto in = std::ifstream {std::string {path}};
    return std::invoke(std::forward<Callable>(callback), in);
}

}

#endif // IOUTILITY_HH_
