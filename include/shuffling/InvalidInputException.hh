/** \file
 *
 * \brief Definition of Shuffling::InvalidInputException class
 */

#ifndef INVALIDINPUTEXCEPTION_HH_
#define INVALIDINPUTEXCEPTION_HH_

#include <stdexcept>

namespace Shuffling {

/** \brief Exception to indicate that a caller supplied invalid input
 *
 * Thrown by the correctness critical operations (shuffling, recording and
 * applying steps) when they are given an empty deck, decks of mismatched
 * length, an unknown algorithm name or a similar malformed argument.
 */
class InvalidInputException : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}

#endif // INVALIDINPUTEXCEPTION_HH_
