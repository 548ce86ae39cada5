/** \file
 *
 * \brief Definition of Shuffling::InvariantViolationException class
 */

#ifndef INVARIANTVIOLATIONEXCEPTION_HH_
#define INVARIANTVIOLATIONEXCEPTION_HH_

#include <stdexcept>

namespace Shuffling {

/** \brief Exception to indicate that a structural invariant does not hold
 *
 * Thrown when a deck contains duplicate card identifiers, or a transformation
 * record refers to an index outside the deck or is otherwise inconsistent
 * with its kind.
 */
class InvariantViolationException : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

}

#endif // INVARIANTVIOLATIONEXCEPTION_HH_
