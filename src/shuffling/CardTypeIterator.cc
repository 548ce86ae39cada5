#include "shuffling/CardTypeIterator.hh"

#include "shuffling/InvalidInputException.hh"
#include "shuffling/ShufflingConstants.hh"

#include <boost/format.hpp>

namespace Shuffling {

static_assert(Rank::size() == N_RANKS && Suit::size() == N_SUITS);

CardType enumerateCardType(const int n)
{
    if (n < 0 || n >= N_CARDS) {
        throw InvalidInputException {
            boost::str(boost::format("No card type at index %1%") % n)};
    }
    return {
        static_cast<RankLabel>(n % N_RANKS),
        static_cast<SuitLabel>(n / N_RANKS)};
}

}
