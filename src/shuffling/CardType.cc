#include "shuffling/CardType.hh"

#include <ostream>

namespace Shuffling {

bool operator==(const CardType& lhs, const CardType& rhs)
{
    return lhs.rank == rhs.rank && lhs.suit == rhs.suit;
}

std::ostream& operator<<(std::ostream& os, const Rank rank)
{
    return os << rank.value();
}

std::ostream& operator<<(std::ostream& os, const Suit suit)
{
    return os << suit.value();
}

std::ostream& operator<<(std::ostream& os, const CardType cardType)
{
    return os << cardType.suit << "-" << cardType.rank;
}

}
