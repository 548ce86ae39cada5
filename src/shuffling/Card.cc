#include "shuffling/Card.hh"

#include <boost/lexical_cast.hpp>

#include <ostream>
#include <utility>

namespace Shuffling {

std::string makeCardId(const CardType& cardType)
{
    return boost::lexical_cast<std::string>(cardType);
}

Card::Card(const CardType type, const int position) :
    id {makeCardId(type)},
    type {type},
    position {position},
    highlighted {false}
{
}

Card::Card(
    std::string id, const CardType type, const int position,
    const bool highlighted) :
    id {std::move(id)},
    type {type},
    position {position},
    highlighted {highlighted}
{
}

bool operator==(const Card& lhs, const Card& rhs)
{
    return lhs.id == rhs.id && lhs.type == rhs.type &&
        lhs.position == rhs.position && lhs.highlighted == rhs.highlighted;
}

std::ostream& operator<<(std::ostream& os, const Card& card)
{
    os << card.id << "@" << card.position;
    if (card.highlighted) {
        os << "*";
    }
    return os;
}

}
