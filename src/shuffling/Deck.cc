#include "shuffling/Deck.hh"

#include "shuffling/CardTypeIterator.hh"
#include "shuffling/InvalidInputException.hh"
#include "shuffling/InvariantViolationException.hh"
#include "Utility.hh"

#include <boost/format.hpp>
#include <boost/iterator/counting_iterator.hpp>

#include <algorithm>
#include <iterator>
#include <set>
#include <string>

namespace Shuffling {

Deck createOrderedDeck(const int size)
{
    if (size < 1 || size > N_CARDS) {
        throw InvalidInputException {
            boost::str(boost::format("Invalid deck size: %1%") % size)};
    }
    auto deck = Deck {};
    deck.reserve(size);
    std::transform(
        cardTypeIterator(0), cardTypeIterator(size),
        boost::make_counting_iterator(0), std::back_inserter(deck),
        [](const auto type, const auto position)
        {
            return Card {type, position};
        });
    return deck;
}

Deck resetPositions(Deck deck)
{
    for (const auto n : to(deck.size())) {
        deck[n].position = static_cast<int>(n);
        deck[n].highlighted = false;
    }
    return deck;
}

Deck clearHighlights(Deck deck)
{
    for (auto& card : deck) {
        card.highlighted = false;
    }
    return deck;
}

void validateDeck(const Deck& deck)
{
    if (deck.empty()) {
        throw InvalidInputException {"Deck is empty"};
    }
    auto ids = std::set<std::string> {};
    for (const auto& card : deck) {
        if (!ids.insert(card.id).second) {
            throw InvariantViolationException {
                boost::str(boost::format("Duplicate card id: %1%") % card.id)};
        }
    }
}

bool containsSameCards(const Deck& deck1, const Deck& deck2)
{
    if (deck1.size() != deck2.size()) {
        return false;
    }
    auto ids1 = std::multiset<std::string> {};
    auto ids2 = std::multiset<std::string> {};
    for (const auto& card : deck1) {
        ids1.insert(card.id);
    }
    for (const auto& card : deck2) {
        ids2.insert(card.id);
    }
    return ids1 == ids2;
}

int countSuitRuns(const Deck& deck)
{
    if (deck.empty()) {
        return 0;
    }
    auto runs = 1;
    for (auto iter = std::next(deck.begin()); iter != deck.end(); ++iter) {
        if (iter->type.suit != std::prev(iter)->type.suit) {
            ++runs;
        }
    }
    return runs;
}

}
