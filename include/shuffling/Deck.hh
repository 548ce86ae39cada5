/** \file
 *
 * \brief Definition of the deck type and deck level operations
 */

#ifndef DECK_HH_
#define DECK_HH_

#include "shuffling/Card.hh"
#include "shuffling/ShufflingConstants.hh"

#include <vector>

namespace Shuffling {

/** \brief Ordered collection of cards
 *
 * The index of a card in the vector is its position. A valid deck is nonempty
 * and contains no two cards with the same identifier.
 */
using Deck = std::vector<Card>;

/** \brief Create a deck in the canonical order
 *
 * The canonical order is suit‐major and rank‐minor (hearts, diamonds, clubs,
 * spades; ace to king within each suit). If \p size is less than N_CARDS, the
 * deck consists of the first \p size cards of the canonical order.
 *
 * \param size the number of cards
 *
 * \return the deck, with positions numbered from zero and no highlights
 *
 * \throw InvalidInputException if \p size is not between 1 and N_CARDS
 */
Deck createOrderedDeck(int size = N_CARDS);

/** \brief Renumber positions and clear highlights
 *
 * \param deck the deck
 *
 * \return copy of \p deck where each card has position equal to its index
 * and is not highlighted
 */
Deck resetPositions(Deck deck);

/** \brief Clear highlights
 *
 * \param deck the deck
 *
 * \return copy of \p deck where no card is highlighted
 */
Deck clearHighlights(Deck deck);

/** \brief Check the structural invariants of a deck
 *
 * \param deck the deck
 *
 * \throw InvalidInputException if \p deck is empty
 * \throw InvariantViolationException if two cards in \p deck share an
 * identifier
 */
void validateDeck(const Deck& deck);

/** \brief Determine if two decks contain the same cards
 *
 * \return true if \p deck1 and \p deck2 contain the same multiset of card
 * identifiers, false otherwise
 */
bool containsSameCards(const Deck& deck1, const Deck& deck2);

/** \brief Count suit runs in a deck
 *
 * A run is a maximal sequence of consecutive cards of the same suit. A well
 * shuffled deck has many short runs.
 *
 * \param deck the deck
 *
 * \return the number of runs, or zero if \p deck is empty
 */
int countSuitRuns(const Deck& deck);

}

#endif // DECK_HH_
