/** \file
 *
 * \brief Definition of Shuffling::Card struct
 */

#ifndef CARD_HH_
#define CARD_HH_

#include "shuffling/CardType.hh"

#include <boost/operators.hpp>

#include <iosfwd>
#include <string>

namespace Shuffling {

/** \brief Generate the identifier of a card type
 *
 * \param cardType the card type
 *
 * \return string of the form "<suit>-<rank>", for instance "hearts-A"
 */
std::string makeCardId(const CardType& cardType);

/** \brief A card in a deck being shuffled
 *
 * The identifier of a card is its sole identity across permutations. The
 * position is derived from the index of the card in its deck and is
 * renumbered whenever the deck is permuted. The highlighted flag marks the
 * cards touched by the most recently applied transformation step.
 *
 * Card objects are equality comparable. They compare equal when all their
 * fields are equal.
 */
struct Card : private boost::equality_comparable<Card> {
    std::string id;       ///< \brief Unique and stable identifier
    CardType type;        ///< \brief Suit and rank of the card
    int position {};      ///< \brief Index of the card in its deck
    bool highlighted {};  ///< \brief Whether the card is highlighted

    Card() = default;

    /** \brief Create a card with identifier derived from its type
     *
     * \param type the card type
     * \param position the initial position
     */
    Card(CardType type, int position);

    /** \brief Create a card with explicit identifier
     *
     * \param id the identifier
     * \param type the card type
     * \param position the position
     * \param highlighted whether the card is highlighted
     */
    Card(std::string id, CardType type, int position, bool highlighted);
};

/** \brief Equality operator for cards
 *
 * \sa Card
 */
bool operator==(const Card&, const Card&);

/** \brief Output a Card to stream
 *
 * \param os the output stream
 * \param card the card to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const Card& card);

}

#endif // CARD_HH_
