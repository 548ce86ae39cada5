/** \file
 *
 * \brief Definition of the canonical card type order
 */

#ifndef CARDTYPEITERATOR_HH_
#define CARDTYPEITERATOR_HH_

#include "shuffling/CardType.hh"

#include <boost/iterator/counting_iterator.hpp>
#include <boost/iterator/transform_iterator.hpp>

namespace Shuffling {

/** \brief Get the card type at an index of the canonical order
 *
 * The canonical order is suit major and rank minor: hearts from ace to king,
 * then diamonds, clubs and spades.
 *
 * \param n index between 0 and 51
 *
 * \return the card type at index \p n
 *
 * \throw InvalidInputException if \p n is not an index of the canonical order
 */
CardType enumerateCardType(int n);

/** \brief Iterator over the card types of the canonical order
 *
 * Dereferencing the iterator created with \p n yields
 * <tt>enumerateCardType(n)</tt>. A pair of iterators gives the leading cards
 * of a fresh deck:
 *
 * \code{.cc}
 * auto types = std::vector<CardType>(cardTypeIterator(0), cardTypeIterator(13));
 * \endcode
 */
inline auto cardTypeIterator(const int n)
{
    return boost::make_transform_iterator(
        boost::make_counting_iterator(n), enumerateCardType);
}

}

#endif // CARDTYPEITERATOR_HH_
