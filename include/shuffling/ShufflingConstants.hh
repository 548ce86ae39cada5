/** \file
 *
 * \brief Definition of fundamental deck constants needed by several classes
 */

#ifndef SHUFFLINGCONSTANTS_HH_
#define SHUFFLINGCONSTANTS_HH_

/** \brief Top level namespace of the shuffling engine
 *
 * The Shuffling namespace directly contains the card and deck model and the
 * random sources used by the algorithms. It also contains subnamespaces for
 * the shuffle algorithms, scoring, serialization and the benchmark driver.
 */
namespace Shuffling {

/** \brief Number of suits in playing card deck
 */
constexpr auto N_SUITS = 4;

/** \brief Number of ranks in each suit
 */
constexpr auto N_RANKS = 13;

/** \brief Number of cards in playing card deck
 */
constexpr auto N_CARDS = N_SUITS * N_RANKS; // 52

}

#endif // SHUFFLINGCONSTANTS_HH_
