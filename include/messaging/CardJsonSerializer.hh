/** \file
 *
 * \brief Definition of JSON serializer for Shuffling::CardType and
 * Shuffling::Card
 *
 * \page jsoncardtype Card type JSON representation
 *
 * A Shuffling::CardType is represented by a JSON object consisting of the
 * following:
 *
 * \code{.json}
 * {
 *     "suit": <suit>,
 *     "rank": <rank>
 * }
 * \endcode
 *
 * - &lt;suit&gt; is a string representing the suit of the card. It must be
 *   one of the following: "hearts", "diamonds", "clubs", "spades".
 * - &lt;rank&gt; is a string representing the rank of the card. It must be
 *   one of the following: "A", "2", "3", "4", "5", "6", "7", "8", "9", "10",
 *   "J", "Q", "K".
 *
 * \page jsoncard Card JSON representation
 *
 * A Shuffling::Card extends the card type representation with its identity
 * and state in the deck:
 *
 * \code{.json}
 * {
 *     "id": <id>,
 *     "suit": <suit>,
 *     "rank": <rank>,
 *     "position": <position>,
 *     "highlighted": <highlighted>
 * }
 * \endcode
 *
 * - &lt;id&gt; is a non-empty string
 * - &lt;suit&gt; and &lt;rank&gt; are as in \ref jsoncardtype
 * - &lt;position&gt; is a non-negative integer
 * - &lt;highlighted&gt; is a boolean
 *
 * A Shuffling::Deck is an array of cards.
 */

#ifndef MESSAGING_CARDJSONSERIALIZER_HH_
#define MESSAGING_CARDJSONSERIALIZER_HH_

#include <nlohmann/json.hpp>

#include <string>

namespace Shuffling {

struct Card;
struct CardType;

/** \brief Key for CardType::suit
 *
 * \sa \ref jsoncardtype
 */
extern const std::string CARD_TYPE_SUIT_KEY;

/** \brief Key for CardType::rank
 *
 * \sa \ref jsoncardtype
 */
extern const std::string CARD_TYPE_RANK_KEY;

/** \brief Key for Card::id
 *
 * \sa \ref jsoncard
 */
extern const std::string CARD_ID_KEY;

/** \brief Key for Card::position
 *
 * \sa \ref jsoncard
 */
extern const std::string CARD_POSITION_KEY;

/** \brief Key for Card::highlighted
 *
 * \sa \ref jsoncard
 */
extern const std::string CARD_HIGHLIGHTED_KEY;

/** \brief Convert CardType to JSON
 */
void to_json(nlohmann::json&, const CardType&);

/** \brief Convert JSON to CardType
 */
void from_json(const nlohmann::json&, CardType&);

/** \brief Convert Card to JSON
 */
void to_json(nlohmann::json&, const Card&);

/** \brief Convert JSON to Card
 */
void from_json(const nlohmann::json&, Card&);

}

#endif // MESSAGING_CARDJSONSERIALIZER_HH_
