#include "messaging/CardJsonSerializer.hh"

#include "shuffling/Card.hh"
#include "shuffling/CardType.hh"
#include "messaging/JsonSerializerUtility.hh"

using nlohmann::json;

namespace Shuffling {

const std::string CARD_TYPE_SUIT_KEY {"suit"};
const std::string CARD_TYPE_RANK_KEY {"rank"};
const std::string CARD_ID_KEY {"id"};
const std::string CARD_POSITION_KEY {"position"};
const std::string CARD_HIGHLIGHTED_KEY {"highlighted"};

void to_json(json& j, const CardType& cardType)
{
    j.emplace(CARD_TYPE_SUIT_KEY, cardType.suit);
    j.emplace(CARD_TYPE_RANK_KEY, cardType.rank);
}

void from_json(const json& j, CardType& cardType)
{
    cardType.suit = j.at(CARD_TYPE_SUIT_KEY);
    cardType.rank = j.at(CARD_TYPE_RANK_KEY);
}

void to_json(json& j, const Card& card)
{
    j = card.type;
    j.emplace(CARD_ID_KEY, card.id);
    j.emplace(CARD_POSITION_KEY, card.position);
    j.emplace(CARD_HIGHLIGHTED_KEY, card.highlighted);
}

void from_json(const json& j, Card& card)
{
    card.id = Messaging::validate(
        j.at(CARD_ID_KEY).get<std::string>(),
        [](const auto& id) { return !id.empty(); });
    card.type = j.get<CardType>();
    card.position = Messaging::validate(
        j.at(CARD_POSITION_KEY).get<int>(), Messaging::isNonNegative);
    card.highlighted = j.at(CARD_HIGHLIGHTED_KEY).get<bool>();
}

}
