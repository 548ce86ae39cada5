#include "shuffling/CardTypeIterator.hh"
#include "shuffling/Deck.hh"
#include "shuffling/InvalidInputException.hh"
#include "shuffling/InvariantViolationException.hh"
#include "TestUtility.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

using Shuffling::Deck;

TEST(DeckTest, testCreateOrderedDeck)
{
    const auto deck = Shuffling::createOrderedDeck();
    ASSERT_EQ(52u, deck.size());
    EXPECT_EQ("hearts-A", deck.front().id);
    EXPECT_EQ("hearts-2", deck[1].id);
    EXPECT_EQ("diamonds-A", deck[13].id);
    EXPECT_EQ("clubs-J", deck[36].id);
    EXPECT_EQ("spades-K", deck.back().id);
    EXPECT_THAT(deck, Shuffling::IsRenumbered());
}

TEST(DeckTest, testCreateSmallDeck)
{
    const auto deck = Shuffling::createOrderedDeck(3);
    ASSERT_EQ(3u, deck.size());
    EXPECT_EQ("hearts-3", deck.back().id);
    EXPECT_EQ(2, deck.back().position);
}

TEST(DeckTest, testCreateOrderedDeckFollowsCanonicalOrder)
{
    const auto deck = Shuffling::createOrderedDeck(20);
    const auto types = std::vector<Shuffling::CardType>(
        Shuffling::cardTypeIterator(0), Shuffling::cardTypeIterator(20));
    ASSERT_EQ(types.size(), deck.size());
    for (const auto n : Shuffling::to(deck.size())) {
        EXPECT_EQ(types[n], deck[n].type);
        EXPECT_EQ(Shuffling::makeCardId(types[n]), deck[n].id);
    }
}

TEST(DeckTest, testCreateDeckInvalidSize)
{
    EXPECT_THROW(Shuffling::createOrderedDeck(0), Shuffling::InvalidInputException);
    EXPECT_THROW(Shuffling::createOrderedDeck(53), Shuffling::InvalidInputException);
}

TEST(DeckTest, testInvalidInputIsInvalidArgument)
{
    EXPECT_THROW(Shuffling::createOrderedDeck(-1), std::invalid_argument);
}

TEST(DeckTest, testResetPositions)
{
    auto deck = Shuffling::createOrderedDeck(4);
    std::reverse(deck.begin(), deck.end());
    deck[1].highlighted = true;
    const auto reset = Shuffling::resetPositions(deck);
    EXPECT_THAT(reset, Shuffling::IsRenumbered());
    EXPECT_EQ("hearts-4", reset.front().id);
    EXPECT_EQ(3, deck.front().position);
}

TEST(DeckTest, testClearHighlights)
{
    auto deck = Shuffling::createOrderedDeck(4);
    deck[0].highlighted = true;
    deck[3].highlighted = true;
    deck[3].position = 10;
    const auto cleared = Shuffling::clearHighlights(deck);
    EXPECT_TRUE(std::none_of(
        cleared.begin(), cleared.end(),
        [](const auto& card) { return card.highlighted; }));
    EXPECT_EQ(10, cleared[3].position);
}

TEST(DeckTest, testValidateDeck)
{
    EXPECT_NO_THROW(Shuffling::validateDeck(Shuffling::createOrderedDeck()));
    EXPECT_THROW(Shuffling::validateDeck(Deck {}), Shuffling::InvalidInputException);
    auto deck = Shuffling::createOrderedDeck(3);
    deck[2] = deck[0];
    EXPECT_THROW(
        Shuffling::validateDeck(deck), Shuffling::InvariantViolationException);
}

TEST(DeckTest, testInvariantViolationIsLogicError)
{
    auto deck = Shuffling::createOrderedDeck(2);
    deck[1] = deck[0];
    EXPECT_THROW(Shuffling::validateDeck(deck), std::logic_error);
}

TEST(DeckTest, testContainsSameCards)
{
    const auto deck = Shuffling::createOrderedDeck(5);
    EXPECT_TRUE(
        Shuffling::containsSameCards(
            deck, Shuffling::permuteDeck(deck, {4, 2, 0, 1, 3})));
    EXPECT_FALSE(
        Shuffling::containsSameCards(deck, Shuffling::createOrderedDeck(4)));
    EXPECT_FALSE(
        Shuffling::containsSameCards(
            deck, Shuffling::permuteDeck(deck, {0, 0, 1, 2, 3})));
}

TEST(DeckTest, testCountSuitRuns)
{
    const auto deck = Shuffling::createOrderedDeck();
    EXPECT_EQ(4, Shuffling::countSuitRuns(deck));
    EXPECT_EQ(0, Shuffling::countSuitRuns(Deck {}));
    // hearts-A, diamonds-A, hearts-2, diamonds-2
    EXPECT_EQ(
        4, Shuffling::countSuitRuns(Shuffling::permuteDeck(deck, {0, 13, 1, 14})));
    EXPECT_EQ(
        2, Shuffling::countSuitRuns(Shuffling::permuteDeck(deck, {0, 1, 13, 14})));
}
