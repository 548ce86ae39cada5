#include "engine/ShuffleAlgorithm.hh"
#include "engine/ShuffleEngine.hh"
#include "engine/StepApplicator.hh"
#include "shuffling/CardTypeIterator.hh"
#include "shuffling/InvalidInputException.hh"
#include "shuffling/InvariantViolationException.hh"
#include "shuffling/Random.hh"
#include "TestUtility.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

using Shuffling::Deck;
using Shuffling::Engine::StepKinds;
using testing::ElementsAre;

namespace {

std::vector<std::string> getAlgorithmNames()
{
    auto ret = std::vector<std::string> {};
    for (const auto& descriptor : Shuffling::Engine::listAlgorithms()) {
        ret.push_back(descriptor.name);
    }
    return ret;
}

Deck createLargeDeck(const int size)
{
    auto ret = Deck {};
    for (const auto n : Shuffling::to(size)) {
        ret.emplace_back(
            "c" + std::to_string(n),
            Shuffling::enumerateCardType(n % Shuffling::N_CARDS), n, false);
    }
    return ret;
}

}

TEST(ShuffleEngineTest, testListAlgorithms)
{
    EXPECT_THAT(
        getAlgorithmNames(),
        ElementsAre(
            "Fisher-Yates", "Riffle Shuffle", "Overhand Shuffle",
            "Hindu Shuffle"));
}

TEST(ShuffleEngineTest, testGetAlgorithm)
{
    EXPECT_EQ(
        "Riffle Shuffle",
        Shuffling::Engine::getAlgorithm("Riffle Shuffle").getDescriptor().name);
}

TEST(ShuffleEngineTest, testUnknownAlgorithm)
{
    auto random = Shuffling::RngRandomSource {1};
    const auto deck = Shuffling::createOrderedDeck();
    EXPECT_THROW(
        Shuffling::Engine::getAlgorithm("Bogo Shuffle"),
        Shuffling::InvalidInputException);
    EXPECT_THROW(
        Shuffling::Engine::shuffle("Bogo Shuffle", deck, random),
        Shuffling::InvalidInputException);
    EXPECT_THROW(
        Shuffling::Engine::recordSteps("", deck, random),
        Shuffling::InvalidInputException);
}

class ShuffleEngineAlgorithmTest :
    public testing::TestWithParam<std::string> {
protected:
    std::vector<int> getDeckSizes() const
    {
        return {1, 2, 3, 7, 13, 51, 52};
    }
};

TEST_P(ShuffleEngineAlgorithmTest, testEmptyDeck)
{
    auto random = Shuffling::RngRandomSource {1};
    EXPECT_THROW(
        Shuffling::Engine::shuffle(GetParam(), Deck {}, random),
        Shuffling::InvalidInputException);
    EXPECT_THROW(
        Shuffling::Engine::recordSteps(GetParam(), Deck {}, random),
        Shuffling::InvalidInputException);
}

TEST_P(ShuffleEngineAlgorithmTest, testDuplicateCards)
{
    auto random = Shuffling::RngRandomSource {1};
    auto deck = Shuffling::createOrderedDeck(4);
    deck[3] = deck[0];
    EXPECT_THROW(
        Shuffling::Engine::shuffle(GetParam(), deck, random),
        Shuffling::InvariantViolationException);
}

TEST_P(ShuffleEngineAlgorithmTest, testOutputIsPermutation)
{
    auto random = Shuffling::RngRandomSource {7};
    for (const auto size : Shuffling::from_to(1, Shuffling::N_CARDS + 1)) {
        const auto deck = Shuffling::createOrderedDeck(size);
        const auto shuffled = Shuffling::Engine::shuffle(
            GetParam(), deck, random);
        EXPECT_TRUE(Shuffling::containsSameCards(deck, shuffled));
        EXPECT_THAT(shuffled, Shuffling::IsRenumbered());
    }
}

TEST_P(ShuffleEngineAlgorithmTest, testInputIsNotMutated)
{
    auto random = Shuffling::RngRandomSource {3};
    auto deck = Shuffling::createOrderedDeck();
    deck[5].highlighted = true;
    const auto copy = deck;
    Shuffling::Engine::shuffle(GetParam(), deck, random);
    Shuffling::Engine::recordSteps(GetParam(), deck, random);
    EXPECT_EQ(copy, deck);
}

TEST_P(ShuffleEngineAlgorithmTest, testStepsReproduceBulkShuffle)
{
    for (const auto size : getDeckSizes()) {
        for (const auto seed : Shuffling::to(20u)) {
            auto source = Shuffling::RngRandomSource {seed};
            auto recorder = Shuffling::RecordingRandomSource {source};
            const auto deck = Shuffling::createOrderedDeck(size);
            const auto shuffled = Shuffling::Engine::shuffle(
                GetParam(), deck, recorder);

            auto replay = Shuffling::ReplayRandomSource {recorder.getTrace()};
            const auto records = Shuffling::Engine::recordSteps(
                GetParam(), deck, replay);
            EXPECT_TRUE(replay.isExhausted());

            const auto replayed = Shuffling::Engine::replaySteps(
                deck, records, records.size());
            EXPECT_EQ(shuffled, Shuffling::clearHighlights(replayed));
        }
    }
}

TEST_P(ShuffleEngineAlgorithmTest, testDecksLargerThanStandardDeck)
{
    for (const auto size : {53, 100, 257}) {
        const auto deck = createLargeDeck(size);
        for (const auto seed : Shuffling::to(5u)) {
            auto source = Shuffling::RngRandomSource {seed};
            auto recorder = Shuffling::RecordingRandomSource {source};
            const auto shuffled = Shuffling::Engine::shuffle(
                GetParam(), deck, recorder);
            EXPECT_TRUE(Shuffling::containsSameCards(deck, shuffled));
            EXPECT_THAT(shuffled, Shuffling::IsRenumbered());

            auto replay = Shuffling::ReplayRandomSource {recorder.getTrace()};
            const auto records = Shuffling::Engine::recordSteps(
                GetParam(), deck, replay);
            EXPECT_TRUE(replay.isExhausted());
            EXPECT_EQ(
                shuffled,
                Shuffling::clearHighlights(
                    Shuffling::Engine::replaySteps(
                        deck, records, records.size())));
        }
    }
}

TEST_P(ShuffleEngineAlgorithmTest, testSameSeedSameShuffle)
{
    auto random1 = Shuffling::RngRandomSource {11};
    auto random2 = Shuffling::RngRandomSource {11};
    const auto deck = Shuffling::createOrderedDeck();
    EXPECT_EQ(
        Shuffling::Engine::shuffle(GetParam(), deck, random1),
        Shuffling::Engine::shuffle(GetParam(), deck, random2));
}

TEST_P(ShuffleEngineAlgorithmTest, testEveryStepHighlightsAffectedCards)
{
    auto random = Shuffling::RngRandomSource {5};
    const auto deck = Shuffling::createOrderedDeck();
    const auto records = Shuffling::Engine::recordSteps(
        GetParam(), deck, random);
    ASSERT_FALSE(records.empty());
    auto current = deck;
    for (const auto& record : records) {
        current = Shuffling::Engine::applyStep(current, record);
        for (const auto n : record.affectedIndices) {
            EXPECT_TRUE(current.at(n).highlighted);
        }
    }
}

TEST_P(ShuffleEngineAlgorithmTest, testHighlightedCardsAreMovedCards)
{
    auto random = Shuffling::RngRandomSource {9};
    const auto deck = Shuffling::createOrderedDeck();
    const auto records = Shuffling::Engine::recordSteps(
        GetParam(), deck, random);
    auto current = deck;
    for (const auto& record : records) {
        const auto previous = current;
        current = Shuffling::Engine::applyStep(current, record);
        if (record.kind == StepKinds::SPLIT) {
            continue;
        }
        auto highlighted_ids = std::set<std::string> {};
        for (const auto& card : current) {
            if (card.highlighted) {
                highlighted_ids.insert(card.id);
            }
        }
        auto moved_ids = std::set<std::string> {};
        for (const auto n : record.sourcePositions) {
            moved_ids.insert(previous.at(n).id);
        }
        EXPECT_EQ(moved_ids, highlighted_ids) << record.description;
    }
}

INSTANTIATE_TEST_SUITE_P(
    AllAlgorithms, ShuffleEngineAlgorithmTest,
    testing::Values(
        "Fisher-Yates", "Riffle Shuffle", "Overhand Shuffle", "Hindu Shuffle"));
