#include "engine/AlgorithmDescriptor.hh"
#include "engine/TransformationRecord.hh"
#include "messaging/CardJsonSerializer.hh"
#include "messaging/JsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/SerializationFailureException.hh"
#include "messaging/StatisticsJsonSerializer.hh"
#include "messaging/TransformationRecordJsonSerializer.hh"
#include "scoring/AlgorithmStatistics.hh"
#include "scoring/RandomnessEstimator.hh"
#include "shuffling/Card.hh"
#include "shuffling/Deck.hh"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using namespace Shuffling;
using namespace Shuffling::Engine;
using namespace Shuffling::Messaging;
using namespace Shuffling::Scoring;

using nlohmann::json;

namespace {
constexpr auto CARD_TYPE = CardType {Ranks::QUEEN, Suits::DIAMONDS};
}

class JsonSerializerTest : public testing::Test {
protected:

    template<typename T>
    void testHelper(const T& t, const json& j)
    {
        EXPECT_TRUE(j == json::parse(serializer.serialize(t)))
            << "Failed to serialize into:\n" << j;
        EXPECT_TRUE(t == serializer.deserialize<T>(j.dump()))
            << "Failed to deserialize:\n" << j;
    }

    template<typename T>
    void testFailedDeserializationHelper(const json& j)
    {
        EXPECT_THROW(
            serializer.deserialize<T>(j.dump()),
            SerializationFailureException);
    }

    json cardJson() const
    {
        return json {
            {CARD_TYPE_SUIT_KEY, "diamonds"},
            {CARD_TYPE_RANK_KEY, "Q"},
            {CARD_ID_KEY, "diamonds-Q"},
            {CARD_POSITION_KEY, 24},
            {CARD_HIGHLIGHTED_KEY, true},
        };
    }

    json recordJson() const
    {
        return json {
            {RECORD_DESCRIPTION_KEY, "Take"},
            {RECORD_AFFECTED_INDICES_KEY, std::vector {3, 4}},
            {RECORD_KIND_KEY, "move"},
            {RECORD_SOURCE_POSITIONS_KEY, std::vector {0, 1}},
            {RECORD_DESTINATION_POSITIONS_KEY, std::vector {3, 4}},
        };
    }

    json metricJson(
        const double firstValue, const double secondValue,
        const std::string& winner) const
    {
        return json {
            {METRIC_FIRST_VALUE_KEY, firstValue},
            {METRIC_SECOND_VALUE_KEY, secondValue},
            {METRIC_WINNER_KEY, winner},
        };
    }

private:
    JsonSerializer serializer;
};

TEST_F(JsonSerializerTest, testGeneral)
{
    const auto message = std::string {"hello"};
    testHelper(message, message);
}

TEST_F(JsonSerializerTest, testOptional)
{
    testHelper(std::optional<int> {5}, json(5));
    testHelper(std::optional<int> {}, json {});
}

TEST_F(JsonSerializerTest, testInvalidJson)
{
    EXPECT_THROW(
        JsonSerializer::deserialize<int>("{not json"),
        SerializationFailureException);
}

TEST_F(JsonSerializerTest, testWrongType)
{
    testFailedDeserializationHelper<int>(json("five"));
}

TEST_F(JsonSerializerTest, testCardType)
{
    const auto j = json {
        {CARD_TYPE_SUIT_KEY, "diamonds"},
        {CARD_TYPE_RANK_KEY, "Q"},
    };
    testHelper(CARD_TYPE, j);
}

TEST_F(JsonSerializerTest, testCardTypeInvalidRank)
{
    const auto j = json {
        {CARD_TYPE_SUIT_KEY, "diamonds"},
        {CARD_TYPE_RANK_KEY, "1"},
    };
    testFailedDeserializationHelper<CardType>(j);
}

TEST_F(JsonSerializerTest, testCardTypeInvalidSuit)
{
    const auto j = json {
        {CARD_TYPE_SUIT_KEY, "stars"},
        {CARD_TYPE_RANK_KEY, "Q"},
    };
    testFailedDeserializationHelper<CardType>(j);
}

TEST_F(JsonSerializerTest, testCard)
{
    testHelper(Card {"diamonds-Q", CARD_TYPE, 24, true}, cardJson());
}

TEST_F(JsonSerializerTest, testCardNegativePosition)
{
    auto j = cardJson();
    j[CARD_POSITION_KEY] = -1;
    testFailedDeserializationHelper<Card>(j);
}

TEST_F(JsonSerializerTest, testCardEmptyId)
{
    auto j = cardJson();
    j[CARD_ID_KEY] = "";
    testFailedDeserializationHelper<Card>(j);
}

TEST_F(JsonSerializerTest, testCardMissingHighlighted)
{
    auto j = cardJson();
    j.erase(CARD_HIGHLIGHTED_KEY);
    testFailedDeserializationHelper<Card>(j);
}

TEST_F(JsonSerializerTest, testDeck)
{
    const auto deck = Deck {
        Card {"diamonds-Q", CARD_TYPE, 0, false},
        Card {"hearts-A", CardType {Ranks::ACE, Suits::HEARTS}, 1, true},
    };
    auto first = cardJson();
    first[CARD_POSITION_KEY] = 0;
    first[CARD_HIGHLIGHTED_KEY] = false;
    const auto second = json {
        {CARD_TYPE_SUIT_KEY, "hearts"},
        {CARD_TYPE_RANK_KEY, "A"},
        {CARD_ID_KEY, "hearts-A"},
        {CARD_POSITION_KEY, 1},
        {CARD_HIGHLIGHTED_KEY, true},
    };
    const auto j = json::array({first, second});
    EXPECT_EQ(j, json::parse(JsonSerializer::serialize(deck)));
    EXPECT_EQ(deck, JsonSerializer::deserialize<Deck>(j.dump()));
}

TEST_F(JsonSerializerTest, testTransformationRecord)
{
    const auto record = makeMoveRecord("Take", {3, 4}, {0, 1}, {3, 4});
    testHelper(record, recordJson());
}

TEST_F(JsonSerializerTest, testTransformationRecordInvalidKind)
{
    auto j = recordJson();
    j[RECORD_KIND_KEY] = "shuffle";
    testFailedDeserializationHelper<TransformationRecord>(j);
}

TEST_F(JsonSerializerTest, testTransformationRecordNegativeIndex)
{
    auto j = recordJson();
    j[RECORD_AFFECTED_INDICES_KEY] = std::vector {3, -4};
    testFailedDeserializationHelper<TransformationRecord>(j);
}

TEST_F(JsonSerializerTest, testTransformationRecordMismatchedLengths)
{
    auto j = recordJson();
    j[RECORD_DESTINATION_POSITIONS_KEY] = std::vector {3};
    testFailedDeserializationHelper<TransformationRecord>(j);
}

TEST_F(JsonSerializerTest, testAlgorithmDescriptor)
{
    const auto descriptor = AlgorithmDescriptor {
        "Fisher-Yates", "Swap each card with a random earlier card", "O(n)"};
    const auto j = json {
        {DESCRIPTOR_NAME_KEY, "Fisher-Yates"},
        {DESCRIPTOR_DESCRIPTION_KEY, "Swap each card with a random earlier card"},
        {DESCRIPTOR_COMPLEXITY_KEY, "O(n)"},
    };
    testHelper(descriptor, j);
}

TEST_F(JsonSerializerTest, testAlgorithmStatistics)
{
    auto stats = initStats("Riffle Shuffle");
    stats.shuffleCount = 2;
    stats.averageStepCount = 56.5;
    stats.randomnessScore = 71.25;
    stats.executionTimes = {0.5, 1.5};
    const auto j = json {
        {STATS_ALGORITHM_NAME_KEY, "Riffle Shuffle"},
        {STATS_SHUFFLE_COUNT_KEY, 2},
        {STATS_AVERAGE_STEP_COUNT_KEY, 56.5},
        {STATS_RANDOMNESS_SCORE_KEY, 71.25},
        {STATS_EXECUTION_TIMES_KEY, std::vector {0.5, 1.5}},
    };
    testHelper(stats, j);
}

TEST_F(JsonSerializerTest, testAlgorithmStatisticsInvalidScore)
{
    const auto j = json {
        {STATS_ALGORITHM_NAME_KEY, "Riffle Shuffle"},
        {STATS_SHUFFLE_COUNT_KEY, 1},
        {STATS_AVERAGE_STEP_COUNT_KEY, 56.0},
        {STATS_RANDOMNESS_SCORE_KEY, 101.0},
        {STATS_EXECUTION_TIMES_KEY, std::vector {0.5}},
    };
    testFailedDeserializationHelper<AlgorithmStatistics>(j);
}

TEST_F(JsonSerializerTest, testStatisticsComparison)
{
    auto first = initStats("A");
    first.randomnessScore = 90;
    first.averageStepCount = 51;
    first.executionTimes = {5.0};
    auto second = initStats("B");
    second.randomnessScore = 70;
    second.averageStepCount = 30;
    second.executionTimes = {2.0};
    const auto j = json {
        {COMPARISON_FIRST_KEY, "A"},
        {COMPARISON_SECOND_KEY, "B"},
        {COMPARISON_RANDOMNESS_KEY, metricJson(90, 70, "A")},
        {COMPARISON_SPEED_KEY, metricJson(5, 2, "B")},
        {COMPARISON_STEPS_KEY, metricJson(51, 30, "B")},
    };
    testHelper(compareStats(first, second), j);
}

TEST_F(JsonSerializerTest, testStatisticsComparisonUnknownWinner)
{
    const auto j = json {
        {COMPARISON_FIRST_KEY, "A"},
        {COMPARISON_SECOND_KEY, "B"},
        {COMPARISON_RANDOMNESS_KEY, metricJson(90, 70, "A")},
        {COMPARISON_SPEED_KEY, metricJson(5, 2, "C")},
        {COMPARISON_STEPS_KEY, metricJson(51, 30, "B")},
    };
    testFailedDeserializationHelper<StatisticsComparison>(j);
}

TEST_F(JsonSerializerTest, testRandomnessEstimate)
{
    const auto j = json {
        {ESTIMATE_DISPLACEMENT_KEY, 40},
        {ESTIMATE_ENTROPY_KEY, 100.0},
        {ESTIMATE_SUIT_RUNS_KEY, 1},
    };
    testHelper(RandomnessEstimate {40, 100.0, 1}, j);
}

TEST_F(JsonSerializerTest, testRandomnessEstimateOutOfRange)
{
    const auto j = json {
        {ESTIMATE_DISPLACEMENT_KEY, 140},
        {ESTIMATE_ENTROPY_KEY, 100.0},
        {ESTIMATE_SUIT_RUNS_KEY, 1},
    };
    testFailedDeserializationHelper<RandomnessEstimate>(j);
}
