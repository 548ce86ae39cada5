#include "shuffling/InvalidInputException.hh"
#include "shuffling/Random.hh"
#include "MockRandomSource.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using testing::ElementsAre;
using testing::Return;

TEST(RandomTest, testDrawWithinBounds)
{
    auto random = Shuffling::RngRandomSource {};
    for (auto n = 0; n < 1000; ++n) {
        const auto draw = random.drawInteger(-3, 4);
        EXPECT_GE(draw, -3);
        EXPECT_LE(draw, 4);
    }
}

TEST(RandomTest, testDrawInvalidRange)
{
    auto random = Shuffling::RngRandomSource {};
    EXPECT_THROW(random.drawInteger(1, 0), std::invalid_argument);
}

TEST(RandomTest, testSeededSourcesAgree)
{
    auto random1 = Shuffling::RngRandomSource {42};
    auto random2 = Shuffling::RngRandomSource {42};
    for (auto n = 0; n < 100; ++n) {
        EXPECT_EQ(random1.drawInteger(0, 1000), random2.drawInteger(0, 1000));
    }
}

TEST(RandomTest, testDrawBooleanUsesOneDraw)
{
    auto random = Shuffling::MockRandomSource {};
    EXPECT_CALL(random, handleDrawInteger(0, 1))
        .WillOnce(Return(1))
        .WillOnce(Return(0));
    EXPECT_TRUE(random.drawBoolean());
    EXPECT_FALSE(random.drawBoolean());
}

TEST(RandomTest, testRecordAndReplay)
{
    auto source = Shuffling::MockRandomSource {};
    EXPECT_CALL(source, handleDrawInteger(0, 9)).WillOnce(Return(7));
    EXPECT_CALL(source, handleDrawInteger(-1, 1)).WillOnce(Return(-1));
    auto recorder = Shuffling::RecordingRandomSource {source};
    EXPECT_EQ(7, recorder.drawInteger(0, 9));
    EXPECT_EQ(-1, recorder.drawInteger(-1, 1));
    EXPECT_THAT(recorder.getTrace(), ElementsAre(7, -1));

    auto replay = Shuffling::ReplayRandomSource {recorder.getTrace()};
    EXPECT_FALSE(replay.isExhausted());
    EXPECT_EQ(7, replay.drawInteger(0, 9));
    EXPECT_EQ(-1, replay.drawInteger(-1, 1));
    EXPECT_TRUE(replay.isExhausted());
}

TEST(RandomTest, testReplayExhausted)
{
    auto replay = Shuffling::ReplayRandomSource {std::vector {3}};
    replay.drawInteger(0, 3);
    EXPECT_THROW(replay.drawInteger(0, 3), Shuffling::InvalidInputException);
}

TEST(RandomTest, testReplayOutOfRange)
{
    auto replay = Shuffling::ReplayRandomSource {std::vector {5}};
    EXPECT_THROW(replay.drawInteger(0, 3), Shuffling::InvalidInputException);
}
