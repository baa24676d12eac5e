// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "sheet/DragOffsetState.hpp"
#include "sheet/HeightChangeEmitter.hpp"

#include <limits>
#include <memory>
#include <vector>

using namespace Sheet;

TEST(HeightChangeEmitterTests, DeliversCurrentHeightOnSubscribe)
{
    DragOffsetState state;
    HeightChangeEmitter emitter(state, SheetConfig{});

    std::vector<double> seen;
    auto sub = emitter.subscribe([&](double h) { seen.push_back(h); });

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_DOUBLE_EQ(seen.front(), 340.0);
    EXPECT_TRUE(sub.isActive());
    EXPECT_EQ(emitter.subscriberCount(), 1);
}

TEST(HeightChangeEmitterTests, DeliversEveryChangeSynchronously)
{
    DragOffsetState state;
    HeightChangeEmitter emitter(state, SheetConfig{});

    std::vector<double> a;
    std::vector<double> b;
    auto subA = emitter.subscribe([&](double h) { a.push_back(h); });
    auto subB = emitter.subscribe([&](double h) { b.push_back(h); });

    ASSERT_TRUE(state.acquire(OffsetWriter::Gesture));
    ASSERT_TRUE(state.write(OffsetWriter::Gesture, 10.0));
    ASSERT_EQ(a.size(), 2u);
    EXPECT_DOUBLE_EQ(a.back(), 330.0);

    ASSERT_TRUE(state.write(OffsetWriter::Gesture, -20.0));
    EXPECT_EQ(a, (std::vector<double>{340.0, 330.0, 360.0}));
    EXPECT_EQ(b, a);
    EXPECT_DOUBLE_EQ(emitter.currentHeight(), 360.0);
}

TEST(HeightChangeEmitterTests, UnchangedHeightIsNotDelivered)
{
    DragOffsetState state;
    HeightChangeEmitter emitter(state, SheetConfig{});

    int calls = 0;
    auto sub = emitter.subscribe([&](double) { ++calls; });

    ASSERT_TRUE(state.acquire(OffsetWriter::Gesture));
    ASSERT_TRUE(state.write(OffsetWriter::Gesture, 0.0));
    EXPECT_EQ(calls, 1);

    // Both clamp to minHeight.
    ASSERT_TRUE(state.write(OffsetWriter::Gesture, 300.0));
    ASSERT_TRUE(state.write(OffsetWriter::Gesture, 500.0));
    EXPECT_EQ(calls, 2);
}

TEST(HeightChangeEmitterTests, ReleasedSubscriptionGetsNothing)
{
    DragOffsetState state;
    HeightChangeEmitter emitter(state, SheetConfig{});

    int calls = 0;
    auto sub = emitter.subscribe([&](double) { ++calls; });
    sub.release();
    EXPECT_FALSE(sub.isActive());
    EXPECT_EQ(emitter.subscriberCount(), 0);

    ASSERT_TRUE(state.acquire(OffsetWriter::Gesture));
    for (double y = 0.0; y < 50.0; y += 5.0)
        ASSERT_TRUE(state.write(OffsetWriter::Gesture, y));

    EXPECT_EQ(calls, 1);
}

TEST(HeightChangeEmitterTests, ScopeExitReleases)
{
    DragOffsetState state;
    HeightChangeEmitter emitter(state, SheetConfig{});

    int calls = 0;
    {
        auto sub = emitter.subscribe([&](double) { ++calls; });
        EXPECT_EQ(emitter.subscriberCount(), 1);
    }
    EXPECT_EQ(emitter.subscriberCount(), 0);

    ASSERT_TRUE(state.acquire(OffsetWriter::Gesture));
    ASSERT_TRUE(state.write(OffsetWriter::Gesture, 20.0));
    EXPECT_EQ(calls, 1);
}

TEST(HeightChangeEmitterTests, ReleaseDuringDeliverySkipsLaterSubscriber)
{
    DragOffsetState state;
    HeightChangeEmitter emitter(state, SheetConfig{});

    HeightChangeEmitter::Subscription second;
    int firstCalls = 0;
    int secondCalls = 0;

    auto first = emitter.subscribe([&](double h) {
        ++firstCalls;
        if (h != 340.0)
            second.release();
    });
    second = emitter.subscribe([&](double) { ++secondCalls; });
    ASSERT_EQ(secondCalls, 1);

    ASSERT_TRUE(state.acquire(OffsetWriter::Gesture));
    ASSERT_TRUE(state.write(OffsetWriter::Gesture, 40.0));

    EXPECT_EQ(firstCalls, 2);
    EXPECT_EQ(secondCalls, 1);
    EXPECT_FALSE(second.isActive());
}

TEST(HeightChangeEmitterTests, MovedSubscriptionStaysSingle)
{
    DragOffsetState state;
    HeightChangeEmitter emitter(state, SheetConfig{});

    int calls = 0;
    auto original = emitter.subscribe([&](double) { ++calls; });
    HeightChangeEmitter::Subscription moved = std::move(original);
    EXPECT_FALSE(original.isActive());
    EXPECT_TRUE(moved.isActive());

    ASSERT_TRUE(state.acquire(OffsetWriter::Gesture));
    ASSERT_TRUE(state.write(OffsetWriter::Gesture, 5.0));
    EXPECT_EQ(calls, 2);

    original.release();
    EXPECT_TRUE(moved.isActive());
}

TEST(HeightChangeEmitterTests, SubscriptionMayOutliveEmitter)
{
    DragOffsetState state;
    auto emitter = std::make_unique<HeightChangeEmitter>(state, SheetConfig{});

    int calls = 0;
    auto sub = emitter->subscribe([&](double) { ++calls; });
    emitter.reset();

    EXPECT_FALSE(sub.isActive());
    sub.release();

    ASSERT_TRUE(state.acquire(OffsetWriter::Gesture));
    ASSERT_TRUE(state.write(OffsetWriter::Gesture, 15.0));
    EXPECT_EQ(calls, 1);
}

TEST(HeightChangeEmitterTests, ReentrantWriteIsRejected)
{
    DragOffsetState state;
    HeightChangeEmitter emitter(state, SheetConfig{});
    ASSERT_TRUE(state.acquire(OffsetWriter::Gesture));

    bool nestedAccepted = true;
    bool attempted = false;
    auto sub = emitter.subscribe([&](double h) {
        if (h == 340.0 || attempted)
            return;
        attempted = true;
        nestedAccepted = state.write(OffsetWriter::Gesture, 0.0);
    });

    ASSERT_TRUE(state.write(OffsetWriter::Gesture, 100.0));
    EXPECT_TRUE(attempted);
    EXPECT_FALSE(nestedAccepted);
    EXPECT_DOUBLE_EQ(state.value(), 100.0);
    EXPECT_DOUBLE_EQ(emitter.currentHeight(), 240.0);
}

TEST(HeightChangeEmitterTests, WriteFromInitialDeliveryIsRejected)
{
    DragOffsetState state;
    HeightChangeEmitter emitter(state, SheetConfig{});
    ASSERT_TRUE(state.acquire(OffsetWriter::Gesture));

    bool guarded = false;
    bool nestedAccepted = true;
    auto sub = emitter.subscribe([&](double) {
        guarded = state.isNotifying();
        nestedAccepted = state.write(OffsetWriter::Gesture, 200.0);
    });

    EXPECT_TRUE(guarded);
    EXPECT_FALSE(nestedAccepted);
    EXPECT_FALSE(state.isNotifying());
    EXPECT_DOUBLE_EQ(state.value(), 0.0);
    EXPECT_DOUBLE_EQ(emitter.currentHeight(), 340.0);

    ASSERT_TRUE(state.write(OffsetWriter::Gesture, 20.0));
    EXPECT_DOUBLE_EQ(emitter.currentHeight(), 320.0);
}

TEST(HeightChangeEmitterTests, StateRejectsForeignAndNonFiniteWrites)
{
    DragOffsetState state;
    HeightChangeEmitter emitter(state, SheetConfig{});

    EXPECT_FALSE(state.write(OffsetWriter::Gesture, 10.0));

    ASSERT_TRUE(state.acquire(OffsetWriter::Animation));
    EXPECT_FALSE(state.acquire(OffsetWriter::Gesture));
    EXPECT_FALSE(state.write(OffsetWriter::Gesture, 10.0));
    EXPECT_FALSE(state.write(OffsetWriter::Animation, std::numeric_limits<double>::infinity()));
    EXPECT_DOUBLE_EQ(state.value(), 0.0);

    state.release(OffsetWriter::Animation);
    EXPECT_EQ(state.owner(), OffsetWriter::None);
    EXPECT_TRUE(state.acquire(OffsetWriter::Gesture));
}
