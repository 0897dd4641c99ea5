/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */

#include <gtest/gtest.h>

#include "BranchScaler.hpp"
#include "DirectionTracker.hpp"
#include "SwitchingFunction.hpp"

#include <cmath>

class DirectionTrackerTest : public ::testing::Test
{
 protected:
  DirectionTrackerTest()
      : scaler_(SwitchingFunction(0.25, 1.0, 1.3), 8.854187817e-3),
        tracker_(1000, 1e-4)
  {
    tracker_.initialize(scaler_.switching());
  }

  // Feed a solved voltage the way the model driver does
  TrackerUpdate move(double v)
  {
    BranchScaling sc = scaler_.compute(tracker_.ascending().top(),
                                       tracker_.descending().top(),
                                       tracker_.direction());
    return tracker_.update(v, scaler_, sc);
  }

  BranchScaling scaling() const
  {
    return scaler_.compute(tracker_.ascending().top(),
                           tracker_.descending().top(),
                           tracker_.direction());
  }

  BranchScaler scaler_;
  DirectionTracker tracker_;
};

// ---------- initialization search ----------
TEST_F(DirectionTrackerTest, InitializationFindsSaturationBounds)
{
  // 1e-3 doubled 15 times: tanh saturates to exactly +-1 there
  EXPECT_DOUBLE_EQ(tracker_.ascending().top().voltage, -32.768);
  EXPECT_DOUBLE_EQ(tracker_.descending().top().voltage, 32.768);
  EXPECT_DOUBLE_EQ(tracker_.ascending().top().polarization, -0.25);
  EXPECT_DOUBLE_EQ(tracker_.descending().top().polarization, 0.25);

  EXPECT_EQ(tracker_.ascending().depth(), 1u);
  EXPECT_EQ(tracker_.descending().depth(), 1u);
  EXPECT_EQ(tracker_.direction(), Direction::RISING);
  EXPECT_DOUBLE_EQ(tracker_.previousVoltage(), 0.0);
  EXPECT_DOUBLE_EQ(tracker_.voltageTolerance(), 1e-4);
}

TEST(DirectionTrackerInit, FlatCurveStopsImmediately)
{
  // Qs = 0: F is identically zero, so the first probe already "saturates"
  DirectionTracker t(10, 1e-4);
  t.initialize(SwitchingFunction(0.0, 1.0, 1.3));
  EXPECT_DOUBLE_EQ(t.ascending().top().voltage, -DirectionTracker::SEARCH_START);
  EXPECT_DOUBLE_EQ(t.descending().top().voltage, DirectionTracker::SEARCH_START);
}

// ---------- transitions ----------
TEST_F(DirectionTrackerTest, MovesWithinToleranceAreIgnored)
{
  TrackerUpdate u = move(5e-5);
  EXPECT_EQ(u.action, TrackerAction::NONE);
  EXPECT_DOUBLE_EQ(tracker_.previousVoltage(), 0.0);
}

TEST_F(DirectionTrackerTest, ContinuingMoveUpdatesPreviousVoltage)
{
  TrackerUpdate u = move(2.0);
  EXPECT_EQ(u.action, TrackerAction::CONTINUED);
  EXPECT_FALSE(u.directionChanged());
  EXPECT_DOUBLE_EQ(tracker_.previousVoltage(), 2.0);
}

TEST_F(DirectionTrackerTest, ReversalPushesTurningPoint)
{
  move(5.0);
  const double p5 = scaler_.polarization(5.0, Direction::RISING, scaling());

  TrackerUpdate u = move(-5.0);
  EXPECT_EQ(u.action, TrackerAction::PUSHED_DESCENDING);
  EXPECT_EQ(u.before, Direction::RISING);
  EXPECT_EQ(u.after, Direction::FALLING);
  ASSERT_EQ(tracker_.descending().depth(), 2u);
  EXPECT_DOUBLE_EQ(tracker_.descending().top().voltage, 5.0);
  EXPECT_DOUBLE_EQ(tracker_.descending().top().polarization, p5);

  u = move(1.0);
  EXPECT_EQ(u.action, TrackerAction::PUSHED_ASCENDING);
  EXPECT_EQ(tracker_.direction(), Direction::RISING);
  EXPECT_DOUBLE_EQ(tracker_.ascending().top().voltage, -5.0);
}

TEST_F(DirectionTrackerTest, ScalingPassesThroughStackTops)
{
  move(5.0);
  move(-5.0);
  move(1.0);
  move(0.5);

  BranchScaling sc = scaling();
  const BranchPoint &a = tracker_.ascending().top();
  const BranchPoint &b = tracker_.descending().top();
  EXPECT_NEAR(scaler_.polarization(a.voltage, tracker_.direction(), sc),
              a.polarization, 1e-12);
  EXPECT_NEAR(scaler_.polarization(b.voltage, tracker_.direction(), sc),
              b.polarization, 1e-12);
}

TEST_F(DirectionTrackerTest, ClosingMinorLoopRestoresOuterScaling)
{
  move(5.0);
  move(-5.0);
  move(1.0);
  const BranchScaling outer = scaling();

  move(0.5);  // pushes (1.0, P) on descending
  move(0.7);  // pushes (0.5, P) on ascending
  EXPECT_EQ(tracker_.ascending().depth(), 3u);
  EXPECT_EQ(tracker_.descending().depth(), 3u);

  TrackerUpdate u = move(1.2);  // beyond the inner descending top
  EXPECT_EQ(u.action, TrackerAction::POPPED);
  EXPECT_EQ(tracker_.direction(), Direction::RISING);
  EXPECT_EQ(tracker_.ascending().depth(), 2u);
  EXPECT_EQ(tracker_.descending().depth(), 2u);

  const BranchScaling back = scaling();
  EXPECT_EQ(back.slope, outer.slope);
  EXPECT_EQ(back.intercept, outer.intercept);
}

TEST_F(DirectionTrackerTest, PopBlockedAtBaseSetsDirection)
{
  TrackerUpdate u = move(-40.0);
  EXPECT_EQ(u.action, TrackerAction::POP_BLOCKED);
  EXPECT_EQ(tracker_.direction(), Direction::FALLING);
  EXPECT_EQ(tracker_.ascending().depth(), 1u);

  u = move(40.0);
  EXPECT_EQ(u.action, TrackerAction::POP_BLOCKED);
  EXPECT_EQ(tracker_.direction(), Direction::RISING);
}

TEST(DirectionTrackerCapacity, FullStackDropsPointAndKeepsState)
{
  BranchScaler scaler(SwitchingFunction(0.25, 1.0, 1.3), 8.854187817e-3);
  DirectionTracker t(1, 1e-4);
  t.initialize(scaler.switching());

  auto sc = [&]() {
    return scaler.compute(t.ascending().top(), t.descending().top(),
                          t.direction());
  };

  t.update(5.0, scaler, sc());
  TrackerUpdate u = t.update(-5.0, scaler, sc());

  EXPECT_EQ(u.action, TrackerAction::CAPACITY_REJECTED);
  EXPECT_DOUBLE_EQ(u.rejected.voltage, 5.0);
  EXPECT_EQ(t.descending().depth(), 1u);
  EXPECT_EQ(t.direction(), Direction::RISING);
  EXPECT_DOUBLE_EQ(t.previousVoltage(), 5.0);
}

TEST_F(DirectionTrackerTest, InvalidDirectionIsReset)
{
  tracker_.restore(tracker_.ascending().points(),
                   tracker_.descending().points(), static_cast<Direction>(7),
                   0.0);
  TrackerUpdate u = tracker_.update(2.0, scaler_, BranchScaling());
  EXPECT_TRUE(u.directionReset);
  EXPECT_EQ(tracker_.direction(), Direction::RISING);
}
