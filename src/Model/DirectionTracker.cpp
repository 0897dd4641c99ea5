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
/**
 * @file DirectionTracker.cpp
 * @brief Implementation of the direction state machine and its
 * initialization search.
 */

#include "DirectionTracker.hpp"

#include <cmath>

DirectionTracker::DirectionTracker(std::size_t capacity,
                                   double voltageTolerance)
    : ascending_(capacity),
      descending_(capacity),
      voltageTolerance_(voltageTolerance)
{
}

void DirectionTracker::initialize(const SwitchingFunction &function)
{
    const double qs = function.saturation();

    // Outward doubling searches; bounded so a non-saturating curve cannot
    // loop forever (the last finite voltage is kept).
    double vLow = -SEARCH_START;
    for (int i = 0; i < MAX_SEARCH_DOUBLINGS; ++i) {
        if (function.value(vLow, Direction::RISING) <= -qs) break;
        if (!std::isfinite(2.0 * vLow)) break;
        vLow *= 2.0;
    }

    double vHigh = SEARCH_START;
    for (int i = 0; i < MAX_SEARCH_DOUBLINGS; ++i) {
        if (function.value(vHigh, Direction::FALLING) >= qs) break;
        if (!std::isfinite(2.0 * vHigh)) break;
        vHigh *= 2.0;
    }

    ascending_.reset({vLow, function.value(vLow, Direction::RISING)});
    descending_.reset({vHigh, function.value(vHigh, Direction::FALLING)});
    direction_ = Direction::RISING;
    previousVoltage_ = 0.0;
}

bool DirectionTracker::popBoth()
{
    if (ascending_.depth() > 1 && descending_.depth() > 1) {
        ascending_.pop();
        descending_.pop();
        return true;
    }
    return false;
}

TrackerUpdate DirectionTracker::update(double voltage,
                                       const BranchScaler &scaler,
                                       const BranchScaling &scaling)
{
    TrackerUpdate result;

    if (!isValidDirection(direction_)) {
        direction_ = Direction::RISING;
        result.directionReset = true;
    }
    result.before = direction_;
    result.after = direction_;

    if (std::abs(voltage - previousVoltage_) <= voltageTolerance_)
        return result;

    if (voltage < ascending_.top().voltage) {
        result.action =
            popBoth() ? TrackerAction::POPPED : TrackerAction::POP_BLOCKED;
        direction_ = Direction::FALLING;
    } else if (voltage > descending_.top().voltage) {
        result.action =
            popBoth() ? TrackerAction::POPPED : TrackerAction::POP_BLOCKED;
        direction_ = Direction::RISING;
    } else {
        result.action = TrackerAction::CONTINUED;
        const BranchPoint turning{
            previousVoltage_,
            scaler.polarization(previousVoltage_, direction_, scaling)};

        if (direction_ == Direction::RISING && voltage < previousVoltage_) {
            if (descending_.push(turning)) {
                result.action = TrackerAction::PUSHED_DESCENDING;
                direction_ = Direction::FALLING;
            } else {
                result.action = TrackerAction::CAPACITY_REJECTED;
                result.rejected = turning;
                return result;
            }
        } else if (direction_ == Direction::FALLING &&
                   voltage > previousVoltage_) {
            if (ascending_.push(turning)) {
                result.action = TrackerAction::PUSHED_ASCENDING;
                direction_ = Direction::RISING;
            } else {
                result.action = TrackerAction::CAPACITY_REJECTED;
                result.rejected = turning;
                return result;
            }
        }
    }

    result.after = direction_;
    previousVoltage_ = voltage;
    return result;
}

void DirectionTracker::restore(const std::vector<BranchPoint> &ascending,
                               const std::vector<BranchPoint> &descending,
                               Direction direction, double previousVoltage)
{
    ascending_.assign(ascending);
    descending_.assign(descending);
    direction_ = direction;
    previousVoltage_ = previousVoltage;
}
