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
 * @file DirectionTracker.hpp
 * @brief Direction state machine and turning-point history of one device.
 *
 * The tracker owns the ascending and descending `HistoryStack`s, the current
 * `Direction` and the last accepted voltage. After every solve the driver
 * hands it the new voltage; when the voltage moved by more than the voltage
 * tolerance the tracker decides between:
 *
 *  1. Vnew below the ascending top: the operating point returned to an outer
 *     loop from below. Pop both stacks (when both are deeper than one) and
 *     switch to FALLING.
 *  2. Vnew above the descending top: symmetric, pop both, switch to RISING.
 *  3. Otherwise, inside the innermost loop: a reversal of the motion is a
 *     turning point. RISING and falling back pushes (Vprev, P(Vprev)) onto
 *     the descending stack and switches to FALLING; FALLING and rising
 *     pushes onto the ascending stack and switches to RISING. A push onto a
 *     full stack is refused and the direction left unchanged.
 *
 * Nested minor loops are thereby remembered as stack entries; reversing
 * before a remembered turning point retraces the same branch and exceeding
 * it collapses back to the next outer loop (congruency).
 */

#pragma once

#include <cstddef>

#include "BranchScaler.hpp"
#include "HistoryStack.hpp"
#include "SwitchingFunction.hpp"

/**
 * @enum TrackerAction
 * @brief What an update did to the history.
 */
enum class TrackerAction
{
    NONE,              /**< Voltage moved less than the tolerance */
    CONTINUED,         /**< Same branch, previous voltage advanced */
    POPPED,            /**< Collapsed back to the next outer loop */
    POP_BLOCKED,       /**< Outside the loop but a stack is at its base */
    PUSHED_ASCENDING,  /**< New lower turning point */
    PUSHED_DESCENDING, /**< New upper turning point */
    CAPACITY_REJECTED  /**< Turning point dropped, state left unchanged */
};

/**
 * @struct TrackerUpdate
 * @brief Structured outcome of `DirectionTracker::update`.
 */
struct TrackerUpdate
{
    TrackerAction action = TrackerAction::NONE;
    Direction before = Direction::RISING;
    Direction after = Direction::RISING;
    bool directionReset = false; /**< invalid direction was reset to RISING */
    BranchPoint rejected;        /**< point dropped on CAPACITY_REJECTED */

    bool directionChanged() const { return before != after; }
};

/**
 * @class DirectionTracker
 * @brief Owns the hysteresis history and the direction state.
 */
class DirectionTracker
{
   public:
    /** @brief Magnitude the outward saturation searches start from (V). */
    static constexpr double SEARCH_START = 1e-3;
    /** @brief Bound on the number of doublings per saturation search. */
    static constexpr int MAX_SEARCH_DOUBLINGS = 1100;

    /**
     * @param capacity         Capacity of each history stack.
     * @param voltageTolerance Minimum voltage move that is tracked (V).
     */
    DirectionTracker(std::size_t capacity, double voltageTolerance);

    /**
     * @brief Establish the outer saturation bounds and reset the state.
     *
     * Doubles a small negative voltage until F(V, RISING) <= -Qs and
     * records it as ascending[0]; doubles a small positive voltage until
     * F(V, FALLING) >= +Qs and records it as descending[0]. Direction is set
     * to RISING and the previous voltage to 0.
     */
    void initialize(const SwitchingFunction &function);

    /**
     * @brief Advance the state machine with a newly solved voltage.
     *
     * @param voltage Newly solved voltage (V).
     * @param scaler  Scaled charge relation (to value new turning points).
     * @param scaling Scaling that was active for the solve.
     */
    TrackerUpdate update(double voltage, const BranchScaler &scaler,
                         const BranchScaling &scaling);

    /**
     * @brief Overwrite the complete state (used by snapshot restore).
     */
    void restore(const std::vector<BranchPoint> &ascending,
                 const std::vector<BranchPoint> &descending,
                 Direction direction, double previousVoltage);

    Direction direction() const { return direction_; }
    double previousVoltage() const { return previousVoltage_; }
    double voltageTolerance() const { return voltageTolerance_; }
    const HistoryStack &ascending() const { return ascending_; }
    const HistoryStack &descending() const { return descending_; }

   private:
    HistoryStack ascending_;
    HistoryStack descending_;
    Direction direction_ = Direction::RISING;
    double previousVoltage_ = 0.0;
    double voltageTolerance_;

    bool popBoth();
};
