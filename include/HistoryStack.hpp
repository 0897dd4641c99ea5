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
 * @file HistoryStack.hpp
 * @brief Bounded stack of remembered turning points (minor-loop memory).
 *
 * Two instances are kept per device: the ascending stack remembers the
 * lower turning points where rising branches started, the descending stack
 * the upper turning points where falling branches started. Index 0 of each
 * stack holds the outer saturation bound found during initialization and is
 * never popped, so a stack that has been reset always has depth >= 1.
 *
 * Storage grows on demand up to an explicit capacity. Pushing onto a full
 * stack is refused (the point is dropped and the stack left unchanged); the
 * caller turns the refusal into a CapacityFault.
 */

#pragma once

#include <cstddef>
#include <vector>

/**
 * @struct BranchPoint
 * @brief A remembered turning point: (voltage, polarization).
 */
struct BranchPoint
{
    double voltage = 0.0;      /**< Voltage at the turning point (V) */
    double polarization = 0.0; /**< Scaled polarization there (C/m^2) */
};

inline bool operator==(const BranchPoint &lhs, const BranchPoint &rhs)
{
    return lhs.voltage == rhs.voltage && lhs.polarization == rhs.polarization;
}

inline bool operator!=(const BranchPoint &lhs, const BranchPoint &rhs)
{
    return !(lhs == rhs);
}

/**
 * @class HistoryStack
 * @brief Growable turning-point stack with a fixed maximum depth.
 */
class HistoryStack
{
   public:
    /** @brief Default maximum depth of a history stack. */
    static constexpr std::size_t DEFAULT_CAPACITY = 1000;

    /**
     * @brief Construct an empty stack.
     *
     * @param capacity Maximum depth (>= 1). Throws std::invalid_argument
     *                 for zero.
     */
    explicit HistoryStack(std::size_t capacity = DEFAULT_CAPACITY);

    /**
     * @brief Drop every entry and install `base` as the index-0 bound.
     */
    void reset(const BranchPoint &base);

    /**
     * @brief Push a turning point.
     *
     * @return false (stack unchanged) when the stack is already at capacity.
     */
    bool push(const BranchPoint &point);

    /**
     * @brief Pop the top entry unless only the base entry remains.
     *
     * @return false when depth <= 1 (nothing popped).
     */
    bool pop();

    /** @brief Top entry. Throws std::logic_error on an empty stack. */
    const BranchPoint &top() const;

    /** @brief Entry at `index` (0 = base). Throws std::out_of_range. */
    const BranchPoint &at(std::size_t index) const;

    std::size_t depth() const { return points_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return points_.empty(); }
    bool full() const { return points_.size() >= capacity_; }

    /** @brief All entries, base first. */
    const std::vector<BranchPoint> &points() const { return points_; }

    /**
     * @brief Replace the contents with `points` (used by state restore).
     *
     * Throws std::invalid_argument when `points` is empty or exceeds the
     * capacity.
     */
    void assign(const std::vector<BranchPoint> &points);

   private:
    std::size_t capacity_;
    std::vector<BranchPoint> points_;
};
