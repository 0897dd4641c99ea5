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
 * @file HistoryStack.cpp
 * @brief Implementation of the bounded turning-point stack.
 */

#include "HistoryStack.hpp"

#include <stdexcept>

HistoryStack::HistoryStack(std::size_t capacity) : capacity_(capacity)
{
    if (capacity_ == 0)
        throw std::invalid_argument("history capacity must be >= 1");
}

void HistoryStack::reset(const BranchPoint &base)
{
    points_.clear();
    points_.push_back(base);
}

bool HistoryStack::push(const BranchPoint &point)
{
    if (full()) return false;
    points_.push_back(point);
    return true;
}

bool HistoryStack::pop()
{
    // index 0 is the saturation bound and stays
    if (points_.size() <= 1) return false;
    points_.pop_back();
    return true;
}

const BranchPoint &HistoryStack::top() const
{
    if (points_.empty())
        throw std::logic_error("top() on an uninitialized history stack");
    return points_.back();
}

const BranchPoint &HistoryStack::at(std::size_t index) const
{
    return points_.at(index);
}

void HistoryStack::assign(const std::vector<BranchPoint> &points)
{
    if (points.empty())
        throw std::invalid_argument("history stack needs a base entry");
    if (points.size() > capacity_)
        throw std::invalid_argument("history stack contents exceed capacity");
    points_ = points;
}
