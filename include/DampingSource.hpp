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
 * @file DampingSource.hpp
 * @brief Per-iteration damping multipliers for the Newton solver.
 *
 * The charge-to-voltage solver multiplies the Jacobian dQ/dV by a positive
 * integer in [1, 10] on every iteration. This is an empirical heuristic that
 * keeps the iteration from cycling across the steep region around the
 * coercive voltage; it is not a derived numerical method. The multiplier is
 * drawn from a `DampingSource` so hosts and tests can fix or replace the
 * sequence:
 *
 * - `SeededDamping` is the default: a counter-based generator whose n-th
 *   value depends only on the seed and n, so a given seed and call count
 *   always reproduce the same sequence and the cursor can be saved and
 *   restored.
 * - `ConstantDamping` returns the same factor every time (1 gives plain
 *   Newton-Raphson).
 *
 * The generator is not a source of entropy and must not be used as one.
 */

#pragma once

#include <cstdint>
#include <memory>

/**
 * @class DampingSource
 * @brief Abstract generator of integer damping factors in [1, 10].
 */
class DampingSource
{
   public:
    /** @brief Smallest factor a source may return. */
    static constexpr int MIN_FACTOR = 1;
    /** @brief Largest factor a source may return. */
    static constexpr int MAX_FACTOR = 10;

    virtual ~DampingSource() = default;

    /** @brief Next factor; advances the cursor by one. */
    virtual int next() = 0;

    /** @brief Number of factors drawn since construction or reset(). */
    virtual std::uint64_t cursor() const = 0;

    /** @brief Reposition the cursor (used by state restore). */
    virtual void seek(std::uint64_t cursor) = 0;

    /** @brief Rewind to the start of the sequence. */
    void reset() { seek(0); }
};

/**
 * @class SeededDamping
 * @brief Counter-based damping sequence (splitmix64 of seed and cursor).
 */
class SeededDamping : public DampingSource
{
   public:
    explicit SeededDamping(std::uint64_t seed) : seed_(seed) {}

    int next() override;
    std::uint64_t cursor() const override { return cursor_; }
    void seek(std::uint64_t cursor) override { cursor_ = cursor; }

    std::uint64_t seed() const { return seed_; }

   private:
    std::uint64_t seed_;
    std::uint64_t cursor_ = 0;
};

/**
 * @class ConstantDamping
 * @brief Returns a fixed factor (clamped to [1, 10]).
 */
class ConstantDamping : public DampingSource
{
   public:
    explicit ConstantDamping(int factor = MIN_FACTOR);

    int next() override
    {
        ++cursor_;
        return factor_;
    }
    std::uint64_t cursor() const override { return cursor_; }
    void seek(std::uint64_t cursor) override { cursor_ = cursor; }

   private:
    int factor_;
    std::uint64_t cursor_ = 0;
};

/** @brief Factory helper: default seeded damping source. */
inline std::unique_ptr<DampingSource> makeSeededDamping(std::uint64_t seed)
{
    return std::make_unique<SeededDamping>(seed);
}
