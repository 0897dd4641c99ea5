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

#pragma once

#include <stdexcept>
#include <string>

/*
 * SweepOptions.hpp
 *
 * Lightweight configuration container for the triangular sweep driver.
 *
 * This header declares `SweepOptions`, a simple POD-style struct carrying
 * sweep settings from the model card (`.SWEEP`), the command-line driver or
 * tests into `runTriangularSweep`. It also carries the output and diagnostic
 * knobs of the command-line driver.
 */
/**
 * @struct SweepOptions
 * @brief Settings of a voltage-driven triangular sweep.
 *
 * The sweep first ramps from 0 V down to -amplitude (pre-conditioning, not
 * recorded), then records -amplitude -> +amplitude -> -amplitude in
 * `stepsPerSegment` steps per half. `period` is the duration of the
 * recorded sweep and sets the time base of the relaxation term.
 */
struct SweepOptions
{
    /** @brief Peak magnitude of the sweep (V). Must be > 0. */
    double amplitude = 5.0;

    /** @brief Steps per half sweep. Must be >= 2. */
    int stepsPerSegment = 200;

    /** @brief Duration of the recorded sweep (s). Must be > 0. */
    double period = 1e-3;

    /** @brief CSV output path of the recorded trace. */
    std::string csvFile = "sweep.csv";

    /** @brief Path to the diagnostic log file (appended to). */
    std::string diagFile = "diagnostics.log";

    /**
     * @brief Emit verbose diagnostics.
     *
     * When true every direction change is followed by a full dump of both
     * history stacks in `diagFile`.
     */
    bool diagVerbose = false;

    /** @brief Run the model with `FaultPolicy::STRICT`. */
    bool strict = false;

    /**
     * @brief Validate option values.
     *
     * Throws:
     *   - std::invalid_argument on non-positive amplitude or period, or fewer
     *     than two steps per segment.
     */
    void validate() const
    {
        if (!(amplitude > 0.0))
            throw std::invalid_argument("amplitude must be > 0");
        if (stepsPerSegment < 2)
            throw std::invalid_argument("stepsPerSegment must be >= 2");
        if (!(period > 0.0)) throw std::invalid_argument("period must be > 0");
    }
};
