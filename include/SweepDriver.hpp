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
 * @file SweepDriver.hpp
 * @brief Stand-alone voltage-driven host for the hysteresis model.
 *
 * This header exposes the sweep workflow used by the `fecap_sweep` driver
 * and the end-to-end tests:
 *  - Run a triangular voltage sweep through a `FerroCapacitor`,
 *  - Compute the enclosed (V, Q) loop area,
 *  - Write the recorded trace as CSV, and
 *  - Run the whole workflow from parsed parameters and options.
 *
 * The model is charge-driven. For each applied voltage the host asks the
 * device for the charge on its active branch (`branchCharge()`), converts it
 * to an input signal and calls `evaluate()`, exactly as a circuit solver
 * would feed back a node charge.
 */
#pragma once

#include <ostream>
#include <string>

#include <Eigen/Dense>

#include "FerroCapacitor.hpp"
#include "ModelParameters.hpp"
#include "SweepOptions.hpp"

/**
 * @struct SweepTrace
 * @brief Recorded samples of a sweep, one entry per evaluated step.
 */
struct SweepTrace
{
    Eigen::VectorXd time;      /**< Sample time (s), starts at 0. */
    Eigen::VectorXd applied;   /**< Voltage requested by the host (V). */
    Eigen::VectorXd voltage;   /**< Voltage returned by the model (V). */
    Eigen::VectorXd charge;    /**< Charge per area fed to the model. */
    Eigen::VectorXi direction; /**< +1 rising, -1 falling after the step. */
    int faultCount = 0;        /**< Faults recorded over the sweep. */
    int unconverged = 0;       /**< Evaluations that did not converge. */

    Eigen::Index size() const { return time.size(); }
};

/**
 * @brief Run a triangular sweep -A -> +A -> -A through `model`.
 *
 * The device is first pre-conditioned by a ramp from 0 V to -A (not
 * recorded) so the recorded loop starts from negative saturation. The
 * recorded sweep then has `2 * stepsPerSegment + 1` samples spaced
 * `period / (2 * stepsPerSegment)` apart in time.
 *
 * @param[in,out] model Device under test; its state is advanced.
 * @param[in] options Sweep settings (validated by the caller).
 * @return SweepTrace Recorded samples.
 */
SweepTrace runTriangularSweep(FerroCapacitor &model,
                              const SweepOptions &options);

/**
 * @brief Signed shoelace area of the closed (voltage, charge) polygon.
 *
 * A hysteresis loop traversed counter-clockwise (rising branch below the
 * falling one) gives a positive area.
 */
double loopArea(const SweepTrace &trace);

/**
 * @brief Write the trace as CSV (`time,v_applied,v_model,charge,direction`).
 *
 * @return True on success, false (with a warning on stderr) if the file
 * could not be opened.
 */
bool writeCsv(const SweepTrace &trace, const std::string &path);

/** @brief Print loop area, extremes and fault counts for a finished sweep. */
void printSummary(std::ostream &os, const SweepTrace &trace);

/**
 * @brief Run the top-level sweep workflow.
 *
 * Builds the device (diagnostics appended to `options.diagFile`), runs the
 * sweep, prints the summary to stdout and writes `options.csvFile`.
 *
 * @return 0 on success, 1 on invalid parameters or a fault under the strict
 * policy.
 */
int runSweep(const ModelParameters &params, const SweepOptions &options,
             const std::string &deviceName);
