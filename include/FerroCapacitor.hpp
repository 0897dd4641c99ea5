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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "BranchScaler.hpp"
#include "ChargeVoltageSolver.hpp"
#include "DampingSource.hpp"
#include "Diagnostics.hpp"
#include "DirectionTracker.hpp"
#include "ModelFault.hpp"
#include "ModelParameters.hpp"

/**
 * @file FerroCapacitor.hpp
 * @brief Hysteretic ferroelectric capacitor: charge in, voltage out.
 *
 * This header declares `FerroCapacitor`, the per-device driver of the
 * hysteresis model. A host circuit solver calls `evaluate()` once per
 * nonlinear iteration or timestep with the present input signal; the driver
 *
 *  1. recomputes the branch scaling (m, beta) from the current stack tops
 *     and direction,
 *  2. converts the input signal to a target charge (fixed scale 0.01),
 *  3. inverts Q(V, dir) = target with the damped Newton solver,
 *  4. advances the direction tracker and history stacks with the solution,
 *  5. returns the solved voltage plus the relaxation term
 *     delayCoefficient * thickness * dQ/dt.
 *
 * Every instance exclusively owns its history stacks, direction state and
 * damping generator. State is created by `initialize()` (called on first
 * use if the host does not call it), discarded by `reset()`, and mutated
 * immediately by every accepted voltage change. The model never rolls back
 * on its own: a host that evaluates tentatively takes a `snapshot()` and
 * `restore()`s it when the iteration or timestep is rejected.
 *
 * Soft faults (ArithmeticFault, ConvergenceFault, CapacityFault,
 * DirectionFault) are logged to the diagnostics sink and recorded in the
 * returned `EvaluationResult`. Under `FaultPolicy::STRICT` a `FaultError`
 * is thrown after logging.
 *
 * Usage example:
 * @code
 * ModelParameters params;            // 20 nm HZO-like defaults
 * FerroCapacitor fe("FE1", params);
 * EvaluationResult r = fe.evaluate(25.0, 1e-6);   // 0.25 C/m^2 target
 * double v = r.voltage;
 * @endcode
 */

/**
 * @struct EvaluationResult
 * @brief Structured outcome of one `FerroCapacitor::evaluate` call.
 */
struct EvaluationResult
{
    double voltage = 0.0;       /**< Terminal voltage incl. relaxation (V) */
    double solvedVoltage = 0.0; /**< Voltage from the charge inversion (V) */
    double charge = 0.0;        /**< Target charge (C/m^2) */
    double chargeRate = 0.0;    /**< Backward-difference dQ/dt (C/m^2/s) */
    int iterations = 0;         /**< Newton steps taken */
    bool converged = true;      /**< false: solvedVoltage is the fallback */
    Direction direction = Direction::RISING; /**< Direction after update */
    std::size_t ascendingDepth = 0;
    std::size_t descendingDepth = 0;
    std::vector<ModelFault> faults; /**< Faults raised during the call */

    /** @brief True when the call raised no fault. */
    bool ok() const { return faults.empty(); }

    /** @brief True when a fault of `kind` was raised during the call. */
    bool hasFault(FaultKind kind) const;
};

/**
 * @struct ModelSnapshot
 * @brief Complete mutable state of a `FerroCapacitor`, as a value.
 */
struct ModelSnapshot
{
    bool initialized = false;
    std::vector<BranchPoint> ascending;
    std::vector<BranchPoint> descending;
    Direction direction = Direction::RISING;
    double previousVoltage = 0.0;
    bool hasPreviousSample = false;
    double previousCharge = 0.0;
    double previousTime = 0.0;
    std::uint64_t dampingCursor = 0;
};

/**
 * @class FerroCapacitor
 * @brief Per-device hysteresis model with explicit lifecycle.
 */
class FerroCapacitor
{
   public:
    /** @brief Scale from the input signal to charge per area (C/m^2). */
    static constexpr double INPUT_SCALE = 0.01;

    /**
     * @brief Construct a new device instance.
     *
     * @param name        Device identifier used in diagnostics (e.g. "FE1").
     * @param params      Model parameters; validated here (throws
     *                    std::invalid_argument on range violations).
     * @param diagnostics Optional diagnostics sink shared with other
     *                    devices. If null, events are discarded.
     * @param damping     Optional damping generator owned by this instance.
     *                    If null, a `SeededDamping` with `params.seed` is
     *                    created.
     */
    FerroCapacitor(const std::string &name, const ModelParameters &params,
                   std::shared_ptr<DiagnosticsSink> diagnostics = nullptr,
                   std::unique_ptr<DampingSource> damping = nullptr);

    /**
     * @brief Build the history stacks and solver state.
     *
     * Runs the outward saturation searches, sets direction RISING and the
     * previous voltage to 0, and reports an initialization summary.
     */
    void initialize();

    /** @brief Discard all state, rewind the damping sequence, re-initialize. */
    void reset();

    /**
     * @brief Evaluate the constitutive relation for one host call.
     *
     * @param inputSignal Input charge density encoded as a voltage; the
     *                    target charge is inputSignal * INPUT_SCALE.
     * @param time        Host time of the call (s). Only used for the
     *                    relaxation term; calls at a time not later than the
     *                    previous sample contribute no rate and leave the
     *                    rate bookkeeping untouched.
     */
    EvaluationResult evaluate(double inputSignal, double time);

    /**
     * @brief Charge Q(V) on the currently active scaled branch (C/m^2).
     *
     * Does not mutate state. Voltage-driven hosts use it to pick the input
     * for a desired voltage.
     */
    double branchCharge(double voltage) const;

    /** @brief Branch scaling for the current stack tops and direction. */
    BranchScaling currentScaling() const;

    /** @brief Copy of the complete mutable state. */
    ModelSnapshot snapshot() const;

    /**
     * @brief Put a state previously taken with `snapshot()` back.
     *
     * Throws std::invalid_argument when the snapshot does not fit this
     * instance (empty stacks or contents exceeding the history capacity).
     */
    void restore(const ModelSnapshot &snapshot);

    /** @brief Write both history stacks to `os`. */
    void dumpHistory(std::ostream &os) const;

    const std::string &name() const { return name_; }
    const ModelParameters &parameters() const { return params_; }
    const DerivedConstants &derived() const { return derived_; }
    bool isInitialized() const { return initialized_; }
    Direction direction() const { return tracker_.direction(); }
    double previousVoltage() const { return tracker_.previousVoltage(); }
    const HistoryStack &ascending() const { return tracker_.ascending(); }
    const HistoryStack &descending() const { return tracker_.descending(); }
    const BranchScaler &scaler() const { return scaler_; }

   private:
    std::string name_;
    ModelParameters params_;
    DerivedConstants derived_;
    BranchScaler scaler_;
    ChargeVoltageSolver solver_;
    DirectionTracker tracker_;
    std::shared_ptr<DiagnosticsSink> diagnostics_;
    std::unique_ptr<DampingSource> damping_;

    bool initialized_ = false;
    bool hasPreviousSample_ = false;
    double previousCharge_ = 0.0; /**< Target charge of the last sample */
    double previousTime_ = 0.0;   /**< Host time of the last sample (s) */

    /** @brief Record a fault; throws under FaultPolicy::STRICT. */
    void recordFault(EvaluationResult &result, FaultKind kind,
                     const std::string &message) const;
};
