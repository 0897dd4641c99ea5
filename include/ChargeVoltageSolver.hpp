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
 * @file ChargeVoltageSolver.hpp
 * @brief Damped Newton-Raphson inversion of the scaled charge relation.
 *
 * Given a target charge and the active branch (direction plus scaling), the
 * solver finds V with Q(V, dir) - target ~ 0:
 *
 *  - V is seeded with the previously accepted voltage and the "previous"
 *    iterate with twice that, so at least one real iteration runs unless
 *    the seed is already within tolerance of zero.
 *  - An iterate is accepted when |residual| < chargeTolerance and
 *    |V - previousV| < voltageTolerance.
 *  - Otherwise the remaining-iteration counter is decremented; when it is
 *    exhausted the solve stops unconverged.
 *  - The step is V <- V - residual / (k * dQ/dV) where k is the damping
 *    factor drawn from the `DampingSource` (one draw per iteration).
 *
 * The solver is stateless; the damping source carries the only mutable
 * state (its cursor).
 */

#pragma once

#include "BranchScaler.hpp"
#include "DampingSource.hpp"

/**
 * @struct SolveResult
 * @brief Outcome of one charge-to-voltage solve.
 */
struct SolveResult
{
    double voltage = 0.0;  /**< Last iterate (the root when converged) */
    double residual = 0.0; /**< Q(voltage) - target at the last iterate */
    int iterations = 0;    /**< Newton steps taken */
    bool converged = false;
};

/**
 * @class ChargeVoltageSolver
 * @brief Damped Newton-Raphson root finder for Q(V, dir) = target.
 */
class ChargeVoltageSolver
{
   public:
    /**
     * @param chargeTolerance  Absolute residual tolerance (C/m^2).
     * @param voltageTolerance Absolute step tolerance (V).
     * @param maxIterations    Iteration budget per solve.
     */
    ChargeVoltageSolver(double chargeTolerance, double voltageTolerance,
                        int maxIterations);

    /**
     * @brief Solve Q(V, dir) = targetCharge on the given branch.
     *
     * @param scaler       Scaled charge relation of the device.
     * @param scaling      Active branch scaling.
     * @param dir          Active direction.
     * @param targetCharge Charge to match (C/m^2).
     * @param seedVoltage  Previously accepted voltage (V).
     * @param damping      Damping factor source; advanced once per iteration.
     */
    SolveResult solve(const BranchScaler &scaler, const BranchScaling &scaling,
                      Direction dir, double targetCharge, double seedVoltage,
                      DampingSource &damping) const;

    double chargeTolerance() const { return chargeTolerance_; }
    double voltageTolerance() const { return voltageTolerance_; }
    int maxIterations() const { return maxIterations_; }

   private:
    double chargeTolerance_;
    double voltageTolerance_;
    int maxIterations_;
};
