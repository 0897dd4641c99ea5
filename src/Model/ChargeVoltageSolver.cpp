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
 * @file ChargeVoltageSolver.cpp
 * @brief Implementation of the damped Newton-Raphson charge inversion.
 */

#include "ChargeVoltageSolver.hpp"

#include <cmath>

ChargeVoltageSolver::ChargeVoltageSolver(double chargeTolerance,
                                         double voltageTolerance,
                                         int maxIterations)
    : chargeTolerance_(chargeTolerance),
      voltageTolerance_(voltageTolerance),
      maxIterations_(maxIterations)
{
}

SolveResult ChargeVoltageSolver::solve(const BranchScaler &scaler,
                                       const BranchScaling &scaling,
                                       Direction dir, double targetCharge,
                                       double seedVoltage,
                                       DampingSource &damping) const
{
    SolveResult result;
    double v = seedVoltage;
    double vPrev = 2.0 * seedVoltage;
    int remaining = maxIterations_;

    while (true) {
        const double residual = scaler.charge(v, dir, scaling) - targetCharge;
        result.voltage = v;
        result.residual = residual;

        if (!std::isfinite(residual)) return result;

        if (std::abs(residual) < chargeTolerance_ &&
            std::abs(v - vPrev) < voltageTolerance_) {
            result.converged = true;
            return result;
        }

        if (--remaining <= 0) return result;

        const double dampedSlope = scaler.chargeDerivative(v, dir, scaling) *
                                   static_cast<double>(damping.next());
        if (dampedSlope == 0.0 || !std::isfinite(dampedSlope)) return result;

        vPrev = v;
        v -= residual / dampedSlope;
        ++result.iterations;
    }
}
