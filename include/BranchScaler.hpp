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
 * @file BranchScaler.hpp
 * @brief Affine fit of the switching curve to the active turning points.
 *
 * The idealized switching function only describes the major loop. To stay
 * continuous at remembered turning points the model rescales it so that it
 * passes exactly through the ascending-stack top (Va, Pa) and the
 * descending-stack top (Vb, Pb). With Fa = F(Va, dir) and Fb = F(Vb, dir):
 *
 *   m    = (Pa - Pb) / (Fa - Fb)
 *   beta = (Pb*Fa - Pa*Fb) / (Fa - Fb)
 *
 *   P(V, dir)  = F(V, dir) * m + beta
 *   Q(V, dir)  = P(V, dir) + eps_r * eps_0 * V / thickness
 *   dQ/dV      = dF(V, dir) * m + eps_r * eps_0 / thickness
 *
 * When Fa == Fb the two points cannot be told apart under the switching
 * function; the scaler then returns the neutral scaling (m = 1, beta = 0)
 * flagged as invalid so the caller can raise an ArithmeticFault.
 */

#pragma once

#include "HistoryStack.hpp"
#include "SwitchingFunction.hpp"

/**
 * @struct BranchScaling
 * @brief Affine map (slope, intercept) applied to the switching function.
 */
struct BranchScaling
{
    double slope = 1.0;     /**< m */
    double intercept = 0.0; /**< beta (C/m^2) */
    bool valid = true;      /**< false when the neutral fallback was used */
};

/**
 * @class BranchScaler
 * @brief Computes branch scalings and evaluates the scaled charge relation.
 */
class BranchScaler
{
   public:
    /**
     * @param function          Switching function of the device.
     * @param linearCapacitance eps_r * eps_0 / thickness (F/m^2).
     */
    BranchScaler(const SwitchingFunction &function, double linearCapacitance);

    /**
     * @brief Fit the switching curve of `dir` through both boundary points.
     *
     * @param ascending  Ascending-stack top (Va, Pa).
     * @param descending Descending-stack top (Vb, Pb).
     * @param dir        Active switching direction.
     */
    BranchScaling compute(const BranchPoint &ascending,
                          const BranchPoint &descending, Direction dir) const;

    /** @brief Scaled polarization P(V, dir). */
    double polarization(double v, Direction dir,
                        const BranchScaling &scaling) const;

    /** @brief Scaled charge Q(V, dir) including the dielectric term. */
    double charge(double v, Direction dir, const BranchScaling &scaling) const;

    /** @brief dQ/dV at (V, dir). */
    double chargeDerivative(double v, Direction dir,
                            const BranchScaling &scaling) const;

    const SwitchingFunction &switching() const { return function_; }
    double linearCapacitance() const { return linearCapacitance_; }

   private:
    SwitchingFunction function_;
    double linearCapacitance_;
};
