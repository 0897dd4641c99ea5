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
 * @file BranchScaler.cpp
 * @brief Implementation of the branch-scaling algebra.
 */

#include "BranchScaler.hpp"

#include <cmath>

BranchScaler::BranchScaler(const SwitchingFunction &function,
                           double linearCapacitance)
    : function_(function), linearCapacitance_(linearCapacitance)
{
}

BranchScaling BranchScaler::compute(const BranchPoint &ascending,
                                    const BranchPoint &descending,
                                    Direction dir) const
{
    const double fa = function_.value(ascending.voltage, dir);
    const double fb = function_.value(descending.voltage, dir);
    const double denominator = fa - fb;

    BranchScaling scaling;
    if (denominator == 0.0 || !std::isfinite(denominator)) {
        scaling.valid = false;
        return scaling;
    }

    const double m = (ascending.polarization - descending.polarization) /
                     denominator;
    const double beta = (descending.polarization * fa -
                         ascending.polarization * fb) /
                        denominator;
    if (!std::isfinite(m) || !std::isfinite(beta)) {
        scaling.valid = false;
        return scaling;
    }

    scaling.slope = m;
    scaling.intercept = beta;
    return scaling;
}

double BranchScaler::polarization(double v, Direction dir,
                                  const BranchScaling &scaling) const
{
    return function_.value(v, dir) * scaling.slope + scaling.intercept;
}

double BranchScaler::charge(double v, Direction dir,
                            const BranchScaling &scaling) const
{
    return polarization(v, dir, scaling) + linearCapacitance_ * v;
}

double BranchScaler::chargeDerivative(double v, Direction dir,
                                      const BranchScaling &scaling) const
{
    return function_.derivative(v, dir) * scaling.slope + linearCapacitance_;
}
