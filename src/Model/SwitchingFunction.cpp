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
 * @file SwitchingFunction.cpp
 * @brief Implementation of the tanh switching curve.
 */

#include "SwitchingFunction.hpp"

#include <cmath>

SwitchingFunction::SwitchingFunction(double saturationPolarization,
                                     double slopeFactor,
                                     double coerciveVoltage)
    : qs_(saturationPolarization), a_(slopeFactor), vc_(coerciveVoltage)
{
}

double SwitchingFunction::value(double v, Direction dir) const
{
    return qs_ * std::tanh(a_ * (v - directionSign(dir) * vc_));
}

double SwitchingFunction::derivative(double v, Direction dir) const
{
    // sech^2 via 1/cosh^2; cosh overflows to inf far from the coercive
    // voltage which correctly yields a zero derivative.
    const double c = std::cosh(a_ * (v - directionSign(dir) * vc_));
    return qs_ * a_ / (c * c);
}
