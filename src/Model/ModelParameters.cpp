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
 * @file ModelParameters.cpp
 * @brief Range validation and derived constants of the model parameters.
 */

#include "ModelParameters.hpp"

#include <cmath>
#include <sstream>

static void requireRange(const char *name, double value, double lo, double hi)
{
    if (!std::isfinite(value) || value < lo || value > hi) {
        std::ostringstream msg;
        msg << name << " must be in [" << lo << ", " << hi << "], got "
            << value;
        throw std::invalid_argument(msg.str());
    }
}

static void requireNonNegative(const char *name, double value)
{
    if (!std::isfinite(value) || value < 0.0) {
        std::ostringstream msg;
        msg << name << " must be >= 0, got " << value;
        throw std::invalid_argument(msg.str());
    }
}

static void requirePositive(const char *name, double value)
{
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream msg;
        msg << name << " must be > 0, got " << value;
        throw std::invalid_argument(msg.str());
    }
}

void ModelParameters::validate() const
{
    requirePositive("thickness", thickness);
    requireNonNegative("coerciveField", coerciveField);
    requirePositive("relativePermittivity", relativePermittivity);
    requireNonNegative("saturationPolarization", saturationPolarization);
    requireNonNegative("slopeFactor", slopeFactor);
    requireRange("chargeErrorFraction", chargeErrorFraction, 1e-6, 1e-1);
    requireRange("voltageTolerance", voltageTolerance, 1e-6, 1e-1);
    if (maxIterations < 1000 || maxIterations > 1000000) {
        std::ostringstream msg;
        msg << "maxIterations must be in [1000, 1000000], got "
            << maxIterations;
        throw std::invalid_argument(msg.str());
    }
    if (seed < 0) throw std::invalid_argument("seed must be >= 0");
    requireNonNegative("delayCoefficient", delayCoefficient);
    if (historyCapacity < 1)
        throw std::invalid_argument("historyCapacity must be >= 1");
}

DerivedConstants DerivedConstants::from(const ModelParameters &params)
{
    DerivedConstants derived;
    derived.coerciveVoltage = params.coerciveField * params.thickness;
    derived.linearCapacitance = params.relativePermittivity *
                                VACUUM_PERMITTIVITY / params.thickness;
    derived.chargeTolerance =
        params.saturationPolarization * params.chargeErrorFraction;
    return derived;
}
