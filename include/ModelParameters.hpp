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

#include <cstdint>
#include <stdexcept>
#include <string>

#include "HistoryStack.hpp"
#include "ModelFault.hpp"

/*
 * ModelParameters.hpp
 *
 * Parameter container for one ferroelectric capacitor instance.
 *
 * This header declares `ModelParameters`, a simple POD-style struct carrying
 * the physical and numerical knobs of the hysteresis model from the model
 * card reader (or tests) into `FerroCapacitor`. Values are fixed for the
 * lifetime of a device instance.
 *
 * Design goals:
 *  - Keep parameters trivial to copy (no ownership semantics).
 *  - Provide a `validate()` method that checks every field against its
 *    declared range and throws `std::invalid_argument` on violation.
 *  - Keep the derived constants (coercive voltage, linear capacitance,
 *    charge tolerance) in a separate struct computed once from the
 *    parameters.
 */

/** @brief Vacuum permittivity (F/m). */
constexpr double VACUUM_PERMITTIVITY = 8.854187817e-12;

/**
 * @struct ModelParameters
 * @brief Physical and numerical parameters of the ferroelectric model.
 *
 * All quantities are SI: lengths in metres, fields in V/m, polarization in
 * C/m^2. Fields are public so call-sites can build a parameter set
 * field-by-field; `validate()` must be called before the set is used (the
 * `FerroCapacitor` constructor does so).
 */
struct ModelParameters
{
    /** @brief Ferroelectric layer thickness (m). Must be > 0. */
    double thickness = 20e-9;

    /** @brief Coercive field (V/m). Must be >= 0. */
    double coerciveField = 65e6;

    /** @brief Relative permittivity of the ferroelectric. Must be > 0. */
    double relativePermittivity = 20.0;

    /** @brief Saturation polarization charge density (C/m^2). >= 0. */
    double saturationPolarization = 0.25;

    /**
     * @brief Slope adjustment of the tanh switching curve (1/V). >= 0.
     *
     * Larger values give a squarer loop; zero flattens the switching
     * function to a constant, which makes every branch degenerate.
     */
    double slopeFactor = 1.0;

    /**
     * @brief Charge tolerance relative to the saturation polarization.
     *
     * The Newton solver accepts an iterate when |Q(V) - target| is below
     * `saturationPolarization * chargeErrorFraction`. Range [1e-6, 1e-1].
     */
    double chargeErrorFraction = 1e-4;

    /**
     * @brief Absolute voltage tolerance (V). Range [1e-6, 1e-1].
     *
     * Used both as the Newton step acceptance threshold and as the minimum
     * voltage change that counts as a move for the direction tracker.
     */
    double voltageTolerance = 1e-4;

    /** @brief Newton iteration cap per evaluation. Range [1000, 1e6]. */
    int maxIterations = 10000;

    /** @brief Seed of the damping generator. Must be >= 0. */
    std::int64_t seed = 1;

    /** @brief Coefficient of the relaxation (delay) term. Must be >= 0. */
    double delayCoefficient = 0.0;

    /** @brief Capacity of each turning-point history stack. Must be >= 1. */
    std::size_t historyCapacity = HistoryStack::DEFAULT_CAPACITY;

    /**
     * @brief What to do after a soft fault has been logged.
     *
     * `FaultPolicy::CONTINUE` keeps the degraded-but-defined result;
     * `FaultPolicy::STRICT` throws `FaultError`.
     */
    FaultPolicy faultPolicy = FaultPolicy::CONTINUE;

    /**
     * @brief Validate every field against its declared range.
     *
     * Throws:
     *   - std::invalid_argument naming the first offending parameter.
     */
    void validate() const;
};

/**
 * @struct DerivedConstants
 * @brief Quantities computed once from a validated `ModelParameters`.
 */
struct DerivedConstants
{
    double coerciveVoltage = 0.0;   /**< Ec * thickness (V) */
    double linearCapacitance = 0.0; /**< eps_r * eps_0 / thickness (F/m^2) */
    double chargeTolerance = 0.0;   /**< Ps * chargeErrorFraction (C/m^2) */

    /** @brief Compute the derived constants of `params`. */
    static DerivedConstants from(const ModelParameters &params);
};
