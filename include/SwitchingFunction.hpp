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
 * @file SwitchingFunction.hpp
 * @brief Idealized saturating polarization curve of a ferroelectric layer.
 *
 * The switching function approximates one branch of the major hysteresis
 * loop by a tanh centred on the coercive voltage of the switching direction:
 *
 *   F(V, dir)  = Qs * tanh(a * (V - dir * Vc))
 *   dF/dV      = Qs * a * sech^2(a * (V - dir * Vc))
 *
 * where Qs is the saturation polarization, a the slope factor and Vc the
 * coercive voltage. `dir` is +1 on the rising (ascending) branch and -1 on
 * the falling (descending) branch.
 */

#pragma once

#include <ostream>

/**
 * @enum Direction
 * @brief Sense of the voltage motion on the hysteresis loop.
 *
 * The underlying value is the sign used by the switching function.
 */
enum class Direction : int
{
    FALLING = -1, /**< Descending branch, switching at -Vc */
    RISING = 1    /**< Ascending branch, switching at +Vc */
};

/** @brief Sign of a direction (+1 or -1; other values pass through). */
inline int directionSign(Direction dir) { return static_cast<int>(dir); }

/** @brief True when `dir` holds one of the two defined values. */
inline bool isValidDirection(Direction dir)
{
    return dir == Direction::RISING || dir == Direction::FALLING;
}

inline std::ostream &operator<<(std::ostream &os, Direction dir)
{
    switch (dir) {
        case Direction::RISING:
            os << "RISING";
            break;
        case Direction::FALLING:
            os << "FALLING";
            break;
        default:
            os << "INVALID(" << static_cast<int>(dir) << ")";
            break;
    }
    return os;
}

/**
 * @class SwitchingFunction
 * @brief Pure, stateless tanh switching curve and its derivative.
 */
class SwitchingFunction
{
   public:
    /**
     * @param saturationPolarization Qs (C/m^2).
     * @param slopeFactor            a (1/V).
     * @param coerciveVoltage        Vc (V).
     */
    SwitchingFunction(double saturationPolarization, double slopeFactor,
                      double coerciveVoltage);

    /** @brief F(V, dir). */
    double value(double v, Direction dir) const;

    /** @brief dF/dV at (V, dir). */
    double derivative(double v, Direction dir) const;

    double saturation() const { return qs_; }
    double slope() const { return a_; }
    double coerciveVoltage() const { return vc_; }

   private:
    double qs_;
    double a_;
    double vc_;
};
