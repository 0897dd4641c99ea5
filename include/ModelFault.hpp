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
 * @file ModelFault.hpp
 * @brief Soft fault kinds, fault records and the fault policy.
 *
 * None of the faults raised by the hysteresis model is fatal to the calling
 * host: each is logged to the diagnostics sink, recorded in the evaluation
 * result, and the model continues with a degraded-but-defined value. Callers
 * that prefer strict failure select `FaultPolicy::STRICT`, in which case a
 * `FaultError` is thrown after the fault has been logged.
 */

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

/**
 * @enum FaultKind
 * @brief Categories of soft faults raised during evaluation.
 */
enum class FaultKind
{
    ARITHMETIC,  /**< Branch points indistinguishable under the switching
                    function (zero scaling denominator). */
    CONVERGENCE, /**< Newton solver exhausted its iteration budget. */
    CAPACITY,    /**< History stack push beyond its capacity. */
    DIRECTION    /**< Direction state held an invalid value and was reset. */
};

inline std::ostream &operator<<(std::ostream &os, FaultKind kind)
{
    switch (kind) {
        case FaultKind::ARITHMETIC:
            os << "ArithmeticFault";
            break;
        case FaultKind::CONVERGENCE:
            os << "ConvergenceFault";
            break;
        case FaultKind::CAPACITY:
            os << "CapacityFault";
            break;
        case FaultKind::DIRECTION:
            os << "DirectionFault";
            break;
        default:
            os << "UnknownFault";
            break;
    }
    return os;
}

/**
 * @enum FaultPolicy
 * @brief Behaviour after a soft fault has been logged and recorded.
 */
enum class FaultPolicy
{
    CONTINUE, /**< Keep the degraded result (default). */
    STRICT    /**< Throw `FaultError`. */
};

/**
 * @struct ModelFault
 * @brief One fault raised during an evaluation.
 */
struct ModelFault
{
    FaultKind kind;
    std::string message;
};

/**
 * @class FaultError
 * @brief Exception thrown for soft faults under `FaultPolicy::STRICT`.
 */
class FaultError : public std::runtime_error
{
   public:
    FaultError(FaultKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    /** @brief Kind of the fault that triggered the exception. */
    FaultKind kind() const { return kind_; }

   private:
    FaultKind kind_;
};
