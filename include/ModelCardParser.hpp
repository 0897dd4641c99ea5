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
 * @file ModelCardParser.hpp
 * @brief Reader for SPICE-style ferroelectric model cards.
 *
 * This header defines the `ModelCardParser` class which reads a textual
 * model card file and fills a `ModelParameters` (and, when a `.SWEEP`
 * directive is present, a `SweepOptions`).
 *
 * Card syntax:
 * @code
 * * 20 nm HZO capacitor
 * .MODEL FE1 FECAP (TFE=20N EC=65MEG EPS=20 PS=0.25
 * + SLOPE=1 DELAY=0.09)
 * .SWEEP 5 200 1M
 * .END
 * @endcode
 *
 * Design notes:
 *  - Input is uppercased; `*` and `;` start comments; lines beginning with
 *    `+` continue the previous line. Parentheses around the parameter list
 *    are optional and `=` may be surrounded by spaces.
 *  - Numeric literals are parsed in a strict SPICE-like manner: optional
 *    suffix multipliers (T, G, MEG, K, M, U, N, P, F) are supported and the
 *    mantissa must be a well-formed floating-point literal with no trailing
 *    garbage.
 *  - Range checks are not done here; `ModelParameters::validate()` owns
 *    them.
 *
 * Example usage:
 * @code
 * ModelCardParser p;
 * ModelParameters params;
 * SweepOptions sweep;
 * int errors = p.parse("fecap.mod", params, sweep);
 * if (errors == 0) {
 *   FerroCapacitor fe(p.modelName, params);
 * }
 * @endcode
 */

#pragma once

#include <istream>
#include <string>
#include <vector>

#include "ModelParameters.hpp"
#include "SweepOptions.hpp"

/**
 * @class ModelCardParser
 * @brief Reads `.MODEL <name> FECAP` cards and `.SWEEP` directives.
 *
 * The parser reports errors to `std::cerr` with the line number and returns
 * the number of errors from `parse()`. Recognized parameter keys:
 * TFE, EC, EPS, PS, SLOPE, QERR, VTOL, MAXITER, SEED, DELAY, NHIST.
 */
class ModelCardParser
{
   public:
    /** @brief Name given on the `.MODEL` line (empty until parsed). */
    std::string modelName;

    /**
     * @brief Parse a model card file.
     *
     * @param file   Path of the card file.
     * @param params Updated with every parameter found on the card; fields
     *               not mentioned keep their values.
     * @param sweep  Updated from a `.SWEEP <amplitude> <steps> <period>`
     *               directive if present.
     * @return Number of errors encountered. Zero indicates a clean parse.
     */
    int parse(const std::string &file, ModelParameters &params,
              SweepOptions &sweep);

    /** @brief Same as `parse()` but reads from an already open stream. */
    int parseStream(std::istream &in, ModelParameters &params,
                    SweepOptions &sweep);

    /**
     * @brief Validate the number of tokens in a line.
     *
     * @param tokens Tokenized line.
     * @param expectedSize Expected token count.
     * @param lineNumber Associated line number (for error messages).
     * @return True if token count matches `expectedSize`, false otherwise.
     */
    bool validateTokens(const std::vector<std::string> &tokens,
                        int expectedSize, int lineNumber);

    /**
     * @brief Parse a numeric value string into a double.
     *
     * Accepts optional suffix multipliers (T, G, MEG, K, M, U, N, P, F). The
     * mantissa must be a well-formed numeric literal (std::stod must consume
     * the entire mantissa).
     *
     * @param valueStr Uppercased value token (e.g., \"20N\", \"65MEG\").
     * @param lineNumber Line number in the card (used for diagnostics).
     * @param valid Output parameter set to true when parsing succeeds.
     * @return Parsed numeric value (0.0 if `valid` is false).
     */
    double parseValue(const std::string &valueStr, int lineNumber,
                      bool &valid);

    /**
     * @brief Store one parameter by its card key.
     *
     * Integer-valued keys (MAXITER, SEED, NHIST) reject fractional values.
     *
     * @return False (and an error on stderr) for unknown keys or
     *         non-integral integer values.
     */
    bool assignParameter(const std::string &key, double value,
                         ModelParameters &params, int lineNumber);

   private:
    /** @brief Parse the tokens of a `.MODEL` line; returns error count. */
    int parseModelLine(const std::vector<std::string> &tokens,
                       ModelParameters &params, int lineNumber);

    /** @brief Parse the tokens of a `.SWEEP` line; returns error count. */
    int parseSweepLine(const std::vector<std::string> &tokens,
                       SweepOptions &sweep, int lineNumber);
};
