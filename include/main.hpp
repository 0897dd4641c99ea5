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
 * @file main.hpp
 * @brief Declarations and documentation for the program entry point.
 *
 * This header documents the `fecap_sweep` driver (implemented in
 * src/main.cpp). The implementation parses command-line options, reads the
 * model card, applies command-line overrides and dispatches to the sweep
 * entrypoint.
 *
 * Primary responsibilities of the top-level driver:
 *  - Parse long and short CLI options (see SweepOptions for available flags)
 *  - Determine the model card filename (default: \"fecap.mod\") when not
 *    supplied on the command line
 *  - Read the card with `ModelCardParser`; options given on the command line
 *    override a `.SWEEP` directive in the card
 *  - Validate options and report errors to stderr
 *  - Call `runSweep` with the prepared parameters and options
 *
 * Example usage:
 *   ./fecap_sweep --vmax 5 --steps 400 --diag-verbose hzo.mod
 *
 * See also:
 *  - SweepOptions (include/SweepOptions.hpp) for CLI-configurable options
 *  - runSweep (include/SweepDriver.hpp) which the driver invokes
 */

#pragma once

// This header intentionally does not expose additional symbols. It exists to
// provide a stable place for file-level documentation about the program entry
// point and to be included by the implementation file (src/main.cpp).
