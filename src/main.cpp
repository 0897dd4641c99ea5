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
 * @file main.cpp
 *
 * @brief Command-line driver for ferroelectric capacitor sweeps
 */

#include "main.hpp"

#include <getopt.h>

#include <iostream>
#include <stdexcept>

#include "ModelCardParser.hpp"
#include "ModelParameters.hpp"
#include "SweepDriver.hpp"
#include "SweepOptions.hpp"

static void printHelp(const char *prog)
{
    std::cout << "Usage: " << prog << " [options] [model-card]\n";
    std::cout << "Options:\n";
    std::cout << "  --vmax <double>           Sweep amplitude in volts "
                 "(default 5)\n";
    std::cout << "  --steps <int>             Steps per half sweep "
                 "(default 200)\n";
    std::cout << "  --period <double>         Sweep duration in seconds "
                 "(default 1e-3)\n";
    std::cout << "  --csv <file>              CSV output file (default "
                 "sweep.csv)\n";
    std::cout << "  --diag-file <file>        Diagnostics output file (default "
                 "diagnostics.log)\n";
    std::cout << "  --diag-verbose            Verbose diagnostics\n";
    std::cout << "  --strict                  Abort on the first model fault\n";
    std::cout << "  --help                    Show this help message\n";
}

int main(int argc, char *argv[])
{
    SweepOptions cli;
    bool haveVmax = false, haveSteps = false, havePeriod = false;

    static struct option long_options[] = {
        {"vmax", required_argument, 0, 0},
        {"steps", required_argument, 0, 0},
        {"period", required_argument, 0, 0},
        {"csv", required_argument, 0, 0},
        {"diag-file", required_argument, 0, 0},
        {"diag-verbose", no_argument, 0, 0},
        {"strict", no_argument, 0, 0},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}};

    int option_index = 0;
    int c;
    try {
        while ((c = getopt_long(argc, argv, "h", long_options,
                                &option_index)) != -1) {
            if (c == 'h') {
                printHelp(argv[0]);
                return 0;
            } else if (c == 0) {
                std::string name = long_options[option_index].name;
                if (name == "vmax") {
                    cli.amplitude = std::stod(optarg);
                    haveVmax = true;
                } else if (name == "steps") {
                    cli.stepsPerSegment = std::stoi(optarg);
                    haveSteps = true;
                } else if (name == "period") {
                    cli.period = std::stod(optarg);
                    havePeriod = true;
                } else if (name == "csv")
                    cli.csvFile = std::string(optarg);
                else if (name == "diag-file")
                    cli.diagFile = std::string(optarg);
                else if (name == "diag-verbose")
                    cli.diagVerbose = true;
                else if (name == "strict")
                    cli.strict = true;
            } else {
                printHelp(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception &ex) {
        std::cerr << "Invalid option value: " << ex.what() << std::endl;
        return 1;
    }

    // Remaining non-option args: [model-card]
    std::string filename = "fecap.mod";
    if (optind < argc) {
        filename = argv[optind];
    }

    ModelParameters params;
    SweepOptions options = cli;
    ModelCardParser parser;
    if (parser.parse(filename, params, options) != 0) {
        std::cerr << "Error: Failed to parse model card: " << filename
                  << std::endl;
        return 1;
    }

    // Command-line values win over the card's .SWEEP directive
    if (haveVmax) options.amplitude = cli.amplitude;
    if (haveSteps) options.stepsPerSegment = cli.stepsPerSegment;
    if (havePeriod) options.period = cli.period;

    try {
        options.validate();
    } catch (const std::exception &ex) {
        std::cerr << "Invalid sweep option: " << ex.what() << std::endl;
        return 1;
    }

    return runSweep(params, options, parser.modelName);
}
