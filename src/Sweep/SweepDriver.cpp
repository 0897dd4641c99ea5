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
 * @file SweepDriver.cpp
 * @brief Implementation of the sweep workflow declared in `SweepDriver.hpp`.
 */

#include "SweepDriver.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "Diagnostics.hpp"
#include "ModelFault.hpp"

// Drive the model to `v` through its charge input; returns the result.
static EvaluationResult driveTo(FerroCapacitor &model, double v, double t)
{
    const double signal = model.branchCharge(v) / FerroCapacitor::INPUT_SCALE;
    return model.evaluate(signal, t);
}

SweepTrace runTriangularSweep(FerroCapacitor &model,
                              const SweepOptions &options)
{
    const int steps = options.stepsPerSegment;
    const double amplitude = options.amplitude;
    const double dt = options.period / (2.0 * steps);
    const double dv = 2.0 * amplitude / steps;

    SweepTrace trace;

    // Pre-conditioning ramp 0 -> -A, on a time base that ends before t = 0
    const int rampSteps = std::max(1, steps / 2);
    for (int k = 1; k <= rampSteps; ++k) {
        const double v = -amplitude * k / rampSteps;
        const double t = -dt * (rampSteps - k + 1);
        EvaluationResult r = driveTo(model, v, t);
        trace.faultCount += static_cast<int>(r.faults.size());
        if (!r.converged) ++trace.unconverged;
    }

    const int n = 2 * steps + 1;
    trace.time.resize(n);
    trace.applied.resize(n);
    trace.voltage.resize(n);
    trace.charge.resize(n);
    trace.direction.resize(n);

    for (int i = 0; i < n; ++i) {
        const double v = (i <= steps) ? -amplitude + dv * i
                                      : amplitude - dv * (i - steps);
        const double t = dt * i;
        EvaluationResult r = driveTo(model, v, t);

        trace.time(i) = t;
        trace.applied(i) = v;
        trace.voltage(i) = r.voltage;
        trace.charge(i) = r.charge;
        trace.direction(i) = directionSign(r.direction);
        trace.faultCount += static_cast<int>(r.faults.size());
        if (!r.converged) ++trace.unconverged;
    }
    return trace;
}

double loopArea(const SweepTrace &trace)
{
    const Eigen::Index n = trace.size();
    if (n < 3) return 0.0;

    const Eigen::VectorXd &x = trace.voltage;
    const Eigen::VectorXd &y = trace.charge;

    // Shoelace over consecutive vertices plus the closing edge
    double twiceArea = x.head(n - 1).dot(y.tail(n - 1)) -
                       x.tail(n - 1).dot(y.head(n - 1));
    twiceArea += x(n - 1) * y(0) - x(0) * y(n - 1);
    return 0.5 * twiceArea;
}

bool writeCsv(const SweepTrace &trace, const std::string &path)
{
    std::ofstream csv(path);
    if (!csv) {
        std::cerr << "Warning: Could not open " << path
                  << " for writing. CSV output disabled." << std::endl;
        return false;
    }
    csv.setf(std::ios::fixed);
    csv << "time,v_applied,v_model,charge,direction\n";
    for (Eigen::Index i = 0; i < trace.size(); ++i) {
        csv << std::setprecision(8) << trace.time(i) << ","
            << trace.applied(i) << "," << trace.voltage(i) << ","
            << trace.charge(i) << "," << trace.direction(i) << "\n";
    }
    csv.flush();
    return static_cast<bool>(csv);
}

void printSummary(std::ostream &os, const SweepTrace &trace)
{
    if (trace.size() == 0) {
        os << "No samples recorded." << std::endl;
        return;
    }
    os << std::setprecision(6);
    os << "Samples:           " << trace.size() << "\n";
    os << "Charge range:      [" << trace.charge.minCoeff() << ", "
       << trace.charge.maxCoeff() << "] C/m^2\n";
    os << "Voltage range:     [" << trace.voltage.minCoeff() << ", "
       << trace.voltage.maxCoeff() << "] V\n";
    os << "Loop area:         " << loopArea(trace) << " J/m^2\n";
    os << "Faults:            " << trace.faultCount << "\n";
    os << "Unconverged steps: " << trace.unconverged << std::endl;
}

int runSweep(const ModelParameters &params, const SweepOptions &options,
             const std::string &deviceName)
{
    std::ofstream diag(options.diagFile, std::ios::app);
    if (!diag) {
        std::cerr << "Warning: Could not open " << options.diagFile
                  << " for diagnostics." << std::endl;
    }
    auto sink = diag ? std::static_pointer_cast<DiagnosticsSink>(
                           std::make_shared<StreamDiagnostics>(
                               diag, options.diagVerbose))
                     : std::static_pointer_cast<DiagnosticsSink>(
                           std::make_shared<NullDiagnostics>());

    ModelParameters effective = params;
    if (options.strict) effective.faultPolicy = FaultPolicy::STRICT;

    std::unique_ptr<FerroCapacitor> model;
    try {
        model = std::make_unique<FerroCapacitor>(deviceName, effective, sink);
    } catch (const std::invalid_argument &ex) {
        std::cerr << "Invalid model parameter: " << ex.what() << std::endl;
        return 1;
    }

    std::cout << "Sweep started: device=" << deviceName
              << " amplitude=" << options.amplitude
              << " steps=" << options.stepsPerSegment
              << " period=" << options.period << std::endl;

    SweepTrace trace;
    try {
        trace = runTriangularSweep(*model, options);
    } catch (const FaultError &ex) {
        std::cerr << "Sweep aborted (" << ex.kind() << "): " << ex.what()
                  << std::endl;
        if (diag) model->dumpHistory(diag);
        return 1;
    }

    printSummary(std::cout, trace);
    if (writeCsv(trace, options.csvFile))
        std::cout << "Sweep results written to " << options.csvFile
                  << std::endl;
    std::cout << "Sweep finished." << std::endl;
    return 0;
}
