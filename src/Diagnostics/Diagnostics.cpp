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
 * @file Diagnostics.cpp
 * @brief Text output of model events (StreamDiagnostics) and the history
 * dump helper.
 */

#include "Diagnostics.hpp"

static void writeStack(std::ostream &os, const char *label,
                       const HistoryStack &stack)
{
    os << label << " depth=" << stack.depth()
       << " capacity=" << stack.capacity() << "\n";
    const auto &points = stack.points();
    for (std::size_t i = 0; i < points.size(); ++i) {
        os << "  [" << i << "] v=" << points[i].voltage
           << " p=" << points[i].polarization << "\n";
    }
}

void writeHistory(std::ostream &os, const HistoryStack &ascending,
                  const HistoryStack &descending)
{
    writeStack(os, "ascending", ascending);
    writeStack(os, "descending", descending);
}

StreamDiagnostics::StreamDiagnostics(std::ostream &os, bool verbose)
    : os_(os), verbose_(verbose)
{
}

void StreamDiagnostics::initialized(const std::string &device,
                                    const ModelParameters &params,
                                    const DerivedConstants &derived,
                                    const BranchPoint &lowerBound,
                                    const BranchPoint &upperBound)
{
    os_ << "FECAP " << device << " init: tfe=" << params.thickness
        << " ec=" << params.coerciveField
        << " eps=" << params.relativePermittivity
        << " ps=" << params.saturationPolarization
        << " slope=" << params.slopeFactor << " vc=" << derived.coerciveVoltage
        << " clin=" << derived.linearCapacitance
        << " qtol=" << derived.chargeTolerance
        << " vtol=" << params.voltageTolerance
        << " maxiter=" << params.maxIterations << " seed=" << params.seed
        << " nhist=" << params.historyCapacity << " lower=("
        << lowerBound.voltage << "," << lowerBound.polarization << ") upper=("
        << upperBound.voltage << "," << upperBound.polarization << ")"
        << std::endl;
}

void StreamDiagnostics::convergenceFailure(const std::string &device,
                                           double targetCharge,
                                           double lastVoltage,
                                           double residual, int iterations)
{
    os_ << "FECAP " << device << " " << FaultKind::CONVERGENCE
        << ": target=" << targetCharge << " v_last=" << lastVoltage
        << " residual=" << residual << " iterations=" << iterations
        << std::endl;
}

void StreamDiagnostics::arithmeticFault(const std::string &device,
                                        const BranchPoint &ascendingTop,
                                        const BranchPoint &descendingTop,
                                        Direction dir)
{
    os_ << "FECAP " << device << " " << FaultKind::ARITHMETIC
        << ": branch points indistinguishable dir=" << dir << " a=("
        << ascendingTop.voltage << "," << ascendingTop.polarization
        << ") b=(" << descendingTop.voltage << ","
        << descendingTop.polarization << ")" << std::endl;
}

void StreamDiagnostics::directionChanged(const std::string &device,
                                         Direction from, Direction to,
                                         double voltage,
                                         const HistoryStack &ascending,
                                         const HistoryStack &descending)
{
    os_ << "FECAP " << device << " direction " << from << " -> " << to
        << " at v=" << voltage << " depth=(" << ascending.depth() << ","
        << descending.depth() << ")" << std::endl;
    if (verbose_) writeHistory(os_, ascending, descending);
}

void StreamDiagnostics::capacityFault(const std::string &device,
                                      const char *stackName,
                                      std::size_t capacity,
                                      const BranchPoint &dropped)
{
    os_ << "FECAP " << device << " " << FaultKind::CAPACITY << ": "
        << stackName << " stack full (capacity=" << capacity
        << "), dropped v=" << dropped.voltage << " p=" << dropped.polarization
        << std::endl;
}

void StreamDiagnostics::directionFault(const std::string &device,
                                       int rawValue)
{
    os_ << "FECAP " << device << " " << FaultKind::DIRECTION
        << ": invalid direction " << rawValue << " reset to RISING"
        << std::endl;
}

void StreamDiagnostics::historyDump(const std::string &device,
                                    const HistoryStack &ascending,
                                    const HistoryStack &descending)
{
    os_ << "FECAP " << device << " history\n";
    writeHistory(os_, ascending, descending);
    os_.flush();
}
