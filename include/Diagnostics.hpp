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
 * @file Diagnostics.hpp
 * @brief Injectable diagnostics sink for the hysteresis model.
 *
 * The model core returns structured results and faults; logging is layered
 * on top through a `DiagnosticsSink`. The base class implements every event
 * as a no-op so a default-constructed sink silently discards output and
 * concrete sinks override only what they need. Nothing reported here feeds
 * back into the model.
 *
 * `StreamDiagnostics` writes one line per event to a `std::ostream` (the
 * command-line driver points it at an append-mode diagnostics log). In
 * verbose mode it follows each direction change with a full history dump.
 *
 * Example:
 * @code
 * std::ofstream diag("diagnostics.log", std::ios::app);
 * auto sink = std::make_shared<StreamDiagnostics>(diag, true);
 * FerroCapacitor fe("FE1", params, sink);
 * @endcode
 */

#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "HistoryStack.hpp"
#include "ModelFault.hpp"
#include "ModelParameters.hpp"
#include "SwitchingFunction.hpp"

/**
 * @class DiagnosticsSink
 * @brief Observer of model events. Default implementations do nothing.
 */
class DiagnosticsSink
{
   public:
    virtual ~DiagnosticsSink() = default;

    /** @brief Initialization summary: parameters and saturation bounds. */
    virtual void initialized(const std::string & /*device*/,
                             const ModelParameters & /*params*/,
                             const DerivedConstants & /*derived*/,
                             const BranchPoint & /*lowerBound*/,
                             const BranchPoint & /*upperBound*/)
    {
    }

    /** @brief Newton solver exhausted its iteration budget. */
    virtual void convergenceFailure(const std::string & /*device*/,
                                    double /*targetCharge*/,
                                    double /*lastVoltage*/,
                                    double /*residual*/, int /*iterations*/)
    {
    }

    /** @brief Branch points indistinguishable under the switching function. */
    virtual void arithmeticFault(const std::string & /*device*/,
                                 const BranchPoint & /*ascendingTop*/,
                                 const BranchPoint & /*descendingTop*/,
                                 Direction /*dir*/)
    {
    }

    /** @brief The tracked direction changed. */
    virtual void directionChanged(const std::string & /*device*/,
                                  Direction /*from*/, Direction /*to*/,
                                  double /*voltage*/,
                                  const HistoryStack & /*ascending*/,
                                  const HistoryStack & /*descending*/)
    {
    }

    /** @brief A turning point was dropped because its stack was full. */
    virtual void capacityFault(const std::string & /*device*/,
                               const char * /*stackName*/,
                               std::size_t /*capacity*/,
                               const BranchPoint & /*dropped*/)
    {
    }

    /** @brief The direction state was invalid and has been reset. */
    virtual void directionFault(const std::string & /*device*/,
                                int /*rawValue*/)
    {
    }

    /** @brief Full dump of both history stacks. */
    virtual void historyDump(const std::string & /*device*/,
                             const HistoryStack & /*ascending*/,
                             const HistoryStack & /*descending*/)
    {
    }
};

/** @brief Sink that discards every event. */
class NullDiagnostics : public DiagnosticsSink
{
};

/**
 * @class StreamDiagnostics
 * @brief Line-oriented text sink writing to a caller-owned stream.
 *
 * The stream must outlive the sink.
 */
class StreamDiagnostics : public DiagnosticsSink
{
   public:
    explicit StreamDiagnostics(std::ostream &os, bool verbose = false);

    void initialized(const std::string &device, const ModelParameters &params,
                     const DerivedConstants &derived,
                     const BranchPoint &lowerBound,
                     const BranchPoint &upperBound) override;
    void convergenceFailure(const std::string &device, double targetCharge,
                            double lastVoltage, double residual,
                            int iterations) override;
    void arithmeticFault(const std::string &device,
                         const BranchPoint &ascendingTop,
                         const BranchPoint &descendingTop,
                         Direction dir) override;
    void directionChanged(const std::string &device, Direction from,
                          Direction to, double voltage,
                          const HistoryStack &ascending,
                          const HistoryStack &descending) override;
    void capacityFault(const std::string &device, const char *stackName,
                       std::size_t capacity,
                       const BranchPoint &dropped) override;
    void directionFault(const std::string &device, int rawValue) override;
    void historyDump(const std::string &device, const HistoryStack &ascending,
                     const HistoryStack &descending) override;

    bool verbose() const { return verbose_; }

   private:
    std::ostream &os_;
    bool verbose_;
};

/**
 * @brief Write both history stacks, one entry per line, base first.
 *
 * Format:
 * @code
 * ascending depth=2 capacity=1000
 *   [0] v=-32.768 p=-0.25
 *   [1] v=-5 p=-0.2499
 * descending depth=1 capacity=1000
 *   [0] v=32.768 p=0.25
 * @endcode
 */
void writeHistory(std::ostream &os, const HistoryStack &ascending,
                  const HistoryStack &descending);
