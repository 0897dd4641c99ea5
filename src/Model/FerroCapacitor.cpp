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
 * @file FerroCapacitor.cpp
 * @brief Implementation of the per-device hysteresis driver.
 *
 * Implements the initialize / evaluate / reset lifecycle, fault recording,
 * snapshot / restore and the history dump. API-level documentation is in
 * the header.
 */

#include "FerroCapacitor.hpp"

#include <cmath>
#include <sstream>

static const ModelParameters &validated(const ModelParameters &params)
{
    params.validate();
    return params;
}

bool EvaluationResult::hasFault(FaultKind kind) const
{
    for (const auto &fault : faults)
        if (fault.kind == kind) return true;
    return false;
}

FerroCapacitor::FerroCapacitor(const std::string &name,
                               const ModelParameters &params,
                               std::shared_ptr<DiagnosticsSink> diagnostics,
                               std::unique_ptr<DampingSource> damping)
    : name_(name),
      params_(validated(params)),
      derived_(DerivedConstants::from(params_)),
      scaler_(SwitchingFunction(params_.saturationPolarization,
                                params_.slopeFactor, derived_.coerciveVoltage),
              derived_.linearCapacitance),
      solver_(derived_.chargeTolerance, params_.voltageTolerance,
              params_.maxIterations),
      tracker_(params_.historyCapacity, params_.voltageTolerance),
      diagnostics_(std::move(diagnostics)),
      damping_(std::move(damping))
{
    if (!diagnostics_) diagnostics_ = std::make_shared<NullDiagnostics>();
    if (!damping_)
        damping_ = makeSeededDamping(static_cast<std::uint64_t>(params_.seed));
}

void FerroCapacitor::initialize()
{
    tracker_.initialize(scaler_.switching());
    hasPreviousSample_ = false;
    previousCharge_ = 0.0;
    previousTime_ = 0.0;
    initialized_ = true;

    diagnostics_->initialized(name_, params_, derived_,
                              tracker_.ascending().top(),
                              tracker_.descending().top());
}

void FerroCapacitor::reset()
{
    damping_->reset();
    initialized_ = false;
    initialize();
}

void FerroCapacitor::recordFault(EvaluationResult &result, FaultKind kind,
                                 const std::string &message) const
{
    result.faults.push_back({kind, message});
    if (params_.faultPolicy == FaultPolicy::STRICT)
        throw FaultError(kind, name_ + ": " + message);
}

BranchScaling FerroCapacitor::currentScaling() const
{
    return scaler_.compute(tracker_.ascending().top(),
                           tracker_.descending().top(), tracker_.direction());
}

double FerroCapacitor::branchCharge(double voltage) const
{
    if (!initialized_) {
        // Uninitialized devices sit on the major rising branch.
        DirectionTracker fresh(1, params_.voltageTolerance);
        fresh.initialize(scaler_.switching());
        const BranchScaling scaling = scaler_.compute(
            fresh.ascending().top(), fresh.descending().top(),
            fresh.direction());
        return scaler_.charge(voltage, fresh.direction(), scaling);
    }
    return scaler_.charge(voltage, tracker_.direction(), currentScaling());
}

EvaluationResult FerroCapacitor::evaluate(double inputSignal, double time)
{
    if (!initialized_) initialize();

    EvaluationResult result;
    result.charge = inputSignal * INPUT_SCALE;

    // 1) branch scaling from the current stack tops
    const Direction dir = tracker_.direction();
    const BranchScaling scaling = currentScaling();
    if (!scaling.valid) {
        diagnostics_->arithmeticFault(name_, tracker_.ascending().top(),
                                      tracker_.descending().top(), dir);
        recordFault(result, FaultKind::ARITHMETIC,
                    "branch points indistinguishable under the switching "
                    "function; neutral scaling used");
    }

    // 2) invert the charge relation
    const SolveResult solved =
        solver_.solve(scaler_, scaling, dir, result.charge,
                      tracker_.previousVoltage(), *damping_);
    result.iterations = solved.iterations;
    result.converged = solved.converged;

    if (!solved.converged) {
        diagnostics_->convergenceFailure(name_, result.charge, solved.voltage,
                                         solved.residual, solved.iterations);
        // Fall back to the last accepted voltage; history is not advanced.
        result.solvedVoltage = tracker_.previousVoltage();
        std::ostringstream msg;
        msg << "Newton solver did not converge in " << params_.maxIterations
            << " iterations (target " << result.charge << ")";
        recordFault(result, FaultKind::CONVERGENCE, msg.str());
    } else {
        result.solvedVoltage = solved.voltage;

        // 3) direction / history update
        const int rawDirection = static_cast<int>(dir);
        const TrackerUpdate update =
            tracker_.update(solved.voltage, scaler_, scaling);
        if (update.directionReset) {
            diagnostics_->directionFault(name_, rawDirection);
            recordFault(result, FaultKind::DIRECTION,
                        "invalid direction state reset to RISING");
        }
        if (update.action == TrackerAction::CAPACITY_REJECTED) {
            const bool rising = update.before == Direction::RISING;
            const HistoryStack &full =
                rising ? tracker_.descending() : tracker_.ascending();
            diagnostics_->capacityFault(name_,
                                        rising ? "descending" : "ascending",
                                        full.capacity(), update.rejected);
            diagnostics_->historyDump(name_, tracker_.ascending(),
                                      tracker_.descending());
            recordFault(result, FaultKind::CAPACITY,
                        "history stack full; turning point dropped");
        }
        if (update.directionChanged()) {
            diagnostics_->directionChanged(name_, update.before, update.after,
                                           solved.voltage, tracker_.ascending(),
                                           tracker_.descending());
        }
    }

    // 4) relaxation term from the backward-difference charge rate
    if (!hasPreviousSample_) {
        hasPreviousSample_ = true;
        previousCharge_ = result.charge;
        previousTime_ = time;
    } else if (time > previousTime_) {
        result.chargeRate =
            (result.charge - previousCharge_) / (time - previousTime_);
        previousCharge_ = result.charge;
        previousTime_ = time;
    }

    result.voltage = result.solvedVoltage + params_.delayCoefficient *
                                                params_.thickness *
                                                result.chargeRate;
    result.direction = tracker_.direction();
    result.ascendingDepth = tracker_.ascending().depth();
    result.descendingDepth = tracker_.descending().depth();
    return result;
}

ModelSnapshot FerroCapacitor::snapshot() const
{
    ModelSnapshot snap;
    snap.initialized = initialized_;
    if (initialized_) {
        snap.ascending = tracker_.ascending().points();
        snap.descending = tracker_.descending().points();
    }
    snap.direction = tracker_.direction();
    snap.previousVoltage = tracker_.previousVoltage();
    snap.hasPreviousSample = hasPreviousSample_;
    snap.previousCharge = previousCharge_;
    snap.previousTime = previousTime_;
    snap.dampingCursor = damping_->cursor();
    return snap;
}

void FerroCapacitor::restore(const ModelSnapshot &snap)
{
    if (!snap.initialized) {
        damping_->seek(snap.dampingCursor);
        initialized_ = false;
        hasPreviousSample_ = false;
        return;
    }
    tracker_.restore(snap.ascending, snap.descending, snap.direction,
                     snap.previousVoltage);
    hasPreviousSample_ = snap.hasPreviousSample;
    previousCharge_ = snap.previousCharge;
    previousTime_ = snap.previousTime;
    damping_->seek(snap.dampingCursor);
    initialized_ = true;
}

void FerroCapacitor::dumpHistory(std::ostream &os) const
{
    os << "FECAP " << name_ << " direction=" << tracker_.direction()
       << " v_prev=" << tracker_.previousVoltage() << "\n";
    if (!initialized_) {
        os << "(not initialized)\n";
        return;
    }
    writeHistory(os, tracker_.ascending(), tracker_.descending());
}
