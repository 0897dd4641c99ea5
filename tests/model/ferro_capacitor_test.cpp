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

#include <gtest/gtest.h>

#include "DampingSource.hpp"
#include "Diagnostics.hpp"
#include "FerroCapacitor.hpp"

#include <cmath>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

// Drive the device to a voltage through its charge input, the way a
// voltage-controlled host would.
static EvaluationResult driveTo(FerroCapacitor &fe, double v, double t = 0.0)
{
  return fe.evaluate(fe.branchCharge(v) / FerroCapacitor::INPUT_SCALE, t);
}

// ---------- lifecycle ----------
TEST(FerroCapacitor, EvaluateInitializesOnFirstUse)
{
  FerroCapacitor fe("FE1", ModelParameters());
  EXPECT_FALSE(fe.isInitialized());
  EXPECT_EQ(fe.name(), "FE1");
  EXPECT_NEAR(fe.derived().coerciveVoltage, 1.3, 1e-12);
  EXPECT_NEAR(fe.derived().chargeTolerance, 0.25 * 1e-4, 1e-18);

  EvaluationResult r = fe.evaluate(0.0, 0.0);
  EXPECT_TRUE(fe.isInitialized());
  EXPECT_TRUE(r.ok());
  EXPECT_EQ(r.ascendingDepth, 1u);
  EXPECT_EQ(r.descendingDepth, 1u);
}

TEST(FerroCapacitor, InputSignalIsScaledToCharge)
{
  FerroCapacitor fe("FE1", ModelParameters());
  EvaluationResult r = fe.evaluate(-20.0, 0.0);
  EXPECT_DOUBLE_EQ(r.charge, -0.2);
  ASSERT_TRUE(r.converged);
  // The solved voltage reproduces the charge on the active branch
  EXPECT_NEAR(fe.branchCharge(r.solvedVoltage), -0.2, 0.25 * 1e-4);
}

TEST(FerroCapacitor, ChargeDrivenVoltageFollowsTarget)
{
  FerroCapacitor fe("FE1", ModelParameters());
  for (double v : {0.5, 2.0, 5.0, 3.0, -1.0, -5.0}) {
    EvaluationResult r = driveTo(fe, v);
    ASSERT_TRUE(r.converged) << "v=" << v;
    EXPECT_NEAR(r.solvedVoltage, v, 5e-3) << "v=" << v;
    // zero delay: no relaxation term
    EXPECT_DOUBLE_EQ(r.voltage, r.solvedVoltage);
  }
}

TEST(FerroCapacitor, OperatingPointStaysBetweenStackTops)
{
  FerroCapacitor fe("FE1", ModelParameters());
  // One pop per call: the path never jumps more than one loop level
  const double path[] = {5.0, -5.0, 1.0, 0.5, 0.7, 0.6,
                         0.65, 0.8, 1.1, 3.0, -2.0};
  for (double v : path) {
    EvaluationResult r = driveTo(fe, v);
    ASSERT_TRUE(r.converged);
    const double tol = fe.parameters().voltageTolerance;
    EXPECT_GE(r.solvedVoltage, fe.ascending().top().voltage - tol);
    EXPECT_LE(r.solvedVoltage, fe.descending().top().voltage + tol);

    // Active scaling passes through both stack tops
    BranchScaling sc = fe.currentScaling();
    const BranchPoint &a = fe.ascending().top();
    const BranchPoint &b = fe.descending().top();
    EXPECT_NEAR(fe.scaler().polarization(a.voltage, fe.direction(), sc),
                a.polarization, 1e-12);
    EXPECT_NEAR(fe.scaler().polarization(b.voltage, fe.direction(), sc),
                b.polarization, 1e-12);
  }
}

TEST(FerroCapacitor, ClosedMinorLoopRestoresScalingExactly)
{
  FerroCapacitor fe("FE1", ModelParameters());
  driveTo(fe, 5.0);
  driveTo(fe, -5.0);
  driveTo(fe, 1.0);
  const BranchScaling outer = fe.currentScaling();
  const std::size_t ascDepth = fe.ascending().depth();
  const std::size_t descDepth = fe.descending().depth();

  driveTo(fe, 0.5);
  driveTo(fe, 0.7);
  EXPECT_EQ(fe.ascending().depth(), ascDepth + 1);
  EXPECT_EQ(fe.descending().depth(), descDepth + 1);

  driveTo(fe, 1.2);
  EXPECT_EQ(fe.ascending().depth(), ascDepth);
  EXPECT_EQ(fe.descending().depth(), descDepth);
  EXPECT_EQ(fe.direction(), Direction::RISING);

  const BranchScaling back = fe.currentScaling();
  EXPECT_EQ(back.slope, outer.slope);
  EXPECT_EQ(back.intercept, outer.intercept);
}

TEST(FerroCapacitor, ResetReplaysIdentically)
{
  FerroCapacitor fe("FE1", ModelParameters());
  const double signals[] = {10.0, 25.0, -15.0, -28.0, 5.0};

  std::vector<double> first;
  for (double s : signals) first.push_back(fe.evaluate(s, 0.0).voltage);

  fe.reset();
  EXPECT_EQ(fe.ascending().depth(), 1u);
  EXPECT_EQ(fe.descending().depth(), 1u);
  EXPECT_DOUBLE_EQ(fe.previousVoltage(), 0.0);

  for (std::size_t i = 0; i < first.size(); ++i)
    EXPECT_DOUBLE_EQ(fe.evaluate(signals[i], 0.0).voltage, first[i]);
}

TEST(FerroCapacitor, SnapshotRestoreUndoesTentativeEvaluation)
{
  FerroCapacitor fe("FE1", ModelParameters());
  driveTo(fe, 5.0, 0.0);
  driveTo(fe, -5.0, 1e-6);

  const ModelSnapshot snap = fe.snapshot();
  EvaluationResult committed = fe.evaluate(12.0, 2e-6);

  // A rejected step mutates history ...
  fe.restore(snap);
  EXPECT_EQ(fe.descending().points(), snap.descending);
  EXPECT_EQ(fe.ascending().points(), snap.ascending);
  EXPECT_DOUBLE_EQ(fe.previousVoltage(), snap.previousVoltage);

  // ... and re-running from the snapshot reproduces it bit for bit
  EvaluationResult again = fe.evaluate(12.0, 2e-6);
  EXPECT_DOUBLE_EQ(again.voltage, committed.voltage);
  EXPECT_EQ(again.iterations, committed.iterations);
  EXPECT_EQ(again.ascendingDepth, committed.ascendingDepth);
}

TEST(FerroCapacitor, BranchChargeBeforeInitializationUsesMajorRisingBranch)
{
  FerroCapacitor fresh("FE1", ModelParameters());
  FerroCapacitor used("FE2", ModelParameters());
  used.initialize();

  for (double v : {-5.0, 0.0, 1.3, 5.0})
    EXPECT_DOUBLE_EQ(fresh.branchCharge(v), used.branchCharge(v));
  EXPECT_FALSE(fresh.isInitialized());
}

// ---------- relaxation term ----------
TEST(FerroCapacitor, RelaxationTermUsesBackwardDifference)
{
  ModelParameters p;
  p.delayCoefficient = 0.09;
  FerroCapacitor fe("FE1", p);

  EvaluationResult r0 = fe.evaluate(-20.0, 0.0);
  EXPECT_DOUBLE_EQ(r0.chargeRate, 0.0);
  EXPECT_DOUBLE_EQ(r0.voltage, r0.solvedVoltage);

  EvaluationResult r1 = fe.evaluate(-10.0, 1e-6);
  const double rate = (-0.1 - -0.2) / 1e-6;
  EXPECT_NEAR(r1.chargeRate, rate, 1e-6 * rate);
  EXPECT_NEAR(r1.voltage - r1.solvedVoltage, 0.09 * 20e-9 * rate, 1e-12);

  // Re-evaluation at the same time: no rate, bookkeeping untouched
  EvaluationResult r2 = fe.evaluate(-5.0, 1e-6);
  EXPECT_DOUBLE_EQ(r2.chargeRate, 0.0);
  EXPECT_DOUBLE_EQ(r2.voltage, r2.solvedVoltage);

  EvaluationResult r3 = fe.evaluate(-5.0, 2e-6);
  EXPECT_NEAR(r3.chargeRate, (-0.05 - -0.1) / 1e-6, 1.0);
}

// ---------- faults ----------
TEST(FerroCapacitor, CapacityFaultKeepsState)
{
  ModelParameters p;
  p.historyCapacity = 1;
  FerroCapacitor fe("FE1", p);

  driveTo(fe, 5.0);
  const double vPrev = fe.previousVoltage();

  EvaluationResult r = driveTo(fe, -5.0);
  EXPECT_TRUE(r.hasFault(FaultKind::CAPACITY));
  EXPECT_TRUE(r.converged);
  EXPECT_EQ(fe.descending().depth(), 1u);
  EXPECT_EQ(fe.direction(), Direction::RISING);
  EXPECT_DOUBLE_EQ(fe.previousVoltage(), vPrev);
}

TEST(FerroCapacitor, StrictPolicyThrowsOnCapacityFault)
{
  ModelParameters p;
  p.historyCapacity = 1;
  p.faultPolicy = FaultPolicy::STRICT;
  FerroCapacitor fe("FE1", p);

  driveTo(fe, 5.0);
  try {
    driveTo(fe, -5.0);
    FAIL() << "expected FaultError";
  } catch (const FaultError &ex) {
    EXPECT_EQ(ex.kind(), FaultKind::CAPACITY);
    EXPECT_NE(std::string(ex.what()).find("FE1"), std::string::npos);
  }
}

TEST(FerroCapacitor, FlatCurveRaisesArithmeticAndConvergenceFaults)
{
  // Qs = 0 makes every branch degenerate and the charge tolerance zero
  ModelParameters p;
  p.saturationPolarization = 0.0;
  p.maxIterations = 1000;
  FerroCapacitor fe("FE1", p, nullptr,
                    std::make_unique<ConstantDamping>(1));

  EvaluationResult r = fe.evaluate(1.0, 0.0);
  EXPECT_TRUE(r.hasFault(FaultKind::ARITHMETIC));
  EXPECT_TRUE(r.hasFault(FaultKind::CONVERGENCE));
  EXPECT_FALSE(r.converged);
  EXPECT_FALSE(r.ok());
  // falls back to the last accepted voltage
  EXPECT_DOUBLE_EQ(r.solvedVoltage, 0.0);
  EXPECT_DOUBLE_EQ(fe.previousVoltage(), 0.0);
}

TEST(FerroCapacitor, StrictPolicyThrowsFirstFaultKind)
{
  ModelParameters p;
  p.saturationPolarization = 0.0;
  p.maxIterations = 1000;
  p.faultPolicy = FaultPolicy::STRICT;
  FerroCapacitor fe("FE1", p);

  try {
    fe.evaluate(1.0, 0.0);
    FAIL() << "expected FaultError";
  } catch (const FaultError &ex) {
    EXPECT_EQ(ex.kind(), FaultKind::ARITHMETIC);
  }
}

TEST(FerroCapacitor, CorruptedDirectionIsResetAndReported)
{
  FerroCapacitor fe("FE1", ModelParameters());
  driveTo(fe, 2.0);

  ModelSnapshot snap = fe.snapshot();
  snap.direction = static_cast<Direction>(0);
  fe.restore(snap);

  EvaluationResult r = fe.evaluate(0.0, 0.0);
  EXPECT_TRUE(r.hasFault(FaultKind::DIRECTION));
  EXPECT_TRUE(isValidDirection(fe.direction()));
}

// ---------- diagnostics wiring ----------
TEST(FerroCapacitor, EventsReachDiagnosticsSink)
{
  std::ostringstream log;
  auto sink = std::make_shared<StreamDiagnostics>(log);
  ModelParameters p;
  p.historyCapacity = 1;
  FerroCapacitor fe("FE7", p, sink);

  driveTo(fe, 5.0);
  driveTo(fe, -5.0);

  const std::string out = log.str();
  EXPECT_NE(out.find("FECAP FE7 init:"), std::string::npos);
  EXPECT_NE(out.find("FECAP FE7 CapacityFault: descending stack full"),
            std::string::npos);
  EXPECT_NE(out.find("FECAP FE7 history"), std::string::npos);
}

TEST(FerroCapacitor, DumpHistoryListsBothStacks)
{
  FerroCapacitor fe("FE1", ModelParameters());
  std::ostringstream os;
  fe.dumpHistory(os);
  EXPECT_NE(os.str().find("(not initialized)"), std::string::npos);

  driveTo(fe, 5.0);
  driveTo(fe, -5.0);
  os.str("");
  fe.dumpHistory(os);
  EXPECT_NE(os.str().find("ascending depth=1"), std::string::npos);
  EXPECT_NE(os.str().find("descending depth=2"), std::string::npos);
}
