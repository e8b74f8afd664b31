// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QPLLCLOCKPLAN_H
#define QPLLCLOCKPLAN_H

#include "common/qplldividersolver.h"
#include "common/qpllerror.h"
#include "common/qplloutputrequest.h"
#include "common/qpllprimitiveparameters.h"

#include <QString>

/**
 * @brief Clock plan for one ECP5 PLL instance
 * @details Holds the reference input and the requested outputs, validates
 *          each registration against QPllRangeTable immediately, and turns
 *          the plan into EHXPLLL parameters on finalize. A plan is built,
 *          finalized once and then discarded.
 *
 *          Every operation returns false on failure and keeps the reason in
 *          lastError() and lastErrorMessage(). A failed call leaves the plan
 *          unchanged.
 */
class QPllClockPlan
{
public:
    /**
     * @brief Constructor
     * @param name Instance name, prefix of every signal bound by finalize
     */
    explicit QPllClockPlan(const QString &name = "pll");

    /**
     * @brief Register the reference input clock
     * @param freq Input frequency in Hz
     * @return false with RangeError outside the input range, InvalidState if
     *         already registered or finalized
     */
    bool registerInput(double freq);

    /**
     * @brief Register an output clock in the next free slot
     * @param domain Clock domain driven by the output
     * @param freq Target frequency in Hz
     * @param phase Phase in degrees
     * @param margin Fractional frequency tolerance
     * @param withReset Attach a reset synchronizer released by PLL lock
     * @param usesDynamicPhase Eligible for dynamic phase adjustment
     * @return false with InvalidState before registerInput or after finalize,
     *         RangeError outside the output range, CapacityError when all
     *         slots are taken
     */
    bool registerOutput(
        const QString &domain,
        double         freq,
        double         phase            = 0,
        double         margin           = 1e-2,
        bool           withReset        = true,
        bool           usesDynamicPhase = true);

    /**
     * @brief Enable dynamic phase adjustment for the whole plan
     * @details Outputs eligible for dynamic phase adjustment can no longer
     *          carry the feedback path, and the phase control pins are
     *          exposed on the primitive.
     * @return false with InvalidState after finalize
     */
    bool enableDynamicPhaseAdjust();

    /**
     * @brief Solve the plan and build the primitive parameters
     * @param params Filled on success
     * @return false with InvalidState without input or on a second call,
     *         NoConfigurationFound if no divider set exists
     */
    bool finalize(QPllPrimitiveParameters &params);

    const QString               &getName() const;
    bool                         hasInput() const;
    double                       getInputFreq() const;
    const QPllOutputRequestList &getOutputs() const;
    bool                         isDynamicPhaseEnabled() const;
    bool                         isFinalized() const;

    /**
     * @brief Configuration found by the last successful finalize
     */
    const QPllDividerSolver::Configuration &getConfiguration() const;

    QPllError      lastError() const;
    const QString &lastErrorMessage() const;

private:
    /* Record a failure, log it and return false */
    bool fail(QPllError error, const QString &message);

    /* Clear the error state and return true */
    bool succeed();

    QString                          name;
    bool                             inputRegistered     = false;
    double                           inputFreq           = 0.0;
    QPllOutputRequestList            outputs;
    bool                             dynamicPhaseEnabled = false;
    bool                             finalized           = false;
    QPllDividerSolver::Configuration configuration;
    QPllError                        error = QPllError::None;
    QString                          errorMessage;
};

#endif // QPLLCLOCKPLAN_H
