// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "common/qpllclockplan.h"
#include "common/qpllconfigfinalizer.h"
#include "common/qpllrangetable.h"
#include "common/qstaticlog.h"

QPllClockPlan::QPllClockPlan(const QString &name)
    : name(name)
{
    /* All private members set by constructor */
}

bool QPllClockPlan::registerInput(double freq)
{
    if (finalized) {
        return fail(QPllError::InvalidState, "Cannot register input: plan already finalized");
    }
    if (inputRegistered) {
        return fail(
            QPllError::InvalidState,
            QString("Cannot register input: already registered at %1 MHz").arg(inputFreq / 1e6));
    }

    const QPllFrequencyRange range = QPllRangeTable::CLKI_FREQ;
    if (!range.contains(freq)) {
        return fail(
            QPllError::RangeError,
            QString("Input frequency %1 MHz outside [%2, %3] MHz")
                .arg(freq / 1e6)
                .arg(range.min / 1e6)
                .arg(range.max / 1e6));
    }

    inputFreq       = freq;
    inputRegistered = true;
    QStaticLog::logI(
        Q_FUNC_INFO, QString("%1: registering clkin of %2 MHz").arg(name).arg(freq / 1e6));
    return succeed();
}

bool QPllClockPlan::registerOutput(
    const QString &domain,
    double         freq,
    double         phase,
    double         margin,
    bool           withReset,
    bool           usesDynamicPhase)
{
    if (finalized) {
        return fail(
            QPllError::InvalidState,
            QString("Cannot create clkout for %1: plan already finalized").arg(domain));
    }
    if (!inputRegistered) {
        return fail(
            QPllError::InvalidState,
            QString("Cannot create clkout for %1: no input registered").arg(domain));
    }

    const QPllFrequencyRange range = QPllRangeTable::CLKO_FREQ;
    if (!range.contains(freq)) {
        return fail(
            QPllError::RangeError,
            QString("Output frequency %1 MHz for %2 outside [%3, %4] MHz")
                .arg(freq / 1e6)
                .arg(domain)
                .arg(range.min / 1e6)
                .arg(range.max / 1e6));
    }
    if (outputs.size() >= QPllRangeTable::MAX_OUTPUTS) {
        return fail(
            QPllError::CapacityError,
            QString("Cannot create clkout for %1: all %2 outputs in use")
                .arg(domain)
                .arg(QPllRangeTable::MAX_OUTPUTS));
    }

    QPllOutputRequest request;
    request.slot             = static_cast<int>(outputs.size());
    request.domain           = domain;
    request.freq             = freq;
    request.phase            = phase;
    request.margin           = margin;
    request.withReset        = withReset;
    request.usesDynamicPhase = usesDynamicPhase;
    outputs.append(request);

    QStaticLog::logI(
        Q_FUNC_INFO,
        QString("%1: creating clkout%2 for %3 of %4 MHz (+-%5 ppm)")
            .arg(name)
            .arg(request.slot)
            .arg(domain)
            .arg(freq / 1e6)
            .arg(margin * 1e6));
    return succeed();
}

bool QPllClockPlan::enableDynamicPhaseAdjust()
{
    if (finalized) {
        return fail(
            QPllError::InvalidState,
            "Cannot enable dynamic phase adjustment: plan already finalized");
    }
    dynamicPhaseEnabled = true;
    QStaticLog::logD(Q_FUNC_INFO, QString("%1: dynamic phase adjustment enabled").arg(name));
    return succeed();
}

bool QPllClockPlan::finalize(QPllPrimitiveParameters &params)
{
    if (finalized) {
        return fail(QPllError::InvalidState, "Cannot finalize: plan already finalized");
    }
    if (!inputRegistered) {
        return fail(QPllError::InvalidState, "Cannot finalize: no input registered");
    }

    QPllDividerSolver::Configuration solved;
    if (!QPllDividerSolver::solve(inputFreq, outputs, dynamicPhaseEnabled, solved)) {
        return fail(
            QPllError::NoConfigurationFound,
            QString("%1: no PLL config found for %2 output(s)").arg(name).arg(outputs.size()));
    }

    configuration = solved;
    finalized     = true;
    params        = QPllConfigFinalizer::finalize(
        name, inputFreq, configuration, outputs, dynamicPhaseEnabled);

    QStaticLog::logI(
        Q_FUNC_INFO,
        QString("%1: config: %2").arg(name, QPllDividerSolver::describe(configuration)));
    QStaticLog::logV(Q_FUNC_INFO, params.toYamlString());
    return succeed();
}

const QString &QPllClockPlan::getName() const
{
    return name;
}

bool QPllClockPlan::hasInput() const
{
    return inputRegistered;
}

double QPllClockPlan::getInputFreq() const
{
    return inputFreq;
}

const QPllOutputRequestList &QPllClockPlan::getOutputs() const
{
    return outputs;
}

bool QPllClockPlan::isDynamicPhaseEnabled() const
{
    return dynamicPhaseEnabled;
}

bool QPllClockPlan::isFinalized() const
{
    return finalized;
}

const QPllDividerSolver::Configuration &QPllClockPlan::getConfiguration() const
{
    return configuration;
}

QPllError QPllClockPlan::lastError() const
{
    return error;
}

const QString &QPllClockPlan::lastErrorMessage() const
{
    return errorMessage;
}

bool QPllClockPlan::fail(QPllError error, const QString &message)
{
    this->error  = error;
    errorMessage = message;
    QStaticLog::logE(Q_FUNC_INFO, QString("%1: %2").arg(qPllErrorName(error), message));
    return false;
}

bool QPllClockPlan::succeed()
{
    error = QPllError::None;
    errorMessage.clear();
    return true;
}
