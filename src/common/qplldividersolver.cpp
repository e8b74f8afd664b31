// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "common/qplldividersolver.h"
#include "common/qpllrangetable.h"
#include "common/qstaticlog.h"

#include <QStringList>

#include <cmath>

bool QPllDividerSolver::solve(
    double                       inputFreq,
    const QPllOutputRequestList &outputs,
    bool                         dynamicPhaseEnabled,
    Configuration               &config)
{
    const QPllDividerRange clkiRange  = QPllRangeTable::CLKI_DIV;
    const QPllDividerRange clkoRange  = QPllRangeTable::CLKO_DIV;
    const QPllDividerRange clkfbRange = QPllRangeTable::CLKFB_DIV;

    /* Iterate on CLKI dividers */
    for (int clkiDiv = clkiRange.low; clkiDiv < clkiRange.high; ++clkiDiv) {
        if (!QPllRangeTable::PFD_FREQ.contains(inputFreq / clkiDiv)) {
            continue;
        }
        /* Iterate on the divider shared with the feedback output */
        for (int clkofbDiv = clkoRange.low; clkofbDiv < clkoRange.high; ++clkofbDiv) {
            /* Iterate on CLKFB dividers */
            for (int clkfbDiv = clkfbRange.low; clkfbDiv < clkfbRange.high; ++clkfbDiv) {
                const CandidateStatus status = tryCandidate(
                    inputFreq, outputs, dynamicPhaseEnabled, clkiDiv, clkofbDiv, clkfbDiv, config);
                if (status == CandidateStatus::Valid) {
                    QStaticLog::logD(Q_FUNC_INFO, "Found PLL config: " + describe(config));
                    return true;
                }
            }
        }
    }

    QStaticLog::logD(
        Q_FUNC_INFO,
        QString("Search exhausted for %1 output(s) from %2 Hz")
            .arg(outputs.size())
            .arg(inputFreq, 0, 'g', 12));
    return false;
}

QPllDividerSolver::CandidateStatus QPllDividerSolver::tryCandidate(
    double                       inputFreq,
    const QPllOutputRequestList &outputs,
    bool                         dynamicPhaseEnabled,
    int                          clkiDiv,
    int                          clkofbDiv,
    int                          clkfbDiv,
    Configuration               &config)
{
    const double vco = (inputFreq / clkiDiv) * clkfbDiv * clkofbDiv;
    if (!QPllRangeTable::VCO_FREQ.contains(vco)) {
        return CandidateStatus::Rejected;
    }

    Configuration candidate;
    candidate.clkiDiv   = clkiDiv;
    candidate.clkfbDiv  = clkfbDiv;
    candidate.clkofbDiv = clkofbDiv;
    candidate.vco       = vco;

    for (int slot = 0; slot < outputs.size(); ++slot) {
        const QPllOutputRequest &output = outputs.at(slot);
        OutputDivider            resolved;
        resolved.phase = output.phase;
        if (!resolveOutputDivider(vco, output.freq, output.margin, resolved.div, resolved.freq)) {
            return CandidateStatus::Rejected;
        }
        /* First eligible output with the shared divider carries the feedback */
        if (candidate.feedbackSlot < 0 && resolved.div == clkofbDiv
            && canCarryFeedback(output, dynamicPhaseEnabled)) {
            candidate.feedbackSlot = slot;
        }
        candidate.outputs.append(resolved);
    }

    if (candidate.feedbackSlot < 0) {
        /* No output usable as feedback, a free slot is needed for it */
        if (outputs.size() >= QPllRangeTable::MAX_OUTPUTS) {
            return CandidateStatus::Rejected;
        }
        OutputDivider phantom;
        phantom.div     = phantomDivider(vco, inputFreq, clkiDiv, clkfbDiv);
        phantom.phantom = true;
        if (!QPllRangeTable::CLKO_DIV.contains(phantom.div)) {
            return CandidateStatus::Rejected;
        }
        candidate.feedbackSlot    = static_cast<int>(outputs.size());
        candidate.feedbackPhantom = true;
        candidate.outputs.append(phantom);
    }

    config = candidate;
    return CandidateStatus::Valid;
}

bool QPllDividerSolver::resolveOutputDivider(
    double vco, double freq, double margin, int &div, double &actual)
{
    const QPllDividerRange clkoRange = QPllRangeTable::CLKO_DIV;
    for (int candidate = clkoRange.low; candidate < clkoRange.high; ++candidate) {
        const double clkFreq = vco / candidate;
        if (std::abs(clkFreq - freq) <= freq * margin) {
            div    = candidate;
            actual = clkFreq;
            return true;
        }
    }
    return false;
}

bool QPllDividerSolver::canCarryFeedback(const QPllOutputRequest &output, bool dynamicPhaseEnabled)
{
    return !(output.usesDynamicPhase && dynamicPhaseEnabled);
}

int QPllDividerSolver::phantomDivider(double vco, double inputFreq, int clkiDiv, int clkfbDiv)
{
    return static_cast<int>((vco * clkiDiv) / (inputFreq * clkfbDiv));
}

QString QPllDividerSolver::describe(const Configuration &config)
{
    QStringList parts;
    parts << QString("clki_div=%1").arg(config.clkiDiv);
    parts << QString("clkfb_div=%1").arg(config.clkfbDiv);
    parts << QString("vco=%1MHz").arg(config.vco / 1e6, 0, 'f', 3);
    parts << QString("clkfb=%1%2").arg(config.feedbackSlot).arg(
        config.feedbackPhantom ? QString(" (phantom)") : QString());
    for (int slot = 0; slot < config.outputs.size(); ++slot) {
        const OutputDivider &output = config.outputs.at(slot);
        if (output.phantom) {
            parts << QString("clko%1_div=%2").arg(slot).arg(output.div);
        } else {
            parts << QString("clko%1_div=%2 clko%1_freq=%3MHz clko%1_phase=%4")
                         .arg(slot)
                         .arg(output.div)
                         .arg(output.freq / 1e6, 0, 'f', 3)
                         .arg(output.phase);
        }
    }
    return parts.join(", ");
}
