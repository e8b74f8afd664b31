// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "common/qpllconfigfinalizer.h"
#include "common/qpllphaseencoder.h"

#include <QLocale>
#include <QStringList>

QPllPrimitiveParameters QPllConfigFinalizer::finalize(
    const QString                          &name,
    double                                  inputFreq,
    const QPllDividerSolver::Configuration &config,
    const QPllOutputRequestList            &outputs,
    bool                                    dynamicPhaseEnabled)
{
    QPllPrimitiveParameters params;

    /* Device calibration constants */
    params.attributes = {
        {"FREQUENCY_PIN_CLKI", formatFrequencyMHz(inputFreq)},
        {"ICP_CURRENT", "6"},
        {"LPF_RESISTOR", "16"},
        {"MFG_ENABLE_FILTEROPAMP", "1"},
        {"MFG_GMCREF_SEL", "2"},
    };

    params.inputs["RST"]   = name + "_reset";
    params.inputs["CLKI"]  = name + "_clkin";
    params.inputs["STDBY"] = name + "_stdby";
    params.outputs["LOCK"] = name + "_lock";

    params.parameters["FEEDBK_PATH"] = feedbackPathTag(config.feedbackSlot);
    params.parameters["CLKFB_DIV"]   = config.clkfbDiv;
    params.parameters["CLKI_DIV"]    = config.clkiDiv;

    if (dynamicPhaseEnabled) {
        params.parameters["DPHASE_SOURCE"] = QString("ENABLED");
        params.inputs["PHASESEL0"]         = name + "_phase_sel[0]";
        params.inputs["PHASESEL1"]         = name + "_phase_sel[1]";
        params.inputs["PHASEDIR"]          = name + "_phase_dir";
        params.inputs["PHASESTEP"]         = name + "_phase_step";
        params.inputs["PHASELOADREG"]      = name + "_phase_load";
    }

    /* Locked only while the PLL is not held in reset */
    params.lockedExpression = QString("%1_lock & ~%1_reset").arg(name);

    for (int slot = 0; slot < config.outputs.size(); ++slot) {
        const QPllDividerSolver::OutputDivider &output = config.outputs.at(slot);
        const QString port   = "CLKO" + slotSuffix(slot);
        const QString signal = QString("%1_clkout%2").arg(name).arg(slot);
        const int     cphase = QPllPhaseEncoder::encode(output.phase, output.div);

        params.parameters[port + "_ENABLE"] = QString("ENABLED");
        params.parameters[port + "_DIV"]    = output.div;
        params.parameters[port + "_FPHASE"] = 0;
        params.parameters[port + "_CPHASE"] = cphase;
        params.outputs[port]                = signal;
    }

    for (const QPllOutputRequest &request : outputs) {
        QPllPrimitiveParameters::DomainBinding binding;
        binding.domain    = request.domain;
        binding.clock     = QString("%1_clkout%2").arg(name).arg(request.slot);
        binding.withReset = request.withReset;
        params.domains.append(binding);
    }

    return params;
}

QString QPllConfigFinalizer::slotSuffix(int slot)
{
    static const QStringList suffixes = {"P", "S", "S2", "S3"};
    return suffixes.value(slot);
}

QString QPllConfigFinalizer::feedbackPathTag(int slot)
{
    return "INT_O" + slotSuffix(slot);
}

QString QPllConfigFinalizer::formatFrequencyMHz(double freq)
{
    QString text = QString::number(freq / 1e6, 'g', QLocale::FloatingPointShortest);
    if (!text.contains('.') && !text.contains('e')) {
        text += ".0";
    }
    return text;
}
