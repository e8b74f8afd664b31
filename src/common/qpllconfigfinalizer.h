// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QPLLCONFIGFINALIZER_H
#define QPLLCONFIGFINALIZER_H

#include "common/qplldividersolver.h"
#include "common/qplloutputrequest.h"
#include "common/qpllprimitiveparameters.h"

#include <QString>

/**
 * @brief Turns a solved divider configuration into EHXPLLL parameters
 * @details Pure transformation, the same configuration always yields the
 *          same parameter bag. Output slots map to the primitive ports
 *          CLKOP, CLKOS, CLKOS2 and CLKOS3.
 */
class QPllConfigFinalizer
{
public:
    /**
     * @brief Build the primitive parameters
     * @param name Plan name, used as prefix for every bound signal
     * @param inputFreq Reference input frequency in Hz
     * @param config Solved divider configuration
     * @param outputs Registered outputs in slot order
     * @param dynamicPhaseEnabled Expose the dynamic phase adjustment pins
     * @return Parameter bag ready for instantiation
     */
    static QPllPrimitiveParameters finalize(
        const QString                          &name,
        double                                  inputFreq,
        const QPllDividerSolver::Configuration &config,
        const QPllOutputRequestList            &outputs,
        bool                                    dynamicPhaseEnabled);

    /**
     * @brief Port suffix of an output slot
     * @param slot Slot index 0..3
     * @return "P", "S", "S2" or "S3"
     */
    static QString slotSuffix(int slot);

    /**
     * @brief FEEDBK_PATH value for a feedback slot
     * @param slot Slot index 0..3
     * @return "INT_OP", "INT_OS", "INT_OS2" or "INT_OS3"
     */
    static QString feedbackPathTag(int slot);

    /**
     * @brief Format a frequency in MHz for FREQUENCY_PIN_CLKI
     * @details Shortest round-trip form, always with a decimal point
     *          (25e6 gives "25.0", 12.5e6 gives "12.5").
     */
    static QString formatFrequencyMHz(double freq);
};

#endif // QPLLCONFIGFINALIZER_H
