// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QPLLPHASEENCODER_H
#define QPLLPHASEENCODER_H

/**
 * @brief Coarse-phase encoding for EHXPLLL outputs
 */
class QPllPhaseEncoder
{
public:
    /**
     * @brief Convert a phase to the CLKO*_CPHASE cycle offset
     * @details cphase = trunc(phase * (div + 1) / 360 + div - 1). A zero
     *          phase yields div - 1. Phase is not range checked.
     * @param phaseDegrees Requested phase in degrees
     * @param divider Resolved output divider, at least 1
     * @return Cycle offset
     */
    static int encode(double phaseDegrees, int divider);
};

#endif // QPLLPHASEENCODER_H
