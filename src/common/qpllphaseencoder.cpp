// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "common/qpllphaseencoder.h"

int QPllPhaseEncoder::encode(double phaseDegrees, int divider)
{
    return static_cast<int>(phaseDegrees * (divider + 1) / 360 + divider - 1);
}
