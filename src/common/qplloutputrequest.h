// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QPLLOUTPUTREQUEST_H
#define QPLLOUTPUTREQUEST_H

#include <QList>
#include <QString>

/**
 * @brief One requested PLL output clock
 */
struct QPllOutputRequest
{
    int     slot             = 0;     /**< Output slot, assigned in registration order */
    QString domain;                   /**< Clock domain driven by this output */
    double  freq             = 0.0;   /**< Target frequency in Hz */
    double  phase            = 0.0;   /**< Phase in degrees */
    double  margin           = 1e-2;  /**< Fractional frequency tolerance */
    bool    withReset        = true;  /**< Attach a lock-released reset synchronizer */
    bool    usesDynamicPhase = true;  /**< Eligible for dynamic phase adjustment */
};

using QPllOutputRequestList = QList<QPllOutputRequest>;

#endif // QPLLOUTPUTREQUEST_H
