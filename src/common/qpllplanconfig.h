// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QPLLPLANCONFIG_H
#define QPLLPLANCONFIG_H

#include "common/qpllclockplan.h"
#include "common/qpllerror.h"
#include "common/qplloutputrequest.h"

#include <yaml-cpp/yaml.h>
#include <QString>

/**
 * @brief PLL plan description loaded from YAML
 * @details Describes one plan in the same terms as the QPllClockPlan calls:
 *
 *          name: crg_pll
 *          input:
 *            freq: 25MHz
 *          dynamic_phase: false
 *          output:
 *            - domain: sys
 *              freq: 100MHz
 *              phase: 90
 *              margin: 0.01
 *              reset: true
 *              dynamic_phase: true
 *
 *          Only input.freq and each output's domain and freq are required,
 *          name defaults to "pll". Present optional fields must convert to
 *          their type. Range and capacity checks happen in buildPlan, through
 *          the same registration calls a program would use.
 */
class QPllPlanConfig
{
public:
    QString               name = "pll";                /**< Plan instance name */
    double                inputFreq           = 0.0;   /**< Reference frequency in Hz */
    bool                  dynamicPhaseEnabled = false; /**< Plan-wide DPA flag */
    QPllOutputRequestList outputs;                     /**< Outputs in file order */

    /**
     * @brief Parse a plan from a YAML node
     * @param node Plan root node
     * @return false with ConfigError if a field is missing or malformed
     */
    bool loadFromNode(const YAML::Node &node);

    /**
     * @brief Parse a plan from a YAML file
     * @param filePath Path of the plan file
     * @return false with ConfigError if the file is missing or malformed
     */
    bool loadFromFile(const QString &filePath);

    /**
     * @brief Parse a plan from YAML text
     * @param text YAML document
     * @return false with ConfigError if the text is malformed
     */
    bool loadFromString(const QString &text);

    /**
     * @brief Replay the plan into a fresh QPllClockPlan
     * @param plan Receives the registrations, should be newly constructed
     * @return false with the plan's error if a registration failed
     */
    bool buildPlan(QPllClockPlan &plan);

    /**
     * @brief Parse a frequency string
     * @details Accepts a plain number in Hz or a number followed by Hz, kHz,
     *          MHz or GHz, case-insensitive, with optional whitespace before
     *          the unit. Underscores are ignored ("100_000_000").
     * @param text Frequency text, e.g. "24MHz", "3.125 MHz", "25e6"
     * @param ok Set to false when the text cannot be parsed, may be null
     * @return Frequency in Hz, 0 on failure
     */
    static double parseFrequency(const QString &text, bool *ok = nullptr);

    QPllError      lastError() const;
    const QString &lastErrorMessage() const;

private:
    bool fail(QPllError error, const QString &message);

    /* Read a frequency scalar from a node, which may be a number or a string */
    bool readFrequency(const YAML::Node &node, const QString &field, double &freq);

    QPllError error = QPllError::None;
    QString   errorMessage;
};

#endif // QPLLPLANCONFIG_H
