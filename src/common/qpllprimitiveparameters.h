// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QPLLPRIMITIVEPARAMETERS_H
#define QPLLPRIMITIVEPARAMETERS_H

#include <yaml-cpp/yaml.h>
#include <QList>
#include <QMap>
#include <QPair>
#include <QString>
#include <QVariant>

/**
 * @brief Named attribute bag for one EHXPLLL instance
 * @details Produced by QPllConfigFinalizer and consumed by whatever emits the
 *          hardware instantiation. Parameter values are either int or
 *          QString, ports map a primitive pin to a signal name.
 */
class QPllPrimitiveParameters
{
public:
    /**
     * @brief Clock domain driven by a PLL output
     */
    struct DomainBinding
    {
        QString domain;           /**< Clock domain name */
        QString clock;            /**< Output signal driving the domain clock */
        bool    withReset = true; /**< Reset synchronizer released by lock */
    };

    QString                         type = "EHXPLLL"; /**< Primitive cell name */
    QList<QPair<QString, QString>>  attributes;       /**< Synthesis attributes in order */
    QMap<QString, QVariant>         parameters;       /**< Primitive parameters */
    QMap<QString, QString>          inputs;           /**< Input pin bindings */
    QMap<QString, QString>          outputs;          /**< Output pin bindings */
    QList<DomainBinding>            domains;          /**< Domain clock and reset bindings */
    QString                         lockedExpression; /**< Plan-level locked signal */

    /**
     * @brief Look up a synthesis attribute
     * @param name Attribute name
     * @return Attribute value, empty if absent
     */
    QString attribute(const QString &name) const;

    /**
     * @brief Look up a parameter
     * @param name Parameter name without prefix, e.g. "CLKI_DIV"
     * @return Parameter value, invalid QVariant if absent
     */
    QVariant parameter(const QString &name) const;

    /**
     * @brief Render as a YAML map
     * @return Map with type, attribute, parameter, input, output, domain and locked keys
     */
    YAML::Node toYaml() const;

    /**
     * @brief Render as YAML text
     */
    QString toYamlString() const;
};

#endif // QPLLPRIMITIVEPARAMETERS_H
