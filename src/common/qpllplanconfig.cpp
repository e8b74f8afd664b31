// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "common/qpllplanconfig.h"
#include "common/qstaticlog.h"

#include <QFile>
#include <QRegularExpression>
#include <QRegularExpressionMatch>

bool QPllPlanConfig::loadFromNode(const YAML::Node &node)
{
    if (!node.IsDefined() || node.IsNull() || !node.IsMap()) {
        return fail(QPllError::ConfigError, "PLL plan root must be a map");
    }

    QPllPlanConfig parsed;

    try {
        if (node["name"]) {
            parsed.name = QString::fromStdString(node["name"].as<std::string>());
        }

        /* Input accepts both "input: {freq: 25MHz}" and "input: 25MHz" */
        const YAML::Node inputNode = node["input"];
        if (!inputNode) {
            return fail(QPllError::ConfigError, "'input' field is required in PLL plan");
        }
        const YAML::Node inputFreqNode = inputNode.IsMap() ? inputNode["freq"] : inputNode;
        if (!readFrequency(inputFreqNode, "input.freq", parsed.inputFreq)) {
            return false;
        }

        if (node["dynamic_phase"]) {
            parsed.dynamicPhaseEnabled = node["dynamic_phase"].as<bool>();
        }

        const YAML::Node outputNode = node["output"];
        if (outputNode && !outputNode.IsNull()) {
            if (!outputNode.IsSequence()) {
                return fail(QPllError::ConfigError, "'output' must be a list");
            }
            for (std::size_t index = 0; index < outputNode.size(); ++index) {
                const YAML::Node  item  = outputNode[index];
                const QString     where = QString("output[%1]").arg(index);
                QPllOutputRequest request;
                request.slot = static_cast<int>(index);

                if (!item.IsMap() || !item["domain"]) {
                    return fail(
                        QPllError::ConfigError, QString("'domain' is required in %1").arg(where));
                }
                request.domain = QString::fromStdString(item["domain"].as<std::string>());

                if (!readFrequency(item["freq"], where + ".freq", request.freq)) {
                    return false;
                }
                /* Optional fields keep their defaults only when absent */
                if (item["phase"]) {
                    request.phase = item["phase"].as<double>();
                }
                if (item["margin"]) {
                    request.margin = item["margin"].as<double>();
                }
                if (item["reset"]) {
                    request.withReset = item["reset"].as<bool>();
                }
                if (item["dynamic_phase"]) {
                    request.usesDynamicPhase = item["dynamic_phase"].as<bool>();
                }

                parsed.outputs.append(request);
            }
        }
    } catch (const YAML::Exception &e) {
        return fail(
            QPllError::ConfigError,
            QString("Malformed PLL plan: %1").arg(QString::fromUtf8(e.what())));
    }

    name                = parsed.name;
    inputFreq           = parsed.inputFreq;
    dynamicPhaseEnabled = parsed.dynamicPhaseEnabled;
    outputs             = parsed.outputs;
    error               = QPllError::None;
    errorMessage.clear();

    QStaticLog::logD(
        Q_FUNC_INFO,
        QString("Loaded PLL plan %1 with %2 output(s)").arg(name).arg(outputs.size()));
    return true;
}

bool QPllPlanConfig::loadFromFile(const QString &filePath)
{
    if (!QFile::exists(filePath)) {
        return fail(
            QPllError::ConfigError, QString("PLL plan file does not exist: %1").arg(filePath));
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(filePath.toStdString());
    } catch (const YAML::Exception &e) {
        return fail(
            QPllError::ConfigError,
            QString("Error parsing PLL plan file %1: %2")
                .arg(filePath, QString::fromUtf8(e.what())));
    }
    return loadFromNode(node);
}

bool QPllPlanConfig::loadFromString(const QString &text)
{
    YAML::Node node;
    try {
        node = YAML::Load(text.toStdString());
    } catch (const YAML::Exception &e) {
        return fail(
            QPllError::ConfigError,
            QString("Error parsing PLL plan: %1").arg(QString::fromUtf8(e.what())));
    }
    return loadFromNode(node);
}

bool QPllPlanConfig::buildPlan(QPllClockPlan &plan)
{
    if (!plan.registerInput(inputFreq)) {
        return fail(plan.lastError(), plan.lastErrorMessage());
    }
    for (const QPllOutputRequest &request : outputs) {
        if (!plan.registerOutput(
                request.domain,
                request.freq,
                request.phase,
                request.margin,
                request.withReset,
                request.usesDynamicPhase)) {
            return fail(plan.lastError(), plan.lastErrorMessage());
        }
    }
    if (dynamicPhaseEnabled && !plan.enableDynamicPhaseAdjust()) {
        return fail(plan.lastError(), plan.lastErrorMessage());
    }
    error = QPllError::None;
    errorMessage.clear();
    return true;
}

double QPllPlanConfig::parseFrequency(const QString &text, bool *ok)
{
    if (ok) {
        *ok = false;
    }

    QString cleanStr = text.trimmed();
    cleanStr.remove('_');

    static const QRegularExpression freqRegex(
        R"(^([0-9]*\.?[0-9]+(?:[eE][-+]?[0-9]+)?)\s*([kKmMgG]?[hH][zZ])?$)");
    const QRegularExpressionMatch match = freqRegex.match(cleanStr);
    if (!match.hasMatch()) {
        return 0.0;
    }

    bool   numberOk = false;
    double value    = match.captured(1).toDouble(&numberOk);
    if (!numberOk) {
        return 0.0;
    }

    const QString unit = match.captured(2).toLower();
    if (unit == "khz") {
        value *= 1e3;
    } else if (unit == "mhz") {
        value *= 1e6;
    } else if (unit == "ghz") {
        value *= 1e9;
    }

    if (ok) {
        *ok = true;
    }
    return value;
}

QPllError QPllPlanConfig::lastError() const
{
    return error;
}

const QString &QPllPlanConfig::lastErrorMessage() const
{
    return errorMessage;
}

bool QPllPlanConfig::fail(QPllError error, const QString &message)
{
    this->error  = error;
    errorMessage = message;
    QStaticLog::logE(Q_FUNC_INFO, QString("%1: %2").arg(qPllErrorName(error), message));
    return false;
}

bool QPllPlanConfig::readFrequency(const YAML::Node &node, const QString &field, double &freq)
{
    if (!node || !node.IsScalar()) {
        return fail(QPllError::ConfigError, QString("'%1' is required in PLL plan").arg(field));
    }

    bool         ok     = false;
    const double parsed = parseFrequency(QString::fromStdString(node.Scalar()), &ok);
    if (!ok || parsed <= 0.0) {
        return fail(
            QPllError::ConfigError,
            QString("Invalid frequency for '%1': %2")
                .arg(field, QString::fromStdString(node.Scalar())));
    }
    freq = parsed;
    return true;
}
