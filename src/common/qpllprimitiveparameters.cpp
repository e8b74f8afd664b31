// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "common/qpllprimitiveparameters.h"

#include <QMetaType>

#include <sstream>

QString QPllPrimitiveParameters::attribute(const QString &name) const
{
    for (const auto &attr : attributes) {
        if (attr.first == name) {
            return attr.second;
        }
    }
    return {};
}

QVariant QPllPrimitiveParameters::parameter(const QString &name) const
{
    return parameters.value(name);
}

YAML::Node QPllPrimitiveParameters::toYaml() const
{
    YAML::Node node(YAML::NodeType::Map);
    node["type"] = type.toStdString();

    YAML::Node attrNode(YAML::NodeType::Map);
    for (const auto &attr : attributes) {
        attrNode[attr.first.toStdString()] = attr.second.toStdString();
    }
    node["attribute"] = attrNode;

    YAML::Node paramNode(YAML::NodeType::Map);
    for (auto iter = parameters.constBegin(); iter != parameters.constEnd(); ++iter) {
        const std::string key = iter.key().toStdString();
        /* Keep integers as integers so the dump reads back with the same types */
        if (iter.value().typeId() == QMetaType::Int) {
            paramNode[key] = iter.value().toInt();
        } else {
            paramNode[key] = iter.value().toString().toStdString();
        }
    }
    node["parameter"] = paramNode;

    YAML::Node inputNode(YAML::NodeType::Map);
    for (auto iter = inputs.constBegin(); iter != inputs.constEnd(); ++iter) {
        inputNode[iter.key().toStdString()] = iter.value().toStdString();
    }
    node["input"] = inputNode;

    YAML::Node outputNode(YAML::NodeType::Map);
    for (auto iter = outputs.constBegin(); iter != outputs.constEnd(); ++iter) {
        outputNode[iter.key().toStdString()] = iter.value().toStdString();
    }
    node["output"] = outputNode;

    YAML::Node domainNode(YAML::NodeType::Sequence);
    for (const DomainBinding &binding : domains) {
        YAML::Node item(YAML::NodeType::Map);
        item["domain"] = binding.domain.toStdString();
        item["clock"]  = binding.clock.toStdString();
        item["reset"]  = binding.withReset;
        domainNode.push_back(item);
    }
    node["domain"] = domainNode;

    node["locked"] = lockedExpression.toStdString();

    return node;
}

QString QPllPrimitiveParameters::toYamlString() const
{
    std::stringstream stream;
    stream << toYaml();
    return QString::fromStdString(stream.str());
}
