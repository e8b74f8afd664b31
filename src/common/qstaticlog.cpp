// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "common/qstaticlog.h"

#include <QDebug>
#include <QProcessEnvironment>

#include <cstdio>

QStaticLog::Level QStaticLog::currentLevel    = QStaticLog::Level::Info;
QtMessageHandler  QStaticLog::previousHandler = nullptr;

void QStaticLog::setLevel(Level level)
{
    currentLevel = level;
}

QStaticLog::Level QStaticLog::getLevel()
{
    return currentLevel;
}

QStaticLog::Level QStaticLog::levelFromString(const QString &text, bool *ok)
{
    const QMetaEnum metaEnum = QMetaEnum::fromType<Level>();
    const QString   key      = text.trimmed().toLower();

    if (ok) {
        *ok = true;
    }

    /* Key names, matched case-insensitively */
    for (int index = 0; index < metaEnum.keyCount(); ++index) {
        if (key == QString::fromLatin1(metaEnum.key(index)).toLower()) {
            return static_cast<Level>(metaEnum.value(index));
        }
    }

    /* Numeric form */
    bool      isNumber = false;
    const int value    = key.toInt(&isNumber);
    if (isNumber && metaEnum.valueToKey(value) != nullptr) {
        return static_cast<Level>(value);
    }

    if (ok) {
        *ok = false;
    }
    return Level::Info;
}

bool QStaticLog::setLevelFromEnvironment()
{
    const QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    if (!env.contains("QPLL_LOG_LEVEL")) {
        return false;
    }

    bool        ok    = false;
    const Level level = levelFromString(env.value("QPLL_LOG_LEVEL"), &ok);
    if (!ok) {
        qWarning() << "Ignoring invalid QPLL_LOG_LEVEL:" << env.value("QPLL_LOG_LEVEL");
        return false;
    }

    setLevel(level);
    return true;
}

void QStaticLog::installMessageHandler()
{
    previousHandler = qInstallMessageHandler(messageHandler);
}

void QStaticLog::restoreMessageHandler()
{
    qInstallMessageHandler(previousHandler);
    previousHandler = nullptr;
}

void QStaticLog::messageHandler(
    QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    Q_UNUSED(context);

    const QByteArray localMsg = message.toLocal8Bit();
    switch (type) {
    case QtWarningMsg:
    case QtCriticalMsg:
    case QtFatalMsg:
        fprintf(stderr, "%s\n", localMsg.constData());
        fflush(stderr);
        break;
    case QtDebugMsg:
    case QtInfoMsg:
    default:
        fprintf(stdout, "%s\n", localMsg.constData());
        fflush(stdout);
        break;
    }
}

QString QStaticLog::decorate(const QString &func, const QString &message)
{
    if (currentLevel >= Level::Debug && !func.isEmpty()) {
        return QString("[%1] %2").arg(func, message);
    }
    return message;
}

void QStaticLog::logE(const QString &func, const QString &message)
{
    if (currentLevel >= Level::Error) {
        qCritical().noquote() << decorate(func, message);
    }
}

void QStaticLog::logW(const QString &func, const QString &message)
{
    if (currentLevel >= Level::Warning) {
        qWarning().noquote() << decorate(func, message);
    }
}

void QStaticLog::logI(const QString &func, const QString &message)
{
    if (currentLevel >= Level::Info) {
        qInfo().noquote() << decorate(func, message);
    }
}

void QStaticLog::logD(const QString &func, const QString &message)
{
    if (currentLevel >= Level::Debug) {
        qDebug().noquote() << decorate(func, message);
    }
}

void QStaticLog::logV(const QString &func, const QString &message)
{
    if (currentLevel >= Level::Verbose) {
        qDebug().noquote() << decorate(func, message);
    }
}
