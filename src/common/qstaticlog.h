// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QSTATICLOG_H
#define QSTATICLOG_H

#include <QMetaEnum>
#include <QObject>
#include <QString>

/**
 * @brief The QStaticLog class.
 * @details This class provides levelled logging on top of the Qt message
 *          system. Messages below the current level are dropped, the others
 *          are forwarded to qCritical, qWarning, qInfo or qDebug so that a
 *          test or an application can still capture them with
 *          qInstallMessageHandler.
 */
class QStaticLog
{
    Q_GADGET

public:
    /**
     * @brief Log level, ordered from quietest to most verbose
     */
    enum class Level {
        Silent  = 0, /**< Nothing is printed */
        Error   = 1, /**< Errors only */
        Warning = 2, /**< Errors and warnings */
        Info    = 3, /**< Normal progress messages */
        Debug   = 4, /**< Debug messages */
        Verbose = 5  /**< Everything, including dumps */
    };
    Q_ENUM(Level)

    QStaticLog() = delete;

    /**
     * @brief Set the current log level.
     * @param level New log level.
     */
    static void setLevel(Level level);

    /**
     * @brief Get the current log level.
     * @return Current log level, Info by default.
     */
    static Level getLevel();

    /**
     * @brief Parse a level name or number.
     * @details Accepts the Level key names in any case (silent, error,
     *          warning, info, debug, verbose) or the numeric values 0 to 5.
     * @param text Level text.
     * @param ok Set to false when the text is not a level, may be null.
     * @return Parsed level, or Info when the text is not a level.
     */
    static Level levelFromString(const QString &text, bool *ok = nullptr);

    /**
     * @brief Set the level from the QPLL_LOG_LEVEL environment variable.
     * @details Leaves the level untouched when the variable is unset or invalid.
     * @return true if the level was changed.
     */
    static bool setLevelFromEnvironment();

    /**
     * @brief Install a message handler that writes errors and warnings to
     *        stderr and other messages to stdout.
     */
    static void installMessageHandler();

    /**
     * @brief Restore the message handler active before installMessageHandler.
     */
    static void restoreMessageHandler();

    static void logE(const QString &func, const QString &message);
    static void logW(const QString &func, const QString &message);
    static void logI(const QString &func, const QString &message);
    static void logD(const QString &func, const QString &message);
    static void logV(const QString &func, const QString &message);

private:
    static void messageHandler(
        QtMsgType type, const QMessageLogContext &context, const QString &message);

    /* Prefix the message with the function name at debug level and above */
    static QString decorate(const QString &func, const QString &message);

    static Level            currentLevel;
    static QtMessageHandler previousHandler;
};

#endif // QSTATICLOG_H
