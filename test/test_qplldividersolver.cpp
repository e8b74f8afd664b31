// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "common/qplldividersolver.h"
#include "common/qpllrangetable.h"
#include "common/qstaticlog.h"
#include "qpll_test.h"

#include <QStringList>
#include <QtCore>
#include <QtTest>

#include <cmath>

class Test : public QObject
{
    Q_OBJECT

private:
    static QStringList messageList;

    static void messageOutput(QtMsgType type, const QMessageLogContext &context, const QString &msg)
    {
        Q_UNUSED(type);
        Q_UNUSED(context);
        messageList << msg;
    }

    static QPllOutputRequest makeOutput(
        int slot, double freq, double margin = 1e-2, bool usesDynamicPhase = true)
    {
        QPllOutputRequest request;
        request.slot             = slot;
        request.domain           = QString("cd%1").arg(slot);
        request.freq             = freq;
        request.margin           = margin;
        request.usesDynamicPhase = usesDynamicPhase;
        return request;
    }

    /* 100, 100, 50 and 25 MHz: all four slots used, no phantom possible */
    static QPllOutputRequestList fourOutputs()
    {
        return {
            makeOutput(0, 100e6), makeOutput(1, 100e6), makeOutput(2, 50e6), makeOutput(3, 25e6)};
    }

    static bool verifyConfiguration(
        double                                  inputFreq,
        const QPllOutputRequestList            &outputs,
        const QPllDividerSolver::Configuration &config)
    {
        if (!QPllRangeTable::CLKI_DIV.contains(config.clkiDiv)
            || !QPllRangeTable::CLKFB_DIV.contains(config.clkfbDiv)
            || !QPllRangeTable::CLKO_DIV.contains(config.clkofbDiv)) {
            qWarning() << "Divider out of range";
            return false;
        }
        if (!QPllRangeTable::PFD_FREQ.contains(inputFreq / config.clkiDiv)) {
            qWarning() << "PFD out of range";
            return false;
        }
        if (!QPllRangeTable::VCO_FREQ.contains(config.vco)) {
            qWarning() << "VCO out of range";
            return false;
        }
        if (config.outputs.size() < outputs.size()) {
            qWarning() << "Missing resolved outputs";
            return false;
        }
        for (int slot = 0; slot < outputs.size(); ++slot) {
            const QPllOutputRequest                &request  = outputs.at(slot);
            const QPllDividerSolver::OutputDivider &resolved = config.outputs.at(slot);
            if (!QPllRangeTable::CLKO_DIV.contains(resolved.div)) {
                qWarning() << "Output divider out of range for slot" << slot;
                return false;
            }
            if (std::abs(resolved.freq - request.freq) > request.freq * request.margin) {
                qWarning() << "Output outside margin for slot" << slot;
                return false;
            }
        }
        if (config.feedbackSlot < 0 || config.feedbackSlot >= config.outputs.size()) {
            qWarning() << "No feedback source";
            return false;
        }
        return true;
    }

private slots:
    void initTestCase()
    {
        qInstallMessageHandler(messageOutput);
        QStaticLog::setLevel(QStaticLog::Level::Info);
    }

    void cleanupTestCase() { qInstallMessageHandler(nullptr); }

    void singleOutputUsesPhantomFeedback()
    {
        const QPllOutputRequestList      outputs = {makeOutput(0, 100e6)};
        QPllDividerSolver::Configuration config;

        QVERIFY(QPllDividerSolver::solve(25e6, outputs, false, config));
        QCOMPARE(config.clkiDiv, 1);
        QCOMPARE(config.clkofbDiv, 1);
        QCOMPARE(config.clkfbDiv, 16);
        QCOMPARE(config.vco, 400e6);
        QCOMPARE(config.outputs.size(), 2);
        QCOMPARE(config.outputs.at(0).div, 4);
        QCOMPARE(config.outputs.at(0).freq, 100e6);
        QVERIFY(!config.outputs.at(0).phantom);
        QCOMPARE(config.feedbackSlot, 1);
        QVERIFY(config.feedbackPhantom);
        QVERIFY(config.outputs.at(1).phantom);
        QCOMPARE(config.outputs.at(1).div, 1);
        QCOMPARE(config.outputs.at(1).freq, 0.0);
        QVERIFY(verifyConfiguration(25e6, outputs, config));
    }

    void outputCarriesFeedbackWhenDividerMatches()
    {
        const QPllOutputRequestList      outputs = {makeOutput(0, 400e6)};
        QPllDividerSolver::Configuration config;

        QVERIFY(QPllDividerSolver::solve(25e6, outputs, false, config));
        QCOMPARE(config.clkofbDiv, 1);
        QCOMPARE(config.clkfbDiv, 16);
        QCOMPARE(config.outputs.size(), 1);
        QCOMPARE(config.outputs.at(0).div, 1);
        QCOMPARE(config.feedbackSlot, 0);
        QVERIFY(!config.feedbackPhantom);
    }

    void dynamicPhaseOutputCannotCarryFeedback()
    {
        const QPllOutputRequestList      outputs = {makeOutput(0, 400e6)};
        QPllDividerSolver::Configuration config;

        QVERIFY(QPllDividerSolver::solve(25e6, outputs, true, config));
        QCOMPARE(config.outputs.size(), 2);
        QCOMPARE(config.feedbackSlot, 1);
        QVERIFY(config.feedbackPhantom);
        QCOMPARE(config.outputs.at(1).div, 1);
    }

    void dynamicPhaseIneligibleOutputCarriesFeedback()
    {
        const QPllOutputRequestList      outputs = {makeOutput(0, 400e6, 1e-2, false)};
        QPllDividerSolver::Configuration config;

        QVERIFY(QPllDividerSolver::solve(25e6, outputs, true, config));
        QCOMPARE(config.outputs.size(), 1);
        QCOMPARE(config.feedbackSlot, 0);
        QVERIFY(!config.feedbackPhantom);
    }

    void fullSlotsNeedMatchingFeedbackOutput()
    {
        const QPllOutputRequestList      outputs = fourOutputs();
        QPllDividerSolver::Configuration config;

        QVERIFY(QPllDividerSolver::solve(25e6, outputs, false, config));
        QCOMPARE(config.clkiDiv, 1);
        QCOMPARE(config.clkofbDiv, 4);
        QCOMPARE(config.clkfbDiv, 4);
        QCOMPARE(config.vco, 400e6);
        QCOMPARE(config.outputs.size(), 4);
        QCOMPARE(config.outputs.at(0).div, 4);
        QCOMPARE(config.outputs.at(1).div, 4);
        QCOMPARE(config.outputs.at(2).div, 8);
        QCOMPARE(config.outputs.at(3).div, 16);
        /* Slots 0 and 1 both match, the lower slot wins */
        QCOMPARE(config.feedbackSlot, 0);
        QVERIFY(!config.feedbackPhantom);
        QVERIFY(verifyConfiguration(25e6, outputs, config));
    }

    void feedbackSkipsDynamicPhaseOutputs()
    {
        QPllOutputRequestList outputs = fourOutputs();
        outputs[1].usesDynamicPhase   = false;
        QPllDividerSolver::Configuration config;

        QVERIFY(QPllDividerSolver::solve(25e6, outputs, true, config));
        QCOMPARE(config.clkofbDiv, 4);
        QCOMPARE(config.feedbackSlot, 1);
        QVERIFY(!config.feedbackPhantom);
    }

    void fullSlotsWithoutFeedbackFail()
    {
        /* Every output uses dynamic phase and no slot is free for a phantom */
        const QPllOutputRequestList      outputs = fourOutputs();
        QPllDividerSolver::Configuration config;

        QVERIFY(!QPllDividerSolver::solve(25e6, outputs, true, config));
    }

    void unreachableToleranceFails()
    {
        const QPllOutputRequestList      outputs = {makeOutput(0, 1e6, 1e-5)};
        QPllDividerSolver::Configuration config;

        QVERIFY(!QPllDividerSolver::solve(25e6, outputs, false, config));
    }

    void inputBelowPfdRangeFails()
    {
        /* 8 MHz is a valid input but no input divider reaches the 10 MHz PFD minimum */
        const QPllOutputRequestList      outputs = {makeOutput(0, 100e6)};
        QPllDividerSolver::Configuration config;

        QVERIFY(!QPllDividerSolver::solve(8e6, outputs, false, config));
    }

    void solutionsRespectRanges_data()
    {
        QTest::addColumn<double>("inputFreq");
        QTest::addColumn<QList<double>>("freqs");

        QTest::newRow("25MHz to 100MHz") << 25e6 << QList<double>{100e6};
        QTest::newRow("12MHz to 48MHz and 60MHz") << 12e6 << QList<double>{48e6, 60e6};
        QTest::newRow("100MHz to three outputs") << 100e6 << QList<double>{125e6, 50e6, 25e6};
        QTest::newRow("25MHz to four outputs") << 25e6 << QList<double>{100e6, 100e6, 50e6, 25e6};
        QTest::newRow("50MHz to 400MHz") << 50e6 << QList<double>{400e6};
    }

    void solutionsRespectRanges()
    {
        QFETCH(double, inputFreq);
        QFETCH(QList<double>, freqs);

        QPllOutputRequestList outputs;
        for (int slot = 0; slot < freqs.size(); ++slot) {
            outputs.append(makeOutput(slot, freqs.at(slot)));
        }

        QPllDividerSolver::Configuration config;
        QVERIFY(QPllDividerSolver::solve(inputFreq, outputs, false, config));
        QVERIFY(verifyConfiguration(inputFreq, outputs, config));
    }

    void solveIsDeterministic()
    {
        const QPllOutputRequestList      outputs = {makeOutput(0, 48e6), makeOutput(1, 60e6)};
        QPllDividerSolver::Configuration first;
        QPllDividerSolver::Configuration second;

        QVERIFY(QPllDividerSolver::solve(12e6, outputs, false, first));
        QVERIFY(QPllDividerSolver::solve(12e6, outputs, false, second));
        QCOMPARE(first.clkiDiv, second.clkiDiv);
        QCOMPARE(first.clkfbDiv, second.clkfbDiv);
        QCOMPARE(first.clkofbDiv, second.clkofbDiv);
        QCOMPARE(first.vco, second.vco);
        QCOMPARE(first.feedbackSlot, second.feedbackSlot);
        QCOMPARE(first.outputs.size(), second.outputs.size());
        for (int slot = 0; slot < first.outputs.size(); ++slot) {
            QCOMPARE(first.outputs.at(slot).div, second.outputs.at(slot).div);
            QCOMPARE(first.outputs.at(slot).freq, second.outputs.at(slot).freq);
        }
        QCOMPARE(QPllDividerSolver::describe(first), QPllDividerSolver::describe(second));
    }

    void resolveOutputPrefersSmallestDivider()
    {
        int    div    = 0;
        double actual = 0.0;

        /* Divider 3 gives 133 MHz, inside a 50% margin, so it wins over the exact 4 */
        QVERIFY(QPllDividerSolver::resolveOutputDivider(400e6, 100e6, 0.5, div, actual));
        QCOMPARE(div, 3);
        QVERIFY(std::abs(actual - 400e6 / 3) < 1.0);

        QVERIFY(QPllDividerSolver::resolveOutputDivider(400e6, 100e6, 1e-2, div, actual));
        QCOMPARE(div, 4);
        QCOMPARE(actual, 100e6);
    }

    void resolveOutputFailsOutsideMargin()
    {
        int    div    = 0;
        double actual = 0.0;

        QVERIFY(!QPllDividerSolver::resolveOutputDivider(425e6, 100e6, 1e-2, div, actual));
        QCOMPARE(div, 0);
    }

    void candidateRejectedOutsideVcoRange()
    {
        const QPllOutputRequestList      outputs = {makeOutput(0, 100e6)};
        QPllDividerSolver::Configuration config;

        QVERIFY(
            QPllDividerSolver::tryCandidate(25e6, outputs, false, 1, 1, 15, config)
            == QPllDividerSolver::CandidateStatus::Rejected);
        QVERIFY(
            QPllDividerSolver::tryCandidate(25e6, outputs, false, 1, 1, 33, config)
            == QPllDividerSolver::CandidateStatus::Rejected);
        /* Rejected candidates leave the configuration untouched */
        QCOMPARE(config.clkiDiv, 0);
        QCOMPARE(config.feedbackSlot, -1);
    }

    void candidateRejectedWhenOutputUnresolved()
    {
        const QPllOutputRequestList      outputs = {makeOutput(0, 100e6)};
        QPllDividerSolver::Configuration config;

        /* 425 MHz VCO cannot produce 100 MHz within 1% */
        QVERIFY(
            QPllDividerSolver::tryCandidate(25e6, outputs, false, 1, 1, 17, config)
            == QPllDividerSolver::CandidateStatus::Rejected);
    }

    void candidateRejectedWhenPhantomDividerOutOfRange()
    {
        /* 8 MHz / 8 * 4 * 129 = 516 MHz, the phantom would need divider 129 */
        const QPllOutputRequestList      outputs = {makeOutput(0, 129e6)};
        QPllDividerSolver::Configuration config;

        QVERIFY(
            QPllDividerSolver::tryCandidate(8e6, outputs, false, 8, 129, 4, config)
            == QPllDividerSolver::CandidateStatus::Rejected);
        QCOMPARE(config.feedbackSlot, -1);
        QVERIFY(config.outputs.isEmpty());

        /* One divider lower the phantom fits */
        QVERIFY(
            QPllDividerSolver::tryCandidate(8e6, outputs, false, 8, 128, 4, config)
            == QPllDividerSolver::CandidateStatus::Valid);
        QCOMPARE(config.vco, 512e6);
        QCOMPARE(config.outputs.at(0).div, 4);
        QCOMPARE(config.feedbackSlot, 1);
        QCOMPARE(config.outputs.at(1).div, 128);
    }

    void candidateAcceptedWithPhantom()
    {
        const QPllOutputRequestList      outputs = {makeOutput(0, 100e6)};
        QPllDividerSolver::Configuration config;

        QVERIFY(
            QPllDividerSolver::tryCandidate(25e6, outputs, false, 1, 2, 10, config)
            == QPllDividerSolver::CandidateStatus::Valid);
        QCOMPARE(config.vco, 500e6);
        QCOMPARE(config.outputs.at(0).div, 5);
        QCOMPARE(config.feedbackSlot, 1);
        QCOMPARE(config.outputs.at(1).div, 2);
    }

    void canCarryFeedbackRules()
    {
        QPllOutputRequest eligible = makeOutput(0, 100e6, 1e-2, true);
        QPllOutputRequest fixed    = makeOutput(1, 100e6, 1e-2, false);

        QVERIFY(QPllDividerSolver::canCarryFeedback(eligible, false));
        QVERIFY(!QPllDividerSolver::canCarryFeedback(eligible, true));
        QVERIFY(QPllDividerSolver::canCarryFeedback(fixed, false));
        QVERIFY(QPllDividerSolver::canCarryFeedback(fixed, true));
    }

    void phantomDividerTruncates()
    {
        QCOMPARE(QPllDividerSolver::phantomDivider(400e6, 25e6, 1, 16), 1);
        QCOMPARE(QPllDividerSolver::phantomDivider(500e6, 25e6, 1, 10), 2);
        /* 799.99 / 400 = 1.99997, truncated rather than rounded */
        QCOMPARE(QPllDividerSolver::phantomDivider(799.99e6, 25e6, 1, 16), 1);
    }

    void solveLogsResultAtDebugLevel()
    {
        const QPllOutputRequestList      outputs = {makeOutput(0, 100e6)};
        QPllDividerSolver::Configuration config;

        messageList.clear();
        QStaticLog::setLevel(QStaticLog::Level::Debug);
        QVERIFY(QPllDividerSolver::solve(25e6, outputs, false, config));
        QStaticLog::setLevel(QStaticLog::Level::Info);

        bool found = false;
        for (const QString &msg : messageList) {
            if (msg.contains("Found PLL config") && msg.contains("clki_div=1")
                && msg.contains("clkfb=1 (phantom)")) {
                found = true;
            }
        }
        QVERIFY(found);
    }
};

QStringList Test::messageList;

QPLL_TEST_MAIN(Test)

#include "test_qplldividersolver.moc"
