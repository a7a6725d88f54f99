/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Scripted Pass-through Transport for Tests
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#ifndef QSGPT_MOCKTRANSPORT_H
#define QSGPT_MOCKTRANSPORT_H

#include "passthrough/PassThroughTransport.h"

#include <QByteArray>
#include <QMap>
#include <QQueue>
#include <QString>

namespace qsgpt {
namespace test {

/**
 * @brief What the next submit() reports
 */
struct MockOutcome {
    int submitResult = 0;       ///< 0, -errno, PT_DO_BAD_PARAMS or PT_DO_TIMEOUT
    quint8 status = 0;
    int hostStatus = 0;
    int driverStatus = 0;
    int resid = 0;
    int durationMs = 1;
    QByteArray sense;           ///< Copied into the caller's sense buffer
    QByteArray dataIn;          ///< Copied into the caller's data-in buffer
    QString transportText;
};

/**
 * @brief Everything the command was given, for assertions
 */
struct MockRecord {
    int submitCount = 0;
    int lastFd = -1;
    int lastTimeout = -1;
    bool lastVerbose = false;
    QByteArray cdb;
    QByteArray dataOut;
    int dataInLength = 0;
    int senseMax = 0;
    int packetId = -1;
    quint64 tag = 0;
    int taskManagement = -1;
    QMap<int, int> taskAttributes;
    int flags = 0;
    bool directIo = false;
    int clearCount = 0;
};

class MockTransport : public PassThroughTransport
{
public:
    static PtFeatures allFeatures();

    explicit MockTransport(PtFeatures features = allFeatures());

    QString name() const override { return QStringLiteral("mock"); }
    QString version() const override { return QStringLiteral("1.0 20260301"); }
    bool isAvailable() const override { return available; }
    int maxCdbLength() const override { return 16; }
    int dmaAlignment() const override { return 512; }

    int openDevice(const QString& deviceName, int flags, bool verbose) override;
    int closeDevice(int fd) override;
    std::unique_ptr<NativeCommand> constructCommand() override;

    /**
     * @brief Queue the outcome of the next submission (GOOD when empty)
     */
    void script(const MockOutcome& outcome) { m_outcomes.enqueue(outcome); }
    MockOutcome nextOutcome();

    // Scripted device behaviour
    bool available = true;
    bool failConstruct = false;
    int openResult = 3;         ///< fd or -errno
    int closeResult = 0;

    // Recorded calls
    QString openedName;
    int openedFlags = 0;
    int openCount = 0;
    int closeCount = 0;
    int closedFd = -1;
    MockRecord record;

private:
    QQueue<MockOutcome> m_outcomes;
};

} // namespace test
} // namespace qsgpt

#endif // QSGPT_MOCKTRANSPORT_H
