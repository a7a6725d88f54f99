/*
 * QSgPt - Qt-based SCSI pass-through toolkit
 * qsgpt - Command-line pass-through tool
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include <QSettings>
#include <QTextStream>

#include "buffer/AlignedBuffer.h"
#include "buffer/ScratchPool.h"
#include "device/DeviceHandle.h"
#include "passthrough/PassThroughObject.h"
#include "passthrough/PassThroughTransport.h"
#include "sense/SenseFormatter.h"
#include "util/HexFormatter.h"
#include "util/Logger.h"
#include "util/PtSettings.h"
#include "util/ScsiNames.h"

using namespace qsgpt;

namespace {

constexpr int EXIT_SYNTAX_ERROR = 1;
constexpr int EXIT_FILE_ERROR = 2;

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

void printFeatures(const PassThroughTransport &transport)
{
    static const struct {
        PtFeature feature;
        const char *name;
    } featureNames[] = {
        {FeaturePacketId, "packet id"},
        {FeatureTag, "tag"},
        {FeatureTaskManagement, "task management"},
        {FeatureTaskAttribute, "task attribute"},
        {FeatureQueueFlags, "queue flags"},
        {FeatureDirectIo, "direct io"},
        {FeatureDuration, "duration"},
        {FeatureTransportErrorString, "transport error string"},
    };

    out() << "Transport: " << transport.name() << " " << transport.version()
          << (transport.isAvailable() ? "" : " (unavailable)") << "\n";
    out() << "  max cdb length: " << transport.maxCdbLength()
          << ", dma alignment: " << transport.dmaAlignment() << "\n";
    for (const auto &entry : featureNames) {
        out() << "  " << QString::fromLatin1(entry.name).leftJustified(24)
              << (transport.supports(entry.feature) ? "yes" : "no") << "\n";
    }
    out().flush();
}

bool parsePositive(const QString &text, int minimum, int *value)
{
    bool ok = false;
    const int v = text.toInt(&ok, 0);
    if (!ok || v < minimum) {
        return false;
    }
    *value = v;
    return true;
}

void printResult(const PassThroughObject &pt, const QByteArray &cdb,
                 const quint8 *dataIn, int dataInLength,
                 bool hexData, bool rawSense)
{
    out() << ScsiNames::commandName(cdb) << ":\n";

    if (pt.osError() != 0) {
        out() << "  OS error: " << pt.osErrorString() << "\n";
    }
    if (pt.resultCategory() == PtResultCategory::TransportError) {
        const QString text = pt.transportErrorString();
        out() << "  Transport error: 0x" << QString::number(pt.transportError(), 16)
              << (text.isEmpty() ? QString() : QStringLiteral(" (%1)").arg(text)) << "\n";
    }

    const std::optional<quint8> status = pt.statusResponse();
    if (status) {
        out() << "  Status: " << ScsiNames::statusName(*status)
              << " [0x" << QString::number(*status, 16).rightJustified(2, QLatin1Char('0'))
              << "]\n";
    }
    out() << "  Residual: " << pt.resid() << "\n";

    const std::optional<int> duration = pt.durationMs();
    if (duration) {
        out() << "  Duration: " << *duration << " ms\n";
    }

    if (pt.senseLength() > 0) {
        out() << SenseFormatter::describe(pt.senseData(), QStringLiteral("  "), rawSense);
    }

    if (hexData && dataIn && dataInLength > 0) {
        const int received = qBound(0, dataInLength - pt.resid(), dataInLength);
        out() << "  Data in (" << received << " bytes):\n";
        out() << HexFormatter::dump(dataIn, received, HexFormat::WithAscii, QStringLiteral("   "));
    }

    const SenseCategory category = pt.errorCategory();
    out() << "  Category: " << ScsiNames::categoryName(category)
          << " [" << static_cast<int>(category) << "]\n";
    out().flush();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application info
    app.setApplicationName(QStringLiteral("qsgpt"));
    app.setApplicationVersion(versionString());
    app.setOrganizationName(QStringLiteral("JeffreyZHU"));
    app.setOrganizationDomain(QStringLiteral("github.com/Gypsop"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Send one SCSI command to a device through the pass-through interface."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption cdbOption(QStringLiteral("cdb"),
        QStringLiteral("Command descriptor block as hex bytes."), QStringLiteral("hex"));
    const QCommandLineOption inOption(QStringLiteral("in"),
        QStringLiteral("Read <len> bytes from the device."), QStringLiteral("len"));
    const QCommandLineOption outOption(QStringLiteral("out"),
        QStringLiteral("Send the given hex bytes to the device."), QStringLiteral("hex"));
    const QCommandLineOption timeoutOption(QStringLiteral("timeout"),
        QStringLiteral("Command timeout in seconds."), QStringLiteral("s"));
    const QCommandLineOption readOnlyOption(QStringLiteral("readonly"),
        QStringLiteral("Open the device read-only."));
    const QCommandLineOption repeatOption(QStringLiteral("repeat"),
        QStringLiteral("Execute the command <n> times."), QStringLiteral("n"), QStringLiteral("1"));
    const QCommandLineOption hexOption(QStringLiteral("hex"),
        QStringLiteral("Hex dump the data read from the device."));
    const QCommandLineOption rawSenseOption(QStringLiteral("raw-sense"),
        QStringLiteral("Append the raw sense bytes to the decoded sense."));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"),
        QStringLiteral("Log CDB and sense of every submission."));
    const QCommandLineOption settingsOption(QStringLiteral("settings"),
        QStringLiteral("Read options from an INI file."), QStringLiteral("ini"));
    const QCommandLineOption logFileOption(QStringLiteral("log-file"),
        QStringLiteral("Append log output to <path>."), QStringLiteral("path"));
    const QCommandLineOption logLevelOption(QStringLiteral("log-level"),
        QStringLiteral("TRACE, DEBUG, INFO, WARN, ERROR or FATAL."), QStringLiteral("level"));
    const QCommandLineOption featuresOption(QStringLiteral("features"),
        QStringLiteral("Print the pass-through transport capabilities."));

    parser.addOptions({cdbOption, inOption, outOption, timeoutOption, readOnlyOption,
                       repeatOption, hexOption, rawSenseOption, verboseOption,
                       settingsOption, logFileOption, logLevelOption, featuresOption});
    parser.addPositionalArgument(QStringLiteral("device"),
                                 QStringLiteral("Device node, e.g. /dev/sg0."));

    if (!parser.parse(app.arguments())) {
        err() << parser.errorText() << "\n";
        return EXIT_SYNTAX_ERROR;
    }
    if (parser.isSet(QStringLiteral("help"))) {
        parser.showHelp(0);
    }
    if (parser.isSet(QStringLiteral("version"))) {
        parser.showVersion();
    }

    // Settings, then command-line overrides
    PtSettings settings;
    if (parser.isSet(settingsOption)) {
        if (!QFileInfo::exists(parser.value(settingsOption))) {
            err() << "Settings file " << parser.value(settingsOption) << " does not exist\n";
            return EXIT_FILE_ERROR;
        }
        QSettings ini(parser.value(settingsOption), QSettings::IniFormat);
        if (ini.status() != QSettings::NoError) {
            err() << "Cannot read settings file " << parser.value(settingsOption) << "\n";
            return EXIT_FILE_ERROR;
        }
        settings.load(ini);
    }
    if (parser.isSet(logLevelOption)) {
        settings.logLevel = Logger::stringToLevel(parser.value(logLevelOption));
    }
    if (parser.isSet(logFileOption)) {
        settings.logPath = parser.value(logFileOption);
    }
    if (parser.isSet(verboseOption)) {
        settings.verbose = true;
    }
    if (!settings.applyLogging()) {
        err() << "Cannot open log file " << settings.logPath << "\n";
    }
    if (settings.verbose) {
        Logger::instance().setCategoryLevel(QString::fromLatin1(LogCategory::Transport), LogLevel::Debug);
        Logger::instance().setCategoryLevel(QString::fromLatin1(LogCategory::PassThrough), LogLevel::Debug);
    }

    PassThroughTransport &transport = PassThroughTransport::defaultTransport();

    const QStringList positional = parser.positionalArguments();
    if (parser.isSet(featuresOption)) {
        printFeatures(transport);
        if (positional.isEmpty()) {
            return 0;
        }
    }

    // Validate arguments
    if (positional.size() != 1) {
        err() << "Exactly one device must be given\n";
        return EXIT_SYNTAX_ERROR;
    }
    if (!parser.isSet(cdbOption)) {
        err() << "--cdb is required\n";
        return EXIT_SYNTAX_ERROR;
    }

    bool ok = false;
    const QByteArray cdb = HexFormatter::parseHex(parser.value(cdbOption), &ok);
    if (!ok || cdb.isEmpty()) {
        err() << "Bad --cdb value: " << parser.value(cdbOption) << "\n";
        return EXIT_SYNTAX_ERROR;
    }
    if (cdb.size() > transport.maxCdbLength()) {
        err() << "CDB of " << cdb.size() << " bytes exceeds the transport maximum of "
              << transport.maxCdbLength() << "\n";
        return EXIT_SYNTAX_ERROR;
    }

    int dataInLength = 0;
    if (parser.isSet(inOption) && !parsePositive(parser.value(inOption), 0, &dataInLength)) {
        err() << "Bad --in value: " << parser.value(inOption) << "\n";
        return EXIT_SYNTAX_ERROR;
    }

    QByteArray dataOut;
    if (parser.isSet(outOption)) {
        dataOut = HexFormatter::parseHex(parser.value(outOption), &ok);
        if (!ok) {
            err() << "Bad --out value: " << parser.value(outOption) << "\n";
            return EXIT_SYNTAX_ERROR;
        }
    }
    if (dataInLength > 0 && !dataOut.isEmpty()) {
        err() << "--in and --out cannot be combined\n";
        return EXIT_SYNTAX_ERROR;
    }

    int timeout = settings.defaultTimeout;
    if (parser.isSet(timeoutOption) && !parsePositive(parser.value(timeoutOption), 0, &timeout)) {
        err() << "Bad --timeout value: " << parser.value(timeoutOption) << "\n";
        return EXIT_SYNTAX_ERROR;
    }

    int repeat = 1;
    if (!parsePositive(parser.value(repeatOption), 1, &repeat)) {
        err() << "Bad --repeat value: " << parser.value(repeatOption) << "\n";
        return EXIT_SYNTAX_ERROR;
    }

    // Open device
    DeviceHandle device(transport);
    PtStatus status = device.open(positional.first(), parser.isSet(readOnlyOption),
                                  settings.verbose);
    if (!status.ok()) {
        err() << status.toString() << "\n";
        return EXIT_FILE_ERROR;
    }

    // Buffers
    const int alignment = settings.alignment > 0 ? settings.alignment : transport.dmaAlignment();
    ScratchPool::local().setInitialSize(settings.scratchInitialSize);
    ScratchLease dataIn = ScratchPool::local().acquire(dataInLength, alignment);
    AlignedBuffer outBuffer(dataOut, -1, alignment);
    AlignedBuffer sense(settings.senseLength);
    if (!dataIn.status().ok() || outBuffer.isNull() || sense.isNull()) {
        err() << "Cannot allocate command buffers\n";
        return static_cast<int>(SenseCategory::Other);
    }

    PassThroughObject pt(transport);
    if (!pt.constructStatus().ok()) {
        err() << pt.constructStatus().toString() << "\n";
        return static_cast<int>(SenseCategory::Other);
    }

    const PtStatus setupStatus[] = {
        pt.setCdb(reinterpret_cast<const quint8 *>(cdb.constData()), cdb.size()),
        pt.setSense(sense),
        dataInLength > 0 ? pt.setDataIn(dataIn.buffer()) : PtStatus::success(),
        !dataOut.isEmpty() ? pt.setDataOut(outBuffer) : PtStatus::success(),
    };
    for (const PtStatus &s : setupStatus) {
        if (!s.ok()) {
            err() << s.toString() << "\n";
            return static_cast<int>(SenseCategory::Other);
        }
    }

    // Execute
    SenseCategory category = SenseCategory::Clean;
    for (int i = 0; i < repeat; ++i) {
        if (i > 0) {
            status = pt.clear();
            if (!status.ok()) {
                err() << status.toString() << "\n";
                category = SenseCategory::Other;
                break;
            }
            sense.fill(0);
        }

        status = pt.execute(device, timeout, settings.verbose);
        if (!status.ok() && pt.state() != PtState::Executed) {
            err() << status.toString() << "\n";
            category = SenseCategory::Other;
            break;
        }

        printResult(pt, cdb, dataInLength > 0 ? dataIn.data() : nullptr, dataInLength,
                    parser.isSet(hexOption), parser.isSet(rawSenseOption));
        category = pt.errorCategory();
        if (category != SenseCategory::Clean && category != SenseCategory::Recovered) {
            break;
        }
    }

    status = device.close();
    if (!status.ok()) {
        QSGPT_WARNING(LogCategory::Device, status.toString());
    }

    Logger::instance().shutdown();
    return static_cast<int>(category);
}
