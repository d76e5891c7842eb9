/* Replay a JSON pump event stream through the event simulator
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <cstdio>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QSettings>

#include "logger.h"
#include "PumpLib/appsettings.h"
#include "PumpLib/eventreader.h"
#include "PumpLib/eventsimulator.h"
#include "PumpLib/pumperrors.h"

static void usage(const QString & name)
{
    qDebug().noquote() << "Usage:" << name << "[--drop-trailing-basal] [-o OUT] FILE";
    qDebug().noquote() << "  Writes the simulated upload log as JSON to OUT, or to stdout";
}

static bool writeOutput(const QString & outName, const QByteArray & json)
{
    QFile out;
    bool opened;
    if (outName.isEmpty()) {
        opened = out.open(stdout, QFile::WriteOnly);
    } else {
        out.setFileName(outName);
        opened = out.open(QFile::WriteOnly | QFile::Truncate);
    }
    if (!opened) {
        qCritical().noquote() << "Couldn't open" << (outName.isEmpty() ? QString("stdout") : outName) << ":" << out.errorString();
        return false;
    }
    if (out.write(json) != json.size()) {
        qCritical().noquote() << "Couldn't write" << out.fileName() << ":" << out.errorString();
        return false;
    }
    out.flush();
    return true;
}

int main(int argc, char *argv[]) {

    QCoreApplication a(argc, argv);
    QCoreApplication::setOrganizationName("InfuseLog");
    QCoreApplication::setApplicationName("simulateEvents");
    QStringList args = a.arguments();

    if (args.size() < 2) {
        usage(args[0]);
        exit(1);
    }

    QString filename = args[args.size()-1];
    QString outName;
    bool dropTrailing = false;

    for (int i = 1; i < args.size()-1; i++) {
        if (args[i] == "--drop-trailing-basal")
            dropTrailing = true;
        else if (args[i] == "-o" && i+1 < args.size()-1)
            outName = args[++i];
        else {
            qWarning().noquote() << "Unknown option" << args[i];
            usage(args[0]);
            exit(1);
        }
    }

    initializeLogger();

    QSettings store;
    AppSettings settings(store);
    if (logger->logToFile(settings.logDirectory(), settings.logMaxPrevious())) {
        qDebug().noquote() << "Trailing basal policy:" << AppSettings::policyName(settings.trailingBasalPolicy());
    }

    SimulatorConfig config = settings.simulatorConfig();
    if (dropTrailing) {
        config.trailingBasal = TBP_Drop;
    }

    int ret = 0;
    try {
        QList<PumpEventPtr> input = EventReader::readFile(filename);

        EventSimulator sim(config);
        for (const PumpEventPtr & event : input) {
            sim.simulate(*event);
        }
        sim.finalBasal();

        QList<PumpEventPtr> events = sim.getEvents();
        qDebug() << "Simulated" << input.size() << "input events into" << events.size() << "upload records";

        QJsonDocument doc(EventReader::toJsonArray(events));
        if (!writeOutput(outName, doc.toJson(QJsonDocument::Indented))) {
            ret = 2;
        }
    } catch (const OrderingViolation & e) {
        qCritical().noquote() << "Input is not in time order, aborting:" << e.message();
        ret = 3;
    } catch (const PumpLibError & e) {
        qCritical().noquote() << e.message();
        ret = 3;
    }

    shutdownLogger();
    return ret;
}
