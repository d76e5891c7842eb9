/* Dump fixed-layout binary records from a pump memory image
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QSettings>

#include "logger.h"
#include "PumpLib/appsettings.h"
#include "PumpLib/pumperrors.h"
#include "PumpLib/structcodec.h"

static void usage(const QString & name)
{
    qDebug().noquote() << "Usage:" << name << "[-o offset] [-n count] -f FORMAT -k name1,name2,... FILE";
    qDebug().noquote() << "  FORMAT is a string of width codes: b = 1 byte, s = 2 bytes, I = 4 bytes (little-endian, unsigned)";
}

static void dumpRecord(int index, int offset, const StructRecord & rec)
{
    QStringList fields;
    for (const QString & name : rec.names()) {
        fields.append(QString("%1=%2").arg(name).arg(rec[name]));
    }
    qDebug().noquote() << QString("Record %1 @ 0x%2:").arg(index).arg(offset, 6, 16, QChar('0')) << fields.join(" ");
}

int main(int argc, char *argv[]) {

    QCoreApplication a(argc, argv);
    QCoreApplication::setOrganizationName("InfuseLog");
    QCoreApplication::setApplicationName("dumpRecords");
    QStringList args = a.arguments();

    if (args.size() < 2) {
        usage(args[0]);
        exit(1);
    }

    QString filename = args[args.size()-1];
    QString format;
    QStringList names;
    int offset = 0, count = -1;

    for (int i = 1; i < args.size()-1; i++) {
        if (args[i] == "-o" && i+1 < args.size()-1)
            offset = args[++i].toInt(nullptr, 0);
        else if (args[i] == "-n" && i+1 < args.size()-1)
            count = args[++i].toInt();
        else if (args[i] == "-f" && i+1 < args.size()-1)
            format = args[++i];
        else if (args[i] == "-k" && i+1 < args.size()-1)
            names = args[++i].split(",");
        else {
            qWarning().noquote() << "Unknown option" << args[i];
            usage(args[0]);
            exit(1);
        }
    }
    if (format.isEmpty()) {
        usage(args[0]);
        exit(1);
    }

    initializeLogger();

    QSettings store;
    AppSettings settings(store);
    if (!logger->logToFile(settings.logDirectory(), settings.logMaxPrevious())) {
        qWarning() << "Continuing with output to stderr only";
    }

    QFile file(filename);
    if (!file.open(QFile::ReadOnly)) {
        qCritical().noquote() << "Couldn't open" << filename << ":" << file.errorString();
        shutdownLogger();
        exit(2);
    }
    QByteArray data = file.readAll();
    file.close();

    int ret = 0;
    try {
        StructDescriptor desc(format, names);
        qDebug().noquote() << filename << "is" << data.size() << "bytes," << desc.length() << "bytes per record";

        int rec = 0;
        while ((count < 0 || rec < count) && offset + desc.length() <= data.size()) {
            StructRecord record = desc.decode(data, offset);
            dumpRecord(rec++, offset, record);
            offset += record.unpackLength();
        }
        if (count > 0 && rec < count) {
            qWarning() << "Only" << rec << "of" << count << "records fit in the file";
        }
    } catch (const StructCodecError & e) {
        qCritical().noquote() << e.message();
        ret = 3;
    }

    shutdownLogger();
    return ret;
}
