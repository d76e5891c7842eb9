/* PumpLib Event Reader Implementation
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <cmath>
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QtNumeric>

#include "eventreader.h"
#include "pumperrors.h"

QDateTime EventReader::readDateTime(const QJsonObject & record, const QString & key)
{
    QJsonValue value = record.value(key);
    if (!value.isString()) {
        throw EventFormatError(QString("Record is missing a \"%1\" timestamp").arg(key));
    }
    QDateTime dt = PumpEvent::deviceTime(value.toString());
    if (!dt.isValid()) {
        throw EventFormatError(QString("Invalid \"%1\" timestamp: %2").arg(key).arg(value.toString()));
    }
    return dt;
}

double EventReader::readDouble(const QJsonObject & record, const QString & key, bool required)
{
    QJsonValue value = record.value(key);
    if (value.isDouble()) {
        return value.toDouble();
    }
    if (required || !value.isUndefined()) {
        throw EventFormatError(QString("Field \"%1\" must be a number in %2 record")
                               .arg(key).arg(record.value("type").toString()));
    }
    return 0.0;
}

qint64 EventReader::readDuration(const QJsonObject & record, const QString & key)
{
    double value = readDouble(record, key);
    // 2^63 is exactly representable, INT64_MAX is not.
    if (!qIsFinite(value) || value < 0 || value != std::floor(value) || value >= 9223372036854775808.0) {
        throw EventFormatError(QString("Field \"%1\" must be a whole number of milliseconds in %2 record, got %3")
                               .arg(key).arg(record.value("type").toString()).arg(value));
    }
    return (qint64) value;
}

QString EventReader::readString(const QJsonObject & record, const QString & key)
{
    QJsonValue value = record.value(key);
    if (value.isUndefined() || value.isNull()) {
        return QString();
    }
    if (!value.isString()) {
        throw EventFormatError(QString("Field \"%1\" must be a string in %2 record")
                               .arg(key).arg(record.value("type").toString()));
    }
    return value.toString();
}

BolusEvent EventReader::readBolus(const QJsonObject & record, const QDateTime & defaultTime)
{
    QDateTime time = record.contains("time") ? readDateTime(record, "time") : defaultTime;
    double normal = readDouble(record, "normal");
    if (normal < 0) {
        throw EventFormatError(QString("Bolus at %1 has a negative amount %2").arg(PumpEvent::timeStr(time)).arg(normal));
    }
    BolusEvent bolus(time, normal);
    if (record.contains("expectedNormal") && !record.value("expectedNormal").isNull()) {
        bolus.setExpectedNormal(readDouble(record, "expectedNormal"));
    }
    return bolus;
}

PumpEventPtr EventReader::fromJson(const QJsonObject & record)
{
    QString typeName = record.value("type").toString();
    PumpEventType type;
    if (!PumpEvent::typeFromName(typeName, type)) {
        throw EventFormatError(QString("Unknown event type \"%1\"").arg(typeName));
    }
    QDateTime time = readDateTime(record, "time");

    switch (type) {
    case EV_PUMP_ALARM:
        return PumpEventPtr(new AlarmEvent(time, readString(record, "alarmType")));

    case EV_PUMP_BASAL: {
        BasalEvent* basal = new BasalEvent(time);
        PumpEventPtr out(basal);
        if (record.contains("duration")) {
            basal->setDuration(readDuration(record, "duration"));
        }
        QString schedule = readString(record, "scheduleName");
        if (!schedule.isNull()) {
            basal->setScheduleName(schedule);
        }
        if (record.contains("rate")) {
            basal->setRate(readDouble(record, "rate"));
        }
        return out;
    }

    case EV_PUMP_BOLUS:
        return PumpEventPtr(new BolusEvent(readBolus(record, time)));

    case EV_PUMP_CHANGE_DEVICE_TIME:
        return PumpEventPtr(new ChangeDeviceTimeEvent(time, readString(record, "from"), readString(record, "to")));

    case EV_PUMP_CHANGE_RESERVOIR:
        return PumpEventPtr(new ChangeReservoirEvent(time));

    case EV_PUMP_RESUME:
        return PumpEventPtr(new ResumeEvent(time, readString(record, "reason")));

    case EV_PUMP_SETTINGS:
        return PumpEventPtr(new SettingsEvent(time, readString(record, "activeSchedule")));

    case EV_PUMP_SMBG:
        return PumpEventPtr(new SmbgEvent(time, readDouble(record, "value")));

    case EV_PUMP_SUSPEND:
        return PumpEventPtr(new SuspendEvent(time, readString(record, "reason")));

    case EV_PUMP_WIZARD: {
        WizardEvent* wizard = new WizardEvent(time);
        PumpEventPtr out(wizard);
        if (record.contains("carbInput")) {
            wizard->setCarbInput(readDouble(record, "carbInput"));
        }
        QJsonValue bolus = record.value("bolus");
        if (bolus.isObject()) {
            wizard->setBolus(readBolus(bolus.toObject(), time));
        } else if (!bolus.isUndefined() && !bolus.isNull()) {
            throw EventFormatError(QString("Wizard at %1 has a malformed bolus").arg(PumpEvent::timeStr(time)));
        }
        return out;
    }
    }
    throw EventFormatError(QString("Unhandled event type \"%1\"").arg(typeName));
}

QList<PumpEventPtr> EventReader::readArray(const QByteArray & json)
{
    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(json, &error);
    if (error.error != QJsonParseError::NoError) {
        throw EventFormatError(QString("Invalid JSON at offset %1: %2").arg(error.offset).arg(error.errorString()));
    }
    if (!doc.isArray()) {
        throw EventFormatError("Expected a JSON array of event records");
    }

    QList<PumpEventPtr> events;
    QJsonArray records = doc.array();
    for (int i = 0; i < records.size(); i++) {
        if (!records.at(i).isObject()) {
            throw EventFormatError(QString("Record %1 is not an object").arg(i));
        }
        events.append(fromJson(records.at(i).toObject()));
    }
    return events;
}

QList<PumpEventPtr> EventReader::readFile(const QString & filename)
{
    QFile file(filename);
    if (!file.open(QFile::ReadOnly)) {
        throw EventFormatError(QString("Couldn't open event file %1: %2").arg(filename).arg(file.errorString()));
    }
    QList<PumpEventPtr> events = readArray(file.readAll());
    qDebug().noquote() << "Read" << events.size() << "events from" << filename;
    return events;
}

QJsonArray EventReader::toJsonArray(const QList<PumpEventPtr> & events)
{
    QJsonArray out;
    for (const PumpEventPtr & event : events) {
        out.append(event->toJson());
    }
    return out;
}
