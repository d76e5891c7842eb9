/* PumpLib Pump Event Implementation
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <QRegularExpression>

#include "pumpevent.h"
#include "pumperrors.h"

const PumpEventType BasalEvent::TYPE;
const PumpEventType BolusEvent::TYPE;
const PumpEventType WizardEvent::TYPE;
const PumpEventType AlarmEvent::TYPE;
const PumpEventType SmbgEvent::TYPE;
const PumpEventType ChangeDeviceTimeEvent::TYPE;
const PumpEventType SettingsEvent::TYPE;
const PumpEventType ChangeReservoirEvent::TYPE;
const PumpEventType SuspendEvent::TYPE;
const PumpEventType ResumeEvent::TYPE;

struct PumpEventName
{
    PumpEventType type;
    const char* name;
};

static const PumpEventName s_eventNames[] = {
    { EV_PUMP_ALARM,              "alarm" },
    { EV_PUMP_BASAL,              "basal" },
    { EV_PUMP_BOLUS,              "bolus" },
    { EV_PUMP_CHANGE_DEVICE_TIME, "changeDeviceTime" },
    { EV_PUMP_CHANGE_RESERVOIR,   "changeReservoir" },
    { EV_PUMP_RESUME,             "resume" },
    { EV_PUMP_SETTINGS,           "settings" },
    { EV_PUMP_SMBG,               "smbg" },
    { EV_PUMP_SUSPEND,            "suspend" },
    { EV_PUMP_WIZARD,             "wizard" },
};
static const int s_eventNameCount = sizeof(s_eventNames) / sizeof(s_eventNames[0]);


PumpEvent::PumpEvent(PumpEventType type, const QDateTime & time)
    : m_type(type), m_time(time)
{
}

QString PumpEvent::typeName(PumpEventType type)
{
    for (int i = 0; i < s_eventNameCount; i++) {
        if (s_eventNames[i].type == type) {
            return QString(s_eventNames[i].name);
        }
    }
    return QString("0x%1").arg((int) type, 0, 16);
}

bool PumpEvent::typeFromName(const QString & name, PumpEventType & type)
{
    for (int i = 0; i < s_eventNameCount; i++) {
        if (name == QLatin1String(s_eventNames[i].name)) {
            type = s_eventNames[i].type;
            return true;
        }
    }
    return false;
}

QDateTime PumpEvent::deviceTime(const QString & text)
{
    // Device clocks have no zone. Drop any suffix an upstream tool may have added
    // and read the fields as-is.
    static const QRegularExpression zoneSuffix("(Z|[+-]\\d\\d:?\\d\\d)$");
    QString local = text.trimmed();
    local.remove(zoneSuffix);

    QDateTime dt = QDateTime::fromString(local + "Z", Qt::ISODateWithMs);
    if (!dt.isValid()) {
        return QDateTime();
    }
    return dt.toUTC();
}

QString PumpEvent::timeStr(const QDateTime & time)
{
    if (time.time().msec() != 0) {
        return time.toString("yyyy-MM-dd'T'HH:mm:ss.zzz");
    }
    return time.toString("yyyy-MM-dd'T'HH:mm:ss");
}

QJsonObject PumpEvent::toJson() const
{
    QJsonObject out;
    out["type"] = typeName();
    out["time"] = timeStr(m_time);
    return out;
}


// ===============================================================================================
// MARK: Basal

BasalEvent::BasalEvent(const QDateTime & time)
    : PumpEvent(TYPE, time),
      m_hasDuration(false), m_duration(0),
      m_hasRate(false), m_rate(0.0),
      m_closed(false)
{
}

void BasalEvent::checkOpen(const char* what) const
{
    if (m_closed) {
        throw SimulatorError(QString("Cannot change %1 of the basal segment at %2: it has already been closed")
                             .arg(what).arg(timeStr(m_time)));
    }
}

void BasalEvent::setDuration(qint64 msecs)
{
    checkOpen("duration");
    m_duration = msecs;
    m_hasDuration = true;
}

void BasalEvent::setScheduleName(const QString & name)
{
    checkOpen("schedule name");
    m_scheduleName = name;
}

void BasalEvent::setRate(double rate)
{
    checkOpen("rate");
    m_rate = rate;
    m_hasRate = true;
}

BasalEvent BasalEvent::closedAt(const QDateTime & successorTime) const
{
    checkOpen("closure");
    BasalEvent closed(*this);
    if (!closed.m_hasDuration) {
        closed.m_duration = m_time.msecsTo(successorTime);
        closed.m_hasDuration = true;
    }
    if (closed.m_scheduleName.isNull()) {
        closed.m_scheduleName = STR_PUMP_UnknownSchedule;
    }
    closed.m_closed = true;
    return closed;
}

BasalEvent BasalEvent::snapshot() const
{
    BasalEvent copy(*this);
    copy.m_previous.clear();
    return copy;
}

BasalEvent BasalEvent::withPrevious(const QSharedPointer<const BasalEvent> & previous) const
{
    BasalEvent linked(*this);
    linked.m_previous = previous;
    return linked;
}

QJsonObject BasalEvent::toJson() const
{
    QJsonObject out = PumpEvent::toJson();
    if (m_hasDuration) {
        out["duration"] = m_duration;
    }
    if (hasScheduleName()) {
        out["scheduleName"] = m_scheduleName;
    }
    if (m_hasRate) {
        out["rate"] = m_rate;
    }
    if (m_previous) {
        out["previous"] = m_previous->toJson();
    }
    return out;
}


// ===============================================================================================
// MARK: Bolus & wizard

BolusEvent::BolusEvent(const QDateTime & time, double normal)
    : PumpEvent(TYPE, time), m_normal(normal), m_hasExpectedNormal(false), m_expectedNormal(0.0)
{
}

QJsonObject BolusEvent::toJson() const
{
    QJsonObject out = PumpEvent::toJson();
    out["normal"] = m_normal;
    if (m_hasExpectedNormal) {
        out["expectedNormal"] = m_expectedNormal;
    }
    return out;
}

WizardEvent::WizardEvent(const QDateTime & time)
    : PumpEvent(TYPE, time), m_hasCarbInput(false), m_carbInput(0.0)
{
}

QJsonObject WizardEvent::toJson() const
{
    QJsonObject out = PumpEvent::toJson();
    if (m_hasCarbInput) {
        out["carbInput"] = m_carbInput;
    }
    if (m_bolus) {
        out["bolus"] = m_bolus->toJson();
    }
    return out;
}


// ===============================================================================================
// MARK: Everything else

QJsonObject AlarmEvent::toJson() const
{
    QJsonObject out = PumpEvent::toJson();
    if (!m_alarmType.isEmpty()) {
        out["alarmType"] = m_alarmType;
    }
    return out;
}

QJsonObject SmbgEvent::toJson() const
{
    QJsonObject out = PumpEvent::toJson();
    out["value"] = m_value;
    return out;
}

QJsonObject ChangeDeviceTimeEvent::toJson() const
{
    QJsonObject out = PumpEvent::toJson();
    if (!m_from.isEmpty()) {
        out["from"] = m_from;
    }
    if (!m_to.isEmpty()) {
        out["to"] = m_to;
    }
    return out;
}

QJsonObject SettingsEvent::toJson() const
{
    QJsonObject out = PumpEvent::toJson();
    if (!m_activeSchedule.isEmpty()) {
        out["activeSchedule"] = m_activeSchedule;
    }
    return out;
}

QJsonObject PumpReasonEvent::toJson() const
{
    QJsonObject out = PumpEvent::toJson();
    if (!m_reason.isEmpty()) {
        out["reason"] = m_reason;
    }
    return out;
}
