/* PumpLib Pump Event Header
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef PUMPEVENT_H
#define PUMPEVENT_H

#include <QDateTime>
#include <QJsonObject>
#include <QSharedPointer>
#include <QString>

//********************************************************************************************
// MARK: -
// MARK: Typed pump events
//********************************************************************************************

// For new events, add an enum here, a name in pumpevent.cpp and a class below.
enum PumpEventType
{
    EV_PUMP_ALARM = 0,
    EV_PUMP_BASAL,
    EV_PUMP_BOLUS,
    EV_PUMP_CHANGE_DEVICE_TIME,
    EV_PUMP_CHANGE_RESERVOIR,
    EV_PUMP_RESUME,
    EV_PUMP_SETTINGS,
    EV_PUMP_SMBG,
    EV_PUMP_SUSPEND,
    EV_PUMP_WIZARD,
};

// Schedule name given to a closed basal segment when the stream doesn't say which program was active.
const QString STR_PUMP_UnknownSchedule = "Unknown";


/*! \class PumpEvent
    \brief Common header for everything a pump logs: a kind and a device-local timestamp.

    Device-local timestamps are kept as Qt::UTC QDateTimes purely so that arithmetic
    on them is free of DST effects; no zone conversion is ever applied.
 */
class PumpEvent
{
public:
    virtual ~PumpEvent() {}

    PumpEventType type() const { return m_type; }
    const QDateTime & time() const { return m_time; }

    QString typeName() const { return typeName(m_type); }

    //! \brief Canonical upload form of this event.
    virtual QJsonObject toJson() const;

    static QString typeName(PumpEventType type);
    //! \brief Look up a type by its canonical name, returning false if there is none.
    static bool typeFromName(const QString & name, PumpEventType & type);

    //! \brief Parse a device timestamp ("2014-05-01T08:00:00[.zzz]"), ignoring any zone suffix. Returns an invalid QDateTime on failure.
    static QDateTime deviceTime(const QString & text);
    //! \brief Format a device timestamp the way toJson() does.
    static QString timeStr(const QDateTime & time);

protected:
    PumpEvent(PumpEventType type, const QDateTime & time);

    PumpEventType m_type;
    QDateTime m_time;
};

typedef QSharedPointer<const PumpEvent> PumpEventPtr;


/*! \class BasalEvent
    \brief A basal segment: steady delivery from time() until the next segment begins.

    A segment is open until the simulator closes it with closedAt(). A closed segment
    is frozen: its setters throw, and the simulator only ever holds it as const.
 */
class BasalEvent : public PumpEvent
{
public:
    static const PumpEventType TYPE = EV_PUMP_BASAL;

    explicit BasalEvent(const QDateTime & time);

    bool hasDuration() const { return m_hasDuration; }
    qint64 duration() const { return m_duration; }  // milliseconds
    bool hasScheduleName() const { return !m_scheduleName.isNull(); }
    const QString & scheduleName() const { return m_scheduleName; }
    bool hasRate() const { return m_hasRate; }
    double rate() const { return m_rate; }  // units/hour
    bool isClosed() const { return m_closed; }
    const QSharedPointer<const BasalEvent> & previous() const { return m_previous; }

    void setDuration(qint64 msecs);
    void setScheduleName(const QString & name);
    void setRate(double rate);

    //! \brief Return a frozen copy closed by a successor starting at successorTime.
    // The duration is only filled in if the device didn't report one, and the schedule
    // name defaults to "Unknown" if it was never set.
    BasalEvent closedAt(const QDateTime & successorTime) const;

    //! \brief Copy of this segment without its own previous link.
    BasalEvent snapshot() const;

    //! \brief Copy of this segment linked to the given closed predecessor.
    BasalEvent withPrevious(const QSharedPointer<const BasalEvent> & previous) const;

    virtual QJsonObject toJson() const;

protected:
    void checkOpen(const char* what) const;

    bool m_hasDuration;
    qint64 m_duration;
    QString m_scheduleName;
    bool m_hasRate;
    double m_rate;
    bool m_closed;
    QSharedPointer<const BasalEvent> m_previous;
};


class BolusEvent : public PumpEvent
{
public:
    static const PumpEventType TYPE = EV_PUMP_BOLUS;

    BolusEvent(const QDateTime & time, double normal);

    double normal() const { return m_normal; }
    bool hasExpectedNormal() const { return m_hasExpectedNormal; }
    double expectedNormal() const { return m_expectedNormal; }
    void setExpectedNormal(double expected) { m_expectedNormal = expected; m_hasExpectedNormal = true; }

    //! \brief True for a zero delivery that was never programmed to be anything else.
    bool isEmpty() const { return m_normal == 0 && !m_hasExpectedNormal; }

    virtual QJsonObject toJson() const;

protected:
    double m_normal;
    bool m_hasExpectedNormal;
    double m_expectedNormal;
};


class WizardEvent : public PumpEvent
{
public:
    static const PumpEventType TYPE = EV_PUMP_WIZARD;

    explicit WizardEvent(const QDateTime & time);

    const QSharedPointer<const BolusEvent> & bolus() const { return m_bolus; }
    void setBolus(const BolusEvent & bolus) { m_bolus = QSharedPointer<const BolusEvent>(new BolusEvent(bolus)); }
    bool hasCarbInput() const { return m_hasCarbInput; }
    double carbInput() const { return m_carbInput; }  // grams
    void setCarbInput(double carbs) { m_carbInput = carbs; m_hasCarbInput = true; }

    virtual QJsonObject toJson() const;

protected:
    QSharedPointer<const BolusEvent> m_bolus;
    bool m_hasCarbInput;
    double m_carbInput;
};


class AlarmEvent : public PumpEvent
{
public:
    static const PumpEventType TYPE = EV_PUMP_ALARM;

    AlarmEvent(const QDateTime & time, const QString & alarmType = QString())
        : PumpEvent(TYPE, time), m_alarmType(alarmType) {}

    const QString & alarmType() const { return m_alarmType; }

    virtual QJsonObject toJson() const;

protected:
    QString m_alarmType;
};


class SmbgEvent : public PumpEvent
{
public:
    static const PumpEventType TYPE = EV_PUMP_SMBG;

    SmbgEvent(const QDateTime & time, double value) : PumpEvent(TYPE, time), m_value(value) {}

    double value() const { return m_value; }  // mg/dL

    virtual QJsonObject toJson() const;

protected:
    double m_value;
};


class ChangeDeviceTimeEvent : public PumpEvent
{
public:
    static const PumpEventType TYPE = EV_PUMP_CHANGE_DEVICE_TIME;

    ChangeDeviceTimeEvent(const QDateTime & time, const QString & from = QString(), const QString & to = QString())
        : PumpEvent(TYPE, time), m_from(from), m_to(to) {}

    const QString & from() const { return m_from; }
    const QString & to() const { return m_to; }

    virtual QJsonObject toJson() const;

protected:
    QString m_from;
    QString m_to;
};


class SettingsEvent : public PumpEvent
{
public:
    static const PumpEventType TYPE = EV_PUMP_SETTINGS;

    SettingsEvent(const QDateTime & time, const QString & activeSchedule = QString())
        : PumpEvent(TYPE, time), m_activeSchedule(activeSchedule) {}

    const QString & activeSchedule() const { return m_activeSchedule; }

    virtual QJsonObject toJson() const;

protected:
    QString m_activeSchedule;
};


class PumpReasonEvent : public PumpEvent
{
public:
    const QString & reason() const { return m_reason; }

    virtual QJsonObject toJson() const;

protected:
    PumpReasonEvent(PumpEventType type, const QDateTime & time, const QString & reason)
        : PumpEvent(type, time), m_reason(reason) {}

    QString m_reason;
};


#define _PUMP_EVENT(T, E, P) \
class T : public P \
{ \
public: \
    static const PumpEventType TYPE = E; \
    explicit T(const QDateTime & time) : P(TYPE, time) {} \
};
#define _PUMP_REASON_EVENT(T, E) \
class T : public PumpReasonEvent \
{ \
public: \
    static const PumpEventType TYPE = E; \
    T(const QDateTime & time, const QString & reason = QString()) : PumpReasonEvent(TYPE, time, reason) {} \
};

_PUMP_EVENT(ChangeReservoirEvent, EV_PUMP_CHANGE_RESERVOIR, PumpEvent)
_PUMP_REASON_EVENT(SuspendEvent, EV_PUMP_SUSPEND)
_PUMP_REASON_EVENT(ResumeEvent, EV_PUMP_RESUME)

#endif // PUMPEVENT_H
