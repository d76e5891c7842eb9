/* PumpLib Event Simulator Implementation
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <QDebug>
#include <algorithm>

#include "eventsimulator.h"
#include "pumperrors.h"

EventSimulator::EventSimulator(const SimulatorConfig & config)
    : m_config(config), m_finalized(false)
{
}

void EventSimulator::ensureTimestamp(const PumpEvent & event)
{
    if (m_finalized) {
        throw SimulatorError(QString("Received %1 at [%2] after the session was finalized")
                             .arg(event.typeName()).arg(PumpEvent::timeStr(event.time())));
    }
    if (!event.time().isValid()) {
        throw SimulatorError(QString("Received %1 without a valid timestamp").arg(event.typeName()));
    }
    if (m_lastTimestamp.isValid() && event.time() < m_lastTimestamp) {
        throw OrderingViolation(m_lastTimestamp, event.time(), event.typeName());
    }
    m_lastTimestamp = event.time();
}

void EventSimulator::simpleSimulate(const PumpEventPtr & event)
{
    ensureTimestamp(*event);
    m_events.append(event);
}

void EventSimulator::alarm(const AlarmEvent & event)
{
    simpleSimulate(PumpEventPtr(new AlarmEvent(event)));
}

void EventSimulator::basal(const BasalEvent & event)
{
    if (event.isClosed()) {
        throw SimulatorError(QString("Received basal segment at [%1] that has already been closed")
                             .arg(PumpEvent::timeStr(event.time())));
    }
    ensureTimestamp(event);

    BasalEvent next(event);
    if (m_openBasal) {
        QSharedPointer<const BasalEvent> closed(new BasalEvent(m_openBasal->closedAt(event.time())));
        QSharedPointer<const BasalEvent> snapshot(new BasalEvent(closed->snapshot()));
        next = event.withPrevious(snapshot);
        m_events.append(closed);
    }
    m_openBasal = QSharedPointer<const BasalEvent>(new BasalEvent(next));
}

void EventSimulator::bolus(const BolusEvent & event)
{
    simpleSimulate(PumpEventPtr(new BolusEvent(event)));
}

void EventSimulator::changeDeviceTime(const ChangeDeviceTimeEvent & event)
{
    simpleSimulate(PumpEventPtr(new ChangeDeviceTimeEvent(event)));
}

void EventSimulator::changeReservoir(const ChangeReservoirEvent & event)
{
    simpleSimulate(PumpEventPtr(new ChangeReservoirEvent(event)));
}

void EventSimulator::resume(const ResumeEvent & event)
{
    simpleSimulate(PumpEventPtr(new ResumeEvent(event)));
}

void EventSimulator::settings(const SettingsEvent & event)
{
    simpleSimulate(PumpEventPtr(new SettingsEvent(event)));
}

void EventSimulator::smbg(const SmbgEvent & event)
{
    simpleSimulate(PumpEventPtr(new SmbgEvent(event)));
}

void EventSimulator::suspend(const SuspendEvent & event)
{
    simpleSimulate(PumpEventPtr(new SuspendEvent(event)));
}

void EventSimulator::wizard(const WizardEvent & event)
{
    simpleSimulate(PumpEventPtr(new WizardEvent(event)));
}

void EventSimulator::simulate(const PumpEvent & event)
{
    switch (event.type()) {
    case EV_PUMP_ALARM:              alarm(static_cast<const AlarmEvent &>(event)); break;
    case EV_PUMP_BASAL:              basal(static_cast<const BasalEvent &>(event)); break;
    case EV_PUMP_BOLUS:              bolus(static_cast<const BolusEvent &>(event)); break;
    case EV_PUMP_CHANGE_DEVICE_TIME: changeDeviceTime(static_cast<const ChangeDeviceTimeEvent &>(event)); break;
    case EV_PUMP_CHANGE_RESERVOIR:   changeReservoir(static_cast<const ChangeReservoirEvent &>(event)); break;
    case EV_PUMP_RESUME:             resume(static_cast<const ResumeEvent &>(event)); break;
    case EV_PUMP_SETTINGS:           settings(static_cast<const SettingsEvent &>(event)); break;
    case EV_PUMP_SMBG:               smbg(static_cast<const SmbgEvent &>(event)); break;
    case EV_PUMP_SUSPEND:            suspend(static_cast<const SuspendEvent &>(event)); break;
    case EV_PUMP_WIZARD:             wizard(static_cast<const WizardEvent &>(event)); break;
    default:
        throw SimulatorError(QString("No handler for event type %1").arg(event.typeName()));
    }
}

void EventSimulator::finalBasal()
{
    if (m_finalized) {
        return;
    }
    m_finalized = true;

    if (m_openBasal.isNull()) {
        return;
    }
    switch (m_config.trailingBasal) {
    case TBP_EmitOpenEnded:
        qDebug().noquote() << "Emitting open-ended basal segment at" << PumpEvent::timeStr(m_openBasal->time());
        m_events.append(m_openBasal);
        break;
    case TBP_Drop:
        qWarning().noquote() << "Dropping trailing basal segment at" << PumpEvent::timeStr(m_openBasal->time())
                             << "that no later segment closed";
        break;
    }
    m_openBasal.clear();
}

bool EventSimulator::isRetained(const PumpEvent & event)
{
    if (event.type() == EV_PUMP_BOLUS) {
        return !static_cast<const BolusEvent &>(event).isEmpty();
    } else if (event.type() == EV_PUMP_WIZARD) {
        const QSharedPointer<const BolusEvent> & bolus = static_cast<const WizardEvent &>(event).bolus();
        if (bolus) {
            return !bolus->isEmpty();
        }
    }
    return true;
}

static bool eventTimeLessThan(const PumpEventPtr & a, const PumpEventPtr & b)
{
    return a->time() < b->time();
}

QList<PumpEventPtr> EventSimulator::getEvents() const
{
    // Closed basal segments were appended when their successor arrived, so they
    // can sit behind later events of other kinds; a stable sort restores time order
    // without disturbing events that share a timestamp.
    QList<PumpEventPtr> ordered;
    ordered.reserve(m_events.size());
    for (const PumpEventPtr & event : m_events) {
        if (isRetained(*event)) {
            ordered.append(event);
        }
    }
    std::stable_sort(ordered.begin(), ordered.end(), eventTimeLessThan);
    return ordered;
}
