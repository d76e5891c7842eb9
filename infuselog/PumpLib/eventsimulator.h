/* PumpLib Event Simulator Header
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef EVENTSIMULATOR_H
#define EVENTSIMULATOR_H

#include <QList>

#include "PumpLib/pumpevent.h"

// What finalBasal() does with a segment that no later basal ever closed.
enum TrailingBasalPolicy
{
    TBP_EmitOpenEnded = 0,  // keep it in the log without a computed duration
    TBP_Drop,               // discard it
};

struct SimulatorConfig
{
    SimulatorConfig() : trailingBasal(TBP_EmitOpenEnded) {}

    TrailingBasalPolicy trailingBasal;
};


/*! \class EventSimulator
    \brief Turns a time-ordered stream of pump events into the canonical upload log.

    Events must be delivered in non-decreasing time order, one call per event.
    Basal segments are only complete once the next segment begins, so each one is
    held open until its successor arrives and is then closed with a duration and
    appended to the log. That puts closed segments behind later non-basal events,
    which getEvents() corrects by sorting.

    Call finalBasal() once the stream is exhausted to decide what happens to the
    last open segment. After that the simulator accepts no more events.
 */
class EventSimulator
{
public:
    explicit EventSimulator(const SimulatorConfig & config = SimulatorConfig());

    void alarm(const AlarmEvent & event);
    void basal(const BasalEvent & event);
    void bolus(const BolusEvent & event);
    void changeDeviceTime(const ChangeDeviceTimeEvent & event);
    void changeReservoir(const ChangeReservoirEvent & event);
    void resume(const ResumeEvent & event);
    void settings(const SettingsEvent & event);
    void smbg(const SmbgEvent & event);
    void suspend(const SuspendEvent & event);
    void wizard(const WizardEvent & event);

    //! \brief Dispatch an event of any kind to its handler.
    void simulate(const PumpEvent & event);

    //! \brief End of stream: resolve the trailing open basal segment per the configured policy.
    void finalBasal();

    //! \brief The accepted events without empty boluses, sorted by time. Does not modify the simulator.
    QList<PumpEventPtr> getEvents() const;

    // Diagnostics
    const SimulatorConfig & config() const { return m_config; }
    const QSharedPointer<const BasalEvent> & openBasal() const { return m_openBasal; }
    bool hasLastTimestamp() const { return m_lastTimestamp.isValid(); }
    const QDateTime & lastTimestamp() const { return m_lastTimestamp; }
    bool isFinalized() const { return m_finalized; }
    int rawEventCount() const { return m_events.size(); }

    //! \brief True if getEvents() would keep this event.
    static bool isRetained(const PumpEvent & event);

protected:
    void ensureTimestamp(const PumpEvent & event);
    void simpleSimulate(const PumpEventPtr & event);

    SimulatorConfig m_config;
    QSharedPointer<const BasalEvent> m_openBasal;
    QDateTime m_lastTimestamp;
    bool m_finalized;
    QList<PumpEventPtr> m_events;
};

#endif // EVENTSIMULATOR_H
