/* Event Simulator Unit Tests
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include "eventsimulatortests.h"
#include "PumpLib/eventsimulator.h"
#include "PumpLib/pumperrors.h"

static const QDateTime s_t0 = QDateTime(QDate(2014, 5, 1), QTime(8, 0, 0), Qt::UTC);

static QDateTime at(qint64 msecs)
{
    return s_t0.addMSecs(msecs);
}

static const BasalEvent & asBasal(const PumpEventPtr & event)
{
    return static_cast<const BasalEvent &>(*event);
}

static void verifySorted(const QList<PumpEventPtr> & events)
{
    for (int i = 1; i < events.size(); i++) {
        QVERIFY(events[i-1]->time() <= events[i]->time());
    }
}


void EventSimulatorTests::testBasalBolusSession()
{
    const qint64 halfHour = 1800000;
    EventSimulator sim;

    sim.basal(BasalEvent(at(0)));
    sim.basal(BasalEvent(at(halfHour)));
    sim.bolus(BolusEvent(at(halfHour + 60000), 0));
    sim.bolus(BolusEvent(at(halfHour + 120000), 2.5));
    sim.finalBasal();

    QList<PumpEventPtr> events = sim.getEvents();
    QCOMPARE(events.size(), 3);

    QCOMPARE(events[0]->type(), EV_PUMP_BASAL);
    const BasalEvent & closed = asBasal(events[0]);
    QCOMPARE(closed.time(), at(0));
    QVERIFY(closed.isClosed());
    QVERIFY(closed.hasDuration());
    QCOMPARE(closed.duration(), halfHour);
    QCOMPARE(closed.scheduleName(), STR_PUMP_UnknownSchedule);
    QVERIFY(closed.previous().isNull());

    QCOMPARE(events[1]->type(), EV_PUMP_BASAL);
    const BasalEvent & open = asBasal(events[1]);
    QCOMPARE(open.time(), at(halfHour));
    QVERIFY(!open.isClosed());
    QVERIFY(!open.hasDuration());
    QVERIFY(!open.previous().isNull());
    QCOMPARE(open.previous()->time(), at(0));
    QCOMPARE(open.previous()->duration(), halfHour);
    QCOMPARE(open.previous()->scheduleName(), STR_PUMP_UnknownSchedule);

    QCOMPARE(events[2]->type(), EV_PUMP_BOLUS);
    QCOMPARE(events[2]->time(), at(halfHour + 120000));
    QCOMPARE(static_cast<const BolusEvent &>(*events[2]).normal(), 2.5);
}

void EventSimulatorTests::testChainedBasalDurations()
{
    static const qint64 starts[] = { 0, 600000, 660000, 3600000, 3600001, 7200000 };
    const int count = sizeof(starts) / sizeof(starts[0]);

    EventSimulator sim;
    for (int i = 0; i < count; i++) {
        sim.basal(BasalEvent(at(starts[i])));
    }
    QList<PumpEventPtr> events = sim.getEvents();
    QCOMPARE(events.size(), count - 1);  // the last segment is still open

    for (int i = 0; i < count - 1; i++) {
        const BasalEvent & basal = asBasal(events[i]);
        QCOMPARE(basal.time(), at(starts[i]));
        QCOMPARE(basal.duration(), starts[i+1] - starts[i]);
        if (i > 0) {
            // Each link is a snapshot: it carries no further history.
            QVERIFY(!basal.previous().isNull());
            QCOMPARE(basal.previous()->time(), at(starts[i-1]));
            QVERIFY(basal.previous()->previous().isNull());
        }
    }
    QCOMPARE(sim.openBasal()->time(), at(starts[count-1]));
    QCOMPARE(sim.openBasal()->previous()->time(), at(starts[count-2]));
}

void EventSimulatorTests::testReportedDurationIsKept()
{
    EventSimulator sim;
    BasalEvent first(at(0));
    first.setDuration(900000);
    sim.basal(first);
    sim.basal(BasalEvent(at(1800000)));

    QList<PumpEventPtr> events = sim.getEvents();
    QCOMPARE(events.size(), 1);
    QCOMPARE(asBasal(events[0]).duration(), (qint64) 900000);
}

void EventSimulatorTests::testScheduleNameDefaultsToUnknown()
{
    EventSimulator sim;
    BasalEvent named(at(0));
    named.setScheduleName("Weekday");
    named.setRate(0.85);
    sim.basal(named);
    sim.basal(BasalEvent(at(3600000)));
    sim.basal(BasalEvent(at(7200000)));

    QList<PumpEventPtr> events = sim.getEvents();
    QCOMPARE(events.size(), 2);
    QCOMPARE(asBasal(events[0]).scheduleName(), QString("Weekday"));
    QCOMPARE(asBasal(events[0]).rate(), 0.85);
    QCOMPARE(asBasal(events[1]).scheduleName(), STR_PUMP_UnknownSchedule);
}

void EventSimulatorTests::testClosedSegmentIsFrozen()
{
    BasalEvent open(at(0));
    BasalEvent closed = open.closedAt(at(1000));
    QVERIFY(!open.isClosed());
    QVERIFY(!open.hasDuration());
    QVERIFY(closed.isClosed());
    QCOMPARE(closed.duration(), (qint64) 1000);

    QVERIFY_EXCEPTION_THROWN(closed.setDuration(5), SimulatorError);
    QVERIFY_EXCEPTION_THROWN(closed.setScheduleName("Other"), SimulatorError);
    QVERIFY_EXCEPTION_THROWN(closed.setRate(1.0), SimulatorError);
    QVERIFY_EXCEPTION_THROWN(closed.closedAt(at(2000)), SimulatorError);
}

void EventSimulatorTests::testOrderIsStableForEqualTimes()
{
    EventSimulator sim;
    sim.basal(BasalEvent(at(0)));
    sim.smbg(SmbgEvent(at(1000), 110));
    sim.alarm(AlarmEvent(at(1000), "low_insulin"));
    sim.changeReservoir(ChangeReservoirEvent(at(2000)));
    // Closes the first segment, which lands in the log behind the three events above.
    sim.basal(BasalEvent(at(2000)));
    sim.suspend(SuspendEvent(at(2000), "manual"));
    sim.finalBasal();

    QList<PumpEventPtr> events = sim.getEvents();
    verifySorted(events);
    QCOMPARE(events.size(), 6);
    QCOMPARE(events[0]->type(), EV_PUMP_BASAL);
    QCOMPARE(events[0]->time(), at(0));
    QCOMPARE(events[1]->type(), EV_PUMP_SMBG);
    QCOMPARE(events[2]->type(), EV_PUMP_ALARM);
    QCOMPARE(events[3]->type(), EV_PUMP_CHANGE_RESERVOIR);
    QCOMPARE(events[4]->type(), EV_PUMP_SUSPEND);
    QCOMPARE(events[5]->type(), EV_PUMP_BASAL);  // emitted at finalize, after the suspend
    QCOMPARE(events[5]->time(), at(2000));
}

void EventSimulatorTests::testBolusFilter()
{
    EventSimulator sim;
    sim.bolus(BolusEvent(at(0), 0));               // dropped

    BolusEvent interrupted(at(1000), 0);
    interrupted.setExpectedNormal(3.0);
    sim.bolus(interrupted);                        // kept

    BolusEvent zeroExpected(at(2000), 0);
    zeroExpected.setExpectedNormal(0);
    sim.bolus(zeroExpected);                       // kept: expectedNormal is present

    sim.bolus(BolusEvent(at(3000), 0.1));          // kept

    QCOMPARE(sim.rawEventCount(), 4);
    QList<PumpEventPtr> events = sim.getEvents();
    QCOMPARE(events.size(), 3);
    QCOMPARE(events[0]->time(), at(1000));
    QCOMPARE(events[1]->time(), at(2000));
    QCOMPARE(events[2]->time(), at(3000));
}

void EventSimulatorTests::testWizardFilter()
{
    EventSimulator sim;

    WizardEvent noBolus(at(0));
    noBolus.setCarbInput(45);
    sim.wizard(noBolus);                           // kept

    WizardEvent emptyBolus(at(1000));
    emptyBolus.setBolus(BolusEvent(at(1000), 0));
    sim.wizard(emptyBolus);                        // dropped

    WizardEvent realBolus(at(2000));
    realBolus.setBolus(BolusEvent(at(2000), 4.2));
    sim.wizard(realBolus);                         // kept

    QList<PumpEventPtr> events = sim.getEvents();
    QCOMPARE(events.size(), 2);
    QCOMPARE(events[0]->time(), at(0));
    QCOMPARE(events[1]->time(), at(2000));
    QVERIFY(!EventSimulator::isRetained(emptyBolus));
    QVERIFY(EventSimulator::isRetained(noBolus));
}

void EventSimulatorTests::testOrderingViolation()
{
    EventSimulator sim;
    sim.bolus(BolusEvent(at(5000), 1.0));

    bool thrown = false;
    try {
        sim.smbg(SmbgEvent(at(4999), 95));
    } catch (const OrderingViolation & e) {
        thrown = true;
        QCOMPARE(e.lastTimestamp(), at(5000));
        QCOMPARE(e.eventTime(), at(4999));
    }
    QVERIFY(thrown);
    QCOMPARE(sim.rawEventCount(), 1);
    QCOMPARE(sim.lastTimestamp(), at(5000));

    // A late basal must not close or replace the open segment either.
    sim.basal(BasalEvent(at(6000)));
    QVERIFY_EXCEPTION_THROWN(sim.basal(BasalEvent(at(5500))), OrderingViolation);
    QCOMPARE(sim.openBasal()->time(), at(6000));
    QCOMPARE(sim.rawEventCount(), 1);

    // Equal timestamps are accepted.
    sim.resume(ResumeEvent(at(6000)));
    QCOMPARE(sim.rawEventCount(), 2);
}

void EventSimulatorTests::testClosedBasalRejected()
{
    EventSimulator sim;
    sim.bolus(BolusEvent(at(0), 1.0));

    BasalEvent closed = BasalEvent(at(1000)).closedAt(at(2000));
    QVERIFY_EXCEPTION_THROWN(sim.basal(closed), SimulatorError);
    QVERIFY_EXCEPTION_THROWN(sim.simulate(closed), SimulatorError);
    QCOMPARE(sim.lastTimestamp(), at(0));
    QCOMPARE(sim.rawEventCount(), 1);
    QVERIFY(sim.openBasal().isNull());

    // Events between the last accepted one and the rejected one still go through.
    sim.bolus(BolusEvent(at(500), 2.0));
    sim.basal(BasalEvent(at(600)));
    QCOMPARE(sim.lastTimestamp(), at(600));

    sim.finalBasal();
    QList<PumpEventPtr> events = sim.getEvents();
    QCOMPARE(events.size(), 3);
    QVERIFY(!asBasal(events[2]).isClosed());
    QCOMPARE(events[2]->time(), at(600));
}

void EventSimulatorTests::testFinalizeEmitsOpenSegment()
{
    EventSimulator sim;
    BasalEvent last(at(0));
    last.setRate(1.25);
    sim.basal(last);
    QCOMPARE(sim.getEvents().size(), 0);

    sim.finalBasal();
    QVERIFY(sim.isFinalized());
    QVERIFY(sim.openBasal().isNull());

    QList<PumpEventPtr> events = sim.getEvents();
    QCOMPARE(events.size(), 1);
    const BasalEvent & basal = asBasal(events[0]);
    QVERIFY(!basal.isClosed());
    QVERIFY(!basal.hasDuration());
    QVERIFY(!basal.hasScheduleName());
    QCOMPARE(basal.rate(), 1.25);

    sim.finalBasal();  // idempotent
    QCOMPARE(sim.getEvents().size(), 1);
}

void EventSimulatorTests::testFinalizeDropsOpenSegment()
{
    SimulatorConfig config;
    config.trailingBasal = TBP_Drop;
    EventSimulator sim(config);

    sim.basal(BasalEvent(at(0)));
    sim.basal(BasalEvent(at(60000)));
    sim.finalBasal();

    QList<PumpEventPtr> events = sim.getEvents();
    QCOMPARE(events.size(), 1);
    QCOMPARE(events[0]->time(), at(0));
    QVERIFY(sim.openBasal().isNull());
}

void EventSimulatorTests::testNoEventsAfterFinalize()
{
    EventSimulator sim;
    sim.finalBasal();
    QVERIFY(sim.getEvents().isEmpty());

    QVERIFY_EXCEPTION_THROWN(sim.basal(BasalEvent(at(0))), SimulatorError);
    QVERIFY_EXCEPTION_THROWN(sim.bolus(BolusEvent(at(0), 1.0)), SimulatorError);
    QCOMPARE(sim.rawEventCount(), 0);
    QVERIFY(sim.openBasal().isNull());
}

void EventSimulatorTests::testGetEventsIsRepeatable()
{
    EventSimulator sim;
    sim.basal(BasalEvent(at(0)));
    sim.bolus(BolusEvent(at(1000), 0));
    sim.settings(SettingsEvent(at(1500), "Weekend"));
    sim.basal(BasalEvent(at(2000)));

    QList<PumpEventPtr> first = sim.getEvents();
    QList<PumpEventPtr> second = sim.getEvents();
    QCOMPARE(first.size(), 2);
    QCOMPARE(first, second);
    QCOMPARE(sim.rawEventCount(), 3);

    // Mid-stream inspection doesn't disturb later processing.
    sim.basal(BasalEvent(at(3000)));
    QList<PumpEventPtr> third = sim.getEvents();
    QCOMPARE(third.size(), 3);
    verifySorted(third);
}

void EventSimulatorTests::testSimulateDispatchesByType()
{
    EventSimulator sim;
    QList<PumpEventPtr> input;
    input.append(PumpEventPtr(new BasalEvent(at(0))));
    input.append(PumpEventPtr(new ChangeDeviceTimeEvent(at(100), "2014-05-01T08:00:00", "2014-05-01T09:00:00")));
    input.append(PumpEventPtr(new SuspendEvent(at(200))));
    input.append(PumpEventPtr(new ResumeEvent(at(300))));
    input.append(PumpEventPtr(new BasalEvent(at(400))));

    for (const PumpEventPtr & event : input) {
        sim.simulate(*event);
    }
    sim.finalBasal();

    QList<PumpEventPtr> events = sim.getEvents();
    QCOMPARE(events.size(), 5);
    QCOMPARE(events[0]->type(), EV_PUMP_BASAL);
    QCOMPARE(asBasal(events[0]).duration(), (qint64) 400);
    QCOMPARE(events[1]->type(), EV_PUMP_CHANGE_DEVICE_TIME);
    QCOMPARE(events[2]->type(), EV_PUMP_SUSPEND);
    QCOMPARE(events[3]->type(), EV_PUMP_RESUME);
    QCOMPARE(events[4]->type(), EV_PUMP_BASAL);
}
