/* PumpLib Application Settings Header
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QSettings>
#include <QString>
#include <QVariant>

#include "PumpLib/eventsimulator.h"

// Setting keys
const QString STR_SIM_TrailingBasalPolicy = "Simulator/TrailingBasalPolicy";
const QString STR_SCAN_DelayMs = "Scanner/DelayMs";
const QString STR_SCAN_TimeoutMs = "Scanner/TimeoutMs";
const QString STR_LOG_Directory = "Logging/Directory";
const QString STR_LOG_MaxPrevious = "Logging/MaxPrevious";

// TrailingBasalPolicy values as stored
const QString STR_TBP_Emit = "emit";
const QString STR_TBP_Drop = "drop";


/*! \class AppSettings
    \brief Typed access to the persistent application settings.

    Every setting is initialized with its default on construction, so a fresh
    settings store comes out fully populated.
 */
class AppSettings
{
public:
    explicit AppSettings(QSettings & settings);

    TrailingBasalPolicy trailingBasalPolicy() const { return m_trailingBasal; }
    int scanDelay() const { return m_scanDelay; }
    int scanTimeout() const { return m_scanTimeout; }
    const QString & logDirectory() const { return m_logDirectory; }
    int logMaxPrevious() const { return m_logMaxPrevious; }

    void setTrailingBasalPolicy(TrailingBasalPolicy policy);
    void setScanDelay(int msecs);
    void setScanTimeout(int msecs);
    void setLogDirectory(const QString & path);

    //! \brief Simulator configuration derived from these settings.
    SimulatorConfig simulatorConfig() const;

    static QString policyName(TrailingBasalPolicy policy);
    static bool policyFromName(const QString & name, TrailingBasalPolicy & policy);

protected:
    QVariant initPref(const QString & key, const QVariant & defaultValue);
    int initPositivePref(const QString & key, int defaultValue);

    QSettings & m_settings;

    TrailingBasalPolicy m_trailingBasal;
    int m_scanDelay;
    int m_scanTimeout;
    QString m_logDirectory;
    int m_logMaxPrevious;
};

#endif // APPSETTINGS_H
