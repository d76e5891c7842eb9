/* PumpLib Application Settings Initialization
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <QDebug>
#include <QDir>
#include <QStandardPaths>

#include "appsettings.h"

AppSettings::AppSettings(QSettings & settings) : m_settings(settings)
{
    QString policy = initPref(STR_SIM_TrailingBasalPolicy, STR_TBP_Emit).toString();
    if (!policyFromName(policy, m_trailingBasal)) {
        qWarning().noquote() << "Unknown" << STR_SIM_TrailingBasalPolicy << policy << "- using" << STR_TBP_Emit;
        m_trailingBasal = TBP_EmitOpenEnded;
    }
    m_scanDelay = initPositivePref(STR_SCAN_DelayMs, 200);
    m_scanTimeout = initPositivePref(STR_SCAN_TimeoutMs, 5000);

    QString appData = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    m_logDirectory = initPref(STR_LOG_Directory, QDir(appData).filePath("logs")).toString();
    m_logMaxPrevious = initPositivePref(STR_LOG_MaxPrevious, 4);
}

QVariant AppSettings::initPref(const QString & key, const QVariant & defaultValue)
{
    if (!m_settings.contains(key)) {
        m_settings.setValue(key, defaultValue);
    }
    return m_settings.value(key, defaultValue);
}

int AppSettings::initPositivePref(const QString & key, int defaultValue)
{
    bool ok;
    int value = initPref(key, defaultValue).toInt(&ok);
    if (!ok || value <= 0) {
        qWarning().noquote() << "Invalid" << key << m_settings.value(key).toString() << "- using" << defaultValue;
        value = defaultValue;
    }
    return value;
}

void AppSettings::setTrailingBasalPolicy(TrailingBasalPolicy policy)
{
    m_trailingBasal = policy;
    m_settings.setValue(STR_SIM_TrailingBasalPolicy, policyName(policy));
}

void AppSettings::setScanDelay(int msecs)
{
    m_scanDelay = msecs;
    m_settings.setValue(STR_SCAN_DelayMs, msecs);
}

void AppSettings::setScanTimeout(int msecs)
{
    m_scanTimeout = msecs;
    m_settings.setValue(STR_SCAN_TimeoutMs, msecs);
}

void AppSettings::setLogDirectory(const QString & path)
{
    m_logDirectory = path;
    m_settings.setValue(STR_LOG_Directory, path);
}

SimulatorConfig AppSettings::simulatorConfig() const
{
    SimulatorConfig config;
    config.trailingBasal = m_trailingBasal;
    return config;
}

QString AppSettings::policyName(TrailingBasalPolicy policy)
{
    return policy == TBP_Drop ? STR_TBP_Drop : STR_TBP_Emit;
}

bool AppSettings::policyFromName(const QString & name, TrailingBasalPolicy & policy)
{
    if (name.compare(STR_TBP_Emit, Qt::CaseInsensitive) == 0) {
        policy = TBP_EmitOpenEnded;
        return true;
    }
    if (name.compare(STR_TBP_Drop, Qt::CaseInsensitive) == 0) {
        policy = TBP_Drop;
        return true;
    }
    return false;
}
