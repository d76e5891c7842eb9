/* PumpLib Device Scanner Implementation
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <QDebug>

#include "devicescanner.h"

DeviceScanner::DeviceScanner(DetectFunction detect, QObject* parent)
    : QObject(parent), m_detect(detect),
      m_delay(200), m_timeout(5000),
      m_scanning(false), m_attempts(0)
{
    m_timeoutTimer.setSingleShot(true);
    connect(&m_pollTimer, SIGNAL(timeout()), this, SLOT(onPoll()));
    connect(&m_timeoutTimer, SIGNAL(timeout()), this, SLOT(onTimeout()));
}

DeviceScanner::~DeviceScanner()
{
    m_pollTimer.stop();
    m_timeoutTimer.stop();
}

void DeviceScanner::startScanning()
{
    if (m_scanning) {
        return;
    }
    m_scanning = true;
    m_attempts = 0;
    m_error.clear();
    emit scanningChanged(true);

    m_timeoutTimer.start(m_timeout);
    m_pollTimer.start(m_delay);
    // The first poll happens right away rather than after the first delay.
    QMetaObject::invokeMethod(this, "onPoll", Qt::QueuedConnection);
}

void DeviceScanner::stopScanning()
{
    if (m_scanning) {
        qDebug() << "Device scan cancelled after" << m_attempts << "attempts";
        finish(QString());
    }
}

void DeviceScanner::onPoll()
{
    if (!m_scanning) {
        return;  // a queued poll that arrived after the scan ended
    }
    m_attempts++;

    QStringList found;
    QString error;
    if (!m_detect(found, error)) {
        if (error.isEmpty()) {
            error = tr("Device detection failed");
        }
        qWarning().noquote() << "Device detection failed:" << error;
        finish(error);
        return;
    }
    if (found != m_devices) {
        m_devices = found;
        emit devicesChanged(m_devices);
    }
    if (!found.isEmpty()) {
        qDebug().noquote() << "Found" << found.join(", ") << "after" << m_attempts << "attempts";
        finish(QString());
    }
}

void DeviceScanner::onTimeout()
{
    if (m_scanning) {
        finish(tr("No devices found after %1 ms").arg(m_timeout));
    }
}

void DeviceScanner::finish(const QString & error)
{
    m_pollTimer.stop();
    m_timeoutTimer.stop();
    m_scanning = false;
    m_error = error;
    emit scanningChanged(false);
    emit scanFinished(error);
}
