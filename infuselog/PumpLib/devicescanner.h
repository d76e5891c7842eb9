/* PumpLib Device Scanner Header
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef DEVICESCANNER_H
#define DEVICESCANNER_H

#include <functional>
#include <QObject>
#include <QStringList>
#include <QTimer>

/*
 * Device scanner
 *
 * Polls a detection function on a fixed delay until it reports at least one
 * device, reports an error, or the overall timeout elapses. The detection
 * function is injected so that the scanner is independent of how devices are
 * actually found (USB enumeration, serial ports, a test fixture).
 *
 * The detection function fills in the identifiers of the devices it found and
 * returns true, or sets an error message and returns false.
 *
 * All timing runs on the event loop of the thread that owns the scanner.
 */
class DeviceScanner : public QObject
{
    Q_OBJECT

public:
    typedef std::function<bool(QStringList & devices, QString & error)> DetectFunction;

    explicit DeviceScanner(DetectFunction detect, QObject* parent = nullptr);
    virtual ~DeviceScanner();

    void setDelay(int msecs) { m_delay = msecs; }
    void setTimeout(int msecs) { m_timeout = msecs; }
    int delay() const { return m_delay; }
    int timeout() const { return m_timeout; }

    bool isScanning() const { return m_scanning; }
    const QStringList & devices() const { return m_devices; }
    const QString & error() const { return m_error; }
    int attempts() const { return m_attempts; }

public slots:
    void startScanning();
    void stopScanning();

signals:
    void scanningChanged(bool scanning);
    void devicesChanged(const QStringList & devices);
    //! \brief Emitted once per scan; error is empty on success or cancellation.
    void scanFinished(const QString & error);

protected slots:
    void onPoll();
    void onTimeout();

protected:
    void finish(const QString & error);

    DetectFunction m_detect;
    QTimer m_pollTimer;
    QTimer m_timeoutTimer;
    int m_delay;
    int m_timeout;
    bool m_scanning;
    int m_attempts;
    QStringList m_devices;
    QString m_error;
};

#endif // DEVICESCANNER_H
