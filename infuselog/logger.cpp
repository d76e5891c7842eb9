/* InfuseLog Logger module implementation
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include "logger.h"
#include <cstdio>
#include <cstdlib>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

QThreadPool * otherThreadPool = nullptr;
LogThread * logger = nullptr;

static const char* messagePrefix(QtMsgType type)
{
    switch (type) {
    case QtWarningMsg:  return "Warning: ";
    case QtCriticalMsg: return "Critical: ";
    case QtFatalMsg:    return "Fatal: ";
    case QtInfoMsg:     return "Info: ";
    default:            return "Debug: ";
    }
}

void MyOutputHandler(QtMsgType type, const QMessageLogContext &context, const QString &msgtxt)
{
    Q_UNUSED(context)

    if (!logger) {
        fprintf(stderr, "Pre/Post: %s\n", msgtxt.toLocal8Bit().constData());
        return;
    }

    QString msg = QLatin1String(messagePrefix(type)) + msgtxt;
    if (logger->isRunning()) {
        logger->append(msg);
    } else {
        fprintf(stderr, "%s\n", msg.toLocal8Bit().constData());
    }

    if (type == QtFatalMsg) {
        abort();
    }
}

static QMutex s_LoggerRunning;

void initializeLogger()
{
    if (logger) {
        qWarning() << "Logging thread already started";
        return;
    }
    s_LoggerRunning.lock();  // lock until the thread starts running
    logger = new LogThread();
    otherThreadPool = new QThreadPool();
    bool b = otherThreadPool->tryStart(logger);
    if (b) {
        s_LoggerRunning.lock();  // wait until the thread begins running
    }
    s_LoggerRunning.unlock();
    qInstallMessageHandler(MyOutputHandler);
    if (b) {
        qDebug() << "Started logging thread";
    } else {
        qWarning() << "Logging thread did not start correctly";
    }
}

void shutdownLogger()
{
    if (logger) {
        logger->quit();
        // The thread is automatically destroyed when its run() method exits.
        otherThreadPool->waitForDone(-1);
        logger = nullptr;
    }
    delete otherThreadPool;
    otherThreadPool = nullptr;
}

LogThread::LogThread()
    : QRunnable(), running(false), m_logFile(nullptr), m_logStream(nullptr), m_fileFailed(false)
{
    logtime.start();
}

LogThread::~LogThread()
{
    QMutexLocker lock(&strlock);

    Q_ASSERT(running == false);
    if (m_logStream) {
        m_logStream->flush();
        delete m_logStream;
        m_logStream = nullptr;
    }
    delete m_logFile;
    m_logFile = nullptr;
}

bool LogThread::logToFile(const QString & logDir, int maxPrevious)
{
    if (m_logStream) {
        qWarning().noquote() << "Already logging to" << m_logFile->fileName();
        return false;
    }

    QString debugLog = GetLogDir(logDir) + "/debug.txt";
    rotateLogs(debugLog, maxPrevious);  // keep a limited set of previous logs

    strlock.lock();
    m_logFile = new QFile(debugLog);
    if (m_logFile->open(QFile::WriteOnly | QFile::Truncate | QFile::Text)) {
        m_logStream = new QTextStream(m_logFile);
        m_fileFailed = false;
    } else {
        delete m_logFile;
        m_logFile = nullptr;
        // Nothing will ever drain the buffer, so stop holding on to lines.
        m_fileFailed = true;
        buffer.clear();
    }
    logTrigger.wakeAll();
    strlock.unlock();

    if (m_logStream) {
        qDebug().noquote() << "Logging to" << debugLog;
        return true;
    }
    qWarning().noquote() << "Unable to open" << debugLog;
    return false;
}

QString LogThread::logFileName()
{
    QMutexLocker lock(&strlock);
    if (!m_logFile) {
        return "";
    }
    return m_logFile->fileName();
}

void LogThread::append(QString msg)
{
    QString tmp = QString("%1: %2").arg(logtime.elapsed(), 5, 10, QChar('0')).arg(msg);
    appendClean(tmp);
}

void LogThread::appendClean(QString msg)
{
    fprintf(stderr, "%s\n", msg.toLocal8Bit().constData());
    strlock.lock();
    if (!m_fileFailed) {
        buffer.append(msg);
        logTrigger.wakeAll();
    }
    strlock.unlock();
}

int LogThread::pendingLines()
{
    QMutexLocker lock(&strlock);
    return buffer.size();
}

void LogThread::quit()
{
    qDebug() << "Shutting down logging thread";
    qInstallMessageHandler(0);  // Remove our logger.

    strlock.lock();
    running = false;       // Force the thread to exit after its next iteration.
    logTrigger.wakeAll();  // Trigger the final flush.
    strlock.unlock();      // Release the lock so that the thread can complete.
}

void LogThread::run()
{
    QMutexLocker lock(&strlock);

    running = true;
    s_LoggerRunning.unlock();  // unlock as soon as the thread begins to run
    do {
        logTrigger.wait(&strlock);  // releases strlock while it waits
        while (m_logStream && !buffer.isEmpty()) {
            QString msg = buffer.takeFirst();
            *m_logStream << msg << "\n";
        }
        if (m_logStream) {
            m_logStream->flush();
        }
    } while (running);

    // strlock will be released when lock goes out of scope
}


QString GetLogDir(const QString & baseDir)
{
    QDir base(baseDir);
    if (!base.exists() && !base.mkpath(".")) {
        qWarning() << "Unable to create" << base.absolutePath() << "reverting to" << QDir::currentPath();
        return QDir::current().canonicalPath();
    }
    return base.canonicalPath();
}

// Rotated copies of debug.txt are named debug.0.txt (newest) through debug.<maxPrevious-1>.txt.
static QString rotatedName(const QFileInfo & info, int index)
{
    QString name = info.baseName();
    if (index >= 0) {
        name += QString(".%1").arg(index);
    }
    if (!info.completeSuffix().isEmpty()) {
        name += "." + info.completeSuffix();
    }
    return info.dir().filePath(name);
}

void rotateLogs(const QString & filePath, int maxPrevious)
{
    QFileInfo info(filePath);
    if (!info.dir().exists()) {
        qWarning() << "Skipping log rotation, directory does not exist:" << info.absoluteFilePath();
        return;
    }
    maxPrevious = qMax(maxPrevious, 0);

    // The oldest copy falls off the end.
    QString expired = rotatedName(info, maxPrevious - 1);
    if (QFile::exists(expired) && !QFile::remove(expired)) {
        qWarning() << "Unable to delete expired log file" << expired;
    }

    // Everything else moves up one slot; index -1 is the current log.
    for (int i = maxPrevious - 2; i >= -1; i--) {
        QString from = rotatedName(info, i);
        QString to = rotatedName(info, i + 1);
        if (!QFile::exists(from)) {
            continue;
        }
        if (QFile::exists(to)) {
            qWarning() << "Unable to rotate log:" << to << "exists";
        } else if (!QFile::rename(from, to)) {
            qWarning() << "Unable to rename" << from << "to" << to;
        }
    }
}
