/* InfuseLog Logger module
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef LOGGER_H
#define LOGGER_H

#include <QDebug>
#include <QElapsedTimer>
#include <QMutex>
#include <QRunnable>
#include <QStringList>
#include <QThreadPool>
#include <QWaitCondition>

void initializeLogger();
void shutdownLogger();

//! \brief Return the log directory under baseDir, creating it if needed.
QString GetLogDir(const QString & baseDir);
void rotateLogs(const QString & filePath, int maxPrevious);

void MyOutputHandler(QtMsgType type, const QMessageLogContext &context, const QString &msgtxt);

class LogThread : public QRunnable
{
public:
    explicit LogThread();
    virtual ~LogThread();

    void run();
    void append(QString msg);
    void appendClean(QString msg);
    bool isRunning() { return running; }
    //! \brief Start writing the log to debug.txt in logDir, rotating previous logs.
    bool logToFile(const QString & logDir, int maxPrevious);
    QString logFileName();
    //! \brief Number of lines waiting to be written to the log file.
    int pendingLines();

    void quit();

protected:
    QStringList buffer;
    QMutex strlock;
    volatile bool running;
    QElapsedTimer logtime;
    class QFile* m_logFile;
    class QTextStream* m_logStream;
    bool m_fileFailed;
    QWaitCondition logTrigger;
};

extern LogThread * logger;
extern QThreadPool * otherThreadPool;

#endif // LOGGER_H
