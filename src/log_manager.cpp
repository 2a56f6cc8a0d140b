#include "log_manager.h"
#include "file_utils.h"
#include <QDebug>
#include <QMutexLocker>
#include <QCoreApplication>
#include <QStandardPaths>
#include <cstdio>
#include <cstdlib>

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(FLUSH_INTERVAL_MS);
    connect(&m_flushTimer, &QTimer::timeout, this, &LogManager::flushPending);

    // Persistent log under the per-user data directory, next to the executable as a fallback
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dir.isEmpty() || !FileUtils::ensureDirectory(dir)) {
        dir = QCoreApplication::applicationDirPath();
    }
    setLogFile(dir + "/audio2video.log");
}

LogManager::~LogManager() {
    flushPending();
    if (m_ts.device()) {
        m_ts.flush();
    }
}

bool LogManager::setLogFile(const QString& path) {
    QMutexLocker locker(&m_mutex);
    if (m_ts.device()) {
        m_ts.flush();
        m_ts.setDevice(nullptr);
    }
    if (m_file.isOpen()) m_file.close();
    m_pendingFlush = false;

    m_file.setFileName(path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "[LogManager] cannot open %s\n", path.toLocal8Bit().constData());
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start " << QDateTime::currentDateTime().toString(Qt::ISODate) << " ---\n";
    m_ts.flush();
    return true;
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

QStringList LogManager::recent(int count) const {
    QMutexLocker locker(&m_mutex);
    if (count >= m_logs.size()) return m_logs;
    return m_logs.mid(m_logs.size() - count);
}

void LogManager::addLog(const QString& message, const QString& level) {
    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        logEntry = QString("[%1] [%2] %3").arg(timestamp, level, message);
        m_logs.append(logEntry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }
        if (m_ts.device()) {
            m_ts << logEntry << '\n';
        }
    } // unlock before emitting so receivers may log themselves

    emit logAdded(logEntry);
    scheduleFlush(level);
}

void LogManager::flushPending() {
    QMutexLocker locker(&m_mutex);
    if (!m_ts.device()) {
        m_pendingFlush = false;
        return;
    }
    if (m_pendingFlush) {
        m_ts.flush();
        m_pendingFlush = false;
    }
}

bool LogManager::shouldFlushImmediately(const QString& level) const {
    const QString upper = level.toUpper();
    return upper == "WARN" || upper == "ERROR" || upper == "FATAL";
}

void LogManager::scheduleFlush(const QString& level) {
    {
        QMutexLocker locker(&m_mutex);
        if (!m_ts.device()) {
            return;
        }
        m_pendingFlush = true;
    }

    if (shouldFlushImmediately(level)) {
        m_flushTimer.stop();
        flushPending();
        return;
    }

    m_flushTimer.start(FLUSH_INTERVAL_MS);
}

void LogManager::clear() {
    QMutexLocker locker(&m_mutex);
    m_logs.clear();
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    QString level;
    switch (type) {
        case QtDebugMsg:
            level = "DEBUG";
            break;
        case QtInfoMsg:
            level = "INFO";
            break;
        case QtWarningMsg:
            level = "WARN";
            break;
        case QtCriticalMsg:
            level = "ERROR";
            break;
        case QtFatalMsg:
            level = "FATAL";
            break;
    }

    // Messages arrive from worker threads too; hand them to the log manager's thread.
    QString levelCopy = level;
    QString msgCopy = msg;
    QMetaObject::invokeMethod(&LogManager::instance(), [levelCopy, msgCopy]() {
        LogManager::instance().addLog(msgCopy, levelCopy);
    }, Qt::QueuedConnection);

    const bool severe = type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg;
    if (LogManager::instance().echoToStderr() || severe) {
        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        fprintf(stderr, "[%s] [%s] %s\n",
                timestamp.toLocal8Bit().constData(),
                levelCopy.toLocal8Bit().constData(),
                msgCopy.toLocal8Bit().constData());
        fflush(stderr);
    }

    if (type == QtFatalMsg) {
        abort();
    }
}
