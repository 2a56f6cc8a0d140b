#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QDateTime>
#include <QFile>
#include <QTextStream>
#include <QTimer>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    QStringList logs() const;
    QStringList recent(int count) const;
    QString logFilePath() const { return m_file.fileName(); }

    // Switches the persistent log to another file; the previous one is flushed and closed.
    bool setLogFile(const QString& path);
    void setEchoToStderr(bool echo) { m_echo = echo; }
    bool echoToStderr() const { return m_echo; }

    Q_INVOKABLE void addLog(const QString& message, const QString& level = "INFO");
    Q_INVOKABLE void clear();

    static constexpr int MAX_LOGS = 1000;

signals:
    void logAdded(const QString& message);

private:
    explicit LogManager(QObject* parent = nullptr);
    void flushPending();
    void scheduleFlush(const QString& level);
    bool shouldFlushImmediately(const QString& level) const;

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    QTimer m_flushTimer;
    bool m_pendingFlush = false;
    bool m_echo = true;
    static constexpr int FLUSH_INTERVAL_MS = 250;
};

// Message handler for qDebug/qInfo/qWarning/qCritical: feeds LogManager and mirrors to stderr.
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
