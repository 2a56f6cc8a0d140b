#pragma once

#include <QContiguousCache>
#include <QMetaType>
#include <QString>
#include <QStringList>

#include "conversion_error.h"

using JobId = quint64;

enum class JobStatus { Queued, Running, Completed, Failed, Cancelled };

QString jobStatusName(JobStatus status);

constexpr double kIndeterminateProgress = -1.0;
constexpr qint64 kUnknownDuration = -1;
constexpr int kDefaultLogTailLines = 40;
constexpr int kDefaultGracePeriodMs = 5000;

inline bool isIndeterminate(double progress) { return progress < 0.0; }

// Fixed-capacity history of encoder diagnostic lines. Appending to a full tail
// drops the oldest line.
class LogTail {
public:
    explicit LogTail(int capacity = kDefaultLogTailLines) : m_lines(qMax(1, capacity)) {}

    void append(const QString& line) { m_lines.append(line); }
    void clear() { m_lines.clear(); }

    int capacity() const { return int(m_lines.capacity()); }
    int size() const { return int(m_lines.count()); }
    bool isEmpty() const { return m_lines.isEmpty(); }

    QStringList lines() const;
    QString joined() const { return lines().join(QLatin1Char('\n')); }

private:
    QContiguousCache<QString> m_lines;
};

struct ConversionJob {
    JobId id = 0;
    JobId retryOf = 0;              // 0 for an original submission
    QString inputAudioPath;
    QString coverImagePath;         // snapshot taken when the job starts running
    QString outputPath;             // resolved right before the encoder starts
    JobStatus status = JobStatus::Queued;
    double progress = 0.0;          // [0,1] or kIndeterminateProgress
    qint64 durationMs = kUnknownDuration;
    ConversionError error = ConversionError::None;
    QString errorMessage;
    LogTail logTail;

    bool isTerminal() const;
    bool isValid() const { return id != 0; }
};

// New Queued job for an audio file; the path is made absolute.
ConversionJob makeConversionJob(const QString& audioPath, int logTailLines = kDefaultLogTailLines);

JobId nextJobId();

// Registers the conversion value types for queued signal delivery across threads.
void registerConversionMetaTypes();

Q_DECLARE_METATYPE(JobStatus)
