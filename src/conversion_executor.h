#pragma once

#include <QMetaType>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>

#include "conversion_job.h"
#include "progress_parser.h"

// Everything needed to run one encode. Paths are absolute.
struct ConversionRequest {
    JobId jobId = 0;
    QString encoderPath;
    QString coverImagePath;
    QString audioPath;
    QString outputPath;
    qint64 durationMs = kUnknownDuration;
    int gracePeriodMs = kDefaultGracePeriodMs;
    int logTailLines = kDefaultLogTailLines;
};

enum class OutcomeKind { Succeeded, Failed, Cancelled };

struct ExecutionOutcome {
    OutcomeKind kind = OutcomeKind::Failed;
    ConversionError error = ConversionError::None;
    QString message;
    QStringList logTail;
    int exitCode = 0;

    static ExecutionOutcome success()
    {
        ExecutionOutcome o;
        o.kind = OutcomeKind::Succeeded;
        return o;
    }
    static ExecutionOutcome failure(ConversionError error, const QString& message,
                                    const QStringList& logTail = QStringList())
    {
        ExecutionOutcome o;
        o.kind = OutcomeKind::Failed;
        o.error = error;
        o.message = message;
        o.logTail = logTail;
        return o;
    }
    static ExecutionOutcome cancelled(const QStringList& logTail = QStringList())
    {
        ExecutionOutcome o;
        o.kind = OutcomeKind::Cancelled;
        o.error = ConversionError::Cancelled;
        o.logTail = logTail;
        return o;
    }
};

Q_DECLARE_METATYPE(ExecutionOutcome)

// Runs a single encode out of process. An executor is used once: start() is
// called at most one time, finished() is emitted exactly once afterwards, and
// progressed() snapshots arrive in the order the encoder produced them.
// cancel() may be called at any point; the outcome is then Cancelled once the
// encoder is gone.
class ConversionExecutor : public QObject {
    Q_OBJECT
public:
    explicit ConversionExecutor(QObject* parent = nullptr) : QObject(parent) {}
    ~ConversionExecutor() override = default;

    virtual void start(const ConversionRequest& request) = 0;
    virtual void cancel() = 0;

signals:
    void progressed(const ProgressSnapshot& snapshot);
    void diagnosticLine(const QString& line);
    void finished(const ExecutionOutcome& outcome);
};

// Creates an executor on the calling (worker) thread.
using ExecutorFactory = std::function<ConversionExecutor*(QObject* parent)>;
