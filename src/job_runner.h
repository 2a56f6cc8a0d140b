#pragma once

#include <QObject>
#include <QString>

#include <atomic>
#include <memory>

#include "conversion_executor.h"
#include "conversion_job.h"

class DurationResolver;
class OutputPathResolver;

// Shared, read-only inputs for every runner the controller starts.
struct RunnerContext {
    QString encoderPath;
    QString outputDir;
    QString outputExtension = QStringLiteral("mpg");
    int gracePeriodMs = kDefaultGracePeriodMs;
    int logTailLines = kDefaultLogTailLines;
    std::shared_ptr<const DurationResolver> durationResolver;
    OutputPathResolver* pathResolver = nullptr;   // owned by the controller, outlives runners
    ExecutorFactory executorFactory;
};

// Carries one job through preparation and encoding on a worker thread:
// input check, duration probe, output name reservation, then the executor.
// Everything it reports goes out through signals; it never touches the queue.
class JobRunner : public QObject {
    Q_OBJECT
public:
    JobRunner(JobId id, const QString& audioPath, const QString& coverPath,
              const RunnerContext& ctx, QObject* parent = nullptr);
    ~JobRunner() override;

    JobId jobId() const { return m_id; }

    // Safe from any thread. Takes effect between preparation steps, or via
    // the executor's cancellation once the encoder is running.
    void requestCancel();

public slots:
    void run();

signals:
    void prepared(JobId id, const QString& outputPath, qint64 durationMs);
    void progressed(JobId id, const ProgressSnapshot& snapshot);
    void diagnosticLine(JobId id, const QString& line);
    void finished(JobId id, const ExecutionOutcome& outcome);

private:
    void cancelExecutor();
    void complete(const ExecutionOutcome& outcome);

    JobId m_id;
    QString m_audioPath;
    QString m_coverPath;
    QString m_outputPath;
    RunnerContext m_ctx;
    ConversionExecutor* m_executor = nullptr;
    std::atomic<bool> m_cancelRequested{false};
    bool m_done = false;
};
