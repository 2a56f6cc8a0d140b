#pragma once

#include <QHash>
#include <QObject>
#include <QStringList>
#include <QVector>

#include <memory>

#include "conversion_executor.h"
#include "job_queue.h"
#include "output_path_resolver.h"

class DurationResolver;
class JobRunner;
class QThread;

// Drives the job queue: at most maxConcurrentJobs jobs run at once, each on its
// own worker thread. Control calls return immediately; their effects arrive
// through the signals below. All public methods must be called from the thread
// the controller lives on.
class ConversionController : public QObject {
    Q_OBJECT
public:
    enum class StartResult { Started, AlreadyRunning, NothingQueued, MissingCoverImage, EmptyAudioList, OutputDirUnavailable };
    Q_ENUM(StartResult)

    struct Options {
        QString encoderPath = QStringLiteral("ffmpeg");
        int maxConcurrentJobs = 1;
        int gracePeriodMs = kDefaultGracePeriodMs;
        int logTailLines = kDefaultLogTailLines;
    };

    static constexpr int kMaxConcurrentJobs = 8;

    // A null resolver probes with the ffprobe found next to the encoder; a null
    // factory runs FfmpegExecutor.
    explicit ConversionController(const Options& options = Options(),
                                  std::shared_ptr<const DurationResolver> durationResolver = nullptr,
                                  ExecutorFactory executorFactory = nullptr,
                                  QObject* parent = nullptr);
    ~ConversionController() override;

    // Cover used by jobs that start from now on; running jobs keep theirs.
    void setCoverImage(const QString& path);
    QString coverImage() const { return m_coverImage; }

    void setOutputDirectory(const QString& dir);
    QString outputDirectory() const { return m_outputDir; }

    void setMaxConcurrentJobs(int count);
    int maxConcurrentJobs() const { return m_options.maxConcurrentJobs; }

    QVector<JobId> addAudioFiles(const QStringList& paths);

    StartResult start();
    QueueResult cancel(JobId id);
    // Cancels every Queued and Running job. Jobs submitted before the queue
    // drains stay Queued until the next start().
    void cancelAll();
    // Returns the id of the new job, or 0 if the job is not Failed/Cancelled.
    JobId retry(JobId id);
    QueueResult remove(JobId id);
    ClearResult clearAll();

    bool isRunning() const { return m_running; }
    int runningCount() const { return m_active.size(); }
    const JobQueue& queue() const { return m_queue; }
    ConversionJob job(JobId id) const;
    const OutputPathResolver& pathResolver() const { return m_paths; }

    static QString startResultName(StartResult result);

signals:
    void jobSubmitted(JobId id);
    void jobStatusChanged(JobId id, JobStatus status, const QString& errorText);
    // fraction in [0,1], or kIndeterminateProgress
    void jobProgressChanged(JobId id, double fraction);
    void jobOutputResolved(JobId id, const QString& outputPath);
    void jobLogLine(JobId id, const QString& line);
    void queueDrained();
    void queueHalted(const QString& reason);

private slots:
    void onRunnerPrepared(JobId id, const QString& outputPath, qint64 durationMs);
    void onRunnerProgress(JobId id, const ProgressSnapshot& snapshot);
    void onRunnerLogLine(JobId id, const QString& line);
    void onRunnerFinished(JobId id, const ExecutionOutcome& outcome);

private:
    struct ActiveJob {
        QThread* thread = nullptr;
        JobRunner* runner = nullptr;
    };

    void scheduleNext();
    void launch(JobId id);
    void halt(const ExecutionOutcome& cause);
    bool applyStatus(ConversionJob& job, JobStatus to);
    void checkDrained();

    Options m_options;
    std::shared_ptr<const DurationResolver> m_durations;
    ExecutorFactory m_executorFactory;
    OutputPathResolver m_paths;
    JobQueue m_queue;
    QHash<JobId, ActiveJob> m_active;
    QList<QThread*> m_retiring;        // quit, not yet finished
    QString m_coverImage;
    QString m_outputDir;
    bool m_running = false;
    bool m_halted = false;
    bool m_stopping = false;          // cancelAll() issued, waiting for running jobs to finish
};
