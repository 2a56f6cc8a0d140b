#include "conversion_controller.h"
#include "duration_resolver.h"
#include "file_utils.h"
#include "job_runner.h"
#include "job_state_machine.h"
#include "media_types.h"
#include "tool_locator.h"

#include <QDebug>
#include <QFileInfo>
#include <QThread>

#include <algorithm>

ConversionController::ConversionController(const Options& options,
                                           std::shared_ptr<const DurationResolver> durationResolver,
                                           ExecutorFactory executorFactory,
                                           QObject* parent)
    : QObject(parent),
      m_options(options),
      m_durations(std::move(durationResolver)),
      m_executorFactory(std::move(executorFactory))
{
    registerConversionMetaTypes();
    m_options.maxConcurrentJobs = std::clamp(m_options.maxConcurrentJobs, 1, kMaxConcurrentJobs);
    if (!m_durations) {
        m_durations = std::make_shared<DurationResolver>(
            ToolLocator::locateFfprobe(QString(), m_options.encoderPath), m_options.encoderPath);
    }
}

ConversionController::~ConversionController()
{
    // Shutdown: runners still going are cancelled and their threads joined.
    // The executor's destructor reaps any encoder that is still alive.
    for (auto it = m_active.begin(); it != m_active.end(); ++it) {
        disconnect(it->runner, nullptr, this, nullptr);
        it->runner->requestCancel();
        it->thread->quit();
    }
    for (auto it = m_active.begin(); it != m_active.end(); ++it) {
        it->thread->wait();
        delete it->thread;
    }
    m_active.clear();
    for (QThread* t : std::as_const(m_retiring)) t->wait();
}

QString ConversionController::startResultName(StartResult result)
{
    switch (result) {
        case StartResult::Started: return QStringLiteral("Started");
        case StartResult::AlreadyRunning: return QStringLiteral("AlreadyRunning");
        case StartResult::NothingQueued: return QStringLiteral("NothingQueued");
        case StartResult::MissingCoverImage: return QStringLiteral("MissingCoverImage");
        case StartResult::EmptyAudioList: return QStringLiteral("EmptyAudioList");
        case StartResult::OutputDirUnavailable: return QStringLiteral("OutputDirUnavailable");
    }
    return QStringLiteral("Unknown");
}

void ConversionController::setCoverImage(const QString& path)
{
    m_coverImage = path.isEmpty() ? QString() : QFileInfo(path).absoluteFilePath();
}

void ConversionController::setOutputDirectory(const QString& dir)
{
    m_outputDir = dir.isEmpty() ? QString() : QFileInfo(dir).absoluteFilePath();
}

void ConversionController::setMaxConcurrentJobs(int count)
{
    m_options.maxConcurrentJobs = std::clamp(count, 1, kMaxConcurrentJobs);
    if (m_running) scheduleNext();
}

ConversionJob ConversionController::job(JobId id) const
{
    const ConversionJob* j = m_queue.find(id);
    return j ? *j : ConversionJob();
}

QVector<JobId> ConversionController::addAudioFiles(const QStringList& paths)
{
    QVector<JobId> ids;
    for (const QString& p : paths) {
        if (p.isEmpty()) continue;
        const JobId id = m_queue.append(makeConversionJob(p, m_options.logTailLines));
        ids.push_back(id);
        emit jobSubmitted(id);
    }
    if (m_running && !m_halted) scheduleNext();
    return ids;
}

ConversionController::StartResult ConversionController::start()
{
    if (m_running) return StartResult::AlreadyRunning;
    if (m_queue.isEmpty()) return StartResult::EmptyAudioList;
    if (m_coverImage.isEmpty() || !FileUtils::fileExists(m_coverImage) || !MediaTypes::isReadableImage(m_coverImage)) {
        qWarning() << "[Controller] Cover image missing or unreadable:" << m_coverImage;
        return StartResult::MissingCoverImage;
    }
    if (m_queue.countWithStatus(JobStatus::Queued) == 0) return StartResult::NothingQueued;
    if (!FileUtils::ensureDirectory(m_outputDir)) {
        qWarning() << "[Controller] Output directory unavailable:" << m_outputDir;
        return StartResult::OutputDirUnavailable;
    }

    qInfo() << "[Controller] Starting" << m_queue.countWithStatus(JobStatus::Queued) << "job(s), up to"
            << m_options.maxConcurrentJobs << "at a time, into" << m_outputDir;
    m_running = true;
    m_halted = false;
    m_stopping = false;
    scheduleNext();
    return StartResult::Started;
}

void ConversionController::scheduleNext()
{
    while (m_running && !m_halted && !m_stopping && m_active.size() < m_options.maxConcurrentJobs) {
        const ConversionJob* next = m_queue.nextQueued();
        if (!next) break;
        launch(next->id);
    }
    checkDrained();
}

bool ConversionController::applyStatus(ConversionJob& job, JobStatus to)
{
    if (!JobStateMachine::transition(job, to)) return false;
    emit jobStatusChanged(job.id, job.status, job.errorMessage);
    return true;
}

void ConversionController::launch(JobId id)
{
    ConversionJob* job = m_queue.find(id);
    if (!job) return;
    job->coverImagePath = m_coverImage;
    job->outputPath.clear();
    job->durationMs = kUnknownDuration;
    job->progress = kIndeterminateProgress;
    if (!JobStateMachine::transition(*job, JobStatus::Running)) return;
    const QString audioPath = job->inputAudioPath;
    const QString coverPath = job->coverImagePath;
    qInfo() << "[Controller] Job" << id << "running:" << audioPath << "cover" << coverPath;

    RunnerContext ctx;
    ctx.encoderPath = m_options.encoderPath;
    ctx.outputDir = m_outputDir;
    ctx.gracePeriodMs = m_options.gracePeriodMs;
    ctx.logTailLines = m_options.logTailLines;
    ctx.durationResolver = m_durations;
    ctx.pathResolver = &m_paths;
    ctx.executorFactory = m_executorFactory;

    auto* runner = new JobRunner(id, audioPath, coverPath, ctx);
    auto* thread = new QThread(this);
    runner->moveToThread(thread);

    connect(thread, &QThread::started, runner, &JobRunner::run);
    connect(thread, &QThread::finished, runner, &QObject::deleteLater);
    connect(runner, &JobRunner::prepared, this, &ConversionController::onRunnerPrepared);
    connect(runner, &JobRunner::progressed, this, &ConversionController::onRunnerProgress);
    connect(runner, &JobRunner::diagnosticLine, this, &ConversionController::onRunnerLogLine);
    connect(runner, &JobRunner::finished, this, &ConversionController::onRunnerFinished);

    // Registered as active before anyone hears of it: slots connected to the
    // status signal may cancel it or submit more work.
    m_active.insert(id, ActiveJob{thread, runner});
    emit jobStatusChanged(id, JobStatus::Running, QString());
    thread->start();
}

void ConversionController::onRunnerPrepared(JobId id, const QString& outputPath, qint64 durationMs)
{
    ConversionJob* j = m_queue.find(id);
    if (!j || j->status != JobStatus::Running) return;
    j->outputPath = outputPath;
    j->durationMs = durationMs;
    j->progress = durationMs > 0 ? 0.0 : kIndeterminateProgress;
    emit jobOutputResolved(id, outputPath);
    emit jobProgressChanged(id, j->progress);
}

void ConversionController::onRunnerProgress(JobId id, const ProgressSnapshot& snapshot)
{
    ConversionJob* j = m_queue.find(id);
    if (!j || j->status != JobStatus::Running) return;
    if (snapshot.isIndeterminate()) {
        j->progress = kIndeterminateProgress;
    } else {
        const double prev = isIndeterminate(j->progress) ? 0.0 : j->progress;
        j->progress = std::clamp(std::max(prev, snapshot.fraction), 0.0, 1.0);
    }
    emit jobProgressChanged(id, j->progress);
}

void ConversionController::onRunnerLogLine(JobId id, const QString& line)
{
    if (ConversionJob* j = m_queue.find(id)) j->logTail.append(line);
    qDebug().noquote() << "[ffmpeg:" << id << "]" << line;
    emit jobLogLine(id, line);
}

void ConversionController::onRunnerFinished(JobId id, const ExecutionOutcome& outcome)
{
    const auto it = m_active.find(id);
    if (it != m_active.end()) {
        QThread* thread = it->thread;
        m_retiring.append(thread);
        connect(thread, &QThread::finished, this, [this, thread]() {
            m_retiring.removeOne(thread);
            thread->deleteLater();
        });
        thread->quit();
        m_active.erase(it);
    }

    ConversionJob* j = m_queue.find(id);
    if (j && j->status == JobStatus::Running) {
        switch (outcome.kind) {
            case OutcomeKind::Succeeded:
                qInfo() << "[Controller] Job" << id << "completed:" << j->outputPath;
                // Completed pins progress to 1.0; the final reading follows the status change.
                if (applyStatus(*j, JobStatus::Completed)) emit jobProgressChanged(id, 1.0);
                break;
            case OutcomeKind::Cancelled:
                applyStatus(*j, JobStatus::Cancelled);
                qInfo() << "[Controller] Job" << id << "cancelled";
                break;
            case OutcomeKind::Failed:
                j->error = outcome.error;
                j->errorMessage = outcome.message;
                // The executor's own tail is authoritative for failures raised after spawn.
                if (!outcome.logTail.isEmpty()) {
                    j->logTail.clear();
                    for (const QString& line : outcome.logTail) j->logTail.append(line);
                }
                applyStatus(*j, JobStatus::Failed);
                qWarning() << "[Controller] Job" << id << "failed:" << conversionErrorName(outcome.error)
                           << outcome.message;
                break;
        }
    }

    if (outcome.kind == OutcomeKind::Failed && isQueueFatal(outcome.error)) {
        halt(outcome);
    }
    scheduleNext();
}

void ConversionController::halt(const ExecutionOutcome& cause)
{
    if (m_halted) return;
    m_halted = true;
    qCritical() << "[Controller] Queue halted:" << cause.message;
    for (const JobId id : m_queue.idsWithStatus(JobStatus::Queued)) {
        ConversionJob* j = m_queue.find(id);
        if (!j) continue;
        j->error = cause.error;
        j->errorMessage = cause.message;
        applyStatus(*j, JobStatus::Failed);
    }
    emit queueHalted(cause.message);
}

void ConversionController::checkDrained()
{
    if (!m_running || !m_active.isEmpty()) return;
    if (!m_halted && !m_stopping && m_queue.nextQueued()) return;
    m_running = false;
    m_stopping = false;
    qInfo() << "[Controller] Queue drained:" << m_queue.countWithStatus(JobStatus::Completed) << "completed,"
            << m_queue.countWithStatus(JobStatus::Failed) << "failed,"
            << m_queue.countWithStatus(JobStatus::Cancelled) << "cancelled";
    emit queueDrained();
}

QueueResult ConversionController::cancel(JobId id)
{
    ConversionJob* j = m_queue.find(id);
    if (!j) return QueueResult::NotFound;

    switch (j->status) {
        case JobStatus::Queued:
            applyStatus(*j, JobStatus::Cancelled);
            qInfo() << "[Controller] Job" << id << "cancelled before start";
            checkDrained();
            return QueueResult::Ok;
        case JobStatus::Running: {
            const auto it = m_active.constFind(id);
            if (it != m_active.constEnd()) it->runner->requestCancel();
            return QueueResult::Ok;
        }
        default:
            return QueueResult::InvalidState;
    }
}

void ConversionController::cancelAll()
{
    // Nothing new starts until the cancelled runners have wound down and the queue drains.
    if (m_running) m_stopping = true;
    for (const JobId id : m_queue.idsWithStatus(JobStatus::Queued)) {
        if (ConversionJob* j = m_queue.find(id)) applyStatus(*j, JobStatus::Cancelled);
    }
    for (auto it = m_active.constBegin(); it != m_active.constEnd(); ++it) it->runner->requestCancel();
    checkDrained();
}

JobId ConversionController::retry(JobId id)
{
    const ConversionJob* j = m_queue.find(id);
    if (!j || (j->status != JobStatus::Failed && j->status != JobStatus::Cancelled)) return 0;

    const JobId newId = m_queue.append(JobStateMachine::makeRetry(*j));
    qInfo() << "[Controller] Job" << id << "retried as job" << newId;
    emit jobSubmitted(newId);
    if (m_running && !m_halted) scheduleNext();
    return newId;
}

QueueResult ConversionController::remove(JobId id)
{
    const QueueResult r = m_queue.remove(id);
    if (r == QueueResult::JobBusy) qWarning() << "[Controller] Job" << id << "is running and cannot be removed";
    if (r == QueueResult::Ok) checkDrained();
    return r;
}

ClearResult ConversionController::clearAll()
{
    int removed = 0;
    const ClearResult r = m_queue.clear(&removed);
    qInfo() << "[Controller] Cleared" << removed << "job(s)"
            << (r == ClearResult::PartialClear ? "; running jobs kept" : "");
    checkDrained();
    return r;
}
