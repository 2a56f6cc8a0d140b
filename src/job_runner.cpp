#include "job_runner.h"
#include "duration_resolver.h"
#include "ffmpeg_executor.h"
#include "file_utils.h"
#include "output_path_resolver.h"

#include <QDebug>
#include <QFileInfo>

JobRunner::JobRunner(JobId id, const QString& audioPath, const QString& coverPath,
                     const RunnerContext& ctx, QObject* parent)
    : QObject(parent), m_id(id), m_audioPath(audioPath), m_coverPath(coverPath), m_ctx(ctx)
{
}

JobRunner::~JobRunner()
{
    if (!m_done && m_ctx.pathResolver) m_ctx.pathResolver->release(m_outputPath);
}

void JobRunner::requestCancel()
{
    if (m_cancelRequested.exchange(true)) return;
    QMetaObject::invokeMethod(this, &JobRunner::cancelExecutor, Qt::QueuedConnection);
}

void JobRunner::cancelExecutor()
{
    if (m_executor && !m_done) m_executor->cancel();
}

void JobRunner::run()
{
    if (m_cancelRequested) { complete(ExecutionOutcome::cancelled()); return; }

    if (!FileUtils::fileExists(m_audioPath)) {
        complete(ExecutionOutcome::failure(ConversionError::InputMissing,
                                           QString("audio file not found: %1").arg(m_audioPath)));
        return;
    }
    if (!FileUtils::fileExists(m_coverPath)) {
        complete(ExecutionOutcome::failure(ConversionError::InputMissing,
                                           QString("cover image not found: %1").arg(m_coverPath)));
        return;
    }

    qint64 durMs = kUnknownDuration;
    if (m_ctx.durationResolver) {
        QString err;
        if (!m_ctx.durationResolver->resolveDurationMs(m_audioPath, durMs, err, &m_cancelRequested)) {
            durMs = kUnknownDuration;
            if (m_cancelRequested) { complete(ExecutionOutcome::cancelled()); return; }
            qWarning() << "[JobRunner] Job" << m_id << conversionErrorName(ConversionError::ProbeFailed)
                       << "-" << err << "; progress will be indeterminate";
        }
    }

    if (m_cancelRequested) { complete(ExecutionOutcome::cancelled()); return; }

    QString err = QStringLiteral("no output path resolver");
    const QString base = QFileInfo(m_audioPath).completeBaseName();
    if (!m_ctx.pathResolver
        || !m_ctx.pathResolver->reserve(m_ctx.outputDir, base, m_ctx.outputExtension, m_outputPath, err)) {
        m_outputPath.clear();
        complete(ExecutionOutcome::failure(ConversionError::NamingCollisionExhausted, err));
        return;
    }

    emit prepared(m_id, m_outputPath, durMs);

    ConversionRequest req;
    req.jobId = m_id;
    req.encoderPath = m_ctx.encoderPath;
    req.coverImagePath = m_coverPath;
    req.audioPath = m_audioPath;
    req.outputPath = m_outputPath;
    req.durationMs = durMs;
    req.gracePeriodMs = m_ctx.gracePeriodMs;
    req.logTailLines = m_ctx.logTailLines;

    m_executor = m_ctx.executorFactory ? m_ctx.executorFactory(this) : new FfmpegExecutor(this);
    connect(m_executor, &ConversionExecutor::progressed, this,
            [this](const ProgressSnapshot& s) { emit progressed(m_id, s); });
    connect(m_executor, &ConversionExecutor::diagnosticLine, this,
            [this](const QString& line) { emit diagnosticLine(m_id, line); });
    connect(m_executor, &ConversionExecutor::finished, this, &JobRunner::complete);

    m_executor->start(req);

    // A cancel that raced with the steps above is applied now.
    if (m_cancelRequested) cancelExecutor();
}

void JobRunner::complete(const ExecutionOutcome& outcome)
{
    if (m_done) return;
    m_done = true;
    if (m_ctx.pathResolver) m_ctx.pathResolver->release(m_outputPath);
    emit finished(m_id, outcome);
}
