#include "conversion_job.h"
#include "conversion_executor.h"
#include "progress_parser.h"

#include <QFileInfo>

#include <atomic>

QString jobStatusName(JobStatus status)
{
    switch (status) {
        case JobStatus::Queued: return QStringLiteral("Queued");
        case JobStatus::Running: return QStringLiteral("Running");
        case JobStatus::Completed: return QStringLiteral("Completed");
        case JobStatus::Failed: return QStringLiteral("Failed");
        case JobStatus::Cancelled: return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown");
}

QStringList LogTail::lines() const
{
    QStringList out;
    out.reserve(int(m_lines.count()));
    for (qsizetype i = m_lines.firstIndex(); i <= m_lines.lastIndex(); ++i)
        out << m_lines.at(i);
    return out;
}

bool ConversionJob::isTerminal() const
{
    return status == JobStatus::Completed || status == JobStatus::Failed || status == JobStatus::Cancelled;
}

JobId nextJobId()
{
    static std::atomic<JobId> counter{0};
    return ++counter;
}

ConversionJob makeConversionJob(const QString& audioPath, int logTailLines)
{
    ConversionJob job;
    job.id = nextJobId();
    job.inputAudioPath = QFileInfo(audioPath).absoluteFilePath();
    job.logTail = LogTail(logTailLines);
    return job;
}

void registerConversionMetaTypes()
{
    static std::atomic<bool> done{false};
    if (done.exchange(true)) return;
    qRegisterMetaType<JobId>("JobId");
    qRegisterMetaType<JobStatus>("JobStatus");
    qRegisterMetaType<ConversionError>("ConversionError");
    qRegisterMetaType<ProgressSnapshot>("ProgressSnapshot");
    qRegisterMetaType<ExecutionOutcome>("ExecutionOutcome");
}
