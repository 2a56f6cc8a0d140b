#include "job_state_machine.h"

#include <QDebug>

namespace JobStateMachine {

bool isTerminal(JobStatus status)
{
    return status == JobStatus::Completed || status == JobStatus::Failed || status == JobStatus::Cancelled;
}

bool canTransition(JobStatus from, JobStatus to)
{
    switch (from) {
        case JobStatus::Queued:
            return to == JobStatus::Running || to == JobStatus::Cancelled || to == JobStatus::Failed;
        case JobStatus::Running:
            return to == JobStatus::Completed || to == JobStatus::Failed || to == JobStatus::Cancelled;
        case JobStatus::Completed:
        case JobStatus::Failed:
        case JobStatus::Cancelled:
            return false;
    }
    return false;
}

bool transition(ConversionJob& job, JobStatus to, QString* err)
{
    if (!canTransition(job.status, to)) {
        const QString msg = QString("illegal transition %1 -> %2 for job %3")
                                .arg(jobStatusName(job.status), jobStatusName(to))
                                .arg(job.id);
        qWarning() << "[JobStateMachine]" << msg;
        if (err) *err = msg;
        return false;
    }

    job.status = to;
    switch (to) {
        case JobStatus::Completed:
            job.progress = 1.0;
            job.error = ConversionError::None;
            job.errorMessage.clear();
            break;
        case JobStatus::Cancelled:
            job.error = ConversionError::None;
            job.errorMessage.clear();
            break;
        default:
            break;
    }
    return true;
}

ConversionJob makeRetry(const ConversionJob& original)
{
    ConversionJob fresh = makeConversionJob(original.inputAudioPath, original.logTail.capacity());
    fresh.retryOf = original.id;
    return fresh;
}

} // namespace JobStateMachine
