#include "job_queue.h"

#include <algorithm>

QString queueResultName(QueueResult result)
{
    switch (result) {
        case QueueResult::Ok: return QStringLiteral("Ok");
        case QueueResult::NotFound: return QStringLiteral("NotFound");
        case QueueResult::JobBusy: return QStringLiteral("JobBusy");
        case QueueResult::InvalidState: return QStringLiteral("InvalidState");
    }
    return QStringLiteral("Unknown");
}

JobId JobQueue::append(ConversionJob job)
{
    if (job.id == 0) job.id = nextJobId();
    job.status = JobStatus::Queued;
    const JobId id = job.id;
    m_jobs.push_back(std::move(job));
    return id;
}

QueueResult JobQueue::remove(JobId id)
{
    auto it = std::find_if(m_jobs.begin(), m_jobs.end(), [id](const ConversionJob& j) { return j.id == id; });
    if (it == m_jobs.end()) return QueueResult::NotFound;
    if (it->status == JobStatus::Running) return QueueResult::JobBusy;
    m_jobs.erase(it);
    return QueueResult::Ok;
}

ClearResult JobQueue::clear(int* removedCount)
{
    const int before = m_jobs.size();
    m_jobs.erase(std::remove_if(m_jobs.begin(), m_jobs.end(),
                                [](const ConversionJob& j) { return j.status != JobStatus::Running; }),
                 m_jobs.end());
    if (removedCount) *removedCount = before - m_jobs.size();
    return m_jobs.isEmpty() ? ClearResult::AllRemoved : ClearResult::PartialClear;
}

ConversionJob* JobQueue::nextQueued()
{
    for (ConversionJob& j : m_jobs) {
        if (j.status == JobStatus::Queued) return &j;
    }
    return nullptr;
}

ConversionJob* JobQueue::find(JobId id)
{
    for (ConversionJob& j : m_jobs) {
        if (j.id == id) return &j;
    }
    return nullptr;
}

const ConversionJob* JobQueue::find(JobId id) const
{
    for (const ConversionJob& j : m_jobs) {
        if (j.id == id) return &j;
    }
    return nullptr;
}

int JobQueue::countWithStatus(JobStatus status) const
{
    return int(std::count_if(m_jobs.begin(), m_jobs.end(), [status](const ConversionJob& j) { return j.status == status; }));
}

QVector<JobId> JobQueue::idsWithStatus(JobStatus status) const
{
    QVector<JobId> ids;
    for (const ConversionJob& j : m_jobs) {
        if (j.status == status) ids.push_back(j.id);
    }
    return ids;
}

bool JobQueue::allTerminal() const
{
    return std::all_of(m_jobs.begin(), m_jobs.end(), [](const ConversionJob& j) { return j.isTerminal(); });
}
