#pragma once

#include <QVector>

#include "conversion_job.h"

enum class QueueResult { Ok, NotFound, JobBusy, InvalidState };
enum class ClearResult { AllRemoved, PartialClear };

QString queueResultName(QueueResult result);

// Ordered job list; processing order is insertion order. Owned and mutated by
// a single thread (the controller's). Pointers returned by find()/nextQueued()
// are invalidated by append(), remove() and clear().
class JobQueue {
public:
    JobId append(ConversionJob job);

    // Running jobs cannot be removed (JobBusy).
    QueueResult remove(JobId id);

    // Removes every job that is not Running; PartialClear when some were kept.
    ClearResult clear(int* removedCount = nullptr);

    ConversionJob* nextQueued();
    ConversionJob* find(JobId id);
    const ConversionJob* find(JobId id) const;

    const QVector<ConversionJob>& jobs() const { return m_jobs; }
    int size() const { return m_jobs.size(); }
    bool isEmpty() const { return m_jobs.isEmpty(); }

    int countWithStatus(JobStatus status) const;
    QVector<JobId> idsWithStatus(JobStatus status) const;
    bool allTerminal() const;

private:
    QVector<ConversionJob> m_jobs;
};
