#pragma once

#include "conversion_job.h"

/**
 * JobStateMachine - legal status transitions for a single ConversionJob.
 *
 *   Queued  -> Running | Cancelled | Failed (queue halted before the job ran)
 *   Running -> Completed | Failed | Cancelled
 *
 * Completed, Failed and Cancelled are terminal. Retrying a terminal job does
 * not move it: makeRetry() produces a fresh Queued record instead.
 */
namespace JobStateMachine {

bool canTransition(JobStatus from, JobStatus to);
bool isTerminal(JobStatus status);

// Applies the transition when legal. Entering Completed pins progress to 1.0,
// entering Cancelled or Completed clears any error. Returns false and leaves
// the job untouched otherwise.
bool transition(ConversionJob& job, JobStatus to, QString* err = nullptr);

// Fresh record for another attempt at a Failed or Cancelled job: new id, same
// input audio, no progress, no error, no output path. The cover is not carried
// over; like any Queued job the retry takes the cover selected when it starts.
ConversionJob makeRetry(const ConversionJob& original);

} // namespace JobStateMachine
