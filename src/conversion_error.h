#pragma once

#include <QMetaType>
#include <QString>

// Failure causes recorded on a job. Everything except LaunchFailed is local to
// the job it happened on; LaunchFailed halts the whole queue.
enum class ConversionError {
    None,
    InputMissing,             // audio or cover file absent when the job was scheduled
    ProbeFailed,              // duration unknown, job runs with indeterminate progress
    LaunchFailed,             // encoder binary missing or could not be spawned
    EncoderExitedNonZero,
    OutputNotCreated,         // encoder reported success but left no file behind
    Cancelled,
    NamingCollisionExhausted
};

QString conversionErrorName(ConversionError error);
bool isQueueFatal(ConversionError error);

Q_DECLARE_METATYPE(ConversionError)
