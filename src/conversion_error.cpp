#include "conversion_error.h"

QString conversionErrorName(ConversionError error)
{
    switch (error) {
        case ConversionError::None: return QStringLiteral("None");
        case ConversionError::InputMissing: return QStringLiteral("InputMissing");
        case ConversionError::ProbeFailed: return QStringLiteral("ProbeFailed");
        case ConversionError::LaunchFailed: return QStringLiteral("LaunchFailed");
        case ConversionError::EncoderExitedNonZero: return QStringLiteral("EncoderExitedNonZero");
        case ConversionError::OutputNotCreated: return QStringLiteral("OutputNotCreated");
        case ConversionError::Cancelled: return QStringLiteral("Cancelled");
        case ConversionError::NamingCollisionExhausted: return QStringLiteral("NamingCollisionExhausted");
    }
    return QStringLiteral("Unknown");
}

bool isQueueFatal(ConversionError error)
{
    return error == ConversionError::LaunchFailed;
}
