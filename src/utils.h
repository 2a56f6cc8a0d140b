#pragma once
#include <QString>
#include <QtGlobal>

namespace Utils {

// Milliseconds as "HH:MM:SS"; negative input renders as zero.
inline QString formatDuration(qint64 ms) {
    if (ms < 0) ms = 0;
    const qint64 total = ms / 1000;
    return QString("%1:%2:%3")
        .arg(total / 3600, 2, 10, QChar('0'))
        .arg((total % 3600) / 60, 2, 10, QChar('0'))
        .arg(total % 60, 2, 10, QChar('0'));
}

// Fraction in [0,1] as a whole percentage; anything negative means "unknown".
inline int percentOf(double fraction) {
    if (fraction < 0.0) return -1;
    return qBound(0, int(fraction * 100.0 + 0.5), 100);
}

} // namespace Utils
