#pragma once

#include <QByteArray>
#include <QHash>
#include <QMetaType>
#include <QString>
#include <QVector>

#include "conversion_job.h"

// One decoded frame of ffmpeg's "-progress" stream.
struct ProgressSnapshot {
    qint64 outTimeMs = 0;                  // elapsed output time, never decreasing within a job
    qint64 frame = -1;                     // -1 when not reported
    double speed = 0.0;                    // 0 when not reported
    double fraction = kIndeterminateProgress;
    bool end = false;                      // frame closed with progress=end

    bool isIndeterminate() const { return fraction < 0.0; }
};

Q_DECLARE_METATYPE(ProgressSnapshot)

// Reducer for the key=value progress stream. Pairs accumulate until the
// "progress" key closes the frame, which yields one snapshot. Unknown keys,
// "N/A" values and lines without '=' are skipped. Once a frame ends with
// progress=end (or finish() is called) further input is ignored.
class ProgressParser {
public:
    explicit ProgressParser(qint64 durationMs = kUnknownDuration);

    void reset(qint64 durationMs);

    // Returns true and fills `out` when the line closed a frame.
    bool feedLine(const QString& line, ProgressSnapshot& out);

    // Splits raw process output into lines, keeping any partial line for the
    // next call.
    QVector<ProgressSnapshot> feed(const QByteArray& chunk);

    // Stream closed: flushes a trailing unterminated line.
    QVector<ProgressSnapshot> finish();

    bool isFinished() const { return m_finished; }
    bool sawEnd() const { return m_sawEnd; }
    qint64 durationMs() const { return m_durationMs; }
    int ignoredLines() const { return m_ignored; }

    // "HH:MM:SS.micro" -> milliseconds; negative clocks are accepted.
    static bool parseClock(const QString& value, qint64& ms);

private:
    ProgressSnapshot closeFrame(bool end);
    bool frameOutTimeMs(qint64& ms) const;

    qint64 m_durationMs = kUnknownDuration;
    QHash<QString, QString> m_frame;
    QByteArray m_pending;
    qint64 m_maxOutTimeMs = 0;
    int m_ignored = 0;
    bool m_finished = false;
    bool m_sawEnd = false;
};
