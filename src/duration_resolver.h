#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <atomic>

// Determines audio duration so progress can be expressed as a fraction.
// ffprobe is asked first; if it is missing, times out or answers nonsense,
// the "Duration:" line of ffmpeg's own input banner is used. Failing both is
// not an error for the job: it simply runs with indeterminate progress.
//
// resolveDurationMs() is const and keeps no shared state, so several worker
// threads may call it at once. When a cancel flag is passed, a running tool is
// killed as soon as the flag is set and the ffmpeg fallback is skipped.
class DurationResolver {
public:
    static constexpr int kDefaultTimeoutMs = 10000;

    explicit DurationResolver(const QString& ffprobePath = QString(),
                              const QString& ffmpegPath = QString(),
                              int timeoutMs = kDefaultTimeoutMs);
    virtual ~DurationResolver() = default;

    virtual bool resolveDurationMs(const QString& audioPath, qint64& durMs, QString& err,
                                   const std::atomic<bool>* cancelFlag = nullptr) const;

    QString ffprobePath() const { return m_ffprobe; }
    QString ffmpegPath() const { return m_ffmpeg; }
    int timeoutMs() const { return m_timeoutMs; }

    // ffprobe "default=noprint_wrappers=1:nokey=1" output, seconds as a decimal.
    static bool parseProbeSeconds(const QByteArray& output, qint64& durMs);
    // "Duration: 00:03:21.47, start: ..." from an ffmpeg banner.
    static bool parseBannerDuration(const QString& text, qint64& durMs);

private:
    bool probeWithFfprobe(const QString& audioPath, qint64& durMs, QString& err,
                          const std::atomic<bool>* cancelFlag) const;
    bool probeWithFfmpeg(const QString& audioPath, qint64& durMs, QString& err,
                         const std::atomic<bool>* cancelFlag) const;
    bool runTool(const QString& program, const QStringList& args, const std::atomic<bool>* cancelFlag,
                 QByteArray& out, QByteArray& errOut, int& exitCode, QString& err) const;

    QString m_ffprobe;
    QString m_ffmpeg;
    int m_timeoutMs;
};

inline bool isCancelled(const std::atomic<bool>* flag) { return flag && flag->load(); }
