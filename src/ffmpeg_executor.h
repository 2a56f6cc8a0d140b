#pragma once

#include <QByteArray>
#include <QProcess>
#include <QTimer>

#include "conversion_executor.h"

// ConversionExecutor backed by an ffmpeg child process. The cover image is
// looped as the video track, the audio drives the duration, and the result is
// an MPEG-PS file (MPEG-2 video, MP2 audio, 1280x720 at 30 fps).
//
// stdout carries "-progress pipe:1" frames, stderr the diagnostic log; both
// are drained as data arrives. Cancelling sends SIGTERM, then SIGKILL once the
// grace period runs out. Any outcome other than success deletes the output file.
class FfmpegExecutor : public ConversionExecutor {
    Q_OBJECT
public:
    explicit FfmpegExecutor(QObject* parent = nullptr);
    ~FfmpegExecutor() override;

    void start(const ConversionRequest& request) override;
    void cancel() override;

    bool isRunning() const;

    static QStringList buildArguments(const ConversionRequest& request);
    static QString videoFilter();

private slots:
    void onReadyStdOut();
    void onReadyStdErr();
    void onFinished(int exitCode, QProcess::ExitStatus status);
    void onErrorOccurred(QProcess::ProcessError error);
    void onGraceExpired();

private:
    void consumeDiagnostics(const QByteArray& data, bool flush);
    void removePartialOutput();
    void finish(ExecutionOutcome outcome);

    ConversionRequest m_request;
    QProcess* m_proc = nullptr;
    ProgressParser m_parser;
    LogTail m_tail;
    QByteArray m_errPending;
    QTimer m_killTimer;
    bool m_started = false;
    bool m_cancelling = false;
    bool m_done = false;
};
