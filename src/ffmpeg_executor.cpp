#include "ffmpeg_executor.h"
#include "file_utils.h"

#include <QDebug>
#include <QFileInfo>

namespace {
constexpr int kWidth = 1280;
constexpr int kHeight = 720;
constexpr int kFps = 30;
constexpr const char* kVideoCodec = "mpeg2video";
constexpr const char* kAudioCodec = "mp2";
constexpr const char* kVideoBitrate = "4000k";
constexpr const char* kAudioBitrate = "192k";
constexpr const char* kContainer = "mpeg";
constexpr int kReapTimeoutMs = 3000;
}

FfmpegExecutor::FfmpegExecutor(QObject* parent) : ConversionExecutor(parent)
{
    m_killTimer.setSingleShot(true);
    connect(&m_killTimer, &QTimer::timeout, this, &FfmpegExecutor::onGraceExpired);
}

FfmpegExecutor::~FfmpegExecutor()
{
    if (m_proc && m_proc->state() != QProcess::NotRunning) {
        qWarning() << "[FfmpegExecutor] Destroyed while job" << m_request.jobId << "was running; killing encoder";
        disconnect(m_proc, nullptr, this, nullptr);
        m_proc->kill();
        m_proc->waitForFinished(kReapTimeoutMs);
        removePartialOutput();
    }
}

QString FfmpegExecutor::videoFilter()
{
    return QString("scale=%1:%2:force_original_aspect_ratio=decrease,"
                   "pad=%1:%2:(ow-iw)/2:(oh-ih)/2,format=yuv420p")
        .arg(kWidth)
        .arg(kHeight);
}

QStringList FfmpegExecutor::buildArguments(const ConversionRequest& r)
{
    QStringList a;
    a << "-hide_banner" << "-nostdin" << "-y";
    // Input 0: the still image, repeated for as long as the output runs.
    a << "-loop" << "1" << "-framerate" << QString::number(kFps) << "-i" << r.coverImagePath;
    // Input 1: the audio, which decides where the output ends.
    a << "-i" << r.audioPath;
    a << "-map" << "0:v:0" << "-map" << "1:a:0";
    a << "-vf" << videoFilter();
    a << "-r" << QString::number(kFps);
    a << "-c:v" << kVideoCodec << "-b:v" << kVideoBitrate;
    a << "-c:a" << kAudioCodec << "-b:a" << kAudioBitrate;
    a << "-shortest";
    a << "-f" << kContainer;
    a << "-progress" << "pipe:1" << "-nostats";
    a << r.outputPath;
    return a;
}

bool FfmpegExecutor::isRunning() const
{
    return m_proc && m_proc->state() != QProcess::NotRunning;
}

void FfmpegExecutor::start(const ConversionRequest& request)
{
    if (m_started) {
        qWarning() << "[FfmpegExecutor] start() called twice for job" << m_request.jobId;
        return;
    }
    m_started = true;
    m_request = request;
    m_parser.reset(request.durationMs);
    m_tail = LogTail(request.logTailLines);

    if (m_cancelling) {
        finish(ExecutionOutcome::cancelled());
        return;
    }

    m_proc = new QProcess(this);
    connect(m_proc, &QProcess::readyReadStandardOutput, this, &FfmpegExecutor::onReadyStdOut);
    connect(m_proc, &QProcess::readyReadStandardError, this, &FfmpegExecutor::onReadyStdErr);
    connect(m_proc, qOverload<int, QProcess::ExitStatus>(&QProcess::finished), this, &FfmpegExecutor::onFinished);
    connect(m_proc, &QProcess::errorOccurred, this, &FfmpegExecutor::onErrorOccurred);

    // QProcess passes arguments straight to exec, no shell in between.
    m_proc->setProgram(request.encoderPath);
    m_proc->setArguments(buildArguments(request));
    m_proc->setStandardInputFile(QProcess::nullDevice());

    qInfo() << "[FfmpegExecutor] Job" << request.jobId << ":"
            << QFileInfo(request.encoderPath).fileName() << m_proc->arguments().join(' ');
    m_proc->start();
}

void FfmpegExecutor::cancel()
{
    if (m_done || m_cancelling) return;
    m_cancelling = true;

    if (!m_started) return; // start() reports Cancelled
    if (!isRunning()) return;

    qInfo() << "[FfmpegExecutor] Cancelling job" << m_request.jobId
            << "grace" << m_request.gracePeriodMs << "ms";
    m_proc->terminate();
    m_killTimer.start(qMax(0, m_request.gracePeriodMs));
}

void FfmpegExecutor::onGraceExpired()
{
    if (!isRunning()) return;
    qWarning() << "[FfmpegExecutor] Encoder for job" << m_request.jobId << "ignored terminate; killing";
    m_proc->kill();
}

void FfmpegExecutor::onReadyStdOut()
{
    if (!m_proc) return;
    const QVector<ProgressSnapshot> snaps = m_parser.feed(m_proc->readAllStandardOutput());
    for (const ProgressSnapshot& s : snaps) emit progressed(s);
}

void FfmpegExecutor::onReadyStdErr()
{
    if (!m_proc) return;
    consumeDiagnostics(m_proc->readAllStandardError(), false);
}

void FfmpegExecutor::consumeDiagnostics(const QByteArray& data, bool flush)
{
    m_errPending.append(data);
    for (;;) {
        const qsizetype nl = m_errPending.indexOf('\n');
        const qsizetype cr = m_errPending.indexOf('\r');
        qsizetype cut = nl;
        if (cr >= 0 && (cut < 0 || cr < cut)) cut = cr;
        if (cut < 0) break;
        const QString line = QString::fromUtf8(m_errPending.constData(), cut).trimmed();
        m_errPending.remove(0, cut + 1);
        if (line.isEmpty()) continue;
        m_tail.append(line);
        emit diagnosticLine(line);
    }
    if (flush && !m_errPending.isEmpty()) {
        const QString line = QString::fromUtf8(m_errPending).trimmed();
        m_errPending.clear();
        if (!line.isEmpty()) {
            m_tail.append(line);
            emit diagnosticLine(line);
        }
    }
}

void FfmpegExecutor::onErrorOccurred(QProcess::ProcessError error)
{
    // Only a failed start comes without a finished() signal.
    if (error != QProcess::FailedToStart) return;
    m_killTimer.stop();
    if (m_cancelling) {
        finish(ExecutionOutcome::cancelled());
        return;
    }
    const QString msg = QString("could not launch encoder %1: %2")
                            .arg(m_request.encoderPath, m_proc ? m_proc->errorString() : QString());
    qCritical() << "[FfmpegExecutor]" << msg;
    finish(ExecutionOutcome::failure(ConversionError::LaunchFailed, msg));
}

void FfmpegExecutor::onFinished(int exitCode, QProcess::ExitStatus status)
{
    m_killTimer.stop();
    onReadyStdOut();
    for (const ProgressSnapshot& s : m_parser.finish()) emit progressed(s);
    if (m_proc) consumeDiagnostics(m_proc->readAllStandardError(), true);

    if (m_cancelling) {
        qInfo() << "[FfmpegExecutor] Job" << m_request.jobId << "cancelled";
        finish(ExecutionOutcome::cancelled());
        return;
    }

    if (status == QProcess::CrashExit || exitCode != 0) {
        const QString msg = status == QProcess::CrashExit
                                ? QString("encoder crashed")
                                : QString("encoder exited with code %1").arg(exitCode);
        ExecutionOutcome o = ExecutionOutcome::failure(ConversionError::EncoderExitedNonZero, msg);
        o.exitCode = exitCode;
        finish(o);
        return;
    }

    if (!m_parser.sawEnd()) {
        finish(ExecutionOutcome::failure(ConversionError::EncoderExitedNonZero,
                                         "encoder stream closed before completion"));
        return;
    }

    if (!FileUtils::fileExists(m_request.outputPath)) {
        finish(ExecutionOutcome::failure(ConversionError::OutputNotCreated,
                                         QString("output file was not created: %1").arg(m_request.outputPath)));
        return;
    }

    finish(ExecutionOutcome::success());
}

void FfmpegExecutor::removePartialOutput()
{
    if (!FileUtils::removeFileIfExists(m_request.outputPath))
        qWarning() << "[FfmpegExecutor] Could not delete partial output" << m_request.outputPath;
}

void FfmpegExecutor::finish(ExecutionOutcome outcome)
{
    if (m_done) return;
    m_done = true;
    if (outcome.kind != OutcomeKind::Succeeded) removePartialOutput();
    outcome.logTail = m_tail.lines();
    if (outcome.kind == OutcomeKind::Failed) {
        qWarning() << "[FfmpegExecutor] Job" << m_request.jobId << "failed:" << outcome.message;
    }
    emit finished(outcome);
}
