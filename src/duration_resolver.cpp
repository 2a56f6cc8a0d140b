#include "duration_resolver.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QProcess>
#include <QRegularExpression>

#include <cmath>

namespace {
constexpr int kCancelPollMs = 50;
}

DurationResolver::DurationResolver(const QString& ffprobePath, const QString& ffmpegPath, int timeoutMs)
    : m_ffprobe(ffprobePath), m_ffmpeg(ffmpegPath), m_timeoutMs(timeoutMs > 0 ? timeoutMs : kDefaultTimeoutMs)
{
}

bool DurationResolver::parseProbeSeconds(const QByteArray& output, qint64& durMs)
{
    // ffprobe may print one value per line when a file has several formats; take the first.
    const QList<QByteArray> lines = output.trimmed().split('\n');
    if (lines.isEmpty()) return false;
    bool ok = false;
    const double sec = QString::fromUtf8(lines.first()).trimmed().toDouble(&ok);
    if (!ok || !std::isfinite(sec) || sec <= 0.0) return false;
    durMs = qRound64(sec * 1000.0);
    return durMs > 0;
}

bool DurationResolver::parseBannerDuration(const QString& text, qint64& durMs)
{
    static const QRegularExpression rx("Duration:\\s*(\\d+):(\\d{2}):(\\d{2})(?:\\.(\\d+))?");
    const QRegularExpressionMatch m = rx.match(text);
    if (!m.hasMatch()) return false;
    const qint64 h = m.captured(1).toLongLong();
    const qint64 min = m.captured(2).toLongLong();
    const qint64 s = m.captured(3).toLongLong();
    qint64 ms = ((h * 60 + min) * 60 + s) * 1000;
    const QString frac = m.captured(4);
    if (!frac.isEmpty()) {
        // "47" is hundredths, "470" thousandths: scale the digits to milliseconds.
        const QString ms3 = (frac + QStringLiteral("000")).left(3);
        ms += ms3.toLongLong();
    }
    if (ms <= 0) return false;
    durMs = ms;
    return true;
}

bool DurationResolver::runTool(const QString& program, const QStringList& args, const std::atomic<bool>* cancelFlag,
                               QByteArray& out, QByteArray& errOut, int& exitCode, QString& err) const
{
    QProcess p;
    p.setStandardInputFile(QProcess::nullDevice());
    p.start(program, args);
    if (!p.waitForStarted(m_timeoutMs)) {
        err = QString("%1 could not be started: %2").arg(QFileInfo(program).fileName(), p.errorString());
        return false;
    }

    // Short waits so a cancel is noticed while the tool is still running.
    QElapsedTimer timer;
    timer.start();
    bool finished = false;
    while (!finished) {
        if (isCancelled(cancelFlag)) {
            p.kill();
            p.waitForFinished(1000);
            err = QString("%1 cancelled").arg(QFileInfo(program).fileName());
            return false;
        }
        const qint64 left = m_timeoutMs - timer.elapsed();
        if (left <= 0) {
            p.kill();
            p.waitForFinished(1000);
            err = QString("%1 timed out after %2 ms").arg(QFileInfo(program).fileName()).arg(m_timeoutMs);
            return false;
        }
        finished = p.waitForFinished(int(qMin<qint64>(left, kCancelPollMs)));
        if (!finished && p.state() == QProcess::NotRunning) finished = true;
    }
    out = p.readAllStandardOutput();
    errOut = p.readAllStandardError();
    exitCode = p.exitStatus() == QProcess::NormalExit ? p.exitCode() : -1;
    return true;
}

bool DurationResolver::probeWithFfprobe(const QString& audioPath, qint64& durMs, QString& err,
                                        const std::atomic<bool>* cancelFlag) const
{
    if (m_ffprobe.isEmpty()) { err = "ffprobe not configured"; return false; }

    const QStringList args = {"-v", "error", "-show_entries", "format=duration",
                              "-of", "default=noprint_wrappers=1:nokey=1", audioPath};
    QByteArray out, errOut; int code = 0;
    if (!runTool(m_ffprobe, args, cancelFlag, out, errOut, code, err)) return false;
    if (code != 0) {
        err = QString("ffprobe exited with code %1: %2").arg(code).arg(QString::fromUtf8(errOut).trimmed());
        return false;
    }
    if (!parseProbeSeconds(out, durMs)) {
        err = QString("ffprobe reported no usable duration (%1)").arg(QString::fromUtf8(out).trimmed());
        return false;
    }
    return true;
}

bool DurationResolver::probeWithFfmpeg(const QString& audioPath, qint64& durMs, QString& err,
                                       const std::atomic<bool>* cancelFlag) const
{
    if (m_ffmpeg.isEmpty()) { err = "ffmpeg not configured"; return false; }

    // Without an output ffmpeg prints the input banner and exits non-zero; only the banner matters.
    const QStringList args = {"-hide_banner", "-nostdin", "-i", audioPath};
    QByteArray out, errOut; int code = 0;
    if (!runTool(m_ffmpeg, args, cancelFlag, out, errOut, code, err)) return false;
    if (!parseBannerDuration(QString::fromUtf8(errOut), durMs)) {
        err = "ffmpeg banner has no duration";
        return false;
    }
    return true;
}

bool DurationResolver::resolveDurationMs(const QString& audioPath, qint64& durMs, QString& err,
                                         const std::atomic<bool>* cancelFlag) const
{
    QString probeErr;
    if (probeWithFfprobe(audioPath, durMs, probeErr, cancelFlag)) return true;
    if (isCancelled(cancelFlag)) {
        err = probeErr;
        return false;
    }
    qDebug() << "[DurationResolver] ffprobe failed for" << audioPath << "-" << probeErr << "; trying ffmpeg";

    QString bannerErr;
    if (probeWithFfmpeg(audioPath, durMs, bannerErr, cancelFlag)) return true;

    err = QString("duration unknown (%1; %2)").arg(probeErr, bannerErr);
    return false;
}
