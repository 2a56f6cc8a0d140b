#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFileInfo>
#include <QHash>
#include <QTextStream>

#ifdef Q_OS_UNIX
#include <QSocketNotifier>
#include <csignal>
#include <sys/socket.h>
#include <unistd.h>
#endif

#include <functional>
#include <memory>

#include "app_settings.h"
#include "conversion_controller.h"
#include "duration_resolver.h"
#include "log_manager.h"
#include "media_types.h"
#include "tool_locator.h"
#include "utils.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitJobsFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

QTextStream& out()
{
    static QTextStream ts(stdout);
    return ts;
}

#ifdef Q_OS_UNIX
// Self-pipe: the handler only writes a byte, the notifier runs the callback on the event loop.
int g_signalFds[2] = {-1, -1};

void onUnixSignal(int)
{
    const char c = 1;
    const ssize_t n = ::write(g_signalFds[0], &c, 1);
    (void)n;
}

bool installSignalPipe(QObject* context, const std::function<void()>& onSignal)
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFds) != 0) return false;
    auto* notifier = new QSocketNotifier(g_signalFds[1], QSocketNotifier::Read, context);
    QObject::connect(notifier, &QSocketNotifier::activated, context, [notifier, onSignal]() {
        notifier->setEnabled(false);
        char c = 0;
        if (::read(g_signalFds[1], &c, 1) > 0) onSignal();
        notifier->setEnabled(true);
    });

    struct sigaction sa = {};
    sa.sa_handler = onUnixSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    return ::sigaction(SIGINT, &sa, nullptr) == 0 && ::sigaction(SIGTERM, &sa, nullptr) == 0;
}
#endif

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(AppSettings::kOrganization);
    QCoreApplication::setApplicationName(AppSettings::kApplication);
    QCoreApplication::setApplicationVersion(AUDIO2VIDEO_VERSION);

    qInstallMessageHandler(customMessageHandler);

    QCommandLineParser parser;
    parser.setApplicationDescription("Turns audio files into MPEG videos showing a still cover image.");
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption coverOpt({"c", "cover"}, "Cover image shown for the whole video.", "image");
    const QCommandLineOption outputOpt({"o", "output"}, "Folder for the generated videos (created if missing).", "dir");
    const QCommandLineOption jobsOpt({"j", "jobs"}, "Number of conversions to run at once.", "count");
    const QCommandLineOption ffmpegOpt("ffmpeg", "Path to the ffmpeg executable.", "path");
    const QCommandLineOption ffprobeOpt("ffprobe", "Path to the ffprobe executable.", "path");
    const QCommandLineOption verboseOpt({"v", "verbose"}, "Echo the full log, encoder output included.");
    parser.addOptions({coverOpt, outputOpt, jobsOpt, ffmpegOpt, ffprobeOpt, verboseOpt});
    parser.addPositionalArgument("audio", "Audio files to convert.", "<audio>...");
    parser.process(app);

    LogManager::instance().setEchoToStderr(parser.isSet(verboseOpt));
    AppSettings settings = AppSettings::load();

    QStringList audio;
    for (const QString& p : parser.positionalArguments()) {
        if (!MediaTypes::isSupportedAudioFile(p)) {
            qWarning() << "[CLI] Skipping unsupported file:" << p;
            continue;
        }
        audio << QFileInfo(p).absoluteFilePath();
    }
    if (audio.isEmpty()) {
        qCritical() << "[CLI] No supported audio files given";
        parser.showHelp(kExitUsage);
    }

    const QString cover = parser.isSet(coverOpt) ? parser.value(coverOpt) : settings.lastCoverImage;
    if (cover.isEmpty()) {
        qCritical() << "[CLI] No cover image given (--cover)";
        return kExitUsage;
    }
    if (!MediaTypes::isSupportedImageFile(cover)) {
        qWarning() << "[CLI] Cover has an unusual extension, trying anyway:" << cover;
    }
    const QString outputDir = parser.isSet(outputOpt) ? parser.value(outputOpt) : settings.lastOutputFolder;

    if (parser.isSet(jobsOpt)) {
        bool ok = false;
        const int jobs = parser.value(jobsOpt).toInt(&ok);
        if (!ok || jobs < 1) {
            qCritical() << "[CLI] --jobs expects a positive number";
            return kExitUsage;
        }
        settings.maxConcurrentJobs = jobs;
    }

    const QString ffmpeg = ToolLocator::locateFfmpeg(parser.isSet(ffmpegOpt) ? parser.value(ffmpegOpt) : settings.ffmpegPath);
    const QString ffprobe = ToolLocator::locateFfprobe(parser.isSet(ffprobeOpt) ? parser.value(ffprobeOpt) : settings.ffprobePath, ffmpeg);
    qInfo() << "[CLI] ffmpeg:" << ffmpeg << "ffprobe:" << ffprobe;

    ConversionController::Options options;
    options.encoderPath = ffmpeg;
    options.maxConcurrentJobs = settings.maxConcurrentJobs;
    options.gracePeriodMs = settings.gracePeriodMs;
    options.logTailLines = settings.logTailLines;
    auto durations = std::make_shared<DurationResolver>(ffprobe, ffmpeg, settings.probeTimeoutMs);

    ConversionController controller(options, durations);
    controller.setCoverImage(cover);
    controller.setOutputDirectory(outputDir);

    QHash<JobId, int> lastPercent;
    auto nameOf = [&controller](JobId id) {
        return QFileInfo(controller.job(id).inputAudioPath).fileName();
    };

    QObject::connect(&controller, &ConversionController::jobStatusChanged, &app,
                     [&](JobId id, JobStatus status, const QString& errorText) {
        out() << nameOf(id) << ": " << jobStatusName(status);
        if (status == JobStatus::Completed) out() << " -> " << controller.job(id).outputPath;
        if (status == JobStatus::Failed) {
            out() << " (" << errorText << ")";
            const QStringList tail = controller.job(id).logTail.lines();
            for (const QString& line : tail.mid(qMax(0, tail.size() - 5))) out() << "\n    " << line;
        }
        out() << Qt::endl;
    });
    QObject::connect(&controller, &ConversionController::jobProgressChanged, &app,
                     [&](JobId id, double fraction) {
        const int pct = Utils::percentOf(fraction);
        if (lastPercent.value(id, -2) == pct) return;
        lastPercent.insert(id, pct);
        if (pct < 0) {
            out() << nameOf(id) << ": converting (length unknown)" << Qt::endl;
            return;
        }
        const ConversionJob j = controller.job(id);
        out() << nameOf(id) << ": " << pct << "%";
        if (j.durationMs > 0) {
            out() << " (" << Utils::formatDuration(qint64(fraction * j.durationMs)) << " / "
                  << Utils::formatDuration(j.durationMs) << ")";
        }
        out() << Qt::endl;
    });

    int signalCount = 0;
    QObject::connect(&controller, &ConversionController::queueHalted, &app, [](const QString& reason) {
        out() << "Stopped: " << reason << Qt::endl;
    });
    QObject::connect(&controller, &ConversionController::queueDrained, &app, [&]() {
        const JobQueue& q = controller.queue();
        const int done = q.countWithStatus(JobStatus::Completed);
        out() << done << " of " << q.size() << " converted";
        const int failed = q.countWithStatus(JobStatus::Failed);
        const int cancelled = q.countWithStatus(JobStatus::Cancelled);
        if (failed) out() << ", " << failed << " failed";
        if (cancelled) out() << ", " << cancelled << " cancelled";
        out() << Qt::endl;
        app.exit(done == q.size() ? kExitOk : kExitJobsFailed);
    });

#ifdef Q_OS_UNIX
    const bool signalsOk = installSignalPipe(&app, [&]() {
        if (++signalCount == 1) {
            out() << "Cancelling, press Ctrl+C again to quit immediately" << Qt::endl;
            controller.cancelAll();
        } else {
            app.exit(kExitInterrupted);
        }
    });
    if (!signalsOk) qWarning() << "[CLI] Could not install signal handlers; Ctrl+C will not cancel cleanly";
#endif

    controller.addAudioFiles(audio);
    const ConversionController::StartResult r = controller.start();
    if (r != ConversionController::StartResult::Started) {
        qCritical() << "[CLI] Cannot start:" << ConversionController::startResultName(r);
        return kExitUsage;
    }

    settings.lastCoverImage = controller.coverImage();
    settings.lastOutputFolder = controller.outputDirectory();
    settings.save();

    return app.exec();
}
