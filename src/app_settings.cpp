#include "app_settings.h"
#include "conversion_controller.h"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

#include <algorithm>

QString AppSettings::defaultOutputFolder()
{
    QString desktop = QStandardPaths::writableLocation(QStandardPaths::DesktopLocation);
    if (desktop.isEmpty()) desktop = QDir::homePath();
    return QDir(desktop).filePath("Audio2Video_Exports");
}

AppSettings AppSettings::load(QSettings& s)
{
    AppSettings a;
    a.ffmpegPath = s.value("Encoder/FfmpegPath").toString();
    a.ffprobePath = s.value("Encoder/FfprobePath").toString();
    a.maxConcurrentJobs = std::clamp(s.value("Conversion/MaxConcurrentJobs", 1).toInt(),
                                     1, ConversionController::kMaxConcurrentJobs);
    a.gracePeriodMs = std::max(0, s.value("Conversion/GracePeriodMs", 5000).toInt());
    a.probeTimeoutMs = std::max(500, s.value("Conversion/ProbeTimeoutMs", 10000).toInt());
    a.logTailLines = std::clamp(s.value("Conversion/LogTailLines", 40).toInt(), 1, 1000);
    a.lastOutputFolder = s.value("Session/LastOutputFolder", defaultOutputFolder()).toString();
    a.lastCoverImage = s.value("Session/LastCoverImage").toString();
    return a;
}

void AppSettings::save(QSettings& s) const
{
    s.setValue("Encoder/FfmpegPath", ffmpegPath);
    s.setValue("Encoder/FfprobePath", ffprobePath);
    s.setValue("Conversion/MaxConcurrentJobs", maxConcurrentJobs);
    s.setValue("Conversion/GracePeriodMs", gracePeriodMs);
    s.setValue("Conversion/ProbeTimeoutMs", probeTimeoutMs);
    s.setValue("Conversion/LogTailLines", logTailLines);
    s.setValue("Session/LastOutputFolder", lastOutputFolder);
    s.setValue("Session/LastCoverImage", lastCoverImage);
    s.sync();
}

AppSettings AppSettings::load()
{
    QSettings s(kOrganization, kApplication);
    return load(s);
}

void AppSettings::save() const
{
    QSettings s(kOrganization, kApplication);
    save(s);
}
