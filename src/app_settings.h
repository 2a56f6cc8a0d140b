#pragma once

#include <QString>

class QSettings;

// Persisted preferences. Stored with QSettings under the organization and
// application names below; tests pass their own QSettings instance.
struct AppSettings {
    static constexpr const char* kOrganization = "Audio2Video";
    static constexpr const char* kApplication = "Audio2Video";

    QString ffmpegPath;          // empty: locate automatically
    QString ffprobePath;         // empty: locate automatically
    int maxConcurrentJobs = 1;
    int gracePeriodMs = 5000;
    int probeTimeoutMs = 10000;
    int logTailLines = 40;
    QString lastOutputFolder;
    QString lastCoverImage;

    static AppSettings load(QSettings& s);
    void save(QSettings& s) const;

    static AppSettings load();
    void save() const;

    // <Desktop>/Audio2Video_Exports
    static QString defaultOutputFolder();
};
