#include "tool_locator.h"
#include "file_utils.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

namespace {

QString locate(const QString& tool, const QString& configured, const QString& siblingDir)
{
    const QString exe = ToolLocator::executableName(tool);

    if (!configured.isEmpty()) {
        if (FileUtils::fileExists(configured)) return QFileInfo(configured).absoluteFilePath();
        qWarning() << "[ToolLocator] Configured" << tool << "not found at" << configured;
    }

    QStringList dirs;
    if (!siblingDir.isEmpty()) dirs << siblingDir;
    if (QCoreApplication::instance()) {
        const QString appDir = QCoreApplication::applicationDirPath();
        dirs << QDir(appDir).filePath("bin") << appDir;
    }
    const QString root = qEnvironmentVariable("FFMPEG_ROOT");
    if (!root.isEmpty()) dirs << QDir(root).filePath("bin");

    for (const QString& d : dirs) {
        const QString cand = QDir(d).filePath(exe);
        if (FileUtils::fileExists(cand)) return QFileInfo(cand).absoluteFilePath();
    }

    const QString onPath = QStandardPaths::findExecutable(tool);
    if (!onPath.isEmpty()) return onPath;

    qWarning() << "[ToolLocator]" << tool << "not found; relying on" << exe << "being resolvable at launch";
    return exe;
}

} // namespace

namespace ToolLocator {

QString executableName(const QString& tool)
{
#ifdef Q_OS_WIN
    return tool + ".exe";
#else
    return tool;
#endif
}

QString locateFfmpeg(const QString& configured)
{
    return locate(QStringLiteral("ffmpeg"), configured, QString());
}

QString locateFfprobe(const QString& configured, const QString& ffmpegPath)
{
    QString sibling;
    const QFileInfo fi(ffmpegPath);
    if (fi.isAbsolute()) sibling = fi.absolutePath();
    return locate(QStringLiteral("ffprobe"), configured, sibling);
}

} // namespace ToolLocator
