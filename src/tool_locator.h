#pragma once

#include <QString>

// Finds the external encoder and probe executables.
namespace ToolLocator {

// Search order: configured path, <appDir>/bin, <appDir>, $FFMPEG_ROOT/bin, PATH.
// Falls back to the bare program name so the launch error names the tool.
QString locateFfmpeg(const QString& configured = QString());

// Same order, except a probe sitting next to the resolved ffmpeg wins over
// the application folders.
QString locateFfprobe(const QString& configured, const QString& ffmpegPath);

QString executableName(const QString& tool);

} // namespace ToolLocator
