#pragma once

#include <QSet>
#include <QString>

// File type checks for job inputs. Extension checks take the suffix without
// the dot ("mp3"); the path variants look at the suffix of a full path.
namespace MediaTypes {

bool isAudioExtension(const QString& ext);
bool isImageExtension(const QString& ext);

bool isSupportedAudioFile(const QString& path);
bool isSupportedImageFile(const QString& path);

// True when Qt's image plugins recognize the file contents as an image.
bool isReadableImage(const QString& path);

const QSet<QString>& audioExtensions();
const QSet<QString>& imageExtensions();

} // namespace MediaTypes
