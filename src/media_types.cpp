#include "media_types.h"

#include <QFileInfo>
#include <QImageReader>

namespace {

inline QString normalize(const QString& ext)
{
    QString e = ext.toLower();
    if (e.startsWith(QLatin1Char('.'))) e.remove(0, 1);
    return e;
}

} // namespace

namespace MediaTypes {

const QSet<QString>& audioExtensions()
{
    // Containers such as mp4/mkv/avi are accepted for their audio track.
    static const QSet<QString> exts = {
        "m4a","mp3","wav","aac","flac","ogg","wma","opus",
        "aiff","aif","mp2","mp4","webm","mkv","avi"
    };
    return exts;
}

const QSet<QString>& imageExtensions()
{
    static const QSet<QString> exts = {"jpg","jpeg","png","bmp","gif","webp","tiff","tif"};
    return exts;
}

bool isAudioExtension(const QString& ext)
{
    return audioExtensions().contains(normalize(ext));
}

bool isImageExtension(const QString& ext)
{
    return imageExtensions().contains(normalize(ext));
}

bool isSupportedAudioFile(const QString& path)
{
    return isAudioExtension(QFileInfo(path).suffix());
}

bool isSupportedImageFile(const QString& path)
{
    return isImageExtension(QFileInfo(path).suffix());
}

bool isReadableImage(const QString& path)
{
    QImageReader reader(path);
    return reader.canRead();
}

} // namespace MediaTypes
