#pragma once

#include <QString>
#include <QFileInfo>
#include <QFile>
#include <QDir>

/**
 * FileUtils - file checks shared by the scheduler, the worker threads and the CLI.
 *
 * Everything that touches job inputs or outputs goes through these helpers so
 * that existence checks and cleanup behave the same on every path.
 */
namespace FileUtils {

/**
 * Check if a regular file exists at the given path.
 *
 * @param filePath The file path to check
 * @return true if the file exists and is a regular file, false otherwise
 */
inline bool fileExists(const QString& filePath)
{
    QFileInfo fi(filePath);
    return fi.exists() && fi.isFile();
}

inline bool dirExists(const QString& dirPath)
{
    QFileInfo fi(dirPath);
    return fi.exists() && fi.isDir();
}

/**
 * Create a directory (and its parents) if it is not already there.
 *
 * @return true if the directory exists afterwards
 */
inline bool ensureDirectory(const QString& dirPath)
{
    if (dirPath.isEmpty()) return false;
    if (dirExists(dirPath)) return true;
    return QDir().mkpath(dirPath);
}

/**
 * Delete a leftover output file. A path that does not exist counts as removed.
 *
 * @return false only when the file exists and could not be deleted
 */
inline bool removeFileIfExists(const QString& filePath)
{
    if (filePath.isEmpty() || !QFileInfo::exists(filePath)) return true;
    return QFile::remove(filePath);
}

} // namespace FileUtils
