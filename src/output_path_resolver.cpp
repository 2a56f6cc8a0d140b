#include "output_path_resolver.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>

QString OutputPathResolver::candidateName(const QString& baseName, const QString& extension, int n)
{
    QString ext = extension;
    if (ext.startsWith(QLatin1Char('.'))) ext.remove(0, 1);
    // Concatenate rather than arg(): file names may contain "%1"-style text.
    if (n == 0) return baseName + QLatin1Char('.') + ext;
    return baseName + QStringLiteral(" (") + QString::number(n) + QStringLiteral(").") + ext;
}

QString OutputPathResolver::key(const QString& path)
{
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

bool OutputPathResolver::reserve(const QString& dir, const QString& baseName, const QString& extension,
                                 QString& outPath, QString& err)
{
    QString base = baseName.trimmed();
    if (base.isEmpty()) base = QStringLiteral("output");
    const QDir d(dir);

    QMutexLocker locker(&m_mutex);
    for (int n = 0; n <= kMaxCollisionIndex; ++n) {
        const QString cand = key(d.filePath(candidateName(base, extension, n)));
        if (m_reserved.contains(cand) || QFileInfo::exists(cand)) continue;
        m_reserved.insert(cand);
        outPath = cand;
        return true;
    }
    err = QString("no free output name for \"%1\" in %2 after %3 attempts")
              .arg(base, d.absolutePath())
              .arg(kMaxCollisionIndex + 1);
    qWarning() << "[OutputPathResolver]" << err;
    return false;
}

void OutputPathResolver::release(const QString& path)
{
    if (path.isEmpty()) return;
    QMutexLocker locker(&m_mutex);
    m_reserved.remove(key(path));
}

bool OutputPathResolver::isReserved(const QString& path) const
{
    QMutexLocker locker(&m_mutex);
    return m_reserved.contains(key(path));
}

int OutputPathResolver::reservedCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_reserved.size();
}
