#pragma once

#include <QMutex>
#include <QSet>
#include <QString>

// Hands out collision-free output paths: "base.ext", then "base (1).ext",
// "base (2).ext", ... A name is taken when it exists on disk or has been
// reserved and not yet released. Checking and reserving happen under one lock,
// so workers resolving in parallel never receive the same path.
class OutputPathResolver {
public:
    static constexpr int kMaxCollisionIndex = 9999;

    bool reserve(const QString& dir, const QString& baseName, const QString& extension,
                 QString& outPath, QString& err);
    void release(const QString& path);

    bool isReserved(const QString& path) const;
    int reservedCount() const;

    // "base.ext" for n == 0, "base (n).ext" otherwise.
    static QString candidateName(const QString& baseName, const QString& extension, int n);

private:
    static QString key(const QString& path);

    mutable QMutex m_mutex;
    QSet<QString> m_reserved;
};
