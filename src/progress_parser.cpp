#include "progress_parser.h"

#include <QRegularExpression>

#include <algorithm>

ProgressParser::ProgressParser(qint64 durationMs)
{
    reset(durationMs);
}

void ProgressParser::reset(qint64 durationMs)
{
    m_durationMs = durationMs > 0 ? durationMs : kUnknownDuration;
    m_frame.clear();
    m_pending.clear();
    m_maxOutTimeMs = 0;
    m_ignored = 0;
    m_finished = false;
    m_sawEnd = false;
}

bool ProgressParser::parseClock(const QString& value, qint64& ms)
{
    static const QRegularExpression rx("^(-?)(\\d+):(\\d{1,2}):(\\d{1,2}(?:\\.\\d+)?)$");
    const QRegularExpressionMatch m = rx.match(value);
    if (!m.hasMatch()) return false;
    bool ok1 = false, ok2 = false, ok3 = false;
    const qint64 h = m.captured(2).toLongLong(&ok1);
    const qint64 min = m.captured(3).toLongLong(&ok2);
    const double sec = m.captured(4).toDouble(&ok3);
    if (!ok1 || !ok2 || !ok3) return false;
    ms = (h * 3600 + min * 60) * 1000 + qint64(sec * 1000.0);
    if (!m.captured(1).isEmpty()) ms = -ms;
    return true;
}

bool ProgressParser::frameOutTimeMs(qint64& ms) const
{
    bool ok = false;
    // out_time_ms carries microseconds as well, same as out_time_us.
    for (const char* usKey : {"out_time_us", "out_time_ms"}) {
        const auto it = m_frame.constFind(QLatin1String(usKey));
        if (it == m_frame.constEnd()) continue;
        const qint64 us = it.value().toLongLong(&ok);
        if (ok) { ms = us / 1000; return true; }
    }
    const auto clock = m_frame.constFind(QStringLiteral("out_time"));
    if (clock != m_frame.constEnd() && parseClock(clock.value(), ms)) return true;
    return false;
}

ProgressSnapshot ProgressParser::closeFrame(bool end)
{
    ProgressSnapshot snap;

    qint64 ms = 0;
    if (frameOutTimeMs(ms)) m_maxOutTimeMs = std::max(m_maxOutTimeMs, std::max<qint64>(0, ms));
    snap.outTimeMs = m_maxOutTimeMs;

    bool ok = false;
    const qint64 frame = m_frame.value(QStringLiteral("frame")).toLongLong(&ok);
    if (ok) snap.frame = frame;

    QString speed = m_frame.value(QStringLiteral("speed"));
    if (speed.endsWith(QLatin1Char('x'))) speed.chop(1);
    const double sp = speed.trimmed().toDouble(&ok);
    if (ok) snap.speed = sp;

    snap.end = end;
    if (m_durationMs > 0) {
        snap.fraction = end ? 1.0 : std::clamp(double(m_maxOutTimeMs) / double(m_durationMs), 0.0, 1.0);
    }

    m_frame.clear();
    if (end) {
        m_sawEnd = true;
        m_finished = true;
    }
    return snap;
}

bool ProgressParser::feedLine(const QString& line, ProgressSnapshot& out)
{
    if (m_finished) return false;
    const QString s = line.trimmed();
    if (s.isEmpty()) return false;

    const int eq = s.indexOf(QLatin1Char('='));
    if (eq <= 0) { ++m_ignored; return false; }

    const QString key = s.left(eq).trimmed();
    const QString value = s.mid(eq + 1).trimmed();

    if (key == QLatin1String("progress")) {
        if (value == QLatin1String("continue")) { out = closeFrame(false); return true; }
        if (value == QLatin1String("end")) { out = closeFrame(true); return true; }
        ++m_ignored;
        return false;
    }
    if (value.isEmpty() || value == QLatin1String("N/A")) {
        ++m_ignored;
        return false;
    }
    m_frame.insert(key, value);
    return false;
}

QVector<ProgressSnapshot> ProgressParser::feed(const QByteArray& chunk)
{
    QVector<ProgressSnapshot> out;
    m_pending.append(chunk);
    qsizetype nl;
    while ((nl = m_pending.indexOf('\n')) >= 0) {
        const QString line = QString::fromUtf8(m_pending.constData(), nl);
        m_pending.remove(0, nl + 1);
        ProgressSnapshot snap;
        if (feedLine(line, snap)) out.push_back(snap);
    }
    return out;
}

QVector<ProgressSnapshot> ProgressParser::finish()
{
    QVector<ProgressSnapshot> out;
    if (!m_pending.isEmpty()) {
        ProgressSnapshot snap;
        if (feedLine(QString::fromUtf8(m_pending), snap)) out.push_back(snap);
        m_pending.clear();
    }
    m_finished = true;
    return out;
}
