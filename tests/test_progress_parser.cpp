#include <QtTest>
#include "../src/progress_parser.h"

class TestProgressParser : public QObject {
    Q_OBJECT
private slots:
    void testFrameWithKnownDuration();
    void testOutTimeFallbacks_data();
    void testOutTimeFallbacks();
    void testUnknownDurationIsIndeterminate();
    void testEndPinsFractionToOne();
    void testIgnoresMalformedLines();
    void testFractionNeverDecreases();
    void testChunkedInput();
    void testNothingAfterEnd();
    void testParseClock();
};

void TestProgressParser::testFrameWithKnownDuration()
{
    ProgressParser p(10000);
    ProgressSnapshot s;
    QVERIFY(!p.feedLine("frame=75", s));
    QVERIFY(!p.feedLine("out_time_us=2500000", s));
    QVERIFY(!p.feedLine("speed=1.52x", s));
    QVERIFY(p.feedLine("progress=continue", s));
    QCOMPARE(s.outTimeMs, qint64(2500));
    QCOMPARE(s.frame, qint64(75));
    QCOMPARE(s.speed, 1.52);
    QCOMPARE(s.fraction, 0.25);
    QVERIFY(!s.end);
    QVERIFY(!p.isFinished());
}

void TestProgressParser::testOutTimeFallbacks_data()
{
    QTest::addColumn<QStringList>("lines");
    QTest::addColumn<qint64>("expectedMs");

    QTest::newRow("us") << QStringList{"out_time_us=4000000"} << qint64(4000);
    // Despite the name, out_time_ms is in microseconds.
    QTest::newRow("ms-key") << QStringList{"out_time_ms=4000000"} << qint64(4000);
    QTest::newRow("clock") << QStringList{"out_time=00:00:04.000000"} << qint64(4000);
    QTest::newRow("us wins") << QStringList{"out_time=00:00:09.000000", "out_time_us=4000000"} << qint64(4000);
    QTest::newRow("us N/A") << QStringList{"out_time_us=N/A", "out_time=00:00:04.000000"} << qint64(4000);
}

void TestProgressParser::testOutTimeFallbacks()
{
    QFETCH(QStringList, lines);
    QFETCH(qint64, expectedMs);

    ProgressParser p(8000);
    ProgressSnapshot s;
    for (const QString& l : lines) QVERIFY(!p.feedLine(l, s));
    QVERIFY(p.feedLine("progress=continue", s));
    QCOMPARE(s.outTimeMs, expectedMs);
    QCOMPARE(s.fraction, 0.5);
}

void TestProgressParser::testUnknownDurationIsIndeterminate()
{
    ProgressParser p;
    ProgressSnapshot s;
    p.feedLine("out_time_us=1000000", s);
    QVERIFY(p.feedLine("progress=continue", s));
    QVERIFY(s.isIndeterminate());
    QCOMPARE(s.outTimeMs, qint64(1000));

    // progress=end without a duration stays indeterminate
    QVERIFY(p.feedLine("progress=end", s));
    QVERIFY(s.end);
    QVERIFY(s.isIndeterminate());
    QVERIFY(p.sawEnd());
}

void TestProgressParser::testEndPinsFractionToOne()
{
    ProgressParser p(10000);
    ProgressSnapshot s;
    // The encoder may stop a little short of the probed duration.
    p.feedLine("out_time_us=9960000", s);
    QVERIFY(p.feedLine("progress=end", s));
    QVERIFY(s.end);
    QCOMPARE(s.fraction, 1.0);
    QVERIFY(p.isFinished());
}

void TestProgressParser::testIgnoresMalformedLines()
{
    ProgressParser p(10000);
    ProgressSnapshot s;
    QVERIFY(!p.feedLine("garbage without separator", s));
    QVERIFY(!p.feedLine("=value", s));
    QVERIFY(!p.feedLine("bitrate=N/A", s));
    QVERIFY(!p.feedLine("progress=whatever", s));
    QVERIFY(!p.feedLine("", s));
    QCOMPARE(p.ignoredLines(), 4);

    p.feedLine("out_time_us=1000000", s);
    QVERIFY(p.feedLine("progress=continue", s));
    QCOMPARE(s.fraction, 0.1);
}

void TestProgressParser::testFractionNeverDecreases()
{
    ProgressParser p(10000);
    ProgressSnapshot s;
    p.feedLine("out_time_us=6000000", s);
    QVERIFY(p.feedLine("progress=continue", s));
    QCOMPARE(s.fraction, 0.6);

    // Negative and regressing clocks show up at stream start and after seeks.
    p.feedLine("out_time=-00:00:00.040000", s);
    QVERIFY(p.feedLine("progress=continue", s));
    QCOMPARE(s.fraction, 0.6);
    QCOMPARE(s.outTimeMs, qint64(6000));

    p.feedLine("out_time_us=3000000", s);
    QVERIFY(p.feedLine("progress=continue", s));
    QCOMPARE(s.fraction, 0.6);

    // Overshoot clamps to 1.0
    p.feedLine("out_time_us=12000000", s);
    QVERIFY(p.feedLine("progress=continue", s));
    QCOMPARE(s.fraction, 1.0);
}

void TestProgressParser::testChunkedInput()
{
    ProgressParser p(4000);
    QVector<ProgressSnapshot> snaps = p.feed("frame=1\nout_time_us=10");
    QVERIFY(snaps.isEmpty());
    snaps = p.feed("00000\nprogress=cont");
    QVERIFY(snaps.isEmpty());
    snaps = p.feed("inue\r\nout_time_us=2000000\nprogress=continue\n");
    QCOMPARE(snaps.size(), 2);
    QCOMPARE(snaps.at(0).outTimeMs, qint64(1000));
    QCOMPARE(snaps.at(0).fraction, 0.25);
    QCOMPARE(snaps.at(1).fraction, 0.5);

    // Unterminated trailing line is flushed by finish()
    QVERIFY(p.feed("progress=end").isEmpty());
    snaps = p.finish();
    QCOMPARE(snaps.size(), 1);
    QVERIFY(snaps.first().end);
    QCOMPARE(snaps.first().fraction, 1.0);
}

void TestProgressParser::testNothingAfterEnd()
{
    ProgressParser p(4000);
    ProgressSnapshot s;
    QVERIFY(p.feedLine("progress=end", s));
    QVERIFY(!p.feedLine("out_time_us=1000000", s));
    QVERIFY(!p.feedLine("progress=continue", s));
    QVERIFY(p.feed("progress=continue\n").isEmpty());

    p.reset(4000);
    QVERIFY(!p.isFinished());
    QVERIFY(!p.sawEnd());
    QVERIFY(p.feedLine("progress=continue", s));
}

void TestProgressParser::testParseClock()
{
    qint64 ms = 0;
    QVERIFY(ProgressParser::parseClock("01:02:03.500000", ms));
    QCOMPARE(ms, qint64(3723500));
    QVERIFY(ProgressParser::parseClock("00:00:07", ms));
    QCOMPARE(ms, qint64(7000));
    QVERIFY(ProgressParser::parseClock("-00:00:01.000000", ms));
    QCOMPARE(ms, qint64(-1000));
    QVERIFY(!ProgressParser::parseClock("N/A", ms));
    QVERIFY(!ProgressParser::parseClock("12.5", ms));
}

QTEST_APPLESS_MAIN(TestProgressParser)
#include "test_progress_parser.moc"
