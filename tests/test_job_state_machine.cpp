#include <QtTest>
#include "../src/job_state_machine.h"

class TestJobStateMachine : public QObject {
    Q_OBJECT
private slots:
    void testTransitions_data();
    void testTransitions();
    void testIllegalTransitionLeavesJobUntouched();
    void testCompletedPinsProgress();
    void testCancelledClearsError();
    void testMakeRetry();
    void testLogTailKeepsNewest();
};

void TestJobStateMachine::testTransitions_data()
{
    QTest::addColumn<JobStatus>("from");
    QTest::addColumn<JobStatus>("to");
    QTest::addColumn<bool>("allowed");

    QTest::newRow("queued->running") << JobStatus::Queued << JobStatus::Running << true;
    QTest::newRow("queued->cancelled") << JobStatus::Queued << JobStatus::Cancelled << true;
    QTest::newRow("queued->failed") << JobStatus::Queued << JobStatus::Failed << true;
    QTest::newRow("queued->completed") << JobStatus::Queued << JobStatus::Completed << false;
    QTest::newRow("running->completed") << JobStatus::Running << JobStatus::Completed << true;
    QTest::newRow("running->failed") << JobStatus::Running << JobStatus::Failed << true;
    QTest::newRow("running->cancelled") << JobStatus::Running << JobStatus::Cancelled << true;
    QTest::newRow("running->queued") << JobStatus::Running << JobStatus::Queued << false;
    QTest::newRow("completed->running") << JobStatus::Completed << JobStatus::Running << false;
    QTest::newRow("failed->queued") << JobStatus::Failed << JobStatus::Queued << false;
    QTest::newRow("failed->running") << JobStatus::Failed << JobStatus::Running << false;
    QTest::newRow("cancelled->queued") << JobStatus::Cancelled << JobStatus::Queued << false;
    QTest::newRow("cancelled->failed") << JobStatus::Cancelled << JobStatus::Failed << false;
}

void TestJobStateMachine::testTransitions()
{
    QFETCH(JobStatus, from);
    QFETCH(JobStatus, to);
    QFETCH(bool, allowed);
    QCOMPARE(JobStateMachine::canTransition(from, to), allowed);
}

void TestJobStateMachine::testIllegalTransitionLeavesJobUntouched()
{
    ConversionJob job = makeConversionJob("/music/a.mp3");
    job.status = JobStatus::Failed;
    job.error = ConversionError::EncoderExitedNonZero;
    job.errorMessage = "encoder exited with code 1";

    QString err;
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("illegal transition"));
    QVERIFY(!JobStateMachine::transition(job, JobStatus::Running, &err));
    QVERIFY(err.contains("Failed -> Running"));
    QCOMPARE(job.status, JobStatus::Failed);
    QCOMPARE(job.error, ConversionError::EncoderExitedNonZero);
}

void TestJobStateMachine::testCompletedPinsProgress()
{
    ConversionJob job = makeConversionJob("/music/a.mp3");
    QVERIFY(JobStateMachine::transition(job, JobStatus::Running));
    job.progress = kIndeterminateProgress;
    QVERIFY(JobStateMachine::transition(job, JobStatus::Completed));
    QCOMPARE(job.progress, 1.0);
    QVERIFY(job.isTerminal());
    QVERIFY(JobStateMachine::isTerminal(job.status));
}

void TestJobStateMachine::testCancelledClearsError()
{
    ConversionJob job = makeConversionJob("/music/a.mp3");
    QVERIFY(JobStateMachine::transition(job, JobStatus::Running));
    job.error = ConversionError::ProbeFailed;
    job.errorMessage = "duration unknown";
    QVERIFY(JobStateMachine::transition(job, JobStatus::Cancelled));
    QCOMPARE(job.error, ConversionError::None);
    QVERIFY(job.errorMessage.isEmpty());
}

void TestJobStateMachine::testMakeRetry()
{
    ConversionJob job = makeConversionJob("/music/a.mp3", 7);
    QVERIFY(JobStateMachine::transition(job, JobStatus::Running));
    job.coverImagePath = "/covers/front.png";
    job.outputPath = "/out/a.mpg";
    job.progress = 0.4;
    job.logTail.append("Error while decoding");
    job.error = ConversionError::EncoderExitedNonZero;
    QVERIFY(JobStateMachine::transition(job, JobStatus::Failed));

    const ConversionJob retry = JobStateMachine::makeRetry(job);
    QVERIFY(retry.id != job.id);
    QVERIFY(retry.isValid());
    QCOMPARE(retry.retryOf, job.id);
    QCOMPARE(retry.inputAudioPath, job.inputAudioPath);
    QCOMPARE(retry.status, JobStatus::Queued);
    QCOMPARE(retry.progress, 0.0);
    QCOMPARE(retry.error, ConversionError::None);
    QVERIFY(retry.outputPath.isEmpty());
    QVERIFY(retry.coverImagePath.isEmpty());
    QVERIFY(retry.logTail.isEmpty());
    QCOMPARE(retry.logTail.capacity(), 7);

    // The original record is unchanged
    QCOMPARE(job.status, JobStatus::Failed);
    QCOMPARE(job.outputPath, QString("/out/a.mpg"));
    QCOMPARE(job.coverImagePath, QString("/covers/front.png"));
}

void TestJobStateMachine::testLogTailKeepsNewest()
{
    LogTail tail(3);
    for (int i = 1; i <= 5; ++i) tail.append(QString("line %1").arg(i));
    QCOMPARE(tail.size(), 3);
    QCOMPARE(tail.lines(), QStringList({"line 3", "line 4", "line 5"}));
    QCOMPARE(tail.joined(), QString("line 3\nline 4\nline 5"));
    tail.clear();
    QVERIFY(tail.isEmpty());
}

QTEST_APPLESS_MAIN(TestJobStateMachine)
#include "test_job_state_machine.moc"
