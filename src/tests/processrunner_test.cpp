#include <QElapsedTimer>
#include <QFile>
#include <QString>
#include <QTemporaryDir>
#include <QThread>
#include <QtGlobal>
#include <gtest/gtest.h>

import devsrv.core.processrunner;

#ifdef Q_OS_UNIX

TEST(ProcessRunnerTest, CapturesOutputAndExitCode)
{
    const CommandResult result = ProcessRunner::run(
        QStringLiteral("/bin/sh"), {QStringLiteral("-c"), QStringLiteral("printf out; printf err >&2; exit 3")}, 5000);

    EXPECT_EQ(result.exitCode, 3);
    EXPECT_EQ(result.out, QStringLiteral("out"));
    EXPECT_EQ(result.err, QStringLiteral("err"));
    EXPECT_FALSE(result.ok());
}

TEST(ProcessRunnerTest, MissingProgramReportsStartFailure)
{
    const CommandResult result = ProcessRunner::run(QStringLiteral("/nonexistent/devsrv-tool"), {}, 1000);

    EXPECT_EQ(result.exitCode, ProcessRunner::kStartFailedExitCode);
    EXPECT_FALSE(result.err.isEmpty());
}

TEST(ProcessRunnerTest, TimeoutKillsProcess)
{
    QElapsedTimer timer;
    timer.start();
    const CommandResult result = ProcessRunner::run(
        QStringLiteral("/bin/sh"), {QStringLiteral("-c"), QStringLiteral("sleep 10")}, 200);

    EXPECT_EQ(result.exitCode, ProcessRunner::kTimedOutExitCode);
    EXPECT_LT(timer.elapsed(), 5000);
}

TEST(ProcessRunnerTest, DetachedProcessAppendsToLog)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString logPath = dir.filePath(QStringLiteral("out.log"));

    qint64 pid = 0;
    QString error;
    ASSERT_TRUE(ProcessRunner::startDetached(
        QStringLiteral("/bin/sh"),
        {QStringLiteral("-c"), QStringLiteral("echo detached")},
        dir.path(),
        logPath,
        &pid,
        &error)) << error.toStdString();
    EXPECT_GT(pid, 0);

    QByteArray contents;
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < 5000) {
        QFile file(logPath);
        if (file.open(QIODevice::ReadOnly)) {
            contents = file.readAll();
            if (contents.contains("detached")) {
                break;
            }
        }
        QThread::msleep(20);
    }
    EXPECT_TRUE(contents.contains("detached"));
}

TEST(ProcessRunnerTest, InvalidPidsAreNotAlive)
{
    EXPECT_FALSE(ProcessRunner::isProcessAlive(0));
    EXPECT_FALSE(ProcessRunner::isProcessAlive(-5));
    EXPECT_FALSE(ProcessRunner::terminate(0, 100));
}

#endif
