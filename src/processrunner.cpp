module;
#include <QElapsedTimer>
#include <QIODevice>
#include <QProcess>
#include <QString>
#include <QStringList>
#include <QThread>

#ifdef Q_OS_UNIX
#include <cerrno>
#include <csignal>
#include <sys/types.h>
#endif

module devsrv.core.processrunner;

namespace {
constexpr int kStartTimeoutMs = 5000;
constexpr int kKillWaitMs = 2000;
constexpr int kAlivePollMs = 50;

void setError(QString *errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}
}

QString shellQuote(const QString& value)
{
    QString quoted = value;
    quoted.replace(QStringLiteral("'"), QStringLiteral("'\\''"));
    return QStringLiteral("'") + quoted + QStringLiteral("'");
}

QString appleScriptQuote(const QString& value)
{
    QString escaped = value;
    escaped.replace(QStringLiteral("\\"), QStringLiteral("\\\\"));
    escaped.replace(QStringLiteral("\""), QStringLiteral("\\\""));
    escaped.replace(QStringLiteral("\n"), QStringLiteral("\\n"));
    return escaped;
}

CommandResult ProcessRunner::run(const QString& program, const QStringList& arguments, int timeoutMs)
{
    QProcess process;
    process.start(program, arguments);

    if (!process.waitForStarted(kStartTimeoutMs)) {
        CommandResult result;
        result.exitCode = kStartFailedExitCode;
        result.err = QStringLiteral("Cannot run %1: %2").arg(program, process.errorString());
        return result;
    }

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(kKillWaitMs);

        CommandResult result;
        result.exitCode = kTimedOutExitCode;
        result.out = QString::fromUtf8(process.readAllStandardOutput());
        result.err = QStringLiteral("Process timed out: %1").arg(program);
        return result;
    }

    CommandResult result;
    result.out = QString::fromUtf8(process.readAllStandardOutput());
    result.err = QString::fromUtf8(process.readAllStandardError());
    result.exitCode = process.exitCode();
    if (process.exitStatus() != QProcess::NormalExit && result.exitCode == 0) {
        result.exitCode = 1;
        if (result.err.trimmed().isEmpty()) {
            result.err = QStringLiteral("%1 crashed.").arg(program);
        }
    }
    return result;
}

bool ProcessRunner::startDetached(
    const QString& program,
    const QStringList& arguments,
    const QString& workingDirectory,
    const QString& logPath,
    qint64 *pid,
    QString *errorMessage)
{
    QProcess process;
    process.setProgram(program);
    process.setArguments(arguments);
    if (!workingDirectory.trimmed().isEmpty()) {
        process.setWorkingDirectory(workingDirectory);
    }
    if (!logPath.isEmpty()) {
        process.setStandardOutputFile(logPath, QIODevice::Append);
        process.setStandardErrorFile(logPath, QIODevice::Append);
    }
    process.setStandardInputFile(QProcess::nullDevice());

    qint64 startedPid = 0;
    if (!process.startDetached(&startedPid)) {
        setError(errorMessage, QStringLiteral("Failed to start %1: %2").arg(program, process.errorString()));
        return false;
    }

    if (pid) {
        *pid = startedPid;
    }
    return true;
}

bool ProcessRunner::isProcessAlive(qint64 pid)
{
#ifdef Q_OS_UNIX
    if (pid <= 1) {
        return false;
    }
    // EPERM means the id now belongs to another user's process.
    return ::kill(static_cast<pid_t>(pid), 0) == 0;
#else
    Q_UNUSED(pid)
    return false;
#endif
}

bool ProcessRunner::terminate(qint64 pid, int graceMs)
{
#ifdef Q_OS_UNIX
    if (pid <= 1) {
        return false;
    }

    if (::kill(static_cast<pid_t>(pid), SIGTERM) != 0) {
        return errno == ESRCH;
    }

    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < graceMs) {
        if (!isProcessAlive(pid)) {
            return true;
        }
        QThread::msleep(kAlivePollMs);
    }

    ::kill(static_cast<pid_t>(pid), SIGKILL);
    QThread::msleep(kAlivePollMs);
    return !isProcessAlive(pid);
#else
    Q_UNUSED(pid)
    Q_UNUSED(graceMs)
    return false;
#endif
}
