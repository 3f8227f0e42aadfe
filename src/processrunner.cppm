/*!
 * @file        processrunner.cppm
 * @brief       Bounded external process execution.
 *
 * @details
 * Synchronous wrappers around `QProcess` used by every component that shells
 * out: wait with a deadline, force-kill on timeout, capture output into a
 * `CommandResult`. Also provides detached launching with output redirected
 * to a log file, pid-based termination and shell/AppleScript quoting.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>
#include <QStringList>
#include <QtTypes>

export module devsrv.core.processrunner;

export import devsrv.core.commandresult;

/**
 * @brief Quote a value for POSIX `sh`.
 * @param value Raw argument.
 * @return Single-quoted, escaped argument.
 */
export QString shellQuote(const QString& value);

/**
 * @brief Escape text for embedding in an AppleScript string literal.
 * @param value Raw text.
 * @return Escaped text (backslash, double quote, newline).
 */
export QString appleScriptQuote(const QString& value);

/**
 * @class ProcessRunner
 * @brief Static helpers for running and controlling external programs.
 */
export class ProcessRunner
{
public:
    //! Exit code reported when the program cannot be started.
    static constexpr int kStartFailedExitCode = 127;
    //! Exit code reported when the program was killed on timeout.
    static constexpr int kTimedOutExitCode = 124;

    /**
     * @brief Run a program to completion or until the deadline.
     * @param program Executable path.
     * @param arguments Argument list.
     * @param timeoutMs Deadline; the process is killed when exceeded.
     * @return Exit code and captured output.
     */
    static CommandResult run(const QString& program, const QStringList& arguments, int timeoutMs);

    /**
     * @brief Launch a background process that outlives this one.
     * @param program Executable path.
     * @param arguments Argument list.
     * @param workingDirectory Working directory (may be empty).
     * @param logPath File receiving appended stdout and stderr.
     * @param pid Output process id.
     * @param errorMessage Optional output message on failure.
     * @return True when the process was started.
     */
    static bool startDetached(
        const QString& program,
        const QStringList& arguments,
        const QString& workingDirectory,
        const QString& logPath,
        qint64 *pid,
        QString *errorMessage = nullptr);

    /**
     * @brief Whether a process id refers to a live process we may signal.
     * @param pid Process id.
     * @return True when signal 0 can be delivered, false for other users' processes.
     */
    static bool isProcessAlive(qint64 pid);

    /**
     * @brief Send SIGTERM, then SIGKILL after the grace period.
     * @param pid Process id.
     * @param graceMs Grace period in milliseconds.
     * @return True when the process is gone afterwards.
     */
    static bool terminate(qint64 pid, int graceMs);
};
