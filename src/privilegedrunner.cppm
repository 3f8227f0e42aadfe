/*!
 * @file        privilegedrunner.cppm
 * @brief       Privilege escalation gateway.
 *
 * @details
 * Every operation needing root (service install/repair/removal, hosts table
 * rewrite) is composed into one shell command string and executed here,
 * producing exactly one OS consent prompt per call: `osascript ... with
 * administrator privileges` on macOS, `pkexec` on Linux. Calls are never
 * retried; a declined prompt is a regular non-zero result.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>
#include <QStringList>

export module devsrv.core.privilegedrunner;

export import devsrv.core.commandresult;
export import devsrv.core.runtimepaths;

/**
 * @class PrivilegedRunner
 * @brief Runs one shell command with elevated rights.
 */
export class PrivilegedRunner
{
public:
    /**
     * @brief Construct gateway for a platform.
     * @param platform Escalation flavor.
     * @param timeoutMs Deadline including the time the prompt is shown.
     */
    explicit PrivilegedRunner(HostPlatform platform = currentHostPlatform(), int timeoutMs = 60000);

    /**
     * @brief Execute a shell command as root.
     * @param shellCommand Complete `sh` command line.
     * @return Result tagged `PrivilegeEscalation` on any failure.
     */
    CommandResult run(const QString& shellCommand) const;

    /**
     * @brief Program that shows the consent prompt.
     * @return Absolute program path, empty when unsupported.
     */
    QString program() const;

    /**
     * @brief Arguments passed to `program()` for a command.
     * @param shellCommand Complete `sh` command line.
     * @return Argument list.
     */
    QStringList arguments(const QString& shellCommand) const;

private:
    HostPlatform m_platform; //!< Escalation flavor.
    int m_timeoutMs = 60000;  //!< Deadline for one call.
};
