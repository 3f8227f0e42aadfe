/*!
 * @file        commandresult.cppm
 * @brief       Structured result of external and privileged operations.
 *
 * @details
 * Every DevSrv operation that executes a program, escalates privileges or
 * mutates proxy runtime state reports back through `CommandResult`. The
 * failure kind lets front ends tell persistence, launch and escalation
 * problems apart while still printing a single diagnostic line.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>

export module devsrv.core.commandresult;

/**
 * @enum FailureKind
 * @brief Error taxonomy for core operations.
 */
export enum class FailureKind
{
    None,                //!< Operation succeeded.
    ConfigPersist,       //!< Registry or generated config could not be written.
    SchemaRecovery,      //!< Registry file unreadable even by lenient recovery.
    ProcessLaunch,       //!< Unprivileged proxy process failed to start.
    PrivilegeEscalation  //!< Consent declined or an escalated step failed.
};

/**
 * @brief Human-readable name of a failure kind.
 * @param kind Failure kind.
 * @return Short label.
 */
export QString failureKindName(FailureKind kind);

/**
 * @struct CommandResult
 * @brief Exit code and captured output of one operation.
 */
export struct CommandResult {
    int exitCode = 0;                       //!< Zero on success.
    QString out;                            //!< Captured standard output.
    QString err;                            //!< Captured standard error.
    FailureKind failure = FailureKind::None; //!< Classified failure, if any.

    /**
     * @brief Whether the operation succeeded.
     * @return True when exit code is zero.
     */
    bool ok() const;

    /**
     * @brief Single-line diagnostic for display near the point of action.
     * @return Trimmed stderr, else stdout, else a generic exit-code message.
     */
    QString message() const;

    /**
     * @brief Build a successful result.
     * @param out Optional informational output.
     * @return Result with exit code zero.
     */
    static CommandResult success(const QString& out = QString());

    /**
     * @brief Build a failed result.
     * @param kind Failure classification.
     * @param error Diagnostic text.
     * @param exitCode Non-zero exit code.
     * @return Failed result.
     */
    static CommandResult failed(FailureKind kind, const QString& error, int exitCode = 2);
};
