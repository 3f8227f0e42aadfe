module;
#include <QString>
#include <QStringList>

module devsrv.core.privilegedrunner;

import devsrv.core.processrunner;

namespace {
// osascript reports a dismissed password dialog as error -128.
constexpr auto kUserCanceledMarker = "(-128)";
// pkexec exit codes for a dismissed dialog and a failed authorization.
constexpr int kPkexecDismissed = 126;
constexpr int kPkexecNotAuthorized = 127;
}

PrivilegedRunner::PrivilegedRunner(HostPlatform platform, int timeoutMs)
    : m_platform(platform)
    , m_timeoutMs(timeoutMs)
{
}

QString PrivilegedRunner::program() const
{
    switch (m_platform) {
    case HostPlatform::MacOS:
        return QStringLiteral("/usr/bin/osascript");
    case HostPlatform::Linux:
        return QStringLiteral("pkexec");
    case HostPlatform::Unsupported:
    default:
        return {};
    }
}

QStringList PrivilegedRunner::arguments(const QString& shellCommand) const
{
    switch (m_platform) {
    case HostPlatform::MacOS: {
        const QString script = QStringLiteral("do shell script \"%1\" with administrator privileges")
            .arg(appleScriptQuote(shellCommand));
        return {QStringLiteral("-e"), script};
    }
    case HostPlatform::Linux:
        return {QStringLiteral("/bin/sh"), QStringLiteral("-c"), shellCommand};
    case HostPlatform::Unsupported:
    default:
        return {};
    }
}

CommandResult PrivilegedRunner::run(const QString& shellCommand) const
{
    if (m_platform == HostPlatform::Unsupported) {
        return CommandResult::failed(
            FailureKind::PrivilegeEscalation,
            QStringLiteral("Privileged commands are not supported on this platform.")
        );
    }

    CommandResult result = ProcessRunner::run(program(), arguments(shellCommand), m_timeoutMs);
    if (result.ok()) {
        return result;
    }

    result.failure = FailureKind::PrivilegeEscalation;

    if (result.exitCode == ProcessRunner::kTimedOutExitCode) {
        result.err = QStringLiteral("Administrator authorization timed out.");
    } else if (m_platform == HostPlatform::MacOS && result.err.contains(QLatin1String(kUserCanceledMarker))) {
        result.err = QStringLiteral("Administrator authorization was cancelled.");
    } else if (m_platform == HostPlatform::Linux
               && (result.exitCode == kPkexecDismissed || result.exitCode == kPkexecNotAuthorized)
               && result.err.trimmed().isEmpty()) {
        result.err = QStringLiteral("Administrator authorization was cancelled or denied.");
    }

    return result;
}
