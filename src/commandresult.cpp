module;
#include <QString>
#include <QStringList>

module devsrv.core.commandresult;

QString failureKindName(FailureKind kind)
{
    switch (kind) {
    case FailureKind::None:
        return QStringLiteral("none");
    case FailureKind::ConfigPersist:
        return QStringLiteral("config-persist");
    case FailureKind::SchemaRecovery:
        return QStringLiteral("schema-recovery");
    case FailureKind::ProcessLaunch:
        return QStringLiteral("process-launch");
    case FailureKind::PrivilegeEscalation:
        return QStringLiteral("privilege-escalation");
    }

    return QStringLiteral("unknown");
}

bool CommandResult::ok() const
{
    return exitCode == 0;
}

QString CommandResult::message() const
{
    QString detail = err.trimmed();
    if (detail.isEmpty()) {
        detail = out.trimmed();
    }

    if (detail.isEmpty()) {
        return ok()
            ? QStringLiteral("OK")
            : QStringLiteral("Command failed with exit code %1.").arg(exitCode);
    }

    // Diagnostics are shown on one line.
    const QStringList lines = detail.split('\n', Qt::SkipEmptyParts);
    QStringList trimmedLines;
    trimmedLines.reserve(lines.size());
    for (const QString& line : lines) {
        trimmedLines.append(line.trimmed());
    }
    return trimmedLines.join(QStringLiteral(" | "));
}

CommandResult CommandResult::success(const QString& out)
{
    CommandResult result;
    result.out = out;
    return result;
}

CommandResult CommandResult::failed(FailureKind kind, const QString& error, int exitCode)
{
    CommandResult result;
    result.exitCode = exitCode == 0 ? 2 : exitCode;
    result.err = error;
    result.failure = kind;
    return result;
}
