module;
#include <QFile>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

module devsrv.core.hostsaliassync;

import devsrv.core.processrunner;

HostsAliasSync::HostsAliasSync(const QString& hostsPath, HostPlatform platform)
    : m_hostsPath(hostsPath)
    , m_platform(platform)
{
}

QString HostsAliasSync::beginMarker()
{
    return QStringLiteral("# DEVSRV-BEGIN");
}

QString HostsAliasSync::endMarker()
{
    return QStringLiteral("# DEVSRV-END");
}

QStringList HostsAliasSync::desiredLines(const QList<Site>& sites)
{
    QStringList lines;
    for (const Site& site : sites) {
        if (!site.served || site.mode != SiteMode::CustomDomain) {
            continue;
        }

        const QString domain = site.domain.trimmed();
        if (domain.isEmpty()) {
            continue;
        }

        const QString line = QStringLiteral("127.0.0.1 %1").arg(domain);
        if (!lines.contains(line)) {
            lines.append(line);
        }
    }
    return lines;
}

QString HostsAliasSync::applyBlock(const QString& hostsText, const QStringList& lines)
{
    QStringList input = hostsText.split('\n');
    const bool trailingNewline = hostsText.endsWith('\n');
    if (trailingNewline || hostsText.isEmpty()) {
        input.removeLast();
    }

    // Same range semantics as `sed '/BEGIN/,/END/d'`.
    QString output;
    bool inBlock = false;
    for (qsizetype i = 0; i < input.size(); ++i) {
        const QString& line = input.at(i);
        if (!inBlock && line.contains(beginMarker())) {
            inBlock = true;
            continue;
        }
        if (inBlock) {
            if (line.contains(endMarker())) {
                inBlock = false;
            }
            continue;
        }

        output += line;
        const bool lastLine = i == input.size() - 1;
        if (!lastLine || trailingNewline) {
            output += QLatin1Char('\n');
        }
    }

    if (lines.isEmpty()) {
        return output;
    }

    if (!output.isEmpty() && !output.endsWith('\n')) {
        output += QLatin1Char('\n');
    }

    output += beginMarker() + QLatin1Char('\n');
    for (const QString& line : lines) {
        output += line + QLatin1Char('\n');
    }
    output += endMarker() + QLatin1Char('\n');
    return output;
}

bool HostsAliasSync::hasBlock(const QString& hostsText)
{
    // A stray end marker is not something the removal command can delete.
    return applyBlock(hostsText, {}) != hostsText;
}

QString HostsAliasSync::buildSyncCommand(const QStringList& lines) const
{
    const QString hosts = shellQuote(m_hostsPath);
    const QString range = shellQuote(QStringLiteral("/%1/,/%2/d").arg(beginMarker(), endMarker()));

    QString command = m_platform == HostPlatform::MacOS
        ? QStringLiteral("/usr/bin/sed -i '' %1 %2").arg(range, hosts)
        : QStringLiteral("sed -i %1 %2").arg(range, hosts);

    if (lines.isEmpty()) {
        return command;
    }

    QStringList printfArgs;
    printfArgs << shellQuote(beginMarker());
    for (const QString& line : lines) {
        printfArgs << shellQuote(line);
    }
    printfArgs << shellQuote(endMarker());

    command += QStringLiteral(" && { [ -z \"$(tail -c 1 %1)\" ] || printf '\\n' >> %1; }").arg(hosts);
    command += QStringLiteral(" && printf '%s\\n' %1 >> %2").arg(printfArgs.join(' '), hosts);
    return command;
}

std::optional<QString> HostsAliasSync::readHosts() const
{
    QFile file(m_hostsPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    return QString::fromUtf8(file.readAll());
}

CommandResult HostsAliasSync::sync(const QList<Site>& sites, const PrivilegedCommand& runPrivileged) const
{
    const QStringList lines = desiredLines(sites);

    const auto current = readHosts();
    if (current.has_value() && applyBlock(current.value(), lines) == current.value()) {
        return CommandResult::success(QStringLiteral("Hosts aliases already up to date."));
    }

    if (!runPrivileged) {
        return CommandResult::failed(FailureKind::PrivilegeEscalation, QStringLiteral("No privileged runner available."));
    }

    CommandResult result = runPrivileged(buildSyncCommand(lines));
    if (!result.ok() && result.failure == FailureKind::None) {
        result.failure = FailureKind::PrivilegeEscalation;
    }
    return result;
}

QString HostsAliasSync::hostsPath() const
{
    return m_hostsPath;
}
