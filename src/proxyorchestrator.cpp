module;
#include <QByteArray>
#include <QFile>
#include <QFileInfo>
#include <QIODevice>
#include <QList>
#include <QSaveFile>
#include <QString>
#include <QStringList>
#include <QUrl>

#include <algorithm>
#include <optional>
#include <utility>

module devsrv.core.proxyorchestrator;

import devsrv.core.caddyfilebuilder;
import devsrv.core.hostsaliassync;
import devsrv.core.privilegedrunner;
import devsrv.core.processrunner;
import devsrv.core.servicedescriptor;
import devsrv.core.statusprober;

namespace {
// Large logs are only read from their tail.
constexpr qint64 kMaxLogTailBytes = 256 * 1024;

QString tailLines(const QString& path, int lines)
{
    QFile file(path);
    if (!file.exists()) {
        return QStringLiteral("(empty)");
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return QStringLiteral("(cannot read)");
    }

    const qint64 size = file.size();
    const bool truncated = size > kMaxLogTailBytes;
    if (truncated && !file.seek(size - kMaxLogTailBytes)) {
        return QStringLiteral("(cannot read)");
    }

    QStringList all = QString::fromUtf8(file.readAll()).split('\n');
    if (truncated && !all.isEmpty()) {
        all.removeFirst(); // partial line
    }
    all.removeAll(QString());

    if (all.isEmpty()) {
        return QStringLiteral("(empty)");
    }
    if (lines > 0 && all.size() > lines) {
        all = all.mid(all.size() - lines);
    }
    return all.join('\n');
}

QString firstLine(const QString& text)
{
    return text.trimmed().section('\n', 0, 0).trimmed();
}

// SIGTERM, poll every 0.2 s for the grace period, then SIGKILL. Never fails.
QString stopProcessCommand(qint64 pid, int graceMs)
{
    const int polls = std::max(1, graceMs / 200);
    return QStringLiteral(
        "{ kill -TERM %1 2>/dev/null; i=0; "
        "while [ $i -lt %2 ] && kill -0 %1 2>/dev/null; do sleep 0.2; i=$((i+1)); done; "
        "kill -KILL %1 2>/dev/null; true; }")
        .arg(pid)
        .arg(polls);
}
}

ProxyOrchestrator::ProxyOrchestrator(
    SiteRegistry& registry,
    const RuntimePaths& paths,
    const ProxySettings& settings,
    ActivityLog *log)
    : m_registry(registry)
    , m_paths(paths)
    , m_settings(settings)
    , m_log(log)
    , m_platform(currentHostPlatform())
    , m_hostsPath(RuntimePaths::hostsFile())
    , m_serviceDescriptorPath(RuntimePaths::serviceDescriptorPath(m_platform))
    , m_caddyExecutable(settings.resolveCaddyExecutable())
{
    initializeDefaultDependencies();
}

ProxyOrchestrator::ProxyOrchestrator(
    SiteRegistry& registry,
    const RuntimePaths& paths,
    const ProxySettings& settings,
    TestMode mode,
    ActivityLog *log)
    : m_registry(registry)
    , m_paths(paths)
    , m_settings(settings)
    , m_log(log)
    , m_dependencies(std::move(mode.dependencies))
    , m_platform(mode.platform)
    , m_hostsPath(mode.hostsPath.isEmpty() ? RuntimePaths::hostsFile() : mode.hostsPath)
    , m_serviceDescriptorPath(mode.serviceDescriptorPath.isEmpty()
          ? RuntimePaths::serviceDescriptorPath(mode.platform)
          : mode.serviceDescriptorPath)
    , m_caddyExecutable(mode.caddyExecutable.isEmpty() ? settings.resolveCaddyExecutable() : mode.caddyExecutable)
{
    initializeDefaultDependencies();
}

void ProxyOrchestrator::initializeDefaultDependencies()
{
    if (!m_dependencies.runCommand) {
        m_dependencies.runCommand = &ProcessRunner::run;
    }
    if (!m_dependencies.runPrivileged) {
        const PrivilegedRunner runner(m_platform, m_settings.privilegedTimeoutMs);
        m_dependencies.runPrivileged = [runner](const QString& shellCommand) {
            return runner.run(shellCommand);
        };
    }
    if (!m_dependencies.adminAlive) {
        const quint16 port = m_settings.adminPort;
        const int timeoutMs = m_settings.adminProbeTimeoutMs;
        m_dependencies.adminAlive = [port, timeoutMs]() {
            return StatusProber::adminAlive(port, timeoutMs);
        };
    }
    if (!m_dependencies.probeSite) {
        const int timeoutMs = m_settings.siteProbeTimeoutMs;
        m_dependencies.probeSite = [timeoutMs](const QUrl& url) {
            return StatusProber::probeSite(url, timeoutMs);
        };
    }
    if (!m_dependencies.launchDetached) {
        m_dependencies.launchDetached = &ProcessRunner::startDetached;
    }
    if (!m_dependencies.terminateProcess) {
        const int graceMs = m_settings.stopGraceMs;
        m_dependencies.terminateProcess = [graceMs](qint64 pid) {
            return ProcessRunner::terminate(pid, graceMs);
        };
    }
    if (!m_dependencies.isProcessAlive) {
        m_dependencies.isProcessAlive = &ProcessRunner::isProcessAlive;
    }
}

ProxyState ProxyOrchestrator::state() const
{
    if (m_dependencies.adminAlive()) {
        return ProxyState::Running;
    }
    if (serviceRunning()) {
        return ProxyState::Running;
    }
    if (QFileInfo::exists(m_paths.userPidFile())) {
        return ProxyState::Unknown;
    }
    return ProxyState::Stopped;
}

SiteStatus ProxyOrchestrator::siteStatus(const Site& site) const
{
    if (!site.served) {
        return SiteStatus::Off;
    }
    return siteStatus(site, state());
}

SiteStatus ProxyOrchestrator::siteStatus(const Site& site, ProxyState overall) const
{
    if (!site.served) {
        return SiteStatus::Off;
    }
    if (overall != ProxyState::Running) {
        return SiteStatus::Error;
    }
    return m_dependencies.probeSite(QUrl(site.urlString()));
}

CommandResult ProxyOrchestrator::apply()
{
    const CommandResult config = generateConfig();
    if (!config.ok()) {
        return config;
    }

    if (m_caddyExecutable.isEmpty() || !QFileInfo(m_caddyExecutable).isFile()) {
        const QString message = m_caddyExecutable.isEmpty()
            ? QStringLiteral("Caddy executable not found.")
            : QStringLiteral("Caddy executable not found: %1").arg(m_caddyExecutable);
        log(QStringLiteral("[Proxy] %1").arg(message));
        return CommandResult::failed(FailureKind::ProcessLaunch, message);
    }

    const QList<Site> served = m_registry.servedSites();
    const bool privileged = std::any_of(served.cbegin(), served.cend(), [](const Site& site) {
        return site.requiresPrivileges();
    });

    return privileged ? applyPrivileged(served) : applyUnprivileged();
}

CommandResult ProxyOrchestrator::applyPrivileged(const QList<Site>& served)
{
    const HostsAliasSync hosts(m_hostsPath, m_platform);
    const CommandResult hostsResult = hosts.sync(served, m_dependencies.runPrivileged);
    if (!hostsResult.ok()) {
        log(QStringLiteral("[Hosts] Sync failed: %1").arg(hostsResult.message()));
        return hostsResult;
    }
    log(QStringLiteral("[Hosts] %1").arg(hostsResult.message()));

    // The service needs the admin port the background process holds. It is
    // stopped by the escalated command so a declined prompt leaves it serving.
    std::optional<qint64> runningPid = recordedPid();
    if (runningPid.has_value() && !m_dependencies.isProcessAlive(runningPid.value())) {
        runningPid.reset();
    }

    QString error;

    // Created as the current user so a later unprivileged run can still write them.
    if (!touchLogs(&error)) {
        log(QStringLiteral("[Proxy] %1").arg(error));
        return CommandResult::failed(FailureKind::ConfigPersist, error);
    }

    const ServiceDescriptor descriptor = ServiceDescriptor::forCaddy(
        m_caddyExecutable,
        m_paths.caddyfile(),
        m_paths.errorLog(),
        m_platform);
    const QString staged = m_paths.serviceDescriptorTemp(m_platform);
    if (!writeFileAtomically(staged, descriptor.render(m_platform).toUtf8(), &error)) {
        log(QStringLiteral("[Proxy] %1").arg(error));
        return CommandResult::failed(FailureKind::ConfigPersist, error);
    }

    log(QStringLiteral("[Proxy] Installing service %1").arg(RuntimePaths::serviceLabel()));
    CommandResult result = m_dependencies.runPrivileged(buildServiceInstallCommand(staged, runningPid));
    if (!result.ok()) {
        if (result.failure == FailureKind::None) {
            result.failure = FailureKind::PrivilegeEscalation;
        }
        log(QStringLiteral("[Proxy] Service install failed: %1").arg(result.message()));
        return result;
    }

    const QString pidFile = m_paths.userPidFile();
    if (QFileInfo::exists(pidFile) && !QFile::remove(pidFile)) {
        log(QStringLiteral("[Proxy] Cannot remove %1").arg(pidFile));
    }

    log(QStringLiteral("[Proxy] Service %1 started").arg(RuntimePaths::serviceLabel()));
    return CommandResult::success(QStringLiteral("Caddy service %1 started.").arg(RuntimePaths::serviceLabel()));
}

CommandResult ProxyOrchestrator::applyUnprivileged()
{
    const CommandResult teardown = teardownPrivileged();
    if (!teardown.ok()) {
        log(QStringLiteral("[Proxy] Teardown failed: %1").arg(teardown.message()));
        return teardown;
    }

    QString error;
    if (!stopUserProcess(&error)) {
        log(QStringLiteral("[Proxy] %1").arg(error));
        return CommandResult::failed(FailureKind::ProcessLaunch, error);
    }

    return startUserProcess();
}

CommandResult ProxyOrchestrator::teardownPrivileged()
{
    QStringList steps;

    const QString removeService = buildServiceRemoveCommand();
    if (!removeService.isEmpty() && (serviceInstalled() || serviceRunning())) {
        steps << removeService;
    }

    const HostsAliasSync hosts(m_hostsPath, m_platform);
    const auto current = hosts.readHosts();
    if (current.has_value() && HostsAliasSync::hasBlock(current.value())) {
        steps << hosts.buildSyncCommand({});
    }

    if (steps.isEmpty()) {
        return CommandResult::success();
    }

    log(QStringLiteral("[Proxy] Removing privileged service and host aliases"));
    CommandResult result = m_dependencies.runPrivileged(steps.join(QStringLiteral(" && ")));
    if (!result.ok() && result.failure == FailureKind::None) {
        result.failure = FailureKind::PrivilegeEscalation;
    }
    return result;
}

CommandResult ProxyOrchestrator::startUserProcess()
{
    QString error;
    if (!touchLogs(&error)) {
        log(QStringLiteral("[Proxy] %1").arg(error));
        return CommandResult::failed(FailureKind::ProcessLaunch, error);
    }

    const QStringList arguments {
        QStringLiteral("run"),
        QStringLiteral("--config"),
        m_paths.caddyfile(),
        QStringLiteral("--adapter"),
        QStringLiteral("caddyfile")
    };

    qint64 pid = 0;
    if (!m_dependencies.launchDetached(
            m_caddyExecutable, arguments, m_paths.dataDirectory(), m_paths.errorLog(), &pid, &error)) {
        if (error.isEmpty()) {
            error = QStringLiteral("Failed to start Caddy.");
        }
        log(QStringLiteral("[Proxy] %1").arg(error));
        return CommandResult::failed(FailureKind::ProcessLaunch, error);
    }

    if (!writeFileAtomically(m_paths.userPidFile(), QByteArray::number(pid) + '\n', &error)) {
        log(QStringLiteral("[Proxy] %1").arg(error));
        if (!m_dependencies.terminateProcess(pid)) {
            log(QStringLiteral("[Proxy] Untracked Caddy process %1 is still running").arg(pid));
        }
        return CommandResult::failed(FailureKind::ConfigPersist, error);
    }

    log(QStringLiteral("[Proxy] Caddy started (pid %1)").arg(pid));
    return CommandResult::success(QStringLiteral("Caddy started (pid %1).").arg(pid));
}

bool ProxyOrchestrator::stopUserProcess(QString *errorMessage)
{
    const auto pid = recordedPid();
    if (pid.has_value() && m_dependencies.isProcessAlive(pid.value())) {
        log(QStringLiteral("[Proxy] Stopping Caddy (pid %1)").arg(pid.value()));
        if (!m_dependencies.terminateProcess(pid.value())) {
            // The id may have been reused by a process we cannot signal.
            log(QStringLiteral("[Proxy] Cannot stop process %1, dropping its record").arg(pid.value()));
        }
    }

    const QString pidFile = m_paths.userPidFile();
    if (QFileInfo::exists(pidFile) && !QFile::remove(pidFile)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot remove %1.").arg(pidFile);
        }
        return false;
    }
    return true;
}

CommandResult ProxyOrchestrator::stopAll()
{
    QString error;
    const bool processStopped = stopUserProcess(&error);
    if (!processStopped) {
        log(QStringLiteral("[Proxy] %1").arg(error));
    }

    const CommandResult teardown = teardownPrivileged();
    if (!teardown.ok()) {
        log(QStringLiteral("[Proxy] Teardown failed: %1").arg(teardown.message()));
        return teardown;
    }
    if (!processStopped) {
        return CommandResult::failed(FailureKind::ProcessLaunch, error);
    }

    log(QStringLiteral("[Proxy] Stopped"));
    return CommandResult::success(QStringLiteral("Caddy stopped."));
}

CommandResult ProxyOrchestrator::generateConfig()
{
    if (!m_paths.ensureDataDirectory()) {
        const QString message = QStringLiteral("Cannot create data directory: %1").arg(m_paths.dataDirectory());
        log(QStringLiteral("[Proxy] %1").arg(message));
        return CommandResult::failed(FailureKind::ConfigPersist, message);
    }

    QString error;
    if (!writeFileAtomically(m_paths.caddyfile(), renderConfig().toUtf8(), &error)) {
        log(QStringLiteral("[Proxy] %1").arg(error));
        return CommandResult::failed(FailureKind::ConfigPersist, error);
    }

    log(QStringLiteral("[Proxy] Generated %1").arg(m_paths.caddyfile()));
    return CommandResult::success(QStringLiteral("Generated %1").arg(m_paths.caddyfile()));
}

QString ProxyOrchestrator::renderConfig() const
{
    CaddyfileBuilder::BuildOptions options;
    options.adminAddress = m_settings.adminAddress();
    options.placeholderPort = m_settings.userPort;
    options.accessLogPath = m_paths.accessLog();
    return CaddyfileBuilder::build(m_registry.servedSites(), options);
}

bool ProxyOrchestrator::serviceRunning() const
{
    switch (m_platform) {
    case HostPlatform::MacOS: {
        const CommandResult result = m_dependencies.runCommand(
            QStringLiteral("/bin/launchctl"),
            {QStringLiteral("print"), QStringLiteral("system/%1").arg(RuntimePaths::serviceLabel())},
            m_settings.commandTimeoutMs);
        return result.ok() && result.out.contains(QStringLiteral("state = running"));
    }
    case HostPlatform::Linux: {
        // is-active exits non-zero for every state but active.
        const CommandResult result = m_dependencies.runCommand(
            QStringLiteral("systemctl"),
            {QStringLiteral("is-active"), RuntimePaths::systemdUnitName()},
            m_settings.commandTimeoutMs);
        return result.out.trimmed() == QStringLiteral("active");
    }
    case HostPlatform::Unsupported:
    default:
        return false;
    }
}

bool ProxyOrchestrator::serviceInstalled() const
{
    return !m_serviceDescriptorPath.isEmpty() && QFileInfo::exists(m_serviceDescriptorPath);
}

std::optional<qint64> ProxyOrchestrator::recordedPid() const
{
    QFile file(m_paths.userPidFile());
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }

    bool ok = false;
    const qint64 pid = QString::fromUtf8(file.readAll()).trimmed().toLongLong(&ok);
    if (!ok || pid <= 1) {
        return std::nullopt;
    }
    return pid;
}

QString ProxyOrchestrator::caddyVersion() const
{
    if (m_caddyExecutable.isEmpty() || !QFileInfo(m_caddyExecutable).isFile()) {
        return QStringLiteral("(caddy executable missing)");
    }

    const CommandResult result = m_dependencies.runCommand(
        m_caddyExecutable, {QStringLiteral("version")}, m_settings.commandTimeoutMs);
    const QString out = firstLine(result.out);
    if (result.ok() && !out.isEmpty()) {
        return out;
    }

    const QString err = firstLine(result.err);
    return err.isEmpty() ? result.message() : err;
}

QString ProxyOrchestrator::readLogs(int lines) const
{
    const QStringList sections {
        QStringLiteral("== Access log: %1 ==\n%2").arg(m_paths.accessLog(), tailLines(m_paths.accessLog(), lines)),
        QStringLiteral("== Error log: %1 ==\n%2").arg(m_paths.errorLog(), tailLines(m_paths.errorLog(), lines))
    };
    return sections.join(QStringLiteral("\n\n")) + QLatin1Char('\n');
}

QString ProxyOrchestrator::caddyExecutable() const
{
    return m_caddyExecutable;
}

QString ProxyOrchestrator::buildServiceInstallCommand(
    const QString& stagedDescriptor,
    std::optional<qint64> stopPid) const
{
    const QString descriptor = shellQuote(m_serviceDescriptorPath);
    const QString descriptorDir = shellQuote(QFileInfo(m_serviceDescriptorPath).absolutePath());
    const QString logs = shellQuote(m_paths.accessLog()) + QLatin1Char(' ') + shellQuote(m_paths.errorLog());
    const QString dataDir = shellQuote(m_paths.dataDirectory());
    const QString staged = shellQuote(stagedDescriptor);

    QStringList steps;
    switch (m_platform) {
    case HostPlatform::MacOS: {
        const QString target = shellQuote(QStringLiteral("system/%1").arg(RuntimePaths::serviceLabel()));
        steps << QStringLiteral("/bin/mkdir -p %1").arg(descriptorDir)
              << QStringLiteral("/bin/mkdir -p %1").arg(dataDir)
              << QStringLiteral("/usr/bin/touch %1").arg(logs)
              << QStringLiteral("/bin/chmod 644 %1").arg(logs)
              << QStringLiteral("/bin/cp %1 %2").arg(staged, descriptor)
              << QStringLiteral("/usr/sbin/chown root:wheel %1").arg(descriptor)
              << QStringLiteral("/bin/chmod 644 %1").arg(descriptor);
        if (stopPid.has_value()) {
            steps << stopProcessCommand(stopPid.value(), m_settings.stopGraceMs);
        }
        steps << QStringLiteral("{ /bin/launchctl bootout system %1 2>/dev/null || true; }").arg(descriptor)
              << QStringLiteral("/bin/launchctl bootstrap system %1").arg(descriptor)
              << QStringLiteral("/bin/launchctl enable %1").arg(target)
              << QStringLiteral("/bin/launchctl kickstart -k %1").arg(target);
        break;
    }
    case HostPlatform::Linux: {
        const QString unit = shellQuote(RuntimePaths::systemdUnitName());
        steps << QStringLiteral("mkdir -p %1").arg(descriptorDir)
              << QStringLiteral("mkdir -p %1").arg(dataDir)
              << QStringLiteral("touch %1").arg(logs)
              << QStringLiteral("chmod 644 %1").arg(logs)
              << QStringLiteral("install -m 644 -o root -g root %1 %2").arg(staged, descriptor)
              << QStringLiteral("systemctl daemon-reload")
              << QStringLiteral("systemctl enable %1").arg(unit);
        if (stopPid.has_value()) {
            steps << stopProcessCommand(stopPid.value(), m_settings.stopGraceMs);
        }
        steps << QStringLiteral("systemctl restart %1").arg(unit);
        break;
    }
    case HostPlatform::Unsupported:
    default:
        break;
    }
    return steps.join(QStringLiteral(" && "));
}

QString ProxyOrchestrator::buildServiceRemoveCommand() const
{
    const QString descriptor = shellQuote(m_serviceDescriptorPath);

    switch (m_platform) {
    case HostPlatform::MacOS:
        return QStringLiteral("{ /bin/launchctl bootout system %1 2>/dev/null || true; } && /bin/rm -f %1")
            .arg(descriptor);
    case HostPlatform::Linux:
        return QStringLiteral("{ systemctl disable --now %1 2>/dev/null || true; } && rm -f %2 && systemctl daemon-reload")
            .arg(shellQuote(RuntimePaths::systemdUnitName()), descriptor);
    case HostPlatform::Unsupported:
    default:
        return QString();
    }
}

bool ProxyOrchestrator::touchLogs(QString *errorMessage) const
{
    if (!m_paths.ensureDataDirectory()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot create data directory: %1").arg(m_paths.dataDirectory());
        }
        return false;
    }

    for (const QString& path : {m_paths.accessLog(), m_paths.errorLog()}) {
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Cannot open log %1: %2").arg(path, file.errorString());
            }
            return false;
        }
    }
    return true;
}

bool ProxyOrchestrator::writeFileAtomically(const QString& path, const QByteArray& data, QString *errorMessage) const
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to open %1: %2").arg(path, file.errorString());
        }
        return false;
    }

    if (file.write(data) != data.size()) {
        file.cancelWriting();
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to write %1: %2").arg(path, file.errorString());
        }
        return false;
    }

    if (!file.commit()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to save %1: %2").arg(path, file.errorString());
        }
        return false;
    }
    return true;
}

void ProxyOrchestrator::log(const QString& message) const
{
    if (m_log) {
        m_log->append(message);
    }
}
