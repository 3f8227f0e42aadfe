/*!
 * @file        proxyorchestrator.cppm
 * @brief       Caddy lifecycle orchestration for DevSrv.
 *
 * @details
 * Decides whether the served site needs the privileged system service
 * (custom domain on port 443) or an unprivileged background Caddy process,
 * starts, stops and repairs them, and derives the overall and per-site status.
 * External effects go through a `Dependencies` table so tests can replace the
 * escalation gateway, probes and process control.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QList>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QtTypes>

#include <functional>
#include <optional>

export module devsrv.core.proxyorchestrator;

export import devsrv.core.commandresult;
export import devsrv.core.proxystate;
export import devsrv.core.runtimepaths;
export import devsrv.core.proxysettings;
import devsrv.core.activitylog;
import devsrv.core.site;
import devsrv.core.siteregistry;

/**
 * @class ProxyOrchestrator
 * @brief Applies the registry to the Caddy runtime and reports status.
 */
export class ProxyOrchestrator
{
public:
    /**
     * @struct Dependencies
     * @brief Replaceable external effects. Empty entries get defaults.
     */
    struct Dependencies {
        std::function<CommandResult(const QString&, const QStringList&, int)> runCommand;
        std::function<CommandResult(const QString&)> runPrivileged;
        std::function<bool()> adminAlive;
        std::function<SiteStatus(const QUrl&)> probeSite;
        std::function<bool(const QString&, const QStringList&, const QString&, const QString&, qint64 *, QString *)>
            launchDetached;
        std::function<bool(qint64)> terminateProcess;
        std::function<bool(qint64)> isProcessAlive;
    };

    /**
     * @struct TestMode
     * @brief Construction parameters overriding platform facts.
     */
    struct TestMode {
        Dependencies dependencies;                       //!< Replacement effects.
        HostPlatform platform = HostPlatform::MacOS;     //!< Command flavor.
        QString hostsPath;                               //!< Hosts table to read.
        QString serviceDescriptorPath;                   //!< Installed descriptor location.
        QString caddyExecutable;                         //!< Caddy binary path.
    };

    /**
     * @brief Construct with real platform effects.
     * @param registry Site registry, not owned.
     * @param paths Runtime file locations.
     * @param settings Proxy settings.
     * @param log Optional activity log, not owned.
     */
    ProxyOrchestrator(
        SiteRegistry& registry,
        const RuntimePaths& paths,
        const ProxySettings& settings,
        ActivityLog *log = nullptr);

    /**
     * @brief Construct with replaced effects.
     * @param registry Site registry, not owned.
     * @param paths Runtime file locations.
     * @param settings Proxy settings.
     * @param mode Test overrides.
     * @param log Optional activity log, not owned.
     */
    ProxyOrchestrator(
        SiteRegistry& registry,
        const RuntimePaths& paths,
        const ProxySettings& settings,
        TestMode mode,
        ActivityLog *log = nullptr);

    /**
     * @brief Derive the overall runtime state.
     *
     * Admin endpoint reachable, then service manager reporting the service
     * running, give `Running`; a leftover pid record gives `Unknown`;
     * otherwise `Stopped`.
     *
     * @return Current state.
     */
    ProxyState state() const;

    /**
     * @brief Per-site status.
     * @param site Site to probe.
     * @return `Off`, `Error` or the HTTPS probe result.
     */
    SiteStatus siteStatus(const Site& site) const;

    /**
     * @brief Per-site status with an already derived overall state.
     * @param site Site to probe.
     * @param overall Result of `state()`.
     * @return `Off`, `Error` or the HTTPS probe result.
     */
    SiteStatus siteStatus(const Site& site, ProxyState overall) const;

    /**
     * @brief Regenerate config and bring the runtime in line with it.
     * @return Success or the first failing step's result.
     */
    CommandResult apply();

    /**
     * @brief Stop the background process and unload the service.
     * @return Success, or the escalation failure.
     */
    CommandResult stopAll();

    /**
     * @brief Rewrite the generated Caddyfile from the served sites.
     * @return Success or `ConfigPersist` failure.
     */
    CommandResult generateConfig();

    /**
     * @brief Current generated Caddyfile text for the served sites.
     * @return Caddyfile text.
     */
    QString renderConfig() const;

    /**
     * @brief Whether the service manager reports the service running.
     */
    bool serviceRunning() const;

    /**
     * @brief Whether a service descriptor is installed.
     */
    bool serviceInstalled() const;

    /**
     * @brief Process id recorded by the last unprivileged launch.
     * @return Pid or empty optional.
     */
    std::optional<qint64> recordedPid() const;

    /**
     * @brief Version string reported by Caddy.
     * @return First output line or a diagnostic.
     */
    QString caddyVersion() const;

    /**
     * @brief Tail of the access and error logs.
     * @param lines Lines per log.
     * @return Formatted text with one section per log.
     */
    QString readLogs(int lines = 300) const;

    /**
     * @brief Caddy binary in use.
     * @return Path, empty when none was found.
     */
    QString caddyExecutable() const;

    /**
     * @brief Shell command installing and restarting the service.
     * @param stagedDescriptor Descriptor written by this process.
     * @param stopPid Background Caddy to stop before the service starts.
     * @return Composed command.
     */
    QString buildServiceInstallCommand(
        const QString& stagedDescriptor,
        std::optional<qint64> stopPid = std::nullopt) const;

    /**
     * @brief Shell command unloading and removing the service.
     * @return Composed command.
     */
    QString buildServiceRemoveCommand() const;

private:
    CommandResult applyPrivileged(const QList<Site>& served);
    CommandResult applyUnprivileged();

    /**
     * @brief Escalate once to remove the service and a stale alias block.
     * @return Success when nothing was left or removal succeeded.
     */
    CommandResult teardownPrivileged();

    /**
     * @brief Terminate the recorded background process and drop the record.
     *
     * A process that cannot be signalled is logged and forgotten.
     *
     * @param errorMessage Optional output message on failure.
     * @return True when the record is gone.
     */
    bool stopUserProcess(QString *errorMessage);

    CommandResult startUserProcess();
    bool touchLogs(QString *errorMessage) const;
    bool writeFileAtomically(const QString& path, const QByteArray& data, QString *errorMessage) const;
    void initializeDefaultDependencies();
    void log(const QString& message) const;

    SiteRegistry& m_registry;        //!< Site registry.
    RuntimePaths m_paths;            //!< File locations.
    ProxySettings m_settings;        //!< Ports and timeouts.
    ActivityLog *m_log = nullptr;    //!< Optional activity log.
    Dependencies m_dependencies;     //!< External effects.
    HostPlatform m_platform;         //!< Service/escalation flavor.
    QString m_hostsPath;             //!< Hosts table.
    QString m_serviceDescriptorPath; //!< Installed descriptor.
    QString m_caddyExecutable;       //!< Caddy binary.
};
