/*!
 * @file        runtimepaths.cppm
 * @brief       File locations and host platform constants.
 *
 * @details
 * Collects every fixed path DevSrv reads or writes: the per-user data
 * directory holding the registry, generated Caddyfile, logs and pid record,
 * plus the system-level service descriptor and hosts table. The base data
 * directory can be overridden so tests run against a temporary directory.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>

export module devsrv.core.runtimepaths;

/**
 * @enum HostPlatform
 * @brief Service manager and escalation flavor in use.
 */
export enum class HostPlatform
{
    MacOS,      //!< launchd + osascript.
    Linux,      //!< systemd + pkexec.
    Unsupported //!< No privileged service support.
};

/**
 * @brief Platform DevSrv was built for.
 * @return Compile-time host platform.
 */
export HostPlatform currentHostPlatform();

/**
 * @class RuntimePaths
 * @brief Resolves DevSrv file locations.
 */
export class RuntimePaths
{
public:
    /**
     * @brief Use the standard per-user application data directory.
     */
    RuntimePaths();

    /**
     * @brief Use an explicit data directory.
     * @param dataDirectory Base directory for per-user files.
     */
    explicit RuntimePaths(const QString& dataDirectory);

    /**
     * @brief Create the data directory if it does not exist.
     * @return True when the directory exists afterwards.
     */
    bool ensureDataDirectory() const;

    QString dataDirectory() const;
    QString sitesJson() const;
    QString caddyfile() const;
    QString accessLog() const;
    QString errorLog() const;
    QString userPidFile() const;

    /**
     * @brief Staging location of the service descriptor before install.
     * @param platform Target platform.
     * @return Temp descriptor path inside the data directory.
     */
    QString serviceDescriptorTemp(HostPlatform platform = currentHostPlatform()) const;

    /**
     * @brief Service manager label (`devsrv.caddy`).
     */
    static QString serviceLabel();

    /**
     * @brief systemd unit name derived from the label.
     */
    static QString systemdUnitName();

    /**
     * @brief Installed descriptor path for the platform.
     * @param platform Target platform.
     * @return launchd plist or systemd unit path.
     */
    static QString serviceDescriptorPath(HostPlatform platform = currentHostPlatform());

    /**
     * @brief System hostname table.
     */
    static QString hostsFile();

    /**
     * @brief Home directory given to the privileged service.
     * @param platform Target platform.
     */
    static QString privilegedHome(HostPlatform platform = currentHostPlatform());

private:
    QString m_dataDirectory; //!< Per-user base directory.
};
