/*!
 * @file        servicedescriptor.cppm
 * @brief       Privileged service definition for the Caddy daemon.
 *
 * @details
 * Describes the always-on system service that runs Caddy as root when a
 * custom-domain site is served, and renders it for the platform's service
 * manager: a launchd property list on macOS, a systemd unit on Linux.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>

export module devsrv.core.servicedescriptor;

export import devsrv.core.runtimepaths;

/**
 * @struct ServiceDescriptor
 * @brief Platform-neutral service definition.
 */
export struct ServiceDescriptor {
    QString label;                                 //!< Service identifier.
    QString program;                               //!< Executable path.
    QStringList arguments;                         //!< Arguments after the program.
    QString workingDirectory;                      //!< Working directory.
    QList<QPair<QString, QString>> environment;    //!< Ordered environment variables.
    bool runAtLoad = true;                         //!< Start when loaded / at boot.
    bool keepAlive = true;                         //!< Restart whenever it exits.
    QString stdoutPath;                            //!< Appended standard output.
    QString stderrPath;                            //!< Appended standard error.

    /**
     * @brief Render as a launchd property list.
     * @return XML plist text.
     */
    QString toLaunchdPlist() const;

    /**
     * @brief Render as a systemd unit file.
     * @return Unit file text.
     */
    QString toSystemdUnit() const;

    /**
     * @brief Render for a platform.
     * @param platform Target platform.
     * @return plist on macOS, unit file otherwise.
     */
    QString render(HostPlatform platform) const;

    /**
     * @brief Descriptor running Caddy with the generated Caddyfile.
     * @param caddyPath Caddy executable.
     * @param caddyfilePath Generated Caddyfile.
     * @param errorLogPath Output redirection target.
     * @param platform Target platform (selects root home directory).
     * @return Descriptor.
     */
    static ServiceDescriptor forCaddy(
        const QString& caddyPath,
        const QString& caddyfilePath,
        const QString& errorLogPath,
        HostPlatform platform = currentHostPlatform());
};
