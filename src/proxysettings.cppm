/*!
 * @file        proxysettings.cppm
 * @brief       User-tunable proxy settings.
 *
 * @details
 * Ports, timeouts and the Caddy executable override, persisted through
 * `QSettings` under the DevSrv organization. Defaults match the values the
 * generated Caddyfile and status probes expect.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QSettings>
#include <QString>
#include <QtTypes>

export module devsrv.core.proxysettings;

/**
 * @struct ProxySettings
 * @brief Runtime knobs for the orchestrator and probes.
 */
export struct ProxySettings {
    QString caddyExecutablePath;        //!< Explicit Caddy binary, empty for auto-detect.
    quint16 userPort = 8443;            //!< Placeholder port of the unprivileged process.
    quint16 adminPort = 2019;           //!< Caddy admin API port on 127.0.0.1.
    int siteProbeTimeoutMs = 2000;      //!< HTTPS HEAD timeout.
    int adminProbeTimeoutMs = 1000;     //!< Admin endpoint timeout.
    int commandTimeoutMs = 8000;        //!< Regular external command timeout.
    int privilegedTimeoutMs = 60000;    //!< Escalated command timeout, prompt included.
    int stopGraceMs = 2000;             //!< SIGTERM grace period before SIGKILL.
    bool loggingEnabled = true;         //!< Activity log on/off.

    /**
     * @brief Read settings, falling back to defaults.
     * @param settings Settings store.
     * @return Loaded settings.
     */
    static ProxySettings load(QSettings& settings);

    /**
     * @brief Persist settings.
     * @param settings Settings store.
     */
    void save(QSettings& settings) const;

    /**
     * @brief Locate the Caddy binary.
     *
     * Order: explicit override, next to the application binary, the macOS
     * bundle `Resources` directory, then `PATH`.
     *
     * @return Absolute path or empty string when not found.
     */
    QString resolveCaddyExecutable() const;

    /**
     * @brief Admin address written into the Caddyfile.
     * @return `127.0.0.1:<adminPort>`.
     */
    QString adminAddress() const;
};
