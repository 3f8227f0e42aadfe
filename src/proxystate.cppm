/*!
 * @file        proxystate.cppm
 * @brief       Proxy and site status enums for DevSrv.
 *
 * @details
 * Canonical overall proxy state and per-site status values computed by the
 * orchestrator and rendered by front ends.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>

export module devsrv.core.proxystate;

/**
 * @enum ProxyState
 * @brief Derived state of the Caddy runtime.
 */
export enum class ProxyState
{
    Stopped, //!< No runtime artifact.
    Running, //!< Admin endpoint or service manager reports it running.
    Unknown, //!< Leftover pid record; the process may have died.
    Error    //!< Last operation failed.
};

/**
 * @enum SiteStatus
 * @brief Per-site reachability.
 */
export enum class SiteStatus
{
    Off,   //!< Site is not served.
    On,    //!< HTTPS HEAD returned 2xx/3xx.
    Error, //!< Served but unreachable or proxy not running.
    Unknown //!< Not probed yet.
};

export QString proxyStateName(ProxyState state)
{
    switch (state) {
    case ProxyState::Running:
        return QStringLiteral("Running");
    case ProxyState::Stopped:
        return QStringLiteral("Stopped");
    case ProxyState::Error:
        return QStringLiteral("Error");
    case ProxyState::Unknown:
    default:
        return QStringLiteral("Unknown");
    }
}

export QString siteStatusName(SiteStatus status)
{
    switch (status) {
    case SiteStatus::Off:
        return QStringLiteral("Off");
    case SiteStatus::On:
        return QStringLiteral("On");
    case SiteStatus::Error:
        return QStringLiteral("Error");
    case SiteStatus::Unknown:
    default:
        return QStringLiteral("Unknown");
    }
}
