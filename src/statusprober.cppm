/*!
 * @file        statusprober.cppm
 * @brief       Health probes for Caddy and served sites.
 *
 * @details
 * Synchronous probes with short deadlines: an HTTP GET against the Caddy
 * admin endpoint on loopback, and an HTTPS HEAD against a site URL with the
 * locally-trusted certificate accepted. Probe failures are classified, never
 * raised.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>
#include <QUrl>
#include <QtTypes>

export module devsrv.core.statusprober;

export import devsrv.core.proxystate;

/**
 * @class StatusProber
 * @brief Admin endpoint and site probes.
 */
export class StatusProber
{
public:
    /**
     * @brief Whether the Caddy admin API answers on loopback.
     * @param adminPort Admin port on 127.0.0.1.
     * @param timeoutMs Deadline, at most one second.
     * @return True when any HTTP response arrives.
     */
    static bool adminAlive(quint16 adminPort, int timeoutMs = 1000);

    /**
     * @brief HTTPS HEAD against a site.
     * @param url Site URL.
     * @param timeoutMs Deadline, at most two seconds.
     * @return `On` for 2xx/3xx, otherwise `Error`.
     */
    static SiteStatus probeSite(const QUrl& url, int timeoutMs = 2000);

    /**
     * @brief Classify an HTTP status code.
     * @param statusCode HTTP status, zero or negative when none arrived.
     * @return `On` for 200..399, otherwise `Error`.
     */
    static SiteStatus classifyHttpStatus(int statusCode);

    /**
     * @brief Issue one request and wait for its HTTP status.
     * @param url Target.
     * @param head Use HEAD instead of GET.
     * @param timeoutMs Deadline.
     * @param errorMessage Optional transport error text.
     * @return HTTP status, or -1 when no response arrived.
     */
    static int requestStatus(const QUrl& url, bool head, int timeoutMs, QString *errorMessage = nullptr);
};
