/*!
 * @file        caddyfilebuilder.cppm
 * @brief       Caddyfile generator for served sites.
 *
 * @details
 * Turns the served-site subset of the registry into the complete Caddyfile
 * the embedded Caddy runs with. The output depends only on its inputs, so
 * identical site sets always produce byte-identical text. With nothing
 * served, a placeholder site keeps Caddy bound to the unprivileged port.
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
#include <QtTypes>

export module devsrv.core.caddyfilebuilder;

import devsrv.core.site;

/**
 * @class CaddyfileBuilder
 * @brief Builds generated Caddyfile text.
 */
export class CaddyfileBuilder
{
public:
    /**
     * @struct BuildOptions
     * @brief Values embedded into the generated file.
     */
    struct BuildOptions {
        QString adminAddress = QStringLiteral("127.0.0.1:2019"); //!< Caddy admin API listener.
        quint16 placeholderPort = 8443;                          //!< Port of the placeholder site.
        QString accessLogPath;                                   //!< Access log for every site.
        QString placeholderMessage = QStringLiteral("DevSrv: no active sites"); //!< Placeholder body.
    };

    /**
     * @brief Build the full Caddyfile.
     * @param sites Served sites in registry order.
     * @param options Build options.
     * @return Caddyfile text ending with a newline.
     */
    static QString build(const QList<Site>& sites, const BuildOptions& options);

private:
    /**
     * @brief Build one site block.
     * @param site Served site.
     * @param accessLogPath Access log path.
     * @return Lines of the block.
     */
    static QStringList buildSiteBlock(const Site& site, const QString& accessLogPath);

    /**
     * @brief Escape a value for a double-quoted Caddyfile token.
     * @param value Raw value.
     * @return Escaped value without surrounding quotes.
     */
    static QString quoteEscape(const QString& value);
};
