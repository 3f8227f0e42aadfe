/*!
 * @file        hostsaliassync.cppm
 * @brief       Loopback alias block in the system hosts table.
 *
 * @details
 * Custom-domain sites resolve through `127.0.0.1 <domain>` lines kept between
 * two marker comments in the hosts table. The rewrite (delete the old block,
 * append the new one) is composed into a single escalated command so the
 * table never stays half-written. A pure mirror of that rewrite decides
 * whether escalation is needed at all.
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

#include <functional>
#include <optional>

export module devsrv.core.hostsaliassync;

export import devsrv.core.commandresult;
export import devsrv.core.runtimepaths;
import devsrv.core.site;

/**
 * @class HostsAliasSync
 * @brief Computes and applies the DevSrv alias block.
 */
export class HostsAliasSync
{
public:
    //! Executes one shell command with elevated rights.
    using PrivilegedCommand = std::function<CommandResult(const QString&)>;

    /**
     * @brief Construct for a hosts table.
     * @param hostsPath Hosts table path.
     * @param platform `sed` flavor to emit.
     */
    explicit HostsAliasSync(
        const QString& hostsPath = RuntimePaths::hostsFile(),
        HostPlatform platform = currentHostPlatform());

    static QString beginMarker();
    static QString endMarker();

    /**
     * @brief Alias lines wanted for the served custom-domain sites.
     * @param sites Served sites.
     * @return `127.0.0.1 <domain>` lines, deduplicated, in input order.
     */
    static QStringList desiredLines(const QList<Site>& sites);

    /**
     * @brief Rewrite hosts text the way the sync command does.
     * @param hostsText Current table contents.
     * @param lines Alias lines; empty removes the block entirely.
     * @return New table contents.
     */
    static QString applyBlock(const QString& hostsText, const QStringList& lines);

    /**
     * @brief Whether removing the DevSrv block would change the hosts text.
     * @param hostsText Table contents.
     */
    static bool hasBlock(const QString& hostsText);

    /**
     * @brief Compose the single shell command performing the rewrite.
     * @param lines Alias lines; empty only deletes.
     * @return Shell command line.
     */
    QString buildSyncCommand(const QStringList& lines) const;

    /**
     * @brief Read the hosts table.
     * @return Contents, or empty optional when unreadable.
     */
    std::optional<QString> readHosts() const;

    /**
     * @brief Bring the hosts block in line with the served sites.
     *
     * Skips escalation when the table already matches.
     *
     * @param sites Served sites.
     * @param runPrivileged Escalation gateway.
     * @return Success, or the gateway's failure.
     */
    CommandResult sync(const QList<Site>& sites, const PrivilegedCommand& runPrivileged) const;

    QString hostsPath() const;

private:
    QString m_hostsPath;     //!< Hosts table.
    HostPlatform m_platform; //!< `sed -i` flavor.
};
