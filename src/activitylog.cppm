/*!
 * @file        activitylog.cppm
 * @brief       Bounded in-memory log of recent core activity.
 *
 * @details
 * Registry, hosts and proxy operations append one-line, subsystem-prefixed
 * entries here (`[Registry]`, `[Hosts]`, `[Proxy]`). Front ends read the
 * recent lines to show what happened around the last action.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>
#include <QStringList>

export module devsrv.core.activitylog;

/**
 * @class ActivityLog
 * @brief Ring of the latest log lines.
 */
export class ActivityLog
{
public:
    /**
     * @brief Construct an empty log.
     * @param maxLines Retained line count.
     */
    explicit ActivityLog(int maxLines = 200);

    /**
     * @brief Append one line; consecutive duplicates are dropped.
     * @param message Log text.
     */
    void append(const QString& message);

    /**
     * @brief Enable or disable recording.
     * @param enabled New state.
     */
    void setEnabled(bool enabled);

    bool isEnabled() const;

    /**
     * @brief Retained lines, oldest first.
     * @return Line list.
     */
    QStringList recent() const;

    /**
     * @brief Most recent line.
     * @return Last line or empty string.
     */
    QString latest() const;

    void clear();

private:
    QStringList m_lines;  //!< Retained lines.
    int m_maxLines = 200; //!< Capacity.
    bool m_enabled = true; //!< Recording switch.
};
