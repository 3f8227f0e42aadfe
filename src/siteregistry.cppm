/*!
 * @file        siteregistry.cppm
 * @brief       Persistent registry of DevSrv sites.
 *
 * @details
 * Owns the in-memory site collection backed by `sites.json`. Mutations are
 * normalized, validated, sorted by name and committed atomically through
 * `QSaveFile`; the in-memory state only changes once the file is written.
 * Loading recovers older record shapes and writes the recovered registry
 * back. `setOnlyServed()` is the one transition that changes which site is
 * served, keeping at most one served site at any committed state.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QList>
#include <QString>

#include <optional>

export module devsrv.core.siteregistry;

export import devsrv.core.site;
import devsrv.core.activitylog;

/**
 * @class SiteRegistry
 * @brief Site collection with single-served invariant and JSON persistence.
 */
export class SiteRegistry
{
public:
    /**
     * @enum LoadStatus
     * @brief Outcome of reading the registry file.
     */
    enum class LoadStatus {
        Loaded,     //!< Current schema decoded.
        Missing,    //!< No file yet; registry is empty.
        Recovered,  //!< Older schema recovered and written back.
        Unreadable  //!< Not a JSON array; registry is empty.
    };

    /**
     * @struct LoadResult
     * @brief Load status plus a one-line message.
     */
    struct LoadResult {
        LoadStatus status = LoadStatus::Missing; //!< Outcome.
        QString message;                          //!< Informational or error text.

        //! True unless the file could not be parsed at all.
        bool ok() const { return status != LoadStatus::Unreadable; }
    };

    /**
     * @brief Construct a registry bound to a file.
     * @param filePath Location of `sites.json`.
     * @param log Optional activity log.
     */
    explicit SiteRegistry(const QString& filePath, ActivityLog *log = nullptr);

    /**
     * @brief Replace in-memory state with the file contents.
     * @return Load outcome.
     */
    LoadResult load();

    /**
     * @brief Insert or replace a site by id.
     * @param site Candidate record; normalized before validation.
     * @param errorMessage Optional output message on failure.
     * @return True when the record was committed.
     */
    bool upsert(const Site& site, QString *errorMessage = nullptr);

    /**
     * @brief Delete a site by id. Unknown ids are a no-op.
     * @param id Site identifier.
     * @param errorMessage Optional output message on failure.
     * @return True unless persisting failed.
     */
    bool remove(const QString& id, QString *errorMessage = nullptr);

    /**
     * @brief Change the served flag of one site.
     *
     * Serving a site clears the flag on every other site in the same commit.
     * Unserving only touches the given site.
     *
     * @param id Site identifier.
     * @param served New flag value.
     * @param errorMessage Optional output message on failure.
     * @return True when committed.
     */
    bool setOnlyServed(const QString& id, bool served, QString *errorMessage = nullptr);

    /**
     * @brief All sites in registry order.
     */
    const QList<Site>& sites() const;

    /**
     * @brief Sites with `served = true` (zero or one).
     */
    QList<Site> servedSites() const;

    /**
     * @brief Sites flagged for quick-access lists.
     */
    QList<Site> shortcutSites() const;

    /**
     * @brief Look up a site.
     * @param id Site identifier.
     * @return Site or empty optional.
     */
    std::optional<Site> siteById(const QString& id) const;

    /**
     * @brief Whether the document root has an `index.html`.
     * @param site Site to inspect.
     */
    static bool indexHtmlExists(const Site& site);

    QString filePath() const;
    QString lastInfo() const;
    QString lastError() const;

private:
    /**
     * @brief Sort, serialize and atomically write a candidate collection.
     * @param next Candidate collection; becomes current on success.
     * @param errorMessage Optional output message on failure.
     * @return True when written.
     */
    bool commit(QList<Site> next, QString *errorMessage);

    /**
     * @brief Clear `served` on every site except one.
     * @param sites Collection to modify.
     * @param servedId Site keeping its flag.
     */
    static void keepOnlyServed(QList<Site>& sites, const QString& servedId);

    /**
     * @brief Case-insensitive name order, ties by id.
     * @param sites Collection to sort.
     */
    static void sortSites(QList<Site>& sites);

    /**
     * @brief Encode a collection as the registry document.
     * @param sites Collection.
     * @return Indented JSON bytes.
     */
    static QByteArray serialize(const QList<Site>& sites);

    void setError(QString *errorMessage, const QString& message);
    void log(const QString& message) const;

    QString m_filePath;          //!< Registry file.
    ActivityLog *m_log = nullptr; //!< Optional activity log, not owned.
    QList<Site> m_sites;         //!< Committed collection.
    QString m_lastInfo;          //!< Last informational message.
    QString m_lastError;         //!< Last error message.
};
