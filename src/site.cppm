/*!
 * @file        site.cppm
 * @brief       Site data model for DevSrv.
 *
 * @details
 * Defines the `Site` value type describing one local project folder that can
 * be exposed through the embedded Caddy server, either on a loopback port or
 * on a custom local domain. Includes normalization, validation, the strict
 * JSON codec and the lenient recovery path for legacy registry records.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QJsonObject>
#include <QString>

#include <optional>

export module devsrv.core.site;

/**
 * @enum SiteMode
 * @brief How a site is addressed.
 */
export enum class SiteMode
{
    LoopbackPort, //!< https://localhost:<port>, unprivileged.
    CustomDomain  //!< https://<domain>, needs port 443 and a hosts alias.
};

//! Port assigned to loopback sites that do not specify one.
export constexpr int kDefaultSitePort = 3000;

/**
 * @brief Persisted token for a mode.
 * @param mode Site mode.
 * @return `localhost` or `domain`.
 */
export QString siteModeToString(SiteMode mode);

/**
 * @brief Parse a persisted mode token.
 * @param value Token text.
 * @return Mode or empty optional for unknown tokens.
 */
export std::optional<SiteMode> siteModeFromString(const QString& value);

/**
 * @brief Check host name syntax (dot-separated letter/digit/hyphen labels).
 * @param domain Candidate host name.
 * @return True when usable as a Caddy site address and hosts alias.
 */
export bool isValidDomainName(const QString& domain);

/**
 * @struct Site
 * @brief One registered project folder.
 */
export struct Site {
    QString id;                       //!< Stable identifier, never changes.
    QString name;                     //!< Human-readable name, sort key.
    QString shortcutLabel;            //!< Label for quick-access lists.
    QString folder;                   //!< Absolute document root.
    SiteMode mode = SiteMode::LoopbackPort; //!< Addressing mode.
    QString domain;                   //!< Host name for CustomDomain mode.
    std::optional<int> port;          //!< Port for LoopbackPort mode.
    bool served = false;              //!< Currently exposed through the proxy.
    bool shortcut = false;            //!< Shown in quick-access lists.

    /**
     * @brief Trim fields and apply mode-dependent defaults in place.
     */
    void normalize();

    /**
     * @brief Validate a normalized record before it enters the registry.
     * @return Empty string when valid, otherwise a one-line reason.
     */
    QString validationError() const;

    /**
     * @brief Port in effect for loopback mode.
     * @return Configured port or the default.
     */
    int effectivePort() const;

    /**
     * @brief Caddy site address (`localhost:<port>` or `<domain>`).
     * @return Site block key.
     */
    QString hostKey() const;

    /**
     * @brief Browser URL for the site.
     * @return `https://localhost:<port>` or `https://<domain>`.
     */
    QString urlString() const;

    /**
     * @brief Whether serving this site needs the privileged service.
     * @return True for CustomDomain mode.
     */
    bool requiresPrivileges() const;

    /**
     * @brief Serialize into the current registry schema.
     * @return JSON object.
     */
    QJsonObject toJson() const;

    /**
     * @brief Strict decode against the current schema.
     * @param json Source object.
     * @return Site, or empty optional when any field is missing or mistyped.
     */
    static std::optional<Site> fromJson(const QJsonObject& json);

    /**
     * @brief Lenient reconstruction of an older or damaged record.
     *
     * Reads known and renamed fields one by one, treating a value of the
     * wrong JSON type as absent, and fills defaults for the rest. The
     * returned record is normalized.
     *
     * @param json Unstructured record.
     * @return Normalized site.
     */
    static Site fromLegacyJson(const QJsonObject& json);

    /**
     * @brief Generate a fresh identifier.
     * @return UUID string without braces.
     */
    static QString createId();

    bool operator==(const Site& other) const = default;
};
