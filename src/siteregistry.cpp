module;
#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QList>
#include <QSaveFile>
#include <QSet>
#include <QString>

#include <algorithm>
#include <optional>
#include <utility>

module devsrv.core.siteregistry;

SiteRegistry::SiteRegistry(const QString& filePath, ActivityLog *log)
    : m_filePath(filePath)
    , m_log(log)
{
}

SiteRegistry::LoadResult SiteRegistry::load()
{
    m_lastError.clear();
    m_lastInfo.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        m_sites.clear();
        return {LoadStatus::Missing, QString()};
    }

    if (!file.open(QIODevice::ReadOnly)) {
        m_sites.clear();
        m_lastError = QStringLiteral("Cannot read %1: %2").arg(m_filePath, file.errorString());
        log(QStringLiteral("[Registry] %1").arg(m_lastError));
        return {LoadStatus::Unreadable, m_lastError};
    }

    const QByteArray raw = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(raw, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        m_sites.clear();
        m_lastError = QStringLiteral("Cannot decode sites.json (unknown format)");
        log(QStringLiteral("[Registry] %1").arg(m_lastError));
        return {LoadStatus::Unreadable, m_lastError};
    }

    const QJsonArray records = doc.array();

    QList<Site> decoded;
    QSet<QString> decodedIds;
    bool strict = true;
    for (const QJsonValue& value : records) {
        const auto site = value.isObject() ? Site::fromJson(value.toObject()) : std::nullopt;
        // Duplicate ids go through recovery, which reassigns them.
        if (!site.has_value() || decodedIds.contains(site->id)) {
            strict = false;
            break;
        }
        decodedIds.insert(site->id);
        decoded.append(site.value());
    }

    if (strict) {
        sortSites(decoded);
        const auto served = std::find_if(decoded.cbegin(), decoded.cend(), [](const Site& site) {
            return site.served;
        });
        if (served != decoded.cend()) {
            const QString servedId = served->id;
            keepOnlyServed(decoded, servedId);
        }

        m_sites = decoded;
        if (serialize(m_sites) != raw) {
            QString saveError;
            if (!commit(decoded, &saveError)) {
                log(QStringLiteral("[Registry] Normalized registry not saved: %1").arg(saveError));
            }
        }
        return {LoadStatus::Loaded, QString()};
    }

    QList<Site> recovered;
    QSet<QString> seenIds;
    for (const QJsonValue& value : records) {
        if (!value.isObject()) {
            continue;
        }

        Site site = Site::fromLegacyJson(value.toObject());
        if (seenIds.contains(site.id)) {
            site.id = Site::createId();
        }
        seenIds.insert(site.id);
        recovered.append(site);
    }

    sortSites(recovered);
    const auto served = std::find_if(recovered.cbegin(), recovered.cend(), [](const Site& site) {
        return site.served;
    });
    if (served != recovered.cend()) {
        const QString servedId = served->id;
        keepOnlyServed(recovered, servedId);
    }

    m_sites = recovered;
    QString message = QStringLiteral("Recovered sites.json schema");
    QString saveError;
    if (!commit(recovered, &saveError)) {
        message += QStringLiteral(" (not saved: %1)").arg(saveError);
    }

    m_lastInfo = message;
    log(QStringLiteral("[Registry] %1 (%2 site(s)).").arg(message).arg(m_sites.size()));
    return {LoadStatus::Recovered, message};
}

bool SiteRegistry::upsert(const Site& site, QString *errorMessage)
{
    Site normalized = site;
    if (normalized.id.trimmed().isEmpty()) {
        normalized.id = Site::createId();
    }
    normalized.normalize();

    const QString invalid = normalized.validationError();
    if (!invalid.isEmpty()) {
        setError(errorMessage, invalid);
        return false;
    }

    QList<Site> next = m_sites;
    const auto existing = std::find_if(next.begin(), next.end(), [&normalized](const Site& candidate) {
        return candidate.id == normalized.id;
    });
    if (existing != next.end()) {
        *existing = normalized;
    } else {
        next.append(normalized);
    }

    if (normalized.served) {
        keepOnlyServed(next, normalized.id);
    }

    if (!commit(std::move(next), errorMessage)) {
        return false;
    }

    m_lastInfo = QStringLiteral("Saved");
    log(QStringLiteral("[Registry] Saved site \"%1\" (%2).").arg(normalized.name, normalized.urlString()));
    return true;
}

bool SiteRegistry::remove(const QString& id, QString *errorMessage)
{
    QList<Site> next = m_sites;
    const auto removed = next.removeIf([&id](const Site& site) { return site.id == id; });
    if (removed == 0) {
        return true;
    }

    if (!commit(std::move(next), errorMessage)) {
        return false;
    }

    m_lastInfo = QStringLiteral("Removed");
    log(QStringLiteral("[Registry] Removed site %1.").arg(id));
    return true;
}

bool SiteRegistry::setOnlyServed(const QString& id, bool served, QString *errorMessage)
{
    QList<Site> next = m_sites;
    const auto target = std::find_if(next.begin(), next.end(), [&id](const Site& site) {
        return site.id == id;
    });
    if (target == next.end()) {
        setError(errorMessage, QStringLiteral("Unknown site: %1").arg(id));
        return false;
    }

    if (served) {
        keepOnlyServed(next, id);
    } else {
        target->served = false;
    }

    if (next == m_sites) {
        return true;
    }

    if (!commit(std::move(next), errorMessage)) {
        return false;
    }

    log(served
        ? QStringLiteral("[Registry] Serving site %1.").arg(id)
        : QStringLiteral("[Registry] Stopped serving site %1.").arg(id));
    return true;
}

const QList<Site>& SiteRegistry::sites() const
{
    return m_sites;
}

QList<Site> SiteRegistry::servedSites() const
{
    QList<Site> served;
    for (const Site& site : m_sites) {
        if (site.served) {
            served.append(site);
        }
    }
    return served;
}

QList<Site> SiteRegistry::shortcutSites() const
{
    QList<Site> shortcuts;
    for (const Site& site : m_sites) {
        if (site.shortcut) {
            shortcuts.append(site);
        }
    }
    return shortcuts;
}

std::optional<Site> SiteRegistry::siteById(const QString& id) const
{
    for (const Site& site : m_sites) {
        if (site.id == id) {
            return site;
        }
    }
    return std::nullopt;
}

bool SiteRegistry::indexHtmlExists(const Site& site)
{
    return QFileInfo::exists(QDir(site.folder).filePath(QStringLiteral("index.html")));
}

QString SiteRegistry::filePath() const
{
    return m_filePath;
}

QString SiteRegistry::lastInfo() const
{
    return m_lastInfo;
}

QString SiteRegistry::lastError() const
{
    return m_lastError;
}

bool SiteRegistry::commit(QList<Site> next, QString *errorMessage)
{
    sortSites(next);

    const QFileInfo info(m_filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        setError(errorMessage, QStringLiteral("Cannot create directory %1").arg(info.absolutePath()));
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setError(errorMessage, QStringLiteral("Cannot save sites.json: %1").arg(file.errorString()));
        return false;
    }

    const QByteArray data = serialize(next);
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        setError(errorMessage, QStringLiteral("Cannot save sites.json: %1").arg(file.errorString()));
        return false;
    }

    if (!file.commit()) {
        setError(errorMessage, QStringLiteral("Cannot save sites.json: %1").arg(file.errorString()));
        return false;
    }

    m_sites = std::move(next);
    m_lastError.clear();
    return true;
}

void SiteRegistry::keepOnlyServed(QList<Site>& sites, const QString& servedId)
{
    bool marked = false;
    for (Site& site : sites) {
        site.served = !marked && site.id == servedId;
        marked = marked || site.served;
    }
}

void SiteRegistry::sortSites(QList<Site>& sites)
{
    std::stable_sort(sites.begin(), sites.end(), [](const Site& left, const Site& right) {
        const int byName = left.name.compare(right.name, Qt::CaseInsensitive);
        if (byName != 0) {
            return byName < 0;
        }
        return left.id < right.id;
    });
}

QByteArray SiteRegistry::serialize(const QList<Site>& sites)
{
    QJsonArray records;
    for (const Site& site : sites) {
        records.append(site.toJson());
    }
    return QJsonDocument(records).toJson(QJsonDocument::Indented);
}

void SiteRegistry::setError(QString *errorMessage, const QString& message)
{
    m_lastError = message;
    log(QStringLiteral("[Registry] %1").arg(message));
    if (errorMessage) {
        *errorMessage = message;
    }
}

void SiteRegistry::log(const QString& message) const
{
    if (m_log) {
        m_log->append(message);
    }
}
