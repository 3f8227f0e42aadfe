module;
#include <QDir>
#include <QJsonObject>
#include <QJsonValue>
#include <QRegularExpression>
#include <QString>
#include <QUuid>

#include <cmath>
#include <optional>

module devsrv.core.site;

namespace {
constexpr int kMinPort = 1;
constexpr int kMaxPort = 65535;

std::optional<QString> stringField(const QJsonObject& json, const QString& key)
{
    const QJsonValue value = json.value(key);
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.toString();
}

std::optional<bool> boolField(const QJsonObject& json, const QString& key)
{
    const QJsonValue value = json.value(key);
    if (!value.isBool()) {
        return std::nullopt;
    }
    return value.toBool();
}

std::optional<int> integerValue(const QJsonValue& value)
{
    if (value.isDouble()) {
        const double number = value.toDouble();
        if (std::floor(number) != number) {
            return std::nullopt;
        }
        if (number < kMinPort || number > kMaxPort) {
            return std::nullopt;
        }
        return static_cast<int>(number);
    }

    if (value.isString()) {
        bool ok = false;
        const int number = value.toString().trimmed().toInt(&ok);
        if (ok && number >= kMinPort && number <= kMaxPort) {
            return number;
        }
    }

    return std::nullopt;
}
}

QString siteModeToString(SiteMode mode)
{
    switch (mode) {
    case SiteMode::CustomDomain:
        return QStringLiteral("domain");
    case SiteMode::LoopbackPort:
    default:
        return QStringLiteral("localhost");
    }
}

std::optional<SiteMode> siteModeFromString(const QString& value)
{
    const QString token = value.trimmed().toLower();
    if (token == QStringLiteral("localhost")) {
        return SiteMode::LoopbackPort;
    }
    if (token == QStringLiteral("domain")) {
        return SiteMode::CustomDomain;
    }
    return std::nullopt;
}

bool isValidDomainName(const QString& domain)
{
    static const QRegularExpression pattern(
        QStringLiteral("^[A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?(\\.[A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?)*$")
    );

    if (domain.isEmpty() || domain.size() > 253) {
        return false;
    }
    return pattern.match(domain).hasMatch();
}

void Site::normalize()
{
    id = id.trimmed();
    name = name.trimmed();
    shortcutLabel = shortcutLabel.trimmed();
    folder = folder.trimmed();
    domain = domain.trimmed();

    if (shortcutLabel.isEmpty()) {
        shortcutLabel = name;
    }
    if (name.isEmpty()) {
        name = shortcutLabel.isEmpty() ? QStringLiteral("Site") : shortcutLabel;
    }
    if (shortcutLabel.isEmpty()) {
        shortcutLabel = name;
    }

    if (mode == SiteMode::LoopbackPort && !port.has_value()) {
        port = kDefaultSitePort;
    }
    if (mode == SiteMode::CustomDomain) {
        port.reset();
    }
}

QString Site::validationError() const
{
    if (id.isEmpty()) {
        return QStringLiteral("Site id is missing.");
    }

    if (folder.isEmpty()) {
        return QStringLiteral("Choose a folder to serve.");
    }

    if (!QDir::isAbsolutePath(folder)) {
        return QStringLiteral("Folder must be an absolute path: %1").arg(folder);
    }

    if (mode == SiteMode::LoopbackPort) {
        const int value = effectivePort();
        if (value < kMinPort || value > kMaxPort) {
            return QStringLiteral("Port must be between %1 and %2.").arg(kMinPort).arg(kMaxPort);
        }
        return {};
    }

    if (domain.isEmpty()) {
        return QStringLiteral("Enter a domain (for example myapp.test).");
    }

    if (!isValidDomainName(domain)) {
        return QStringLiteral("Invalid domain name: %1").arg(domain);
    }

    return {};
}

int Site::effectivePort() const
{
    return port.value_or(kDefaultSitePort);
}

QString Site::hostKey() const
{
    if (mode == SiteMode::CustomDomain) {
        return domain;
    }
    return QStringLiteral("localhost:%1").arg(effectivePort());
}

QString Site::urlString() const
{
    return QStringLiteral("https://%1").arg(hostKey());
}

bool Site::requiresPrivileges() const
{
    return mode == SiteMode::CustomDomain;
}

QJsonObject Site::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("id")] = id;
    json[QStringLiteral("name")] = name;
    json[QStringLiteral("shortcutLabel")] = shortcutLabel;
    json[QStringLiteral("folder")] = folder;
    json[QStringLiteral("mode")] = siteModeToString(mode);
    json[QStringLiteral("domain")] = domain;
    if (port.has_value()) {
        json[QStringLiteral("port")] = port.value();
    }
    json[QStringLiteral("served")] = served;
    json[QStringLiteral("shortcut")] = shortcut;
    return json;
}

std::optional<Site> Site::fromJson(const QJsonObject& json)
{
    const auto id = stringField(json, QStringLiteral("id"));
    const auto name = stringField(json, QStringLiteral("name"));
    const auto shortcutLabel = stringField(json, QStringLiteral("shortcutLabel"));
    const auto folder = stringField(json, QStringLiteral("folder"));
    const auto modeText = stringField(json, QStringLiteral("mode"));
    const auto domain = stringField(json, QStringLiteral("domain"));
    const auto served = boolField(json, QStringLiteral("served"));
    const auto shortcut = boolField(json, QStringLiteral("shortcut"));

    if (!id || !name || !shortcutLabel || !folder || !modeText || !domain || !served || !shortcut) {
        return std::nullopt;
    }

    const auto mode = siteModeFromString(modeText.value());
    if (!mode.has_value()) {
        return std::nullopt;
    }

    std::optional<int> port;
    const QJsonValue portValue = json.value(QStringLiteral("port"));
    if (!portValue.isUndefined() && !portValue.isNull()) {
        if (!portValue.isDouble()) {
            return std::nullopt;
        }
        port = integerValue(portValue);
        if (!port.has_value()) {
            return std::nullopt;
        }
    }

    Site site;
    site.id = id.value();
    site.name = name.value();
    site.shortcutLabel = shortcutLabel.value();
    site.folder = folder.value();
    site.mode = mode.value();
    site.domain = domain.value();
    site.port = port;
    site.served = served.value();
    site.shortcut = shortcut.value();

    if (site.id.trimmed().isEmpty()) {
        return std::nullopt;
    }

    site.normalize();
    return site;
}

Site Site::fromLegacyJson(const QJsonObject& json)
{
    Site site;

    site.id = stringField(json, QStringLiteral("id")).value_or(QString()).trimmed();
    if (site.id.isEmpty()) {
        site.id = createId();
    }

    site.name = stringField(json, QStringLiteral("name")).value_or(QString());
    site.folder = stringField(json, QStringLiteral("folder")).value_or(QString());

    site.served = boolField(json, QStringLiteral("served"))
        .value_or(boolField(json, QStringLiteral("enabled")).value_or(false));
    site.shortcut = boolField(json, QStringLiteral("shortcut")).value_or(false);

    if (const auto label = stringField(json, QStringLiteral("shortcutLabel"))) {
        site.shortcutLabel = label.value();
    } else {
        site.shortcutLabel = stringField(json, QStringLiteral("label")).value_or(site.name);
    }

    if (const auto domain = stringField(json, QStringLiteral("domain"))) {
        site.domain = domain.value();
    } else {
        const auto prefix = stringField(json, QStringLiteral("prefix"));
        const auto tld = stringField(json, QStringLiteral("tld"));
        if (prefix && tld && !prefix->trimmed().isEmpty() && !tld->trimmed().isEmpty()) {
            QString suffix = tld->trimmed();
            if (suffix.startsWith('.')) {
                suffix.remove(0, 1);
            }
            site.domain = prefix->trimmed() + QStringLiteral(".") + suffix;
        }
    }

    std::optional<SiteMode> mode;
    if (const auto modeText = stringField(json, QStringLiteral("mode"))) {
        mode = siteModeFromString(modeText.value());
    }
    if (!mode.has_value()) {
        // Older records toggled https://localhost on port 443 per site.
        const bool withoutPort = boolField(json, QStringLiteral("withoutPort")).value_or(false);
        mode = withoutPort ? SiteMode::CustomDomain : SiteMode::LoopbackPort;
        if (withoutPort && site.domain.trimmed().isEmpty()) {
            site.domain = QStringLiteral("localhost");
        }
    }
    site.mode = mode.value();

    site.port = integerValue(json.value(QStringLiteral("port")));

    site.normalize();
    return site;
}

QString Site::createId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}
