module;
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QStringList>
#include <QtGlobal>

#include <utility>

module devsrv.core.proxysettings;

namespace {
quint16 portSetting(QSettings& settings, const QString& key, quint16 fallback)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok || value <= 0 || value > 65535) {
        return fallback;
    }
    return static_cast<quint16>(value);
}

int timeoutSetting(QSettings& settings, const QString& key, int fallback)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    return ok && value > 0 ? value : fallback;
}
}

ProxySettings ProxySettings::load(QSettings& settings)
{
    ProxySettings loaded;
    loaded.caddyExecutablePath = settings.value(QStringLiteral("caddy/executablePath")).toString().trimmed();
    loaded.userPort = portSetting(settings, QStringLiteral("proxy/userPort"), loaded.userPort);
    loaded.adminPort = portSetting(settings, QStringLiteral("proxy/adminPort"), loaded.adminPort);
    loaded.siteProbeTimeoutMs = qMin(2000, timeoutSetting(settings, QStringLiteral("probe/siteTimeoutMs"), loaded.siteProbeTimeoutMs));
    loaded.adminProbeTimeoutMs = qMin(1000, timeoutSetting(settings, QStringLiteral("probe/adminTimeoutMs"), loaded.adminProbeTimeoutMs));
    loaded.commandTimeoutMs = timeoutSetting(settings, QStringLiteral("commands/timeoutMs"), loaded.commandTimeoutMs);
    loaded.privilegedTimeoutMs = timeoutSetting(settings, QStringLiteral("commands/privilegedTimeoutMs"), loaded.privilegedTimeoutMs);
    loaded.stopGraceMs = timeoutSetting(settings, QStringLiteral("commands/stopGraceMs"), loaded.stopGraceMs);
    loaded.loggingEnabled = settings.value(QStringLiteral("logs/enabled"), true).toBool();
    return loaded;
}

void ProxySettings::save(QSettings& settings) const
{
    settings.setValue(QStringLiteral("caddy/executablePath"), caddyExecutablePath);
    settings.setValue(QStringLiteral("proxy/userPort"), userPort);
    settings.setValue(QStringLiteral("proxy/adminPort"), adminPort);
    settings.setValue(QStringLiteral("probe/siteTimeoutMs"), siteProbeTimeoutMs);
    settings.setValue(QStringLiteral("probe/adminTimeoutMs"), adminProbeTimeoutMs);
    settings.setValue(QStringLiteral("commands/timeoutMs"), commandTimeoutMs);
    settings.setValue(QStringLiteral("commands/privilegedTimeoutMs"), privilegedTimeoutMs);
    settings.setValue(QStringLiteral("commands/stopGraceMs"), stopGraceMs);
    settings.setValue(QStringLiteral("logs/enabled"), loggingEnabled);
}

QString ProxySettings::resolveCaddyExecutable() const
{
    if (!caddyExecutablePath.isEmpty()) {
        const QFileInfo info(caddyExecutablePath);
        return info.exists() && info.isFile() ? info.absoluteFilePath() : QString();
    }

    QStringList candidates;
    const QString appDir = QCoreApplication::applicationDirPath();
    if (!appDir.isEmpty()) {
        candidates << QDir(appDir).filePath(QStringLiteral("caddy"));
#ifdef Q_OS_MACOS
        // Bundled binary lives in Contents/Resources next to Contents/MacOS.
        candidates << QDir(appDir).filePath(QStringLiteral("../Resources/caddy"));
#endif
    }

    for (const QString& path : std::as_const(candidates)) {
        const QFileInfo info(path);
        if (info.exists() && info.isFile()) {
            return info.canonicalFilePath();
        }
    }

    return QStandardPaths::findExecutable(QStringLiteral("caddy"));
}

QString ProxySettings::adminAddress() const
{
    return QStringLiteral("127.0.0.1:%1").arg(adminPort);
}
