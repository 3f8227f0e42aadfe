module;
#include <QDir>
#include <QStandardPaths>
#include <QString>
#include <QtGlobal>

module devsrv.core.runtimepaths;

HostPlatform currentHostPlatform()
{
#if defined(Q_OS_MACOS)
    return HostPlatform::MacOS;
#elif defined(Q_OS_LINUX)
    return HostPlatform::Linux;
#else
    return HostPlatform::Unsupported;
#endif
}

RuntimePaths::RuntimePaths()
    : m_dataDirectory(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation))
{
}

RuntimePaths::RuntimePaths(const QString& dataDirectory)
    : m_dataDirectory(dataDirectory)
{
}

bool RuntimePaths::ensureDataDirectory() const
{
    return QDir().mkpath(m_dataDirectory);
}

QString RuntimePaths::dataDirectory() const
{
    return m_dataDirectory;
}

QString RuntimePaths::sitesJson() const
{
    return QDir(m_dataDirectory).filePath(QStringLiteral("sites.json"));
}

QString RuntimePaths::caddyfile() const
{
    return QDir(m_dataDirectory).filePath(QStringLiteral("Caddyfile.generated"));
}

QString RuntimePaths::accessLog() const
{
    return QDir(m_dataDirectory).filePath(QStringLiteral("caddy-access.log"));
}

QString RuntimePaths::errorLog() const
{
    return QDir(m_dataDirectory).filePath(QStringLiteral("caddy-error.log"));
}

QString RuntimePaths::userPidFile() const
{
    return QDir(m_dataDirectory).filePath(QStringLiteral("caddy-user.pid"));
}

QString RuntimePaths::serviceDescriptorTemp(HostPlatform platform) const
{
    if (platform == HostPlatform::Linux) {
        return QDir(m_dataDirectory).filePath(systemdUnitName() + QStringLiteral(".tmp"));
    }
    return QDir(m_dataDirectory).filePath(serviceLabel() + QStringLiteral(".plist.tmp"));
}

QString RuntimePaths::serviceLabel()
{
    return QStringLiteral("devsrv.caddy");
}

QString RuntimePaths::systemdUnitName()
{
    return QStringLiteral("devsrv-caddy.service");
}

QString RuntimePaths::serviceDescriptorPath(HostPlatform platform)
{
    if (platform == HostPlatform::Linux) {
        return QStringLiteral("/etc/systemd/system/") + systemdUnitName();
    }
    return QStringLiteral("/Library/LaunchDaemons/") + serviceLabel() + QStringLiteral(".plist");
}

QString RuntimePaths::hostsFile()
{
    return QStringLiteral("/etc/hosts");
}

QString RuntimePaths::privilegedHome(HostPlatform platform)
{
    if (platform == HostPlatform::Linux) {
        return QStringLiteral("/root");
    }
    return QStringLiteral("/var/root");
}
