#include <QFile>
#include <QSettings>
#include <QString>
#include <QTemporaryDir>
#include <gtest/gtest.h>

import devsrv.core.proxysettings;
import devsrv.core.runtimepaths;

namespace {

class ProxySettingsTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(dir.isValid()); }

    QString iniPath() const { return dir.filePath(QStringLiteral("settings.ini")); }

    QTemporaryDir dir;
};

} // namespace

TEST_F(ProxySettingsTest, EmptyStoreGivesDefaults)
{
    QSettings store(iniPath(), QSettings::IniFormat);
    const ProxySettings settings = ProxySettings::load(store);

    EXPECT_TRUE(settings.caddyExecutablePath.isEmpty());
    EXPECT_EQ(settings.userPort, 8443);
    EXPECT_EQ(settings.adminPort, 2019);
    EXPECT_EQ(settings.siteProbeTimeoutMs, 2000);
    EXPECT_EQ(settings.adminProbeTimeoutMs, 1000);
    EXPECT_EQ(settings.privilegedTimeoutMs, 60000);
    EXPECT_TRUE(settings.loggingEnabled);
    EXPECT_EQ(settings.adminAddress(), QStringLiteral("127.0.0.1:2019"));
}

TEST_F(ProxySettingsTest, SavedValuesRoundTripAndProbeTimeoutsAreCapped)
{
    {
        QSettings store(iniPath(), QSettings::IniFormat);
        ProxySettings settings;
        settings.adminPort = 2999;
        settings.siteProbeTimeoutMs = 10000;
        settings.loggingEnabled = false;
        settings.save(store);
    }

    QSettings store(iniPath(), QSettings::IniFormat);
    const ProxySettings loaded = ProxySettings::load(store);
    EXPECT_EQ(loaded.adminPort, 2999);
    EXPECT_EQ(loaded.adminAddress(), QStringLiteral("127.0.0.1:2999"));
    EXPECT_EQ(loaded.siteProbeTimeoutMs, 2000);
    EXPECT_FALSE(loaded.loggingEnabled);
}

TEST_F(ProxySettingsTest, InvalidPortFallsBackToDefault)
{
    QSettings store(iniPath(), QSettings::IniFormat);
    store.setValue(QStringLiteral("proxy/userPort"), 70000);
    store.setValue(QStringLiteral("proxy/adminPort"), QStringLiteral("abc"));

    const ProxySettings loaded = ProxySettings::load(store);
    EXPECT_EQ(loaded.userPort, 8443);
    EXPECT_EQ(loaded.adminPort, 2019);
}

TEST_F(ProxySettingsTest, ExplicitCaddyPathMustExist)
{
    ProxySettings settings;
    settings.caddyExecutablePath = dir.filePath(QStringLiteral("missing-caddy"));
    EXPECT_TRUE(settings.resolveCaddyExecutable().isEmpty());

    QFile binary(settings.caddyExecutablePath);
    ASSERT_TRUE(binary.open(QIODevice::WriteOnly));
    binary.close();
    EXPECT_EQ(settings.resolveCaddyExecutable(), settings.caddyExecutablePath);
}

TEST(RuntimePathsTest, FilesLiveInDataDirectory)
{
    const RuntimePaths paths(QStringLiteral("/data/DevSrv"));

    EXPECT_EQ(paths.sitesJson(), QStringLiteral("/data/DevSrv/sites.json"));
    EXPECT_EQ(paths.caddyfile(), QStringLiteral("/data/DevSrv/Caddyfile.generated"));
    EXPECT_EQ(paths.accessLog(), QStringLiteral("/data/DevSrv/caddy-access.log"));
    EXPECT_EQ(paths.errorLog(), QStringLiteral("/data/DevSrv/caddy-error.log"));
    EXPECT_EQ(paths.userPidFile(), QStringLiteral("/data/DevSrv/caddy-user.pid"));
    EXPECT_EQ(paths.serviceDescriptorTemp(HostPlatform::MacOS), QStringLiteral("/data/DevSrv/devsrv.caddy.plist.tmp"));
    EXPECT_EQ(paths.serviceDescriptorTemp(HostPlatform::Linux), QStringLiteral("/data/DevSrv/devsrv-caddy.service.tmp"));
}

TEST(RuntimePathsTest, SystemLocations)
{
    EXPECT_EQ(RuntimePaths::serviceLabel(), QStringLiteral("devsrv.caddy"));
    EXPECT_EQ(
        RuntimePaths::serviceDescriptorPath(HostPlatform::MacOS),
        QStringLiteral("/Library/LaunchDaemons/devsrv.caddy.plist"));
    EXPECT_EQ(
        RuntimePaths::serviceDescriptorPath(HostPlatform::Linux),
        QStringLiteral("/etc/systemd/system/devsrv-caddy.service"));
    EXPECT_EQ(RuntimePaths::hostsFile(), QStringLiteral("/etc/hosts"));
    EXPECT_EQ(RuntimePaths::privilegedHome(HostPlatform::MacOS), QStringLiteral("/var/root"));
}
