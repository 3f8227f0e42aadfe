#include <QString>
#include <QStringList>
#include <QXmlStreamReader>
#include <gtest/gtest.h>

import devsrv.core.servicedescriptor;

namespace {

ServiceDescriptor caddyDescriptor(HostPlatform platform)
{
    return ServiceDescriptor::forCaddy(
        QStringLiteral("/Applications/DevSrv.app/Contents/Resources/caddy"),
        QStringLiteral("/Users/me/Library/Application Support/DevSrv/Caddyfile.generated"),
        QStringLiteral("/Users/me/Library/Application Support/DevSrv/caddy-error.log"),
        platform);
}

} // namespace

TEST(ServiceDescriptorTest, CaddyDescriptorRunsGeneratedConfig)
{
    const ServiceDescriptor descriptor = caddyDescriptor(HostPlatform::MacOS);

    EXPECT_EQ(descriptor.label, QStringLiteral("devsrv.caddy"));
    const QStringList expectedArguments {
        QStringLiteral("run"),
        QStringLiteral("--config"),
        QStringLiteral("/Users/me/Library/Application Support/DevSrv/Caddyfile.generated"),
        QStringLiteral("--adapter"),
        QStringLiteral("caddyfile")
    };
    EXPECT_EQ(descriptor.arguments, expectedArguments);
    EXPECT_TRUE(descriptor.runAtLoad);
    EXPECT_TRUE(descriptor.keepAlive);
    EXPECT_EQ(descriptor.stdoutPath, descriptor.stderrPath);
}

TEST(ServiceDescriptorTest, MacEnvironmentUsesRootHome)
{
    const ServiceDescriptor descriptor = caddyDescriptor(HostPlatform::MacOS);

    ASSERT_EQ(descriptor.environment.size(), 4);
    EXPECT_EQ(descriptor.environment.at(0).first, QStringLiteral("HOME"));
    EXPECT_EQ(descriptor.environment.at(0).second, QStringLiteral("/var/root"));
    EXPECT_EQ(descriptor.environment.at(1).second, QStringLiteral("/var/root/Library/Application Support"));
    EXPECT_EQ(descriptor.environment.at(3).first, QStringLiteral("PATH"));
    EXPECT_EQ(descriptor.workingDirectory, QStringLiteral("/var/root"));
}

TEST(ServiceDescriptorTest, LaunchdPlistIsWellFormed)
{
    const QString plist = caddyDescriptor(HostPlatform::MacOS).toLaunchdPlist();

    EXPECT_TRUE(plist.contains(QStringLiteral("<!DOCTYPE plist PUBLIC")));
    EXPECT_TRUE(plist.contains(QStringLiteral("<key>Label</key>")));
    EXPECT_TRUE(plist.contains(QStringLiteral("<string>devsrv.caddy</string>")));
    EXPECT_TRUE(plist.contains(QStringLiteral("<key>RunAtLoad</key>")));
    EXPECT_TRUE(plist.contains(QStringLiteral("<key>StandardErrorPath</key>")));
    EXPECT_TRUE(plist.contains(QStringLiteral("<string>caddyfile</string>")));

    QXmlStreamReader reader(plist);
    while (!reader.atEnd()) {
        reader.readNext();
    }
    EXPECT_FALSE(reader.hasError()) << reader.errorString().toStdString();
}

TEST(ServiceDescriptorTest, SystemdUnitQuotesArguments)
{
    const ServiceDescriptor descriptor = ServiceDescriptor::forCaddy(
        QStringLiteral("/usr/bin/caddy"),
        QStringLiteral("/home/me/.local/share/DevSrv/Caddyfile.generated"),
        QStringLiteral("/home/me/.local/share/DevSrv/caddy-error.log"),
        HostPlatform::Linux);
    const QString unit = descriptor.render(HostPlatform::Linux);

    EXPECT_TRUE(unit.startsWith(QStringLiteral("[Unit]\n")));
    EXPECT_TRUE(unit.contains(QStringLiteral(
        "ExecStart=\"/usr/bin/caddy\" \"run\" \"--config\" "
        "\"/home/me/.local/share/DevSrv/Caddyfile.generated\" \"--adapter\" \"caddyfile\"\n")));
    EXPECT_TRUE(unit.contains(QStringLiteral("Environment=\"HOME=/root\"\n")));
    EXPECT_TRUE(unit.contains(QStringLiteral("Environment=\"XDG_CONFIG_HOME=/root/.config\"\n")));
    EXPECT_TRUE(unit.contains(QStringLiteral("StandardError=append:/home/me/.local/share/DevSrv/caddy-error.log\n")));
    EXPECT_TRUE(unit.contains(QStringLiteral("Restart=always\n")));
    EXPECT_TRUE(unit.endsWith(QStringLiteral("[Install]\nWantedBy=multi-user.target\n")));
}

TEST(ServiceDescriptorTest, SystemdUnitWithoutKeepAlive)
{
    ServiceDescriptor descriptor;
    descriptor.label = QStringLiteral("x");
    descriptor.program = QStringLiteral("/bin/true");
    descriptor.keepAlive = false;
    descriptor.runAtLoad = false;

    const QString unit = descriptor.toSystemdUnit();
    EXPECT_TRUE(unit.contains(QStringLiteral("Restart=no\n")));
    EXPECT_FALSE(unit.contains(QStringLiteral("[Install]")));
}
