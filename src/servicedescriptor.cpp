module;
#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QXmlStreamWriter>

module devsrv.core.servicedescriptor;

namespace {
QString systemdQuote(const QString& value)
{
    QString escaped = value;
    escaped.replace(QStringLiteral("\\"), QStringLiteral("\\\\"));
    escaped.replace(QStringLiteral("\""), QStringLiteral("\\\""));
    return QStringLiteral("\"") + escaped + QStringLiteral("\"");
}

void writeKeyString(QXmlStreamWriter& xml, const QString& key, const QString& value)
{
    xml.writeTextElement(QStringLiteral("key"), key);
    xml.writeTextElement(QStringLiteral("string"), value);
}

void writeKeyBool(QXmlStreamWriter& xml, const QString& key, bool value)
{
    xml.writeTextElement(QStringLiteral("key"), key);
    xml.writeEmptyElement(value ? QStringLiteral("true") : QStringLiteral("false"));
}
}

QString ServiceDescriptor::toLaunchdPlist() const
{
    QString text;
    QXmlStreamWriter xml(&text);
    xml.setAutoFormatting(true);
    xml.setAutoFormattingIndent(2);

    xml.writeStartDocument();
    xml.writeDTD(QStringLiteral(
        "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" \"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">"
    ));
    xml.writeStartElement(QStringLiteral("plist"));
    xml.writeAttribute(QStringLiteral("version"), QStringLiteral("1.0"));
    xml.writeStartElement(QStringLiteral("dict"));

    writeKeyString(xml, QStringLiteral("Label"), label);

    xml.writeTextElement(QStringLiteral("key"), QStringLiteral("ProgramArguments"));
    xml.writeStartElement(QStringLiteral("array"));
    xml.writeTextElement(QStringLiteral("string"), program);
    for (const QString& argument : arguments) {
        xml.writeTextElement(QStringLiteral("string"), argument);
    }
    xml.writeEndElement();

    if (!workingDirectory.isEmpty()) {
        writeKeyString(xml, QStringLiteral("WorkingDirectory"), workingDirectory);
    }

    if (!environment.isEmpty()) {
        xml.writeTextElement(QStringLiteral("key"), QStringLiteral("EnvironmentVariables"));
        xml.writeStartElement(QStringLiteral("dict"));
        for (const auto& variable : environment) {
            writeKeyString(xml, variable.first, variable.second);
        }
        xml.writeEndElement();
    }

    writeKeyBool(xml, QStringLiteral("RunAtLoad"), runAtLoad);
    writeKeyBool(xml, QStringLiteral("KeepAlive"), keepAlive);

    if (!stdoutPath.isEmpty()) {
        writeKeyString(xml, QStringLiteral("StandardOutPath"), stdoutPath);
    }
    if (!stderrPath.isEmpty()) {
        writeKeyString(xml, QStringLiteral("StandardErrorPath"), stderrPath);
    }

    xml.writeEndElement();
    xml.writeEndElement();
    xml.writeEndDocument();
    return text;
}

QString ServiceDescriptor::toSystemdUnit() const
{
    QStringList command;
    command << systemdQuote(program);
    for (const QString& argument : arguments) {
        command << systemdQuote(argument);
    }

    QStringList lines {
        QStringLiteral("[Unit]"),
        QStringLiteral("Description=DevSrv Caddy (%1)").arg(label),
        QStringLiteral("After=network.target"),
        QString(),
        QStringLiteral("[Service]"),
        QStringLiteral("Type=simple"),
        QStringLiteral("ExecStart=%1").arg(command.join(' '))
    };

    if (!workingDirectory.isEmpty()) {
        lines << QStringLiteral("WorkingDirectory=%1").arg(workingDirectory);
    }
    for (const auto& variable : environment) {
        lines << QStringLiteral("Environment=%1").arg(systemdQuote(variable.first + QLatin1Char('=') + variable.second));
    }
    if (!stdoutPath.isEmpty()) {
        lines << QStringLiteral("StandardOutput=append:%1").arg(stdoutPath);
    }
    if (!stderrPath.isEmpty()) {
        lines << QStringLiteral("StandardError=append:%1").arg(stderrPath);
    }
    lines << QStringLiteral("Restart=%1").arg(keepAlive ? QStringLiteral("always") : QStringLiteral("no"));

    if (runAtLoad) {
        lines << QString()
              << QStringLiteral("[Install]")
              << QStringLiteral("WantedBy=multi-user.target");
    }

    return lines.join('\n') + QLatin1Char('\n');
}

QString ServiceDescriptor::render(HostPlatform platform) const
{
    return platform == HostPlatform::MacOS ? toLaunchdPlist() : toSystemdUnit();
}

ServiceDescriptor ServiceDescriptor::forCaddy(
    const QString& caddyPath,
    const QString& caddyfilePath,
    const QString& errorLogPath,
    HostPlatform platform)
{
    const QString home = RuntimePaths::privilegedHome(platform);
    const bool mac = platform == HostPlatform::MacOS;
    const QString xdgData = mac
        ? home + QStringLiteral("/Library/Application Support")
        : home + QStringLiteral("/.local/share");
    const QString xdgConfig = mac
        ? home + QStringLiteral("/Library/Application Support")
        : home + QStringLiteral("/.config");

    ServiceDescriptor descriptor;
    descriptor.label = RuntimePaths::serviceLabel();
    descriptor.program = caddyPath;
    descriptor.arguments = {
        QStringLiteral("run"),
        QStringLiteral("--config"),
        caddyfilePath,
        QStringLiteral("--adapter"),
        QStringLiteral("caddyfile")
    };
    descriptor.workingDirectory = home;
    descriptor.environment = {
        {QStringLiteral("HOME"), home},
        {QStringLiteral("XDG_DATA_HOME"), xdgData},
        {QStringLiteral("XDG_CONFIG_HOME"), xdgConfig},
        {QStringLiteral("PATH"), QStringLiteral("/usr/local/bin:/usr/bin:/bin:/usr/sbin:/sbin")}
    };
    descriptor.runAtLoad = true;
    descriptor.keepAlive = true;
    descriptor.stdoutPath = errorLogPath;
    descriptor.stderrPath = errorLogPath;
    return descriptor;
}
