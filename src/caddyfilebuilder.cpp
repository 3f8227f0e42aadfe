module;
#include <QList>
#include <QString>
#include <QStringList>

module devsrv.core.caddyfilebuilder;

QString CaddyfileBuilder::build(const QList<Site>& sites, const BuildOptions& options)
{
    QStringList lines {
        QStringLiteral("{"),
        QStringLiteral("  admin %1").arg(options.adminAddress),
        QStringLiteral("}"),
        QString(),
        QStringLiteral("# GENERATED - do not edit"),
        QString()
    };

    if (sites.isEmpty()) {
        lines << QStringLiteral("localhost:%1 {").arg(options.placeholderPort)
              << QStringLiteral("  respond \"%1\" 200").arg(quoteEscape(options.placeholderMessage))
              << QStringLiteral("}");
        return lines.join('\n') + QLatin1Char('\n');
    }

    for (const Site& site : sites) {
        lines << buildSiteBlock(site, options.accessLogPath);
    }

    // Drop the separator after the last block; join adds the final newline.
    while (!lines.isEmpty() && lines.last().isEmpty()) {
        lines.removeLast();
    }
    return lines.join('\n') + QLatin1Char('\n');
}

QStringList CaddyfileBuilder::buildSiteBlock(const Site& site, const QString& accessLogPath)
{
    return {
        QStringLiteral("%1 {").arg(site.hostKey()),
        QStringLiteral("  tls internal"),
        QStringLiteral("  root * \"%1\"").arg(quoteEscape(site.folder)),
        QStringLiteral("  file_server"),
        QStringLiteral("  log {"),
        QStringLiteral("    output file \"%1\"").arg(quoteEscape(accessLogPath)),
        QStringLiteral("  }"),
        QStringLiteral("}"),
        QString()
    };
}

QString CaddyfileBuilder::quoteEscape(const QString& value)
{
    QString escaped = value;
    escaped.replace(QStringLiteral("\\"), QStringLiteral("\\\\"));
    escaped.replace(QStringLiteral("\""), QStringLiteral("\\\""));
    return escaped;
}
