#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QList>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <QTextStream>

#include <optional>

import devsrv.core.activitylog;
import devsrv.core.proxyorchestrator;
import devsrv.core.site;
import devsrv.core.siteregistry;

namespace {
enum ExitCode {
    ExitOk = 0,
    ExitFailed = 1,
    ExitUsage = 2
};

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

struct SiteOptions {
    QCommandLineOption name {QStringLiteral("name"), QStringLiteral("Site name."), QStringLiteral("name")};
    QCommandLineOption label {QStringLiteral("label"), QStringLiteral("Shortcut label."), QStringLiteral("label")};
    QCommandLineOption folder {QStringLiteral("folder"), QStringLiteral("Document root."), QStringLiteral("path")};
    QCommandLineOption port {QStringLiteral("port"), QStringLiteral("Serve on https://localhost:<port>."), QStringLiteral("port")};
    QCommandLineOption domain {QStringLiteral("domain"), QStringLiteral("Serve on https://<domain> (needs administrator rights)."), QStringLiteral("domain")};
    QCommandLineOption shortcut {QStringLiteral("shortcut"), QStringLiteral("Show in quick-access list (yes/no)."), QStringLiteral("yes|no")};
};

std::optional<Site> findSite(const SiteRegistry& registry, const QString& key)
{
    if (const auto byId = registry.siteById(key)) {
        return byId;
    }
    for (const Site& site : registry.sites()) {
        if (site.name.compare(key, Qt::CaseInsensitive) == 0) {
            return site;
        }
    }
    return std::nullopt;
}

bool applySiteOptions(const QCommandLineParser& parser, const SiteOptions& options, Site *site, QString *errorMessage)
{
    if (parser.isSet(options.name)) {
        site->name = parser.value(options.name);
    }
    if (parser.isSet(options.label)) {
        site->shortcutLabel = parser.value(options.label);
    }
    if (parser.isSet(options.folder)) {
        site->folder = parser.value(options.folder);
    }
    if (parser.isSet(options.port) && parser.isSet(options.domain)) {
        *errorMessage = QStringLiteral("Use either --port or --domain, not both.");
        return false;
    }
    if (parser.isSet(options.port)) {
        bool ok = false;
        const int port = parser.value(options.port).toInt(&ok);
        if (!ok) {
            *errorMessage = QStringLiteral("Invalid port: %1").arg(parser.value(options.port));
            return false;
        }
        site->mode = SiteMode::LoopbackPort;
        site->port = port;
        site->domain.clear();
    }
    if (parser.isSet(options.domain)) {
        site->mode = SiteMode::CustomDomain;
        site->domain = parser.value(options.domain);
        site->port.reset();
    }
    if (parser.isSet(options.shortcut)) {
        const QString value = parser.value(options.shortcut).trimmed().toLower();
        site->shortcut = value == QStringLiteral("yes") || value == QStringLiteral("true") || value == QStringLiteral("1");
    }
    return true;
}

int report(const CommandResult& result)
{
    if (result.ok()) {
        out() << result.message() << Qt::endl;
        return ExitOk;
    }
    err() << failureKindName(result.failure) << ": " << result.message() << Qt::endl;
    return ExitFailed;
}

void printSites(const SiteRegistry& registry, ProxyOrchestrator& orchestrator)
{
    if (registry.sites().isEmpty()) {
        out() << "No sites." << Qt::endl;
        return;
    }

    const ProxyState overall = registry.servedSites().isEmpty() ? ProxyState::Stopped : orchestrator.state();
    for (const Site& site : registry.sites()) {
        out() << (site.served ? "* " : "  ")
              << site.name << "  " << site.urlString()
              << "  [" << siteStatusName(orchestrator.siteStatus(site, overall)) << "]"
              << (site.shortcut ? "  shortcut" : "")
              << Qt::endl
              << "    id: " << site.id << Qt::endl
              << "    folder: " << site.folder << Qt::endl;
        if (!SiteRegistry::indexHtmlExists(site)) {
            out() << "    warning: no index.html in folder" << Qt::endl;
        }
    }
}
}

auto main(int argc, char *argv[]) -> int
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("DevSrv"));
    QCoreApplication::setApplicationName(QStringLiteral("DevSrv"));
#ifdef APP_VERSION
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));
#else
    QCoreApplication::setApplicationVersion(QStringLiteral("0.0.0"));
#endif

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Serve local folders through Caddy.\n\n"
        "Commands:\n"
        "  list                     List registered sites\n"
        "  add [options]            Register a site\n"
        "  update <site> [options]  Change a site\n"
        "  remove <site>            Unregister a site\n"
        "  serve <site>             Serve a site (only one at a time) and apply\n"
        "  unserve <site>           Stop serving a site and apply\n"
        "  apply                    Regenerate config and (re)start Caddy\n"
        "  stop                     Stop Caddy and unload the system service\n"
        "  status                   Show proxy and site status\n"
        "  config                   Print the generated Caddyfile\n"
        "  logs                     Show the tail of the Caddy logs\n"
        "  version                  Show DevSrv and Caddy versions"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."));
    parser.addPositionalArgument(QStringLiteral("site"), QStringLiteral("Site id or name."), QStringLiteral("[site]"));

    const SiteOptions siteOptions;
    parser.addOptions({
        siteOptions.name,
        siteOptions.label,
        siteOptions.folder,
        siteOptions.port,
        siteOptions.domain,
        siteOptions.shortcut
    });

    const QCommandLineOption linesOption(
        QStringLiteral("lines"), QStringLiteral("Log lines to show."), QStringLiteral("count"), QStringLiteral("300"));
    const QCommandLineOption dataDirOption(
        QStringLiteral("data-dir"), QStringLiteral("Data directory override."), QStringLiteral("path"));
    const QCommandLineOption caddyOption(
        QStringLiteral("caddy"), QStringLiteral("Caddy executable override."), QStringLiteral("path"));
    const QCommandLineOption verboseOption(
        QStringLiteral("verbose"), QStringLiteral("Print the activity log."));
    parser.addOptions({linesOption, dataDirOption, caddyOption, verboseOption});

    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        err() << parser.helpText();
        return ExitUsage;
    }
    const QString command = positional.constFirst().toLower();
    const QString siteKey = positional.value(1);

    QSettings settings;
    ProxySettings proxySettings = ProxySettings::load(settings);
    if (parser.isSet(caddyOption)) {
        proxySettings.caddyExecutablePath = parser.value(caddyOption);
    }

    const RuntimePaths paths = parser.isSet(dataDirOption) ? RuntimePaths(parser.value(dataDirOption)) : RuntimePaths();

    ActivityLog activity;
    activity.setEnabled(proxySettings.loggingEnabled || parser.isSet(verboseOption));

    SiteRegistry registry(paths.sitesJson(), &activity);
    const SiteRegistry::LoadResult loaded = registry.load();
    if (loaded.status == SiteRegistry::LoadStatus::Unreadable) {
        err() << failureKindName(FailureKind::SchemaRecovery) << ": " << loaded.message << Qt::endl;
    } else if (loaded.status == SiteRegistry::LoadStatus::Recovered) {
        err() << loaded.message << Qt::endl;
    }

    ProxyOrchestrator orchestrator(registry, paths, proxySettings, &activity);

    const auto requireSite = [&]() -> std::optional<Site> {
        if (siteKey.isEmpty()) {
            err() << "Missing site id or name." << Qt::endl;
            return std::nullopt;
        }
        auto site = findSite(registry, siteKey);
        if (!site.has_value()) {
            err() << "Unknown site: " << siteKey << Qt::endl;
        }
        return site;
    };

    int exitCode = ExitOk;
    QString error;

    if (command == QStringLiteral("list")) {
        printSites(registry, orchestrator);
    } else if (command == QStringLiteral("add")) {
        Site site;
        site.id = Site::createId();
        if (!applySiteOptions(parser, siteOptions, &site, &error) || !registry.upsert(site, &error)) {
            err() << error << Qt::endl;
            exitCode = ExitFailed;
        } else {
            out() << "Added " << site.id << Qt::endl;
        }
    } else if (command == QStringLiteral("update")) {
        auto site = requireSite();
        if (!site.has_value()) {
            exitCode = ExitUsage;
        } else if (!applySiteOptions(parser, siteOptions, &site.value(), &error) || !registry.upsert(site.value(), &error)) {
            err() << error << Qt::endl;
            exitCode = ExitFailed;
        } else {
            out() << "Updated " << site->id << Qt::endl;
        }
    } else if (command == QStringLiteral("remove")) {
        const auto site = requireSite();
        if (!site.has_value()) {
            exitCode = ExitUsage;
        } else if (!registry.remove(site->id, &error)) {
            err() << error << Qt::endl;
            exitCode = ExitFailed;
        } else {
            out() << "Removed " << site->name << Qt::endl;
            if (site->served) {
                exitCode = report(orchestrator.apply());
            }
        }
    } else if (command == QStringLiteral("serve") || command == QStringLiteral("unserve")) {
        const bool serve = command == QStringLiteral("serve");
        const auto site = requireSite();
        if (!site.has_value()) {
            exitCode = ExitUsage;
        } else if (!registry.setOnlyServed(site->id, serve, &error)) {
            err() << error << Qt::endl;
            exitCode = ExitFailed;
        } else {
            if (serve && !SiteRegistry::indexHtmlExists(site.value())) {
                err() << "warning: no index.html in " << site->folder << Qt::endl;
            }
            exitCode = report(orchestrator.apply());
        }
    } else if (command == QStringLiteral("apply")) {
        exitCode = report(orchestrator.apply());
    } else if (command == QStringLiteral("stop")) {
        exitCode = report(orchestrator.stopAll());
    } else if (command == QStringLiteral("status")) {
        const ProxyState overall = orchestrator.state();
        out() << "Proxy: " << proxyStateName(overall) << Qt::endl;
        if (orchestrator.serviceInstalled()) {
            out() << "Service: " << RuntimePaths::serviceLabel()
                  << (orchestrator.serviceRunning() ? " (running)" : " (installed)") << Qt::endl;
        }
        if (const auto pid = orchestrator.recordedPid()) {
            out() << "Process: " << pid.value() << Qt::endl;
        }
        const QString caddy = orchestrator.caddyExecutable();
        out() << "Caddy: " << (caddy.isEmpty() ? QStringLiteral("(not found)") : caddy) << Qt::endl;
        for (const Site& site : registry.servedSites()) {
            out() << site.name << "  " << site.urlString()
                  << "  " << siteStatusName(orchestrator.siteStatus(site, overall)) << Qt::endl;
        }
    } else if (command == QStringLiteral("config")) {
        out() << orchestrator.renderConfig();
    } else if (command == QStringLiteral("logs")) {
        bool ok = false;
        const int lines = parser.value(linesOption).toInt(&ok);
        out() << orchestrator.readLogs(ok && lines > 0 ? lines : 300);
    } else if (command == QStringLiteral("version")) {
        out() << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion() << Qt::endl
              << orchestrator.caddyVersion() << Qt::endl;
    } else {
        err() << "Unknown command: " << command << Qt::endl << Qt::endl << parser.helpText();
        exitCode = ExitUsage;
    }

    if (parser.isSet(verboseOption)) {
        for (const QString& line : activity.recent()) {
            err() << line << Qt::endl;
        }
    }

    return exitCode;
}
