#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QTemporaryDir>
#include <gtest/gtest.h>

import devsrv.core.activitylog;
import devsrv.core.site;
import devsrv.core.siteregistry;

namespace {

void writeFile(const QString& path, const QByteArray& data)
{
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(data);
}

QByteArray readFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

Site makeSite(const QString& id, const QString& name, int port, bool served = false)
{
    Site site;
    site.id = id;
    site.name = name;
    site.folder = QStringLiteral("/srv/%1").arg(id);
    site.port = port;
    site.served = served;
    return site;
}

int servedCount(const SiteRegistry& registry)
{
    int count = 0;
    for (const Site& site : registry.sites()) {
        count += site.served ? 1 : 0;
    }
    return count;
}

class SiteRegistryTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        path = dir.filePath(QStringLiteral("sites.json"));
    }

    QTemporaryDir dir;
    QString path;
};

} // namespace

TEST_F(SiteRegistryTest, MissingFileIsEmptyRegistry)
{
    SiteRegistry registry(path);
    const auto result = registry.load();

    EXPECT_EQ(result.status, SiteRegistry::LoadStatus::Missing);
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(registry.sites().isEmpty());
    EXPECT_FALSE(QFile::exists(path));
}

TEST_F(SiteRegistryTest, UpsertPersistsAndReloads)
{
    {
        SiteRegistry registry(path);
        ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("b"), QStringLiteral("beta"), 3001)));
        ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("a"), QStringLiteral("Alpha"), 3002)));
    }

    SiteRegistry reloaded(path);
    const auto result = reloaded.load();
    EXPECT_EQ(result.status, SiteRegistry::LoadStatus::Loaded);
    ASSERT_EQ(reloaded.sites().size(), 2);
    EXPECT_EQ(reloaded.sites().at(0).name, QStringLiteral("Alpha"));
    EXPECT_EQ(reloaded.sites().at(1).name, QStringLiteral("beta"));
}

TEST_F(SiteRegistryTest, SortIsCaseInsensitiveWithIdTieBreak)
{
    SiteRegistry registry(path);
    ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("z"), QStringLiteral("same"), 3001)));
    ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("y"), QStringLiteral("Same"), 3002)));
    ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("x"), QStringLiteral("apple"), 3003)));

    ASSERT_EQ(registry.sites().size(), 3);
    EXPECT_EQ(registry.sites().at(0).id, QStringLiteral("x"));
    EXPECT_EQ(registry.sites().at(1).id, QStringLiteral("y"));
    EXPECT_EQ(registry.sites().at(2).id, QStringLiteral("z"));
}

TEST_F(SiteRegistryTest, UpsertReplacesById)
{
    SiteRegistry registry(path);
    ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("a"), QStringLiteral("Alpha"), 3001)));
    ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("a"), QStringLiteral("Alpha 2"), 3005)));

    ASSERT_EQ(registry.sites().size(), 1);
    EXPECT_EQ(registry.sites().at(0).name, QStringLiteral("Alpha 2"));
    EXPECT_EQ(registry.sites().at(0).effectivePort(), 3005);
}

TEST_F(SiteRegistryTest, UpsertRejectsInvalidWithoutWriting)
{
    SiteRegistry registry(path);
    Site site = makeSite(QStringLiteral("a"), QStringLiteral("Alpha"), 3001);
    site.folder = QStringLiteral("not/absolute");

    QString error;
    EXPECT_FALSE(registry.upsert(site, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_EQ(registry.lastError(), error);
    EXPECT_TRUE(registry.sites().isEmpty());
    EXPECT_FALSE(QFile::exists(path));
}

TEST_F(SiteRegistryTest, SetOnlyServedKeepsSingleServedSite)
{
    SiteRegistry registry(path);
    ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("a"), QStringLiteral("A"), 3001)));
    ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("b"), QStringLiteral("B"), 3002)));
    ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("c"), QStringLiteral("C"), 3003)));

    ASSERT_TRUE(registry.setOnlyServed(QStringLiteral("a"), true));
    ASSERT_TRUE(registry.setOnlyServed(QStringLiteral("c"), true));

    EXPECT_EQ(servedCount(registry), 1);
    ASSERT_EQ(registry.servedSites().size(), 1);
    EXPECT_EQ(registry.servedSites().at(0).id, QStringLiteral("c"));

    SiteRegistry reloaded(path);
    reloaded.load();
    EXPECT_EQ(servedCount(reloaded), 1);
    EXPECT_EQ(reloaded.servedSites().at(0).id, QStringLiteral("c"));

    ASSERT_TRUE(registry.setOnlyServed(QStringLiteral("c"), false));
    EXPECT_TRUE(registry.servedSites().isEmpty());
}

TEST_F(SiteRegistryTest, SetOnlyServedUnknownIdFails)
{
    SiteRegistry registry(path);
    ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("a"), QStringLiteral("A"), 3001)));
    const QByteArray before = readFile(path);

    QString error;
    EXPECT_FALSE(registry.setOnlyServed(QStringLiteral("missing"), true, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_EQ(readFile(path), before);
}

TEST_F(SiteRegistryTest, UpsertOfServedSiteDemotesPreviousOne)
{
    SiteRegistry registry(path);
    ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("a"), QStringLiteral("A"), 3001, true)));
    ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("b"), QStringLiteral("B"), 3002, true)));

    EXPECT_EQ(servedCount(registry), 1);
    EXPECT_EQ(registry.servedSites().at(0).id, QStringLiteral("b"));
}

TEST_F(SiteRegistryTest, RemoveDeletesAndUnknownIdIsNoOp)
{
    SiteRegistry registry(path);
    ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("a"), QStringLiteral("A"), 3001)));
    ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("b"), QStringLiteral("B"), 3002)));

    EXPECT_TRUE(registry.remove(QStringLiteral("unknown")));
    EXPECT_EQ(registry.sites().size(), 2);

    EXPECT_TRUE(registry.remove(QStringLiteral("a")));
    ASSERT_EQ(registry.sites().size(), 1);
    EXPECT_FALSE(registry.siteById(QStringLiteral("a")).has_value());
    EXPECT_TRUE(registry.siteById(QStringLiteral("b")).has_value());

    SiteRegistry reloaded(path);
    reloaded.load();
    EXPECT_EQ(reloaded.sites().size(), 1);
}

TEST_F(SiteRegistryTest, ShortcutSitesFiltersFlag)
{
    SiteRegistry registry(path);
    Site pinned = makeSite(QStringLiteral("a"), QStringLiteral("A"), 3001);
    pinned.shortcut = true;
    ASSERT_TRUE(registry.upsert(pinned));
    ASSERT_TRUE(registry.upsert(makeSite(QStringLiteral("b"), QStringLiteral("B"), 3002)));

    ASSERT_EQ(registry.shortcutSites().size(), 1);
    EXPECT_EQ(registry.shortcutSites().at(0).id, QStringLiteral("a"));
}

TEST_F(SiteRegistryTest, LegacyRecordIsRecoveredAndRewritten)
{
    writeFile(path, R"([{"name":"Foo","folder":"/srv/foo","enabled":true}])");

    ActivityLog log;
    SiteRegistry registry(path, &log);
    const auto result = registry.load();

    EXPECT_EQ(result.status, SiteRegistry::LoadStatus::Recovered);
    EXPECT_TRUE(result.message.startsWith(QStringLiteral("Recovered sites.json schema")));
    EXPECT_EQ(registry.lastInfo(), result.message);
    ASSERT_EQ(registry.sites().size(), 1);

    const Site& site = registry.sites().at(0);
    EXPECT_FALSE(site.id.isEmpty());
    EXPECT_EQ(site.mode, SiteMode::LoopbackPort);
    EXPECT_EQ(site.effectivePort(), 3000);
    EXPECT_TRUE(site.domain.isEmpty());
    EXPECT_TRUE(site.served);
    EXPECT_FALSE(log.recent().isEmpty());

    SiteRegistry reloaded(path);
    EXPECT_EQ(reloaded.load().status, SiteRegistry::LoadStatus::Loaded);
    ASSERT_EQ(reloaded.sites().size(), 1);
    EXPECT_EQ(reloaded.sites().at(0).id, site.id);
}

TEST_F(SiteRegistryTest, RecoveryKeepsFirstServedAndSkipsNonObjects)
{
    writeFile(path, R"([
        {"id":"2","name":"Beta","folder":"/srv/b","served":true},
        7,
        {"id":"1","name":"alpha","folder":"/srv/a","served":true},
        {"id":"1","name":"Gamma","folder":"/srv/g"}
    ])");

    SiteRegistry registry(path);
    EXPECT_EQ(registry.load().status, SiteRegistry::LoadStatus::Recovered);

    ASSERT_EQ(registry.sites().size(), 3);
    EXPECT_EQ(servedCount(registry), 1);
    EXPECT_EQ(registry.servedSites().at(0).id, QStringLiteral("1"));

    // Duplicate ids get a fresh one.
    EXPECT_NE(registry.sites().at(2).id, QStringLiteral("1"));
}

TEST_F(SiteRegistryTest, CurrentSchemaDuplicateIdsKeepSingleServedSite)
{
    const QJsonArray records {
        makeSite(QStringLiteral("x"), QStringLiteral("A"), 3001).toJson(),
        makeSite(QStringLiteral("x"), QStringLiteral("B"), 3002, true).toJson()
    };
    writeFile(path, QJsonDocument(records).toJson());

    SiteRegistry registry(path);
    EXPECT_EQ(registry.load().status, SiteRegistry::LoadStatus::Recovered);

    ASSERT_EQ(registry.sites().size(), 2);
    EXPECT_NE(registry.sites().at(0).id, registry.sites().at(1).id);
    EXPECT_EQ(servedCount(registry), 1);
    ASSERT_EQ(registry.servedSites().size(), 1);
    EXPECT_EQ(registry.servedSites().at(0).name, QStringLiteral("B"));

    ASSERT_TRUE(registry.setOnlyServed(QStringLiteral("x"), true));
    EXPECT_EQ(servedCount(registry), 1);
    EXPECT_EQ(registry.servedSites().at(0).name, QStringLiteral("A"));

    SiteRegistry reloaded(path);
    EXPECT_EQ(reloaded.load().status, SiteRegistry::LoadStatus::Loaded);
    EXPECT_EQ(servedCount(reloaded), 1);
}

TEST_F(SiteRegistryTest, UnreadableFileIsLeftUntouched)
{
    const QByteArray garbage = "this is { not json";
    writeFile(path, garbage);

    SiteRegistry registry(path);
    const auto result = registry.load();

    EXPECT_EQ(result.status, SiteRegistry::LoadStatus::Unreadable);
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.message.isEmpty());
    EXPECT_TRUE(registry.sites().isEmpty());
    EXPECT_EQ(readFile(path), garbage);
}

TEST_F(SiteRegistryTest, JsonObjectDocumentIsUnreadable)
{
    writeFile(path, R"({"sites":[]})");

    SiteRegistry registry(path);
    EXPECT_EQ(registry.load().status, SiteRegistry::LoadStatus::Unreadable);
}

TEST_F(SiteRegistryTest, StrictFileWithUntrimmedFieldsIsNormalized)
{
    QJsonObject record;
    record[QStringLiteral("id")] = QStringLiteral("n1");
    record[QStringLiteral("name")] = QStringLiteral("  Padded  ");
    record[QStringLiteral("shortcutLabel")] = QString();
    record[QStringLiteral("folder")] = QStringLiteral("/srv/padded ");
    record[QStringLiteral("mode")] = QStringLiteral("localhost");
    record[QStringLiteral("domain")] = QString();
    record[QStringLiteral("served")] = false;
    record[QStringLiteral("shortcut")] = false;
    writeFile(path, QJsonDocument(QJsonArray {record}).toJson());

    SiteRegistry registry(path);
    EXPECT_EQ(registry.load().status, SiteRegistry::LoadStatus::Loaded);
    ASSERT_EQ(registry.sites().size(), 1);
    EXPECT_EQ(registry.sites().at(0).name, QStringLiteral("Padded"));
    EXPECT_EQ(registry.sites().at(0).shortcutLabel, QStringLiteral("Padded"));
    EXPECT_EQ(registry.sites().at(0).effectivePort(), 3000);

    const QJsonArray saved = QJsonDocument::fromJson(readFile(path)).array();
    ASSERT_EQ(saved.size(), 1);
    EXPECT_EQ(saved.at(0).toObject().value(QStringLiteral("name")).toString(), QStringLiteral("Padded"));
    EXPECT_EQ(saved.at(0).toObject().value(QStringLiteral("port")).toInt(), 3000);
}

TEST_F(SiteRegistryTest, IndexHtmlDetection)
{
    Site site = makeSite(QStringLiteral("a"), QStringLiteral("A"), 3001);
    site.folder = dir.path();
    EXPECT_FALSE(SiteRegistry::indexHtmlExists(site));

    writeFile(QDir(dir.path()).filePath(QStringLiteral("index.html")), "<h1>hi</h1>");
    EXPECT_TRUE(SiteRegistry::indexHtmlExists(site));
}
