#include <gtest/gtest.h>

#include <QJsonObject>
#include <QTemporaryDir>

#include "credential_store.h"

using namespace tvremote;

namespace {

TvProfile makeProfile(const QString &host)
{
    TvProfile profile;
    profile.id = QStringLiteral("tv-7");
    profile.brand = Brand::Samsung;
    profile.host = host;
    return profile;
}

} // namespace

TEST(CredentialStore, CacheKeyIsProfileAndHost) {
    EXPECT_EQ(CredentialStore::cacheKey(makeProfile(QStringLiteral(" 192.168.1.20 "))), QStringLiteral("tv-7:192.168.1.20"));

    TvProfile noHost = makeProfile(QString());
    noHost.host.reset();
    EXPECT_EQ(CredentialStore::cacheKey(noHost), QStringLiteral("tv-7:"));
}

TEST(CredentialStore, HostChangeIsACacheMiss) {
    MemoryStorage storage;
    CredentialStore store(&storage);
    const QString oldKey = CredentialStore::cacheKey(makeProfile(QStringLiteral("192.168.1.20")));
    const QString newKey = CredentialStore::cacheKey(makeProfile(QStringLiteral("192.168.1.21")));

    store.setValue(CredentialKind::SamsungToken, oldKey, QStringLiteral("11223344"));
    EXPECT_EQ(store.value(CredentialKind::SamsungToken, oldKey), QStringLiteral("11223344"));
    EXPECT_TRUE(store.value(CredentialKind::SamsungToken, newKey).isEmpty());
    EXPECT_TRUE(store.value(CredentialKind::LgClientKey, oldKey).isEmpty());
}

TEST(CredentialStore, ValuesSurviveAReload) {
    MemoryStorage storage;
    {
        CredentialStore store(&storage);
        store.setValue(CredentialKind::LgClientKey, QStringLiteral("tv-7:10.0.0.4"), QStringLiteral("lg-key"));
        QJsonObject sony;
        sony.insert(QStringLiteral("psk"), QStringLiteral("0000"));
        store.setRecord(CredentialKind::SonyPsk, QStringLiteral("tv-7:10.0.0.5"), sony);
    }

    CredentialStore reloaded(&storage);
    EXPECT_EQ(reloaded.value(CredentialKind::LgClientKey, QStringLiteral("tv-7:10.0.0.4")), QStringLiteral("lg-key"));
    EXPECT_EQ(reloaded.record(CredentialKind::SonyPsk, QStringLiteral("tv-7:10.0.0.5")).value(QStringLiteral("psk")).toString(),
              QStringLiteral("0000"));
}

TEST(CredentialStore, UnchangedValuesAreNotRewritten) {
    MemoryStorage storage;
    CredentialStore store(&storage);
    store.setValue(CredentialKind::VizioAuthToken, QStringLiteral("k"), QStringLiteral("Zm9v"));
    const int writes = storage.writeCount();
    store.setValue(CredentialKind::VizioAuthToken, QStringLiteral("k"), QStringLiteral("Zm9v"));
    store.setValue(CredentialKind::VizioAuthToken, QStringLiteral("k"), QString());
    EXPECT_EQ(storage.writeCount(), writes);
}

TEST(CredentialStore, MalformedAndLegacyEntriesAreHandled) {
    MemoryStorage storage;
    storage.setValue(CredentialStore::storageKey(CredentialKind::SamsungToken), QStringLiteral("{broken"));
    storage.setValue(CredentialStore::storageKey(CredentialKind::SonyPsk), QStringLiteral(R"({"tv-7:10.0.0.5":"1234"})"));

    CredentialStore store(&storage);
    EXPECT_FALSE(store.contains(CredentialKind::SamsungToken, QStringLiteral("tv-7:10.0.0.5")));
    EXPECT_EQ(store.record(CredentialKind::SonyPsk, QStringLiteral("tv-7:10.0.0.5")).value(QStringLiteral("psk")).toString(),
              QStringLiteral("1234"));
}

TEST(CredentialStore, ForgetDropsEveryKindForTheProfile) {
    MemoryStorage storage;
    CredentialStore store(&storage);
    const TvProfile profile = makeProfile(QStringLiteral("192.168.1.20"));
    const QString key = CredentialStore::cacheKey(profile);

    store.setValue(CredentialKind::SamsungToken, key, QStringLiteral("t"));
    store.setValue(CredentialKind::SamsungCertificate, key, QStringLiteral("ab12"));
    store.setValue(CredentialKind::LgClientKey, QStringLiteral("other:1.2.3.4"), QStringLiteral("keep"));

    EXPECT_EQ(store.forget(profile), 2);
    EXPECT_FALSE(store.contains(CredentialKind::SamsungToken, key));
    EXPECT_FALSE(store.contains(CredentialKind::SamsungCertificate, key));
    EXPECT_EQ(store.value(CredentialKind::LgClientKey, QStringLiteral("other:1.2.3.4")), QStringLiteral("keep"));
    EXPECT_EQ(store.forget(profile), 0);
}

TEST(SettingsStorage, PersistsToAnIniFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("credentials.ini"));
    {
        SettingsStorage storage(path);
        CredentialStore store(&storage);
        store.setValue(CredentialKind::SamsungToken, QStringLiteral("tv-7:192.168.1.20"), QStringLiteral("99"));
    }
    SettingsStorage storage(path);
    CredentialStore store(&storage);
    EXPECT_EQ(store.value(CredentialKind::SamsungToken, QStringLiteral("tv-7:192.168.1.20")), QStringLiteral("99"));
}
