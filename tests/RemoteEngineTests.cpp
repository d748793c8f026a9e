#include <gtest/gtest.h>

#include <QSslSocket>

#include "fake_servers.h"
#include "remote_engine.h"
#include "secure_channel.h"

using namespace tvremote;
using namespace tvremote::test;

namespace {

TvProfile makeProfile(Brand brand)
{
    TvProfile profile;
    profile.id = QStringLiteral("kitchen");
    profile.brand = brand;
    profile.nickname = QStringLiteral("Kitchen");
    profile.host = QStringLiteral("127.0.0.1");
    return profile;
}

} // namespace

TEST(RemoteEngine, ScanPlansRaceInPriorityOrder) {
    RemoteEngine engine(isolatedConfig(), std::make_unique<MemoryStorage>());

    QStringList sources;
    for (const ProbePlan &plan : engine.scanPlans(QStringLiteral("192.168.1.40"), false))
        sources.append(plan.source);
    ASSERT_EQ(sources.size(), 10);
    EXPECT_EQ(sources.first(), QStringLiteral("roku"));
    EXPECT_EQ(sources.at(1), QStringLiteral("samsung"));
    EXPECT_EQ(sources.at(2), QStringLiteral("sony"));
    EXPECT_EQ(sources.at(4), QStringLiteral("vizio"));
    EXPECT_EQ(sources.at(7), QStringLiteral("firetv"));
    EXPECT_EQ(sources.at(8), QStringLiteral("chromecast"));
    EXPECT_EQ(sources.last(), QStringLiteral("bridge"));
}

TEST(RemoteEngine, PairingUnsupportedBrands) {
    RemoteEngine engine(isolatedConfig(), std::make_unique<MemoryStorage>());
    EXPECT_EQ(engine.completePairing(makeProfile(Brand::Roku), QStringLiteral("1234")).message,
              QStringLiteral("Roku TVs do not support pairing."));
    EXPECT_EQ(engine.completePairing(makeProfile(Brand::Tcl), QStringLiteral("1234")).message,
              QStringLiteral("TCL TVs do not support pairing."));
}

TEST(RemoteEngine, SonyKeyEntryResumesPendingCommand) {
    FakeHttpServer tv([](const FakeHttpRequest &request) -> FakeHttpResponse {
        if (request.header("X-Auth-PSK") != "0000")
            return { 403, {} };
        if (request.path == QLatin1String("/sony/system"))
            return { 200, R"({"result":[{},[{"name":"VolumeUp","value":"VOLUP-CODE"}]]})" };
        return { 200, {}, "text/xml" };
    });
    ASSERT_TRUE(tv.listen());

    EngineConfig config = isolatedConfig();
    config.sony.ports = { tv.port() };
    RemoteEngine engine(config, std::make_unique<MemoryStorage>());
    const TvProfile profile = makeProfile(Brand::Sony);

    const DispatchResult first = engine.dispatch(profile, RemoteCommand::VolumeUp);
    ASSERT_TRUE(first.pairing.has_value());
    EXPECT_EQ(engine.sessions().size(), 1);

    const DispatchResult done = engine.completePairing(profile, QStringLiteral("0000"));
    EXPECT_TRUE(done.ok) << done.message.toStdString();
    EXPECT_EQ(done.message, QStringLiteral("Sony TV paired. Command sent to Sony TV."));
    EXPECT_EQ(engine.sessions().size(), 0);
    EXPECT_EQ(tv.requestLines().last(), QStringLiteral("POST /sony/IRCC"));
    EXPECT_TRUE(tv.requests().last().body.contains("<IRCCCode>VOLUP-CODE</IRCCCode>"));
}

// Sessions are persisted, so check the backing store too
TEST(RemoteEngine, ForgetDropsCredentialsAndSessions) {
    auto storage = std::make_unique<MemoryStorage>();
    MemoryStorage *backing = storage.get();
    RemoteEngine engine(isolatedConfig(), std::move(storage));
    const TvProfile profile = makeProfile(Brand::Vizio);
    const QString key = CredentialStore::cacheKey(profile);

    engine.credentials().setValue(CredentialKind::VizioAuthToken, key, QStringLiteral("tok"));
    engine.credentials().setValue(CredentialKind::SamsungToken, key, QStringLiteral("123"));
    PairingRequest request;
    request.brand = Brand::Vizio;
    request.challenge = VizioPairingChallenge { 1, 7, QStringLiteral("dev") };
    engine.sessions().remember(key, PairingSession { request, RemoteCommand::Mute });

    EXPECT_EQ(engine.forget(profile), 2);
    EXPECT_FALSE(engine.credentials().contains(CredentialKind::VizioAuthToken, key));
    EXPECT_FALSE(engine.sessions().find(key).has_value());

    PairingSessionManager reloaded(backing);
    EXPECT_EQ(reloaded.size(), 0);
    EXPECT_EQ(engine.forget(profile), 0);
}

TEST(RemoteEngine, ScanOfSilentHostFindsNothing) {
    RemoteEngine engine(isolatedConfig(), std::make_unique<MemoryStorage>());
    int streamed = 0;
    QObject::connect(&engine, &RemoteEngine::deviceDiscovered, [&](const DiscoveredDevice &) { ++streamed; });

    ScanOptions options;
    options.prefixes = QStringList();
    options.hosts = { QStringLiteral("127.0.0.1") };
    bool cancelled = true;
    EXPECT_TRUE(engine.scanBlocking(options, &cancelled).isEmpty());
    EXPECT_FALSE(cancelled);
    EXPECT_EQ(streamed, 0);
}

#if QT_CONFIG(ssl)
TEST(RemoteEngine, PinnedSamsungCertificateSurvivesMismatchUntilForgotten) {
    if (!QSslSocket::supportsSsl())
        GTEST_SKIP() << "no TLS backend";

    QSslConfiguration firstTls;
    QSslConfiguration secondTls;
    QSslCertificate firstCert;
    QSslCertificate secondCert;
    ASSERT_TRUE(loadServerTls(QStringLiteral("tv_a"), &firstTls, &firstCert));
    ASSERT_TRUE(loadServerTls(QStringLiteral("tv_b"), &secondTls, &secondCert));

    FakeWsServer tv(QWebSocketServer::SecureMode);
    tv.setSslConfiguration(firstTls);
    ASSERT_TRUE(tv.listen());
    tv.onMessage([](QWebSocket *socket, const QString &) {
        socket->sendTextMessage(QStringLiteral(R"({"event":"ms.channel.connect","data":{"token":"51234567"}})"));
    });

    EngineConfig config = isolatedConfig();
    config.samsung.pinnedTls = true;
    config.samsung.wssPort = tv.port();
    config.samsung.pinnedOpenTimeoutMs = 3000;
    config.samsung.pinnedTokenWaitMs = 300;
    RemoteEngine engine(config, std::make_unique<MemoryStorage>());

    const TvProfile profile = makeProfile(Brand::Samsung);
    const QString key = CredentialStore::cacheKey(profile);

    // First contact pins the leaf certificate.
    const DispatchResult first = engine.dispatch(profile, RemoteCommand::VolumeUp);
    ASSERT_TRUE(first.ok) << first.message.toStdString();
    const QString firstPin = sha256Fingerprint(firstCert.toDer());
    EXPECT_EQ(engine.credentials().value(CredentialKind::SamsungCertificate, key), firstPin);
    EXPECT_EQ(engine.credentials().value(CredentialKind::SamsungToken, key), QStringLiteral("51234567"));
    ASSERT_EQ(tv.messages().size(), 1);

    tv.setSslConfiguration(secondTls);
    for (int i = 0; i < 3; ++i) {
        const DispatchResult result = engine.dispatch(profile, RemoteCommand::VolumeUp);
        EXPECT_FALSE(result.ok);
        EXPECT_EQ(result.message,
                  QStringLiteral("Unable to send Samsung command. "
                                 "Samsung TV certificate fingerprint changed. Re-pair this TV."));
    }
    // No frame reached the replaced peer and nothing was retried without the token.
    EXPECT_EQ(tv.messages().size(), 1);
    EXPECT_EQ(engine.credentials().value(CredentialKind::SamsungToken, key), QStringLiteral("51234567"));
    EXPECT_EQ(engine.credentials().value(CredentialKind::SamsungCertificate, key), firstPin);

    EXPECT_EQ(engine.forget(profile), 2);
    EXPECT_FALSE(engine.credentials().contains(CredentialKind::SamsungCertificate, key));
    EXPECT_FALSE(engine.credentials().contains(CredentialKind::SamsungToken, key));

    // After forgetting, the new certificate is trusted on first use.
    const DispatchResult repaired = engine.dispatch(profile, RemoteCommand::VolumeUp);
    ASSERT_TRUE(repaired.ok) << repaired.message.toStdString();
    EXPECT_EQ(engine.credentials().value(CredentialKind::SamsungCertificate, key),
              sha256Fingerprint(secondCert.toDer()));
}
#endif
