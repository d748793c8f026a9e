#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "fake_servers.h"
#include "remote_engine.h"
#include "vizio_adapter.h"

using namespace tvremote;
using namespace tvremote::test;

namespace {

// SmartCast TV that issues tok-1 after PIN 1234 and accepts only that token.
struct FakeVizio {
    QString validToken;
    QString issuedToken = QStringLiteral("tok-1");
    bool grantOnStart = false;

    FakeHttpResponse handle(const FakeHttpRequest &request)
    {
        const QJsonObject body = QJsonDocument::fromJson(request.body).object();
        if (request.path == QLatin1String("/pairing/start")) {
            if (grantOnStart) {
                validToken = issuedToken;
                return { 200, QByteArrayLiteral(R"({"STATUS":{"RESULT":"SUCCESS"},"ITEM":{"AUTH_TOKEN":")")
                                  + issuedToken.toUtf8() + QByteArrayLiteral(R"("}})") };
            }
            return { 200, R"({"STATUS":{"RESULT":"SUCCESS"},"ITEM":{"PAIRING_REQ_TOKEN":"48213","CHALLENGE_TYPE":1}})" };
        }
        if (request.path == QLatin1String("/pairing/pair")) {
            if (body.value(QStringLiteral("RESPONSE_VALUE")).toString() != QLatin1String("1234")
                || body.value(QStringLiteral("PAIRING_REQ_TOKEN")).toInteger() != 48213) {
                return { 200, R"({"STATUS":{"RESULT":"INVALID_PIN","DETAIL":"Wrong PIN"}})" };
            }
            validToken = issuedToken;
            return { 200, QByteArrayLiteral(R"({"STATUS":{"RESULT":"SUCCESS"},"ITEM":{"AUTH_TOKEN":")")
                              + issuedToken.toUtf8() + QByteArrayLiteral(R"("}})") };
        }
        if (request.path == QLatin1String("/key_command/")) {
            if (validToken.isEmpty() || request.header("AUTH") != validToken.toUtf8())
                return { 200, R"({"STATUS":{"RESULT":"INVALID_AUTH_TOKEN"}})" };
            return { 200, R"({"STATUS":{"RESULT":"SUCCESS"}})" };
        }
        return { 404, {} };
    }
};

EngineConfig vizioConfig(quint16 port)
{
    EngineConfig config = isolatedConfig();
    config.vizio.endpoints = { { QStringLiteral("http"), port } };
    return config;
}

TvProfile vizioProfile()
{
    TvProfile profile;
    profile.id = QStringLiteral("den");
    profile.brand = Brand::Vizio;
    profile.nickname = QStringLiteral("Den");
    profile.host = QStringLiteral("127.0.0.1");
    return profile;
}

} // namespace

TEST(VizioAdapter, StaticHelpers) {
    TvProfile profile;
    profile.id = QStringLiteral("living room/1");
    EXPECT_EQ(VizioAdapter::deviceIdFor(profile), QStringLiteral("tvremote-livingroom1"));

    const QJsonObject payload = QJsonDocument::fromJson(R"({"ITEM":{"auth_token":"abc"}})").object();
    EXPECT_EQ(VizioAdapter::itemValue(payload, QStringLiteral("AUTH_TOKEN")).toString(), QStringLiteral("abc"));
    EXPECT_TRUE(VizioAdapter::itemValue(payload, QStringLiteral("DEVICE_ID")).isUndefined());

    EXPECT_TRUE(VizioAdapter::isPairingRequiredResult(QStringLiteral("INVALID_AUTH_TOKEN")));
    EXPECT_FALSE(VizioAdapter::isPairingRequiredResult(QStringLiteral("BLOCKED")));
    ASSERT_TRUE(VizioAdapter::keyFor(RemoteCommand::Digit7).has_value());
    EXPECT_EQ(VizioAdapter::keyFor(RemoteCommand::Digit7)->code, 55);
}

TEST(VizioAdapter, PinPairingResumesTheCommand) {
    FakeVizio vizio;
    FakeHttpServer tv([&](const FakeHttpRequest &request) { return vizio.handle(request); });
    ASSERT_TRUE(tv.listen());

    RemoteEngine engine(vizioConfig(tv.port()), std::make_unique<MemoryStorage>());
    const TvProfile profile = vizioProfile();

    const DispatchResult first = engine.dispatch(profile, RemoteCommand::Power);
    EXPECT_FALSE(first.ok);
    ASSERT_TRUE(first.pairing.has_value());
    EXPECT_EQ(first.message, QStringLiteral("Enter the PIN shown on your Vizio TV to finish pairing."));
    const auto *challenge = std::get_if<VizioPairingChallenge>(&first.pairing->challenge);
    ASSERT_NE(challenge, nullptr);
    EXPECT_EQ(challenge->pairingToken, 48213);
    EXPECT_EQ(challenge->deviceId, QStringLiteral("tvremote-den"));

    const DispatchResult paired = engine.completePairing(profile, QStringLiteral("1234"));
    EXPECT_TRUE(paired.ok) << paired.message.toStdString();
    EXPECT_EQ(paired.message, QStringLiteral("Vizio pairing complete. Command sent to Vizio TV."));
    EXPECT_EQ(engine.credentials().value(CredentialKind::VizioAuthToken, CredentialStore::cacheKey(profile)),
              QStringLiteral("tok-1"));
    EXPECT_FALSE(engine.sessions().find(CredentialStore::cacheKey(profile)).has_value());

    const FakeHttpRequest &resumed = tv.requests().last();
    EXPECT_EQ(resumed.path, QStringLiteral("/key_command/"));
    EXPECT_EQ(resumed.header("AUTH"), QByteArrayLiteral("tok-1"));
    const QJsonObject key = QJsonDocument::fromJson(resumed.body).object().value(QStringLiteral("KEYLIST")).toArray().at(0).toObject();
    EXPECT_EQ(key.value(QStringLiteral("CODESET")).toInt(), 11);
    EXPECT_EQ(key.value(QStringLiteral("CODE")).toInt(), 2);

    const int before = tv.requests().size();
    const DispatchResult again = engine.dispatch(profile, RemoteCommand::Power);
    EXPECT_TRUE(again.ok);
    EXPECT_FALSE(again.pairing.has_value());
    EXPECT_EQ(tv.requests().size(), before + 1);
}

// Some firmware hands out the token from /pairing/start without a PIN
TEST(VizioAdapter, TokenFromPairingStartSendsWithoutPin) {
    FakeVizio vizio;
    vizio.grantOnStart = true;
    FakeHttpServer tv([&](const FakeHttpRequest &request) { return vizio.handle(request); });
    ASSERT_TRUE(tv.listen());

    AdapterHarness harness;
    harness.config.vizio.endpoints = { { QStringLiteral("http"), tv.port() } };
    const TvProfile profile = harness.profile(Brand::Vizio);
    const QString key = CredentialStore::cacheKey(profile);

    VizioAdapter adapter(harness.context());
    const DispatchResult result = adapter.send(profile, RemoteCommand::Mute);
    EXPECT_TRUE(result.ok) << result.message.toStdString();
    EXPECT_EQ(result.message, QStringLiteral("Command sent to Vizio TV."));
    EXPECT_FALSE(result.pairing.has_value());
    EXPECT_EQ(harness.credentials.value(CredentialKind::VizioAuthToken, key), QStringLiteral("tok-1"));
    EXPECT_FALSE(harness.sessions.find(key).has_value());
    EXPECT_EQ(tv.requestLines(), (QStringList { QStringLiteral("PUT /pairing/start"), QStringLiteral("PUT /key_command/") }));
    EXPECT_EQ(tv.requests().last().header("AUTH"), QByteArrayLiteral("tok-1"));
}

// Rejected token: cleared, then one retry without it, which needs a new PIN
TEST(VizioAdapter, StaleTokenStartsPairingAgain) {
    FakeVizio vizio;
    FakeHttpServer tv([&](const FakeHttpRequest &request) { return vizio.handle(request); });
    ASSERT_TRUE(tv.listen());

    AdapterHarness harness;
    harness.config.vizio.endpoints = { { QStringLiteral("http"), tv.port() } };
    const TvProfile profile = harness.profile(Brand::Vizio);
    const QString key = CredentialStore::cacheKey(profile);
    harness.credentials.setValue(CredentialKind::VizioAuthToken, key, QStringLiteral("expired"));

    VizioAdapter adapter(harness.context());
    const DispatchResult result = adapter.send(profile, RemoteCommand::VolumeUp);
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.pairing.has_value());
    EXPECT_FALSE(harness.credentials.contains(CredentialKind::VizioAuthToken, key));
    EXPECT_EQ(tv.requestLines(), (QStringList { QStringLiteral("PUT /key_command/"), QStringLiteral("PUT /pairing/start") }));

    const std::optional<PairingSession> session = harness.sessions.find(key);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->pendingCommand, RemoteCommand::VolumeUp);
}

TEST(VizioAdapter, RejectsMalformedPin) {
    AdapterHarness harness;
    VizioAdapter adapter(harness.context());
    const TvProfile profile = harness.profile(Brand::Vizio);

    EXPECT_EQ(adapter.completePairing(profile, QStringLiteral("12a4"), std::nullopt).message,
              QStringLiteral("Enter a valid numeric PIN from your Vizio TV."));
    EXPECT_EQ(adapter.completePairing(profile, QStringLiteral("1234"), std::nullopt).message,
              QStringLiteral("No Vizio pairing session found. Start pairing again."));
}

TEST(VizioAdapter, WrongPinKeepsTheSession) {
    FakeVizio vizio;
    FakeHttpServer tv([&](const FakeHttpRequest &request) { return vizio.handle(request); });
    ASSERT_TRUE(tv.listen());

    AdapterHarness harness;
    harness.config.vizio.endpoints = { { QStringLiteral("http"), tv.port() } };
    const TvProfile profile = harness.profile(Brand::Vizio);
    VizioAdapter adapter(harness.context());
    ASSERT_TRUE(adapter.send(profile, RemoteCommand::Power).pairing.has_value());

    const DispatchResult result = adapter.completePairing(profile, QStringLiteral("9999"), std::nullopt);
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.message.startsWith(QStringLiteral("Vizio pairing failed.")));
    EXPECT_TRUE(result.message.contains(QStringLiteral("INVALID_PIN")));
    EXPECT_TRUE(harness.sessions.find(CredentialStore::cacheKey(profile)).has_value());
}

TEST(VizioAdapter, UnmappedNavigationKeyMakesNoRequest) {
    FakeVizio vizio;
    FakeHttpServer tv([&](const FakeHttpRequest &request) { return vizio.handle(request); });
    ASSERT_TRUE(tv.listen());

    AdapterHarness harness;
    harness.config.vizio.endpoints = { { QStringLiteral("http"), tv.port() } };
    VizioAdapter adapter(harness.context());
    const DispatchResult result = adapter.send(harness.profile(Brand::Vizio), RemoteCommand::Up);
    EXPECT_EQ(result.message, QStringLiteral("This command is not mapped for Vizio yet."));
    EXPECT_TRUE(tv.requests().isEmpty());
}
