#include <gtest/gtest.h>

#include <QJsonDocument>
#include <QJsonObject>

#include "bridge_adapter.h"
#include "fake_servers.h"
#include "firetv_adapter.h"
#include "panasonic_adapter.h"
#include "philips_adapter.h"
#include "roku_adapter.h"

using namespace tvremote;
using namespace tvremote::test;

TEST(RokuAdapter, PostsKeypressToProfilePort) {
    FakeHttpServer tv([](const FakeHttpRequest &) { return FakeHttpResponse { 200, {} }; });
    ASSERT_TRUE(tv.listen());

    AdapterHarness harness;
    TvProfile profile = harness.profile(Brand::Roku);
    profile.port = tv.port();
    RokuAdapter adapter(harness.context());

    const DispatchResult result = adapter.send(profile, RemoteCommand::VolumeUp);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.message, QStringLiteral("Command sent to Roku TV."));
    EXPECT_EQ(tv.requestLines(), QStringList { QStringLiteral("POST /keypress/VolumeUp") });
}

TEST(RokuAdapter, ReportsRejectedStatus) {
    FakeHttpServer tv([](const FakeHttpRequest &) { return FakeHttpResponse { 503, {} }; });
    ASSERT_TRUE(tv.listen());

    AdapterHarness harness;
    harness.config.roku.port = tv.port();
    RokuAdapter adapter(harness.context());
    EXPECT_EQ(adapter.send(harness.profile(Brand::Roku), RemoteCommand::Mute).message,
              QStringLiteral("Roku rejected command (503)."));
    EXPECT_EQ(tv.requestLines(), QStringList { QStringLiteral("POST /keypress/VolumeMute") });
}

TEST(RokuAdapter, UnmappedCommandMakesNoRequest) {
    FakeHttpServer tv([](const FakeHttpRequest &) { return FakeHttpResponse { 200, {} }; });
    ASSERT_TRUE(tv.listen());

    AdapterHarness harness;
    harness.config.roku.port = tv.port();
    RokuAdapter adapter(harness.context());
    const DispatchResult result = adapter.send(harness.profile(Brand::Roku), RemoteCommand::Numpad);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, QStringLiteral("This command is not mapped for Roku yet."));
    EXPECT_TRUE(tv.requestLines().isEmpty());
}

TEST(PanasonicAdapter, SoapHelpers) {
    EXPECT_EQ(PanasonicAdapter::keyFor(RemoteCommand::Digit4), QStringLiteral("NRC_D4-ONOFF"));
    EXPECT_FALSE(PanasonicAdapter::keyFor(RemoteCommand::Numpad).has_value());
    EXPECT_TRUE(PanasonicAdapter::sendKeyEnvelope(QStringLiteral("NRC_MUTE-ONOFF"))
                    .contains("<X_KeyEvent>NRC_MUTE-ONOFF</X_KeyEvent>"));

    const QString fault = QStringLiteral("<s:Envelope><s:Body><s:Fault><faultstring>\n  UPnPError  </faultstring>"
                                         "<detail>Unauthorized access</detail></s:Fault></s:Body></s:Envelope>");
    EXPECT_TRUE(PanasonicAdapter::isSoapFault(fault));
    EXPECT_FALSE(PanasonicAdapter::isSoapFault(QStringLiteral("<s:Envelope><u:X_SendKeyResponse/></s:Envelope>")));
    EXPECT_EQ(PanasonicAdapter::faultString(fault), QStringLiteral("UPnPError"));
    EXPECT_TRUE(PanasonicAdapter::isAuthorizationFault(QStringLiteral("Session not authorized")));
    EXPECT_FALSE(PanasonicAdapter::isAuthorizationFault(QStringLiteral("Invalid Args")));
}

TEST(PanasonicAdapter, ClassifiesReplies) {
    FakeHttpResponse reply;
    FakeHttpServer tv([&](const FakeHttpRequest &) { return reply; });
    ASSERT_TRUE(tv.listen());

    AdapterHarness harness;
    harness.config.panasonic.port = tv.port();
    PanasonicAdapter adapter(harness.context());
    const TvProfile profile = harness.profile(Brand::Panasonic);

    reply = { 200, "<s:Envelope><s:Body><u:X_SendKeyResponse/></s:Body></s:Envelope>", "text/xml" };
    EXPECT_EQ(adapter.send(profile, RemoteCommand::VolumeUp).message, QStringLiteral("Command sent to Panasonic TV."));
    EXPECT_EQ(tv.requests().last().path, QStringLiteral("/nrc/control_0"));
    EXPECT_TRUE(tv.requests().last().body.contains("NRC_VOLUP-ONOFF"));

    reply = { 500, "<s:Envelope><s:Body><s:Fault><faultstring>Invalid Args</faultstring></s:Fault></s:Body></s:Envelope>",
              "text/xml" };
    EXPECT_EQ(adapter.send(profile, RemoteCommand::VolumeUp).message,
              QStringLiteral("Panasonic TV returned a SOAP fault: Invalid Args"));

    reply = { 200, "<s:Envelope><s:Body><s:Fault><faultstring>Access denied</faultstring></s:Fault></s:Body></s:Envelope>",
              "text/xml" };
    EXPECT_EQ(adapter.send(profile, RemoteCommand::VolumeUp).message,
              QStringLiteral("Panasonic TV denied the command. Enable TV Remote App / Network Remote Control in TV settings."));

    reply = { 400, {}, "text/xml" };
    EXPECT_EQ(adapter.send(profile, RemoteCommand::VolumeUp).message, QStringLiteral("Panasonic TV rejected command (400)."));
}

// Older JointSpace firmware only serves API 1
TEST(PanasonicAdapter, UnmappedCommandMakesNoRequest) {
    FakeHttpServer tv([](const FakeHttpRequest &) { return FakeHttpResponse { 200, {}, "text/xml" }; });
    ASSERT_TRUE(tv.listen());

    AdapterHarness harness;
    harness.config.panasonic.port = tv.port();
    PanasonicAdapter adapter(harness.context());
    const DispatchResult result = adapter.send(harness.profile(Brand::Panasonic), RemoteCommand::Numpad);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, QStringLiteral("This command is not mapped for Panasonic yet."));
    EXPECT_TRUE(tv.requestLines().isEmpty());
}

TEST(PhilipsAdapter, FallsBackThroughApiVersionsAndMethods) {
    FakeHttpServer tv([](const FakeHttpRequest &request) {
        if (request.method == "POST" && request.path == QLatin1String("/1/input/key"))
            return FakeHttpResponse { 200, {} };
        return FakeHttpResponse { 404, {} };
    });
    ASSERT_TRUE(tv.listen());

    AdapterHarness harness;
    harness.config.philips.httpPort = tv.port();
    PhilipsAdapter adapter(harness.context());

    const DispatchResult result = adapter.send(harness.profile(Brand::Philips), RemoteCommand::Power);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.message, QStringLiteral("Command sent to Philips TV."));
    EXPECT_EQ(tv.requestLines(), (QStringList { QStringLiteral("POST /6/input/key"), QStringLiteral("PUT /6/input/key"),
                                               QStringLiteral("POST /1/input/key") }));
    EXPECT_EQ(QJsonDocument::fromJson(tv.requests().last().body).object().value(QStringLiteral("key")).toString(),
              QStringLiteral("Standby"));
}

TEST(PhilipsAdapter, ReportsDeniedAccess) {
    FakeHttpServer tv([](const FakeHttpRequest &) { return FakeHttpResponse { 401, {} }; });
    ASSERT_TRUE(tv.listen());

    AdapterHarness harness;
    harness.config.philips.httpPort = tv.port();
    PhilipsAdapter adapter(harness.context());
    EXPECT_EQ(adapter.send(harness.profile(Brand::Philips), RemoteCommand::Mute).message,
              QStringLiteral("Philips TV denied the command. Enable JointSpace/IP control and pairing on the TV."));
    EXPECT_EQ(tv.requests().size(), 4);
}

// Bridges without a ping route answer 404
TEST(PhilipsAdapter, UnmappedCommandMakesNoRequest) {
    FakeHttpServer tv([](const FakeHttpRequest &) { return FakeHttpResponse { 200, {} }; });
    ASSERT_TRUE(tv.listen());

    AdapterHarness harness;
    harness.config.philips.httpPort = tv.port();
    PhilipsAdapter adapter(harness.context());
    const DispatchResult result = adapter.send(harness.profile(Brand::Philips), RemoteCommand::Numpad);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, QStringLiteral("This command is not mapped for Philips yet."));
    EXPECT_TRUE(tv.requestLines().isEmpty());
}

TEST(BridgeAdapter, PingsThenForwardsCommandByName) {
    FakeHttpServer bridge([](const FakeHttpRequest &request) {
        if (request.path == QLatin1String("/remote/ping"))
            return FakeHttpResponse { 404, {} };
        return FakeHttpResponse { 200, R"({"ok":true})" };
    });
    ASSERT_TRUE(bridge.listen());

    AdapterHarness harness;
    harness.config.bridge.port = bridge.port();
    BridgeAdapter adapter(harness.context());

    const DispatchResult result = adapter.send(harness.profile(Brand::Tcl), RemoteCommand::Digit3);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.message, QStringLiteral("Command sent."));
    EXPECT_EQ(bridge.requestLines(), (QStringList { QStringLiteral("GET /remote/ping"), QStringLiteral("POST /remote/command") }));

    const QJsonObject payload = QJsonDocument::fromJson(bridge.requests().last().body).object();
    EXPECT_EQ(payload.value(QStringLiteral("brand")).toString(), QStringLiteral("tcl"));
    EXPECT_EQ(payload.value(QStringLiteral("command")).toString(), QStringLiteral("DIGIT_3"));
    EXPECT_EQ(payload.value(QStringLiteral("nickname")).toString(), QStringLiteral("Living Room"));
}

TEST(BridgeAdapter, UnreachablePing) {
    AdapterHarness harness;
    BridgeAdapter adapter(harness.context());
    EXPECT_EQ(adapter.send(harness.profile(Brand::Other), RemoteCommand::Power).message,
              QStringLiteral("Unable to reach TV bridge ping endpoint over Wi-Fi."));
}

TEST(FireTvAdapter, DelegatesToBridge) {
    FakeHttpServer bridge([](const FakeHttpRequest &) { return FakeHttpResponse { 200, {} }; });
    ASSERT_TRUE(bridge.listen());

    AdapterHarness harness;
    harness.config.bridge.port = bridge.port();
    FireTvAdapter adapter(harness.context());
    const DispatchResult result = adapter.send(harness.profile(Brand::FireTv), RemoteCommand::Home);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.message, QStringLiteral("Command sent to Fire TV."));
    EXPECT_EQ(QJsonDocument::fromJson(bridge.requests().last().body).object().value(QStringLiteral("brand")).toString(),
              QStringLiteral("firetv"));
}

TEST(FireTvAdapter, ExplainsBridgeRequirement) {
    AdapterHarness harness;
    FireTvAdapter adapter(harness.context());
    const DispatchResult result = adapter.send(harness.profile(Brand::FireTv), RemoteCommand::Home);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, QStringLiteral("Fire TV control requires bridge/ADB integration. "
                                             "Unable to reach TV bridge ping endpoint over Wi-Fi."));
}
