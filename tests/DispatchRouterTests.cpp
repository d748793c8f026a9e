#include <gtest/gtest.h>

#include "dispatch_router.h"
#include "fake_servers.h"
#include "remote_engine.h"
#include "roku_adapter.h"

using namespace tvremote;
using namespace tvremote::test;

namespace {

TvProfile unbrandedProfile(Brand brand)
{
    TvProfile profile;
    profile.id = QStringLiteral("bedroom");
    profile.brand = brand;
    profile.nickname = QStringLiteral("Bedroom");
    profile.host = QStringLiteral("127.0.0.1");
    return profile;
}

} // namespace

TEST(DispatchRouter, BrandClassification) {
    EXPECT_FALSE(DispatchRouter::hasDedicatedProtocol(Brand::Tcl));
    EXPECT_FALSE(DispatchRouter::hasDedicatedProtocol(Brand::Other));
    EXPECT_TRUE(DispatchRouter::hasDedicatedProtocol(Brand::FireTv));

    const QList<Brand> priority = DispatchRouter::fallbackPriority();
    ASSERT_EQ(priority.size(), 8);
    EXPECT_EQ(priority.first(), Brand::Samsung);
    EXPECT_EQ(priority.last(), Brand::FireTv);
    EXPECT_FALSE(priority.contains(Brand::Tcl));
}

TEST(DispatchRouter, RegisteringTwiceReplacesTheAdapter) {
    AdapterHarness harness;
    DispatchRouter router(harness.context().http);
    EXPECT_EQ(router.adapterFor(Brand::Roku), nullptr);

    auto first = std::make_unique<RokuAdapter>(harness.context());
    auto second = std::make_unique<RokuAdapter>(harness.context());
    BrandAdapter *replacement = second.get();
    router.registerAdapter(std::move(first));
    router.registerAdapter(std::move(second));
    router.registerAdapter(nullptr);
    EXPECT_EQ(router.adapterFor(Brand::Roku), replacement);
    EXPECT_EQ(router.adapterFor(Brand::Lg), nullptr);
}

TEST(DispatchRouter, UndeclaredBrandUsesFingerprintedProtocol) {
    FakeHttpServer roku([](const FakeHttpRequest &request) {
        if (request.path == QLatin1String("/query/device-info"))
            return FakeHttpResponse { 200, "<device-info><friendly-device-name>Den Roku</friendly-device-name></device-info>",
                                      "text/xml" };
        return FakeHttpResponse { 200, {} };
    });
    ASSERT_TRUE(roku.listen());

    EngineConfig config = isolatedConfig();
    config.roku.port = roku.port();
    RemoteEngine engine(config, std::make_unique<MemoryStorage>());

    EXPECT_EQ(engine.router().detectBrands(QStringLiteral("127.0.0.1")), QList<Brand> { Brand::Roku });

    const DispatchResult result = engine.dispatch(unbrandedProfile(Brand::Tcl), RemoteCommand::Home);
    EXPECT_TRUE(result.ok) << result.message.toStdString();
    EXPECT_EQ(result.message, QStringLiteral("Command sent to Roku TV."));
    EXPECT_EQ(roku.requestLines().last(), QStringLiteral("POST /keypress/Home"));
}

// Roku fingerprint matches but the keypress fails
TEST(DispatchRouter, FailedProtocolFallsBackToBridge) {
    FakeHttpServer roku([](const FakeHttpRequest &request) {
        if (request.path == QLatin1String("/query/device-info"))
            return FakeHttpResponse { 200, "<device-info/>", "text/xml" };
        return FakeHttpResponse { 500, {} };
    });
    ASSERT_TRUE(roku.listen());
    FakeHttpServer bridge([](const FakeHttpRequest &) { return FakeHttpResponse { 200, {} }; });
    ASSERT_TRUE(bridge.listen());

    EngineConfig config = isolatedConfig();
    config.roku.port = roku.port();
    config.bridge.port = bridge.port();
    RemoteEngine engine(config, std::make_unique<MemoryStorage>());

    const DispatchResult result = engine.dispatch(unbrandedProfile(Brand::Other), RemoteCommand::Power);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.message, QStringLiteral("Command sent."));
    EXPECT_EQ(bridge.requestLines(), (QStringList { QStringLiteral("GET /remote/ping"), QStringLiteral("POST /remote/command") }));
}

// A fingerprinted Fire TV already delegated to the bridge, so the bridge
// is not asked a second time
TEST(DispatchRouter, BridgeSeesCommandOnceAfterFireTvAttempt) {
    FakeHttpServer stick([](const FakeHttpRequest &request) {
        if (request.path == QLatin1String("/ssdp/device-desc.xml"))
            return FakeHttpResponse { 200, "<root><device><manufacturer>Amazon</manufacturer>"
                                           "<modelName>AFTMM</modelName></device></root>", "text/xml" };
        return FakeHttpResponse { 404, {} };
    });
    ASSERT_TRUE(stick.listen());
    FakeHttpServer bridge([](const FakeHttpRequest &request) {
        if (request.path == QLatin1String("/remote/ping"))
            return FakeHttpResponse { 200, {} };
        return FakeHttpResponse { 503, {} };
    });
    ASSERT_TRUE(bridge.listen());

    EngineConfig config = isolatedConfig();
    config.firetv.descriptorPort = stick.port();
    config.bridge.port = bridge.port();
    RemoteEngine engine(config, std::make_unique<MemoryStorage>());
    ASSERT_EQ(engine.router().detectBrands(QStringLiteral("127.0.0.1")), QList<Brand> { Brand::FireTv });

    const DispatchResult result = engine.dispatch(unbrandedProfile(Brand::Other), RemoteCommand::Power);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, QStringLiteral("No supported TV protocol responded. Fire TV control requires "
                                             "bridge/ADB integration. TV bridge rejected command (503)."));
    EXPECT_EQ(bridge.requestLines().count(QStringLiteral("POST /remote/command")), 1);
}

TEST(DispatchRouter, NothingResponds) {
    RemoteEngine engine(isolatedConfig(), std::make_unique<MemoryStorage>());
    const DispatchResult result = engine.dispatch(unbrandedProfile(Brand::Tcl), RemoteCommand::Power);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, QStringLiteral("No supported TV protocol responded. "
                                             "Unable to reach TV bridge ping endpoint over Wi-Fi."));
}

TEST(DispatchRouter, MissingHost) {
    RemoteEngine engine(isolatedConfig(), std::make_unique<MemoryStorage>());
    TvProfile profile = unbrandedProfile(Brand::Tcl);
    profile.host.reset();
    EXPECT_EQ(engine.dispatch(profile, RemoteCommand::Power).message, QStringLiteral("No TV host configured yet."));

    profile.brand = Brand::Roku;
    EXPECT_EQ(engine.dispatch(profile, RemoteCommand::Power).message, QStringLiteral("No TV host configured yet."));
}
