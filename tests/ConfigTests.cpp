#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QFile>
#include <QTemporaryDir>

#include "remote_config.h"

using tvremote::EngineConfig;

TEST(EngineConfig, DefaultsMatchTheTvProtocols) {
    const EngineConfig config;
    EXPECT_EQ(config.samsung.wsPort, 8001);
    EXPECT_EQ(config.samsung.wssPort, 8002);
    EXPECT_EQ(config.lg.wsPort, 3000);
    EXPECT_EQ(config.sony.ports, (QList<int> { 80, 10000, 443 }));
    EXPECT_EQ(config.vizio.endpoints.size(), 4);
    EXPECT_EQ(config.panasonic.port, 55000);
    EXPECT_EQ(config.roku.port, 8060);
    EXPECT_EQ(config.bridge.port, 8080);
    EXPECT_EQ(config.scanner.maxConcurrency, 28);
    EXPECT_FALSE(config.samsung.pinnedTls);
}

TEST(EngineConfig, FromJsonOverridesAndValidates) {
    const QByteArray json = R"({
        "samsung": { "wsPort": 9001, "wssPort": 70000, "pinnedTls": true, "appName": "  " },
        "sony": { "ports": [10000, 0, 10000, 80] },
        "vizio": { "endpoints": [ { "scheme": "ftp", "port": 21 }, { "scheme": "HTTP", "port": 7345 } ] },
        "scanner": { "maxConcurrency": 8, "defaultPrefixes": ["10.1.1", ""], "detectLocalPrefix": false },
        "storage": { "path": "/tmp/tvremote.ini" }
    })";
    const EngineConfig config = EngineConfig::fromJson(QJsonDocument::fromJson(json).object());

    EXPECT_EQ(config.samsung.wsPort, 9001);
    EXPECT_EQ(config.samsung.wssPort, 8002);
    EXPECT_TRUE(config.samsung.pinnedTls);
    EXPECT_EQ(config.samsung.appName, QStringLiteral("PhoneRemote"));
    EXPECT_EQ(config.sony.ports, (QList<int> { 10000, 80 }));
    ASSERT_EQ(config.vizio.endpoints.size(), 1);
    EXPECT_EQ(config.vizio.endpoints.first().scheme, QStringLiteral("http"));
    EXPECT_EQ(config.vizio.endpoints.first().port, 7345);
    EXPECT_EQ(config.scanner.maxConcurrency, 8);
    EXPECT_EQ(config.scanner.defaultPrefixes, QStringList { QStringLiteral("10.1.1") });
    EXPECT_FALSE(config.scanner.detectLocalPrefix);
    EXPECT_EQ(config.storage.path, QStringLiteral("/tmp/tvremote.ini"));
    EXPECT_EQ(config.lg.wsPort, 3000);
}

TEST(EngineConfig, LoadFileReportsErrorsAndKeepsDefaults) {
    QString error;
    const EngineConfig missing = EngineConfig::loadFile(QStringLiteral("/nonexistent/tvremote.json"), &error);
    EXPECT_FALSE(error.isEmpty());
    EXPECT_EQ(missing.roku.port, 8060);

    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("broken.json"));
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    EngineConfig::loadFile(path, &error);
    EXPECT_TRUE(error.startsWith(QStringLiteral("Invalid config file")));

    ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(R"({"roku":{"port":8061}})");
    file.close();
    const EngineConfig loaded = EngineConfig::loadFile(path, &error);
    EXPECT_TRUE(error.isEmpty());
    EXPECT_EQ(loaded.roku.port, 8061);
}
