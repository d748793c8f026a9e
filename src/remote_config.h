#pragma once

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

namespace tvremote {

struct SamsungConfig {
    int wsPort = 8001;
    int wssPort = 8002;
    QString appName = QStringLiteral("PhoneRemote");
    int tokenTimeoutMs = 4000;
    int pairingTimeoutMs = 12000;
    // Use the certificate pinned TLS channel instead of the plain socket URLs.
    bool pinnedTls = false;
    int pinnedOpenTimeoutMs = 5000;
    int pinnedTokenWaitMs = 600;
    int probeTimeoutMs = 650;
    int socketProbeTimeoutMs = 700;
};

struct LgConfig {
    int wsPort = 3000;
    int wssPort = 3001;
    int clientKeyTimeoutMs = 6000;
    int pairingTimeoutMs = 15000;
    int probeTimeoutMs = 420;
    int socketProbeTimeoutMs = 900;
};

struct SonyConfig {
    QList<int> ports = { 80, 10000, 443 };
    int requestTimeoutMs = 3200;
    int probePort = 80;
    int probeTimeoutMs = 550;
};

struct VizioEndpoint {
    QString scheme;
    int port = 0;
};

struct VizioConfig {
    QList<VizioEndpoint> endpoints = {
        { QStringLiteral("https"), 7345 },
        { QStringLiteral("https"), 9000 },
        { QStringLiteral("http"), 7345 },
        { QStringLiteral("http"), 9000 },
    };
    QString deviceName = QStringLiteral("TV Remote App");
    int requestTimeoutMs = 3200;
    int probePort = 7345;
    int probeTimeoutMs = 420;
};

struct PanasonicConfig {
    int port = 55000;
    int requestTimeoutMs = 2800;
    int probeTimeoutMs = 500;
};

struct PhilipsConfig {
    int httpPort = 1925;
    int httpsPort = 1926;
    int requestTimeoutMs = 2600;
    int probeTimeoutMs = 500;
};

struct RokuConfig {
    int port = 8060;
    int requestTimeoutMs = 2200;
    int probeTimeoutMs = 500;
};

struct BridgeConfig {
    int port = 8080;
    int pingTimeoutMs = 1200;
    int commandTimeoutMs = 2200;
    int probeTimeoutMs = 360;
};

struct FireTvConfig {
    int descriptorPort = 8009;
    int castPort = 8008;
    int probeTimeoutMs = 500;
};

struct ScannerConfig {
    int maxConcurrency = 28;
    int hostRangeStart = 1;
    int hostRangeEnd = 254;
    QStringList defaultPrefixes = {
        QStringLiteral("192.168.1"),
        QStringLiteral("192.168.0"),
        QStringLiteral("192.168.50"),
        QStringLiteral("10.0.0"),
        QStringLiteral("10.0.1"),
        QStringLiteral("172.20.10"),
    };
    QList<int> genericPorts = { 80, 10000, 1925, 3000, 3001, 7345, 8008, 8009, 8001, 8002, 8060, 8080, 55000 };
    int genericProbeTimeoutMs = 360;
    bool detectLocalPrefix = true;
};

struct StorageConfig {
    // Empty path selects the platform default QSettings location.
    QString path;
};

struct EngineConfig {
    SamsungConfig samsung;
    LgConfig lg;
    SonyConfig sony;
    VizioConfig vizio;
    PanasonicConfig panasonic;
    PhilipsConfig philips;
    RokuConfig roku;
    BridgeConfig bridge;
    FireTvConfig firetv;
    ScannerConfig scanner;
    StorageConfig storage;

    static EngineConfig fromJson(const QJsonObject &root);
    static EngineConfig loadFile(const QString &path, QString *error = nullptr);
};

} // namespace tvremote
