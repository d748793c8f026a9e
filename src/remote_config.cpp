#include "remote_config.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QVariant>

Q_LOGGING_CATEGORY(configLog, "tvremote.config");

namespace tvremote {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

int readPort(const QJsonObject &obj, const QString &key, int fallback)
{
    const int value = readInt(obj, key, fallback);
    return (value > 0 && value <= 65535) ? value : fallback;
}

int readTimeout(const QJsonObject &obj, const QString &key, int fallback)
{
    const int value = readInt(obj, key, fallback);
    return value > 0 ? value : fallback;
}

bool readBool(const QJsonObject &obj, const QString &key, bool fallback)
{
    const QJsonValue value = obj.value(key);
    return value.isBool() ? value.toBool() : fallback;
}

QString readString(const QJsonObject &obj, const QString &key, const QString &fallback)
{
    const QString value = obj.value(key).toString().trimmed();
    return value.isEmpty() ? fallback : value;
}

QList<int> readPortList(const QJsonObject &obj, const QString &key, const QList<int> &fallback)
{
    if (!obj.value(key).isArray())
        return fallback;
    QList<int> out;
    for (const QJsonValue &value : obj.value(key).toArray()) {
        const int port = value.toInt();
        if (port > 0 && port <= 65535 && !out.contains(port))
            out.append(port);
    }
    return out.isEmpty() ? fallback : out;
}

QStringList readStringList(const QJsonObject &obj, const QString &key, const QStringList &fallback)
{
    if (!obj.value(key).isArray())
        return fallback;
    QStringList out;
    for (const QJsonValue &value : obj.value(key).toArray()) {
        const QString text = value.toString().trimmed();
        if (!text.isEmpty())
            out.append(text);
    }
    return out.isEmpty() ? fallback : out;
}

QList<VizioEndpoint> readVizioEndpoints(const QJsonObject &obj, const QList<VizioEndpoint> &fallback)
{
    const QJsonValue value = obj.value(QStringLiteral("endpoints"));
    if (!value.isArray())
        return fallback;
    QList<VizioEndpoint> out;
    for (const QJsonValue &entry : value.toArray()) {
        const QJsonObject endpointObj = entry.toObject();
        VizioEndpoint endpoint;
        endpoint.scheme = endpointObj.value(QStringLiteral("scheme")).toString().trimmed().toLower();
        endpoint.port = readPort(endpointObj, QStringLiteral("port"), 0);
        if ((endpoint.scheme == QLatin1String("http") || endpoint.scheme == QLatin1String("https"))
            && endpoint.port > 0) {
            out.append(endpoint);
        }
    }
    return out.isEmpty() ? fallback : out;
}

} // namespace

EngineConfig EngineConfig::fromJson(const QJsonObject &root)
{
    EngineConfig config;

    const QJsonObject samsung = root.value(QStringLiteral("samsung")).toObject();
    config.samsung.wsPort = readPort(samsung, QStringLiteral("wsPort"), config.samsung.wsPort);
    config.samsung.wssPort = readPort(samsung, QStringLiteral("wssPort"), config.samsung.wssPort);
    config.samsung.appName = readString(samsung, QStringLiteral("appName"), config.samsung.appName);
    config.samsung.tokenTimeoutMs = readTimeout(samsung, QStringLiteral("tokenTimeoutMs"), config.samsung.tokenTimeoutMs);
    config.samsung.pairingTimeoutMs = readTimeout(samsung, QStringLiteral("pairingTimeoutMs"), config.samsung.pairingTimeoutMs);
    config.samsung.pinnedTls = readBool(samsung, QStringLiteral("pinnedTls"), config.samsung.pinnedTls);
    config.samsung.pinnedOpenTimeoutMs = readTimeout(samsung, QStringLiteral("pinnedOpenTimeoutMs"), config.samsung.pinnedOpenTimeoutMs);
    config.samsung.pinnedTokenWaitMs = readTimeout(samsung, QStringLiteral("pinnedTokenWaitMs"), config.samsung.pinnedTokenWaitMs);
    config.samsung.probeTimeoutMs = readTimeout(samsung, QStringLiteral("probeTimeoutMs"), config.samsung.probeTimeoutMs);
    config.samsung.socketProbeTimeoutMs = readTimeout(samsung, QStringLiteral("socketProbeTimeoutMs"), config.samsung.socketProbeTimeoutMs);

    const QJsonObject lg = root.value(QStringLiteral("lg")).toObject();
    config.lg.wsPort = readPort(lg, QStringLiteral("wsPort"), config.lg.wsPort);
    config.lg.wssPort = readPort(lg, QStringLiteral("wssPort"), config.lg.wssPort);
    config.lg.clientKeyTimeoutMs = readTimeout(lg, QStringLiteral("clientKeyTimeoutMs"), config.lg.clientKeyTimeoutMs);
    config.lg.pairingTimeoutMs = readTimeout(lg, QStringLiteral("pairingTimeoutMs"), config.lg.pairingTimeoutMs);
    config.lg.probeTimeoutMs = readTimeout(lg, QStringLiteral("probeTimeoutMs"), config.lg.probeTimeoutMs);
    config.lg.socketProbeTimeoutMs = readTimeout(lg, QStringLiteral("socketProbeTimeoutMs"), config.lg.socketProbeTimeoutMs);

    const QJsonObject sony = root.value(QStringLiteral("sony")).toObject();
    config.sony.ports = readPortList(sony, QStringLiteral("ports"), config.sony.ports);
    config.sony.requestTimeoutMs = readTimeout(sony, QStringLiteral("requestTimeoutMs"), config.sony.requestTimeoutMs);
    config.sony.probePort = readPort(sony, QStringLiteral("probePort"), config.sony.probePort);
    config.sony.probeTimeoutMs = readTimeout(sony, QStringLiteral("probeTimeoutMs"), config.sony.probeTimeoutMs);

    const QJsonObject vizio = root.value(QStringLiteral("vizio")).toObject();
    config.vizio.endpoints = readVizioEndpoints(vizio, config.vizio.endpoints);
    config.vizio.deviceName = readString(vizio, QStringLiteral("deviceName"), config.vizio.deviceName);
    config.vizio.requestTimeoutMs = readTimeout(vizio, QStringLiteral("requestTimeoutMs"), config.vizio.requestTimeoutMs);
    config.vizio.probePort = readPort(vizio, QStringLiteral("probePort"), config.vizio.probePort);
    config.vizio.probeTimeoutMs = readTimeout(vizio, QStringLiteral("probeTimeoutMs"), config.vizio.probeTimeoutMs);

    const QJsonObject panasonic = root.value(QStringLiteral("panasonic")).toObject();
    config.panasonic.port = readPort(panasonic, QStringLiteral("port"), config.panasonic.port);
    config.panasonic.requestTimeoutMs = readTimeout(panasonic, QStringLiteral("requestTimeoutMs"), config.panasonic.requestTimeoutMs);
    config.panasonic.probeTimeoutMs = readTimeout(panasonic, QStringLiteral("probeTimeoutMs"), config.panasonic.probeTimeoutMs);

    const QJsonObject philips = root.value(QStringLiteral("philips")).toObject();
    config.philips.httpPort = readPort(philips, QStringLiteral("httpPort"), config.philips.httpPort);
    config.philips.httpsPort = readPort(philips, QStringLiteral("httpsPort"), config.philips.httpsPort);
    config.philips.requestTimeoutMs = readTimeout(philips, QStringLiteral("requestTimeoutMs"), config.philips.requestTimeoutMs);
    config.philips.probeTimeoutMs = readTimeout(philips, QStringLiteral("probeTimeoutMs"), config.philips.probeTimeoutMs);

    const QJsonObject roku = root.value(QStringLiteral("roku")).toObject();
    config.roku.port = readPort(roku, QStringLiteral("port"), config.roku.port);
    config.roku.requestTimeoutMs = readTimeout(roku, QStringLiteral("requestTimeoutMs"), config.roku.requestTimeoutMs);
    config.roku.probeTimeoutMs = readTimeout(roku, QStringLiteral("probeTimeoutMs"), config.roku.probeTimeoutMs);

    const QJsonObject bridge = root.value(QStringLiteral("bridge")).toObject();
    config.bridge.port = readPort(bridge, QStringLiteral("port"), config.bridge.port);
    config.bridge.pingTimeoutMs = readTimeout(bridge, QStringLiteral("pingTimeoutMs"), config.bridge.pingTimeoutMs);
    config.bridge.commandTimeoutMs = readTimeout(bridge, QStringLiteral("commandTimeoutMs"), config.bridge.commandTimeoutMs);
    config.bridge.probeTimeoutMs = readTimeout(bridge, QStringLiteral("probeTimeoutMs"), config.bridge.probeTimeoutMs);

    const QJsonObject firetv = root.value(QStringLiteral("firetv")).toObject();
    config.firetv.descriptorPort = readPort(firetv, QStringLiteral("descriptorPort"), config.firetv.descriptorPort);
    config.firetv.castPort = readPort(firetv, QStringLiteral("castPort"), config.firetv.castPort);
    config.firetv.probeTimeoutMs = readTimeout(firetv, QStringLiteral("probeTimeoutMs"), config.firetv.probeTimeoutMs);

    const QJsonObject scanner = root.value(QStringLiteral("scanner")).toObject();
    config.scanner.maxConcurrency = readTimeout(scanner, QStringLiteral("maxConcurrency"), config.scanner.maxConcurrency);
    config.scanner.hostRangeStart = readInt(scanner, QStringLiteral("hostRangeStart"), config.scanner.hostRangeStart);
    config.scanner.hostRangeEnd = readInt(scanner, QStringLiteral("hostRangeEnd"), config.scanner.hostRangeEnd);
    config.scanner.defaultPrefixes = readStringList(scanner, QStringLiteral("defaultPrefixes"), config.scanner.defaultPrefixes);
    config.scanner.genericPorts = readPortList(scanner, QStringLiteral("genericPorts"), config.scanner.genericPorts);
    config.scanner.genericProbeTimeoutMs = readTimeout(scanner, QStringLiteral("genericProbeTimeoutMs"), config.scanner.genericProbeTimeoutMs);
    config.scanner.detectLocalPrefix = readBool(scanner, QStringLiteral("detectLocalPrefix"), config.scanner.detectLocalPrefix);

    const QJsonObject storage = root.value(QStringLiteral("storage")).toObject();
    config.storage.path = storage.value(QStringLiteral("path")).toString().trimmed();

    return config;
}

EngineConfig EngineConfig::loadFile(const QString &path, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("Cannot open config file %1: %2").arg(path, file.errorString());
        qCWarning(configLog) << "using defaults, cannot open" << path << file.errorString();
        return EngineConfig();
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error)
            *error = QStringLiteral("Invalid config file %1: %2").arg(path, parseError.errorString());
        qCWarning(configLog) << "using defaults, invalid JSON in" << path << parseError.errorString();
        return EngineConfig();
    }

    if (error)
        error->clear();
    return fromJson(doc.object());
}

} // namespace tvremote
