#include "bridge_adapter.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(bridgeLog, "tvremote.adapters.bridge");

namespace tvremote {

BridgeAdapter::BridgeAdapter(const AdapterContext &context)
    : BrandAdapter(context)
{
}

QString BridgeAdapter::commandName(RemoteCommand command)
{
    switch (command) {
    case RemoteCommand::Power: return QStringLiteral("POWER");
    case RemoteCommand::Input: return QStringLiteral("INPUT");
    case RemoteCommand::Up: return QStringLiteral("UP");
    case RemoteCommand::Down: return QStringLiteral("DOWN");
    case RemoteCommand::Left: return QStringLiteral("LEFT");
    case RemoteCommand::Right: return QStringLiteral("RIGHT");
    case RemoteCommand::Ok: return QStringLiteral("OK");
    case RemoteCommand::Back: return QStringLiteral("BACK");
    case RemoteCommand::Home: return QStringLiteral("HOME");
    case RemoteCommand::Settings: return QStringLiteral("SETTINGS");
    case RemoteCommand::VolumeUp: return QStringLiteral("VOLUME_UP");
    case RemoteCommand::VolumeDown: return QStringLiteral("VOLUME_DOWN");
    case RemoteCommand::ChannelUp: return QStringLiteral("CHANNEL_UP");
    case RemoteCommand::ChannelDown: return QStringLiteral("CHANNEL_DOWN");
    case RemoteCommand::Mute: return QStringLiteral("MUTE");
    case RemoteCommand::Previous: return QStringLiteral("PREVIOUS");
    case RemoteCommand::PlayPause: return QStringLiteral("PLAY_PAUSE");
    case RemoteCommand::Next: return QStringLiteral("NEXT");
    case RemoteCommand::Numpad: return QStringLiteral("NUMPAD");
    case RemoteCommand::Digit0:
    case RemoteCommand::Digit1:
    case RemoteCommand::Digit2:
    case RemoteCommand::Digit3:
    case RemoteCommand::Digit4:
    case RemoteCommand::Digit5:
    case RemoteCommand::Digit6:
    case RemoteCommand::Digit7:
    case RemoteCommand::Digit8:
    case RemoteCommand::Digit9:
        return QStringLiteral("DIGIT_%1").arg(static_cast<int>(command) - static_cast<int>(RemoteCommand::Digit0));
    case RemoteCommand::NumpadBackspace: return QStringLiteral("NUMPAD_BACKSPACE");
    case RemoteCommand::NumpadEnter: return QStringLiteral("NUMPAD_ENTER");
    }
    return QString();
}

DispatchResult BridgeAdapter::send(const TvProfile &profile, RemoteCommand command)
{
    const QString host = profile.hostOrEmpty();
    if (host.isEmpty())
        return missingHost();

    const BridgeConfig &cfg = config().bridge;
    const int port = profile.port.value_or(cfg.port);

    const HttpResult ping = http().get(makeUrl(QStringLiteral("http"), host, port, QStringLiteral("/remote/ping")),
                                       cfg.pingTimeoutMs);
    if (!ping.hasResponse()) {
        qCDebug(bridgeLog) << "ping failed for" << host << ping.error;
        return DispatchResult::failure(QStringLiteral("Unable to reach TV bridge ping endpoint over Wi-Fi."));
    }
    // Older bridges have no ping route; a 404 still proves something is listening.
    if (!ping.ok && ping.statusCode != 404)
        return DispatchResult::failure(QStringLiteral("TV bridge ping failed (%1).").arg(ping.statusCode));

    QJsonObject payload;
    payload.insert(QStringLiteral("brand"), brandId(profile.brand));
    payload.insert(QStringLiteral("command"), commandName(command));
    payload.insert(QStringLiteral("nickname"), profile.nickname);

    const HttpResult result = http().postJson(makeUrl(QStringLiteral("http"), host, port, QStringLiteral("/remote/command")),
                                              QJsonDocument(payload).toJson(QJsonDocument::Compact),
                                              cfg.commandTimeoutMs);
    if (result.ok)
        return DispatchResult::success(QStringLiteral("Command sent."));
    if (result.hasResponse())
        return DispatchResult::failure(QStringLiteral("TV bridge rejected command (%1).").arg(result.statusCode));

    qCWarning(bridgeLog) << "command failed for" << host << result.error;
    return DispatchResult::failure(
        QStringLiteral("Unable to reach TV bridge over Wi-Fi. %1").arg(describeError(result.error)));
}

ProbePlan BridgeAdapter::probePlan(const QString &host, bool explicitHost) const
{
    Q_UNUSED(explicitHost);

    const BridgeConfig &cfg = config().bridge;
    const int port = cfg.port;

    ProbePlan plan;
    plan.brand = Brand::Other;
    plan.source = QStringLiteral("bridge");
    plan.steps.append(httpProbe(makeUrl(QStringLiteral("http"), host, port, QStringLiteral("/remote/ping")),
                                cfg.probeTimeoutMs,
                                [host, port](const HttpResult &result) -> std::optional<DiscoveredDevice> {
                                    if (!result.ok)
                                        return std::nullopt;
                                    return makeDiscoveredDevice(QStringLiteral("bridge-%1").arg(host), Brand::Other,
                                                                QStringLiteral("TV Bridge (%1)").arg(host), host, port,
                                                                QStringLiteral("bridge"));
                                }));
    return plan;
}

} // namespace tvremote
