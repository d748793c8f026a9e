#include "roku_adapter.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(rokuLog, "tvremote.adapters.roku");

namespace tvremote {

RokuAdapter::RokuAdapter(const AdapterContext &context)
    : BrandAdapter(context)
{
}

std::optional<QString> RokuAdapter::keyFor(RemoteCommand command)
{
    switch (command) {
    case RemoteCommand::Power: return QStringLiteral("Power");
    case RemoteCommand::Input: return QStringLiteral("InputTuner");
    case RemoteCommand::Up: return QStringLiteral("Up");
    case RemoteCommand::Down: return QStringLiteral("Down");
    case RemoteCommand::Left: return QStringLiteral("Left");
    case RemoteCommand::Right: return QStringLiteral("Right");
    case RemoteCommand::Ok: return QStringLiteral("Select");
    case RemoteCommand::Back: return QStringLiteral("Back");
    case RemoteCommand::Home: return QStringLiteral("Home");
    case RemoteCommand::Settings: return QStringLiteral("Info");
    case RemoteCommand::VolumeUp: return QStringLiteral("VolumeUp");
    case RemoteCommand::VolumeDown: return QStringLiteral("VolumeDown");
    case RemoteCommand::ChannelUp: return QStringLiteral("ChannelUp");
    case RemoteCommand::ChannelDown: return QStringLiteral("ChannelDown");
    case RemoteCommand::Mute: return QStringLiteral("VolumeMute");
    case RemoteCommand::Previous: return QStringLiteral("Rev");
    case RemoteCommand::PlayPause: return QStringLiteral("Play");
    case RemoteCommand::Next: return QStringLiteral("Fwd");
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
        return QStringLiteral("Lit_%1").arg(static_cast<int>(command) - static_cast<int>(RemoteCommand::Digit0));
    case RemoteCommand::NumpadBackspace: return QStringLiteral("Backspace");
    case RemoteCommand::NumpadEnter: return QStringLiteral("Enter");
    case RemoteCommand::Numpad: break;
    }
    return std::nullopt;
}

DispatchResult RokuAdapter::send(const TvProfile &profile, RemoteCommand command)
{
    const QString host = profile.hostOrEmpty();
    if (host.isEmpty())
        return missingHost();

    const std::optional<QString> key = keyFor(command);
    if (!key)
        return unmapped();

    const RokuConfig &cfg = config().roku;
    HttpRequest request;
    request.method = QByteArrayLiteral("POST");
    request.url = makeUrl(QStringLiteral("http"), host, profile.port.value_or(cfg.port),
                          QStringLiteral("/keypress/%1").arg(*key));
    request.timeoutMs = cfg.requestTimeoutMs;

    const HttpResult result = http().send(request);
    if (result.ok)
        return DispatchResult::success(QStringLiteral("Command sent to Roku TV."));
    if (result.hasResponse())
        return DispatchResult::failure(QStringLiteral("Roku rejected command (%1).").arg(result.statusCode));

    qCWarning(rokuLog) << "keypress failed for" << host << result.error;
    return DispatchResult::failure(QStringLiteral("Unable to send Roku command. %1").arg(describeError(result.error)));
}

ProbePlan RokuAdapter::probePlan(const QString &host, bool explicitHost) const
{
    Q_UNUSED(explicitHost);

    const RokuConfig &cfg = config().roku;
    const int port = cfg.port;

    ProbePlan plan;
    plan.brand = Brand::Roku;
    plan.source = QStringLiteral("roku");
    plan.steps.append(httpProbe(makeUrl(QStringLiteral("http"), host, port, QStringLiteral("/query/device-info")),
                                cfg.probeTimeoutMs,
                                [host, port](const HttpResult &result) -> std::optional<DiscoveredDevice> {
                                    if (!result.ok)
                                        return std::nullopt;
                                    QString nickname = xmlTagText(QString::fromUtf8(result.payload),
                                                                  QStringLiteral("friendly-device-name"));
                                    if (nickname.isEmpty())
                                        nickname = QStringLiteral("ROKU TV");
                                    return makeDiscoveredDevice(QStringLiteral("roku-%1").arg(host), Brand::Roku,
                                                                nickname, host, port, QStringLiteral("roku"));
                                }));
    return plan;
}

} // namespace tvremote
