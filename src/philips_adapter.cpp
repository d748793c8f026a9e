#include "philips_adapter.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QStringList>

Q_LOGGING_CATEGORY(philipsLog, "tvremote.adapters.philips");

namespace tvremote {

PhilipsAdapter::PhilipsAdapter(const AdapterContext &context)
    : BrandAdapter(context)
{
}

std::optional<QString> PhilipsAdapter::keyFor(RemoteCommand command)
{
    switch (command) {
    case RemoteCommand::Power: return QStringLiteral("Standby");
    case RemoteCommand::Input: return QStringLiteral("Source");
    case RemoteCommand::Up: return QStringLiteral("CursorUp");
    case RemoteCommand::Down: return QStringLiteral("CursorDown");
    case RemoteCommand::Left: return QStringLiteral("CursorLeft");
    case RemoteCommand::Right: return QStringLiteral("CursorRight");
    case RemoteCommand::Ok: return QStringLiteral("Confirm");
    case RemoteCommand::Back: return QStringLiteral("Back");
    case RemoteCommand::Home: return QStringLiteral("Home");
    case RemoteCommand::Settings: return QStringLiteral("Options");
    case RemoteCommand::VolumeUp: return QStringLiteral("VolumeUp");
    case RemoteCommand::VolumeDown: return QStringLiteral("VolumeDown");
    case RemoteCommand::ChannelUp: return QStringLiteral("ChannelStepUp");
    case RemoteCommand::ChannelDown: return QStringLiteral("ChannelStepDown");
    case RemoteCommand::Mute: return QStringLiteral("Mute");
    case RemoteCommand::Previous: return QStringLiteral("Previous");
    case RemoteCommand::PlayPause: return QStringLiteral("PlayPause");
    case RemoteCommand::Next: return QStringLiteral("Next");
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
        return QStringLiteral("Digit%1").arg(static_cast<int>(command) - static_cast<int>(RemoteCommand::Digit0));
    case RemoteCommand::NumpadBackspace: return QStringLiteral("Back");
    case RemoteCommand::NumpadEnter: return QStringLiteral("Confirm");
    case RemoteCommand::Numpad: break;
    }
    return std::nullopt;
}

QList<QUrl> PhilipsAdapter::commandUrls(const TvProfile &profile) const
{
    const PhilipsConfig &cfg = config().philips;
    const QString host = profile.hostOrEmpty();
    QList<QUrl> urls;
    for (int port : candidatePorts(profile.port, { cfg.httpPort, cfg.httpsPort })) {
        const QString scheme = port == cfg.httpsPort ? QStringLiteral("https") : QStringLiteral("http");
        urls.append(makeUrl(scheme, host, port, QStringLiteral("/6/input/key")));
        urls.append(makeUrl(scheme, host, port, QStringLiteral("/1/input/key")));
    }
    return urls;
}

DispatchResult PhilipsAdapter::send(const TvProfile &profile, RemoteCommand command)
{
    const QString host = profile.hostOrEmpty();
    if (host.isEmpty())
        return missingHost();

    const std::optional<QString> key = keyFor(command);
    if (!key)
        return unmapped();

    const QByteArray body = QJsonDocument(QJsonObject { { QStringLiteral("key"), *key } }).toJson(QJsonDocument::Compact);
    bool unauthorized = false;
    int lastStatus = 0;
    QString lastError;

    for (const QUrl &url : commandUrls(profile)) {
        for (const QByteArray &method : { QByteArrayLiteral("POST"), QByteArrayLiteral("PUT") }) {
            HttpRequest request;
            request.method = method;
            request.url = url;
            request.body = body;
            request.timeoutMs = config().philips.requestTimeoutMs;
            request.headers.append({ QByteArrayLiteral("Content-Type"), QByteArrayLiteral("application/json") });
            request.headers.append({ QByteArrayLiteral("Accept"), QByteArrayLiteral("application/json") });

            const HttpResult result = http().send(request);
            if (result.ok)
                return DispatchResult::success(QStringLiteral("Command sent to Philips TV."));
            if (!result.hasResponse()) {
                lastError = result.error;
                continue;
            }
            lastStatus = result.statusCode;
            if (result.statusCode == 401 || result.statusCode == 403)
                unauthorized = true;
        }
    }

    if (unauthorized) {
        return DispatchResult::failure(
            QStringLiteral("Philips TV denied the command. Enable JointSpace/IP control and pairing on the TV."));
    }
    if (lastStatus > 0)
        return DispatchResult::failure(QStringLiteral("Philips TV rejected command (%1).").arg(lastStatus));

    qCWarning(philipsLog) << "send failed for" << host << lastError;
    return DispatchResult::failure(QStringLiteral("Unable to send Philips command. %1").arg(describeError(lastError)));
}

ProbePlan PhilipsAdapter::probePlan(const QString &host, bool explicitHost) const
{
    Q_UNUSED(explicitHost);

    const PhilipsConfig &cfg = config().philips;
    const int port = cfg.httpPort;
    const QString fallbackName = QStringLiteral("Philips TV (%1)").arg(host);

    auto evaluate = [host, port, fallbackName](const HttpResult &result) -> std::optional<DiscoveredDevice> {
        if (result.statusCode == 401 || result.statusCode == 403) {
            return makeDiscoveredDevice(QStringLiteral("philips-%1-auth").arg(host), Brand::Philips, fallbackName,
                                        host, port, QStringLiteral("philips"));
        }
        if (!result.hasResponse() || (!result.ok && result.statusCode >= 500))
            return std::nullopt;

        const QString text = QString::fromUtf8(result.payload).toLower();
        if (!text.contains(QLatin1String("philips")) && !text.contains(QLatin1String("jointspace"))
            && !text.contains(QLatin1String("ambilight")) && !text.contains(QLatin1String("featuring"))) {
            return std::nullopt;
        }

        const QJsonObject system = QJsonDocument::fromJson(result.payload).object();
        QStringList label;
        for (const QString &field : { QStringLiteral("name"), QStringLiteral("model") }) {
            const QString value = system.value(field).toString().trimmed();
            if (!value.isEmpty())
                label.append(value);
        }
        return makeDiscoveredDevice(QStringLiteral("philips-%1").arg(host), Brand::Philips,
                                    label.isEmpty() ? fallbackName : label.join(QLatin1Char(' ')), host, port,
                                    QStringLiteral("philips"));
    };

    ProbePlan plan;
    plan.brand = Brand::Philips;
    plan.source = QStringLiteral("philips");
    for (const QString &path : { QStringLiteral("/6/system"), QStringLiteral("/1/system") })
        plan.steps.append(httpProbe(makeUrl(QStringLiteral("http"), host, port, path), cfg.probeTimeoutMs, evaluate));
    return plan;
}

} // namespace tvremote
