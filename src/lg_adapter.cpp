#include "lg_adapter.h"

#include <QDeadlineTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QUuid>

#include "credential_store.h"
#include "ws_channel.h"

Q_LOGGING_CATEGORY(lgLog, "tvremote.adapters.lg");

namespace tvremote {

namespace {

const QString kLaunchUri = QStringLiteral("ssap://com.webos.applicationManager/launch");
const QString kButtonUri = QStringLiteral("ssap://com.webos.service.networkinput/sendButton");

std::optional<QString> buttonFor(RemoteCommand command)
{
    switch (command) {
    case RemoteCommand::Up: return QStringLiteral("UP");
    case RemoteCommand::Down: return QStringLiteral("DOWN");
    case RemoteCommand::Left: return QStringLiteral("LEFT");
    case RemoteCommand::Right: return QStringLiteral("RIGHT");
    case RemoteCommand::Ok: return QStringLiteral("ENTER");
    case RemoteCommand::Back: return QStringLiteral("BACK");
    case RemoteCommand::Home: return QStringLiteral("HOME");
    case RemoteCommand::VolumeUp: return QStringLiteral("VOLUMEUP");
    case RemoteCommand::VolumeDown: return QStringLiteral("VOLUMEDOWN");
    case RemoteCommand::ChannelUp: return QStringLiteral("CHANNELUP");
    case RemoteCommand::ChannelDown: return QStringLiteral("CHANNELDOWN");
    case RemoteCommand::Mute: return QStringLiteral("MUTE");
    case RemoteCommand::Previous: return QStringLiteral("REWIND");
    case RemoteCommand::PlayPause: return QStringLiteral("PLAY");
    case RemoteCommand::Next: return QStringLiteral("FASTFORWARD");
    case RemoteCommand::Digit0: return QStringLiteral("0");
    case RemoteCommand::Digit1: return QStringLiteral("1");
    case RemoteCommand::Digit2: return QStringLiteral("2");
    case RemoteCommand::Digit3: return QStringLiteral("3");
    case RemoteCommand::Digit4: return QStringLiteral("4");
    case RemoteCommand::Digit5: return QStringLiteral("5");
    case RemoteCommand::Digit6: return QStringLiteral("6");
    case RemoteCommand::Digit7: return QStringLiteral("7");
    case RemoteCommand::Digit8: return QStringLiteral("8");
    case RemoteCommand::Digit9: return QStringLiteral("9");
    case RemoteCommand::NumpadBackspace: return QStringLiteral("DELETE");
    case RemoteCommand::NumpadEnter: return QStringLiteral("ENTER");
    default:
        break;
    }
    return std::nullopt;
}

QJsonArray toJsonArray(const QStringList &values)
{
    QJsonArray array;
    for (const QString &value : values)
        array.append(value);
    return array;
}

QString messageId(const QString &prefix)
{
    return prefix + QLatin1Char('_') + QUuid::createUuid().toString(QUuid::Id128).left(12);
}

QString compact(const QJsonObject &obj)
{
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

} // namespace

LgAdapter::LgAdapter(const AdapterContext &context)
    : BrandAdapter(context)
{
}

std::optional<LgAdapter::Request> LgAdapter::requestFor(RemoteCommand command)
{
    switch (command) {
    case RemoteCommand::Power:
        return Request { QStringLiteral("ssap://system/turnOff"), QJsonObject() };
    case RemoteCommand::Input:
        return Request { kLaunchUri, QJsonObject { { QStringLiteral("id"), QStringLiteral("com.webos.app.inputpicker") } } };
    case RemoteCommand::Settings:
        return Request { kLaunchUri, QJsonObject { { QStringLiteral("id"), QStringLiteral("com.palm.app.settings") } } };
    default:
        break;
    }

    const std::optional<QString> button = buttonFor(command);
    if (!button)
        return std::nullopt;
    return Request { kButtonUri, QJsonObject { { QStringLiteral("name"), *button } } };
}

QJsonObject LgAdapter::registerPayload(const QString &clientKey)
{
    static const QStringList registerPermissions = {
        QStringLiteral("LAUNCH"), QStringLiteral("LAUNCH_WEBAPP"), QStringLiteral("APP_TO_APP"),
        QStringLiteral("CLOSE"), QStringLiteral("TEST_OPEN"), QStringLiteral("TEST_PROTECTED"),
        QStringLiteral("CONTROL_AUDIO"), QStringLiteral("CONTROL_DISPLAY"), QStringLiteral("CONTROL_INPUT_JOYSTICK"),
        QStringLiteral("CONTROL_INPUT_MEDIA_PLAYBACK"), QStringLiteral("CONTROL_INPUT_TV"), QStringLiteral("CONTROL_POWER"),
        QStringLiteral("READ_APP_STATUS"), QStringLiteral("READ_CURRENT_CHANNEL"), QStringLiteral("READ_INPUT_DEVICE_LIST"),
        QStringLiteral("READ_NETWORK_STATE"), QStringLiteral("READ_RUNNING_APPS"), QStringLiteral("READ_TV_CHANNEL_LIST"),
        QStringLiteral("WRITE_NOTIFICATION_TOAST"), QStringLiteral("READ_POWER_STATE"), QStringLiteral("READ_COUNTRY_INFO"),
        QStringLiteral("WRITE_SETTINGS"),
    };
    static const QStringList signedPermissions = {
        QStringLiteral("CONTROL_AUDIO"), QStringLiteral("CONTROL_DISPLAY"), QStringLiteral("CONTROL_INPUT_JOYSTICK"),
        QStringLiteral("CONTROL_INPUT_MEDIA_PLAYBACK"), QStringLiteral("CONTROL_INPUT_TV"), QStringLiteral("CONTROL_POWER"),
        QStringLiteral("READ_APP_STATUS"), QStringLiteral("READ_CURRENT_CHANNEL"), QStringLiteral("READ_RUNNING_APPS"),
        QStringLiteral("READ_UPDATE_INFO"), QStringLiteral("READ_POWER_STATE"),
    };

    QJsonObject signedBlock;
    signedBlock.insert(QStringLiteral("created"), QStringLiteral("20140509"));
    signedBlock.insert(QStringLiteral("appId"), QStringLiteral("com.lge.test"));
    signedBlock.insert(QStringLiteral("vendorId"), QStringLiteral("com.lge"));
    signedBlock.insert(QStringLiteral("localizedAppNames"), QJsonObject { { QString(), QStringLiteral("LG Remote App") } });
    signedBlock.insert(QStringLiteral("localizedVendorNames"), QJsonObject { { QString(), QStringLiteral("LG Electronics") } });
    signedBlock.insert(QStringLiteral("permissions"), toJsonArray(signedPermissions));
    signedBlock.insert(QStringLiteral("serial"), QStringLiteral("2f930e2d2cfe083771f68e4fe7bb07"));

    QJsonObject manifest;
    manifest.insert(QStringLiteral("manifestVersion"), 1);
    manifest.insert(QStringLiteral("appVersion"), QStringLiteral("1.1"));
    manifest.insert(QStringLiteral("signed"), signedBlock);
    manifest.insert(QStringLiteral("permissions"), toJsonArray(registerPermissions));

    QJsonObject payload;
    payload.insert(QStringLiteral("forcePairing"), false);
    payload.insert(QStringLiteral("pairingType"), QStringLiteral("PROMPT"));
    payload.insert(QStringLiteral("manifest"), manifest);
    if (!clientKey.isEmpty())
        payload.insert(QStringLiteral("client-key"), clientKey);
    return payload;
}

DispatchResult LgAdapter::send(const TvProfile &profile, RemoteCommand command)
{
    const QString host = profile.hostOrEmpty();
    if (host.isEmpty())
        return missingHost();

    const std::optional<Request> request = requestFor(command);
    if (!request)
        return unmapped();

    CredentialStore *store = context().credentials;
    if (!store)
        return DispatchResult::failure(QStringLiteral("Unable to send LG command. Credential store unavailable."));

    const QString cacheKey = CredentialStore::cacheKey(profile);
    const CredentialAttemptOutcome outcome = attemptWithCredentialFallback(
        store->value(CredentialKind::LgClientKey, cacheKey),
        [&](const QString &clientKey) { return sendOverSockets(host, *request, clientKey); },
        [&]() { store->remove(CredentialKind::LgClientKey, cacheKey); });

    if (outcome.result.status == AttemptStatus::Success) {
        if (!outcome.result.issuedCredential.isEmpty())
            store->setValue(CredentialKind::LgClientKey, cacheKey, outcome.result.issuedCredential);
        return DispatchResult::success(QStringLiteral("Command sent to LG TV."));
    }

    qCWarning(lgLog) << "send failed for" << host << outcome.result.error;
    return DispatchResult::failure(
        QStringLiteral("Unable to send LG command. %1").arg(describeError(outcome.result.error)));
}

AttemptResult LgAdapter::sendOverSockets(const QString &host, const Request &request, const QString &clientKey) const
{
    const LgConfig &cfg = config().lg;
    QUrl plain;
    plain.setScheme(QStringLiteral("ws"));
    plain.setHost(host);
    plain.setPort(cfg.wsPort);
    QUrl secure = plain;
    secure.setScheme(QStringLiteral("wss"));
    secure.setPort(cfg.wssPort);

    QString lastError;
    for (const QUrl &url : { plain, secure }) {
        const AttemptResult result = sendOverUrl(url, request, clientKey);
        if (result.status != AttemptStatus::Failed)
            return result;
        lastError = result.error;
        qCDebug(lgLog) << url.scheme() << "attempt failed:" << result.error;
    }
    return AttemptResult::failed(lastError.isEmpty() ? QStringLiteral("LG adapter failed to connect.") : lastError);
}

AttemptResult LgAdapter::sendOverUrl(const QUrl &url, const Request &request, const QString &clientKey) const
{
    const LgConfig &cfg = config().lg;
    const QString registerId = messageId(QStringLiteral("register"));
    const QString requestId = messageId(QStringLiteral("request"));

    WsChannel channel;
    channel.open(url);

    const QDeadlineTimer deadline(clientKey.isEmpty() ? cfg.pairingTimeoutMs : cfg.clientKeyTimeoutMs);
    QString discoveredKey;
    bool requestSent = false;

    auto sendRequest = [&]() -> bool {
        if (requestSent)
            return true;
        requestSent = true;
        QJsonObject frame;
        frame.insert(QStringLiteral("id"), requestId);
        frame.insert(QStringLiteral("type"), QStringLiteral("request"));
        frame.insert(QStringLiteral("uri"), request.uri);
        frame.insert(QStringLiteral("payload"), request.payload);
        return channel.sendText(compact(frame));
    };

    for (;;) {
        const WsChannel::Event event = channel.next(deadline);
        switch (event.type) {
        case WsChannel::EventType::Opened: {
            QJsonObject frame;
            frame.insert(QStringLiteral("id"), registerId);
            frame.insert(QStringLiteral("type"), QStringLiteral("register"));
            frame.insert(QStringLiteral("payload"), registerPayload(clientKey));
            if (!channel.sendText(compact(frame)))
                return AttemptResult::failed(QStringLiteral("LG registration payload failed to send."));
            break;
        }
        case WsChannel::EventType::Message: {
            const QJsonDocument doc = QJsonDocument::fromJson(event.text.toUtf8());
            if (!doc.isObject())
                break;
            const QJsonObject message = doc.object();
            const QString id = message.value(QStringLiteral("id")).toString();
            const QString type = message.value(QStringLiteral("type")).toString();
            const QJsonObject payload = message.value(QStringLiteral("payload")).toObject();

            const QJsonValue key = payload.value(QStringLiteral("client-key"));
            if (key.isString() && !key.toString().isEmpty())
                discoveredKey = key.toString();

            const bool returnedFalse = payload.value(QStringLiteral("returnValue")) == QJsonValue(false);

            if (type == QLatin1String("error")) {
                QString details = message.value(QStringLiteral("error")).toString().trimmed();
                if (details.isEmpty())
                    details = QStringLiteral("request failed");
                if (id == registerId) {
                    channel.close();
                    return AttemptResult::rejected(QStringLiteral("LG TV denied remote authorization (%1).").arg(details));
                }
                if (id == requestId) {
                    channel.close();
                    return AttemptResult::failed(QStringLiteral("LG TV rejected command (%1).").arg(details));
                }
                break;
            }

            if (type == QLatin1String("registered")) {
                if (!sendRequest())
                    return AttemptResult::failed(QStringLiteral("LG payload failed to send."));
                break;
            }

            if (id == registerId && type == QLatin1String("response")) {
                if (returnedFalse) {
                    channel.close();
                    return AttemptResult::rejected(QStringLiteral("LG TV rejected registration response."));
                }
                if (!sendRequest())
                    return AttemptResult::failed(QStringLiteral("LG payload failed to send."));
                break;
            }

            if (id == requestId && type == QLatin1String("response")) {
                channel.close();
                if (returnedFalse)
                    return AttemptResult::failed(QStringLiteral("LG TV command returned returnValue=false."));
                return AttemptResult::success(discoveredKey != clientKey ? discoveredKey : QString());
            }
            break;
        }
        case WsChannel::EventType::Closed:
            return AttemptResult::failed(QStringLiteral("LG TV socket closed before command response."));
        case WsChannel::EventType::Error:
            return AttemptResult::failed(QStringLiteral("LG adapter connection failed."));
        case WsChannel::EventType::Timeout:
        case WsChannel::EventType::Cancelled:
            return AttemptResult::failed(QStringLiteral("LG TV connection timeout. Is the TV on the same Wi-Fi?"));
        }
    }
}

ProbePlan LgAdapter::probePlan(const QString &host, bool explicitHost) const
{
    const LgConfig &cfg = config().lg;
    const QString nickname = QStringLiteral("LG TV (%1)").arg(host);
    const QString source = QStringLiteral("lg");

    ProbePlan plan;
    plan.brand = Brand::Lg;
    plan.source = source;

    const int port = cfg.wsPort;
    plan.steps.append(httpProbe(makeUrl(QStringLiteral("http"), host, port, QStringLiteral("/")),
                                cfg.probeTimeoutMs,
                                [=](const HttpResult &result) -> std::optional<DiscoveredDevice> {
                                    if (!result.hasResponse() || result.statusCode >= 500)
                                        return std::nullopt;
                                    return makeDiscoveredDevice(QStringLiteral("lg-%1-http%2").arg(host).arg(port),
                                                                Brand::Lg, nickname, host, port, source);
                                }));

    if (explicitHost) {
        const QList<QPair<QString, int>> sockets = {
            { QStringLiteral("ws"), cfg.wsPort },
            { QStringLiteral("wss"), cfg.wssPort },
        };
        for (const auto &socket : sockets) {
            QUrl url;
            url.setScheme(socket.first);
            url.setHost(host);
            url.setPort(socket.second);
            plan.steps.append(socketProbe(url, cfg.socketProbeTimeoutMs,
                                          makeDiscoveredDevice(QStringLiteral("lg-%1-ws%2").arg(host).arg(socket.second),
                                                               Brand::Lg, nickname, host, socket.second, source)));
        }
    }
    return plan;
}

} // namespace tvremote
