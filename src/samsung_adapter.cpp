#include "samsung_adapter.h"

#include <QDeadlineTimer>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>

#include "credential_store.h"
#include "samsung_protocol.h"
#include "secure_channel.h"
#include "ws_channel.h"

Q_LOGGING_CATEGORY(samsungLog, "tvremote.adapters.samsung");

namespace tvremote {

SamsungAdapter::SamsungAdapter(const AdapterContext &context)
    : BrandAdapter(context)
{
}

std::optional<QString> SamsungAdapter::keyFor(RemoteCommand command)
{
    switch (command) {
    case RemoteCommand::Power: return QStringLiteral("KEY_POWER");
    case RemoteCommand::Input: return QStringLiteral("KEY_SOURCE");
    case RemoteCommand::Up: return QStringLiteral("KEY_UP");
    case RemoteCommand::Down: return QStringLiteral("KEY_DOWN");
    case RemoteCommand::Left: return QStringLiteral("KEY_LEFT");
    case RemoteCommand::Right: return QStringLiteral("KEY_RIGHT");
    case RemoteCommand::Ok: return QStringLiteral("KEY_ENTER");
    case RemoteCommand::Back: return QStringLiteral("KEY_RETURN");
    case RemoteCommand::Home: return QStringLiteral("KEY_HOME");
    case RemoteCommand::Settings: return QStringLiteral("KEY_MENU");
    case RemoteCommand::VolumeUp: return QStringLiteral("KEY_VOLUP");
    case RemoteCommand::VolumeDown: return QStringLiteral("KEY_VOLDOWN");
    case RemoteCommand::ChannelUp: return QStringLiteral("KEY_CHUP");
    case RemoteCommand::ChannelDown: return QStringLiteral("KEY_CHDOWN");
    case RemoteCommand::Mute: return QStringLiteral("KEY_MUTE");
    case RemoteCommand::Previous: return QStringLiteral("KEY_REWIND");
    case RemoteCommand::PlayPause: return QStringLiteral("KEY_PLAY");
    case RemoteCommand::Next: return QStringLiteral("KEY_FF");
    case RemoteCommand::Digit0: return QStringLiteral("KEY_0");
    case RemoteCommand::Digit1: return QStringLiteral("KEY_1");
    case RemoteCommand::Digit2: return QStringLiteral("KEY_2");
    case RemoteCommand::Digit3: return QStringLiteral("KEY_3");
    case RemoteCommand::Digit4: return QStringLiteral("KEY_4");
    case RemoteCommand::Digit5: return QStringLiteral("KEY_5");
    case RemoteCommand::Digit6: return QStringLiteral("KEY_6");
    case RemoteCommand::Digit7: return QStringLiteral("KEY_7");
    case RemoteCommand::Digit8: return QStringLiteral("KEY_8");
    case RemoteCommand::Digit9: return QStringLiteral("KEY_9");
    case RemoteCommand::NumpadBackspace: return QStringLiteral("KEY_RETURN");
    case RemoteCommand::NumpadEnter: return QStringLiteral("KEY_ENTER");
    case RemoteCommand::Numpad: break;
    }
    return std::nullopt;
}

DispatchResult SamsungAdapter::send(const TvProfile &profile, RemoteCommand command)
{
    const QString host = profile.hostOrEmpty();
    if (host.isEmpty())
        return missingHost();

    const std::optional<QString> key = keyFor(command);
    if (!key)
        return unmapped();

    CredentialStore *store = context().credentials;
    if (!store)
        return DispatchResult::failure(QStringLiteral("Unable to send Samsung command. Credential store unavailable."));

    const QString cacheKey = CredentialStore::cacheKey(profile);
    const bool pinned = config().samsung.pinnedTls;

    const CredentialAttemptOutcome outcome = attemptWithCredentialFallback(
        store->value(CredentialKind::SamsungToken, cacheKey),
        [&](const QString &token) {
            return pinned ? sendPinned(cacheKey, host, *key, token) : sendOverSockets(host, *key, token);
        },
        [&]() { store->remove(CredentialKind::SamsungToken, cacheKey); });

    if (outcome.result.status == AttemptStatus::Success) {
        if (!outcome.result.issuedCredential.isEmpty()) {
            qCInfo(samsungLog) << "token issued for" << cacheKey;
            store->setValue(CredentialKind::SamsungToken, cacheKey, outcome.result.issuedCredential);
        }
        return DispatchResult::success(QStringLiteral("Command sent to Samsung TV."));
    }

    qCWarning(samsungLog) << "send failed for" << host << outcome.result.error;
    return DispatchResult::failure(
        QStringLiteral("Unable to send Samsung command. %1").arg(describeError(outcome.result.error)));
}

AttemptResult SamsungAdapter::sendOverSockets(const QString &host, const QString &key, const QString &token) const
{
    const SamsungConfig &cfg = config().samsung;
    const QList<QUrl> urls = {
        samsungRemoteUrl(QStringLiteral("ws"), host, cfg.wsPort, cfg.appName, token),
        samsungRemoteUrl(QStringLiteral("wss"), host, cfg.wssPort, cfg.appName, token),
    };

    QString lastError;
    for (const QUrl &url : urls) {
        const AttemptResult result = sendOverUrl(url, key, !token.isEmpty());
        // The TV's verdict is final; only transport failures move to the next URL.
        if (result.status != AttemptStatus::Failed)
            return result;
        lastError = result.error;
        qCDebug(samsungLog) << url.scheme() << "attempt failed:" << result.error;
    }
    return AttemptResult::failed(lastError.isEmpty() ? QStringLiteral("Samsung adapter failed to connect.") : lastError);
}

AttemptResult SamsungAdapter::sendOverUrl(const QUrl &url, const QString &key, bool hasToken) const
{
    const SamsungConfig &cfg = config().samsung;
    WsChannel channel;
    channel.open(url);

    const QDeadlineTimer deadline(hasToken ? cfg.tokenTimeoutMs : cfg.pairingTimeoutMs);
    bool sent = false;
    for (;;) {
        const WsChannel::Event event = channel.next(deadline);
        switch (event.type) {
        case WsChannel::EventType::Opened: {
            QString error;
            if (!channel.sendText(samsungKeyFrame(key), &error))
                return AttemptResult::failed(QStringLiteral("Samsung payload failed to send."));
            sent = true;
            break;
        }
        case WsChannel::EventType::Message: {
            const SamsungEvent parsed = parseSamsungEvent(event.text);
            if (parsed.isUnauthorized()) {
                channel.close();
                return AttemptResult::rejected(QStringLiteral("Samsung TV denied remote authorization."));
            }
            if (parsed.isConnect() && !parsed.token.isEmpty()) {
                channel.close();
                return AttemptResult::success(parsed.token);
            }
            break;
        }
        case WsChannel::EventType::Closed:
            if (sent)
                return AttemptResult::success();
            return AttemptResult::failed(QStringLiteral("Samsung TV closed the connection."));
        case WsChannel::EventType::Error:
            return AttemptResult::failed(QStringLiteral("Samsung adapter connection failed."));
        case WsChannel::EventType::Timeout:
        case WsChannel::EventType::Cancelled:
            return AttemptResult::failed(QStringLiteral("Samsung TV connection timeout. Is the TV on the same Wi-Fi?"));
        }
    }
}

AttemptResult SamsungAdapter::sendPinned(const QString &cacheKey,
                                         const QString &host,
                                         const QString &key,
                                         const QString &token) const
{
    const SamsungConfig &cfg = config().samsung;
    CredentialStore *store = context().credentials;

    SecureSendRequest request;
    request.host = host;
    request.port = cfg.wssPort;
    request.appName = cfg.appName;
    request.key = key;
    request.token = token;
    request.pinnedFingerprint = store->value(CredentialKind::SamsungCertificate, cacheKey);
    request.openTimeoutMs = cfg.pinnedOpenTimeoutMs;
    request.tokenWaitMs = cfg.pinnedTokenWaitMs;
    request.pairingWaitMs = cfg.pairingTimeoutMs;

    const SecureSendResult result = tvremote::sendPinned(request);
    if (!result.certificateFingerprint.isEmpty() && request.pinnedFingerprint.isEmpty()) {
        qCInfo(samsungLog) << "pinning certificate for" << cacheKey;
        store->setValue(CredentialKind::SamsungCertificate, cacheKey, result.certificateFingerprint);
    }

    if (result.ok())
        return AttemptResult::success(result.token);
    if (result.error == SecureChannelError::Unauthorized)
        return AttemptResult::rejected(result.message);
    return AttemptResult::failed(result.message);
}

ProbePlan SamsungAdapter::probePlan(const QString &host, bool explicitHost) const
{
    const SamsungConfig &cfg = config().samsung;
    const QString fallbackName = QStringLiteral("Samsung TV (%1)").arg(host);

    ProbePlan plan;
    plan.brand = Brand::Samsung;
    plan.source = QStringLiteral("samsung");

    const int port = cfg.wsPort;
    plan.steps.append(httpProbe(makeUrl(QStringLiteral("http"), host, port, QStringLiteral("/api/v2/")),
                                cfg.probeTimeoutMs,
                                [host, port, fallbackName](const HttpResult &result) -> std::optional<DiscoveredDevice> {
                                    if (!result.hasResponse())
                                        return std::nullopt;
                                    const QJsonObject device = QJsonDocument::fromJson(result.payload)
                                                                   .object()
                                                                   .value(QStringLiteral("device"))
                                                                   .toObject();
                                    const QString name = device.value(QStringLiteral("name")).toString();
                                    const QString model = device.value(QStringLiteral("modelName")).toString();
                                    const QString text = QString::fromUtf8(result.payload).toLower();
                                    const bool looksSamsung = text.contains(QLatin1String("samsung"))
                                        || text.contains(QLatin1String("tizen"))
                                        || text.contains(QLatin1String("smarttv"));
                                    const bool hasDeviceInfo = !name.isEmpty() || !model.isEmpty();
                                    if (!hasDeviceInfo && !(result.statusCode < 500 && looksSamsung))
                                        return std::nullopt;
                                    const QString nickname = !name.isEmpty() ? name : (!model.isEmpty() ? model : fallbackName);
                                    return makeDiscoveredDevice(QStringLiteral("samsung-%1").arg(host), Brand::Samsung,
                                                                nickname, host, port, QStringLiteral("samsung"));
                                }));

    if (explicitHost) {
        plan.steps.append(socketProbe(samsungRemoteUrl(QStringLiteral("ws"), host, cfg.wsPort, cfg.appName),
                                      cfg.socketProbeTimeoutMs,
                                      makeDiscoveredDevice(QStringLiteral("samsung-%1-ws%2").arg(host).arg(cfg.wsPort),
                                                           Brand::Samsung, fallbackName, host, cfg.wsPort,
                                                           QStringLiteral("samsung"))));
        plan.steps.append(socketProbe(samsungRemoteUrl(QStringLiteral("wss"), host, cfg.wssPort, cfg.appName),
                                      cfg.socketProbeTimeoutMs,
                                      makeDiscoveredDevice(QStringLiteral("samsung-%1-ws%2").arg(host).arg(cfg.wssPort),
                                                           Brand::Samsung, fallbackName, host, cfg.wssPort,
                                                           QStringLiteral("samsung"))));
    }
    return plan;
}

} // namespace tvremote
