#include "vizio_adapter.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QRegularExpression>

#include "credential_store.h"
#include "pairing_sessions.h"

Q_LOGGING_CATEGORY(vizioLog, "tvremote.adapters.vizio");

namespace tvremote {

namespace {

std::optional<qint64> toInteger(const QJsonValue &value)
{
    if (value.isDouble())
        return static_cast<qint64>(value.toDouble());
    if (value.isString()) {
        bool ok = false;
        const qint64 parsed = value.toString().trimmed().toLongLong(&ok);
        if (ok)
            return parsed;
    }
    return std::nullopt;
}

QString statusDetail(const QJsonObject &payload)
{
    return payload.value(QStringLiteral("STATUS")).toObject().value(QStringLiteral("DETAIL")).toString().trimmed();
}

QString describeStatus(const QJsonObject &payload)
{
    QString text;
    const QString result = VizioAdapter::statusResult(payload);
    const QString detail = statusDetail(payload);
    if (!result.isEmpty())
        text += QStringLiteral(" Result: %1.").arg(result);
    if (!detail.isEmpty())
        text += QLatin1Char(' ') + detail;
    return text;
}

QString authTokenFrom(const QJsonObject &payload)
{
    const QJsonValue token = VizioAdapter::itemValue(payload, QStringLiteral("AUTH_TOKEN"));
    return token.isString() ? token.toString().trimmed() : QString();
}

std::optional<VizioPairingChallenge> challengeFrom(const QJsonObject &payload, const QString &fallbackDeviceId)
{
    const std::optional<qint64> token = toInteger(VizioAdapter::itemValue(payload, QStringLiteral("PAIRING_REQ_TOKEN")));
    const std::optional<qint64> type = toInteger(VizioAdapter::itemValue(payload, QStringLiteral("CHALLENGE_TYPE")));
    if (!token || !type)
        return std::nullopt;

    VizioPairingChallenge challenge;
    challenge.challengeType = static_cast<int>(*type);
    challenge.pairingToken = *token;
    const QString deviceId = VizioAdapter::itemValue(payload, QStringLiteral("DEVICE_ID")).toString().trimmed();
    challenge.deviceId = deviceId.isEmpty() ? fallbackDeviceId : deviceId;
    return challenge;
}

} // namespace

VizioAdapter::VizioAdapter(const AdapterContext &context)
    : BrandAdapter(context)
{
}

std::optional<VizioAdapter::KeySpec> VizioAdapter::keyFor(RemoteCommand command)
{
    switch (command) {
    case RemoteCommand::Power: return KeySpec { 11, 2 };
    case RemoteCommand::Input: return KeySpec { 7, 1 };
    case RemoteCommand::VolumeDown: return KeySpec { 5, 0 };
    case RemoteCommand::VolumeUp: return KeySpec { 5, 1 };
    case RemoteCommand::Mute: return KeySpec { 5, 4 };
    case RemoteCommand::ChannelDown: return KeySpec { 8, 0 };
    case RemoteCommand::ChannelUp: return KeySpec { 8, 1 };
    case RemoteCommand::Previous: return KeySpec { 8, 2 };
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
        return KeySpec { 0, 48 + static_cast<int>(command) - static_cast<int>(RemoteCommand::Digit0) };
    case RemoteCommand::NumpadBackspace: return KeySpec { 0, 8 };
    case RemoteCommand::NumpadEnter: return KeySpec { 0, 13 };
    default:
        break;
    }
    return std::nullopt;
}

QString VizioAdapter::deviceIdFor(const TvProfile &profile)
{
    static const QRegularExpression disallowed(QStringLiteral("[^A-Za-z0-9_-]"));
    QString id = QStringLiteral("tvremote-%1").arg(profile.id);
    id.remove(disallowed);
    return id.left(40);
}

QJsonValue VizioAdapter::itemValue(const QJsonObject &payload, const QString &key)
{
    const QJsonObject item = payload.value(QStringLiteral("ITEM")).toObject();
    if (item.contains(key))
        return item.value(key);
    for (auto it = item.constBegin(); it != item.constEnd(); ++it) {
        if (it.key().compare(key, Qt::CaseInsensitive) == 0)
            return it.value();
    }
    return QJsonValue(QJsonValue::Undefined);
}

QString VizioAdapter::statusResult(const QJsonObject &payload)
{
    const QJsonValue result = payload.value(QStringLiteral("STATUS")).toObject().value(QStringLiteral("RESULT"));
    return result.toVariant().toString().trimmed().toUpper();
}

bool VizioAdapter::isPairingRequiredResult(const QString &result)
{
    return result.contains(QLatin1String("PAIR")) || result.contains(QLatin1String("AUTH"))
        || result.contains(QLatin1String("PIN")) || result.contains(QLatin1String("UNAUTHORIZED"));
}

VizioAdapter::PutReply VizioAdapter::putJson(const QString &host,
                                            const QString &path,
                                            const QJsonObject &body,
                                            const QString &authToken) const
{
    const VizioConfig &cfg = config().vizio;
    const QByteArray payload = QJsonDocument(body).toJson(QJsonDocument::Compact);

    PutReply reply;
    QString lastError;
    for (const VizioEndpoint &endpoint : cfg.endpoints) {
        HttpRequest request;
        request.method = QByteArrayLiteral("PUT");
        request.url = makeUrl(endpoint.scheme, host, endpoint.port, path);
        request.body = payload;
        request.timeoutMs = cfg.requestTimeoutMs;
        request.headers.append({ QByteArrayLiteral("Content-Type"), QByteArrayLiteral("application/json") });
        request.headers.append({ QByteArrayLiteral("Accept"), QByteArrayLiteral("application/json") });
        if (!authToken.isEmpty())
            request.headers.append({ QByteArrayLiteral("AUTH"), authToken.toUtf8() });

        const HttpResult result = http().send(request);
        if (!result.hasResponse()) {
            lastError = result.error;
            continue;
        }

        if (result.payload.trimmed().isEmpty()) {
            if (result.ok) {
                reply.reached = true;
                return reply;
            }
            lastError = QStringLiteral("Vizio endpoint failed (%1).").arg(result.statusCode);
            continue;
        }

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(result.payload, &parseError);
        if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
            reply.reached = true;
            reply.payload = doc.object();
            return reply;
        }
        if (result.ok) {
            reply.reached = true;
            return reply;
        }
        lastError = QStringLiteral("Vizio endpoint returned non-JSON (%1).").arg(result.statusCode);
    }

    reply.error = lastError.isEmpty() ? QStringLiteral("Vizio adapter failed to connect.") : lastError;
    return reply;
}

VizioAdapter::PairingStart VizioAdapter::startPairing(const TvProfile &profile, RemoteCommand command) const
{
    const QString deviceId = deviceIdFor(profile);
    QJsonObject body;
    body.insert(QStringLiteral("DEVICE_ID"), deviceId);
    body.insert(QStringLiteral("DEVICE_NAME"), config().vizio.deviceName);

    PairingStart start;
    const PutReply reply = putJson(profile.hostOrEmpty(), QStringLiteral("/pairing/start"), body, QString());
    if (!reply.reached) {
        start.result = DispatchResult::failure(
            QStringLiteral("Unable to start Vizio pairing. %1").arg(describeError(reply.error)));
        return start;
    }

    start.authToken = authTokenFrom(reply.payload);
    if (!start.authToken.isEmpty()) {
        start.result = DispatchResult::success(QStringLiteral("Vizio TV paired and authenticated."));
        return start;
    }

    if (const std::optional<VizioPairingChallenge> challenge = challengeFrom(reply.payload, deviceId)) {
        PairingRequest request;
        request.brand = Brand::Vizio;
        request.challenge = *challenge;
        if (PairingSessionManager *sessions = context().sessions)
            sessions->remember(CredentialStore::cacheKey(profile), PairingSession { request, command });
        qCInfo(vizioLog) << "pairing challenge issued for" << profile.hostOrEmpty();
        start.result = DispatchResult::pairingRequired(
            QStringLiteral("Enter the PIN shown on your Vizio TV to finish pairing."), request);
        return start;
    }

    start.result = DispatchResult::failure(QStringLiteral("Unable to start Vizio pairing.") + describeStatus(reply.payload));
    return start;
}

AttemptResult VizioAdapter::sendKey(const QString &host, const KeySpec &key, const QString &authToken) const
{
    QJsonObject entry;
    entry.insert(QStringLiteral("CODESET"), key.codeset);
    entry.insert(QStringLiteral("CODE"), key.code);
    entry.insert(QStringLiteral("ACTION"), QStringLiteral("KEYPRESS"));
    QJsonObject body;
    body.insert(QStringLiteral("KEYLIST"), QJsonArray { entry });

    const PutReply reply = putJson(host, QStringLiteral("/key_command/"), body, authToken);
    if (!reply.reached)
        return AttemptResult::failed(QStringLiteral("Unable to send Vizio command. %1").arg(describeError(reply.error)));

    const QString result = statusResult(reply.payload);
    if (result.isEmpty() || result == QLatin1String("SUCCESS"))
        return AttemptResult::success();

    const QString detail = statusDetail(reply.payload);
    const QString message = QStringLiteral("Vizio rejected command (%1%2).")
                                .arg(result, detail.isEmpty() ? QString() : QStringLiteral(": ") + detail);
    if (isPairingRequiredResult(result))
        return AttemptResult::rejected(message);
    return AttemptResult::failed(message);
}

DispatchResult VizioAdapter::send(const TvProfile &profile, RemoteCommand command)
{
    const QString host = profile.hostOrEmpty();
    if (host.isEmpty())
        return missingHost();

    const std::optional<KeySpec> key = keyFor(command);
    if (!key)
        return unmapped();

    CredentialStore *store = context().credentials;
    if (!store)
        return DispatchResult::failure(QStringLiteral("Unable to send Vizio command. Credential store unavailable."));

    const QString cacheKey = CredentialStore::cacheKey(profile);
    std::optional<DispatchResult> pairingOutcome;

    const CredentialAttemptOutcome outcome = attemptWithCredentialFallback(
        store->value(CredentialKind::VizioAuthToken, cacheKey),
        [&](const QString &cached) {
            QString token = cached;
            if (token.isEmpty()) {
                const PairingStart start = startPairing(profile, command);
                if (start.authToken.isEmpty()) {
                    pairingOutcome = start.result;
                    return AttemptResult::failed(start.result.message);
                }
                store->setValue(CredentialKind::VizioAuthToken, cacheKey, start.authToken);
                token = start.authToken;
            }
            return sendKey(host, *key, token);
        },
        [&]() { store->remove(CredentialKind::VizioAuthToken, cacheKey); });

    if (outcome.result.status == AttemptStatus::Success)
        return DispatchResult::success(QStringLiteral("Command sent to Vizio TV."));
    if (pairingOutcome)
        return *pairingOutcome;

    qCWarning(vizioLog) << "send failed for" << host << outcome.result.error;
    return DispatchResult::failure(outcome.result.error);
}

DispatchResult VizioAdapter::completePairing(const TvProfile &profile,
                                             const QString &secret,
                                             const std::optional<PairingRequest> &challenge)
{
    const QString host = profile.hostOrEmpty();
    if (host.isEmpty())
        return missingHost();

    static const QRegularExpression pinPattern(QStringLiteral("^\\d{4,8}$"));
    const QString pin = secret.trimmed();
    if (!pinPattern.match(pin).hasMatch())
        return DispatchResult::failure(QStringLiteral("Enter a valid numeric PIN from your Vizio TV."));

    CredentialStore *store = context().credentials;
    if (!store)
        return DispatchResult::failure(QStringLiteral("Vizio pairing failed. Credential store unavailable."));

    const QString cacheKey = CredentialStore::cacheKey(profile);
    std::optional<VizioPairingChallenge> pending;
    if (challenge) {
        if (const auto *vizio = std::get_if<VizioPairingChallenge>(&challenge->challenge))
            pending = *vizio;
    }
    if (!pending && context().sessions) {
        if (const std::optional<PairingSession> session = context().sessions->find(cacheKey)) {
            if (const auto *vizio = std::get_if<VizioPairingChallenge>(&session->request.challenge))
                pending = *vizio;
        }
    }
    if (!pending)
        return DispatchResult::failure(QStringLiteral("No Vizio pairing session found. Start pairing again."));

    QJsonObject body;
    body.insert(QStringLiteral("DEVICE_ID"), pending->deviceId);
    body.insert(QStringLiteral("CHALLENGE_TYPE"), pending->challengeType);
    body.insert(QStringLiteral("RESPONSE_VALUE"), pin);
    body.insert(QStringLiteral("PAIRING_REQ_TOKEN"), pending->pairingToken);

    const PutReply reply = putJson(host, QStringLiteral("/pairing/pair"), body, QString());
    if (!reply.reached)
        return DispatchResult::failure(QStringLiteral("Vizio pairing failed. %1").arg(describeError(reply.error)));

    const QString token = authTokenFrom(reply.payload);
    if (token.isEmpty())
        return DispatchResult::failure(QStringLiteral("Vizio pairing failed.") + describeStatus(reply.payload));

    store->setValue(CredentialKind::VizioAuthToken, cacheKey, token);
    if (context().sessions)
        context().sessions->clear(cacheKey);
    qCInfo(vizioLog) << "paired" << cacheKey;
    return DispatchResult::success(QStringLiteral("Vizio pairing complete."));
}

ProbePlan VizioAdapter::probePlan(const QString &host, bool explicitHost) const
{
    Q_UNUSED(explicitHost);

    const VizioConfig &cfg = config().vizio;
    const int port = cfg.probePort;

    ProbePlan plan;
    plan.brand = Brand::Vizio;
    plan.source = QStringLiteral("vizio");
    plan.steps.append(httpProbe(makeUrl(QStringLiteral("http"), host, port, QStringLiteral("/state/device/name")),
                                cfg.probeTimeoutMs,
                                [host, port](const HttpResult &result) -> std::optional<DiscoveredDevice> {
                                    if (!result.ok && result.statusCode != 401)
                                        return std::nullopt;
                                    QString label = QJsonDocument::fromJson(result.payload)
                                                        .object()
                                                        .value(QStringLiteral("ITEM"))
                                                        .toObject()
                                                        .value(QStringLiteral("VALUE"))
                                                        .toObject()
                                                        .value(QStringLiteral("NAME"))
                                                        .toString()
                                                        .trimmed();
                                    if (label.isEmpty())
                                        label = QStringLiteral("VIZIO TV");
                                    return makeDiscoveredDevice(QStringLiteral("vizio-%1").arg(host), Brand::Vizio,
                                                                label, host, port, QStringLiteral("vizio"));
                                }));
    return plan;
}

} // namespace tvremote
