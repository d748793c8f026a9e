#include "sony_adapter.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QRegularExpression>

#include "credential_store.h"
#include "pairing_sessions.h"

Q_LOGGING_CATEGORY(sonyLog, "tvremote.adapters.sony");

namespace tvremote {

namespace {

const QString kDefaultPairingMessage =
    QStringLiteral("Enter your Sony TV Pre-Shared Key (IP Control) to authorize this remote.");
const QString kExpiredMessage = QStringLiteral("Sony authorization expired. Re-enter your TV Pre-Shared Key.");

QByteArray rpcBody(const QString &method)
{
    QJsonObject body;
    body.insert(QStringLiteral("method"), method);
    body.insert(QStringLiteral("params"), QJsonArray());
    body.insert(QStringLiteral("id"), 1);
    body.insert(QStringLiteral("version"), QStringLiteral("1.0"));
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

bool isUnauthorizedReply(int statusCode, const QJsonDocument &body)
{
    if (statusCode == 401 || statusCode == 403)
        return true;
    const QJsonArray error = body.object().value(QStringLiteral("error")).toArray();
    if (error.isEmpty())
        return false;
    const int code = error.at(0).toInt();
    return code == 401 || code == 403;
}

QJsonObject codesToJson(const SonyAdapter::CodeMap &codes)
{
    QJsonObject obj;
    for (auto it = codes.cbegin(); it != codes.cend(); ++it)
        obj.insert(it.key(), it.value());
    return obj;
}

SonyAdapter::CodeMap codesFromJson(const QJsonObject &obj)
{
    SonyAdapter::CodeMap codes;
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        if (it.value().isString() && !it.value().toString().isEmpty())
            codes.insert(it.key(), it.value().toString());
    }
    return codes;
}

} // namespace

SonyAdapter::SonyAdapter(const AdapterContext &context)
    : BrandAdapter(context)
{
}

QStringList SonyAdapter::keyCandidates(RemoteCommand command)
{
    switch (command) {
    case RemoteCommand::Power: return { QStringLiteral("Power"), QStringLiteral("PowerOff"), QStringLiteral("TvPower") };
    case RemoteCommand::Input: return { QStringLiteral("Input"), QStringLiteral("TvInput"), QStringLiteral("InputSelect") };
    case RemoteCommand::Up: return { QStringLiteral("Up") };
    case RemoteCommand::Down: return { QStringLiteral("Down") };
    case RemoteCommand::Left: return { QStringLiteral("Left") };
    case RemoteCommand::Right: return { QStringLiteral("Right") };
    case RemoteCommand::Ok: return { QStringLiteral("Confirm"), QStringLiteral("Enter"), QStringLiteral("Select") };
    case RemoteCommand::Back: return { QStringLiteral("Return"), QStringLiteral("Back") };
    case RemoteCommand::Home: return { QStringLiteral("Home") };
    case RemoteCommand::Settings: return { QStringLiteral("Options"), QStringLiteral("ActionMenu"), QStringLiteral("Display") };
    case RemoteCommand::VolumeUp: return { QStringLiteral("VolumeUp"), QStringLiteral("AudioVolumeUp") };
    case RemoteCommand::VolumeDown: return { QStringLiteral("VolumeDown"), QStringLiteral("AudioVolumeDown") };
    case RemoteCommand::ChannelUp: return { QStringLiteral("ChannelUp"), QStringLiteral("ProgramUp"), QStringLiteral("ProgUp") };
    case RemoteCommand::ChannelDown: return { QStringLiteral("ChannelDown"), QStringLiteral("ProgramDown"), QStringLiteral("ProgDown") };
    case RemoteCommand::Mute: return { QStringLiteral("Mute"), QStringLiteral("AudioMute") };
    case RemoteCommand::Previous: return { QStringLiteral("Rewind"), QStringLiteral("Prev"), QStringLiteral("PrevChapter") };
    case RemoteCommand::PlayPause: return { QStringLiteral("Play"), QStringLiteral("Pause") };
    case RemoteCommand::Next: return { QStringLiteral("Forward"), QStringLiteral("Next"), QStringLiteral("NextChapter") };
    case RemoteCommand::Digit0:
    case RemoteCommand::Digit1:
    case RemoteCommand::Digit2:
    case RemoteCommand::Digit3:
    case RemoteCommand::Digit4:
    case RemoteCommand::Digit5:
    case RemoteCommand::Digit6:
    case RemoteCommand::Digit7:
    case RemoteCommand::Digit8:
    case RemoteCommand::Digit9: {
        const int digit = static_cast<int>(command) - static_cast<int>(RemoteCommand::Digit0);
        return { QStringLiteral("Num%1").arg(digit), QString::number(digit) };
    }
    case RemoteCommand::NumpadBackspace: return { QStringLiteral("Return"), QStringLiteral("Back") };
    case RemoteCommand::NumpadEnter: return { QStringLiteral("Enter"), QStringLiteral("Confirm") };
    case RemoteCommand::Numpad: break;
    }
    return {};
}

QString SonyAdapter::normalizeCodeName(const QString &name)
{
    static const QRegularExpression nonAlnum(QStringLiteral("[^a-z0-9]"));
    QString normalized = name.toLower();
    normalized.remove(nonAlnum);
    return normalized;
}

QString SonyAdapter::findIrccCode(RemoteCommand command, const CodeMap &codes)
{
    const QStringList candidates = keyCandidates(command);
    for (const QString &candidate : candidates) {
        const QString exact = codes.value(normalizeCodeName(candidate));
        if (!exact.isEmpty())
            return exact;
    }
    for (const QString &candidate : candidates) {
        const QString needle = normalizeCodeName(candidate);
        for (auto it = codes.cbegin(); it != codes.cend(); ++it) {
            if (it.key().contains(needle))
                return it.value();
        }
    }
    return QString();
}

SonyAdapter::CodeMap SonyAdapter::parseRemoteControllerInfo(const QJsonDocument &body)
{
    CodeMap codes;
    const QJsonArray result = body.object().value(QStringLiteral("result")).toArray();
    if (result.size() < 2)
        return codes;
    const QJsonArray entries = result.at(1).toArray();
    for (const QJsonValue &entry : entries) {
        const QJsonObject item = entry.toObject();
        const QString name = item.value(QStringLiteral("name")).toString().trimmed();
        const QString value = item.value(QStringLiteral("value")).toString().trimmed();
        if (name.isEmpty() || value.isEmpty())
            continue;
        codes.insert(normalizeCodeName(name), value);
    }
    return codes;
}

QList<QUrl> SonyAdapter::baseUrls(const TvProfile &profile) const
{
    const QString host = profile.hostOrEmpty();
    QList<QUrl> urls;
    for (int port : candidatePorts(profile.port, config().sony.ports))
        urls.append(makeUrl(port == 443 ? QStringLiteral("https") : QStringLiteral("http"), host, port, QStringLiteral("/")));
    return urls;
}

SonyAdapter::CodeFetch SonyAdapter::fetchCodes(const TvProfile &profile, const QString &psk) const
{
    CodeFetch fetch;
    QString lastError;
    for (QUrl url : baseUrls(profile)) {
        url.setPath(QStringLiteral("/sony/system"));

        HttpRequest request;
        request.method = QByteArrayLiteral("POST");
        request.url = url;
        request.timeoutMs = config().sony.requestTimeoutMs;
        request.body = rpcBody(QStringLiteral("getRemoteControllerInfo"));
        request.headers.append({ QByteArrayLiteral("Content-Type"), QByteArrayLiteral("application/json") });
        request.headers.append({ QByteArrayLiteral("Accept"), QByteArrayLiteral("application/json") });
        if (!psk.trimmed().isEmpty())
            request.headers.append({ QByteArrayLiteral("X-Auth-PSK"), psk.trimmed().toUtf8() });

        const HttpResult result = http().send(request);
        if (!result.hasResponse()) {
            lastError = result.error;
            continue;
        }
        if (result.statusCode == 404 || result.statusCode == 405) {
            lastError = QStringLiteral("Sony service not found at %1 (%2).")
                            .arg(url.toString(QUrl::RemovePath))
                            .arg(result.statusCode);
            continue;
        }

        const QJsonDocument body = QJsonDocument::fromJson(result.payload);
        if (isUnauthorizedReply(result.statusCode, body)) {
            fetch.status = CallStatus::Unauthorized;
            return fetch;
        }

        fetch.codes = parseRemoteControllerInfo(body);
        if (fetch.codes.isEmpty()) {
            fetch.error = QStringLiteral("Sony TV returned no IRCC key data.");
            return fetch;
        }
        fetch.status = CallStatus::Ok;
        qCDebug(sonyLog) << "loaded" << fetch.codes.size() << "IRCC codes from" << url.host();
        return fetch;
    }

    fetch.error = lastError.isEmpty() ? QStringLiteral("Sony TV is unreachable.") : lastError;
    return fetch;
}

SonyAdapter::CallResult SonyAdapter::sendIrcc(const TvProfile &profile, const QString &psk, const QString &code) const
{
    const QByteArray envelope =
        QByteArrayLiteral("<?xml version=\"1.0\"?>"
                          "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
                          "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
                          "<s:Body>"
                          "<u:X_SendIRCC xmlns:u=\"urn:schemas-sony-com:service:IRCC:1\">"
                          "<IRCCCode>")
        + code.toHtmlEscaped().toUtf8()
        + QByteArrayLiteral("</IRCCCode>"
                            "</u:X_SendIRCC>"
                            "</s:Body>"
                            "</s:Envelope>");

    CallResult call;
    QString lastError;
    for (QUrl url : baseUrls(profile)) {
        url.setPath(QStringLiteral("/sony/IRCC"));

        HttpRequest request;
        request.method = QByteArrayLiteral("POST");
        request.url = url;
        request.timeoutMs = config().sony.requestTimeoutMs;
        request.body = envelope;
        request.headers.append({ QByteArrayLiteral("Content-Type"), QByteArrayLiteral("text/xml; charset=\"utf-8\"") });
        request.headers.append({ QByteArrayLiteral("SOAPACTION"),
                                 QByteArrayLiteral("\"urn:schemas-sony-com:service:IRCC:1#X_SendIRCC\"") });
        request.headers.append({ QByteArrayLiteral("X-Auth-PSK"), psk.toUtf8() });

        const HttpResult result = http().send(request);
        if (result.statusCode == 401 || result.statusCode == 403) {
            call.status = CallStatus::Unauthorized;
            return call;
        }
        if (result.ok) {
            call.status = CallStatus::Ok;
            return call;
        }
        lastError = result.hasResponse()
            ? QStringLiteral("Sony IRCC request failed (%1).").arg(result.statusCode)
            : result.error;
    }

    call.error = lastError.isEmpty() ? QStringLiteral("Sony IRCC request failed.") : lastError;
    return call;
}

DispatchResult SonyAdapter::pairingRequired(const TvProfile &profile,
                                            const QString &message,
                                            std::optional<RemoteCommand> command) const
{
    PairingRequest request;
    request.brand = Brand::Sony;
    request.challenge = SonyPairingChallenge {};

    if (PairingSessionManager *sessions = context().sessions) {
        PairingSession session;
        session.request = request;
        session.pendingCommand = command;
        if (!command) {
            if (const std::optional<PairingSession> existing = sessions->find(CredentialStore::cacheKey(profile)))
                session.pendingCommand = existing->pendingCommand;
        }
        sessions->remember(CredentialStore::cacheKey(profile), session);
    }
    return DispatchResult::pairingRequired(message, request);
}

void SonyAdapter::storeCredentials(const QString &cacheKey, const QString &psk, const CodeMap &codes) const
{
    QJsonObject record;
    record.insert(QStringLiteral("psk"), psk);
    record.insert(QStringLiteral("codes"), codesToJson(codes));
    context().credentials->setRecord(CredentialKind::SonyPsk, cacheKey, record);
}

DispatchResult SonyAdapter::send(const TvProfile &profile, RemoteCommand command)
{
    if (profile.hostOrEmpty().isEmpty())
        return missingHost();

    CredentialStore *store = context().credentials;
    if (!store)
        return DispatchResult::failure(QStringLiteral("Unable to send Sony command. Credential store unavailable."));

    const QString cacheKey = CredentialStore::cacheKey(profile);
    const QJsonObject record = store->record(CredentialKind::SonyPsk, cacheKey);
    const QString psk = record.value(QStringLiteral("psk")).toString();
    if (psk.isEmpty())
        return pairingRequired(profile, kDefaultPairingMessage, command);

    if (keyCandidates(command).isEmpty())
        return unmapped();

    CodeMap codes = codesFromJson(record.value(QStringLiteral("codes")).toObject());
    if (codes.isEmpty()) {
        const CodeFetch fetch = fetchCodes(profile, psk);
        if (fetch.status == CallStatus::Unauthorized) {
            store->remove(CredentialKind::SonyPsk, cacheKey);
            return pairingRequired(profile, kExpiredMessage, command);
        }
        if (fetch.status == CallStatus::Failed) {
            qCWarning(sonyLog) << "code table load failed:" << fetch.error;
            return DispatchResult::failure(
                QStringLiteral("Unable to load Sony remote keys. %1").arg(describeError(fetch.error)));
        }
        codes = fetch.codes;
        storeCredentials(cacheKey, psk, codes);
    }

    QString code = findIrccCode(command, codes);
    if (code.isEmpty()) {
        const CodeFetch fetch = fetchCodes(profile, psk);
        if (fetch.status == CallStatus::Unauthorized) {
            store->remove(CredentialKind::SonyPsk, cacheKey);
            return pairingRequired(profile, kExpiredMessage, command);
        }
        if (fetch.status == CallStatus::Failed) {
            qCWarning(sonyLog) << "code table refresh failed:" << fetch.error;
            return DispatchResult::failure(
                QStringLiteral("Unable to refresh Sony remote keys. %1").arg(describeError(fetch.error)));
        }
        storeCredentials(cacheKey, psk, fetch.codes);
        code = findIrccCode(command, fetch.codes);
    }

    if (code.isEmpty())
        return DispatchResult::failure(QStringLiteral("This command is unavailable on this Sony TV model."));

    const CallResult call = sendIrcc(profile, psk, code);
    switch (call.status) {
    case CallStatus::Ok:
        return DispatchResult::success(QStringLiteral("Command sent to Sony TV."));
    case CallStatus::Unauthorized:
        store->remove(CredentialKind::SonyPsk, cacheKey);
        return pairingRequired(profile, QStringLiteral("Sony key no longer valid. Re-enter your TV Pre-Shared Key."), command);
    case CallStatus::Failed:
        break;
    }
    qCWarning(sonyLog) << "IRCC send failed:" << call.error;
    return DispatchResult::failure(QStringLiteral("Unable to send Sony command. %1").arg(describeError(call.error)));
}

DispatchResult SonyAdapter::completePairing(const TvProfile &profile,
                                            const QString &secret,
                                            const std::optional<PairingRequest> &challenge)
{
    Q_UNUSED(challenge);

    if (profile.hostOrEmpty().isEmpty())
        return missingHost();

    const QString psk = secret.trimmed();
    if (psk.size() < 4)
        return DispatchResult::failure(QStringLiteral("Enter a valid Sony Pre-Shared Key."));

    if (!context().credentials)
        return DispatchResult::failure(QStringLiteral("Unable to pair Sony TV. Credential store unavailable."));

    const QString cacheKey = CredentialStore::cacheKey(profile);
    const CodeFetch fetch = fetchCodes(profile, psk);
    if (fetch.status == CallStatus::Unauthorized)
        return pairingRequired(profile, QStringLiteral("Sony key rejected. Check the TV's Pre-Shared Key and try again."),
                               std::nullopt);
    if (fetch.status == CallStatus::Failed)
        return DispatchResult::failure(QStringLiteral("Unable to pair Sony TV. %1").arg(describeError(fetch.error)));

    storeCredentials(cacheKey, psk, fetch.codes);
    qCInfo(sonyLog) << "paired" << cacheKey;
    return DispatchResult::success(QStringLiteral("Sony TV paired."));
}

ProbePlan SonyAdapter::probePlan(const QString &host, bool explicitHost) const
{
    Q_UNUSED(explicitHost);

    const SonyConfig &cfg = config().sony;
    const int port = cfg.probePort;
    const QString fallbackName = QStringLiteral("Sony TV (%1)").arg(host);

    ProbeStep step = httpProbe(
        makeUrl(QStringLiteral("http"), host, port, QStringLiteral("/sony/system")),
        cfg.probeTimeoutMs,
        [host, port, fallbackName](const HttpResult &result) -> std::optional<DiscoveredDevice> {
            if (result.statusCode == 401 || result.statusCode == 403) {
                return makeDiscoveredDevice(QStringLiteral("sony-%1-auth").arg(host), Brand::Sony, fallbackName, host,
                                            port, QStringLiteral("sony"));
            }
            if (!result.hasResponse() || (!result.ok && result.statusCode >= 500))
                return std::nullopt;

            const QString text = QString::fromUtf8(result.payload).toLower();
            const bool looksSony = text.contains(QLatin1String("sony")) || text.contains(QLatin1String("bravia"))
                || text.contains(QLatin1String("illegal request")) || text.contains(QLatin1String("\"result\""))
                || text.contains(QLatin1String("\"error\""));
            if (!looksSony)
                return std::nullopt;

            const QJsonObject info = QJsonDocument::fromJson(result.payload)
                                         .object()
                                         .value(QStringLiteral("result"))
                                         .toArray()
                                         .at(0)
                                         .toObject();
            QStringList label;
            for (const QString &field : { QStringLiteral("model"), QStringLiteral("product"), QStringLiteral("generation") }) {
                const QString value = info.value(field).toString().trimmed();
                if (!value.isEmpty())
                    label.append(value);
            }
            const QString nickname = label.isEmpty() ? fallbackName : label.join(QLatin1Char(' '));
            return makeDiscoveredDevice(QStringLiteral("sony-%1").arg(host), Brand::Sony, nickname, host, port,
                                        QStringLiteral("sony"));
        });
    step.request.method = QByteArrayLiteral("POST");
    step.request.body = rpcBody(QStringLiteral("getSystemInformation"));
    step.request.headers.append({ QByteArrayLiteral("Content-Type"), QByteArrayLiteral("application/json") });
    step.request.headers.append({ QByteArrayLiteral("Accept"), QByteArrayLiteral("application/json") });

    ProbePlan plan;
    plan.brand = Brand::Sony;
    plan.source = QStringLiteral("sony");
    plan.steps.append(step);
    return plan;
}

} // namespace tvremote
