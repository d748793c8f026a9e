#include "secure_channel.h"

#include <QCryptographicHash>
#include <QDeadlineTimer>
#include <QLoggingCategory>
#include <QStringList>
#if QT_CONFIG(ssl)
#include <QSslCertificate>
#include <QSslConfiguration>
#include <QSslError>
#include <QSslSocket>
#endif

#include "cancellation.h"
#include "samsung_protocol.h"
#include "ws_channel.h"

Q_LOGGING_CATEGORY(secureLog, "tvremote.secure");

namespace tvremote {

namespace {

QString describeDetails(const QString &details)
{
    const QString trimmed = details.trimmed();
    return trimmed.isEmpty() ? QStringLiteral("unknown error") : trimmed;
}

SecureSendResult failed(SecureChannelError error, const QString &details = QString())
{
    SecureSendResult result;
    result.error = error;
    result.message = secureChannelErrorMessage(error, details);
    qCWarning(secureLog) << "pinned send failed:" << result.message;
    return result;
}

bool parseOctets(const QString &host, int octets[4])
{
    const QStringList parts = host.split(QLatin1Char('.'));
    if (parts.size() != 4)
        return false;
    for (int i = 0; i < 4; ++i) {
        bool ok = false;
        const int value = parts.at(i).toInt(&ok);
        if (!ok || value < 0 || value > 255)
            return false;
        octets[i] = value;
    }
    return true;
}

#if QT_CONFIG(ssl)
QSslCertificate leafFromErrors(const QList<QSslError> &errors)
{
    // A host name mismatch always refers to the peer's own certificate.
    for (const QSslError &error : errors) {
        if (error.error() == QSslError::HostNameMismatch && !error.certificate().isNull())
            return error.certificate();
    }
    for (const QSslError &error : errors) {
        if (!error.certificate().isNull())
            return error.certificate();
    }
    return QSslCertificate();
}
#endif

} // namespace

QString secureChannelErrorMessage(SecureChannelError error, const QString &details)
{
    switch (error) {
    case SecureChannelError::None:
        return QString();
    case SecureChannelError::InvalidHost:
        return QStringLiteral("Only private LAN Samsung hosts are allowed for direct TLS override.");
    case SecureChannelError::Timeout:
        return QStringLiteral("Samsung TV connection timed out.");
    case SecureChannelError::Unauthorized:
        return QStringLiteral("Samsung TV denied remote authorization.");
    case SecureChannelError::PinMismatch:
        return QStringLiteral("Samsung TV certificate fingerprint changed. Re-pair this TV.");
    case SecureChannelError::TrustChallengeMissing:
        return QStringLiteral("Samsung TLS trust challenge missing server trust.");
    case SecureChannelError::SendFailed:
        return QStringLiteral("Samsung payload failed to send: %1").arg(describeDetails(details));
    case SecureChannelError::SocketClosed:
        return QStringLiteral("Samsung WebSocket closed before it opened.");
    case SecureChannelError::ConnectFailed:
        return QStringLiteral("Samsung connection failed: %1").arg(describeDetails(details));
    }
    return QString();
}

bool isPrivateLanHost(const QString &host)
{
    const QString value = host.trimmed().toLower();
    if (value.isEmpty())
        return false;
    if (value == QLatin1String("localhost") || value.endsWith(QLatin1String(".local")))
        return true;

    int octets[4] = { 0, 0, 0, 0 };
    if (!parseOctets(value, octets))
        return false;

    if (octets[0] == 10 || octets[0] == 127)
        return true;
    if (octets[0] == 192 && octets[1] == 168)
        return true;
    if (octets[0] == 172 && octets[1] >= 16 && octets[1] <= 31)
        return true;
    return false;
}

QString normalizeFingerprint(const QString &raw)
{
    QString value = raw.trimmed().toLower();
    value.remove(QLatin1Char(':'));
    value.remove(QLatin1Char(' '));
    return value;
}

QString sha256Fingerprint(const QByteArray &certificateDer)
{
    return QString::fromLatin1(QCryptographicHash::hash(certificateDer, QCryptographicHash::Sha256).toHex());
}

TrustDecision evaluateServerTrust(const QByteArray &certificateDer,
                                  const QString &expectedHost,
                                  const QString &pinnedFingerprint)
{
    TrustDecision decision;
    if (!isPrivateLanHost(expectedHost)) {
        decision.reason = SecureChannelError::InvalidHost;
        return decision;
    }
    if (certificateDer.isEmpty()) {
        decision.reason = SecureChannelError::TrustChallengeMissing;
        return decision;
    }

    decision.observedFingerprint = sha256Fingerprint(certificateDer);
    const QString pinned = normalizeFingerprint(pinnedFingerprint);
    if (!pinned.isEmpty() && pinned != decision.observedFingerprint) {
        decision.reason = SecureChannelError::PinMismatch;
        return decision;
    }

    decision.accepted = true;
    return decision;
}

SecureSendResult sendPinned(const SecureSendRequest &request, const CancellationToken *cancel)
{
    const QString host = request.host.trimmed();
    if (!isPrivateLanHost(host))
        return failed(SecureChannelError::InvalidHost);

#if QT_CONFIG(ssl)
    WsChannel channel;
    channel.setRelaxedTls(false);

    QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
    ssl.setPeerVerifyMode(QSslSocket::VerifyPeer);
    // No trusted roots: every handshake raises sslErrors and reaches the pin check.
    ssl.setCaCertificates({});
    channel.socket()->setSslConfiguration(ssl);

    bool trustEvaluated = false;
    TrustDecision decision;
    QWebSocket *socket = channel.socket();
    QObject::connect(socket, &QWebSocket::sslErrors, &channel, [&](const QList<QSslError> &errors) {
        const QSslCertificate leaf = leafFromErrors(errors);
        trustEvaluated = true;
        decision = evaluateServerTrust(leaf.isNull() ? QByteArray() : leaf.toDer(), host,
                                       request.pinnedFingerprint);
        if (decision.accepted) {
            socket->ignoreSslErrors();
        } else {
            qCWarning(secureLog) << "rejecting TLS peer" << host << secureChannelErrorMessage(decision.reason);
            socket->abort();
        }
    });

    channel.open(samsungRemoteUrl(QStringLiteral("wss"), host, request.port, request.appName, request.token));

    const QDeadlineTimer openDeadline(request.openTimeoutMs > 0 ? request.openTimeoutMs : 5000);
    bool opened = false;
    while (!opened) {
        const WsChannel::Event event = channel.next(openDeadline, cancel);
        switch (event.type) {
        case WsChannel::EventType::Opened:
            opened = true;
            break;
        case WsChannel::EventType::Message:
            break;
        case WsChannel::EventType::Error:
        case WsChannel::EventType::Closed:
            if (trustEvaluated && !decision.accepted)
                return failed(decision.reason);
            if (event.type == WsChannel::EventType::Closed)
                return failed(SecureChannelError::SocketClosed);
            return failed(SecureChannelError::ConnectFailed, event.text);
        case WsChannel::EventType::Timeout:
            return failed(SecureChannelError::Timeout);
        case WsChannel::EventType::Cancelled:
            return failed(SecureChannelError::ConnectFailed, QStringLiteral("cancelled"));
        }
    }

    if (!trustEvaluated || !decision.accepted) {
        channel.close();
        return failed(SecureChannelError::TrustChallengeMissing);
    }

    QString sendError;
    if (!channel.sendText(samsungKeyFrame(request.key), &sendError)) {
        channel.close();
        return failed(SecureChannelError::SendFailed, sendError);
    }

    SecureSendResult result;
    result.certificateFingerprint = decision.observedFingerprint;

    const int waitMs = request.token.isEmpty() ? request.pairingWaitMs : request.tokenWaitMs;
    const QDeadlineTimer tokenDeadline(waitMs > 0 ? waitMs : 600);
    for (;;) {
        const WsChannel::Event event = channel.next(tokenDeadline, cancel);
        if (event.type == WsChannel::EventType::Message) {
            const SamsungEvent parsed = parseSamsungEvent(event.text);
            if (parsed.isUnauthorized()) {
                channel.close();
                SecureSendResult denied = failed(SecureChannelError::Unauthorized);
                denied.certificateFingerprint = decision.observedFingerprint;
                return denied;
            }
            if (parsed.isConnect() && !parsed.token.isEmpty()) {
                result.token = parsed.token;
                break;
            }
            continue;
        }
        if (event.type == WsChannel::EventType::Error) {
            channel.close();
            SecureSendResult broken = failed(SecureChannelError::ConnectFailed, event.text);
            broken.certificateFingerprint = decision.observedFingerprint;
            return broken;
        }
        // Timeout, close or cancel after the key went out: delivered without a new token.
        break;
    }

    channel.close();
    qCDebug(secureLog) << "pinned send delivered to" << host << (result.token.isEmpty() ? "without token" : "with token");
    return result;
#else
    Q_UNUSED(cancel);
    return failed(SecureChannelError::ConnectFailed, QStringLiteral("TLS support is not available"));
#endif
}

} // namespace tvremote
