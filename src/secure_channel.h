#pragma once

#include <optional>

#include <QByteArray>
#include <QString>

namespace tvremote {

class CancellationToken;

enum class SecureChannelError {
    None,
    InvalidHost,
    Timeout,
    Unauthorized,
    PinMismatch,
    TrustChallengeMissing,
    SendFailed,
    SocketClosed,
    ConnectFailed
};

QString secureChannelErrorMessage(SecureChannelError error, const QString &details = QString());

struct TrustDecision {
    bool accepted = false;
    SecureChannelError reason = SecureChannelError::None;
    QString observedFingerprint;
};

struct SecureSendRequest {
    QString host;
    int port = 8002;
    QString appName = QStringLiteral("PhoneRemote");
    QString key;
    QString token;
    QString pinnedFingerprint;
    int openTimeoutMs = 5000;
    int tokenWaitMs = 600;
    int pairingWaitMs = 12000;
};

struct SecureSendResult {
    SecureChannelError error = SecureChannelError::None;
    QString message;
    QString token;
    QString certificateFingerprint;

    bool ok() const { return error == SecureChannelError::None; }
};

// localhost, *.local, 10/8, 127/8, 192.168/16 and 172.16/12.
bool isPrivateLanHost(const QString &host);

// Lowercase hex without ':' separators or spaces; empty when nothing is left.
QString normalizeFingerprint(const QString &raw);

QString sha256Fingerprint(const QByteArray &certificateDer);

// Pinning policy for the TLS trust hook. Pure: no I/O, no state.
TrustDecision evaluateServerTrust(const QByteArray &certificateDer,
                                  const QString &expectedHost,
                                  const QString &pinnedFingerprint);

// Pinned-TLS variant of the Samsung remote socket: validates the host,
// checks the leaf certificate against the pin, sends one key and waits
// briefly for a token or an unauthorized event. The socket is closed on
// every path.
SecureSendResult sendPinned(const SecureSendRequest &request, const CancellationToken *cancel = nullptr);

} // namespace tvremote
