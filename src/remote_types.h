#pragma once

#include <optional>
#include <variant>

#include <QJsonObject>
#include <QList>
#include <QString>

namespace tvremote {

enum class Brand {
    Samsung,
    Lg,
    Sony,
    Vizio,
    Panasonic,
    Philips,
    Roku,
    FireTv,
    Tcl,
    Other
};

enum class RemoteCommand {
    Power,
    Input,
    Up,
    Down,
    Left,
    Right,
    Ok,
    Back,
    Home,
    Settings,
    VolumeUp,
    VolumeDown,
    ChannelUp,
    ChannelDown,
    Mute,
    Previous,
    PlayPause,
    Next,
    Numpad,
    Digit0,
    Digit1,
    Digit2,
    Digit3,
    Digit4,
    Digit5,
    Digit6,
    Digit7,
    Digit8,
    Digit9,
    NumpadBackspace,
    NumpadEnter
};

QString brandId(Brand brand);
QString brandDisplayName(Brand brand);
std::optional<Brand> brandFromId(const QString &id);
QList<Brand> allBrands();

QString commandId(RemoteCommand command);
std::optional<RemoteCommand> commandFromId(const QString &id);
QList<RemoteCommand> allCommands();

// Saved TV as owned by the profile store. brand + host form the identity the
// credential cache is keyed on; nickname is cosmetic.
struct TvProfile {
    QString id;
    Brand brand = Brand::Other;
    QString nickname;
    std::optional<QString> host;
    std::optional<int> port;

    QString hostOrEmpty() const { return host ? host->trimmed() : QString(); }
};

struct VizioPairingChallenge {
    int challengeType = 0;
    qint64 pairingToken = 0;
    QString deviceId;
};

struct SonyPairingChallenge {
    QString kind = QStringLiteral("psk");
};

using PairingChallenge = std::variant<VizioPairingChallenge, SonyPairingChallenge>;

struct PairingRequest {
    Brand brand = Brand::Vizio;
    PairingChallenge challenge;

    QJsonObject toJson() const;
    static std::optional<PairingRequest> fromJson(const QJsonObject &obj);
};

struct DispatchResult {
    bool ok = false;
    QString message;
    std::optional<PairingRequest> pairing;

    static DispatchResult success(const QString &message);
    static DispatchResult failure(const QString &message);
    static DispatchResult pairingRequired(const QString &message, const PairingRequest &request);
};

struct DiscoveredDevice {
    QString id;
    Brand brand = Brand::Other;
    QString nickname;
    QString host;
    int port = 0;
    QString source;

    QJsonObject toJson() const;
};

inline bool operator==(const DiscoveredDevice &a, const DiscoveredDevice &b)
{
    return a.id == b.id && a.brand == b.brand && a.nickname == b.nickname && a.host == b.host
        && a.port == b.port && a.source == b.source;
}

} // namespace tvremote
