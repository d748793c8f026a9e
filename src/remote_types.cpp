#include "remote_types.h"

#include <QJsonValue>

namespace tvremote {

namespace {

struct BrandEntry {
    Brand brand;
    const char *id;
    const char *display;
};

constexpr BrandEntry kBrands[] = {
    { Brand::Samsung, "samsung", "Samsung" },
    { Brand::Lg, "lg", "LG" },
    { Brand::Sony, "sony", "Sony" },
    { Brand::Vizio, "vizio", "Vizio" },
    { Brand::Panasonic, "panasonic", "Panasonic" },
    { Brand::Philips, "philips", "Philips" },
    { Brand::Roku, "roku", "Roku" },
    { Brand::FireTv, "firetv", "Fire TV" },
    { Brand::Tcl, "tcl", "TCL" },
    { Brand::Other, "other", "Other" },
};

struct CommandEntry {
    RemoteCommand command;
    const char *id;
};

constexpr CommandEntry kCommands[] = {
    { RemoteCommand::Power, "power" },
    { RemoteCommand::Input, "input" },
    { RemoteCommand::Up, "up" },
    { RemoteCommand::Down, "down" },
    { RemoteCommand::Left, "left" },
    { RemoteCommand::Right, "right" },
    { RemoteCommand::Ok, "ok" },
    { RemoteCommand::Back, "back" },
    { RemoteCommand::Home, "home" },
    { RemoteCommand::Settings, "settings" },
    { RemoteCommand::VolumeUp, "volumeUp" },
    { RemoteCommand::VolumeDown, "volumeDown" },
    { RemoteCommand::ChannelUp, "channelUp" },
    { RemoteCommand::ChannelDown, "channelDown" },
    { RemoteCommand::Mute, "mute" },
    { RemoteCommand::Previous, "previous" },
    { RemoteCommand::PlayPause, "playPause" },
    { RemoteCommand::Next, "next" },
    { RemoteCommand::Numpad, "numpad" },
    { RemoteCommand::Digit0, "digit0" },
    { RemoteCommand::Digit1, "digit1" },
    { RemoteCommand::Digit2, "digit2" },
    { RemoteCommand::Digit3, "digit3" },
    { RemoteCommand::Digit4, "digit4" },
    { RemoteCommand::Digit5, "digit5" },
    { RemoteCommand::Digit6, "digit6" },
    { RemoteCommand::Digit7, "digit7" },
    { RemoteCommand::Digit8, "digit8" },
    { RemoteCommand::Digit9, "digit9" },
    { RemoteCommand::NumpadBackspace, "numpadBackspace" },
    { RemoteCommand::NumpadEnter, "numpadEnter" },
};

qint64 readNumber(const QJsonValue &value, bool *ok)
{
    if (value.isDouble()) {
        *ok = true;
        return static_cast<qint64>(value.toDouble());
    }
    if (value.isString()) {
        return value.toString().trimmed().toLongLong(ok);
    }
    *ok = false;
    return 0;
}

} // namespace

QString brandId(Brand brand)
{
    for (const BrandEntry &entry : kBrands) {
        if (entry.brand == brand)
            return QString::fromLatin1(entry.id);
    }
    return QStringLiteral("other");
}

QString brandDisplayName(Brand brand)
{
    for (const BrandEntry &entry : kBrands) {
        if (entry.brand == brand)
            return QString::fromLatin1(entry.display);
    }
    return QStringLiteral("Other");
}

std::optional<Brand> brandFromId(const QString &id)
{
    const QString needle = id.trimmed().toLower();
    for (const BrandEntry &entry : kBrands) {
        if (needle == QLatin1String(entry.id))
            return entry.brand;
    }
    return std::nullopt;
}

QList<Brand> allBrands()
{
    QList<Brand> out;
    for (const BrandEntry &entry : kBrands)
        out.append(entry.brand);
    return out;
}

QString commandId(RemoteCommand command)
{
    for (const CommandEntry &entry : kCommands) {
        if (entry.command == command)
            return QString::fromLatin1(entry.id);
    }
    return {};
}

std::optional<RemoteCommand> commandFromId(const QString &id)
{
    const QString needle = id.trimmed();
    for (const CommandEntry &entry : kCommands) {
        if (needle.compare(QLatin1String(entry.id), Qt::CaseInsensitive) == 0)
            return entry.command;
    }
    return std::nullopt;
}

QList<RemoteCommand> allCommands()
{
    QList<RemoteCommand> out;
    for (const CommandEntry &entry : kCommands)
        out.append(entry.command);
    return out;
}

QJsonObject PairingRequest::toJson() const
{
    QJsonObject challengeObj;
    if (const auto *vizio = std::get_if<VizioPairingChallenge>(&challenge)) {
        challengeObj.insert(QStringLiteral("challengeType"), vizio->challengeType);
        challengeObj.insert(QStringLiteral("pairingReqToken"), static_cast<double>(vizio->pairingToken));
        challengeObj.insert(QStringLiteral("deviceId"), vizio->deviceId);
    } else if (const auto *sony = std::get_if<SonyPairingChallenge>(&challenge)) {
        challengeObj.insert(QStringLiteral("type"), sony->kind);
    }

    QJsonObject obj;
    obj.insert(QStringLiteral("brand"), brandId(brand));
    obj.insert(QStringLiteral("challenge"), challengeObj);
    return obj;
}

std::optional<PairingRequest> PairingRequest::fromJson(const QJsonObject &obj)
{
    const std::optional<Brand> brand = brandFromId(obj.value(QStringLiteral("brand")).toString());
    const QJsonObject challengeObj = obj.value(QStringLiteral("challenge")).toObject();
    if (!brand)
        return std::nullopt;

    PairingRequest request;
    request.brand = *brand;

    if (*brand == Brand::Vizio) {
        bool typeOk = false;
        bool tokenOk = false;
        VizioPairingChallenge challenge;
        challenge.challengeType = static_cast<int>(readNumber(challengeObj.value(QStringLiteral("challengeType")), &typeOk));
        challenge.pairingToken = readNumber(challengeObj.value(QStringLiteral("pairingReqToken")), &tokenOk);
        challenge.deviceId = challengeObj.value(QStringLiteral("deviceId")).toString().trimmed();
        if (!typeOk || !tokenOk || challenge.deviceId.isEmpty())
            return std::nullopt;
        request.challenge = challenge;
        return request;
    }

    if (*brand == Brand::Sony) {
        SonyPairingChallenge challenge;
        const QString kind = challengeObj.value(QStringLiteral("type")).toString();
        if (!kind.isEmpty() && kind != challenge.kind)
            return std::nullopt;
        request.challenge = challenge;
        return request;
    }

    return std::nullopt;
}

DispatchResult DispatchResult::success(const QString &message)
{
    DispatchResult result;
    result.ok = true;
    result.message = message;
    return result;
}

DispatchResult DispatchResult::failure(const QString &message)
{
    DispatchResult result;
    result.message = message;
    return result;
}

DispatchResult DispatchResult::pairingRequired(const QString &message, const PairingRequest &request)
{
    DispatchResult result;
    result.message = message;
    result.pairing = request;
    return result;
}

QJsonObject DiscoveredDevice::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), id);
    obj.insert(QStringLiteral("brand"), brandId(brand));
    obj.insert(QStringLiteral("nickname"), nickname);
    obj.insert(QStringLiteral("host"), host);
    obj.insert(QStringLiteral("port"), port);
    obj.insert(QStringLiteral("source"), source);
    return obj;
}

} // namespace tvremote
