#include <gtest/gtest.h>

#include <QJsonObject>
#include <QUrlQuery>

#include "remote_types.h"
#include "samsung_protocol.h"

using namespace tvremote;

TEST(RemoteTypes, BrandIdsRoundTripAndIgnoreCase) {
    for (Brand brand : allBrands())
        EXPECT_EQ(brandFromId(brandId(brand)), brand) << brandId(brand).toStdString();

    EXPECT_EQ(brandFromId(QStringLiteral(" Samsung ")), Brand::Samsung);
    EXPECT_EQ(brandFromId(QStringLiteral("FIRETV")), Brand::FireTv);
    EXPECT_FALSE(brandFromId(QStringLiteral("hisense")).has_value());
    EXPECT_EQ(brandDisplayName(Brand::FireTv), QStringLiteral("Fire TV"));
}

TEST(RemoteTypes, CommandVocabularyIsComplete) {
    const QList<RemoteCommand> commands = allCommands();
    EXPECT_EQ(commands.size(), 31);
    for (RemoteCommand command : commands)
        EXPECT_EQ(commandFromId(commandId(command)), command);

    EXPECT_EQ(commandFromId(QStringLiteral("volumeup")), RemoteCommand::VolumeUp);
    EXPECT_FALSE(commandFromId(QStringLiteral("rewind")).has_value());
}

TEST(RemoteTypes, VizioChallengeAcceptsStringNumbers) {
    QJsonObject challenge;
    challenge.insert(QStringLiteral("challengeType"), QStringLiteral("1"));
    challenge.insert(QStringLiteral("pairingReqToken"), QStringLiteral("884422"));
    challenge.insert(QStringLiteral("deviceId"), QStringLiteral("tvremote-tv-1"));
    QJsonObject obj;
    obj.insert(QStringLiteral("brand"), QStringLiteral("vizio"));
    obj.insert(QStringLiteral("challenge"), challenge);

    const std::optional<PairingRequest> request = PairingRequest::fromJson(obj);
    ASSERT_TRUE(request.has_value());
    const auto *vizio = std::get_if<VizioPairingChallenge>(&request->challenge);
    ASSERT_NE(vizio, nullptr);
    EXPECT_EQ(vizio->challengeType, 1);
    EXPECT_EQ(vizio->pairingToken, 884422);
    EXPECT_EQ(vizio->deviceId, QStringLiteral("tvremote-tv-1"));
}

TEST(RemoteTypes, VizioChallengeWithoutDeviceIdIsRejected) {
    QJsonObject obj;
    obj.insert(QStringLiteral("brand"), QStringLiteral("vizio"));
    obj.insert(QStringLiteral("challenge"),
               QJsonObject { { QStringLiteral("challengeType"), 1 }, { QStringLiteral("pairingReqToken"), 5 } });
    EXPECT_FALSE(PairingRequest::fromJson(obj).has_value());

    obj.insert(QStringLiteral("brand"), QStringLiteral("roku"));
    EXPECT_FALSE(PairingRequest::fromJson(obj).has_value());
}

TEST(SamsungProtocol, RemoteUrlCarriesEncodedNameAndToken) {
    const QUrl url = samsungRemoteUrl(QStringLiteral("wss"), QStringLiteral("192.168.1.20"), 8002,
                                      QStringLiteral("PhoneRemote"), QStringLiteral("1234"));
    EXPECT_EQ(url.scheme(), QStringLiteral("wss"));
    EXPECT_EQ(url.port(), 8002);
    EXPECT_EQ(url.path(), QStringLiteral("/api/v2/channels/samsung.remote.control"));
    const QUrlQuery query(url);
    EXPECT_EQ(query.queryItemValue(QStringLiteral("name"), QUrl::FullyDecoded), QStringLiteral("UGhvbmVSZW1vdGU="));
    EXPECT_EQ(query.queryItemValue(QStringLiteral("token"), QUrl::FullyDecoded), QStringLiteral("1234"));

    const QUrl anonymous = samsungRemoteUrl(QStringLiteral("ws"), QStringLiteral("192.168.1.20"), 8001,
                                            QStringLiteral("PhoneRemote"));
    EXPECT_FALSE(QUrlQuery(anonymous).hasQueryItem(QStringLiteral("token")));
}

TEST(SamsungProtocol, TokenIsReadFromClientsWhenDataHasNone) {
    const SamsungEvent event = parseSamsungEvent(QStringLiteral(
        R"({"event":"ms.channel.connect","data":{"clients":[{"attributes":{}},{"attributes":{"token":51234567}}]}})"));
    EXPECT_TRUE(event.valid);
    EXPECT_TRUE(event.isConnect());
    EXPECT_EQ(event.token, QStringLiteral("51234567"));

    EXPECT_TRUE(parseSamsungEvent(QStringLiteral(R"({"event":"ms.channel.unauthorized"})")).isUnauthorized());
    EXPECT_FALSE(parseSamsungEvent(QStringLiteral("not json")).valid);
}
