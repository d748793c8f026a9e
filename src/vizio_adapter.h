#pragma once

#include <optional>

#include <QJsonObject>
#include <QString>

#include "brand_adapter.h"

namespace tvremote {

// SmartCast REST API. Commands carry an AUTH token obtained through a PIN
// challenge shown on the TV.
class VizioAdapter final : public BrandAdapter
{
public:
    struct KeySpec {
        int codeset = 0;
        int code = 0;
    };

    explicit VizioAdapter(const AdapterContext &context);

    Brand brand() const override { return Brand::Vizio; }
    DispatchResult send(const TvProfile &profile, RemoteCommand command) override;
    DispatchResult completePairing(const TvProfile &profile,
                                   const QString &secret,
                                   const std::optional<PairingRequest> &challenge) override;
    ProbePlan probePlan(const QString &host, bool explicitHost) const override;

    static std::optional<KeySpec> keyFor(RemoteCommand command);
    static QString deviceIdFor(const TvProfile &profile);

    // ITEM lookups ignore key case; some firmware lowercases the names.
    static QJsonValue itemValue(const QJsonObject &payload, const QString &key);
    static QString statusResult(const QJsonObject &payload);
    static bool isPairingRequiredResult(const QString &result);

private:
    struct PutReply {
        bool reached = false;
        QJsonObject payload;
        QString error;
    };

    struct PairingStart {
        DispatchResult result;
        QString authToken;
    };

    PutReply putJson(const QString &host, const QString &path, const QJsonObject &body, const QString &authToken) const;
    PairingStart startPairing(const TvProfile &profile, RemoteCommand command) const;
    AttemptResult sendKey(const QString &host, const KeySpec &key, const QString &authToken) const;
};

} // namespace tvremote
