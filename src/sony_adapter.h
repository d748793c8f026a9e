#pragma once

#include <QJsonDocument>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QUrl>

#include "brand_adapter.h"

namespace tvremote {

// BRAVIA IP control: the IRCC code table is read over JSON-RPC and key
// presses are SOAP calls, both authorised by the TV's pre-shared key.
class SonyAdapter final : public BrandAdapter
{
public:
    using CodeMap = QMap<QString, QString>;

    explicit SonyAdapter(const AdapterContext &context);

    Brand brand() const override { return Brand::Sony; }
    DispatchResult send(const TvProfile &profile, RemoteCommand command) override;
    DispatchResult completePairing(const TvProfile &profile,
                                   const QString &secret,
                                   const std::optional<PairingRequest> &challenge) override;
    ProbePlan probePlan(const QString &host, bool explicitHost) const override;

    static QStringList keyCandidates(RemoteCommand command);
    static QString normalizeCodeName(const QString &name);
    // Exact candidate match first, then the first code whose name contains a candidate.
    static QString findIrccCode(RemoteCommand command, const CodeMap &codes);
    static CodeMap parseRemoteControllerInfo(const QJsonDocument &body);

private:
    enum class CallStatus {
        Ok,
        Unauthorized,
        Failed
    };

    struct CodeFetch {
        CallStatus status = CallStatus::Failed;
        CodeMap codes;
        QString error;
    };

    struct CallResult {
        CallStatus status = CallStatus::Failed;
        QString error;
    };

    QList<QUrl> baseUrls(const TvProfile &profile) const;
    CodeFetch fetchCodes(const TvProfile &profile, const QString &psk) const;
    CallResult sendIrcc(const TvProfile &profile, const QString &psk, const QString &code) const;

    DispatchResult pairingRequired(const TvProfile &profile,
                                   const QString &message,
                                   std::optional<RemoteCommand> command) const;
    void storeCredentials(const QString &cacheKey, const QString &psk, const CodeMap &codes) const;
};

} // namespace tvremote
