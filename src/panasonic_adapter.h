#pragma once

#include <optional>

#include <QString>

#include "brand_adapter.h"

namespace tvremote {

// VIERA network remote: UPnP SOAP X_SendKey on the nrc control endpoint.
class PanasonicAdapter final : public BrandAdapter
{
public:
    explicit PanasonicAdapter(const AdapterContext &context);

    Brand brand() const override { return Brand::Panasonic; }
    DispatchResult send(const TvProfile &profile, RemoteCommand command) override;
    ProbePlan probePlan(const QString &host, bool explicitHost) const override;

    static std::optional<QString> keyFor(RemoteCommand command);
    static QByteArray sendKeyEnvelope(const QString &keyEvent);

    static bool isSoapFault(const QString &body);
    // Whitespace collapsed; empty when the body has no faultstring.
    static QString faultString(const QString &body);
    static bool isAuthorizationFault(const QString &fault);
};

} // namespace tvremote
