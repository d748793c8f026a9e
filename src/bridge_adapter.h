#pragma once

#include <QString>

#include "brand_adapter.h"

namespace tvremote {

// Generic HTTP bridge running next to the TV (ADB, CEC or IR blaster).
// Every command is forwarded by name, so nothing is unmapped.
class BridgeAdapter final : public BrandAdapter
{
public:
    explicit BridgeAdapter(const AdapterContext &context);

    Brand brand() const override { return Brand::Other; }
    DispatchResult send(const TvProfile &profile, RemoteCommand command) override;
    ProbePlan probePlan(const QString &host, bool explicitHost) const override;

    // POWER, VOLUME_UP, DIGIT_3, NUMPAD_ENTER ...
    static QString commandName(RemoteCommand command);
};

} // namespace tvremote
