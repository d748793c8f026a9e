#pragma once

#include <QString>

#include "bridge_adapter.h"

namespace tvremote {

// Fire TV has no open IP remote; commands go through the ADB bridge.
class FireTvAdapter final : public BrandAdapter
{
public:
    explicit FireTvAdapter(const AdapterContext &context);

    Brand brand() const override { return Brand::FireTv; }
    DispatchResult send(const TvProfile &profile, RemoteCommand command) override;
    ProbePlan probePlan(const QString &host, bool explicitHost) const override;
    bool deliversThroughBridge() const override { return true; }

    static bool looksLikeFireTv(const QString &text);

private:
    BridgeAdapter m_bridge;
};

} // namespace tvremote
