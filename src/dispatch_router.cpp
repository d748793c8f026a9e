#include "dispatch_router.h"

#include <optional>

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(routerLog, "tvremote.router");

namespace tvremote {

DispatchRouter::DispatchRouter(const HttpClient &http)
    : m_http(http)
{
}

void DispatchRouter::registerAdapter(std::unique_ptr<BrandAdapter> adapter)
{
    if (!adapter)
        return;
    const Brand brand = adapter->brand();
    m_adapters[brand] = std::move(adapter);
}

void DispatchRouter::setBridge(std::unique_ptr<BrandAdapter> bridge)
{
    m_bridge = std::move(bridge);
}

BrandAdapter *DispatchRouter::adapterFor(Brand brand) const
{
    const auto it = m_adapters.find(brand);
    return it == m_adapters.end() ? nullptr : it->second.get();
}

QList<Brand> DispatchRouter::fallbackPriority()
{
    return { Brand::Samsung, Brand::Lg, Brand::Sony, Brand::Vizio,
             Brand::Roku, Brand::Philips, Brand::Panasonic, Brand::FireTv };
}

bool DispatchRouter::hasDedicatedProtocol(Brand brand)
{
    return brand != Brand::Tcl && brand != Brand::Other;
}

QList<Brand> DispatchRouter::detectBrands(const QString &host) const
{
    QList<Brand> candidates;
    QList<ProbePlan> plans;
    for (Brand brand : fallbackPriority()) {
        const BrandAdapter *adapter = adapterFor(brand);
        if (!adapter)
            continue;
        const ProbePlan plan = adapter->probePlan(host, false);
        if (plan.isEmpty())
            continue;
        candidates.append(brand);
        plans.append(plan);
    }

    const QList<std::optional<DiscoveredDevice>> results = collectProbePlansBlocking(m_http, plans);
    QList<Brand> matched;
    for (int i = 0; i < candidates.size() && i < results.size(); ++i) {
        if (results.at(i))
            matched.append(candidates.at(i));
    }
    qCDebug(routerLog) << host << "matched" << matched.size() << "protocols";
    return matched;
}

DispatchResult DispatchRouter::dispatch(const TvProfile &profile, RemoteCommand command)
{
    if (hasDedicatedProtocol(profile.brand)) {
        if (BrandAdapter *adapter = adapterFor(profile.brand))
            return adapter->send(profile, command);
        qCWarning(routerLog) << "no adapter registered for" << brandId(profile.brand);
    }

    const QString host = profile.hostOrEmpty();
    if (host.isEmpty())
        return DispatchResult::failure(QStringLiteral("No TV host configured yet."));

    std::optional<DispatchResult> bridged;
    for (Brand brand : detectBrands(host)) {
        BrandAdapter *adapter = adapterFor(brand);
        const DispatchResult result = adapter->send(profile, command);
        if (result.ok || result.pairing) {
            qCInfo(routerLog) << host << "answered as" << brandId(brand);
            return result;
        }
        qCDebug(routerLog) << brandId(brand) << "attempt failed:" << result.message;
        if (adapter->deliversThroughBridge())
            bridged = result;
    }

    // A delegating adapter already used the bridge for this command.
    if (!bridged) {
        if (!m_bridge)
            return DispatchResult::failure(QStringLiteral("No supported TV protocol responded."));
        bridged = m_bridge->send(profile, command);
        if (bridged->ok)
            return *bridged;
    }
    return DispatchResult::failure(QStringLiteral("No supported TV protocol responded. %1").arg(bridged->message));
}

} // namespace tvremote
