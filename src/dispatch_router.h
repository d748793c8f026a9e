#pragma once

#include <map>
#include <memory>

#include <QList>

#include "brand_adapter.h"
#include "remote_http.h"
#include "remote_types.h"

namespace tvremote {

// Chooses the adapter for a profile. Brands without a dedicated protocol
// (TCL, other) are fingerprinted first and fall back to the bridge.
//
// The router owns every registered adapter and the bridge. Pointers handed
// out by adapterFor() and bridge() stay valid until the adapter is replaced
// or the router is destroyed.
class DispatchRouter
{
public:
    explicit DispatchRouter(const HttpClient &http);

    DispatchRouter(const DispatchRouter &) = delete;
    DispatchRouter &operator=(const DispatchRouter &) = delete;

    // Replaces any adapter already registered for the same brand.
    void registerAdapter(std::unique_ptr<BrandAdapter> adapter);
    void setBridge(std::unique_ptr<BrandAdapter> bridge);

    // nullptr when no adapter is registered for the brand.
    BrandAdapter *adapterFor(Brand brand) const;
    BrandAdapter *bridge() const { return m_bridge.get(); }

    // Order in which probe-positive adapters are tried for undeclared brands.
    static QList<Brand> fallbackPriority();
    static bool hasDedicatedProtocol(Brand brand);

    // Declared brands go straight to their adapter and its result is returned
    // unchanged. Otherwise the first fingerprinted adapter that succeeds or asks
    // for pairing wins, and the bridge is tried at most once as the last resort.
    DispatchResult dispatch(const TvProfile &profile, RemoteCommand command);

    // Brands whose fingerprint matched the host, in fallback priority order.
    // Blocks until every probe plan has finished.
    QList<Brand> detectBrands(const QString &host) const;

private:
    HttpClient m_http;
    std::map<Brand, std::unique_ptr<BrandAdapter>> m_adapters;
    std::unique_ptr<BrandAdapter> m_bridge;
};

} // namespace tvremote
