#include "firetv_adapter.h"

#include <QLoggingCategory>
#include <QStringList>

Q_LOGGING_CATEGORY(fireTvLog, "tvremote.adapters.firetv");

namespace tvremote {

FireTvAdapter::FireTvAdapter(const AdapterContext &context)
    : BrandAdapter(context)
    , m_bridge(context)
{
}

bool FireTvAdapter::looksLikeFireTv(const QString &text)
{
    const QString value = text.toLower();
    return value.contains(QLatin1String("fire tv")) || value.contains(QLatin1String("amazon"))
        || value.contains(QLatin1String("<modelname>aft"));
}

DispatchResult FireTvAdapter::send(const TvProfile &profile, RemoteCommand command)
{
    const DispatchResult bridged = m_bridge.send(profile, command);
    if (bridged.ok)
        return DispatchResult::success(QStringLiteral("Command sent to Fire TV."));

    qCDebug(fireTvLog) << "bridge delegate failed:" << bridged.message;
    return DispatchResult::failure(
        QStringLiteral("Fire TV control requires bridge/ADB integration. %1").arg(bridged.message));
}

ProbePlan FireTvAdapter::probePlan(const QString &host, bool explicitHost) const
{
    Q_UNUSED(explicitHost);

    const FireTvConfig &cfg = config().firetv;
    const QString fallbackName = QStringLiteral("Fire TV (%1)").arg(host);

    ProbePlan plan;
    plan.brand = Brand::FireTv;
    plan.source = QStringLiteral("firetv");

    const int descriptorPort = cfg.descriptorPort;
    plan.steps.append(httpProbe(
        makeUrl(QStringLiteral("http"), host, descriptorPort, QStringLiteral("/ssdp/device-desc.xml")),
        cfg.probeTimeoutMs,
        [host, descriptorPort, fallbackName](const HttpResult &result) -> std::optional<DiscoveredDevice> {
            if (!result.ok)
                return std::nullopt;
            const QString xml = QString::fromUtf8(result.payload);
            const QString manufacturer = xmlTagText(xml, QStringLiteral("manufacturer"));
            const QString model = xmlTagText(xml, QStringLiteral("modelName"));
            const QString friendly = xmlTagText(xml, QStringLiteral("friendlyName"));
            const QString merged = QStringList { manufacturer, model, friendly }.join(QLatin1Char(' '));
            if (!looksLikeFireTv(merged) && !model.startsWith(QLatin1String("aft"), Qt::CaseInsensitive))
                return std::nullopt;
            const QString nickname = !friendly.isEmpty() ? friendly : (!model.isEmpty() ? model : fallbackName);
            return makeDiscoveredDevice(QStringLiteral("firetv-%1").arg(host), Brand::FireTv, nickname, host,
                                        descriptorPort, QStringLiteral("firetv"));
        }));

    // Cast fallback for sticks whose DIAL descriptor is disabled.
    const int castPort = cfg.castPort;
    plan.steps.append(httpProbe(makeUrl(QStringLiteral("http"), host, castPort, QStringLiteral("/setup/eureka_info")),
                                cfg.probeTimeoutMs,
                                [host, castPort, fallbackName](const HttpResult &result) -> std::optional<DiscoveredDevice> {
                                    if (!result.ok || !looksLikeFireTv(QString::fromUtf8(result.payload)))
                                        return std::nullopt;
                                    return makeDiscoveredDevice(QStringLiteral("firetv-%1").arg(host), Brand::FireTv,
                                                                fallbackName, host, castPort, QStringLiteral("firetv"));
                                }));
    return plan;
}

} // namespace tvremote
