#include "remote_engine.h"

#include <QLoggingCategory>
#include <QNetworkAccessManager>

#include "bridge_adapter.h"
#include "firetv_adapter.h"
#include "lg_adapter.h"
#include "panasonic_adapter.h"
#include "philips_adapter.h"
#include "roku_adapter.h"
#include "samsung_adapter.h"
#include "sony_adapter.h"
#include "vizio_adapter.h"

Q_LOGGING_CATEGORY(engineLog, "tvremote.engine");

namespace tvremote {

RemoteEngine::RemoteEngine(const EngineConfig &config, std::unique_ptr<KeyValueStorage> storage, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_network(new QNetworkAccessManager(this))
    , m_storage(std::move(storage))
{
    if (!m_storage)
        m_storage = std::make_unique<SettingsStorage>(m_config.storage.path);

    m_credentials = std::make_unique<CredentialStore>(m_storage.get());
    m_sessions = std::make_unique<PairingSessionManager>(m_storage.get());

    AdapterContext context;
    context.http = HttpClient(m_network);
    context.credentials = m_credentials.get();
    context.sessions = m_sessions.get();
    context.config = m_config;

    m_router = std::make_unique<DispatchRouter>(context.http);
    m_router->registerAdapter(std::make_unique<SamsungAdapter>(context));
    m_router->registerAdapter(std::make_unique<LgAdapter>(context));
    m_router->registerAdapter(std::make_unique<SonyAdapter>(context));
    m_router->registerAdapter(std::make_unique<VizioAdapter>(context));
    m_router->registerAdapter(std::make_unique<PanasonicAdapter>(context));
    m_router->registerAdapter(std::make_unique<PhilipsAdapter>(context));
    m_router->registerAdapter(std::make_unique<RokuAdapter>(context));
    m_router->registerAdapter(std::make_unique<FireTvAdapter>(context));
    m_router->setBridge(std::make_unique<BridgeAdapter>(context));

    m_scanner = new NetworkScanner(context.http, m_config.scanner,
                                   [this](const QString &host, bool explicitHost) {
                                       return scanPlans(host, explicitHost);
                                   },
                                   this);
    connect(m_scanner, &NetworkScanner::deviceDiscovered, this, &RemoteEngine::deviceDiscovered);
    connect(m_scanner, &NetworkScanner::finished, this, &RemoteEngine::scanFinished);
}

RemoteEngine::~RemoteEngine()
{
    if (m_scanner)
        m_scanner->cancel();
}

QList<ProbePlan> RemoteEngine::scanPlans(const QString &host, bool explicitHost) const
{
    static const QList<Brand> order = { Brand::Roku, Brand::Samsung, Brand::Sony, Brand::Lg,
                                        Brand::Vizio, Brand::Philips, Brand::Panasonic, Brand::FireTv };
    QList<ProbePlan> plans;
    for (Brand brand : order) {
        if (const BrandAdapter *adapter = m_router->adapterFor(brand))
            plans.append(adapter->probePlan(host, explicitHost));
    }
    plans.append(chromecastProbePlan(host, m_config.firetv.castPort, m_config.firetv.probeTimeoutMs));
    if (const BrandAdapter *bridge = m_router->bridge())
        plans.append(bridge->probePlan(host, explicitHost));
    return plans;
}

DispatchResult RemoteEngine::dispatch(const TvProfile &profile, RemoteCommand command)
{
    const DispatchResult result = m_router->dispatch(profile, command);
    if (result.pairing) {
        const QString key = CredentialStore::cacheKey(profile);
        if (!m_sessions->find(key))
            m_sessions->remember(key, PairingSession { *result.pairing, command });
    }
    if (!result.ok && !result.pairing)
        qCWarning(engineLog) << commandId(command) << "to" << profile.hostOrEmpty() << "failed:" << result.message;
    return result;
}

DispatchResult RemoteEngine::completePairing(const TvProfile &profile,
                                             const QString &secret,
                                             const std::optional<PairingRequest> &challenge)
{
    const QString key = CredentialStore::cacheKey(profile);
    const std::optional<PairingSession> session = m_sessions->find(key);

    Brand brand = profile.brand;
    if (challenge)
        brand = challenge->brand;
    else if (session)
        brand = session->request.brand;

    BrandAdapter *adapter = m_router->adapterFor(brand);
    if (!adapter)
        return DispatchResult::failure(QStringLiteral("%1 TVs do not support pairing.").arg(brandDisplayName(brand)));

    const DispatchResult paired = adapter->completePairing(profile, secret, challenge);
    if (!paired.ok)
        return paired;

    m_sessions->clear(key);
    if (!session || !session->pendingCommand)
        return paired;

    const RemoteCommand pending = *session->pendingCommand;
    qCInfo(engineLog) << "resuming" << commandId(pending) << "after pairing";
    DispatchResult resumed = adapter->send(profile, pending);
    resumed.message = paired.message + QLatin1Char(' ') + resumed.message;
    return resumed;
}

bool RemoteEngine::scan(const ScanOptions &options)
{
    return m_scanner->start(options);
}

QList<DiscoveredDevice> RemoteEngine::scanBlocking(const ScanOptions &options, bool *cancelled)
{
    return m_scanner->scanBlocking(options, cancelled);
}

void RemoteEngine::cancelScan()
{
    m_scanner->cancel();
}

int RemoteEngine::forget(const TvProfile &profile)
{
    const int removed = m_credentials->forget(profile);
    m_sessions->clear(CredentialStore::cacheKey(profile));
    return removed;
}

} // namespace tvremote
