#include "network_scanner.h"

#include <QEventLoop>
#include <QHostAddress>
#include <QLoggingCategory>
#include <QNetworkInterface>
#include <QRegularExpression>
#include <QTimer>

Q_LOGGING_CATEGORY(scannerLog, "tvremote.scanner");

namespace tvremote {

namespace {

bool isOctetList(const QString &value, int count)
{
    static const QRegularExpression octet(QStringLiteral("^\\d{1,3}$"));
    const QStringList parts = value.split(QLatin1Char('.'));
    if (parts.size() != count)
        return false;
    for (const QString &part : parts) {
        if (!octet.match(part).hasMatch() || part.toInt() > 255)
            return false;
    }
    return true;
}

} // namespace

NetworkScanner::NetworkScanner(const HttpClient &http, const ScannerConfig &config, PlanProvider plans, QObject *parent)
    : QObject(parent)
    , m_http(http)
    , m_config(config)
    , m_plans(std::move(plans))
{
}

NetworkScanner::~NetworkScanner()
{
    if (m_token)
        m_token->cancel();
}

bool NetworkScanner::isValidHost(const QString &host)
{
    return isOctetList(host, 4);
}

bool NetworkScanner::isValidPrefix(const QString &prefix)
{
    return isOctetList(prefix, 3);
}

QString NetworkScanner::prefixOf(const QString &host)
{
    if (!isValidHost(host))
        return QString();
    return host.section(QLatin1Char('.'), 0, 2);
}

QString NetworkScanner::localNetworkPrefix()
{
    const QList<QNetworkInterface> interfaces = QNetworkInterface::allInterfaces();
    for (const QNetworkInterface &iface : interfaces) {
        const QNetworkInterface::InterfaceFlags flags = iface.flags();
        if (!flags.testFlag(QNetworkInterface::IsUp) || !flags.testFlag(QNetworkInterface::IsRunning)
            || flags.testFlag(QNetworkInterface::IsLoopBack)) {
            continue;
        }
        for (const QNetworkAddressEntry &entry : iface.addressEntries()) {
            const QHostAddress address = entry.ip();
            if (address.protocol() != QAbstractSocket::IPv4Protocol || address.isLoopback())
                continue;
            const QString prefix = prefixOf(address.toString());
            if (prefix.isEmpty() || prefix == QLatin1String("0.0.0") || prefix.startsWith(QLatin1String("127.")))
                continue;
            return prefix;
        }
    }
    return QString();
}

QStringList NetworkScanner::resolvePrefixes(const std::optional<QStringList> &requested) const
{
    if (requested && requested->isEmpty())
        return {};

    QStringList valid;
    if (requested) {
        for (const QString &raw : *requested) {
            const QString prefix = raw.trimmed();
            if (isValidPrefix(prefix) && !valid.contains(prefix))
                valid.append(prefix);
        }
    }
    if (!valid.isEmpty())
        return valid;

    if (m_config.detectLocalPrefix) {
        const QString local = localNetworkPrefix();
        if (!local.isEmpty())
            return { local };
    }

    QStringList defaults;
    for (const QString &prefix : m_config.defaultPrefixes) {
        if (isValidPrefix(prefix) && !defaults.contains(prefix))
            defaults.append(prefix);
    }
    return defaults;
}

QList<ScanTarget> NetworkScanner::buildTargets(const ScanOptions &options) const
{
    QList<ScanTarget> targets;
    QSet<QString> seen;

    for (const QString &raw : options.hosts) {
        const QString host = raw.trimmed();
        if (!isValidHost(host) || seen.contains(host))
            continue;
        seen.insert(host);
        targets.append({ host, true });
    }

    const int first = qBound(1, options.hostRangeStart.value_or(m_config.hostRangeStart), 254);
    const int last = qBound(first, options.hostRangeEnd.value_or(m_config.hostRangeEnd), 254);
    for (const QString &prefix : resolvePrefixes(options.prefixes)) {
        for (int i = first; i <= last; ++i) {
            const QString host = QStringLiteral("%1.%2").arg(prefix).arg(i);
            if (seen.contains(host))
                continue;
            seen.insert(host);
            targets.append({ host, false });
        }
    }
    return targets;
}

int NetworkScanner::resolveConcurrency(const ScanOptions &options) const
{
    return qBound(1, options.maxConcurrency.value_or(m_config.maxConcurrency), 128);
}

bool NetworkScanner::start(const ScanOptions &options)
{
    if (m_running) {
        qCWarning(scannerLog) << "scan already running";
        return false;
    }

    m_running = true;
    ++m_generation;
    m_token.reset(options.cancellationToken ? options.cancellationToken->createChild() : new CancellationToken);
    m_targets = buildTargets(options);
    m_results = QList<std::optional<DiscoveredDevice>>(m_targets.size());
    m_seenHosts.clear();
    m_cursor = 0;
    m_active = 0;
    m_concurrency = resolveConcurrency(options);

    qCInfo(scannerLog) << "scanning" << m_targets.size() << "hosts with" << m_concurrency << "workers";

    // Deferred so callers can connect to the signals after start() returns.
    const quint64 generation = m_generation;
    QTimer::singleShot(0, this, [this, generation]() {
        if (generation == m_generation)
            pump();
    });
    return true;
}

void NetworkScanner::cancel()
{
    if (m_token)
        m_token->cancel();
}

void NetworkScanner::pump()
{
    if (!m_running)
        return;

    while (!cancelled() && m_active < m_concurrency && m_cursor < m_targets.size())
        probeTarget(m_cursor++);

    if (m_active == 0 && (cancelled() || m_cursor >= m_targets.size()))
        finish();
}

void NetworkScanner::probeTarget(int index)
{
    ++m_active;
    const ScanTarget target = m_targets.at(index);
    const quint64 generation = m_generation;
    QPointer<NetworkScanner> self(this);

    auto done = [self, generation, index](const std::optional<DiscoveredDevice> &device) {
        if (!self || self->m_generation != generation)
            return;
        self->targetDone(index, device);
    };

    const QList<ProbePlan> plans = m_plans ? m_plans(target.host, target.explicitHost) : QList<ProbePlan>();
    raceProbePlans(m_http, plans, m_token.get(),
                   [self, generation, target, done](const std::optional<DiscoveredDevice> &device) {
                       if (!self || self->m_generation != generation)
                           return;
                       if (device || !target.explicitHost || self->cancelled()) {
                           done(device);
                           return;
                       }
                       const ProbePlan sweep = genericSweepPlan(target.host, self->m_config.genericPorts,
                                                                self->m_config.genericProbeTimeoutMs);
                       runProbePlan(self->m_http, sweep, self->m_token.get(), done);
                   });
}

void NetworkScanner::targetDone(int index, const std::optional<DiscoveredDevice> &device)
{
    --m_active;
    if (device && !m_seenHosts.contains(device->host)) {
        m_seenHosts.insert(device->host);
        m_results[index] = device;
        qCInfo(scannerLog) << "discovered" << device->id << brandId(device->brand) << "via" << device->source;
        emit deviceDiscovered(*device);
    }
    pump();
}

void NetworkScanner::finish()
{
    if (!m_running)
        return;
    m_running = false;

    QList<DiscoveredDevice> devices;
    for (const std::optional<DiscoveredDevice> &result : m_results) {
        if (result)
            devices.append(*result);
    }
    const bool wasCancelled = cancelled();
    qCInfo(scannerLog) << "scan finished:" << devices.size() << "devices" << (wasCancelled ? "(cancelled)" : "");
    emit finished(devices, wasCancelled);
}

QList<DiscoveredDevice> NetworkScanner::scanBlocking(const ScanOptions &options, bool *cancelled)
{
    QList<DiscoveredDevice> devices;
    bool wasCancelled = false;
    bool done = false;
    QEventLoop loop;

    const QMetaObject::Connection connection = connect(
        this, &NetworkScanner::finished, &loop,
        [&](const QList<DiscoveredDevice> &found, bool aborted) {
            devices = found;
            wasCancelled = aborted;
            done = true;
            loop.quit();
        });

    if (start(options) && !done)
        loop.exec();
    disconnect(connection);

    if (cancelled)
        *cancelled = wasCancelled;
    return devices;
}

} // namespace tvremote
