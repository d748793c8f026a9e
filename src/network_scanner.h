#pragma once

#include <functional>
#include <memory>
#include <optional>

#include <QList>
#include <QMetaType>
#include <QObject>
#include <QPointer>
#include <QSet>
#include <QString>
#include <QStringList>

#include "cancellation.h"
#include "fingerprint_probe.h"
#include "remote_config.h"
#include "remote_http.h"
#include "remote_types.h"

namespace tvremote {

struct ScanOptions {
    // Unset: local interface prefix, then the configured defaults.
    // Set but empty: scan the explicit hosts only.
    std::optional<QStringList> prefixes;
    QStringList hosts;
    std::optional<int> hostRangeStart;
    std::optional<int> hostRangeEnd;
    std::optional<int> maxConcurrency;
    CancellationToken *cancellationToken = nullptr;
};

struct ScanTarget {
    QString host;
    bool explicitHost = false;
};

// Sweeps IPv4 hosts with a bounded worker pool. Every host races the brand
// fingerprint plans; hosts the user named also get the generic port sweep.
class NetworkScanner : public QObject
{
    Q_OBJECT
public:
    // Probe plans for one host, highest priority first.
    using PlanProvider = std::function<QList<ProbePlan>(const QString &host, bool explicitHost)>;

    NetworkScanner(const HttpClient &http, const ScannerConfig &config, PlanProvider plans, QObject *parent = nullptr);
    ~NetworkScanner() override;

    static bool isValidHost(const QString &host);
    static bool isValidPrefix(const QString &prefix);
    static QString prefixOf(const QString &host);

    // Prefix of the first active non-loopback IPv4 interface, empty if none.
    static QString localNetworkPrefix();

    QStringList resolvePrefixes(const std::optional<QStringList> &requested) const;
    QList<ScanTarget> buildTargets(const ScanOptions &options) const;
    int resolveConcurrency(const ScanOptions &options) const;

    bool isRunning() const { return m_running; }

    // Results are streamed through deviceDiscovered and summarised by
    // finished. Returns false if a scan is already running.
    bool start(const ScanOptions &options);

    QList<DiscoveredDevice> scanBlocking(const ScanOptions &options, bool *cancelled = nullptr);

public slots:
    void cancel();

signals:
    void deviceDiscovered(const tvremote::DiscoveredDevice &device);
    void finished(const QList<tvremote::DiscoveredDevice> &devices, bool cancelled);

private:
    struct TokenDeleter {
        void operator()(CancellationToken *token) const
        {
            if (token)
                token->deleteLater();
        }
    };

    void pump();
    void probeTarget(int index);
    void targetDone(int index, const std::optional<DiscoveredDevice> &device);
    void finish();
    bool cancelled() const { return isCancelled(m_token.get()); }

    HttpClient m_http;
    ScannerConfig m_config;
    PlanProvider m_plans;

    std::unique_ptr<CancellationToken, TokenDeleter> m_token;
    QList<ScanTarget> m_targets;
    QList<std::optional<DiscoveredDevice>> m_results;
    QSet<QString> m_seenHosts;
    int m_cursor = 0;
    int m_active = 0;
    int m_concurrency = 1;
    quint64 m_generation = 0;
    bool m_running = false;
};

} // namespace tvremote

Q_DECLARE_METATYPE(tvremote::DiscoveredDevice)
