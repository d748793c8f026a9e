#pragma once

#include <functional>
#include <optional>

#include <QList>
#include <QString>
#include <QUrl>

#include "remote_http.h"
#include "remote_types.h"

namespace tvremote {

class CancellationToken;

// One low-timeout check. Http steps hand the reply to evaluate(); SocketOpen
// steps report socketDevice when the handshake succeeds.
struct ProbeStep {
    enum class Kind {
        Http,
        SocketOpen
    };

    Kind kind = Kind::Http;
    HttpRequest request;
    std::function<std::optional<DiscoveredDevice>(const HttpResult &)> evaluate;

    QUrl socketUrl;
    int socketTimeoutMs = 700;
    DiscoveredDevice socketDevice;
};

// Steps of one brand, tried in order until one matches.
struct ProbePlan {
    Brand brand = Brand::Other;
    QString source;
    QList<ProbeStep> steps;

    bool isEmpty() const { return steps.isEmpty(); }
};

ProbeStep httpProbe(const QUrl &url,
                    int timeoutMs,
                    std::function<std::optional<DiscoveredDevice>(const HttpResult &)> evaluate);
ProbeStep socketProbe(const QUrl &url, int timeoutMs, const DiscoveredDevice &device);

DiscoveredDevice makeDiscoveredDevice(const QString &id,
                                      Brand brand,
                                      const QString &nickname,
                                      const QString &host,
                                      int port,
                                      const QString &source);

// First <tag>...</tag> of an XML body, trimmed. Case-insensitive.
QString xmlTagText(const QString &xml, const QString &tag);

// Brand guess from free text such as a cast manufacturer or model name.
Brand guessBrandFromLabel(const QString &label);

using PlanCallback = std::function<void(const std::optional<DiscoveredDevice> &)>;
using CollectCallback = std::function<void(const QList<std::optional<DiscoveredDevice>> &)>;

// All runners report exactly once, from the event loop.
void runProbePlan(const HttpClient &http, const ProbePlan &plan, const CancellationToken *cancel, PlanCallback done);

// Runs every plan concurrently. The first plan (in list order) with a
// positive result wins as soon as every plan before it has finished; the
// remaining probes are aborted.
void raceProbePlans(const HttpClient &http,
                    const QList<ProbePlan> &plans,
                    const CancellationToken *cancel,
                    PlanCallback done);

// Runs every plan concurrently and reports all results, index aligned with plans.
void collectProbePlans(const HttpClient &http,
                       const QList<ProbePlan> &plans,
                       const CancellationToken *cancel,
                       CollectCallback done);

QList<std::optional<DiscoveredDevice>> collectProbePlansBlocking(const HttpClient &http,
                                                                 const QList<ProbePlan> &plans,
                                                                 const CancellationToken *cancel = nullptr);

// Discovery-only plans with no control adapter behind them.
ProbePlan chromecastProbePlan(const QString &host, int port, int timeoutMs);
ProbePlan genericSweepPlan(const QString &host, const QList<int> &ports, int timeoutMs);

} // namespace tvremote
