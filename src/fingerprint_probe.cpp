#include "fingerprint_probe.h"

#include <memory>

#include <QCoreApplication>
#include <QEventLoop>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QMetaObject>
#include <QNetworkAccessManager>
#include <QRegularExpression>

#include "cancellation.h"
#include "ws_channel.h"

Q_LOGGING_CATEGORY(probeLog, "tvremote.probe");

namespace tvremote {

namespace {

struct DeleteLater {
    void operator()(QObject *object) const
    {
        if (object)
            object->deleteLater();
    }
};

using TokenHandle = std::unique_ptr<CancellationToken, DeleteLater>;

void postLater(const HttpClient &http, std::function<void()> fn)
{
    QObject *context = http.manager() ? static_cast<QObject *>(http.manager()) : QCoreApplication::instance();
    QMetaObject::invokeMethod(context, std::move(fn), Qt::QueuedConnection);
}

class PlanRun : public std::enable_shared_from_this<PlanRun>
{
public:
    PlanRun(const HttpClient &http, const ProbePlan &plan, const CancellationToken *cancel, PlanCallback done)
        : m_http(http)
        , m_plan(plan)
        , m_cancel(cancel)
        , m_done(std::move(done))
    {
    }

    void next()
    {
        if (m_index >= m_plan.steps.size() || isCancelled(m_cancel)) {
            finish(std::nullopt);
            return;
        }

        const ProbeStep step = m_plan.steps.at(m_index++);
        auto self = shared_from_this();

        if (step.kind == ProbeStep::Kind::SocketOpen) {
            probeSocketOpen(step.socketUrl, step.socketTimeoutMs, m_cancel, [self, step](bool opened) {
                if (opened)
                    self->finish(step.socketDevice);
                else
                    self->next();
            });
            return;
        }

        m_http.start(step.request, [self, step](const HttpResult &result) {
            std::optional<DiscoveredDevice> device;
            if (!result.cancelled && step.evaluate)
                device = step.evaluate(result);
            if (device)
                self->finish(device);
            else
                self->next();
        }, m_cancel);
    }

private:
    void finish(const std::optional<DiscoveredDevice> &device)
    {
        if (m_finished)
            return;
        m_finished = true;
        if (device)
            qCDebug(probeLog) << m_plan.source << "matched" << device->host;
        m_done(device);
    }

    HttpClient m_http;
    ProbePlan m_plan;
    const CancellationToken *m_cancel = nullptr;
    PlanCallback m_done;
    int m_index = 0;
    bool m_finished = false;
};

struct MultiPlanState {
    QList<bool> finished;
    QList<std::optional<DiscoveredDevice>> results;
    TokenHandle child;
    bool reported = false;
};

TokenHandle makeChildToken(const CancellationToken *cancel)
{
    return TokenHandle(cancel ? cancel->createChild() : new CancellationToken);
}

} // namespace

ProbeStep httpProbe(const QUrl &url,
                    int timeoutMs,
                    std::function<std::optional<DiscoveredDevice>(const HttpResult &)> evaluate)
{
    ProbeStep step;
    step.kind = ProbeStep::Kind::Http;
    step.request.url = url;
    step.request.timeoutMs = timeoutMs;
    step.evaluate = std::move(evaluate);
    return step;
}

ProbeStep socketProbe(const QUrl &url, int timeoutMs, const DiscoveredDevice &device)
{
    ProbeStep step;
    step.kind = ProbeStep::Kind::SocketOpen;
    step.socketUrl = url;
    step.socketTimeoutMs = timeoutMs;
    step.socketDevice = device;
    return step;
}

DiscoveredDevice makeDiscoveredDevice(const QString &id,
                                      Brand brand,
                                      const QString &nickname,
                                      const QString &host,
                                      int port,
                                      const QString &source)
{
    DiscoveredDevice device;
    device.id = id;
    device.brand = brand;
    device.nickname = nickname;
    device.host = host;
    device.port = port;
    device.source = source;
    return device;
}

QString xmlTagText(const QString &xml, const QString &tag)
{
    const QRegularExpression re(QStringLiteral("<%1>(.*?)</%1>").arg(QRegularExpression::escape(tag)),
                                QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch match = re.match(xml);
    return match.hasMatch() ? match.captured(1).trimmed() : QString();
}

Brand guessBrandFromLabel(const QString &label)
{
    const QString value = label.toLower();
    if (value.contains(QLatin1String("samsung")))
        return Brand::Samsung;
    if (value.contains(QLatin1String("sony")) || value.contains(QLatin1String("bravia")))
        return Brand::Sony;
    if (value.contains(QLatin1String("roku")))
        return Brand::Roku;
    if (value.contains(QLatin1String("panasonic")))
        return Brand::Panasonic;
    if (value.contains(QLatin1String("vizio")))
        return Brand::Vizio;
    if (value.contains(QLatin1String("tcl")))
        return Brand::Tcl;
    if (value.contains(QLatin1String("lg")) || value.contains(QLatin1String("webos")))
        return Brand::Lg;
    if (value.contains(QLatin1String("philips")))
        return Brand::Philips;
    if (value.contains(QLatin1String("amazon")) || value.contains(QLatin1String("fire tv"))
        || value.contains(QLatin1String("aft"))) {
        return Brand::FireTv;
    }
    return Brand::Other;
}

void runProbePlan(const HttpClient &http, const ProbePlan &plan, const CancellationToken *cancel, PlanCallback done)
{
    auto run = std::make_shared<PlanRun>(http, plan, cancel, std::move(done));
    postLater(http, [run]() { run->next(); });
}

void raceProbePlans(const HttpClient &http,
                    const QList<ProbePlan> &plans,
                    const CancellationToken *cancel,
                    PlanCallback done)
{
    if (plans.isEmpty()) {
        postLater(http, [done]() { done(std::nullopt); });
        return;
    }

    auto state = std::make_shared<MultiPlanState>();
    state->finished = QList<bool>(plans.size(), false);
    state->results = QList<std::optional<DiscoveredDevice>>(plans.size());
    state->child = makeChildToken(cancel);

    auto settle = [state, done]() {
        if (state->reported)
            return;
        for (int i = 0; i < state->finished.size(); ++i) {
            if (!state->finished.at(i))
                return;
            if (state->results.at(i)) {
                state->reported = true;
                const DiscoveredDevice winner = *state->results.at(i);
                state->child->cancel();
                done(winner);
                return;
            }
        }
        state->reported = true;
        done(std::nullopt);
    };

    for (int i = 0; i < plans.size(); ++i) {
        runProbePlan(http, plans.at(i), state->child.get(),
                     [state, settle, i](const std::optional<DiscoveredDevice> &device) {
                         state->finished[i] = true;
                         state->results[i] = device;
                         settle();
                     });
    }
}

void collectProbePlans(const HttpClient &http,
                       const QList<ProbePlan> &plans,
                       const CancellationToken *cancel,
                       CollectCallback done)
{
    if (plans.isEmpty()) {
        postLater(http, [done]() { done({}); });
        return;
    }

    auto state = std::make_shared<MultiPlanState>();
    state->finished = QList<bool>(plans.size(), false);
    state->results = QList<std::optional<DiscoveredDevice>>(plans.size());
    state->child = makeChildToken(cancel);

    for (int i = 0; i < plans.size(); ++i) {
        runProbePlan(http, plans.at(i), state->child.get(),
                     [state, done, i](const std::optional<DiscoveredDevice> &device) {
                         state->finished[i] = true;
                         state->results[i] = device;
                         if (state->reported || state->finished.contains(false))
                             return;
                         state->reported = true;
                         done(state->results);
                     });
    }
}

QList<std::optional<DiscoveredDevice>> collectProbePlansBlocking(const HttpClient &http,
                                                                 const QList<ProbePlan> &plans,
                                                                 const CancellationToken *cancel)
{
    QList<std::optional<DiscoveredDevice>> results;
    bool finished = false;
    QEventLoop loop;
    collectProbePlans(http, plans, cancel, [&](const QList<std::optional<DiscoveredDevice>> &collected) {
        results = collected;
        finished = true;
        loop.quit();
    });
    if (!finished)
        loop.exec();
    return results;
}

ProbePlan chromecastProbePlan(const QString &host, int port, int timeoutMs)
{
    ProbePlan plan;
    plan.brand = Brand::Other;
    plan.source = QStringLiteral("chromecast");
    plan.steps.append(httpProbe(makeUrl(QStringLiteral("http"), host, port, QStringLiteral("/setup/eureka_info")),
                                timeoutMs,
                                [host, port](const HttpResult &result) -> std::optional<DiscoveredDevice> {
                                    if (!result.ok)
                                        return std::nullopt;
                                    const QJsonDocument doc = QJsonDocument::fromJson(result.payload);
                                    if (!doc.isObject())
                                        return std::nullopt;
                                    const QJsonObject root = doc.object();
                                    const QJsonObject info = root.value(QStringLiteral("device_info")).toObject();
                                    const QString manufacturer = info.value(QStringLiteral("manufacturer")).toString();
                                    const QString model = info.value(QStringLiteral("model_name")).toString();
                                    QString nickname = root.value(QStringLiteral("name")).toString();
                                    if (nickname.isEmpty())
                                        nickname = model.isEmpty() ? QStringLiteral("Cast TV") : model;
                                    return makeDiscoveredDevice(QStringLiteral("cast-%1").arg(host),
                                                                guessBrandFromLabel(manufacturer + QLatin1Char(' ') + model),
                                                                nickname, host, port,
                                                                QStringLiteral("chromecast"));
                                }));
    return plan;
}

ProbePlan genericSweepPlan(const QString &host, const QList<int> &ports, int timeoutMs)
{
    ProbePlan plan;
    plan.brand = Brand::Other;
    plan.source = QStringLiteral("generic");
    for (int port : ports) {
        plan.steps.append(httpProbe(makeUrl(QStringLiteral("http"), host, port, QStringLiteral("/")),
                                    timeoutMs,
                                    [host, port](const HttpResult &result) -> std::optional<DiscoveredDevice> {
                                        // Any HTTP answer marks a candidate worth offering.
                                        if (!result.hasResponse())
                                            return std::nullopt;
                                        return makeDiscoveredDevice(QStringLiteral("generic-%1-%2").arg(host).arg(port),
                                                                    Brand::Other,
                                                                    QStringLiteral("Potential TV (%1)").arg(host),
                                                                    host, port, QStringLiteral("bridge"));
                                    }));
    }
    return plan;
}

} // namespace tvremote
