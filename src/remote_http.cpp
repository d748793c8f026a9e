#include "remote_http.h"

#include <memory>

#include <QCoreApplication>
#include <QEventLoop>
#include <QLoggingCategory>
#include <QMetaObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslSocket>
#endif

#include "cancellation.h"

Q_LOGGING_CATEGORY(httpLog, "tvremote.http");

namespace tvremote {

namespace {

struct ReplyState {
    bool timedOut = false;
    bool cancelled = false;
    bool reported = false;
};

HttpResult collectResult(QNetworkReply *reply, const ReplyState &state)
{
    HttpResult result;
    result.timedOut = state.timedOut;
    result.cancelled = state.cancelled;

    if (state.timedOut) {
        result.error = QStringLiteral("Request timed out");
        return result;
    }
    if (state.cancelled) {
        result.error = QStringLiteral("Request cancelled");
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();

    if (result.statusCode <= 0) {
        result.error = reply->error() != QNetworkReply::NoError
            ? reply->errorString()
            : QStringLiteral("No HTTP response");
        return result;
    }

    if (isHttpSuccess(result.statusCode)) {
        result.ok = true;
    } else {
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    }
    return result;
}

} // namespace

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

HttpResult HttpClient::get(const QUrl &url, int timeoutMs, const CancellationToken *cancel) const
{
    HttpRequest request;
    request.url = url;
    request.timeoutMs = timeoutMs;
    return send(request, cancel);
}

HttpResult HttpClient::postJson(const QUrl &url,
                                const QByteArray &payload,
                                int timeoutMs,
                                const QList<QPair<QByteArray, QByteArray>> &extraHeaders) const
{
    HttpRequest request;
    request.method = QByteArrayLiteral("POST");
    request.url = url;
    request.body = payload;
    request.timeoutMs = timeoutMs;
    request.headers.append({ QByteArrayLiteral("Content-Type"), QByteArrayLiteral("application/json") });
    request.headers.append(extraHeaders);
    return send(request);
}

HttpResult HttpClient::send(const HttpRequest &request, const CancellationToken *cancel) const
{
    HttpResult result;
    bool done = false;
    QEventLoop loop;

    start(request,
          [&](const HttpResult &finished) {
              result = finished;
              done = true;
              loop.quit();
          },
          cancel);

    if (!done)
        loop.exec();
    return result;
}

void HttpClient::start(const HttpRequest &request, Callback onFinished, const CancellationToken *cancel) const
{
    auto failLater = [this, onFinished](const QString &error) {
        HttpResult result;
        result.error = error;
        QObject *context = m_manager ? static_cast<QObject *>(m_manager) : QCoreApplication::instance();
        QMetaObject::invokeMethod(context, [onFinished, result]() { onFinished(result); }, Qt::QueuedConnection);
    };

    if (!m_manager) {
        failLater(QStringLiteral("Network manager unavailable"));
        return;
    }

    if (isCancelled(cancel)) {
        HttpResult result;
        result.cancelled = true;
        result.error = QStringLiteral("Request cancelled");
        QMetaObject::invokeMethod(m_manager, [onFinished, result]() { onFinished(result); }, Qt::QueuedConnection);
        return;
    }

    QNetworkRequest requestObj;
    QString buildError;
    if (!buildRequest(request, &requestObj, &buildError)) {
        failLater(buildError);
        return;
    }

    QNetworkReply *reply = nullptr;
    if (request.method == QByteArrayLiteral("GET")) {
        reply = m_manager->get(requestObj);
    } else if (request.method == QByteArrayLiteral("POST")) {
        reply = m_manager->post(requestObj, request.body);
    } else if (request.method == QByteArrayLiteral("PUT")) {
        reply = m_manager->put(requestObj, request.body);
    } else {
        reply = m_manager->sendCustomRequest(requestObj, request.method, request.body);
    }

    if (!reply) {
        failLater(QStringLiteral("Failed to create network request"));
        return;
    }

    auto state = std::make_shared<ReplyState>();

    auto *timer = new QTimer(reply);
    timer->setSingleShot(true);
    QObject::connect(timer, &QTimer::timeout, reply, [reply, state]() {
        state->timedOut = true;
        reply->abort();
    });

    if (cancel) {
        QObject::connect(cancel, &CancellationToken::cancelled, reply, [reply, state]() {
            state->cancelled = true;
            reply->abort();
        });
    }

    QObject::connect(reply, &QNetworkReply::finished, reply, [reply, state, onFinished]() {
        if (state->reported)
            return;
        state->reported = true;
        const HttpResult result = collectResult(reply, *state);
        if (!result.hasResponse() && !result.cancelled) {
            qCDebug(httpLog) << reply->request().url().toString() << "failed:" << result.error;
        }
        reply->deleteLater();
        onFinished(result);
    });

    timer->start(request.timeoutMs > 0 ? request.timeoutMs : 1200);
}

bool HttpClient::buildRequest(const HttpRequest &request, QNetworkRequest *out, QString *error) const
{
    if (!out) {
        if (error)
            *error = QStringLiteral("Request object is null");
        return false;
    }

    if (!request.url.isValid() || request.url.host().isEmpty()) {
        if (error)
            *error = QStringLiteral("Invalid request URL");
        return false;
    }

    QNetworkRequest requestObj(request.url);
    requestObj.setRawHeader("User-Agent", "tvremote-core/1.0");
    requestObj.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
    for (const auto &header : request.headers)
        requestObj.setRawHeader(header.first, header.second);

#if QT_CONFIG(ssl)
    if (request.url.scheme() == QLatin1String("https")) {
        // TVs serve self-signed certificates; pinning is handled separately.
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        requestObj.setSslConfiguration(ssl);
    }
#endif

    *out = requestObj;
    if (error)
        error->clear();
    return true;
}

QUrl makeUrl(const QString &scheme, const QString &host, int port, const QString &path)
{
    QUrl url;
    url.setScheme(scheme);
    url.setHost(host);
    if (port > 0)
        url.setPort(port);
    if (path.startsWith(QLatin1Char('/')))
        url.setPath(path);
    else
        url.setPath(QStringLiteral("/") + path);
    return url;
}

QString describeError(const QString &error)
{
    const QString trimmed = error.trimmed();
    if (trimmed.isEmpty())
        return QStringLiteral("connection failed");
    return trimmed;
}

QString base64EncodeAscii(const QString &value)
{
    return QString::fromLatin1(value.toLatin1().toBase64());
}

bool isHttpSuccess(int statusCode)
{
    return statusCode >= 200 && statusCode < 300;
}

} // namespace tvremote
