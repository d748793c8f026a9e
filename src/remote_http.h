#pragma once

#include <functional>

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrl>

class QNetworkAccessManager;
class QNetworkRequest;

namespace tvremote {

class CancellationToken;

struct HttpRequest {
    QByteArray method = QByteArrayLiteral("GET");
    QUrl url;
    QList<QPair<QByteArray, QByteArray>> headers;
    QByteArray body;
    int timeoutMs = 1200;
};

struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;
    bool timedOut = false;
    bool cancelled = false;

    // True when the server answered with an HTTP status line, whatever the code.
    bool hasResponse() const { return statusCode > 0; }
};

class HttpClient
{
public:
    using Callback = std::function<void(const HttpResult &)>;

    explicit HttpClient(QNetworkAccessManager *manager);

    HttpResult get(const QUrl &url, int timeoutMs, const CancellationToken *cancel = nullptr) const;

    HttpResult postJson(const QUrl &url,
                        const QByteArray &payload,
                        int timeoutMs,
                        const QList<QPair<QByteArray, QByteArray>> &extraHeaders = {}) const;

    // Blocking request: spins a local event loop until the reply finishes,
    // the timer fires or the token is cancelled.
    HttpResult send(const HttpRequest &request, const CancellationToken *cancel = nullptr) const;

    // Starts the request and reports through onFinished exactly once. The
    // callback is always invoked from the event loop, never from inside start().
    void start(const HttpRequest &request, Callback onFinished, const CancellationToken *cancel = nullptr) const;

    QNetworkAccessManager *manager() const { return m_manager; }

private:
    bool buildRequest(const HttpRequest &request, QNetworkRequest *out, QString *error = nullptr) const;

    QNetworkAccessManager *m_manager = nullptr;
};

QUrl makeUrl(const QString &scheme, const QString &host, int port, const QString &path);

// Error text normalised for user facing messages.
QString describeError(const QString &error);

QString base64EncodeAscii(const QString &value);

bool isHttpSuccess(int statusCode);

} // namespace tvremote
