#include "ws_channel.h"

#include <memory>

#include <QEventLoop>
#include <QLoggingCategory>
#include <QTimer>
#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslError>
#include <QSslSocket>
#endif

#include "cancellation.h"

Q_LOGGING_CATEGORY(wsLog, "tvremote.ws");

namespace tvremote {

WsChannel::WsChannel(QObject *parent)
    : QObject(parent)
{
    connect(&m_socket, &QWebSocket::connected, this, [this]() { push(EventType::Opened); });
    connect(&m_socket, &QWebSocket::textMessageReceived, this, [this](const QString &message) {
        push(EventType::Message, message);
    });
    connect(&m_socket, &QWebSocket::errorOccurred, this, [this](QAbstractSocket::SocketError) {
        push(EventType::Error, m_socket.errorString());
    });
    connect(&m_socket, &QWebSocket::disconnected, this, [this]() {
        push(EventType::Closed, m_socket.closeReason());
    });
#if QT_CONFIG(ssl)
    connect(&m_socket, &QWebSocket::sslErrors, this, [this](const QList<QSslError> &) {
        if (m_relaxedTls)
            m_socket.ignoreSslErrors();
    });
#endif
}

WsChannel::~WsChannel()
{
    QObject::disconnect(&m_socket, nullptr, this, nullptr);
    m_socket.abort();
}

void WsChannel::open(const QUrl &url)
{
#if QT_CONFIG(ssl)
    if (m_relaxedTls && url.scheme() == QLatin1String("wss")) {
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        m_socket.setSslConfiguration(ssl);
    }
#endif
    qCDebug(wsLog) << "opening" << url.toString(QUrl::RemoveQuery);
    m_socket.open(url);
}

bool WsChannel::sendText(const QString &text, QString *error)
{
    if (m_socket.state() != QAbstractSocket::ConnectedState) {
        if (error)
            *error = QStringLiteral("socket is not connected");
        return false;
    }
    const qint64 written = m_socket.sendTextMessage(text);
    if (written <= 0) {
        if (error)
            *error = m_socket.errorString();
        return false;
    }
    if (error)
        error->clear();
    return true;
}

void WsChannel::close()
{
    if (m_socket.state() == QAbstractSocket::ConnectedState)
        m_socket.close();
    else
        m_socket.abort();
}

WsChannel::Event WsChannel::next(const QDeadlineTimer &deadline, const CancellationToken *cancel)
{
    if (!m_events.isEmpty())
        return m_events.dequeue();
    if (isCancelled(cancel))
        return { EventType::Cancelled, QString() };
    if (deadline.hasExpired())
        return { EventType::Timeout, QString() };

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    if (cancel)
        connect(cancel, &CancellationToken::cancelled, &loop, &QEventLoop::quit);
    if (!deadline.isForever())
        timer.start(static_cast<int>(qMax<qint64>(0, deadline.remainingTime())));

    m_waiter = &loop;
    loop.exec();
    m_waiter = nullptr;

    if (!m_events.isEmpty())
        return m_events.dequeue();
    if (isCancelled(cancel))
        return { EventType::Cancelled, QString() };
    return { EventType::Timeout, QString() };
}

WsChannel::Event WsChannel::takeEvent()
{
    if (m_events.isEmpty())
        return { EventType::Timeout, QString() };
    return m_events.dequeue();
}

void WsChannel::push(EventType type, const QString &text)
{
    if (type == EventType::Error)
        qCDebug(wsLog) << "socket error:" << text;
    m_events.enqueue({ type, text });
    if (m_waiter)
        m_waiter->quit();
    emit eventQueued();
}

const char *eventTypeName(WsChannel::EventType type)
{
    switch (type) {
    case WsChannel::EventType::Opened:
        return "opened";
    case WsChannel::EventType::Message:
        return "message";
    case WsChannel::EventType::Error:
        return "error";
    case WsChannel::EventType::Closed:
        return "closed";
    case WsChannel::EventType::Timeout:
        return "timeout";
    case WsChannel::EventType::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

void probeSocketOpen(const QUrl &url,
                     int timeoutMs,
                     const CancellationToken *cancel,
                     std::function<void(bool opened)> done)
{
    auto *channel = new WsChannel;
    auto settled = std::make_shared<bool>(false);
    auto finish = [channel, settled, done](bool opened) {
        if (*settled)
            return;
        *settled = true;
        channel->deleteLater();
        done(opened);
    };

    QObject::connect(channel, &WsChannel::eventQueued, channel, [channel, finish]() {
        const WsChannel::Event event = channel->takeEvent();
        finish(event.type == WsChannel::EventType::Opened);
    });

    auto *timer = new QTimer(channel);
    timer->setSingleShot(true);
    QObject::connect(timer, &QTimer::timeout, channel, [finish]() { finish(false); });

    if (cancel)
        QObject::connect(cancel, &CancellationToken::cancelled, channel, [finish]() { finish(false); });

    const bool alreadyCancelled = isCancelled(cancel);
    QTimer::singleShot(0, channel, [channel, timer, finish, url, timeoutMs, alreadyCancelled]() {
        if (alreadyCancelled) {
            finish(false);
            return;
        }
        timer->start(timeoutMs > 0 ? timeoutMs : 700);
        channel->open(url);
    });
}

} // namespace tvremote
