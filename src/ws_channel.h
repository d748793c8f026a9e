#pragma once

#include <functional>

#include <QDeadlineTimer>
#include <QObject>
#include <QQueue>
#include <QString>
#include <QUrl>
#include <QWebSocket>

class QEventLoop;

namespace tvremote {

class CancellationToken;

// WebSocket wrapped as a typed event queue. Socket callbacks only enqueue;
// a single consumer drains the queue with next() under a deadline.
class WsChannel : public QObject
{
    Q_OBJECT
public:
    enum class EventType {
        Opened,
        Message,
        Error,
        Closed,
        Timeout,
        Cancelled
    };

    struct Event {
        EventType type = EventType::Timeout;
        QString text;
    };

    explicit WsChannel(QObject *parent = nullptr);
    ~WsChannel() override;

    // Relaxed TLS accepts the self-signed certificates TVs serve. Turn it off
    // before open() to install a custom sslErrors policy on socket().
    void setRelaxedTls(bool relaxed) { m_relaxedTls = relaxed; }

    void open(const QUrl &url);
    bool sendText(const QString &text, QString *error = nullptr);
    void close();

    // Blocks on a local event loop until an event is queued, the deadline
    // passes (Timeout) or the token fires (Cancelled).
    Event next(const QDeadlineTimer &deadline, const CancellationToken *cancel = nullptr);

    bool hasPendingEvents() const { return !m_events.isEmpty(); }
    Event takeEvent();

    QWebSocket *socket() { return &m_socket; }

signals:
    void eventQueued();

private:
    void push(EventType type, const QString &text = QString());

    QWebSocket m_socket;
    QQueue<Event> m_events;
    QEventLoop *m_waiter = nullptr;
    bool m_relaxedTls = true;
};

const char *eventTypeName(WsChannel::EventType type);

// Opens a socket only to learn whether something accepts the handshake.
// done runs exactly once, from the event loop.
void probeSocketOpen(const QUrl &url,
                     int timeoutMs,
                     const CancellationToken *cancel,
                     std::function<void(bool opened)> done);

} // namespace tvremote
