#pragma once

#include <QString>
#include <QUrl>

namespace tvremote {

// Frames and events of the Samsung remote control channel, shared by the
// plain socket path and the pinned TLS path.
struct SamsungEvent {
    bool valid = false;
    QString event;
    QString token;

    bool isUnauthorized() const { return event == QLatin1String("ms.channel.unauthorized"); }
    bool isConnect() const { return event == QLatin1String("ms.channel.connect"); }
};

QUrl samsungRemoteUrl(const QString &scheme,
                      const QString &host,
                      int port,
                      const QString &appName,
                      const QString &token = QString());

QString samsungKeyFrame(const QString &key);

// Token comes from data.token or the first data.clients[].attributes.token;
// numeric tokens are rendered as decimal strings.
SamsungEvent parseSamsungEvent(const QString &text);

} // namespace tvremote
