#include "samsung_protocol.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrlQuery>

#include "remote_http.h"

namespace tvremote {

namespace {

QString tokenText(const QJsonValue &value)
{
    if (value.isString())
        return value.toString();
    if (value.isDouble())
        return QString::number(static_cast<qint64>(value.toDouble()));
    return {};
}

} // namespace

QUrl samsungRemoteUrl(const QString &scheme,
                      const QString &host,
                      int port,
                      const QString &appName,
                      const QString &token)
{
    QUrl url = makeUrl(scheme, host, port, QStringLiteral("/api/v2/channels/samsung.remote.control"));
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("name"), base64EncodeAscii(appName));
    if (!token.isEmpty())
        query.addQueryItem(QStringLiteral("token"), token);
    url.setQuery(query);
    return url;
}

QString samsungKeyFrame(const QString &key)
{
    QJsonObject params;
    params.insert(QStringLiteral("Cmd"), QStringLiteral("Click"));
    params.insert(QStringLiteral("DataOfCmd"), key);
    params.insert(QStringLiteral("Option"), QStringLiteral("false"));
    params.insert(QStringLiteral("TypeOfRemote"), QStringLiteral("SendRemoteKey"));

    QJsonObject frame;
    frame.insert(QStringLiteral("method"), QStringLiteral("ms.remote.control"));
    frame.insert(QStringLiteral("params"), params);
    return QString::fromUtf8(QJsonDocument(frame).toJson(QJsonDocument::Compact));
}

SamsungEvent parseSamsungEvent(const QString &text)
{
    SamsungEvent out;
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8());
    if (!doc.isObject())
        return out;

    const QJsonObject root = doc.object();
    out.event = root.value(QStringLiteral("event")).toString();
    out.valid = !out.event.isEmpty();

    const QJsonObject data = root.value(QStringLiteral("data")).toObject();
    out.token = tokenText(data.value(QStringLiteral("token")));
    if (!out.token.isEmpty())
        return out;

    for (const QJsonValue &client : data.value(QStringLiteral("clients")).toArray()) {
        const QJsonObject attributes = client.toObject().value(QStringLiteral("attributes")).toObject();
        const QString token = tokenText(attributes.value(QStringLiteral("token")));
        if (!token.isEmpty()) {
            out.token = token;
            break;
        }
    }
    return out;
}

} // namespace tvremote
