#include "panasonic_adapter.h"

#include <QLoggingCategory>
#include <QRegularExpression>

Q_LOGGING_CATEGORY(panasonicLog, "tvremote.adapters.panasonic");

namespace tvremote {

PanasonicAdapter::PanasonicAdapter(const AdapterContext &context)
    : BrandAdapter(context)
{
}

std::optional<QString> PanasonicAdapter::keyFor(RemoteCommand command)
{
    QString key;
    switch (command) {
    case RemoteCommand::Power: key = QStringLiteral("NRC_POWER"); break;
    case RemoteCommand::Input: key = QStringLiteral("NRC_CHG_INPUT"); break;
    case RemoteCommand::Up: key = QStringLiteral("NRC_UP"); break;
    case RemoteCommand::Down: key = QStringLiteral("NRC_DOWN"); break;
    case RemoteCommand::Left: key = QStringLiteral("NRC_LEFT"); break;
    case RemoteCommand::Right: key = QStringLiteral("NRC_RIGHT"); break;
    case RemoteCommand::Ok: key = QStringLiteral("NRC_ENTER"); break;
    case RemoteCommand::Back: key = QStringLiteral("NRC_RETURN"); break;
    case RemoteCommand::Home: key = QStringLiteral("NRC_HOME"); break;
    case RemoteCommand::Settings: key = QStringLiteral("NRC_SUBMENU"); break;
    case RemoteCommand::VolumeUp: key = QStringLiteral("NRC_VOLUP"); break;
    case RemoteCommand::VolumeDown: key = QStringLiteral("NRC_VOLDOWN"); break;
    case RemoteCommand::ChannelUp: key = QStringLiteral("NRC_CH_UP"); break;
    case RemoteCommand::ChannelDown: key = QStringLiteral("NRC_CH_DOWN"); break;
    case RemoteCommand::Mute: key = QStringLiteral("NRC_MUTE"); break;
    case RemoteCommand::Previous: key = QStringLiteral("NRC_REW"); break;
    case RemoteCommand::PlayPause: key = QStringLiteral("NRC_PLAY"); break;
    case RemoteCommand::Next: key = QStringLiteral("NRC_FF"); break;
    case RemoteCommand::Digit0:
    case RemoteCommand::Digit1:
    case RemoteCommand::Digit2:
    case RemoteCommand::Digit3:
    case RemoteCommand::Digit4:
    case RemoteCommand::Digit5:
    case RemoteCommand::Digit6:
    case RemoteCommand::Digit7:
    case RemoteCommand::Digit8:
    case RemoteCommand::Digit9:
        key = QStringLiteral("NRC_D%1").arg(static_cast<int>(command) - static_cast<int>(RemoteCommand::Digit0));
        break;
    case RemoteCommand::NumpadBackspace: key = QStringLiteral("NRC_RETURN"); break;
    case RemoteCommand::NumpadEnter: key = QStringLiteral("NRC_ENTER"); break;
    case RemoteCommand::Numpad: return std::nullopt;
    }
    return key + QStringLiteral("-ONOFF");
}

QByteArray PanasonicAdapter::sendKeyEnvelope(const QString &keyEvent)
{
    return QStringLiteral("<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                          "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
                          "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">\n"
                          "  <s:Body>\n"
                          "    <u:X_SendKey xmlns:u=\"urn:panasonic-com:service:p00NetworkControl:1\">\n"
                          "      <X_KeyEvent>%1</X_KeyEvent>\n"
                          "    </u:X_SendKey>\n"
                          "  </s:Body>\n"
                          "</s:Envelope>")
        .arg(keyEvent.toHtmlEscaped())
        .toUtf8();
}

bool PanasonicAdapter::isSoapFault(const QString &body)
{
    static const QRegularExpression fault(QStringLiteral("<\\s*(?:\\w+:)?fault"),
                                          QRegularExpression::CaseInsensitiveOption);
    return fault.match(body).hasMatch();
}

QString PanasonicAdapter::faultString(const QString &body)
{
    static const QRegularExpression tag(QStringLiteral("<faultstring>(.*?)</faultstring>"),
                                        QRegularExpression::CaseInsensitiveOption
                                            | QRegularExpression::DotMatchesEverythingOption);
    const QRegularExpressionMatch match = tag.match(body);
    if (!match.hasMatch())
        return QString();
    return match.captured(1).simplified();
}

bool PanasonicAdapter::isAuthorizationFault(const QString &fault)
{
    static const QRegularExpression auth(QStringLiteral("auth|forbid|denied|not allowed|session|authorize"),
                                         QRegularExpression::CaseInsensitiveOption);
    return auth.match(fault).hasMatch();
}

DispatchResult PanasonicAdapter::send(const TvProfile &profile, RemoteCommand command)
{
    const QString host = profile.hostOrEmpty();
    if (host.isEmpty())
        return missingHost();

    const std::optional<QString> key = keyFor(command);
    if (!key)
        return unmapped();

    const PanasonicConfig &cfg = config().panasonic;
    bool unauthorized = false;
    int lastStatus = 0;
    QString lastFault;
    QString lastError;

    for (int port : candidatePorts(profile.port, { cfg.port })) {
        HttpRequest request;
        request.method = QByteArrayLiteral("POST");
        request.url = makeUrl(QStringLiteral("http"), host, port, QStringLiteral("/nrc/control_0"));
        request.timeoutMs = cfg.requestTimeoutMs;
        request.body = sendKeyEnvelope(*key);
        request.headers.append({ QByteArrayLiteral("Content-Type"), QByteArrayLiteral("text/xml; charset=\"utf-8\"") });
        request.headers.append({ QByteArrayLiteral("SOAPACTION"),
                                 QByteArrayLiteral("\"urn:panasonic-com:service:p00NetworkControl:1#X_SendKey\"") });
        request.headers.append({ QByteArrayLiteral("Accept"), QByteArrayLiteral("text/xml, application/xml, */*") });

        const HttpResult result = http().send(request);
        if (!result.hasResponse()) {
            lastError = result.error;
            continue;
        }

        const QString body = QString::fromUtf8(result.payload);
        if (result.ok && !isSoapFault(body))
            return DispatchResult::success(QStringLiteral("Command sent to Panasonic TV."));

        lastStatus = result.statusCode;
        if (result.statusCode == 401 || result.statusCode == 403)
            unauthorized = true;
        const QString fault = faultString(body);
        if (!fault.isEmpty()) {
            lastFault = fault;
            if (isAuthorizationFault(fault))
                unauthorized = true;
        }
        qCDebug(panasonicLog) << "port" << port << "answered" << result.statusCode << fault;
    }

    if (unauthorized) {
        return DispatchResult::failure(QStringLiteral(
            "Panasonic TV denied the command. Enable TV Remote App / Network Remote Control in TV settings."));
    }
    if (!lastFault.isEmpty())
        return DispatchResult::failure(QStringLiteral("Panasonic TV returned a SOAP fault: %1").arg(lastFault));
    if (lastStatus > 0)
        return DispatchResult::failure(QStringLiteral("Panasonic TV rejected command (%1).").arg(lastStatus));

    qCWarning(panasonicLog) << "send failed for" << host << lastError;
    return DispatchResult::failure(QStringLiteral("Unable to send Panasonic command. %1").arg(describeError(lastError)));
}

ProbePlan PanasonicAdapter::probePlan(const QString &host, bool explicitHost) const
{
    Q_UNUSED(explicitHost);

    const PanasonicConfig &cfg = config().panasonic;
    const int port = cfg.port;
    const QString fallbackName = QStringLiteral("Panasonic TV (%1)").arg(host);

    auto evaluate = [host, port, fallbackName](const HttpResult &result) -> std::optional<DiscoveredDevice> {
        if (result.statusCode == 401 || result.statusCode == 403) {
            return makeDiscoveredDevice(QStringLiteral("panasonic-%1-auth").arg(host), Brand::Panasonic, fallbackName,
                                        host, port, QStringLiteral("panasonic"));
        }
        if (!result.hasResponse() || (!result.ok && result.statusCode >= 500))
            return std::nullopt;

        const QString body = QString::fromUtf8(result.payload);
        const QString text = body.toLower();
        if (!text.contains(QLatin1String("panasonic")) && !text.contains(QLatin1String("viera"))
            && !text.contains(QLatin1String("p00networkcontrol")) && !text.contains(QLatin1String("x_sendkey"))) {
            return std::nullopt;
        }

        QString nickname = xmlTagText(body, QStringLiteral("friendlyName"));
        if (nickname.isEmpty())
            nickname = xmlTagText(body, QStringLiteral("modelName"));
        if (nickname.isEmpty())
            nickname = fallbackName;
        return makeDiscoveredDevice(QStringLiteral("panasonic-%1").arg(host), Brand::Panasonic, nickname, host, port,
                                    QStringLiteral("panasonic"));
    };

    ProbePlan plan;
    plan.brand = Brand::Panasonic;
    plan.source = QStringLiteral("panasonic");
    for (const QString &path : { QStringLiteral("/nrc/sdd_0.xml"), QStringLiteral("/nrc/ddd.xml") })
        plan.steps.append(httpProbe(makeUrl(QStringLiteral("http"), host, port, path), cfg.probeTimeoutMs, evaluate));
    return plan;
}

} // namespace tvremote
