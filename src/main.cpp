#include <atomic>
#include <csignal>
#include <iostream>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QTimer>

#include "cancellation.h"
#include "remote_config.h"
#include "remote_engine.h"
#include "remote_types.h"

namespace {

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

QString describePairing(const tvremote::PairingRequest &request)
{
    if (std::holds_alternative<tvremote::SonyPairingChallenge>(request.challenge))
        return QStringLiteral("enter the Pre-Shared Key configured on the TV with: pair <psk>");
    return QStringLiteral("enter the PIN shown on the TV with: pair <pin>");
}

int printResult(const tvremote::DispatchResult &result)
{
    std::cout << result.message.toStdString() << '\n';
    if (result.pairing) {
        std::cout << "pairing required (" << tvremote::brandId(result.pairing->brand).toStdString()
                  << "): " << describePairing(*result.pairing).toStdString() << '\n';
        return 2;
    }
    return result.ok ? 0 : 1;
}

bool readProfile(const QCommandLineParser &parser, tvremote::TvProfile *profile, QString *error)
{
    const QString brandText = parser.value(QStringLiteral("brand")).trimmed().toLower();
    const std::optional<tvremote::Brand> brand = tvremote::brandFromId(brandText.isEmpty() ? QStringLiteral("other") : brandText);
    if (!brand) {
        *error = QStringLiteral("unknown brand: %1").arg(brandText);
        return false;
    }

    profile->brand = *brand;
    profile->id = parser.value(QStringLiteral("id"));
    if (profile->id.isEmpty())
        profile->id = QStringLiteral("cli");
    profile->nickname = parser.value(QStringLiteral("name"));

    const QString host = parser.value(QStringLiteral("host")).trimmed();
    if (!host.isEmpty())
        profile->host = host;

    if (parser.isSet(QStringLiteral("port"))) {
        bool ok = false;
        const int port = parser.value(QStringLiteral("port")).toInt(&ok);
        if (!ok || port <= 0 || port > 65535) {
            *error = QStringLiteral("invalid port: %1").arg(parser.value(QStringLiteral("port")));
            return false;
        }
        profile->port = port;
    }
    return true;
}

std::optional<int> readOptionalInt(const QCommandLineParser &parser, const QString &name)
{
    if (!parser.isSet(name))
        return std::nullopt;
    bool ok = false;
    const int value = parser.value(name).toInt(&ok);
    return ok ? std::optional<int>(value) : std::nullopt;
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("tvremote"));
    QCoreApplication::setApplicationName(QStringLiteral("tvremote-cli"));

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Send remote keys to network TVs and discover them on the LAN."));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("action"), QStringLiteral("send | pair | scan | forget"));
    parser.addPositionalArgument(QStringLiteral("argument"), QStringLiteral("Command id for send, PIN or key for pair."));

    parser.addOptions({
        { QStringLiteral("config"), QStringLiteral("JSON engine configuration."), QStringLiteral("file") },
        { QStringLiteral("storage"), QStringLiteral("Credential storage INI file."), QStringLiteral("file") },
        { QStringLiteral("brand"), QStringLiteral("TV brand id."), QStringLiteral("brand") },
        { QStringLiteral("host"), QStringLiteral("TV address; repeatable for scan."), QStringLiteral("host") },
        { QStringLiteral("port"), QStringLiteral("Preferred control port."), QStringLiteral("port") },
        { QStringLiteral("id"), QStringLiteral("Profile id the credentials are stored under."), QStringLiteral("id") },
        { QStringLiteral("name"), QStringLiteral("Profile nickname."), QStringLiteral("name") },
        { QStringLiteral("prefix"), QStringLiteral("IPv4 /24 prefix to scan; repeatable."), QStringLiteral("a.b.c") },
        { QStringLiteral("hosts-only"), QStringLiteral("Scan only the hosts given with --host.") },
        { QStringLiteral("range-start"), QStringLiteral("First host octet."), QStringLiteral("n") },
        { QStringLiteral("range-end"), QStringLiteral("Last host octet."), QStringLiteral("n") },
        { QStringLiteral("concurrency"), QStringLiteral("Hosts probed at once."), QStringLiteral("n") },
    });
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(1);
    const QString action = args.first();

    tvremote::EngineConfig config;
    if (parser.isSet(QStringLiteral("config"))) {
        QString error;
        config = tvremote::EngineConfig::loadFile(parser.value(QStringLiteral("config")), &error);
        if (!error.isEmpty()) {
            std::cerr << error.toStdString() << '\n';
            return 1;
        }
    }
    if (parser.isSet(QStringLiteral("storage")))
        config.storage.path = parser.value(QStringLiteral("storage"));

    tvremote::RemoteEngine engine(config);

    if (action == QLatin1String("scan")) {
        tvremote::ScanOptions options;
        if (parser.isSet(QStringLiteral("hosts-only")))
            options.prefixes = QStringList();
        else if (parser.isSet(QStringLiteral("prefix")))
            options.prefixes = parser.values(QStringLiteral("prefix"));
        options.hosts = parser.values(QStringLiteral("host"));
        options.hostRangeStart = readOptionalInt(parser, QStringLiteral("range-start"));
        options.hostRangeEnd = readOptionalInt(parser, QStringLiteral("range-end"));
        options.maxConcurrency = readOptionalInt(parser, QStringLiteral("concurrency"));

        tvremote::CancellationToken token;
        options.cancellationToken = &token;

        int exitCode = 0;
        QObject::connect(&engine, &tvremote::RemoteEngine::deviceDiscovered, [](const tvremote::DiscoveredDevice &device) {
            std::cout << QJsonDocument(device.toJson()).toJson(QJsonDocument::Compact).toStdString() << '\n';
        });
        QObject::connect(&engine, &tvremote::RemoteEngine::scanFinished,
                         [&](const QList<tvremote::DiscoveredDevice> &devices, bool cancelled) {
                             std::cerr << (cancelled ? "scan cancelled, " : "scan finished, ") << devices.size()
                                       << " device(s)" << '\n';
                             exitCode = cancelled ? 130 : 0;
                             app.quit();
                         });

        QTimer signalPoll;
        QObject::connect(&signalPoll, &QTimer::timeout, [&]() {
            if (!g_running.load())
                token.cancel();
        });
        signalPoll.start(100);

        if (!engine.scan(options)) {
            std::cerr << "scan already running" << '\n';
            return 1;
        }
        app.exec();
        return exitCode;
    }

    tvremote::TvProfile profile;
    QString error;
    if (!readProfile(parser, &profile, &error)) {
        std::cerr << error.toStdString() << '\n';
        return 1;
    }

    if (action == QLatin1String("send")) {
        if (args.size() < 2) {
            std::cerr << "send needs a command id" << '\n';
            return 1;
        }
        const std::optional<tvremote::RemoteCommand> command = tvremote::commandFromId(args.at(1));
        if (!command) {
            std::cerr << "unknown command: " << args.at(1).toStdString() << '\n';
            return 1;
        }
        return printResult(engine.dispatch(profile, *command));
    }

    if (action == QLatin1String("pair")) {
        if (args.size() < 2) {
            std::cerr << "pair needs the PIN or key shown by the TV" << '\n';
            return 1;
        }
        return printResult(engine.completePairing(profile, args.at(1)));
    }

    if (action == QLatin1String("forget")) {
        const int removed = engine.forget(profile);
        std::cout << "removed " << removed << " stored credential(s)" << '\n';
        return 0;
    }

    std::cerr << "unknown action: " << action.toStdString() << '\n';
    return 1;
}
