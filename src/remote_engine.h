#pragma once

#include <memory>
#include <optional>

#include <QList>
#include <QObject>
#include <QString>

#include "credential_store.h"
#include "dispatch_router.h"
#include "network_scanner.h"
#include "pairing_sessions.h"
#include "remote_config.h"
#include "remote_types.h"

class QNetworkAccessManager;

namespace tvremote {

// Caller-facing entry point. Owns the network manager, the credential and
// pairing stores, every brand adapter and the scanner.
class RemoteEngine : public QObject
{
    Q_OBJECT
public:
    // Without a storage backend the QSettings file from config.storage is used.
    explicit RemoteEngine(const EngineConfig &config,
                          std::unique_ptr<KeyValueStorage> storage = nullptr,
                          QObject *parent = nullptr);
    ~RemoteEngine() override;

    DispatchResult dispatch(const TvProfile &profile, RemoteCommand command);

    // Relays the PIN or key the user read off the TV. On success the command
    // that triggered the pairing is sent again.
    DispatchResult completePairing(const TvProfile &profile,
                                   const QString &secret,
                                   const std::optional<PairingRequest> &challenge = std::nullopt);

    bool scan(const ScanOptions &options);
    QList<DiscoveredDevice> scanBlocking(const ScanOptions &options, bool *cancelled = nullptr);
    void cancelScan();

    // Drops credentials, pins and pending pairing for the profile.
    int forget(const TvProfile &profile);

    // Discovery race order for one host.
    QList<ProbePlan> scanPlans(const QString &host, bool explicitHost) const;

    const EngineConfig &config() const { return m_config; }
    CredentialStore &credentials() { return *m_credentials; }
    PairingSessionManager &sessions() { return *m_sessions; }
    DispatchRouter &router() { return *m_router; }
    NetworkScanner *scanner() const { return m_scanner; }

signals:
    void deviceDiscovered(const tvremote::DiscoveredDevice &device);
    void scanFinished(const QList<tvremote::DiscoveredDevice> &devices, bool cancelled);

private:
    EngineConfig m_config;
    QNetworkAccessManager *m_network = nullptr;
    std::unique_ptr<KeyValueStorage> m_storage;
    std::unique_ptr<CredentialStore> m_credentials;
    std::unique_ptr<PairingSessionManager> m_sessions;
    std::unique_ptr<DispatchRouter> m_router;
    NetworkScanner *m_scanner = nullptr;
};

} // namespace tvremote
