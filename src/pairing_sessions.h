#pragma once

#include <optional>

#include <QHash>
#include <QString>

#include "remote_types.h"

namespace tvremote {

class KeyValueStorage;

// A suspended command waiting for the user to relay a PIN or key.
struct PairingSession {
    PairingRequest request;
    std::optional<RemoteCommand> pendingCommand;
};

class PairingSessionManager
{
public:
    explicit PairingSessionManager(KeyValueStorage *storage = nullptr);

    static QString storageKey() { return QStringLiteral("tv_remote/pairing_sessions_v1"); }

    void remember(const QString &credentialKey, const PairingSession &session);
    std::optional<PairingSession> find(const QString &credentialKey) const;
    bool clear(const QString &credentialKey);

    int size() const { return m_sessions.size(); }

private:
    void load();
    void persist();

    KeyValueStorage *m_storage = nullptr;
    QHash<QString, PairingSession> m_sessions;
};

} // namespace tvremote
