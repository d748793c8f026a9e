#include "pairing_sessions.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>

#include "credential_store.h"

Q_LOGGING_CATEGORY(pairingLog, "tvremote.pairing");

namespace tvremote {

PairingSessionManager::PairingSessionManager(KeyValueStorage *storage)
    : m_storage(storage)
{
    load();
}

void PairingSessionManager::remember(const QString &credentialKey, const PairingSession &session)
{
    m_sessions.insert(credentialKey, session);
    qCInfo(pairingLog) << "pairing session opened for" << credentialKey << "brand" << brandId(session.request.brand);
    persist();
}

std::optional<PairingSession> PairingSessionManager::find(const QString &credentialKey) const
{
    const auto it = m_sessions.constFind(credentialKey);
    if (it == m_sessions.constEnd())
        return std::nullopt;
    return it.value();
}

bool PairingSessionManager::clear(const QString &credentialKey)
{
    if (m_sessions.remove(credentialKey) == 0)
        return false;
    qCDebug(pairingLog) << "pairing session closed for" << credentialKey;
    persist();
    return true;
}

void PairingSessionManager::load()
{
    m_sessions.clear();
    if (!m_storage)
        return;

    const QString raw = m_storage->value(storageKey());
    if (raw.trimmed().isEmpty())
        return;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(raw.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(pairingLog) << "ignoring malformed pairing sessions" << parseError.errorString();
        return;
    }

    const QJsonObject stored = doc.object();
    for (auto it = stored.begin(); it != stored.end(); ++it) {
        const QJsonObject entry = it.value().toObject();
        const std::optional<PairingRequest> request =
            PairingRequest::fromJson(entry.value(QStringLiteral("request")).toObject());
        if (!request) {
            qCDebug(pairingLog) << "dropping unreadable session" << it.key();
            continue;
        }
        PairingSession session;
        session.request = *request;
        session.pendingCommand = commandFromId(entry.value(QStringLiteral("command")).toString());
        m_sessions.insert(it.key(), session);
    }
}

void PairingSessionManager::persist()
{
    if (!m_storage)
        return;

    QJsonObject stored;
    for (auto it = m_sessions.constBegin(); it != m_sessions.constEnd(); ++it) {
        QJsonObject entry;
        entry.insert(QStringLiteral("request"), it.value().request.toJson());
        if (it.value().pendingCommand)
            entry.insert(QStringLiteral("command"), commandId(*it.value().pendingCommand));
        stored.insert(it.key(), entry);
    }

    QString error;
    const QByteArray payload = QJsonDocument(stored).toJson(QJsonDocument::Compact);
    if (!m_storage->setValue(storageKey(), QString::fromUtf8(payload), &error))
        qCWarning(pairingLog) << "failed to persist pairing sessions" << error;
}

} // namespace tvremote
