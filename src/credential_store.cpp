#include "credential_store.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(credentialsLog, "tvremote.credentials");

namespace tvremote {

namespace {

constexpr CredentialKind kAllKinds[] = {
    CredentialKind::SamsungToken,
    CredentialKind::SamsungCertificate,
    CredentialKind::LgClientKey,
    CredentialKind::SonyPsk,
    CredentialKind::VizioAuthToken,
};

bool isStructured(CredentialKind kind)
{
    return kind == CredentialKind::SonyPsk;
}

} // namespace

SettingsStorage::SettingsStorage(const QString &path)
{
    if (path.isEmpty()) {
        m_settings = std::make_unique<QSettings>(QSettings::IniFormat, QSettings::UserScope,
                                                 QStringLiteral("tvremote"), QStringLiteral("tvremote-core"));
    } else {
        m_settings = std::make_unique<QSettings>(path, QSettings::IniFormat);
    }
}

QString SettingsStorage::value(const QString &key) const
{
    return m_settings->value(key).toString();
}

bool SettingsStorage::setValue(const QString &key, const QString &value, QString *error)
{
    m_settings->setValue(key, value);
    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        if (error)
            *error = QStringLiteral("Failed to write %1").arg(m_settings->fileName());
        return false;
    }
    if (error)
        error->clear();
    return true;
}

bool MemoryStorage::setValue(const QString &key, const QString &value, QString *error)
{
    m_values.insert(key, value);
    ++m_writes;
    if (error)
        error->clear();
    return true;
}

CredentialStore::CredentialStore(KeyValueStorage *storage)
    : m_storage(storage)
{
    for (CredentialKind kind : kAllKinds)
        load(kind);
}

QString CredentialStore::cacheKey(const TvProfile &profile)
{
    return profile.id + QLatin1Char(':') + profile.hostOrEmpty();
}

QString CredentialStore::storageKey(CredentialKind kind)
{
    switch (kind) {
    case CredentialKind::SamsungToken:
        return QStringLiteral("tv_remote/samsung_tokens_v1");
    case CredentialKind::SamsungCertificate:
        return QStringLiteral("tv_remote/samsung_certs_v1");
    case CredentialKind::LgClientKey:
        return QStringLiteral("tv_remote/lg_client_keys_v1");
    case CredentialKind::SonyPsk:
        return QStringLiteral("tv_remote/sony_psk_tokens_v1");
    case CredentialKind::VizioAuthToken:
        return QStringLiteral("tv_remote/vizio_auth_tokens_v1");
    }
    return {};
}

QString CredentialStore::value(CredentialKind kind, const QString &key) const
{
    return m_records.value(kind).value(key).toString();
}

void CredentialStore::setValue(CredentialKind kind, const QString &key, const QString &value)
{
    if (value.isEmpty())
        return;
    QJsonObject &records = m_records[kind];
    if (records.value(key).toString() == value)
        return;
    records.insert(key, value);
    persist(kind);
}

QJsonObject CredentialStore::record(CredentialKind kind, const QString &key) const
{
    return m_records.value(kind).value(key).toObject();
}

void CredentialStore::setRecord(CredentialKind kind, const QString &key, const QJsonObject &record)
{
    QJsonObject &records = m_records[kind];
    if (records.value(key).toObject() == record)
        return;
    records.insert(key, record);
    persist(kind);
}

bool CredentialStore::contains(CredentialKind kind, const QString &key) const
{
    return m_records.value(kind).contains(key);
}

bool CredentialStore::remove(CredentialKind kind, const QString &key)
{
    auto it = m_records.find(kind);
    if (it == m_records.end() || !it->contains(key))
        return false;
    it->remove(key);
    persist(kind);
    return true;
}

int CredentialStore::forget(const TvProfile &profile)
{
    const QString key = cacheKey(profile);
    int removed = 0;
    for (CredentialKind kind : kAllKinds) {
        if (remove(kind, key))
            ++removed;
    }
    qCInfo(credentialsLog) << "forgot" << removed << "credential records for" << key;
    return removed;
}

void CredentialStore::load(CredentialKind kind)
{
    QJsonObject &records = m_records[kind];
    records = QJsonObject();
    if (!m_storage)
        return;

    const QString raw = m_storage->value(storageKey(kind));
    if (raw.trimmed().isEmpty())
        return;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(raw.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(credentialsLog) << "ignoring malformed" << storageKey(kind) << parseError.errorString();
        return;
    }

    const QJsonObject stored = doc.object();
    for (auto it = stored.begin(); it != stored.end(); ++it) {
        if (isStructured(kind)) {
            if (it.value().isObject()) {
                records.insert(it.key(), it.value());
            } else if (it.value().isString() && !it.value().toString().isEmpty()) {
                // Older entries stored the PSK as a plain string.
                QJsonObject upgraded;
                upgraded.insert(QStringLiteral("psk"), it.value().toString());
                records.insert(it.key(), upgraded);
            }
            continue;
        }
        if (it.value().isString() && !it.value().toString().isEmpty())
            records.insert(it.key(), it.value());
    }
    qCDebug(credentialsLog) << "loaded" << records.size() << "entries from" << storageKey(kind);
}

void CredentialStore::persist(CredentialKind kind)
{
    if (!m_storage)
        return;
    const QByteArray payload = QJsonDocument(m_records.value(kind)).toJson(QJsonDocument::Compact);
    QString error;
    if (!m_storage->setValue(storageKey(kind), QString::fromUtf8(payload), &error))
        qCWarning(credentialsLog) << "failed to persist" << storageKey(kind) << error;
}

} // namespace tvremote
