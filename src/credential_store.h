#pragma once

#include <memory>

#include <QHash>
#include <QJsonObject>
#include <QMap>
#include <QSettings>
#include <QString>

#include "remote_types.h"

namespace tvremote {

// Persistent string map the credential cache and pairing sessions are
// mirrored to.
class KeyValueStorage
{
public:
    virtual ~KeyValueStorage() = default;

    virtual QString value(const QString &key) const = 0;
    virtual bool setValue(const QString &key, const QString &value, QString *error = nullptr) = 0;
};

class SettingsStorage final : public KeyValueStorage
{
public:
    // Empty path selects the per-user INI file of the application.
    explicit SettingsStorage(const QString &path = QString());

    QString value(const QString &key) const override;
    bool setValue(const QString &key, const QString &value, QString *error = nullptr) override;

    QString fileName() const { return m_settings->fileName(); }

private:
    std::unique_ptr<QSettings> m_settings;
};

class MemoryStorage final : public KeyValueStorage
{
public:
    QString value(const QString &key) const override { return m_values.value(key); }
    bool setValue(const QString &key, const QString &value, QString *error = nullptr) override;

    int writeCount() const { return m_writes; }

private:
    QHash<QString, QString> m_values;
    int m_writes = 0;
};

enum class CredentialKind {
    SamsungToken,
    SamsungCertificate,
    LgClientKey,
    SonyPsk,
    VizioAuthToken
};

class CredentialStore
{
public:
    explicit CredentialStore(KeyValueStorage *storage);

    // "<profileId>:<host>"; a host change on the same profile is a cache miss.
    static QString cacheKey(const TvProfile &profile);
    static QString storageKey(CredentialKind kind);

    QString value(CredentialKind kind, const QString &key) const;
    void setValue(CredentialKind kind, const QString &key, const QString &value);

    // Structured records (Sony keeps its PSK together with the code table).
    QJsonObject record(CredentialKind kind, const QString &key) const;
    void setRecord(CredentialKind kind, const QString &key, const QJsonObject &record);

    bool contains(CredentialKind kind, const QString &key) const;
    bool remove(CredentialKind kind, const QString &key);

    // Drops every record held for the profile, certificate pins included.
    int forget(const TvProfile &profile);

private:
    void load(CredentialKind kind);
    void persist(CredentialKind kind);

    KeyValueStorage *m_storage = nullptr;
    QMap<CredentialKind, QJsonObject> m_records;
};

} // namespace tvremote
