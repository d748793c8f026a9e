#pragma once

#include <functional>
#include <optional>

#include <QString>

#include "fingerprint_probe.h"
#include "remote_config.h"
#include "remote_http.h"
#include "remote_types.h"

namespace tvremote {

class CredentialStore;
class PairingSessionManager;

// Collaborators every adapter is built with. The engine owns all of them.
struct AdapterContext {
    HttpClient http { nullptr };
    CredentialStore *credentials = nullptr;
    PairingSessionManager *sessions = nullptr;
    EngineConfig config;
};

class BrandAdapter
{
public:
    explicit BrandAdapter(const AdapterContext &context);
    virtual ~BrandAdapter() = default;

    BrandAdapter(const BrandAdapter &) = delete;
    BrandAdapter &operator=(const BrandAdapter &) = delete;

    virtual Brand brand() const = 0;
    QString displayName() const { return brandDisplayName(brand()); }

    virtual DispatchResult send(const TvProfile &profile, RemoteCommand command) = 0;

    // Finishes a pairing the adapter asked for. Brands without an
    // out-of-band secret keep the default.
    virtual DispatchResult completePairing(const TvProfile &profile,
                                           const QString &secret,
                                           const std::optional<PairingRequest> &challenge);

    // Empty plan when the brand cannot be fingerprinted. explicitHost enables
    // the slower fallback checks reserved for hosts the user named.
    virtual ProbePlan probePlan(const QString &host, bool explicitHost) const = 0;

    // True when send() forwards to the bridge instead of talking to the TV.
    virtual bool deliversThroughBridge() const { return false; }

protected:
    DispatchResult missingHost() const;
    DispatchResult unmapped() const;

    const AdapterContext &context() const { return m_context; }
    const HttpClient &http() const { return m_context.http; }
    const EngineConfig &config() const { return m_context.config; }

private:
    AdapterContext m_context;
};

// Outcome of one attempt in the credential retry machine.
enum class AttemptStatus {
    Success,
    AuthRejected,
    Failed
};

struct AttemptResult {
    AttemptStatus status = AttemptStatus::Failed;
    QString error;
    QString issuedCredential;

    static AttemptResult success(const QString &issued = QString());
    static AttemptResult rejected(const QString &error);
    static AttemptResult failed(const QString &error);
};

enum class CredentialStage {
    WithCredential,
    WithoutCredential
};

struct CredentialAttemptOutcome {
    AttemptResult result;
    int attempts = 0;
    CredentialStage finalStage = CredentialStage::WithoutCredential;
};

// WithCredential -> WithoutCredential. The cached credential is used first;
// an authentication rejection clears it and the attempt is repeated exactly
// once without it. Transport failures are surfaced without a retry.
CredentialAttemptOutcome attemptWithCredentialFallback(
    const QString &cachedCredential,
    const std::function<AttemptResult(const QString &credential)> &attempt,
    const std::function<void()> &clearCredential);

// Ports to try in order: the profile's preferred port first, duplicates dropped.
QList<int> candidatePorts(const std::optional<int> &preferred, const QList<int> &defaults);

} // namespace tvremote
