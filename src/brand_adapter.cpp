#include "brand_adapter.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(adapterLog, "tvremote.adapters");

namespace tvremote {

BrandAdapter::BrandAdapter(const AdapterContext &context)
    : m_context(context)
{
}

DispatchResult BrandAdapter::completePairing(const TvProfile &profile,
                                             const QString &secret,
                                             const std::optional<PairingRequest> &challenge)
{
    Q_UNUSED(profile);
    Q_UNUSED(secret);
    Q_UNUSED(challenge);
    return DispatchResult::failure(QStringLiteral("%1 TVs do not support pairing.").arg(displayName()));
}

DispatchResult BrandAdapter::missingHost() const
{
    return DispatchResult::failure(QStringLiteral("No TV host configured yet."));
}

DispatchResult BrandAdapter::unmapped() const
{
    return DispatchResult::failure(QStringLiteral("This command is not mapped for %1 yet.").arg(displayName()));
}

AttemptResult AttemptResult::success(const QString &issued)
{
    AttemptResult result;
    result.status = AttemptStatus::Success;
    result.issuedCredential = issued;
    return result;
}

AttemptResult AttemptResult::rejected(const QString &error)
{
    AttemptResult result;
    result.status = AttemptStatus::AuthRejected;
    result.error = error;
    return result;
}

AttemptResult AttemptResult::failed(const QString &error)
{
    AttemptResult result;
    result.status = AttemptStatus::Failed;
    result.error = error;
    return result;
}

CredentialAttemptOutcome attemptWithCredentialFallback(
    const QString &cachedCredential,
    const std::function<AttemptResult(const QString &credential)> &attempt,
    const std::function<void()> &clearCredential)
{
    CredentialAttemptOutcome outcome;

    if (!cachedCredential.isEmpty()) {
        outcome.finalStage = CredentialStage::WithCredential;
        outcome.result = attempt(cachedCredential);
        ++outcome.attempts;
        if (outcome.result.status != AttemptStatus::AuthRejected)
            return outcome;

        qCInfo(adapterLog) << "cached credential rejected, retrying once without it";
        if (clearCredential)
            clearCredential();
    }

    outcome.finalStage = CredentialStage::WithoutCredential;
    outcome.result = attempt(QString());
    ++outcome.attempts;
    return outcome;
}

QList<int> candidatePorts(const std::optional<int> &preferred, const QList<int> &defaults)
{
    QList<int> ports;
    if (preferred && *preferred > 0 && *preferred <= 65535)
        ports.append(*preferred);
    for (int port : defaults) {
        if (port > 0 && !ports.contains(port))
            ports.append(port);
    }
    return ports;
}

} // namespace tvremote
