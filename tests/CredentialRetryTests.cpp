#include <gtest/gtest.h>

#include "brand_adapter.h"

using namespace tvremote;

TEST(CredentialRetry, CachedCredentialSuccessDoesNotRetry) {
    QStringList seen;
    bool cleared = false;
    const CredentialAttemptOutcome outcome = attemptWithCredentialFallback(
        QStringLiteral("cached"),
        [&](const QString &credential) {
            seen.append(credential);
            return AttemptResult::success();
        },
        [&]() { cleared = true; });

    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(outcome.finalStage, CredentialStage::WithCredential);
    EXPECT_EQ(seen, QStringList { QStringLiteral("cached") });
    EXPECT_FALSE(cleared);
}

TEST(CredentialRetry, RejectionClearsAndRetriesExactlyOnce) {
    QStringList seen;
    int clears = 0;
    const CredentialAttemptOutcome outcome = attemptWithCredentialFallback(
        QStringLiteral("stale"),
        [&](const QString &credential) {
            seen.append(credential);
            return AttemptResult::rejected(QStringLiteral("denied"));
        },
        [&]() { ++clears; });

    EXPECT_EQ(outcome.attempts, 2);
    EXPECT_EQ(clears, 1);
    EXPECT_EQ(outcome.finalStage, CredentialStage::WithoutCredential);
    EXPECT_EQ(outcome.result.status, AttemptStatus::AuthRejected);
    EXPECT_EQ(seen, (QStringList { QStringLiteral("stale"), QString() }));
}

TEST(CredentialRetry, TransportFailureKeepsTheCredential) {
    int calls = 0;
    bool cleared = false;
    const CredentialAttemptOutcome outcome = attemptWithCredentialFallback(
        QStringLiteral("cached"),
        [&](const QString &) {
            ++calls;
            return AttemptResult::failed(QStringLiteral("timeout"));
        },
        [&]() { cleared = true; });

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(cleared);
    EXPECT_EQ(outcome.result.error, QStringLiteral("timeout"));
}

TEST(CredentialRetry, NoCachedCredentialStartsWithoutOne) {
    QStringList seen;
    const CredentialAttemptOutcome outcome = attemptWithCredentialFallback(
        QString(),
        [&](const QString &credential) {
            seen.append(credential);
            return AttemptResult::success(QStringLiteral("issued"));
        },
        nullptr);

    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(outcome.result.issuedCredential, QStringLiteral("issued"));
    EXPECT_EQ(seen, QStringList { QString() });
}

TEST(CandidatePorts, PreferredPortGoesFirstWithoutDuplicates) {
    EXPECT_EQ(candidatePorts(8060, { 80, 8060, 10000 }), (QList<int> { 8060, 80, 10000 }));
    EXPECT_EQ(candidatePorts(std::nullopt, { 80, 80, 443 }), (QList<int> { 80, 443 }));
    EXPECT_EQ(candidatePorts(0, { 1925 }), QList<int> { 1925 });
}
