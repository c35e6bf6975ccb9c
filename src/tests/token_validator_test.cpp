#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include "auth/token_validator.hpp"
#include "crypto/base64.hpp"
#include "auth_fakes.hpp"

using namespace bxfer::auth;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::Optional;
using ::testing::Eq;

namespace {

std::string token_for(const std::string& id, const std::string& secret) {
    return bxfer::crypto::base64::encode(id + ":" + secret);
}

} // namespace

class TokenValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ClientCredentials credentials;
        credentials.client_id = "backup-agent";
        credentials.client_secret = "correct-secret";
        store.store(credentials);
    }

    LockoutTracker::Clock::time_point now = LockoutTracker::Clock::time_point(std::chrono::hours(1));
    MemoryCredentialStore store;
    ::testing::NiceMock<MockAuditLog> audit;
    AuthenticationValidator validator{store, audit, LockoutPolicy{}, [this] { return now; }};
};

TEST_F(TokenValidatorTest, ValidTokenSucceeds) {
    EXPECT_CALL(audit, record(AllOf(Field(&AuditEntry::outcome, AuditOutcome::SUCCESS),
                                    Field(&AuditEntry::client_id, Optional(Eq("backup-agent"))),
                                    Field(&AuditEntry::operation, "token-validation"))))
        .Times(1);

    auto result = validator.validate_token(token_for("backup-agent", "correct-secret"));
    EXPECT_TRUE(result.is_valid);
    EXPECT_EQ(result.client_id, "backup-agent");
    EXPECT_TRUE(result.error_message.empty());
}

TEST_F(TokenValidatorTest, MalformedTokensAreRejected) {
    EXPECT_CALL(audit, record(AllOf(Field(&AuditEntry::outcome, AuditOutcome::FAILURE),
                                    Field(&AuditEntry::client_id, std::optional<std::string>()))))
        .Times(6);

    for (const std::string token : {std::string(), std::string("not base64!"),
                                    bxfer::crypto::base64::encode("no-colon"),
                                    bxfer::crypto::base64::encode("a:b:c"),
                                    bxfer::crypto::base64::encode(":secret"),
                                    bxfer::crypto::base64::encode("backup-agent:")}) {
        auto result = validator.validate_token(token);
        EXPECT_FALSE(result.is_valid);
        EXPECT_EQ(result.error_message, messages::INVALID_FORMAT);
    }
}

TEST_F(TokenValidatorTest, WrongSecretAndUnknownClientShareMessage) {
    EXPECT_CALL(audit, record(Field(&AuditEntry::outcome, AuditOutcome::FAILURE))).Times(2);

    auto wrong = validator.validate_token(token_for("backup-agent", "wrong-secret"));
    auto unknown = validator.validate_token(token_for("ghost-agent", "correct-secret"));

    EXPECT_FALSE(wrong.is_valid);
    EXPECT_FALSE(unknown.is_valid);
    EXPECT_EQ(wrong.error_message, messages::INVALID_CREDENTIALS);
    EXPECT_EQ(unknown.error_message, messages::INVALID_CREDENTIALS);
}

TEST_F(TokenValidatorTest, InactiveAndExpiredClients) {
    ClientCredentials inactive;
    inactive.client_id = "inactive-agent";
    inactive.client_secret = "correct-secret";
    inactive.is_active = false;
    store.store(inactive);

    ClientCredentials expired;
    expired.client_id = "expired-agent";
    expired.client_secret = "correct-secret";
    expired.expires_at = SystemClock::now() - std::chrono::hours(1);
    store.store(expired);

    EXPECT_EQ(validator.validate_token(token_for("inactive-agent", "correct-secret")).error_message,
              messages::INACTIVE);
    EXPECT_EQ(validator.validate_token(token_for("expired-agent", "correct-secret")).error_message,
              messages::EXPIRED);
}

TEST_F(TokenValidatorTest, LocksOutAfterRepeatedFailures) {
    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(validator.validate_token(token_for("backup-agent", "wrong-secret")).is_valid);
    }

    // Locked even with the correct secret
    auto locked = validator.validate_token(token_for("backup-agent", "correct-secret"));
    EXPECT_FALSE(locked.is_valid);
    EXPECT_EQ(locked.error_message, messages::LOCKED);

    now += std::chrono::minutes(15);
    EXPECT_TRUE(validator.validate_token(token_for("backup-agent", "correct-secret")).is_valid);
}

TEST_F(TokenValidatorTest, SuccessResetsFailureCount) {
    for (int i = 0; i < 4; ++i) {
        validator.validate_token(token_for("backup-agent", "wrong-secret"));
    }
    EXPECT_EQ(validator.lockout().failure_count("backup-agent"), 4);

    EXPECT_TRUE(validator.validate_token(token_for("backup-agent", "correct-secret")).is_valid);
    EXPECT_EQ(validator.lockout().failure_count("backup-agent"), 0);

    validator.validate_token(token_for("backup-agent", "wrong-secret"));
    EXPECT_TRUE(validator.validate_token(token_for("backup-agent", "correct-secret")).is_valid);
}

// Malformed tokens cannot lock anybody out
TEST_F(TokenValidatorTest, FormatFailuresAreNotCounted) {
    for (int i = 0; i < 10; ++i) {
        validator.validate_token(bxfer::crypto::base64::encode("backup-agent"));
    }
    EXPECT_TRUE(validator.validate_token(token_for("backup-agent", "correct-secret")).is_valid);
}

TEST(TokenValidatorAuditTest, EveryAttemptIsAudited) {
    MemoryCredentialStore store;
    CountingAuditLog audit;
    ClientCredentials credentials{"backup-agent", "correct-secret"};
    store.store(credentials);
    AuthenticationValidator validator(store, audit);

    validator.validate_token(token_for("backup-agent", "correct-secret"));
    validator.validate_token(token_for("backup-agent", "wrong-secret"));
    validator.validate_token("%%%");
    validator.validate_token(token_for("ghost-agent", "whatever1"));
    EXPECT_EQ(audit.size(), 4u);
    EXPECT_EQ(audit.entries[0].outcome, AuditOutcome::SUCCESS);
    EXPECT_EQ(audit.entries[1].detail, "secret mismatch");
    EXPECT_FALSE(audit.entries[2].client_id.has_value());
    EXPECT_EQ(audit.entries[3].detail, "unknown client");
}
