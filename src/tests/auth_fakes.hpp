#ifndef BXFER_TEST_AUTH_FAKES_HPP
#define BXFER_TEST_AUTH_FAKES_HPP

#include <gmock/gmock.h>
#include <map>
#include <mutex>
#include "auth/audit_log.hpp"
#include "auth/credential_store.hpp"

// In-memory credential store
class MemoryCredentialStore : public bxfer::auth::CredentialStore {
public:
    void store(const bxfer::auth::ClientCredentials& credentials) override {
        std::lock_guard<std::mutex> lock(mutex_);
        credentials_[credentials.client_id] = credentials;
    }

    bxfer::auth::ClientCredentials ensure_default() override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = credentials_.find("default-client");
        if (it == credentials_.end()) {
            bxfer::auth::ClientCredentials credentials;
            credentials.client_id = "default-client";
            credentials.client_secret = "default-secret-value";
            it = credentials_.emplace(credentials.client_id, credentials).first;
            ++defaults_created;
        }
        return it->second;
    }

    std::optional<bxfer::auth::ClientCredentials> lookup(const std::string& client_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = credentials_.find(client_id);
        if (it == credentials_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    int defaults_created = 0;

private:
    mutable std::mutex mutex_;
    std::map<std::string, bxfer::auth::ClientCredentials> credentials_;
};

class MockAuditLog : public bxfer::auth::AuditLog {
public:
    MOCK_METHOD(void, record, (const bxfer::auth::AuditEntry& entry), (override));
};

// Audit log that only counts records
class CountingAuditLog : public bxfer::auth::AuditLog {
public:
    void record(const bxfer::auth::AuditEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.push_back(entry);
    }

    std::size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries.size();
    }

    std::vector<bxfer::auth::AuditEntry> entries;

private:
    std::mutex mutex_;
};

#endif // BXFER_TEST_AUTH_FAKES_HPP
