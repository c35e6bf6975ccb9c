#include <gtest/gtest.h>
#include <atomic>
#include <map>
#include <set>
#include "network/retry_service.hpp"
#include "store/resume_store.hpp"
#include "transfer/file_transfer_client.hpp"
#include "receiver_fixture.hpp"

using namespace bxfer::transfer;
using namespace bxfer::network;
using namespace std::chrono_literals;
using bxfer::utils::CancellationToken;

namespace {

// Shared between every connection a factory opens
struct FaultPlan {
    // Chunk indices whose next send fails once with a connection reset
    std::set<uint32_t> fail_chunks;
    // Chunk index to the number of sends whose checksum gets corrupted
    std::map<uint32_t, int> corrupt_chunks;
    // Rewrites the receiver's COMPLETE_RESULT
    bool forge_complete_digest = false;
    bool fail_complete = false;
    std::atomic<int> connections{0};
    std::atomic<int> injected{0};
    std::atomic<int> corrupted{0};
};

// Breaks the connection or tampers with selected frames
class FaultyTransport : public Transport {
public:
    FaultyTransport(std::unique_ptr<Transport> inner, std::shared_ptr<FaultPlan> plan)
        : inner_(std::move(inner)), plan_(std::move(plan)) {}

    void send_frame(const Frame& frame, std::chrono::milliseconds timeout) override {
        if (frame.type == FrameType::CHUNK) {
            auto chunk = Codec::decode<ChunkMessage>(frame);
            if (plan_->fail_chunks.erase(chunk.index) > 0) {
                ++plan_->injected;
                inner_->close();
                throw TransportError(TransportErrorCode::CONNECTION_RESET, "Injected reset");
            }
            auto corrupt = plan_->corrupt_chunks.find(chunk.index);
            if (corrupt != plan_->corrupt_chunks.end() && corrupt->second > 0) {
                --corrupt->second;
                ++plan_->corrupted;
                chunk.checksum = std::string(chunk.checksum.size(), '0');
                inner_->send_frame(Codec::encode(chunk), timeout);
                return;
            }
        }
        inner_->send_frame(frame, timeout);
    }

    Frame receive_frame(std::chrono::milliseconds timeout) override {
        auto frame = inner_->receive_frame(timeout);
        if (frame.type == FrameType::COMPLETE_RESULT && (plan_->forge_complete_digest || plan_->fail_complete)) {
            auto response = Codec::decode<CompleteResponse>(frame);
            if (plan_->forge_complete_digest) {
                response.file_digest = std::string(response.file_digest.size(), 'f');
            }
            if (plan_->fail_complete) {
                response.ok = false;
                response.message = "Receiver failed to store the file";
            }
            return Codec::encode(response);
        }
        return frame;
    }
    void close() override { inner_->close(); }
    void abort() override { inner_->abort(); }
    bool is_open() const override { return inner_->is_open(); }
    std::string remote_address() const override { return inner_->remote_address(); }

private:
    std::unique_ptr<Transport> inner_;
    std::shared_ptr<FaultPlan> plan_;
};

RetryPolicy fast_policy() {
    RetryPolicy policy;
    policy.max_attempts = 3;
    policy.base_delay = 10ms;
    policy.max_delay = 50ms;
    return policy;
}

} // namespace

class FileTransferTest : public ReceiverFixture {
protected:
    void SetUp() override {
        ReceiverFixture::SetUp();
        resume_store = std::make_unique<bxfer::store::FileResumeStore>(dir / "resume");
        client = make_client();
    }

    std::unique_ptr<FileTransferClient> make_client(FileTransferClient::TransportFactory factory = {}) {
        return std::make_unique<FileTransferClient>(token_service, checksum, *resume_store, retry, std::move(factory));
    }

    TransferConfig make_config(int64_t chunk_size = 1024 * 1024) const {
        TransferConfig config;
        config.host = "127.0.0.1";
        config.port = port;
        config.target_directory = "backups";
        config.chunk_size = chunk_size;
        config.client = bxfer::auth::ClientConfiguration{"backup-agent", "correct-secret"};
        config.connect_timeout = 2s;
        config.chunk_timeout = 5s;
        return config;
    }

    FileTransferClient::TransportFactory faulty_factory(std::shared_ptr<FaultPlan> plan) {
        return [plan](const TransferConfig& config, const CancellationToken* cancellation) -> std::unique_ptr<Transport> {
            ++plan->connections;
            auto inner = FileTransferClient::default_transport_factory()(config, cancellation);
            return std::make_unique<FaultyTransport>(std::move(inner), plan);
        };
    }

    std::filesystem::path source(const std::string& name, const std::vector<uint8_t>& data) {
        const auto path = dir / "source" / name;
        write_test_file(path, data);
        return path;
    }

    std::filesystem::path stored(const std::string& name) { return dir / "storage" / "backups" / name; }

    MemoryCredentialStore& client_credentials = credentials_store;
    bxfer::auth::AuthenticationTokenService token_service{client_credentials};
    NetworkRetryService retry{fast_policy()};
    std::unique_ptr<bxfer::store::FileResumeStore> resume_store;
    std::unique_ptr<FileTransferClient> client;
    CancellationToken cancellation;
};

TEST_F(FileTransferTest, TransfersTenMegabytes) {
    const auto data = make_test_data(10 * 1024 * 1024);
    const auto path = source("backup.tar", data);
    auto config = make_config();

    std::vector<uint32_t> progress;
    client->set_progress_callback([&](const TransferProgress& p) {
        progress.push_back(p.chunks_acknowledged);
        EXPECT_EQ(p.total_chunks, 10u);
    });

    auto result = client->transfer(path, config, cancellation);
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.state, TransferState::State::COMPLETED);
    EXPECT_EQ(result.chunks_sent, 10u);
    EXPECT_EQ(result.bytes_transferred, data.size());
    EXPECT_EQ(result.resumed_from, 0u);
    EXPECT_EQ(result.file_digest, checksum.digest(data));
    EXPECT_EQ(result.session_id.size(), 36u);
    EXPECT_EQ(progress, (std::vector<uint32_t>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}));

    EXPECT_EQ(read_test_file(stored("backup.tar")), data);
    // Nothing left to resume
    EXPECT_FALSE(resume_store->get(bxfer::store::ResumeKey{"backup-agent", "backups", "backup.tar"}).has_value());
    EXPECT_EQ(chunk_manager->session_count(), 0u);
}

TEST_F(FileTransferTest, ZeroByteFile) {
    const auto path = source("empty.bin", {});
    auto config = make_config();

    auto result = client->transfer(path, config, cancellation);
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.chunks_sent, 1u);
    ASSERT_TRUE(std::filesystem::exists(stored("empty.bin")));
    EXPECT_EQ(std::filesystem::file_size(stored("empty.bin")), 0u);
}

TEST_F(FileTransferTest, ShortLastChunkAndRename) {
    const auto data = make_test_data(2500);
    const auto path = source("notes.txt", data);
    auto config = make_config(1000);
    config.file_name = "renamed.txt";

    auto result = client->transfer(path, config, cancellation);
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.chunks_sent, 3u);
    EXPECT_EQ(read_test_file(stored("renamed.txt")), data);
}

TEST_F(FileTransferTest, SecondUploadGetsUniqueName) {
    const auto path = source("backup.tar", make_test_data(3000));
    auto config = make_config(1000);

    ASSERT_TRUE(client->transfer(path, config, cancellation).success);
    ASSERT_TRUE(client->transfer(path, config, cancellation).success);
    EXPECT_TRUE(std::filesystem::exists(stored("backup.tar")));
    EXPECT_TRUE(std::filesystem::exists(stored("backup_1.tar")));
}

TEST_F(FileTransferTest, ResumesAfterCancellation) {
    const auto data = make_test_data(10 * 1000);
    const auto path = source("backup.tar", data);
    auto config = make_config(1000);

    CancellationToken first_token;
    client->set_progress_callback([&](const TransferProgress& p) {
        if (p.chunks_acknowledged == 4) {
            first_token.cancel();
        }
    });
    auto first = client->transfer(path, config, first_token);
    EXPECT_FALSE(first.success);
    EXPECT_TRUE(first.cancelled);
    EXPECT_EQ(first.state, TransferState::State::CANCELLED);
    EXPECT_EQ(first.chunks_sent, 4u);
    EXPECT_FALSE(std::filesystem::exists(stored("backup.tar")));

    auto marker = resume_store->get(bxfer::store::ResumeKey{"backup-agent", "backups", "backup.tar"});
    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(marker->last_acknowledged_index, 3);
    EXPECT_EQ(marker->session_id, first.session_id);

    client->set_progress_callback({});
    auto second = client->transfer(path, config, cancellation);
    ASSERT_TRUE(second.success) << second.error_message;
    EXPECT_EQ(second.session_id, first.session_id);
    EXPECT_EQ(second.resumed_from, 4u);
    EXPECT_EQ(second.chunks_sent, 6u);
    EXPECT_EQ(read_test_file(stored("backup.tar")), data);
}

// The receiver restarted and lost nothing, its scratch state is on disk
TEST_F(FileTransferTest, ResumesAcrossReceiverRestart) {
    const auto data = make_test_data(8 * 1000);
    const auto path = source("backup.tar", data);
    auto config = make_config(1000);

    CancellationToken first_token;
    client->set_progress_callback([&](const TransferProgress& p) {
        if (p.chunks_acknowledged == 5) {
            first_token.cancel();
        }
    });
    ASSERT_TRUE(client->transfer(path, config, first_token).cancelled);
    client->set_progress_callback({});

    receiver->stop_listening();
    receiver.reset();
    chunk_manager = std::make_unique<ChunkManager>(*storage, checksum, dir / "scratch");
    start_receiver();
    config.port = port;

    auto second = client->transfer(path, config, cancellation);
    ASSERT_TRUE(second.success) << second.error_message;
    EXPECT_EQ(second.resumed_from, 5u);
    EXPECT_EQ(read_test_file(stored("backup.tar")), data);
}

// A changed source invalidates the resume marker
TEST_F(FileTransferTest, ChangedSourceStartsOver) {
    const auto path = source("backup.tar", make_test_data(6000));
    auto config = make_config(1000);

    CancellationToken first_token;
    client->set_progress_callback([&](const TransferProgress& p) {
        if (p.chunks_acknowledged == 3) {
            first_token.cancel();
        }
    });
    ASSERT_TRUE(client->transfer(path, config, first_token).cancelled);
    client->set_progress_callback({});

    const auto changed = make_test_data(6000, 99);
    write_test_file(path, changed);
    auto second = client->transfer(path, config, cancellation);
    ASSERT_TRUE(second.success) << second.error_message;
    EXPECT_EQ(second.resumed_from, 0u);
    EXPECT_EQ(second.chunks_sent, 6u);
    EXPECT_EQ(read_test_file(stored("backup.tar")), changed);
}

TEST_F(FileTransferTest, RecoversFromTransientFailures) {
    auto plan = std::make_shared<FaultPlan>();
    plan->fail_chunks = {2, 5};
    client = make_client(faulty_factory(plan));

    const auto data = make_test_data(8 * 1000);
    const auto path = source("backup.tar", data);
    auto config = make_config(1000);

    auto result = client->transfer(path, config, cancellation);
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(plan->injected.load(), 2);
    EXPECT_EQ(plan->connections.load(), 3);
    EXPECT_EQ(result.chunks_sent, 8u);
    EXPECT_EQ(read_test_file(stored("backup.tar")), data);
}

TEST_F(FileTransferTest, ResendsChunkOnceAfterChecksumRejection) {
    auto plan = std::make_shared<FaultPlan>();
    plan->corrupt_chunks = {{3, 1}};
    client = make_client(faulty_factory(plan));

    const auto data = make_test_data(5 * 1000);
    const auto path = source("backup.tar", data);
    auto config = make_config(1000);

    auto result = client->transfer(path, config, cancellation);
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(plan->corrupted.load(), 1);
    // Resent on the same connection
    EXPECT_EQ(plan->connections.load(), 1);
    EXPECT_EQ(read_test_file(stored("backup.tar")), data);
}

TEST_F(FileTransferTest, SecondChecksumRejectionIsFatal) {
    auto plan = std::make_shared<FaultPlan>();
    plan->corrupt_chunks = {{3, 5}};
    client = make_client(faulty_factory(plan));

    const auto path = source("backup.tar", make_test_data(5 * 1000));
    auto config = make_config(1000);

    auto result = client->transfer(path, config, cancellation);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.state, TransferState::State::FAILED);
    EXPECT_EQ(result.error_message, "Chunk 3 failed checksum verification twice");
    // Integrity failures are not retried
    EXPECT_EQ(plan->corrupted.load(), 2);
    EXPECT_EQ(plan->connections.load(), 1);
    EXPECT_FALSE(std::filesystem::exists(stored("backup.tar")));

    auto marker = resume_store->get(bxfer::store::ResumeKey{"backup-agent", "backups", "backup.tar"});
    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(marker->last_acknowledged_index, 2);
}

TEST_F(FileTransferTest, StoredDigestMismatchKeepsMarker) {
    auto plan = std::make_shared<FaultPlan>();
    plan->forge_complete_digest = true;
    client = make_client(faulty_factory(plan));

    const auto path = source("backup.tar", make_test_data(5 * 1000));
    auto config = make_config(1000);

    auto result = client->transfer(path, config, cancellation);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.state, TransferState::State::FAILED);
    EXPECT_EQ(result.error_message, "Stored file checksum does not match the source file");

    auto marker = resume_store->get(bxfer::store::ResumeKey{"backup-agent", "backups", "backup.tar"});
    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(marker->session_id, result.session_id);
    EXPECT_EQ(marker->last_acknowledged_index, 4);
}

TEST_F(FileTransferTest, FailedCompleteKeepsMarker) {
    auto plan = std::make_shared<FaultPlan>();
    plan->fail_complete = true;
    client = make_client(faulty_factory(plan));

    const auto path = source("backup.tar", make_test_data(5 * 1000));
    auto config = make_config(1000);

    auto result = client->transfer(path, config, cancellation);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.state, TransferState::State::FAILED);
    EXPECT_EQ(result.error_message, "Receiver failed to finalize the file: Receiver failed to store the file");
    EXPECT_TRUE(resume_store->get(bxfer::store::ResumeKey{"backup-agent", "backups", "backup.tar"}).has_value());
}

TEST_F(FileTransferTest, GivesUpAfterRetries) {
    std::atomic<int> attempts{0};
    client = make_client([&](const TransferConfig&, const CancellationToken*) -> std::unique_ptr<Transport> {
        ++attempts;
        throw TransportError(TransportErrorCode::CONNECTION_REFUSED, "Connection refused");
    });

    const auto path = source("backup.tar", make_test_data(100));
    auto config = make_config();
    auto result = client->transfer(path, config, cancellation);

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.state, TransferState::State::FAILED);
    EXPECT_EQ(result.error_message, "Network transfer failed after 3 attempts");
    EXPECT_EQ(attempts.load(), 3);
}

TEST_F(FileTransferTest, AuthenticationFailureSendsNothing) {
    const auto path = source("backup.tar", make_test_data(5000));
    auto config = make_config(1000);
    config.client.client_secret = "wrong-secret";

    auto result = client->transfer(path, config, cancellation);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_message, bxfer::auth::messages::INVALID_CREDENTIALS);
    EXPECT_EQ(result.chunks_sent, 0u);
    EXPECT_EQ(chunk_manager->session_count(), 0u);
    EXPECT_FALSE(std::filesystem::exists(stored("backup.tar")));
    // Not retried
    EXPECT_EQ(audit.size(), 1u);
}

TEST_F(FileTransferTest, InvalidIdentityFailsBeforeConnecting) {
    std::atomic<int> connections{0};
    client = make_client([&](const TransferConfig& config, const CancellationToken* token) {
        ++connections;
        return FileTransferClient::default_transport_factory()(config, token);
    });
    const auto path = source("backup.tar", make_test_data(100));
    auto config = make_config();
    config.client.client_secret.clear();

    auto result = client->transfer(path, config, cancellation);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_message, "Failed to create authentication token");
    EXPECT_EQ(connections.load(), 0);
}

TEST_F(FileTransferTest, DefaultIdentityIsResolved) {
    // The receiver knows the default identity the client resolves
    credentials_store.ensure_default();
    const auto path = source("backup.tar", make_test_data(100));
    auto config = make_config();
    config.client = {};

    auto result = client->transfer(path, config, cancellation);
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(config.client.client_id, "default-client");
}

TEST_F(FileTransferTest, MissingSourceFile) {
    auto config = make_config();
    auto result = client->transfer(dir / "source" / "missing.tar", config, cancellation);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_message, "Source file does not exist or is not a regular file");
    EXPECT_EQ(result.state, TransferState::State::FAILED);
}

TEST_F(FileTransferTest, ReceiverRefusesSession) {
    storage->set_space_query([](const std::filesystem::path&) { return std::uintmax_t{10}; });
    const auto path = source("backup.tar", make_test_data(5000));
    auto config = make_config(1000);

    auto result = client->transfer(path, config, cancellation);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_message, "Insufficient disk space for a transfer of 5000 bytes");
}

TEST_F(FileTransferTest, CancelledBeforeStart) {
    const auto path = source("backup.tar", make_test_data(100));
    auto config = make_config();
    cancellation.cancel();

    auto result = client->transfer(path, config, cancellation);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.error_message, "Transfer cancelled");
    EXPECT_EQ(result.state, TransferState::State::CANCELLED);
}

TEST_F(FileTransferTest, SessionTimeoutBoundsRetries) {
    RetryPolicy slow;
    slow.max_attempts = 10;
    slow.base_delay = 10s;
    slow.max_delay = 10s;
    NetworkRetryService slow_retry(slow);
    FileTransferClient slow_client(token_service, checksum, *resume_store, slow_retry,
        [](const TransferConfig&, const CancellationToken*) -> std::unique_ptr<Transport> {
            throw TransportError(TransportErrorCode::TIMEOUT, "Timed out");
        });

    const auto path = source("backup.tar", make_test_data(100));
    auto config = make_config();
    config.session_timeout = 200ms;

    const auto start = std::chrono::steady_clock::now();
    auto result = slow_client.transfer(path, config, cancellation);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.error_message, "Transfer session timed out");
}

TEST(FileTransferClientTest, EffectiveChunkSize) {
    EXPECT_EQ(FileTransferClient::effective_chunk_size(0), DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(FileTransferClient::effective_chunk_size(-5), DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(FileTransferClient::effective_chunk_size(4096), 4096u);
    EXPECT_EQ(FileTransferClient::effective_chunk_size(int64_t{1} << 40), MAX_CHUNK_SIZE);
}
