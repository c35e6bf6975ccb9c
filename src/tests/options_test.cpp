#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <vector>
#include "config/options.hpp"
#include "test_utils.hpp"

using namespace bxfer::config;
using namespace std::chrono_literals;

class OptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("BXFER_PASSPHRASE");
        unsetenv("BXFER_CLIENT_SECRET");
    }

    void TearDown() override {
        unsetenv("BXFER_PASSPHRASE");
        unsetenv("BXFER_CLIENT_SECRET");
    }

    template <typename Parser>
    static auto run(Parser parser, std::vector<const char*> args) {
        args.insert(args.begin(), "bxfer");
        return parser(static_cast<int>(args.size()), args.data());
    }

    static ServerOptions server(std::vector<const char*> args) { return run(parse_server_options, std::move(args)); }
    static ClientOptions client(std::vector<const char*> args) { return run(parse_client_options, std::move(args)); }

    TempDirectory dir{"options_test"};
};

TEST_F(OptionsTest, ServerDefaults) {
    auto options = server({"--passphrase", "secret"});
    EXPECT_FALSE(options.show_help);
    EXPECT_EQ(options.port, DEFAULT_PORT);
    EXPECT_EQ(options.receiver.bind_address, "0.0.0.0");
    EXPECT_EQ(options.storage_root, "storage");
    EXPECT_EQ(options.lockout.max_failures, 5);
    EXPECT_EQ(options.lockout.lockout_duration, 15min);
    EXPECT_FALSE(options.receiver.use_tls());
    EXPECT_FALSE(options.register_client.has_value());
    EXPECT_EQ(options.receiver.session_idle_timeout, 24h);
}

TEST_F(OptionsTest, ServerOverrides) {
    auto options = server({"--passphrase", "secret", "-p", "0", "--storage-root", "/srv/backups",
                           "--receive-timeout-ms", "500", "--lockout-threshold", "3",
                           "--lockout-cooldown-s", "60", "--register-client", "nightly",
                           "--log-level", "debug", "--session-idle-timeout-s", "0"});
    EXPECT_EQ(options.port, 0);
    EXPECT_EQ(options.receiver.session_idle_timeout, 0ms);
    EXPECT_EQ(options.storage_root, "/srv/backups");
    EXPECT_EQ(options.receiver.receive_timeout, 500ms);
    EXPECT_EQ(options.lockout.max_failures, 3);
    EXPECT_EQ(options.lockout.lockout_duration, 60s);
    EXPECT_EQ(options.register_client, std::optional<std::string>("nightly"));
    EXPECT_EQ(options.log.level, "debug");
}

TEST_F(OptionsTest, ServerValidation) {
    EXPECT_THROW(server({}), ConfigError);
    EXPECT_THROW(server({"--passphrase", "secret", "--receive-timeout-ms", "0"}), ConfigError);
    EXPECT_THROW(server({"--passphrase", "secret", "--session-idle-timeout-s", "-1"}), ConfigError);
    EXPECT_THROW(server({"--passphrase", "secret", "--tls-cert", "cert.pem"}), ConfigError);
    EXPECT_THROW(server({"--passphrase", "secret", "--log-level", "loud"}), ConfigError);
    EXPECT_THROW(server({"--passphrase", "secret", "--no-such-option"}), ConfigError);
    EXPECT_THROW(server({"--passphrase", "secret", "--port", "70000"}), ConfigError);
}

TEST_F(OptionsTest, HelpSkipsValidation) {
    auto options = server({"--help"});
    EXPECT_TRUE(options.show_help);
    EXPECT_NE(options.help_text.find("--storage-root"), std::string::npos);
}

TEST_F(OptionsTest, PassphraseFromEnvironment) {
    setenv("BXFER_PASSPHRASE", "from-env", 1);
    EXPECT_EQ(server({}).passphrase, "from-env");
    // Command line wins
    EXPECT_EQ(server({"--passphrase", "from-cli"}).passphrase, "from-cli");
}

TEST_F(OptionsTest, ConfigFile) {
    const auto path = dir / "server.ini";
    std::ofstream(path) << "passphrase=from-file\nport=9999\nstorage-root=/data\n";

    auto options = server({"--config", path.c_str(), "--port", "1234"});
    EXPECT_EQ(options.passphrase, "from-file");
    EXPECT_EQ(options.storage_root, "/data");
    EXPECT_EQ(options.port, 1234);

    EXPECT_THROW(server({"--config", (dir / "missing.ini").c_str()}), ConfigError);
}

TEST_F(OptionsTest, ClientPositionalFile) {
    auto options = client({"backup.tar", "--passphrase", "secret", "--host", "backup.local", "-d", "nightly",
                           "--chunk-size", "4096", "--session-timeout-s", "120", "--tls", "--tls-no-verify"});
    EXPECT_EQ(options.file_path, "backup.tar");
    EXPECT_EQ(options.transfer.host, "backup.local");
    EXPECT_EQ(options.transfer.port, DEFAULT_PORT);
    EXPECT_EQ(options.transfer.target_directory, "nightly");
    EXPECT_EQ(options.transfer.chunk_size, 4096);
    EXPECT_TRUE(options.transfer.use_tls);
    EXPECT_FALSE(options.transfer.tls_verify_peer);
    ASSERT_TRUE(options.transfer.session_timeout.has_value());
    EXPECT_EQ(*options.transfer.session_timeout, 120s);
}

TEST_F(OptionsTest, ClientDefaults) {
    auto options = client({"-f", "backup.tar", "--passphrase", "secret"});
    EXPECT_FALSE(options.transfer.use_tls);
    EXPECT_TRUE(options.transfer.tls_verify_peer);
    EXPECT_FALSE(options.transfer.session_timeout.has_value());
    EXPECT_EQ(options.retry.max_attempts, 3);
    EXPECT_EQ(options.retry.base_delay, 1000ms);
    EXPECT_TRUE(options.transfer.client.client_id.empty());
    EXPECT_EQ(options.resume_max_age, 720h);

    options = client({"-f", "backup.tar", "--passphrase", "secret", "--resume-max-age-s", "3600"});
    EXPECT_EQ(options.resume_max_age, 1h);
}

TEST_F(OptionsTest, ClientSecretFromEnvironment) {
    setenv("BXFER_CLIENT_SECRET", "env-secret", 1);
    auto options = client({"backup.tar", "--passphrase", "secret", "--client-id", "backup-agent"});
    EXPECT_EQ(options.transfer.client.client_id, "backup-agent");
    EXPECT_EQ(options.transfer.client.client_secret, "env-secret");
}

TEST_F(OptionsTest, ClientValidation) {
    EXPECT_THROW(client({"--passphrase", "secret"}), ConfigError);
    EXPECT_THROW(client({"backup.tar"}), ConfigError);
    EXPECT_THROW(client({"backup.tar", "--passphrase", "secret", "--retries", "0"}), ConfigError);
    EXPECT_THROW(client({"backup.tar", "--passphrase", "secret", "--chunk-timeout-ms", "-1"}), ConfigError);
    EXPECT_THROW(client({"backup.tar", "--passphrase", "secret", "--retry-base-ms", "5000", "--retry-max-ms", "10"}),
                 ConfigError);
    EXPECT_THROW(client({"a.tar", "b.tar", "--passphrase", "secret"}), ConfigError);
    EXPECT_THROW(client({"backup.tar", "--passphrase", "secret", "--resume-max-age-s", "-5"}), ConfigError);
}
