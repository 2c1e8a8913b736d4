/**
 * @file test_common.cpp
 * @brief Unit tests for common.h constants, helpers and the Error type
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <map>
#include <string>
#include <unistd.h>
#include "ragd/common.h"
#include "ragd/error.h"
#include "ragd/ipc/socket_stream.h"

class CommonTest : public ::testing::Test {
protected:
    void SetUp() override {
        save("HOME");
        save(ragd::SOCKET_ENV_VAR);
        save("XDG_RUNTIME_DIR");
    }

    void TearDown() override {
        for (const auto& entry : saved_) {
            if (entry.second.first) {
                setenv(entry.first.c_str(), entry.second.second.c_str(), 1);
            } else {
                unsetenv(entry.first.c_str());
            }
        }
    }

    void save(const std::string& name) {
        const char* value = std::getenv(name.c_str());
        saved_[name] = {value != nullptr, value ? value : ""};
    }

    std::map<std::string, std::pair<bool, std::string>> saved_;
};

// ============================================================================
// Protocol constants
// ============================================================================

TEST_F(CommonTest, ProtocolIdentity) {
    EXPECT_STREQ(ragd::PROTOCOL_NAME, "rag-cli-ipc");
    EXPECT_EQ(ragd::PROTOCOL_VERSION, 1);
    EXPECT_STREQ(ragd::SERVER_ID, "rag-backend");
    EXPECT_STREQ(ragd::DEFAULT_CLIENT_ID, "ipc-client");
}

TEST_F(CommonTest, MaxFrameSizeIs16MiB) {
    EXPECT_EQ(ragd::MAX_FRAME_SIZE, 16u * 1024u * 1024u);
}

TEST_F(CommonTest, TimeoutsArePositive) {
    EXPECT_GT(ragd::SOCKET_TIMEOUT_MS, 0);
    EXPECT_GT(ragd::DIAL_TIMEOUT_MS, 0);
    EXPECT_GT(ragd::SOCKET_BACKLOG, 0);
}

// ============================================================================
// Helpers
// ============================================================================

TEST_F(CommonTest, ExpandPathReplacesTilde) {
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ragd::expand_path("~/.local/share/ragcli"), "/home/tester/.local/share/ragcli");
    EXPECT_EQ(ragd::expand_path("/var/lib/ragd"), "/var/lib/ragd");
    EXPECT_EQ(ragd::expand_path(""), "");
}

TEST_F(CommonTest, ExpandPathWithoutHomeIsUnchanged) {
    unsetenv("HOME");
    EXPECT_EQ(ragd::expand_path("~/x"), "~/x");
}

TEST_F(CommonTest, IsoTimestampIsUtc) {
    EXPECT_EQ(ragd::to_iso(ragd::Clock::from_time_t(0)), "1970-01-01T00:00:00Z");
    EXPECT_EQ(ragd::timestamp_iso().size(), 20u);
}

// ============================================================================
// Socket path resolution
// ============================================================================

TEST_F(CommonTest, SocketPathOverrideWins) {
    setenv(ragd::SOCKET_ENV_VAR, "/run/env.sock", 1);
    EXPECT_EQ(ragd::resolve_socket_path("/run/explicit.sock"), "/run/explicit.sock");
}

TEST_F(CommonTest, SocketPathFromEnvironment) {
    setenv(ragd::SOCKET_ENV_VAR, "/run/env.sock", 1);
    EXPECT_EQ(ragd::resolve_socket_path(), "/run/env.sock");
}

TEST_F(CommonTest, SocketPathUnderRuntimeDir) {
    unsetenv(ragd::SOCKET_ENV_VAR);
    setenv("XDG_RUNTIME_DIR", "/run/user/1000", 1);
    EXPECT_EQ(ragd::resolve_socket_path(), "/run/user/1000/ragcli/backend.sock");
}

TEST_F(CommonTest, SocketPathFallsBackToTmp) {
    unsetenv(ragd::SOCKET_ENV_VAR);
    unsetenv("XDG_RUNTIME_DIR");
    EXPECT_EQ(ragd::resolve_socket_path(),
              "/tmp/ragcli-" + std::to_string(getuid()) + "/backend.sock");
}

// ============================================================================
// Error
// ============================================================================

TEST_F(CommonTest, NoneIsOk) {
    EXPECT_TRUE(ragd::Error::none().ok());
    EXPECT_FALSE(ragd::Error::none().fatal());
}

TEST_F(CommonTest, OnlyTimeoutAndEofAreRetryable) {
    EXPECT_TRUE(ragd::Error::make(ragd::ErrorKind::TIMEOUT, "").retryable());
    EXPECT_TRUE(ragd::Error::make(ragd::ErrorKind::UNEXPECTED_EOF, "").retryable());
    EXPECT_FALSE(ragd::Error::make(ragd::ErrorKind::PROTOCOL, "").retryable());
    EXPECT_FALSE(ragd::Error::make(ragd::ErrorKind::STATUS, "", 503).retryable());
}

TEST_F(CommonTest, StatusErrorsAreNotFatal) {
    EXPECT_FALSE(ragd::Error::make(ragd::ErrorKind::STATUS, "", 404).fatal());
    EXPECT_FALSE(ragd::Error::make(ragd::ErrorKind::INVALID_ARGUMENT, "").fatal());
    EXPECT_TRUE(ragd::Error::make(ragd::ErrorKind::CORRELATION_MISMATCH, "").fatal());
    EXPECT_TRUE(ragd::Error::make(ragd::ErrorKind::STREAM_INCOMPLETE, "").fatal());
}

TEST_F(CommonTest, ErrorToStringIncludesStatus) {
    EXPECT_EQ(ragd::Error::make(ragd::ErrorKind::STATUS, "not found", 404).to_string(),
              "status (404): not found");
    EXPECT_EQ(ragd::Error::make(ragd::ErrorKind::CANCELLED, "").to_string(), "cancelled");
}

TEST_F(CommonTest, ResultCarriesValueOrError) {
    auto good = ragd::Result<int>::success(7);
    EXPECT_TRUE(good.ok());
    EXPECT_EQ(good.value, 7);

    auto bad = ragd::Result<int>::failure(ragd::ErrorKind::IO, "boom");
    EXPECT_FALSE(bad.ok());
    EXPECT_EQ(bad.error.message, "boom");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
