/**
 * @file test_manager_config.cpp
 * @brief Unit tests for manager constants, directory layout and name rules
 *
 * Tests configuration including:
 * - Port space and timing constants
 * - Data directory resolution (WPMAN_DATA_DIR)
 * - Profile name validation and sanitization
 * - Launch config name detection
 */

#include <gtest/gtest.h>
#include "wpman/manager_config.hpp"
#include "test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

using namespace wpman;
using namespace wpman::config;
namespace fs = std::filesystem;

// Test fixture for manager config tests
class ManagerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_ = std::make_unique<wpman::test::TempDir>("wpman_config_test");
        const char* previous = std::getenv("WPMAN_DATA_DIR");
        if (previous) {
            saved_env_ = previous;
        }
    }

    void TearDown() override {
        if (saved_env_) {
            ::setenv("WPMAN_DATA_DIR", saved_env_->c_str(), 1);
        } else {
            ::unsetenv("WPMAN_DATA_DIR");
        }
        temp_.reset();
    }

    std::unique_ptr<wpman::test::TempDir> temp_;
    std::optional<std::string> saved_env_;
};

// ============================================================================
// Constants Tests
// ============================================================================

TEST_F(ManagerConfigTest, PortSpaceConstants) {
    EXPECT_EQ(PORT_RANGE_START, 60000);
    EXPECT_EQ(PORT_RANGE_END, 65535);
    EXPECT_EQ(DEFAULT_PORT_LIMIT, 10u);
    EXPECT_STREQ(PROXY_BIND_HOST, "127.0.0.1");
}

TEST_F(ManagerConfigTest, AutoConnectConstants) {
    EXPECT_EQ(AUTO_CONNECT_MAX_WORKERS, 4u);
    EXPECT_GT(MAX_PORT_ATTEMPTS_PER_WORKER, 0u);
    EXPECT_EQ(STATE_VERSION, 3);
}

// ============================================================================
// Directory Tests
// ============================================================================

TEST_F(ManagerConfigTest, DataDirectoryFromEnvironment) {
    fs::path expected = temp_->path() / "custom_data";
    ::setenv("WPMAN_DATA_DIR", expected.c_str(), 1);

    fs::path dir = get_data_directory();
    EXPECT_EQ(dir.string(), expected.string());
    EXPECT_TRUE(fs::is_directory(dir));
}

TEST_F(ManagerConfigTest, SubdirectoriesAreCreated) {
    fs::path profiles = get_profile_directory(temp_->path());
    fs::path logs = get_log_directory(temp_->path());

    EXPECT_EQ(profiles.string(), (temp_->path() / "profiles").string());
    EXPECT_EQ(logs.string(), (temp_->path() / "logs").string());
    EXPECT_TRUE(fs::is_directory(profiles));
    EXPECT_TRUE(fs::is_directory(logs));
}

TEST_F(ManagerConfigTest, StateAndLedgerFiles) {
    EXPECT_EQ(get_state_file(temp_->path()).filename().string(), "state.json");
    EXPECT_EQ(get_ledger_file(temp_->path()).filename().string(), "sessions.db");
}

// ============================================================================
// Name Validation Tests
// ============================================================================

TEST_F(ManagerConfigTest, ValidateProfileNameValid) {
    EXPECT_TRUE(validate_profile_name("office"));
    EXPECT_TRUE(validate_profile_name("us-east_1"));
    EXPECT_TRUE(validate_profile_name("A"));
    EXPECT_TRUE(validate_profile_name(std::string(MAX_PROFILE_NAME_LENGTH, 'x')));
}

TEST_F(ManagerConfigTest, ValidateProfileNameInvalid) {
    EXPECT_FALSE(validate_profile_name(""));
    EXPECT_FALSE(validate_profile_name("has space"));
    EXPECT_FALSE(validate_profile_name("../escape"));
    EXPECT_FALSE(validate_profile_name("dot.name"));
    EXPECT_FALSE(validate_profile_name(std::string(MAX_PROFILE_NAME_LENGTH + 1, 'x')));
}

TEST_F(ManagerConfigTest, ValidateProfileNameRejectsLaunchConfigLookalike) {
    EXPECT_FALSE(validate_profile_name("office_wireproxy"));
}

TEST_F(ManagerConfigTest, SanitizeProfileName) {
    EXPECT_EQ(sanitize_profile_name("  my vpn!  "), "myvpn");
    EXPECT_EQ(sanitize_profile_name("***"), "imported");
    EXPECT_EQ(sanitize_profile_name("", "fallback"), "fallback");
    EXPECT_EQ(sanitize_profile_name("home_wireproxy"), "home");
    EXPECT_EQ(sanitize_profile_name(std::string(100, 'a')).size(), MAX_PROFILE_NAME_LENGTH);
}

TEST_F(ManagerConfigTest, SanitizedNamesAreValid) {
    for (const auto& hint : {"a b c", "x/../y", "_wireproxy", "name.conf", "\xE2\x9C\x93"}) {
        EXPECT_TRUE(validate_profile_name(sanitize_profile_name(hint))) << hint;
    }
}

TEST_F(ManagerConfigTest, LaunchConfigNames) {
    EXPECT_TRUE(is_launch_config_name("office_wireproxy.conf"));
    EXPECT_FALSE(is_launch_config_name("office.conf"));
    EXPECT_FALSE(is_launch_config_name("wireproxy.conf"));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
