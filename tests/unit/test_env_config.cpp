#include <gtest/gtest.h>
#include <cstdlib>
#include "prologixlib/client/discovery_client.hpp"
#include "prologixlib/client/reboot_client.hpp"
#include "prologixlib/utils/env.hpp"
#include "prologixlib/utils/log_config.hpp"

using namespace prologixlib;

class EnvConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        ::unsetenv("PROLOGIX_BROADCAST_ADDRESS");
        ::unsetenv("PROLOGIX_CONTROLLER_PORT");
        ::unsetenv("PROLOGIX_DISCOVERY_TIMEOUT_MS");
        ::unsetenv("PROLOGIX_LOG_LEVEL");
    }
};

TEST_F(EnvConfigTest, DefaultsWhenUnset) {
    EXPECT_FALSE(utils::getenv_os("PROLOGIX_CONTROLLER_PORT").has_value());
    EXPECT_EQ(utils::broadcast_address_from_env(), "255.255.255.255");
    EXPECT_EQ(utils::controller_port_from_env(), 3040);
    EXPECT_EQ(utils::discovery_time_budget_from_env(), std::chrono::milliseconds(500));
    EXPECT_EQ(utils::log_utils::log_level_from_env(), utils::LogLevel::Warning);
}

TEST_F(EnvConfigTest, ValuesFromEnvironment) {
    ::setenv("PROLOGIX_BROADCAST_ADDRESS", "192.168.1.255", 1);
    ::setenv("PROLOGIX_CONTROLLER_PORT", "4040", 1);
    ::setenv("PROLOGIX_DISCOVERY_TIMEOUT_MS", "1500", 1);
    ::setenv("PROLOGIX_LOG_LEVEL", "debug", 1);

    EXPECT_EQ(utils::broadcast_address_from_env(), "192.168.1.255");
    EXPECT_EQ(utils::controller_port_from_env(), 4040);
    EXPECT_EQ(utils::discovery_time_budget_from_env(), std::chrono::milliseconds(1500));
    EXPECT_EQ(utils::log_utils::log_level_from_env(), utils::LogLevel::Debug);

    auto dc = client::DiscoveryClient::from_env();
    EXPECT_EQ(dc.broadcast_address(), "192.168.1.255");
    EXPECT_EQ(dc.port(), 4040);
    EXPECT_EQ(client::RebootClient::from_env().port(), 4040);
}

// 不正値は既定値にフォールバック
TEST_F(EnvConfigTest, InvalidValuesFallBack) {
    ::setenv("PROLOGIX_CONTROLLER_PORT", "70000", 1);
    ::setenv("PROLOGIX_DISCOVERY_TIMEOUT_MS", "-5", 1);
    EXPECT_EQ(utils::controller_port_from_env(), 3040);
    EXPECT_EQ(utils::discovery_time_budget_from_env(), std::chrono::milliseconds(500));

    ::setenv("PROLOGIX_CONTROLLER_PORT", "abc", 1);
    ::setenv("PROLOGIX_DISCOVERY_TIMEOUT_MS", "", 1);
    EXPECT_EQ(utils::controller_port_from_env(), 3040);
    EXPECT_EQ(utils::discovery_time_budget_from_env(), std::chrono::milliseconds(500));

    ::setenv("PROLOGIX_CONTROLLER_PORT", "0", 1);
    EXPECT_EQ(utils::controller_port_from_env(), 3040);
}
