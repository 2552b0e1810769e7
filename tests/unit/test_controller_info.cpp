#include <gtest/gtest.h>
#include <vector>
#include "prologixlib/packet/controller_info.hpp"
#include "utils/fake_controller.hpp"

using namespace prologixlib;
using namespace prologixlib::proto;

class ControllerInfoTest : public ::testing::Test {
protected:
    ReplySpec createTestSpec() {
        ReplySpec spec{};
        spec.mac = {0x00, 0x21, 0x69, 0x01, 0x0A, 0xFF};
        spec.uptime_days = 1;
        spec.uptime_hours = 2;
        spec.uptime_minutes = 3;
        spec.uptime_seconds = 4;
        spec.mode = 1;
        spec.alert = 1;
        spec.ip_type = 1;
        spec.ip = {10, 0, 0, 42};
        spec.netmask = {255, 255, 0, 0};
        spec.gateway = {10, 0, 0, 1};
        spec.app_version = {1, 6, 6, 0};
        spec.boot_version = {1, 2, 3, 4};
        spec.hardware_version = {5, 6, 7, 8};
        spec.name = {'G', 'P', 'I', 'B', '-', 'L', 'A', 'B'};
        return spec;
    }
};

TEST_F(ControllerInfoTest, DecodeWellFormedReply) {
    auto bytes = build_controller_reply(createTestSpec());
    ASSERT_EQ(bytes.size(), kControllerInfoSize);

    auto res = ControllerInfo::from_bytes(bytes);
    ASSERT_TRUE(res.has_value()) << res.error().message();
    const auto& info = res.value();

    EXPECT_EQ(info.mac_address().to_string(), "00:21:69:01:0A:FF");
    EXPECT_EQ(info.mode(), ControllerMode::Application);
    EXPECT_EQ(info.alert(), ControllerAlert::Warning);
    EXPECT_EQ(info.ip_type(), IpAddressType::Static);
    EXPECT_EQ(info.ip_address().to_string(), "10.0.0.42");
    EXPECT_EQ(info.ip_netmask().to_string(), "255.255.0.0");
    EXPECT_EQ(info.ip_netmask().prefix_length(), 16);
    EXPECT_EQ(info.ip_gateway().to_string(), "10.0.0.1");
    EXPECT_EQ(info.app_version().to_string(), "1.6.6.0");
    EXPECT_EQ(info.boot_version().to_string(), "1.2.3.4");
    EXPECT_EQ(info.hardware_version().to_string(), "5.6.7.8");
    EXPECT_EQ(info.device_name_string(), "GPIB-LAB");
    EXPECT_EQ(info.device_name()[8], 0);
}

// days=1, hours=2, minutes=3, seconds=4 → 93784秒
TEST_F(ControllerInfoTest, UptimeComputation) {
    auto res = ControllerInfo::from_bytes(build_controller_reply(createTestSpec()));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().uptime().count(), 93784);
}

// 日数は big-endian 16bit
TEST_F(ControllerInfoTest, UptimeDaysBigEndian) {
    auto spec = createTestSpec();
    spec.uptime_days = 0x0102;
    spec.uptime_hours = 0;
    spec.uptime_minutes = 0;
    spec.uptime_seconds = 0;
    auto res = ControllerInfo::from_bytes(build_controller_reply(spec));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().uptime().count(), 258LL * 86400);
}

// 76バイト未満はすべて失敗し、範囲外を読まない
TEST_F(ControllerInfoTest, TooShortBuffersFail) {
    auto full = build_controller_reply(createTestSpec());
    for (size_t len = 0; len < kControllerInfoSize; ++len) {
        std::vector<uint8_t> truncated(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(len));
        auto res = ControllerInfo::from_bytes(truncated);
        ASSERT_FALSE(res.has_value()) << "length " << len;
        EXPECT_EQ(res.error(), PrologixErrc::packet_too_short);
        EXPECT_TRUE(is_parse_error(res.error()));
    }
}

// magic 不一致は内容に関わらず失敗
TEST_F(ControllerInfoTest, WrongMagicFails) {
    for (uint8_t magic : {0x00, 0x5B, 0xA5, 0xFF}) {
        auto bytes = build_controller_reply(createTestSpec());
        bytes[0] = magic;
        auto res = ControllerInfo::from_bytes(bytes);
        ASSERT_FALSE(res.has_value());
        EXPECT_EQ(res.error(), PrologixErrc::invalid_magic);
        EXPECT_TRUE(is_parse_error(res.error()));
    }

    std::vector<uint8_t> zeros(kControllerInfoSize, 0);
    auto res = ControllerInfo::from_bytes(zeros);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), PrologixErrc::invalid_magic);
}

// 76バイトを超える部分は無視
TEST_F(ControllerInfoTest, TrailingBytesIgnored) {
    auto bytes = build_controller_reply(createTestSpec());
    bytes.resize(120, 0xEE);
    auto res = ControllerInfo::from_bytes(bytes);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().ip_address().to_string(), "10.0.0.42");
}

// 未定義値は最後の列挙子に丸められる
TEST_F(ControllerInfoTest, EnumCatchAllMapping) {
    auto spec = createTestSpec();
    spec.mode = 0;
    spec.alert = 0;
    spec.ip_type = 0;
    auto res = ControllerInfo::from_bytes(build_controller_reply(spec));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().mode(), ControllerMode::Bootloader);
    EXPECT_EQ(res.value().alert(), ControllerAlert::Ok);
    EXPECT_EQ(res.value().ip_type(), IpAddressType::Dynamic);

    spec.mode = 0x7F;
    spec.alert = 2;
    spec.ip_type = 0xFF;
    res = ControllerInfo::from_bytes(build_controller_reply(spec));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().mode(), ControllerMode::Application);
    EXPECT_EQ(res.value().alert(), ControllerAlert::Error);
    EXPECT_EQ(res.value().ip_type(), IpAddressType::Static);

    spec.alert = 200;
    res = ControllerInfo::from_bytes(build_controller_reply(spec));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().alert(), ControllerAlert::Error);
}

// 名前が32バイト全て埋まっている場合
TEST_F(ControllerInfoTest, FullLengthDeviceName) {
    auto spec = createTestSpec();
    spec.name.assign(32, 'x');
    auto res = ControllerInfo::from_bytes(build_controller_reply(spec));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().device_name_string(), std::string(32, 'x'));
}
