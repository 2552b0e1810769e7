#include <gtest/gtest.h>
#include <vector>
#include "prologixlib/packet/codec.hpp"

using namespace prologixlib;
using namespace prologixlib::proto;

class CodecTest : public ::testing::Test {
protected:
    MessageHeader createTestHeader() {
        MessageHeader h{};
        h.magic = kMagic;
        h.command_id = CommandId::Reboot;
        h.sequence = 0xBEEF;
        h.mac_address = MacAddress(MacAddress::Bytes{0x00, 0x21, 0x69, 0xAA, 0xBB, 0xCC});
        return h;
    }
};

// ヘッダーのバイト配置
TEST_F(CodecTest, EncodeHeaderLayout) {
    auto bytes = encode_header(createTestHeader());

    ASSERT_EQ(bytes.size(), kHeaderSize);
    EXPECT_EQ(bytes[0], 0x5A);
    EXPECT_EQ(bytes[1], 0x12);
    // シーケンスは big-endian
    EXPECT_EQ(bytes[2], 0xBE);
    EXPECT_EQ(bytes[3], 0xEF);
    EXPECT_EQ(bytes[4], 0x00);
    EXPECT_EQ(bytes[5], 0x21);
    EXPECT_EQ(bytes[6], 0x69);
    EXPECT_EQ(bytes[7], 0xAA);
    EXPECT_EQ(bytes[8], 0xBB);
    EXPECT_EQ(bytes[9], 0xCC);
    EXPECT_EQ(bytes[10], 0x00);
    EXPECT_EQ(bytes[11], 0x00);
}

// デコードはエンコードの逆写像
TEST_F(CodecTest, DecodeHeaderInverse) {
    auto original = createTestHeader();
    auto bytes = encode_header(original);

    auto decoded = decode_header(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value().magic, original.magic);
    EXPECT_EQ(decoded.value().command_id, original.command_id);
    EXPECT_EQ(decoded.value().sequence, original.sequence);
    EXPECT_EQ(decoded.value().mac_address, original.mac_address);
}

// magic は検証しない
TEST_F(CodecTest, DecodeHeaderDoesNotValidateMagic) {
    std::vector<uint8_t> bytes = {0x00, 0x00, 0x01, 0x02, 1, 2, 3, 4, 5, 6, 0, 0};

    auto decoded = decode_header(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value().magic, 0x00);
    EXPECT_EQ(decoded.value().sequence, 0x0102);
    EXPECT_EQ(decoded.value().mac_address.to_string(), "01:02:03:04:05:06");
}

// 12バイト未満は読まずにエラー
TEST_F(CodecTest, DecodeHeaderTooShort) {
    std::vector<uint8_t> bytes = {0x5A, 0x00, 0x01};

    auto decoded = decode_header(bytes);
    EXPECT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), PrologixErrc::packet_too_short);
    EXPECT_TRUE(is_parse_error(decoded.error()));
}

TEST_F(CodecTest, BigEndianHelpers) {
    uint8_t out[2] = {0, 0};
    write_be16(out, 0x0A0B);
    EXPECT_EQ(out[0], 0x0A);
    EXPECT_EQ(out[1], 0x0B);

    std::vector<uint8_t> in = {0xFF, 0x01, 0x02};
    EXPECT_EQ(read_be16(in, 1), 0x0102);
}
