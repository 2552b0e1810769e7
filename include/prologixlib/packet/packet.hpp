#pragma once

#include <array>
#include <cstdint>

#include "prologixlib/packet/types.hpp"

namespace prologixlib::proto {

// 共通ヘッダー 96-bit（12バイト）
struct MessageHeader {
  uint8_t magic = kMagic;               // 8 bits
  CommandId command_id = CommandId::Identify; // 8 bits
  uint16_t sequence = 0;                // 16 bits (big-endian, 受信時は未検証)
  MacAddress mac_address{};             // 48 bits
  // 予約 16 bits は常に 0x0000
};

constexpr size_t kHeaderSize = 12u;
constexpr size_t kRebootPayloadSize = 4u;
constexpr size_t kRebootRequestSize = kHeaderSize + kRebootPayloadSize;

using HeaderBytes = std::array<std::uint8_t, kHeaderSize>;
using IdentifyRequestBytes = HeaderBytes;
using RebootRequestBytes = std::array<std::uint8_t, kRebootRequestSize>;

} // namespace prologixlib::proto
