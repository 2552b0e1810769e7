#pragma once

#include <cstdint>
#include <span>

#include "prologixlib/error.hpp"
#include "prologixlib/expected.hpp"
#include "prologixlib/packet/packet.hpp"

namespace prologixlib::proto {

// 12バイト共通ヘッダのエンコード/デコード
HeaderBytes encode_header(const MessageHeader& h) noexcept;

// magic の検証は行わない（呼び出し側で確認する）。12バイト未満のみエラー。
prologixlib::Result<MessageHeader> decode_header(std::span<const std::uint8_t> bytes) noexcept;

// big-endian 読み書き
inline uint16_t read_be16(std::span<const std::uint8_t> in, size_t offset) noexcept {
  return static_cast<uint16_t>((static_cast<uint16_t>(in[offset]) << 8) | in[offset + 1]);
}

inline void write_be16(std::uint8_t* out, uint16_t value) noexcept {
  out[0] = static_cast<uint8_t>((value >> 8) & 0xFF);
  out[1] = static_cast<uint8_t>(value & 0xFF);
}

} // namespace prologixlib::proto
