#include "prologixlib/packet/codec.hpp"

#include <algorithm>

namespace prologixlib::proto {

HeaderBytes encode_header(const MessageHeader& h) noexcept {
  HeaderBytes out{};
  // [magic, command, seq(2), mac(6), 0x00, 0x00]
  out[0] = h.magic;
  out[1] = static_cast<uint8_t>(h.command_id);
  write_be16(&out[2], h.sequence);
  const auto& mac = h.mac_address.bytes();
  std::copy(mac.begin(), mac.end(), out.begin() + 4);
  out[10] = 0x00;
  out[11] = 0x00;
  return out;
}

prologixlib::Result<MessageHeader> decode_header(std::span<const std::uint8_t> bytes) noexcept {
  if (bytes.size() < kHeaderSize) {
    return make_error_code(PrologixErrc::packet_too_short);
  }
  MessageHeader h{};
  h.magic = bytes[0];
  h.command_id = static_cast<CommandId>(bytes[1]);
  h.sequence = read_be16(bytes, 2);
  MacAddress::Bytes mac{};
  std::copy(bytes.begin() + 4, bytes.begin() + 10, mac.begin());
  h.mac_address = MacAddress(mac);
  return h;
}

} // namespace prologixlib::proto
