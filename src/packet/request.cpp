#include "prologixlib/packet/request.hpp"

#include <algorithm>
#include <random>

#include "prologixlib/packet/codec.hpp"

namespace prologixlib::proto {

uint16_t generate_sequence() {
  std::mt19937 rng{std::random_device{}()};
  return static_cast<uint16_t>(rng() & 0xFFFFu);
}

IdentifyRequestBytes build_identify_request() {
  return build_identify_request(generate_sequence());
}

IdentifyRequestBytes build_identify_request(uint16_t sequence) noexcept {
  MessageHeader h{};
  h.magic = kMagic;
  h.command_id = CommandId::Identify;
  h.sequence = sequence;
  h.mac_address = MacAddress::broadcast();
  return encode_header(h);
}

RebootRequestBytes build_reboot_request(RebootType type) {
  return build_reboot_request(type, generate_sequence());
}

RebootRequestBytes build_reboot_request(RebootType type, uint16_t sequence) noexcept {
  MessageHeader h{};
  h.magic = kMagic;
  h.command_id = CommandId::Reboot;
  h.sequence = sequence;
  h.mac_address = MacAddress::broadcast();

  RebootRequestBytes out{};
  const auto hb = encode_header(h);
  std::copy(hb.begin(), hb.end(), out.begin());
  out[kHeaderSize] = static_cast<uint8_t>(type);
  // 残り3バイトは 0
  return out;
}

} // namespace prologixlib::proto
