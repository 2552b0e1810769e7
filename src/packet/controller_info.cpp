#include "prologixlib/packet/controller_info.hpp"

#include <algorithm>

#include "prologixlib/packet/codec.hpp"

namespace prologixlib::proto {

namespace {

// 応答内オフセット
constexpr size_t kUptimeDaysOffset = 12;
constexpr size_t kUptimeHoursOffset = 14;
constexpr size_t kUptimeMinutesOffset = 15;
constexpr size_t kUptimeSecondsOffset = 16;
constexpr size_t kModeOffset = 17;
constexpr size_t kAlertOffset = 18;
constexpr size_t kIpTypeOffset = 19;
constexpr size_t kIpAddressOffset = 20;
constexpr size_t kNetmaskOffset = 24;
constexpr size_t kGatewayOffset = 28;
constexpr size_t kAppVersionOffset = 32;
constexpr size_t kBootVersionOffset = 36;
constexpr size_t kHardwareVersionOffset = 40;
constexpr size_t kDeviceNameOffset = 44;

Ipv4Address read_ipv4(std::span<const std::uint8_t> in, size_t offset) noexcept {
  return Ipv4Address(in[offset], in[offset + 1], in[offset + 2], in[offset + 3]);
}

ControllerVersion read_version(std::span<const std::uint8_t> in, size_t offset) noexcept {
  ControllerVersion v{};
  v.major = in[offset];
  v.minor = in[offset + 1];
  v.patch = in[offset + 2];
  v.bugfix = in[offset + 3];
  return v;
}

} // namespace

prologixlib::Result<ControllerInfo> ControllerInfo::from_bytes(std::span<const std::uint8_t> bytes) noexcept {
  if (bytes.size() < kControllerInfoSize) {
    return make_error_code(PrologixErrc::packet_too_short);
  }
  auto h_res = decode_header(bytes.first(kHeaderSize));
  if (!h_res) return h_res.error();
  const MessageHeader& header = h_res.value();
  if (header.magic != kMagic) {
    return make_error_code(PrologixErrc::invalid_magic);
  }

  ControllerInfo info{};
  info.mac_address_ = header.mac_address;

  const uint64_t days = read_be16(bytes, kUptimeDaysOffset);
  const uint64_t total = days * 86400u
                       + static_cast<uint64_t>(bytes[kUptimeHoursOffset]) * 3600u
                       + static_cast<uint64_t>(bytes[kUptimeMinutesOffset]) * 60u
                       + static_cast<uint64_t>(bytes[kUptimeSecondsOffset]);
  info.uptime_ = std::chrono::seconds{static_cast<std::chrono::seconds::rep>(total)};

  info.mode_ = controller_mode_from_byte(bytes[kModeOffset]);
  info.alert_ = controller_alert_from_byte(bytes[kAlertOffset]);
  info.ip_type_ = ip_address_type_from_byte(bytes[kIpTypeOffset]);
  info.ip_address_ = read_ipv4(bytes, kIpAddressOffset);
  info.ip_netmask_ = read_ipv4(bytes, kNetmaskOffset);
  info.ip_gateway_ = read_ipv4(bytes, kGatewayOffset);
  info.app_version_ = read_version(bytes, kAppVersionOffset);
  info.boot_version_ = read_version(bytes, kBootVersionOffset);
  info.hardware_version_ = read_version(bytes, kHardwareVersionOffset);
  std::copy(bytes.begin() + kDeviceNameOffset,
            bytes.begin() + kDeviceNameOffset + kDeviceNameSize,
            info.device_name_.begin());
  return info;
}

std::string ControllerInfo::device_name_string() const {
  auto end = std::find(device_name_.begin(), device_name_.end(), uint8_t{0});
  return std::string(device_name_.begin(), end);
}

} // namespace prologixlib::proto
