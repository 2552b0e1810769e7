#include "prologixlib/packet/types.hpp"

#include <cstdio>
#include <sstream>

namespace prologixlib::proto {

const char* to_string(ControllerMode mode) noexcept {
  switch (mode) {
    case ControllerMode::Bootloader: return "Bootloader";
    case ControllerMode::Application: return "Application";
  }
  return "Application";
}

const char* to_string(ControllerAlert alert) noexcept {
  switch (alert) {
    case ControllerAlert::Ok: return "Ok";
    case ControllerAlert::Warning: return "Warning";
    case ControllerAlert::Error: return "Error";
  }
  return "Error";
}

const char* to_string(IpAddressType type) noexcept {
  switch (type) {
    case IpAddressType::Dynamic: return "Dynamic";
    case IpAddressType::Static: return "Static";
  }
  return "Static";
}

const char* to_string(RebootType type) noexcept {
  switch (type) {
    case RebootType::Bootloader: return "Bootloader";
    case RebootType::Reset: return "Reset";
  }
  return "Reset";
}

std::string MacAddress::to_string() const {
  char buf[18];
  std::snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                bytes_[0], bytes_[1], bytes_[2], bytes_[3], bytes_[4], bytes_[5]);
  return std::string(buf);
}

std::string Ipv4Address::to_string() const {
  std::ostringstream ss;
  ss << int(bytes_[0]) << '.' << int(bytes_[1]) << '.' << int(bytes_[2]) << '.' << int(bytes_[3]);
  return ss.str();
}

int Ipv4Address::prefix_length() const noexcept {
  uint32_t mask = to_uint32();
  int len = 0;
  while (len < 32 && (mask & (0x80000000u >> len))) ++len;
  // 先頭の1ビット列の後ろに1が残っていれば非連続
  uint32_t expected = len == 0 ? 0u : (0xFFFFFFFFu << (32 - len));
  return mask == expected ? len : -1;
}

std::string ControllerVersion::to_string() const {
  std::ostringstream ss;
  ss << int(major) << '.' << int(minor) << '.' << int(patch) << '.' << int(bugfix);
  return ss.str();
}

} // namespace prologixlib::proto
