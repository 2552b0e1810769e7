#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <span>
#include <string>

#include "prologixlib/error.hpp"
#include "prologixlib/expected.hpp"
#include "prologixlib/packet/types.hpp"

namespace prologixlib::proto {

/**
 * @brief identify 応答から得られるコントローラ状態のスナップショット
 *
 * from_bytes() からのみ構築でき、構築後は変更されない。
 */
class ControllerInfo {
public:
  using DeviceName = std::array<uint8_t, kDeviceNameSize>;

  /**
   * @brief identify 応答をデコード
   * @param bytes 受信データ（76バイト以上、先頭が 0x5A）
   * @return ControllerInfo、または packet_too_short / invalid_magic
   */
  static prologixlib::Result<ControllerInfo> from_bytes(std::span<const std::uint8_t> bytes) noexcept;

  const MacAddress& mac_address() const noexcept { return mac_address_; }
  std::chrono::seconds uptime() const noexcept { return uptime_; }
  ControllerMode mode() const noexcept { return mode_; }
  ControllerAlert alert() const noexcept { return alert_; }
  IpAddressType ip_type() const noexcept { return ip_type_; }
  const Ipv4Address& ip_address() const noexcept { return ip_address_; }
  const Ipv4Address& ip_netmask() const noexcept { return ip_netmask_; }
  const Ipv4Address& ip_gateway() const noexcept { return ip_gateway_; }
  const ControllerVersion& app_version() const noexcept { return app_version_; }
  const ControllerVersion& boot_version() const noexcept { return boot_version_; }
  const ControllerVersion& hardware_version() const noexcept { return hardware_version_; }

  // 生の32バイト（内容は機器依存）
  const DeviceName& device_name() const noexcept { return device_name_; }

  // 最初の NUL までを文字列として返す
  std::string device_name_string() const;

private:
  ControllerInfo() = default;

  MacAddress mac_address_{};
  std::chrono::seconds uptime_{0};
  ControllerMode mode_ = ControllerMode::Bootloader;
  ControllerAlert alert_ = ControllerAlert::Ok;
  IpAddressType ip_type_ = IpAddressType::Dynamic;
  Ipv4Address ip_address_{};
  Ipv4Address ip_netmask_{};
  Ipv4Address ip_gateway_{};
  ControllerVersion app_version_{};
  ControllerVersion boot_version_{};
  ControllerVersion hardware_version_{};
  DeviceName device_name_{};
};

} // namespace prologixlib::proto
