#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace prologixlib::proto {

constexpr uint8_t kMagic = 0x5A;
constexpr uint16_t kControllerPort = 3040;

constexpr size_t kMinReplyPrefixSize = 24u;   // IPアドレスまでを含む最小長
constexpr size_t kControllerInfoSize = 76u;   // identify 応答の全長
constexpr size_t kDeviceNameSize = 32u;

constexpr std::chrono::milliseconds kDefaultDiscoveryTimeBudget{500};
constexpr std::chrono::milliseconds kReceiveAttemptTimeout{100};

enum class CommandId : uint8_t {
  Identify = 0x00,
  Reboot = 0x12,
};

enum class RebootType : uint8_t {
  Bootloader = 0,
  Reset = 1,
};

enum class ControllerMode : uint8_t {
  Bootloader = 0,
  Application = 1,
};

enum class ControllerAlert : uint8_t {
  Ok = 0,
  Warning = 1,
  Error = 2,
};

enum class IpAddressType : uint8_t {
  Dynamic = 0,
  Static = 1,
};

// 未定義値は最後の列挙子に丸める（機器側の実装に合わせる）
inline ControllerMode controller_mode_from_byte(uint8_t b) noexcept {
  return b == 0 ? ControllerMode::Bootloader : ControllerMode::Application;
}

inline ControllerAlert controller_alert_from_byte(uint8_t b) noexcept {
  switch (b) {
    case 0: return ControllerAlert::Ok;
    case 1: return ControllerAlert::Warning;
    default: return ControllerAlert::Error;
  }
}

inline IpAddressType ip_address_type_from_byte(uint8_t b) noexcept {
  return b == 0 ? IpAddressType::Dynamic : IpAddressType::Static;
}

const char* to_string(ControllerMode mode) noexcept;
const char* to_string(ControllerAlert alert) noexcept;
const char* to_string(IpAddressType type) noexcept;
const char* to_string(RebootType type) noexcept;

/**
 * @brief 6バイトのMACアドレス
 */
class MacAddress {
public:
  using Bytes = std::array<uint8_t, 6>;

  MacAddress() = default;
  explicit MacAddress(const Bytes& bytes) : bytes_(bytes) {}

  /**
   * @brief ブロードキャスト用の FF:FF:FF:FF:FF:FF
   */
  static MacAddress broadcast() noexcept {
    return MacAddress(Bytes{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF});
  }

  const Bytes& bytes() const noexcept { return bytes_; }

  /**
   * @brief "AA:BB:CC:DD:EE:FF" 形式（大文字16進）
   */
  std::string to_string() const;

  bool operator==(const MacAddress& other) const noexcept { return bytes_ == other.bytes_; }
  bool operator!=(const MacAddress& other) const noexcept { return bytes_ != other.bytes_; }

private:
  Bytes bytes_{};
};

/**
 * @brief ネットワークバイトオーダーのIPv4アドレス
 */
class Ipv4Address {
public:
  using Bytes = std::array<uint8_t, 4>;

  Ipv4Address() = default;
  explicit Ipv4Address(const Bytes& bytes) : bytes_(bytes) {}
  Ipv4Address(uint8_t a, uint8_t b, uint8_t c, uint8_t d) : bytes_{a, b, c, d} {}

  const Bytes& bytes() const noexcept { return bytes_; }

  // ホストバイトオーダーの32bit値（マップのキー用）
  uint32_t to_uint32() const noexcept {
    return (static_cast<uint32_t>(bytes_[0]) << 24) | (static_cast<uint32_t>(bytes_[1]) << 16)
         | (static_cast<uint32_t>(bytes_[2]) << 8) | static_cast<uint32_t>(bytes_[3]);
  }

  /**
   * @brief ネットマスクとして見たときのプレフィックス長
   * @return 0-32（連続していないマスクは -1）
   */
  int prefix_length() const noexcept;

  std::string to_string() const;

  bool operator==(const Ipv4Address& other) const noexcept { return bytes_ == other.bytes_; }
  bool operator!=(const Ipv4Address& other) const noexcept { return bytes_ != other.bytes_; }

private:
  Bytes bytes_{};
};

struct ControllerVersion {
  uint8_t major = 0;
  uint8_t minor = 0;
  uint8_t patch = 0;
  uint8_t bugfix = 0;

  std::string to_string() const;

  bool operator==(const ControllerVersion& o) const noexcept {
    return major == o.major && minor == o.minor && patch == o.patch && bugfix == o.bugfix;
  }
};

} // namespace prologixlib::proto
