#pragma once

#include <cstdint>
#include <future>
#include <string>

#include "prologixlib/error.hpp"
#include "prologixlib/expected.hpp"
#include "prologixlib/packet/types.hpp"

namespace prologixlib::client {

/**
 * @brief コントローラへ reboot 要求を送るクライアント
 *
 * 送信のみで応答は待たない。成功はローカルの送信受付を意味するだけで、
 * 到達や再起動の完了を示すものではない。
 */
class RebootClient {
public:
  explicit RebootClient(uint16_t port = proto::kControllerPort, bool debug = false)
    : port_(port), debug_(debug) {}

  /**
   * @brief PROLOGIX_CONTROLLER_PORT から構築
   */
  static RebootClient from_env(bool debug = false);

  /**
   * @brief reboot 要求を1回ユニキャスト送信
   * @param target IPv4アドレス（ドット表記）またはホスト名
   * @param type 再起動種別
   * @return 成功、またはソケット・名前解決・送信失敗時 io_error
   */
  prologixlib::Result<void> reboot(const std::string& target, proto::RebootType type) const noexcept;

  prologixlib::Result<void> reboot(const proto::Ipv4Address& target, proto::RebootType type) const noexcept;

  std::future<prologixlib::Result<void>> reboot_async(const std::string& target, proto::RebootType type) const;

  uint16_t port() const noexcept { return port_; }

private:
  uint16_t port_;
  bool debug_ = false;
};

} // namespace prologixlib::client
