#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <string>
#include <vector>

#include "prologixlib/error.hpp"
#include "prologixlib/expected.hpp"
#include "prologixlib/packet/controller_info.hpp"
#include "prologixlib/packet/types.hpp"

namespace prologixlib::client {

/**
 * @brief Prologix GPIB-ETHERNET コントローラの探索クライアント
 *
 * discover() 1回につき identify 要求をちょうど1回ブロードキャストし、
 * 制限時間内に届いた応答をIPv4アドレスごとにまとめて返す。
 * 呼び出しごとに専用ソケットを使うため、同一インスタンスへの並行呼び出しも可。
 */
class DiscoveryClient {
public:
  DiscoveryClient(std::string broadcast_address = default_broadcast_address(),
                  uint16_t port = proto::kControllerPort,
                  bool debug = false)
    : broadcast_address_(std::move(broadcast_address)), port_(port), debug_(debug) {}

  /**
   * @brief PROLOGIX_BROADCAST_ADDRESS / PROLOGIX_CONTROLLER_PORT から構築
   */
  static DiscoveryClient from_env(bool debug = false);
  static std::string default_broadcast_address() { return "255.255.255.255"; }

  /**
   * @brief コントローラを探索
   * @param time_budget 送信後に応答を待つ時間
   * @return 応答したコントローラ（順不同）
   *
   * エラー:
   * - io_error: ソケット作成・ブロードキャスト設定・送信に失敗
   * - not_found: 時間内に有効な応答なし
   * - packet_too_short / invalid_magic: 24バイト以上の不正な応答を受信（探索全体を中断）
   */
  prologixlib::Result<std::vector<proto::ControllerInfo>> discover(
      std::chrono::milliseconds time_budget = proto::kDefaultDiscoveryTimeBudget) const noexcept;

  /**
   * @brief discover() を別スレッドで実行
   */
  std::future<prologixlib::Result<std::vector<proto::ControllerInfo>>> discover_async(
      std::chrono::milliseconds time_budget = proto::kDefaultDiscoveryTimeBudget) const;

  const std::string& broadcast_address() const noexcept { return broadcast_address_; }
  uint16_t port() const noexcept { return port_; }

private:
  std::string broadcast_address_;
  uint16_t port_;
  bool debug_ = false;
};

} // namespace prologixlib::client
