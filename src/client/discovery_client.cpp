#include "prologixlib/client/discovery_client.hpp"

#include <array>
#include <iostream>
#include <unordered_map>

#include "prologixlib/client/utils/udp_socket.hpp"
#include "prologixlib/packet/codec.hpp"
#include "prologixlib/packet/request.hpp"
#include "prologixlib/utils/env.hpp"
#include "prologixlib/utils/log_config.hpp"

namespace prologixlib::client {

using namespace prologixlib::proto;

DiscoveryClient DiscoveryClient::from_env(bool debug) {
  return DiscoveryClient(prologixlib::utils::broadcast_address_from_env(),
                         prologixlib::utils::controller_port_from_env(), debug);
}

prologixlib::Result<std::vector<ControllerInfo>> DiscoveryClient::discover(
    std::chrono::milliseconds time_budget) const noexcept {
  auto logger = prologixlib::utils::LogManager::instance().get_logger("discovery");
  // debug_ はこの呼び出しだけに効く。共有ロガーの設定は変更しない
  const bool verbose = debug_ || logger->should_log(prologixlib::utils::LogLevel::Debug);
  auto debug_log = [&](const std::string& msg) {
    if (debug_) {
      std::cerr << "DEBUG: [discovery] " << msg << std::endl;
    } else {
      PROLOGIXLIB_LOG_DEBUG(logger, msg);
    }
  };

  auto sock_res = utils::UdpSocket::open_ephemeral();
  if (!sock_res) {
    PROLOGIXLIB_LOG_ERROR(logger, "failed to open UDP socket");
    return sock_res.error();
  }
  utils::UdpSocket sock = std::move(sock_res.value());
  if (auto ec = sock.enable_broadcast()) {
    PROLOGIXLIB_LOG_ERROR(logger, "failed to enable broadcast on socket");
    return ec;
  }
  if (auto ec = sock.set_receive_timeout(kReceiveAttemptTimeout)) {
    PROLOGIXLIB_LOG_ERROR(logger, "failed to set receive timeout");
    return ec;
  }

  const auto request = build_identify_request();
  if (auto ec = sock.send_to(broadcast_address_, port_, request)) {
    PROLOGIXLIB_LOG_ERROR(logger, "identify send to " + broadcast_address_ + ":" + std::to_string(port_) + " failed");
    return ec;
  }
  if (verbose) {
    debug_log("identify sent to " + broadcast_address_ + ":" + std::to_string(port_)
              + " seq=" + std::to_string(read_be16(request, 2)));
  }

  const auto deadline = std::chrono::steady_clock::now() + time_budget;
  std::unordered_map<uint32_t, ControllerInfo> controllers;
  // 76バイトを超える応答は切り詰められるが、デコードには先頭76バイトで足りる
  std::array<std::uint8_t, 512> buf{};

  while (std::chrono::steady_clock::now() < deadline) {
    auto rx = sock.receive_from(buf);
    if (!rx) {
      // タイムアウトまたは受信エラー → 期限を再確認して続行
      PROLOGIXLIB_LOG_TRACE(logger, "receive attempt returned without datagram");
      continue;
    }
    const auto& dgram = rx.value();
    if (dgram.length < kMinReplyPrefixSize) {
      PROLOGIXLIB_LOG_WARNING(logger, "discarding " + std::to_string(dgram.length) + "-byte datagram from "
                                      + dgram.source.to_string());
      continue;
    }
    auto info = ControllerInfo::from_bytes(std::span<const std::uint8_t>(buf.data(), dgram.length));
    if (!info) {
      PROLOGIXLIB_LOG_ERROR(logger, "malformed reply from " + dgram.source.to_string() + ": "
                                    + info.error().message());
      return info.error();
    }
    if (verbose) {
      debug_log("reply from " + info.value().ip_address().to_string()
                + " mac=" + info.value().mac_address().to_string());
    }
    // 同一アドレスは後着で上書き
    const uint32_t key = info.value().ip_address().to_uint32();
    controllers.insert_or_assign(key, std::move(info.value()));
  }

  if (controllers.empty()) {
    if (verbose) debug_log("no controller replied within " + std::to_string(time_budget.count()) + "ms");
    return make_error_code(PrologixErrc::not_found);
  }

  std::vector<ControllerInfo> out;
  out.reserve(controllers.size());
  for (auto& [addr, ci] : controllers) out.push_back(std::move(ci));
  return out;
}

std::future<prologixlib::Result<std::vector<ControllerInfo>>> DiscoveryClient::discover_async(
    std::chrono::milliseconds time_budget) const {
  // 設定をコピーしてクライアントの寿命から切り離す
  DiscoveryClient self = *this;
  return std::async(std::launch::async, [self, time_budget]() {
    return self.discover(time_budget);
  });
}

} // namespace prologixlib::client
