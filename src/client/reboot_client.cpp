#include "prologixlib/client/reboot_client.hpp"

#include <iostream>

#include "prologixlib/client/utils/udp_socket.hpp"
#include "prologixlib/packet/request.hpp"
#include "prologixlib/utils/env.hpp"
#include "prologixlib/utils/log_config.hpp"

namespace prologixlib::client {

using namespace prologixlib::proto;

RebootClient RebootClient::from_env(bool debug) {
  return RebootClient(prologixlib::utils::controller_port_from_env(), debug);
}

prologixlib::Result<void> RebootClient::reboot(const std::string& target, RebootType type) const noexcept {
  auto logger = prologixlib::utils::LogManager::instance().get_logger("reboot");

  auto sock_res = utils::UdpSocket::open_ephemeral();
  if (!sock_res) {
    PROLOGIXLIB_LOG_ERROR(logger, "failed to open UDP socket");
    return sock_res.error();
  }
  utils::UdpSocket sock = std::move(sock_res.value());

  const auto request = build_reboot_request(type);
  if (auto ec = sock.send_to(target, port_, request)) {
    PROLOGIXLIB_LOG_ERROR(logger, "reboot send to " + target + ":" + std::to_string(port_) + " failed");
    return ec;
  }
  const std::string sent = std::string("reboot (") + to_string(type) + ") sent to "
                           + target + ":" + std::to_string(port_);
  // debug_ は共有ロガーのレベルを変えず、この呼び出しの出力だけを増やす
  if (debug_) {
    std::cerr << "DEBUG: [reboot] " << sent << std::endl;
  } else {
    PROLOGIXLIB_LOG_DEBUG(logger, sent);
  }
  return {};
}

prologixlib::Result<void> RebootClient::reboot(const Ipv4Address& target, RebootType type) const noexcept {
  return reboot(target.to_string(), type);
}

std::future<prologixlib::Result<void>> RebootClient::reboot_async(const std::string& target, RebootType type) const {
  RebootClient self = *this;
  return std::async(std::launch::async, [self, target, type]() {
    return self.reboot(target, type);
  });
}

} // namespace prologixlib::client
