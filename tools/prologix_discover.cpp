#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "prologixlib/client/discovery_client.hpp"
#include "prologixlib/utils/env.hpp"
#include "prologixlib/utils/log_config.hpp"

using namespace prologixlib;
using namespace prologixlib::proto;

static std::string format_uptime(std::chrono::seconds up) {
  auto s = up.count();
  std::ostringstream ss;
  ss << (s / 86400) << "d " << std::setw(2) << std::setfill('0') << ((s / 3600) % 24) << ':'
     << std::setw(2) << ((s / 60) % 60) << ':' << std::setw(2) << (s % 60);
  return ss.str();
}

int main(int argc, char** argv) {
  utils::log_utils::setup_basic_logging(utils::log_utils::log_level_from_env());

  auto budget = utils::discovery_time_budget_from_env();
  if (argc >= 2) {
    char* end = nullptr;
    long ms = std::strtol(argv[1], &end, 10);
    if (end == argv[1] || *end != '\0' || ms < 0) {
      std::cerr << "Usage: prologix_discover [timeout_ms]\n";
      return 2;
    }
    budget = std::chrono::milliseconds{ms};
  }

  auto discovery = client::DiscoveryClient::from_env();
  auto res = discovery.discover(budget);
  if (!res) {
    std::cerr << "discover: " << res.error().message() << "\n";
    return res.error() == PrologixErrc::not_found ? 1 : 2;
  }

  for (const auto& c : res.value()) {
    std::cout << c.ip_address().to_string()
              << " mac=" << c.mac_address().to_string()
              << " mode=" << to_string(c.mode())
              << " alert=" << to_string(c.alert())
              << " ip_type=" << to_string(c.ip_type())
              << " netmask=" << c.ip_netmask().to_string()
              << " gateway=" << c.ip_gateway().to_string()
              << " app=" << c.app_version().to_string()
              << " boot=" << c.boot_version().to_string()
              << " hw=" << c.hardware_version().to_string()
              << " uptime=" << format_uptime(c.uptime());
    auto name = c.device_name_string();
    if (!name.empty()) std::cout << " name=\"" << name << "\"";
    std::cout << "\n";
  }
  utils::LogManager::instance().flush_all();
  return 0;
}
