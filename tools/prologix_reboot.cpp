#include <iostream>
#include <string>

#include "prologixlib/client/reboot_client.hpp"
#include "prologixlib/utils/log_config.hpp"

using namespace prologixlib;
using namespace prologixlib::proto;

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: prologix_reboot <address> [reset|bootloader]\n";
    return 2;
  }
  utils::log_utils::setup_basic_logging(utils::log_utils::log_level_from_env());

  RebootType type = RebootType::Reset;
  if (argc >= 3) {
    std::string t = argv[2];
    if (t == "reset") type = RebootType::Reset;
    else if (t == "bootloader") type = RebootType::Bootloader;
    else { std::cerr << "unknown reboot type: " << t << "\n"; return 2; }
  }

  auto rebooter = client::RebootClient::from_env();
  auto res = rebooter.reboot(argv[1], type);
  if (!res) {
    std::cerr << "reboot: " << res.error().message() << "\n";
    return 1;
  }
  std::cout << "reboot (" << to_string(type) << ") sent to " << argv[1] << "\n";
  utils::LogManager::instance().flush_all();
  return 0;
}
