#include "prologixlib/prologix.hpp"

namespace prologixlib {

Result<std::vector<ControllerInfo>> discover(std::chrono::milliseconds time_budget) noexcept {
  return client::DiscoveryClient{}.discover(time_budget);
}

std::future<Result<std::vector<ControllerInfo>>> discover_async(std::chrono::milliseconds time_budget) {
  return client::DiscoveryClient{}.discover_async(time_budget);
}

Result<void> reboot(const std::string& address, RebootType type) noexcept {
  return client::RebootClient{}.reboot(address, type);
}

std::future<Result<void>> reboot_async(const std::string& address, RebootType type) {
  return client::RebootClient{}.reboot_async(address, type);
}

} // namespace prologixlib
