#pragma once

#include <chrono>
#include <future>
#include <string>
#include <vector>

#include "prologixlib/client/discovery_client.hpp"
#include "prologixlib/client/reboot_client.hpp"
#include "prologixlib/error.hpp"
#include "prologixlib/expected.hpp"
#include "prologixlib/packet/controller_info.hpp"
#include "prologixlib/packet/types.hpp"

namespace prologixlib {

using proto::ControllerInfo;
using proto::RebootType;

/**
 * @brief ネットワーク上のコントローラを探索（255.255.255.255:3040）
 * @param time_budget 応答待ち時間（既定 500ms）
 */
Result<std::vector<ControllerInfo>> discover(
    std::chrono::milliseconds time_budget = proto::kDefaultDiscoveryTimeBudget) noexcept;

std::future<Result<std::vector<ControllerInfo>>> discover_async(
    std::chrono::milliseconds time_budget = proto::kDefaultDiscoveryTimeBudget);

/**
 * @brief 指定アドレスのコントローラへ reboot 要求を送信
 */
Result<void> reboot(const std::string& address, RebootType type) noexcept;

std::future<Result<void>> reboot_async(const std::string& address, RebootType type);

} // namespace prologixlib
