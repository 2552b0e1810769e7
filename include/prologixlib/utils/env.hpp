#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace prologixlib::utils {

// OSごとの環境変数名の違いを吸収するgetenvラッパー
std::optional<std::string> getenv_os(const std::string& key);

/**
 * @brief PROLOGIX_BROADCAST_ADDRESS（未設定時は 255.255.255.255）
 */
std::string broadcast_address_from_env();

/**
 * @brief PROLOGIX_CONTROLLER_PORT（未設定・不正時は 3040）
 */
uint16_t controller_port_from_env();

/**
 * @brief PROLOGIX_DISCOVERY_TIMEOUT_MS（未設定・不正時は 500ms）
 */
std::chrono::milliseconds discovery_time_budget_from_env();

} // namespace prologixlib::utils
