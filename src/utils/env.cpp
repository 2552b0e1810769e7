#include "prologixlib/utils/env.hpp"

#include <cstdlib>
#include <limits>

#include "prologixlib/packet/types.hpp"

namespace prologixlib::utils {

namespace {

// 10進の非負整数のみ受け付ける
std::optional<unsigned long long> parse_unsigned(const std::string& s) {
    if (s.empty()) return std::nullopt;
    unsigned long long v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        if (v > (std::numeric_limits<unsigned long long>::max() - 9) / 10) return std::nullopt;
        v = v * 10 + static_cast<unsigned long long>(c - '0');
    }
    return v;
}

} // namespace

std::optional<std::string> getenv_os(const std::string& key) {
#ifdef _WIN32
    std::string os_key = key;
    if (key == "HOME") {
        os_key = "USERPROFILE"; // WindowsのHOME相当
    }
#else
    std::string os_key = key;
#endif
    const char* value = std::getenv(os_key.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string broadcast_address_from_env() {
    if (auto v = getenv_os("PROLOGIX_BROADCAST_ADDRESS"); v && !v->empty()) return *v;
    return "255.255.255.255";
}

uint16_t controller_port_from_env() {
    if (auto v = getenv_os("PROLOGIX_CONTROLLER_PORT")) {
        auto n = parse_unsigned(*v);
        if (n && *n > 0 && *n <= 65535) return static_cast<uint16_t>(*n);
    }
    return proto::kControllerPort;
}

std::chrono::milliseconds discovery_time_budget_from_env() {
    if (auto v = getenv_os("PROLOGIX_DISCOVERY_TIMEOUT_MS")) {
        auto n = parse_unsigned(*v);
        if (n && *n <= static_cast<unsigned long long>(std::numeric_limits<int32_t>::max())) {
            return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(*n)};
        }
    }
    return proto::kDefaultDiscoveryTimeBudget;
}

} // namespace prologixlib::utils
