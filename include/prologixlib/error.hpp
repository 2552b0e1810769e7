#pragma once

#include <string>
#include <system_error>

namespace prologixlib {

enum class PrologixErrc {
  ok = 0,
  io_error = 1,
  not_found = 2,
  packet_too_short = 3,
  invalid_magic = 4,
};

} // namespace prologixlib

namespace std {
template<> struct is_error_code_enum<prologixlib::PrologixErrc> : true_type {};
}

namespace prologixlib {

class PrologixErrorCategory final : public std::error_category {
public:
  const char* name() const noexcept override { return "prologixlib"; }
  std::string message(int ev) const override {
    switch (static_cast<PrologixErrc>(ev)) {
      case PrologixErrc::ok: return "ok";
      case PrologixErrc::io_error: return "socket error";
      case PrologixErrc::not_found: return "no controller found";
      case PrologixErrc::packet_too_short: return "failed to parse controller info: packet too short";
      case PrologixErrc::invalid_magic: return "incorrect magic number at start of message";
      default: return "unknown error";
    }
  }
};

inline const std::error_category& prologix_error_category() {
  static PrologixErrorCategory cat;
  return cat;
}

inline std::error_code make_error_code(PrologixErrc e) {
  return {static_cast<int>(e), prologix_error_category()};
}

// 受信データの構造解析エラー（短すぎる / マジック不一致）
inline bool is_parse_error(const std::error_code& ec) noexcept {
  return ec == PrologixErrc::packet_too_short || ec == PrologixErrc::invalid_magic;
}

} // namespace prologixlib
