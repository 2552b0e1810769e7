#pragma once

#include <optional>
#include <system_error>
#include <utility>

namespace prologixlib {

template<typename T>
class Result {
public:
  Result(const T& value) : value_(value) {}
  Result(T&& value) : value_(std::move(value)) {}
  Result(std::error_code ec) : ec_(ec) {}

  bool has_value() const noexcept { return value_.has_value(); }
  explicit operator bool() const noexcept { return value_.has_value(); }
  /**
   * @brief 保持している値
   *
   * エラー時に呼ぶと std::bad_optional_access を送出する。
   * 先に has_value() で確認すること。
   */
  const T& value() const { return value_.value(); }
  T& value() { return value_.value(); }
  const std::error_code& error() const { return ec_; }

private:
  // 値型がデフォルト構築不可でも保持できるよう optional に格納
  std::optional<T> value_{};
  std::error_code ec_{};
};

// 値を持たない操作（送信のみ等）の成否
template<>
class Result<void> {
public:
  Result() = default;
  Result(std::error_code ec) : ec_(ec) {}

  bool has_value() const noexcept { return !ec_; }
  explicit operator bool() const noexcept { return !ec_; }
  const std::error_code& error() const { return ec_; }

private:
  std::error_code ec_{};
};

} // namespace prologixlib
