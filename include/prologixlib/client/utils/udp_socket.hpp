#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <string>

#include "prologixlib/error.hpp"
#include "prologixlib/expected.hpp"
#include "prologixlib/packet/types.hpp"
#include "prologixlib/utils/platform_compat.hpp"

namespace prologixlib::client::utils {

/**
 * @brief 受信した1データグラム
 */
struct Datagram {
    size_t length = 0;
    proto::Ipv4Address source{};
};

/**
 * @brief IPv4 UDPソケット（RAII）
 *
 * 呼び出しごとに生成し、スコープを抜けると閉じる。
 */
class UdpSocket {
public:
    /**
     * @brief 0.0.0.0:0 にバインドしたソケットを作成
     * @return ソケット、失敗時 io_error
     */
    static prologixlib::Result<UdpSocket> open_ephemeral() noexcept;

    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    ~UdpSocket();

    std::error_code enable_broadcast() noexcept;
    std::error_code set_receive_timeout(std::chrono::milliseconds timeout) noexcept;

    /**
     * @brief 宛先へ1データグラム送信
     * @param destination IPv4アドレス（ドット表記）またはホスト名
     * @param port 宛先ポート
     * @param payload 送信データ
     */
    std::error_code send_to(const std::string& destination, uint16_t port,
                            std::span<const std::uint8_t> payload) noexcept;

    /**
     * @brief 1データグラム受信（SO_RCVTIMEO に従って戻る）
     * @param buffer 受信バッファ（超過分は切り詰め）
     * @return 受信結果、タイムアウト・エラー時は io_error
     */
    prologixlib::Result<Datagram> receive_from(std::span<std::uint8_t> buffer) noexcept;

private:
    explicit UdpSocket(socket_handle_t sock) noexcept : sock_(sock) {}
    void close() noexcept;

    socket_handle_t sock_ = kInvalidSocket;
};

/**
 * @brief ドット表記またはホスト名からIPv4アドレスを解決
 * @return sockaddr_in（ポートは未設定）、失敗時 io_error
 */
prologixlib::Result<sockaddr_in> resolve_ipv4(const std::string& host) noexcept;

} // namespace prologixlib::client::utils
