#include "prologixlib/client/utils/udp_socket.hpp"

#include <cstring>

namespace prologixlib::client::utils {

using prologixlib::utils::platform_recvfrom;
using prologixlib::utils::platform_sendto;
using prologixlib::utils::platform_set_recv_timeout;
using prologixlib::utils::platform_setsockopt;

prologixlib::Result<UdpSocket> UdpSocket::open_ephemeral() noexcept {
    if (!prologixlib::utils::initialize_platform()) {
        return make_error_code(PrologixErrc::io_error);
    }
#if defined(_WIN32)
    socket_handle_t sock = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
#else
    socket_handle_t sock = ::socket(AF_INET, SOCK_DGRAM, 0);
#endif
    if (sock == kInvalidSocket) {
        prologixlib::utils::cleanup_platform();
        return make_error_code(PrologixErrc::io_error);
    }
    UdpSocket s(sock);

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = htons(0);
    if (::bind(sock, reinterpret_cast<sockaddr*>(&local), sizeof(local)) != 0) {
        return make_error_code(PrologixErrc::io_error);
    }
    return prologixlib::Result<UdpSocket>(std::move(s));
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept : sock_(other.sock_) {
    other.sock_ = kInvalidSocket;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        sock_ = other.sock_;
        other.sock_ = kInvalidSocket;
    }
    return *this;
}

UdpSocket::~UdpSocket() { close(); }

void UdpSocket::close() noexcept {
    if (sock_ != kInvalidSocket) {
        platform_close_socket(sock_);
        sock_ = kInvalidSocket;
        prologixlib::utils::cleanup_platform();
    }
}

std::error_code UdpSocket::enable_broadcast() noexcept {
    int on = 1;
    if (platform_setsockopt(sock_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) != 0) {
        return make_error_code(PrologixErrc::io_error);
    }
    return {};
}

std::error_code UdpSocket::set_receive_timeout(std::chrono::milliseconds timeout) noexcept {
    if (platform_set_recv_timeout(sock_, timeout) != 0) {
        return make_error_code(PrologixErrc::io_error);
    }
    return {};
}

std::error_code UdpSocket::send_to(const std::string& destination, uint16_t port,
                                   std::span<const std::uint8_t> payload) noexcept {
    auto addr_res = resolve_ipv4(destination);
    if (!addr_res) return addr_res.error();
    sockaddr_in addr = addr_res.value();
    addr.sin_port = htons(port);
    ssize_t sent = platform_sendto(sock_, payload.data(), payload.size(), 0,
                                   reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (sent < 0 || static_cast<size_t>(sent) != payload.size()) {
        return make_error_code(PrologixErrc::io_error);
    }
    return {};
}

prologixlib::Result<Datagram> UdpSocket::receive_from(std::span<std::uint8_t> buffer) noexcept {
    sockaddr_in from{};
    socklen_t fromlen = sizeof(from);
    ssize_t rlen = platform_recvfrom(sock_, buffer.data(), buffer.size(), 0,
                                     reinterpret_cast<sockaddr*>(&from), &fromlen);
    if (rlen < 0) {
        // タイムアウト（EAGAIN/EWOULDBLOCK）を含む
        return make_error_code(PrologixErrc::io_error);
    }
    Datagram d{};
    // 切り詰められた場合もバッファ長を超えない
    d.length = static_cast<size_t>(rlen) < buffer.size() ? static_cast<size_t>(rlen) : buffer.size();
    proto::Ipv4Address::Bytes b{};
    std::memcpy(b.data(), &from.sin_addr, 4);
    d.source = proto::Ipv4Address(b);
    return d;
}

prologixlib::Result<sockaddr_in> resolve_ipv4(const std::string& host) noexcept {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
        return addr;
    }
    // 名前解決（IPv4）
    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    struct addrinfo* res = nullptr;
    if (::getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || res == nullptr) {
        return make_error_code(PrologixErrc::io_error);
    }
    auto* a = reinterpret_cast<sockaddr_in*>(res->ai_addr);
    addr.sin_addr = a->sin_addr;
    ::freeaddrinfo(res);
    return addr;
}

} // namespace prologixlib::client::utils
