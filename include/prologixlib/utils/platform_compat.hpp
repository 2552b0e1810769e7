#pragma once

/**
 * @brief Windows/POSIX互換性ヘッダー
 *
 * UDPソケット操作で使う差異のみを吸収する
 */

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>

    using ssize_t = long long;
    using socklen_t = int;
    using socket_handle_t = SOCKET;
    constexpr socket_handle_t kInvalidSocket = INVALID_SOCKET;

    #define platform_close_socket(s) ::closesocket(s)
#else  // POSIX (Linux, macOS, etc.)
    #include <sys/types.h>
    #include <sys/socket.h>
    #include <sys/time.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <netdb.h>
    #include <unistd.h>

    using socket_handle_t = int;
    constexpr socket_handle_t kInvalidSocket = -1;

    #define platform_close_socket(s) ::close(s)
#endif

#include <chrono>
#include <cstddef>

namespace prologixlib::utils {

/**
 * @brief プラットフォーム固有の初期化
 */
inline bool initialize_platform() {
#ifdef _WIN32
    WSADATA wsaData;
    return WSAStartup(MAKEWORD(2, 2), &wsaData) == 0;
#else
    return true;  // POSIX では何もしない
#endif
}

/**
 * @brief プラットフォーム固有のクリーンアップ
 */
inline void cleanup_platform() {
#ifdef _WIN32
    WSACleanup();
#endif
}

inline int platform_setsockopt(socket_handle_t sockfd, int level, int optname, const void* optval, socklen_t optlen) {
#ifdef _WIN32
    return ::setsockopt(sockfd, level, optname, reinterpret_cast<const char*>(optval), optlen);
#else
    return ::setsockopt(sockfd, level, optname, optval, optlen);
#endif
}

/**
 * @brief 受信タイムアウト（SO_RCVTIMEO）を設定
 */
inline int platform_set_recv_timeout(socket_handle_t sockfd, std::chrono::milliseconds timeout) {
#ifdef _WIN32
    DWORD tv = static_cast<DWORD>(timeout.count());
    return platform_setsockopt(sockfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#else
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return platform_setsockopt(sockfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#endif
}

inline ssize_t platform_sendto(socket_handle_t sockfd, const void* buf, size_t len, int flags,
                               const struct sockaddr* dest_addr, socklen_t addrlen) {
#ifdef _WIN32
    return ::sendto(sockfd, reinterpret_cast<const char*>(buf), static_cast<int>(len), flags, dest_addr, addrlen);
#else
    return ::sendto(sockfd, buf, len, flags, dest_addr, addrlen);
#endif
}

inline ssize_t platform_recvfrom(socket_handle_t sockfd, void* buf, size_t len, int flags,
                                 struct sockaddr* src_addr, socklen_t* addrlen) {
#ifdef _WIN32
    return ::recvfrom(sockfd, reinterpret_cast<char*>(buf), static_cast<int>(len), flags, src_addr, addrlen);
#else
    return ::recvfrom(sockfd, buf, len, flags, src_addr, addrlen);
#endif
}

}  // namespace prologixlib::utils
