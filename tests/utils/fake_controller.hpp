#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

// テスト用の identify 応答パラメータ
struct ReplySpec {
    std::array<uint8_t, 6> mac{0x00, 0x21, 0x69, 0x01, 0x02, 0x03};
    uint16_t uptime_days = 0;
    uint8_t uptime_hours = 0;
    uint8_t uptime_minutes = 0;
    uint8_t uptime_seconds = 0;
    uint8_t mode = 1;
    uint8_t alert = 0;
    uint8_t ip_type = 0;
    std::array<uint8_t, 4> ip{192, 168, 1, 50};
    std::array<uint8_t, 4> netmask{255, 255, 255, 0};
    std::array<uint8_t, 4> gateway{192, 168, 1, 1};
    std::array<uint8_t, 4> app_version{1, 6, 6, 0};
    std::array<uint8_t, 4> boot_version{1, 2, 0, 0};
    std::array<uint8_t, 4> hardware_version{1, 0, 0, 0};
    std::vector<uint8_t> name{};
    uint16_t sequence = 0x1234;
};

// 76バイトの identify 応答を組み立てる
std::vector<uint8_t> build_controller_reply(const ReplySpec& spec);

/**
 * @brief 127.0.0.1 上で動作するコントローラのモック
 *
 * 受信したデータグラムを記録し、identify 要求（先頭 0x5A,0x00）には
 * 設定された応答列を順に送り返す。
 */
class FakeController {
public:
    FakeController();
    ~FakeController();

    // 127.0.0.1:0 にバインドしてスレッドを開始
    bool start();
    void stop();

    uint16_t port() const { return port_; }

    // identify 要求に対して返すデータグラム列
    void set_replies(std::vector<std::vector<uint8_t>> replies);

    // 応答の間隔
    void set_reply_interval(std::chrono::milliseconds interval);

    std::vector<std::vector<uint8_t>> received() const;

    // 指定数のデータグラムを受信するまで待つ
    bool wait_for_datagrams(size_t count, std::chrono::milliseconds timeout) const;

private:
    void server_loop();

    int sock_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
    mutable std::mutex mutex_;
    std::vector<std::vector<uint8_t>> replies_;
    std::vector<std::vector<uint8_t>> received_;
    std::chrono::milliseconds reply_interval_{0};
};
