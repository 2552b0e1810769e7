#pragma once

#include <cstdint>

#include "prologixlib/packet/packet.hpp"

namespace prologixlib::proto {

/**
 * @brief ランダムなシーケンス番号を生成
 *
 * 呼び出しごとに生成器を作るため、プロセス全体の状態は持たない。
 */
uint16_t generate_sequence();

/**
 * @brief identify 要求（12バイト）を構築
 * @return magic=0x5A, command=Identify, MAC=FF:FF:FF:FF:FF:FF のヘッダのみ
 */
IdentifyRequestBytes build_identify_request();

/**
 * @brief シーケンス番号を指定して identify 要求を構築
 * @param sequence シーケンス番号
 */
IdentifyRequestBytes build_identify_request(uint16_t sequence) noexcept;

/**
 * @brief reboot 要求（16バイト）を構築
 * @param type 再起動種別
 * @return ヘッダ + [type, 0, 0, 0]
 */
RebootRequestBytes build_reboot_request(RebootType type);

RebootRequestBytes build_reboot_request(RebootType type, uint16_t sequence) noexcept;

} // namespace prologixlib::proto
