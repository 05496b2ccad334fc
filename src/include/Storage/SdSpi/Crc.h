#pragma once

#include <cstdint>
#include <cstddef>

namespace Storage::SdSpi
{
/**
 * @brief CRC7 as used for command frames and CID/CSD registers (polynomial 0x09)
 * @retval uint8_t 7-bit CRC, not shifted
 */
uint8_t crc7(const void* data, size_t len);

/**
 * @brief CRC16-CCITT as used for data blocks (polynomial 0x1021)
 * @param crc Initial value, 0 for a new block
 */
uint16_t crc16(uint16_t crc, const void* data, size_t len);

} // namespace Storage::SdSpi
