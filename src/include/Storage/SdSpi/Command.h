#pragma once

#include <cstdint>
#include <cstddef>

namespace Storage::SdSpi
{
/* SD commands (SPI mode) */
enum Command : uint8_t {
	CMD0 = 0,			// R1 GO_IDLE_STATE
	CMD8 = 8,			// R7 SEND_IF_COND
	CMD9 = 9,			// R1 SEND_CSD
	CMD10 = 10,			// R1 SEND_CID
	CMD16 = 16,			// R1 SET_BLOCKLEN
	CMD17 = 17,			// R1 READ_SINGLE_BLOCK
	CMD24 = 24,			// R1 WRITE_BLOCK
	CMD32 = 32,			// R1 ERASE_ER_BLK_START
	CMD33 = 33,			// R1 ERASE_ER_BLK_END
	CMD38 = 38,			// R1b ERASE
	CMD55 = 55,			// R1 APP_CMD
	CMD58 = 58,			// R3 READ_OCR
	CMD59 = 59,			// R1 CRC_ON_OFF
	ACMD41 = 0x80 | 41, // R1 SD_SEND_OP_COND
};

// ACMD<n> is the command sequence CMD55, CMD<n>
constexpr uint8_t appCommandFlag{0x80};

/* Arguments */
constexpr uint32_t ifCondArg{0x000001aa};	///< CMD8: 2.7-3.6V, check pattern 0xAA
constexpr uint32_t ifCondMask{0x00000fff};	 ///< CMD8: voltage accepted + check pattern echo
constexpr uint32_t acmd41HcsBit{1UL << 30};	///< ACMD41: host supports high capacity
constexpr uint32_t ocrCcsBit{1UL << 30};	   ///< OCR: card capacity status (block addressed)
constexpr uint32_t ocrPowerUpBit{1UL << 31};   ///< OCR: power-up sequence complete

/**
 * @brief A command packet
 *
 * 	byte 0		0 1 index[5:0]
 * 	byte 1-4	argument, MSB first
 * 	byte 5		crc7[6:0] 1
 */
struct Frame {
	static constexpr size_t size{6};

	uint8_t bytes[size];

	uint8_t index() const
	{
		return bytes[0] & 0x3f;
	}

	uint32_t argument() const
	{
		return (uint32_t(bytes[1]) << 24) | (uint32_t(bytes[2]) << 16) | (uint32_t(bytes[3]) << 8) | bytes[4];
	}

	uint8_t crc() const
	{
		return bytes[5] >> 1;
	}
};

/**
 * @brief Build a command frame
 * @param index Command index, only the low 6 bits are used
 * @param arg Command argument
 */
Frame encode(uint8_t index, uint32_t arg);

} // namespace Storage::SdSpi
