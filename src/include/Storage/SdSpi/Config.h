#pragma once

#include <cstdint>

#ifndef SDSPI_INIT_FREQUENCY
#define SDSPI_INIT_FREQUENCY 400000
#endif

#ifndef SDSPI_MAX_FREQUENCY
#define SDSPI_MAX_FREQUENCY 40000000
#endif

#ifndef SDSPI_RESPONSE_BYTES
#define SDSPI_RESPONSE_BYTES 8
#endif

#ifndef SDSPI_INIT_TIMEOUT_MS
#define SDSPI_INIT_TIMEOUT_MS 1000
#endif

#ifndef SDSPI_READ_TIMEOUT_MS
#define SDSPI_READ_TIMEOUT_MS 250
#endif

#ifndef SDSPI_WRITE_TIMEOUT_MS
#define SDSPI_WRITE_TIMEOUT_MS 500
#endif

#ifndef SDSPI_ERASE_TIMEOUT_MS
#define SDSPI_ERASE_TIMEOUT_MS 5000
#endif

namespace Storage::SdSpi
{
/**
 * @brief Card operating parameters
 */
struct Config {
	uint32_t initFrequency{SDSPI_INIT_FREQUENCY}; ///< Clock during initialisation, must not exceed 400kHz
	uint32_t frequency{0};						  ///< Operating clock, 0 for maximum supported
	uint8_t cmd0Attempts{5};					  ///< Number of GO_IDLE_STATE attempts
	uint8_t responseBytes{SDSPI_RESPONSE_BYTES};  ///< Command response poll budget in bytes (Ncr)
	uint32_t initTimeoutMs{SDSPI_INIT_TIMEOUT_MS};
	uint32_t readTimeoutMs{SDSPI_READ_TIMEOUT_MS};
	uint32_t writeTimeoutMs{SDSPI_WRITE_TIMEOUT_MS};
	uint32_t eraseTimeoutMs{SDSPI_ERASE_TIMEOUT_MS};
	bool crcEnabled{false};	///< Ask the card to check command and data CRCs (CMD59)
	bool verifyReadCrc{false}; ///< Check CRC16 of received data blocks
};

} // namespace Storage::SdSpi
