#pragma once

#include "Bus.h"
#include "Error.h"
#include "TimeSource.h"

namespace Storage::SdSpi
{
/* R1 response flags */
enum R1 : uint8_t {
	R1_IDLE_STATE = 0x01,
	R1_ERASE_RESET = 0x02,
	R1_ILLEGAL_COMMAND = 0x04,
	R1_CRC_ERROR = 0x08,
	R1_ERASE_SEQUENCE_ERROR = 0x10,
	R1_ADDRESS_ERROR = 0x20,
	R1_PARAMETER_ERROR = 0x40,
	R1_ERROR_MASK = 0x7e,
};

// Data block transfer control tokens
enum Token : uint8_t {
	TK_START_BLOCK_SINGLE = 0xfe,
};

/* Data error token bits, token is 0000eeee */
enum DataErrorBits : uint8_t {
	DE_ERROR = 0x01,
	DE_CC_ERROR = 0x02,
	DE_ECC_FAILED = 0x04,
	DE_OUT_OF_RANGE = 0x08,
};

/* Data response token, low 5 bits xxx0sss1 */
enum DataResponse : uint8_t {
	DR_MASK = 0x1f,
	DR_ACCEPTED = 0x05,
	DR_CRC_ERROR = 0x0b,
	DR_WRITE_ERROR = 0x0d,
};

/**
 * @brief Reads responses and tokens from the card
 *
 * The card drives DO high (0xFF) whilst it has nothing to say, and low (0x00) whilst busy programming.
 */
class ResponseReader
{
public:
	/**
	 * @param bus
	 * @param time
	 * @param pollBytes Maximum number of bytes to wait for a command response (Ncr)
	 */
	ResponseReader(Bus& bus, TimeSource& time, uint8_t pollBytes) : bus(bus), time(time), pollBytes(pollBytes)
	{
	}

	/**
	 * @brief Wait for an R1 response
	 * @param r1 On success, the response byte
	 * @retval Status timeout if no response within the poll budget
	 */
	Status readR1(uint8_t& r1);

	/**
	 * @brief Wait for an R3 or R7 response
	 * @param r1 On success, the R1 part of the response
	 * @param payload On success, the following 32-bit value
	 */
	Status readR3R7(uint8_t& r1, uint32_t& payload);

	/**
	 * @brief Wait for the start of a data block
	 * @retval Status dataError with error bits if the card sends an error token
	 */
	Status waitDataToken(uint32_t timeoutMs);

	/**
	 * @brief Wait for the data response token following a written block
	 * @param response On success, the low 5 bits of the token
	 */
	Status readDataResponse(uint8_t& response);

	/**
	 * @brief Wait for the card to release DO after programming or erasing
	 */
	Status waitNotBusy(uint32_t timeoutMs);

	/**
	 * @brief Wait for the card to be idle (DO high) before sending a command
	 */
	Status waitReady(uint32_t timeoutMs);

private:
	Bus& bus;
	TimeSource& time;
	uint8_t pollBytes;
};

} // namespace Storage::SdSpi
