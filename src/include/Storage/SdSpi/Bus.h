#pragma once

#include <cstdint>
#include <cstddef>

namespace Storage::SdSpi
{
/**
 * @brief Interface to the SPI bus the card is attached to
 *
 * All transfers are full duplex, MSB first, SPI mode 0.
 * When there is nothing to send the card expects 0xFF.
 */
class Bus
{
public:
	virtual ~Bus()
	{
	}

	/**
	 * @brief Assert chip select (drive CS low)
	 */
	virtual void select() = 0;

	/**
	 * @brief De-assert chip select (drive CS high)
	 */
	virtual void deselect() = 0;

	/**
	 * @brief Exchange data with the card
	 * @param data Bytes to send, overwritten with the bytes received
	 * @param length Number of bytes
	 */
	virtual void exchange(void* data, size_t length) = 0;

	/**
	 * @brief Send data, discarding anything received
	 */
	virtual void write(const void* data, size_t length);

	virtual void setClockSpeed(uint32_t frequency) = 0;

	/**
	 * @brief Exchange a single byte
	 */
	uint8_t transfer(uint8_t value = 0xff)
	{
		exchange(&value, 1);
		return value;
	}

	/**
	 * @brief Read bytes, sending 0xFF
	 */
	void read(void* buffer, size_t length);

	/**
	 * @brief Clock out `count` bytes of 0xFF
	 */
	void idle(size_t count);
};

} // namespace Storage::SdSpi
