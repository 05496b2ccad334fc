#pragma once

#include "Bus.h"
#include <HSPI/Device.h>

namespace Storage::SdSpi
{
class SpiDevice : public HSPI::Device
{
public:
	using HSPI::Device::Device;

	HSPI::IoModes getSupportedIoModes() const override
	{
		return HSPI::IoMode::SPI;
	}
};

/**
 * @brief Bus implementation using the Sming HardwareSPI library
 *
 * Chip select is a GPIO driven directly by `select()` and `deselect()`, so it stays
 * asserted across any number of requests. The controller never touches it.
 */
class HspiBus : public Bus
{
public:
	HspiBus(HSPI::Controller& controller) : device(controller)
	{
	}

	~HspiBus()
	{
		end();
	}

	/**
	 * @brief Attach to the SPI controller
	 * @param pinSet
	 * @param chipSelect GPIO connected to the card CS line
	 * @param freq Initial clock frequency, the card requires <= 400kHz until initialised
	 */
	bool begin(HSPI::PinSet pinSet, uint8_t chipSelect, uint32_t freq = 400000);

	void end();

	void select() override;
	void deselect() override;

	void exchange(void* data, size_t length) override;
	void write(const void* data, size_t length) override;

	void setClockSpeed(uint32_t frequency) override
	{
		device.setClockSpeed(frequency);
	}

private:
	SpiDevice device;
	uint8_t csPin{0xff};
};

} // namespace Storage::SdSpi
