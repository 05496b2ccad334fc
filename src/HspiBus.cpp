#include "include/Storage/SdSpi/HspiBus.h"
#include <Digital.h>
#include <debug_progmem.h>

namespace Storage::SdSpi
{
bool HspiBus::begin(HSPI::PinSet pinSet, uint8_t chipSelect, uint32_t freq)
{
	if(!device.begin(pinSet, chipSelect, freq)) {
		debug_e("[SD] SPI init failed");
		return false;
	}

	device.setBitOrder(MSBFIRST);
	device.setClockMode(HSPI::ClockMode::mode0);
	device.setIoMode(HSPI::IoMode::SPI);

	csPin = chipSelect;
	pinMode(csPin, OUTPUT);
	digitalWrite(csPin, HIGH);

	return true;
}

void HspiBus::end()
{
	if(csPin != 0xff) {
		digitalWrite(csPin, HIGH);
		csPin = 0xff;
	}
	device.end();
}

void HspiBus::select()
{
	if(csPin != 0xff) {
		digitalWrite(csPin, LOW);
	}
}

void HspiBus::deselect()
{
	if(csPin != 0xff) {
		digitalWrite(csPin, HIGH);
	}
}

void HspiBus::exchange(void* data, size_t length)
{
	HSPI::Request req;
	req.out.set(data, length);
	req.in.set(data, length);
	// CS is ours, not the controller's
	req.chipsel = 0;
	device.execute(req);
}

void HspiBus::write(const void* data, size_t length)
{
	HSPI::Request req;
	req.out.set(data, length);
	req.chipsel = 0;
	device.execute(req);
}

} // namespace Storage::SdSpi
