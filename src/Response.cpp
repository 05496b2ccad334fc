#include "include/Storage/SdSpi/Response.h"
#include <debug_progmem.h>

namespace Storage::SdSpi
{
namespace
{
// Delay between polls once the card has indicated it is not ready
constexpr uint32_t pollIntervalUs{10};
constexpr uint32_t busyPollIntervalUs{100};
} // namespace

Status ResponseReader::readR1(uint8_t& r1)
{
	// Response arrives after 0-8 bytes of 0xFF (Ncr), bit 7 is always clear
	for(unsigned i = 0; i < pollBytes; ++i) {
		auto d = bus.transfer();
		if((d & 0x80) == 0) {
			r1 = d;
			return Status();
		}
	}

	debug_w("[SD] No R1 response");
	return Error::timeout;
}

Status ResponseReader::readR3R7(uint8_t& r1, uint32_t& payload)
{
	auto status = readR1(r1);
	if(!status) {
		return status;
	}

	uint8_t buf[4];
	bus.read(buf, sizeof(buf));
	payload = (uint32_t(buf[0]) << 24) | (uint32_t(buf[1]) << 16) | (uint32_t(buf[2]) << 8) | buf[3];
	return status;
}

Status ResponseReader::waitDataToken(uint32_t timeoutMs)
{
	Deadline deadline(time, timeoutMs);
	for(;;) {
		auto token = bus.transfer();
		if(token == TK_START_BLOCK_SINGLE) {
			return Status();
		}
		if((token & 0xf0) == 0) {
			debug_e("[SD] Data error token 0x%02x", token);
			return Status(Error::dataError, token & 0x0f);
		}
		if(token != 0xff) {
			debug_e("[SD] Unexpected data token 0x%02x", token);
			return Status(Error::protocol, token);
		}
		if(deadline.expired()) {
			debug_e("[SD] Data token timeout after %u ms", deadline.elapsed());
			return Error::timeout;
		}
		time.delayMicroseconds(pollIntervalUs);
	}
}

Status ResponseReader::readDataResponse(uint8_t& response)
{
	for(unsigned i = 0; i < pollBytes; ++i) {
		auto d = bus.transfer();
		if(d != 0xff) {
			response = d & DR_MASK;
			return Status();
		}
	}

	debug_e("[SD] No data response");
	return Error::timeout;
}

Status ResponseReader::waitNotBusy(uint32_t timeoutMs)
{
	Deadline deadline(time, timeoutMs);
	while(bus.transfer() == 0x00) {
		if(deadline.expired()) {
			debug_e("[SD] Card busy for %u ms", deadline.elapsed());
			return Error::timeout;
		}
		time.delayMicroseconds(busyPollIntervalUs);
	}
	return Status();
}

Status ResponseReader::waitReady(uint32_t timeoutMs)
{
	Deadline deadline(time, timeoutMs);
	while(bus.transfer() != 0xff) {
		if(deadline.expired()) {
			debug_e("[SD] Card not ready after %u ms", deadline.elapsed());
			return Error::timeout;
		}
		time.delayMicroseconds(busyPollIntervalUs);
	}
	return Status();
}

} // namespace Storage::SdSpi
