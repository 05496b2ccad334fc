/*
Project: SdSpiCard - SD card block device for Sming
License: MIT
Descr: SD card access in SPI mode
*/
/*
  Supported cards:

  * SDv1 (SDSC), byte addressed
  * SDv2 standard capacity (SDSC), byte addressed
  * SDv2 high/extended capacity (SDHC/SDXC), block addressed

  Transfers are single-block only. Media changes are not detected: the application
  must call end() and begin() after a card is swapped.

  Responses

	Type	Length (bytes)
	R1		1
	R1b		1 with busy
	R3		5 R1 + 4 bytes OCR
	R7		5 R1 + 4 bytes interface condition

*/

#include "include/Storage/SdSpi/Card.h"
#include "include/Storage/SdSpi/Command.h"
#include "include/Storage/SdSpi/Crc.h"
#include <Storage/Disk.h>
#include <debug_progmem.h>

#define CHECK_INIT()                                                                                                   \
	if(state != InitState::ready) {                                                                                    \
		return Error::notInitialised;                                                                                  \
	}

namespace Storage::SdSpi
{
namespace
{
// Time allowed for the card to finish a previous operation before a new command
constexpr uint32_t readyTimeoutMs{500};
// Host must supply at least 74 clocks with CS high after power-up
constexpr size_t powerUpIdleBytes{10};
constexpr uint32_t cmd0RetryDelayUs{1000};
constexpr uint32_t appInitPollIntervalUs{1000};
} // namespace

void Card::lockBus()
{
	if(lockCount++ == 0) {
		bus.select();
	}
}

void Card::unlockBus()
{
	if(lockCount == 0) {
		debug_w("[SD] unlockBus() without lockBus()");
		return;
	}

	if(--lockCount == 0) {
		bus.deselect();
		// Card releases DO on the clock following CS going high
		bus.idle(1);
	}
}

/*
 * Send a command packet to the card
 *
 * ACMD<n> is sent as CMD55, CMD<n>, with chip select held for both.
 */
Status Card::sendCommand(uint8_t cmd, uint32_t arg, uint8_t& r1, uint32_t* payload)
{
	BusLock lock(*this);

	if(cmd & appCommandFlag) {
		cmd &= 0x7f;
		auto status = sendCommand(CMD55, 0, r1);
		if(!status) {
			return status;
		}
		if(r1 > R1_IDLE_STATE) {
			debug_e("[SD] CMD55 error, r1 = 0x%02x", r1);
			return Status(Error::protocol, r1);
		}
	}

	auto rd = reader();

	// CMD0 resets the card so it may legitimately be in any state
	if(cmd != CMD0) {
		auto status = rd.waitReady(readyTimeoutMs);
		if(!status) {
			return status;
		}
	}

	auto frame = encode(cmd, arg);
	debug_hex(DBG, "SPI > ", frame.bytes, frame.size);
	bus.write(frame.bytes, frame.size);

	auto status = payload ? rd.readR3R7(r1, *payload) : rd.readR1(r1);
	if(status) {
		debug_d("[SD] CMD%u(0x%08x): 0x%02x", cmd, arg, r1);
	} else {
		debug_e("[SD] CMD%u(0x%08x): no response", cmd, arg);
	}
	return status;
}

/*
 * Send a command which must complete without any flags set
 */
Status Card::command(uint8_t cmd, uint32_t arg)
{
	uint8_t r1;
	auto status = sendCommand(cmd, arg, r1);
	if(status && r1 != 0) {
		debug_e("[SD] CMD%u error, r1 = 0x%02x", cmd & 0x3f, r1);
		return Status(Error::protocol, r1);
	}
	return status;
}

/*
 * Receive a data packet from the card
 */
Status Card::receiveData(void* buffer, size_t size, uint32_t timeoutMs)
{
	auto status = reader().waitDataToken(timeoutMs);
	if(!status) {
		return status;
	}

	bus.read(buffer, size);

	// CRC is always clocked out, even if we don't check it
	uint8_t crc[2];
	bus.read(crc, sizeof(crc));

	debug_hex(DBG, "SD RCV", buffer, size);

	if(config.verifyReadCrc) {
		uint16_t crcRx = (crc[0] << 8) | crc[1];
		uint16_t crcCalc = crc16(0, buffer, size);
		if(crcRx != crcCalc) {
			debug_e("[SD] CRC 0x%04x, rx 0x%04x", crcCalc, crcRx);
			return Error::crcMismatch;
		}
	}

	return status;
}

/*
 * Send a data packet to the card and wait for it to be programmed
 */
Status Card::transmitData(const void* buffer)
{
	// One byte gap (Nwr) then the token
	const uint8_t token[]{0xff, TK_START_BLOCK_SINGLE};
	bus.write(token, sizeof(token));

	bus.write(buffer, blockSize);

	auto crc = crc16(0, buffer, blockSize);
	const uint8_t crcBytes[]{uint8_t(crc >> 8), uint8_t(crc)};
	bus.write(crcBytes, sizeof(crcBytes));

	auto rd = reader();
	uint8_t response;
	auto status = rd.readDataResponse(response);
	if(!status) {
		return status;
	}

	if(response != DR_ACCEPTED) {
		debug_e("[SD] data not accepted, d = 0x%02x", response);
		return Status(Error::writeRejected, response);
	}

	return rd.waitNotBusy(config.writeTimeoutMs);
}

Status Card::begin(const Config& cfg)
{
	if(state == InitState::ready) {
		debug_e("[SD] Already initialised");
		return Error::badParam;
	}

	if(isBusLocked()) {
		debug_e("[SD] Bus locked");
		return Error::badParam;
	}

	if(cfg.responseBytes == 0 || cfg.cmd0Attempts == 0) {
		debug_e("[SD] Invalid configuration");
		return Error::badParam;
	}

	config = cfg;

	// Require low speed for initialisation
	bus.setClockSpeed(config.initFrequency);

	auto status = init();
	if(!status) {
		debug_e("[SD] init FAIL at %s", ::toString(InitState(status.code)).c_str());
		return status;
	}

	// Adjust clock speed for normal operation
	uint32_t freq = config.frequency;
	if(freq == 0 || freq > SDSPI_MAX_FREQUENCY) {
		freq = SDSPI_MAX_FREQUENCY;
	}
	bus.setClockSpeed(freq);

	state = InitState::ready;
	debug_i("[SD] OK: %s, %u blocks", ::toString(cardType).c_str(), getBlockCount());

	Disk::scanPartitions(*this);

	return status;
}

void Card::end()
{
	if(lockCount != 0) {
		lockCount = 0;
		bus.deselect();
	}
	state = InitState::powerIdle;
	cardType = CardType::none;
	sectorCount = 0;
}

Status Card::fail()
{
	auto failedState = state;
	state = InitState::failed;
	cardType = CardType::none;
	sectorCount = 0;
	return Status(Error::initFailed, uint8_t(failedState));
}

Status Card::init()
{
	cardType = CardType::none;
	sectorCount = 0;

	state = InitState::powerIdle;

	bus.deselect();
	bus.idle(powerUpIdleBytes);

	BusLock lock(*this);

	if(!goIdle()) {
		return fail();
	}

	if(config.crcEnabled) {
		uint8_t r1;
		auto status = sendCommand(CMD59, 1, r1);
		if(!status || r1 != R1_IDLE_STATE) {
			debug_e("[SD] CRC_ON_OFF failed");
			return fail();
		}
	}

	state = InitState::voltageCheck;
	bool isVersion2;
	if(!checkVoltage(isVersion2)) {
		return fail();
	}

	state = InitState::appInit;
	if(!initialiseCard(isVersion2)) {
		return fail();
	}

	state = InitState::readOcr;
	if(isVersion2) {
		uint32_t ocr;
		if(!readOcr(ocr)) {
			debug_e("[SD] OCR read failed");
			return fail();
		}
		debug_d("[SD] OCR 0x%08x", ocr);
		cardType = (ocr & ocrCcsBit) ? CardType::sdhc : CardType::sd2;
	} else {
		cardType = CardType::sd1;
	}

	if(!isBlockAddressed()) {
		// Set R/W block length to 512
		if(!command(CMD16, blockSize)) {
			debug_e("[SD] SET_BLOCKLEN failed");
			return fail();
		}
	}

	state = InitState::readRegisters;
	if(!readRegisters()) {
		return fail();
	}

	return Status();
}

Status Card::goIdle()
{
	for(unsigned attempt = 0; attempt < config.cmd0Attempts; ++attempt) {
		uint8_t r1;
		auto status = sendCommand(CMD0, 0, r1);
		if(status && r1 == R1_IDLE_STATE) {
			return status;
		}
		time.delayMicroseconds(cmd0RetryDelayUs);
	}

	debug_e("[SD] ERROR CMD0");
	return Error::timeout;
}

Status Card::checkVoltage(bool& isVersion2)
{
	uint8_t r1;
	uint32_t ifcond;
	auto status = sendCommand(CMD8, ifCondArg, r1, &ifcond);
	if(!status) {
		return status;
	}

	if(r1 & R1_ILLEGAL_COMMAND) {
		debug_i("[SD] SDv1");
		isVersion2 = false;
		return status;
	}

	if(r1 != R1_IDLE_STATE) {
		debug_e("[SD] SEND_IF_COND error, r1 = 0x%02x", r1);
		return Status(Error::protocol, r1);
	}

	debug_d("[SD] IF COND 0x%08x", ifcond);

	// Check card can work at vdd range of 2.7-3.6V and has echoed the pattern
	if((ifcond & ifCondMask) != ifCondArg) {
		debug_e("[SD] VDD invalid");
		return Error::protocol;
	}

	isVersion2 = true;
	return status;
}

/*
 * Wait for card to leave idle state
 */
Status Card::initialiseCard(bool isVersion2)
{
	const uint32_t arg = isVersion2 ? acmd41HcsBit : 0;
	Deadline deadline(time, config.initTimeoutMs);
	for(;;) {
		uint8_t r1;
		auto status = sendCommand(ACMD41, arg, r1);
		if(!status) {
			return status;
		}
		if(r1 == 0) {
			debug_d("[SD] ACMD41 OK after %u ms", deadline.elapsed());
			return status;
		}
		if(r1 != R1_IDLE_STATE) {
			debug_e("[SD] ACMD41 error, r1 = 0x%02x", r1);
			return Status(Error::protocol, r1);
		}
		if(deadline.expired()) {
			debug_e("[SD] ACMD41 timeout");
			return Error::timeout;
		}
		time.delayMicroseconds(appInitPollIntervalUs);
	}
}

Status Card::readOcr(uint32_t& ocr)
{
	uint8_t r1;
	auto status = sendCommand(CMD58, 0, r1, &ocr);
	if(status && r1 != 0) {
		return Status(Error::protocol, r1);
	}
	return status;
}

Status Card::readRegister(uint8_t cmd, void* buffer, size_t size)
{
	BusLock lock(*this);

	auto status = command(cmd, 0);
	if(!status) {
		return status;
	}

	return receiveData(buffer, size, config.readTimeoutMs);
}

Status Card::readRegisters()
{
	uint8_t buf[16];

	auto status = readRegister(CMD9, buf, sizeof(buf));
	if(!status) {
		debug_e("[SD] Read CSD failed");
		return status;
	}
	mCSD.load(buf);

	uint64_t size = mCSD.getSize();
#ifndef ENABLE_STORAGE_SIZE64
	if(isSize64(size)) {
		debug_e("[SD] Device size %llu requires ENABLE_STORAGE_SIZE64=1", size);
		return Error::badParam;
	}
#endif
	sectorCount = size >> sectorSizeShift;
	if(sectorCount == 0) {
		debug_e("[SD] Size invalid %llu", size);
		return Error::protocol;
	}
#ifdef ENABLE_STORAGE_SIZE64
	// Block numbers are 32 bits
	if(sectorCount > UINT32_MAX) {
		debug_e("[SD] %llu blocks exceeds 32-bit block numbers", uint64_t(sectorCount));
		return Error::badParam;
	}
#endif

	status = readRegister(CMD10, buf, sizeof(buf));
	if(!status) {
		debug_e("[SD] Read CID failed");
		return status;
	}
	if(crc7(buf, 15) != (buf[15] >> 1)) {
		debug_w("[SD] CID CRC mismatch");
	}
	mCID.load(buf);

	return status;
}

Status Card::checkBlock(uint32_t block, uint32_t count)
{
	auto blockCount = getBlockCount();
	if(block >= blockCount || count > blockCount - block) {
		debug_e("[SD] Block %u+%u out of range", block, count);
		return Error::badParam;
	}
	return Status();
}

Status Card::readBlock(uint32_t block, void* dst)
{
	CHECK_INIT()

	auto status = checkBlock(block, 1);
	if(!status) {
		return status;
	}

	BusLock lock(*this);

	status = command(CMD17, blockAddress(block));
	if(status) {
		status = receiveData(dst, blockSize, config.readTimeoutMs);
	}
	if(!status) {
		debug_e("[SD] Read block %u failed: %s", block, ::toString(status).c_str());
	}
	return status;
}

Status Card::writeBlock(uint32_t block, const void* src)
{
	CHECK_INIT()

	auto status = checkBlock(block, 1);
	if(!status) {
		return status;
	}

	BusLock lock(*this);

	status = command(CMD24, blockAddress(block));
	if(status) {
		status = transmitData(src);
	}
	if(!status) {
		debug_e("[SD] Write block %u failed: %s", block, ::toString(status).c_str());
	}
	return status;
}

Status Card::eraseRange(uint32_t block, uint32_t count)
{
	CHECK_INIT()

	if(count == 0) {
		return Status();
	}

	auto status = checkBlock(block, count);
	if(!status) {
		return status;
	}

	BusLock lock(*this);

	// ERASE_WR_BLK_START, ERASE_WR_BLK_END, ERASE
	status = command(CMD32, blockAddress(block));
	if(status) {
		status = command(CMD33, blockAddress(block + count - 1));
	}
	if(status) {
		status = command(CMD38, 0);
	}
	if(status) {
		status = reader().waitNotBusy(config.eraseTimeoutMs);
	}
	if(!status) {
		debug_e("[SD] Erase %u+%u failed: %s", block, count, ::toString(status).c_str());
	}
	return status;
}

bool Card::raw_sector_read(storage_size_t address, void* dst, size_t size)
{
	if(address + size > sectorCount) {
		lastStatus = state == InitState::ready ? Error::badParam : Error::notInitialised;
		return false;
	}

	auto ptr = static_cast<uint8_t*>(dst);
	for(; size != 0; --size, ++address, ptr += blockSize) {
		lastStatus = readBlock(address, ptr);
		if(!lastStatus) {
			return false;
		}
	}

	return true;
}

bool Card::raw_sector_write(storage_size_t address, const void* src, size_t size)
{
	if(address + size > sectorCount) {
		lastStatus = state == InitState::ready ? Error::badParam : Error::notInitialised;
		return false;
	}

	auto ptr = static_cast<const uint8_t*>(src);
	for(; size != 0; --size, ++address, ptr += blockSize) {
		lastStatus = writeBlock(address, ptr);
		if(!lastStatus) {
			return false;
		}
	}

	return true;
}

bool Card::raw_sector_erase_range(storage_size_t address, size_t size)
{
	if(address + size > sectorCount) {
		lastStatus = state == InitState::ready ? Error::badParam : Error::notInitialised;
		return false;
	}

	lastStatus = eraseRange(address, size);
	return bool(lastStatus);
}

bool Card::raw_sync()
{
	// Writes complete before returning
	return true;
}

} // namespace Storage::SdSpi

String toString(Storage::SdSpi::CardType type)
{
	using CardType = Storage::SdSpi::CardType;

	switch(type) {
#define XX(tag, text)                                                                                                  \
	case CardType::tag:                                                                                                \
		return F(text);
		SDSPI_CARD_TYPE_MAP(XX)
#undef XX
	default:
		return F("INVALID");
	}
}

String toString(Storage::SdSpi::InitState state)
{
	using InitState = Storage::SdSpi::InitState;

	switch(state) {
#define XX(tag, text)                                                                                                  \
	case InitState::tag:                                                                                               \
		return F(text);
		SDSPI_INIT_STATE_MAP(XX)
#undef XX
	default:
		return F("INVALID");
	}
}
