/*
Project: SdSpiCard - SD card block device for Sming
License: MIT
Descr: SD card access in SPI mode
*/
#pragma once

#include <Storage/Disk/BlockDevice.h>
#include "Bus.h"
#include "Config.h"
#include "Error.h"
#include "Response.h"
#include "TimeSource.h"
#include "CSD.h"
#include "CID.h"

#define SDSPI_CARD_TYPE_MAP(XX)                                                                                        \
	XX(none, "None")                                                                                                   \
	XX(sd1, "SDv1")                                                                                                    \
	XX(sd2, "SDv2 standard capacity")                                                                                  \
	XX(sdhc, "SDv2 high capacity")

#define SDSPI_INIT_STATE_MAP(XX)                                                                                       \
	XX(powerIdle, "PowerIdle")                                                                                         \
	XX(voltageCheck, "VoltageCheck")                                                                                   \
	XX(appInit, "AppInit")                                                                                             \
	XX(readOcr, "ReadOCR")                                                                                             \
	XX(readRegisters, "ReadRegisters")                                                                                 \
	XX(ready, "Ready")                                                                                                 \
	XX(failed, "Failed")

namespace Storage::SdSpi
{
/**
 * @brief Card variant, fixed during initialisation
 *
 * Only SDHC/SDXC (sdhc) cards use block addressing; others take a byte offset.
 */
enum class CardType : uint8_t {
#define XX(tag, ...) tag,
	SDSPI_CARD_TYPE_MAP(XX)
#undef XX
};

enum class InitState : uint8_t {
#define XX(tag, ...) tag,
	SDSPI_INIT_STATE_MAP(XX)
#undef XX
};

class Card : public Disk::BlockDevice
{
public:
	static constexpr uint16_t blockSize{512};

	/**
	 * @brief Scoped ownership of the bus
	 *
	 * Chip select stays asserted whilst any lock is held, so a sequence of operations
	 * cannot be interleaved with transactions for other devices on the same bus.
	 */
	class BusLock
	{
	public:
		BusLock(Card& card) : card(card)
		{
			card.lockBus();
		}

		~BusLock()
		{
			card.unlockBus();
		}

		BusLock(const BusLock&) = delete;
		BusLock& operator=(const BusLock&) = delete;

	private:
		Card& card;
	};

	/**
	 * @param name Device name for storage registration
	 * @param bus Transport the card is attached to
	 * @param time Used for all timeouts
	 */
	Card(const String& name, Bus& bus, TimeSource& time = systemTimeSource)
		: BlockDevice(), name(name), bus(bus), time(time)
	{
	}

	~Card()
	{
		end();
	}

	explicit operator bool() const
	{
		return state == InitState::ready;
	}

	/**
	 * @brief Initialise the card
	 * @param config Operating parameters
	 * @retval Status initFailed with the failing InitState as code
	 */
	Status begin(const Config& config = {});

	void end();

	/**
	 * @brief Read a single 512-byte block
	 * @param block Logical block number
	 * @param dst Buffer of at least blockSize bytes
	 */
	Status readBlock(uint32_t block, void* dst);

	/**
	 * @brief Write a single 512-byte block
	 *
	 * A timeout after the block has been accepted means the card did not finish programming
	 * in time: the block may or may not have been committed.
	 */
	Status writeBlock(uint32_t block, const void* src);

	/**
	 * @brief Erase a range of blocks
	 */
	Status eraseRange(uint32_t block, uint32_t count);

	/**
	 * @brief Acquire the bus, asserting chip select
	 *
	 * Calls may be nested; the bus is released when the outermost lock is released.
	 */
	void lockBus();

	void unlockBus();

	bool isBusLocked() const
	{
		return lockCount != 0;
	}

	uint32_t getBlockCount() const
	{
		return uint32_t(sectorCount);
	}

	CardType getCardType() const
	{
		return cardType;
	}

	bool isBlockAddressed() const
	{
		return cardType == CardType::sdhc;
	}

	InitState getInitState() const
	{
		return state;
	}

	/**
	 * @brief Outcome of the most recent BlockDevice operation
	 */
	Status getLastStatus() const
	{
		return lastStatus;
	}

	/* Storage Device methods */

	String getName() const override
	{
		return name.c_str();
	}

	uint32_t getId() const
	{
		return 0;
	}

	Type getType() const
	{
		return Type::sdcard;
	}

	size_t getBlockSize() const override
	{
		return blockSize;
	}

	const CID& cid{mCID};
	const CSD& csd{mCSD};

protected:
	bool raw_sector_read(storage_size_t address, void* dst, size_t size) override;
	bool raw_sector_write(storage_size_t address, const void* src, size_t size) override;
	bool raw_sector_erase_range(storage_size_t address, size_t size) override;
	bool raw_sync() override;

private:
	Status init();
	Status goIdle();
	Status checkVoltage(bool& isVersion2);
	Status initialiseCard(bool isVersion2);
	Status readOcr(uint32_t& ocr);
	Status readRegisters();
	Status readRegister(uint8_t cmd, void* buffer, size_t size);
	Status receiveData(void* buffer, size_t size, uint32_t timeoutMs);
	Status transmitData(const void* buffer);
	Status sendCommand(uint8_t cmd, uint32_t arg, uint8_t& r1, uint32_t* payload = nullptr);
	Status command(uint8_t cmd, uint32_t arg);
	Status checkBlock(uint32_t block, uint32_t count);

	uint32_t blockAddress(uint32_t block) const
	{
		return isBlockAddressed() ? block : block << sectorSizeShift;
	}

	Status fail();

	ResponseReader reader()
	{
		return ResponseReader(bus, time, config.responseBytes);
	}

	CString name;
	Bus& bus;
	TimeSource& time;
	Config config;
	CSD mCSD{};
	CID mCID{};
	Status lastStatus;
	InitState state{InitState::powerIdle};
	CardType cardType{CardType::none};
	uint8_t lockCount{0};
};

} // namespace Storage::SdSpi

String toString(Storage::SdSpi::CardType type);
String toString(Storage::SdSpi::InitState state);
