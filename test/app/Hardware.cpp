#include <Storage/SdSpi/Card.h>
#include <Storage/SdSpi/HspiBus.h>
#include <Storage/Disk/SectorBuffer.h>
#include <Storage/Disk/PartInfo.h>
#include <SmingTest.h>
#include <Digital.h>

// Chip selects independent of SPI controller in use
#ifdef ARCH_ESP32
#define PIN_CARD_CS 21
#else
// Esp8266 cannot use GPIO15 as this affects boot mode
#define PIN_CARD_CS 5
#endif

using namespace Storage::SdSpi;

/*
 * Requires a real card attached to the SPI bus.
 * Data on the card is overwritten.
 */
class HardwareTest : public TestGroup
{
public:
	HardwareTest() : TestGroup(_F("Hardware")), bus(SPI), card("card1", bus)
	{
		REQUIRE(Storage::registerDevice(&card));
	}

	void execute() override
	{
		REQUIRE(bus.begin(HSPI::PinSet::normal, PIN_CARD_CS));
		auto status = card.begin();
		Serial << _F("begin: ") << status << endl;
		REQUIRE(status);

		Serial << toString(card.getCardType()) << endl;
		Serial << "CSD" << endl << card.csd << endl;
		Serial << "CID" << endl << card.cid;
		for(auto part : card.partitions()) {
			Serial << part << endl;
		}

		const auto blockCount = card.getBlockCount();

		TEST_CASE("Chip select held across operations")
		{
			uint8_t data1[Card::blockSize];
			uint8_t data2[Card::blockSize];
			REQUIRE(card.readBlock(0, data1));
			{
				Card::BusLock lock(card);
				REQUIRE(digitalRead(PIN_CARD_CS) == LOW);
				REQUIRE(card.readBlock(0, data2));
				REQUIRE(digitalRead(PIN_CARD_CS) == LOW);
				REQUIRE(memcmp(data1, data2, Card::blockSize) == 0);
				REQUIRE(card.readBlock(1, data2));
			}
			REQUIRE(digitalRead(PIN_CARD_CS) == HIGH);
		}

		// Try a few random blocks
		static constexpr size_t BLOCK_COUNT{4};
		const size_t bufSize = BLOCK_COUNT * Card::blockSize;
		Storage::Disk::SectorBuffer buffer1(Card::blockSize, BLOCK_COUNT);
		Storage::Disk::SectorBuffer buffer2(Card::blockSize, BLOCK_COUNT);
		REQUIRE(buffer1 && buffer2);
		for(unsigned n = 0; n < 10; ++n) {
			auto block = os_random() % (blockCount - BLOCK_COUNT);
			storage_size_t offset = storage_size_t(block) * Card::blockSize;

			Serial << endl << "** Test blocks " << block << " - " << block + BLOCK_COUNT - 1 << endl;

			TEST_CASE("Write/Read blocks")
			{
				os_get_random(buffer1.get(), buffer1.size());
				REQUIRE(card.write(offset, buffer1.get(), bufSize));

				buffer2.clear();
				REQUIRE(card.read(offset, buffer2.get(), bufSize));
				REQUIRE(buffer1 == buffer2);

				// Single block access
				uint8_t data[Card::blockSize];
				REQUIRE(card.readBlock(block + 1, data));
				REQUIRE(memcmp(data, buffer1.get() + Card::blockSize, Card::blockSize) == 0);

				REQUIRE(card.erase_range(offset, bufSize));

				// Erased blocks read as all 0x00 or all 0xFF depending on the card
				buffer2.fill(0xaa);
				REQUIRE(card.read(offset, buffer2.get(), bufSize));
				auto erased = buffer2.get()[0];
				CHECK(erased == 0x00 || erased == 0xff);
				buffer1.fill(erased);
				REQUIRE(buffer1 == buffer2);
			}
		}

		card.end();
		bus.end();
	}

private:
	HspiBus bus;
	Card card;
};

void REGISTER_TEST(hardware)
{
	registerGroup<HardwareTest>();
}
