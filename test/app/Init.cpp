#include <Storage/SdSpi/Card.h>
#include <Storage/SdSpi/Command.h>
#include <SmingTest.h>
#include "SimCard.h"

using namespace Storage::SdSpi;

class InitTest : public TestGroup
{
public:
	InitTest() : TestGroup(_F("Initialisation"))
	{
	}

	void execute() override
	{
		TEST_CASE("SDv1 card")
		{
			SimCard sim(SimCard::Kind::sd1, 262144);
			SimTimeSource clock;
			Card card("sim", sim, clock);
			REQUIRE_EQ(card.begin().error, Error::success);
			REQUIRE(card);
			REQUIRE_EQ(card.getInitState(), InitState::ready);
			REQUIRE_EQ(card.getCardType(), CardType::sd1);
			REQUIRE(!card.isBlockAddressed());
			REQUIRE_EQ(card.getBlockCount(), 262144U);
			// Version 1 cards are not asked about high capacity support
			REQUIRE_EQ(sim.lastArg(41), 0U);
			REQUIRE_EQ(sim.count(58), 0U);
			REQUIRE_EQ(sim.count(16), 1U);
			REQUIRE_EQ(sim.lastArg(16), 512U);
			REQUIRE(!sim.selected);
		}

		TEST_CASE("SDv2 standard capacity card")
		{
			SimCard sim(SimCard::Kind::sd2, 1048576);
			SimTimeSource clock;
			Card card("sim", sim, clock);
			REQUIRE_EQ(card.begin().error, Error::success);
			REQUIRE_EQ(card.getCardType(), CardType::sd2);
			REQUIRE(!card.isBlockAddressed());
			REQUIRE_EQ(card.getBlockCount(), 1048576U);
			REQUIRE_EQ(sim.lastArg(8), ifCondArg);
			REQUIRE_EQ(sim.lastArg(41), acmd41HcsBit);
			REQUIRE_EQ(sim.count(58), 1U);
			REQUIRE_EQ(sim.lastArg(16), 512U);
		}

		TEST_CASE("SDHC card")
		{
			// 2GiB
			SimCard sim(SimCard::Kind::sdhc, 4194304);
			SimTimeSource clock;
			Card card("sim", sim, clock);
			REQUIRE_EQ(card.begin().error, Error::success);
			REQUIRE_EQ(card.getCardType(), CardType::sdhc);
			REQUIRE(card.isBlockAddressed());
			REQUIRE_EQ(card.getBlockCount(), 4194304U);
			REQUIRE_EQ(card.csd.structure(), CSD::Structure::v2);
			REQUIRE_EQ(card.cid.mid, 0x1b);
			// Block length is fixed for high capacity cards
			REQUIRE_EQ(sim.count(16), 0U);
			Serial << toString(card.getCardType()) << ", " << card.getBlockCount() << " blocks" << endl;
		}

		TEST_CASE("Command sequence")
		{
			SimCard sim(SimCard::Kind::sdhc, 65536);
			SimTimeSource clock;
			Card card("sim", sim, clock);
			REQUIRE(card.begin());

			// CMD0, CMD8, (CMD55, ACMD41) x 3, CMD58, CMD9, CMD10
			const uint8_t expected[]{0, 8, 55, 41, 55, 41, 55, 41, 58, 9, 10};
			REQUIRE(sim.commands.size() >= ARRAY_SIZE(expected));
			for(unsigned i = 0; i < ARRAY_SIZE(expected); ++i) {
				REQUIRE_EQ(sim.commands[i].index, expected[i]);
			}
			REQUIRE(sim.commands[3].app);
			REQUIRE(!sim.commands[2].app);
		}

		TEST_CASE("Clock speeds")
		{
			SimCard sim(SimCard::Kind::sd2, 65536);
			SimTimeSource clock;
			Card card("sim", sim, clock);
			REQUIRE(card.begin());
			REQUIRE(sim.initClockSpeed != 0);
			REQUIRE(sim.initClockSpeed <= 400000U);
			REQUIRE_EQ(sim.clockSpeed, uint32_t(SDSPI_MAX_FREQUENCY));
			card.end();

			Config config;
			config.frequency = 8000000;
			REQUIRE(card.begin(config));
			REQUIRE_EQ(sim.clockSpeed, 8000000U);
		}

		TEST_CASE("Slow card leaves idle state")
		{
			SimCard sim(SimCard::Kind::sdhc, 65536);
			sim.acmd41Polls = 100;
			SimTimeSource clock;
			Card card("sim", sim, clock);
			REQUIRE(card.begin());
			REQUIRE_EQ(sim.count(41), 101U);
			REQUIRE(clock.millis() >= 100);
		}

		TEST_CASE("Card never leaves idle state")
		{
			SimCard sim(SimCard::Kind::sdhc, 65536);
			sim.acmd41Polls = -1;
			SimTimeSource clock;
			Card card("sim", sim, clock);
			auto status = card.begin();
			Serial << status << endl;
			REQUIRE_EQ(status.error, Error::initFailed);
			REQUIRE_EQ(status.code, uint8_t(InitState::appInit));
			REQUIRE_EQ(card.getInitState(), InitState::failed);
			REQUIRE(!card);
			REQUIRE(clock.millis() >= SDSPI_INIT_TIMEOUT_MS);
			// No further commands once the timeout expires
			REQUIRE_EQ(sim.count(58), 0U);
			REQUIRE_EQ(sim.count(9), 0U);
		}

		TEST_CASE("GO_IDLE_STATE retries")
		{
			SimCard sim(SimCard::Kind::sd2, 65536);
			sim.cmd0Ignore = 2;
			SimTimeSource clock;
			Card card("sim", sim, clock);
			REQUIRE(card.begin());
			REQUIRE_EQ(sim.count(0), 3U);
		}

		TEST_CASE("No card")
		{
			SimCard sim(SimCard::Kind::sd2, 65536);
			sim.cmd0Ignore = 10;
			SimTimeSource clock;
			Card card("sim", sim, clock);
			auto status = card.begin();
			REQUIRE_EQ(status.error, Error::initFailed);
			REQUIRE_EQ(status.code, uint8_t(InitState::powerIdle));
			REQUIRE_EQ(sim.count(0), 5U);
			REQUIRE_EQ(sim.count(8), 0U);
			REQUIRE(!sim.selected);
		}

		TEST_CASE("Bad SEND_IF_COND echo")
		{
			SimCard sim(SimCard::Kind::sd2, 65536);
			sim.badEcho = true;
			SimTimeSource clock;
			Card card("sim", sim, clock);
			auto status = card.begin();
			REQUIRE_EQ(status.error, Error::initFailed);
			REQUIRE_EQ(status.code, uint8_t(InitState::voltageCheck));
			REQUIRE_EQ(sim.count(41), 0U);
		}

		TEST_CASE("Register read failure")
		{
			SimCard sim(SimCard::Kind::sd2, 65536);
			sim.readNoToken = true;
			SimTimeSource clock;
			Card card("sim", sim, clock);
			auto status = card.begin();
			REQUIRE_EQ(status.error, Error::initFailed);
			REQUIRE_EQ(status.code, uint8_t(InitState::readRegisters));
			REQUIRE_EQ(card.getBlockCount(), 0U);
		}

		TEST_CASE("Capacity beyond 32-bit block numbers")
		{
			SimCard sim(SimCard::Kind::sdhc, 65536);
			// SDUC, (C_SIZE + 1) * 1024 blocks
			SimCard::setBits(sim.csd, 126, 2, 2);
			SimCard::setBits(sim.csd, 48, 28, 4194304);
			SimCard::updateRegisterCrc(sim.csd);
			SimTimeSource clock;
			Card card("sim", sim, clock);
			auto status = card.begin();
			REQUIRE_EQ(status.error, Error::initFailed);
			REQUIRE_EQ(status.code, uint8_t(InitState::readRegisters));
			REQUIRE_EQ(card.getBlockCount(), 0U);
			REQUIRE_EQ(card.getSectorCount(), 0U);
		}

		TEST_CASE("CRC checking enabled")
		{
			SimCard sim(SimCard::Kind::sdhc, 65536);
			SimTimeSource clock;
			Card card("sim", sim, clock);
			Config config;
			config.crcEnabled = true;
			config.verifyReadCrc = true;
			REQUIRE(card.begin(config));
			REQUIRE(sim.crcEnabled);
			REQUIRE_EQ(sim.count(59), 1U);
			REQUIRE_EQ(sim.lastArg(59), 1U);
			REQUIRE_EQ(sim.commands[1].index, 59);
		}

		TEST_CASE("Invalid configuration")
		{
			SimCard sim(SimCard::Kind::sd2, 65536);
			SimTimeSource clock;
			Card card("sim", sim, clock);
			Config config;
			config.responseBytes = 0;
			REQUIRE_EQ(card.begin(config).error, Error::badParam);
			REQUIRE(sim.commands.empty());
		}

		TEST_CASE("Re-initialisation")
		{
			SimCard sim(SimCard::Kind::sd2, 65536);
			SimTimeSource clock;
			Card card("sim", sim, clock);
			REQUIRE(card.begin());
			REQUIRE_EQ(card.begin().error, Error::badParam);
			REQUIRE(card);

			card.end();
			REQUIRE(!card);
			REQUIRE_EQ(card.getCardType(), CardType::none);
			REQUIRE_EQ(card.getBlockCount(), 0U);

			REQUIRE(card.begin());
			REQUIRE_EQ(card.getBlockCount(), 65536U);
			REQUIRE_EQ(sim.count(0), 2U);
		}

		TEST_CASE("Retry after failure")
		{
			SimCard sim(SimCard::Kind::sdhc, 65536);
			sim.acmd41Polls = -1;
			SimTimeSource clock;
			Card card("sim", sim, clock);
			REQUIRE(!card.begin());
			REQUIRE_EQ(card.getInitState(), InitState::failed);

			sim.acmd41Polls = 2;
			REQUIRE(card.begin());
			REQUIRE_EQ(card.getCardType(), CardType::sdhc);
		}
	}
};

void REGISTER_TEST(init)
{
	registerGroup<InitTest>();
}
