#pragma once

#include <Print.h>
#include <cstring>

namespace Storage::SdSpi
{
/*
	Card Identification register, e.g.

	Samsung 32GB EVO Plus: 1b 53 4d 45 42 31 51 54 30 f1 77 5f ea 01 1a b9

	1b                  MID
	53 4d               OID: "SM"
	45 42 31 51 54      PNM: "EB1QT"
	30                  PRV
	f1 77 5f ea         PSN
	01 1a               MDT    reserved:4 year:8 month:4
	b9                  CRC7: 0x5C
*/
struct __attribute__((packed)) CID {
	uint8_t mid;		  ///< Manufacturer ID
	char oid[2];		  ///< OEM / Application ID
	char pnm[5];		  ///< Product name
	uint8_t prv;		  ///< Product revision
	uint32_t psn;		  ///< Product serial number
	uint16_t mdt;		  ///< Manufacturing date
	uint8_t not_used : 1; ///< Always 1
	uint8_t crc : 7;	  ///< 7-bit checksum

	/**
	 * @brief Load register content as received from the card
	 */
	void load(const void* data)
	{
		memcpy(this, data, sizeof(CID));
		bswap();
	}

	void bswap()
	{
		psn = __builtin_bswap32(psn);
		mdt = __builtin_bswap16(mdt);
	}

	uint16_t mdt_year() const
	{
		return 2000 + ((mdt >> 4) & 0xff);
	}

	uint8_t mdt_month() const
	{
		return mdt & 0x0f;
	}

	uint8_t major() const
	{
		return prv >> 4;
	}

	uint8_t minor() const
	{
		return prv & 0x0f;
	}

	size_t printTo(Print& p) const;
};
static_assert(sizeof(CID) == 16, "Bad CID struct");

} // namespace Storage::SdSpi
