#include "include/Storage/SdSpi/CID.h"

namespace Storage::SdSpi
{
size_t CID::printTo(Print& p) const
{
	size_t n{0};

#define FIELD(tag) n += p.print(_F("  " #tag ": "));

	FIELD(Manufacturer)
	n += p.print("0x");
	n += p.println(mid, HEX);

	FIELD(OEM)
	n += p.write(oid, sizeof(oid));
	n += p.println();

	FIELD(Product)
	n += p.write(pnm, sizeof(pnm));
	n += p.print(' ');
	n += p.print(major());
	n += p.print('.');
	n += p.println(minor());

	FIELD(Serial)
	n += p.println(psn, HEX, 8);

	FIELD(Date)
	n += p.print(mdt_year());
	n += p.print('-');
	if(mdt_month() < 10) {
		n += p.print('0');
	}
	n += p.println(mdt_month());

#undef FIELD

	return n;
}

} // namespace Storage::SdSpi
