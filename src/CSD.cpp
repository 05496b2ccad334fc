#include "include/Storage/SdSpi/CSD.h"

String toString(Storage::SdSpi::CSD::Structure structure)
{
	using Structure = Storage::SdSpi::CSD::Structure;

	switch(structure) {
	case Structure::v1:
		return F("v1 (SDSC)");
	case Structure::v2:
		return F("v2 (SDHC/SDXC)");
	case Structure::v3:
		return F("v3 (SDUC)");
	default:
		return F("INVALID");
	}
}

namespace Storage::SdSpi
{
uint64_t CSD::getSize() const
{
	switch(structure()) {
	case Structure::v1:
		return v1().size();
	case Structure::v2:
		return v2().size();
	case Structure::v3:
		return v3().size();
	default:
		return 0;
	}
}

size_t CSD::printTo(Print& p) const
{
	size_t n{0};

#define XX(tag, ...)                                                                                                   \
	n += p.print(_F("  " #tag ": "));                                                                                  \
	n += p.println(csd.tag());

	{
		auto& csd = *this;
		SDSPI_CSD_MAP_A(XX)
	}

	switch(structure()) {
	case Structure::v1: {
		auto& csd = v1();
		SDSPI_CSD_MAP_B1(XX)
		break;
	}
	case Structure::v2: {
		auto& csd = v2();
		SDSPI_CSD_MAP_B2(XX)
		break;
	}
	case Structure::v3: {
		auto& csd = v3();
		SDSPI_CSD_MAP_B3(XX)
		break;
	}
	default:;
	}

	{
		auto& csd = *this;
		SDSPI_CSD_MAP_C(XX)
	}

#undef XX

	auto size = getSize();
	n += p.print(_F("  size: "));
	n += p.print(size);
	n += p.print(_F(" bytes, "));
	n += p.print(size / 512);
	n += p.println(_F(" blocks"));

	return n;
}

} // namespace Storage::SdSpi
