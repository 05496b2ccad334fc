#include "include/Storage/SdSpi/Error.h"

String toString(Storage::SdSpi::Error error)
{
	using Error = Storage::SdSpi::Error;

	switch(error) {
#define XX(tag, text)                                                                                                  \
	case Error::tag:                                                                                                   \
		return F(text);
		SDSPI_ERROR_MAP(XX)
#undef XX
	default:
		return F("INVALID");
	}
}

String toString(const Storage::SdSpi::Status& status)
{
	String s = toString(status.error);
	if(status.code != 0) {
		s += F(" (0x");
		s += String(status.code, HEX, 2);
		s += ')';
	}
	return s;
}

namespace Storage::SdSpi
{
size_t Status::printTo(Print& p) const
{
	return p.print(::toString(*this));
}

} // namespace Storage::SdSpi
