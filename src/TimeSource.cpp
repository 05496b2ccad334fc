#include "include/Storage/SdSpi/TimeSource.h"
#include <Clock.h>

namespace Storage::SdSpi
{
SystemTimeSource systemTimeSource;

uint32_t SystemTimeSource::millis()
{
	return ::millis();
}

void SystemTimeSource::delayMicroseconds(uint32_t us)
{
	::delayMicroseconds(us);
}

} // namespace Storage::SdSpi
