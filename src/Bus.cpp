#include "include/Storage/SdSpi/Bus.h"
#include <cstring>
#include <algorithm>

namespace Storage::SdSpi
{
void Bus::write(const void* data, size_t length)
{
	uint8_t buf[64];
	auto ptr = static_cast<const uint8_t*>(data);
	while(length != 0) {
		auto n = std::min(length, sizeof(buf));
		memcpy(buf, ptr, n);
		exchange(buf, n);
		ptr += n;
		length -= n;
	}
}

void Bus::read(void* buffer, size_t length)
{
	memset(buffer, 0xff, length);
	exchange(buffer, length);
}

void Bus::idle(size_t count)
{
	uint8_t buf[16];
	memset(buf, 0xff, sizeof(buf));
	while(count != 0) {
		auto n = std::min(count, sizeof(buf));
		write(buf, n);
		count -= n;
	}
}

} // namespace Storage::SdSpi
