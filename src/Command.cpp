#include "include/Storage/SdSpi/Command.h"
#include "include/Storage/SdSpi/Crc.h"

namespace Storage::SdSpi
{
Frame encode(uint8_t index, uint32_t arg)
{
	Frame frame;
	frame.bytes[0] = 0x40 | (index & 0x3f);
	frame.bytes[1] = arg >> 24;
	frame.bytes[2] = arg >> 16;
	frame.bytes[3] = arg >> 8;
	frame.bytes[4] = arg;
	frame.bytes[5] = (crc7(frame.bytes, 5) << 1) | 0x01;
	return frame;
}

} // namespace Storage::SdSpi
