#pragma once

#include <cstdint>

namespace Storage::SdSpi
{
/**
 * @brief Clock and delay provider used by all polling loops
 *
 * Tests substitute a manual clock so timeouts can be exercised without waiting.
 */
class TimeSource
{
public:
	virtual ~TimeSource()
	{
	}

	virtual uint32_t millis() = 0;
	virtual void delayMicroseconds(uint32_t us) = 0;
};

/**
 * @brief Uses the system clock
 */
class SystemTimeSource : public TimeSource
{
public:
	uint32_t millis() override;
	void delayMicroseconds(uint32_t us) override;
};

extern SystemTimeSource systemTimeSource;

/**
 * @brief Wall-clock budget for a polling loop
 */
class Deadline
{
public:
	Deadline(TimeSource& time, uint32_t timeoutMs) : time(time), start(time.millis()), timeout(timeoutMs)
	{
	}

	bool expired() const
	{
		return (time.millis() - start) >= timeout;
	}

	uint32_t elapsed() const
	{
		return time.millis() - start;
	}

private:
	TimeSource& time;
	uint32_t start;
	uint32_t timeout;
};

} // namespace Storage::SdSpi
