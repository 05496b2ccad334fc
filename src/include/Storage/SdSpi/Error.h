#pragma once

#include <WString.h>
#include <Print.h>

#define SDSPI_ERROR_MAP(XX)                                                                                            \
	XX(success, "Success")                                                                                             \
	XX(timeout, "Timeout waiting for card")                                                                            \
	XX(protocol, "Unexpected response")                                                                                \
	XX(dataError, "Data error token")                                                                                  \
	XX(writeRejected, "Write rejected")                                                                                \
	XX(crcMismatch, "Data CRC mismatch")                                                                               \
	XX(initFailed, "Initialisation failed")                                                                            \
	XX(notInitialised, "Card not initialised")                                                                         \
	XX(badParam, "Bad parameter")

namespace Storage::SdSpi
{
enum class Error : uint8_t {
#define XX(tag, ...) tag,
	SDSPI_ERROR_MAP(XX)
#undef XX
};

/**
 * @brief Outcome of a card operation
 *
 * The meaning of `code` depends on the error:
 *
 * 	protocol		R1 response flags
 * 	dataError		Error bits from the data error token
 * 	writeRejected	Data response token, low 5 bits
 * 	initFailed		InitState at which initialisation stopped
 */
struct Status {
	Error error{Error::success};
	uint8_t code{0};

	Status() = default;

	Status(Error error, uint8_t code = 0) : error(error), code(code)
	{
	}

	explicit operator bool() const
	{
		return error == Error::success;
	}

	bool operator==(Error err) const
	{
		return error == err;
	}

	bool operator!=(Error err) const
	{
		return error != err;
	}

	size_t printTo(Print& p) const;
};

} // namespace Storage::SdSpi

String toString(Storage::SdSpi::Error error);
String toString(const Storage::SdSpi::Status& status);
