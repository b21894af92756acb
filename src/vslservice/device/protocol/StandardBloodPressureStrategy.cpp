//-- includes -----
#include "StandardBloodPressureStrategy.h"
#include "PacketReader.h"
#include "Logger.h"

#include <limits.h>
#include <math.h>

//-- constants -----
const char *StandardBloodPressureStrategy::k_strategy_name = "StandardBloodPressure";
const size_t StandardBloodPressureStrategy::k_min_frame_size = 7;

#define BP_FLAG_UNITS_KPA		0x01

static const double k_kpa_to_mmhg = 7.50062;

// Special SFLOAT mantissa values (exponent 0)
static const int16_t k_sfloat_nan = 0x07FF;
static const int16_t k_sfloat_nres = 0x0800;
static const int16_t k_sfloat_positive_infinity = 0x07FE;
static const int16_t k_sfloat_negative_infinity = 0x0802;
static const int16_t k_sfloat_reserved = 0x0801;

// -- StandardBloodPressureStrategy ----
IProtocolStrategy *StandardBloodPressureStrategy::StandardBloodPressureStrategyFactory()
{
	return new StandardBloodPressureStrategy();
}

bool StandardBloodPressureStrategy::decodeSFloat(uint16_t raw_value, double &out_value)
{
	const int16_t raw_mantissa = static_cast<int16_t>(raw_value & 0x0FFF);
	const bool bZeroExponent = (raw_value & 0xF000) == 0;

	if (bZeroExponent &&
		(raw_mantissa == k_sfloat_nan ||
		 raw_mantissa == k_sfloat_nres ||
		 raw_mantissa == k_sfloat_positive_infinity ||
		 raw_mantissa == k_sfloat_negative_infinity ||
		 raw_mantissa == k_sfloat_reserved))
	{
		return false;
	}

	// Sign extend the 12-bit mantissa and the 4-bit exponent
	int mantissa = raw_mantissa;
	if (mantissa >= 0x0800)
	{
		mantissa -= 0x1000;
	}

	int exponent = (raw_value >> 12) & 0x0F;
	if (exponent >= 0x08)
	{
		exponent -= 0x10;
	}

	out_value = static_cast<double>(mantissa) * pow(10.0, exponent);

	return true;
}

bool StandardBloodPressureStrategy::looksComplete(const std::vector<uint8_t> &bytes) const
{
	return bytes.size() >= k_min_frame_size;
}

eDecodeStatus StandardBloodPressureStrategy::decode(const std::vector<uint8_t> &bytes, DecodedReading &out_reading) const
{
	if (bytes.size() < k_min_frame_size)
		return DecodeStatus_Incomplete;

	PacketReader reader(bytes);
	const uint8_t flags = reader.readByte();
	const bool bIsKPa = (flags & BP_FLAG_UNITS_KPA) != 0;

	double values[3];
	for (int value_index = 0; value_index < 3; ++value_index)
	{
		if (!decodeSFloat(reader.readShortLE(), values[value_index]))
		{
			VSL_LOG_DEBUG("StandardBloodPressureStrategy::decode") << "SFLOAT special value at field " << value_index;
			return DecodeStatus_Malformed;
		}
	}

	// Only the pressure fields carry units, the pulse rate is always bpm
	if (bIsKPa)
	{
		values[0] *= k_kpa_to_mmhg;
		values[1] *= k_kpa_to_mmhg;
	}

	for (int value_index = 0; value_index < 3; ++value_index)
	{
		if (fabs(values[value_index]) > static_cast<double>(INT_MAX))
			return DecodeStatus_Malformed;
	}

	out_reading = DecodedReading::makeBloodPressure(
		static_cast<int>(floor(values[0] + 0.5)),
		static_cast<int>(floor(values[1] + 0.5)),
		static_cast<int>(floor(values[2] + 0.5)));

	return DecodeStatus_Success;
}
