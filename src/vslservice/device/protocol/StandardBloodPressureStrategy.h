#ifndef STANDARD_BLOOD_PRESSURE_STRATEGY_H
#define STANDARD_BLOOD_PRESSURE_STRATEGY_H

//-- includes -----
#include "ProtocolStrategy.h"

//-- definitions -----
/// Blood Pressure Measurement characteristic (0x2A35).
/// flags(u8), systolic @1, diastolic @3, pulse @5 as little-endian SFLOAT.
class StandardBloodPressureStrategy : public IProtocolStrategy
{
public:
	static const char *k_strategy_name;
	static const size_t k_min_frame_size;

	const char *getStrategyName() const override { return k_strategy_name; }
	eReadingConfidence getConfidence() const override { return ReadingConfidence_DeviceConfirmed; }
	bool requiresStandardProfile() const override { return true; }
	eDeviceType getReadingKind() const override { return DeviceType_BloodPressure; }

	bool looksComplete(const std::vector<uint8_t> &bytes) const override;
	eDecodeStatus decode(const std::vector<uint8_t> &bytes, DecodedReading &out_reading) const override;

	static IProtocolStrategy *StandardBloodPressureStrategyFactory();

	// Decodes an IEEE-11073 16-bit SFLOAT. Returns false for NaN, NRes, +/-INF and reserved values.
	static bool decodeSFloat(uint16_t raw_value, double &out_value);
};

#endif // STANDARD_BLOOD_PRESSURE_STRATEGY_H
