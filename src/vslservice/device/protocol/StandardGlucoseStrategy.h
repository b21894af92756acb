#ifndef STANDARD_GLUCOSE_STRATEGY_H
#define STANDARD_GLUCOSE_STRATEGY_H

//-- includes -----
#include "ProtocolStrategy.h"

//-- definitions -----
/// Glucose Measurement characteristic (0x2A18)
class StandardGlucoseStrategy : public IProtocolStrategy
{
public:
	static const char *k_strategy_name;
	static const size_t k_min_frame_size;

	const char *getStrategyName() const override { return k_strategy_name; }
	eReadingConfidence getConfidence() const override { return ReadingConfidence_DeviceConfirmed; }
	bool requiresStandardProfile() const override { return true; }
	eDeviceType getReadingKind() const override { return DeviceType_Glucose; }

	bool looksComplete(const std::vector<uint8_t> &bytes) const override;
	eDecodeStatus decode(const std::vector<uint8_t> &bytes, DecodedReading &out_reading) const override;

	static IProtocolStrategy *StandardGlucoseStrategyFactory();
};

#endif // STANDARD_GLUCOSE_STRATEGY_H
