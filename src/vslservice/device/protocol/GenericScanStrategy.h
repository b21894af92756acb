#ifndef GENERIC_SCAN_STRATEGY_H
#define GENERIC_SCAN_STRATEGY_H

//-- includes -----
#include "ProtocolStrategy.h"

//-- definitions -----
/// Last resort blood pressure decoder. No framing assumptions at all.
class GenericScanStrategy : public IProtocolStrategy
{
public:
	static const char *k_strategy_name;
	static const size_t k_min_frame_size;

	GenericScanStrategy();
	GenericScanStrategy(const ValueRangeHint &hint);

	const char *getStrategyName() const override { return k_strategy_name; }
	eReadingConfidence getConfidence() const override { return ReadingConfidence_HeuristicAccepted; }
	eDeviceType getReadingKind() const override { return DeviceType_BloodPressure; }

	bool looksComplete(const std::vector<uint8_t> &bytes) const override;
	eDecodeStatus decode(const std::vector<uint8_t> &bytes, DecodedReading &out_reading) const override;

	static IProtocolStrategy *GenericScanStrategyFactory();

private:
	ValueRangeHint m_hint;
};

#endif // GENERIC_SCAN_STRATEGY_H
