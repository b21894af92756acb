#ifndef PROPRIETARY_FRAMED_STRATEGY_H
#define PROPRIETARY_FRAMED_STRATEGY_H

//-- includes -----
#include "ProtocolStrategy.h"

//-- definitions -----
/// Vendor framed blood pressure packets (Transtek / Coverich style).
/// Frame: marker byte, length byte, then systolic/diastolic/pulse as u16
/// at offsets 2/4/6 in an undocumented byte order.
class ProprietaryFramedStrategy : public IProtocolStrategy
{
public:
	static const char *k_strategy_name;
	static const size_t k_min_frame_size;

	ProprietaryFramedStrategy();
	ProprietaryFramedStrategy(const ValueRangeHint &hint);

	const char *getStrategyName() const override { return k_strategy_name; }
	eReadingConfidence getConfidence() const override { return ReadingConfidence_HeuristicAccepted; }
	eDeviceType getReadingKind() const override { return DeviceType_BloodPressure; }

	bool looksComplete(const std::vector<uint8_t> &bytes) const override;
	eDecodeStatus decode(const std::vector<uint8_t> &bytes, DecodedReading &out_reading) const override;

	static IProtocolStrategy *ProprietaryFramedStrategyFactory();

private:
	// True when the buffer opens with a frame marker. out_bComplete tells whether the declared length has arrived.
	bool readFrameMarker(const std::vector<uint8_t> &bytes, bool &out_bComplete) const;
	bool readFixedOffsets(const std::vector<uint8_t> &bytes, bool bBigEndian, BloodPressureValues &out_values) const;

	ValueRangeHint m_hint;
};

#endif // PROPRIETARY_FRAMED_STRATEGY_H
