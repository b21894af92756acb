#ifndef PROTOCOL_STRATEGY_H
#define PROTOCOL_STRATEGY_H

//-- includes -----
#include "ReadingTypes.h"
#include "ServiceProfile.h"

#include <vector>
#include <stddef.h>
#include <stdint.h>

//-- interface -----
/// One way of turning a reassembled byte buffer into a reading.
/// Implementations are stateless so a single instance can serve every attempt.
class IProtocolStrategy
{
public:
	virtual ~IProtocolStrategy() {}

	virtual const char *getStrategyName() const = 0;
	virtual eReadingConfidence getConfidence() const = 0;
	virtual eDeviceType getReadingKind() const = 0;

	// True when the layout is only authoritative on a declared standard characteristic
	virtual bool requiresStandardProfile() const { return false; }

	// Cheap test for "enough bytes have arrived to try a decode"
	virtual bool looksComplete(const std::vector<uint8_t> &bytes) const = 0;

	// Fills in the reading values only. Confidence, strategy name and timestamp
	// are stamped by the chain.
	virtual eDecodeStatus decode(const std::vector<uint8_t> &bytes, DecodedReading &out_reading) const = 0;
};

//-- definitions -----
struct BloodPressureTripleMatch
{
	BloodPressureValues values;
	size_t offset;
	bool bBigEndian;
};

// Slides over every offset reading (u16 systolic, u16 diastolic, u8 pulse).
// Tries a full big-endian pass before a full little-endian pass and returns
// the first triple inside all three ranges.
bool protocol_scan_blood_pressure_triple(
	const std::vector<uint8_t> &bytes,
	const ValueRangeHint &ranges,
	BloodPressureTripleMatch &out_match);

#endif // PROTOCOL_STRATEGY_H
