//-- includes -----
#include "GenericScanStrategy.h"
#include "Logger.h"

//-- constants -----
const char *GenericScanStrategy::k_strategy_name = "GenericScan";
const size_t GenericScanStrategy::k_min_frame_size = 5;

// -- GenericScanStrategy ----
GenericScanStrategy::GenericScanStrategy()
	: m_hint()
{
}

GenericScanStrategy::GenericScanStrategy(const ValueRangeHint &hint)
	: m_hint(hint)
{
}

IProtocolStrategy *GenericScanStrategy::GenericScanStrategyFactory()
{
	return new GenericScanStrategy();
}

bool GenericScanStrategy::looksComplete(const std::vector<uint8_t> &bytes) const
{
	return bytes.size() >= k_min_frame_size;
}

eDecodeStatus GenericScanStrategy::decode(const std::vector<uint8_t> &bytes, DecodedReading &out_reading) const
{
	if (bytes.size() < k_min_frame_size)
		return DecodeStatus_Incomplete;

	BloodPressureTripleMatch match;
	if (!protocol_scan_blood_pressure_triple(bytes, m_hint, match))
		return DecodeStatus_NoPlausibleValues;

	VSL_LOG_DEBUG("GenericScanStrategy::decode")
		<< "Triple found at offset " << match.offset
		<< (match.bBigEndian ? " (big-endian)" : " (little-endian)");

	out_reading = DecodedReading::makeBloodPressure(
		match.values.systolic,
		match.values.diastolic,
		match.values.pulse);

	return DecodeStatus_Success;
}
