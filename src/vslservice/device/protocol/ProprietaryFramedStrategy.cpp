//-- includes -----
#include "ProprietaryFramedStrategy.h"
#include "PacketReader.h"
#include "Logger.h"

//-- constants -----
const char *ProprietaryFramedStrategy::k_strategy_name = "ProprietaryFramed";
const size_t ProprietaryFramedStrategy::k_min_frame_size = 8;

static const size_t k_systolic_offset = 2;
static const size_t k_diastolic_offset = 4;
static const size_t k_pulse_offset = 6;

// -- ProprietaryFramedStrategy ----
ProprietaryFramedStrategy::ProprietaryFramedStrategy()
	: m_hint()
{
	m_hint.frameMarkers = { 0xAA, 0x55 };
	m_hint.lengthFieldOffset = 1;
}

ProprietaryFramedStrategy::ProprietaryFramedStrategy(const ValueRangeHint &hint)
	: m_hint(hint)
{
}

IProtocolStrategy *ProprietaryFramedStrategy::ProprietaryFramedStrategyFactory()
{
	return new ProprietaryFramedStrategy();
}

bool ProprietaryFramedStrategy::looksComplete(const std::vector<uint8_t> &bytes) const
{
	if (bytes.size() < k_min_frame_size)
		return false;

	bool bFrameComplete = false;
	if (readFrameMarker(bytes, bFrameComplete))
		return bFrameComplete;

	// Unframed packet whose fixed offsets already look like a reading
	BloodPressureValues values;
	return readFixedOffsets(bytes, true, values);
}

eDecodeStatus ProprietaryFramedStrategy::decode(const std::vector<uint8_t> &bytes, DecodedReading &out_reading) const
{
	if (bytes.size() < k_min_frame_size)
		return DecodeStatus_Incomplete;

	bool bFrameComplete = false;
	if (readFrameMarker(bytes, bFrameComplete) && !bFrameComplete)
		return DecodeStatus_Incomplete;

	BloodPressureValues values;

	if (readFixedOffsets(bytes, true, values))
	{
		VSL_LOG_DEBUG("ProprietaryFramedStrategy::decode") << "Matched big-endian fixed offsets";
	}
	else if (readFixedOffsets(bytes, false, values))
	{
		VSL_LOG_DEBUG("ProprietaryFramedStrategy::decode") << "Matched little-endian fixed offsets";
	}
	else
	{
		BloodPressureTripleMatch match;

		if (!protocol_scan_blood_pressure_triple(bytes, m_hint, match))
		{
			return DecodeStatus_NoPlausibleValues;
		}

		VSL_LOG_DEBUG("ProprietaryFramedStrategy::decode")
			<< "Matched scanned triple at offset " << match.offset
			<< (match.bBigEndian ? " (big-endian)" : " (little-endian)");
		values = match.values;
	}

	out_reading = DecodedReading::makeBloodPressure(values.systolic, values.diastolic, values.pulse);

	return DecodeStatus_Success;
}

bool ProprietaryFramedStrategy::readFrameMarker(const std::vector<uint8_t> &bytes, bool &out_bComplete) const
{
	PacketReader reader(bytes);

	if (bytes.empty() || !m_hint.isFrameMarker(reader.getByteAt(0)))
		return false;

	if (m_hint.lengthFieldOffset < 0)
	{
		out_bComplete = true;
	}
	else
	{
		const size_t length_offset = static_cast<size_t>(m_hint.lengthFieldOffset);

		out_bComplete = length_offset < bytes.size() && bytes.size() >= reader.getByteAt(length_offset);
	}

	return true;
}

bool ProprietaryFramedStrategy::readFixedOffsets(
	const std::vector<uint8_t> &bytes,
	bool bBigEndian,
	BloodPressureValues &out_values) const
{
	PacketReader reader(bytes);

	if (bBigEndian)
	{
		out_values.systolic = reader.getShortBEAt(k_systolic_offset);
		out_values.diastolic = reader.getShortBEAt(k_diastolic_offset);
		out_values.pulse = reader.getShortBEAt(k_pulse_offset);
	}
	else
	{
		out_values.systolic = reader.getShortLEAt(k_systolic_offset);
		out_values.diastolic = reader.getShortLEAt(k_diastolic_offset);
		out_values.pulse = reader.getShortLEAt(k_pulse_offset);
	}

	return
		m_hint.systolic.contains(out_values.systolic) &&
		m_hint.diastolic.contains(out_values.diastolic) &&
		m_hint.pulse.contains(out_values.pulse);
}
