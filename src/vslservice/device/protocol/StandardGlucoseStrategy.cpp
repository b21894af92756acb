//-- includes -----
#include "StandardGlucoseStrategy.h"
#include "PacketReader.h"

//-- constants -----
const char *StandardGlucoseStrategy::k_strategy_name = "StandardGlucose";
const size_t StandardGlucoseStrategy::k_min_frame_size = 12;

#define GLUCOSE_CONTEXT_MASK	0x0F

// -- StandardGlucoseStrategy ----
IProtocolStrategy *StandardGlucoseStrategy::StandardGlucoseStrategyFactory()
{
	return new StandardGlucoseStrategy();
}

bool StandardGlucoseStrategy::looksComplete(const std::vector<uint8_t> &bytes) const
{
	return bytes.size() >= k_min_frame_size;
}

eDecodeStatus StandardGlucoseStrategy::decode(const std::vector<uint8_t> &bytes, DecodedReading &out_reading) const
{
	if (bytes.size() < k_min_frame_size)
		return DecodeStatus_Incomplete;

	PacketReader reader(bytes);
	const uint8_t flags = reader.readByte();

	DecodedReading reading = DecodedReading::makeGlucose(0, glucose_context_from_code(flags & GLUCOSE_CONTEXT_MASK));
	reading.glucose.sequenceNumber = reader.readShortLE();
	reading.glucose.year = reader.readShortLE();
	reading.glucose.month = reader.readByte();
	reading.glucose.day = reader.readByte();
	reading.glucose.hours = reader.readByte();
	reading.glucose.minutes = reader.readByte();
	reading.glucose.seconds = reader.readByte();
	reading.glucose.concentration = reader.readShortLE();

	if (reader.hasOverrun())
		return DecodeStatus_Malformed;

	out_reading = reading;

	return DecodeStatus_Success;
}
