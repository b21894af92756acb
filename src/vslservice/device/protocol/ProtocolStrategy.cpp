//-- includes -----
#include "ProtocolStrategy.h"
#include "PacketReader.h"

//-- constants -----
// u16 + u16 + u8
static const size_t k_triple_width = 5;

//-- private methods -----
static bool scan_pass(
	const PacketReader &reader,
	const ValueRangeHint &ranges,
	bool bBigEndian,
	BloodPressureTripleMatch &out_match)
{
	for (size_t offset = 0; offset + k_triple_width <= reader.getSize(); ++offset)
	{
		const int systolic = bBigEndian ? reader.getShortBEAt(offset) : reader.getShortLEAt(offset);
		const int diastolic = bBigEndian ? reader.getShortBEAt(offset + 2) : reader.getShortLEAt(offset + 2);
		const int pulse = reader.getByteAt(offset + 4);

		if (ranges.systolic.contains(systolic) &&
			ranges.diastolic.contains(diastolic) &&
			ranges.pulse.contains(pulse))
		{
			out_match.values.systolic = systolic;
			out_match.values.diastolic = diastolic;
			out_match.values.pulse = pulse;
			out_match.offset = offset;
			out_match.bBigEndian = bBigEndian;
			return true;
		}
	}

	return false;
}

//-- public interface -----
bool protocol_scan_blood_pressure_triple(
	const std::vector<uint8_t> &bytes,
	const ValueRangeHint &ranges,
	BloodPressureTripleMatch &out_match)
{
	PacketReader reader(bytes);

	return
		scan_pass(reader, ranges, true, out_match) ||
		scan_pass(reader, ranges, false, out_match);
}
