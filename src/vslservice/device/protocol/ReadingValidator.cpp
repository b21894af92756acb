//-- includes -----
#include "ReadingValidator.h"

#include <sstream>

//-- private methods -----
static bool check_range(const char *field_name, int value, const ValueRange &range, std::string &out_reason)
{
	if (range.contains(value))
		return true;

	std::stringstream reason;
	reason << field_name << " " << value << " outside " << range.minValue << "-" << range.maxValue;
	out_reason = reason.str();

	return false;
}

static bool check_positive(const char *field_name, int value, std::string &out_reason)
{
	if (value > 0)
		return true;

	std::stringstream reason;
	reason << field_name << " must be positive (got " << value << ")";
	out_reason = reason.str();

	return false;
}

// -- ReadingValidator ----
ReadingValidator::ReadingValidator()
	: m_ranges()
{
}

ReadingValidator::ReadingValidator(const ValueRangeHint &ranges)
	: m_ranges(ranges)
{
}

eValidationResult ReadingValidator::validate(const DecodedReading &reading, std::string &out_reason) const
{
	bool bAccepted = false;

	out_reason.clear();

	switch (reading.kind)
	{
	case DeviceType_BloodPressure:
		{
			const BloodPressureValues &values = reading.bloodPressure;

			switch (reading.confidence)
			{
			case ReadingConfidence_DeviceConfirmed:
				bAccepted = checkBloodPressureInvariant(values, out_reason);
				break;
			case ReadingConfidence_HeuristicAccepted:
				bAccepted =
					checkBloodPressureRanges(values, out_reason) &&
					checkBloodPressureInvariant(values, out_reason);
				break;
			case ReadingConfidence_ManualFallback:
				bAccepted =
					check_positive("systolic", values.systolic, out_reason) &&
					check_positive("diastolic", values.diastolic, out_reason) &&
					check_positive("pulse", values.pulse, out_reason) &&
					checkBloodPressureInvariant(values, out_reason);
				break;
			}
		} break;
	case DeviceType_Glucose:
		{
			const GlucoseValues &values = reading.glucose;

			switch (reading.confidence)
			{
			case ReadingConfidence_DeviceConfirmed:
			case ReadingConfidence_ManualFallback:
				bAccepted = check_positive("glucose", values.concentration, out_reason);
				break;
			case ReadingConfidence_HeuristicAccepted:
				bAccepted =
					check_positive("glucose", values.concentration, out_reason) &&
					checkGlucoseRange(values, out_reason);
				break;
			}
		} break;
	default:
		out_reason = "unknown reading kind";
		break;
	}

	return bAccepted ? ValidationResult_Accepted : ValidationResult_Rejected;
}

bool ReadingValidator::checkBloodPressureInvariant(const BloodPressureValues &values, std::string &out_reason) const
{
	if (values.systolic > values.diastolic)
		return true;

	std::stringstream reason;
	reason << "systolic " << values.systolic << " not above diastolic " << values.diastolic;
	out_reason = reason.str();

	return false;
}

bool ReadingValidator::checkBloodPressureRanges(const BloodPressureValues &values, std::string &out_reason) const
{
	return
		check_range("systolic", values.systolic, m_ranges.systolic, out_reason) &&
		check_range("diastolic", values.diastolic, m_ranges.diastolic, out_reason) &&
		check_range("pulse", values.pulse, m_ranges.pulse, out_reason);
}

bool ReadingValidator::checkGlucoseRange(const GlucoseValues &values, std::string &out_reason) const
{
	return check_range("glucose", values.concentration, m_ranges.glucose, out_reason);
}
