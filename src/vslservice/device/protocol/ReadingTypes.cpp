//-- includes -----
#include "ReadingTypes.h"
#include "Utility.h"

#include <string.h>

//-- constants -----
const ValueRange k_systolic_plausible_range = { 80, 200 };
const ValueRange k_diastolic_plausible_range = { 40, 130 };
const ValueRange k_pulse_plausible_range = { 40, 180 };
const ValueRange k_glucose_plausible_range = { 20, 600 };

static const char *k_device_type_strings[DeviceType_COUNT] = {
	"BloodPressure",
	"Glucose"
};

static const char *k_glucose_context_strings[] = {
	"Reserved",
	"Fasting",
	"Random",
	"Pre-meal",
	"Post-meal",
	"Exercise",
	"Bedtime",
	"Other"
};

// -- DecodedReading ----
DecodedReading::DecodedReading()
	: kind(DeviceType_INVALID)
	, confidence(ReadingConfidence_ManualFallback)
	, strategyName()
	, timestamp(std::chrono::system_clock::now())
{
	memset(&glucose, 0, sizeof(glucose));
	glucose.context = GlucoseContext_Unknown;
}

DecodedReading DecodedReading::makeBloodPressure(int systolic, int diastolic, int pulse)
{
	DecodedReading reading;

	reading.kind = DeviceType_BloodPressure;
	reading.bloodPressure.systolic = systolic;
	reading.bloodPressure.diastolic = diastolic;
	reading.bloodPressure.pulse = pulse;

	return reading;
}

DecodedReading DecodedReading::makeGlucose(int concentration, eGlucoseContext context)
{
	DecodedReading reading;

	reading.kind = DeviceType_Glucose;
	reading.glucose.concentration = concentration;
	reading.glucose.context = context;

	return reading;
}

//-- public interface -----
const char *device_type_to_string(eDeviceType device_type)
{
	return Utility::is_index_valid(device_type, DeviceType_COUNT) ? k_device_type_strings[device_type] : "INVALID";
}

eDeviceType device_type_from_string(const std::string &device_type_string)
{
	for (int type_index = 0; type_index < DeviceType_COUNT; ++type_index)
	{
		if (device_type_string == k_device_type_strings[type_index])
		{
			return static_cast<eDeviceType>(type_index);
		}
	}

	return DeviceType_INVALID;
}

const char *reading_confidence_to_string(eReadingConfidence confidence)
{
	switch (confidence)
	{
	case ReadingConfidence_DeviceConfirmed:
		return "device-confirmed";
	case ReadingConfidence_HeuristicAccepted:
		return "heuristic-accepted";
	case ReadingConfidence_ManualFallback:
		return "manual-fallback";
	}

	return "INVALID";
}

const char *glucose_context_to_string(eGlucoseContext context)
{
	const int context_index = static_cast<int>(context);

	return Utility::is_index_valid(context_index, (int)ARRAY_SIZE(k_glucose_context_strings))
		? k_glucose_context_strings[context_index]
		: "Unknown";
}

const char *decode_status_to_string(eDecodeStatus status)
{
	switch (status)
	{
	case DecodeStatus_Success:
		return "Success";
	case DecodeStatus_Incomplete:
		return "Incomplete";
	case DecodeStatus_Malformed:
		return "Malformed";
	case DecodeStatus_NoPlausibleValues:
		return "NoPlausibleValues";
	}

	return "INVALID";
}

eGlucoseContext glucose_context_from_code(int context_code)
{
	return Utility::is_index_valid(context_code, (int)ARRAY_SIZE(k_glucose_context_strings))
		? static_cast<eGlucoseContext>(context_code)
		: GlucoseContext_Unknown;
}
