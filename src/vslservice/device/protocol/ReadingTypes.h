#ifndef READING_TYPES_H
#define READING_TYPES_H

//-- includes -----
#include <chrono>
#include <string>
#include <stdint.h>

//-- constants -----
enum eDeviceType
{
	DeviceType_INVALID = -1,

	DeviceType_BloodPressure,
	DeviceType_Glucose,

	DeviceType_COUNT
};

enum eReadingConfidence
{
	ReadingConfidence_DeviceConfirmed,		///< Decoded from a standard profile the device declares
	ReadingConfidence_HeuristicAccepted,	///< Decoded by offset guessing, passed every plausibility range
	ReadingConfidence_ManualFallback		///< Keyed in by a human

};

/// Glucose measurement context (low nibble of the measurement flags)
enum eGlucoseContext
{
	GlucoseContext_Reserved,
	GlucoseContext_Fasting,
	GlucoseContext_Random,
	GlucoseContext_PreMeal,
	GlucoseContext_PostMeal,
	GlucoseContext_Exercise,
	GlucoseContext_Bedtime,
	GlucoseContext_Other,

	GlucoseContext_Unknown
};

enum eDecodeStatus
{
	DecodeStatus_Success,
	DecodeStatus_Incomplete,		///< Not enough bytes for this layout
	DecodeStatus_Malformed,			///< Layout recognized but the contents are unusable
	DecodeStatus_NoPlausibleValues	///< No candidate triple fell inside the plausibility ranges
};

//-- definitions -----
struct ValueRange
{
	int minValue;
	int maxValue;

	inline bool contains(int value) const { return value >= minValue && value <= maxValue; }
};

extern const ValueRange k_systolic_plausible_range;
extern const ValueRange k_diastolic_plausible_range;
extern const ValueRange k_pulse_plausible_range;
extern const ValueRange k_glucose_plausible_range;

struct BloodPressureValues
{
	int systolic;	///< mmHg
	int diastolic;	///< mmHg
	int pulse;		///< beats per minute
};

struct GlucoseValues
{
	int concentration;	///< mg/dL
	eGlucoseContext context;
	uint16_t sequenceNumber;

	// Base time reported by the meter
	uint16_t year;
	uint8_t month;
	uint8_t day;
	uint8_t hours;
	uint8_t minutes;
	uint8_t seconds;
};

/// A single clinical reading plus where it came from
struct DecodedReading
{
	eDeviceType kind;
	union
	{
		BloodPressureValues bloodPressure;
		GlucoseValues glucose;
	};
	eReadingConfidence confidence;
	std::string strategyName;
	std::chrono::system_clock::time_point timestamp;

	DecodedReading();

	static DecodedReading makeBloodPressure(int systolic, int diastolic, int pulse);
	static DecodedReading makeGlucose(int concentration, eGlucoseContext context);
};

//-- interface -----
const char *device_type_to_string(eDeviceType device_type);
eDeviceType device_type_from_string(const std::string &device_type_string);
const char *reading_confidence_to_string(eReadingConfidence confidence);
const char *glucose_context_to_string(eGlucoseContext context);
const char *decode_status_to_string(eDecodeStatus status);

// Maps a raw context nibble to the fixed label table. Codes beyond the table map to Unknown.
eGlucoseContext glucose_context_from_code(int context_code);

#endif // READING_TYPES_H
