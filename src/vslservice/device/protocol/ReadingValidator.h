#ifndef READING_VALIDATOR_H
#define READING_VALIDATOR_H

//-- includes -----
#include "ReadingTypes.h"
#include "ServiceProfile.h"

#include <string>

//-- constants -----
enum eValidationResult
{
	ValidationResult_Accepted,
	ValidationResult_Rejected
};

//-- definitions -----
/// Gatekeeper between decoders and callers. Never clamps or rewrites a value.
class ReadingValidator
{
public:
	ReadingValidator();
	ReadingValidator(const ValueRangeHint &ranges);

	// Checks a reading according to its confidence:
	//  device-confirmed   -> invariants only (systolic > diastolic, glucose > 0)
	//  heuristic-accepted -> invariants plus every plausibility range
	//  manual-fallback    -> invariants plus strictly positive values
	eValidationResult validate(const DecodedReading &reading, std::string &out_reason) const;

	inline const ValueRangeHint &getRanges() const { return m_ranges; }

private:
	bool checkBloodPressureInvariant(const BloodPressureValues &values, std::string &out_reason) const;
	bool checkBloodPressureRanges(const BloodPressureValues &values, std::string &out_reason) const;
	bool checkGlucoseRange(const GlucoseValues &values, std::string &out_reason) const;

	ValueRangeHint m_ranges;
};

#endif // READING_VALIDATOR_H
