#ifndef SERVICE_PROFILE_H
#define SERVICE_PROFILE_H

//-- includes -----
#include "BluetoothUUID.h"
#include "ReadingTypes.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <stdint.h>

//-- constants -----
enum eProtocolFamily
{
	ProtocolFamily_Proprietary,
	ProtocolFamily_StandardHealth
};

//-- definitions -----
/// Framing and plausibility hints consulted only by heuristic decoders
struct ValueRangeHint
{
	std::vector<uint8_t> frameMarkers;
	int lengthFieldOffset;	///< -1 when the frame carries no length byte

	ValueRange systolic;
	ValueRange diastolic;
	ValueRange pulse;
	ValueRange glucose;

	ValueRangeHint();

	bool isFrameMarker(uint8_t byte) const;
};

class ServiceProfile
{
public:
	ServiceProfile();
	ServiceProfile(
		const std::string &profile_name,
		eProtocolFamily protocol_family,
		eDeviceType device_type,
		const BluetoothUUID &service_uuid,
		const std::vector<BluetoothUUID> &characteristic_uuids);

	std::string profileName;
	eProtocolFamily protocolFamily;
	eDeviceType deviceType;
	BluetoothUUID serviceUuid;
	std::vector<BluetoothUUID> characteristicUuids;
	ValueRangeHint valueRangeHint;

	inline bool isProprietary() const { return protocolFamily == ProtocolFamily_Proprietary; }
};
typedef std::shared_ptr<const ServiceProfile> ServiceProfilePtr;
typedef std::vector<ServiceProfilePtr> ServiceProfileList;

/// Append-only table of known service profiles.
/// Registration order is the resolution priority within a device type.
class ServiceProfileCatalog
{
public:
	ServiceProfileCatalog();

	static const char *k_transtek_profile_name;
	static const char *k_blood_pressure_profile_name;
	static const char *k_glucose_profile_name;

	// Adds the Transtek, Blood Pressure and Glucose profiles
	void registerBuiltInProfiles();

	// Refuses a profile whose name is already taken
	bool registerProfile(const ServiceProfile &profile);

	ServiceProfileList getProfilesForDeviceType(eDeviceType device_type) const;
	ServiceProfilePtr findProfileByName(const std::string &profile_name) const;
	size_t getProfileCount() const;

private:
	mutable std::mutex m_catalogMutex;
	ServiceProfileList m_profiles;
};

#endif // SERVICE_PROFILE_H
