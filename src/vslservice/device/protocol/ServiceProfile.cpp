//-- includes -----
#include "ServiceProfile.h"
#include "BluetoothLEServiceIDs.h"
#include "Logger.h"

#include <algorithm>

//-- constants -----
const char *ServiceProfileCatalog::k_transtek_profile_name = "Transtek Proprietary";
const char *ServiceProfileCatalog::k_blood_pressure_profile_name = "Blood Pressure";
const char *ServiceProfileCatalog::k_glucose_profile_name = "Glucose";

// -- ValueRangeHint ----
ValueRangeHint::ValueRangeHint()
	: frameMarkers()
	, lengthFieldOffset(-1)
	, systolic(k_systolic_plausible_range)
	, diastolic(k_diastolic_plausible_range)
	, pulse(k_pulse_plausible_range)
	, glucose(k_glucose_plausible_range)
{
}

bool ValueRangeHint::isFrameMarker(uint8_t byte) const
{
	return std::find(frameMarkers.begin(), frameMarkers.end(), byte) != frameMarkers.end();
}

// -- ServiceProfile ----
ServiceProfile::ServiceProfile()
	: profileName()
	, protocolFamily(ProtocolFamily_StandardHealth)
	, deviceType(DeviceType_INVALID)
	, serviceUuid()
	, characteristicUuids()
	, valueRangeHint()
{
}

ServiceProfile::ServiceProfile(
	const std::string &profile_name,
	eProtocolFamily protocol_family,
	eDeviceType device_type,
	const BluetoothUUID &service_uuid,
	const std::vector<BluetoothUUID> &characteristic_uuids)
	: profileName(profile_name)
	, protocolFamily(protocol_family)
	, deviceType(device_type)
	, serviceUuid(service_uuid)
	, characteristicUuids(characteristic_uuids)
	, valueRangeHint()
{
}

// -- ServiceProfileCatalog ----
ServiceProfileCatalog::ServiceProfileCatalog()
{
}

void ServiceProfileCatalog::registerBuiltInProfiles()
{
	// Proprietary first so it wins over the standard profile when a cuff exposes both
	ServiceProfile transtek(
		k_transtek_profile_name,
		ProtocolFamily_Proprietary,
		DeviceType_BloodPressure,
		*k_Service_TranstekProprietary_UUID,
		{ *k_Characteristic_TranstekMeasurement_UUID });
	transtek.valueRangeHint.frameMarkers = { 0xAA, 0x55 };
	transtek.valueRangeHint.lengthFieldOffset = 1;
	registerProfile(transtek);

	registerProfile(ServiceProfile(
		k_blood_pressure_profile_name,
		ProtocolFamily_StandardHealth,
		DeviceType_BloodPressure,
		*k_Service_BloodPressure_UUID,
		{ *k_Characteristic_BloodPressureMeasurement_UUID }));

	registerProfile(ServiceProfile(
		k_glucose_profile_name,
		ProtocolFamily_StandardHealth,
		DeviceType_Glucose,
		*k_Service_Glucose_UUID,
		{ *k_Characteristic_GlucoseMeasurement_UUID }));
}

bool ServiceProfileCatalog::registerProfile(const ServiceProfile &profile)
{
	std::lock_guard<std::mutex> lock(m_catalogMutex);

	for (const ServiceProfilePtr &existing : m_profiles)
	{
		if (existing->profileName == profile.profileName)
		{
			VSL_LOG_WARNING("ServiceProfileCatalog::registerProfile") << "Profile already registered: " << profile.profileName;
			return false;
		}
	}

	if (!profile.serviceUuid.isValid() || profile.characteristicUuids.empty())
	{
		VSL_LOG_ERROR("ServiceProfileCatalog::registerProfile") << "Profile " << profile.profileName << " needs a service and at least one characteristic";
		return false;
	}

	m_profiles.push_back(ServiceProfilePtr(new ServiceProfile(profile)));

	VSL_LOG_DEBUG("ServiceProfileCatalog::registerProfile")
		<< "Registered profile " << profile.profileName
		<< " (service " << profile.serviceUuid.getDisplayString()
		<< ", " << device_type_to_string(profile.deviceType) << ")";

	return true;
}

ServiceProfileList ServiceProfileCatalog::getProfilesForDeviceType(eDeviceType device_type) const
{
	std::lock_guard<std::mutex> lock(m_catalogMutex);
	ServiceProfileList result;

	for (const ServiceProfilePtr &profile : m_profiles)
	{
		if (profile->deviceType == device_type)
		{
			result.push_back(profile);
		}
	}

	return result;
}

ServiceProfilePtr ServiceProfileCatalog::findProfileByName(const std::string &profile_name) const
{
	std::lock_guard<std::mutex> lock(m_catalogMutex);

	for (const ServiceProfilePtr &profile : m_profiles)
	{
		if (profile->profileName == profile_name)
		{
			return profile;
		}
	}

	return ServiceProfilePtr();
}

size_t ServiceProfileCatalog::getProfileCount() const
{
	std::lock_guard<std::mutex> lock(m_catalogMutex);

	return m_profiles.size();
}
