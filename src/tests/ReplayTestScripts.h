#ifndef REPLAY_TEST_SCRIPTS_H
#define REPLAY_TEST_SCRIPTS_H

//-- includes -----
#include "BluetoothLEServiceIDs.h"
#include "ReplayBluetoothLEApiConfig.h"

#include <string>
#include <vector>

//-- definitions -----
// [AA 08] then [00 78 00 50 00 48 00]: a framed 120/80/72 packet split in two
inline std::vector<ReplayFragment> make_framed_reading_fragments(int delay_ms = 5)
{
	return {
		ReplayFragment(delay_ms, { 0xAA, 0x08 }),
		ReplayFragment(delay_ms, { 0x00, 0x78, 0x00, 0x50, 0x00, 0x48, 0x00 })
	};
}

inline ReplayDeviceScript make_transtek_cuff(
	const std::string &device_id,
	const std::vector<ReplayFragment> &fragments)
{
	ReplayDeviceScript script;

	script.identity = DeviceIdentity(device_id, "TMB-1018 " + device_id);
	script.advertisedServices.addUUID(*k_Service_TranstekProprietary_UUID);
	script.addDeviceInformation("Transtek", "TMB-1018");
	script.addNotifyingCharacteristic(
		*k_Service_TranstekProprietary_UUID,
		*k_Characteristic_TranstekMeasurement_UUID,
		fragments);

	return script;
}

inline ReplayDeviceScript make_standard_cuff(
	const std::string &device_id,
	const std::vector<ReplayFragment> &fragments)
{
	ReplayDeviceScript script;

	script.identity = DeviceIdentity(device_id, "BP7000 " + device_id);
	script.advertisedServices.addUUID(*k_Service_BloodPressure_UUID);
	script.addDeviceInformation("Omron", "BP7000");
	script.addNotifyingCharacteristic(
		*k_Service_BloodPressure_UUID,
		*k_Characteristic_BloodPressureMeasurement_UUID,
		fragments);

	return script;
}

inline ReplayDeviceScript make_glucose_meter(
	const std::string &device_id,
	const std::vector<ReplayFragment> &fragments)
{
	ReplayDeviceScript script;

	script.identity = DeviceIdentity(device_id, "Contour " + device_id);
	script.advertisedServices.addUUID(*k_Service_Glucose_UUID);
	script.addNotifyingCharacteristic(
		*k_Service_Glucose_UUID,
		*k_Characteristic_GlucoseMeasurement_UUID,
		fragments);

	return script;
}

// Advertises nothing and hides its measurements behind a vendor characteristic
inline ReplayDeviceScript make_silent_vendor_cuff(
	const std::string &device_id,
	const std::vector<ReplayFragment> &fragments)
{
	ReplayDeviceScript script;

	script.identity = DeviceIdentity(device_id, "Unbranded " + device_id);
	script.addNotifyingCharacteristic(
		BluetoothUUID("0000fff0-0000-1000-8000-00805f9b34fb"),
		BluetoothUUID("0000fff1-0000-1000-8000-00805f9b34fb"),
		std::vector<ReplayFragment>());
	script.addNotifyingCharacteristic(
		BluetoothUUID("0000fff0-0000-1000-8000-00805f9b34fb"),
		BluetoothUUID("0000fff4-0000-1000-8000-00805f9b34fb"),
		fragments);

	return script;
}

#endif // REPLAY_TEST_SCRIPTS_H
