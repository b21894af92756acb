#ifndef REPLAY_BLUETOOTH_LE_API_CONFIG_H
#define REPLAY_BLUETOOTH_LE_API_CONFIG_H

//-- includes -----
#include "VSLConfig.h"
#include "BluetoothLEApiInterface.h"

#include <vector>
#include <stdint.h>

//-- definitions -----
struct ReplayFragment
{
	int delayMs;	///< Wait before this fragment, relative to the previous one
	std::vector<uint8_t> bytes;

	ReplayFragment() : delayMs(0), bytes() {}
	ReplayFragment(int delay_ms, const std::vector<uint8_t> &fragment_bytes) : delayMs(delay_ms), bytes(fragment_bytes) {}
};

struct ReplayCharacteristicScript
{
	BluetoothUUID uuid;
	bool bReadable;
	bool bNotifiable;
	bool bIndicatable;
	std::vector<uint8_t> value;
	// Replayed from the start every time notifications are enabled
	std::vector<ReplayFragment> fragments;

	ReplayCharacteristicScript();
};

struct ReplayServiceScript
{
	BluetoothUUID uuid;
	std::vector<ReplayCharacteristicScript> characteristics;
};

struct ReplayDeviceScript
{
	DeviceIdentity identity;
	BluetoothUUIDSet advertisedServices;
	std::vector<ReplayServiceScript> services;

	// Failure injection
	int connectFailuresBeforeSuccess;
	int dropLinkAfterFragments;	///< -1 disables. Applies to the first successful link only.

	ReplayDeviceScript();

	// Adds a readable Device Information service with manufacturer and model strings
	void addDeviceInformation(const std::string &manufacturer, const std::string &model);
	// Adds a notifiable characteristic (and its service, if new) replaying the given fragments
	void addNotifyingCharacteristic(
		const BluetoothUUID &service_uuid,
		const BluetoothUUID &characteristic_uuid,
		const std::vector<ReplayFragment> &fragments);
};

/// Scripted peripherals served by ReplayBluetoothLEApi
class ReplayBluetoothLEApiConfig : public VSLConfig
{
public:
	static const int CONFIG_VERSION;

	ReplayBluetoothLEApiConfig(const std::string &fnamebase = "ReplayBluetoothLEApiConfig");

	virtual const configuru::Config writeToJSON();
	virtual void readFromJSON(const configuru::Config &pt);

	long version;
	std::vector<ReplayDeviceScript> devices;
};

#endif // REPLAY_BLUETOOTH_LE_API_CONFIG_H
