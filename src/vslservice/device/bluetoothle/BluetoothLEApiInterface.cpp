#include "BluetoothLEApiInterface.h"

// -- BLEDeviceState ----
BluetoothLEDeviceState::BluetoothLEDeviceState(const DeviceIdentity &identity)
	: deviceHandle(k_invalid_ble_device_handle)
	, deviceIdentity(identity)
	, gattProfile(nullptr)
{
}

BluetoothLEDeviceState::~BluetoothLEDeviceState()
{
	if (gattProfile != nullptr)
	{
		delete gattProfile;
	}
}
