#ifndef BLE_API_INTERFACE_H
#define BLE_API_INTERFACE_H

#include "BluetoothUUID.h"
#include "BluetoothLEDeviceGatt.h"

#include <functional>
#include <stddef.h>
#include <string>
#include <vector>

//-- constants -----
enum eBluetoothLEApiType : short
{
	_BLEApiType_INVALID = -1,

	_BLEApiType_Replay,

	_BLEApiType_COUNT
};

//-- typedefs -----
struct t_bluetoothle_device_handle
{
	eBluetoothLEApiType api_type;
	short unique_id;

	inline bool operator < (const t_bluetoothle_device_handle &other) const { return unique_id < other.unique_id; }
	inline bool operator == (const t_bluetoothle_device_handle &other) const { return unique_id == other.unique_id; }
	inline bool operator != (const t_bluetoothle_device_handle &other) const { return unique_id != other.unique_id; }
};
const t_bluetoothle_device_handle k_invalid_ble_device_handle = { _BLEApiType_INVALID, -1 };

//-- definitions -----
/// Identity assigned to a device by the host wireless stack
struct DeviceIdentity
{
	std::string deviceId;
	std::string friendlyName;

	DeviceIdentity() {}
	DeviceIdentity(const std::string &id, const std::string &name)
		: deviceId(id)
		, friendlyName(name)
	{}
};

/// Device picker request, modeled on the host stack's requestDevice
struct BluetoothLEDeviceRequest
{
	// Only devices advertising at least one of these services match.
	// Ignored when acceptAllDevices is set.
	BluetoothUUIDSet filterServices;

	// Services the caller intends to access beyond the filter services
	BluetoothUUIDSet optionalServices;

	bool acceptAllDevices;

	// Restricts the request to a previously seen device. Empty means any.
	std::string deviceId;

	BluetoothLEDeviceRequest() : acceptAllDevices(false) {}
};

class BluetoothLEDeviceState
{
public:
	BluetoothLEDeviceState(const DeviceIdentity &identity);
	virtual ~BluetoothLEDeviceState();

	void assignPublicHandle(t_bluetoothle_device_handle handle) { deviceHandle = handle; }
	t_bluetoothle_device_handle getPublicHandle() const { return deviceHandle; }
	inline const DeviceIdentity &getDeviceIdentity() const { return deviceIdentity; }
	inline BLEGattProfile *getGattProfile() const { return gattProfile; }

protected:
	t_bluetoothle_device_handle deviceHandle;
	DeviceIdentity deviceIdentity;
	BLEGattProfile *gattProfile;
};

//-- interface -----
class IBluetoothLEApi
{
public:
	using DisconnectCallback = std::function<void(const std::string &device_id)>;

	IBluetoothLEApi() {}
	virtual ~IBluetoothLEApi() {}

	virtual eBluetoothLEApiType getRuntimeBLEApiType() const = 0;

	virtual bool startup() = 0;
	virtual void shutdown() = 0;

	// Resolves a request to a single reachable device.
	// Returns false when nothing matches.
	virtual bool requestDevice(const BluetoothLEDeviceRequest &request, DeviceIdentity &out_identity) = 0;

	virtual BluetoothLEDeviceState *openBluetoothLEDevice(const DeviceIdentity &identity) = 0;
	virtual void closeBluetoothLEDevice(BluetoothLEDeviceState* device_state) = 0;

	virtual bool getBluetoothLEGattProfile(const BluetoothLEDeviceState* device_state, BLEGattProfile **outGattProfile) const = 0;

	// Fires when the link drops without closeBluetoothLEDevice being called.
	// The callback may run on a transport owned thread.
	virtual BluetoothEventHandle registerDisconnectEvent(BluetoothLEDeviceState* device_state, DisconnectCallback callback) = 0;
	virtual void unregisterDisconnectEvent(BluetoothLEDeviceState* device_state, const BluetoothEventHandle &handle) = 0;
};

#endif // BLE_API_INTERFACE_H
