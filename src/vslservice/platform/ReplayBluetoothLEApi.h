#ifndef REPLAY_BLUETOOTH_LE_API_H
#define REPLAY_BLUETOOTH_LE_API_H

//-- includes -----
#include "BluetoothLEApiInterface.h"
#include "ReplayBluetoothLEApiConfig.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <stdint.h>

//-- definitions -----
/// In-process transport serving scripted peripherals.
/// Notification fragments are replayed on worker threads with their scripted delays,
/// disconnects are delivered from a separate dispatcher thread like a host stack would.
class ReplayBluetoothLEApi : public IBluetoothLEApi
{
public:
	ReplayBluetoothLEApi();
	virtual ~ReplayBluetoothLEApi();

	static eBluetoothLEApiType getStaticBLEApiType() { return _BLEApiType_Replay; }
	eBluetoothLEApiType getRuntimeBLEApiType() const override { return getStaticBLEApiType(); }

	// -- Scripting ----
	void addDevice(const ReplayDeviceScript &script);
	void loadDevices(const ReplayBluetoothLEApiConfig &config);
	bool removeDevice(const std::string &device_id);
	size_t getDeviceCount() const;

	// Drops every open link to the device as if it walked out of range
	bool simulateDisconnect(const std::string &device_id);

	// -- Counters ----
	int getOpenLinkCount(const std::string &device_id) const;
	int getMaxConcurrentLinks(const std::string &device_id) const;
	int getOpenAttemptCount(const std::string &device_id) const;

	// -- IBluetoothLEApi ----
	bool startup() override;
	void shutdown() override;

	bool requestDevice(const BluetoothLEDeviceRequest &request, DeviceIdentity &out_identity) override;

	BluetoothLEDeviceState *openBluetoothLEDevice(const DeviceIdentity &identity) override;
	void closeBluetoothLEDevice(BluetoothLEDeviceState* device_state) override;

	bool getBluetoothLEGattProfile(const BluetoothLEDeviceState* device_state, BLEGattProfile **outGattProfile) const override;

	BluetoothEventHandle registerDisconnectEvent(BluetoothLEDeviceState* device_state, DisconnectCallback callback) override;
	void unregisterDisconnectEvent(BluetoothLEDeviceState* device_state, const BluetoothEventHandle &handle) override;

	// Called by a replayed link once it decides to drop
	void postLinkDropped(t_bluetoothle_device_handle handle);

private:
	void dispatchLinkDropped(t_bluetoothle_device_handle handle);

	struct ReplayDeviceRecord
	{
		ReplayDeviceScript script;
		int openAttempts;
		int successfulOpens;
		int openLinks;
		int maxConcurrentLinks;
	};

	mutable std::mutex m_apiMutex;
	std::vector<ReplayDeviceRecord> m_devices;
	std::map<t_bluetoothle_device_handle, class ReplayDeviceState *> m_openDevices;
	std::map<t_bluetoothle_device_handle, std::map<intptr_t, DisconnectCallback> > m_disconnectCallbacks;
	short m_nextDeviceHandle;
	intptr_t m_nextEventId;

	class ReplayEventDispatcher *m_dispatcher;
};

#endif // REPLAY_BLUETOOTH_LE_API_H
