#ifndef BLE_DEVICE_MANAGER_H
#define BLE_DEVICE_MANAGER_H

//-- includes -----
#include "VSLConfig.h"
#include "BluetoothLEApiInterface.h"

#include <string>

//-- definitions -----
class BluetoothLEManagerConfig : public VSLConfig
{
public:
	static const int CONFIG_VERSION;

	BluetoothLEManagerConfig(const std::string &fnamebase = "BluetoothLEManagerConfig");

	virtual const configuru::Config writeToJSON();
	virtual void readFromJSON(const configuru::Config &pt);

	long version;

	// Transport used for acquisitions
	eBluetoothLEApiType active_api_type;
	// Config file holding the scripted devices for the replay transport
	std::string replay_config_name;
};

/// Owns one IBluetoothLEApi per transport type and hands out the active one.
class BluetoothLEDeviceManager
{
public:
	BluetoothLEDeviceManager(const BluetoothLEManagerConfig &config);
	virtual ~BluetoothLEDeviceManager();

	IBluetoothLEApi *getBLEApiInterface(eBluetoothLEApiType api) const;
	IBluetoothLEApi *getActiveBLEApiInterface() const;

	template <class t_ble_api>
	t_ble_api *getTypedBLEApiInterface() const
	{
		IBluetoothLEApi *api= getBLEApiInterface(t_ble_api::getStaticBLEApiType());

		if (api == nullptr || api->getRuntimeBLEApiType() != t_ble_api::getStaticBLEApiType())
			return nullptr;

		return static_cast<t_ble_api *>(api);
	}

	inline const BluetoothLEManagerConfig &getConfig() const { return m_cfg; }

	// -- System ----
	bool startup();
	void shutdown();

private:
	/// Configuration settings used by the BLE manager
	BluetoothLEManagerConfig m_cfg;

	/// private implementation
	class BluetoothLEDeviceManagerImpl *m_implementation_ptr;

	bool m_bIsStarted;
};

const char *ble_api_type_to_string(eBluetoothLEApiType api_type);
eBluetoothLEApiType ble_api_type_from_string(const std::string &api_type_string);

#endif  // BLE_DEVICE_MANAGER_H
