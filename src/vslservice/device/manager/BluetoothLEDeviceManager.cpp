//-- includes -----
#include "BluetoothLEApiInterface.h"
#include "BluetoothLEDeviceManager.h"
#include "Logger.h"
#include "Utility.h"

#include "ReplayBluetoothLEApi.h"
#include "ReplayBluetoothLEApiConfig.h"

//-- constants -----
static const char *k_ble_api_type_names[_BLEApiType_COUNT] = {
	"Replay"
};

//-- BLE Manager Config -----
const int BluetoothLEManagerConfig::CONFIG_VERSION = 1;

BluetoothLEManagerConfig::BluetoothLEManagerConfig(const std::string &fnamebase)
	: VSLConfig(fnamebase)
	, version(CONFIG_VERSION)
	, active_api_type(_BLEApiType_Replay)
	, replay_config_name("ReplayBluetoothLEApiConfig")
{
};

const configuru::Config
BluetoothLEManagerConfig::writeToJSON()
{
	configuru::Config pt{
		{"version", BluetoothLEManagerConfig::CONFIG_VERSION},
		{"active_api_type", ble_api_type_to_string(active_api_type)},
		{"replay_config_name", replay_config_name}
	};

	return pt;
}

void
BluetoothLEManagerConfig::readFromJSON(const configuru::Config &pt)
{
	version = pt.get_or<int>("version", 0);

	if (version == BluetoothLEManagerConfig::CONFIG_VERSION)
	{
		const std::string api_type_string=
			pt.get_or<std::string>("active_api_type", ble_api_type_to_string(active_api_type));
		const eBluetoothLEApiType api_type= ble_api_type_from_string(api_type_string);

		if (api_type != _BLEApiType_INVALID)
		{
			active_api_type= api_type;
		}
		else
		{
			VSL_LOG_WARNING("BluetoothLEManagerConfig") << "Unknown api type " << api_type_string << ", keeping " << ble_api_type_to_string(active_api_type);
		}

		replay_config_name= pt.get_or<std::string>("replay_config_name", replay_config_name);
	}
	else
	{
		VSL_LOG_WARNING("BluetoothLEManagerConfig") <<
			"Config version " << version << " does not match expected version " <<
			BluetoothLEManagerConfig::CONFIG_VERSION << ", Using defaults.";
	}
}

// -BluetoothLEDeviceManagerImpl-
/// Internal implementation of the BLE device manager.
class BluetoothLEDeviceManagerImpl
{
public:
	BluetoothLEDeviceManagerImpl()
	{
		m_ble_apis = new IBluetoothLEApi*[_BLEApiType_COUNT];
		m_ble_apis[_BLEApiType_Replay] = new ReplayBluetoothLEApi;
	}

	virtual ~BluetoothLEDeviceManagerImpl()
	{
		for (int api = 0; api < _BLEApiType_COUNT; ++api)
		{
			delete m_ble_apis[api];
		}
		delete[] m_ble_apis;
	}

	// -- System ----
	bool startup(const BluetoothLEManagerConfig &config)
	{
		bool bSuccess = true;

		if (!config.replay_config_name.empty())
		{
			ReplayBluetoothLEApiConfig replay_config(config.replay_config_name);

			if (replay_config.load())
			{
				static_cast<ReplayBluetoothLEApi *>(m_ble_apis[_BLEApiType_Replay])->loadDevices(replay_config);
			}
			else if (!Utility::file_exists(replay_config.getConfigPath()))
			{
				// Leave an empty script behind for the user to fill in
				replay_config.save();
			}
		}

		for (int api = 0; api < _BLEApiType_COUNT; ++api)
		{
			if (m_ble_apis[api]->startup())
			{
				VSL_LOG_INFO("BluetoothLEDeviceManager::startup") << "Initialized " << k_ble_api_type_names[api] << " BLE API";
			}
			else
			{
				VSL_LOG_ERROR("BluetoothLEDeviceManager::startup") << "Failed to initialize " << k_ble_api_type_names[api] << " BLE API";
				bSuccess = false;
			}
		}

		return bSuccess;
	}

	void shutdown()
	{
		for (int api = 0; api < _BLEApiType_COUNT; ++api)
		{
			m_ble_apis[api]->shutdown();
		}
	}

	// -- accessors ----
	inline IBluetoothLEApi *getBLEApi(eBluetoothLEApiType apiType) const
	{
		return Utility::is_index_valid(apiType, _BLEApiType_COUNT) ? m_ble_apis[apiType] : nullptr;
	}

private:
	IBluetoothLEApi **m_ble_apis;
};

//-- public interface -----
BluetoothLEDeviceManager::BluetoothLEDeviceManager(const BluetoothLEManagerConfig &config)
	: m_cfg(config)
	, m_implementation_ptr(new BluetoothLEDeviceManagerImpl())
	, m_bIsStarted(false)
{
}

BluetoothLEDeviceManager::~BluetoothLEDeviceManager()
{
	if (m_bIsStarted)
	{
		VSL_LOG_ERROR("~BluetoothLEDeviceManager()") << "BLE device manager deleted without shutdown() getting called first";
		shutdown();
	}

	if (m_implementation_ptr != nullptr)
	{
		delete m_implementation_ptr;
		m_implementation_ptr = nullptr;
	}
}

IBluetoothLEApi *BluetoothLEDeviceManager::getBLEApiInterface(eBluetoothLEApiType api) const
{
	return m_implementation_ptr->getBLEApi(api);
}

IBluetoothLEApi *BluetoothLEDeviceManager::getActiveBLEApiInterface() const
{
	return m_implementation_ptr->getBLEApi(m_cfg.active_api_type);
}

bool BluetoothLEDeviceManager::startup()
{
	m_bIsStarted = m_implementation_ptr->startup(m_cfg);

	return m_bIsStarted;
}

void BluetoothLEDeviceManager::shutdown()
{
	m_implementation_ptr->shutdown();
	m_bIsStarted = false;
}

const char *ble_api_type_to_string(eBluetoothLEApiType api_type)
{
	return Utility::is_index_valid(api_type, _BLEApiType_COUNT) ? k_ble_api_type_names[api_type] : "INVALID";
}

eBluetoothLEApiType ble_api_type_from_string(const std::string &api_type_string)
{
	for (int api = 0; api < _BLEApiType_COUNT; ++api)
	{
		if (api_type_string == k_ble_api_type_names[api])
			return static_cast<eBluetoothLEApiType>(api);
	}

	return _BLEApiType_INVALID;
}
