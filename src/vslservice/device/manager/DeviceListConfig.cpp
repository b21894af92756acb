//-- includes -----
#include "DeviceListConfig.h"
#include "Logger.h"

// -- DeviceListConfig ----
const int DeviceListConfig::CONFIG_VERSION = 1;

DeviceListConfig::DeviceListConfig(const std::string &fnamebase)
	: VSLConfig(fnamebase)
	, version(CONFIG_VERSION)
	, devices()
{
}

const configuru::Config
DeviceListConfig::writeToJSON()
{
	configuru::Config device_list = configuru::Config::array();

	for (const RegisteredDevice &device : devices)
	{
		configuru::Config device_pt{
			{"device_id", device.identity.deviceId},
			{"friendly_name", device.metadata.friendlyName},
			{"device_type", device_type_to_string(device.metadata.deviceType)},
			{"manufacturer_name", device.deviceInformation.manufacturerName},
			{"model_number", device.deviceInformation.modelNumber}
		};

		device_list.push_back(device_pt);
	}

	configuru::Config pt{
		{"version", DeviceListConfig::CONFIG_VERSION},
		{"devices", device_list}
	};

	return pt;
}

void
DeviceListConfig::readFromJSON(const configuru::Config &pt)
{
	version = pt.get_or<int>("version", 0);

	if (version != DeviceListConfig::CONFIG_VERSION)
	{
		VSL_LOG_WARNING("DeviceListConfig") <<
			"Config version " << version << " does not match expected version " <<
			DeviceListConfig::CONFIG_VERSION << ", Using defaults.";
		return;
	}

	devices.clear();

	if (!pt.has_key("devices") || !pt["devices"].is_array())
		return;

	for (const configuru::Config &device_pt : pt["devices"].as_array())
	{
		RegisteredDevice device;

		device.identity.deviceId = device_pt.get_or<std::string>("device_id", "");
		device.metadata.friendlyName = device_pt.get_or<std::string>("friendly_name", "");
		device.identity.friendlyName = device.metadata.friendlyName;
		device.metadata.deviceType = device_type_from_string(device_pt.get_or<std::string>("device_type", ""));
		device.deviceInformation.manufacturerName =
			device_pt.get_or<std::string>("manufacturer_name", device.deviceInformation.manufacturerName);
		device.deviceInformation.modelNumber =
			device_pt.get_or<std::string>("model_number", device.deviceInformation.modelNumber);

		if (device.identity.deviceId.empty() || device.metadata.deviceType == DeviceType_INVALID)
		{
			VSL_LOG_WARNING("DeviceListConfig") << "Skipping malformed device entry '" << device.identity.deviceId << "'";
			continue;
		}

		devices.push_back(device);
	}
}
