//-- includes -----
#include "ReplayBluetoothLEApiConfig.h"
#include "BluetoothLEServiceIDs.h"
#include "Logger.h"

// -- ReplayCharacteristicScript ----
ReplayCharacteristicScript::ReplayCharacteristicScript()
	: uuid()
	, bReadable(false)
	, bNotifiable(false)
	, bIndicatable(false)
	, value()
	, fragments()
{
}

// -- ReplayDeviceScript ----
ReplayDeviceScript::ReplayDeviceScript()
	: identity()
	, advertisedServices()
	, services()
	, connectFailuresBeforeSuccess(0)
	, dropLinkAfterFragments(-1)
{
}

void ReplayDeviceScript::addDeviceInformation(const std::string &manufacturer, const std::string &model)
{
	ReplayServiceScript service;
	service.uuid = *k_Service_DeviceInformation_UUID;

	ReplayCharacteristicScript manufacturer_characteristic;
	manufacturer_characteristic.uuid = *k_Characteristic_ManufacturerNameString_UUID;
	manufacturer_characteristic.bReadable = true;
	manufacturer_characteristic.value.assign(manufacturer.begin(), manufacturer.end());
	service.characteristics.push_back(manufacturer_characteristic);

	ReplayCharacteristicScript model_characteristic;
	model_characteristic.uuid = *k_Characteristic_ModelNumberString_UUID;
	model_characteristic.bReadable = true;
	model_characteristic.value.assign(model.begin(), model.end());
	service.characteristics.push_back(model_characteristic);

	services.push_back(service);
}

void ReplayDeviceScript::addNotifyingCharacteristic(
	const BluetoothUUID &service_uuid,
	const BluetoothUUID &characteristic_uuid,
	const std::vector<ReplayFragment> &fragments)
{
	ReplayCharacteristicScript characteristic;
	characteristic.uuid = characteristic_uuid;
	characteristic.bNotifiable = true;
	characteristic.fragments = fragments;

	for (ReplayServiceScript &service : services)
	{
		if (service.uuid == service_uuid)
		{
			service.characteristics.push_back(characteristic);
			return;
		}
	}

	ReplayServiceScript service;
	service.uuid = service_uuid;
	service.characteristics.push_back(characteristic);
	services.push_back(service);
}

// -- ReplayBluetoothLEApiConfig ----
const int ReplayBluetoothLEApiConfig::CONFIG_VERSION = 1;

ReplayBluetoothLEApiConfig::ReplayBluetoothLEApiConfig(const std::string &fnamebase)
	: VSLConfig(fnamebase)
	, version(CONFIG_VERSION)
	, devices()
{
}

const configuru::Config
ReplayBluetoothLEApiConfig::writeToJSON()
{
	configuru::Config device_list = configuru::Config::array();

	for (const ReplayDeviceScript &device : devices)
	{
		configuru::Config advertised = configuru::Config::array();
		for (const BluetoothUUID &uuid : device.advertisedServices.toVector())
		{
			advertised.push_back(uuid.getUUIDString());
		}

		configuru::Config service_list = configuru::Config::array();
		for (const ReplayServiceScript &service : device.services)
		{
			configuru::Config characteristic_list = configuru::Config::array();

			for (const ReplayCharacteristicScript &characteristic : service.characteristics)
			{
				configuru::Config fragment_list = configuru::Config::array();
				for (const ReplayFragment &fragment : characteristic.fragments)
				{
					configuru::Config fragment_pt{
						{"delay_ms", fragment.delayMs}
					};
					writeHexBytes(fragment_pt, "bytes", fragment.bytes);
					fragment_list.push_back(fragment_pt);
				}

				configuru::Config characteristic_pt{
					{"uuid", characteristic.uuid.getUUIDString()},
					{"readable", characteristic.bReadable},
					{"notifiable", characteristic.bNotifiable},
					{"indicatable", characteristic.bIndicatable}
				};
				writeHexBytes(characteristic_pt, "value", characteristic.value);
				characteristic_pt["fragments"] = fragment_list;
				characteristic_list.push_back(characteristic_pt);
			}

			configuru::Config service_pt{
				{"uuid", service.uuid.getUUIDString()}
			};
			service_pt["characteristics"] = characteristic_list;
			service_list.push_back(service_pt);
		}

		configuru::Config device_pt{
			{"device_id", device.identity.deviceId},
			{"friendly_name", device.identity.friendlyName},
			{"connect_failures_before_success", device.connectFailuresBeforeSuccess},
			{"drop_link_after_fragments", device.dropLinkAfterFragments}
		};
		device_pt["advertised_services"] = advertised;
		device_pt["services"] = service_list;
		device_list.push_back(device_pt);
	}

	configuru::Config pt{
		{"version", ReplayBluetoothLEApiConfig::CONFIG_VERSION}
	};
	pt["devices"] = device_list;

	return pt;
}

void
ReplayBluetoothLEApiConfig::readFromJSON(const configuru::Config &pt)
{
	version = pt.get_or<int>("version", 0);

	if (version != ReplayBluetoothLEApiConfig::CONFIG_VERSION)
	{
		VSL_LOG_WARNING("ReplayBluetoothLEApiConfig") <<
			"Config version " << version << " does not match expected version " <<
			ReplayBluetoothLEApiConfig::CONFIG_VERSION << ", Using defaults.";
		return;
	}

	if (!pt.has_key("devices") || !pt["devices"].is_array())
		return;

	devices.clear();

	for (const configuru::Config &device_pt : pt["devices"].as_array())
	{
		ReplayDeviceScript device;
		device.identity.deviceId = device_pt.get_or<std::string>("device_id", "");
		device.identity.friendlyName = device_pt.get_or<std::string>("friendly_name", "");
		device.connectFailuresBeforeSuccess = device_pt.get_or<int>("connect_failures_before_success", 0);
		device.dropLinkAfterFragments = device_pt.get_or<int>("drop_link_after_fragments", -1);

		if (device.identity.deviceId.empty())
		{
			VSL_LOG_WARNING("ReplayBluetoothLEApiConfig") << "Skipping scripted device without a device_id";
			continue;
		}

		if (device_pt.has_key("advertised_services") && device_pt["advertised_services"].is_array())
		{
			for (const configuru::Config &uuid_pt : device_pt["advertised_services"].as_array())
			{
				device.advertisedServices.addUUID(BluetoothUUID(uuid_pt.as_string()));
			}
		}

		if (device_pt.has_key("services") && device_pt["services"].is_array())
		{
			for (const configuru::Config &service_pt : device_pt["services"].as_array())
			{
				ReplayServiceScript service;
				service.uuid = BluetoothUUID(service_pt.get_or<std::string>("uuid", ""));

				if (service_pt.has_key("characteristics") && service_pt["characteristics"].is_array())
				{
					for (const configuru::Config &characteristic_pt : service_pt["characteristics"].as_array())
					{
						ReplayCharacteristicScript characteristic;
						characteristic.uuid = BluetoothUUID(characteristic_pt.get_or<std::string>("uuid", ""));
						characteristic.bReadable = characteristic_pt.get_or<bool>("readable", false);
						characteristic.bNotifiable = characteristic_pt.get_or<bool>("notifiable", false);
						characteristic.bIndicatable = characteristic_pt.get_or<bool>("indicatable", false);
						readHexBytes(characteristic_pt, "value", characteristic.value);

						if (characteristic_pt.has_key("fragments") && characteristic_pt["fragments"].is_array())
						{
							for (const configuru::Config &fragment_pt : characteristic_pt["fragments"].as_array())
							{
								ReplayFragment fragment;
								fragment.delayMs = fragment_pt.get_or<int>("delay_ms", 0);

								if (readHexBytes(fragment_pt, "bytes", fragment.bytes))
								{
									characteristic.fragments.push_back(fragment);
								}
							}
						}

						if (characteristic.uuid.isValid())
						{
							service.characteristics.push_back(characteristic);
						}
					}
				}

				if (service.uuid.isValid())
				{
					device.services.push_back(service);
				}
			}
		}

		devices.push_back(device);
	}
}
