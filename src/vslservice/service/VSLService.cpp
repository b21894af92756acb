//-- includes -----
#include "VSLService.h"
#include "DeviceListConfig.h"
#include "ReadingValidator.h"
#include "ServiceProfile.h"
#include "ServiceVersion.h"
#include "Logger.h"

//-- constants -----
static const char *k_manual_entry_strategy_name = "ManualEntry";

// -- VSLServiceSettings ----
VSLServiceSettings::VSLServiceSettings()
	: logLevel(VSLLogSeverityLevel_info)
	, logFilename("VSLSERVICE.log")
	, bUseConfigFiles(true)
	, acquisitionConfig()
	, bleManagerConfig()
{
}

//-- definitions -----
VSLService::VSLService()
	: m_ble_device_manager(nullptr)
	, m_profile_catalog(new ServiceProfileCatalog)
	, m_device_registry(new DeviceRegistry)
	, m_orchestrator(nullptr)
	, m_bPersistDeviceList(false)
	, m_isInitialized(false)
{
	m_profile_catalog->registerBuiltInProfiles();
}

VSLService::~VSLService()
{
	if (m_isInitialized)
	{
		shutdown();
	}

	delete m_device_registry;
	delete m_profile_catalog;
}

const char *VSLService::getVersionString()
{
	return VSL_SERVICE_VERSION_STRING;
}

bool VSLService::startup(VSLLogSeverityLevel log_level)
{
	VSLServiceSettings settings;
	settings.logLevel= log_level;

	return startup(settings);
}

bool VSLService::startup(const VSLServiceSettings &settings)
{
	bool success= true;

	if (m_isInitialized)
	{
		VSL_LOG_WARNING("VSLService::startup") << "Already started";
		return true;
	}

	// initialize logging system
	log_init(settings.logLevel, settings.logFilename);

	// Start the service app
	VSL_LOG_INFO("main") << "Starting VSLService v" << VSL_SERVICE_VERSION_STRING;

	AcquisitionConfig acquisition_config= settings.acquisitionConfig;
	BluetoothLEManagerConfig ble_manager_config= settings.bleManagerConfig;

	if (settings.bUseConfigFiles)
	{
		acquisition_config.load();
		ble_manager_config.load();

		// Save the configs back out in case they don't exist
		acquisition_config.save();
		ble_manager_config.save();
	}

	/** Setup the bluetooth LE subsystem first */
	m_ble_device_manager= new BluetoothLEDeviceManager(ble_manager_config);
	if (!m_ble_device_manager->startup())
	{
		VSL_LOG_FATAL("VSLService") << "Failed to initialize the BluetoothLE manager";
		success= false;
	}

	IBluetoothLEApi *ble_api= m_ble_device_manager->getActiveBLEApiInterface();
	if (success && ble_api == nullptr)
	{
		VSL_LOG_FATAL("VSLService") << "No BluetoothLE transport available for "
			<< ble_api_type_to_string(ble_manager_config.active_api_type);
		success= false;
	}

	/** Setup the acquisition pipeline */
	if (success)
	{
		m_orchestrator= new AcquisitionOrchestrator(ble_api, m_device_registry, m_profile_catalog, acquisition_config);
		m_orchestrator->registerDefaultStrategies();

		m_bPersistDeviceList= settings.bUseConfigFiles;
		loadDeviceList();
	}

	if (success)
	{
		m_isInitialized= true;
	}
	else
	{
		m_ble_device_manager->shutdown();
		delete m_ble_device_manager;
		m_ble_device_manager= nullptr;
		log_dispose();
	}

	return success;
}

void VSLService::shutdown()
{
	if (!m_isInitialized)
		return;

	VSL_LOG_INFO("main") << "Shutting down VSLService";

	// Cancels anything still in flight
	delete m_orchestrator;
	m_orchestrator= nullptr;

	// Sessions hold links, so they go before the transports
	m_device_registry->closeAllSessions();

	m_ble_device_manager->shutdown();
	delete m_ble_device_manager;
	m_ble_device_manager= nullptr;

	m_isInitialized= false;

	log_dispose();
}

// -- Acquisition ----
AcquisitionResult VSLService::acquireReading(eDeviceType device_type, const DeviceIdentity &identity)
{
	if (!m_isInitialized)
	{
		VSL_LOG_ERROR("VSLService::acquireReading") << "Service not started";

		AcquisitionResult result;
		result.status= AcquisitionStatus_DiscoveryFailed;
		result.deviceId= identity.deviceId;
		return result;
	}

	AcquisitionResult result= m_orchestrator->acquireReading(device_type, identity);

	// Keep the persisted manufacturer/model current
	if (result.status == AcquisitionStatus_Success)
	{
		RegisteredDevice device;

		if (m_device_registry->findDevice(result.deviceId, device))
		{
			saveDeviceList();
		}
	}

	return result;
}

void VSLService::cancelAcquisition(const std::string &device_id)
{
	if (m_isInitialized)
	{
		m_orchestrator->cancelAcquisition(device_id);
	}
}

bool VSLService::makeManualReading(
	const DecodedReading &entered_values,
	DecodedReading &out_reading,
	std::string &out_reason)
{
	out_reading= entered_values;
	out_reading.confidence= ReadingConfidence_ManualFallback;
	out_reading.strategyName= k_manual_entry_strategy_name;
	out_reading.timestamp= std::chrono::system_clock::now();

	const ReadingValidator validator;

	if (validator.validate(out_reading, out_reason) != ValidationResult_Accepted)
	{
		VSL_LOG_WARNING("VSLService::makeManualReading") << "Rejected manual entry: " << out_reason;
		return false;
	}

	VSL_LOG_INFO("VSLService::makeManualReading") << "Accepted manual " << device_type_to_string(out_reading.kind) << " reading";
	return true;
}

// -- Device Management ----
bool VSLService::registerDevice(const DeviceIdentity &identity, const DeviceMetadata &metadata)
{
	if (!m_device_registry->registerDevice(identity, metadata))
		return false;

	saveDeviceList();
	return true;
}

std::vector<RegisteredDevice> VSLService::listDevices() const
{
	return m_device_registry->listDevices();
}

bool VSLService::removeDevice(const std::string &device_id)
{
	// Don't yank the link out from under a running acquisition
	if (m_orchestrator != nullptr)
	{
		m_orchestrator->cancelAcquisition(device_id);
	}

	if (!m_device_registry->removeDevice(device_id))
		return false;

	saveDeviceList();
	return true;
}

void VSLService::loadDeviceList()
{
	if (!m_bPersistDeviceList)
		return;

	std::lock_guard<std::mutex> lock(m_deviceListMutex);
	DeviceListConfig device_list;

	if (!device_list.load())
		return;

	for (const RegisteredDevice &device : device_list.devices)
	{
		if (m_device_registry->registerDevice(device.identity, device.metadata))
		{
			m_device_registry->updateDeviceInformation(device.identity.deviceId, device.deviceInformation);
		}
	}

	VSL_LOG_INFO("VSLService::loadDeviceList") << "Restored " << device_list.devices.size() << " registered devices";
}

void VSLService::saveDeviceList()
{
	if (!m_bPersistDeviceList)
		return;

	std::lock_guard<std::mutex> lock(m_deviceListMutex);
	DeviceListConfig device_list;

	device_list.devices= m_device_registry->listDevices();

	if (!device_list.save())
	{
		VSL_LOG_ERROR("VSLService::saveDeviceList") << "Failed to persist the device list";
	}
}
