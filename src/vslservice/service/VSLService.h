#ifndef VSL_SERVICE_H
#define VSL_SERVICE_H

//-- includes -----
#include "ClientConstants.h"
#include "AcquisitionConfig.h"
#include "AcquisitionOrchestrator.h"
#include "BluetoothLEDeviceManager.h"
#include "DeviceRegistry.h"
#include "Logger.h"

#include <mutex>
#include <string>
#include <vector>

//-- definitions -----
/// Everything startup() needs. The default settings read and write ~/VSLSERVICE.
struct VSLServiceSettings
{
	VSLLogSeverityLevel logLevel;
	// Empty disables the log file
	std::string logFilename;
	// Loads (and writes back) the config files and persists the device list
	bool bUseConfigFiles;

	AcquisitionConfig acquisitionConfig;
	BluetoothLEManagerConfig bleManagerConfig;

	VSLServiceSettings();
};

class VSLService
{
public:
	VSLService();
	virtual ~VSLService();

	bool startup(VSLLogSeverityLevel log_level);
	bool startup(const VSLServiceSettings &settings);
	void shutdown();

	inline bool getIsInitialized() const { return m_isInitialized; }
	inline BluetoothLEDeviceManager *getBLEDeviceManager() const { return m_ble_device_manager; }
	inline DeviceRegistry *getDeviceRegistry() const { return m_device_registry; }
	inline AcquisitionOrchestrator *getOrchestrator() const { return m_orchestrator; }
	static const char *getVersionString();

	// -- Acquisition ----
	// Blocks the calling thread until a reading, a failure or a cancel
	AcquisitionResult acquireReading(eDeviceType device_type, const DeviceIdentity &identity);
	void cancelAcquisition(const std::string &device_id);

	// Tags human entered values as manual-fallback and checks them.
	// Returns false (with a reason) when the values break an invariant.
	// Needs no live transport.
	static bool makeManualReading(const DecodedReading &entered_values, DecodedReading &out_reading, std::string &out_reason);

	// -- Device Management ----
	bool registerDevice(const DeviceIdentity &identity, const DeviceMetadata &metadata);
	std::vector<RegisteredDevice> listDevices() const;
	bool removeDevice(const std::string &device_id);

private:
	void loadDeviceList();
	void saveDeviceList();

	// Manages all BluetoothLE transports
	BluetoothLEDeviceManager *m_ble_device_manager;

	ServiceProfileCatalog *m_profile_catalog;

	// Live sessions and registered devices
	DeviceRegistry *m_device_registry;

	AcquisitionOrchestrator *m_orchestrator;

	std::mutex m_deviceListMutex;
	bool m_bPersistDeviceList;
	bool m_isInitialized;
};

#endif // VSL_SERVICE_H
