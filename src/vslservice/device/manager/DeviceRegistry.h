#ifndef DEVICE_REGISTRY_H
#define DEVICE_REGISTRY_H

//-- includes -----
#include "ConnectionSession.h"
#include "ReadingTypes.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

//-- definitions -----
/// Supplied by the management UI when a device is registered
struct DeviceMetadata
{
	std::string friendlyName;
	eDeviceType deviceType;

	DeviceMetadata() : friendlyName(), deviceType(DeviceType_INVALID) {}
	DeviceMetadata(const std::string &name, eDeviceType type) : friendlyName(name), deviceType(type) {}
};

struct RegisteredDevice
{
	DeviceIdentity identity;
	DeviceMetadata metadata;
	DeviceInformation deviceInformation;
};

/// Live sessions plus the list of devices the user has registered.
/// Constructed by the owner and handed to whoever needs it.
class DeviceRegistry
{
public:
	DeviceRegistry();
	virtual ~DeviceRegistry();

	// -- Session Table ----
	// Installs a disconnect handler that drops the session from the table
	// once the link goes away on its own. Replaces (and closes) any prior session.
	void add(const std::string &device_id, ConnectionSessionPtr session);
	ConnectionSessionPtr get(const std::string &device_id) const;
	// Forgets the session without closing it
	ConnectionSessionPtr remove(const std::string &device_id);
	size_t getSessionCount() const;
	void closeAllSessions();

	// -- Management Table ----
	bool registerDevice(const DeviceIdentity &identity, const DeviceMetadata &metadata);
	std::vector<RegisteredDevice> listDevices() const;
	bool findDevice(const std::string &device_id, RegisteredDevice &out_device) const;
	// Also closes any live session for the device
	bool removeDevice(const std::string &device_id);
	void updateDeviceInformation(const std::string &device_id, const DeviceInformation &info);

	// -- Exclusivity ----
	// Serializes acquisitions for one device. Created on first use.
	std::shared_ptr<std::mutex> getAcquisitionMutex(const std::string &device_id);
	// Call after dropping the pointer. The entry goes once no acquisition refers to it.
	void releaseAcquisitionMutex(const std::string &device_id);
	size_t getAcquisitionMutexCount() const;

private:
	void removeIfCurrent(const std::string &device_id, const ConnectionSession *session);

	typedef std::map<std::string, ConnectionSessionPtr> t_session_map;
	typedef std::map<std::string, RegisteredDevice> t_device_map;
	typedef std::map<std::string, std::shared_ptr<std::mutex> > t_mutex_map;

	mutable std::mutex m_registryMutex;
	t_session_map m_sessions;
	t_device_map m_devices;
	std::vector<std::string> m_deviceOrder;
	t_mutex_map m_acquisitionMutexes;
};

#endif // DEVICE_REGISTRY_H
