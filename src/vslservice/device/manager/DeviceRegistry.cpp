//-- includes -----
#include "DeviceRegistry.h"
#include "Logger.h"

#include <algorithm>

// -- DeviceRegistry ----
DeviceRegistry::DeviceRegistry()
{
}

DeviceRegistry::~DeviceRegistry()
{
	closeAllSessions();
}

// -- Session Table ----
void DeviceRegistry::add(const std::string &device_id, ConnectionSessionPtr session)
{
	if (!session)
		return;

	const ConnectionSession *raw_session = session.get();
	session->setDisconnectHandler(
		[this, raw_session](const std::string &disconnected_id)
	{
		removeIfCurrent(disconnected_id, raw_session);
	});

	ConnectionSessionPtr replaced_session;
	{
		std::lock_guard<std::mutex> lock(m_registryMutex);

		t_session_map::iterator it = m_sessions.find(device_id);
		if (it != m_sessions.end())
		{
			replaced_session = it->second;
			it->second = session;
		}
		else
		{
			m_sessions.insert(std::make_pair(device_id, session));
		}
	}

	// Sessions are never closed while holding the registry lock
	if (replaced_session && replaced_session != session)
	{
		VSL_LOG_WARNING("DeviceRegistry::add") << "Replacing existing session for " << device_id;
		replaced_session->setDisconnectHandler(ConnectionSession::DisconnectHandler());
		replaced_session->close();
	}

	VSL_LOG_DEBUG("DeviceRegistry::add") << "Session added for " << device_id;
}

ConnectionSessionPtr DeviceRegistry::get(const std::string &device_id) const
{
	std::lock_guard<std::mutex> lock(m_registryMutex);
	t_session_map::const_iterator it = m_sessions.find(device_id);

	return (it != m_sessions.end()) ? it->second : ConnectionSessionPtr();
}

ConnectionSessionPtr DeviceRegistry::remove(const std::string &device_id)
{
	ConnectionSessionPtr session;

	{
		std::lock_guard<std::mutex> lock(m_registryMutex);
		t_session_map::iterator it = m_sessions.find(device_id);

		if (it != m_sessions.end())
		{
			session = it->second;
			m_sessions.erase(it);
		}
	}

	if (session)
	{
		session->setDisconnectHandler(ConnectionSession::DisconnectHandler());
		VSL_LOG_DEBUG("DeviceRegistry::remove") << "Session removed for " << device_id;
	}

	return session;
}

size_t DeviceRegistry::getSessionCount() const
{
	std::lock_guard<std::mutex> lock(m_registryMutex);
	return m_sessions.size();
}

void DeviceRegistry::closeAllSessions()
{
	t_session_map sessions;
	{
		std::lock_guard<std::mutex> lock(m_registryMutex);
		sessions.swap(m_sessions);
	}

	for (auto it = sessions.begin(); it != sessions.end(); ++it)
	{
		it->second->setDisconnectHandler(ConnectionSession::DisconnectHandler());
		it->second->close();
	}
}

void DeviceRegistry::removeIfCurrent(const std::string &device_id, const ConnectionSession *session)
{
	ConnectionSessionPtr removed_session;

	{
		std::lock_guard<std::mutex> lock(m_registryMutex);
		t_session_map::iterator it = m_sessions.find(device_id);

		if (it != m_sessions.end() && it->second.get() == session)
		{
			removed_session = it->second;
			m_sessions.erase(it);
		}
	}

	if (removed_session)
	{
		removed_session->setDisconnectHandler(ConnectionSession::DisconnectHandler());
		VSL_LOG_INFO("DeviceRegistry::removeIfCurrent") << "Dropped disconnected session for " << device_id;
	}
}

// -- Management Table ----
bool DeviceRegistry::registerDevice(const DeviceIdentity &identity, const DeviceMetadata &metadata)
{
	if (identity.deviceId.empty())
	{
		VSL_LOG_ERROR("DeviceRegistry::registerDevice") << "Can't register a device without an id";
		return false;
	}

	std::lock_guard<std::mutex> lock(m_registryMutex);

	t_device_map::iterator it = m_devices.find(identity.deviceId);
	if (it != m_devices.end())
	{
		it->second.identity = identity;
		it->second.metadata = metadata;
		VSL_LOG_INFO("DeviceRegistry::registerDevice") << "Updated device " << identity.deviceId;
	}
	else
	{
		RegisteredDevice device;
		device.identity = identity;
		device.metadata = metadata;

		m_devices.insert(std::make_pair(identity.deviceId, device));
		m_deviceOrder.push_back(identity.deviceId);
		VSL_LOG_INFO("DeviceRegistry::registerDevice")
			<< "Registered " << device_type_to_string(metadata.deviceType)
			<< " device " << identity.deviceId << " (" << metadata.friendlyName << ")";
	}

	return true;
}

std::vector<RegisteredDevice> DeviceRegistry::listDevices() const
{
	std::lock_guard<std::mutex> lock(m_registryMutex);
	std::vector<RegisteredDevice> result;

	for (const std::string &device_id : m_deviceOrder)
	{
		t_device_map::const_iterator it = m_devices.find(device_id);

		if (it != m_devices.end())
		{
			result.push_back(it->second);
		}
	}

	return result;
}

bool DeviceRegistry::findDevice(const std::string &device_id, RegisteredDevice &out_device) const
{
	std::lock_guard<std::mutex> lock(m_registryMutex);
	t_device_map::const_iterator it = m_devices.find(device_id);

	if (it == m_devices.end())
		return false;

	out_device = it->second;
	return true;
}

bool DeviceRegistry::removeDevice(const std::string &device_id)
{
	bool bRemoved = false;

	{
		std::lock_guard<std::mutex> lock(m_registryMutex);

		if (m_devices.erase(device_id) > 0)
		{
			m_deviceOrder.erase(
				std::remove(m_deviceOrder.begin(), m_deviceOrder.end(), device_id),
				m_deviceOrder.end());
			bRemoved = true;
		}
	}

	ConnectionSessionPtr session = remove(device_id);
	if (session)
	{
		session->close();
	}

	if (bRemoved)
	{
		VSL_LOG_INFO("DeviceRegistry::removeDevice") << "Removed device " << device_id;
	}

	return bRemoved;
}

void DeviceRegistry::updateDeviceInformation(const std::string &device_id, const DeviceInformation &info)
{
	std::lock_guard<std::mutex> lock(m_registryMutex);
	t_device_map::iterator it = m_devices.find(device_id);

	if (it != m_devices.end())
	{
		it->second.deviceInformation = info;
	}
}

// -- Exclusivity ----
std::shared_ptr<std::mutex> DeviceRegistry::getAcquisitionMutex(const std::string &device_id)
{
	std::lock_guard<std::mutex> lock(m_registryMutex);
	t_mutex_map::iterator it = m_acquisitionMutexes.find(device_id);

	if (it != m_acquisitionMutexes.end())
		return it->second;

	std::shared_ptr<std::mutex> acquisition_mutex(new std::mutex);
	m_acquisitionMutexes.insert(std::make_pair(device_id, acquisition_mutex));

	return acquisition_mutex;
}

void DeviceRegistry::releaseAcquisitionMutex(const std::string &device_id)
{
	std::lock_guard<std::mutex> lock(m_registryMutex);
	t_mutex_map::iterator it = m_acquisitionMutexes.find(device_id);

	// Only the table still holds it
	if (it != m_acquisitionMutexes.end() && it->second.use_count() == 1)
	{
		m_acquisitionMutexes.erase(it);
	}
}

size_t DeviceRegistry::getAcquisitionMutexCount() const
{
	std::lock_guard<std::mutex> lock(m_registryMutex);
	return m_acquisitionMutexes.size();
}
