//-- includes -----
#include "ConnectionSession.h"
#include "BluetoothLEServiceIDs.h"
#include "Logger.h"

#include <chrono>
#include <set>

//-- constants -----
static const char *k_unknown_device_info = "Unknown";

// -- DeviceInformation ----
DeviceInformation::DeviceInformation()
	: manufacturerName(k_unknown_device_info)
	, modelNumber(k_unknown_device_info)
{
}

// -- ConnectionSession ----
std::shared_ptr<ConnectionSession> ConnectionSession::create(IBluetoothLEApi *api, const DeviceIdentity &identity)
{
	return std::shared_ptr<ConnectionSession>(new ConnectionSession(api, identity));
}

ConnectionSession::ConnectionSession(IBluetoothLEApi *api, const DeviceIdentity &identity)
	: m_api(api)
	, m_state(SessionState_Idle)
	, m_identity(identity)
	, m_deviceInformation()
	, m_resolvedProfile()
	, m_activeCharacteristicUuid()
	, m_disconnectHandler()
	, m_deviceState(nullptr)
	, m_activeCharacteristic(nullptr)
	, m_changeEventHandle(k_invalid_ble_gatt_event_handle)
	, m_disconnectEventHandle(k_invalid_ble_gatt_event_handle)
	, m_linkGeneration(0)
	, m_listener(nullptr)
	, m_bProbeDataReceived(false)
	, m_bAbortRequested(false)
	, m_bLinkLost(false)
{
}

ConnectionSession::~ConnectionSession()
{
	close();
}

eSessionError ConnectionSession::discover(const ServiceProfileList &profiles)
{
	if (!setState(SessionState_Discovering))
		return SessionError_InvalidState;

	const DeviceIdentity requested_identity = getDeviceIdentity();
	DeviceIdentity found_identity;

	BluetoothLEDeviceRequest scoped_request;
	scoped_request.deviceId = requested_identity.deviceId;
	for (const ServiceProfilePtr &profile : profiles)
	{
		scoped_request.filterServices.addUUID(profile->serviceUuid);
	}

	bool bFound = false;
	if (!scoped_request.filterServices.isEmpty())
	{
		bFound = m_api->requestDevice(scoped_request, found_identity);
	}

	if (!bFound)
	{
		// Plenty of cuffs never advertise their measurement service
		VSL_LOG_INFO("ConnectionSession::discover")
			<< "No device advertising a known profile service, retrying without a service filter";

		BluetoothLEDeviceRequest open_request;
		open_request.deviceId = requested_identity.deviceId;
		open_request.acceptAllDevices = true;
		open_request.optionalServices = scoped_request.filterServices;
		open_request.optionalServices.addUUID(*k_Service_DeviceInformation_UUID);
		open_request.optionalServices.addUUID(*k_Service_GenericAccess_UUID);
		open_request.optionalServices.addUUID(*k_Service_GenericAttribute_UUID);

		bFound = m_api->requestDevice(open_request, found_identity);
	}

	if (!bFound)
	{
		VSL_LOG_ERROR("ConnectionSession::discover") << "Discovery failed for device '" << requested_identity.deviceId << "'";
		return SessionError_DiscoveryFailed;
	}

	{
		std::lock_guard<std::mutex> lock(m_stateMutex);

		if (m_identity.deviceId.empty())
		{
			m_identity.deviceId = found_identity.deviceId;
		}
		if (!found_identity.friendlyName.empty())
		{
			m_identity.friendlyName = found_identity.friendlyName;
		}
	}

	VSL_LOG_INFO("ConnectionSession::discover")
		<< "Discovered " << found_identity.friendlyName << " (" << found_identity.deviceId << ")";

	return SessionError_None;
}

eSessionError ConnectionSession::establishLink()
{
	std::lock_guard<std::mutex> link_lock(m_linkMutex);

	if (getState() != SessionState_Discovering)
	{
		VSL_LOG_ERROR("ConnectionSession::establishLink")
			<< "Can't establish a link from state " << stateToString(getState());
		return SessionError_InvalidState;
	}

	if (m_deviceState != nullptr)
	{
		releaseLink();
	}

	const DeviceIdentity identity = getDeviceIdentity();

	m_deviceState = m_api->openBluetoothLEDevice(identity);
	if (m_deviceState == nullptr)
	{
		VSL_LOG_ERROR("ConnectionSession::establishLink") << "Failed to open link to " << identity.deviceId;
		return SessionError_LinkFailed;
	}

	const int link_generation = m_linkGeneration;
	std::weak_ptr<ConnectionSession> weak_self = shared_from_this();
	m_disconnectEventHandle =
		m_api->registerDisconnectEvent(
			m_deviceState,
			[weak_self, link_generation](const std::string &device_id)
	{
		std::shared_ptr<ConnectionSession> self = weak_self.lock();

		if (self)
		{
			self->onLinkDisconnected(link_generation);
		}
	});

	m_bLinkLost = false;
	readDeviceInformation();
	setState(SessionState_LinkEstablished);

	return SessionError_None;
}

eSessionError ConnectionSession::reconnect()
{
	{
		std::lock_guard<std::mutex> link_lock(m_linkMutex);
		const eSessionState state = getState();

		if (state == SessionState_Idle || state == SessionState_Closed)
		{
			VSL_LOG_ERROR("ConnectionSession::reconnect") << "Can't reconnect from state " << stateToString(state);
			return SessionError_InvalidState;
		}

		VSL_LOG_WARNING("ConnectionSession::reconnect") << "Reconnecting to " << getDeviceIdentity().deviceId;

		releaseLink();
		setListener(nullptr);

		if (state == SessionState_ResolvingProfile || state == SessionState_StreamingNotifications)
		{
			setState(SessionState_LinkEstablished);
		}

		{
			std::lock_guard<std::mutex> lock(m_stateMutex);
			m_resolvedProfile.reset();
		}

		setState(SessionState_Discovering);
	}

	return establishLink();
}

eSessionError ConnectionSession::resolveProfile(
	const ServiceProfileList &profiles,
	ISessionListener *listener,
	int probe_timeout_ms)
{
	std::lock_guard<std::mutex> link_lock(m_linkMutex);

	if (m_deviceState == nullptr || !setState(SessionState_ResolvingProfile))
		return SessionError_InvalidState;

	BLEGattProfile *gatt_profile = nullptr;
	if (!m_api->getBluetoothLEGattProfile(m_deviceState, &gatt_profile) || gatt_profile == nullptr)
	{
		VSL_LOG_ERROR("ConnectionSession::resolveProfile") << "Link has no GATT profile";
		setState(SessionState_LinkEstablished);
		return SessionError_LinkFailed;
	}

	setListener(listener);

	std::set<BLEGattCharacteristic *> tried_characteristics;

	// Primary profile characteristics, in priority order
	for (const ServiceProfilePtr &profile : profiles)
	{
		BLEGattService *service = gatt_profile->findService(profile->serviceUuid);
		if (service == nullptr)
			continue;

		for (const BluetoothUUID &characteristic_uuid : profile->characteristicUuids)
		{
			BLEGattCharacteristic *characteristic = service->findCharacteristic(characteristic_uuid);
			if (characteristic == nullptr)
				continue;

			tried_characteristics.insert(characteristic);

			if (!characteristic->getIsNotifiable() && !characteristic->getIsIndicatable())
			{
				VSL_LOG_WARNING("ConnectionSession::resolveProfile")
					<< profile->profileName << " characteristic " << characteristic_uuid.getDisplayString()
					<< " does not notify";
				continue;
			}

			if (subscribeCharacteristic(characteristic))
			{
				{
					std::lock_guard<std::mutex> lock(m_stateMutex);
					m_resolvedProfile = profile;
				}

				VSL_LOG_INFO("ConnectionSession::resolveProfile")
					<< "Resolved profile " << profile->profileName
					<< " on characteristic " << characteristic_uuid.getDisplayString();
				setState(SessionState_StreamingNotifications);
				return SessionError_None;
			}
		}
	}

	VSL_LOG_INFO("ConnectionSession::resolveProfile") << "No known profile matched, probing every notifiable characteristic";

	// Fallback: probe whatever else notifies until something produces data
	for (BLEGattService *service : gatt_profile->getServices())
	{
		for (BLEGattCharacteristic *characteristic : service->getCharacteristics())
		{
			if (tried_characteristics.find(characteristic) != tried_characteristics.end())
				continue;
			if (!characteristic->getIsNotifiable() && !characteristic->getIsIndicatable())
				continue;

			tried_characteristics.insert(characteristic);

			if (m_bAbortRequested || m_bLinkLost)
				break;

			{
				std::lock_guard<std::mutex> lock(m_probeMutex);
				m_bProbeDataReceived = false;
			}

			VSL_LOG_DEBUG("ConnectionSession::resolveProfile")
				<< "Probing " << service->getServiceUuid().getDisplayString()
				<< "/" << characteristic->getCharacteristicUuid().getDisplayString();

			if (!subscribeCharacteristic(characteristic))
				continue;

			if (waitForProbeData(probe_timeout_ms))
			{
				VSL_LOG_INFO("ConnectionSession::resolveProfile")
					<< "Characteristic " << characteristic->getCharacteristicUuid().getDisplayString()
					<< " produced data, keeping it";
				setState(SessionState_StreamingNotifications);
				return SessionError_None;
			}

			unsubscribeActiveCharacteristic();
		}
	}

	setListener(nullptr);
	setState(SessionState_LinkEstablished);

	if (m_bAbortRequested)
	{
		VSL_LOG_INFO("ConnectionSession::resolveProfile") << "Profile resolution aborted";
		return SessionError_Aborted;
	}

	if (m_bLinkLost)
	{
		VSL_LOG_WARNING("ConnectionSession::resolveProfile") << "Link lost during profile resolution";
		return SessionError_LinkFailed;
	}

	VSL_LOG_ERROR("ConnectionSession::resolveProfile") << "No characteristic produced data";
	return SessionError_ProfileResolutionExhausted;
}

void ConnectionSession::stopNotifications()
{
	std::lock_guard<std::mutex> link_lock(m_linkMutex);

	unsubscribeActiveCharacteristic();
	setListener(nullptr);

	const eSessionState state = getState();
	if (state == SessionState_StreamingNotifications || state == SessionState_ResolvingProfile)
	{
		setState(SessionState_LinkEstablished);
	}
}

void ConnectionSession::close()
{
	std::lock_guard<std::mutex> link_lock(m_linkMutex);

	releaseLink();
	setListener(nullptr);
	setState(SessionState_Closed);
}

void ConnectionSession::requestAbort()
{
	m_bAbortRequested = true;

	std::lock_guard<std::mutex> lock(m_probeMutex);
	m_probeCondition.notify_all();
}

void ConnectionSession::setDisconnectHandler(DisconnectHandler handler)
{
	std::lock_guard<std::mutex> lock(m_stateMutex);
	m_disconnectHandler = handler;
}

eSessionState ConnectionSession::getState() const
{
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_state;
}

DeviceIdentity ConnectionSession::getDeviceIdentity() const
{
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_identity;
}

DeviceInformation ConnectionSession::getDeviceInformation() const
{
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_deviceInformation;
}

ServiceProfilePtr ConnectionSession::getResolvedProfile() const
{
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_resolvedProfile;
}

BluetoothUUID ConnectionSession::getActiveCharacteristicUuid() const
{
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_activeCharacteristicUuid;
}

bool ConnectionSession::setState(eSessionState new_state)
{
	std::lock_guard<std::mutex> lock(m_stateMutex);

	if (m_state == new_state)
		return true;

	if (!isTransitionAllowed(m_state, new_state))
	{
		VSL_LOG_ERROR("ConnectionSession::setState")
			<< m_identity.deviceId << ": refused transition "
			<< stateToString(m_state) << " -> " << stateToString(new_state);
		return false;
	}

	VSL_LOG_INFO("ConnectionSession::setState")
		<< m_identity.deviceId << ": " << stateToString(m_state) << " -> " << stateToString(new_state);
	m_state = new_state;

	return true;
}

bool ConnectionSession::isTransitionAllowed(eSessionState from_state, eSessionState to_state)
{
	if (to_state == SessionState_Closed)
		return true;

	switch (from_state)
	{
	case SessionState_Idle:
		return to_state == SessionState_Discovering;
	case SessionState_Discovering:
		return to_state == SessionState_LinkEstablished;
	case SessionState_LinkEstablished:
		return to_state == SessionState_ResolvingProfile || to_state == SessionState_Discovering;
	case SessionState_ResolvingProfile:
		return to_state == SessionState_StreamingNotifications || to_state == SessionState_LinkEstablished;
	case SessionState_StreamingNotifications:
		return to_state == SessionState_LinkEstablished;
	case SessionState_Closed:
		return false;
	}

	return false;
}

bool ConnectionSession::subscribeCharacteristic(BLEGattCharacteristic *characteristic)
{
	unsubscribeActiveCharacteristic();

	m_changeEventHandle =
		characteristic->registerChangeEvent(
			std::bind(&ConnectionSession::onCharacteristicChanged, this,
				std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));

	if (!characteristic->startNotifications())
	{
		VSL_LOG_WARNING("ConnectionSession::subscribeCharacteristic")
			<< "Failed to start notifications on " << characteristic->getCharacteristicUuid().getDisplayString();
		characteristic->unregisterChangeEvent(m_changeEventHandle);
		m_changeEventHandle = k_invalid_ble_gatt_event_handle;
		return false;
	}

	m_activeCharacteristic = characteristic;

	std::lock_guard<std::mutex> lock(m_stateMutex);
	m_activeCharacteristicUuid = characteristic->getCharacteristicUuid();

	return true;
}

void ConnectionSession::unsubscribeActiveCharacteristic()
{
	if (m_activeCharacteristic == nullptr)
		return;

	m_activeCharacteristic->stopNotifications();
	m_activeCharacteristic->unregisterChangeEvent(m_changeEventHandle);
	m_activeCharacteristic = nullptr;
	m_changeEventHandle = k_invalid_ble_gatt_event_handle;

	std::lock_guard<std::mutex> lock(m_stateMutex);
	m_activeCharacteristicUuid = BluetoothUUID();
}

void ConnectionSession::releaseLink()
{
	// Unsubscribe first, the characteristic dies with the link
	unsubscribeActiveCharacteristic();

	if (m_deviceState != nullptr)
	{
		m_api->unregisterDisconnectEvent(m_deviceState, m_disconnectEventHandle);
		m_disconnectEventHandle = k_invalid_ble_gatt_event_handle;

		m_api->closeBluetoothLEDevice(m_deviceState);
		m_deviceState = nullptr;
		++m_linkGeneration;

		VSL_LOG_DEBUG("ConnectionSession::releaseLink") << "Released link to " << getDeviceIdentity().deviceId;
	}
}

void ConnectionSession::readDeviceInformation()
{
	DeviceInformation info;
	BLEGattProfile *gatt_profile = nullptr;

	if (m_api->getBluetoothLEGattProfile(m_deviceState, &gatt_profile) && gatt_profile != nullptr)
	{
		BLEGattService *service = gatt_profile->findService(*k_Service_DeviceInformation_UUID);

		if (service != nullptr)
		{
			BLEGattCharacteristic *manufacturer = service->findCharacteristic(*k_Characteristic_ManufacturerNameString_UUID);
			BLEGattCharacteristic *model = service->findCharacteristic(*k_Characteristic_ModelNumberString_UUID);
			std::string value;

			if (manufacturer != nullptr && manufacturer->getIsReadable() &&
				manufacturer->getCharacteristicValue() != nullptr &&
				manufacturer->getCharacteristicValue()->getString(value) && !value.empty())
			{
				info.manufacturerName = value;
			}

			if (model != nullptr && model->getIsReadable() &&
				model->getCharacteristicValue() != nullptr &&
				model->getCharacteristicValue()->getString(value) && !value.empty())
			{
				info.modelNumber = value;
			}
		}
	}

	VSL_LOG_INFO("ConnectionSession::readDeviceInformation")
		<< "Manufacturer: " << info.manufacturerName << ", Model: " << info.modelNumber;

	std::lock_guard<std::mutex> lock(m_stateMutex);
	m_deviceInformation = info;
}

bool ConnectionSession::waitForProbeData(int probe_timeout_ms)
{
	std::unique_lock<std::mutex> lock(m_probeMutex);

	m_probeCondition.wait_for(
		lock,
		std::chrono::milliseconds(probe_timeout_ms),
		[this]() { return m_bProbeDataReceived || m_bAbortRequested || m_bLinkLost; });

	return m_bProbeDataReceived;
}

void ConnectionSession::onCharacteristicChanged(BluetoothGattHandle attribute_handle, uint8_t *data, size_t data_size)
{
	std::vector<uint8_t> fragment;
	if (data != nullptr && data_size > 0)
	{
		fragment.assign(data, data + data_size);
	}

	const std::string device_id = getDeviceIdentity().deviceId;

	if (log_can_emit_level(VSLLogSeverityLevel_debug))
	{
		VSL_LOG_DEBUG("ConnectionSession::onCharacteristicChanged")
			<< device_id << " [" << data_size << " bytes] " << log_format_hex(fragment);
	}

	{
		std::lock_guard<std::mutex> lock(m_probeMutex);
		m_bProbeDataReceived = true;
		m_probeCondition.notify_all();
	}

	std::lock_guard<std::mutex> lock(m_listenerMutex);
	if (m_listener != nullptr)
	{
		m_listener->notifyFragmentReceived(device_id, std::move(fragment));
	}
}

void ConnectionSession::onLinkDisconnected(int link_generation)
{
	if (link_generation != m_linkGeneration)
		return;

	// Wake a pending probe before waiting on the link
	m_bLinkLost = true;
	{
		std::lock_guard<std::mutex> lock(m_probeMutex);
		m_probeCondition.notify_all();
	}

	const std::string device_id = getDeviceIdentity().deviceId;

	{
		std::lock_guard<std::mutex> link_lock(m_linkMutex);

		if (m_deviceState == nullptr || link_generation != m_linkGeneration)
			return;

		VSL_LOG_WARNING("ConnectionSession::onLinkDisconnected") << "Link to " << device_id << " dropped";

		setState(SessionState_Closed);
		releaseLink();

		std::lock_guard<std::mutex> lock(m_listenerMutex);
		if (m_listener != nullptr)
		{
			m_listener->notifyLinkLost(device_id);
			m_listener = nullptr;
		}
	}

	DisconnectHandler handler;
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		handler = m_disconnectHandler;
	}

	if (handler)
	{
		handler(device_id);
	}
}

void ConnectionSession::setListener(ISessionListener *listener)
{
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	m_listener = listener;
}

const char *ConnectionSession::stateToString(eSessionState state)
{
	switch (state)
	{
	case SessionState_Idle:
		return "Idle";
	case SessionState_Discovering:
		return "Discovering";
	case SessionState_LinkEstablished:
		return "LinkEstablished";
	case SessionState_ResolvingProfile:
		return "ResolvingProfile";
	case SessionState_StreamingNotifications:
		return "StreamingNotifications";
	case SessionState_Closed:
		return "Closed";
	}

	return "INVALID";
}

const char *ConnectionSession::errorToString(eSessionError error)
{
	switch (error)
	{
	case SessionError_None:
		return "None";
	case SessionError_DiscoveryFailed:
		return "DiscoveryFailed";
	case SessionError_LinkFailed:
		return "LinkFailed";
	case SessionError_ProfileResolutionExhausted:
		return "ProfileResolutionExhausted";
	case SessionError_InvalidState:
		return "InvalidState";
	case SessionError_Aborted:
		return "Aborted";
	}

	return "INVALID";
}
