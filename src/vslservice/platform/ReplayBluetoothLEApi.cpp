//-- includes -----
#include "ReplayBluetoothLEApi.h"
#include "Logger.h"
#include "WorkerThread.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>

//-- constants -----
static const int k_dispatcher_poll_ms = 2;

//-- private definitions -----
/// Delivers link events on its own thread so transport callers never re-enter themselves
class ReplayEventDispatcher : public WorkerThread
{
public:
	ReplayEventDispatcher()
		: WorkerThread("ReplayEventDispatcher")
	{
	}

	virtual ~ReplayEventDispatcher()
	{
		stopThread();
	}

	void post(std::function<void()> event)
	{
		std::lock_guard<std::mutex> lock(m_eventMutex);
		m_events.push_back(event);
	}

protected:
	bool doWork() override
	{
		std::function<void()> event;

		{
			std::lock_guard<std::mutex> lock(m_eventMutex);

			if (!m_events.empty())
			{
				event = m_events.front();
				m_events.pop_front();
			}
		}

		if (event)
		{
			event();
			return true;
		}

		return sleepUnlessStopped(std::chrono::milliseconds(k_dispatcher_poll_ms));
	}

private:
	std::mutex m_eventMutex;
	std::deque<std::function<void()> > m_events;
};

class ReplayDeviceState : public BluetoothLEDeviceState
{
public:
	ReplayDeviceState(
		ReplayBluetoothLEApi *api,
		const ReplayDeviceScript &script,
		t_bluetoothle_device_handle handle,
		int drop_after_fragments);
	virtual ~ReplayDeviceState();

	inline bool isLinkDropped() const { return m_bLinkDropped; }

	// Returns true if this call dropped the link
	bool markLinkDropped();
	void onFragmentDelivered();

private:
	ReplayBluetoothLEApi *m_api;
	int m_dropAfterFragments;
	std::atomic<int> m_deliveredFragments;
	std::atomic<bool> m_bLinkDropped;
};

class ReplayGattCharacteristic : public BLEGattCharacteristic
{
public:
	ReplayGattCharacteristic(
		BLEGattService *service,
		ReplayDeviceState *device,
		const ReplayCharacteristicScript &script,
		unsigned short attribute_handle);
	virtual ~ReplayGattCharacteristic();

	bool getIsReadable() const override { return m_script.bReadable; }
	bool getIsNotifiable() const override { return m_script.bNotifiable; }
	bool getIsIndicatable() const override { return m_script.bIndicatable; }

	BluetoothEventHandle registerChangeEvent(ChangeCallback callback) override;
	void unregisterChangeEvent(const BluetoothEventHandle &handle) override;

	bool startNotifications() override;
	void stopNotifications() override;

	inline ReplayDeviceState *getDevice() const { return m_device; }
	inline const ReplayCharacteristicScript &getScript() const { return m_script; }

	// Runs on the notification stream thread
	bool deliverFragment(const std::vector<uint8_t> &bytes);

private:
	ReplayDeviceState *m_device;
	ReplayCharacteristicScript m_script;
	BluetoothGattHandle m_attributeHandle;

	std::mutex m_callbackMutex;
	std::map<intptr_t, ChangeCallback> m_callbacks;
	intptr_t m_nextCallbackId;

	class ReplayNotificationStream *m_stream;
	std::atomic<bool> m_bIsNotifying;
};

class ReplayNotificationStream : public WorkerThread
{
public:
	ReplayNotificationStream(ReplayGattCharacteristic *characteristic)
		: WorkerThread("ReplayNotificationStream")
		, m_characteristic(characteristic)
		, m_fragmentIndex(0)
	{
	}

	virtual ~ReplayNotificationStream()
	{
		stopThread();
	}

	void rewind()
	{
		m_fragmentIndex = 0;
	}

protected:
	bool doWork() override
	{
		const std::vector<ReplayFragment> &fragments = m_characteristic->getScript().fragments;

		if (m_fragmentIndex >= fragments.size())
			return false;

		const ReplayFragment &fragment = fragments[m_fragmentIndex];
		if (fragment.delayMs > 0 && !sleepUnlessStopped(std::chrono::milliseconds(fragment.delayMs)))
			return false;

		if (!m_characteristic->deliverFragment(fragment.bytes))
			return false;

		++m_fragmentIndex;
		return true;
	}

private:
	ReplayGattCharacteristic *m_characteristic;
	size_t m_fragmentIndex;
};

class ReplayGattCharacteristicValue : public BLEGattCharacteristicValue
{
public:
	ReplayGattCharacteristicValue(ReplayGattCharacteristic *characteristic)
		: BLEGattCharacteristicValue(characteristic)
		, m_replayCharacteristic(characteristic)
		, m_value()
	{
	}

	bool readValue() override
	{
		if (!m_replayCharacteristic->getIsReadable() || m_replayCharacteristic->getDevice()->isLinkDropped())
			return false;

		m_value = m_replayCharacteristic->getScript().value;
		return true;
	}

	bool getData(uint8_t **outBuffer, size_t *outBufferSize) override
	{
		if (outBuffer == nullptr || outBufferSize == nullptr)
			return false;

		*outBuffer = m_value.empty() ? nullptr : m_value.data();
		*outBufferSize = m_value.size();
		return true;
	}

private:
	ReplayGattCharacteristic *m_replayCharacteristic;
	std::vector<uint8_t> m_value;
};

class ReplayGattService : public BLEGattService
{
public:
	ReplayGattService(
		BLEGattProfile *profile,
		ReplayDeviceState *device,
		const ReplayServiceScript &script,
		unsigned short &next_attribute_handle)
		: BLEGattService(profile, script.uuid)
	{
		for (const ReplayCharacteristicScript &characteristic_script : script.characteristics)
		{
			characteristics.push_back(
				new ReplayGattCharacteristic(this, device, characteristic_script, next_attribute_handle++));
		}
	}
};

class ReplayGattProfile : public BLEGattProfile
{
public:
	ReplayGattProfile(ReplayDeviceState *device, const ReplayDeviceScript &script)
		: BLEGattProfile(device)
	{
		unsigned short next_attribute_handle = 0x0001;

		for (const ReplayServiceScript &service_script : script.services)
		{
			services.push_back(new ReplayGattService(this, device, service_script, next_attribute_handle));
		}
	}
};

// -- ReplayDeviceState ----
ReplayDeviceState::ReplayDeviceState(
	ReplayBluetoothLEApi *api,
	const ReplayDeviceScript &script,
	t_bluetoothle_device_handle handle,
	int drop_after_fragments)
	: BluetoothLEDeviceState(script.identity)
	, m_api(api)
	, m_dropAfterFragments(drop_after_fragments)
	, m_deliveredFragments(0)
	, m_bLinkDropped(false)
{
	assignPublicHandle(handle);
	gattProfile = new ReplayGattProfile(this, script);
}

ReplayDeviceState::~ReplayDeviceState()
{
	// Stop every stream before the profile goes away
	delete gattProfile;
	gattProfile = nullptr;
}

bool ReplayDeviceState::markLinkDropped()
{
	return !m_bLinkDropped.exchange(true);
}

void ReplayDeviceState::onFragmentDelivered()
{
	const int delivered_count = ++m_deliveredFragments;

	if (m_dropAfterFragments >= 0 && delivered_count >= m_dropAfterFragments && markLinkDropped())
	{
		VSL_LOG_WARNING("ReplayDeviceState::onFragmentDelivered")
			<< "Dropping link to " << deviceIdentity.deviceId << " after " << delivered_count << " fragments";
		m_api->postLinkDropped(deviceHandle);
	}
}

// -- ReplayGattCharacteristic ----
ReplayGattCharacteristic::ReplayGattCharacteristic(
	BLEGattService *service,
	ReplayDeviceState *device,
	const ReplayCharacteristicScript &script,
	unsigned short attribute_handle)
	: BLEGattCharacteristic(service, script.uuid)
	, m_device(device)
	, m_script(script)
	, m_attributeHandle(attribute_handle)
	, m_nextCallbackId(1)
	, m_stream(nullptr)
	, m_bIsNotifying(false)
{
	characteristicValue = new ReplayGattCharacteristicValue(this);
	m_stream = new ReplayNotificationStream(this);
}

ReplayGattCharacteristic::~ReplayGattCharacteristic()
{
	delete m_stream;
	m_stream = nullptr;
}

BluetoothEventHandle ReplayGattCharacteristic::registerChangeEvent(ChangeCallback callback)
{
	std::lock_guard<std::mutex> lock(m_callbackMutex);
	const intptr_t callback_id = m_nextCallbackId++;

	m_callbacks.insert(std::make_pair(callback_id, callback));

	return BluetoothEventHandle(reinterpret_cast<void *>(callback_id));
}

void ReplayGattCharacteristic::unregisterChangeEvent(const BluetoothEventHandle &handle)
{
	std::lock_guard<std::mutex> lock(m_callbackMutex);

	m_callbacks.erase(reinterpret_cast<intptr_t>(handle.getHandleData()));
}

bool ReplayGattCharacteristic::startNotifications()
{
	if (!m_script.bNotifiable && !m_script.bIndicatable)
		return false;

	if (m_device->isLinkDropped())
		return false;

	m_stream->stopThread();
	m_stream->rewind();
	m_bIsNotifying = true;
	m_stream->startThread();

	return true;
}

void ReplayGattCharacteristic::stopNotifications()
{
	m_bIsNotifying = false;
	m_stream->stopThread();
}

bool ReplayGattCharacteristic::deliverFragment(const std::vector<uint8_t> &bytes)
{
	if (!m_bIsNotifying || m_device->isLinkDropped())
		return false;

	std::vector<ChangeCallback> callbacks;
	{
		std::lock_guard<std::mutex> lock(m_callbackMutex);

		for (auto it = m_callbacks.begin(); it != m_callbacks.end(); ++it)
		{
			callbacks.push_back(it->second);
		}
	}

	for (ChangeCallback &callback : callbacks)
	{
		std::vector<uint8_t> payload(bytes);
		callback(m_attributeHandle, payload.empty() ? nullptr : payload.data(), payload.size());
	}

	m_device->onFragmentDelivered();

	return !m_device->isLinkDropped();
}

// -- ReplayBluetoothLEApi ----
ReplayBluetoothLEApi::ReplayBluetoothLEApi()
	: m_devices()
	, m_openDevices()
	, m_disconnectCallbacks()
	, m_nextDeviceHandle(0)
	, m_nextEventId(1)
	, m_dispatcher(new ReplayEventDispatcher)
{
}

ReplayBluetoothLEApi::~ReplayBluetoothLEApi()
{
	shutdown();

	delete m_dispatcher;
	m_dispatcher = nullptr;
}

// -- Scripting ----
void ReplayBluetoothLEApi::addDevice(const ReplayDeviceScript &script)
{
	std::lock_guard<std::mutex> lock(m_apiMutex);

	for (ReplayDeviceRecord &record : m_devices)
	{
		if (record.script.identity.deviceId == script.identity.deviceId)
		{
			record.script = script;
			return;
		}
	}

	ReplayDeviceRecord record;
	record.script = script;
	record.openAttempts = 0;
	record.successfulOpens = 0;
	record.openLinks = 0;
	record.maxConcurrentLinks = 0;
	m_devices.push_back(record);

	VSL_LOG_DEBUG("ReplayBluetoothLEApi::addDevice")
		<< "Scripted device " << script.identity.deviceId << " (" << script.identity.friendlyName << ")";
}

void ReplayBluetoothLEApi::loadDevices(const ReplayBluetoothLEApiConfig &config)
{
	for (const ReplayDeviceScript &script : config.devices)
	{
		addDevice(script);
	}

	VSL_LOG_INFO("ReplayBluetoothLEApi::loadDevices") << "Loaded " << config.devices.size() << " scripted devices";
}

bool ReplayBluetoothLEApi::removeDevice(const std::string &device_id)
{
	std::lock_guard<std::mutex> lock(m_apiMutex);

	auto it = std::find_if(
		m_devices.begin(), m_devices.end(),
		[&device_id](const ReplayDeviceRecord &record)
	{
		return record.script.identity.deviceId == device_id;
	});

	if (it == m_devices.end())
		return false;

	m_devices.erase(it);
	return true;
}

size_t ReplayBluetoothLEApi::getDeviceCount() const
{
	std::lock_guard<std::mutex> lock(m_apiMutex);
	return m_devices.size();
}

bool ReplayBluetoothLEApi::simulateDisconnect(const std::string &device_id)
{
	std::vector<t_bluetoothle_device_handle> dropped_handles;

	{
		std::lock_guard<std::mutex> lock(m_apiMutex);

		for (auto it = m_openDevices.begin(); it != m_openDevices.end(); ++it)
		{
			if (it->second->getDeviceIdentity().deviceId == device_id && it->second->markLinkDropped())
			{
				dropped_handles.push_back(it->first);
			}
		}
	}

	for (const t_bluetoothle_device_handle &handle : dropped_handles)
	{
		postLinkDropped(handle);
	}

	return !dropped_handles.empty();
}

// -- Counters ----
int ReplayBluetoothLEApi::getOpenLinkCount(const std::string &device_id) const
{
	std::lock_guard<std::mutex> lock(m_apiMutex);

	for (const ReplayDeviceRecord &record : m_devices)
	{
		if (record.script.identity.deviceId == device_id)
			return record.openLinks;
	}

	return 0;
}

int ReplayBluetoothLEApi::getMaxConcurrentLinks(const std::string &device_id) const
{
	std::lock_guard<std::mutex> lock(m_apiMutex);

	for (const ReplayDeviceRecord &record : m_devices)
	{
		if (record.script.identity.deviceId == device_id)
			return record.maxConcurrentLinks;
	}

	return 0;
}

int ReplayBluetoothLEApi::getOpenAttemptCount(const std::string &device_id) const
{
	std::lock_guard<std::mutex> lock(m_apiMutex);

	for (const ReplayDeviceRecord &record : m_devices)
	{
		if (record.script.identity.deviceId == device_id)
			return record.openAttempts;
	}

	return 0;
}

// -- IBluetoothLEApi ----
bool ReplayBluetoothLEApi::startup()
{
	m_dispatcher->startThread();

	VSL_LOG_INFO("ReplayBluetoothLEApi::startup") << "Replay transport started with " << getDeviceCount() << " scripted devices";

	return true;
}

void ReplayBluetoothLEApi::shutdown()
{
	if (m_dispatcher != nullptr)
	{
		m_dispatcher->stopThread();
	}

	std::vector<ReplayDeviceState *> open_devices;
	{
		std::lock_guard<std::mutex> lock(m_apiMutex);

		for (auto it = m_openDevices.begin(); it != m_openDevices.end(); ++it)
		{
			open_devices.push_back(it->second);
		}
	}

	for (ReplayDeviceState *device_state : open_devices)
	{
		VSL_LOG_WARNING("ReplayBluetoothLEApi::shutdown") << "Closing leaked link to " << device_state->getDeviceIdentity().deviceId;
		closeBluetoothLEDevice(device_state);
	}
}

bool ReplayBluetoothLEApi::requestDevice(const BluetoothLEDeviceRequest &request, DeviceIdentity &out_identity)
{
	std::lock_guard<std::mutex> lock(m_apiMutex);

	for (const ReplayDeviceRecord &record : m_devices)
	{
		const ReplayDeviceScript &script = record.script;

		if (!request.deviceId.empty() && request.deviceId != script.identity.deviceId)
			continue;

		if (request.acceptAllDevices || script.advertisedServices.intersects(request.filterServices))
		{
			out_identity = script.identity;

			VSL_LOG_DEBUG("ReplayBluetoothLEApi::requestDevice")
				<< "Matched " << script.identity.deviceId
				<< (request.acceptAllDevices ? " (accept all)" : " (service filter)");
			return true;
		}
	}

	return false;
}

BluetoothLEDeviceState *ReplayBluetoothLEApi::openBluetoothLEDevice(const DeviceIdentity &identity)
{
	std::lock_guard<std::mutex> lock(m_apiMutex);

	auto it = std::find_if(
		m_devices.begin(), m_devices.end(),
		[&identity](const ReplayDeviceRecord &record)
	{
		return record.script.identity.deviceId == identity.deviceId;
	});

	if (it == m_devices.end())
	{
		VSL_LOG_ERROR("ReplayBluetoothLEApi::openBluetoothLEDevice") << "Unknown device " << identity.deviceId;
		return nullptr;
	}

	ReplayDeviceRecord &record = *it;
	++record.openAttempts;

	if (record.openAttempts <= record.script.connectFailuresBeforeSuccess)
	{
		VSL_LOG_WARNING("ReplayBluetoothLEApi::openBluetoothLEDevice")
			<< "Injected connect failure " << record.openAttempts << " for " << identity.deviceId;
		return nullptr;
	}

	++record.successfulOpens;
	const int drop_after_fragments = (record.successfulOpens == 1) ? record.script.dropLinkAfterFragments : -1;

	t_bluetoothle_device_handle handle = { _BLEApiType_Replay, m_nextDeviceHandle++ };
	ReplayDeviceState *device_state = new ReplayDeviceState(this, record.script, handle, drop_after_fragments);

	++record.openLinks;
	record.maxConcurrentLinks = std::max(record.maxConcurrentLinks, record.openLinks);
	m_openDevices.insert(std::make_pair(handle, device_state));

	return device_state;
}

void ReplayBluetoothLEApi::closeBluetoothLEDevice(BluetoothLEDeviceState* device_state)
{
	if (device_state == nullptr)
		return;

	ReplayDeviceState *replay_state = nullptr;

	{
		std::lock_guard<std::mutex> lock(m_apiMutex);
		auto it = m_openDevices.find(device_state->getPublicHandle());

		if (it == m_openDevices.end() || it->second != device_state)
			return;

		replay_state = it->second;
		m_openDevices.erase(it);
		m_disconnectCallbacks.erase(device_state->getPublicHandle());

		for (ReplayDeviceRecord &record : m_devices)
		{
			if (record.script.identity.deviceId == device_state->getDeviceIdentity().deviceId)
			{
				--record.openLinks;
				break;
			}
		}
	}

	// Joins the notification streams, so never under the api lock
	delete replay_state;
}

bool ReplayBluetoothLEApi::getBluetoothLEGattProfile(const BluetoothLEDeviceState* device_state, BLEGattProfile **outGattProfile) const
{
	if (device_state == nullptr || outGattProfile == nullptr)
		return false;

	*outGattProfile = device_state->getGattProfile();
	return *outGattProfile != nullptr;
}

BluetoothEventHandle ReplayBluetoothLEApi::registerDisconnectEvent(BluetoothLEDeviceState* device_state, DisconnectCallback callback)
{
	if (device_state == nullptr)
		return k_invalid_ble_gatt_event_handle;

	std::lock_guard<std::mutex> lock(m_apiMutex);
	const intptr_t event_id = m_nextEventId++;

	m_disconnectCallbacks[device_state->getPublicHandle()].insert(std::make_pair(event_id, callback));

	return BluetoothEventHandle(reinterpret_cast<void *>(event_id));
}

void ReplayBluetoothLEApi::unregisterDisconnectEvent(BluetoothLEDeviceState* device_state, const BluetoothEventHandle &handle)
{
	if (device_state == nullptr)
		return;

	std::lock_guard<std::mutex> lock(m_apiMutex);
	auto it = m_disconnectCallbacks.find(device_state->getPublicHandle());

	if (it != m_disconnectCallbacks.end())
	{
		it->second.erase(reinterpret_cast<intptr_t>(handle.getHandleData()));
	}
}

void ReplayBluetoothLEApi::postLinkDropped(t_bluetoothle_device_handle handle)
{
	m_dispatcher->post([this, handle]()
	{
		dispatchLinkDropped(handle);
	});
}

void ReplayBluetoothLEApi::dispatchLinkDropped(t_bluetoothle_device_handle handle)
{
	std::vector<DisconnectCallback> callbacks;
	std::string device_id;

	{
		std::lock_guard<std::mutex> lock(m_apiMutex);
		auto device_it = m_openDevices.find(handle);

		// Already closed by its owner
		if (device_it == m_openDevices.end())
			return;

		device_id = device_it->second->getDeviceIdentity().deviceId;

		auto callback_it = m_disconnectCallbacks.find(handle);
		if (callback_it != m_disconnectCallbacks.end())
		{
			for (auto it = callback_it->second.begin(); it != callback_it->second.end(); ++it)
			{
				callbacks.push_back(it->second);
			}
		}
	}

	VSL_LOG_INFO("ReplayBluetoothLEApi::dispatchLinkDropped") << "Link to " << device_id << " lost";

	for (DisconnectCallback &callback : callbacks)
	{
		callback(device_id);
	}
}
