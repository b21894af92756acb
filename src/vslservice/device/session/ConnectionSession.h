#ifndef CONNECTION_SESSION_H
#define CONNECTION_SESSION_H

//-- includes -----
#include "BluetoothLEApiInterface.h"
#include "ServiceProfile.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

//-- constants -----
enum eSessionState
{
	SessionState_Idle,
	SessionState_Discovering,
	SessionState_LinkEstablished,
	SessionState_ResolvingProfile,
	SessionState_StreamingNotifications,
	SessionState_Closed
};

enum eSessionError
{
	SessionError_None,
	SessionError_DiscoveryFailed,
	SessionError_LinkFailed,
	SessionError_ProfileResolutionExhausted,
	SessionError_InvalidState,
	SessionError_Aborted
};

//-- interface -----
/// Receives the notification stream of a session.
/// Both calls arrive on transport threads.
class ISessionListener
{
public:
	virtual ~ISessionListener() {}

	virtual void notifyFragmentReceived(const std::string &device_id, std::vector<uint8_t> fragment) = 0;
	virtual void notifyLinkLost(const std::string &device_id) = 0;
};

//-- definitions -----
struct DeviceInformation
{
	std::string manufacturerName;
	std::string modelNumber;

	DeviceInformation();
};

/// Owns the link to one peripheral and walks it through
/// discovery, link establishment, profile resolution and streaming.
class ConnectionSession : public std::enable_shared_from_this<ConnectionSession>
{
public:
	using DisconnectHandler = std::function<void(const std::string &device_id)>;

	// Sessions must be owned by a shared_ptr since transport callbacks hold weak references
	static std::shared_ptr<ConnectionSession> create(IBluetoothLEApi *api, const DeviceIdentity &identity);
	virtual ~ConnectionSession();

	eSessionError discover(const ServiceProfileList &profiles);
	eSessionError establishLink();
	eSessionError reconnect();
	eSessionError resolveProfile(
		const ServiceProfileList &profiles,
		ISessionListener *listener,
		int probe_timeout_ms);

	// Idempotent. Unsubscribes and detaches the listener, the link stays up.
	void stopNotifications();
	// Idempotent. Unsubscribes before the link handle is released.
	void close();
	// Wakes a pending characteristic probe. Sticky for the rest of the session.
	void requestAbort();

	// Invoked after an unsolicited disconnect has moved the session to Closed
	void setDisconnectHandler(DisconnectHandler handler);

	eSessionState getState() const;
	DeviceIdentity getDeviceIdentity() const;
	DeviceInformation getDeviceInformation() const;
	ServiceProfilePtr getResolvedProfile() const;
	BluetoothUUID getActiveCharacteristicUuid() const;
	inline bool isAbortRequested() const { return m_bAbortRequested; }

	static const char *stateToString(eSessionState state);
	static const char *errorToString(eSessionError error);

protected:
	ConnectionSession(IBluetoothLEApi *api, const DeviceIdentity &identity);

	bool setState(eSessionState new_state);
	static bool isTransitionAllowed(eSessionState from_state, eSessionState to_state);

	// Called with m_linkMutex held
	bool subscribeCharacteristic(BLEGattCharacteristic *characteristic);
	void unsubscribeActiveCharacteristic();
	void releaseLink();
	void readDeviceInformation();
	bool waitForProbeData(int probe_timeout_ms);

	void onCharacteristicChanged(BluetoothGattHandle attribute_handle, uint8_t *data, size_t data_size);
	void onLinkDisconnected(int link_generation);

	void setListener(ISessionListener *listener);

private:
	IBluetoothLEApi *m_api;

	mutable std::mutex m_stateMutex;
	eSessionState m_state;
	DeviceIdentity m_identity;
	DeviceInformation m_deviceInformation;
	ServiceProfilePtr m_resolvedProfile;
	BluetoothUUID m_activeCharacteristicUuid;
	DisconnectHandler m_disconnectHandler;

	// Guards the link handle and every GATT object reached through it
	std::mutex m_linkMutex;
	BluetoothLEDeviceState *m_deviceState;
	BLEGattCharacteristic *m_activeCharacteristic;
	BluetoothEventHandle m_changeEventHandle;
	BluetoothEventHandle m_disconnectEventHandle;
	// Bumped whenever a link is released so stale disconnect events can be ignored
	std::atomic<int> m_linkGeneration;

	std::mutex m_listenerMutex;
	ISessionListener *m_listener;

	// Probe wait
	std::mutex m_probeMutex;
	std::condition_variable m_probeCondition;
	bool m_bProbeDataReceived;
	std::atomic<bool> m_bAbortRequested;
	std::atomic<bool> m_bLinkLost;
};
typedef std::shared_ptr<ConnectionSession> ConnectionSessionPtr;

#endif // CONNECTION_SESSION_H
