//-- includes -----
#include "BluetoothLEServiceIDs.h"
#include "ConnectionSession.h"
#include "DeviceRegistry.h"
#include "ReplayBluetoothLEApi.h"
#include "ReplayTestScripts.h"
#include "ServiceProfile.h"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

//-- private methods -----
static bool wait_for_condition(std::function<bool()> predicate, int timeout_ms)
{
	const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

	while (!predicate())
	{
		if (std::chrono::steady_clock::now() >= deadline)
			return false;

		std::this_thread::sleep_for(std::chrono::milliseconds(2));
	}

	return true;
}

class RecordingListener : public ISessionListener
{
public:
	RecordingListener() : m_fragmentCount(0), m_bLinkLost(false) {}

	void notifyFragmentReceived(const std::string &device_id, std::vector<uint8_t> fragment) override
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_bytes.insert(m_bytes.end(), fragment.begin(), fragment.end());
		++m_fragmentCount;
	}

	void notifyLinkLost(const std::string &device_id) override
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_bLinkLost = true;
	}

	int getFragmentCount() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_fragmentCount;
	}

	std::vector<uint8_t> getBytes() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_bytes;
	}

	bool getLinkLost() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_bLinkLost;
	}

private:
	mutable std::mutex m_mutex;
	std::vector<uint8_t> m_bytes;
	int m_fragmentCount;
	bool m_bLinkLost;
};

class ConnectionSessionTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		m_catalog.registerBuiltInProfiles();
		m_api.startup();
	}

	void TearDown() override
	{
		m_api.shutdown();
	}

	ServiceProfileList bloodPressureProfiles() const
	{
		return m_catalog.getProfilesForDeviceType(DeviceType_BloodPressure);
	}

	ServiceProfileCatalog m_catalog;
	ReplayBluetoothLEApi m_api;
};

// -- Lifecycle ----
TEST_F(ConnectionSessionTest, WalksThroughTheLifecycle)
{
	m_api.addDevice(make_transtek_cuff("cuff-1", make_framed_reading_fragments()));

	ConnectionSessionPtr session = ConnectionSession::create(&m_api, DeviceIdentity("cuff-1", ""));
	EXPECT_EQ(SessionState_Idle, session->getState());

	ASSERT_EQ(SessionError_None, session->discover(bloodPressureProfiles()));
	EXPECT_EQ(SessionState_Discovering, session->getState());
	EXPECT_EQ("TMB-1018 cuff-1", session->getDeviceIdentity().friendlyName);

	ASSERT_EQ(SessionError_None, session->establishLink());
	EXPECT_EQ(SessionState_LinkEstablished, session->getState());
	EXPECT_EQ(1, m_api.getOpenLinkCount("cuff-1"));

	RecordingListener listener;
	ASSERT_EQ(SessionError_None, session->resolveProfile(bloodPressureProfiles(), &listener, 100));
	EXPECT_EQ(SessionState_StreamingNotifications, session->getState());
	ASSERT_TRUE(session->getResolvedProfile() != nullptr);
	EXPECT_EQ(ServiceProfileCatalog::k_transtek_profile_name, session->getResolvedProfile()->profileName);
	EXPECT_EQ(*k_Characteristic_TranstekMeasurement_UUID, session->getActiveCharacteristicUuid());

	ASSERT_TRUE(wait_for_condition([&listener]() { return listener.getFragmentCount() == 2; }, 2000));
	const std::vector<uint8_t> expected{ 0xAA, 0x08, 0x00, 0x78, 0x00, 0x50, 0x00, 0x48, 0x00 };
	EXPECT_EQ(expected, listener.getBytes());

	session->stopNotifications();
	EXPECT_EQ(SessionState_LinkEstablished, session->getState());
	EXPECT_FALSE(session->getActiveCharacteristicUuid().isValid());

	session->close();
	EXPECT_EQ(SessionState_Closed, session->getState());
	EXPECT_EQ(0, m_api.getOpenLinkCount("cuff-1"));

	// Idempotent
	session->close();
	session->stopNotifications();
	EXPECT_EQ(SessionState_Closed, session->getState());
}

TEST_F(ConnectionSessionTest, RefusesOutOfOrderCalls)
{
	m_api.addDevice(make_transtek_cuff("cuff-1", make_framed_reading_fragments()));

	ConnectionSessionPtr session = ConnectionSession::create(&m_api, DeviceIdentity("cuff-1", ""));
	RecordingListener listener;

	EXPECT_EQ(SessionError_InvalidState, session->establishLink());
	EXPECT_EQ(SessionError_InvalidState, session->resolveProfile(bloodPressureProfiles(), &listener, 50));
	EXPECT_EQ(SessionError_InvalidState, session->reconnect());
	EXPECT_EQ(SessionState_Idle, session->getState());

	session->close();
	EXPECT_EQ(SessionError_InvalidState, session->discover(bloodPressureProfiles()));
	EXPECT_EQ(SessionState_Closed, session->getState());
	EXPECT_EQ(0, m_api.getOpenAttemptCount("cuff-1"));
}

// -- Discovery ----
TEST_F(ConnectionSessionTest, DiscoveryFallsBackToAcceptAll)
{
	m_api.addDevice(make_silent_vendor_cuff("quiet-1", make_framed_reading_fragments()));

	ConnectionSessionPtr session = ConnectionSession::create(&m_api, DeviceIdentity("quiet-1", ""));
	EXPECT_EQ(SessionError_None, session->discover(bloodPressureProfiles()));
	EXPECT_EQ("Unbranded quiet-1", session->getDeviceIdentity().friendlyName);
}

TEST_F(ConnectionSessionTest, DiscoveryFailsForUnknownDevice)
{
	m_api.addDevice(make_transtek_cuff("cuff-1", make_framed_reading_fragments()));

	ConnectionSessionPtr session = ConnectionSession::create(&m_api, DeviceIdentity("missing", ""));
	EXPECT_EQ(SessionError_DiscoveryFailed, session->discover(bloodPressureProfiles()));
	EXPECT_EQ(0, m_api.getOpenAttemptCount("cuff-1"));
}

TEST_F(ConnectionSessionTest, AnonymousDiscoveryAdoptsFoundIdentity)
{
	m_api.addDevice(make_glucose_meter("meter-1", std::vector<ReplayFragment>()));
	m_api.addDevice(make_transtek_cuff("cuff-1", make_framed_reading_fragments()));

	ConnectionSessionPtr session = ConnectionSession::create(&m_api, DeviceIdentity());
	ASSERT_EQ(SessionError_None, session->discover(bloodPressureProfiles()));
	EXPECT_EQ("cuff-1", session->getDeviceIdentity().deviceId);
}

// -- Device Information ----
TEST_F(ConnectionSessionTest, ReadsDeviceInformationOnLink)
{
	m_api.addDevice(make_transtek_cuff("cuff-1", make_framed_reading_fragments()));
	m_api.addDevice(make_glucose_meter("meter-1", std::vector<ReplayFragment>()));

	ConnectionSessionPtr cuff_session = ConnectionSession::create(&m_api, DeviceIdentity("cuff-1", ""));
	ASSERT_EQ(SessionError_None, cuff_session->discover(bloodPressureProfiles()));
	ASSERT_EQ(SessionError_None, cuff_session->establishLink());
	EXPECT_EQ("Transtek", cuff_session->getDeviceInformation().manufacturerName);
	EXPECT_EQ("TMB-1018", cuff_session->getDeviceInformation().modelNumber);

	ConnectionSessionPtr meter_session = ConnectionSession::create(&m_api, DeviceIdentity("meter-1", ""));
	ASSERT_EQ(SessionError_None, meter_session->discover(m_catalog.getProfilesForDeviceType(DeviceType_Glucose)));
	ASSERT_EQ(SessionError_None, meter_session->establishLink());
	EXPECT_EQ("Unknown", meter_session->getDeviceInformation().manufacturerName);
	EXPECT_EQ("Unknown", meter_session->getDeviceInformation().modelNumber);
}

// -- Profile Resolution ----
TEST_F(ConnectionSessionTest, ProbesUnknownCharacteristicsUntilOneProducesData)
{
	m_api.addDevice(make_silent_vendor_cuff("quiet-1", make_framed_reading_fragments()));

	ConnectionSessionPtr session = ConnectionSession::create(&m_api, DeviceIdentity("quiet-1", ""));
	ASSERT_EQ(SessionError_None, session->discover(bloodPressureProfiles()));
	ASSERT_EQ(SessionError_None, session->establishLink());

	RecordingListener listener;
	ASSERT_EQ(SessionError_None, session->resolveProfile(bloodPressureProfiles(), &listener, 150));
	EXPECT_EQ(SessionState_StreamingNotifications, session->getState());
	EXPECT_TRUE(session->getResolvedProfile() == nullptr);
	EXPECT_EQ(BluetoothUUID("0000fff4-0000-1000-8000-00805f9b34fb"), session->getActiveCharacteristicUuid());

	ASSERT_TRUE(wait_for_condition([&listener]() { return listener.getFragmentCount() == 2; }, 2000));
	session->close();
}

TEST_F(ConnectionSessionTest, ExhaustsWhenNothingNotifies)
{
	m_api.addDevice(make_silent_vendor_cuff("quiet-1", std::vector<ReplayFragment>()));

	ConnectionSessionPtr session = ConnectionSession::create(&m_api, DeviceIdentity("quiet-1", ""));
	ASSERT_EQ(SessionError_None, session->discover(bloodPressureProfiles()));
	ASSERT_EQ(SessionError_None, session->establishLink());

	RecordingListener listener;
	EXPECT_EQ(SessionError_ProfileResolutionExhausted, session->resolveProfile(bloodPressureProfiles(), &listener, 30));
	EXPECT_EQ(SessionState_LinkEstablished, session->getState());
	EXPECT_FALSE(session->getActiveCharacteristicUuid().isValid());
}

TEST_F(ConnectionSessionTest, AbortWakesPendingProbe)
{
	m_api.addDevice(make_silent_vendor_cuff("quiet-1", std::vector<ReplayFragment>()));

	ConnectionSessionPtr session = ConnectionSession::create(&m_api, DeviceIdentity("quiet-1", ""));
	ASSERT_EQ(SessionError_None, session->discover(bloodPressureProfiles()));
	ASSERT_EQ(SessionError_None, session->establishLink());

	std::thread aborter([session]()
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
		session->requestAbort();
	});

	RecordingListener listener;
	const auto start_time = std::chrono::steady_clock::now();
	EXPECT_EQ(SessionError_Aborted, session->resolveProfile(bloodPressureProfiles(), &listener, 5000));
	const auto elapsed = std::chrono::steady_clock::now() - start_time;
	aborter.join();

	EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
	EXPECT_TRUE(session->isAbortRequested());
}

// -- Link Loss ----
TEST_F(ConnectionSessionTest, UnsolicitedDisconnectClosesSession)
{
	m_api.addDevice(make_transtek_cuff("cuff-1", std::vector<ReplayFragment>()));

	ConnectionSessionPtr session = ConnectionSession::create(&m_api, DeviceIdentity("cuff-1", ""));
	ASSERT_EQ(SessionError_None, session->discover(bloodPressureProfiles()));
	ASSERT_EQ(SessionError_None, session->establishLink());

	RecordingListener listener;
	ASSERT_EQ(SessionError_None, session->resolveProfile(bloodPressureProfiles(), &listener, 50));

	std::string disconnected_id;
	std::mutex handler_mutex;
	session->setDisconnectHandler([&](const std::string &device_id)
	{
		std::lock_guard<std::mutex> lock(handler_mutex);
		disconnected_id = device_id;
	});

	ASSERT_TRUE(m_api.simulateDisconnect("cuff-1"));
	ASSERT_TRUE(wait_for_condition([&]() { return session->getState() == SessionState_Closed; }, 2000));
	ASSERT_TRUE(wait_for_condition([&]()
	{
		std::lock_guard<std::mutex> lock(handler_mutex);
		return !disconnected_id.empty();
	}, 2000));

	EXPECT_EQ("cuff-1", disconnected_id);
	EXPECT_TRUE(listener.getLinkLost());
	EXPECT_EQ(0, m_api.getOpenLinkCount("cuff-1"));
}

TEST_F(ConnectionSessionTest, ReconnectOpensAFreshLink)
{
	ReplayDeviceScript script = make_transtek_cuff("cuff-1", std::vector<ReplayFragment>());
	m_api.addDevice(script);

	ConnectionSessionPtr session = ConnectionSession::create(&m_api, DeviceIdentity("cuff-1", ""));
	ASSERT_EQ(SessionError_None, session->discover(bloodPressureProfiles()));
	ASSERT_EQ(SessionError_None, session->establishLink());

	RecordingListener listener;
	ASSERT_EQ(SessionError_None, session->resolveProfile(bloodPressureProfiles(), &listener, 50));

	EXPECT_EQ(SessionError_None, session->reconnect());
	EXPECT_EQ(SessionState_LinkEstablished, session->getState());
	EXPECT_TRUE(session->getResolvedProfile() == nullptr);
	EXPECT_EQ(2, m_api.getOpenAttemptCount("cuff-1"));
	EXPECT_EQ(1, m_api.getOpenLinkCount("cuff-1"));
	EXPECT_EQ(1, m_api.getMaxConcurrentLinks("cuff-1"));
}

TEST_F(ConnectionSessionTest, LinkFailsWhenTheDeviceRefusesToConnect)
{
	ReplayDeviceScript script = make_transtek_cuff("cuff-1", std::vector<ReplayFragment>());
	script.connectFailuresBeforeSuccess = 1;
	m_api.addDevice(script);

	ConnectionSessionPtr session = ConnectionSession::create(&m_api, DeviceIdentity("cuff-1", ""));
	ASSERT_EQ(SessionError_None, session->discover(bloodPressureProfiles()));
	EXPECT_EQ(SessionError_LinkFailed, session->establishLink());
	EXPECT_EQ(SessionState_Discovering, session->getState());

	// Second attempt from the same state goes through
	EXPECT_EQ(SessionError_None, session->establishLink());
	EXPECT_EQ(SessionState_LinkEstablished, session->getState());
}

// -- DeviceRegistry ----
TEST_F(ConnectionSessionTest, RegistryDropsSessionOnLinkLoss)
{
	m_api.addDevice(make_transtek_cuff("cuff-1", std::vector<ReplayFragment>()));

	DeviceRegistry registry;
	ConnectionSessionPtr session = ConnectionSession::create(&m_api, DeviceIdentity("cuff-1", ""));
	ASSERT_EQ(SessionError_None, session->discover(bloodPressureProfiles()));
	ASSERT_EQ(SessionError_None, session->establishLink());

	registry.add("cuff-1", session);
	EXPECT_EQ(session, registry.get("cuff-1"));
	EXPECT_EQ(1u, registry.getSessionCount());

	ASSERT_TRUE(m_api.simulateDisconnect("cuff-1"));
	EXPECT_TRUE(wait_for_condition([&registry]() { return registry.getSessionCount() == 0; }, 2000));
	EXPECT_TRUE(registry.get("cuff-1") == nullptr);
	EXPECT_EQ(SessionState_Closed, session->getState());
}

TEST_F(ConnectionSessionTest, RegistryAddReplacesAndClosesPriorSession)
{
	m_api.addDevice(make_transtek_cuff("cuff-1", std::vector<ReplayFragment>()));

	DeviceRegistry registry;
	ConnectionSessionPtr first = ConnectionSession::create(&m_api, DeviceIdentity("cuff-1", ""));
	ASSERT_EQ(SessionError_None, first->discover(bloodPressureProfiles()));
	ASSERT_EQ(SessionError_None, first->establishLink());
	registry.add("cuff-1", first);

	ConnectionSessionPtr second = ConnectionSession::create(&m_api, DeviceIdentity("cuff-1", ""));
	registry.add("cuff-1", second);

	EXPECT_EQ(SessionState_Closed, first->getState());
	EXPECT_EQ(second, registry.get("cuff-1"));
	EXPECT_EQ(1u, registry.getSessionCount());
	EXPECT_EQ(0, m_api.getOpenLinkCount("cuff-1"));

	// remove() forgets without closing
	ConnectionSessionPtr removed = registry.remove("cuff-1");
	EXPECT_EQ(second, removed);
	EXPECT_EQ(SessionState_Idle, removed->getState());
	EXPECT_TRUE(registry.remove("cuff-1") == nullptr);
}

TEST(DeviceRegistryTest, ManagementTableKeepsRegistrationOrder)
{
	DeviceRegistry registry;

	EXPECT_TRUE(registry.registerDevice(DeviceIdentity("b", "Bedroom cuff"), DeviceMetadata("Bedroom cuff", DeviceType_BloodPressure)));
	EXPECT_TRUE(registry.registerDevice(DeviceIdentity("a", "Kitchen meter"), DeviceMetadata("Kitchen meter", DeviceType_Glucose)));
	EXPECT_FALSE(registry.registerDevice(DeviceIdentity("", "Nameless"), DeviceMetadata("Nameless", DeviceType_Glucose)));

	std::vector<RegisteredDevice> devices = registry.listDevices();
	ASSERT_EQ(2u, devices.size());
	EXPECT_EQ("b", devices[0].identity.deviceId);
	EXPECT_EQ("a", devices[1].identity.deviceId);
	EXPECT_EQ(DeviceType_Glucose, devices[1].metadata.deviceType);

	DeviceInformation info;
	info.manufacturerName = "Ascensia";
	registry.updateDeviceInformation("a", info);

	RegisteredDevice found;
	ASSERT_TRUE(registry.findDevice("a", found));
	EXPECT_EQ("Ascensia", found.deviceInformation.manufacturerName);
	EXPECT_EQ("Unknown", found.deviceInformation.modelNumber);

	EXPECT_TRUE(registry.removeDevice("b"));
	EXPECT_FALSE(registry.removeDevice("b"));
	EXPECT_FALSE(registry.findDevice("b", found));
	EXPECT_EQ(1u, registry.listDevices().size());

	EXPECT_EQ(registry.getAcquisitionMutex("a"), registry.getAcquisitionMutex("a"));
	EXPECT_NE(registry.getAcquisitionMutex("a"), registry.getAcquisitionMutex("b"));
}

TEST(DeviceRegistryTest, AcquisitionMutexesGoOnceReleased)
{
	DeviceRegistry registry;

	{
		std::shared_ptr<std::mutex> held_mutex = registry.getAcquisitionMutex("a");
		registry.getAcquisitionMutex("b");
		EXPECT_EQ(2u, registry.getAcquisitionMutexCount());

		// Still held here
		registry.releaseAcquisitionMutex("a");
		registry.releaseAcquisitionMutex("b");
		EXPECT_EQ(1u, registry.getAcquisitionMutexCount());
		EXPECT_EQ(held_mutex, registry.getAcquisitionMutex("a"));
	}

	registry.releaseAcquisitionMutex("a");
	EXPECT_EQ(0u, registry.getAcquisitionMutexCount());

	// Unknown ids are ignored
	registry.releaseAcquisitionMutex("c");
}
