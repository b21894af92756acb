//-- includes -----
#include "AcquisitionOrchestrator.h"
#include "DeviceRegistry.h"
#include "FragmentQueue.h"
#include "ReplayBluetoothLEApi.h"
#include "ReplayTestScripts.h"
#include "ServiceProfile.h"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
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

static std::vector<ReplayFragment> make_standard_reading_fragments()
{
	// flags 0 (mmHg), SFLOAT 120 / 80 / 72
	return { ReplayFragment(5, { 0x00, 0x78, 0x00, 0x50, 0x00, 0x48, 0x00 }) };
}

static std::vector<ReplayFragment> make_glucose_reading_fragments()
{
	// context 1 (fasting), seq 2, 2024-01-20 07:15:00, 98 mg/dL
	return { ReplayFragment(5, { 0x01, 0x02, 0x00, 0xE8, 0x07, 0x01, 0x14, 0x07, 0x0F, 0x00, 0x62, 0x00 }) };
}

class AcquisitionOrchestratorTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		m_catalog.registerBuiltInProfiles();
		m_api.startup();

		m_config.proprietary_timeout_ms = 400;
		m_config.standard_timeout_ms = 400;
		m_config.characteristic_probe_timeout_ms = 100;
		m_config.max_reconnect_attempts = 1;

		m_orchestrator = new AcquisitionOrchestrator(&m_api, &m_registry, &m_catalog, m_config);
		m_orchestrator->registerDefaultStrategies();
	}

	void TearDown() override
	{
		delete m_orchestrator;
		m_orchestrator = nullptr;

		m_registry.closeAllSessions();
		m_api.shutdown();
	}

	ServiceProfileCatalog m_catalog;
	ReplayBluetoothLEApi m_api;
	DeviceRegistry m_registry;
	AcquisitionConfig m_config;
	AcquisitionOrchestrator *m_orchestrator;
};

// -- Readings ----
TEST_F(AcquisitionOrchestratorTest, FramedCuffReadingIsHeuristic)
{
	m_api.addDevice(make_transtek_cuff("cuff-1", make_framed_reading_fragments()));

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", ""));

	ASSERT_EQ(AcquisitionStatus_Success, result.status);
	ASSERT_TRUE(result.bHasReading);
	EXPECT_EQ(DeviceType_BloodPressure, result.reading.kind);
	EXPECT_EQ(120, result.reading.bloodPressure.systolic);
	EXPECT_EQ(80, result.reading.bloodPressure.diastolic);
	EXPECT_EQ(72, result.reading.bloodPressure.pulse);
	EXPECT_EQ(ReadingConfidence_HeuristicAccepted, result.reading.confidence);
	EXPECT_EQ("ProprietaryFramed", result.strategyName);
	EXPECT_EQ(2, result.fragmentCount);
	EXPECT_EQ("cuff-1", result.deviceId);
	EXPECT_EQ("Transtek", result.deviceInformation.manufacturerName);

	// The link stays up for the next reading
	ConnectionSessionPtr session = m_registry.get("cuff-1");
	ASSERT_TRUE(session != nullptr);
	EXPECT_EQ(SessionState_LinkEstablished, session->getState());
	EXPECT_EQ(1, m_api.getOpenLinkCount("cuff-1"));
}

TEST_F(AcquisitionOrchestratorTest, StandardCuffReadingIsDeviceConfirmed)
{
	m_api.addDevice(make_standard_cuff("bp-1", make_standard_reading_fragments()));

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("bp-1", ""));

	ASSERT_EQ(AcquisitionStatus_Success, result.status);
	EXPECT_EQ(120, result.reading.bloodPressure.systolic);
	EXPECT_EQ(80, result.reading.bloodPressure.diastolic);
	EXPECT_EQ(72, result.reading.bloodPressure.pulse);
	EXPECT_EQ(ReadingConfidence_DeviceConfirmed, result.reading.confidence);
	EXPECT_EQ("StandardBloodPressure", result.strategyName);
	EXPECT_EQ("Omron", result.deviceInformation.manufacturerName);
}

TEST_F(AcquisitionOrchestratorTest, GlucoseMeterReading)
{
	m_api.addDevice(make_glucose_meter("meter-1", make_glucose_reading_fragments()));

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_Glucose, DeviceIdentity("meter-1", ""));

	ASSERT_EQ(AcquisitionStatus_Success, result.status);
	EXPECT_EQ(DeviceType_Glucose, result.reading.kind);
	EXPECT_EQ(98, result.reading.glucose.concentration);
	EXPECT_EQ(GlucoseContext_Fasting, result.reading.glucose.context);
	EXPECT_EQ(2, result.reading.glucose.sequenceNumber);
	EXPECT_EQ(ReadingConfidence_DeviceConfirmed, result.reading.confidence);
	EXPECT_EQ("Unknown", result.deviceInformation.modelNumber);
}

TEST_F(AcquisitionOrchestratorTest, SilentDeviceRequiresManualEntry)
{
	m_api.addDevice(make_transtek_cuff("cuff-1", std::vector<ReplayFragment>()));

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", ""));

	EXPECT_EQ(AcquisitionStatus_ManualEntryRequired, result.status);
	EXPECT_FALSE(result.bHasReading);
	EXPECT_EQ(0, result.fragmentCount);
	EXPECT_GE(result.elapsed.count(), 400);

	// Timed out sessions are torn down
	EXPECT_EQ(0u, m_registry.getSessionCount());
	EXPECT_EQ(0, m_api.getOpenLinkCount("cuff-1"));
}

TEST_F(AcquisitionOrchestratorTest, UndecodableBytesRequireManualEntry)
{
	m_api.addDevice(make_transtek_cuff("cuff-1", {
		ReplayFragment(5, { 0xAA, 0x08, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF })
	}));

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", ""));

	EXPECT_EQ(AcquisitionStatus_ManualEntryRequired, result.status);
	EXPECT_FALSE(result.bHasReading);
	EXPECT_EQ(1, result.fragmentCount);
}

TEST_F(AcquisitionOrchestratorTest, UnknownDeviceFailsDiscovery)
{
	m_api.addDevice(make_transtek_cuff("cuff-1", make_framed_reading_fragments()));

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("missing", ""));

	EXPECT_EQ(AcquisitionStatus_DiscoveryFailed, result.status);
	EXPECT_FALSE(result.bHasReading);
	EXPECT_EQ(0u, m_registry.getSessionCount());
}

TEST_F(AcquisitionOrchestratorTest, ProbesUnknownCharacteristics)
{
	m_api.addDevice(make_silent_vendor_cuff("quiet-1", make_framed_reading_fragments()));

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("quiet-1", ""));

	ASSERT_EQ(AcquisitionStatus_Success, result.status);
	EXPECT_EQ(120, result.reading.bloodPressure.systolic);
}

TEST_F(AcquisitionOrchestratorTest, NothingToProbeIsExhausted)
{
	m_api.addDevice(make_silent_vendor_cuff("quiet-1", std::vector<ReplayFragment>()));

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("quiet-1", ""));

	EXPECT_EQ(AcquisitionStatus_ProfileResolutionExhausted, result.status);
	EXPECT_EQ(0, m_api.getOpenLinkCount("quiet-1"));
}

TEST_F(AcquisitionOrchestratorTest, ProbedCharacteristicGetsVendorDeadline)
{
	m_config.proprietary_timeout_ms = 1500;
	m_config.standard_timeout_ms = 100;
	delete m_orchestrator;
	m_orchestrator = new AcquisitionOrchestrator(&m_api, &m_registry, &m_catalog, m_config);
	m_orchestrator->registerDefaultStrategies();

	// The second half arrives well after the standard deadline
	m_api.addDevice(make_silent_vendor_cuff("quiet-1", {
		ReplayFragment(5, { 0xAA, 0x08 }),
		ReplayFragment(300, { 0x00, 0x78, 0x00, 0x50, 0x00, 0x48, 0x00 }) }));

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("quiet-1", ""));

	ASSERT_EQ(AcquisitionStatus_Success, result.status);
	EXPECT_EQ(120, result.reading.bloodPressure.systolic);
	EXPECT_EQ(ReadingConfidence_HeuristicAccepted, result.reading.confidence);
}

TEST_F(AcquisitionOrchestratorTest, StandardLayoutOnVendorCharacteristicIsNotTrusted)
{
	// Reads as 100/0/72 in the standard layout
	m_api.addDevice(make_transtek_cuff("cuff-1", {
		ReplayFragment(5, { 0x00, 0x64, 0x00, 0x00, 0x00, 0x48, 0x00 }) }));

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", ""));

	EXPECT_EQ(AcquisitionStatus_ManualEntryRequired, result.status);
	EXPECT_FALSE(result.bHasReading);
}

// -- Reconnect ----
TEST_F(AcquisitionOrchestratorTest, ReconnectsOnceAfterLinkLoss)
{
	ReplayDeviceScript script = make_transtek_cuff("cuff-1", make_framed_reading_fragments());
	script.dropLinkAfterFragments = 1;
	m_api.addDevice(script);

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", ""));

	ASSERT_EQ(AcquisitionStatus_Success, result.status);
	EXPECT_EQ(120, result.reading.bloodPressure.systolic);
	EXPECT_EQ(2, m_api.getOpenAttemptCount("cuff-1"));
	EXPECT_EQ(1, m_api.getMaxConcurrentLinks("cuff-1"));
	// One fragment before the drop, two after
	EXPECT_EQ(3, result.fragmentCount);
}

TEST_F(AcquisitionOrchestratorTest, ReconnectsOnceAfterConnectFailure)
{
	ReplayDeviceScript script = make_transtek_cuff("cuff-1", make_framed_reading_fragments());
	script.connectFailuresBeforeSuccess = 1;
	m_api.addDevice(script);

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", ""));

	ASSERT_EQ(AcquisitionStatus_Success, result.status);
	EXPECT_EQ(2, m_api.getOpenAttemptCount("cuff-1"));
}

TEST_F(AcquisitionOrchestratorTest, GivesUpAfterSecondConnectFailure)
{
	ReplayDeviceScript script = make_transtek_cuff("cuff-1", make_framed_reading_fragments());
	script.connectFailuresBeforeSuccess = 2;
	m_api.addDevice(script);

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", ""));

	EXPECT_EQ(AcquisitionStatus_LinkFailed, result.status);
	EXPECT_FALSE(result.bHasReading);
	EXPECT_EQ(2, m_api.getOpenAttemptCount("cuff-1"));
	EXPECT_EQ(0u, m_registry.getSessionCount());
}

TEST_F(AcquisitionOrchestratorTest, DroppedIdleLinkGetsAFreshSession)
{
	m_api.addDevice(make_transtek_cuff("cuff-1", make_framed_reading_fragments()));

	ASSERT_EQ(AcquisitionStatus_Success,
		m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", "")).status);
	ConnectionSessionPtr first_session = m_registry.get("cuff-1");
	ASSERT_TRUE(first_session != nullptr);

	ASSERT_TRUE(m_api.simulateDisconnect("cuff-1"));
	ASSERT_TRUE(wait_for_condition([this]() { return m_registry.getSessionCount() == 0; }, 2000));

	ASSERT_EQ(AcquisitionStatus_Success,
		m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", "")).status);

	ConnectionSessionPtr second_session = m_registry.get("cuff-1");
	ASSERT_TRUE(second_session != nullptr);
	EXPECT_NE(first_session, second_session);
	EXPECT_EQ(SessionState_Closed, first_session->getState());
	EXPECT_EQ(2, m_api.getOpenAttemptCount("cuff-1"));
}

// -- Exclusivity ----
TEST_F(AcquisitionOrchestratorTest, ConcurrentAcquisitionsShareOneLink)
{
	m_api.addDevice(make_transtek_cuff("cuff-1", make_framed_reading_fragments(20)));

	AcquisitionResult first_result;
	AcquisitionResult second_result;

	std::thread first_thread([&]()
	{
		first_result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", ""));
	});
	std::thread second_thread([&]()
	{
		second_result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", ""));
	});

	first_thread.join();
	second_thread.join();

	EXPECT_EQ(AcquisitionStatus_Success, first_result.status);
	EXPECT_EQ(AcquisitionStatus_Success, second_result.status);
	EXPECT_EQ(1, m_api.getMaxConcurrentLinks("cuff-1"));
	// The second acquisition reuses the established link
	EXPECT_EQ(1, m_api.getOpenAttemptCount("cuff-1"));
}

// -- Cancellation ----
TEST_F(AcquisitionOrchestratorTest, CancelFromAnotherThread)
{
	m_config.proprietary_timeout_ms = 10000;
	delete m_orchestrator;
	m_orchestrator = new AcquisitionOrchestrator(&m_api, &m_registry, &m_catalog, m_config);
	m_orchestrator->registerDefaultStrategies();

	m_api.addDevice(make_transtek_cuff("cuff-1", std::vector<ReplayFragment>()));

	std::thread canceller([this]()
	{
		wait_for_condition([this]() { return m_api.getOpenLinkCount("cuff-1") == 1; }, 2000);
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
		m_orchestrator->cancelAcquisition("cuff-1");
	});

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", ""));
	canceller.join();

	EXPECT_EQ(AcquisitionStatus_Cancelled, result.status);
	EXPECT_FALSE(result.bHasReading);
	EXPECT_LT(result.elapsed.count(), 5000);
	EXPECT_EQ(0, m_api.getOpenLinkCount("cuff-1"));
	EXPECT_EQ(0u, m_registry.getSessionCount());
}

TEST_F(AcquisitionOrchestratorTest, CancelByDiscoveredIdDuringAnonymousAcquisition)
{
	m_config.proprietary_timeout_ms = 10000;
	delete m_orchestrator;
	m_orchestrator = new AcquisitionOrchestrator(&m_api, &m_registry, &m_catalog, m_config);
	m_orchestrator->registerDefaultStrategies();

	m_api.addDevice(make_transtek_cuff("cuff-1", std::vector<ReplayFragment>()));

	std::thread canceller([this]()
	{
		wait_for_condition([this]() { return m_api.getOpenLinkCount("cuff-1") == 1; }, 2000);
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
		m_orchestrator->cancelAcquisition("cuff-1");
	});

	AcquisitionResult result = m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("", ""));
	canceller.join();

	EXPECT_EQ(AcquisitionStatus_Cancelled, result.status);
	EXPECT_EQ("cuff-1", result.deviceId);
	EXPECT_LT(result.elapsed.count(), 5000);
	EXPECT_EQ(0, m_api.getOpenLinkCount("cuff-1"));
	// Cancelled rather than reconnected
	EXPECT_EQ(1, m_api.getOpenAttemptCount("cuff-1"));
	EXPECT_EQ(0u, m_registry.getSessionCount());
	EXPECT_EQ(0u, m_registry.getAcquisitionMutexCount());
}

TEST_F(AcquisitionOrchestratorTest, DestroyingOrchestratorCancelsInFlightAcquisition)
{
	m_config.proprietary_timeout_ms = 10000;
	AcquisitionOrchestrator *orchestrator = new AcquisitionOrchestrator(&m_api, &m_registry, &m_catalog, m_config);
	orchestrator->registerDefaultStrategies();

	m_api.addDevice(make_transtek_cuff("cuff-1", std::vector<ReplayFragment>()));

	AcquisitionResult result;
	std::thread acquirer([orchestrator, &result]()
	{
		result = orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", ""));
	});

	ASSERT_TRUE(wait_for_condition([this]() { return m_api.getOpenLinkCount("cuff-1") == 1; }, 2000));
	std::this_thread::sleep_for(std::chrono::milliseconds(50));

	// Waits for the attempt to wind down before the members go away
	delete orchestrator;
	acquirer.join();

	EXPECT_EQ(AcquisitionStatus_Cancelled, result.status);
	EXPECT_EQ(0, m_api.getOpenLinkCount("cuff-1"));
}

TEST_F(AcquisitionOrchestratorTest, CancelWithoutAttemptClosesIdleSession)
{
	m_api.addDevice(make_transtek_cuff("cuff-1", make_framed_reading_fragments()));

	ASSERT_EQ(AcquisitionStatus_Success,
		m_orchestrator->acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", "")).status);
	ASSERT_EQ(1u, m_registry.getSessionCount());

	m_orchestrator->cancelAcquisition("cuff-1");
	EXPECT_EQ(0u, m_registry.getSessionCount());
	EXPECT_EQ(0, m_api.getOpenLinkCount("cuff-1"));

	// Nothing to cancel
	m_orchestrator->cancelAcquisition("cuff-1");
}

// -- Strategy Factory ----
TEST_F(AcquisitionOrchestratorTest, BuildsChainsPerDeviceType)
{
	EXPECT_EQ(3u, m_orchestrator->buildStrategyChain(DeviceType_BloodPressure)->getStrategyCount());
	EXPECT_EQ(1u, m_orchestrator->buildStrategyChain(DeviceType_Glucose)->getStrategyCount());
}

// -- FragmentQueue ----
TEST(FragmentQueueTest, HandsOutPendingFragmentsBeforeLinkLoss)
{
	FragmentQueue queue;
	queue.notifyFragmentReceived("cuff-1", std::vector<uint8_t>{ 0x01 });
	queue.notifyFragmentReceived("cuff-1", std::vector<uint8_t>{ 0x02 });
	queue.notifyLinkLost("cuff-1");

	const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(100);
	std::vector<uint8_t> fragment;

	ASSERT_EQ(FragmentWait_Fragment, queue.waitForFragment(deadline, fragment));
	EXPECT_EQ(std::vector<uint8_t>{ 0x01 }, fragment);
	ASSERT_EQ(FragmentWait_Fragment, queue.waitForFragment(deadline, fragment));
	EXPECT_EQ(std::vector<uint8_t>{ 0x02 }, fragment);
	EXPECT_EQ(FragmentWait_LinkLost, queue.waitForFragment(deadline, fragment));
	EXPECT_EQ(2, queue.getReceivedCount());

	queue.resetForReconnect();
	EXPECT_EQ(FragmentWait_Timeout,
		queue.waitForFragment(std::chrono::steady_clock::now() + std::chrono::milliseconds(10), fragment));
}

TEST(FragmentQueueTest, CancelWinsOverEverything)
{
	FragmentQueue queue;
	queue.notifyFragmentReceived("cuff-1", std::vector<uint8_t>{ 0x01 });
	queue.notifyLinkLost("cuff-1");
	queue.cancel();

	std::vector<uint8_t> fragment;
	EXPECT_TRUE(queue.isCancelled());
	EXPECT_EQ(FragmentWait_Cancelled,
		queue.waitForFragment(std::chrono::steady_clock::now() + std::chrono::milliseconds(10), fragment));
}

TEST(FragmentQueueTest, WakesWaiterFromAnotherThread)
{
	FragmentQueue queue;

	std::thread producer([&queue]()
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(20));
		queue.notifyFragmentReceived("cuff-1", std::vector<uint8_t>{ 0xAA, 0x08 });
	});

	std::vector<uint8_t> fragment;
	const eFragmentWaitResult wait_result =
		queue.waitForFragment(std::chrono::steady_clock::now() + std::chrono::milliseconds(2000), fragment);
	producer.join();

	EXPECT_EQ(FragmentWait_Fragment, wait_result);
	EXPECT_EQ(2u, fragment.size());
}
