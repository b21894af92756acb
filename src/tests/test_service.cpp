//-- includes -----
#include "VSLService.h"
#include "ReplayBluetoothLEApi.h"
#include "ReplayTestScripts.h"

#include <gtest/gtest.h>

//-- definitions -----
class VSLServiceTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		VSLServiceSettings settings;
		settings.logLevel = VSLLogSeverityLevel_warning;
		settings.logFilename = "";
		settings.bUseConfigFiles = false;
		settings.bleManagerConfig.replay_config_name = "";
		settings.acquisitionConfig.proprietary_timeout_ms = 400;
		settings.acquisitionConfig.standard_timeout_ms = 400;
		settings.acquisitionConfig.characteristic_probe_timeout_ms = 100;

		ASSERT_TRUE(m_service.startup(settings));

		m_replay = m_service.getBLEDeviceManager()->getTypedBLEApiInterface<ReplayBluetoothLEApi>();
		ASSERT_TRUE(m_replay != nullptr);
	}

	void TearDown() override
	{
		m_service.shutdown();
	}

	VSLService m_service;
	ReplayBluetoothLEApi *m_replay;
};

TEST_F(VSLServiceTest, StartsOnTheReplayTransport)
{
	EXPECT_TRUE(m_service.getIsInitialized());
	EXPECT_EQ(m_replay, m_service.getBLEDeviceManager()->getActiveBLEApiInterface());
	EXPECT_EQ(0u, m_replay->getDeviceCount());
	EXPECT_STREQ("0.1.0.0", VSLService::getVersionString());
}

TEST_F(VSLServiceTest, AcquiresFromRegisteredDevice)
{
	m_replay->addDevice(make_transtek_cuff("cuff-1", make_framed_reading_fragments()));
	ASSERT_TRUE(m_service.registerDevice(
		DeviceIdentity("cuff-1", "Bedroom cuff"),
		DeviceMetadata("Bedroom cuff", DeviceType_BloodPressure)));

	AcquisitionResult result = m_service.acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", "Bedroom cuff"));
	ASSERT_EQ(AcquisitionStatus_Success, result.status);
	EXPECT_EQ(120, result.reading.bloodPressure.systolic);

	// Manufacturer and model were captured while linking
	std::vector<RegisteredDevice> devices = m_service.listDevices();
	ASSERT_EQ(1u, devices.size());
	EXPECT_EQ("Transtek", devices[0].deviceInformation.manufacturerName);
	EXPECT_EQ("TMB-1018", devices[0].deviceInformation.modelNumber);
}

TEST_F(VSLServiceTest, RemovingDeviceClosesItsLink)
{
	m_replay->addDevice(make_transtek_cuff("cuff-1", make_framed_reading_fragments()));
	ASSERT_TRUE(m_service.registerDevice(
		DeviceIdentity("cuff-1", "Bedroom cuff"),
		DeviceMetadata("Bedroom cuff", DeviceType_BloodPressure)));

	ASSERT_EQ(AcquisitionStatus_Success,
		m_service.acquireReading(DeviceType_BloodPressure, DeviceIdentity("cuff-1", "")).status);
	EXPECT_EQ(1, m_replay->getOpenLinkCount("cuff-1"));

	EXPECT_TRUE(m_service.removeDevice("cuff-1"));
	EXPECT_EQ(0, m_replay->getOpenLinkCount("cuff-1"));
	EXPECT_TRUE(m_service.listDevices().empty());
	EXPECT_FALSE(m_service.removeDevice("cuff-1"));
}

TEST_F(VSLServiceTest, RegisterRejectsMissingId)
{
	EXPECT_FALSE(m_service.registerDevice(DeviceIdentity("", "Nameless"), DeviceMetadata("Nameless", DeviceType_Glucose)));
	EXPECT_TRUE(m_service.listDevices().empty());
}

TEST(VSLServiceLifecycleTest, AcquireBeforeStartupFails)
{
	VSLService service;

	EXPECT_FALSE(service.getIsInitialized());
	AcquisitionResult result = service.acquireReading(DeviceType_Glucose, DeviceIdentity("meter-1", ""));
	EXPECT_EQ(AcquisitionStatus_DiscoveryFailed, result.status);
	EXPECT_FALSE(result.bHasReading);

	// Harmless without a running service
	service.cancelAcquisition("meter-1");
	service.shutdown();
}

// -- Manual Entry ----
TEST(ManualReadingTest, AcceptsPlausibleBloodPressure)
{
	DecodedReading reading;
	std::string reason;

	ASSERT_TRUE(VSLService::makeManualReading(DecodedReading::makeBloodPressure(135, 85, 70), reading, reason));
	EXPECT_EQ(ReadingConfidence_ManualFallback, reading.confidence);
	EXPECT_EQ("ManualEntry", reading.strategyName);
	EXPECT_EQ(135, reading.bloodPressure.systolic);
	EXPECT_TRUE(reason.empty());
}

TEST(ManualReadingTest, RejectsBrokenInvariants)
{
	DecodedReading reading;
	std::string reason;

	EXPECT_FALSE(VSLService::makeManualReading(DecodedReading::makeBloodPressure(80, 120, 70), reading, reason));
	EXPECT_FALSE(reason.empty());

	EXPECT_FALSE(VSLService::makeManualReading(DecodedReading::makeBloodPressure(120, 80, 0), reading, reason));
	EXPECT_FALSE(VSLService::makeManualReading(DecodedReading::makeGlucose(0, GlucoseContext_Fasting), reading, reason));

	// Manual entry skips the plausibility ranges heuristics get
	EXPECT_TRUE(VSLService::makeManualReading(DecodedReading::makeGlucose(700, GlucoseContext_Bedtime), reading, reason));
	EXPECT_EQ(ReadingConfidence_ManualFallback, reading.confidence);
}
