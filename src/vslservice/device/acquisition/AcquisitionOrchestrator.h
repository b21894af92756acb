#ifndef ACQUISITION_ORCHESTRATOR_H
#define ACQUISITION_ORCHESTRATOR_H

//-- includes -----
#include "AcquisitionConfig.h"
#include "ConnectionSession.h"
#include "FragmentQueue.h"
#include "ProtocolStrategyChain.h"
#include "ReadingValidator.h"
#include "ServiceProfile.h"

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

//-- constants -----
enum eAcquisitionStatus
{
	AcquisitionStatus_Success,
	AcquisitionStatus_ManualEntryRequired,	///< Nothing decodable arrived before the deadline
	AcquisitionStatus_DiscoveryFailed,
	AcquisitionStatus_LinkFailed,
	AcquisitionStatus_ProfileResolutionExhausted,
	AcquisitionStatus_Cancelled
};

//-- definitions -----
struct AcquisitionResult
{
	eAcquisitionStatus status;
	// Only meaningful when status is Success
	DecodedReading reading;
	bool bHasReading;
	std::string deviceId;
	std::string strategyName;
	int fragmentCount;
	std::chrono::milliseconds elapsed;
	DeviceInformation deviceInformation;

	AcquisitionResult();
};

/// Drives one reading from a device: session setup, profile resolution,
/// reassembly and decoding, with a deadline and a single reconnect.
/// Runs on the caller's thread.
class AcquisitionOrchestrator
{
public:
	using StrategyFactoryFunction = ProtocolStrategyChain::StrategyFactoryFunction;

	AcquisitionOrchestrator(
		IBluetoothLEApi *api,
		class DeviceRegistry *registry,
		ServiceProfileCatalog *catalog,
		const AcquisitionConfig &config);
	virtual ~AcquisitionOrchestrator();

	// Proprietary, standard and generic decoders for blood pressure, standard for glucose
	void registerDefaultStrategies();

	// -- Strategy Factory ---
	// Factories run in registration order, each call appends to the end of the chain
	void registerStrategyFactory(eDeviceType device_type, StrategyFactoryFunction factory_func);
	ProtocolStrategyChainPtr buildStrategyChain(eDeviceType device_type) const;

	AcquisitionResult acquireReading(eDeviceType device_type, const DeviceIdentity &identity);

	// Safe from any thread. Returns once the in-flight attempt (if any) has
	// released its link. Without an attempt it just closes any idle session.
	void cancelAcquisition(const std::string &device_id);

	inline const AcquisitionConfig &getConfig() const { return m_config; }
	inline const ReadingValidator &getValidator() const { return m_validator; }

	static const char *statusToString(eAcquisitionStatus status);

private:
	struct AcquisitionAttempt
	{
		AcquisitionAttempt();

		void setSession(ConnectionSessionPtr session);
		ConnectionSessionPtr getSession() const;
		void cancel();
		bool isCancelled() const;

		FragmentQueue queue;
		bool bFinished;

	private:
		mutable std::mutex m_attemptMutex;
		ConnectionSessionPtr m_session;
		bool m_bCancelled;
	};
	typedef std::shared_ptr<AcquisitionAttempt> AcquisitionAttemptPtr;
	friend class AttemptScope;

	eSessionError prepareSession(
		const DeviceIdentity &identity,
		const ServiceProfileList &profiles,
		AcquisitionAttempt &attempt,
		ConnectionSessionPtr &session);
	void discardSession(const std::string &device_id, ConnectionSessionPtr session);

	bool beginAttempt(const std::string &device_id, AcquisitionAttemptPtr attempt);
	void moveAttempt(const std::string &from_device_id, const std::string &to_device_id, AcquisitionAttemptPtr attempt);
	void endAttempt(const std::string &device_id, AcquisitionAttemptPtr attempt);

	IBluetoothLEApi *m_api;
	class DeviceRegistry *m_registry;
	ServiceProfileCatalog *m_catalog;
	AcquisitionConfig m_config;
	ReadingValidator m_validator;

	mutable std::mutex m_factoryMutex;
	std::vector<std::pair<eDeviceType, StrategyFactoryFunction> > m_strategyFactories;

	std::mutex m_inFlightMutex;
	std::condition_variable m_attemptFinishedCondition;
	std::map<std::string, AcquisitionAttemptPtr> m_inFlightAttempts;
};

#endif // ACQUISITION_ORCHESTRATOR_H
