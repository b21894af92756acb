//-- includes -----
#include "AcquisitionOrchestrator.h"
#include "DeviceRegistry.h"
#include "FrameBuffer.h"
#include "GenericScanStrategy.h"
#include "ProprietaryFramedStrategy.h"
#include "StandardBloodPressureStrategy.h"
#include "StandardGlucoseStrategy.h"
#include "Logger.h"

//-- private definitions -----
/// Keeps an attempt visible to cancelAcquisition for as long as it runs
class AttemptScope
{
public:
	AttemptScope(
		AcquisitionOrchestrator *orchestrator,
		const std::string &device_id,
		AcquisitionOrchestrator::AcquisitionAttemptPtr attempt)
		: m_orchestrator(orchestrator)
		, m_deviceId(device_id)
		, m_attempt(attempt)
	{
		m_orchestrator->beginAttempt(m_deviceId, m_attempt);
	}

	~AttemptScope()
	{
		m_orchestrator->endAttempt(m_deviceId, m_attempt);
	}

	// Anonymous attempts become cancellable by the id discovery found
	void rebind(const std::string &device_id)
	{
		if (device_id != m_deviceId)
		{
			m_orchestrator->moveAttempt(m_deviceId, device_id, m_attempt);
			m_deviceId = device_id;
		}
	}

private:
	AcquisitionOrchestrator *m_orchestrator;
	std::string m_deviceId;
	AcquisitionOrchestrator::AcquisitionAttemptPtr m_attempt;
};

/// Holds the registry's per-device acquisition mutex and hands it back on exit
class AcquisitionLock
{
public:
	AcquisitionLock(DeviceRegistry *registry, const std::string &device_id)
		: m_registry(registry)
		, m_deviceId(device_id)
		, m_mutex(registry->getAcquisitionMutex(device_id))
	{
		m_mutex->lock();
	}

	~AcquisitionLock()
	{
		m_mutex->unlock();
		m_mutex.reset();
		m_registry->releaseAcquisitionMutex(m_deviceId);
	}

private:
	AcquisitionLock(const AcquisitionLock &);
	AcquisitionLock &operator = (const AcquisitionLock &);

	DeviceRegistry *m_registry;
	std::string m_deviceId;
	std::shared_ptr<std::mutex> m_mutex;
};

// -- AcquisitionResult ----
AcquisitionResult::AcquisitionResult()
	: status(AcquisitionStatus_ManualEntryRequired)
	, reading()
	, bHasReading(false)
	, deviceId()
	, strategyName()
	, fragmentCount(0)
	, elapsed(0)
	, deviceInformation()
{
}

// -- AcquisitionAttempt ----
AcquisitionOrchestrator::AcquisitionAttempt::AcquisitionAttempt()
	: queue()
	, bFinished(false)
	, m_session()
	, m_bCancelled(false)
{
}

void AcquisitionOrchestrator::AcquisitionAttempt::setSession(ConnectionSessionPtr session)
{
	bool bAbortSession = false;

	{
		std::lock_guard<std::mutex> lock(m_attemptMutex);
		m_session = session;
		bAbortSession = m_bCancelled;
	}

	// Cancelled before the session existed
	if (bAbortSession && session)
	{
		session->requestAbort();
	}
}

ConnectionSessionPtr AcquisitionOrchestrator::AcquisitionAttempt::getSession() const
{
	std::lock_guard<std::mutex> lock(m_attemptMutex);
	return m_session;
}

void AcquisitionOrchestrator::AcquisitionAttempt::cancel()
{
	ConnectionSessionPtr session;

	{
		std::lock_guard<std::mutex> lock(m_attemptMutex);
		m_bCancelled = true;
		session = m_session;
	}

	queue.cancel();

	if (session)
	{
		session->requestAbort();
	}
}

bool AcquisitionOrchestrator::AcquisitionAttempt::isCancelled() const
{
	std::lock_guard<std::mutex> lock(m_attemptMutex);
	return m_bCancelled;
}

// -- AcquisitionOrchestrator ----
AcquisitionOrchestrator::AcquisitionOrchestrator(
	IBluetoothLEApi *api,
	DeviceRegistry *registry,
	ServiceProfileCatalog *catalog,
	const AcquisitionConfig &config)
	: m_api(api)
	, m_registry(registry)
	, m_catalog(catalog)
	, m_config(config)
	, m_validator()
{
}

AcquisitionOrchestrator::~AcquisitionOrchestrator()
{
	std::vector<std::string> in_flight_ids;

	{
		std::lock_guard<std::mutex> lock(m_inFlightMutex);

		for (auto it = m_inFlightAttempts.begin(); it != m_inFlightAttempts.end(); ++it)
		{
			in_flight_ids.push_back(it->first);
		}
	}

	for (const std::string &device_id : in_flight_ids)
	{
		VSL_LOG_WARNING("~AcquisitionOrchestrator") << "Cancelling in-flight acquisition for " << device_id;
		cancelAcquisition(device_id);
	}
}

void AcquisitionOrchestrator::registerDefaultStrategies()
{
	registerStrategyFactory(DeviceType_BloodPressure, ProprietaryFramedStrategy::ProprietaryFramedStrategyFactory);
	registerStrategyFactory(DeviceType_BloodPressure, StandardBloodPressureStrategy::StandardBloodPressureStrategyFactory);
	registerStrategyFactory(DeviceType_BloodPressure, GenericScanStrategy::GenericScanStrategyFactory);
	registerStrategyFactory(DeviceType_Glucose, StandardGlucoseStrategy::StandardGlucoseStrategyFactory);
}

// -- Strategy Factory ---
void AcquisitionOrchestrator::registerStrategyFactory(
	eDeviceType device_type,
	StrategyFactoryFunction factory_func)
{
	if (!factory_func)
		return;

	std::lock_guard<std::mutex> lock(m_factoryMutex);
	m_strategyFactories.push_back(std::make_pair(device_type, factory_func));
}

ProtocolStrategyChainPtr AcquisitionOrchestrator::buildStrategyChain(eDeviceType device_type) const
{
	ProtocolStrategyChainPtr chain(new ProtocolStrategyChain(device_type));
	std::lock_guard<std::mutex> lock(m_factoryMutex);

	for (auto it = m_strategyFactories.begin(); it != m_strategyFactories.end(); ++it)
	{
		if (it->first == device_type)
		{
			chain->addStrategy(it->second());
		}
	}

	return chain;
}

AcquisitionResult AcquisitionOrchestrator::acquireReading(eDeviceType device_type, const DeviceIdentity &identity)
{
	const std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();
	AcquisitionResult result;
	result.deviceId = identity.deviceId;

	const ServiceProfileList profiles = m_catalog->getProfilesForDeviceType(device_type);
	ProtocolStrategyChainPtr chain = buildStrategyChain(device_type);

	if (profiles.empty() || chain->getStrategyCount() == 0)
	{
		VSL_LOG_ERROR("AcquisitionOrchestrator::acquireReading")
			<< "No profiles or decoders registered for device type " << device_type_to_string(device_type);
		result.status = AcquisitionStatus_DiscoveryFailed;
		return result;
	}

	// One acquisition per device at a time
	AcquisitionLock acquisition_lock(m_registry, identity.deviceId);

	AcquisitionAttemptPtr attempt(new AcquisitionAttempt);
	AttemptScope attempt_scope(this, identity.deviceId, attempt);

	VSL_LOG_INFO("AcquisitionOrchestrator::acquireReading")
		<< "Acquiring " << device_type_to_string(device_type) << " reading from '" << identity.deviceId << "'";

	FrameBuffer frame_buffer;
	ConnectionSessionPtr session;
	int reconnects_used = 0;
	bool bDone = false;

	while (!bDone)
	{
		eAcquisitionStatus failure_status = AcquisitionStatus_LinkFailed;

		if (attempt->isCancelled())
		{
			result.status = AcquisitionStatus_Cancelled;
			break;
		}

		// Session setup
		eSessionError session_error = prepareSession(identity, profiles, *attempt, session);
		if (session_error == SessionError_DiscoveryFailed)
		{
			result.status = AcquisitionStatus_DiscoveryFailed;
			break;
		}

		if (session_error == SessionError_None)
		{
			result.deviceId = session->getDeviceIdentity().deviceId;
			result.deviceInformation = session->getDeviceInformation();
			attempt_scope.rebind(result.deviceId);

			if (attempt->isCancelled())
			{
				result.status = AcquisitionStatus_Cancelled;
				break;
			}

			// Profile resolution
			session_error =
				session->resolveProfile(
					profiles,
					&attempt->queue,
					m_config.characteristic_probe_timeout_ms);

			if (session_error == SessionError_Aborted || attempt->isCancelled())
			{
				result.status = AcquisitionStatus_Cancelled;
				break;
			}

			if (session_error == SessionError_ProfileResolutionExhausted)
			{
				failure_status = AcquisitionStatus_ProfileResolutionExhausted;
			}
		}

		if (session_error == SessionError_None)
		{
			// Streaming
			// A characteristic found by probing gets the vendor deadline
			ServiceProfilePtr resolved_profile = session->getResolvedProfile();
			const int timeout_ms =
				(!resolved_profile || resolved_profile->isProprietary())
				? m_config.proprietary_timeout_ms
				: m_config.standard_timeout_ms;
			const std::chrono::steady_clock::time_point deadline =
				std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

			VSL_LOG_INFO("AcquisitionOrchestrator::acquireReading")
				<< "Streaming from " << (resolved_profile ? resolved_profile->profileName : std::string("fallback characteristic"))
				<< ", deadline " << timeout_ms << "ms";

			bool bLinkLost = false;
			while (!bDone && !bLinkLost)
			{
				std::vector<uint8_t> fragment;

				switch (attempt->queue.waitForFragment(deadline, fragment))
				{
				case FragmentWait_Fragment:
					{
						++result.fragmentCount;
						frame_buffer.append(fragment);

						if (log_can_emit_level(VSLLogSeverityLevel_debug))
						{
							VSL_LOG_DEBUG("AcquisitionOrchestrator::acquireReading")
								<< "Buffer [" << frame_buffer.getSize() << " bytes] " << log_format_hex(frame_buffer.snapshot());
						}

						DecodedReading reading;
						const eChainResult chain_result =
							chain->evaluate(frame_buffer.snapshot(), resolved_profile.get(), m_validator, reading);

						if (chain_result == ChainResult_Decoded)
						{
							session->stopNotifications();

							VSL_LOG_DEBUG("AcquisitionOrchestrator::acquireReading")
								<< "Frame completed "
								<< std::chrono::duration_cast<std::chrono::milliseconds>(
									std::chrono::steady_clock::now() - frame_buffer.getFirstByteTime()).count()
								<< "ms after its first byte";

							result.status = AcquisitionStatus_Success;
							result.reading = reading;
							result.bHasReading = true;
							result.strategyName = reading.strategyName;
							bDone = true;
						}
						else if (frame_buffer.getSize() >= static_cast<size_t>(m_config.max_frame_buffer_size))
						{
							VSL_LOG_WARNING("AcquisitionOrchestrator::acquireReading")
								<< "Frame buffer reached " << frame_buffer.getSize()
								<< " bytes without a decodable reading, discarding";
							frame_buffer.reset();
						}
					} break;
				case FragmentWait_Timeout:
					VSL_LOG_WARNING("AcquisitionOrchestrator::acquireReading")
						<< "No decodable reading from " << result.deviceId << " within " << timeout_ms << "ms";
					result.status = AcquisitionStatus_ManualEntryRequired;
					bDone = true;
					break;
				case FragmentWait_Cancelled:
					result.status = AcquisitionStatus_Cancelled;
					bDone = true;
					break;
				case FragmentWait_LinkLost:
					VSL_LOG_WARNING("AcquisitionOrchestrator::acquireReading") << "Link lost mid-stream";
					// Waits out the transport's disconnect handling
					session->stopNotifications();
					bLinkLost = true;
					break;
				}
			}

			if (bDone)
				break;
		}

		// Transport failure: one reconnect with a clean buffer
		if (reconnects_used < m_config.max_reconnect_attempts && !attempt->isCancelled())
		{
			++reconnects_used;
			VSL_LOG_WARNING("AcquisitionOrchestrator::acquireReading")
				<< "Transport failure (" << statusToString(failure_status) << "), reconnect attempt "
				<< reconnects_used << " of " << m_config.max_reconnect_attempts;

			if (session)
			{
				session->stopNotifications();
			}
			frame_buffer.reset();
			attempt->queue.resetForReconnect();
			continue;
		}

		result.status = attempt->isCancelled() ? AcquisitionStatus_Cancelled : failure_status;
		bDone = true;
	}

	// Teardown
	if (session)
	{
		if (result.status == AcquisitionStatus_Success)
		{
			// Stays in the registry, ready for the next acquisition
			session->stopNotifications();
		}
		else
		{
			discardSession(result.deviceId, session);
		}
	}

	result.elapsed =
		std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);

	if (result.status == AcquisitionStatus_Success)
	{
		VSL_LOG_INFO("AcquisitionOrchestrator::acquireReading")
			<< "Acquired reading from " << result.deviceId << " via " << result.strategyName
			<< " after " << result.fragmentCount << " fragments (" << result.elapsed.count() << "ms)";
	}
	else
	{
		VSL_LOG_WARNING("AcquisitionOrchestrator::acquireReading")
			<< "Acquisition from " << result.deviceId << " ended with " << statusToString(result.status)
			<< " after " << result.elapsed.count() << "ms";
	}

	return result;
}

void AcquisitionOrchestrator::cancelAcquisition(const std::string &device_id)
{
	AcquisitionAttemptPtr attempt;

	{
		std::lock_guard<std::mutex> lock(m_inFlightMutex);
		auto it = m_inFlightAttempts.find(device_id);

		if (it != m_inFlightAttempts.end())
		{
			attempt = it->second;
		}
	}

	if (attempt)
	{
		VSL_LOG_INFO("AcquisitionOrchestrator::cancelAcquisition") << "Cancelling acquisition for " << device_id;
		attempt->cancel();

		std::unique_lock<std::mutex> lock(m_inFlightMutex);
		m_attemptFinishedCondition.wait(lock, [&attempt]() { return attempt->bFinished; });
	}
	else
	{
		ConnectionSessionPtr session = m_registry->remove(device_id);

		if (session)
		{
			VSL_LOG_INFO("AcquisitionOrchestrator::cancelAcquisition") << "Closing idle session for " << device_id;
			session->close();
		}
	}
}

eSessionError AcquisitionOrchestrator::prepareSession(
	const DeviceIdentity &identity,
	const ServiceProfileList &profiles,
	AcquisitionAttempt &attempt,
	ConnectionSessionPtr &session)
{
	eSessionError error = SessionError_None;

	// Retry on a session that is still alive
	if (session && session->getState() != SessionState_Closed)
	{
		error = session->reconnect();

		if (error == SessionError_None)
		{
			m_registry->add(session->getDeviceIdentity().deviceId, session);
		}

		return error;
	}

	if (!session)
	{
		ConnectionSessionPtr existing_session = m_registry->get(identity.deviceId);

		if (existing_session)
		{
			if (existing_session->getState() == SessionState_LinkEstablished)
			{
				VSL_LOG_INFO("AcquisitionOrchestrator::prepareSession") << "Reusing established link to " << identity.deviceId;
				session = existing_session;
				attempt.setSession(session);
				return SessionError_None;
			}

			discardSession(identity.deviceId, existing_session);
		}
	}

	session = ConnectionSession::create(m_api, identity);
	attempt.setSession(session);

	error = session->discover(profiles);
	if (error != SessionError_None)
	{
		session->close();
		return error;
	}

	error = session->establishLink();
	if (error != SessionError_None)
		return error;

	const std::string device_id = session->getDeviceIdentity().deviceId;
	m_registry->add(device_id, session);
	m_registry->updateDeviceInformation(device_id, session->getDeviceInformation());

	return SessionError_None;
}

void AcquisitionOrchestrator::discardSession(const std::string &device_id, ConnectionSessionPtr session)
{
	session->stopNotifications();
	session->close();

	if (m_registry->get(device_id) == session)
	{
		m_registry->remove(device_id);
	}
}

bool AcquisitionOrchestrator::beginAttempt(const std::string &device_id, AcquisitionAttemptPtr attempt)
{
	std::lock_guard<std::mutex> lock(m_inFlightMutex);

	bool bInserted = m_inFlightAttempts.insert(std::make_pair(device_id, attempt)).second;
	if (!bInserted)
	{
		VSL_LOG_WARNING("AcquisitionOrchestrator::beginAttempt") << "Another attempt already in flight for '" << device_id << "'";
		m_inFlightAttempts[device_id] = attempt;
	}

	return bInserted;
}

void AcquisitionOrchestrator::moveAttempt(
	const std::string &from_device_id,
	const std::string &to_device_id,
	AcquisitionAttemptPtr attempt)
{
	std::lock_guard<std::mutex> lock(m_inFlightMutex);
	auto it = m_inFlightAttempts.find(from_device_id);

	if (it != m_inFlightAttempts.end() && it->second == attempt)
	{
		m_inFlightAttempts.erase(it);
	}

	if (m_inFlightAttempts.find(to_device_id) != m_inFlightAttempts.end())
	{
		VSL_LOG_WARNING("AcquisitionOrchestrator::moveAttempt") << "Another attempt already in flight for '" << to_device_id << "'";
	}
	m_inFlightAttempts[to_device_id] = attempt;
}

void AcquisitionOrchestrator::endAttempt(const std::string &device_id, AcquisitionAttemptPtr attempt)
{
	std::lock_guard<std::mutex> lock(m_inFlightMutex);
	auto it = m_inFlightAttempts.find(device_id);

	if (it != m_inFlightAttempts.end() && it->second == attempt)
	{
		m_inFlightAttempts.erase(it);
	}

	// Notified under the lock, a woken canceller may go on to destroy the orchestrator
	attempt->bFinished = true;
	m_attemptFinishedCondition.notify_all();
}

const char *AcquisitionOrchestrator::statusToString(eAcquisitionStatus status)
{
	switch (status)
	{
	case AcquisitionStatus_Success:
		return "Success";
	case AcquisitionStatus_ManualEntryRequired:
		return "ManualEntryRequired";
	case AcquisitionStatus_DiscoveryFailed:
		return "DiscoveryFailed";
	case AcquisitionStatus_LinkFailed:
		return "LinkFailed";
	case AcquisitionStatus_ProfileResolutionExhausted:
		return "ProfileResolutionExhausted";
	case AcquisitionStatus_Cancelled:
		return "Cancelled";
	}

	return "INVALID";
}
