//-- includes -----
#include "ProtocolStrategyChain.h"
#include "Logger.h"

#include <chrono>

// -- ProtocolStrategyChain ----
ProtocolStrategyChain::ProtocolStrategyChain(eDeviceType reading_kind)
	: m_readingKind(reading_kind)
	, m_strategies()
{
}

ProtocolStrategyChain::~ProtocolStrategyChain()
{
	for (IProtocolStrategy *strategy : m_strategies)
	{
		delete strategy;
	}
	m_strategies.clear();
}

void ProtocolStrategyChain::addStrategy(IProtocolStrategy *strategy)
{
	if (strategy == nullptr)
		return;

	if (strategy->getReadingKind() != m_readingKind)
	{
		VSL_LOG_WARNING("ProtocolStrategyChain::addStrategy")
			<< strategy->getStrategyName() << " decodes " << device_type_to_string(strategy->getReadingKind())
			<< ", chain expects " << device_type_to_string(m_readingKind) << ". It will never be consulted.";
	}

	m_strategies.push_back(strategy);
}

eChainResult ProtocolStrategyChain::evaluate(
	const std::vector<uint8_t> &bytes,
	const ServiceProfile *resolved_profile,
	const ReadingValidator &validator,
	DecodedReading &out_reading) const
{
	const bool bStandardProfile =
		resolved_profile != nullptr && resolved_profile->protocolFamily == ProtocolFamily_StandardHealth;
	bool bAnyComplete = false;
	bool bAnyRejected = false;

	for (const IProtocolStrategy *strategy : m_strategies)
	{
		if (strategy->getReadingKind() != m_readingKind || !strategy->looksComplete(bytes))
			continue;

		bAnyComplete = true;

		DecodedReading candidate;
		const eDecodeStatus status = strategy->decode(bytes, candidate);

		if (status != DecodeStatus_Success)
		{
			VSL_LOG_DEBUG("ProtocolStrategyChain::evaluate")
				<< strategy->getStrategyName() << " declined: " << decode_status_to_string(status);
			continue;
		}

		candidate.confidence = strategy->getConfidence();
		if (strategy->requiresStandardProfile() && !bStandardProfile)
		{
			// Same layout on a vendor characteristic has to pass the plausibility ranges
			candidate.confidence = ReadingConfidence_HeuristicAccepted;
		}
		candidate.strategyName = strategy->getStrategyName();
		candidate.timestamp = std::chrono::system_clock::now();

		std::string reason;
		if (validator.validate(candidate, reason) == ValidationResult_Accepted)
		{
			VSL_LOG_INFO("ProtocolStrategyChain::evaluate")
				<< strategy->getStrategyName() << " decoded a "
				<< reading_confidence_to_string(candidate.confidence) << " reading";
			out_reading = candidate;
			return ChainResult_Decoded;
		}

		VSL_LOG_WARNING("ProtocolStrategyChain::evaluate")
			<< "Rejected candidate from " << strategy->getStrategyName() << ": " << reason;
		bAnyRejected = true;
	}

	if (bAnyRejected)
		return ChainResult_Rejected;

	return bAnyComplete ? ChainResult_NoMatch : ChainResult_Incomplete;
}

const char *chain_result_to_string(eChainResult result)
{
	switch (result)
	{
	case ChainResult_Decoded:
		return "Decoded";
	case ChainResult_Incomplete:
		return "Incomplete";
	case ChainResult_Rejected:
		return "Rejected";
	case ChainResult_NoMatch:
		return "NoMatch";
	}

	return "INVALID";
}
