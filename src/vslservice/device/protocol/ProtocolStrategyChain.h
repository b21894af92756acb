#ifndef PROTOCOL_STRATEGY_CHAIN_H
#define PROTOCOL_STRATEGY_CHAIN_H

//-- includes -----
#include "ProtocolStrategy.h"
#include "ReadingValidator.h"

#include <functional>
#include <memory>
#include <vector>

//-- constants -----
enum eChainResult
{
	ChainResult_Decoded,	///< A strategy produced a reading the validator accepted
	ChainResult_Incomplete,	///< No strategy considered the buffer complete yet
	ChainResult_Rejected,	///< At least one candidate failed validation, none passed
	ChainResult_NoMatch		///< Complete enough to try, but nothing decoded
};

//-- definitions -----
/// Ordered list of decode strategies for one reading kind.
/// Earlier strategies have priority over later ones.
class ProtocolStrategyChain
{
public:
	using StrategyFactoryFunction = std::function<IProtocolStrategy *()>;

	ProtocolStrategyChain(eDeviceType reading_kind);
	virtual ~ProtocolStrategyChain();

	inline eDeviceType getReadingKind() const { return m_readingKind; }
	inline size_t getStrategyCount() const { return m_strategies.size(); }
	inline const IProtocolStrategy *getStrategy(size_t index) const { return m_strategies[index]; }

	// Takes ownership of the strategy and appends it to the end of the chain
	void addStrategy(IProtocolStrategy *strategy);

	// resolved_profile is null for a characteristic found by the fallback probe.
	// Standard layouts seen anywhere but their own profile are treated as heuristics.
	eChainResult evaluate(
		const std::vector<uint8_t> &bytes,
		const ServiceProfile *resolved_profile,
		const ReadingValidator &validator,
		DecodedReading &out_reading) const;

private:
	ProtocolStrategyChain(const ProtocolStrategyChain &);
	ProtocolStrategyChain &operator = (const ProtocolStrategyChain &);

	eDeviceType m_readingKind;
	std::vector<IProtocolStrategy *> m_strategies;
};
typedef std::shared_ptr<ProtocolStrategyChain> ProtocolStrategyChainPtr;

const char *chain_result_to_string(eChainResult result);

#endif // PROTOCOL_STRATEGY_CHAIN_H
