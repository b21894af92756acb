//-- includes -----
#include "FragmentQueue.h"

//-- constants -----
static const size_t k_initial_fragment_capacity = 64;

// -- FragmentQueue ----
FragmentQueue::FragmentQueue()
	: m_fragmentQueue(k_initial_fragment_capacity)
	, m_bCancelled(false)
	, m_bLinkLost(false)
	, m_receivedCount(0)
{
}

void FragmentQueue::notifyFragmentReceived(const std::string &device_id, std::vector<uint8_t> fragment)
{
	{
		std::lock_guard<std::mutex> write_lock(m_fragmentWriteMutex);

		m_fragmentQueue.enqueue(std::move(fragment));
		++m_receivedCount;
	}

	// Taking the wake lock keeps the notify from slipping in between a waiter's check and its sleep
	{
		std::lock_guard<std::mutex> lock(m_wakeMutex);
	}
	m_wakeCondition.notify_all();
}

void FragmentQueue::notifyLinkLost(const std::string &device_id)
{
	{
		std::lock_guard<std::mutex> lock(m_wakeMutex);
		m_bLinkLost = true;
	}

	m_wakeCondition.notify_all();
}

eFragmentWaitResult FragmentQueue::waitForFragment(
	std::chrono::steady_clock::time_point deadline,
	std::vector<uint8_t> &out_fragment)
{
	{
		std::unique_lock<std::mutex> lock(m_wakeMutex);

		m_wakeCondition.wait_until(
			lock,
			deadline,
			[this]() { return m_bCancelled || hasPendingFragment() || m_bLinkLost; });
	}

	if (m_bCancelled)
		return FragmentWait_Cancelled;

	if (m_fragmentQueue.try_dequeue(out_fragment))
		return FragmentWait_Fragment;

	return m_bLinkLost ? FragmentWait_LinkLost : FragmentWait_Timeout;
}

void FragmentQueue::cancel()
{
	{
		std::lock_guard<std::mutex> lock(m_wakeMutex);
		m_bCancelled = true;
	}

	m_wakeCondition.notify_all();
}

bool FragmentQueue::isCancelled() const
{
	return m_bCancelled;
}

void FragmentQueue::resetForReconnect()
{
	std::vector<uint8_t> stale_fragment;
	while (m_fragmentQueue.try_dequeue(stale_fragment))
	{
	}

	m_bLinkLost = false;
}

int FragmentQueue::getReceivedCount() const
{
	return m_receivedCount;
}

bool FragmentQueue::hasPendingFragment()
{
	return m_fragmentQueue.peek() != nullptr;
}
