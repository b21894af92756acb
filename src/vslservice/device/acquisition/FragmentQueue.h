#ifndef FRAGMENT_QUEUE_H
#define FRAGMENT_QUEUE_H

//-- includes -----
#include "ConnectionSession.h"
#include "readerwriterqueue.h" // lockfree queue

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

//-- constants -----
enum eFragmentWaitResult
{
	FragmentWait_Fragment,
	FragmentWait_Timeout,
	FragmentWait_Cancelled,
	FragmentWait_LinkLost
};

//-- definitions -----
/// Hand-off point between transport threads and the acquiring thread.
/// A single wait races new fragments, the deadline, cancellation and link loss.
/// Only the acquiring thread may wait, drain or reset.
class FragmentQueue : public ISessionListener
{
public:
	FragmentQueue();

	// -- ISessionListener ----
	void notifyFragmentReceived(const std::string &device_id, std::vector<uint8_t> fragment) override;
	void notifyLinkLost(const std::string &device_id) override;

	// Pending fragments are handed out before a link loss is reported
	eFragmentWaitResult waitForFragment(
		std::chrono::steady_clock::time_point deadline,
		std::vector<uint8_t> &out_fragment);

	void cancel();
	bool isCancelled() const;

	// Drops pending fragments and the link lost flag ahead of a reconnect
	void resetForReconnect();

	int getReceivedCount() const;

private:
	bool hasPendingFragment();

	// Transport threads take turns writing, the acquiring thread reads lock free
	std::mutex m_fragmentWriteMutex;
	moodycamel::ReaderWriterQueue<std::vector<uint8_t> > m_fragmentQueue;

	std::mutex m_wakeMutex;
	std::condition_variable m_wakeCondition;
	std::atomic<bool> m_bCancelled;
	std::atomic<bool> m_bLinkLost;
	std::atomic<int> m_receivedCount;
};

#endif // FRAGMENT_QUEUE_H
