#ifndef WORKER_THREAD_H
#define WORKER_THREAD_H

//-- includes -----
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

//-- definitions -----
/// Runs doWork() on a dedicated thread until it returns false or stopThread() is called
class WorkerThread
{
public:
	WorkerThread(const std::string &thread_name);
	virtual ~WorkerThread();

	void startThread();
	void stopThread();

	inline bool hasThreadStarted() const { return m_bHasThreadStarted; }
	inline bool hasThreadEnded() const { return m_bHasThreadEnded; }
	inline bool isStopRequested() const { return m_bExitSignaled; }
	inline const std::string &getThreadName() const { return m_threadName; }

protected:
	virtual void onThreadStarted() {}
	virtual void onThreadHalted() {}
	virtual bool doWork() = 0;

	// Sleeps for the given duration unless a stop gets requested first.
	// Returns false when the sleep was interrupted by a stop request.
	bool sleepUnlessStopped(std::chrono::milliseconds duration);

private:
	void threadFunc();

	const std::string m_threadName;
	std::thread m_workerThread;
	std::mutex m_wakeMutex;
	std::condition_variable m_wakeCondition;
	std::atomic<bool> m_bExitSignaled;
	std::atomic<bool> m_bHasThreadStarted;
	std::atomic<bool> m_bHasThreadEnded;
};

#endif // WORKER_THREAD_H
