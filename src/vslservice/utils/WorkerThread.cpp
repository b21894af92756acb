//-- includes -----
#include "WorkerThread.h"
#include "Logger.h"

// -- WorkerThread -----
WorkerThread::WorkerThread(const std::string &thread_name)
	: m_threadName(thread_name)
	, m_bExitSignaled(false)
	, m_bHasThreadStarted(false)
	, m_bHasThreadEnded(false)
{
}

WorkerThread::~WorkerThread()
{
	if (m_workerThread.joinable())
	{
		if (std::this_thread::get_id() == m_workerThread.get_id())
		{
			VSL_LOG_ERROR("~WorkerThread") << "Worker thread " << m_threadName << " destroyed from its own thread";
			m_workerThread.detach();
		}
		else
		{
			stopThread();
		}
	}
}

void WorkerThread::startThread()
{
	if (m_bHasThreadStarted && !m_bHasThreadEnded)
		return;

	// Reap a previous run that finished on its own
	if (m_workerThread.joinable())
	{
		m_workerThread.join();
	}

	VSL_LOG_DEBUG("WorkerThread::startThread") << "Starting worker thread: " << m_threadName;

	m_bExitSignaled = false;
	m_bHasThreadEnded = false;
	m_bHasThreadStarted = true;
	m_workerThread = std::thread(&WorkerThread::threadFunc, this);
}

void WorkerThread::stopThread()
{
	if (!m_bHasThreadStarted)
		return;

	{
		std::lock_guard<std::mutex> lock(m_wakeMutex);
		m_bExitSignaled = true;
	}
	m_wakeCondition.notify_all();

	// A worker asking to stop itself just flags the exit, the owner joins later
	if (m_workerThread.joinable() && std::this_thread::get_id() != m_workerThread.get_id())
	{
		VSL_LOG_DEBUG("WorkerThread::stopThread") << "Stopping worker thread: " << m_threadName;
		m_workerThread.join();
		m_bHasThreadStarted = false;
	}
}

bool WorkerThread::sleepUnlessStopped(std::chrono::milliseconds duration)
{
	std::unique_lock<std::mutex> lock(m_wakeMutex);

	const bool bStopRequested =
		m_wakeCondition.wait_for(lock, duration, [this]() { return m_bExitSignaled.load(); });

	return !bStopRequested;
}

void WorkerThread::threadFunc()
{
	onThreadStarted();

	while (!m_bExitSignaled)
	{
		if (!doWork())
			break;
	}

	onThreadHalted();

	m_bHasThreadEnded = true;
}
