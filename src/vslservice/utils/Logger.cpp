//-- includes -----
#include "Logger.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

//-- private data -----
static std::atomic<int> g_min_log_level(VSLLogSeverityLevel_info);
static std::ofstream *g_log_file = nullptr;
static std::mutex g_log_mutex;

static const char *k_log_level_names[] = {
	"trace",
	"debug",
	"info",
	"warning",
	"error",
	"fatal"
};

//-- private methods -----
static std::string make_timestamp()
{
	const auto now = std::chrono::system_clock::now();
	const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
	const auto millis =
		std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

	std::tm local_time;
#ifdef _WIN32
	localtime_s(&local_time, &now_time);
#else
	localtime_r(&now_time, &local_time);
#endif

	char buffer[32];
	std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local_time);

	std::ostringstream stream;
	stream << buffer << "." << std::setw(3) << std::setfill('0') << millis;

	return stream.str();
}

//-- public interface -----
void log_init(VSLLogSeverityLevel level, const std::string &log_filename)
{
	std::lock_guard<std::mutex> lock(g_log_mutex);

	g_min_log_level.store(level);

	if (g_log_file == nullptr && !log_filename.empty())
	{
		g_log_file = new std::ofstream(log_filename.c_str(), std::ios::out | std::ios::app);

		if (!g_log_file->is_open())
		{
			std::cerr << "log_init - Failed to open log file: " << log_filename << std::endl;
			delete g_log_file;
			g_log_file = nullptr;
		}
	}
}

void log_dispose()
{
	std::lock_guard<std::mutex> lock(g_log_mutex);

	if (g_log_file != nullptr)
	{
		g_log_file->flush();
		g_log_file->close();
		delete g_log_file;
		g_log_file = nullptr;
	}
}

bool log_can_emit_level(VSLLogSeverityLevel level)
{
	return static_cast<int>(level) >= g_min_log_level.load();
}

std::string log_format_hex(const uint8_t *bytes, size_t byte_count)
{
	std::ostringstream stream;

	stream << std::hex << std::setfill('0');
	for (size_t index = 0; index < byte_count; ++index)
	{
		if (index > 0)
		{
			stream << ' ';
		}

		stream << std::setw(2) << static_cast<int>(bytes[index]);
	}

	return stream.str();
}

std::string log_format_hex(const std::vector<uint8_t> &bytes)
{
	return bytes.empty() ? std::string() : log_format_hex(bytes.data(), bytes.size());
}

// -- LoggerStream -----
LoggerStream::LoggerStream(VSLLogSeverityLevel level, const char *section)
	: m_level(level)
	, m_section(section)
	, m_bEnabled(log_can_emit_level(level))
{
}

LoggerStream::~LoggerStream()
{
	if (!m_bEnabled)
		return;

	std::ostringstream line;
	line << "[" << make_timestamp() << "] [" << k_log_level_names[m_level] << "] "
		<< m_section << ": " << m_stream.str();

	std::lock_guard<std::mutex> lock(g_log_mutex);

	if (m_level >= VSLLogSeverityLevel_error)
	{
		std::cerr << line.str() << std::endl;
	}
	else
	{
		std::cout << line.str() << std::endl;
	}

	if (g_log_file != nullptr)
	{
		*g_log_file << line.str() << std::endl;
	}
}
