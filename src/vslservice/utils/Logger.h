#ifndef LOGGER_H
#define LOGGER_H

//-- includes -----
#include "ClientConstants.h"

#include <sstream>
#include <string>
#include <vector>
#include <stdint.h>

//-- definitions -----
/// Collects a single log line and emits it when the stream goes out of scope
class LoggerStream
{
public:
	LoggerStream(VSLLogSeverityLevel level, const char *section);
	~LoggerStream();

	template <typename t_value>
	LoggerStream &operator << (const t_value &value)
	{
		if (m_bEnabled)
		{
			m_stream << value;
		}

		return *this;
	}

private:
	LoggerStream(const LoggerStream &);
	LoggerStream &operator = (const LoggerStream &);

	VSLLogSeverityLevel m_level;
	const char *m_section;
	bool m_bEnabled;
	std::ostringstream m_stream;
};

//-- interface -----
void log_init(VSLLogSeverityLevel level, const std::string &log_filename);
void log_dispose();
bool log_can_emit_level(VSLLogSeverityLevel level);

// Formats bytes as space separated lowercase hex ("aa 08 00 78")
std::string log_format_hex(const uint8_t *bytes, size_t byte_count);
std::string log_format_hex(const std::vector<uint8_t> &bytes);

//-- macros -----
#define VSL_LOG_TRACE(section) LoggerStream(VSLLogSeverityLevel_trace, section)
#define VSL_LOG_DEBUG(section) LoggerStream(VSLLogSeverityLevel_debug, section)
#define VSL_LOG_INFO(section) LoggerStream(VSLLogSeverityLevel_info, section)
#define VSL_LOG_WARNING(section) LoggerStream(VSLLogSeverityLevel_warning, section)
#define VSL_LOG_ERROR(section) LoggerStream(VSLLogSeverityLevel_error, section)
#define VSL_LOG_FATAL(section) LoggerStream(VSLLogSeverityLevel_fatal, section)

#endif // LOGGER_H
