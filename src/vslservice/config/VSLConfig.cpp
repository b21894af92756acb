#include "VSLConfig.h"
#include "Logger.h"
#include "Utility.h"

#include <exception>

// Suppress unhelpful configuru warnings
#ifdef _MSC_VER
		#pragma warning (push)
		#pragma warning (disable: 4996) // This function or variable may be unsafe
		#pragma warning (disable: 4244) // 'return': conversion from 'const int64_t' to 'float', possible loss of data
		#pragma warning (disable: 4715) // configuru::Config::operator[]': not all control paths return a value
#endif
#define CONFIGURU_IMPLEMENTATION 1
#include <configuru.hpp>
#ifdef _MSC_VER
		#pragma warning (pop)
#endif

VSLConfig::VSLConfig(const std::string &fnamebase)
: ConfigFileBase(fnamebase)
{
}

const std::string
VSLConfig::getConfigPath()
{
	std::string home_dir= Utility::get_home_directory();
	std::string config_path = home_dir + "/VSLSERVICE";

	if (!Utility::create_directory(config_path))
	{
		VSL_LOG_ERROR("VSLConfig::getConfigPath") << "Failed to create config directory: " << config_path;
	}

	std::string config_filepath = config_path + "/" + ConfigFileBase + ".json";

	return config_filepath;
}

bool
VSLConfig::save()
{
	return save(getConfigPath());
}

bool
VSLConfig::save(const std::string &path)
{
	try
	{
		configuru::dump_file(path, writeToJSON(), configuru::JSON);
	}
	catch (std::exception &e)
	{
		VSL_LOG_ERROR("VSLConfig::save") << "Failed to write config " << path << ": " << e.what();
		return false;
	}

	return true;
}

bool
VSLConfig::load()
{
	return load(getConfigPath());
}

bool
VSLConfig::load(const std::string &path)
{
	bool bLoadedOk = false;

	if (Utility::file_exists( path ) )
	{
		try
		{
			configuru::Config m_config = configuru::parse_file(path, configuru::JSON);
			readFromJSON(m_config);
			bLoadedOk = true;
		}
		catch (std::exception &e)
		{
			VSL_LOG_WARNING("VSLConfig::load") << "Failed to parse config " << path << ": " << e.what() << ". Using defaults.";
		}
	}

	return bLoadedOk;
}

void VSLConfig::writeHexBytes(
	configuru::Config &pt,
	const char *field_name,
	const std::vector<uint8_t> &bytes)
{
	pt[field_name]= log_format_hex(bytes);
}

bool VSLConfig::readHexBytes(
	const configuru::Config &pt,
	const char *field_name,
	std::vector<uint8_t> &outBytes)
{
	if (!pt.has_key(field_name) || !pt[field_name].is_string())
		return false;

	const std::string hex_string= pt[field_name].as_string();
	if (!Utility::parse_hex_bytes(hex_string, outBytes))
	{
		VSL_LOG_WARNING("VSLConfig::readHexBytes") << "Malformed hex byte string for " << field_name << ": " << hex_string;
		return false;
	}

	return true;
}
