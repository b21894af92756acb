//-- includes -----
#include "AcquisitionConfig.h"
#include "Logger.h"

// -- AcquisitionConfig ----
// Bump this version when you are making a breaking config change.
// Simply adding or removing a field is ok and doesn't require a version bump.
const int AcquisitionConfig::CONFIG_VERSION = 1;

AcquisitionConfig::AcquisitionConfig(const std::string &fnamebase)
	: VSLConfig(fnamebase)
	, version(CONFIG_VERSION)
	, proprietary_timeout_ms(60000)
	, standard_timeout_ms(30000)
	, characteristic_probe_timeout_ms(5000)
	, max_frame_buffer_size(4096)
	, max_reconnect_attempts(1)
{
}

const configuru::Config
AcquisitionConfig::writeToJSON()
{
	configuru::Config pt{
		{"version", AcquisitionConfig::CONFIG_VERSION},
		{"proprietary_timeout_ms", proprietary_timeout_ms},
		{"standard_timeout_ms", standard_timeout_ms},
		{"characteristic_probe_timeout_ms", characteristic_probe_timeout_ms},
		{"max_frame_buffer_size", max_frame_buffer_size},
		{"max_reconnect_attempts", max_reconnect_attempts}
	};

	return pt;
}

void
AcquisitionConfig::readFromJSON(const configuru::Config &pt)
{
	version = pt.get_or<int>("version", 0);

	if (version == AcquisitionConfig::CONFIG_VERSION)
	{
		proprietary_timeout_ms = pt.get_or<int>("proprietary_timeout_ms", proprietary_timeout_ms);
		standard_timeout_ms = pt.get_or<int>("standard_timeout_ms", standard_timeout_ms);
		characteristic_probe_timeout_ms = pt.get_or<int>("characteristic_probe_timeout_ms", characteristic_probe_timeout_ms);
		max_frame_buffer_size = pt.get_or<int>("max_frame_buffer_size", max_frame_buffer_size);
		max_reconnect_attempts = pt.get_or<int>("max_reconnect_attempts", max_reconnect_attempts);
	}
	else
	{
		VSL_LOG_WARNING("AcquisitionConfig") <<
			"Config version " << version << " does not match expected version " <<
			AcquisitionConfig::CONFIG_VERSION << ", Using defaults.";
	}
}
