#ifndef ACQUISITION_CONFIG_H
#define ACQUISITION_CONFIG_H

//-- includes -----
#include "VSLConfig.h"

//-- definitions -----
class AcquisitionConfig : public VSLConfig
{
public:
	static const int CONFIG_VERSION;

	AcquisitionConfig(const std::string &fnamebase = "AcquisitionConfig");

	virtual const configuru::Config writeToJSON();
	virtual void readFromJSON(const configuru::Config &pt);

	long version;

	// Vendor framed cuffs take a full inflate/deflate cycle before sending anything
	int proprietary_timeout_ms;
	int standard_timeout_ms;
	// How long a fallback characteristic gets to produce its first notification
	int characteristic_probe_timeout_ms;
	int max_frame_buffer_size;
	int max_reconnect_attempts;
};

#endif // ACQUISITION_CONFIG_H
