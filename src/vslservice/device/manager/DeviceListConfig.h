#ifndef DEVICE_LIST_CONFIG_H
#define DEVICE_LIST_CONFIG_H

//-- includes -----
#include "VSLConfig.h"
#include "DeviceRegistry.h"

#include <vector>

//-- definitions -----
/// Devices the user has registered, in registration order
class DeviceListConfig : public VSLConfig
{
public:
	static const int CONFIG_VERSION;

	DeviceListConfig(const std::string &fnamebase = "DeviceListConfig");

	virtual const configuru::Config writeToJSON();
	virtual void readFromJSON(const configuru::Config &pt);

	long version;
	std::vector<RegisteredDevice> devices;
};

#endif // DEVICE_LIST_CONFIG_H
