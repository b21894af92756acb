//-- includes -----
#include "BluetoothUUID.h"
#include <ctype.h>

//-- constants -----
const char kCommonUuidPostfix[] = "-0000-1000-8000-00805f9b34fb";
const char kCommonUuidPrefix[] = "0000";

//-- public interface -----

// -- BluetoothUUID ----
BluetoothUUID::BluetoothUUID()
	: uuid128_string()
{
}

BluetoothUUID::BluetoothUUID(const std::string& in_uuid)
	: uuid128_string()
{
	setUUID(in_uuid);
}

void BluetoothUUID::setUUID(const std::string& in_uuid)
{
	uuid128_string.clear();

	if (in_uuid.empty())
	{
		return;
	}

	// Strip off "0x" prefix
	std::string uuid = in_uuid;
	if (uuid.size() >= 2 && uuid[0] == '0' && (uuid[1] == 'x' || uuid[1] == 'X'))
	{
		uuid = uuid.substr(2);
	}

	if (uuid.size() != 4 && uuid.size() != 8 && uuid.size() != 36)
	{
		return;
	}

	for (size_t i = 0; i < uuid.size(); ++i)
	{
		if (uuid.size() == 36 && (i == 8 || i == 13 || i == 18 || i == 23))
		{
			if (uuid[i] != '-')
			{
				return;
			}
		}
		else
		{
			if (isxdigit(static_cast<unsigned char>(uuid[i])) == 0)
			{
				return;
			}

			uuid[i] = static_cast<char>(tolower(static_cast<unsigned char>(uuid[i])));
		}
	}

	if (uuid.size() == 4)
	{
		uuid128_string.assign(kCommonUuidPrefix + uuid + kCommonUuidPostfix);
	}
	else if (uuid.size() == 8)
	{
		uuid128_string.assign(uuid + kCommonUuidPostfix);
	}
	else
	{
		uuid128_string.assign(uuid);
	}
}

bool BluetoothUUID::isValid() const
{
	return uuid128_string.size() > 0;
}

bool BluetoothUUID::isShortForm() const
{
	return
		uuid128_string.size() == 36 &&
		uuid128_string.compare(0, 4, kCommonUuidPrefix) == 0 &&
		uuid128_string.compare(8, std::string::npos, kCommonUuidPostfix) == 0;
}

std::string BluetoothUUID::getDisplayString() const
{
	if (!isValid())
	{
		return "<invalid>";
	}

	return isShortForm() ? uuid128_string.substr(4, 4) : uuid128_string;
}

bool BluetoothUUID::operator<(const BluetoothUUID& uuid) const
{
	return uuid128_string < uuid.uuid128_string;
}

bool BluetoothUUID::operator==(const BluetoothUUID& uuid) const
{
	return uuid128_string == uuid.uuid128_string;
}

bool BluetoothUUID::operator!=(const BluetoothUUID& uuid) const
{
	return uuid128_string != uuid.uuid128_string;
}

// -- BluetoothUUIDSet ----
BluetoothUUIDSet::BluetoothUUIDSet() : uuid_set()
{
}

BluetoothUUIDSet::BluetoothUUIDSet(const std::vector<BluetoothUUID> &uuids)
	: uuid_set(uuids.begin(), uuids.end())
{
}

void BluetoothUUIDSet::addUUID(const BluetoothUUID &uuid)
{
	if (uuid.isValid())
	{
		uuid_set.insert(uuid);
	}
}

bool BluetoothUUIDSet::containsUUID(const BluetoothUUID& uuid) const
{
	return uuid_set.find(uuid) != uuid_set.end();
}

bool BluetoothUUIDSet::intersects(const BluetoothUUIDSet &other_set) const
{
	for (auto it = uuid_set.begin(); it != uuid_set.end(); ++it)
	{
		if (other_set.containsUUID(*it))
		{
			return true;
		}
	}

	return false;
}

std::vector<BluetoothUUID> BluetoothUUIDSet::toVector() const
{
	return std::vector<BluetoothUUID>(uuid_set.begin(), uuid_set.end());
}

bool BluetoothUUIDSet::operator == (const BluetoothUUIDSet& other_set) const
{
	return uuid_set == other_set.uuid_set;
}
