#include "BluetoothLEDeviceGatt.h"
#include <algorithm>

// -- BLEGattProfile ----
BLEGattProfile::BLEGattProfile(BluetoothLEDeviceState *device)
	: parentDevice(device)
{
}

BLEGattProfile::~BLEGattProfile()
{
	for (auto service : services)
	{
		delete service;
	}
}

BLEGattService* BLEGattProfile::findService(const BluetoothUUID& uuid) const
{
	auto it = std::find_if(
		services.begin(), services.end(),
		[&uuid](const BLEGattService *service)
	{
		return service->getServiceUuid() == uuid;
	});

	return it != services.end() ? *it : nullptr;
}

// -- BLEGattService ----
BLEGattService::BLEGattService(BLEGattProfile *profile, const BluetoothUUID &uuid)
	: parentProfile(profile)
	, serviceUuid(uuid)
{
}

BLEGattService::~BLEGattService()
{
	for (auto characteristic : characteristics)
	{
		delete characteristic;
	}
}

BLEGattCharacteristic *BLEGattService::findCharacteristic(const BluetoothUUID& uuid) const
{
	auto it = std::find_if(
		characteristics.begin(), characteristics.end(),
		[&uuid](const BLEGattCharacteristic *characteristic)
	{
		return characteristic->getCharacteristicUuid() == uuid;
	});

	return it != characteristics.end() ? *it : nullptr;
}

// -- BLEGattCharacteristic ----
BLEGattCharacteristic::BLEGattCharacteristic(BLEGattService *service, const BluetoothUUID &uuid)
	: parentService(service)
	, characteristicUuid(uuid)
	, characteristicValue(nullptr)
{
}

BLEGattCharacteristic::~BLEGattCharacteristic()
{
	if (characteristicValue != nullptr)
	{
		delete characteristicValue;
	}
}

// -- BLEGattCharacteristicValue ----
BLEGattCharacteristicValue::BLEGattCharacteristicValue(BLEGattCharacteristic *characteristic)
	: parentCharacteristic(characteristic)
{
}

BLEGattCharacteristicValue::~BLEGattCharacteristicValue()
{
}

bool BLEGattCharacteristicValue::getString(std::string &outString)
{
	uint8_t *buffer = nullptr;
	size_t buffer_size = 0;

	if (!readValue() || !getData(&buffer, &buffer_size) || buffer == nullptr)
	{
		return false;
	}

	// Device Information strings are UTF-8 and may carry trailing nulls
	while (buffer_size > 0 && buffer[buffer_size - 1] == 0)
	{
		--buffer_size;
	}

	outString.assign(reinterpret_cast<const char *>(buffer), buffer_size);

	return true;
}
