#ifndef BLUETOOTH_LE_DEVICE_GATT_API_H
#define BLUETOOTH_LE_DEVICE_GATT_API_H

#include "BluetoothUUID.h"
#include <string>
#include <vector>
#include <functional>
#include <stddef.h>
#include <stdint.h>

class BluetoothGattHandle
{
public:
	BluetoothGattHandle() : m_handleValue(0x0000) {}
	BluetoothGattHandle(unsigned short handleValue) : m_handleValue(handleValue) {}

	inline unsigned short getHandleValue() const { return m_handleValue; }
	inline bool operator < (const BluetoothGattHandle &other) const { return m_handleValue < other.m_handleValue; }
	inline bool operator == (const BluetoothGattHandle &other) const { return m_handleValue == other.m_handleValue; }
	inline bool operator != (const BluetoothGattHandle &other) const { return m_handleValue != other.m_handleValue; }

private:
	unsigned short m_handleValue;
};
const BluetoothGattHandle k_invalid_ble_gatt_handle = { 0x0000 };

class BluetoothEventHandle
{
public:
	BluetoothEventHandle() : m_handleData(nullptr) {}
	BluetoothEventHandle(void *handle) : m_handleData(handle) {}

	inline bool isValid() const { return m_handleData != nullptr; }
	inline void* getHandleData() const { return m_handleData; }
	inline bool operator == (const BluetoothEventHandle& other) const { return m_handleData == other.m_handleData; }
	inline bool operator != (const BluetoothEventHandle& other) const { return m_handleData != other.m_handleData; }

private:
	void *m_handleData;
};
const BluetoothEventHandle k_invalid_ble_gatt_event_handle = { nullptr };

//-- definitions -----
class BLEGattProfile
{
public:
	BLEGattProfile(class BluetoothLEDeviceState *device);
	virtual ~BLEGattProfile();

	inline const std::vector<class BLEGattService *> &getServices() const { return services; }
	class BLEGattService* findService(const BluetoothUUID& uuid) const;

protected:
	class BluetoothLEDeviceState *parentDevice;
	std::vector<class BLEGattService *> services;
};

class BLEGattService
{
public:
	BLEGattService(class BLEGattProfile *profile, const BluetoothUUID &uuid);
	virtual ~BLEGattService();

	const BluetoothUUID &getServiceUuid() const { return serviceUuid; }
	const std::vector<class BLEGattCharacteristic *> &getCharacteristics() const { return characteristics; }

	class BLEGattCharacteristic *findCharacteristic(const BluetoothUUID& uuid) const;

protected:
	BLEGattProfile *parentProfile;
	BluetoothUUID serviceUuid;
	std::vector<class BLEGattCharacteristic *> characteristics;
};

class BLEGattCharacteristic
{
public:
	using ChangeCallback = std::function<void(BluetoothGattHandle attributeHandle, uint8_t *data, size_t data_size)>;

	BLEGattCharacteristic(BLEGattService *service, const BluetoothUUID &uuid);
	virtual ~BLEGattCharacteristic();

	const BluetoothUUID &getCharacteristicUuid() const { return characteristicUuid; }

	virtual bool getIsReadable() const = 0;
	virtual bool getIsNotifiable() const = 0;
	virtual bool getIsIndicatable() const = 0;

	inline class BLEGattCharacteristicValue* getCharacteristicValue() const { return characteristicValue; }

	// Change events only fire while notifications are enabled.
	// Events may arrive on a transport owned thread.
	virtual BluetoothEventHandle registerChangeEvent(ChangeCallback callback) = 0;
	virtual void unregisterChangeEvent(const BluetoothEventHandle &handle) = 0;

	virtual bool startNotifications() = 0;
	virtual void stopNotifications() = 0;

protected:
	BLEGattService *parentService;
	BluetoothUUID characteristicUuid;
	class BLEGattCharacteristicValue *characteristicValue;
};

class BLEGattCharacteristicValue
{
public:
	BLEGattCharacteristicValue(BLEGattCharacteristic *characteristic);
	virtual ~BLEGattCharacteristicValue();

	// Fetches the current value from the device
	virtual bool readValue() = 0;

	virtual bool getData(uint8_t **outBuffer, size_t *outBufferSize) = 0;

	bool getString(std::string &outString);

protected:
	BLEGattCharacteristic *parentCharacteristic;
};

#endif // BLUETOOTH_LE_DEVICE_GATT_API_H
