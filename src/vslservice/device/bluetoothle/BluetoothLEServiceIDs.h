#ifndef BLUETOOTH_LE_SERVICE_IDS_H
#define BLUETOOTH_LE_SERVICE_IDS_H

// -- includes -----
#include "BluetoothUUID.h"

// -- constants -----
extern const BluetoothUUID *k_Service_GenericAccess_UUID;
extern const BluetoothUUID *k_Service_GenericAttribute_UUID;

extern const BluetoothUUID *k_Service_DeviceInformation_UUID;
extern const BluetoothUUID *k_Characteristic_ModelNumberString_UUID;
extern const BluetoothUUID *k_Characteristic_ManufacturerNameString_UUID;

extern const BluetoothUUID *k_Service_BloodPressure_UUID;
extern const BluetoothUUID *k_Characteristic_BloodPressureMeasurement_UUID;

extern const BluetoothUUID *k_Service_Glucose_UUID;
extern const BluetoothUUID *k_Characteristic_GlucoseMeasurement_UUID;

// Vendor service used by Transtek (and rebadged Coverich) cuffs
extern const BluetoothUUID *k_Service_TranstekProprietary_UUID;
extern const BluetoothUUID *k_Characteristic_TranstekMeasurement_UUID;

#endif // BLUETOOTH_LE_SERVICE_IDS_H
