//-- includes -----
#include "BluetoothLEServiceIDs.h"

//-- Services -----

//-- Generic Access / Generic Attribute --
const BluetoothUUID g_Service_GenericAccess_UUID("1800");
const BluetoothUUID *k_Service_GenericAccess_UUID= &g_Service_GenericAccess_UUID;
const BluetoothUUID g_Service_GenericAttribute_UUID("1801");
const BluetoothUUID *k_Service_GenericAttribute_UUID= &g_Service_GenericAttribute_UUID;

//-- Device Information Service --
const BluetoothUUID g_Service_DeviceInformation_UUID("180A");
const BluetoothUUID *k_Service_DeviceInformation_UUID= &g_Service_DeviceInformation_UUID;
const BluetoothUUID g_Characteristic_ModelNumberString_UUID("2A24");
const BluetoothUUID *k_Characteristic_ModelNumberString_UUID= &g_Characteristic_ModelNumberString_UUID;
const BluetoothUUID g_Characteristic_ManufacturerNameString_UUID("2A29");
const BluetoothUUID *k_Characteristic_ManufacturerNameString_UUID= &g_Characteristic_ManufacturerNameString_UUID;

//-- Blood Pressure Service --
const BluetoothUUID g_Service_BloodPressure_UUID("1810");
const BluetoothUUID *k_Service_BloodPressure_UUID= &g_Service_BloodPressure_UUID;
const BluetoothUUID g_Characteristic_BloodPressureMeasurement_UUID("2A35");
const BluetoothUUID *k_Characteristic_BloodPressureMeasurement_UUID= &g_Characteristic_BloodPressureMeasurement_UUID;

//-- Glucose Service --
const BluetoothUUID g_Service_Glucose_UUID("1808");
const BluetoothUUID *k_Service_Glucose_UUID= &g_Service_Glucose_UUID;
const BluetoothUUID g_Characteristic_GlucoseMeasurement_UUID("2A18");
const BluetoothUUID *k_Characteristic_GlucoseMeasurement_UUID= &g_Characteristic_GlucoseMeasurement_UUID;

//-- Transtek Proprietary Service --
const BluetoothUUID g_Service_TranstekProprietary_UUID("FFE0");
const BluetoothUUID *k_Service_TranstekProprietary_UUID= &g_Service_TranstekProprietary_UUID;
const BluetoothUUID g_Characteristic_TranstekMeasurement_UUID("FFE1");
const BluetoothUUID *k_Characteristic_TranstekMeasurement_UUID= &g_Characteristic_TranstekMeasurement_UUID;
