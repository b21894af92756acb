// -- includes -----
#include "VSLClient_CAPI.h"
#include "VSLService.h"
#include "Logger.h"
#include "Utility.h"

#include <string.h>

#ifdef _MSC_VER
	#pragma warning(disable:4996)  // ignore strncpy warning
#endif

// -- private data ---
VSLService *g_VSL_service= nullptr;

// -- private methods -----
static eDeviceType device_type_from_client(VSLDeviceType device_type)
{
	switch (device_type)
	{
	case VSLDeviceType_BloodPressure:
		return DeviceType_BloodPressure;
	case VSLDeviceType_Glucose:
		return DeviceType_Glucose;
	}

	return DeviceType_INVALID;
}

static VSLDeviceType device_type_to_client(eDeviceType device_type)
{
	return (device_type == DeviceType_Glucose) ? VSLDeviceType_Glucose : VSLDeviceType_BloodPressure;
}

static void reading_to_client(const DecodedReading &reading, VSLReading *out_reading)
{
	memset(out_reading, 0, sizeof(VSLReading));

	out_reading->deviceType= device_type_to_client(reading.kind);

	if (reading.kind == DeviceType_BloodPressure)
	{
		out_reading->bloodPressure.systolic= reading.bloodPressure.systolic;
		out_reading->bloodPressure.diastolic= reading.bloodPressure.diastolic;
		out_reading->bloodPressure.pulse= reading.bloodPressure.pulse;
	}
	else
	{
		out_reading->glucose.concentration= reading.glucose.concentration;
		out_reading->glucose.contextCode= static_cast<int>(reading.glucose.context);
		Utility::copyCString(
			glucose_context_to_string(reading.glucose.context),
			out_reading->glucose.contextLabel, sizeof(out_reading->glucose.contextLabel));
		out_reading->glucose.sequenceNumber= reading.glucose.sequenceNumber;
		out_reading->glucose.year= reading.glucose.year;
		out_reading->glucose.month= reading.glucose.month;
		out_reading->glucose.day= reading.glucose.day;
		out_reading->glucose.hours= reading.glucose.hours;
		out_reading->glucose.minutes= reading.glucose.minutes;
		out_reading->glucose.seconds= reading.glucose.seconds;
	}

	out_reading->confidence= static_cast<VSLReadingConfidence>(reading.confidence);
	Utility::copyCString(reading.strategyName.c_str(), out_reading->strategyName, sizeof(out_reading->strategyName));
	out_reading->timestampMs=
		std::chrono::duration_cast<std::chrono::milliseconds>(reading.timestamp.time_since_epoch()).count();
}

static VSLResult submit_manual_reading(const DecodedReading &entered_values, VSLReading *out_reading)
{
	if (out_reading == nullptr)
		return VSLResult_Error;

	DecodedReading reading;
	std::string reason;

	if (!VSLService::makeManualReading(entered_values, reading, reason))
		return VSLResult_Error;

	reading_to_client(reading, out_reading);
	return VSLResult_Success;
}

// -- public interface -----
bool VSL_GetIsInitialized()
{
	return g_VSL_service != nullptr && g_VSL_service->getIsInitialized();
}

VSLResult VSL_Initialize(VSLLogSeverityLevel log_level)
{
	VSLResult result= VSLResult_Success;

	if (g_VSL_service == nullptr)
	{
		g_VSL_service= new VSLService();
	}

	if (!g_VSL_service->getIsInitialized())
	{
		if (!g_VSL_service->startup(log_level))
		{
			result= VSLResult_Error;
		}
	}

	if (result != VSLResult_Success)
	{
		delete g_VSL_service;
		g_VSL_service = nullptr;
	}

	return result;
}

VSLResult VSL_GetVersionString(char *out_version_string, size_t max_version_string)
{
	if (out_version_string == nullptr)
		return VSLResult_Error;

	return Utility::copyCString(VSLService::getVersionString(), out_version_string, max_version_string)
		? VSLResult_Success
		: VSLResult_Error;
}

VSLResult VSL_Shutdown()
{
	VSLResult result= VSLResult_Error;

	if (g_VSL_service != nullptr)
	{
		g_VSL_service->shutdown();

		delete g_VSL_service;
		g_VSL_service= nullptr;

		result= VSLResult_Success;
	}

	return result;
}

VSLResult VSL_RegisterDevice(const char *device_id, const char *friendly_name, VSLDeviceType device_type)
{
	if (!VSL_GetIsInitialized() || device_id == nullptr)
		return VSLResult_Error;

	const eDeviceType internal_type= device_type_from_client(device_type);
	if (internal_type == DeviceType_INVALID)
		return VSLResult_Error;

	const std::string name= (friendly_name != nullptr) ? friendly_name : "";

	return g_VSL_service->registerDevice(DeviceIdentity(device_id, name), DeviceMetadata(name, internal_type))
		? VSLResult_Success
		: VSLResult_Error;
}

VSLResult VSL_RemoveDevice(const char *device_id)
{
	if (!VSL_GetIsInitialized() || device_id == nullptr)
		return VSLResult_Error;

	return g_VSL_service->removeDevice(device_id) ? VSLResult_Success : VSLResult_Error;
}

VSLResult VSL_GetDeviceList(VSLDeviceList *out_device_list)
{
	if (!VSL_GetIsInitialized() || out_device_list == nullptr)
		return VSLResult_Error;

	memset(out_device_list, 0, sizeof(VSLDeviceList));

	const std::vector<RegisteredDevice> devices= g_VSL_service->listDevices();
	for (const RegisteredDevice &device : devices)
	{
		if (out_device_list->count >= VSLSERVICE_MAX_DEVICE_COUNT)
		{
			VSL_LOG_WARNING("VSL_GetDeviceList") << "Device list truncated to " << VSLSERVICE_MAX_DEVICE_COUNT << " entries";
			break;
		}

		VSLDeviceListEntry &entry= out_device_list->devices[out_device_list->count];
		Utility::copyCString(device.identity.deviceId.c_str(), entry.deviceId, sizeof(entry.deviceId));
		Utility::copyCString(device.metadata.friendlyName.c_str(), entry.friendlyName, sizeof(entry.friendlyName));
		entry.deviceType= device_type_to_client(device.metadata.deviceType);
		Utility::copyCString(device.deviceInformation.manufacturerName.c_str(), entry.manufacturerName, sizeof(entry.manufacturerName));
		Utility::copyCString(device.deviceInformation.modelNumber.c_str(), entry.modelNumber, sizeof(entry.modelNumber));

		++out_device_list->count;
	}

	return VSLResult_Success;
}

VSLResult VSL_AcquireReading(
	VSLDeviceType device_type,
	const char *device_id,
	VSLReading *out_reading,
	VSLAcquisitionInfo *out_info)
{
	if (!VSL_GetIsInitialized() || out_reading == nullptr)
		return VSLResult_Error;

	const eDeviceType internal_type= device_type_from_client(device_type);
	if (internal_type == DeviceType_INVALID)
		return VSLResult_Error;

	DeviceIdentity identity;
	if (device_id != nullptr)
	{
		RegisteredDevice registered_device;

		identity.deviceId= device_id;
		if (g_VSL_service->getDeviceRegistry()->findDevice(identity.deviceId, registered_device))
		{
			identity= registered_device.identity;
		}
	}

	const AcquisitionResult acquisition= g_VSL_service->acquireReading(internal_type, identity);

	if (out_info != nullptr)
	{
		memset(out_info, 0, sizeof(VSLAcquisitionInfo));
		out_info->status= static_cast<VSLAcquisitionStatus>(acquisition.status);
		Utility::copyCString(acquisition.deviceId.c_str(), out_info->deviceId, sizeof(out_info->deviceId));
		Utility::copyCString(
			acquisition.deviceInformation.manufacturerName.c_str(),
			out_info->manufacturerName, sizeof(out_info->manufacturerName));
		Utility::copyCString(
			acquisition.deviceInformation.modelNumber.c_str(),
			out_info->modelNumber, sizeof(out_info->modelNumber));
		out_info->fragmentCount= acquisition.fragmentCount;
		out_info->elapsedMs= static_cast<int>(acquisition.elapsed.count());
	}

	switch (acquisition.status)
	{
	case AcquisitionStatus_Success:
		reading_to_client(acquisition.reading, out_reading);
		return VSLResult_Success;
	case AcquisitionStatus_ManualEntryRequired:
		return VSLResult_NoData;
	case AcquisitionStatus_Cancelled:
		return VSLResult_Canceled;
	default:
		return VSLResult_Error;
	}
}

VSLResult VSL_CancelAcquisition(const char *device_id)
{
	if (!VSL_GetIsInitialized())
		return VSLResult_Error;

	g_VSL_service->cancelAcquisition(device_id != nullptr ? device_id : "");
	return VSLResult_Success;
}

VSLResult VSL_SubmitManualBloodPressure(int systolic, int diastolic, int pulse, VSLReading *out_reading)
{
	return submit_manual_reading(DecodedReading::makeBloodPressure(systolic, diastolic, pulse), out_reading);
}

VSLResult VSL_SubmitManualGlucose(int concentration, int context_code, VSLReading *out_reading)
{
	return submit_manual_reading(
		DecodedReading::makeGlucose(concentration, glucose_context_from_code(context_code)),
		out_reading);
}
