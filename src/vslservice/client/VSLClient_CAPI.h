/**
\file
*/ 

#ifndef __VSLCLIENT_CAPI_H
#define __VSLCLIENT_CAPI_H
#include "VSLClient_export.h"
#include "ClientConstants.h"
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

//cut_before

/** 
\brief Client Interface for VSLService
\defgroup VSLClient_CAPI Client Interface
\addtogroup VSLClient_CAPI 
@{ 
*/

// Shared Constants
//-----------------

/// Result enum in response to a client API request
typedef enum
{
	VSLResult_Canceled		= -3,	///< Request Was Canceled
	VSLResult_NoData		= -2,	///< Request Returned No Data
	VSLResult_Error			= -1,	///< General Error Result
	VSLResult_Success		= 0,	///< General Success Result
} VSLResult;

typedef enum
{
	VSLDeviceType_BloodPressure	= 0,
	VSLDeviceType_Glucose		= 1
} VSLDeviceType;

/// Where a reading came from
typedef enum
{
	VSLReadingConfidence_DeviceConfirmed	= 0,	///< Decoded from a standard profile the device declares
	VSLReadingConfidence_HeuristicAccepted	= 1,	///< Decoded by offset guessing, passed every plausibility range
	VSLReadingConfidence_ManualFallback		= 2		///< Keyed in by a human
} VSLReadingConfidence;

/// Outcome of an acquisition
typedef enum
{
	VSLAcquisitionStatus_Success						= 0,
	VSLAcquisitionStatus_ManualEntryRequired			= 1,	///< Nothing decodable arrived before the deadline
	VSLAcquisitionStatus_DiscoveryFailed				= 2,
	VSLAcquisitionStatus_LinkFailed						= 3,
	VSLAcquisitionStatus_ProfileResolutionExhausted		= 4,
	VSLAcquisitionStatus_Cancelled						= 5
} VSLAcquisitionStatus;

// Readings
//---------

typedef struct
{
	int						systolic;	// mmHg
	int						diastolic;	// mmHg
	int						pulse;		// beats per minute
} VSLBloodPressureReading;

/// https://www.bluetooth.com/specifications/gatt/viewer?attributeXmlFile=org.bluetooth.characteristic.glucose_measurement.xml
typedef struct
{
	int						concentration;	// mg/dL
	int						contextCode;	// 0-7, 8 when unknown
	char					contextLabel[VSLSERVICE_LABEL_LEN];
	uint16_t				sequenceNumber;
	uint16_t				year;
	uint8_t					month;
	uint8_t					day;
	uint8_t					hours;
	uint8_t					minutes;
	uint8_t					seconds;
} VSLGlucoseReading;

/// A single reading. Only the member matching deviceType is filled in.
typedef struct
{
	VSLDeviceType			deviceType;
	VSLBloodPressureReading	bloodPressure;
	VSLGlucoseReading		glucose;
	VSLReadingConfidence	confidence;
	char					strategyName[VSLSERVICE_LABEL_LEN];
	int64_t					timestampMs;	// Unix epoch
} VSLReading;

/// Diagnostics for the last acquisition
typedef struct
{
	VSLAcquisitionStatus	status;
	char					deviceId[VSLSERVICE_DEVICE_ID_LEN];
	char					manufacturerName[VSLSERVICE_DEVICE_NAME_LEN];
	char					modelNumber[VSLSERVICE_DEVICE_NAME_LEN];
	int						fragmentCount;
	int						elapsedMs;
} VSLAcquisitionInfo;

// Device List
//------------

typedef struct
{
	char					deviceId[VSLSERVICE_DEVICE_ID_LEN];
	char					friendlyName[VSLSERVICE_DEVICE_NAME_LEN];
	VSLDeviceType			deviceType;
	char					manufacturerName[VSLSERVICE_DEVICE_NAME_LEN];
	char					modelNumber[VSLSERVICE_DEVICE_NAME_LEN];
} VSLDeviceListEntry;

typedef struct
{
	VSLDeviceListEntry		devices[VSLSERVICE_MAX_DEVICE_COUNT];
	int						count;
} VSLDeviceList;

// Interface
//----------

/** \brief Initializes the service, loading configs from ~/VSLSERVICE.
	\param log_level The level of logging to emit
	\return VSLResult_Success on success
 */
VSL_PUBLIC_FUNCTION(VSLResult) VSL_Initialize(VSLLogSeverityLevel log_level);

/** \brief Shuts down the service. Cancels anything still in flight and closes every link.
	\return VSLResult_Success if the service was running
 */
VSL_PUBLIC_FUNCTION(VSLResult) VSL_Shutdown();

VSL_PUBLIC_FUNCTION(bool) VSL_GetIsInitialized();

/** \brief Copies the "Product.Major.Minor.Hotfix" service version into the given buffer.
 */
VSL_PUBLIC_FUNCTION(VSLResult) VSL_GetVersionString(char *out_version_string, size_t max_version_string);

VSL_PUBLIC_FUNCTION(VSLResult) VSL_RegisterDevice(const char *device_id, const char *friendly_name, VSLDeviceType device_type);

/** \brief Forgets a registered device, cancelling and closing any link it holds.
 */
VSL_PUBLIC_FUNCTION(VSLResult) VSL_RemoveDevice(const char *device_id);

/** \brief Lists the registered devices in registration order.
	Lists longer than VSLSERVICE_MAX_DEVICE_COUNT are truncated.
 */
VSL_PUBLIC_FUNCTION(VSLResult) VSL_GetDeviceList(VSLDeviceList *out_device_list);

/** \brief Blocks until a reading arrives, the acquisition fails or it gets cancelled.
	\param device_type Kind of reading to acquire
	\param device_id A previously seen device, or NULL/"" to take any matching device
	\param out_reading Filled in on VSLResult_Success
	\param out_info Optional diagnostics, may be NULL
	\return VSLResult_Success with a reading,
			VSLResult_NoData when the values need to be keyed in by hand,
			VSLResult_Canceled after VSL_CancelAcquisition,
			VSLResult_Error on a discovery, link or profile failure (see out_info->status)
 */
VSL_PUBLIC_FUNCTION(VSLResult) VSL_AcquireReading(
	VSLDeviceType device_type,
	const char *device_id,
	VSLReading *out_reading,
	VSLAcquisitionInfo *out_info);

/** \brief Cancels an acquisition running on another thread.
	Returns once the acquisition has released its link.
 */
VSL_PUBLIC_FUNCTION(VSLResult) VSL_CancelAcquisition(const char *device_id);

/** \brief Builds a manual-fallback reading from hand entered values.
	\return VSLResult_Error when systolic isn't above diastolic or a value isn't positive
 */
VSL_PUBLIC_FUNCTION(VSLResult) VSL_SubmitManualBloodPressure(int systolic, int diastolic, int pulse, VSLReading *out_reading);
VSL_PUBLIC_FUNCTION(VSLResult) VSL_SubmitManualGlucose(int concentration, int context_code, VSLReading *out_reading);

/** 
@} 
*/ 

//cut_after
#endif
