#ifndef CLIENT_CONSTANTS_H
#define CLIENT_CONSTANTS_H

//-- includes -----
/**
\addtogroup VSLClient_CAPI
@{
*/

//-- constants -----
typedef enum
{
    VSLLogSeverityLevel_trace,
    VSLLogSeverityLevel_debug,
    VSLLogSeverityLevel_info,
    VSLLogSeverityLevel_warning,
    VSLLogSeverityLevel_error,
    VSLLogSeverityLevel_fatal
} VSLLogSeverityLevel;

// Max number of devices that can be returned in a device list
#define VSLSERVICE_MAX_DEVICE_COUNT  16

// The max length of the service version string
#define VSLSERVICE_MAX_VERSION_STRING_LEN 32

// Max length of a device identifier assigned by the host wireless stack
#define VSLSERVICE_DEVICE_ID_LEN  64

// Max length of a device friendly name, manufacturer or model string
#define VSLSERVICE_DEVICE_NAME_LEN  128

// Max length of a strategy name or glucose context label
#define VSLSERVICE_LABEL_LEN  32

/**
@}
*/

#endif // CLIENT_CONSTANTS_H
