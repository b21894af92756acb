#include "VSLClient_CAPI.h"
#include "ClientConstants.h"

#include "stdio.h"

#include <cstring>
#include <exception>
#include <string>

class VSLConsoleClient
{
public:
	VSLConsoleClient(VSLDeviceType device_type, const std::string &device_id)
		: m_deviceType(device_type)
		, m_deviceId(device_id)
	{
		memset(&DeviceList, 0, sizeof(VSLDeviceList));
	}

	int run()
	{
		int exit_code= 1;

		// Attempt to start and run the client
		try
		{
			if (startup())
			{
				exit_code= acquire() ? 0 : 1;
			}
			else
			{
				fprintf( stderr, "ERROR: Failed to startup the VSL Client\n");
			}
		}
		catch (std::exception& e)
		{
			fprintf( stderr, "ERROR: %s\n", e.what());
		}

		// Attempt to shutdown the client
		try
		{
		   shutdown();
		}
		catch (std::exception& e)
		{
			fprintf( stderr, "ERROR: %s\n", e.what());
		}

		return exit_code;
   }

private:
	// VSLConsoleClient
	bool startup()
	{
		bool success= true;

		if (VSL_Initialize(VSLLogSeverityLevel_info) == VSLResult_Success)
		{
			char version_string[VSLSERVICE_MAX_VERSION_STRING_LEN];

			VSL_GetVersionString(version_string, sizeof(version_string));
			printf("VSLConsoleClient::startup() - Initialized client version - %s\n", version_string);
		}
		else
		{
			fprintf(stderr, "VSLConsoleClient::startup() - Failed to initialize the service\n");
			success= false;
		}

		if (success)
		{
			fetchDeviceList();
		}

		return success;
	}

	bool acquire()
	{
		VSLReading reading;
		VSLAcquisitionInfo info;

		memset(&info, 0, sizeof(VSLAcquisitionInfo));
		printf("Acquiring %s reading from '%s'...\n",
			m_deviceType == VSLDeviceType_Glucose ? "glucose" : "blood pressure",
			m_deviceId.c_str());

		const VSLResult result= VSL_AcquireReading(m_deviceType, m_deviceId.c_str(), &reading, &info);

		printf("  Device: %s (%s %s), %d fragments in %dms\n",
			info.deviceId, info.manufacturerName, info.modelNumber, info.fragmentCount, info.elapsedMs);

		switch (result)
		{
		case VSLResult_Success:
			printReading(reading);
			return true;
		case VSLResult_NoData:
			printf("No reading arrived from the device, falling back to manual entry.\n");
			return manualEntry();
		case VSLResult_Canceled:
			printf("Acquisition canceled.\n");
			return false;
		default:
			fprintf(stderr, "Acquisition failed with status %d\n", info.status);
			return false;
		}
	}

	bool manualEntry()
	{
		VSLReading reading;
		VSLResult result= VSLResult_Error;

		if (m_deviceType == VSLDeviceType_BloodPressure)
		{
			int systolic= 0, diastolic= 0, pulse= 0;

			printf("Enter systolic diastolic pulse: ");
			if (scanf("%d %d %d", &systolic, &diastolic, &pulse) != 3)
			{
				fprintf(stderr, "Expected three numbers\n");
				return false;
			}

			result= VSL_SubmitManualBloodPressure(systolic, diastolic, pulse, &reading);
		}
		else
		{
			int concentration= 0, context_code= 0;

			printf("Enter concentration (mg/dL) and meal context code (0-7): ");
			if (scanf("%d %d", &concentration, &context_code) != 2)
			{
				fprintf(stderr, "Expected two numbers\n");
				return false;
			}

			result= VSL_SubmitManualGlucose(concentration, context_code, &reading);
		}

		if (result != VSLResult_Success)
		{
			fprintf(stderr, "Manual entry rejected\n");
			return false;
		}

		printReading(reading);
		return true;
	}

	void printReading(const VSLReading &reading)
	{
		static const char *k_confidence_names[]= {"device-confirmed", "heuristic-accepted", "manual-fallback"};

		if (reading.deviceType == VSLDeviceType_BloodPressure)
		{
			printf("[BP] %d/%d mmHg, pulse %d bpm",
				reading.bloodPressure.systolic, reading.bloodPressure.diastolic, reading.bloodPressure.pulse);
		}
		else
		{
			printf("[GLU] %d mg/dL (%s), seq %d",
				reading.glucose.concentration, reading.glucose.contextLabel, reading.glucose.sequenceNumber);
		}

		printf(" via %s, %s\n", reading.strategyName, k_confidence_names[reading.confidence]);
	}

	void shutdown()
	{
		VSL_Shutdown();
	}

	void fetchDeviceList()
	{
		memset(&DeviceList, 0, sizeof(VSLDeviceList));
		VSL_GetDeviceList(&DeviceList);

		printf("Found %d registered devices.\n", DeviceList.count);
		for (int device_index=0; device_index<DeviceList.count; ++device_index)
		{
			printf("  %s: %s\n", DeviceList.devices[device_index].deviceId, DeviceList.devices[device_index].friendlyName);
		}
	}

private:
	VSLDeviceType m_deviceType;
	std::string m_deviceId;
	VSLDeviceList DeviceList;
};

int main(int argc, char *argv[])
{
	VSLDeviceType device_type= VSLDeviceType_BloodPressure;
	std::string device_id;

	if (argc > 1 && strcmp(argv[1], "glucose") == 0)
	{
		device_type= VSLDeviceType_Glucose;
	}
	else if (argc > 1 && strcmp(argv[1], "bp") != 0)
	{
		fprintf(stderr, "usage: %s [bp|glucose] [device_id]\n", argv[0]);
		return 1;
	}

	if (argc > 2)
	{
		device_id= argv[2];
	}

	VSLConsoleClient app(device_type, device_id);

	// app instantiation
	return app.run();
}
