#ifndef VSL_CONFIG_H
#define VSL_CONFIG_H

//-- includes -----
#include <string>
#include <vector>
#include <stdint.h>

#ifdef _MSC_VER
		#pragma warning (push)
		#pragma warning (disable: 4996) // This function or variable may be unsafe
		#pragma warning (disable: 4244) // 'return': conversion from 'const int64_t' to 'float', possible loss of data
		#pragma warning (disable: 4715) // configuru::Config::operator[]': not all control paths return a value
#endif
#include <configuru.hpp>
#ifdef _MSC_VER
		#pragma warning (pop)
#endif


//-- definitions -----
/*
Note that VSLConfig is an abstract class because it has 2 pure virtual functions.
Child classes must add public member variables that store the config data,
as well as implement writeToJSON and readFromJSON that use pt[key]= value and
pt.get_or<type>(), respectively, to convert between member variables and the
property tree. See AcquisitionConfig for an example.
*/
class VSLConfig {
public:
	VSLConfig(const std::string &fnamebase = std::string("VSLConfig"));
	virtual ~VSLConfig() {}

	bool save();
	bool save(const std::string &path);
	bool load();
	bool load(const std::string &path);

	std::string ConfigFileBase;

	virtual const configuru::Config writeToJSON() = 0;  // Implement by each config's subclass
	virtual void readFromJSON(const configuru::Config &pt) = 0;  // Implement by each config's subclass

	static void writeHexBytes(
		configuru::Config &pt,
		const char *field_name,
		const std::vector<uint8_t> &bytes);
	static bool readHexBytes(
		const configuru::Config &pt,
		const char *field_name,
		std::vector<uint8_t> &outBytes);

	const std::string getConfigPath();
};

#endif // VSL_CONFIG_H
