#ifndef UTILITY_H
#define UTILITY_H

//-- includes -----
#include <string>
#include <vector>
#include <stddef.h>
#include <stdint.h>

//-- macros -----
#define ARRAY_SIZE(x) (sizeof(x) / sizeof((x)[0]))

//-- utility methods -----
namespace Utility
{
	// Copies a string into a fixed size buffer, always null terminating
	bool copyCString(const char *source, char *dest, size_t dest_size);

	inline bool is_index_valid(int index, int count) { return index >= 0 && index < count; }

	void sleep_ms(int milliseconds);

	std::string get_home_directory();
	bool file_exists(const std::string &filename);
	bool create_directory(const std::string &path);

	// Parses "aa 08 00 78", "aa:08:00:78" or "aa080078" into bytes
	bool parse_hex_bytes(const std::string &hex_string, std::vector<uint8_t> &out_bytes);
};

#endif // UTILITY_H
