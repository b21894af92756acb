//-- includes -----
#include "Utility.h"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctype.h>
#include <thread>
#include <sys/stat.h>
#include <sys/types.h>

#ifdef _WIN32
#include <direct.h>
#endif

//-- public interface -----
bool Utility::copyCString(const char *source, char *dest, size_t dest_size)
{
	if (source == nullptr || dest == nullptr || dest_size == 0)
		return false;

	const size_t source_length = strlen(source);
	const size_t copy_length = (source_length < dest_size - 1) ? source_length : dest_size - 1;

	memcpy(dest, source, copy_length);
	dest[copy_length] = '\0';

	return copy_length == source_length;
}

void Utility::sleep_ms(int milliseconds)
{
	std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
}

std::string Utility::get_home_directory()
{
#ifdef _WIN32
	const char *home = getenv("USERPROFILE");
#else
	const char *home = getenv("HOME");
#endif

	return (home != nullptr) ? std::string(home) : std::string(".");
}

bool Utility::file_exists(const std::string &filename)
{
	struct stat file_stat;

	return stat(filename.c_str(), &file_stat) == 0 && (file_stat.st_mode & S_IFREG) != 0;
}

bool Utility::create_directory(const std::string &path)
{
	struct stat dir_stat;
	if (stat(path.c_str(), &dir_stat) == 0)
	{
		return (dir_stat.st_mode & S_IFDIR) != 0;
	}

#ifdef _WIN32
	return _mkdir(path.c_str()) == 0;
#else
	return mkdir(path.c_str(), 0755) == 0;
#endif
}

static int hex_digit_value(char c)
{
	if (c >= '0' && c <= '9')
		return c - '0';
	if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	if (c >= 'A' && c <= 'F')
		return c - 'A' + 10;

	return -1;
}

bool Utility::parse_hex_bytes(const std::string &hex_string, std::vector<uint8_t> &out_bytes)
{
	std::vector<uint8_t> bytes;
	int high_nibble = -1;

	for (size_t index = 0; index < hex_string.size(); ++index)
	{
		const char c = hex_string[index];

		if (isspace(static_cast<unsigned char>(c)) || c == ':' || c == ',')
		{
			// Separators may only appear between whole bytes
			if (high_nibble != -1)
				return false;

			continue;
		}

		const int value = hex_digit_value(c);
		if (value < 0)
			return false;

		if (high_nibble == -1)
		{
			high_nibble = value;
		}
		else
		{
			bytes.push_back(static_cast<uint8_t>((high_nibble << 4) | value));
			high_nibble = -1;
		}
	}

	if (high_nibble != -1)
		return false;

	out_bytes.swap(bytes);

	return true;
}
