#ifndef FRAME_BUFFER_H
#define FRAME_BUFFER_H

//-- includes -----
#include <chrono>
#include <vector>
#include <stddef.h>
#include <stdint.h>

//-- definitions -----
/// Append-only reassembly buffer for notification fragments.
/// Owned by a single acquisition attempt, so it carries no lock.
class FrameBuffer
{
public:
	FrameBuffer();

	// Appends bytes in arrival order. Never fails.
	void append(const uint8_t *bytes, size_t byte_count);
	void append(const std::vector<uint8_t> &bytes);

	std::vector<uint8_t> snapshot() const;
	void reset();

	inline size_t getSize() const { return m_bytes.size(); }
	inline bool isEmpty() const { return m_bytes.empty(); }
	inline int getNotificationCount() const { return m_notificationCount; }
	inline bool hasFirstByteTime() const { return m_bHasFirstByte; }
	inline std::chrono::steady_clock::time_point getFirstByteTime() const { return m_firstByteTime; }

private:
	std::vector<uint8_t> m_bytes;
	int m_notificationCount;
	bool m_bHasFirstByte;
	std::chrono::steady_clock::time_point m_firstByteTime;
};

#endif // FRAME_BUFFER_H
