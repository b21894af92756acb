//-- includes -----
#include "FrameBuffer.h"

// -- FrameBuffer ----
FrameBuffer::FrameBuffer()
	: m_bytes()
	, m_notificationCount(0)
	, m_bHasFirstByte(false)
	, m_firstByteTime()
{
}

void FrameBuffer::append(const uint8_t *bytes, size_t byte_count)
{
	++m_notificationCount;

	if (bytes == nullptr || byte_count == 0)
		return;

	if (!m_bHasFirstByte)
	{
		m_firstByteTime = std::chrono::steady_clock::now();
		m_bHasFirstByte = true;
	}

	m_bytes.insert(m_bytes.end(), bytes, bytes + byte_count);
}

void FrameBuffer::append(const std::vector<uint8_t> &bytes)
{
	append(bytes.empty() ? nullptr : bytes.data(), bytes.size());
}

std::vector<uint8_t> FrameBuffer::snapshot() const
{
	return m_bytes;
}

void FrameBuffer::reset()
{
	m_bytes.clear();
	m_notificationCount = 0;
	m_bHasFirstByte = false;
}
