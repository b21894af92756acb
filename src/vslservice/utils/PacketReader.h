#ifndef PACKET_READER_H
#define PACKET_READER_H

#include <cstddef>
#include <cstdint>
#include <vector>

/// Read cursor over a borrowed byte buffer with explicit byte order.
/// Reads past the end return 0 and flag the reader as overrun.
class PacketReader
{
public:
	explicit PacketReader(const std::vector<uint8_t>& bytes)
		: m_data(bytes.empty() ? nullptr : bytes.data())
		, m_size(bytes.size())
		, m_readPosition(0)
		, m_bOverrun(false)
	{
	}

	size_t getSize() const
	{
		return m_size;
	}

	bool hasOverrun() const
	{
		return m_bOverrun;
	}

	// Read Functions
	uint8_t readByte()
	{
		uint8_t value = getByteAt(m_readPosition);
		advance(1);
		return value;
	}

	uint16_t readShortLE()
	{
		uint16_t value = getShortLEAt(m_readPosition);
		advance(2);
		return value;
	}

	// Random Access Functions
	uint8_t getByteAt(size_t index) const
	{
		return (index < m_size) ? m_data[index] : 0;
	}

	uint16_t getShortLEAt(size_t index) const
	{
		if (index + 2 > m_size)
			return 0;

		return static_cast<uint16_t>(m_data[index] | (m_data[index + 1] << 8));
	}

	uint16_t getShortBEAt(size_t index) const
	{
		if (index + 2 > m_size)
			return 0;

		return static_cast<uint16_t>((m_data[index] << 8) | m_data[index + 1]);
	}

private:
	void advance(size_t len)
	{
		if (m_readPosition + len > m_size)
		{
			m_bOverrun = true;
		}

		m_readPosition += len;
	}

	const uint8_t* m_data;
	size_t m_size;
	size_t m_readPosition;
	bool m_bOverrun;
};

#endif // PACKET_READER_H
