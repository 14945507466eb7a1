// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "encoding.hpp"

#include <string.h>

const uint32_t kReplacementCharacter = 0xFFFD;

inline uint16_t endianSwap(uint16_t value)
{
	return static_cast<uint16_t>(((value & 0xff) << 8) | (value >> 8));
}

inline uint32_t endianSwap(uint32_t value)
{
	return ((value & 0xff) << 24) | ((value & 0xff00) << 8) | ((value & 0xff0000) >> 8) | (value >> 24);
}

struct UTF8Counter
{
	size_t operator()(size_t result, uint32_t ch)
	{
		// U+0000..U+007F
		if (ch < 0x80) return result + 1;
		// U+0080..U+07FF
		else if (ch < 0x800) return result + 2;
		// U+0800..U+FFFF
		else if (ch < 0x10000) return result + 3;
		// U+10000..U+10FFFF
		else return result + 4;
	}
};

struct UTF8Writer
{
	uint8_t* operator()(uint8_t* result, uint32_t ch)
	{
		if (ch < 0x80)
		{
			*result = static_cast<uint8_t>(ch);
			return result + 1;
		}
		else if (ch < 0x800)
		{
			result[0] = static_cast<uint8_t>(0xC0 | (ch >> 6));
			result[1] = static_cast<uint8_t>(0x80 | (ch & 0x3F));
			return result + 2;
		}
		else if (ch < 0x10000)
		{
			result[0] = static_cast<uint8_t>(0xE0 | (ch >> 12));
			result[1] = static_cast<uint8_t>(0x80 | ((ch >> 6) & 0x3F));
			result[2] = static_cast<uint8_t>(0x80 | (ch & 0x3F));
			return result + 3;
		}
		else
		{
			result[0] = static_cast<uint8_t>(0xF0 | (ch >> 18));
			result[1] = static_cast<uint8_t>(0x80 | ((ch >> 12) & 0x3F));
			result[2] = static_cast<uint8_t>(0x80 | ((ch >> 6) & 0x3F));
			result[3] = static_cast<uint8_t>(0x80 | (ch & 0x3F));
			return result + 4;
		}
	}
};

template <bool swap> struct UTF16Decoder
{
	typedef uint16_t Element;

	template <typename State, typename Pred> static State decode(const uint16_t* data, size_t size, State result, Pred pred)
	{
		const uint16_t* end = data + size;

		while (data < end)
		{
			uint16_t lead = swap ? endianSwap(*data) : *data;

			// U+0000..U+D7FF, U+E000..U+FFFF
			if (lead < 0xD800 || static_cast<unsigned int>(lead - 0xE000) < 0x2000)
			{
				result = pred(result, lead);
				data += 1;
			}
			// surrogate pair lead
			else if (static_cast<unsigned int>(lead - 0xD800) < 0x400 && data + 1 < end)
			{
				uint16_t next = swap ? endianSwap(data[1]) : data[1];

				if (static_cast<unsigned int>(next - 0xDC00) < 0x400)
				{
					result = pred(result, 0x10000 + ((lead & 0x3ff) << 10) + (next & 0x3ff));
					data += 2;
				}
				else
				{
					data += 1;
				}
			}
			else
			{
				data += 1;
			}
		}

		return result;
	}
};

template <bool swap> struct UTF32Decoder
{
	typedef uint32_t Element;

	template <typename State, typename Pred> static State decode(const uint32_t* data, size_t size, State result, Pred pred)
	{
		for (const uint32_t* end = data + size; data < end; ++data)
			result = pred(result, swap ? endianSwap(*data) : *data);

		return result;
	}
};

template <typename Decoder> inline std::vector<char> convertToUTF8Impl(const char* data, size_t size)
{
	typedef typename Decoder::Element T;

	const T* source = reinterpret_cast<const T*>(data);
	size_t count = size / sizeof(T);

	size_t utf8Length = Decoder::decode(source, count, static_cast<size_t>(0), UTF8Counter());
	std::vector<char> result(utf8Length);

	if (utf8Length > 0)
	{
		uint8_t* beg = reinterpret_cast<uint8_t*>(&result[0]);
		uint8_t* end = Decoder::decode(source, count, beg, UTF8Writer());
		assert(beg + utf8Length == end);
		(void)end;
	}

	return result;
}

std::vector<char> convertToUTF8(std::vector<char> data)
{
	const char* contents = data.empty() ? 0 : &data[0];
	size_t size = data.size();

	if (size >= 4 && memcmp(contents, "\xff\xfe\x00\x00", 4) == 0) return convertToUTF8Impl<UTF32Decoder<false>>(contents + 4, size - 4);
	if (size >= 4 && memcmp(contents, "\x00\x00\xfe\xff", 4) == 0) return convertToUTF8Impl<UTF32Decoder<true>>(contents + 4, size - 4);
	if (size >= 2 && memcmp(contents, "\xff\xfe", 2) == 0) return convertToUTF8Impl<UTF16Decoder<false>>(contents + 2, size - 2);
	if (size >= 2 && memcmp(contents, "\xfe\xff", 2) == 0) return convertToUTF8Impl<UTF16Decoder<true>>(contents + 2, size - 2);
	if (size >= 3 && memcmp(contents, "\xef\xbb\xbf", 3) == 0) return std::vector<char>(contents + 3, contents + size);

	return data;
}

// Returns the length of the sequence starting at data and stores the code point; malformed sequences have length 1
static size_t decodeUTF8Char(const uint8_t* data, const uint8_t* end, uint32_t& ch)
{
	uint8_t lead = data[0];

	if (lead < 0x80)
	{
		ch = lead;
		return 1;
	}

	size_t length;
	uint32_t result;
	uint32_t minimum;

	if ((lead & 0xE0) == 0xC0) length = 2, result = lead & 0x1F, minimum = 0x80;
	else if ((lead & 0xF0) == 0xE0) length = 3, result = lead & 0x0F, minimum = 0x800;
	else if ((lead & 0xF8) == 0xF0) length = 4, result = lead & 0x07, minimum = 0x10000;
	else
	{
		ch = kReplacementCharacter;
		return 1;
	}

	if (static_cast<size_t>(end - data) < length)
	{
		ch = kReplacementCharacter;
		return 1;
	}

	for (size_t i = 1; i < length; ++i)
	{
		if ((data[i] & 0xC0) != 0x80)
		{
			ch = kReplacementCharacter;
			return 1;
		}

		result = (result << 6) | (data[i] & 0x3F);
	}

	// overlong encodings, surrogates and out of range values
	if (result < minimum || result > 0x10FFFF || (result >= 0xD800 && result < 0xE000))
	{
		ch = kReplacementCharacter;
		return 1;
	}

	ch = result;
	return length;
}

void decodeUTF8(std::vector<uint32_t>& result, const char* data, size_t size, std::vector<size_t>* offsets)
{
	result.clear();
	if (offsets) offsets->clear();

	const uint8_t* begin = reinterpret_cast<const uint8_t*>(data);
	const uint8_t* end = begin + size;

	for (const uint8_t* p = begin; p < end; )
	{
		uint32_t ch;
		size_t length = decodeUTF8Char(p, end, ch);

		result.push_back(ch);
		if (offsets) offsets->push_back(p - begin);

		p += length;
	}

	if (offsets) offsets->push_back(size);
}

size_t countUTF8(const char* data, size_t size)
{
	const uint8_t* begin = reinterpret_cast<const uint8_t*>(data);
	const uint8_t* end = begin + size;

	size_t result = 0;

	for (const uint8_t* p = begin; p < end; ++result)
	{
		uint32_t ch;
		p += decodeUTF8Char(p, end, ch);
	}

	return result;
}
