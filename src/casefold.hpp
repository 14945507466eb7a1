// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <stdint.h>

#include "unicode/uchar.h"

// Simple lowercase mapping from UnicodeData; always maps one code point to one code point
inline uint32_t casefold(uint32_t ch)
{
	if (ch < 0x80)
		return (ch - 'A' < 26) ? (ch | 0x20) : ch;

	return static_cast<uint32_t>(u_tolower(static_cast<UChar32>(ch)));
}

// Letters, combining marks with the Alphabetic property, and all numbers
inline bool isWordCharacter(uint32_t ch)
{
	if (ch < 0x80)
		return (ch - 'a' < 26) || (ch - 'A' < 26) || (ch - '0' < 10);

	UChar32 uch = static_cast<UChar32>(ch);

	if (u_hasBinaryProperty(uch, UCHAR_ALPHABETIC))
		return true;

	int8_t type = u_charType(uch);

	return type == U_DECIMAL_DIGIT_NUMBER || type == U_LETTER_NUMBER || type == U_OTHER_NUMBER;
}
