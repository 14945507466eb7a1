// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <vector>

#include <stddef.h>
#include <stdint.h>

std::vector<char> convertToUTF8(std::vector<char> data);

// Decodes UTF-8 text into code points; every malformed byte decodes to U+FFFD.
// When offsets is not null, it receives the byte offset of each code point followed by the total size.
void decodeUTF8(std::vector<uint32_t>& result, const char* data, size_t size, std::vector<size_t>* offsets = nullptr);

size_t countUTF8(const char* data, size_t size);
