// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <stddef.h>

enum RegexOptions
{
	RO_IGNORECASE = 1 << 0,
};

struct RegexMatch
{
	const char* data;
	size_t size;

	RegexMatch();
	RegexMatch(const char* data, size_t size);

	operator bool() const;
};

// Regex objects are safe to use from multiple threads concurrently
class Regex
{
public:
	virtual ~Regex() {}

	// Searches data starting from offset; the text before offset is still used as context for anchors
	virtual RegexMatch search(const char* data, size_t size, size_t offset = 0) const = 0;
};

// Throws std::runtime_error if the pattern is malformed
Regex* createRegex(const char* pattern, unsigned int options);
