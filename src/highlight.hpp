// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <utility>
#include <string>
#include <vector>

// Use the default colors of the original grep
const char* const kHighlightMatch = "\033[;01;31m"; // bright red
const char* const kHighlightScore = "\033[;0;32m"; // green
const char* const kHighlightSeparator = "\033[;0;36m"; // cyan
const char* const kHighlightEnd = "\033[0m";

// Byte offset and length
typedef std::pair<size_t, size_t> HighlightRange;

// Converts increasing code point positions of a UTF-8 string into byte ranges; adjacent positions share a range
void highlightPositions(std::vector<HighlightRange>& ranges, const char* data, size_t size, const std::vector<unsigned int>& positions);

// Ranges must be sorted and must not overlap
void highlight(std::string& result, const char* data, size_t size, const std::vector<HighlightRange>& ranges, const char* groupBegin, const char* groupEnd = kHighlightEnd);
