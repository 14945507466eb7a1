// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "highlight.hpp"

#include "encoding.hpp"

void highlightPositions(std::vector<HighlightRange>& ranges, const char* data, size_t size, const std::vector<unsigned int>& positions)
{
	ranges.clear();

	if (positions.empty())
		return;

	std::vector<uint32_t> characters;
	std::vector<size_t> offsets;
	decodeUTF8(characters, data, size, &offsets);

	for (unsigned int p: positions)
	{
		if (p >= characters.size())
			break;

		size_t begin = offsets[p];
		size_t end = offsets[p + 1];

		if (!ranges.empty() && ranges.back().first + ranges.back().second == begin)
			ranges.back().second += end - begin;
		else
			ranges.push_back(HighlightRange(begin, end - begin));
	}
}

void highlight(std::string& result, const char* data, size_t size, const std::vector<HighlightRange>& ranges, const char* groupBegin, const char* groupEnd)
{
	size_t last = 0;

	for (auto& r: ranges)
	{
		assert(last <= r.first && r.first + r.second <= size);

		result.append(data + last, data + r.first);
		result += groupBegin;
		result.append(data + r.first, data + r.first + r.second);
		result += groupEnd;

		last = r.first + r.second;
	}

	result.append(data + last, data + size);
}
