// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "topk.hpp"

#include <algorithm>

bool ranksHigher(const RankedMatch& lhs, const RankedMatch& rhs)
{
	return lhs.score == rhs.score ? lhs.index < rhs.index : lhs.score > rhs.score;
}

TopKHeap::TopKHeap(size_t capacity): capacity(capacity)
{
	heap.reserve(capacity + 1);
}

bool TopKHeap::push(RankedMatch match)
{
	if (capacity == 0) return false;

	if (heap.size() < capacity)
	{
		heap.push_back(std::move(match));
		std::push_heap(heap.begin(), heap.end(), ranksHigher);
		return true;
	}

	if (!ranksHigher(match, heap.front()))
		return false;

	// evict the current minimum
	std::pop_heap(heap.begin(), heap.end(), ranksHigher);
	heap.back() = std::move(match);
	std::push_heap(heap.begin(), heap.end(), ranksHigher);

	assert(heap.size() == capacity);
	return true;
}

std::vector<RankedMatch> TopKHeap::drain()
{
	std::vector<RankedMatch> result;
	result.swap(heap);

	std::sort(result.begin(), result.end(), ranksHigher);

	return result;
}
