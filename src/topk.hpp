// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <vector>

#include <stddef.h>

struct RankedMatch
{
	size_t index;
	double score;
	std::vector<unsigned int> positions;
};

// Higher score ranks higher; on equal scores the earlier index does
bool ranksHigher(const RankedMatch& lhs, const RankedMatch& rhs);

// Bounded min-heap that keeps the best capacity entries pushed so far
class TopKHeap
{
public:
	explicit TopKHeap(size_t capacity);

	// Returns false if the entry did not make it into the heap
	bool push(RankedMatch match);

	size_t size() const
	{
		return heap.size();
	}

	bool full() const
	{
		return heap.size() >= capacity;
	}

	// Lowest retained entry; heap must not be empty
	const RankedMatch& top() const
	{
		return heap.front();
	}

	// Empties the heap, returning its entries best first
	std::vector<RankedMatch> drain();

private:
	size_t capacity;
	std::vector<RankedMatch> heap;
};
