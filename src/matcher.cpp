// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "matcher.hpp"

#include "constants.hpp"
#include "encoding.hpp"
#include "workqueue.hpp"

#include <algorithm>

FuzzyMatcher::FuzzyMatcher(const MatcherOptions& options)
	: options(options)
	, scorer(options.pathMode ? SM_PATH : SM_DEFAULT)
	, computed(0)
{
}

FuzzyMatcher::~FuzzyMatcher()
{
}

FuzzyMatch FuzzyMatcher::compute(const FuzzyQuery& query, const std::string& candidate)
{
	computed++;

	return matchFuzzy(query, scorer, candidate.c_str(), candidate.size());
}

bool FuzzyMatcher::isViable(const FuzzyQuery& query, const std::string& candidate) const
{
	if (countUTF8(candidate.c_str(), candidate.size()) < query.size())
		return false;

	std::vector<uint32_t> characters;
	query.prepare(characters, candidate.c_str(), candidate.size());

	if (std::find(characters.begin(), characters.end(), query.getCharacters()[0]) == characters.end())
		return false;

	return query.isCoveredBy(characters.data(), characters.size());
}

WorkQueue& FuzzyMatcher::getWorkQueue()
{
	if (!queue)
		queue.reset(new WorkQueue(options.workerCount ? options.workerCount : WorkQueue::getIdealWorkerCount()));

	return *queue;
}

size_t FuzzyMatcher::getGrain(size_t count)
{
	size_t jobs = getWorkQueue().getWorkerCount() * kJobsPerWorker;

	return std::max(kParallelGrain, (count + jobs - 1) / jobs);
}

FuzzyMatch FuzzyMatcher::match(const std::string& query, const std::string& candidate)
{
	FuzzyMatch result;

	if (cache.lookup(query, candidate, result))
		return result;

	result = compute(FuzzyQuery(query, options.caseSensitive), candidate);

	cache.insert(query, candidate, result);

	return result;
}

std::vector<FuzzyMatch> FuzzyMatcher::matchBatch(const std::string& query, const std::vector<std::string>& candidates)
{
	std::vector<FuzzyMatch> result;

	if (candidates.size() < kParallelThreshold)
	{
		result.reserve(candidates.size());

		for (auto& c: candidates)
			result.push_back(match(query, c));

		return result;
	}

	result.resize(candidates.size());

	// split into cached and pending candidates
	std::vector<size_t> pending;

	for (size_t i = 0; i < candidates.size(); ++i)
		if (!cache.lookup(query, candidates[i], result[i]))
			pending.push_back(i);

	if (pending.empty())
		return result;

	// compute pending matches in parallel; every job only writes its own slots
	FuzzyQuery fq(query, options.caseSensitive);
	std::vector<FuzzyMatch> matches(pending.size());

	getWorkQueue().parallelFor(pending.size(), getGrain(pending.size()), [&](size_t begin, size_t end) {
		for (size_t i = begin; i < end; ++i)
			matches[i] = compute(fq, candidates[pending[i]]);
	});

	// merge into the cache after all jobs are done
	for (size_t i = 0; i < pending.size(); ++i)
	{
		size_t index = pending[i];

		cache.insert(query, candidates[index], matches[i]);
		result[index] = std::move(matches[i]);
	}

	return result;
}

std::vector<RankedMatch> FuzzyMatcher::matchTopK(const std::string& query, const std::vector<std::string>& candidates, size_t k)
{
	std::vector<RankedMatch> result;

	if (candidates.empty() || k == 0)
		return result;

	if (candidates.size() < kParallelThreshold || k >= candidates.size() / 2)
	{
		std::vector<FuzzyMatch> matches = matchBatch(query, candidates);

		for (size_t i = 0; i < matches.size(); ++i)
			if (matches[i].score > 0)
			{
				RankedMatch m = {i, matches[i].score, std::move(matches[i].positions)};
				result.push_back(std::move(m));
			}

		std::stable_sort(result.begin(), result.end(), [](const RankedMatch& l, const RankedMatch& r) { return l.score > r.score; });

		if (result.size() > k)
			result.resize(k);

		return result;
	}

	FuzzyQuery fq(query, options.caseSensitive);

	if (fq.empty())
		return result;

	enum SlotState
	{
		SS_REJECTED,
		SS_CACHED,
		SS_COMPUTED,
	};

	struct Slot
	{
		SlotState state;
		FuzzyMatch match;
	};

	std::vector<Slot> slots(candidates.size());

	// the cache is only read while jobs are running
	getWorkQueue().parallelFor(candidates.size(), getGrain(candidates.size()), [&](size_t begin, size_t end) {
		for (size_t i = begin; i < end; ++i)
		{
			Slot& slot = slots[i];
			const std::string& candidate = candidates[i];

			if (cache.lookup(query, candidate, slot.match))
				slot.state = SS_CACHED;
			else if (isViable(fq, candidate))
			{
				slot.match = compute(fq, candidate);
				slot.state = SS_COMPUTED;
			}
			else
				slot.state = SS_REJECTED;
		}
	});

	// single-threaded reduction in index order
	TopKHeap heap(k);

	for (size_t i = 0; i < slots.size(); ++i)
	{
		Slot& slot = slots[i];

		if (slot.state == SS_REJECTED || slot.match.score <= 0)
			continue;

		// only positive results are remembered on this path
		if (slot.state == SS_COMPUTED)
			cache.insert(query, candidates[i], slot.match);

		RankedMatch m = {i, slot.match.score, std::move(slot.match.positions)};
		heap.push(std::move(m));
	}

	return heap.drain();
}

void FuzzyMatcher::clearCache()
{
	cache.clear();
}

size_t FuzzyMatcher::cacheSize() const
{
	return cache.size();
}

size_t FuzzyMatcher::computeCount() const
{
	return computed.load();
}
