// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include "fuzzymatch.hpp"
#include "matchcache.hpp"
#include "topk.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

class WorkQueue;

struct MatcherOptions
{
	bool caseSensitive;
	bool pathMode;

	// 0 selects one worker per hardware thread
	unsigned int workerCount;

	MatcherOptions(): caseSensitive(false), pathMode(false), workerCount(0)
	{
	}
};

// Matches queries against candidates and memoizes the results for the lifetime of the instance.
// Options are fixed at construction; a single instance must not be used from several threads at once.
class FuzzyMatcher
{
public:
	explicit FuzzyMatcher(const MatcherOptions& options = MatcherOptions());
	~FuzzyMatcher();

	FuzzyMatch match(const std::string& query, const std::string& candidate);

	// Result is index-aligned with candidates
	std::vector<FuzzyMatch> matchBatch(const std::string& query, const std::vector<std::string>& candidates);

	// At most k positive results, best first; equal scores are ordered by index
	std::vector<RankedMatch> matchTopK(const std::string& query, const std::vector<std::string>& candidates, size_t k);

	void clearCache();
	size_t cacheSize() const;

	// Number of candidates that went through the full matching pipeline
	size_t computeCount() const;

	const MatcherOptions& getOptions() const
	{
		return options;
	}

private:
	MatcherOptions options;
	FuzzyScorer scorer;
	MatchCache cache;

	std::unique_ptr<WorkQueue> queue;
	std::atomic<size_t> computed;

	FuzzyMatch compute(const FuzzyQuery& query, const std::string& candidate);
	bool isViable(const FuzzyQuery& query, const std::string& candidate) const;

	WorkQueue& getWorkQueue();
	size_t getGrain(size_t count);
};
