// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "matcher.hpp"

#include "doctest/doctest.h"

#include <algorithm>

#include <stdio.h>

static std::vector<std::string> makeCandidates(size_t count)
{
	const char* folders[] = {"src", "include/qfuzz", "tests", "docs/api", "build/out"};
	const char* names[] = {"fuzzy_match", "match_cache", "work_queue", "top_k", "file_list", "main", "readme", "buffer"};
	const char* exts[] = {"cpp", "hpp", "md", "txt"};

	std::vector<std::string> result;

	for (size_t i = 0; i < count; ++i)
	{
		char buf[256];
		snprintf(buf, sizeof(buf), "%s/%s%d.%s", folders[i % 5], names[(i / 5) % 8], int(i / 40), exts[(i / 3) % 4]);

		result.push_back(buf);
	}

	return result;
}

static std::vector<RankedMatch> rankAll(const std::vector<FuzzyMatch>& matches, size_t k)
{
	std::vector<RankedMatch> result;

	for (size_t i = 0; i < matches.size(); ++i)
		if (matches[i].score > 0)
		{
			RankedMatch m = {i, matches[i].score, matches[i].positions};
			result.push_back(m);
		}

	std::sort(result.begin(), result.end(), ranksHigher);

	if (result.size() > k)
		result.resize(k);

	return result;
}

TEST_CASE("match is memoized")
{
	FuzzyMatcher matcher;

	FuzzyMatch first = matcher.match("fb", "foo_bar");
	FuzzyMatch second = matcher.match("fb", "foo_bar");

	CHECK(first.score == second.score);
	CHECK(first.positions == second.positions);

	CHECK(matcher.computeCount() == 1);
	CHECK(matcher.cacheSize() == 1);

	// non-matches are cached too
	matcher.match("zz", "foo_bar");
	matcher.match("zz", "foo_bar");

	CHECK(matcher.computeCount() == 2);
	CHECK(matcher.cacheSize() == 2);
}

TEST_CASE("clearCache forces recomputation")
{
	FuzzyMatcher matcher;

	FuzzyMatch before = matcher.match("mc", "match_cache");

	matcher.clearCache();
	CHECK(matcher.cacheSize() == 0);

	FuzzyMatch after = matcher.match("mc", "match_cache");

	CHECK(matcher.computeCount() == 2);
	CHECK(before.score == after.score);
	CHECK(before.positions == after.positions);
}

TEST_CASE("options are applied to every match")
{
	MatcherOptions options;
	options.caseSensitive = true;
	options.pathMode = true;

	FuzzyMatcher matcher(options);

	CHECK(matcher.match("AB", "src/ab.rs").score == 0);
	CHECK(matcher.match("ab", "src/ab.rs").positions == std::vector<unsigned int>({4, 5}));
}

TEST_CASE("small batches are index aligned")
{
	std::vector<std::string> candidates = makeCandidates(200);

	FuzzyMatcher matcher;
	std::vector<FuzzyMatch> result = matcher.matchBatch("fm", candidates);

	REQUIRE(result.size() == candidates.size());

	FuzzyMatcher reference;

	for (size_t i = 0; i < candidates.size(); ++i)
	{
		FuzzyMatch m = reference.match("fm", candidates[i]);

		CHECK(result[i].score == m.score);
		CHECK(result[i].positions == m.positions);
	}
}

TEST_CASE("large batches are index aligned")
{
	std::vector<std::string> candidates = makeCandidates(3000);

	MatcherOptions options;
	options.workerCount = 4;

	FuzzyMatcher matcher(options);
	std::vector<FuzzyMatch> result = matcher.matchBatch("wq", candidates);

	REQUIRE(result.size() == candidates.size());

	// every candidate was computed once, duplicates are cached once
	std::vector<std::string> unique = candidates;
	std::sort(unique.begin(), unique.end());
	unique.erase(std::unique(unique.begin(), unique.end()), unique.end());

	CHECK(matcher.cacheSize() == unique.size());

	FuzzyMatcher reference;

	for (size_t i = 0; i < candidates.size(); ++i)
	{
		FuzzyMatch m = reference.match("wq", candidates[i]);

		CHECK(result[i].score == m.score);
		CHECK(result[i].positions == m.positions);
	}

	// a repeated batch is served from the cache
	size_t computed = matcher.computeCount();
	std::vector<FuzzyMatch> again = matcher.matchBatch("wq", candidates);

	CHECK(matcher.computeCount() == computed);
	REQUIRE(again.size() == result.size());

	for (size_t i = 0; i < candidates.size(); ++i)
		CHECK(again[i].score == result[i].score);
}

TEST_CASE("top-K on small inputs")
{
	std::vector<std::string> candidates;
	candidates.push_back("readme.md");
	candidates.push_back("foo_bar");
	candidates.push_back("fast_buffer");
	candidates.push_back("nothing");
	candidates.push_back("f_b");

	FuzzyMatcher matcher;

	std::vector<RankedMatch> top = matcher.matchTopK("fb", candidates, 10);

	REQUIRE(top.size() == 3);

	for (size_t i = 1; i < top.size(); ++i)
		CHECK(top[i - 1].score >= top[i].score);

	for (auto& m: top)
	{
		FuzzyMatch single = matcher.match("fb", candidates[m.index]);

		CHECK(m.score == single.score);
		CHECK(m.positions == single.positions);
	}

	CHECK(matcher.matchTopK("fb", candidates, 1).size() == 1);
	CHECK(matcher.matchTopK("fb", candidates, 0).empty());
	CHECK(matcher.matchTopK("fb", std::vector<std::string>(), 5).empty());
	CHECK(matcher.matchTopK("", candidates, 5).empty());
}

TEST_CASE("top-K on large inputs agrees with full ranking")
{
	std::vector<std::string> candidates = makeCandidates(5000);

	MatcherOptions options;
	options.workerCount = 3;

	const char* queries[] = {"fm", "src", "tk", "bo", "q", "xyz"};

	for (auto q: queries)
	{
		CAPTURE(q);

		FuzzyMatcher matcher(options);
		std::vector<RankedMatch> top = matcher.matchTopK(q, candidates, 20);

		FuzzyMatcher reference;
		std::vector<RankedMatch> expected = rankAll(reference.matchBatch(q, candidates), 20);

		REQUIRE(top.size() == expected.size());

		for (size_t i = 0; i < top.size(); ++i)
		{
			CHECK(top[i].index == expected[i].index);
			CHECK(top[i].score == expected[i].score);
			CHECK(top[i].positions == expected[i].positions);
		}

		// the same call again is deterministic
		std::vector<RankedMatch> again = matcher.matchTopK(q, candidates, 20);

		REQUIRE(again.size() == top.size());

		for (size_t i = 0; i < top.size(); ++i)
			CHECK(again[i].index == top[i].index);
	}
}

TEST_CASE("top-K prefilter skips hopeless candidates")
{
	std::vector<std::string> candidates = makeCandidates(2000);

	FuzzyMatcher matcher;
	std::vector<RankedMatch> top = matcher.matchTopK("jq", candidates, 10);

	CHECK(top.empty());
	CHECK(matcher.computeCount() == 0);
}

TEST_CASE("top-K on large inputs caches positive results only")
{
	std::vector<std::string> candidates;

	for (int i = 0; i < 2000; ++i)
	{
		char buf[64];

		// odd entries contain both letters but in the wrong order
		snprintf(buf, sizeof(buf), i % 2 == 0 ? "ab_%d" : "ba_%d", i);
		candidates.push_back(buf);
	}

	FuzzyMatcher matcher;
	std::vector<RankedMatch> top = matcher.matchTopK("ab", candidates, 5);

	CHECK(top.size() == 5);
	CHECK(matcher.computeCount() == 2000);
	CHECK(matcher.cacheSize() == 1000);

	// positive results are served from the cache on the next call
	matcher.matchTopK("ab", candidates, 5);

	CHECK(matcher.computeCount() == 3000);
	CHECK(matcher.cacheSize() == 1000);
}
