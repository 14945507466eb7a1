// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "filter.hpp"

#include "output.hpp"
#include "regex.hpp"
#include "highlight.hpp"
#include "matcher.hpp"

#include <algorithm>
#include <memory>

#include <stdio.h>

struct FilterOutput
{
	FilterOutput(Output* output, unsigned int options, unsigned int limit): output(output), options(options), limit(limit)
	{
	}

	Output* output;
	unsigned int options;
	unsigned int limit;
};

struct FilterHighlightBuffer
{
	std::vector<HighlightRange> ranges;
	std::string result;
};

static void processMatch(const char* path, size_t pathLength, FilterOutput* output)
{
	output->output->rawprint(path, pathLength);
	output->output->rawprint("\n", 1);
}

static unsigned int dumpEntries(const std::vector<std::string>& candidates, FilterOutput* output)
{
	unsigned int count = static_cast<unsigned int>(std::min<size_t>(output->limit, candidates.size()));

	for (unsigned int i = 0; i < count; ++i)
		processMatch(candidates[i].c_str(), candidates[i].size(), output);

	return count;
}

static void processMatchRanked(FilterHighlightBuffer& hlbuf, const std::string& candidate, const RankedMatch& match, FilterOutput* output)
{
	hlbuf.result.clear();

	if (output->options & SO_SCORES)
	{
		char score[64];
		snprintf(score, sizeof(score), "%.3f", match.score);

		if (output->options & SO_HIGHLIGHT) hlbuf.result += kHighlightScore;
		hlbuf.result += score;
		if (output->options & SO_HIGHLIGHT) hlbuf.result += kHighlightSeparator;
		hlbuf.result += ":";
		if (output->options & SO_HIGHLIGHT) hlbuf.result += kHighlightEnd;
	}

	if (output->options & SO_HIGHLIGHT)
	{
		highlightPositions(hlbuf.ranges, candidate.c_str(), candidate.size(), match.positions);

		highlight(hlbuf.result, candidate.c_str(), candidate.size(), hlbuf.ranges, kHighlightMatch);
	}
	else
		hlbuf.result += candidate;

	processMatch(hlbuf.result.c_str(), hlbuf.result.size(), output);
}

void filterPaths(std::vector<std::string>& paths, const char* include, const char* exclude)
{
	std::unique_ptr<Regex> includeRe(include ? createRegex(include, RO_IGNORECASE) : 0);
	std::unique_ptr<Regex> excludeRe(exclude ? createRegex(exclude, RO_IGNORECASE) : 0);

	if (!includeRe && !excludeRe) return;

	paths.erase(std::remove_if(paths.begin(), paths.end(), [&](const std::string& path) -> bool {
		if (includeRe && !includeRe->search(path.c_str(), path.size()))
			return true;

		if (excludeRe && excludeRe->search(path.c_str(), path.size()))
			return true;

		return false; }), paths.end());
}

unsigned int filter(Output* output_, FuzzyMatcher& matcher, const char* query, unsigned int options, unsigned int limit, const std::vector<std::string>& candidates)
{
	FilterOutput output(output_, options, limit);

	if (*query == 0)
		return dumpEntries(candidates, &output);

	std::vector<RankedMatch> matches = matcher.matchTopK(query, candidates, limit);

	FilterHighlightBuffer hlbuf;

	for (auto& m: matches)
		processMatchRanked(hlbuf, candidates[m.index], m, &output);

	return static_cast<unsigned int>(matches.size());
}

void printSummary(Output* output, unsigned int found, unsigned int limit, size_t total, double seconds)
{
	output->print("Search complete, found %u%s matches out of %u in %.2f sec\n", found, (found == limit ? "+" : ""),
		static_cast<unsigned int>(total), seconds);
}
