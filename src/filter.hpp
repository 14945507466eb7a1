// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <string>
#include <vector>

class Output;
class FuzzyMatcher;

enum SearchOptions
{
	SO_CASESENSITIVE = 1 << 0,
	SO_PATHMODE = 1 << 1,
	SO_DIRECTORIES = 1 << 2,

	SO_HIGHLIGHT = 1 << 3,
	SO_SCORES = 1 << 4,
	SO_SUMMARY = 1 << 5,
};

// Removes paths that don't match include or match exclude; both are case-insensitive regular expressions and may be null
void filterPaths(std::vector<std::string>& paths, const char* include, const char* exclude);

// Prints at most limit best matches, best first; an empty query prints the first limit candidates
unsigned int filter(Output* output, FuzzyMatcher& matcher, const char* query, unsigned int options, unsigned int limit, const std::vector<std::string>& candidates);

void printSummary(Output* output, unsigned int found, unsigned int limit, size_t total, double seconds);
