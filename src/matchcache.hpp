// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include "fuzzymatch.hpp"

#include <string>
#include <unordered_map>
#include <utility>

// Unbounded memo of (query, candidate) -> best match; not thread-safe, callers serialize writes
class MatchCache
{
public:
	bool lookup(const std::string& query, const std::string& candidate, FuzzyMatch& result) const;
	void insert(const std::string& query, const std::string& candidate, const FuzzyMatch& result);

	void clear();

	size_t size() const
	{
		return entries.size();
	}

private:
	typedef std::pair<std::string, std::string> Key;

	struct KeyHash
	{
		size_t operator()(const Key& key) const;
	};

	std::unordered_map<Key, FuzzyMatch, KeyHash> entries;
};
