// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "matchcache.hpp"

#include <functional>

size_t MatchCache::KeyHash::operator()(const Key& key) const
{
	std::hash<std::string> hasher;

	size_t h = hasher(key.first);

	return h ^ (hasher(key.second) + 0x9e3779b9 + (h << 6) + (h >> 2));
}

bool MatchCache::lookup(const std::string& query, const std::string& candidate, FuzzyMatch& result) const
{
	auto it = entries.find(Key(query, candidate));
	if (it == entries.end()) return false;

	result = it->second;
	return true;
}

void MatchCache::insert(const std::string& query, const std::string& candidate, const FuzzyMatch& result)
{
	entries[Key(query, candidate)] = result;
}

void MatchCache::clear()
{
	entries.clear();
}
