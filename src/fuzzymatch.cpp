// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "fuzzymatch.hpp"

#include "casefold.hpp"
#include "encoding.hpp"

#include <algorithm>

FuzzyQuery::FuzzyQuery(const std::string& query, bool caseSensitive): caseSensitive(caseSensitive)
{
	prepare(characters, query.c_str(), query.size());

	alphabet = characters;
	std::sort(alphabet.begin(), alphabet.end());
	alphabet.erase(std::unique(alphabet.begin(), alphabet.end()), alphabet.end());

	// fill table
	for (size_t i = 0; i < sizeof(table) / sizeof(table[0]); ++i)
		table[i] = -1;

	for (size_t i = 0; i < alphabet.size() && alphabet[i] < 128; ++i)
		table[alphabet[i]] = static_cast<int>(i);
}

void FuzzyQuery::prepare(std::vector<uint32_t>& result, const char* data, size_t size) const
{
	decodeUTF8(result, data, size);

	if (!caseSensitive)
		for (size_t i = 0; i < result.size(); ++i)
			result[i] = casefold(result[i]);
}

bool FuzzyQuery::isCoveredBy(const uint32_t* candidate, size_t candidateLength) const
{
	size_t remaining = alphabet.size();
	if (remaining == 0) return true;

	std::vector<unsigned char> seen(alphabet.size());

	for (size_t i = 0; i < candidateLength; ++i)
	{
		uint32_t ch = candidate[i];
		int index = -1;

		if (ch < 128)
			index = table[ch];
		else
		{
			std::vector<uint32_t>::const_iterator it = std::lower_bound(alphabet.begin(), alphabet.end(), ch);

			if (it != alphabet.end() && *it == ch)
				index = static_cast<int>(it - alphabet.begin());
		}

		if (index >= 0 && !seen[index])
		{
			seen[index] = 1;

			if (--remaining == 0)
				return true;
		}
	}

	return false;
}

FuzzyScorer::FuzzyScorer(ScoringMode mode): mode(mode)
{
}

void FuzzyScorer::getFirstLetters(std::vector<unsigned char>& result, const std::vector<uint32_t>& characters) const
{
	size_t length = characters.size();

	result.assign(length, 0);

	if (mode == SM_PATH)
	{
		if (length > 0)
			result[0] = 1;

		for (size_t i = 0; i + 1 < length; ++i)
			if (characters[i] == '/')
				result[i + 1] = 1;
	}
	else
	{
		bool inWord = false;

		for (size_t i = 0; i < length; ++i)
		{
			bool word = isWordCharacter(characters[i]);

			if (word && !inWord)
				result[i] = 1;

			inWord = word;
		}
	}
}

double FuzzyScorer::score(const std::vector<unsigned char>& firstLetters, const unsigned int* positions, size_t count)
{
	if (count == 0) return 0.0;

	size_t firstLetterMatches = 0;

	for (size_t i = 0; i < count; ++i)
		if (positions[i] < firstLetters.size() && firstLetters[positions[i]])
			firstLetterMatches++;

	size_t groups = 1;

	for (size_t i = 1; i < count; ++i)
		if (positions[i] != positions[i - 1] + 1)
			groups++;

	// favor fewer groups, i.e. longer runs of consecutive matches
	double normalizedGroups = static_cast<double>(count - (groups - 1)) / static_cast<double>(count);

	return static_cast<double>(count + firstLetterMatches) * (1.0 + normalizedGroups * normalizedGroups);
}

bool findLetterPositions(LetterPositions& result, const uint32_t* query, size_t queryLength, const uint32_t* candidate, size_t candidateLength)
{
	result.clear();
	result.resize(queryLength);

	const uint32_t* end = candidate + candidateLength;
	size_t position = 0;

	for (size_t offset = 0; offset < queryLength; ++offset)
	{
		if (position >= candidateLength) return false;

		std::vector<unsigned int>& positions = result[offset];
		size_t lastIndex = candidateLength - offset;

		for (size_t index = position; index < candidateLength; )
		{
			const uint32_t* it = std::find(candidate + index, end, query[offset]);
			if (it == end) break;

			size_t location = it - candidate;

			positions.push_back(static_cast<unsigned int>(location));
			index = location + 1;

			if (index >= lastIndex) break;
		}

		if (positions.empty()) return false;

		position = positions[0] + 1;
	}

	return true;
}

FuzzyMatch matchSingleCharacter(uint32_t ch, const std::vector<uint32_t>& candidate, const std::vector<unsigned char>& firstLetters)
{
	BestAlignment result;
	std::vector<unsigned int> position(1);

	for (size_t i = 0; i < candidate.size(); ++i)
		if (candidate[i] == ch)
		{
			position[0] = static_cast<unsigned int>(i);

			result.add(firstLetters[i] ? 4.0 : 1.0, position);
		}

	return result.best;
}

FuzzyMatch matchFuzzy(const FuzzyQuery& query, const FuzzyScorer& scorer, const char* data, size_t size)
{
	if (query.empty()) return FuzzyMatch();

	std::vector<uint32_t> candidate;
	query.prepare(candidate, data, size);

	std::vector<unsigned char> firstLetters;

	if (query.size() == 1)
	{
		scorer.getFirstLetters(firstLetters, candidate);

		return matchSingleCharacter(query.getCharacters()[0], candidate, firstLetters);
	}

	// early rejection is much cheaper than the full search for non-matches
	if (candidate.size() < query.size() || !query.isCoveredBy(candidate.data(), candidate.size()))
		return FuzzyMatch();

	LetterPositions letterPositions;

	if (!findLetterPositions(letterPositions, query.getCharacters().data(), query.size(), candidate.data(), candidate.size()))
		return FuzzyMatch();

	scorer.getFirstLetters(firstLetters, candidate);

	BestAlignment result;

	enumerateAlignments(letterPositions, [&](const std::vector<unsigned int>& positions) {
		result.add(FuzzyScorer::score(firstLetters, positions.data(), positions.size()), positions);
	});

	return result.best;
}
