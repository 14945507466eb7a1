// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <string>
#include <vector>

#include <stddef.h>
#include <stdint.h>

enum ScoringMode
{
	SM_DEFAULT, // first letters start alphanumeric runs
	SM_PATH, // first letters start the string or follow a '/'
};

struct FuzzyMatch
{
	double score;
	std::vector<unsigned int> positions;

	FuzzyMatch(): score(0)
	{
	}

	FuzzyMatch(double score, std::vector<unsigned int> positions): score(score), positions(std::move(positions))
	{
	}
};

typedef std::vector<std::vector<unsigned int>> LetterPositions;

class FuzzyQuery
{
public:
	FuzzyQuery(const std::string& query, bool caseSensitive);

	bool isCaseSensitive() const
	{
		return caseSensitive;
	}

	const std::vector<uint32_t>& getCharacters() const
	{
		return characters;
	}

	size_t size() const
	{
		return characters.size();
	}

	bool empty() const
	{
		return characters.empty();
	}

	// Checks that every query character occurs somewhere in the folded candidate
	bool isCoveredBy(const uint32_t* candidate, size_t candidateLength) const;

	// Decodes and folds candidate text according to the query case sensitivity
	void prepare(std::vector<uint32_t>& result, const char* data, size_t size) const;

private:
	bool caseSensitive;

	std::vector<uint32_t> characters;
	std::vector<uint32_t> alphabet;

	int table[128];
};

class FuzzyScorer
{
public:
	explicit FuzzyScorer(ScoringMode mode);

	ScoringMode getMode() const
	{
		return mode;
	}

	// Fills a per code point flag array for the prepared candidate
	void getFirstLetters(std::vector<unsigned char>& result, const std::vector<uint32_t>& characters) const;

	static double score(const std::vector<unsigned char>& firstLetters, const unsigned int* positions, size_t count);

private:
	ScoringMode mode;
};

bool findLetterPositions(LetterPositions& result, const uint32_t* query, size_t queryLength, const uint32_t* candidate, size_t candidateLength);

template <typename Visitor> void enumerateAlignmentsRec(const LetterPositions& letterPositions, std::vector<unsigned int>& current, Visitor& visitor)
{
	size_t index = current.size();

	for (unsigned int offset: letterPositions[index])
		if (current.empty() || offset > current.back())
		{
			current.push_back(offset);

			if (current.size() == letterPositions.size())
				visitor(current);
			else
				enumerateAlignmentsRec(letterPositions, current, visitor);

			current.pop_back();
		}
}

// Calls visitor with every strictly increasing alignment, in lexicographic order; the number of alignments is exponential in the worst case
template <typename Visitor> inline void enumerateAlignments(const LetterPositions& letterPositions, Visitor visitor)
{
	if (letterPositions.empty()) return;

	std::vector<unsigned int> current;
	current.reserve(letterPositions.size());

	enumerateAlignmentsRec(letterPositions, current, visitor);
}

// Keeps the first alignment with the highest score
struct BestAlignment
{
	FuzzyMatch best;

	void add(double score, const std::vector<unsigned int>& positions)
	{
		if (score > best.score)
		{
			best.score = score;
			best.positions = positions;
		}
	}
};

FuzzyMatch matchSingleCharacter(uint32_t ch, const std::vector<uint32_t>& candidate, const std::vector<unsigned char>& firstLetters);

FuzzyMatch matchFuzzy(const FuzzyQuery& query, const FuzzyScorer& scorer, const char* data, size_t size);
