// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <memory>
#include <string>
#include <vector>

#include <stddef.h>

class Output;
class Regex;

enum IgnoreVerdict
{
	IV_NONE, // no rule matched
	IV_IGNORE,
	IV_INCLUDE, // matched a negated rule
};

struct IgnoreRule
{
	std::string pattern;
	std::shared_ptr<Regex> re;

	bool negate;
	bool directoryOnly;
};

// Converts a gitignore glob to an RE2 regular expression matching paths relative to the ignore file
std::string convertGlobToRegex(const std::string& glob, bool anchored);

// Returns false for blank lines and comments; throws std::runtime_error if the rule does not compile
bool parseIgnoreRule(IgnoreRule& rule, const std::string& line);

// Rules of a single .gitignore file; the last matching rule wins
class IgnoreList
{
public:
	void add(const IgnoreRule& rule)
	{
		rules.push_back(rule);
	}

	bool empty() const
	{
		return rules.empty();
	}

	size_t size() const
	{
		return rules.size();
	}

	IgnoreVerdict check(const char* path, size_t length, bool isDirectory) const;

private:
	std::vector<IgnoreRule> rules;
};

// Missing or unreadable files yield an empty list; malformed rules are reported and skipped
void loadIgnoreFile(Output* output, const char* path, IgnoreList& list);
