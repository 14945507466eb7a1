// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"

#include "output.hpp"
#include "files.hpp"
#include "filter.hpp"
#include "filterutil.hpp"
#include "matcher.hpp"
#include "highlight.hpp"
#include "constants.hpp"

#include <chrono>
#include <stdexcept>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

const char* kVersion = "1.0";

struct CommandOptions
{
	unsigned int options;
	unsigned int limit;
	unsigned int workers;
	double timeout;
	std::string include, exclude;
};

bool parseHighlightOption(char opt, unsigned int& options)
{
	switch (opt)
	{
	case 'D':
		options &= ~SO_HIGHLIGHT;
		return true;

	default:
		return false;
	}
}

const char* parseOrRegex(std::string& result, const char* str)
{
	const char* end = str;
	while (*end && *end != ' ') end++;

	if (!result.empty()) result += "|";
	result += "(";
	result += std::string(str, end);
	result += ")";

	return end;
}

unsigned int parseNumberOption(const char*& s)
{
	char* end = 0;
	unsigned long result = strtoul(s + 1, &end, 10);
	s = end - 1;

	return static_cast<unsigned int>(result);
}

void parseSearchOptions(const char* opts, CommandOptions& co)
{
	for (const char* s = opts; *s; ++s)
	{
		switch (*s)
		{
		case 'c':
			co.options |= SO_CASESENSITIVE;
			break;

		case 'p':
			co.options |= SO_PATHMODE;
			break;

		case 'd':
			co.options |= SO_DIRECTORIES;
			break;

		case 'H':
			if (parseHighlightOption(s[1], co.options)) s++;
			else co.options |= SO_HIGHLIGHT;
			break;

		case 's':
			co.options |= SO_SCORES;
			break;

		case 'S':
			co.options |= SO_SUMMARY;
			break;

		case 'L':
			co.limit = parseNumberOption(s);
			break;

		case 'j':
			co.workers = parseNumberOption(s);
			break;

		case 'T':
			{
				char* end = 0;
				co.timeout = strtod(s + 1, &end);
				if (end == s + 1) throw std::runtime_error("Option 'T' expects a number of seconds");
				s = end - 1;
			}
			break;

		case 'f':
			s++;

			if (*s == 'i')
				s = parseOrRegex(co.include, s + 1) - 1;
			else if (*s == 'e')
				s = parseOrRegex(co.exclude, s + 1) - 1;
			else
				throw std::runtime_error("Unknown search option 'f" + std::string(*s != 0, *s) + "'");
			break;

		case ' ':
			break;

		default:
			throw std::runtime_error(std::string("Unknown search option '") + *s + "'");
		}
	}
}

// Options are the arguments in [startarg, endarg)
CommandOptions getSearchOptions(int startarg, int endarg, const char** argv, bool istty)
{
	CommandOptions co;
	co.options = istty ? SO_HIGHLIGHT : 0;
	co.limit = kDefaultLimit;
	co.workers = 0;
	co.timeout = -1;

	const char* gopts = getenv("QFUZZ_OPTIONS");

	// parse global options
	if (gopts)
		parseSearchOptions(gopts, co);

	// parse command-line options
	for (int i = startarg; i < endarg; ++i)
		parseSearchOptions(argv[i], co);

	// L0 means "no limit"
	if (co.limit == 0)
		co.limit = ~0u;

	return co;
}

MatcherOptions getMatcherOptions(const CommandOptions& co)
{
	MatcherOptions result;
	result.caseSensitive = (co.options & SO_CASESENSITIVE) != 0;
	result.pathMode = (co.options & SO_PATHMODE) != 0;
	result.workerCount = co.workers;

	return result;
}

unsigned int processCandidates(Output* output, const char* query, const CommandOptions& co, std::vector<std::string>& candidates)
{
	auto start = std::chrono::high_resolution_clock::now();

	filterPaths(candidates, co.include.empty() ? 0 : co.include.c_str(), co.exclude.empty() ? 0 : co.exclude.c_str());

	FuzzyMatcher matcher(getMatcherOptions(co));

	unsigned int result = filter(output, matcher, query, co.options, co.limit, candidates);

	if (co.options & SO_SUMMARY)
	{
		auto time = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::high_resolution_clock::now() - start);

		printSummary(output, result, co.limit, candidates.size(), static_cast<double>(time.count()) / 1000.0);
	}

	return result;
}

bool processFilesCommand(Output* output, int argc, const char** argv)
{
	const char* root = argv[2];
	const char* query = argc > 3 ? argv[argc - 1] : "";

	CommandOptions co = getSearchOptions(3, argc - 1, argv, output->isTTY());

	EnumerateOptions eo;
	eo.includeDirectories = (co.options & SO_DIRECTORIES) != 0;
	eo.maxDuration = co.timeout;

	std::vector<std::string> files;

	if (!enumerateFiles(output, root, eo, files))
		return false;

	return processCandidates(output, query, co, files) > 0;
}

bool processFilterCommand(Output* output, int argc, const char** argv)
{
	const char* query = argc > 2 ? argv[argc - 1] : "";

	CommandOptions co = getSearchOptions(2, argc - 1, argv, output->isTTY());

	std::vector<std::string> lines;

	if (!readStdin(output, lines))
		return false;

	return processCandidates(output, query, co, lines) > 0;
}

bool processMatchCommand(Output* output, int argc, const char** argv)
{
	const char* query = argv[argc - 2];
	const char* candidate = argv[argc - 1];

	CommandOptions co = getSearchOptions(2, argc - 2, argv, output->isTTY());

	FuzzyMatcher matcher(getMatcherOptions(co));

	FuzzyMatch m = matcher.match(query, candidate);

	std::string positions;

	for (size_t i = 0; i < m.positions.size(); ++i)
	{
		char buf[32];
		snprintf(buf, sizeof(buf), "%s%u", i == 0 ? "" : " ", m.positions[i]);
		positions += buf;
	}

	if (co.options & SO_HIGHLIGHT)
	{
		std::vector<HighlightRange> ranges;
		highlightPositions(ranges, candidate, strlen(candidate), m.positions);

		std::string hl;
		highlight(hl, candidate, strlen(candidate), ranges, kHighlightMatch);

		output->print("%s%.3f%s:%s[%s]%s:%s\n", kHighlightScore, m.score, kHighlightSeparator, kHighlightEnd, positions.c_str(), kHighlightSeparator, kHighlightEnd);
		output->rawprint(hl.c_str(), hl.size());
		output->rawprint("\n", 1);
	}
	else
		output->print("%.3f:[%s]:%s\n", m.score, positions.c_str(), candidate);

	return m.score > 0;
}

void printHelp(Output* output, bool extended)
{
	output->print(
"qfuzz %s\n"
"\n"
"Basic commands:\n"
"  qfuzz files <path> <search-options> <query>\n"
"  qfuzz filter <search-options> <query>\n"
"  qfuzz help\n", kVersion);

	if (extended)
		output->print(
"\n"
"Advanced commands:\n"
"  qfuzz match <search-options> <query> <candidate>\n"
"  qfuzz version\n");

	output->print(
"\n"
"<path> is a folder to enumerate; .gitignore files are honored\n"
"<query> is a sequence of characters that must appear in order\n"
"\n"
"<search-options> can include:\n"
"  c - case-sensitive search            p - score path components\n"
"  s - print match scores               S - print search summary\n"
"  L<num> - limit output to <num> lines (default %d, L0 for no limit)\n", kDefaultLimit);

	if (extended)
		output->print(
"  d - include folders in file lists    T<sec> - stop enumerating after <sec> seconds\n"
"  j<num> - use <num> worker threads\n"
"\n"
"<search-options> can include flags for restricting searches to certain files:\n"
"  fi<re> - only search in files with paths matching regex <re>\n"
"  fe<re> - don't search in files with paths matching regex <re>\n"
"\n"
"<search-options> can include additional options for output highlighting:\n"
"  H - force enable highlighting        HD - force disable highlighting\n"
"      (default for TTY output)\n"
"\n"
"Options are also read from QFUZZ_OPTIONS environment variable.\n");
}

int mainImpl(Output* output, int argc, const char** argv)
{
	try
	{
		bool result = true;

		if (argc > 2 && strcmp(argv[1], "files") == 0)
		{
			result = processFilesCommand(output, argc, argv);
		}
		else if (argc > 1 && strcmp(argv[1], "filter") == 0)
		{
			result = processFilterCommand(output, argc, argv);
		}
		else if (argc > 3 && strcmp(argv[1], "match") == 0)
		{
			result = processMatchCommand(output, argc, argv);
		}
		else if (argc > 1 && strcmp(argv[1], "version") == 0)
		{
			output->print("%s\n", kVersion);
		}
		else
		{
			bool extended = argc > 1 && strcmp(argv[1], "help") == 0;

			printHelp(output, extended);
		}

		return result ? 0 : 1;
	}
	catch (const std::exception& e)
	{
		output->error("Uncaught exception: %s\n", e.what());

		return 1;
	}
}

int main(int argc, const char** argv)
{
	StandardOutput output;
	return mainImpl(&output, argc, argv);
}
