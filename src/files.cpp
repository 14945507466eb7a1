// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "files.hpp"

#include "output.hpp"
#include "fileutil.hpp"
#include "ignore.hpp"

#include <chrono>

struct IgnoreLevel
{
	// length of the relative path prefix the rules are relative to
	size_t prefix;

	IgnoreList list;
};

struct EnumerateContext
{
	Output* output;
	EnumerateOptions options;

	std::chrono::steady_clock::time_point start;
	bool timedOut;

	std::vector<IgnoreLevel> levels;
	std::vector<std::string>* result;
};

static bool isDeadlineReached(EnumerateContext& context)
{
	if (context.timedOut)
		return true;

	if (context.options.maxDuration < 0)
		return false;

	std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - context.start;

	if (elapsed.count() > context.options.maxDuration)
		context.timedOut = true;

	return context.timedOut;
}

// Symbolic links are skipped to avoid handling cycles
static bool isTraversable(const DirectoryEntry& e)
{
	if (e.type != FT_FILE && e.type != FT_DIRECTORY)
		return false;

	return e.name != ".git";
}

static bool isIgnored(const EnumerateContext& context, const std::string& relpath, bool isDirectory)
{
	// deeper ignore files take precedence
	for (size_t i = context.levels.size(); i > 0; --i)
	{
		const IgnoreLevel& level = context.levels[i - 1];
		assert(level.prefix <= relpath.size());

		IgnoreVerdict verdict = level.list.check(relpath.c_str() + level.prefix, relpath.size() - level.prefix, isDirectory);

		if (verdict != IV_NONE)
			return verdict == IV_IGNORE;
	}

	return false;
}

static bool enumerateFilesRec(EnumerateContext& context, const std::string& path, const std::string& relpath)
{
	std::vector<DirectoryEntry> entries;

	if (!readDirectory(path.c_str(), entries))
		return false;

	IgnoreLevel level;
	level.prefix = relpath.empty() ? 0 : relpath.size() + 1;
	loadIgnoreFile(context.output, joinPaths(path, ".gitignore").c_str(), level.list);

	bool hasRules = !level.list.empty();
	if (hasRules) context.levels.push_back(level);

	for (auto& e: entries)
	{
		if (isDeadlineReached(context))
			break;

		if (!isTraversable(e))
			continue;

		bool directory = e.type == FT_DIRECTORY;
		std::string entryRelPath = joinPaths(relpath, e.name);

		if (isIgnored(context, entryRelPath, directory))
			continue;

		std::string entryPath = joinPaths(path, e.name);

		if (directory)
		{
			if (context.options.includeDirectories)
				context.result->push_back(entryPath);

			// unreadable subdirectories are skipped
			enumerateFilesRec(context, entryPath, entryRelPath);
		}
		else
			context.result->push_back(entryPath);
	}

	if (hasRules) context.levels.pop_back();

	return true;
}

bool enumerateFiles(Output* output, const char* root, const EnumerateOptions& options, std::vector<std::string>& result)
{
	EnumerateContext context;
	context.output = output;
	context.options = options;
	context.start = std::chrono::steady_clock::now();
	context.timedOut = false;
	context.result = &result;

	result.clear();

	if (!enumerateFilesRec(context, root, ""))
	{
		output->error("Error reading folder %s\n", root);
		return false;
	}

	return true;
}
