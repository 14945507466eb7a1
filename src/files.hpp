// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <vector>
#include <string>

class Output;

struct EnumerateOptions
{
	bool includeDirectories;

	// Time budget in seconds; negative means no limit
	double maxDuration;

	EnumerateOptions(): includeDirectories(false), maxDuration(-1)
	{
	}
};

// Walks root depth-first honoring .gitignore files; stopping early on the time budget still succeeds.
// Returns false only if root itself can't be read.
bool enumerateFiles(Output* output, const char* root, const EnumerateOptions& options, std::vector<std::string>& result);
