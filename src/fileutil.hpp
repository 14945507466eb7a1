// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <string>
#include <vector>

enum FileType
{
	FT_FILE,
	FT_DIRECTORY,
	FT_LINK,
	FT_OTHER,
};

struct DirectoryEntry
{
	std::string name;
	FileType type;
};

// Lists directory entries sorted by name; symbolic links are reported as links and never followed
bool readDirectory(const char* path, std::vector<DirectoryEntry>& entries);

// Joins with a single '/'; an empty lhs yields rhs
std::string joinPaths(const std::string& lhs, const std::string& rhs);
