// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "fileutil.hpp"

#include <algorithm>

#include <dirent.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

static FileType getFileType(mode_t mode)
{
	if (S_ISREG(mode)) return FT_FILE;
	if (S_ISDIR(mode)) return FT_DIRECTORY;
	if (S_ISLNK(mode)) return FT_LINK;

	return FT_OTHER;
}

static FileType getFileType(unsigned char type)
{
	switch (type)
	{
	case DT_REG: return FT_FILE;
	case DT_DIR: return FT_DIRECTORY;
	case DT_LNK: return FT_LINK;
	default: return FT_OTHER;
	}
}

bool readDirectory(const char* path, std::vector<DirectoryEntry>& entries)
{
	entries.clear();

	int fd = open(path, O_RDONLY | O_DIRECTORY);
	if (fd < 0)
		return false;

	DIR* dir = fdopendir(fd);

	if (!dir)
	{
		close(fd);
		return false;
	}

	while (dirent* entry = readdir(dir))
	{
		const dirent& data = *entry;

		if (strcmp(data.d_name, ".") == 0 || strcmp(data.d_name, "..") == 0)
			continue;

		DirectoryEntry e;
		e.name = data.d_name;

		// we need to stat DT_UNKNOWN to be able to tell the type
		if (data.d_type == DT_UNKNOWN)
		{
			struct stat st = {};

			// entries that vanished in the meantime are skipped
			if (fstatat(fd, data.d_name, &st, AT_SYMLINK_NOFOLLOW) != 0)
				continue;

			e.type = getFileType(st.st_mode);
		}
		else
			e.type = getFileType(data.d_type);

		entries.push_back(e);
	}

	closedir(dir);

	std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& l, const DirectoryEntry& r) { return l.name < r.name; });

	return true;
}

std::string joinPaths(const std::string& lhs, const std::string& rhs)
{
	if (lhs.empty()) return rhs;
	if (lhs.back() == '/') return lhs + rhs;

	return lhs + "/" + rhs;
}
