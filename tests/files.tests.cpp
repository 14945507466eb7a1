// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "files.hpp"
#include "fileutil.hpp"
#include "output.hpp"

#include "doctest/doctest.h"

#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

static int removeEntry(const char* path, const struct stat*, int, struct FTW*)
{
	return remove(path);
}

class TempFolder
{
public:
	TempFolder()
	{
		char buf[] = "/tmp/qfuzz-files-XXXXXX";
		REQUIRE(mkdtemp(buf));
		path = buf;
	}

	~TempFolder()
	{
		nftw(path.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS);
	}

	void folder(const char* name)
	{
		REQUIRE(mkdir((path + "/" + name).c_str(), 0755) == 0);
	}

	void file(const char* name, const char* contents = "")
	{
		FILE* f = fopen((path + "/" + name).c_str(), "w");
		REQUIRE(f);
		fputs(contents, f);
		fclose(f);
	}

	std::vector<std::string> relative(const std::vector<std::string>& paths) const
	{
		std::vector<std::string> result;

		for (auto& p: paths)
		{
			REQUIRE(p.compare(0, path.size() + 1, path + "/") == 0);
			result.push_back(p.substr(path.size() + 1));
		}

		return result;
	}

	std::string path;
};

static void makeTree(TempFolder& tf)
{
	tf.file(".gitignore", "*.log\n!keep.log\nbuild/\n");
	tf.file("a.txt");
	tf.file("b.log");
	tf.file("keep.log");

	tf.folder("build");
	tf.file("build/out.o");

	tf.folder(".git");
	tf.file(".git/HEAD");

	tf.folder("other");
	tf.file("other/x.tmp");

	tf.folder("src");
	tf.file("src/.gitignore", "# temporaries\n*.tmp\n");
	tf.file("src/main.cpp");
	tf.file("src/x.tmp");
}

TEST_CASE("files are enumerated depth first honoring ignore files")
{
	TempFolder tf;
	makeTree(tf);

	std::string log;
	StringOutput output(log);

	std::vector<std::string> files;
	REQUIRE(enumerateFiles(&output, tf.path.c_str(), EnumerateOptions(), files));

	std::vector<std::string> expected = {".gitignore", "a.txt", "keep.log", "other/x.tmp", "src/.gitignore", "src/main.cpp"};

	CHECK(tf.relative(files) == expected);
	CHECK(log.empty());
}

TEST_CASE("directories are reported before their contents")
{
	TempFolder tf;
	makeTree(tf);

	std::string log;
	StringOutput output(log);

	EnumerateOptions options;
	options.includeDirectories = true;

	std::vector<std::string> files;
	REQUIRE(enumerateFiles(&output, tf.path.c_str(), options, files));

	std::vector<std::string> expected = {".gitignore", "a.txt", "keep.log", "other", "other/x.tmp", "src", "src/.gitignore", "src/main.cpp"};

	CHECK(tf.relative(files) == expected);
}

TEST_CASE("time budget stops the walk early")
{
	TempFolder tf;
	makeTree(tf);

	std::string log;
	StringOutput output(log);

	EnumerateOptions options;
	options.maxDuration = 0;

	std::vector<std::string> files;
	CHECK(enumerateFiles(&output, tf.path.c_str(), options, files));
	CHECK(files.size() < 6);
	CHECK(log.empty());
}

TEST_CASE("missing root is an error")
{
	std::string log;
	StringOutput output(log);

	std::vector<std::string> files;
	CHECK(!enumerateFiles(&output, "/nonexistent/qfuzz/folder", EnumerateOptions(), files));
	CHECK(files.empty());
	CHECK(log.find("Error reading folder") != std::string::npos);
}

TEST_CASE("directory listing is sorted and skips links")
{
	TempFolder tf;
	tf.file("b");
	tf.file("a");
	tf.folder("c");
	REQUIRE(symlink("a", (tf.path + "/link").c_str()) == 0);

	std::vector<DirectoryEntry> entries;
	REQUIRE(readDirectory(tf.path.c_str(), entries));

	REQUIRE(entries.size() == 4);
	CHECK(entries[0].name == "a");
	CHECK(entries[0].type == FT_FILE);
	CHECK(entries[1].name == "b");
	CHECK(entries[2].name == "c");
	CHECK(entries[2].type == FT_DIRECTORY);
	CHECK(entries[3].name == "link");
	CHECK(entries[3].type == FT_LINK);

	std::string log;
	StringOutput output(log);

	std::vector<std::string> files;
	REQUIRE(enumerateFiles(&output, tf.path.c_str(), EnumerateOptions(), files));

	std::vector<std::string> expected = {"a", "b"};
	CHECK(tf.relative(files) == expected);
}

TEST_CASE("path joining")
{
	CHECK(joinPaths("a", "b") == "a/b");
	CHECK(joinPaths("a/", "b") == "a/b");
	CHECK(joinPaths("", "b") == "b");
}
