// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "ignore.hpp"

#include "doctest/doctest.h"

#include <string.h>

static IgnoreList makeList(std::initializer_list<const char*> lines)
{
	IgnoreList result;

	for (auto line: lines)
	{
		IgnoreRule rule;

		if (parseIgnoreRule(rule, line))
			result.add(rule);
	}

	return result;
}

static IgnoreVerdict check(const IgnoreList& list, const char* path, bool isDirectory = false)
{
	return list.check(path, strlen(path), isDirectory);
}

TEST_CASE("glob conversion")
{
	CHECK(convertGlobToRegex("*.o", false) == "^(?:.*/)?[^/]*\\.o$");
	CHECK(convertGlobToRegex("build", true) == "^build$");
	CHECK(convertGlobToRegex("doc/**/*.txt", true) == "^doc/(?:.*/)?[^/]*\\.txt$");
	CHECK(convertGlobToRegex("out/**", true) == "^out/.*$");
	CHECK(convertGlobToRegex("file?.[ch]", false) == "^(?:.*/)?file[^/]\\.[ch]$");
	CHECK(convertGlobToRegex("[!a]", false) == "^(?:.*/)?[^a]$");
}

TEST_CASE("blank lines and comments are not rules")
{
	IgnoreRule rule;

	CHECK(!parseIgnoreRule(rule, ""));
	CHECK(!parseIgnoreRule(rule, "   "));
	CHECK(!parseIgnoreRule(rule, "# comment"));
	CHECK(!parseIgnoreRule(rule, "/"));

	REQUIRE(parseIgnoreRule(rule, "\\#file"));
	CHECK(!rule.negate);
	CHECK(rule.re->search("#file", 5));
}

TEST_CASE("unanchored patterns match at any depth")
{
	IgnoreList list = makeList({"*.o"});

	CHECK(check(list, "main.o") == IV_IGNORE);
	CHECK(check(list, "src/deep/main.o") == IV_IGNORE);
	CHECK(check(list, "main.cpp") == IV_NONE);
	CHECK(check(list, "main.o.d") == IV_NONE);
}

TEST_CASE("patterns with a slash are anchored")
{
	IgnoreList list = makeList({"/build", "doc/*.txt"});

	CHECK(check(list, "build", true) == IV_IGNORE);
	CHECK(check(list, "src/build", true) == IV_NONE);

	CHECK(check(list, "doc/a.txt") == IV_IGNORE);
	CHECK(check(list, "doc/x/a.txt") == IV_NONE);
	CHECK(check(list, "src/doc/a.txt") == IV_NONE);
}

TEST_CASE("double star matches any number of folders")
{
	IgnoreList list = makeList({"**/cache", "doc/**/*.txt", "out/**"});

	CHECK(check(list, "cache") == IV_IGNORE);
	CHECK(check(list, "a/b/cache") == IV_IGNORE);

	CHECK(check(list, "doc/a.txt") == IV_IGNORE);
	CHECK(check(list, "doc/x/y/a.txt") == IV_IGNORE);

	CHECK(check(list, "out/x/y") == IV_IGNORE);
	CHECK(check(list, "out") == IV_NONE);
}

TEST_CASE("directory-only rules")
{
	IgnoreList list = makeList({"logs/"});

	CHECK(check(list, "logs", true) == IV_IGNORE);
	CHECK(check(list, "nested/logs", true) == IV_IGNORE);
	CHECK(check(list, "logs", false) == IV_NONE);
}

TEST_CASE("last matching rule wins")
{
	IgnoreList list = makeList({"*.log", "!keep.log"});

	CHECK(list.size() == 2);

	CHECK(check(list, "debug.log") == IV_IGNORE);
	CHECK(check(list, "keep.log") == IV_INCLUDE);
	CHECK(check(list, "sub/keep.log") == IV_INCLUDE);

	IgnoreList reversed = makeList({"!keep.log", "*.log"});

	CHECK(check(reversed, "keep.log") == IV_IGNORE);
}

TEST_CASE("trailing spaces are trimmed")
{
	IgnoreList list = makeList({"*.tmp  ", "a\\ "});

	CHECK(check(list, "x.tmp") == IV_IGNORE);
	CHECK(check(list, "a ") == IV_IGNORE);
}
