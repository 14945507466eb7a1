// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "ignore.hpp"

#include "output.hpp"
#include "regex.hpp"

#include <fstream>
#include <stdexcept>

#include <ctype.h>

static void appendLiteral(std::string& result, char ch)
{
	unsigned char uch = static_cast<unsigned char>(ch);

	// non-ASCII bytes are part of UTF-8 sequences and can't be escaped
	if (uch >= 0x80 || isalnum(uch) || ch == '_')
		result += ch;
	else
	{
		result += '\\';
		result += ch;
	}
}

static size_t convertCharacterClass(std::string& result, const std::string& glob, size_t begin)
{
	assert(glob[begin] == '[');

	size_t i = begin + 1;

	bool negate = i < glob.size() && (glob[i] == '!' || glob[i] == '^');
	if (negate) i++;

	// leading ] is a literal
	size_t first = i;

	std::string body;

	for (; i < glob.size(); ++i)
	{
		char ch = glob[i];

		if (ch == ']' && i != first)
			break;

		if (ch == '\\' && i + 1 < glob.size())
			ch = glob[++i];

		if (ch == '-' && i != first && i + 1 < glob.size() && glob[i + 1] != ']')
			body += '-';
		else
			appendLiteral(body, ch);
	}

	// unterminated class is matched literally
	if (i >= glob.size())
	{
		result += "\\[";
		return begin + 1;
	}

	result += negate ? "[^" : "[";
	result += body;
	result += "]";

	return i + 1;
}

std::string convertGlobToRegex(const std::string& glob, bool anchored)
{
	std::string result = anchored ? "^" : "^(?:.*/)?";

	for (size_t i = 0; i < glob.size(); )
	{
		char ch = glob[i];

		if (ch == '*' && i + 1 < glob.size() && glob[i + 1] == '*' && (i == 0 || glob[i - 1] == '/'))
		{
			if (i + 2 == glob.size())
			{
				// trailing /** matches everything inside
				result += ".*";
				i += 2;
			}
			else if (glob[i + 2] == '/')
			{
				// leading **/ or /**/ matches zero or more directories
				result += "(?:.*/)?";
				i += 3;
			}
			else
			{
				result += "[^/]*";
				i += 2;
			}
		}
		else if (ch == '*')
		{
			result += "[^/]*";
			i++;
		}
		else if (ch == '?')
		{
			result += "[^/]";
			i++;
		}
		else if (ch == '[')
		{
			i = convertCharacterClass(result, glob, i);
		}
		else if (ch == '\\' && i + 1 < glob.size())
		{
			appendLiteral(result, glob[i + 1]);
			i += 2;
		}
		else
		{
			appendLiteral(result, ch);
			i++;
		}
	}

	result += "$";

	return result;
}

static std::string trimTrailingSpaces(const std::string& line)
{
	size_t end = line.size();

	while (end > 0 && (line[end - 1] == ' ' || line[end - 1] == '\t' || line[end - 1] == '\r'))
	{
		// escaped space is kept
		if (end >= 2 && line[end - 2] == '\\' && line[end - 1] == ' ')
			break;

		end--;
	}

	return line.substr(0, end);
}

bool parseIgnoreRule(IgnoreRule& rule, const std::string& line)
{
	std::string glob = trimTrailingSpaces(line);

	if (glob.empty() || glob[0] == '#')
		return false;

	rule.pattern = glob;
	rule.negate = false;
	rule.directoryOnly = false;

	if (glob[0] == '!')
	{
		rule.negate = true;
		glob.erase(0, 1);
	}
	else if (glob[0] == '\\' && glob.size() > 1 && (glob[1] == '!' || glob[1] == '#'))
	{
		glob.erase(0, 1);
	}

	if (!glob.empty() && glob.back() == '/')
	{
		rule.directoryOnly = true;
		glob.pop_back();
	}

	bool anchored = glob.find('/') != std::string::npos;

	if (!glob.empty() && glob[0] == '/')
		glob.erase(0, 1);

	if (glob.empty())
		return false;

	rule.re.reset(createRegex(convertGlobToRegex(glob, anchored).c_str(), 0));

	return true;
}

IgnoreVerdict IgnoreList::check(const char* path, size_t length, bool isDirectory) const
{
	for (size_t i = rules.size(); i > 0; --i)
	{
		const IgnoreRule& rule = rules[i - 1];

		if (rule.directoryOnly && !isDirectory)
			continue;

		if (rule.re->search(path, length))
			return rule.negate ? IV_INCLUDE : IV_IGNORE;
	}

	return IV_NONE;
}

void loadIgnoreFile(Output* output, const char* path, IgnoreList& list)
{
	std::ifstream in(path);
	if (!in) return;

	std::string line;
	unsigned int lineId = 0;

	while (std::getline(in, line))
	{
		lineId++;

		try
		{
			IgnoreRule rule;

			if (parseIgnoreRule(rule, line))
				list.add(rule);
		}
		catch (const std::exception& e)
		{
			output->error("%s(%d): %s\n", path, lineId, e.what());
		}
	}
}
