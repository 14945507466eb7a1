// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "regex.hpp"

#include "re2/re2.h"

#include <memory>
#include <stdexcept>
#include <string>

class RE2Regex: public Regex
{
public:
	RE2Regex(const char* string, unsigned int options)
	{
		RE2::Options opts;
		opts.set_never_nl(true);
		opts.set_log_errors(false);
		opts.set_case_sensitive((options & RO_IGNORECASE) == 0);

		re.reset(new RE2(string, opts));
		if (!re->ok())
			throw std::runtime_error("Error parsing regular expression " + (string + (": " + re->error())));
	}

	virtual RegexMatch search(const char* data, size_t size, size_t offset) const
	{
		if (offset > size) return RegexMatch();

		re2::StringPiece p(data, size);
		re2::StringPiece match;

		if (re->Match(p, offset, size, RE2::UNANCHORED, &match, 1))
			return RegexMatch(match.data() ? match.data() : data + offset, match.size());

		return RegexMatch();
	}

private:
	std::unique_ptr<RE2> re;
};

RegexMatch::RegexMatch(): data(0), size(0)
{
}

RegexMatch::RegexMatch(const char* data, size_t size): data(data), size(size)
{
}

RegexMatch::operator bool() const
{
	return data != 0;
}

Regex* createRegex(const char* pattern, unsigned int options)
{
	return new RE2Regex(pattern, options);
}
