// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "filterutil.hpp"

#include "output.hpp"
#include "encoding.hpp"
#include "constants.hpp"

#include <stdio.h>
#include <string.h>

void splitLines(std::vector<std::string>& result, const char* buffer, size_t bufferSize)
{
	result.clear();

	const char* end = buffer + bufferSize;

	for (const char* line = buffer; line < end; )
	{
		const char* lend = static_cast<const char*>(memchr(line, '\n', end - line));
		if (!lend) lend = end;

		const char* trimmed = (lend > line && lend[-1] == '\r') ? lend - 1 : lend;

		if (line < trimmed)
			result.push_back(std::string(line, trimmed));

		line = lend + 1;
	}
}

bool readStdin(Output* output, std::vector<std::string>& result)
{
	std::vector<char> buffer;

	while (true)
	{
		size_t offset = buffer.size();
		buffer.resize(offset + kInputChunkSize);

		size_t readsize = fread(&buffer[offset], 1, kInputChunkSize, stdin);
		buffer.resize(offset + readsize);

		if (readsize == 0)
			break;
	}

	if (ferror(stdin))
	{
		output->error("Error reading standard input\n");
		return false;
	}

	// ranking needs the whole input, so lines can't be processed as they arrive
	buffer = convertToUTF8(std::move(buffer));

	splitLines(result, buffer.empty() ? nullptr : &buffer[0], buffer.size());

	return true;
}
