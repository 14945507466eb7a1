// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "common.hpp"
#include "output.hpp"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <unistd.h>

StandardOutput::StandardOutput()
{
	istty = isatty(fileno(stdout)) != 0;

	const char* term = getenv("TERM");

	istty = istty && term && strcmp(term, "dumb") != 0;
}

void StandardOutput::rawprint(const char* data, size_t size)
{
	fwrite(data, 1, size, stdout);
}

void StandardOutput::print(const char* message, ...)
{
	va_list l;
	va_start(l, message);
	vfprintf(stdout, message, l);
	va_end(l);
}

void StandardOutput::error(const char* message, ...)
{
	va_list l;
	va_start(l, message);
	vfprintf(stderr, message, l);
	va_end(l);
}

bool StandardOutput::isTTY()
{
	return istty;
}

static void appendFormat(std::string& result, const char* format, va_list args)
{
	va_list temp;
	va_copy(temp, args);
	int count = vsnprintf(0, 0, format, temp);
	va_end(temp);

	if (count <= 0)
		return;

	size_t offset = result.size();

	// vsnprintf needs room for the terminator
	result.resize(offset + count + 1);
	vsnprintf(&result[offset], count + 1, format, args);
	result.resize(offset + count);
}

StringOutput::StringOutput(std::string& buf): result(buf)
{
}

void StringOutput::rawprint(const char* data, size_t size)
{
	std::unique_lock<std::mutex> lock(mutex);

	result.insert(result.end(), data, data + size);
}

void StringOutput::print(const char* message, ...)
{
	std::unique_lock<std::mutex> lock(mutex);

	va_list l;
	va_start(l, message);
	appendFormat(result, message, l);
	va_end(l);
}

void StringOutput::error(const char* message, ...)
{
	std::unique_lock<std::mutex> lock(mutex);

	va_list l;
	va_start(l, message);
	appendFormat(result, message, l);
	va_end(l);
}
