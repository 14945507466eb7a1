// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <mutex>
#include <string>

#include <stddef.h>

class Output
{
public:
	virtual ~Output() {}

	virtual void rawprint(const char* data, size_t size) = 0;

	virtual void print(const char* message, ...) = 0;
	virtual void error(const char* message, ...) = 0;

	virtual bool isTTY() { return false; }
};

class StandardOutput: public Output
{
public:
	StandardOutput();

	virtual void rawprint(const char* data, size_t size);

	virtual void print(const char* message, ...);
	virtual void error(const char* message, ...);

	virtual bool isTTY();

private:
	bool istty;
};

// Collects both regular and error output into a string
class StringOutput: public Output
{
public:
	StringOutput(std::string& buf);

	virtual void rawprint(const char* data, size_t size);

	virtual void print(const char* message, ...);
	virtual void error(const char* message, ...);

private:
	std::string& result;
	std::mutex mutex;
};
