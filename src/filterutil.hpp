// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <string>
#include <vector>

#include <stddef.h>

class Output;

// Splits a buffer into non-empty lines, dropping trailing \r
void splitLines(std::vector<std::string>& result, const char* buffer, size_t bufferSize);

// Reads all of standard input, converting it to UTF-8, and splits it into lines
bool readStdin(Output* output, std::vector<std::string>& result);
