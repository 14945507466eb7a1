// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
