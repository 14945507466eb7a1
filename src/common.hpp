// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
