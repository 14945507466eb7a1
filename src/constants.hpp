// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <stddef.h>

// Batches below this size are matched serially; the fan-out overhead dominates otherwise
const size_t kParallelThreshold = 1000;

// Minimum number of candidates per parallel job
const size_t kParallelGrain = 64;

// Number of jobs per worker the candidates are split into
const size_t kJobsPerWorker = 8;

// Default number of results printed by the command line tool
const unsigned int kDefaultLimit = 100;

// Size of the chunks standard input is read in
const size_t kInputChunkSize = 1 << 20;
