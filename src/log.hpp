#pragma once

#include <cstdio>

// Set from -d/--debug or XPADCFG_DEBUG
extern bool debug_enabled;

#define DEBUG_LOG(...) if (debug_enabled) { fprintf(stderr, __VA_ARGS__); }
