#include "log.hpp"

bool debug_enabled = false;
