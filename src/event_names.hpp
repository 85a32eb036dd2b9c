#pragma once

#include <string>

// Symbolic kernel name of a key/button code, "KEY_#<code>" when it has none
std::string key_name(int code);

// Symbolic kernel name of an absolute axis code, "ABS_#<code>" when it has none
std::string axis_name(int code);
