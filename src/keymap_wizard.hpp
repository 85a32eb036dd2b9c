#pragma once

#include <ostream>

#include "event_reader.hpp"
#include "mapping.hpp"

// Prompts for every catalog button in order. Pressing a key that is already
// bound skips the current button.
ButtonMapping collect_button_mapping(EventReader& reader, std::ostream& out);
