#include "keymap_wizard.hpp"
#include "catalog.hpp"
#include "log.hpp"

ButtonMapping collect_button_mapping(EventReader& reader, std::ostream& out) {
    ButtonMapping mapping;
    const auto& buttons = button_catalog();

    out << "\n=== Buttons ===\n";
    out << "Press each button when asked. Press a button you already used to skip one\n";
    out << "your controller does not have.\n\n";

    for (const auto& slot : buttons) {
        out << "Press " << slot.label << ": ";
        out.flush();

        PhysicalKey key = reader.next_key_press();

        if (const ButtonBinding* used = mapping.find_code(key.code)) {
            out << "skipped (" << key.name << " is " << used->button << ")\n";
            continue;
        }

        mapping.bindings.push_back(ButtonBinding{slot.name, key.code, key.name});
        out << key.name << " -> " << slot.name << "\n";
    }

    out << "\nMapped " << mapping.bindings.size() << " out of " << buttons.size() << " buttons\n";
    DEBUG_LOG("button mapping complete: %zu bindings\n", mapping.bindings.size());
    return mapping;
}
