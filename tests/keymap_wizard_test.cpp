#include <gtest/gtest.h>
#include <set>
#include <sstream>

#include "catalog.hpp"
#include "keymap_wizard.hpp"
#include "scripted_source.hpp"

namespace {

// One press per catalog button, taken from `codes` in order
ButtonMapping run_wizard(const std::vector<int>& codes) {
    ScriptedEventSource source;
    for (int code : codes) {
        source.press(code);
    }
    EventReader reader(source);
    std::ostringstream out;
    return collect_button_mapping(reader, out);
}

}

TEST(KeymapWizardTest, MapsEveryButtonInCatalogOrder) {
    std::vector<int> codes;
    for (size_t i = 0; i < button_catalog().size(); i++) {
        codes.push_back(BTN_TRIGGER_HAPPY1 + static_cast<int>(i));
    }

    ButtonMapping mapping = run_wizard(codes);

    ASSERT_EQ(mapping.bindings.size(), button_catalog().size());
    for (size_t i = 0; i < mapping.bindings.size(); i++) {
        EXPECT_EQ(mapping.bindings[i].button, button_catalog()[i].name);
        EXPECT_EQ(mapping.bindings[i].code, codes[i]);
    }
}

TEST(KeymapWizardTest, RepeatedKeySkipsTheNextButton) {
    std::vector<int> codes(button_catalog().size(), BTN_START);

    ButtonMapping mapping = run_wizard(codes);

    ASSERT_EQ(mapping.bindings.size(), 1u);
    EXPECT_EQ(mapping.bindings[0].button, "start");
    EXPECT_EQ(mapping.bindings[0].key_name, "BTN_START");
    EXPECT_FALSE(mapping.code_for("back").has_value());
}

TEST(KeymapWizardTest, RecordedBindingsAreInjective) {
    // A mix of fresh and repeated keys
    std::vector<int> pool = {KEY_A, KEY_B, KEY_A, KEY_C, KEY_B, KEY_D, KEY_D, KEY_E};
    std::vector<int> codes;
    for (size_t i = 0; i < button_catalog().size(); i++) {
        codes.push_back(pool[(i * 5) % pool.size()]);
    }

    ButtonMapping mapping = run_wizard(codes);

    std::set<int> seen_codes;
    std::set<std::string> seen_buttons;
    for (const auto& binding : mapping.bindings) {
        EXPECT_TRUE(seen_codes.insert(binding.code).second) << binding.key_name;
        EXPECT_TRUE(seen_buttons.insert(binding.button).second) << binding.button;
    }
    EXPECT_EQ(mapping.bindings.size(), 5u);
}

TEST(KeymapWizardTest, SameKeyTwiceInARow) {
    std::vector<int> codes;
    codes.push_back(KEY_A);
    codes.push_back(KEY_A);
    for (size_t i = 2; i < button_catalog().size(); i++) {
        codes.push_back(BTN_TRIGGER_HAPPY1 + static_cast<int>(i));
    }

    ButtonMapping mapping = run_wizard(codes);

    EXPECT_EQ(mapping.code_for("start"), KEY_A);
    EXPECT_FALSE(mapping.code_for("back").has_value());
    EXPECT_EQ(mapping.bindings.size(), button_catalog().size() - 1);
}
