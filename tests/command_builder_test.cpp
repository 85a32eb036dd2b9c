#include <gtest/gtest.h>

#include "command_builder.hpp"

namespace {

ButtonMapping sample_buttons() {
    ButtonMapping buttons;
    buttons.bindings.push_back(ButtonBinding{"start", 0x13b, "BTN_START"});
    buttons.bindings.push_back(ButtonBinding{"a", 30, "KEY_A"});
    return buttons;
}

AxisMapping sample_axes() {
    AxisMapping axes;
    axes.bindings.push_back(AxisBinding{"x1", 0, "ABS_X", false});
    axes.bindings.push_back(AxisBinding{"y1", 1, "ABS_Y", true});
    axes.bindings.push_back(AxisBinding{"lt", 2, "ABS_Z", false});
    return axes;
}

}

TEST(CommandBuilderTest, FullCommand) {
    CommandBuilder builder;
    EXPECT_EQ(builder.build(sample_buttons(), sample_axes()),
              "xboxdrv --evdev {device} --evdev-keymap BTN_START=start,KEY_A=a "
              "--evdev-absmap ABS_X=x1,ABS_Y=y1,ABS_Z=lt --axismap -y1=y1 --mimic-xpad --silent");
}

TEST(CommandBuilderTest, OutputIsDeterministic) {
    CommandBuilder builder("xboxdrv");
    std::string first = builder.build(sample_buttons(), sample_axes());
    std::string second = builder.build(sample_buttons(), sample_axes());
    EXPECT_EQ(first, second);
}

TEST(CommandBuilderTest, EntriesFollowMappingOrder) {
    ButtonMapping buttons;
    buttons.bindings.push_back(ButtonBinding{"y", 0x133, "BTN_NORTH"});
    buttons.bindings.push_back(ButtonBinding{"a", 0x130, "BTN_SOUTH"});
    EXPECT_EQ(CommandBuilder::format_keymap(buttons), "BTN_NORTH=y,BTN_SOUTH=a");
}

TEST(CommandBuilderTest, OnlyInvertedAxesReachTheAxismap) {
    AxisMapping axes = sample_axes();
    axes.bindings[0].inverted = true;
    EXPECT_EQ(CommandBuilder::format_axismap(axes), "-x1=x1,-y1=y1");
}

TEST(CommandBuilderTest, SingleButtonAndAxis) {
    ButtonMapping buttons;
    buttons.bindings.push_back(ButtonBinding{"a", 30, "KEY_A"});
    AxisMapping axes;
    axes.bindings.push_back(AxisBinding{"x1", 0, "ABS_X", false});

    std::string command = CommandBuilder().build(buttons, axes);

    EXPECT_NE(command.find("--evdev-keymap KEY_A=a "), std::string::npos);
    EXPECT_NE(command.find("--evdev-absmap ABS_X=x1 "), std::string::npos);
    EXPECT_EQ(command.find("--axismap"), std::string::npos);
    EXPECT_EQ(CommandBuilder::format_axismap(axes), "");
}

TEST(CommandBuilderTest, EmptyMappingsLeaveOutTheirFlags) {
    EXPECT_EQ(CommandBuilder("/usr/bin/xboxdrv").build(ButtonMapping{}, AxisMapping{}),
              "/usr/bin/xboxdrv --evdev {device} --mimic-xpad --silent");
}
