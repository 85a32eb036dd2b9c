#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

#include "device_scanner.hpp"
#include "scripted_source.hpp"

TEST(DeviceScannerTest, SingleActiveDeviceIsSelected) {
    FakeBackend backend;
    backend.rounds.push_back({"/dev/input/event1"});
    DeviceScanner scanner(backend, std::chrono::milliseconds(0));

    EXPECT_EQ(scanner.detect_gamepad(), "/dev/input/event1");
    EXPECT_EQ(scanner.get_attempts(), 1);
    EXPECT_EQ(backend.pauses, 1);
}

TEST(DeviceScannerTest, TwoActiveDevicesRetryTheScan) {
    FakeBackend backend;
    backend.rounds.push_back({"/dev/input/event0", "/dev/input/event2"});
    backend.rounds.push_back({"/dev/input/event0", "/dev/input/event1", "/dev/input/event2"});
    backend.rounds.push_back({"/dev/input/event2"});
    DeviceScanner scanner(backend, std::chrono::milliseconds(0));

    EXPECT_EQ(scanner.detect_gamepad(), "/dev/input/event2");
    EXPECT_EQ(scanner.get_attempts(), 3);
    EXPECT_EQ(backend.waits, 3);
    EXPECT_EQ(backend.pauses, 1);
}

TEST(DeviceScannerTest, NoActiveDeviceRetries) {
    FakeBackend backend;
    backend.rounds.push_back({});
    backend.rounds.push_back({"/dev/input/event0"});
    DeviceScanner scanner(backend, std::chrono::milliseconds(0));

    EXPECT_EQ(scanner.detect_gamepad(), "/dev/input/event0");
    EXPECT_EQ(scanner.get_attempts(), 2);
}

TEST(DeviceScannerTest, NoDeviceFilesIsFatal) {
    FakeBackend backend;
    backend.devices.clear();
    DeviceScanner scanner(backend, std::chrono::milliseconds(0));

    EXPECT_THROW(scanner.detect_gamepad(), ScanError);
    EXPECT_EQ(backend.waits, 0);
}

class EvdevBackendTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("xpadcfg-input-" + std::to_string(getpid()));
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    void touch(const std::string& name) {
        std::ofstream file(dir / name);
    }
};

TEST_F(EvdevBackendTest, ListsOnlyEventNodesSorted) {
    touch("event3");
    touch("event10");
    touch("js0");
    touch("mouse0");
    touch("event1");

    EvdevBackend backend(dir.string());
    std::vector<std::string> expected = {
        (dir / "event1").string(),
        (dir / "event10").string(),
        (dir / "event3").string()
    };
    EXPECT_EQ(backend.list_devices(), expected);
}

TEST_F(EvdevBackendTest, MissingDirectoryListsNothing) {
    EvdevBackend backend((dir / "absent").string());
    EXPECT_TRUE(backend.list_devices().empty());
}

TEST_F(EvdevBackendTest, NothingOpenableIsAnError) {
    // Regular files are not evdev nodes, so libevdev refuses every one
    touch("event0");
    EvdevBackend backend(dir.string());

    EXPECT_THROW(backend.wait_for_input(backend.list_devices()), ScanError);
}
