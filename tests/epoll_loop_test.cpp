#include <gtest/gtest.h>
#include <cerrno>

#include "epoll_loop.hpp"

TEST(EpollLoopTest, WaitWithoutInitializeFails) {
    EpollLoop loop;
    std::vector<InputSource*> active;
    EXPECT_EQ(loop.run_once(active, 0), -1);
    EXPECT_TRUE(active.empty());
}

TEST(EpollLoopTest, ClosedDeviceIsNotWatched) {
    EpollLoop loop;
    ASSERT_TRUE(loop.initialize());

    InputSource closed;
    EXPECT_FALSE(loop.add_device(&closed));
    EXPECT_FALSE(loop.add_device(nullptr));
    EXPECT_EQ(loop.device_count(), 0u);
}

TEST(EpollLoopTest, IdleWaitReportsNothingActive) {
    EpollLoop loop;
    ASSERT_TRUE(loop.initialize());

    std::vector<InputSource*> active;
    EXPECT_EQ(loop.run_once(active, 0), 0);
    EXPECT_TRUE(active.empty());
}

TEST(EpollLoopTest, OpeningAMissingNodeLeavesSourceClosed) {
    InputSource source;
    EXPECT_EQ(source.open_device("/nonexistent/xpadcfg/event0"), -ENOENT);
    EXPECT_FALSE(source.is_open());
    EXPECT_LT(source.get_fd(), 0);

    EpollLoop loop;
    ASSERT_TRUE(loop.initialize());
    EXPECT_FALSE(loop.add_device(&source));
}
