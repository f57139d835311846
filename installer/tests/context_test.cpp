#include "context.hpp"
#include "signals.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace fortress;
using ::testing::ElementsAre;

TEST(run_context, releases_newest_first) {
    std::vector<std::string> order;
    RunContext ctx([] { return false; });
    ctx.hold("volume", [&] { order.push_back("volume"); return true; });
    ctx.hold("mounts", [&] { order.push_back("mounts"); return true; });
    ctx.hold("swap", [&] { order.push_back("swap"); return true; });

    EXPECT_EQ(ctx.release_all(), 0);
    EXPECT_THAT(order, ElementsAre("swap", "mounts", "volume"));
    EXPECT_TRUE(ctx.held().empty());
}

TEST(run_context, higher_stages_release_first) {
    std::vector<std::string> order;
    RunContext ctx([] { return false; });
    // Opened out of order: swap came up before the mounts were adopted
    ctx.hold("root", [&] { order.push_back("root"); return true; }, 0);
    ctx.hold("swap", [&] { order.push_back("swap"); return true; }, 3);
    ctx.hold("home", [&] { order.push_back("home"); return true; }, 1);
    ctx.hold("mounts", [&] { order.push_back("mounts"); return true; }, 2);
    ctx.hold("boot", [&] { order.push_back("boot"); return true; }, 2);

    EXPECT_THAT(ctx.held(), ElementsAre("root", "swap", "home", "mounts", "boot"));
    EXPECT_EQ(ctx.release_all(), 0);
    EXPECT_THAT(order, ElementsAre("swap", "boot", "mounts", "home", "root"));
}

TEST(run_context, holds_a_name_once) {
    int releases = 0;
    RunContext ctx([] { return false; });
    ctx.hold("mounts", [&] { ++releases; return true; });
    ctx.hold("mounts", [&] { ++releases; return true; });

    EXPECT_TRUE(ctx.holds("mounts"));
    EXPECT_FALSE(ctx.holds("swap"));
    EXPECT_THAT(ctx.held(), ElementsAre("mounts"));

    ctx.release_all();
    EXPECT_EQ(releases, 1);
}

TEST(run_context, counts_failed_releases_and_keeps_going) {
    std::vector<std::string> order;
    RunContext ctx([] { return false; });
    ctx.hold("a", [&] { order.push_back("a"); return true; });
    ctx.hold("b", [&] { order.push_back("b"); return false; });

    EXPECT_EQ(ctx.release_all(), 1);
    EXPECT_THAT(order, ElementsAre("b", "a"));
}

TEST(run_context, destructor_releases_while_armed) {
    int releases = 0;
    {
        RunContext ctx([] { return false; });
        ctx.hold("volume", [&] { ++releases; return true; });
    }
    EXPECT_EQ(releases, 1);
}

TEST(run_context, disarmed_context_keeps_resources) {
    int releases = 0;
    {
        RunContext ctx([] { return false; });
        ctx.hold("volume", [&] { ++releases; return true; });
        ctx.disarm();
        EXPECT_FALSE(ctx.armed());
    }
    EXPECT_EQ(releases, 0);
}

TEST(run_context, explicit_release_is_not_repeated_by_destructor) {
    int releases = 0;
    {
        RunContext ctx([] { return false; });
        ctx.hold("volume", [&] { ++releases; return true; });
        ctx.release_all();
    }
    EXPECT_EQ(releases, 1);
}

TEST(run_context, cancel_query_is_consulted) {
    bool cancel = false;
    RunContext ctx([&] { return cancel; });
    EXPECT_FALSE(ctx.cancelled());
    cancel = true;
    EXPECT_TRUE(ctx.cancelled());
}

TEST(run_context, default_context_follows_signal_flag) {
    signals::reset();
    RunContext ctx;
    EXPECT_FALSE(ctx.cancelled());

    signals::request_cancel();
    EXPECT_TRUE(ctx.cancelled());

    signals::reset();
    EXPECT_FALSE(ctx.cancelled());
}
