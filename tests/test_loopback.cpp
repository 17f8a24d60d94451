#include <gtest/gtest.h>

#include "transport/itransport.hpp"
#include "transport/loopback_transport.hpp"

using namespace transport;

TEST(Loopback, EchoesFrame)
{
    LoopbackTransport t;
    Frame             captured;

    Settings s{};
    s.name      = "downlink";
    s.max_frame = 100;

    ASSERT_TRUE(t.start(s, [&](const Frame &f) { captured = f; }));
    EXPECT_TRUE(t.link_ready());
    EXPECT_EQ(t.name(), "loopback");

    Frame f = {1, 2, 3, 4, 5};
    EXPECT_TRUE(t.send(f));
    EXPECT_EQ(captured, f);
    EXPECT_EQ(t.sent(), 1u);

    t.stop();
    EXPECT_FALSE(t.link_ready());
}

TEST(Loopback, SendFailsWhenNotStarted)
{
    LoopbackTransport t;
    Frame             f = {0x42};
    EXPECT_FALSE(t.send(f));
}

TEST(Loopback, RefusesOversizeFrame)
{
    LoopbackTransport t;
    int               delivered = 0;

    Settings s{};
    s.max_frame = 4;
    ASSERT_TRUE(t.start(s, [&](const Frame &) { ++delivered; }));

    EXPECT_FALSE(t.send(Frame(5, 0xAA)));
    EXPECT_TRUE(t.send(Frame(4, 0xAA)));
    EXPECT_EQ(delivered, 1);
}
