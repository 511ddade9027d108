#include <gtest/gtest.h>
#include "chrono/timer.hpp"

#include <asio/io_context.hpp>

#include <chrono>
#include <memory>

namespace
{
using namespace ::powminer::chrono;

TEST(Timer, rearms_while_handler_returns_true)
{
    auto io_context = std::make_shared<asio::io_context>();
    Timer timer{io_context};
    int calls = 0;
    timer.start(Milliseconds(1), [&calls]() { return ++calls < 3; });

    // returns once the timer is no longer armed
    io_context->run();
    EXPECT_EQ(calls, 3);
}

TEST(Timer, cancel_wins_over_rearm_request)
{
    auto io_context = std::make_shared<asio::io_context>();
    Timer timer{io_context};
    int calls = 0;
    timer.start(Milliseconds(1), [&calls, &timer]()
    {
        ++calls;
        timer.cancel();
        return true;
    });

    io_context->run_for(std::chrono::milliseconds(200));
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(io_context->stopped());
}

TEST(Timer, start_replaces_previous_handler)
{
    auto io_context = std::make_shared<asio::io_context>();
    Timer timer{io_context};
    int first_calls = 0;
    int second_calls = 0;
    timer.start(Milliseconds(1), [&first_calls]() { ++first_calls; return true; });
    timer.start(Milliseconds(1), [&second_calls]() { ++second_calls; return false; });

    io_context->run_for(std::chrono::milliseconds(200));
    EXPECT_EQ(first_calls, 0);
    EXPECT_EQ(second_calls, 1);
}

}
