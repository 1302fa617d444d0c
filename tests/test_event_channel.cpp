#include <catch2/catch.hpp>
#include "../common/EventChannel.hpp"
#include "../common/Log.hpp"
#include <stdexcept>

using netsweep::common::EventChannel;

TEST_CASE("Subscribers receive emitted values", "[events]")
{
    EventChannel<std::string, int> channel;
    std::vector<std::string> seen;

    auto h = channel.Connect([&](const std::string &s, const int &n)
                             { seen.push_back(s + std::to_string(n)); });
    CHECK(h != 0);

    channel.Emit("a", 1);
    CHECK(channel.Disconnect(h));
    CHECK_FALSE(channel.Disconnect(h));
    channel.Emit("b", 2);

    REQUIRE(seen.size() == 1);
    CHECK(seen[0] == "a1");
}

TEST_CASE("Empty callbacks are refused", "[events]")
{
    EventChannel<int> channel;
    CHECK(channel.Connect(nullptr) == 0);
    CHECK(channel.SubscriberCount() == 0);
}

TEST_CASE("A throwing subscriber does not starve the others", "[events]")
{
    netsweep::common::SetLogLevel(netsweep::common::LogLevel::Error);
    EventChannel<int> channel;
    int delivered = 0;

    channel.Connect([](const int &)
                    { throw std::runtime_error("subscriber bug"); });
    channel.Connect([&](const int &v)
                    { delivered += v; });

    REQUIRE_NOTHROW(channel.Emit(3));
    CHECK(delivered == 3);
}

TEST_CASE("Subscribers may disconnect themselves while being notified", "[events]")
{
    EventChannel<int> channel;
    int calls = 0;
    EventChannel<int>::Handle self = 0;

    self = channel.Connect([&](const int &)
                           {
        ++calls;
        channel.Disconnect(self); });

    channel.Emit(1);
    channel.Emit(2);
    CHECK(calls == 1);
    CHECK(channel.SubscriberCount() == 0);

    channel.Connect([](const int &) {});
    channel.DisconnectAll();
    CHECK(channel.SubscriberCount() == 0);
}
