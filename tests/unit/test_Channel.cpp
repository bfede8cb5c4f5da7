#include <catch2/catch_test_macros.hpp>

#include "core/Channel.hpp"

#include <thread>
#include <vector>

using namespace vlanvision::core;

TEST_CASE("Channel delivers in order until closed", "[Channel]") {
    Channel<int> channel;
    REQUIRE(channel.push(1));
    REQUIRE(channel.push(2));
    channel.close();

    REQUIRE_FALSE(channel.push(3));
    REQUIRE(channel.isClosed());
    REQUIRE_FALSE(channel.isExhausted());

    REQUIRE(channel.next() == 1);
    REQUIRE(channel.next() == 2);
    REQUIRE_FALSE(channel.next().has_value());
    REQUIRE(channel.isExhausted());
}

TEST_CASE("Bounded channel drops the oldest item", "[Channel]") {
    Channel<int> channel(2);
    channel.push(1);
    channel.push(2);
    channel.push(3);

    REQUIRE(channel.size() == 2);
    REQUIRE(channel.droppedCount() == 1);
    REQUIRE(channel.tryNext() == 2);
    REQUIRE(channel.tryNext() == 3);
    REQUIRE_FALSE(channel.tryNext().has_value());
}

TEST_CASE("Channel wakes a blocked consumer", "[Channel]") {
    Channel<std::string> channel;

    SECTION("On push") {
        std::thread producer([&channel] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            channel.push("hello");
        });
        REQUIRE(channel.next() == "hello");
        producer.join();
    }

    SECTION("On close") {
        std::thread closer([&channel] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            channel.close();
        });
        REQUIRE_FALSE(channel.next().has_value());
        closer.join();
    }

    SECTION("Timed wait gives up") {
        REQUIRE_FALSE(channel.nextFor(std::chrono::milliseconds(10)).has_value());
        REQUIRE_FALSE(channel.isClosed());
    }
}

TEST_CASE("Channel with several producers", "[Channel]") {
    Channel<int> channel;
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&channel, p] {
            for (int i = 0; i < 100; ++i) {
                channel.push(p * 100 + i);
            }
        });
    }
    for (auto& t : producers) {
        t.join();
    }
    channel.close();

    int count = 0;
    while (channel.next()) {
        ++count;
    }
    REQUIRE(count == 400);
}
