#include <catch2/catch.hpp>

#include "input_queue.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("Bounded queue", "[queue]") {

    SECTION("FifoOrder") {
        BoundedQueue<int> q(4);
        REQUIRE(q.push(1));
        REQUIRE(q.push(2));
        REQUIRE(q.push(3));
        REQUIRE(q.size() == 3);
        REQUIRE(q.pop() == 1);
        REQUIRE(q.pop() == 2);
        REQUIRE(q.pop() == 3);
    }

    SECTION("ZeroCapacityBecomesOne") {
        BoundedQueue<int> q(0);
        REQUIRE(q.capacity() == 1);
    }

    SECTION("PushBlocksWhileFull") {
        BoundedQueue<int> q(1);
        REQUIRE(q.push(1));

        std::atomic<bool> pushed{false};
        std::jthread producer([&] {
            q.push(2);
            pushed = true;
        });

        std::this_thread::sleep_for(50ms);
        REQUIRE_FALSE(pushed.load());

        REQUIRE(q.pop() == 1);
        REQUIRE(q.pop() == 2);
        producer.join();
        REQUIRE(pushed.load());
    }

    SECTION("ConsumerSeesProducerOrder") {
        BoundedQueue<int> q(2);
        std::jthread producer([&] {
            for (int i = 0; i < 100; i++) q.push(i);
        });

        std::vector<int> got;
        for (int i = 0; i < 100; i++) got.push_back(*q.pop());
        for (int i = 0; i < 100; i++) REQUIRE(got[i] == i);
    }

    SECTION("CloseReturnsRemainder") {
        BoundedQueue<int> q(4);
        q.push(7);
        q.push(8);
        auto rest = q.close();
        REQUIRE(rest == std::vector<int>{7, 8});
        REQUIRE(q.closed());
        REQUIRE_FALSE(q.push(9));
        REQUIRE_FALSE(q.pop().has_value());
    }

    SECTION("CloseWakesBlockedPop") {
        BoundedQueue<int> q(1);
        std::optional<int> result = 42;
        std::jthread consumer([&] { result = q.pop(); });

        std::this_thread::sleep_for(20ms);
        q.close();
        consumer.join();
        REQUIRE_FALSE(result.has_value());
    }

    SECTION("CloseWakesBlockedPush") {
        BoundedQueue<int> q(1);
        q.push(1);
        std::atomic<int> outcome{-1};
        std::jthread producer([&] { outcome = q.push(2) ? 1 : 0; });

        std::this_thread::sleep_for(20ms);
        q.close();
        producer.join();
        REQUIRE(outcome.load() == 0);
    }
}

TEST_CASE("Input queue", "[queue]") {
    InputQueue q(4);
    REQUIRE(q.push(Event{WindowNew{.window_id = 3}}));
    REQUIRE(q.push(ControlRequest{.command = StackSwapMain{}, .client_fd = 12}));
    REQUIRE(q.push(Terminate{.connection_lost = true}));

    auto first = q.pop();
    REQUIRE(std::holds_alternative<WindowNew>(std::get<Event>(*first)));

    auto second = q.pop();
    REQUIRE(std::get<ControlRequest>(*second).client_fd == 12);

    auto third = q.pop();
    REQUIRE(std::get<Terminate>(*third).connection_lost);
}
