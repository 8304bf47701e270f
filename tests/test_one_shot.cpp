/**
 * @file test_one_shot.cpp
 * @brief Unit tests for OneShot and ConditionAwaiter
 */

#include <catch2/catch_all.hpp>
#include <drumsync/Log.hpp>
#include <drumsync/OneShot.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

using namespace drumsync;
using namespace std::chrono_literals;

TEST_CASE("OneShot completes exactly once", "[OneShot]") {
    OneShot<int> cell;
    CHECK_FALSE(cell.isComplete());
    CHECK_FALSE(cell.tryGet().has_value());

    CHECK(cell.complete(1));
    CHECK_FALSE(cell.complete(2));
    CHECK(cell.isComplete());
    CHECK(cell.tryGet() == 1);
}

TEST_CASE("OneShot callbacks", "[OneShot]") {
    OneShot<std::string> cell;
    std::vector<std::string> seen;

    SECTION("Registered before completion") {
        cell.onComplete([&seen](const std::string& value) { seen.push_back(value); });
        CHECK(seen.empty());
        cell.complete("loaded");
        REQUIRE(seen.size() == 1);
        CHECK(seen[0] == "loaded");
    }

    SECTION("Registered after completion runs immediately") {
        cell.complete("loaded");
        cell.onComplete([&seen](const std::string& value) { seen.push_back(value); });
        REQUIRE(seen.size() == 1);
    }

    SECTION("A throwing callback does not stop the others") {
        std::vector<LogEntry> logged;
        Log::setSink([&logged](const LogEntry& entry) { logged.push_back(entry); });

        cell.onComplete([](const std::string&) { throw std::runtime_error("callback failure"); });
        cell.onComplete([&seen](const std::string& value) { seen.push_back(value); });
        CHECK(cell.complete("loaded"));
        Log::setSink({});

        CHECK(seen.size() == 1);
        REQUIRE(logged.size() == 1);
        CHECK(logged[0].level == LogLevel::Error);
        CHECK(logged[0].message == "OneShot: Exception in completion callback: callback failure");
    }
}

TEST_CASE("OneShot racing completers", "[OneShot]") {
    OneShot<int> cell;
    std::atomic<int> winners{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&cell, &winners, i] {
            if (cell.complete(i)) {
                winners.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(winners.load() == 1);
    CHECK(cell.isComplete());
}

TEST_CASE("OneShot::waitFor", "[OneShot]") {
    OneShot<int> cell;

    SECTION("Times out with no value") {
        CHECK_FALSE(cell.waitFor(10ms).has_value());
    }

    SECTION("Wakes when another thread completes") {
        std::thread producer([&cell] {
            std::this_thread::sleep_for(5ms);
            cell.complete(42);
        });
        auto value = cell.waitFor(2s);
        producer.join();
        CHECK(value == 42);
    }
}

TEST_CASE("ConditionAwaiter races a deadline", "[OneShot]") {
    asio::io_context io;
    auto work = asio::make_work_guard(io);
    std::thread runner([&io] { io.run(); });

    SECTION("Deadline wins when nothing completes") {
        auto cell = std::make_shared<OneShot<std::string>>();
        auto awaiter = ConditionAwaiter<std::string>::create(io, cell, 20ms, "timeout");

        CHECK(cell->waitFor(2s) == "timeout");
        CHECK_FALSE(awaiter->complete("late"));
        CHECK(cell->tryGet() == "timeout");
    }

    SECTION("Only create() arms an awaiter") {
        STATIC_REQUIRE_FALSE(std::is_constructible_v<ConditionAwaiter<int>, asio::io_context&, OneShotPtr<int>, int>);
        auto cell = std::make_shared<OneShot<int>>();
        auto awaiter = ConditionAwaiter<int>::create(io, cell, 10s, -1);
        CHECK(awaiter->cell() == cell);
        CHECK(awaiter->complete(1));
    }

    SECTION("Completion wins before the deadline") {
        auto cell = std::make_shared<OneShot<std::string>>();
        auto awaiter = ConditionAwaiter<std::string>::create(io, cell, 10s, "timeout");

        CHECK(awaiter->complete("done"));
        CHECK(cell->tryGet() == "done");
    }

    work.reset();
    io.stop();
    runner.join();
}
