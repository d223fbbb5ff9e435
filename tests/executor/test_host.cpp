#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "pagewright/executor/host.hpp"

using namespace pagewright;
using namespace pagewright::executor;

namespace {

struct Session {
    int id = 0;
};

} // namespace

TEST_CASE("Host builds the worker lazily", "[executor][host]") {
    std::atomic<int> builds{0};
    Host<Session> host(
        [&builds]() -> Result<std::unique_ptr<Session>> {
            ++builds;
            return std::make_unique<Session>();
        },
        "session");

    CHECK_FALSE(host.initialized());
    CHECK(builds == 0);
    CHECK(host.name() == "session");

    auto dispatcher = host.get_or_create();
    REQUIRE(dispatcher.has_value());
    CHECK(host.initialized());
    CHECK(builds == 1);
    CHECK(dispatcher->worker()->name() == "session");
}

TEST_CASE("Concurrent first calls share one worker", "[executor][host]") {
    std::atomic<int> builds{0};
    Host<Session> host([&builds]() -> Result<std::unique_ptr<Session>> {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        auto session = std::make_unique<Session>();
        session->id = ++builds;
        return session;
    });

    constexpr int callers = 8;
    std::vector<Result<Dispatcher<Session>>> results(
        callers, std::unexpected(make_error(ErrorCode::Unknown, "unset")));
    std::vector<std::thread> threads;
    for (int i = 0; i < callers; ++i) {
        threads.emplace_back([&host, &results, i] { results[i] = host.get_or_create(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    CHECK(builds == 1);
    for (const auto& result : results) {
        REQUIRE(result.has_value());
        CHECK(*result == *results.front());
    }

    auto id = results.front()->submit([](Session& s) { return s.id; });
    REQUIRE(id.has_value());
    CHECK(*id == 1);
}

TEST_CASE("Host retries after a failed start", "[executor][host]") {
    std::atomic<int> attempts{0};
    Host<Session> host([&attempts]() -> Result<std::unique_ptr<Session>> {
        if (++attempts == 1) {
            return std::unexpected(make_error(ErrorCode::BrowserError, "Chrome not found"));
        }
        return std::make_unique<Session>();
    });

    auto first = host.get_or_create();
    REQUIRE_FALSE(first.has_value());
    CHECK(first.error().code() == ErrorCode::BrowserError);
    CHECK_FALSE(host.initialized());

    auto second = host.get_or_create();
    REQUIRE(second.has_value());
    CHECK(host.initialized());
    CHECK(attempts == 2);
}

TEST_CASE("Host recovers from a factory that throws a non-standard exception",
          "[executor][host]") {
    std::atomic<int> attempts{0};
    Host<Session> host([&attempts]() -> Result<std::unique_ptr<Session>> {
        if (++attempts == 1) {
            throw 42;
        }
        return std::make_unique<Session>();
    });

    auto first = host.get_or_create();
    REQUIRE_FALSE(first.has_value());
    CHECK(first.error().code() == ErrorCode::InternalError);
    CHECK_FALSE(host.initialized());

    auto second = host.get_or_create();
    REQUIRE(second.has_value());
    CHECK(attempts == 2);
}
