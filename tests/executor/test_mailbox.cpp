#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <thread>
#include <vector>

#include "pagewright/executor/mailbox.hpp"

using pagewright::executor::Mailbox;

namespace {

struct Stamped {
    int value = 0;
    uint64_t seq = 0;

    void set_sequence(uint64_t s) { seq = s; }
};

} // namespace

TEST_CASE("Mailbox pops in push order", "[executor][mailbox]") {
    Mailbox<int> box;
    for (int i = 0; i < 5; ++i) {
        REQUIRE(box.push(int{i}));
    }
    CHECK(box.size() == 5);

    for (int i = 0; i < 5; ++i) {
        auto item = box.pop();
        REQUIRE(item.has_value());
        CHECK(*item == i);
    }
    CHECK(box.size() == 0);
    CHECK(box.pushed() == 5);
}

TEST_CASE("Mailbox stamps sequence numbers", "[executor][mailbox]") {
    Mailbox<Stamped> box;
    box.push(Stamped{10});
    box.push(Stamped{20});

    CHECK(box.pop()->seq == 1);
    CHECK(box.pop()->seq == 2);
}

TEST_CASE("Mailbox close drains before end of stream", "[executor][mailbox]") {
    Mailbox<std::string> box;
    box.push("a");
    box.push("b");
    box.close();

    CHECK(box.closed());
    std::string rejected = "c";
    CHECK_FALSE(box.push(std::move(rejected)));
    CHECK(rejected == "c");

    CHECK(box.pop() == std::optional<std::string>("a"));
    CHECK(box.pop() == std::optional<std::string>("b"));
    CHECK_FALSE(box.pop().has_value());
}

TEST_CASE("Mailbox pop wakes on push from another thread", "[executor][mailbox]") {
    Mailbox<int> box;
    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        box.push(7);
    });

    auto item = box.pop();
    producer.join();
    REQUIRE(item.has_value());
    CHECK(*item == 7);
}

TEST_CASE("Mailbox keeps per-producer order with many producers", "[executor][mailbox]") {
    Mailbox<std::pair<int, int>> box;
    constexpr int producers = 4;
    constexpr int per_producer = 250;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&box, p] {
            for (int i = 0; i < per_producer; ++i) {
                box.push({p, i});
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    box.close();

    std::vector<int> next(producers, 0);
    int total = 0;
    while (auto item = box.pop()) {
        auto [p, i] = *item;
        CHECK(i == next[p]);
        next[p] = i + 1;
        ++total;
    }
    CHECK(total == producers * per_producer);
}
