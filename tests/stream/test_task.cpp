/// @file test_task.cpp
/// @brief Tests for Task and sync_wait

#include <catch2/catch_test_macros.hpp>
#include <beacon/stream/task.hpp>
#include <memory>
#include <stdexcept>
#include <string>

using namespace beacon_stream;

namespace {

Task<int> answer() {
    co_return 42;
}

Task<int> add_answers() {
    int a = co_await answer();
    int b = co_await answer();
    co_return a + b;
}

Task<void> set_flag(bool& flag) {
    flag = true;
    co_return;
}

Task<int> fail() {
    throw std::runtime_error("task failed");
    co_return 0;
}

Task<int> forward_failure() {
    co_return co_await fail();
}

Task<std::unique_ptr<std::string>> make_owned() {
    co_return std::make_unique<std::string>("owned");
}

} // namespace

TEST_CASE("Task: lazy start", "[stream][task]") {
    bool flag = false;
    auto task = set_flag(flag);
    REQUIRE(task.valid());
    REQUIRE_FALSE(task.done());
    REQUIRE_FALSE(flag);

    sync_wait(std::move(task));
    REQUIRE(flag);
}

TEST_CASE("Task: value results", "[stream][task]") {
    REQUIRE(sync_wait(answer()) == 42);
    REQUIRE(sync_wait(add_answers()) == 84);
}

TEST_CASE("Task: move-only results", "[stream][task]") {
    auto owned = sync_wait(make_owned());
    REQUIRE(owned != nullptr);
    REQUIRE(*owned == "owned");
}

TEST_CASE("Task: exceptions propagate", "[stream][task]") {
    REQUIRE_THROWS_AS(sync_wait(fail()), std::runtime_error);
    REQUIRE_THROWS_AS(sync_wait(forward_failure()), std::runtime_error);
}

TEST_CASE("Task: move", "[stream][task]") {
    auto first = answer();
    Task<int> second = std::move(first);
    REQUIRE_FALSE(first.valid());
    REQUIRE(second.valid());
    REQUIRE(sync_wait(std::move(second)) == 42);
}
