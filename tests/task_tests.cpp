// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <haul/core/task.hpp>
#include <set>

using namespace haul::core;

TEST_CASE("Task::fraction", "[task]") {
    Task task;

    SECTION("Unknown size") {
        task.partial_bytes = 500;
        CHECK(task.fraction() == 0.0);
    }

    SECTION("Partial") {
        task.total_bytes = 1'000'000;
        task.partial_bytes = 400'000;
        CHECK(task.fraction() == Catch::Approx(0.4));
    }

    SECTION("Never above one") {
        task.total_bytes = 100;
        task.partial_bytes = 150;
        CHECK(task.fraction() == 1.0);
    }

    SECTION("Empty file") {
        task.total_bytes = 0;
        CHECK(task.fraction() == 0.0);
        task.status = TaskStatus::completed;
        CHECK(task.fraction() == 1.0);
    }
}

TEST_CASE("Task::is_terminal", "[task]") {
    Task task;
    for (auto status : {TaskStatus::queued, TaskStatus::downloading, TaskStatus::paused, TaskStatus::error}) {
        task.status = status;
        CHECK_FALSE(task.is_terminal());
    }
    task.status = TaskStatus::completed;
    CHECK(task.is_terminal());
    task.status = TaskStatus::cancelled;
    CHECK(task.is_terminal());
}

TEST_CASE("Enum names round-trip", "[task]") {
    for (auto status : {TaskStatus::queued, TaskStatus::downloading, TaskStatus::paused,
                        TaskStatus::completed, TaskStatus::error, TaskStatus::cancelled}) {
        CHECK(parse_status(to_string(status)) == status);
    }
    for (auto priority : {Priority::low, Priority::normal, Priority::high}) {
        CHECK(parse_priority(to_string(priority)) == priority);
    }
    for (auto algorithm : {DigestAlgorithm::md5, DigestAlgorithm::sha1, DigestAlgorithm::sha256}) {
        CHECK(parse_digest_algorithm(to_string(algorithm)) == algorithm);
    }

    CHECK_FALSE(parse_status("running").has_value());
    CHECK_FALSE(parse_priority("urgent").has_value());
    CHECK_FALSE(parse_digest_algorithm("crc32").has_value());
}

TEST_CASE("can_transition follows the task lifecycle", "[task]") {
    SECTION("Queued") {
        CHECK(can_transition(TaskStatus::queued, TaskStatus::downloading));
        CHECK(can_transition(TaskStatus::queued, TaskStatus::paused));
        CHECK(can_transition(TaskStatus::queued, TaskStatus::cancelled));
        CHECK_FALSE(can_transition(TaskStatus::queued, TaskStatus::completed));
    }

    SECTION("Downloading") {
        CHECK(can_transition(TaskStatus::downloading, TaskStatus::completed));
        CHECK(can_transition(TaskStatus::downloading, TaskStatus::error));
        CHECK(can_transition(TaskStatus::downloading, TaskStatus::paused));
        CHECK(can_transition(TaskStatus::downloading, TaskStatus::cancelled));
        CHECK(can_transition(TaskStatus::downloading, TaskStatus::queued));
    }

    SECTION("Paused and error") {
        CHECK(can_transition(TaskStatus::paused, TaskStatus::queued));
        CHECK_FALSE(can_transition(TaskStatus::paused, TaskStatus::downloading));
        CHECK(can_transition(TaskStatus::error, TaskStatus::queued));
        CHECK_FALSE(can_transition(TaskStatus::error, TaskStatus::paused));
    }

    SECTION("Terminal states") {
        CHECK_FALSE(can_transition(TaskStatus::completed, TaskStatus::queued));
        CHECK_FALSE(can_transition(TaskStatus::cancelled, TaskStatus::queued));
    }
}

TEST_CASE("generate_task_id", "[task]") {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = generate_task_id();
        REQUIRE(id.size() == 16);
        CHECK(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        ids.insert(id);
    }
    CHECK(ids.size() == 100);
}

TEST_CASE("Epoch millisecond conversion", "[task]") {
    CHECK(to_epoch_ms(from_epoch_ms(1'700'000'000'123)) == 1'700'000'000'123);
    CHECK(to_epoch_ms(TimePoint{}) == 0);
}
