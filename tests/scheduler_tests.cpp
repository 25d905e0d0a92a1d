// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <haul/core/scheduler.hpp>
#include "fake_transport.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <atomic>
#include <set>

using namespace haul::core;
using namespace haul::store;
using namespace haul::test;
using namespace std::chrono_literals;

namespace {

std::string url_for(const std::string& name) {
    return "http://files.test/" + name;
}

// Memory store that can be told to reject writes for one task
class FlakyStore : public TaskStore {
public:
    void reject(std::string id) {
        std::lock_guard lock(mutex_);
        rejected_ = std::move(id);
    }

    std::error_code upsert(const Task& task) noexcept override {
        {
            std::lock_guard lock(mutex_);
            if (task.id == rejected_) return make_error_code(TaskErrc::storage_error);
        }
        return inner_.upsert(task);
    }
    std::expected<std::vector<Task>, std::error_code> get_all() noexcept override { return inner_.get_all(); }
    std::expected<Task, std::error_code> get(std::string_view id) noexcept override { return inner_.get(id); }
    std::error_code remove(std::string_view id) noexcept override { return inner_.remove(id); }
    std::expected<std::size_t, std::error_code>
    remove_completed_older_than(std::chrono::milliseconds age) noexcept override {
        return inner_.remove_completed_older_than(age);
    }

private:
    std::mutex mutex_;
    std::string rejected_;
    MemoryTaskStore inner_;
};

struct Fixture {
    TempDir dir;
    SchedulerConfig config;
    std::shared_ptr<TaskStore> store = std::make_shared<MemoryTaskStore>();
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();

    Fixture() {
        config.max_concurrent = 1;
        config.chunk_size = FakeTransport::PIECE;
        config.progress_interval = 20ms;
        config.retry_base_delay = 0ms;
        config.retry_max_delay = 0ms;
        config.download_dir = dir.path();
    }

    std::unique_ptr<Scheduler> make() {
        return std::make_unique<Scheduler>(config, store, transport);
    }

    // Serve a payload under `name` and enqueue it
    std::string add(Scheduler& scheduler, const std::string& name, std::size_t size = 20'000,
                    Priority priority = Priority::normal) {
        transport->serve(url_for(name), make_payload(size, static_cast<std::uint32_t>(name.size() + name[0])));
        Task task;
        task.url = url_for(name);
        task.priority = priority;
        auto id = scheduler.enqueue_task(task);
        REQUIRE(id.has_value());
        return *id;
    }
};

bool reaches(Scheduler& scheduler, const std::string& id, TaskStatus status) {
    return wait_until([&] {
        auto task = scheduler.task(id);
        return task && task->status == status;
    });
}

} // namespace

TEST_CASE("Scheduler admits by priority then age", "[scheduler]") {
    Fixture f;
    auto scheduler = f.make();

    auto b = f.add(*scheduler, "b.bin");
    auto c = f.add(*scheduler, "c.bin");
    auto a = f.add(*scheduler, "a.bin", 20'000, Priority::high);

    CHECK(scheduler->pending_order() == std::vector<std::string>{a, b, c});
    CHECK(scheduler->active_ids().empty());
    CHECK(scheduler->task(b)->status == TaskStatus::queued);

    for (const auto* name : {"a.bin", "b.bin", "c.bin"}) {
        f.transport->hold(url_for(name));
    }

    REQUIRE(!scheduler->start());
    CHECK(scheduler->active_ids() == std::vector<std::string>{a});
    CHECK(scheduler->pending_order() == std::vector<std::string>{b, c});

    // Pausing frees the slot for the next in line
    REQUIRE(!scheduler->pause_task(a));
    CHECK(scheduler->task(a)->status == TaskStatus::paused);
    CHECK(scheduler->active_ids() == std::vector<std::string>{b});
    CHECK(scheduler->pending_order() == std::vector<std::string>{c});

    f.transport->release_all();
    REQUIRE(reaches(*scheduler, c, TaskStatus::completed));
    CHECK(scheduler->task(b)->status == TaskStatus::completed);
    CHECK(scheduler->task(a)->status == TaskStatus::paused);
}

TEST_CASE("Scheduler admits a high priority task enqueued first before older normal ones", "[scheduler]") {
    Fixture f;
    auto scheduler = f.make();

    auto a = f.add(*scheduler, "a.bin", 20'000, Priority::high);
    auto b = f.add(*scheduler, "b.bin");
    auto c = f.add(*scheduler, "c.bin");
    CHECK(scheduler->pending_order() == std::vector<std::string>{a, b, c});

    REQUIRE(!scheduler->start());
    REQUIRE(reaches(*scheduler, c, TaskStatus::completed));

    std::vector<std::string> fetched;
    for (const auto& request : f.transport->requests()) {
        fetched.push_back(request.url);
    }
    CHECK(fetched == std::vector<std::string>{url_for("a.bin"), url_for("b.bin"), url_for("c.bin")});
    CHECK(scheduler->task(a)->status == TaskStatus::completed);
    CHECK(scheduler->task(b)->status == TaskStatus::completed);
}

TEST_CASE("Scheduler set_priority reorders waiting tasks", "[scheduler]") {
    Fixture f;
    auto scheduler = f.make();

    auto a = f.add(*scheduler, "a.bin");
    auto b = f.add(*scheduler, "b.bin");
    auto c = f.add(*scheduler, "c.bin");

    REQUIRE(!scheduler->set_priority(c, Priority::high));
    CHECK(scheduler->pending_order() == std::vector<std::string>{c, a, b});

    REQUIRE(!scheduler->set_priority(a, Priority::low));
    CHECK(scheduler->pending_order() == std::vector<std::string>{c, b, a});
    CHECK(f.store->get(a)->priority == Priority::low);
}

TEST_CASE("Scheduler resumes a paused transfer from its offset", "[scheduler]") {
    Fixture f;
    const auto body = make_payload(1'000'000);
    const auto path = f.dir / "big.iso";
    f.transport->serve(url_for("big.iso"), body, "\"big\"");
    write_file(path, body.substr(0, 400'000));

    Task seeded;
    seeded.id = "0123456789abcdef";
    seeded.url = url_for("big.iso");
    seeded.file_name = "big.iso";
    seeded.save_path = path.string();
    seeded.status = TaskStatus::paused;
    seeded.partial_bytes = 400'000;
    seeded.total_bytes = 1'000'000;
    seeded.etag = "\"big\"";
    seeded.created_at = Clock::now();
    REQUIRE(!f.store->upsert(seeded));

    auto scheduler = f.make();
    REQUIRE(!scheduler->start());
    CHECK(scheduler->task(seeded.id)->status == TaskStatus::paused);
    CHECK(f.transport->requests().empty());

    REQUIRE(!scheduler->resume_task(seeded.id));
    REQUIRE(reaches(*scheduler, seeded.id, TaskStatus::completed));

    auto requests = f.transport->requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].offset == 400'000);
    CHECK(requests[0].if_range == "\"big\"");

    auto done = scheduler->task(seeded.id);
    CHECK(done->partial_bytes == 1'000'000);
    CHECK(done->total_bytes == 1'000'000u);
    CHECK(done->completed_at.has_value());
    CHECK(read_file(path) == body);
    CHECK(f.store->get(seeded.id)->status == TaskStatus::completed);
}

TEST_CASE("Scheduler never exceeds the concurrency limit", "[scheduler]") {
    Fixture f;
    f.config.max_concurrent = 2;
    f.transport->piece_delay(1ms);
    auto scheduler = f.make();
    REQUIRE(!scheduler->start());

    std::atomic<std::size_t> worst{0};
    auto sub = scheduler->state_changes().subscribe([&](const TasksChanged&) {
        auto downloading = scheduler->stats().downloading;
        std::size_t seen = worst.load();
        while (downloading > seen && !worst.compare_exchange_weak(seen, downloading)) {}
    });

    std::vector<std::string> ids;
    for (int i = 0; i < 6; ++i) {
        ids.push_back(f.add(*scheduler, "file" + std::to_string(i) + ".bin", 40'000));
        CHECK(scheduler->active_ids().size() <= 2);
    }

    for (const auto& id : ids) {
        REQUIRE(reaches(*scheduler, id, TaskStatus::completed));
    }
    CHECK(f.transport->peak() <= 2);
    CHECK(f.transport->peak() >= 1);
    CHECK(worst.load() <= 2);
    CHECK(scheduler->stats().completed == 6);
    CHECK(scheduler->idle());
}

TEST_CASE("Scheduler pause_all and resume_all keep every task", "[scheduler]") {
    Fixture f;
    f.config.max_concurrent = 2;
    auto scheduler = f.make();

    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        const auto name = "part" + std::to_string(i) + ".bin";
        f.transport->hold(url_for(name), 2 * FakeTransport::PIECE);
        ids.push_back(f.add(*scheduler, name));
    }
    REQUIRE(!scheduler->start());
    REQUIRE(wait_until([&] { return f.transport->active() == 2; }));

    REQUIRE(!scheduler->pause_all());
    CHECK(scheduler->active_ids().empty());
    CHECK(scheduler->pending_order().empty());
    CHECK(scheduler->stats().paused == 5);

    f.transport->release_all();
    REQUIRE(!scheduler->resume_all());

    for (const auto& id : ids) {
        REQUIRE(reaches(*scheduler, id, TaskStatus::completed));
    }
    auto tasks = scheduler->tasks();
    CHECK(tasks.size() == 5);
    std::set<std::string> unique;
    for (const auto& t : tasks) unique.insert(t.id);
    CHECK(unique.size() == 5);
    CHECK(scheduler->stats().completed == 5);
}

TEST_CASE("Scheduler pause and resume are idempotent", "[scheduler]") {
    Fixture f;
    auto scheduler = f.make();
    auto id = f.add(*scheduler, "a.bin");

    REQUIRE(!scheduler->pause_task(id));
    const auto first = scheduler->task(id)->updated_at;
    std::this_thread::sleep_for(5ms);
    REQUIRE(!scheduler->pause_task(id));
    CHECK(scheduler->task(id)->updated_at == first);
    CHECK(scheduler->pending_order().empty());

    REQUIRE(!scheduler->resume_task(id));
    REQUIRE(!scheduler->resume_task(id));
    CHECK(scheduler->pending_order() == std::vector<std::string>{id});
}

TEST_CASE("Scheduler remove cancels an active transfer", "[scheduler]") {
    Fixture f;
    auto scheduler = f.make();
    f.transport->hold(url_for("a.bin"), 2 * FakeTransport::PIECE);
    auto id = f.add(*scheduler, "a.bin");
    REQUIRE(!scheduler->start());

    REQUIRE(wait_until([&] { return f.transport->holding(url_for("a.bin")); }));
    REQUIRE(wait_until([&] { return scheduler->progress().contains(id); }));

    REQUIRE(!scheduler->remove_task(id));
    CHECK(scheduler->task(id)->status == TaskStatus::cancelled);
    CHECK(scheduler->active_ids().empty());
    CHECK(f.store->get(id)->status == TaskStatus::cancelled);
    CHECK(wait_until([&] { return !scheduler->progress().contains(id); }));

    // Removing twice is harmless; a cancelled task cannot be resumed
    CHECK(!scheduler->remove_task(id));
    CHECK(scheduler->resume_task(id) == TaskErrc::invalid_transition);
}

TEST_CASE("Scheduler retries transient failures", "[scheduler]") {
    Fixture f;

    SECTION("Recovers within the retry budget") {
        auto scheduler = f.make();
        f.transport->serve(url_for("a.bin"), make_payload(10'000));
        f.transport->fail_next(url_for("a.bin"), make_error_code(TaskErrc::network_error), 2);
        REQUIRE(!scheduler->start());

        Task task;
        task.url = url_for("a.bin");
        auto id = scheduler->enqueue_task(task);
        REQUIRE(id.has_value());

        REQUIRE(reaches(*scheduler, *id, TaskStatus::completed));
        CHECK(scheduler->task(*id)->retry_count == 2);
        CHECK_FALSE(scheduler->task(*id)->error_message.has_value());
        CHECK(f.transport->requests_for(url_for("a.bin")).size() == 3);
    }

    SECTION("Gives up after max_retries, manual retry starts over") {
        f.config.max_retries = 2;
        auto scheduler = f.make();
        f.transport->serve(url_for("a.bin"), make_payload(10'000));
        f.transport->fail_next(url_for("a.bin"), make_error_code(TaskErrc::server_error), 2);
        REQUIRE(!scheduler->start());

        Task task;
        task.url = url_for("a.bin");
        auto id = scheduler->enqueue_task(task);
        REQUIRE(id.has_value());

        REQUIRE(reaches(*scheduler, *id, TaskStatus::error));
        auto failed = scheduler->task(*id);
        CHECK(failed->retry_count == 2);
        REQUIRE(failed->error_message.has_value());
        CHECK(failed->error_message->starts_with("gave up after 2 attempts"));
        CHECK(f.transport->requests_for(url_for("a.bin")).size() == 2);

        REQUIRE(!scheduler->retry_task(*id));
        REQUIRE(reaches(*scheduler, *id, TaskStatus::completed));
        CHECK(scheduler->task(*id)->retry_count == 0);
    }

    SECTION("Permanent failures are not retried") {
        auto scheduler = f.make();
        REQUIRE(!scheduler->start());

        Task task;
        task.url = url_for("missing.bin");
        auto id = scheduler->enqueue_task(task);
        REQUIRE(id.has_value());

        REQUIRE(reaches(*scheduler, *id, TaskStatus::error));
        CHECK(scheduler->task(*id)->retry_count == 1);
        CHECK(f.transport->requests_for(url_for("missing.bin")).size() == 1);
        CHECK(scheduler->retry_task("nope") == TaskErrc::task_not_found);
    }
}

TEST_CASE("Scheduler runs other work while a failed task backs off", "[scheduler]") {
    Fixture f;
    f.config.retry_base_delay = 200ms;
    f.config.retry_max_delay = 1s;
    auto scheduler = f.make();

    f.transport->fail_next(url_for("a.bin"), make_error_code(TaskErrc::network_error));
    auto a = f.add(*scheduler, "a.bin");
    auto b = f.add(*scheduler, "b.bin");

    std::atomic<bool> b_ran_while_a_waited{false};
    auto sub = scheduler->state_changes().subscribe([&](const TasksChanged&) {
        auto ta = scheduler->task(a);
        auto tb = scheduler->task(b);
        if (ta && tb && ta->status == TaskStatus::queued && ta->retry_count == 1 &&
            (tb->status == TaskStatus::downloading || tb->status == TaskStatus::completed)) {
            b_ran_while_a_waited = true;
        }
    });

    const auto started = std::chrono::steady_clock::now();
    REQUIRE(!scheduler->start());

    REQUIRE(reaches(*scheduler, b, TaskStatus::completed));
    REQUIRE(reaches(*scheduler, a, TaskStatus::completed));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(b_ran_while_a_waited.load());
    CHECK(elapsed >= 200ms);
    CHECK(scheduler->task(a)->retry_count == 1);
    CHECK(f.transport->requests_for(url_for("a.bin")).size() == 2);
}

TEST_CASE("Scheduler restarts when the remote file changed while paused", "[scheduler]") {
    Fixture f;
    auto scheduler = f.make();
    const auto url = url_for("data.bin");
    const auto first = make_payload(30'000, 1);
    const auto second = make_payload(50'000, 2);

    std::string old_etag;
    std::string new_etag;
    SECTION("New validator") {
        old_etag = "\"v1\"";
        new_etag = "\"v2\"";
    }
    SECTION("No validator, new length") {}

    f.transport->serve(url, first, old_etag);
    f.transport->hold(url, 3 * FakeTransport::PIECE);
    Task task;
    task.url = url;
    auto id = scheduler->enqueue_task(task);
    REQUIRE(id.has_value());
    REQUIRE(!scheduler->start());

    REQUIRE(wait_until([&] { return f.transport->holding(url); }));
    REQUIRE(!scheduler->pause_task(*id));
    CHECK(scheduler->task(*id)->partial_bytes == 3 * FakeTransport::PIECE);
    CHECK(scheduler->task(*id)->total_bytes == 30'000u);

    // Same URL now serves a longer file
    f.transport->serve(url, second, new_etag);
    f.transport->release(url);
    REQUIRE(!scheduler->resume_task(*id));
    REQUIRE(reaches(*scheduler, *id, TaskStatus::completed));

    auto done = scheduler->task(*id);
    CHECK(done->total_bytes == 50'000u);
    CHECK(done->partial_bytes == 50'000u);
    CHECK(done->retry_count == 0);
    CHECK(read_file(done->save_path) == second);
    auto requests = f.transport->requests_for(url);
    REQUIRE(requests.size() >= 2);
    CHECK(requests[1].offset == 3 * FakeTransport::PIECE);
    CHECK(requests[1].if_range == old_etag);
}

TEST_CASE("Scheduler finishes a file that is already complete on disk", "[scheduler]") {
    Fixture f;
    auto scheduler = f.make();
    const auto url = url_for("data.bin");
    const auto body = make_payload(30'000);
    f.transport->serve(url, body);

    SECTION("Whole file present") {
        write_file(f.dir / "data.bin", body);

        Task task;
        task.url = url;
        auto id = scheduler->enqueue_task(task);
        REQUIRE(id.has_value());
        CHECK(scheduler->task(*id)->partial_bytes == 30'000u);
        REQUIRE(!scheduler->start());

        REQUIRE(reaches(*scheduler, *id, TaskStatus::completed));
        CHECK(scheduler->task(*id)->total_bytes == 30'000u);
        CHECK(scheduler->task(*id)->retry_count == 0);
        auto requests = f.transport->requests_for(url);
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].offset == 30'000u);
        CHECK(read_file(f.dir / "data.bin") == body);
    }

    SECTION("Longer leftover than the remote file") {
        write_file(f.dir / "data.bin", make_payload(40'000, 9));

        Task task;
        task.url = url;
        auto id = scheduler->enqueue_task(task);
        REQUIRE(id.has_value());
        REQUIRE(!scheduler->start());

        REQUIRE(reaches(*scheduler, *id, TaskStatus::completed));
        CHECK(scheduler->task(*id)->total_bytes == 30'000u);
        auto requests = f.transport->requests_for(url);
        REQUIRE(requests.size() == 2);
        CHECK(requests[0].offset == 40'000u);
        CHECK(requests[1].offset == 0u);
        CHECK(read_file(f.dir / "data.bin") == body);
    }
}

TEST_CASE("Scheduler fails integrity errors without retrying", "[scheduler]") {
    Fixture f;
    auto scheduler = f.make();
    f.transport->serve(url_for("abc.txt"), "abd");
    REQUIRE(!scheduler->start());

    Task task;
    task.url = url_for("abc.txt");
    task.digest = Digest{DigestAlgorithm::md5, "900150983cd24fb0d6963f7d28e17f72"};
    auto id = scheduler->enqueue_task(task);
    REQUIRE(id.has_value());

    REQUIRE(reaches(*scheduler, *id, TaskStatus::error));
    auto failed = scheduler->task(*id);
    CHECK(failed->partial_bytes == 0);
    CHECK_FALSE(failed->total_bytes.has_value());
    CHECK(failed->retry_count == 1);
    CHECK(f.transport->requests().size() == 1);
}

TEST_CASE("Scheduler restores interrupted transfers as queued", "[scheduler]") {
    Fixture f;
    Task stale;
    stale.id = "feedfacefeedface";
    stale.url = url_for("a.bin");
    stale.save_path = (f.dir / "a.bin").string();
    stale.status = TaskStatus::downloading;
    stale.created_at = Clock::now();
    REQUIRE(!f.store->upsert(stale));

    auto scheduler = f.make();
    REQUIRE(!scheduler->restore());
    CHECK(scheduler->task(stale.id)->status == TaskStatus::queued);
    CHECK(f.store->get(stale.id)->status == TaskStatus::queued);
    CHECK(scheduler->pending_order() == std::vector<std::string>{stale.id});

    // Idempotent
    REQUIRE(!scheduler->restore());
    CHECK(scheduler->tasks().size() == 1);
}

TEST_CASE("Scheduler in-memory recovery leaves the store untouched", "[scheduler]") {
    Fixture f;
    Task live;
    live.id = "cafebabecafebabe";
    live.url = url_for("a.bin");
    live.save_path = (f.dir / "a.bin").string();
    live.status = TaskStatus::downloading;
    live.partial_bytes = 4096;
    live.created_at = Clock::now();
    REQUIRE(!f.store->upsert(live));
    const auto stored = f.store->get(live.id);
    REQUIRE(stored.has_value());

    // Another process may still be transferring this record
    auto scheduler = f.make();
    REQUIRE(!scheduler->restore(Recovery::in_memory));
    CHECK(scheduler->task(live.id)->status == TaskStatus::queued);
    CHECK(*f.store->get(live.id) == *stored);
    CHECK(f.transport->requests().empty());
}

TEST_CASE("Scheduler stop re-queues at the flushed offset", "[scheduler]") {
    Fixture f;
    const auto body = make_payload(50'000);
    f.transport->serve(url_for("a.bin"), body);
    f.transport->hold(url_for("a.bin"), 2 * FakeTransport::PIECE);

    std::string id;
    {
        auto scheduler = f.make();
        REQUIRE(!scheduler->start());
        Task task;
        task.url = url_for("a.bin");
        auto queued = scheduler->enqueue_task(task);
        REQUIRE(queued.has_value());
        id = *queued;

        REQUIRE(wait_until([&] { return f.transport->holding(url_for("a.bin")); }));
        scheduler->stop();
        CHECK_FALSE(scheduler->running());
        CHECK(scheduler->task(id)->status == TaskStatus::queued);
        CHECK(scheduler->task(id)->partial_bytes == 2 * FakeTransport::PIECE);
    }

    auto stored = f.store->get(id);
    REQUIRE(stored.has_value());
    CHECK(stored->status == TaskStatus::queued);
    CHECK(stored->partial_bytes == 2 * FakeTransport::PIECE);

    f.transport->release_all();
    auto scheduler = f.make();
    REQUIRE(!scheduler->start());
    REQUIRE(reaches(*scheduler, id, TaskStatus::completed));

    auto requests = f.transport->requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[1].offset == 2 * FakeTransport::PIECE);
    CHECK(read_file(f.dir / "a.bin") == body);
}

TEST_CASE("Scheduler isolates a task whose record cannot be written", "[scheduler]") {
    Fixture f;
    auto flaky = std::make_shared<FlakyStore>();
    f.store = flaky;
    f.config.max_concurrent = 2;
    auto scheduler = f.make();

    auto bad = f.add(*scheduler, "bad.bin");
    auto good = f.add(*scheduler, "good.bin");
    flaky->reject(bad);

    REQUIRE(!scheduler->start());
    REQUIRE(reaches(*scheduler, good, TaskStatus::completed));

    auto failed = scheduler->task(bad);
    CHECK(failed->status == TaskStatus::error);
    CHECK(failed->error_message.has_value());
    CHECK(f.transport->requests_for(url_for("bad.bin")).empty());
    CHECK(scheduler->idle());
}

TEST_CASE("Scheduler honours scheduled start times", "[scheduler]") {
    Fixture f;
    auto scheduler = f.make();
    REQUIRE(!scheduler->start());

    f.transport->serve(url_for("later.bin"), make_payload(1'000));
    Task task;
    task.url = url_for("later.bin");
    task.scheduled_at = Clock::now() + 300ms;
    auto id = scheduler->enqueue_task(task);
    REQUIRE(id.has_value());

    CHECK(scheduler->active_ids().empty());
    CHECK(scheduler->task(*id)->status == TaskStatus::queued);

    REQUIRE(reaches(*scheduler, *id, TaskStatus::completed));
    auto done = scheduler->task(*id);
    REQUIRE(done->started_at.has_value());
    CHECK(*done->started_at >= *task.scheduled_at);
}

TEST_CASE("Scheduler validates commands", "[scheduler]") {
    Fixture f;
    auto scheduler = f.make();

    SECTION("Unknown ids") {
        CHECK(scheduler->pause_task("x") == TaskErrc::task_not_found);
        CHECK(scheduler->resume_task("x") == TaskErrc::task_not_found);
        CHECK(scheduler->remove_task("x") == TaskErrc::task_not_found);
        CHECK(scheduler->retry_task("x") == TaskErrc::task_not_found);
        CHECK(scheduler->delete_task("x") == TaskErrc::task_not_found);
        CHECK(scheduler->set_priority("x", Priority::high) == TaskErrc::task_not_found);
        CHECK(scheduler->task("x").error() == TaskErrc::task_not_found);
    }

    SECTION("Bad URLs are rejected") {
        Task task;
        task.url = "ftp://files.test/a.bin";
        auto id = scheduler->enqueue_task(task);
        REQUIRE(!id.has_value());
        CHECK(id.error() == TaskErrc::invalid_url);
        CHECK(scheduler->tasks().empty());
    }

    SECTION("Defaults derive from the URL") {
        Task task;
        task.url = url_for("Apollo%2011.mp4");
        task.source_id = "nasa";
        auto id = scheduler->enqueue_task(task);
        REQUIRE(id.has_value());
        CHECK(id->size() == 16);
        auto stored = scheduler->task(*id);
        CHECK(stored->file_name == "Apollo 11.mp4");
        CHECK(stored->save_path == (f.dir.path() / "nasa" / "Apollo 11.mp4").string());
    }

    SECTION("Enqueueing a live id returns it again") {
        Task task;
        task.id = "dup";
        task.url = url_for("a.bin");
        CHECK(scheduler->enqueue_task(task) == std::string("dup"));
        CHECK(scheduler->enqueue_task(task) == std::string("dup"));
        CHECK(scheduler->pending_order().size() == 1);

        REQUIRE(!scheduler->pause_task("dup"));
        CHECK(scheduler->enqueue_task(task).error() == TaskErrc::invalid_transition);
    }

    SECTION("Completed and failed states") {
        f.transport->serve(url_for("a.bin"), "payload");
        REQUIRE(!scheduler->start());
        Task task;
        task.url = url_for("a.bin");
        auto id = scheduler->enqueue_task(task);
        REQUIRE(id.has_value());
        REQUIRE(reaches(*scheduler, *id, TaskStatus::completed));

        CHECK(scheduler->pause_task(*id) == TaskErrc::invalid_transition);
        CHECK(scheduler->remove_task(*id) == TaskErrc::invalid_transition);
        CHECK(scheduler->retry_task(*id) == TaskErrc::invalid_transition);
    }
}

TEST_CASE("Scheduler deletes and purges records", "[scheduler]") {
    Fixture f;
    auto scheduler = f.make();
    REQUIRE(!scheduler->start());
    auto a = f.add(*scheduler, "a.bin");
    auto b = f.add(*scheduler, "b.bin");
    REQUIRE(reaches(*scheduler, a, TaskStatus::completed));
    REQUIRE(reaches(*scheduler, b, TaskStatus::completed));
    REQUIRE(std::filesystem::exists(f.dir / "a.bin"));

    SECTION("delete_task with the file") {
        REQUIRE(!scheduler->delete_task(a, true));
        CHECK(scheduler->task(a).error() == TaskErrc::task_not_found);
        CHECK(f.store->get(a).error() == TaskErrc::task_not_found);
        CHECK_FALSE(std::filesystem::exists(f.dir / "a.bin"));
        CHECK(std::filesystem::exists(f.dir / "b.bin"));
    }

    SECTION("purge_completed") {
        auto kept = scheduler->purge_completed(1h);
        REQUIRE(kept.has_value());
        CHECK(*kept == 0);

        std::this_thread::sleep_for(5ms);
        auto purged = scheduler->purge_completed(0ms);
        REQUIRE(purged.has_value());
        CHECK(*purged == 2);
        CHECK(scheduler->tasks().empty());
        CHECK(std::filesystem::exists(f.dir / "a.bin"));
    }
}

TEST_CASE("Scheduler publishes progress and state changes", "[scheduler]") {
    Fixture f;
    f.transport->piece_delay(2ms);
    auto scheduler = f.make();

    std::atomic<int> changes{0};
    std::atomic<bool> saw_progress{false};
    auto state_sub = scheduler->state_changes().subscribe([&](const TasksChanged&) { ++changes; });

    REQUIRE(!scheduler->start());
    auto id = f.add(*scheduler, "a.bin", 200'000);
    auto progress_sub = scheduler->progress_updates().subscribe([&](const ProgressSnapshot& s) {
        auto it = s.find(id);
        if (it != s.end() && it->second.bytes_done > 0) saw_progress = true;
    });

    REQUIRE(reaches(*scheduler, id, TaskStatus::completed));
    CHECK(wait_until([&] { return saw_progress.load(); }));
    CHECK(wait_until([&] { return changes.load() > 0; }));
}
