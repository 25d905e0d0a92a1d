// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <haul/core/error.hpp>
#include <haul/core/event_channel.hpp>
#include <haul/core/progress_tracker.hpp>
#include <haul/core/task.hpp>
#include <haul/core/transfer_worker.hpp>
#include <haul/core/transport.hpp>
#include <haul/store/task_store.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace haul::core {

// Coarse "something changed" notification; observers re-query tasks()
struct TasksChanged {};

// What restore() does with records left `downloading` by an earlier process
enum class Recovery : std::uint8_t {
    persist,    // downgrade to queued and write the record back
    in_memory   // downgrade the view only; the store is left as found
};

struct SchedulerStats {
    std::size_t queued{0};
    std::size_t downloading{0};
    std::size_t paused{0};
    std::size_t completed{0};
    std::size_t failed{0};
    std::size_t cancelled{0};
    std::uint32_t max_concurrent{0};
};

// Admits queued tasks into a bounded pool of transfer workers and owns
// every status transition.
//
// All public commands run under one command mutex, so admission, slot
// accounting and reordering never interleave. Workers report through an
// event queue that the dispatcher thread drains; the dispatcher also drives
// the progress cadence and delayed retries. Before start() commands only
// edit records and the queue.
class Scheduler {
public:
    Scheduler(SchedulerConfig config,
              std::shared_ptr<store::TaskStore> store,
              std::shared_ptr<Transport> transport);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Load every record from the store; stale `downloading` records are
    // downgraded to `queued`. Called by start() when not done yet.
    // Use Recovery::in_memory when another process may own the transfers.
    [[nodiscard]] std::error_code restore(Recovery recovery = Recovery::persist) noexcept;

    [[nodiscard]] std::error_code start() noexcept;

    // Stop workers at a chunk boundary, persist offsets, re-queue them
    void stop() noexcept;

    [[nodiscard]] bool running() const noexcept;

    //-------------------------------------------------------------------------
    // Commands
    //-------------------------------------------------------------------------

    [[nodiscard]] std::expected<std::string, std::error_code> enqueue_task(Task task) noexcept;
    [[nodiscard]] std::error_code pause_task(std::string_view id) noexcept;
    [[nodiscard]] std::error_code resume_task(std::string_view id) noexcept;
    [[nodiscard]] std::error_code remove_task(std::string_view id) noexcept;
    [[nodiscard]] std::error_code retry_task(std::string_view id) noexcept;
    [[nodiscard]] std::error_code delete_task(std::string_view id, bool delete_file = false) noexcept;
    [[nodiscard]] std::error_code pause_all() noexcept;
    [[nodiscard]] std::error_code resume_all() noexcept;
    [[nodiscard]] std::error_code set_priority(std::string_view id, Priority priority) noexcept;
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    purge_completed(std::chrono::milliseconds older_than) noexcept;

    //-------------------------------------------------------------------------
    // Queries
    //-------------------------------------------------------------------------

    // Every known task, oldest first
    [[nodiscard]] std::vector<Task> tasks() const;
    [[nodiscard]] std::expected<Task, std::error_code> task(std::string_view id) const;

    // Ids in admission order
    [[nodiscard]] std::vector<std::string> pending_order() const;
    [[nodiscard]] std::vector<std::string> active_ids() const;
    [[nodiscard]] SchedulerStats stats() const;

    // True when nothing is queued or downloading
    [[nodiscard]] bool idle() const;

    // Last published progress values
    [[nodiscard]] ProgressSnapshot progress() const;

    [[nodiscard]] const SchedulerConfig& config() const noexcept { return config_; }

    EventChannel<TasksChanged>& state_changes() noexcept { return state_channel_; }
    EventChannel<ProgressSnapshot>& progress_updates() noexcept { return progress_channel_; }

private:
    enum class Intent : std::uint8_t {
        none,
        pause,
        cancel,
        shutdown,
    };

    struct Slot {
        std::uint64_t generation{0};
        Intent intent{Intent::none};
        std::unique_ptr<TransferWorker> worker;
    };

    struct Pending {
        std::string id;
        std::uint64_t sequence{0};
        std::optional<std::chrono::steady_clock::time_point> not_before;
    };

    using Lock = std::unique_lock<std::mutex>;

    // Queue and slot bookkeeping; callers hold mutex_
    void insert_pending(const std::string& id, std::optional<std::chrono::steady_clock::time_point> not_before = {});
    bool erase_pending(std::string_view id);
    void sort_pending();
    void admit_ready();
    void admit(const std::string& id);
    [[nodiscard]] bool eligible(const Pending& entry, std::chrono::steady_clock::time_point now) const;

    // Persist-then-apply: the cache only changes when the store accepted it
    [[nodiscard]] std::error_code commit(Task& task);
    void commit_logged(Task& task);

    // Signal the active worker for `id` and wait until its slot is released
    [[nodiscard]] std::error_code stop_active(Lock& lock, const std::string& id, Intent intent);
    void signal_active(Slot& slot, Intent intent) noexcept;
    void wait_released(Lock& lock, const std::string& id, std::uint64_t generation);

    [[nodiscard]] std::error_code pause_locked(Lock& lock, const std::string& id);
    [[nodiscard]] std::error_code resume_locked(const std::string& id);

    void dispatcher_loop(std::stop_token stoken);
    void handle_event(WorkerEvent event, std::vector<std::unique_ptr<TransferWorker>>& finished);
    void handle_finished(Task& task, Slot& slot, const FinishedEvent& done);
    void publish_progress();
    void notify_changed();

    // Events posted by workers
    void post(WorkerEvent event);

    SchedulerConfig config_;
    std::shared_ptr<store::TaskStore> store_;
    std::shared_ptr<Transport> transport_;
    ProgressTracker tracker_;

    std::mutex command_mutex_;

    mutable std::mutex mutex_;
    std::condition_variable slot_released_;
    std::map<std::string, Task, std::less<>> tasks_;
    std::vector<Pending> pending_;
    std::map<std::string, Slot, std::less<>> active_;
    std::uint64_t next_sequence_{0};
    std::uint64_t next_generation_{0};
    bool restored_{false};
    bool running_{false};
    ProgressSnapshot last_progress_;

    std::mutex events_mutex_;
    std::condition_variable_any events_cv_;
    std::deque<WorkerEvent> events_;

    EventChannel<TasksChanged> state_channel_;
    EventChannel<ProgressSnapshot> progress_channel_;

    std::jthread dispatcher_;
};

} // namespace haul::core
