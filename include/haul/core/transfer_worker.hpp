// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <haul/core/error.hpp>
#include <haul/core/progress_tracker.hpp>
#include <haul/core/task.hpp>
#include <haul/core/transport.hpp>
#include <haul/disk/file_writer.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <variant>

namespace haul::core {

enum class StopReason : std::uint8_t {
    none,
    pause,     // flush buffered bytes, keep offset
    cancel,    // drop buffered bytes
    shutdown,  // like pause; task goes back to the queue
};

// Server-reported facts about the remote file
struct MetadataEvent {
    std::optional<std::uint64_t> total_bytes;
    std::string etag;
    std::string last_modified;
};

// Bytes up to partial_bytes are on disk and flushed. `rebased` marks a
// restart from a lower offset (server ignored the range, file was short).
struct CheckpointEvent {
    std::uint64_t partial_bytes{0};
    bool rebased{false};
};

enum class WorkerOutcome : std::uint8_t {
    completed,
    stopped,
    failed,
};

struct FinishedEvent {
    WorkerOutcome outcome{WorkerOutcome::failed};
    std::uint64_t partial_bytes{0};
    std::optional<std::uint64_t> total_bytes;
    std::error_code error;
    std::string message;
};

using WorkerMessage = std::variant<MetadataEvent, CheckpointEvent, FinishedEvent>;

struct WorkerEvent {
    std::string task_id;
    std::uint64_t generation{0};
    WorkerMessage message;
};

// One resumable transfer attempt for one task, on its own thread.
//
// The worker owns a private copy of the task and never touches scheduler
// state: everything it learns goes out through the event sink, ending with
// exactly one FinishedEvent.
class TransferWorker : private ResponseSink {
public:
    using EventSink = std::function<void(WorkerEvent)>;

    TransferWorker(Task task,
                   std::uint64_t generation,
                   const SchedulerConfig& config,
                   std::shared_ptr<Transport> transport,
                   ProgressTracker& tracker,
                   EventSink sink);
    ~TransferWorker() override;

    TransferWorker(const TransferWorker&) = delete;
    TransferWorker& operator=(const TransferWorker&) = delete;

    void start();

    // Stop at the next chunk boundary. cancel overrides an earlier pause.
    void request_stop(StopReason reason) noexcept;

    void join() noexcept;

    [[nodiscard]] StopReason stop_reason() const noexcept { return stop_reason_.load(std::memory_order_acquire); }
    [[nodiscard]] const std::string& task_id() const noexcept { return task_.id; }
    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }

private:
    void run(std::stop_token stoken) noexcept;
    FinishedEvent transfer();
    FinishedEvent finish_stopped();
    FinishedEvent verify();
    FinishedEvent failed(std::error_code ec, std::string message) const;

    bool on_response(const ResponseInfo& info) override;
    bool on_data(const std::byte* data, std::size_t size) override;
    bool keep_going() override;
    void on_range_not_satisfiable(std::optional<std::uint64_t> entity_size) override;

    // Drop the bytes on disk and forget a server-learned size
    [[nodiscard]] std::error_code restart_from_zero();

    [[nodiscard]] bool stop_requested() const noexcept { return stop_.stop_requested(); }
    [[nodiscard]] std::error_code flush_buffer() noexcept;
    [[nodiscard]] std::error_code maybe_checkpoint() noexcept;
    void emit(WorkerMessage message);

    Task task_;
    std::uint64_t generation_;
    SchedulerConfig config_;
    std::shared_ptr<Transport> transport_;
    ProgressTracker& tracker_;
    EventSink sink_;

    disk::FileWriter file_;
    disk::ChunkBuffer buffer_;
    std::uint64_t start_offset_{0};
    std::uint64_t checkpoint_bytes_{0};
    std::chrono::steady_clock::time_point checkpoint_time_;
    std::error_code write_error_;
    std::optional<FinishedEvent> rejection_;
    bool stale_range_{false};
    bool unsatisfiable_{false};
    std::optional<std::uint64_t> unsatisfiable_size_;

    std::atomic<StopReason> stop_reason_{StopReason::none};
    std::stop_token stop_;
    std::jthread thread_;
};

} // namespace haul::core
