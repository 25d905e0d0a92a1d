// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/scheduler.hpp>
#include <haul/core/log.hpp>
#include <haul/core/url.hpp>
#include <haul/disk/file_writer.hpp>
#include <algorithm>
#include <filesystem>
#include <variant>

namespace haul::core {

namespace {

template<typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template<typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::int64_t to_ms(std::chrono::milliseconds d) noexcept {
    return static_cast<std::int64_t>(d.count());
}

} // namespace

//=============================================================================
// Scheduler
//=============================================================================

Scheduler::Scheduler(SchedulerConfig config,
                     std::shared_ptr<store::TaskStore> store,
                     std::shared_ptr<Transport> transport)
    : config_(std::move(config))
    , store_(std::move(store))
    , transport_(std::move(transport))
    , tracker_(config_.speed_window, config_.speed_smoothing) {
    if (config_.max_concurrent == 0) {
        config_.max_concurrent = 1;
    }
}

Scheduler::~Scheduler() {
    // Workers must be gone before the tracker, store and channels they use
    stop();
}

std::error_code Scheduler::restore(Recovery recovery) noexcept {
    std::lock_guard command(command_mutex_);
    Lock lock(mutex_);
    if (restored_) return {};

    auto all = store_->get_all();
    if (!all) {
        HAUL_LOG_ERROR("restore: cannot read task store: {}", all.error().message());
        return all.error();
    }

    std::size_t recovered = 0;
    for (auto& task : *all) {
        if (tasks_.contains(task.id)) continue;

        if (task.status == TaskStatus::downloading) {
            // Interrupted by a crash: the last checkpoint is the truth
            task.status = TaskStatus::queued;
            switch (recovery) {
                case Recovery::persist:
                    commit_logged(task);
                    break;
                case Recovery::in_memory:
                    break;
            }
            ++recovered;
        }

        auto id = task.id;
        const bool queued = task.status == TaskStatus::queued;
        tasks_.insert_or_assign(id, std::move(task));
        if (queued) {
            insert_pending(id);
        }
    }

    restored_ = true;
    HAUL_LOG_INFO("restored {} tasks ({} queued, {} recovered from an interrupted run)",
                  tasks_.size(), pending_.size(), recovered);
    notify_changed();
    return {};
}

std::error_code Scheduler::start() noexcept {
    if (auto ec = restore()) {
        return ec;
    }

    std::lock_guard command(command_mutex_);
    Lock lock(mutex_);
    if (running_) return {};

    running_ = true;
    dispatcher_ = std::jthread([this](std::stop_token stoken) {
        dispatcher_loop(std::move(stoken));
    });

    HAUL_LOG_INFO("scheduler started: {} slots, {} queued", config_.max_concurrent, pending_.size());
    admit_ready();
    notify_changed();
    return {};
}

void Scheduler::stop() noexcept {
    std::lock_guard command(command_mutex_);
    Lock lock(mutex_);
    if (!running_) return;

    running_ = false;

    std::vector<std::pair<std::string, std::uint64_t>> stopping;
    for (auto& [id, slot] : active_) {
        signal_active(slot, Intent::shutdown);
        stopping.emplace_back(id, slot.generation);
    }
    for (const auto& [id, generation] : stopping) {
        wait_released(lock, id, generation);
    }
    lock.unlock();

    if (dispatcher_.joinable()) {
        dispatcher_.request_stop();
        dispatcher_.join();
    }

    lock.lock();
    publish_progress();
    HAUL_LOG_INFO("scheduler stopped; {} tasks left queued", pending_.size());
}

bool Scheduler::running() const noexcept {
    std::lock_guard lock(mutex_);
    return running_;
}

//=============================================================================
// Commands
//=============================================================================

std::expected<std::string, std::error_code> Scheduler::enqueue_task(Task task) noexcept {
    std::lock_guard command(command_mutex_);
    Lock lock(mutex_);

    if (task.id.empty()) {
        task.id = generate_task_id();
    }

    if (auto it = tasks_.find(task.id); it != tasks_.end()) {
        switch (it->second.status) {
            case TaskStatus::queued:
            case TaskStatus::downloading:
                return task.id;
            case TaskStatus::paused:
            case TaskStatus::completed:
            case TaskStatus::error:
            case TaskStatus::cancelled:
                return std::unexpected(make_error_code(TaskErrc::invalid_transition));
        }
    }

    auto url = Url::parse(task.url);
    if (!url) {
        HAUL_LOG_WARN("enqueue: rejected URL '{}'", task.url);
        return std::unexpected(url.error());
    }

    if (task.file_name.empty()) {
        task.file_name = url->filename();
    }
    if (task.save_path.empty()) {
        auto path = config_.download_dir;
        if (!task.source_id.empty()) path /= task.source_id;
        path /= task.file_name;
        task.save_path = path.string();
    }

    const auto now = Clock::now();
    task.status = TaskStatus::queued;
    task.retry_count = 0;
    task.error_message.reset();
    task.started_at.reset();
    task.completed_at.reset();
    if (task.created_at == TimePoint{}) {
        task.created_at = now;
    }

    if (task.expected_bytes) {
        task.total_bytes = task.expected_bytes;
    }

    // Pick up bytes left by an earlier run of the same file
    auto on_disk = disk::FileWriter::existing_size(task.save_path);
    if (task.total_bytes && on_disk > *task.total_bytes) {
        on_disk = 0;
    }
    task.partial_bytes = on_disk;

    if (auto ec = commit(task)) {
        return std::unexpected(ec);
    }

    HAUL_LOG_INFO("[{}] queued {} -> {} ({} priority, {} bytes on disk)",
                  task.id, task.url, task.save_path, to_string(task.priority), task.partial_bytes);
    insert_pending(task.id);
    admit_ready();
    notify_changed();
    return task.id;
}

std::error_code Scheduler::pause_task(std::string_view id) noexcept {
    std::lock_guard command(command_mutex_);
    Lock lock(mutex_);
    return pause_locked(lock, std::string(id));
}

std::error_code Scheduler::resume_task(std::string_view id) noexcept {
    std::lock_guard command(command_mutex_);
    Lock lock(mutex_);
    auto ec = resume_locked(std::string(id));
    if (!ec) {
        admit_ready();
    }
    return ec;
}

std::error_code Scheduler::remove_task(std::string_view id_view) noexcept {
    std::lock_guard command(command_mutex_);
    Lock lock(mutex_);
    const std::string id(id_view);

    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return make_error_code(TaskErrc::task_not_found);
    }

    switch (it->second.status) {
        case TaskStatus::downloading: {
            if (auto ec = stop_active(lock, id, Intent::cancel)) {
                return ec;
            }
            auto after = tasks_.find(id);
            if (after == tasks_.end() || after->second.status != TaskStatus::cancelled) {
                return make_error_code(TaskErrc::conflict);
            }
            HAUL_LOG_INFO("[{}] cancelled", id);
            return {};
        }
        case TaskStatus::queued:
        case TaskStatus::paused:
        case TaskStatus::error: {
            Task task = it->second;
            task.status = TaskStatus::cancelled;
            if (auto ec = commit(task)) {
                return ec;
            }
            erase_pending(id);
            HAUL_LOG_INFO("[{}] cancelled", id);
            notify_changed();
            return {};
        }
        case TaskStatus::cancelled:
            return {};
        case TaskStatus::completed:
            return make_error_code(TaskErrc::invalid_transition);
    }
    return make_error_code(TaskErrc::invalid_transition);
}

std::error_code Scheduler::retry_task(std::string_view id_view) noexcept {
    std::lock_guard command(command_mutex_);
    Lock lock(mutex_);
    const std::string id(id_view);

    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return make_error_code(TaskErrc::task_not_found);
    }
    if (it->second.status != TaskStatus::error) {
        return make_error_code(TaskErrc::invalid_transition);
    }

    Task task = it->second;
    task.status = TaskStatus::queued;
    task.retry_count = 0;
    task.error_message.reset();
    // The remote file may have changed since its size was learned
    task.total_bytes = task.expected_bytes;
    if (auto ec = commit(task)) {
        return ec;
    }

    HAUL_LOG_INFO("[{}] retry requested", id);
    insert_pending(id);
    admit_ready();
    notify_changed();
    return {};
}

std::error_code Scheduler::delete_task(std::string_view id_view, bool delete_file) noexcept {
    std::lock_guard command(command_mutex_);
    Lock lock(mutex_);
    const std::string id(id_view);

    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return make_error_code(TaskErrc::task_not_found);
    }

    if (it->second.status == TaskStatus::downloading) {
        if (auto ec = stop_active(lock, id, Intent::cancel)) {
            return ec;
        }
        it = tasks_.find(id);
        if (it == tasks_.end()) {
            return {};
        }
    }

    if (auto ec = store_->remove(id)) {
        HAUL_LOG_ERROR("[{}] delete failed: {}", id, ec.message());
        return ec;
    }

    const auto save_path = it->second.save_path;
    tasks_.erase(it);
    erase_pending(id);
    tracker_.end(id);

    if (delete_file && !save_path.empty()) {
        std::error_code fs_ec;
        std::filesystem::remove(save_path, fs_ec);
        if (fs_ec) {
            HAUL_LOG_WARN("[{}] could not delete {}: {}", id, save_path, fs_ec.message());
        }
    }

    HAUL_LOG_INFO("[{}] deleted", id);
    notify_changed();
    return {};
}

std::error_code Scheduler::pause_all() noexcept {
    std::lock_guard command(command_mutex_);
    Lock lock(mutex_);

    std::error_code first_error;

    // Queued tasks first, so freed slots do not admit anything
    auto queued = pending_;
    for (const auto& entry : queued) {
        if (auto ec = pause_locked(lock, entry.id); ec && !first_error) {
            first_error = ec;
        }
    }

    std::vector<std::pair<std::string, std::uint64_t>> stopping;
    for (auto& [id, slot] : active_) {
        signal_active(slot, Intent::pause);
        stopping.emplace_back(id, slot.generation);
    }
    for (const auto& [id, generation] : stopping) {
        wait_released(lock, id, generation);
        auto it = tasks_.find(id);
        if (it != tasks_.end() && it->second.status != TaskStatus::paused && !first_error) {
            HAUL_LOG_DEBUG("[{}] finished as {} before it could pause", id, to_string(it->second.status));
        }
    }

    HAUL_LOG_INFO("paused {} active and {} queued tasks", stopping.size(), queued.size());
    notify_changed();
    return first_error;
}

std::error_code Scheduler::resume_all() noexcept {
    std::lock_guard command(command_mutex_);
    Lock lock(mutex_);

    std::vector<const Task*> paused;
    for (const auto& [id, task] : tasks_) {
        if (task.status == TaskStatus::paused) {
            paused.push_back(&task);
        }
    }
    std::stable_sort(paused.begin(), paused.end(), [](const Task* a, const Task* b) {
        return a->created_at < b->created_at;
    });

    std::vector<std::string> ids;
    ids.reserve(paused.size());
    for (const auto* task : paused) {
        ids.push_back(task->id);
    }

    std::error_code first_error;
    for (const auto& id : ids) {
        if (auto ec = resume_locked(id); ec && !first_error) {
            first_error = ec;
        }
    }

    HAUL_LOG_INFO("resumed {} tasks", ids.size());
    admit_ready();
    notify_changed();
    return first_error;
}

std::error_code Scheduler::set_priority(std::string_view id_view, Priority priority) noexcept {
    std::lock_guard command(command_mutex_);
    Lock lock(mutex_);
    const std::string id(id_view);

    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return make_error_code(TaskErrc::task_not_found);
    }
    if (it->second.priority == priority) {
        return {};
    }

    Task task = it->second;
    task.priority = priority;
    if (auto ec = commit(task)) {
        return ec;
    }

    // Reorders the queue only; a running transfer keeps its slot
    sort_pending();
    HAUL_LOG_INFO("[{}] priority -> {}", id, to_string(priority));
    notify_changed();
    return {};
}

std::expected<std::size_t, std::error_code>
Scheduler::purge_completed(std::chrono::milliseconds older_than) noexcept {
    std::lock_guard command(command_mutex_);
    Lock lock(mutex_);

    auto removed = store_->remove_completed_older_than(older_than);
    if (!removed) {
        return std::unexpected(removed.error());
    }

    // Drop whatever the store no longer has
    std::erase_if(tasks_, [this](const auto& entry) {
        if (entry.second.status != TaskStatus::completed) return false;
        auto stored = store_->get(entry.first);
        return !stored && stored.error() == TaskErrc::task_not_found;
    });

    if (*removed > 0) {
        HAUL_LOG_INFO("purged {} completed tasks older than {} ms", *removed, to_ms(older_than));
        notify_changed();
    }
    return *removed;
}

//=============================================================================
// Queries
//=============================================================================

std::vector<Task> Scheduler::tasks() const {
    std::lock_guard lock(mutex_);
    std::vector<Task> out;
    out.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        out.push_back(task);
    }
    std::stable_sort(out.begin(), out.end(), [](const Task& a, const Task& b) {
        return a.created_at < b.created_at;
    });
    return out;
}

std::expected<Task, std::error_code> Scheduler::task(std::string_view id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::unexpected(make_error_code(TaskErrc::task_not_found));
    }
    return it->second;
}

std::vector<std::string> Scheduler::pending_order() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    out.reserve(pending_.size());
    for (const auto& entry : pending_) {
        out.push_back(entry.id);
    }
    return out;
}

std::vector<std::string> Scheduler::active_ids() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    out.reserve(active_.size());
    for (const auto& [id, slot] : active_) {
        out.push_back(id);
    }
    return out;
}

SchedulerStats Scheduler::stats() const {
    std::lock_guard lock(mutex_);
    SchedulerStats stats;
    stats.max_concurrent = config_.max_concurrent;
    for (const auto& [id, task] : tasks_) {
        switch (task.status) {
            case TaskStatus::queued:      ++stats.queued; break;
            case TaskStatus::downloading: ++stats.downloading; break;
            case TaskStatus::paused:      ++stats.paused; break;
            case TaskStatus::completed:   ++stats.completed; break;
            case TaskStatus::error:       ++stats.failed; break;
            case TaskStatus::cancelled:   ++stats.cancelled; break;
        }
    }
    return stats;
}

bool Scheduler::idle() const {
    std::lock_guard lock(mutex_);
    return pending_.empty() && active_.empty();
}

ProgressSnapshot Scheduler::progress() const {
    std::lock_guard lock(mutex_);
    return last_progress_;
}

//=============================================================================
// Queue and slots
//=============================================================================

void Scheduler::insert_pending(const std::string& id,
                               std::optional<std::chrono::steady_clock::time_point> not_before) {
    erase_pending(id);
    pending_.push_back(Pending{id, next_sequence_++, not_before});
    sort_pending();
}

bool Scheduler::erase_pending(std::string_view id) {
    return std::erase_if(pending_, [id](const Pending& p) { return p.id == id; }) > 0;
}

void Scheduler::sort_pending() {
    // priority desc, then creation time, then insertion order
    std::stable_sort(pending_.begin(), pending_.end(), [this](const Pending& a, const Pending& b) {
        const auto& ta = tasks_.find(a.id)->second;
        const auto& tb = tasks_.find(b.id)->second;
        if (ta.priority != tb.priority) {
            return static_cast<int>(ta.priority) > static_cast<int>(tb.priority);
        }
        if (ta.created_at != tb.created_at) {
            return ta.created_at < tb.created_at;
        }
        return a.sequence < b.sequence;
    });
}

bool Scheduler::eligible(const Pending& entry, std::chrono::steady_clock::time_point now) const {
    if (entry.not_before && now < *entry.not_before) {
        return false;
    }
    auto it = tasks_.find(entry.id);
    if (it == tasks_.end()) return false;
    return !it->second.scheduled_at || *it->second.scheduled_at <= Clock::now();
}

void Scheduler::admit_ready() {
    if (!running_) return;

    const auto now = std::chrono::steady_clock::now();
    while (active_.size() < config_.max_concurrent) {
        auto it = std::find_if(pending_.begin(), pending_.end(),
                               [&](const Pending& p) { return eligible(p, now); });
        if (it == pending_.end()) break;

        auto id = it->id;
        pending_.erase(it);
        admit(id);
    }
}

void Scheduler::admit(const std::string& id) {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return;

    Task task = it->second;
    task.status = TaskStatus::downloading;
    if (!task.started_at) {
        task.started_at = Clock::now();
    }
    if (auto ec = commit(task)) {
        // Cannot record the transition; leave the task out of the queue
        // rather than run a transfer the store does not know about
        HAUL_LOG_ERROR("[{}] not admitted, store rejected update: {}", id, ec.message());
        it->second.status = TaskStatus::error;
        it->second.error_message = "task store unavailable: " + ec.message();
        return;
    }

    const auto generation = ++next_generation_;
    tracker_.begin(id, task.partial_bytes, task.total_bytes);

    Slot slot;
    slot.generation = generation;
    slot.worker = std::make_unique<TransferWorker>(
        task, generation, config_, transport_, tracker_,
        [this](WorkerEvent event) { post(std::move(event)); });

    auto& placed = active_.insert_or_assign(id, std::move(slot)).first->second;
    HAUL_LOG_INFO("[{}] started ({}/{} slots, from byte {})",
                  id, active_.size(), config_.max_concurrent, task.partial_bytes);
    placed.worker->start();
}

std::error_code Scheduler::commit(Task& task) {
    task.updated_at = Clock::now();
    if (auto ec = store_->upsert(task)) {
        HAUL_LOG_ERROR("[{}] store write failed: {}", task.id, ec.message());
        return ec;
    }
    tasks_.insert_or_assign(task.id, task);
    return {};
}

void Scheduler::commit_logged(Task& task) {
    task.updated_at = Clock::now();
    if (auto ec = store_->upsert(task)) {
        HAUL_LOG_ERROR("[{}] store write failed, keeping {} in memory only: {}",
                       task.id, to_string(task.status), ec.message());
    }
    tasks_.insert_or_assign(task.id, task);
}

void Scheduler::signal_active(Slot& slot, Intent intent) noexcept {
    // cancel wins over pause and shutdown
    if (slot.intent == Intent::none || intent == Intent::cancel) {
        slot.intent = intent;
    }

    switch (slot.intent) {
        case Intent::none:
            break;
        case Intent::pause:
            slot.worker->request_stop(StopReason::pause);
            break;
        case Intent::cancel:
            slot.worker->request_stop(StopReason::cancel);
            break;
        case Intent::shutdown:
            slot.worker->request_stop(StopReason::shutdown);
            break;
    }
}

void Scheduler::wait_released(Lock& lock, const std::string& id, std::uint64_t generation) {
    slot_released_.wait(lock, [&] {
        auto it = active_.find(id);
        return it == active_.end() || it->second.generation != generation;
    });
}

std::error_code Scheduler::stop_active(Lock& lock, const std::string& id, Intent intent) {
    auto it = active_.find(id);
    if (it == active_.end()) {
        return make_error_code(TaskErrc::conflict);
    }

    const auto generation = it->second.generation;
    signal_active(it->second, intent);
    wait_released(lock, id, generation);
    return {};
}

std::error_code Scheduler::pause_locked(Lock& lock, const std::string& id) {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return make_error_code(TaskErrc::task_not_found);
    }

    switch (it->second.status) {
        case TaskStatus::queued: {
            Task task = it->second;
            task.status = TaskStatus::paused;
            if (auto ec = commit(task)) {
                return ec;
            }
            erase_pending(id);
            HAUL_LOG_INFO("[{}] paused while queued", id);
            notify_changed();
            return {};
        }
        case TaskStatus::downloading: {
            if (auto ec = stop_active(lock, id, Intent::pause)) {
                return ec;
            }
            auto after = tasks_.find(id);
            if (after == tasks_.end() || after->second.status != TaskStatus::paused) {
                return make_error_code(TaskErrc::conflict);
            }
            HAUL_LOG_INFO("[{}] paused at byte {}", id, after->second.partial_bytes);
            return {};
        }
        case TaskStatus::paused:
            return {};
        case TaskStatus::completed:
        case TaskStatus::error:
        case TaskStatus::cancelled:
            return make_error_code(TaskErrc::invalid_transition);
    }
    return make_error_code(TaskErrc::invalid_transition);
}

std::error_code Scheduler::resume_locked(const std::string& id) {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return make_error_code(TaskErrc::task_not_found);
    }

    switch (it->second.status) {
        case TaskStatus::paused: {
            Task task = it->second;
            task.status = TaskStatus::queued;
            if (auto ec = commit(task)) {
                return ec;
            }
            insert_pending(id);
            HAUL_LOG_INFO("[{}] resumed from byte {}", id, task.partial_bytes);
            notify_changed();
            return {};
        }
        case TaskStatus::queued:
        case TaskStatus::downloading:
            return {};
        case TaskStatus::completed:
        case TaskStatus::error:
        case TaskStatus::cancelled:
            return make_error_code(TaskErrc::invalid_transition);
    }
    return make_error_code(TaskErrc::invalid_transition);
}

//=============================================================================
// Dispatcher
//=============================================================================

void Scheduler::post(WorkerEvent event) {
    {
        std::lock_guard lock(events_mutex_);
        events_.push_back(std::move(event));
    }
    events_cv_.notify_one();
}

void Scheduler::dispatcher_loop(std::stop_token stoken) {
    auto next_tick = std::chrono::steady_clock::now() + config_.progress_interval;

    while (true) {
        std::deque<WorkerEvent> batch;
        {
            std::unique_lock lock(events_mutex_);
            events_cv_.wait_until(lock, stoken, next_tick, [this] { return !events_.empty(); });
            batch.swap(events_);
        }

        std::vector<std::unique_ptr<TransferWorker>> finished;
        {
            std::lock_guard lock(mutex_);
            for (auto& event : batch) {
                handle_event(std::move(event), finished);
            }

            const auto now = std::chrono::steady_clock::now();
            if (now >= next_tick) {
                // Delayed retries and scheduled start times come due here
                const auto before = active_.size();
                admit_ready();
                if (active_.size() != before) {
                    notify_changed();
                }
                publish_progress();
                next_tick = now + config_.progress_interval;
            }
        }

        // Joins worker threads; they have already posted their last event
        finished.clear();

        if (stoken.stop_requested()) {
            std::lock_guard lock(events_mutex_);
            if (events_.empty()) break;
        }
    }
}

void Scheduler::handle_event(WorkerEvent event, std::vector<std::unique_ptr<TransferWorker>>& finished) {
    auto slot_it = active_.find(event.task_id);
    if (slot_it == active_.end() || slot_it->second.generation != event.generation) {
        HAUL_LOG_TRACE("[{}] dropping event from superseded attempt {}", event.task_id, event.generation);
        return;
    }
    auto task_it = tasks_.find(event.task_id);
    if (task_it == tasks_.end()) {
        return;
    }

    Task& task = task_it->second;
    Slot& slot = slot_it->second;

    std::visit(Overloaded{
        [&](const MetadataEvent& meta) {
            task.total_bytes = meta.total_bytes;
            task.etag = meta.etag;
            task.last_modified = meta.last_modified;
            commit_logged(task);
        },
        [&](const CheckpointEvent& checkpoint) {
            // partial_bytes only moves backwards on an explicit rebase
            if (checkpoint.rebased || checkpoint.partial_bytes > task.partial_bytes) {
                task.partial_bytes = checkpoint.partial_bytes;
                commit_logged(task);
            }
        },
        [&](const FinishedEvent& done) {
            handle_finished(task, slot, done);
            finished.push_back(std::move(slot.worker));
            active_.erase(slot_it);
            tracker_.end(event.task_id);
            slot_released_.notify_all();
            admit_ready();
            notify_changed();
        },
    }, event.message);
}

void Scheduler::handle_finished(Task& task, Slot& slot, const FinishedEvent& done) {
    switch (done.outcome) {
        case WorkerOutcome::completed:
            task.status = TaskStatus::completed;
            task.partial_bytes = done.partial_bytes;
            task.total_bytes = done.total_bytes;
            task.completed_at = Clock::now();
            task.error_message.reset();
            HAUL_LOG_INFO("[{}] completed ({} bytes)", task.id, done.partial_bytes);
            break;

        case WorkerOutcome::stopped:
            switch (slot.intent) {
                case Intent::pause:
                    task.status = TaskStatus::paused;
                    task.partial_bytes = done.partial_bytes;
                    break;
                case Intent::cancel:
                    // The partial file stays; the recorded offset is left as is
                    task.status = TaskStatus::cancelled;
                    break;
                case Intent::none:
                case Intent::shutdown:
                    task.status = TaskStatus::queued;
                    task.partial_bytes = done.partial_bytes;
                    insert_pending(task.id);
                    break;
            }
            break;

        case WorkerOutcome::failed: {
            if (slot.intent == Intent::cancel) {
                task.status = TaskStatus::cancelled;
                break;
            }
            if (slot.intent == Intent::pause) {
                task.status = TaskStatus::paused;
                task.partial_bytes = done.partial_bytes;
                break;
            }

            const auto kind = classify(done.error);
            ++task.retry_count;
            task.error_message = done.message;
            task.partial_bytes = done.partial_bytes;

            if (kind == ErrorKind::transient_network && slot.intent == Intent::shutdown) {
                task.status = TaskStatus::queued;
                insert_pending(task.id);
            } else if (kind == ErrorKind::transient_network && task.retry_count < config_.max_retries) {
                const auto delay = config_.retry_delay(task.retry_count);
                task.status = TaskStatus::queued;
                insert_pending(task.id, std::chrono::steady_clock::now() + delay);
                HAUL_LOG_WARN("[{}] attempt {} failed ({}), retrying in {} ms",
                              task.id, task.retry_count, done.message, to_ms(delay));
            } else {
                task.status = TaskStatus::error;
                if (kind == ErrorKind::transient_network) {
                    task.error_message = "gave up after " + std::to_string(task.retry_count) +
                                         " attempts: " + done.message;
                }
                if (kind == ErrorKind::integrity) {
                    // The bytes on disk cannot be trusted; start over next time
                    task.partial_bytes = 0;
                    task.total_bytes = task.expected_bytes;
                }
                HAUL_LOG_ERROR("[{}] failed ({}): {}", task.id, to_string(kind), *task.error_message);
            }
            break;
        }
    }
    commit_logged(task);
}

void Scheduler::publish_progress() {
    auto snapshot = tracker_.snapshot();
    if (snapshot.empty() && last_progress_.empty()) {
        return;
    }
    last_progress_ = snapshot;
    progress_channel_.publish(snapshot);
}

void Scheduler::notify_changed() {
    state_channel_.publish(TasksChanged{});
}

} // namespace haul::core
