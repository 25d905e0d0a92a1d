// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/store/task_store.hpp>

namespace haul::store {

using core::Task;
using core::TaskErrc;
using core::TaskStatus;

//=============================================================================
// MemoryTaskStore
//=============================================================================

std::error_code MemoryTaskStore::upsert(const Task& task) noexcept {
    if (task.id.empty()) {
        return make_error_code(TaskErrc::storage_error);
    }
    std::lock_guard lock(mutex_);
    tasks_.insert_or_assign(task.id, task);
    return {};
}

std::expected<std::vector<Task>, std::error_code> MemoryTaskStore::get_all() noexcept {
    std::lock_guard lock(mutex_);
    std::vector<Task> out;
    out.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        out.push_back(task);
    }
    return out;
}

std::expected<Task, std::error_code> MemoryTaskStore::get(std::string_view id) noexcept {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::unexpected(make_error_code(TaskErrc::task_not_found));
    }
    return it->second;
}

std::error_code MemoryTaskStore::remove(std::string_view id) noexcept {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it != tasks_.end()) {
        tasks_.erase(it);
    }
    return {};
}

std::expected<std::size_t, std::error_code>
MemoryTaskStore::remove_completed_older_than(std::chrono::milliseconds age) noexcept {
    auto cutoff = core::Clock::now() - age;
    std::lock_guard lock(mutex_);
    auto removed = std::erase_if(tasks_, [cutoff](const auto& entry) {
        return entry.second.status == TaskStatus::completed && entry.second.updated_at < cutoff;
    });
    return static_cast<std::size_t>(removed);
}

std::size_t MemoryTaskStore::size() const noexcept {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

} // namespace haul::store
