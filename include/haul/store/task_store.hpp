// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/error.hpp>
#include <haul/core/task.hpp>
#include <chrono>
#include <expected>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace haul::store {

// Persistence boundary for task records. Every call is atomic per record;
// implementations must be safe to call from any thread.
class TaskStore {
public:
    virtual ~TaskStore() = default;

    // Create or replace the record with task.id
    [[nodiscard]] virtual std::error_code upsert(const core::Task& task) noexcept = 0;

    [[nodiscard]] virtual std::expected<std::vector<core::Task>, std::error_code>
    get_all() noexcept = 0;

    // task_not_found when absent
    [[nodiscard]] virtual std::expected<core::Task, std::error_code>
    get(std::string_view id) noexcept = 0;

    // Removing an absent id is not an error
    [[nodiscard]] virtual std::error_code remove(std::string_view id) noexcept = 0;

    // Drop completed records last updated before now - age; returns the count
    [[nodiscard]] virtual std::expected<std::size_t, std::error_code>
    remove_completed_older_than(std::chrono::milliseconds age) noexcept = 0;
};

class MemoryTaskStore : public TaskStore {
public:
    MemoryTaskStore() = default;

    [[nodiscard]] std::error_code upsert(const core::Task& task) noexcept override;
    [[nodiscard]] std::expected<std::vector<core::Task>, std::error_code> get_all() noexcept override;
    [[nodiscard]] std::expected<core::Task, std::error_code> get(std::string_view id) noexcept override;
    [[nodiscard]] std::error_code remove(std::string_view id) noexcept override;
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    remove_completed_older_than(std::chrono::milliseconds age) noexcept override;

    [[nodiscard]] std::size_t size() const noexcept;

private:
    mutable std::mutex mutex_;
    std::map<std::string, core::Task, std::less<>> tasks_;
};

} // namespace haul::store
