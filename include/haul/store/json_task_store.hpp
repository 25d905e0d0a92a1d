// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/store/task_store.hpp>
#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <memory>

namespace haul::store {

// Task records kept in one JSON document:
//   {"version": 1, "tasks": [ {...}, ... ]}
// Every mutation rewrites the document through a sibling temp file and an
// atomic rename, so a crash leaves either the old or the new document.
class JsonTaskStore : public TaskStore {
    struct Token {};

public:
    static constexpr int FORMAT_VERSION = 1;

    // Reachable only through open()
    JsonTaskStore(Token, std::filesystem::path path);

    // Load `path` if it exists, else start empty (the file appears on first write)
    [[nodiscard]] static std::expected<std::unique_ptr<JsonTaskStore>, std::error_code>
    open(const std::filesystem::path& path) noexcept;

    [[nodiscard]] std::error_code upsert(const core::Task& task) noexcept override;
    [[nodiscard]] std::expected<std::vector<core::Task>, std::error_code> get_all() noexcept override;
    [[nodiscard]] std::expected<core::Task, std::error_code> get(std::string_view id) noexcept override;
    [[nodiscard]] std::error_code remove(std::string_view id) noexcept override;
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    remove_completed_older_than(std::chrono::milliseconds age) noexcept override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    static std::filesystem::path temp_path(const std::filesystem::path& path);

private:
    [[nodiscard]] std::error_code write_locked() noexcept;

    std::filesystem::path path_;
    std::mutex mutex_;
    std::map<std::string, core::Task, std::less<>> tasks_;
};

// Record conversion, shared with the CLI's `list --json`. task_from_json
// throws (nlohmann::json::exception or std::invalid_argument) on malformed records.
[[nodiscard]] nlohmann::json task_to_json(const core::Task& task);
[[nodiscard]] core::Task task_from_json(const nlohmann::json& j);

} // namespace haul::store
