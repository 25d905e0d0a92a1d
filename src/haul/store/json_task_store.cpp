// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/store/json_task_store.hpp>
#include <haul/core/log.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace haul::store {

using core::Task;
using core::TaskErrc;
using core::TaskStatus;

namespace {

nlohmann::json optional_time(const std::optional<core::TimePoint>& tp) {
    if (!tp) return nullptr;
    return core::to_epoch_ms(*tp);
}

std::optional<core::TimePoint> read_optional_time(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return core::from_epoch_ms(j[key].get<std::int64_t>());
}

std::string read_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return {};
    return j[key].get<std::string>();
}

// fsync the freshly written temp file before it replaces the live one
std::error_code write_file_durably(const std::filesystem::path& path, const std::string& data) noexcept {
    std::FILE* file = std::fopen(path.c_str(), "wb");
    if (!file) {
        return make_error_code(TaskErrc::storage_error);
    }

    bool ok = std::fwrite(data.data(), 1, data.size(), file) == data.size();
    ok = std::fflush(file) == 0 && ok;
    ok = ::fsync(::fileno(file)) == 0 && ok;
    ok = std::fclose(file) == 0 && ok;

    return ok ? std::error_code{} : make_error_code(TaskErrc::storage_error);
}

} // namespace

//=============================================================================
// Record conversion
//=============================================================================

nlohmann::json task_to_json(const Task& task) {
    nlohmann::json j;
    j["id"] = task.id;
    j["source_id"] = task.source_id;
    j["file_name"] = task.file_name;
    j["url"] = task.url;
    j["save_path"] = task.save_path;
    j["total_bytes"] = task.total_bytes ? nlohmann::json(*task.total_bytes) : nlohmann::json(nullptr);
    j["expected_bytes"] = task.expected_bytes ? nlohmann::json(*task.expected_bytes) : nlohmann::json(nullptr);
    j["partial_bytes"] = task.partial_bytes;
    j["status"] = std::string(core::to_string(task.status));
    j["priority"] = std::string(core::to_string(task.priority));
    j["retry_count"] = task.retry_count;
    j["error_message"] = task.error_message ? nlohmann::json(*task.error_message) : nlohmann::json(nullptr);
    j["etag"] = task.etag;
    j["last_modified"] = task.last_modified;
    if (task.digest) {
        j["digest"] = {
            {"algorithm", std::string(core::to_string(task.digest->algorithm))},
            {"value", task.digest->hex},
        };
    } else {
        j["digest"] = nullptr;
    }
    j["scheduled_at"] = optional_time(task.scheduled_at);
    j["started_at"] = optional_time(task.started_at);
    j["completed_at"] = optional_time(task.completed_at);
    j["created_at"] = core::to_epoch_ms(task.created_at);
    j["updated_at"] = core::to_epoch_ms(task.updated_at);
    return j;
}

Task task_from_json(const nlohmann::json& j) {
    Task task;
    task.id = j.at("id").get<std::string>();
    if (task.id.empty()) {
        throw std::invalid_argument("record without id");
    }
    task.source_id = read_string(j, "source_id");
    task.file_name = read_string(j, "file_name");
    task.url = j.at("url").get<std::string>();
    task.save_path = read_string(j, "save_path");

    if (j.contains("total_bytes") && !j["total_bytes"].is_null()) {
        task.total_bytes = j["total_bytes"].get<std::uint64_t>();
    }
    if (j.contains("expected_bytes") && !j["expected_bytes"].is_null()) {
        task.expected_bytes = j["expected_bytes"].get<std::uint64_t>();
    }
    task.partial_bytes = j.value("partial_bytes", std::uint64_t{0});

    auto status = core::parse_status(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("unknown status in record " + task.id);
    }
    task.status = *status;

    auto priority = core::parse_priority(j.value("priority", std::string("normal")));
    if (!priority) {
        throw std::invalid_argument("unknown priority in record " + task.id);
    }
    task.priority = *priority;

    task.retry_count = j.value("retry_count", std::uint32_t{0});
    if (j.contains("error_message") && !j["error_message"].is_null()) {
        task.error_message = j["error_message"].get<std::string>();
    }
    task.etag = read_string(j, "etag");
    task.last_modified = read_string(j, "last_modified");

    if (j.contains("digest") && j["digest"].is_object()) {
        auto algorithm = core::parse_digest_algorithm(j["digest"].at("algorithm").get<std::string>());
        if (!algorithm) {
            throw std::invalid_argument("unknown digest algorithm in record " + task.id);
        }
        task.digest = core::Digest{*algorithm, j["digest"].at("value").get<std::string>()};
    }

    task.scheduled_at = read_optional_time(j, "scheduled_at");
    task.started_at = read_optional_time(j, "started_at");
    task.completed_at = read_optional_time(j, "completed_at");
    task.created_at = core::from_epoch_ms(j.value("created_at", std::int64_t{0}));
    task.updated_at = core::from_epoch_ms(j.value("updated_at", std::int64_t{0}));

    if (task.total_bytes && task.partial_bytes > *task.total_bytes) {
        task.partial_bytes = *task.total_bytes;
    }
    return task;
}

//=============================================================================
// JsonTaskStore
//=============================================================================

JsonTaskStore::JsonTaskStore(Token, std::filesystem::path path)
    : path_(std::move(path)) {}

std::filesystem::path JsonTaskStore::temp_path(const std::filesystem::path& path) {
    auto tmp = path;
    tmp += ".tmp";
    return tmp;
}

std::expected<std::unique_ptr<JsonTaskStore>, std::error_code>
JsonTaskStore::open(const std::filesystem::path& path) noexcept {
    auto store = std::make_unique<JsonTaskStore>(Token{}, path);

    std::error_code fs_ec;
    if (!std::filesystem::exists(path, fs_ec)) {
        return store;
    }

    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(TaskErrc::storage_error));
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        const auto text = ss.str();
        if (text.empty()) {
            return store;
        }

        auto doc = nlohmann::json::parse(text);
        auto version = doc.value("version", 0);
        if (version != FORMAT_VERSION) {
            HAUL_LOG_ERROR("task store {}: unsupported format version {}", path.string(), version);
            return std::unexpected(make_error_code(TaskErrc::storage_error));
        }

        for (const auto& record : doc.at("tasks")) {
            auto task = task_from_json(record);
            auto id = task.id;
            store->tasks_.insert_or_assign(std::move(id), std::move(task));
        }
    } catch (const std::exception& e) {
        HAUL_LOG_ERROR("task store {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(TaskErrc::storage_error));
    }

    HAUL_LOG_DEBUG("task store {}: loaded {} records", path.string(), store->tasks_.size());
    return store;
}

std::error_code JsonTaskStore::write_locked() noexcept {
    try {
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path());
        }

        nlohmann::json doc;
        doc["version"] = FORMAT_VERSION;
        doc["tasks"] = nlohmann::json::array();
        for (const auto& [id, task] : tasks_) {
            doc["tasks"].push_back(task_to_json(task));
        }

        const auto tmp = temp_path(path_);
        if (auto ec = write_file_durably(tmp, doc.dump(2))) {
            HAUL_LOG_ERROR("task store: cannot write {}", tmp.string());
            return ec;
        }

        std::error_code rename_ec;
        std::filesystem::rename(tmp, path_, rename_ec);
        if (rename_ec) {
            HAUL_LOG_ERROR("task store: rename to {} failed: {}", path_.string(), rename_ec.message());
            return make_error_code(TaskErrc::storage_error);
        }
        return {};
    } catch (const std::exception& e) {
        HAUL_LOG_ERROR("task store {}: {}", path_.string(), e.what());
        return make_error_code(TaskErrc::storage_error);
    }
}

std::error_code JsonTaskStore::upsert(const Task& task) noexcept {
    if (task.id.empty()) {
        return make_error_code(TaskErrc::storage_error);
    }

    std::lock_guard lock(mutex_);
    std::optional<Task> previous;
    if (auto it = tasks_.find(task.id); it != tasks_.end()) {
        previous = it->second;
    }

    tasks_.insert_or_assign(task.id, task);
    auto ec = write_locked();
    if (ec) {
        // Keep memory consistent with what is on disk
        if (previous) {
            tasks_.insert_or_assign(task.id, std::move(*previous));
        } else {
            tasks_.erase(task.id);
        }
    }
    return ec;
}

std::expected<std::vector<Task>, std::error_code> JsonTaskStore::get_all() noexcept {
    std::lock_guard lock(mutex_);
    std::vector<Task> out;
    out.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        out.push_back(task);
    }
    return out;
}

std::expected<Task, std::error_code> JsonTaskStore::get(std::string_view id) noexcept {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::unexpected(make_error_code(TaskErrc::task_not_found));
    }
    return it->second;
}

std::error_code JsonTaskStore::remove(std::string_view id) noexcept {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return {};
    }

    auto previous = std::move(it->second);
    tasks_.erase(it);
    auto ec = write_locked();
    if (ec) {
        auto key = previous.id;
        tasks_.insert_or_assign(std::move(key), std::move(previous));
    }
    return ec;
}

std::expected<std::size_t, std::error_code>
JsonTaskStore::remove_completed_older_than(std::chrono::milliseconds age) noexcept {
    auto cutoff = core::Clock::now() - age;

    std::lock_guard lock(mutex_);
    auto snapshot = tasks_;
    auto removed = std::erase_if(tasks_, [cutoff](const auto& entry) {
        return entry.second.status == TaskStatus::completed && entry.second.updated_at < cutoff;
    });
    if (removed == 0) {
        return std::size_t{0};
    }

    if (auto ec = write_locked()) {
        tasks_ = std::move(snapshot);
        return std::unexpected(ec);
    }
    return static_cast<std::size_t>(removed);
}

} // namespace haul::store
