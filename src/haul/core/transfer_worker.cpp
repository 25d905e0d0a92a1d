// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/transfer_worker.hpp>
#include <haul/core/log.hpp>
#include <haul/disk/digest.hpp>

namespace haul::core {

TransferWorker::TransferWorker(Task task,
                               std::uint64_t generation,
                               const SchedulerConfig& config,
                               std::shared_ptr<Transport> transport,
                               ProgressTracker& tracker,
                               EventSink sink)
    : task_(std::move(task))
    , generation_(generation)
    , config_(config)
    , transport_(std::move(transport))
    , tracker_(tracker)
    , sink_(std::move(sink))
    , buffer_(config.chunk_size) {}

TransferWorker::~TransferWorker() {
    request_stop(StopReason::shutdown);
    join();
}

void TransferWorker::start() {
    thread_ = std::jthread([this](std::stop_token stoken) {
        run(std::move(stoken));
    });
    if (stop_reason() != StopReason::none) {
        thread_.request_stop();
    }
}

void TransferWorker::request_stop(StopReason reason) noexcept {
    auto current = stop_reason_.load(std::memory_order_acquire);
    while (current == StopReason::none || (reason == StopReason::cancel && current != StopReason::cancel)) {
        if (stop_reason_.compare_exchange_weak(current, reason, std::memory_order_acq_rel)) {
            break;
        }
    }
    if (thread_.joinable()) {
        thread_.request_stop();
    }
}

void TransferWorker::join() noexcept {
    if (thread_.joinable()) {
        thread_.join();
    }
}

//=============================================================================
// Transfer
//=============================================================================

void TransferWorker::run(std::stop_token stoken) noexcept {
    stop_ = std::move(stoken);

    FinishedEvent result;
    try {
        result = transfer();
    } catch (const std::exception& e) {
        result = failed(make_error_code(TaskErrc::storage_error), e.what());
    }
    file_.close();

    try {
        emit(std::move(result));
    } catch (const std::exception& e) {
        HAUL_LOG_ERROR("[{}] cannot report outcome: {}", task_.id, e.what());
    }
}

FinishedEvent TransferWorker::transfer() {
    const std::filesystem::path path(task_.save_path);
    std::uint64_t offset = task_.partial_bytes;

    // Never trust more bytes than the file actually holds
    auto on_disk = disk::FileWriter::existing_size(path);
    if (on_disk < offset) {
        HAUL_LOG_WARN("[{}] {} holds {} bytes, record says {}; resuming from {}",
                      task_.id, path.string(), on_disk, offset, on_disk);
        offset = on_disk;
        tracker_.rebase(task_.id, offset);
        emit(CheckpointEvent{offset, true});
    }

    if (auto ec = file_.open(path, offset)) {
        return failed(make_error_code(TaskErrc::storage_error),
                      "cannot open " + path.string() + ": " + ec.message());
    }

    start_offset_ = offset;
    checkpoint_bytes_ = offset;
    checkpoint_time_ = std::chrono::steady_clock::now();

    if (task_.total_bytes && offset >= *task_.total_bytes) {
        HAUL_LOG_DEBUG("[{}] already have all {} bytes, verifying", task_.id, offset);
        return verify();
    }

    std::error_code ec;
    // One restart from byte 0 is allowed per attempt
    for (bool restarted = false;; restarted = true) {
        stale_range_ = false;
        unsatisfiable_ = false;
        unsatisfiable_size_.reset();

        RangeRequest request;
        request.url = task_.url;
        request.offset = file_.offset();
        request.reduced_priority = task_.priority == Priority::low;
        if (request.offset > 0) {
            request.if_range = !task_.etag.empty() ? task_.etag : task_.last_modified;
        }

        HAUL_LOG_DEBUG("[{}] GET {} from byte {}", task_.id, task_.url, request.offset);
        ec = transport_->fetch(request, *this);

        if (stop_reason() != StopReason::none && stop_requested()) {
            return finish_stopped();
        }
        if (write_error_) {
            return failed(make_error_code(TaskErrc::storage_error),
                          "write to " + path.string() + " failed: " + write_error_.message());
        }
        if (rejection_) {
            return *rejection_;
        }

        bool restart = stale_range_;
        if (ec == TaskErrc::range_not_satisfiable && unsatisfiable_) {
            const auto have = file_.offset();
            if (unsatisfiable_size_ && *unsatisfiable_size_ == have) {
                // Nothing left to send: the file on disk is complete
                task_.total_bytes = have;
                ec.clear();
            } else if (!unsatisfiable_size_ && task_.total_bytes && *task_.total_bytes == have) {
                ec.clear();
            } else if (have > 0) {
                restart = true;
            }
        }

        if (!restart || restarted) {
            break;
        }
        HAUL_LOG_INFO("[{}] remote file no longer matches the {} bytes on disk, restarting from byte 0",
                      task_.id, file_.offset());
        if (auto restart_ec = restart_from_zero()) {
            return failed(make_error_code(TaskErrc::storage_error),
                          "cannot truncate " + path.string() + ": " + restart_ec.message());
        }
    }

    if (ec) {
        // Bytes already received are valid; keep them for the next attempt
        auto flush_ec = flush_buffer();
        if (!flush_ec) flush_ec = file_.sync();
        if (flush_ec) {
            return failed(make_error_code(TaskErrc::storage_error),
                          "write to " + path.string() + " failed: " + flush_ec.message());
        }
        return failed(ec, ec.message());
    }

    if (auto flush_ec = flush_buffer()) {
        return failed(make_error_code(TaskErrc::storage_error),
                      "write to " + path.string() + " failed: " + flush_ec.message());
    }
    if (auto sync_ec = file_.sync()) {
        return failed(make_error_code(TaskErrc::storage_error),
                      "flush of " + path.string() + " failed: " + sync_ec.message());
    }
    return verify();
}

std::error_code TransferWorker::restart_from_zero() {
    buffer_.reset();
    if (auto ec = file_.truncate(0)) {
        return ec;
    }
    start_offset_ = 0;
    checkpoint_bytes_ = 0;
    task_.total_bytes = task_.expected_bytes;
    tracker_.rebase(task_.id, 0);
    tracker_.set_total(task_.id, task_.total_bytes);
    emit(CheckpointEvent{0, true});
    return {};
}

FinishedEvent TransferWorker::finish_stopped() {
    FinishedEvent result;
    result.outcome = WorkerOutcome::stopped;
    result.total_bytes = task_.total_bytes;

    if (stop_reason() == StopReason::cancel) {
        buffer_.reset();
        result.partial_bytes = checkpoint_bytes_;
        return result;
    }

    auto ec = flush_buffer();
    if (!ec) ec = file_.sync();
    if (ec) {
        HAUL_LOG_WARN("[{}] flush on stop failed: {}; keeping last checkpoint {}",
                      task_.id, ec.message(), checkpoint_bytes_);
        result.partial_bytes = checkpoint_bytes_;
    } else {
        result.partial_bytes = file_.offset();
    }
    return result;
}

FinishedEvent TransferWorker::verify() {
    const auto final_size = file_.offset();

    if (task_.total_bytes && final_size != *task_.total_bytes) {
        return failed(make_error_code(TaskErrc::size_mismatch),
                      "expected " + std::to_string(*task_.total_bytes) + " bytes, received " +
                      std::to_string(final_size - start_offset_) + " after offset " +
                      std::to_string(start_offset_));
    }

    if (task_.digest) {
        auto actual = disk::file_digest(task_.save_path, task_.digest->algorithm);
        if (!actual) {
            return failed(make_error_code(TaskErrc::storage_error),
                          "cannot hash " + task_.save_path + ": " + actual.error().message());
        }
        if (!disk::digest_equals(*actual, task_.digest->hex)) {
            return failed(make_error_code(TaskErrc::digest_mismatch),
                          std::string(to_string(task_.digest->algorithm)) + " mismatch: expected " +
                          task_.digest->hex + ", got " + *actual);
        }
    }

    FinishedEvent result;
    result.outcome = WorkerOutcome::completed;
    result.partial_bytes = final_size;
    result.total_bytes = final_size;
    return result;
}

FinishedEvent TransferWorker::failed(std::error_code ec, std::string message) const {
    FinishedEvent result;
    result.outcome = WorkerOutcome::failed;
    result.partial_bytes = file_.is_open() ? file_.offset() : checkpoint_bytes_;
    result.total_bytes = task_.total_bytes;
    result.error = ec;
    result.message = std::move(message);
    return result;
}

//=============================================================================
// ResponseSink
//=============================================================================

bool TransferWorker::on_response(const ResponseInfo& info) {
    if (stop_requested()) return false;

    if (start_offset_ > 0 && !info.partial) {
        // Full body: the server ignored the range or the validator no longer matches
        HAUL_LOG_INFO("[{}] server sent the whole file (HTTP {}), restarting from byte 0",
                      task_.id, info.status_code);
        if (auto ec = restart_from_zero()) {
            write_error_ = ec;
            return false;
        }
    }

    auto size = info.entity_size;
    if (!size && info.content_length) {
        size = start_offset_ + *info.content_length;
    }

    if (task_.expected_bytes && size && *size != *task_.expected_bytes) {
        rejection_ = failed(make_error_code(TaskErrc::size_mismatch),
                            "remote size " + std::to_string(*size) + " differs from expected " +
                            std::to_string(*task_.expected_bytes));
        return false;
    }

    if (info.partial && start_offset_ > 0 && size && task_.total_bytes && *size != *task_.total_bytes) {
        // Same validator, different length: the bytes on disk belong to another version
        stale_range_ = true;
        return false;
    }

    if (size) {
        task_.total_bytes = size;
    } else if (!info.partial) {
        task_.total_bytes = task_.expected_bytes;
    }
    if (!info.etag.empty()) task_.etag = info.etag;
    if (!info.last_modified.empty()) task_.last_modified = info.last_modified;

    tracker_.set_total(task_.id, task_.total_bytes);
    emit(MetadataEvent{task_.total_bytes, task_.etag, task_.last_modified});
    return true;
}

bool TransferWorker::on_data(const std::byte* data, std::size_t size) {
    if (stop_requested()) return false;

    if (task_.total_bytes && file_.offset() + buffer_.size() + size > *task_.total_bytes) {
        rejection_ = failed(make_error_code(TaskErrc::size_mismatch),
                            "server sent more than the expected " +
                            std::to_string(*task_.total_bytes) + " bytes");
        return false;
    }

    while (size > 0) {
        auto taken = buffer_.fill(data, size);
        data += taken;
        size -= taken;

        if (buffer_.full()) {
            if (auto ec = flush_buffer()) {
                write_error_ = ec;
                return false;
            }
            if (auto ec = maybe_checkpoint()) {
                write_error_ = ec;
                return false;
            }
            if (stop_requested()) return false;
        }
    }
    return true;
}

bool TransferWorker::keep_going() {
    return !stop_requested();
}

void TransferWorker::on_range_not_satisfiable(std::optional<std::uint64_t> entity_size) {
    unsatisfiable_ = true;
    unsatisfiable_size_ = entity_size;
}

std::error_code TransferWorker::flush_buffer() noexcept {
    if (buffer_.empty()) return {};

    const auto n = buffer_.size();
    if (auto ec = file_.append(buffer_.data(), n)) {
        return ec;
    }
    buffer_.reset();
    tracker_.record(task_.id, n);
    return {};
}

std::error_code TransferWorker::maybe_checkpoint() noexcept {
    const auto now = std::chrono::steady_clock::now();
    const auto offset = file_.offset();
    if (offset - checkpoint_bytes_ < config_.checkpoint_bytes &&
        now - checkpoint_time_ < config_.checkpoint_interval) {
        return {};
    }

    if (auto ec = file_.sync()) {
        return ec;
    }
    checkpoint_bytes_ = offset;
    checkpoint_time_ = now;
    try {
        emit(CheckpointEvent{offset, false});
    } catch (const std::exception& e) {
        HAUL_LOG_WARN("[{}] checkpoint not delivered: {}", task_.id, e.what());
    }
    return {};
}

void TransferWorker::emit(WorkerMessage message) {
    sink_(WorkerEvent{task_.id, generation_, std::move(message)});
}

} // namespace haul::core
