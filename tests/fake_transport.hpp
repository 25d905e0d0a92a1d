// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/error.hpp>
#include <haul/core/transport.hpp>
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace haul::test {

// In-process Transport serving bodies from memory in fixed pieces.
//
// Resources can be made to fail, to stall at a byte offset until released,
// or to ignore Range requests. Every request is recorded.
class FakeTransport : public core::Transport {
public:
    static constexpr std::size_t PIECE = 4096;

    void serve(const std::string& url, std::string body, std::string etag = {}) {
        std::lock_guard lock(mutex_);
        auto& r = resources_[url];
        r.body = std::move(body);
        r.etag = std::move(etag);
    }

    // Next `times` fetches of `url` fail with `ec` before any response
    void fail_next(const std::string& url, std::error_code ec, int times = 1) {
        std::lock_guard lock(mutex_);
        auto& r = resources_[url];
        for (int i = 0; i < times; ++i) r.failures.push_back(ec);
    }

    // Stop delivering after `after_bytes` of the body until release()
    void hold(const std::string& url, std::size_t after_bytes = 0) {
        std::lock_guard lock(mutex_);
        resources_[url].hold_at = after_bytes;
    }

    void release(const std::string& url) {
        {
            std::lock_guard lock(mutex_);
            resources_[url].hold_at.reset();
        }
        cv_.notify_all();
    }

    void release_all() {
        {
            std::lock_guard lock(mutex_);
            for (auto& [url, r] : resources_) r.hold_at.reset();
        }
        cv_.notify_all();
    }

    // Answer ranged requests with the whole body (HTTP 200)
    void ignore_ranges(const std::string& url) {
        std::lock_guard lock(mutex_);
        resources_[url].ranges = false;
    }

    // Drop the connection with network_error once `bytes` have been sent
    void cut_at(const std::string& url, std::size_t bytes) {
        std::lock_guard lock(mutex_);
        resources_[url].cut_at = bytes;
    }

    void piece_delay(std::chrono::milliseconds delay) {
        std::lock_guard lock(mutex_);
        piece_delay_ = delay;
    }

    [[nodiscard]] std::vector<core::RangeRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::vector<core::RangeRequest> requests_for(const std::string& url) const {
        std::lock_guard lock(mutex_);
        std::vector<core::RangeRequest> out;
        std::copy_if(requests_.begin(), requests_.end(), std::back_inserter(out),
                     [&](const core::RangeRequest& r) { return r.url == url; });
        return out;
    }

    // Fetches currently streaming, and the most seen at once
    [[nodiscard]] int active() const {
        std::lock_guard lock(mutex_);
        return active_;
    }

    [[nodiscard]] int peak() const {
        std::lock_guard lock(mutex_);
        return peak_;
    }

    // True once a fetch of `url` is parked at its hold offset
    [[nodiscard]] bool holding(const std::string& url) const {
        std::lock_guard lock(mutex_);
        auto it = resources_.find(url);
        return it != resources_.end() && it->second.parked > 0;
    }

    std::error_code fetch(const core::RangeRequest& request, core::ResponseSink& sink) noexcept override {
        std::unique_lock lock(mutex_);
        requests_.push_back(request);

        auto it = resources_.find(request.url);
        if (it == resources_.end()) {
            return make_error_code(core::TaskErrc::remote_not_found);
        }
        auto& r = it->second;
        if (!r.failures.empty()) {
            auto ec = r.failures.front();
            r.failures.pop_front();
            return ec;
        }

        const std::string body = r.body;
        const bool validator_ok = request.if_range.empty() || request.if_range == r.etag;
        const bool partial = r.ranges && request.offset > 0 && validator_ok;
        const std::size_t start = partial ? static_cast<std::size_t>(request.offset) : 0;
        if (partial && start >= body.size()) {
            const auto size = static_cast<std::uint64_t>(body.size());
            lock.unlock();
            sink.on_range_not_satisfiable(size);
            lock.lock();
            return make_error_code(core::TaskErrc::range_not_satisfiable);
        }

        ++active_;
        peak_ = std::max(peak_, active_);
        struct Active {
            FakeTransport& self;
            ~Active() { --self.active_; }
        } active_guard{*this};

        core::ResponseInfo info;
        info.status_code = partial ? 206 : 200;
        info.partial = partial;
        info.content_length = body.size() - start;
        info.entity_size = body.size();
        info.etag = r.etag;

        lock.unlock();
        if (!sink.on_response(info)) {
            lock.lock();
            return make_error_code(core::TaskErrc::cancelled);
        }

        std::size_t pos = start;
        while (pos < body.size()) {
            lock.lock();
            auto& res = resources_[request.url];
            if (res.hold_at && pos >= *res.hold_at) {
                ++res.parked;
                while (res.hold_at && pos >= *res.hold_at) {
                    lock.unlock();
                    const bool go_on = sink.keep_going();
                    lock.lock();
                    if (!go_on) {
                        --res.parked;
                        return make_error_code(core::TaskErrc::cancelled);
                    }
                    cv_.wait_for(lock, std::chrono::milliseconds(2));
                }
                --res.parked;
            }
            if (res.cut_at && pos >= *res.cut_at) {
                res.cut_at.reset();
                return make_error_code(core::TaskErrc::network_error);
            }
            auto delay = piece_delay_;
            std::size_t n = std::min(PIECE, body.size() - pos);
            if (res.hold_at && *res.hold_at > pos) n = std::min(n, *res.hold_at - pos);
            if (res.cut_at && *res.cut_at > pos) n = std::min(n, *res.cut_at - pos);
            lock.unlock();

            if (!sink.keep_going()) {
                lock.lock();
                return make_error_code(core::TaskErrc::cancelled);
            }
            if (!sink.on_data(reinterpret_cast<const std::byte*>(body.data() + pos), n)) {
                lock.lock();
                return make_error_code(core::TaskErrc::cancelled);
            }
            pos += n;
            if (delay.count() > 0) std::this_thread::sleep_for(delay);
        }

        lock.lock();
        return {};
    }

private:
    struct Resource {
        std::string body;
        std::string etag;
        bool ranges{true};
        std::deque<std::error_code> failures;
        std::optional<std::size_t> hold_at;
        std::optional<std::size_t> cut_at;
        int parked{0};
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Resource> resources_;
    std::vector<core::RangeRequest> requests_;
    std::chrono::milliseconds piece_delay_{0};
    int active_{0};
    int peak_{0};
};

} // namespace haul::test
