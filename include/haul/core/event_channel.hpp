// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/log.hpp>
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace haul::core {

// Broadcast channel with one conflating mailbox per subscriber.
//
// publish() never waits on a consumer: it overwrites each subscriber's
// pending value and wakes that subscriber's delivery thread. A slow
// consumer therefore skips intermediate values and always sees the latest.
template<typename T>
class EventChannel {
    struct Mailbox {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::optional<T> pending;
    };

    struct Shared {
        std::mutex mutex;
        std::vector<std::shared_ptr<Mailbox>> mailboxes;
    };

public:
    using Handler = std::function<void(const T&)>;

    // Unsubscribes and joins the delivery thread on destruction. Must not be
    // destroyed from inside its own handler.
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription() { reset(); }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        Subscription(Subscription&& other) noexcept
            : shared_(std::move(other.shared_))
            , mailbox_(std::move(other.mailbox_))
            , thread_(std::move(other.thread_)) {}

        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                shared_ = std::move(other.shared_);
                mailbox_ = std::move(other.mailbox_);
                thread_ = std::move(other.thread_);
            }
            return *this;
        }

        void reset() noexcept {
            if (auto shared = shared_.lock()) {
                std::lock_guard lock(shared->mutex);
                std::erase(shared->mailboxes, mailbox_);
            }
            shared_.reset();
            if (thread_.joinable()) {
                thread_.request_stop();
                thread_.join();
            }
            mailbox_.reset();
        }

        [[nodiscard]] bool active() const noexcept { return thread_.joinable(); }

    private:
        friend class EventChannel;

        std::weak_ptr<Shared> shared_;
        std::shared_ptr<Mailbox> mailbox_;
        std::jthread thread_;
    };

    EventChannel() : shared_(std::make_shared<Shared>()) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    [[nodiscard]] Subscription subscribe(Handler handler) {
        auto mailbox = std::make_shared<Mailbox>();

        Subscription sub;
        sub.shared_ = shared_;
        sub.mailbox_ = mailbox;
        sub.thread_ = std::jthread([mailbox, handler = std::move(handler)](std::stop_token stoken) {
            deliver(stoken, *mailbox, handler);
        });

        std::lock_guard lock(shared_->mutex);
        shared_->mailboxes.push_back(std::move(mailbox));
        return sub;
    }

    void publish(const T& value) {
        std::lock_guard lock(shared_->mutex);
        for (const auto& mailbox : shared_->mailboxes) {
            {
                std::lock_guard mlock(mailbox->mutex);
                mailbox->pending = value;
            }
            mailbox->cv.notify_one();
        }
    }

    [[nodiscard]] std::size_t subscriber_count() const {
        std::lock_guard lock(shared_->mutex);
        return shared_->mailboxes.size();
    }

private:
    static void deliver(std::stop_token stoken, Mailbox& mailbox, const Handler& handler) {
        while (!stoken.stop_requested()) {
            std::optional<T> value;
            {
                std::unique_lock lock(mailbox.mutex);
                if (!mailbox.cv.wait(lock, stoken, [&] { return mailbox.pending.has_value(); })) {
                    return;
                }
                value = std::move(mailbox.pending);
                mailbox.pending.reset();
            }

            try {
                handler(*value);
            } catch (const std::exception& e) {
                HAUL_LOG_WARN("event subscriber threw: {}", e.what());
            }
        }
    }

    std::shared_ptr<Shared> shared_;
};

} // namespace haul::core
