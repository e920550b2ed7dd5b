#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/worker_pool.hpp>
#include "event.hpp"
#include "formatter.hpp"
#include "transport.hpp"

struct RetryPolicy {
    int max_attempts = NOTIFY_MAX_ATTEMPTS;
    int min_delay_ms = NOTIFY_RETRY_MIN_SECS * 1000;
    int max_delay_ms = NOTIFY_RETRY_MAX_SECS * 1000;

    // Wait after failed attempt `attempt` (1-based): doubles from the minimum, capped.
    int delay_ms(int attempt) const;
};

// Fans every event out to the configured targets. Formatting happens on the
// caller's thread; each (target, message) delivery runs on the worker pool
// with its own retries, so a slow or failing target never blocks the monitor.
class NotificationDispatcher : public EventSink {
public:
    NotificationDispatcher(std::vector<NotificationTarget> targets,
                           std::shared_ptr<Transport> transport,
                           std::optional<std::string> default_error_mention = std::nullopt,
                           RetryPolicy retry = {});
    ~NotificationDispatcher() override;

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    void publish(const LifecycleEvent& event) override;

    void send_system_message(const std::string& title, const std::vector<std::string>& lines);
    void send_startup_summary(const std::vector<MachineSummary>& machines);
    void send_error(int64_t machine_id, const std::string& error);
    void send_recovery(int64_t machine_id);

    // Deliver everything still queued, then stop the workers. Later sends are dropped.
    void close();

    const std::vector<NotificationTarget>& targets() const { return targets_; }
    int worker_count() const { return pool_->size(); }

private:
    using Render = std::function<std::vector<Message>(const Formatter&, const NotificationTarget&)>;

    void dispatch(EventType type, const Render& render);
    void deliver_with_retry(const NotificationTarget& target, const Message& message);

    std::vector<NotificationTarget> targets_;
    std::shared_ptr<Transport> transport_;
    std::optional<std::string> default_error_mention_;
    RetryPolicy retry_;
    std::unique_ptr<platform::WorkerPool> pool_;
    std::atomic<bool> closed_{false};
};

// True if `target` wants events of `type`.
bool target_accepts(const NotificationTarget& target, EventType type);
