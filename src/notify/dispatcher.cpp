#include "dispatcher.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

int RetryPolicy::delay_ms(int attempt) const {
    long long d = min_delay_ms;
    for (int i = 1; i < attempt && d < max_delay_ms; ++i) d *= 2;
    return static_cast<int>(std::min<long long>(d, max_delay_ms));
}

bool target_accepts(const NotificationTarget& target, EventType type) {
    if (!target.enabled) return false;
    if (!target.events) return true;
    return target.events->count(event_name(type)) > 0;
}

// ── Construction ────────────────────────────────────────────

NotificationDispatcher::NotificationDispatcher(std::vector<NotificationTarget> targets,
                                               std::shared_ptr<Transport> transport,
                                               std::optional<std::string> default_error_mention,
                                               RetryPolicy retry)
    : targets_(std::move(targets)),
      transport_(std::move(transport)),
      default_error_mention_(std::move(default_error_mention)),
      retry_(retry) {
    int workers = std::min(NOTIFY_MAX_WORKERS, std::max(1, static_cast<int>(targets_.size())));
    pool_ = std::make_unique<platform::WorkerPool>(workers);
}

NotificationDispatcher::~NotificationDispatcher() {
    close();
}

void NotificationDispatcher::close() {
    if (closed_.exchange(true)) return;
    pool_->shutdown();
}

// ── Delivery ────────────────────────────────────────────────

void NotificationDispatcher::deliver_with_retry(const NotificationTarget& target, const Message& message) {
    for (int attempt = 1; attempt <= retry_.max_attempts; ++attempt) {
        bool ok = false;
        try {
            ok = transport_->deliver(target, message);
        } catch (const std::exception& e) {
            log_warn(fmt::format("Notification to {} raised: {}", target.name, e.what()));
        }
        if (ok) return;

        if (attempt < retry_.max_attempts) {
            int wait = retry_.delay_ms(attempt);
            log_warn(fmt::format("Notification to {} failed (attempt {}/{}), retrying in {}ms",
                                 target.name, attempt, retry_.max_attempts, wait));
            if (wait > 0) platform::sleep_ms(wait);
        }
    }
    log_error(fmt::format("Notification delivery failed for {} after retries", target.name));
}

void NotificationDispatcher::dispatch(EventType type, const Render& render) {
    if (closed_) return;

    for (const auto& target : targets_) {
        if (!target_accepts(target, type)) continue;

        auto formatter = formatter_for(target.service);
        std::vector<Message> messages;
        try {
            messages = render(*formatter, target);
        } catch (const std::exception& e) {
            log_warn(fmt::format("Failed to format {} notification for {}: {}",
                                 event_name(type), target.name, e.what()));
            continue;
        }

        for (auto& msg : messages) {
            bool queued = pool_->submit([this, target, msg]() {
                deliver_with_retry(target, msg);
            });
            if (!queued) {
                log_warn(fmt::format("Dispatcher closed, dropping {} notification for {}",
                                     event_name(type), target.name));
            }
        }
    }
}

// ── Public API ──────────────────────────────────────────────

void NotificationDispatcher::publish(const LifecycleEvent& event) {
    dispatch(event.type, [&event](const Formatter& f, const NotificationTarget&) {
        return f.lifecycle(event);
    });
}

void NotificationDispatcher::send_system_message(const std::string& title,
                                                 const std::vector<std::string>& lines) {
    dispatch(EventType::System, [&](const Formatter& f, const NotificationTarget&) {
        return f.system_message(title, lines);
    });
}

void NotificationDispatcher::send_startup_summary(const std::vector<MachineSummary>& machines) {
    dispatch(EventType::Startup, [&](const Formatter& f, const NotificationTarget&) {
        return f.startup_summary(machines);
    });
}

void NotificationDispatcher::send_error(int64_t machine_id, const std::string& error) {
    dispatch(EventType::Error, [&](const Formatter& f, const NotificationTarget& t) {
        std::optional<std::string> mention = t.mention;
        if (!mention && t.service.rfind("discord", 0) == 0) mention = default_error_mention_;
        return f.error(machine_id, error, mention);
    });
}

void NotificationDispatcher::send_recovery(int64_t machine_id) {
    dispatch(EventType::Recovery, [&](const Formatter& f, const NotificationTarget&) {
        return f.recovery(machine_id);
    });
}
