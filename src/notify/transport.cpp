#include "transport.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

AppriseTransport::AppriseTransport(std::string program, int timeout_ms)
    : program_(std::move(program)), timeout_ms_(timeout_ms) {}

bool AppriseTransport::deliver(const NotificationTarget& target, const Message& message) {
    std::vector<std::string> args;
    if (!message.title.empty()) {
        args.push_back("-t");
        args.push_back(message.title);
    }
    args.push_back("-b");
    args.push_back(message.body);
    args.push_back(target.url);

    auto result = platform::run_capture(program_, args, timeout_ms_);
    if (result.success()) return true;

    std::string output = result.get_output();
    trim(output);
    log_warn(fmt::format("apprise delivery to {} failed (exit {}): {}",
                         target.name, result.exit_code, output));
    return false;
}
