#pragma once

#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "formatter.hpp"

// One delivery attempt of one message to one target.
class Transport {
public:
    virtual ~Transport() = default;

    // True when the service accepted the message.
    virtual bool deliver(const NotificationTarget& target, const Message& message) = 0;
};

// Delivers through the `apprise` command line client, which understands the
// same target URLs (discord://, mailto://, tgram://, ...).
class AppriseTransport : public Transport {
public:
    explicit AppriseTransport(std::string program = "apprise",
                              int timeout_ms = NOTIFY_SEND_TIMEOUT_MS);

    bool deliver(const NotificationTarget& target, const Message& message) override;

private:
    std::string program_;
    int timeout_ms_;
};
