#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>
#include <functional>
#include "event.hpp"

struct Message {
    std::string title;
    std::string body;
};

// Renders events as one or more messages for a delivery service.
class Formatter {
public:
    virtual ~Formatter() = default;

    virtual std::vector<Message> system_message(const std::string& title,
                                                const std::vector<std::string>& lines) const;
    virtual std::vector<Message> lifecycle(const LifecycleEvent& event) const;
    virtual std::vector<Message> startup_summary(const std::vector<MachineSummary>& machines) const;
    virtual std::vector<Message> error(int64_t machine_id, const std::string& error,
                                       const std::optional<std::string>& mention) const;
    virtual std::vector<Message> recovery(int64_t machine_id) const;

protected:
    // Render an ISO timestamp for display.
    virtual std::string timestamp(const std::string& iso) const;

    // Assemble title, "## header" and body lines into messages.
    virtual std::vector<Message> finish(const std::string& title,
                                        const std::vector<std::string>& lines) const;

    std::vector<std::string> machine_section(const MachineSummary& m) const;
    std::vector<std::string> session_started(const LifecycleEvent& ev) const;
    std::vector<std::string> session_ended(const Session& s) const;
};

// Plain markdown, one message per event.
class DefaultFormatter : public Formatter {};

// Discord markdown: native <t:epoch:f> timestamps, user mentions on errors,
// empty titles, bodies split to fit the message size limit.
class DiscordFormatter : public Formatter {
public:
    std::vector<Message> error(int64_t machine_id, const std::string& error,
                               const std::optional<std::string>& mention) const override;

protected:
    std::string timestamp(const std::string& iso) const override;
    std::vector<Message> finish(const std::string& title,
                                const std::vector<std::string>& lines) const override;
};

// Plain-text email: subjects stamped with the send time, an underlined
// heading, markdown markers stripped and the body kept preformatted.
class EmailFormatter : public Formatter {
public:
    std::vector<Message> error(int64_t machine_id, const std::string& error,
                               const std::optional<std::string>& mention) const override;

    // Source of "now" for subject stamps and relative times.
    std::function<std::string()> clock;

    EmailFormatter();

protected:
    std::string timestamp(const std::string& iso) const override;
    std::vector<Message> finish(const std::string& title,
                                const std::vector<std::string>& lines) const override;
};

// Formatter for a service key ("discord", "mailto", "default", ...). Unknown
// keys get the default formatter.
std::shared_ptr<const Formatter> formatter_for(const std::string& service);

// Horizontal rule opening every message.
extern const char* const MESSAGE_RULE;

// Split `lines` into bodies of at most `limit` characters; each body starts
// with `header_lines`.
std::vector<std::string> chunk_lines(const std::vector<std::string>& header_lines,
                                     const std::vector<std::string>& lines,
                                     size_t limit);
