#include "formatter.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <cctype>
#include <cmath>

const char* const MESSAGE_RULE = "~~                                                 ~~";

static std::string join_lines(const std::vector<std::string>& lines) {
    return fmt::format("{}", fmt::join(lines, "\n"));
}

static std::string money(double v) {
    return fmt::format("{:.4f}$", v);
}

static std::string split_line(const char* label, double gpu, double disk) {
    return fmt::format("{}: {} (GPUs) + {} (disk) = {}", label, money(gpu), money(disk), money(gpu + disk));
}

static std::vector<int> sorted_gpus(const Session& s) {
    auto g = s.gpus;
    std::sort(g.begin(), g.end());
    return g;
}

static double gpu_hourly(const Session& s) {
    const auto* g = s.open_gpu();
    return g ? g->rate * g->gpu_count : 0.0;
}

static double storage_rate(const Session& s) {
    const auto* st = s.open_storage();
    return st ? st->rate_per_gb_month : 0.0;
}

static double disk_hourly(const Session& s) {
    return storage_rate(s) * s.storage_gb / HOURS_PER_MONTH;
}

std::vector<std::string> chunk_lines(const std::vector<std::string>& header_lines,
                                     const std::vector<std::string>& lines,
                                     size_t limit) {
    std::vector<std::string> bodies;
    auto measure = [](const std::vector<std::string>& v) {
        size_t n = 0;
        for (const auto& l : v) n += l.size() + 1;
        return n;
    };

    std::vector<std::string> current = header_lines;
    size_t current_len = measure(current);

    for (const auto& line : lines) {
        size_t addition = line.size() + 1;
        if (current_len + addition > limit && current.size() > header_lines.size()) {
            bodies.push_back(join_lines(current));
            current = header_lines;
            current_len = measure(current);
            if (line.empty()) continue;
        }
        current.push_back(line);
        current_len += addition;
    }

    if (current.size() > header_lines.size() || bodies.empty()) {
        bodies.push_back(join_lines(current));
    }
    return bodies;
}

// ── Formatter ───────────────────────────────────────────────

std::string Formatter::timestamp(const std::string& iso) const {
    return iso.empty() ? "" : format_timestamp(iso);
}

std::vector<Message> Formatter::finish(const std::string& title,
                                       const std::vector<std::string>& lines) const {
    std::vector<std::string> all = {MESSAGE_RULE, "## " + title};
    all.insert(all.end(), lines.begin(), lines.end());
    return {{title, join_lines(all)}};
}

std::vector<std::string> Formatter::machine_section(const MachineSummary& m) const {
    auto codes = split_ws(m.gpu_occupancy);
    int used = static_cast<int>(std::count_if(codes.begin(), codes.end(),
                                              [](const std::string& c) { return c != "x"; }));
    int pct = m.num_gpus ? static_cast<int>(std::lround(100.0 * used / m.num_gpus)) : 0;

    double gpu_hr = 0.0;
    double disk_hr = 0.0;
    for (const auto& s : m.sessions) {
        gpu_hr += gpu_hourly(s);
        disk_hr += disk_hourly(s);
    }

    std::vector<std::string> lines;
    lines.push_back(m.gpu_name.empty()
        ? fmt::format("### Machine {}", m.machine_id)
        : fmt::format("### Machine {} {}", m.machine_id, m.gpu_name));
    lines.push_back(fmt::format("Occupancy: {}/{} GPUs ({}%)", used, m.num_gpus, pct));
    lines.push_back(split_line("Total est hourly", gpu_hr, disk_hr));
    lines.push_back(fmt::format("Tracked sessions: {} running, {} stored",
                                m.running_sessions, m.stored_sessions));

    if (m.sessions.empty()) {
        lines.push_back("- No tracked sessions");
        return lines;
    }

    for (const auto& s : m.sessions) {
        auto gpus = sorted_gpus(s);
        lines.push_back(fmt::format("- {} ({})", s.id, to_string(s.status)));
        if (!gpus.empty()) {
            if (s.status == SessionStatus::Stored) {
                lines.push_back(fmt::format("  - GPUs (inactive): x{} {} {}", gpus.size(), gpus, s.rental_type));
            } else {
                const auto* g = s.open_gpu();
                lines.push_back(fmt::format("  - GPUs: x{} {} {} @ {:.4f}$/GPU/hr",
                                            gpus.size(), gpus, s.rental_type, g ? g->rate : 0.0));
            }
        }
        if (s.storage_gb > 0.0) {
            lines.push_back(fmt::format("  - Storage: {:.2f} GB @ {:.4f}$/GB/mo", s.storage_gb, storage_rate(s)));
        }
        lines.push_back("  - " + split_line("Est hourly", gpu_hourly(s), disk_hourly(s)));
        auto t = s.totals(m.as_of);
        lines.push_back("  - " + split_line("Earnings", t.gpu, t.storage));
        lines.push_back("  - Start: " + timestamp(s.start_time));
    }
    return lines;
}

std::vector<std::string> Formatter::session_started(const LifecycleEvent& ev) const {
    const auto& s = ev.session;
    auto gpus = sorted_gpus(s);
    double gpu_hr = ev.rate * static_cast<double>(gpus.size());
    double disk_hr = disk_hourly(s);

    std::vector<std::string> out;
    out.push_back(fmt::format("- {}:", s.id));
    out.push_back(fmt::format("  - {} @ ${:.4f}/gpu (est hourly {} (GPUs) + {} (disk) = {})",
                              ev.rental_type, ev.rate, money(gpu_hr), money(disk_hr), money(gpu_hr + disk_hr)));
    out.push_back(fmt::format("  - x{} GPUs allocated: {}", gpus.size(), gpus));
    if (s.storage_gb > 0.0) {
        out.push_back(fmt::format("  - Storage: {:.2f} GB @ {:.4f}$/GB/mo", s.storage_gb, storage_rate(s)));
    }
    out.push_back("  - Start: " + timestamp(s.start_time));
    return out;
}

std::vector<std::string> Formatter::session_ended(const Session& s) const {
    auto gpus = sorted_gpus(s);
    std::vector<std::string> out;
    out.push_back(fmt::format("- {}:", s.id));
    out.push_back(fmt::format("  - x{} GPUs released: {}", gpus.size(), gpus));
    out.push_back("  - Duration: " + humanize_duration(s.rental_duration.value_or(0.0)));
    out.push_back("  - " + split_line("Total earned", s.earned_gpu.value_or(0.0), s.earned_storage.value_or(0.0)));
    out.push_back("  - Start: " + timestamp(s.start_time));
    out.push_back("  - End: " + timestamp(s.end_time.value_or("")));
    return out;
}

std::vector<Message> Formatter::system_message(const std::string& title,
                                               const std::vector<std::string>& lines) const {
    return finish(title, lines);
}

std::vector<Message> Formatter::lifecycle(const LifecycleEvent& ev) const {
    const auto& s = ev.session;
    auto gpus = sorted_gpus(s);
    std::vector<std::string> lines = {fmt::format("Machine {}", ev.machine_id)};
    std::string title;

    switch (ev.type) {
        case EventType::RentalStart: {
            title = "New Rental";
            auto block = session_started(ev);
            lines.insert(lines.end(), block.begin(), block.end());
            break;
        }
        case EventType::RentalEnd: {
            title = "Rental Ended";
            auto block = session_ended(s);
            lines.insert(lines.end(), block.begin(), block.end());
            break;
        }
        case EventType::RentalPause:
            title = "Session Paused";
            lines.push_back(fmt::format("- {}:", s.id));
            lines.push_back(fmt::format("  - x{} GPUs released: {}", gpus.size(), gpus));
            if (s.storage_gb > 0.0) {
                lines.push_back(fmt::format("  - Storage: {:.2f} GB continues", s.storage_gb));
            }
            lines.push_back("  - Paused: " + timestamp(s.last_state_change));
            break;
        case EventType::RentalResume:
            title = "Session Resumed";
            lines.push_back(fmt::format("- {}:", s.id));
            lines.push_back(fmt::format("  - x{} GPUs allocated: {}", gpus.size(), gpus));
            lines.push_back(fmt::format("  - GPU rate: ${:.4f}/gpu/hr", ev.rate));
            lines.push_back("  - Resumed: " + timestamp(s.last_state_change));
            break;
        default:
            title = event_name(ev.type);
            break;
    }

    lines.push_back("");
    auto section = machine_section(ev.summary);
    lines.insert(lines.end(), section.begin(), section.end());
    return finish(title, lines);
}

std::vector<Message> Formatter::startup_summary(const std::vector<MachineSummary>& machines) const {
    std::vector<std::string> lines;
    for (const auto& m : machines) {
        if (!lines.empty()) lines.push_back("");
        auto section = machine_section(m);
        lines.insert(lines.end(), section.begin(), section.end());
    }
    return finish("Startup Summary", lines);
}

std::vector<Message> Formatter::error(int64_t machine_id, const std::string& error,
                                      const std::optional<std::string>&) const {
    return finish("Machine Error", {fmt::format("Machine {}", machine_id), "Error: " + error});
}

std::vector<Message> Formatter::recovery(int64_t machine_id) const {
    return finish("Machine Recovered", {fmt::format("Machine {}", machine_id), "Status: OK"});
}

// ── DiscordFormatter ────────────────────────────────────────

std::string DiscordFormatter::timestamp(const std::string& iso) const {
    if (iso.empty()) return "";
    auto t = parse_iso_utc(iso);
    if (!t) return iso;
    return fmt::format("<t:{0}:f> (<t:{0}:R>)", static_cast<long long>(*t));
}

std::vector<Message> DiscordFormatter::finish(const std::string& title,
                                              const std::vector<std::string>& lines) const {
    std::vector<Message> out;
    for (auto& body : chunk_lines({MESSAGE_RULE, "## " + title}, lines, DISCORD_CHUNK_LIMIT)) {
        out.push_back({"", std::move(body)});
    }
    return out;
}

std::vector<Message> DiscordFormatter::error(int64_t machine_id, const std::string& error,
                                             const std::optional<std::string>& mention) const {
    std::vector<std::string> lines;
    if (mention && !mention->empty()) lines.push_back(fmt::format("<@{}>", *mention));
    lines.push_back(fmt::format("Machine {}", machine_id));
    lines.push_back("Error: " + error);
    return finish("Machine Error", lines);
}

// ── EmailFormatter ──────────────────────────────────────────

EmailFormatter::EmailFormatter() : clock(now_iso) {}

std::string EmailFormatter::timestamp(const std::string& iso) const {
    if (iso.empty()) return "";
    if (!parse_iso_utc(iso)) return iso;
    double secs = seconds_between(iso, clock());
    return fmt::format("{} ({} {})", format_timestamp(iso),
                       humanize_duration(std::fabs(secs)), secs >= 0.0 ? "ago" : "from now");
}

std::vector<Message> EmailFormatter::finish(const std::string& title,
                                            const std::vector<std::string>& lines) const {
    std::string stamp = "?";
    if (auto t = parse_iso_utc(clock())) {
        struct tm tm_buf;
        gmtime_r(&*t, &tm_buf);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm_buf);
        stamp = buf;
    }

    std::vector<std::string> body = {title, std::string(title.size(), '='), ""};
    for (const auto& line : lines) {
        size_t skip = line.find_first_not_of('#');
        if (skip != 0 && skip != std::string::npos) {
            std::string text = line.substr(skip);
            trim(text);
            body.push_back(text);
        } else {
            body.push_back(line);
        }
    }
    while (!body.empty() && body.back().empty()) body.pop_back();

    return {{fmt::format("{} [{}]", title, stamp), "<pre>" + join_lines(body) + "</pre>"}};
}

std::vector<Message> EmailFormatter::error(int64_t machine_id, const std::string& error,
                                           const std::optional<std::string>& mention) const {
    std::vector<std::string> lines = {fmt::format("Machine {}", machine_id), "Error: " + error};
    if (mention && !mention->empty()) {
        lines.push_back("");
        lines.push_back("Mention: " + *mention);
    }
    return finish("Machine Error", lines);
}

// ── Lookup ──────────────────────────────────────────────────

std::shared_ptr<const Formatter> formatter_for(const std::string& service) {
    static const auto default_fmt = std::make_shared<const DefaultFormatter>();
    static const auto discord_fmt = std::make_shared<const DiscordFormatter>();
    static const auto email_fmt = std::make_shared<const EmailFormatter>();

    std::string key = service;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key.rfind("discord", 0) == 0) return discord_fmt;
    if (key.rfind("mailto", 0) == 0 || key == "email") return email_fmt;
    return default_fmt;
}
