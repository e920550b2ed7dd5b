#include "machine_poller.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>

Result<std::vector<MachineState>> parse_machine_list(const std::string& text,
                                                     const std::vector<int64_t>& wanted) {
    using R = Result<std::vector<MachineState>>;
    std::vector<MachineState> machines;

    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return R::Err(std::string("unparseable machine listing: ") + e.what());
    }

    YAML::Node list = root.IsMap() ? root["machines"] : root;
    if (!list || !list.IsSequence()) {
        return R::Err("machine listing has no machines list");
    }

    for (const auto& entry : list) {
        auto parsed = parse_machine_state(entry);
        if (parsed.is_err()) {
            log_warn("Skipping malformed machine entry: " + parsed.error);
            continue;
        }
        const auto& m = parsed.value;
        if (!wanted.empty() && std::find(wanted.begin(), wanted.end(), m.machine_id) == wanted.end()) {
            continue;
        }
        machines.push_back(m);
    }
    return R::Ok(machines);
}

// ── CommandMachineSource ────────────────────────────────────

CommandMachineSource::CommandMachineSource(std::vector<std::string> command,
                                           std::vector<int64_t> machine_ids)
    : CommandMachineSource(std::move(command), std::move(machine_ids),
                           [](const std::vector<std::string>& argv) {
                               std::vector<std::string> args(argv.begin() + 1, argv.end());
                               return platform::run_capture(argv.front(), args);
                           },
                           [](int ms) { platform::sleep_ms(ms); }) {}

CommandMachineSource::CommandMachineSource(std::vector<std::string> command,
                                           std::vector<int64_t> machine_ids,
                                           Runner runner, Sleeper sleeper)
    : max_attempts(FETCH_MAX_ATTEMPTS),
      min_delay_ms(FETCH_RETRY_MIN_SECS * 1000),
      max_delay_ms(FETCH_RETRY_MAX_SECS * 1000),
      command_(std::move(command)),
      machine_ids_(std::move(machine_ids)),
      runner_(std::move(runner)),
      sleeper_(std::move(sleeper)) {}

Result<std::vector<MachineState>> CommandMachineSource::fetch_once() {
    using R = Result<std::vector<MachineState>>;
    if (command_.empty()) return R::Err("no poll command configured");

    auto result = runner_(command_);
    if (result.failed()) {
        std::string out = result.get_output();
        trim(out);
        return R::Err(fmt::format("{} exited with {}: {}", command_.front(), result.exit_code, out));
    }
    return parse_machine_list(result.stdout_data, machine_ids_);
}

Result<std::vector<MachineState>> CommandMachineSource::fetch() {
    int delay = min_delay_ms;
    std::string last_error;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        auto result = fetch_once();
        if (result.is_ok()) {
            if (log_debug_enabled()) {
                for (const auto& m : result.value) {
                    log_debug(fmt::format("machine {}: occupancy '{}', disk {:.2f} GB, running {}/{} resident {}/{}",
                                          m.machine_id, m.gpu_occupancy, m.alloc_disk_space,
                                          m.counters.running, m.counters.running_on_demand,
                                          m.counters.resident, m.counters.resident_on_demand));
                }
            }
            return result;
        }

        last_error = result.error;
        if (attempt < max_attempts) {
            log_warn(fmt::format("Fetching machines failed (attempt {}/{}): {}; retrying in {}ms",
                                 attempt, max_attempts, last_error, delay));
            sleeper_(delay);
            delay = std::min(delay * 2, max_delay_ms);
        }
    }
    return Result<std::vector<MachineState>>::Err("Failed to fetch machines after retries: " + last_error);
}
