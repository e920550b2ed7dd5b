#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>
#include <core/types.hpp>
#include "machine_state.hpp"

// Where snapshots come from. One fetch returns every monitored machine.
class MachineSource {
public:
    virtual ~MachineSource() = default;
    virtual Result<std::vector<MachineState>> fetch() = 0;
};

// Parse a machine listing: either {"machines": [...]} or a bare list. Keeps
// only `wanted` ids (all when empty); malformed entries are logged and dropped.
Result<std::vector<MachineState>> parse_machine_list(const std::string& text,
                                                     const std::vector<int64_t>& wanted);

// Runs an external command (the vastai CLI by default) and parses its stdout.
// A failed fetch is retried with exponential backoff before giving up.
class CommandMachineSource : public MachineSource {
public:
    using Runner = std::function<CommandResult(const std::vector<std::string>& argv)>;
    using Sleeper = std::function<void(int ms)>;

    CommandMachineSource(std::vector<std::string> command,
                         std::vector<int64_t> machine_ids);

    // Swap the process runner and sleep hook (tests).
    CommandMachineSource(std::vector<std::string> command,
                         std::vector<int64_t> machine_ids,
                         Runner runner, Sleeper sleeper);

    Result<std::vector<MachineState>> fetch() override;

    int max_attempts = 3;
    int min_delay_ms = 2000;
    int max_delay_ms = 30000;

private:
    Result<std::vector<MachineState>> fetch_once();

    std::vector<std::string> command_;
    std::vector<int64_t> machine_ids_;
    Runner runner_;
    Sleeper sleeper_;
};
