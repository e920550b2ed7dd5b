#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>
#include "registry.hpp"
#include "machine_state.hpp"

namespace fs = std::filesystem;

namespace YAML { class Node; class Emitter; }

// Durable per-machine state under one directory:
//   registries/<machine_id>.yaml          active sessions and slot map
//   machine_snapshots/<machine_id>.yaml   last polled MachineState
//   rental_logs/<ts>_session_<id>.yaml    finalized sessions, append-only
//
// Single writer per directory. Every write goes to a temp file that is renamed
// over the target, so a crash never leaves a half-written record.
class RegistryStore {
public:
    explicit RegistryStore(const fs::path& state_dir);

    Result<void> ensure_dirs();

    bool has_registry(int64_t machine_id) const;

    // A missing file gives an empty registry; a corrupt one is an error and is
    // left on disk untouched.
    Result<MachineRegistry> load(int64_t machine_id) const;
    Result<void> save(const MachineRegistry& registry);

    // nullopt when the machine has never been seen.
    Result<std::optional<MachineState>> load_snapshot(int64_t machine_id) const;
    Result<void> save_snapshot(const MachineState& state);

    // Write a finalized session to the archive; returns its path. Archiving the
    // same session id again replaces its existing file.
    Result<fs::path> archive(int64_t machine_id, const Session& session);

    const fs::path& state_dir() const { return state_dir_; }
    fs::path registry_path(int64_t machine_id) const;
    fs::path snapshot_path(int64_t machine_id) const;
    fs::path archive_dir() const;

private:
    fs::path state_dir_;
};

// ── Serialization (shared by registry and archive records) ────

void emit_session(YAML::Emitter& out, const Session& s);
Result<Session> parse_session(const YAML::Node& node);

std::string registry_to_yaml(const MachineRegistry& registry);
Result<MachineRegistry> registry_from_yaml(const std::string& text);
