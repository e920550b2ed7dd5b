#include "registry_store.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

// ── File helpers ─────────────────────────────────────────────

static Result<void> write_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("cannot create {}: {}", path.parent_path().string(), ec.message()));
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Result<void>::Err("cannot open " + tmp.string() + " for writing");
        }
        out << content;
        out.flush();
        if (!out) {
            return Result<void>::Err("write failed for " + tmp.string());
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Result<void>::Err(fmt::format("cannot replace {}", path.string()));
    }
    return Result<void>::Ok();
}

static Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::string>::Err("cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::Ok(ss.str());
}

template <typename T>
static void emit_optional(YAML::Emitter& out, const char* key, const std::optional<T>& v) {
    out << YAML::Key << key << YAML::Value;
    if (v) out << *v; else out << YAML::Null;
}

static std::optional<std::string> read_optional_string(const YAML::Node& n) {
    if (!n || n.IsNull()) return std::nullopt;
    return n.as<std::string>();
}

static std::optional<double> read_optional_number(const YAML::Node& n) {
    if (!n || n.IsNull()) return std::nullopt;
    return n.as<double>();
}

// ── Session records ──────────────────────────────────────────

void emit_session(YAML::Emitter& out, const Session& s) {
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << s.id;
    out << YAML::Key << "status" << YAML::Value << to_string(s.status);
    out << YAML::Key << "gpus" << YAML::Value << YAML::Flow << s.gpus;
    out << YAML::Key << "rental_type" << YAML::Value << s.rental_type;
    out << YAML::Key << "gpu_contracted_rate" << YAML::Value << s.gpu_contracted_rate;
    out << YAML::Key << "storage_contracted_rate" << YAML::Value << s.storage_contracted_rate;
    out << YAML::Key << "storage_gb" << YAML::Value << s.storage_gb;
    out << YAML::Key << "start_time" << YAML::Value << s.start_time;
    out << YAML::Key << "last_state_change" << YAML::Value << s.last_state_change;
    emit_optional(out, "client_end_date", s.client_end_date);

    out << YAML::Key << "gpu_segments" << YAML::Value << YAML::BeginSeq;
    for (const auto& seg : s.gpu_segments) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "start" << YAML::Value << seg.start;
        emit_optional(out, "end", seg.end);
        out << YAML::Key << "rate" << YAML::Value << seg.rate;
        out << YAML::Key << "gpu_count" << YAML::Value << seg.gpu_count;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "storage_segments" << YAML::Value << YAML::BeginSeq;
    for (const auto& seg : s.storage_segments) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "start" << YAML::Value << seg.start;
        emit_optional(out, "end", seg.end);
        out << YAML::Key << "rate_per_gb_month" << YAML::Value << seg.rate_per_gb_month;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    emit_optional(out, "end_time", s.end_time);
    emit_optional(out, "rental_duration", s.rental_duration);
    emit_optional(out, "earned_gpu", s.earned_gpu);
    emit_optional(out, "earned_storage", s.earned_storage);
    emit_optional(out, "estimated_earnings", s.estimated_earnings);
    out << YAML::EndMap;
}

Result<Session> parse_session(const YAML::Node& n) {
    if (!n.IsMap()) return Result<Session>::Err("session record is not a map");

    Session s;
    try {
        s.id = n["id"].as<std::string>("");
        if (s.id.empty()) return Result<Session>::Err("session record has no id");

        auto status = parse_session_status(n["status"].as<std::string>("running"));
        if (!status) {
            return Result<Session>::Err(fmt::format("session {}: unknown status", s.id));
        }
        s.status = *status;

        if (n["gpus"] && n["gpus"].IsSequence()) {
            for (const auto& g : n["gpus"]) s.gpus.push_back(g.as<int>());
        }
        s.rental_type = n["rental_type"].as<std::string>("");
        s.gpu_contracted_rate = n["gpu_contracted_rate"].as<double>(0.0);
        s.storage_contracted_rate = n["storage_contracted_rate"].as<double>(0.0);
        s.storage_gb = n["storage_gb"].as<double>(0.0);
        s.start_time = n["start_time"].as<std::string>("");
        s.last_state_change = n["last_state_change"].as<std::string>(s.start_time);
        s.client_end_date = read_optional_string(n["client_end_date"]);

        if (n["gpu_segments"] && n["gpu_segments"].IsSequence()) {
            for (const auto& g : n["gpu_segments"]) {
                GpuSegment seg;
                seg.start = g["start"].as<std::string>();
                seg.end = read_optional_string(g["end"]);
                seg.rate = g["rate"].as<double>(0.0);
                seg.gpu_count = g["gpu_count"].as<int>(0);
                s.gpu_segments.push_back(seg);
            }
        }
        if (n["storage_segments"] && n["storage_segments"].IsSequence()) {
            for (const auto& g : n["storage_segments"]) {
                StorageSegment seg;
                seg.start = g["start"].as<std::string>();
                seg.end = read_optional_string(g["end"]);
                seg.rate_per_gb_month = g["rate_per_gb_month"].as<double>(0.0);
                s.storage_segments.push_back(seg);
            }
        }

        s.end_time = read_optional_string(n["end_time"]);
        s.rental_duration = read_optional_number(n["rental_duration"]);
        s.earned_gpu = read_optional_number(n["earned_gpu"]);
        s.earned_storage = read_optional_number(n["earned_storage"]);
        s.estimated_earnings = read_optional_number(n["estimated_earnings"]);
    } catch (const YAML::Exception& e) {
        return Result<Session>::Err(fmt::format("session {}: {}", s.id, e.what()));
    }
    return Result<Session>::Ok(s);
}

// ── Registry records ─────────────────────────────────────────

std::string registry_to_yaml(const MachineRegistry& r) {
    YAML::Emitter out;
    out.SetDoublePrecision(17);
    out << YAML::BeginMap;
    out << YAML::Key << "machine_id" << YAML::Value << r.machine_id;
    out << YAML::Key << "gpu_name" << YAML::Value << r.gpu_name;
    out << YAML::Key << "num_gpus" << YAML::Value << r.num_gpus;
    out << YAML::Key << "gpu_occupancy" << YAML::Value << r.gpu_occupancy;
    emit_optional(out, "alloc_disk_space", r.alloc_disk_space);
    out << YAML::Key << "next_session_seq" << YAML::Value << r.next_session_seq;

    out << YAML::Key << "counters" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "running" << YAML::Value << r.counters.running;
    out << YAML::Key << "running_on_demand" << YAML::Value << r.counters.running_on_demand;
    out << YAML::Key << "resident" << YAML::Value << r.counters.resident;
    out << YAML::Key << "resident_on_demand" << YAML::Value << r.counters.resident_on_demand;
    out << YAML::EndMap;

    emit_optional(out, "last_error_notified_at", r.last_error_notified_at);
    emit_optional(out, "last_timeout_notified_at", r.last_timeout_notified_at);

    out << YAML::Key << "slots" << YAML::Value << YAML::BeginMap;
    for (const auto& [idx, sid] : r.slots) {
        out << YAML::Key << idx << YAML::Value << sid;
    }
    out << YAML::EndMap;

    out << YAML::Key << "sessions" << YAML::Value << YAML::BeginSeq;
    for (const auto& [sid, s] : r.sessions) {
        emit_session(out, s);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

Result<MachineRegistry> registry_from_yaml(const std::string& text) {
    MachineRegistry r;
    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap()) {
            return Result<MachineRegistry>::Err("registry root is not a map");
        }

        r.machine_id = root["machine_id"].as<int64_t>(0);
        r.gpu_name = root["gpu_name"].as<std::string>("");
        r.num_gpus = root["num_gpus"].as<int>(0);
        r.gpu_occupancy = root["gpu_occupancy"].as<std::string>("");
        r.alloc_disk_space = read_optional_number(root["alloc_disk_space"]);
        r.next_session_seq = root["next_session_seq"].as<int>(1);

        if (const auto c = root["counters"]) {
            r.counters.running = c["running"].as<int>(0);
            r.counters.running_on_demand = c["running_on_demand"].as<int>(0);
            r.counters.resident = c["resident"].as<int>(0);
            r.counters.resident_on_demand = c["resident_on_demand"].as<int>(0);
        }

        r.last_error_notified_at = read_optional_string(root["last_error_notified_at"]);
        r.last_timeout_notified_at = read_optional_string(root["last_timeout_notified_at"]);

        if (root["slots"] && root["slots"].IsMap()) {
            for (const auto& kv : root["slots"]) {
                r.slots[kv.first.as<int>()] = kv.second.as<std::string>();
            }
        }

        if (root["sessions"] && root["sessions"].IsSequence()) {
            for (const auto& n : root["sessions"]) {
                auto parsed = parse_session(n);
                if (parsed.is_err()) {
                    return Result<MachineRegistry>::Err(parsed.error);
                }
                r.sessions[parsed.value.id] = parsed.value;
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<MachineRegistry>::Err(std::string("corrupt registry: ") + e.what());
    }
    return Result<MachineRegistry>::Ok(r);
}

// ── RegistryStore ────────────────────────────────────────────

RegistryStore::RegistryStore(const fs::path& state_dir)
    : state_dir_(state_dir) {}

Result<void> RegistryStore::ensure_dirs() {
    std::error_code ec;
    for (const char* dir : {REGISTRY_DIR, SNAPSHOT_DIR, ARCHIVE_DIR}) {
        fs::create_directories(state_dir_ / dir, ec);
        if (ec) {
            return Result<void>::Err(fmt::format("cannot create {}: {}",
                                                 (state_dir_ / dir).string(), ec.message()));
        }
    }
    return Result<void>::Ok();
}

fs::path RegistryStore::registry_path(int64_t machine_id) const {
    return state_dir_ / REGISTRY_DIR / fmt::format("{}.yaml", machine_id);
}

fs::path RegistryStore::snapshot_path(int64_t machine_id) const {
    return state_dir_ / SNAPSHOT_DIR / fmt::format("{}.yaml", machine_id);
}

fs::path RegistryStore::archive_dir() const {
    return state_dir_ / ARCHIVE_DIR;
}

bool RegistryStore::has_registry(int64_t machine_id) const {
    std::error_code ec;
    return fs::exists(registry_path(machine_id), ec);
}

Result<MachineRegistry> RegistryStore::load(int64_t machine_id) const {
    if (!has_registry(machine_id)) {
        MachineRegistry fresh;
        fresh.machine_id = machine_id;
        return Result<MachineRegistry>::Ok(fresh);
    }

    auto text = read_file(registry_path(machine_id));
    if (text.is_err()) return Result<MachineRegistry>::Err(text.error);

    auto parsed = registry_from_yaml(text.value);
    if (parsed.is_err()) {
        return Result<MachineRegistry>::Err(fmt::format("{}: {}", registry_path(machine_id).string(), parsed.error));
    }
    parsed.value.machine_id = machine_id;
    return parsed;
}

Result<void> RegistryStore::save(const MachineRegistry& registry) {
    return write_atomic(registry_path(registry.machine_id), registry_to_yaml(registry));
}

Result<std::optional<MachineState>> RegistryStore::load_snapshot(int64_t machine_id) const {
    using R = Result<std::optional<MachineState>>;
    std::error_code ec;
    fs::path path = snapshot_path(machine_id);
    if (!fs::exists(path, ec)) return R::Ok(std::nullopt);

    try {
        auto parsed = parse_machine_state(YAML::LoadFile(path.string()));
        if (parsed.is_err()) return R::Err(parsed.error);
        return R::Ok(parsed.value);
    } catch (const YAML::Exception& e) {
        return R::Err(fmt::format("{}: {}", path.string(), e.what()));
    }
}

Result<void> RegistryStore::save_snapshot(const MachineState& state) {
    YAML::Emitter out;
    out.SetDoublePrecision(17);
    emit_machine_state(out, state);
    return write_atomic(snapshot_path(state.machine_id), std::string(out.c_str()) + "\n");
}

Result<fs::path> RegistryStore::archive(int64_t machine_id, const Session& session) {
    std::string stamp = session.end_time.value_or(now_iso());
    auto t = parse_iso_utc(stamp);
    char buf[32] = "unknown";
    if (t) {
        struct tm tm_buf;
        gmtime_r(&*t, &tm_buf);
        std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%S", &tm_buf);
    }

    YAML::Emitter out;
    out.SetDoublePrecision(17);
    out << YAML::BeginMap;
    out << YAML::Key << "machine_id" << YAML::Value << machine_id;
    out << YAML::Key << "session" << YAML::Value;
    emit_session(out, session);
    out << YAML::EndMap;

    // A session keeps one archive file; a retried pass rewrites it in place.
    fs::path path = archive_dir() / fmt::format("{}_session_{}.yaml", buf, session.id);
    const std::string suffix = fmt::format("_session_{}.yaml", session.id);
    std::error_code ec;
    for (fs::directory_iterator it(archive_dir(), ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.size() > suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            path = it->path();
            break;
        }
    }

    auto written = write_atomic(path, std::string(out.c_str()) + "\n");
    if (written.is_err()) return Result<fs::path>::Err(written.error);
    return Result<fs::path>::Ok(path);
}
