#include "machine_state.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>

// ── Parsing helpers ──────────────────────────────────────────

static bool is_valid_code(const std::string& token) {
    return token.size() == 1 &&
           (token[0] == CODE_ON_DEMAND || token[0] == CODE_INTERRUPTIBLE ||
            token[0] == CODE_RESERVED || token[0] == CODE_FREE);
}

static bool has_value(const YAML::Node& node) {
    return node && !node.IsNull();
}

// Upstream reports dates as epoch seconds; our own snapshots store ISO strings.
static std::optional<std::string> read_timestamp(const YAML::Node& node) {
    if (!has_value(node) || !node.IsScalar()) return std::nullopt;
    try {
        double epoch = node.as<double>();
        return format_iso_utc(static_cast<std::time_t>(epoch));
    } catch (const YAML::Exception&) {
        // not numeric, fall through to ISO
    }
    std::string s = node.as<std::string>("");
    if (parse_iso_utc(s)) return s;
    return std::nullopt;
}

static std::optional<double> read_optional_double(const YAML::Node& node) {
    if (!has_value(node)) return std::nullopt;
    try {
        return node.as<double>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

static std::vector<int> read_int_list(const YAML::Node& node) {
    std::vector<int> out;
    if (!node || !node.IsSequence()) return out;
    for (const auto& n : node) {
        out.push_back(n.as<int>(-1));
    }
    out.erase(std::remove(out.begin(), out.end(), -1), out.end());
    std::sort(out.begin(), out.end());
    return out;
}

static ClientHint parse_client_hint(const YAML::Node& n) {
    ClientHint hint;
    hint.gpus = read_int_list(n["gpus"] ? n["gpus"] : n["gpu_indices"]);
    hint.storage_gb = read_optional_double(n["storage_gb"] ? n["storage_gb"] : n["disk_space"]);
    hint.end_date = read_timestamp(n["end_date"] ? n["end_date"] : n["client_end_date"]);
    return hint;
}

// ── MachineState ─────────────────────────────────────────────

bool operator==(const ClientHint& a, const ClientHint& b) {
    return a.gpus == b.gpus && a.storage_gb == b.storage_gb && a.end_date == b.end_date;
}

bool operator!=(const ClientHint& a, const ClientHint& b) {
    return !(a == b);
}

std::vector<std::string> MachineState::slot_codes() const {
    return split_ws(gpu_occupancy);
}

double MachineState::rate_for_code(const std::string& code) const {
    if (code.size() != 1) return 0.0;
    switch (code[0]) {
        case CODE_ON_DEMAND:     return listed_gpu_cost;
        case CODE_INTERRUPTIBLE: return min_bid_price;
        case CODE_RESERVED:      return bid_gpu_cost.value_or(0.0);
        default:                 return 0.0;
    }
}

Result<MachineState> parse_machine_state(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        return Result<MachineState>::Err("machine entry is not a map");
    }

    MachineState m;
    try {
        if (!has_value(node["machine_id"])) {
            return Result<MachineState>::Err("machine entry has no machine_id");
        }
        m.machine_id = node["machine_id"].as<int64_t>();

        if (!has_value(node["gpu_occupancy"])) {
            return Result<MachineState>::Err(fmt::format("machine {}: missing gpu_occupancy", m.machine_id));
        }
        m.gpu_occupancy = node["gpu_occupancy"].as<std::string>();
        m.gpu_name = node["gpu_name"].as<std::string>("");

        auto codes = m.slot_codes();
        m.num_gpus = node["num_gpus"].as<int>(static_cast<int>(codes.size()));
        if (static_cast<int>(codes.size()) != m.num_gpus) {
            return Result<MachineState>::Err(fmt::format(
                "machine {}: occupancy '{}' has {} slots, expected {}",
                m.machine_id, m.gpu_occupancy, codes.size(), m.num_gpus));
        }
        for (const auto& code : codes) {
            if (!is_valid_code(code)) {
                return Result<MachineState>::Err(fmt::format(
                    "machine {}: unknown occupancy code '{}'", m.machine_id, code));
            }
        }

        m.listed_gpu_cost = node["listed_gpu_cost"].as<double>(0.0);
        m.min_bid_price = node["min_bid_price"].as<double>(0.0);
        m.bid_gpu_cost = read_optional_double(node["bid_gpu_cost"]);
        m.listed_storage_cost = node["listed_storage_cost"].as<double>(0.0);
        m.alloc_disk_space = node["alloc_disk_space"].as<double>(0.0);

        m.counters.running = node["current_rentals_running"].as<int>(0);
        m.counters.running_on_demand = node["current_rentals_running_on_demand"].as<int>(0);
        m.counters.resident = node["current_rentals_resident"].as<int>(0);
        m.counters.resident_on_demand = node["current_rentals_on_demand"].as<int>(0);
        if (m.counters.running < 0 || m.counters.running_on_demand < 0 ||
            m.counters.resident < 0 || m.counters.resident_on_demand < 0) {
            return Result<MachineState>::Err(fmt::format("machine {}: negative rental counter", m.machine_id));
        }

        if (has_value(node["error_description"])) {
            auto err = node["error_description"].as<std::string>("");
            if (!err.empty()) m.error_description = err;
        }
        m.timeout = node["timeout"].as<int>(0);
        m.listed = node["listed"].as<bool>(false);
        m.verification = node["verification"].as<std::string>("");
        m.num_recent_reports = node["num_recent_reports"].as<double>(0.0);
        m.client_end_date = read_timestamp(node["client_end_date"]);

        if (node["clients"] && node["clients"].IsSequence()) {
            for (const auto& c : node["clients"]) {
                if (c.IsMap()) m.clients.push_back(parse_client_hint(c));
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<MachineState>::Err(fmt::format("machine {}: {}", m.machine_id, e.what()));
    }

    return Result<MachineState>::Ok(m);
}

void emit_machine_state(YAML::Emitter& out, const MachineState& m) {
    out << YAML::BeginMap;
    out << YAML::Key << "machine_id" << YAML::Value << m.machine_id;
    out << YAML::Key << "gpu_name" << YAML::Value << m.gpu_name;
    out << YAML::Key << "num_gpus" << YAML::Value << m.num_gpus;
    out << YAML::Key << "gpu_occupancy" << YAML::Value << m.gpu_occupancy;
    out << YAML::Key << "listed_gpu_cost" << YAML::Value << m.listed_gpu_cost;
    out << YAML::Key << "min_bid_price" << YAML::Value << m.min_bid_price;
    out << YAML::Key << "bid_gpu_cost" << YAML::Value;
    if (m.bid_gpu_cost) out << *m.bid_gpu_cost; else out << YAML::Null;
    out << YAML::Key << "listed_storage_cost" << YAML::Value << m.listed_storage_cost;
    out << YAML::Key << "alloc_disk_space" << YAML::Value << m.alloc_disk_space;
    out << YAML::Key << "current_rentals_running" << YAML::Value << m.counters.running;
    out << YAML::Key << "current_rentals_running_on_demand" << YAML::Value << m.counters.running_on_demand;
    out << YAML::Key << "current_rentals_resident" << YAML::Value << m.counters.resident;
    out << YAML::Key << "current_rentals_on_demand" << YAML::Value << m.counters.resident_on_demand;
    out << YAML::Key << "error_description" << YAML::Value;
    if (m.error_description) out << *m.error_description; else out << YAML::Null;
    out << YAML::Key << "timeout" << YAML::Value << m.timeout;
    out << YAML::Key << "listed" << YAML::Value << m.listed;
    out << YAML::Key << "verification" << YAML::Value << m.verification;
    out << YAML::Key << "num_recent_reports" << YAML::Value << m.num_recent_reports;
    out << YAML::Key << "client_end_date" << YAML::Value;
    if (m.client_end_date) out << *m.client_end_date; else out << YAML::Null;

    out << YAML::Key << "clients" << YAML::Value << YAML::BeginSeq;
    for (const auto& c : m.clients) {
        out << YAML::BeginMap;
        out << YAML::Key << "gpus" << YAML::Value << YAML::Flow << c.gpus;
        out << YAML::Key << "storage_gb" << YAML::Value;
        if (c.storage_gb) out << *c.storage_gb; else out << YAML::Null;
        out << YAML::Key << "end_date" << YAML::Value;
        if (c.end_date) out << *c.end_date; else out << YAML::Null;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
}

// ── Change detection ─────────────────────────────────────────

std::vector<std::string> changed_fields(const MachineState& o, const MachineState& n) {
    std::vector<std::string> changed;
    if (o.verification != n.verification) changed.push_back("verification");
    if (o.clients != n.clients) changed.push_back("clients");
    if (o.error_description != n.error_description) changed.push_back("error_description");
    if (o.listed != n.listed) changed.push_back("listed");
    if (o.gpu_occupancy != n.gpu_occupancy) changed.push_back("gpu_occupancy");
    if (o.counters.running != n.counters.running) changed.push_back("current_rentals_running");
    if (o.counters.running_on_demand != n.counters.running_on_demand)
        changed.push_back("current_rentals_running_on_demand");
    if (o.counters.resident != n.counters.resident) changed.push_back("current_rentals_resident");
    if (o.counters.resident_on_demand != n.counters.resident_on_demand)
        changed.push_back("current_rentals_on_demand");
    if (o.num_recent_reports != n.num_recent_reports) changed.push_back("num_recent_reports");
    if (o.alloc_disk_space != n.alloc_disk_space) changed.push_back("alloc_disk_space");
    if (o.listed_storage_cost != n.listed_storage_cost) changed.push_back("listed_storage_cost");
    if (o.timeout != n.timeout) changed.push_back("timeout");
    return changed;
}

bool affects_rentals(const std::vector<std::string>& fields) {
    static const std::vector<std::string> rental_fields = {
        "clients", "gpu_occupancy", "alloc_disk_space", "listed_storage_cost",
        "current_rentals_running", "current_rentals_running_on_demand",
        "current_rentals_resident", "current_rentals_on_demand",
    };
    for (const auto& f : fields) {
        if (std::find(rental_fields.begin(), rental_fields.end(), f) != rental_fields.end()) {
            return true;
        }
    }
    return false;
}
