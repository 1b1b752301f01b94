#include "config/engine_config.hpp"
#include "common/errors.hpp"
#include <fstream>
#include <limits>

namespace zkshard {

DeadlinePolicy deadline_policy_from_string(const std::string& s) {
    if (s == "ignore") return DeadlinePolicy::Ignore;
    if (s == "abort_when_exceeded") return DeadlinePolicy::AbortWhenExceeded;
    if (s == "abort_when_projected") return DeadlinePolicy::AbortWhenProjected;
    throw ConfigError("orchestrator.deadline_policy: unknown policy '" + s + "'");
}

const char* to_string(DeadlinePolicy policy) {
    switch (policy) {
        case DeadlinePolicy::Ignore:             return "ignore";
        case DeadlinePolicy::AbortWhenExceeded:  return "abort_when_exceeded";
        case DeadlinePolicy::AbortWhenProjected: return "abort_when_projected";
    }
    return "unknown";
}

CombineStrategy combine_strategy_from_string(const std::string& s) {
    if (s == "sequential") return CombineStrategy::Sequential;
    if (s == "tree") return CombineStrategy::Tree;
    throw ConfigError("orchestrator.combine_strategy: unknown strategy '" + s + "'");
}

const char* to_string(CombineStrategy strategy) {
    switch (strategy) {
        case CombineStrategy::Sequential: return "sequential";
        case CombineStrategy::Tree:       return "tree";
    }
    return "unknown";
}

DiscoverySource discovery_source_from_string(const std::string& s) {
    if (s == "virtual") return DiscoverySource::Virtual;
    if (s == "cuda") return DiscoverySource::Cuda;
    throw ConfigError("devices.discovery: unknown source '" + s + "'");
}

const char* to_string(DiscoverySource source) {
    switch (source) {
        case DiscoverySource::Virtual: return "virtual";
        case DiscoverySource::Cuda:    return "cuda";
    }
    return "unknown";
}

ShardingConfig ShardingOverrides::apply(ShardingConfig base) const {
    if (shards_per_device) base.shards_per_device = *shards_per_device;
    if (min_cycles_per_shard) base.min_cycles_per_shard = *min_cycles_per_shard;
    if (max_cycles_per_shard) base.max_cycles_per_shard = *max_cycles_per_shard;
    if (checkpoint_interval_cycles) base.checkpoint_interval_cycles = *checkpoint_interval_cycles;
    if (enable_checkpointing) base.enable_checkpointing = *enable_checkpointing;
    return base;
}

// ============================================================================
// JSON helpers
// ============================================================================

namespace {

using nlohmann::json;

class SectionReader {
public:
    SectionReader(const json& root, const char* name) : name_(name) {
        if (root.contains(name)) {
            section_ = &root.at(name);
            if (!section_->is_object()) {
                throw ConfigError(std::string(name) + ": expected an object");
            }
        }
    }

    std::optional<uint64_t> unsigned_value(const char* key, uint64_t max = std::numeric_limits<uint64_t>::max()) const {
        const json* v = find(key);
        if (!v) return std::nullopt;
        if (!v->is_number_unsigned()) {
            throw ConfigError(path(key) + ": expected a non-negative integer");
        }
        uint64_t value = v->get<uint64_t>();
        if (value > max) {
            throw ConfigError(path(key) + ": value " + std::to_string(value) + " is too large");
        }
        return value;
    }

    std::optional<double> number_value(const char* key) const {
        const json* v = find(key);
        if (!v) return std::nullopt;
        if (!v->is_number()) {
            throw ConfigError(path(key) + ": expected a number");
        }
        return v->get<double>();
    }

    std::optional<bool> bool_value(const char* key) const {
        const json* v = find(key);
        if (!v) return std::nullopt;
        if (!v->is_boolean()) {
            throw ConfigError(path(key) + ": expected true or false");
        }
        return v->get<bool>();
    }

    std::optional<std::string> string_value(const char* key) const {
        const json* v = find(key);
        if (!v) return std::nullopt;
        if (!v->is_string()) {
            throw ConfigError(path(key) + ": expected a string");
        }
        return v->get<std::string>();
    }

    std::optional<std::vector<uint32_t>> id_list(const char* key) const {
        const json* v = find(key);
        if (!v) return std::nullopt;
        if (!v->is_array()) {
            throw ConfigError(path(key) + ": expected an array of device ids");
        }
        std::vector<uint32_t> ids;
        for (const auto& item : *v) {
            if (!item.is_number_unsigned() || item.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
                throw ConfigError(path(key) + ": device ids must be non-negative integers");
            }
            ids.push_back(item.get<uint32_t>());
        }
        return ids;
    }

private:
    const json* find(const char* key) const {
        if (!section_ || !section_->contains(key)) return nullptr;
        return &section_->at(key);
    }

    std::string path(const char* key) const {
        return std::string(name_) + "." + key;
    }

    const char* name_;
    const json* section_ = nullptr;
};

constexpr uint64_t U32_MAX = std::numeric_limits<uint32_t>::max();

} // namespace

// ============================================================================
// EngineConfig
// ============================================================================

EngineConfig EngineConfig::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("configuration root must be a JSON object");
    }

    EngineConfig cfg;

    SectionReader devices(json, "devices");
    if (auto v = devices.string_value("discovery")) cfg.devices.discovery = discovery_source_from_string(*v);
    if (auto v = devices.string_value("profile")) cfg.devices.profile = device_profile_from_string(*v);
    if (auto v = devices.id_list("visible")) cfg.devices.visible = *v;
    if (auto v = devices.unsigned_value("virtual_device_count", U32_MAX)) {
        cfg.devices.virtual_device_count = static_cast<uint32_t>(*v);
    }
    if (auto v = devices.number_value("virtual_device_memory_gib")) cfg.devices.virtual_device_memory_gib = *v;

    SectionReader sharding(json, "sharding");
    if (auto v = sharding.unsigned_value("shards_per_device", U32_MAX)) {
        cfg.sharding.shards_per_device = static_cast<uint32_t>(*v);
    }
    cfg.sharding.min_cycles_per_shard = sharding.unsigned_value("min_cycles_per_shard");
    cfg.sharding.max_cycles_per_shard = sharding.unsigned_value("max_cycles_per_shard");
    cfg.sharding.checkpoint_interval_cycles = sharding.unsigned_value("checkpoint_interval_cycles");
    cfg.sharding.enable_checkpointing = sharding.bool_value("enable_checkpointing");

    SectionReader orchestrator(json, "orchestrator");
    if (auto v = orchestrator.unsigned_value("retry_budget", U32_MAX)) {
        cfg.orchestrator.retry_budget = static_cast<uint32_t>(*v);
    }
    if (auto v = orchestrator.unsigned_value("slot_wait_timeout_ms")) {
        cfg.orchestrator.slot_wait_timeout = std::chrono::milliseconds(*v);
    }
    if (auto v = orchestrator.string_value("deadline_policy")) {
        cfg.orchestrator.deadline_policy = deadline_policy_from_string(*v);
    }
    if (auto v = orchestrator.string_value("combine_strategy")) {
        cfg.orchestrator.combine_strategy = combine_strategy_from_string(*v);
    }

    SectionReader parallel(json, "parallel");
    if (auto v = parallel.unsigned_value("num_threads", 4096)) {
        cfg.parallel.num_threads = static_cast<int>(*v);
    }

    SectionReader logging(json, "logging");
    if (auto v = logging.bool_value("debug")) cfg.logging.debug = *v;
    if (auto v = logging.bool_value("profile")) cfg.logging.profile = *v;

    SectionReader calibration(json, "calibration");
    if (auto v = calibration.unsigned_value("cycles_per_run")) cfg.calibration.cycles_per_run = *v;
    if (auto v = calibration.unsigned_value("program_length")) {
        cfg.calibration.program_length = static_cast<size_t>(*v);
    }
    if (auto v = calibration.number_value("safety_margin")) cfg.calibration.safety_margin = *v;
    if (auto v = calibration.unsigned_value("seed")) cfg.calibration.seed = *v;

    cfg.validate();
    return cfg;
}

EngineConfig EngineConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + path);
    }
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path + ": " + e.what());
    }
    return from_json(json);
}

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;

    j["devices"]["discovery"] = to_string(devices.discovery);
    j["devices"]["profile"] = to_string(devices.profile);
    j["devices"]["visible"] = devices.visible;
    j["devices"]["virtual_device_count"] = devices.virtual_device_count;
    j["devices"]["virtual_device_memory_gib"] = devices.virtual_device_memory_gib;

    j["sharding"] = nlohmann::json::object();
    if (sharding.shards_per_device) j["sharding"]["shards_per_device"] = *sharding.shards_per_device;
    if (sharding.min_cycles_per_shard) j["sharding"]["min_cycles_per_shard"] = *sharding.min_cycles_per_shard;
    if (sharding.max_cycles_per_shard) j["sharding"]["max_cycles_per_shard"] = *sharding.max_cycles_per_shard;
    if (sharding.checkpoint_interval_cycles) {
        j["sharding"]["checkpoint_interval_cycles"] = *sharding.checkpoint_interval_cycles;
    }
    if (sharding.enable_checkpointing) j["sharding"]["enable_checkpointing"] = *sharding.enable_checkpointing;

    j["orchestrator"]["retry_budget"] = orchestrator.retry_budget;
    j["orchestrator"]["slot_wait_timeout_ms"] = static_cast<uint64_t>(orchestrator.slot_wait_timeout.count());
    j["orchestrator"]["deadline_policy"] = to_string(orchestrator.deadline_policy);
    j["orchestrator"]["combine_strategy"] = to_string(orchestrator.combine_strategy);

    j["parallel"]["num_threads"] = parallel.num_threads;

    j["logging"]["debug"] = logging.debug;
    j["logging"]["profile"] = logging.profile;

    j["calibration"]["cycles_per_run"] = calibration.cycles_per_run;
    j["calibration"]["program_length"] = calibration.program_length;
    j["calibration"]["safety_margin"] = calibration.safety_margin;
    j["calibration"]["seed"] = calibration.seed;

    return j;
}

void EngineConfig::validate() const {
    if (devices.discovery == DiscoverySource::Virtual) {
        if (devices.virtual_device_count < 1) {
            throw ConfigError("devices.virtual_device_count must be >= 1");
        }
        if (!(devices.virtual_device_memory_gib > 0.0)) {
            throw ConfigError("devices.virtual_device_memory_gib must be > 0");
        }
    }
    if (sharding.shards_per_device && *sharding.shards_per_device < 1) {
        throw ConfigError("sharding.shards_per_device must be >= 1");
    }
    if (sharding.min_cycles_per_shard && *sharding.min_cycles_per_shard < 1) {
        throw ConfigError("sharding.min_cycles_per_shard must be >= 1");
    }
    if (sharding.min_cycles_per_shard && sharding.max_cycles_per_shard
        && *sharding.min_cycles_per_shard > *sharding.max_cycles_per_shard) {
        throw ConfigError("sharding.min_cycles_per_shard exceeds sharding.max_cycles_per_shard");
    }
    if (sharding.checkpoint_interval_cycles && *sharding.checkpoint_interval_cycles < 1) {
        throw ConfigError("sharding.checkpoint_interval_cycles must be >= 1");
    }
    if (orchestrator.slot_wait_timeout.count() <= 0) {
        throw ConfigError("orchestrator.slot_wait_timeout_ms must be > 0");
    }
    if (calibration.program_length < 1) {
        throw ConfigError("calibration.program_length must be >= 1");
    }
    if (!(calibration.safety_margin > 0.0 && calibration.safety_margin <= 1.0)) {
        throw ConfigError("calibration.safety_margin must be in (0, 1]");
    }
}

} // namespace zkshard
