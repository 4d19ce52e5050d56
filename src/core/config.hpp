#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "fee_types.hpp"

namespace fee_estimator {

using json = nlohmann::json;

struct ServiceConfig {
    std::string bind_address{"127.0.0.1"};
    uint16_t port{8500};
};

struct MirrorNodeConfig {
    bool enabled{false};
    std::string host{"testnet.mirrornode.hedera.com"};
    uint16_t port{443};
    bool use_tls{true};
    std::string base_path{"/api/v1"};
    double timeout_seconds{10.0};

    // e.g. "https://testnet.mirrornode.hedera.com:443"
    std::string url() const {
        return std::string(use_tls ? "https://" : "http://") + host + ":" + std::to_string(port);
    }
};

struct QueryConfig {
    FeeEstimateMode default_mode{FeeEstimateMode::STATE};
};

/**
 * One extra line item of the local schedule: units beyond `included` are
 * charged at `fee_per_unit`. Units are counted from the transaction summary
 * by name (SIGNATURES, BYTES, KEYS).
 */
struct ExtraRule {
    std::string name;
    int64_t included{0};
    int64_t fee_per_unit{0};
};

struct ComponentSchedule {
    int64_t base{0};
    std::vector<ExtraRule> extras;
};

struct FeeScheduleConfig {
    int64_t network_multiplier{9};
    ComponentSchedule node{100000, {{"SIGNATURES", 1, 100000}, {"BYTES", 1024, 10}}};
    // Keyed by transaction kind name ("CryptoTransfer", "TokenCreate", ...).
    std::map<std::string, ComponentSchedule> services{
        {"CryptoTransfer", {0, {}}},
        {"TokenCreate", {9999000000, {{"KEYS", 1, 100000000}}}},
        {"TokenMint", {19000000, {}}},
        {"TopicCreate", {99000000, {{"KEYS", 1, 100000000}}}},
        {"TopicMessageSubmit", {500000, {{"BYTES", 100, 1000}}}},
        {"ContractCreate", {9900000000, {{"KEYS", 1, 100000000}}}},
        {"FileCreate", {499000000, {{"KEYS", 1, 100000000}, {"BYTES", 1000, 100000}}}},
        {"FileAppend", {499000000, {{"BYTES", 1000, 100000}}}},
    };
};

struct LoggingConfig {
    std::string level{"info"};
};

struct AuthConfig {
    std::string token{};
};

struct Config {
    ServiceConfig service;
    MirrorNodeConfig mirror_node;
    QueryConfig query;
    FeeScheduleConfig fee_schedule;
    LoggingConfig logging;
    AuthConfig auth;
};

inline ComponentSchedule component_schedule_from_json(const json& j, const ComponentSchedule& defaults) {
    ComponentSchedule out = defaults;
    out.base = j.value("base", out.base);
    if (j.contains("extras")) {
        out.extras.clear();
        for (const auto& e : j["extras"]) {
            ExtraRule rule;
            rule.name = e.value("name", std::string{});
            rule.included = e.value("included", rule.included);
            rule.fee_per_unit = e.value("fee_per_unit", rule.fee_per_unit);
            out.extras.push_back(rule);
        }
    }
    return out;
}

inline json component_schedule_to_json(const ComponentSchedule& schedule) {
    json extras = json::array();
    for (const auto& rule : schedule.extras) {
        extras.push_back({{"name", rule.name}, {"included", rule.included}, {"fee_per_unit", rule.fee_per_unit}});
    }
    return json{{"base", schedule.base}, {"extras", extras}};
}

inline json fee_schedule_to_json(const FeeScheduleConfig& schedule) {
    json services = json::object();
    for (const auto& kv : schedule.services) {
        services[kv.first] = component_schedule_to_json(kv.second);
    }
    return json{
        {"network_multiplier", schedule.network_multiplier},
        {"node", component_schedule_to_json(schedule.node)},
        {"services", services}
    };
}

inline void apply_config_json(Config& cfg, const json& j) {
    if (j.contains("service")) {
        auto& svc = j["service"];
        cfg.service.bind_address = svc.value("bind_address", cfg.service.bind_address);
        cfg.service.port = svc.value("port", cfg.service.port);
    }
    if (j.contains("mirror_node")) {
        auto& m = j["mirror_node"];
        cfg.mirror_node.enabled = m.value("enabled", cfg.mirror_node.enabled);
        cfg.mirror_node.host = m.value("host", cfg.mirror_node.host);
        cfg.mirror_node.port = m.value("port", cfg.mirror_node.port);
        cfg.mirror_node.use_tls = m.value("use_tls", cfg.mirror_node.use_tls);
        cfg.mirror_node.base_path = m.value("base_path", cfg.mirror_node.base_path);
        cfg.mirror_node.timeout_seconds = m.value("timeout_seconds", cfg.mirror_node.timeout_seconds);
    }
    if (j.contains("query")) {
        auto& q = j["query"];
        std::string mode = q.value("default_mode", mode_to_string(cfg.query.default_mode));
        if (auto parsed = mode_from_string(mode)) {
            cfg.query.default_mode = *parsed;
        } else {
            spdlog::warn("Unknown query.default_mode '{}', keeping {}", mode,
                         mode_to_string(cfg.query.default_mode));
        }
    }
    if (j.contains("fee_schedule")) {
        auto& fs = j["fee_schedule"];
        cfg.fee_schedule.network_multiplier = fs.value("network_multiplier", cfg.fee_schedule.network_multiplier);
        if (fs.contains("node")) {
            cfg.fee_schedule.node = component_schedule_from_json(fs["node"], cfg.fee_schedule.node);
        }
        if (fs.contains("services")) {
            // Listed kinds override the defaults; unlisted kinds keep theirs.
            for (auto it = fs["services"].begin(); it != fs["services"].end(); ++it) {
                auto& current = cfg.fee_schedule.services[it.key()];
                current = component_schedule_from_json(it.value(), current);
            }
        }
    }
    if (j.contains("logging")) {
        auto& l = j["logging"];
        cfg.logging.level = l.value("level", cfg.logging.level);
    }
    if (j.contains("auth")) {
        auto& a = j["auth"];
        cfg.auth.token = a.value("token", cfg.auth.token);
    }
}

inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    json j = json::parse(f, nullptr, true, true);
    apply_config_json(cfg, j);
}

} // namespace fee_estimator
