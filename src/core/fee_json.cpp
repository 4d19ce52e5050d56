#include "fee_json.hpp"
#include "fee_aggregator.hpp"
#include <limits>

namespace fee_estimator {

namespace {

// Fee amounts are integers that fit in int64_t; anything else is rejected
// instead of being truncated or wrapped.
int64_t int_field(const json& j, const char* key, int64_t fallback = 0) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    const auto& v = j[key];
    if (!v.is_number_integer()) {
        throw InvalidFeeComponent(std::string(key) + " is not an integer");
    }
    if (v.is_number_unsigned() &&
        v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw InvalidFeeComponent(std::string(key) + " is out of range");
    }
    return v.get<int64_t>();
}

FeeExtra extra_from_json(const json& j) {
    FeeExtra extra;
    extra.name = j.value("name", std::string{});
    extra.included = int_field(j, "included");
    extra.count = int_field(j, "count");
    extra.charged = int_field(j, "charged");
    extra.fee_per_unit = int_field(j, "fee_per_unit");
    extra.subtotal = int_field(j, "subtotal");
    return extra;
}

json extra_to_json(const FeeExtra& extra) {
    return json{
        {"name", extra.name},
        {"included", extra.included},
        {"count", extra.count},
        {"charged", extra.charged},
        {"fee_per_unit", extra.fee_per_unit},
        {"subtotal", extra.subtotal}
    };
}

std::optional<FeeEstimateMode> parse_mode(const json& j) {
    if (!j.contains("mode") || j["mode"].is_null()) return std::nullopt;
    auto name = j["mode"].get<std::string>();
    auto mode = mode_from_string(name);
    if (!mode) throw InvalidFeeComponent("unknown estimation mode '" + name + "'");
    return mode;
}

std::vector<std::string> parse_notes(const json& j) {
    if (!j.contains("notes") || j["notes"].is_null()) return {};
    if (j["notes"].is_string()) return {j["notes"].get<std::string>()};
    return j["notes"].get<std::vector<std::string>>();
}

const json& require_object(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_object()) {
        throw InvalidFeeComponent(std::string(key) + " component is missing");
    }
    return j[key];
}

} // namespace

FeeEstimate fee_estimate_from_json(const json& j) {
    FeeEstimate estimate;
    estimate.base = int_field(j, "base");
    if (j.contains("extras") && j["extras"].is_array()) {
        for (const auto& e : j["extras"]) {
            estimate.extras.push_back(extra_from_json(e));
        }
    }
    if (j.contains("subtotal") && !j["subtotal"].is_null()) {
        estimate.subtotal = int_field(j, "subtotal");
        estimate.subtotal_reported = true;
    }
    return estimate;
}

json fee_estimate_to_json(const FeeEstimate& estimate) {
    json extras = json::array();
    for (const auto& e : estimate.extras) {
        extras.push_back(extra_to_json(e));
    }
    return json{
        {"base", estimate.base},
        {"extras", extras},
        {"subtotal", estimate.subtotal}
    };
}

FeeEstimateResponse fee_response_from_json(const json& j) {
    try {
        FeeEstimateResponse out;
        out.mode = parse_mode(j).value_or(FeeEstimateMode::STATE);
        const auto& network = require_object(j, "network");
        out.network.multiplier = int_field(network, "multiplier");
        out.network.subtotal = int_field(network, "subtotal");
        out.node = fee_estimate_from_json(require_object(j, "node"));
        out.service = fee_estimate_from_json(require_object(j, "service"));
        if (!out.node.subtotal_reported) out.node.subtotal = compute_subtotal(out.node);
        if (!out.service.subtotal_reported) out.service.subtotal = compute_subtotal(out.service);
        out.notes = parse_notes(j);
        out.total = int_field(j, "total");
        return out;
    } catch (const json::exception& e) {
        throw InvalidFeeComponent(std::string("malformed fee estimate: ") + e.what());
    }
}

json fee_response_to_json(const FeeEstimateResponse& response) {
    return json{
        {"mode", mode_to_string(response.mode)},
        {"network", {
            {"multiplier", response.network.multiplier},
            {"subtotal", response.network.subtotal}
        }},
        {"node", fee_estimate_to_json(response.node)},
        {"service", fee_estimate_to_json(response.service)},
        {"notes", response.notes},
        {"total", response.total}
    };
}

FeeBreakdown fee_breakdown_from_json(const json& j) {
    try {
        FeeBreakdown out;
        out.mode = parse_mode(j);
        if (j.contains("network") && j["network"].is_object() && j["network"].contains("multiplier")) {
            out.network_multiplier = int_field(j["network"], "multiplier");
        }
        if (j.contains("node") && j["node"].is_object()) {
            out.node = fee_estimate_from_json(j["node"]);
        }
        if (j.contains("service") && j["service"].is_object()) {
            out.service = fee_estimate_from_json(j["service"]);
        }
        out.notes = parse_notes(j);
        return out;
    } catch (const json::exception& e) {
        throw InvalidFeeComponent(std::string("malformed fee breakdown: ") + e.what());
    }
}

} // namespace fee_estimator
