#include "fee_aggregator.hpp"
#include <limits>
#include <spdlog/fmt/fmt.h>

namespace fee_estimator {

namespace {

int64_t checked_add(int64_t a, int64_t b) {
    // Operands are validated non-negative before they get here.
    if (a > std::numeric_limits<int64_t>::max() - b) {
        throw InvalidFeeComponent(fmt::format("overflow adding {} and {}", a, b));
    }
    return a + b;
}

int64_t checked_mul(int64_t a, int64_t b) {
    if (a != 0 && b > std::numeric_limits<int64_t>::max() / a) {
        throw InvalidFeeComponent(fmt::format("overflow multiplying {} by {}", a, b));
    }
    return a * b;
}

void require_non_negative(int64_t value, const std::string& field) {
    if (value < 0) {
        throw InvalidFeeComponent(fmt::format("{} is negative ({})", field, value));
    }
}

} // namespace

int64_t compute_subtotal(const FeeEstimate& estimate) {
    require_non_negative(estimate.base, "base");
    int64_t subtotal = estimate.base;
    for (const auto& extra : estimate.extras) {
        require_non_negative(extra.subtotal, "extra '" + extra.name + "' subtotal");
        subtotal = checked_add(subtotal, extra.subtotal);
    }
    return subtotal;
}

int64_t compute_network_subtotal(const FeeEstimate& node, int64_t multiplier) {
    require_non_negative(multiplier, "network multiplier");
    return checked_mul(compute_subtotal(node), multiplier);
}

int64_t compute_response_total(const FeeEstimateResponse& response) {
    int64_t node_subtotal = compute_subtotal(response.node);
    int64_t service_subtotal = compute_subtotal(response.service);
    int64_t expected_network = compute_network_subtotal(response.node, response.network.multiplier);
    if (response.network.subtotal != expected_network) {
        throw InvalidFeeComponent(fmt::format(
            "network subtotal {} != node subtotal {} * multiplier {}",
            response.network.subtotal, node_subtotal, response.network.multiplier));
    }
    return checked_add(checked_add(response.network.subtotal, node_subtotal), service_subtotal);
}

void validate_response(const FeeEstimateResponse& response) {
    if (response.node.subtotal_reported && response.node.subtotal != compute_subtotal(response.node)) {
        throw InvalidFeeComponent(fmt::format("node subtotal {} does not match base plus extras {}",
                                              response.node.subtotal, compute_subtotal(response.node)));
    }
    if (response.service.subtotal_reported &&
        response.service.subtotal != compute_subtotal(response.service)) {
        throw InvalidFeeComponent(fmt::format("service subtotal {} does not match base plus extras {}",
                                              response.service.subtotal,
                                              compute_subtotal(response.service)));
    }
    int64_t total = compute_response_total(response);
    if (response.total != total) {
        throw InvalidFeeComponent(fmt::format("total {} != network + node + service ({})",
                                              response.total, total));
    }
}

FeeEstimateResponse derive_response(const FeeBreakdown& breakdown) {
    if (!breakdown.network_multiplier) throw InvalidFeeComponent("network component is missing");
    if (!breakdown.node) throw InvalidFeeComponent("node component is missing");
    if (!breakdown.service) throw InvalidFeeComponent("service component is missing");

    FeeEstimateResponse out;
    out.mode = breakdown.mode.value_or(FeeEstimateMode::STATE);
    out.notes = breakdown.notes;

    out.node = *breakdown.node;
    out.node.subtotal = compute_subtotal(out.node);
    out.node.subtotal_reported = false;

    out.service = *breakdown.service;
    out.service.subtotal = compute_subtotal(out.service);
    out.service.subtotal_reported = false;

    out.network.multiplier = *breakdown.network_multiplier;
    out.network.subtotal = compute_network_subtotal(out.node, out.network.multiplier);

    out.total = compute_response_total(out);
    return out;
}

} // namespace fee_estimator
