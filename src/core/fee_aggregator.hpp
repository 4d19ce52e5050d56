#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include "fee_types.hpp"

namespace fee_estimator {

/**
 * Raised for negative fee figures, missing components, figures that break the
 * total/network invariants, and int64 overflow.
 */
class InvalidFeeComponent : public std::runtime_error {
public:
    explicit InvalidFeeComponent(const std::string& what)
        : std::runtime_error("invalid fee component: " + what) {}
};

/**
 * Fee composition rule:
 *   component subtotal = base + sum(extra.subtotal)
 *   network subtotal   = node subtotal * multiplier
 *   total              = network + node + service
 * Every function here is pure and safe to call concurrently.
 */
int64_t compute_subtotal(const FeeEstimate& estimate);

int64_t compute_network_subtotal(const FeeEstimate& node, int64_t multiplier);

// Also checks that response.network.subtotal matches the node subtotal and multiplier.
int64_t compute_response_total(const FeeEstimateResponse& response);

/**
 * Check a response produced elsewhere (e.g. by a mirror node): reported
 * component subtotals, the network derivation and the reported total.
 */
void validate_response(const FeeEstimateResponse& response);

/**
 * Build a complete response from raw figures, filling every subtotal and the
 * total. A missing mode means STATE.
 */
FeeEstimateResponse derive_response(const FeeBreakdown& breakdown);

} // namespace fee_estimator
